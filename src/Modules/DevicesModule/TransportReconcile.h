#pragma once
/**
 * @file TransportReconcile.h
 * @brief Pure transport-tag transitions used by the listener handlers.
 */

#include "Modules/DevicesModule/PeerTypes.h"

/**
 * @brief Radio tag set after one scan cycle.
 *
 * Non-radio tags are kept. Radio tags are exactly what the latest scan
 * reports: short-range-radio when present, plus radio-enhanced when flagged.
 */
TransportSet reconcile(TransportSet oldTags, bool inScan, bool enhanced);

/** @brief Tag set after the wired link dropped. */
TransportSet withoutWired(TransportSet tags);

/**
 * @brief Tag responsible for an online flip between two tag sets.
 *
 * Going online reports the first added tag (else the first held tag), going
 * offline the first removed one. `kTransportNone` when nothing qualifies.
 */
uint8_t transitionCause(TransportSet before, TransportSet after, bool online);
