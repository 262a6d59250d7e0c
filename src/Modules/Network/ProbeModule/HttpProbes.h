#pragma once
/**
 * @file HttpProbes.h
 * @brief HTTPClient implementations of the peer probes and relay fetches.
 */

#include <stddef.h>
#include <stdint.h>

#include "Modules/DevicesModule/ReachabilityAggregator.h"

/** @brief `GET {endpoint}/api/status`; latency measured around the request. */
class HttpDirectProbe : public IDirectProbe {
public:
    DirectProbeResult probe(const char* endpoint, uint32_t timeoutMs) override;
};

/** @brief `GET {relayBase}/device/{callsign}`; only `connected:false` is an explicit negative. */
class HttpRelayProbe : public IRelayProbe {
public:
    ProxyProbeResult probe(const char* relayBase, const char* callsign, uint32_t timeoutMs) override;
};

/** @brief `GET {relayBase}/api/devices`; false when the list could not be read. */
bool fetchRelayClients(const char* relayBase, uint32_t timeoutMs,
                       RelayClient* out, uint8_t max, uint8_t& count);

/**
 * @brief `GET {endpoint}/files`, then `{relayBase}/device/{callsign}/files` on failure.
 *
 * Either source may be empty. False when neither answered.
 */
bool fetchCollections(const char* callsign, const char* endpoint, const char* relayBase,
                      uint32_t timeoutMs, CollectionDescriptor* out, uint8_t max, uint8_t& count);
