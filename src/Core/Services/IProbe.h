#pragma once
/**
 * @file IProbe.h
 * @brief Probe worker pool service (network I/O off the owner task).
 */
#include <stddef.h>
#include <stdint.h>

#include "Modules/DevicesModule/ReachabilityAggregator.h"

/** @brief Jobs are queued and answered through `PeerInboxService`. */
struct ProbeService {
    /** One device check; the result comes back as `checkResult(sweepId, ...)`. */
    bool (*submitCheck)(void* ctx, uint32_t sweepId, const CheckPlan& plan);
    /** `GET {relayBase}/api/devices`; answered by `relayClients`. */
    bool (*submitRelayClients)(void* ctx, const char* relayBase);
    /** `GET {endpoint}/files` with relay fallback; answered by `collections`. */
    bool (*submitCollections)(void* ctx, const char* callsign, const char* endpoint, const char* relayBase);
    /** Synchronous status probe used by LAN discovery. */
    bool (*probeStatus)(void* ctx, const char* endpoint, uint32_t timeoutMs, DirectProbeResult* out);
    void* ctx;
};
