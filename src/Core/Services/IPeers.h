#pragma once
/**
 * @file IPeers.h
 * @brief Peer tracking services: snapshot access and the owner-task inbox.
 */
#include <stddef.h>
#include <stdint.h>

#include "Modules/DevicesModule/ReachabilityAggregator.h"

/** @brief Consumer side of the devices module. */
struct PeersService {
    /** Copy the latest published snapshot JSON; `generation` may be null. */
    bool (*snapshotJson)(void* ctx, char* out, size_t outLen, uint32_t* generation);
    uint32_t (*generation)(void* ctx);
    /** Queue a sweep request on the owner task. */
    bool (*requestRefresh)(void* ctx, bool force);
    /** Drop every persisted cache entry (factory reset). */
    bool (*wipeCache)(void* ctx);
    /** Configured local callsign (normalized); false when unset. */
    bool (*localCallsign)(void* ctx, char* out, size_t outLen);
    void* ctx;
};

/**
 * @brief Producer side: listeners and probe workers report here.
 *
 * Every call copies its input into the owner inbox and returns false when the
 * inbox stayed full past the post timeout.
 */
struct PeerInboxService {
    bool (*radioScan)(void* ctx, const RadioSighting* seen, uint8_t count);
    /** `done` closes the discovery step started by `LanService::discover`. */
    bool (*localDiscovery)(void* ctx, const LocalSighting* seen, uint8_t count, bool done);
    bool (*relayClients)(void* ctx, const RelayClient* clients, uint8_t count, bool ok);
    bool (*wiredLink)(void* ctx, bool connected, const char* callsign);
    bool (*relayState)(void* ctx, const RelayInfo& info);
    bool (*checkResult)(void* ctx, uint32_t sweepId, const CheckPlan& plan,
                        const DirectProbeResult& direct, const ProxyProbeResult& proxy);
    bool (*collections)(void* ctx, const char* callsign, const CollectionDescriptor* items,
                        uint8_t count, bool ok);
    void* ctx;
};
