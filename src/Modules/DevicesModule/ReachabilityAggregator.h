#pragma once
/**
 * @file ReachabilityAggregator.h
 * @brief Folds probe results and listener events into device records.
 *
 * The aggregator is the only writer of online state and transport tags. It
 * detects online transitions and reports them through `AggregatorListener`.
 */

#include <stddef.h>
#include <stdint.h>

#include "Modules/DevicesModule/DeviceRegistry.h"
#include "Modules/DevicesModule/StatusParsers.h"

/** @brief Live relay connection state. */
struct RelayInfo {
    bool connected = false;
    char callsign[Limits::Peers::CallsignBuf] = {0};
    char url[Limits::Peers::UrlBuf] = {0};
};

/** @brief Outcome of one transport probe. */
enum class ProbeStatus : uint8_t {
    Skipped = 0,
    Success,
    Timeout,
    Unavailable,
    Rejected,
    NoRelay
};

const char* probeStatusName(ProbeStatus s);

struct DirectProbeResult {
    ProbeStatus status = ProbeStatus::Skipped;
    int32_t latencyMs = -1;
    bool hasInfo = false;
    StatusInfo info;
};

struct ProxyProbeResult {
    ProbeStatus status = ProbeStatus::Skipped;
};

/** @brief Everything a worker needs to run one device check without touching the registry. */
struct CheckPlan {
    char callsign[Limits::Peers::CallsignBuf] = {0};
    bool runDirect = false;
    char endpoint[Limits::Peers::UrlBuf] = {0};
    bool selfRelay = false;
    bool relayConnected = false;
    bool runProxy = false;
    char relayBase[Limits::Peers::UrlBuf] = {0};
};

/** @brief `GET {endpoint}/api/status` within a bound. */
class IDirectProbe {
public:
    virtual ~IDirectProbe() = default;
    virtual DirectProbeResult probe(const char* endpoint, uint32_t timeoutMs) = 0;
};

/** @brief `GET {relayBase}/device/{callsign}` within a bound. */
class IRelayProbe {
public:
    virtual ~IRelayProbe() = default;
    virtual ProxyProbeResult probe(const char* relayBase, const char* callsign, uint32_t timeoutMs) = 0;
};

/** @brief Transition callbacks (both optional). */
struct AggregatorListener {
    void (*onStatusChanged)(void* ctx, const char* callsign, bool online, uint8_t cause) = nullptr;
    void (*onCameOnline)(void* ctx, const char* callsign) = nullptr;
    void* ctx = nullptr;
};

/** @brief One peer seen during a radio scan window. */
struct RadioSighting {
    char key[Limits::Peers::CallsignBuf] = {0};   ///< callsign or `BLE-xxxxxx`
    char nickname[Limits::Peers::NicknameBuf] = {0};
    char npub[Limits::Peers::NpubBuf] = {0};
    int16_t rssi = 0;
    bool enhanced = false;
    bool hasLocation = false;
    double latitude = 0.0;
    double longitude = 0.0;
};

/** @brief One peer answering on the local segment. */
struct LocalSighting {
    char callsign[Limits::Peers::CallsignBuf] = {0};
    char endpoint[Limits::Peers::UrlBuf] = {0};
    int32_t latencyMs = -1;
    StatusInfo info;
};

class ReachabilityAggregator {
public:
    explicit ReachabilityAggregator(DeviceRegistry& registry) : registry_(registry) {}

    void setListener(const AggregatorListener& listener) { listener_ = listener; }
    /** @brief Administrative switch for direct probing. */
    void setLocalProbeEnabled(bool enabled) { localProbe_ = enabled; }
    bool localProbeEnabled() const { return localProbe_; }

    void setRelay(const RelayInfo& relay) { relay_ = relay; }
    const RelayInfo& relay() const { return relay_; }

    /** @brief Snapshot what a check of `callsign` has to do; false when unknown. */
    bool planCheck(const char* callsign, CheckPlan& out) const;

    /**
     * @brief Fold probe results into the record.
     * @return Resulting online flag (false when the record disappeared meanwhile).
     */
    bool applyCheck(const CheckPlan& plan,
                    const DirectProbeResult& direct,
                    const ProxyProbeResult& proxy,
                    uint32_t nowMs);

    /** @brief Plan, probe and apply in the calling context. */
    bool checkReachability(const char* callsign, IDirectProbe& direct, IRelayProbe& relay, uint32_t nowMs);

    /** @brief Two-pass reconciliation of one complete radio scan. */
    void applyRadioScan(const RadioSighting* seen, uint8_t count, uint32_t nowMs);

    /** @brief Wired link identified `callsign` (connected) or dropped (callsign ignored). */
    void applyWiredLink(bool connected, const char* callsign, uint32_t nowMs);

    /** @brief Peers answering on the local segment (full scan or quick recheck). */
    void applyLocalDiscovery(const LocalSighting* seen, uint8_t count, uint32_t nowMs);

    /** @brief Merge the relay client list; only listed devices are touched. */
    void applyRelayClients(const RelayClient* clients, uint8_t count, uint32_t nowMs);

    /** @brief Represent the connected relay itself as an internet-tagged device. */
    bool ensureRelayDevice(uint32_t nowMs);

    /** @brief Manually added device (no presence implied). */
    UpsertResult addManual(const char* callsign, const char* url, const char* name, uint32_t nowMs);

private:
    DeviceRegistry& registry_;
    AggregatorListener listener_;
    RelayInfo relay_;
    bool localProbe_ = true;

    /** @brief Apply `patch` with the tag set forced to `tags`, online following the tags. */
    bool commitTags_(const char* callsign, TransportSet tags, DevicePatch& patch, uint32_t nowMs);
    /** @brief Apply `patch` and notify on an online flip. */
    UpsertResult commit_(const char* callsign, DevicePatch& patch, uint32_t nowMs);
    void notify_(const char* callsign, bool wasOnline, TransportSet before, bool online, TransportSet after);
    bool isLocal_(const char* callsign) const;
};
