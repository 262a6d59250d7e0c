/**
 * @file ReachabilityAggregator.cpp
 * @brief Folds probe results and listener events into device records.
 */

#define LOG_TAG "PeerAggr"
#include "Core/ModuleLog.h"

#include "Modules/DevicesModule/ReachabilityAggregator.h"
#include "Modules/DevicesModule/NetAddress.h"
#include "Modules/DevicesModule/TransportReconcile.h"
#include "Domain/PeerDefaults.h"

#include <string.h>

const char* probeStatusName(ProbeStatus s)
{
    switch (s) {
    case ProbeStatus::Skipped:     return "skipped";
    case ProbeStatus::Success:     return "ok";
    case ProbeStatus::Timeout:     return "timeout";
    case ProbeStatus::Unavailable: return "unavailable";
    case ProbeStatus::Rejected:    return "rejected";
    case ProbeStatus::NoRelay:     return "no-relay";
    }
    return "?";
}

static void applyStatusInfo_(const StatusInfo& info, DevicePatch& patch)
{
    if (info.hasNickname) patch.nickname = info.nickname;
    if (info.hasColor) patch.color = info.color;
    if (info.hasDescription) patch.description = info.description;
    if (info.hasPlatform) patch.platform = info.platform;
    if (info.hasNpub) patch.npub = info.npub;
    if (info.hasLocation) {
        patch.hasLocation = true;
        patch.latitude = info.latitude;
        patch.longitude = info.longitude;
    }
}

static void setTagDelta_(DevicePatch& patch, TransportSet before, TransportSet after)
{
    patch.addTransports.bits = (uint8_t)(after.bits & ~before.bits);
    patch.removeTransports.bits = (uint8_t)(before.bits & ~after.bits);
}

bool ReachabilityAggregator::isLocal_(const char* callsign) const
{
    const char* local = registry_.localCallsign();
    if (local[0] == '\0') return false;
    char norm[Limits::Peers::CallsignBuf];
    if (!normalizeCallsign(callsign, norm, sizeof(norm))) return false;
    return strcmp(norm, local) == 0;
}

void ReachabilityAggregator::notify_(const char* callsign, bool wasOnline, TransportSet before,
                                     bool online, TransportSet after)
{
    if (wasOnline == online) return;

    const uint8_t cause = transitionCause(before, after, online);

    LOGI("%s %s (%s)", callsign, online ? "online" : "offline",
         (cause == kTransportNone) ? "-" : transportLabel((Transport)cause));

    if (listener_.onStatusChanged) listener_.onStatusChanged(listener_.ctx, callsign, online, cause);
    if (online && listener_.onCameOnline) listener_.onCameOnline(listener_.ctx, callsign);
}

UpsertResult ReachabilityAggregator::commit_(const char* callsign, DevicePatch& patch, uint32_t nowMs)
{
    bool wasOnline = false;
    TransportSet before;
    const DeviceRecord* prev = registry_.get(callsign);
    if (prev) {
        wasOnline = prev->online;
        before = prev->transports;
    }

    const UpsertResult res = registry_.upsert(callsign, patch, nowMs);
    if (res == UpsertResult::Rejected) {
        LOGW("merge rejected for %s", callsign);
        return res;
    }

    const DeviceRecord* rec = registry_.get(callsign);
    if (rec) notify_(rec->callsign, wasOnline, before, rec->online, rec->transports);
    return res;
}

bool ReachabilityAggregator::commitTags_(const char* callsign, TransportSet tags, DevicePatch& patch, uint32_t nowMs)
{
    const DeviceRecord* prev = registry_.get(callsign);
    const TransportSet before = prev ? prev->transports : TransportSet{};
    setTagDelta_(patch, before, tags);
    patch.hasOnline = true;
    patch.online = !tags.empty();
    return commit_(callsign, patch, nowMs) != UpsertResult::Rejected;
}

bool ReachabilityAggregator::planCheck(const char* callsign, CheckPlan& out) const
{
    out = CheckPlan{};
    const DeviceRecord* rec = registry_.get(callsign);
    if (!rec) return false;

    memcpy(out.callsign, rec->callsign, sizeof(out.callsign));
    out.runDirect = localProbe_ && rec->endpoint[0] != '\0' &&
                    copyBounded(out.endpoint, sizeof(out.endpoint), rec->endpoint);

    out.relayConnected = relay_.connected;
    out.selfRelay = relay_.callsign[0] != '\0' && strcmp(relay_.callsign, rec->callsign) == 0;
    if (!out.selfRelay && relay_.connected) {
        out.runProxy = relayHttpBase(relay_.url, out.relayBase, sizeof(out.relayBase));
    }
    return true;
}

bool ReachabilityAggregator::applyCheck(const CheckPlan& plan,
                                        const DirectProbeResult& direct,
                                        const ProxyProbeResult& proxy,
                                        uint32_t nowMs)
{
    const DeviceRecord* rec = registry_.get(plan.callsign);
    if (!rec) return false;

    const TransportSet before = rec->transports;
    TransportSet tags = before;
    DevicePatch patch;
    patch.hasCheckedAt = true;
    patch.checkedAtMs = nowMs;

    bool directOk = false;
    bool internetByDirect = false;
    if (direct.status == ProbeStatus::Success) {
        directOk = true;
        patch.hasLatency = true;
        patch.latencyMs = direct.latencyMs;
        if (isPrivateHost(plan.endpoint)) {
            const bool relayOnLan = tags.has(Transport::RelayPeerOnLan) ||
                                    (direct.hasInfo && direct.info.isRelay);
            tags.add(relayOnLan ? Transport::RelayPeerOnLan : Transport::LocalNetwork);
        } else {
            tags.add(Transport::Internet);
            internetByDirect = true;
        }
        if (direct.hasInfo) applyStatusInfo_(direct.info, patch);
        LOGD("%s direct ok %ldms", plan.callsign, (long)direct.latencyMs);
    } else if (direct.status != ProbeStatus::Skipped) {
        tags.remove(Transport::LocalNetwork);
        tags.remove(Transport::RelayPeerOnLan);
        patch.hasLatency = true;
        patch.latencyMs = -1;
        LOGD("%s direct %s", plan.callsign, probeStatusName(direct.status));
    }

    bool proxyOk = false;
    if (plan.selfRelay) {
        proxyOk = relay_.connected;
        if (proxyOk) tags.add(Transport::Internet);
        else if (!internetByDirect) tags.remove(Transport::Internet);
    } else {
        switch (proxy.status) {
        case ProbeStatus::Success:
            proxyOk = true;
            tags.add(Transport::Internet);
            break;
        case ProbeStatus::Rejected:
        case ProbeStatus::NoRelay:
            if (!internetByDirect) tags.remove(Transport::Internet);
            break;
        case ProbeStatus::Skipped:
        case ProbeStatus::Timeout:
        case ProbeStatus::Unavailable:
            break;
        }
        if (proxy.status != ProbeStatus::Skipped) {
            LOGD("%s proxy %s", plan.callsign, probeStatusName(proxy.status));
        }
    }

    const bool online = directOk || proxyOk || tags.hasRadio() || tags.has(Transport::WiredLink);
    setTagDelta_(patch, before, tags);
    patch.hasOnline = true;
    patch.online = online;
    if (online) {
        patch.hasSeenAt = true;
        patch.seenAtMs = nowMs;
    }

    if (commit_(plan.callsign, patch, nowMs) == UpsertResult::Rejected) {
        // Enrichment did not fit; keep the presence result alone.
        DevicePatch bare;
        bare.hasCheckedAt = true;
        bare.checkedAtMs = nowMs;
        bare.hasLatency = patch.hasLatency;
        bare.latencyMs = patch.latencyMs;
        bare.addTransports = patch.addTransports;
        bare.removeTransports = patch.removeTransports;
        bare.hasOnline = true;
        bare.online = online;
        bare.hasSeenAt = patch.hasSeenAt;
        bare.seenAtMs = patch.seenAtMs;
        commit_(plan.callsign, bare, nowMs);
    }
    return online;
}

bool ReachabilityAggregator::checkReachability(const char* callsign, IDirectProbe& direct,
                                               IRelayProbe& relay, uint32_t nowMs)
{
    CheckPlan plan;
    if (!planCheck(callsign, plan)) return false;

    DirectProbeResult d;
    if (plan.runDirect) d = direct.probe(plan.endpoint, PeerDefaults::ProbeTimeoutMs);

    ProxyProbeResult p;
    if (plan.runProxy) p = relay.probe(plan.relayBase, plan.callsign, PeerDefaults::ProbeTimeoutMs);
    else if (!plan.selfRelay) p.status = ProbeStatus::NoRelay;

    return applyCheck(plan, d, p, nowMs);
}

void ReachabilityAggregator::applyRadioScan(const RadioSighting* seen, uint8_t count, uint32_t nowMs)
{
    if (!seen) count = 0;
    char keys[Limits::Peers::MaxScanPeers][Limits::Peers::CallsignBuf];
    uint8_t nKeys = 0;

    // Pass 1: refresh every peer present in this cycle.
    for (uint8_t i = 0; i < count && nKeys < Limits::Peers::MaxScanPeers; ++i) {
        const RadioSighting& s = seen[i];
        if (!normalizeCallsign(s.key, keys[nKeys], sizeof(keys[nKeys]))) continue;
        const char* key = keys[nKeys];
        ++nKeys;
        if (isLocal_(key)) continue;

        const DeviceRecord* rec = registry_.get(key);
        const TransportSet tags = reconcile(rec ? rec->transports : TransportSet{}, true, s.enhanced);

        DevicePatch patch;
        patch.hasRssi = true;
        patch.rssi = s.rssi;
        patch.proximity = proximityLabel(s.rssi);
        patch.hasSeenAt = true;
        patch.seenAtMs = nowMs;
        if (s.nickname[0]) patch.nickname = s.nickname;
        if (s.npub[0]) patch.npub = s.npub;
        if (s.hasLocation) {
            patch.hasLocation = true;
            patch.latitude = s.latitude;
            patch.longitude = s.longitude;
        }
        if (!rec) {
            patch.hasSource = true;
            patch.source = PeerSource::ShortRangeRadio;
        }
        commitTags_(key, tags, patch, nowMs);
    }

    // Pass 2: strip radio tags from every record absent from this cycle.
    for (uint8_t i = 0; i < registry_.count(); ++i) {
        const DeviceRecord* rec = registry_.at(i);
        if (!rec || !rec->transports.hasRadio()) continue;

        bool present = false;
        for (uint8_t k = 0; k < nKeys && !present; ++k) present = strcmp(keys[k], rec->callsign) == 0;
        if (present) continue;

        char callsign[Limits::Peers::CallsignBuf];
        memcpy(callsign, rec->callsign, sizeof(callsign));
        DevicePatch patch;
        patch.clearRssi = true;
        patch.proximity = "";
        commitTags_(callsign, reconcile(rec->transports, false, false), patch, nowMs);
    }
}

void ReachabilityAggregator::applyWiredLink(bool connected, const char* callsign, uint32_t nowMs)
{
    if (connected) {
        if (!callsign || isLocal_(callsign)) return;
        const DeviceRecord* rec = registry_.get(callsign);
        TransportSet tags = rec ? rec->transports : TransportSet{};
        tags.add(Transport::WiredLink);

        DevicePatch patch;
        patch.hasSeenAt = true;
        patch.seenAtMs = nowMs;
        if (!rec) {
            patch.hasSource = true;
            patch.source = PeerSource::WiredLink;
        }
        commitTags_(callsign, tags, patch, nowMs);
        return;
    }

    for (uint8_t i = 0; i < registry_.count(); ++i) {
        const DeviceRecord* rec = registry_.at(i);
        if (!rec || !rec->transports.has(Transport::WiredLink)) continue;
        char cs[Limits::Peers::CallsignBuf];
        memcpy(cs, rec->callsign, sizeof(cs));
        DevicePatch patch;
        commitTags_(cs, withoutWired(rec->transports), patch, nowMs);
    }
}

void ReachabilityAggregator::applyLocalDiscovery(const LocalSighting* seen, uint8_t count, uint32_t nowMs)
{
    if (!seen) return;
    for (uint8_t i = 0; i < count; ++i) {
        const LocalSighting& s = seen[i];
        if (s.callsign[0] == '\0' || isLocal_(s.callsign)) continue;

        const DeviceRecord* rec = registry_.get(s.callsign);
        TransportSet tags = rec ? rec->transports : TransportSet{};
        const bool relayOnLan = s.info.isRelay || tags.has(Transport::RelayPeerOnLan);
        tags.add(relayOnLan ? Transport::RelayPeerOnLan : Transport::LocalNetwork);

        DevicePatch patch;
        patch.endpoint = s.endpoint;
        patch.hasLatency = true;
        patch.latencyMs = s.latencyMs;
        patch.hasSeenAt = true;
        patch.seenAtMs = nowMs;
        patch.hasCheckedAt = true;
        patch.checkedAtMs = nowMs;
        applyStatusInfo_(s.info, patch);
        if (!rec) {
            patch.hasSource = true;
            patch.source = PeerSource::LocalScan;
        }
        commitTags_(s.callsign, tags, patch, nowMs);
    }
}

void ReachabilityAggregator::applyRelayClients(const RelayClient* clients, uint8_t count, uint32_t nowMs)
{
    if (!clients) return;
    for (uint8_t i = 0; i < count; ++i) {
        const RelayClient& c = clients[i];
        if (c.callsign[0] == '\0' || isLocal_(c.callsign)) continue;

        const DeviceRecord* rec = registry_.get(c.callsign);
        TransportSet tags = rec ? rec->transports : TransportSet{};
        DevicePatch patch;
        if (c.online) {
            tags.add(Transport::Internet);
            patch.hasSeenAt = true;
            patch.seenAtMs = nowMs;
        } else {
            tags.remove(Transport::Internet);
        }
        if (c.nickname[0]) patch.nickname = c.nickname;
        if (c.npub[0]) patch.npub = c.npub;
        if (c.hasLocation) {
            patch.hasLocation = true;
            patch.latitude = c.latitude;
            patch.longitude = c.longitude;
        }
        if (!rec) {
            patch.hasSource = true;
            patch.source = PeerSource::Relay;
        }
        commitTags_(c.callsign, tags, patch, nowMs);
    }
}

bool ReachabilityAggregator::ensureRelayDevice(uint32_t nowMs)
{
    if (!relay_.connected || relay_.callsign[0] == '\0') return false;

    const DeviceRecord* rec = registry_.get(relay_.callsign);
    TransportSet tags = rec ? rec->transports : TransportSet{};
    tags.add(Transport::Internet);

    DevicePatch patch;
    patch.hasSeenAt = true;
    patch.seenAtMs = nowMs;
    char base[Limits::Peers::UrlBuf];
    if ((!rec || rec->endpoint[0] == '\0') && relayHttpBase(relay_.url, base, sizeof(base))) {
        patch.endpoint = base;
    }
    if (!rec) {
        patch.hasSource = true;
        patch.source = PeerSource::Relay;
    }
    return commitTags_(relay_.callsign, tags, patch, nowMs);
}

UpsertResult ReachabilityAggregator::addManual(const char* callsign, const char* url, const char* name, uint32_t nowMs)
{
    if (isLocal_(callsign)) return UpsertResult::Rejected;

    DevicePatch patch;
    if (url && url[0]) patch.endpoint = url;
    if (name && name[0]) patch.name = name;
    if (!registry_.get(callsign)) {
        patch.hasSource = true;
        patch.source = PeerSource::Manual;
    }
    return commit_(callsign, patch, nowMs);
}
