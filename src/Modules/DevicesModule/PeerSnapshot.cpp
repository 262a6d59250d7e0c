/**
 * @file PeerSnapshot.cpp
 * @brief JSON rendering of device records and of the full ordered registry.
 */

#include "Modules/DevicesModule/PeerSnapshot.h"

void writeDeviceJson(JsonObject obj, const DeviceRecord& rec)
{
    obj["callsign"] = rec.callsign;
    obj["display"] = displayName(rec);
    if (rec.name[0]) obj["name"] = rec.name;
    if (rec.nickname[0]) obj["nickname"] = rec.nickname;
    if (rec.npub[0]) obj["npub"] = rec.npub;
    if (rec.platform[0]) obj["platform"] = rec.platform;
    if (rec.endpoint[0]) obj["url"] = rec.endpoint;

    obj["online"] = rec.online;
    if (rec.latencyMs >= 0) obj["latency_ms"] = rec.latencyMs;
    obj["last_seen_ms"] = rec.lastSeenMs;
    obj["last_checked_ms"] = rec.lastCheckedMs;
    if (rec.lastFetchedMs) obj["last_fetched_ms"] = rec.lastFetchedMs;

    JsonArray tags = obj.createNestedArray("transports");
    JsonArray labels = obj.createNestedArray("labels");
    for (uint8_t i = 0; i < kTransportCount; ++i) {
        const Transport t = (Transport)i;
        if (!rec.transports.has(t)) continue;
        tags.add(transportWireName(t));
        labels.add(transportLabel(t));
    }

    if (rec.hasLocation) {
        JsonObject loc = obj.createNestedObject("location");
        loc["latitude"] = rec.latitude;
        loc["longitude"] = rec.longitude;
    }
    if (rec.description[0]) obj["description"] = rec.description;
    if (rec.color[0]) obj["color"] = rec.color;

    obj["pinned"] = rec.pinned;
    obj["folder"] = rec.folderId;
    obj["source"] = peerSourceName(rec.source);
    if (rec.hasRssi) {
        obj["rssi"] = rec.rssi;
        obj["proximity"] = rec.proximity;
    }
}

bool buildPeersSnapshot(const DeviceRegistry& registry, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;

    const DeviceRecord* ordered[Limits::Peers::MaxDevices];
    const uint8_t n = registry.all(ordered, Limits::Peers::MaxDevices);

    DynamicJsonDocument doc(Limits::PeerJson::SnapshotDoc);
    doc["ok"] = true;
    doc["gen"] = registry.generation();
    uint8_t online = 0;
    JsonArray arr = doc.createNestedArray("devices");
    for (uint8_t i = 0; i < n; ++i) {
        if (ordered[i]->online) ++online;
        writeDeviceJson(arr.createNestedObject(), *ordered[i]);
    }
    doc["count"] = n;
    doc["online"] = online;

    if (doc.overflowed() || measureJson(doc) >= outLen) return false;
    serializeJson(doc, out, outLen);
    return true;
}

bool buildDeviceReply(const DeviceRecord& rec, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;

    StaticJsonDocument<Limits::PeerJson::CacheRecordDoc + 256> doc;
    doc["ok"] = true;
    writeDeviceJson(doc.createNestedObject("device"), rec);
    if (doc.overflowed() || measureJson(doc) >= outLen) return false;
    serializeJson(doc, out, outLen);
    return true;
}
