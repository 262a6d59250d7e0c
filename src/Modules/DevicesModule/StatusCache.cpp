/**
 * @file StatusCache.cpp
 * @brief JSON codec and key layout for the persisted device cache.
 */

#include "Modules/DevicesModule/StatusCache.h"

#include <ArduinoJson.h>
#include <stdio.h>
#include <string.h>

namespace {
constexpr const char* kIndexKey = "idx";
constexpr const char* kFoldersKey = "folders";
constexpr char kRecordPrefix = 'd';
constexpr char kCollectionsPrefix = 'c';

void copyField_(char* out, size_t outLen, const char* in)
{
    if (!in) return;
    if (!copyBounded(out, outLen, in)) {
        // Truncate oversized persisted text.
        strncpy(out, in, outLen - 1);
        out[outLen - 1] = '\0';
    }
}
}

bool StatusCache::recordKey_(const char* callsign, char prefix, char* out, size_t outLen)
{
    char norm[Limits::Peers::CallsignBuf];
    if (!normalizeCallsign(callsign, norm, sizeof(norm))) return false;
    const int n = snprintf(out, outLen, "%c_%s", prefix, norm);
    return n > 0 && (size_t)n < outLen && (size_t)n <= Limits::MaxNvsKeyLen;
}

bool StatusCache::encodeRecord(const DeviceRecord& rec, char* out, size_t outLen)
{
    if (!out || outLen == 0 || rec.callsign[0] == '\0') return false;

    StaticJsonDocument<Limits::PeerJson::CacheRecordDoc> doc;
    doc["cs"] = rec.callsign;
    if (rec.npub[0]) doc["np"] = rec.npub;
    if (rec.name[0]) doc["nm"] = rec.name;
    if (rec.nickname[0]) doc["nk"] = rec.nickname;
    if (rec.platform[0]) doc["pf"] = rec.platform;
    if (rec.endpoint[0]) doc["ep"] = rec.endpoint;
    if (rec.description[0]) doc["ds"] = rec.description;
    if (rec.color[0]) doc["co"] = rec.color;
    if (rec.lastSeenMs) doc["ls"] = rec.lastSeenMs;
    if (rec.lastFetchedMs) doc["lf"] = rec.lastFetchedMs;
    if (rec.hasLocation) {
        doc["lat"] = rec.latitude;
        doc["lon"] = rec.longitude;
    }
    if (rec.pinned) doc["pn"] = true;
    if (rec.folderId != 0) doc["fd"] = rec.folderId;
    doc["src"] = peerSourceName(rec.source);

    if (doc.overflowed()) return false;
    const size_t need = measureJson(doc);
    if (need >= outLen) return false;
    serializeJson(doc, out, outLen);
    return true;
}

bool StatusCache::decodeRecord(const char* json, DeviceRecord& out)
{
    if (!json || json[0] == '\0') return false;

    StaticJsonDocument<Limits::PeerJson::CacheRecordDoc> doc;
    const DeserializationError err = deserializeJson(doc, json);
    if (err || !doc.is<JsonObjectConst>()) return false;

    DeviceRecord rec{};
    const char* cs = doc["cs"] | "";
    if (!normalizeCallsign(cs, rec.callsign, sizeof(rec.callsign))) return false;

    copyField_(rec.npub, sizeof(rec.npub), doc["np"] | (const char*)nullptr);
    copyField_(rec.name, sizeof(rec.name), doc["nm"] | (const char*)nullptr);
    copyField_(rec.nickname, sizeof(rec.nickname), doc["nk"] | (const char*)nullptr);
    copyField_(rec.platform, sizeof(rec.platform), doc["pf"] | (const char*)nullptr);
    copyField_(rec.endpoint, sizeof(rec.endpoint), doc["ep"] | (const char*)nullptr);
    copyField_(rec.description, sizeof(rec.description), doc["ds"] | (const char*)nullptr);
    copyField_(rec.color, sizeof(rec.color), doc["co"] | (const char*)nullptr);

    rec.lastSeenMs = doc["ls"] | 0U;
    rec.lastFetchedMs = doc["lf"] | 0U;
    if (doc["lat"].is<double>() && doc["lon"].is<double>()) {
        rec.hasLocation = true;
        rec.latitude = doc["lat"].as<double>();
        rec.longitude = doc["lon"].as<double>();
    }
    rec.pinned = doc["pn"] | false;
    rec.folderId = doc["fd"] | (uint8_t)0;

    PeerSource src = PeerSource::Cache;
    if (peerSourceFromName(doc["src"] | "", src)) rec.source = src;
    else rec.source = PeerSource::Cache;

    // Session state never survives a restart.
    rec.online = false;
    rec.latencyMs = -1;
    rec.transports.clear();
    rec.hasRssi = false;
    rec.rssi = 0;
    rec.proximity[0] = '\0';

    out = rec;
    return true;
}

uint8_t StatusCache::readIndex_(char (*out)[Limits::Peers::CallsignBuf], uint8_t max)
{
    char text[Limits::PeerJson::CacheIndexText];
    if (!backend_.get(kIndexKey, text, sizeof(text))) return 0;

    DynamicJsonDocument doc(Limits::PeerJson::CacheIndexDoc);
    if (deserializeJson(doc, text) || !doc.is<JsonArrayConst>()) return 0;

    uint8_t n = 0;
    for (JsonVariantConst v : doc.as<JsonArrayConst>()) {
        if (n >= max) break;
        const char* cs = v | "";
        if (!normalizeCallsign(cs, out[n], Limits::Peers::CallsignBuf)) continue;
        ++n;
    }
    return n;
}

bool StatusCache::writeIndex_(const char (*items)[Limits::Peers::CallsignBuf], uint8_t count)
{
    DynamicJsonDocument doc(Limits::PeerJson::CacheIndexDoc);
    JsonArray arr = doc.to<JsonArray>();
    for (uint8_t i = 0; i < count; ++i) arr.add(items[i]);
    if (doc.overflowed()) return false;

    char text[Limits::PeerJson::CacheIndexText];
    if (measureJson(doc) >= sizeof(text)) return false;
    serializeJson(doc, text, sizeof(text));
    return backend_.put(kIndexKey, text);
}

bool StatusCache::indexAdd_(const char* callsign)
{
    char items[Limits::Peers::MaxDevices][Limits::Peers::CallsignBuf];
    const uint8_t n = readIndex_(items, Limits::Peers::MaxDevices);
    for (uint8_t i = 0; i < n; ++i) {
        if (strcmp(items[i], callsign) == 0) return true;
    }
    if (n >= Limits::Peers::MaxDevices) return false;
    memcpy(items[n], callsign, Limits::Peers::CallsignBuf);
    return writeIndex_(items, (uint8_t)(n + 1U));
}

bool StatusCache::indexRemove_(const char* callsign)
{
    char items[Limits::Peers::MaxDevices][Limits::Peers::CallsignBuf];
    const uint8_t n = readIndex_(items, Limits::Peers::MaxDevices);
    uint8_t kept = 0;
    bool found = false;
    for (uint8_t i = 0; i < n; ++i) {
        if (strcmp(items[i], callsign) == 0) {
            found = true;
            continue;
        }
        if (kept != i) memcpy(items[kept], items[i], Limits::Peers::CallsignBuf);
        ++kept;
    }
    if (!found) return true;
    return writeIndex_(items, kept);
}

bool StatusCache::save(const DeviceRecord& rec)
{
    char key[Limits::MaxNvsKeyLen + 1];
    if (!recordKey_(rec.callsign, kRecordPrefix, key, sizeof(key))) return false;

    char text[Limits::PeerJson::CacheRecordText];
    if (!encodeRecord(rec, text, sizeof(text))) return false;
    if (!backend_.put(key, text)) return false;
    return indexAdd_(rec.callsign);
}

bool StatusCache::load(const char* callsign, DeviceRecord& out)
{
    char key[Limits::MaxNvsKeyLen + 1];
    if (!recordKey_(callsign, kRecordPrefix, key, sizeof(key))) return false;

    char text[Limits::PeerJson::CacheRecordText];
    if (!backend_.get(key, text, sizeof(text))) return false;
    return decodeRecord(text, out);
}

bool StatusCache::evict(const char* callsign)
{
    char norm[Limits::Peers::CallsignBuf];
    if (!normalizeCallsign(callsign, norm, sizeof(norm))) return false;

    char key[Limits::MaxNvsKeyLen + 1];
    bool ok = true;
    if (recordKey_(norm, kRecordPrefix, key, sizeof(key))) ok = backend_.erase(key) && ok;
    if (recordKey_(norm, kCollectionsPrefix, key, sizeof(key))) ok = backend_.erase(key) && ok;
    return indexRemove_(norm) && ok;
}

uint8_t StatusCache::loadAll(CacheRecordFn fn, void* ctx)
{
    if (!fn) return 0;

    char items[Limits::Peers::MaxDevices][Limits::Peers::CallsignBuf];
    const uint8_t n = readIndex_(items, Limits::Peers::MaxDevices);

    uint8_t delivered = 0;
    for (uint8_t i = 0; i < n; ++i) {
        DeviceRecord rec;
        if (!load(items[i], rec)) continue;
        fn(ctx, rec);
        ++delivered;
    }
    return delivered;
}

bool StatusCache::encodeCollections(const CollectionDescriptor* items, uint8_t count, char* out, size_t outLen)
{
    if (!out || outLen == 0 || (!items && count > 0)) return false;

    DynamicJsonDocument doc(Limits::PeerJson::CollectionsDoc);
    JsonArray arr = doc.to<JsonArray>();
    for (uint8_t i = 0; i < count; ++i) {
        JsonObject o = arr.createNestedObject();
        o["n"] = items[i].name;
        o["k"] = items[i].kind;
        if (items[i].description[0]) o["d"] = items[i].description;
        if (items[i].fileCount >= 0) o["f"] = items[i].fileCount;
        if (!items[i].isPublic) o["p"] = false;
    }
    if (doc.overflowed()) return false;
    if (measureJson(doc) >= outLen) return false;
    serializeJson(doc, out, outLen);
    return true;
}

uint8_t StatusCache::decodeCollections(const char* json, CollectionDescriptor* out, uint8_t max)
{
    if (!json || !out || max == 0) return 0;

    DynamicJsonDocument doc(Limits::PeerJson::CollectionsDoc);
    if (deserializeJson(doc, json) || !doc.is<JsonArrayConst>()) return 0;

    uint8_t n = 0;
    for (JsonObjectConst o : doc.as<JsonArrayConst>()) {
        if (n >= max) break;
        CollectionDescriptor c{};
        const char* name = o["n"] | "";
        if (name[0] == '\0') continue;
        copyField_(c.name, sizeof(c.name), name);
        copyField_(c.kind, sizeof(c.kind), o["k"] | "");
        copyField_(c.description, sizeof(c.description), o["d"] | (const char*)nullptr);
        c.fileCount = o["f"] | -1;
        c.isPublic = o["p"] | true;
        out[n++] = c;
    }
    return n;
}

bool StatusCache::saveCollections(const char* callsign, const CollectionDescriptor* items, uint8_t count)
{
    char key[Limits::MaxNvsKeyLen + 1];
    if (!recordKey_(callsign, kCollectionsPrefix, key, sizeof(key))) return false;

    char text[Limits::PeerJson::CollectionsText];
    if (!encodeCollections(items, count, text, sizeof(text))) return false;
    return backend_.put(key, text);
}

uint8_t StatusCache::loadCollections(const char* callsign, CollectionDescriptor* out, uint8_t max)
{
    char key[Limits::MaxNvsKeyLen + 1];
    if (!recordKey_(callsign, kCollectionsPrefix, key, sizeof(key))) return 0;

    char text[Limits::PeerJson::CollectionsText];
    if (!backend_.get(key, text, sizeof(text))) return 0;
    return decodeCollections(text, out, max);
}

bool StatusCache::saveFolders(const char* json)
{
    if (!json) return false;
    return backend_.put(kFoldersKey, json);
}

bool StatusCache::loadFolders(char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;
    return backend_.get(kFoldersKey, out, outLen);
}

bool StatusCache::wipe()
{
    return backend_.clear();
}
