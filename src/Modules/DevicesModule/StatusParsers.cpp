/**
 * @file StatusParsers.cpp
 * @brief Decoders for peer and relay HTTP bodies and socket messages.
 */

#include "Modules/DevicesModule/StatusParsers.h"
#include "Domain/PeerDefaults.h"

#include <ArduinoJson.h>
#include <ctype.h>
#include <stdio.h>
#include <string.h>

namespace {
const char* const kCollectionKinds[] = {
    "chat", "forum", "blog", "events", "news", "www",
    "postcards", "contacts", "places", "market", "alerts", "groups"
};

bool takeText_(JsonVariantConst v, char* out, size_t outLen)
{
    const char* s = v.as<const char*>();
    if (!s || s[0] == '\0') return false;
    if (copyBounded(out, outLen, s)) return true;
    strncpy(out, s, outLen - 1);
    out[outLen - 1] = '\0';
    return true;
}

bool takeLocation_(JsonObjectConst o, double& lat, double& lon)
{
    JsonVariantConst la = o["latitude"];
    JsonVariantConst lo = o["longitude"];
    if (!la.is<double>() || !lo.is<double>()) {
        JsonObjectConst loc = o["location"].as<JsonObjectConst>();
        if (loc.isNull()) return false;
        la = loc["latitude"];
        lo = loc["longitude"];
        if (!la.is<double>() || !lo.is<double>()) return false;
    }
    lat = la.as<double>();
    lon = lo.as<double>();
    return true;
}

bool startsWithNoCase_(const char* s, const char* prefix)
{
    while (*prefix) {
        if (tolower((unsigned char)*s) != tolower((unsigned char)*prefix)) return false;
        ++s;
        ++prefix;
    }
    return true;
}
}

bool isKnownCollectionKind(const char* name)
{
    if (!name) return false;
    for (const char* kind : kCollectionKinds) {
        if (compareNoCase(name, kind) == 0) return true;
    }
    return false;
}

bool parseStatusBody(const char* body, StatusInfo& out)
{
    out = StatusInfo{};
    if (!body || body[0] == '\0') return false;

    DynamicJsonDocument doc(Limits::PeerJson::StatusDoc);
    if (deserializeJson(doc, body) || !doc.is<JsonObjectConst>()) return false;
    JsonObjectConst o = doc.as<JsonObjectConst>();

    const char* cs = o["callsign"] | (const char*)nullptr;
    if (!cs || cs[0] == '\0') cs = o["stationCallsign"] | (const char*)nullptr;
    if (cs) out.hasCallsign = normalizeCallsign(cs, out.callsign, sizeof(out.callsign));

    out.hasNickname = takeText_(o["nickname"], out.nickname, sizeof(out.nickname));
    out.hasColor = takeText_(o["color"], out.color, sizeof(out.color));
    out.hasDescription = takeText_(o["description"], out.description, sizeof(out.description));
    out.hasPlatform = takeText_(o["platform"], out.platform, sizeof(out.platform));
    out.hasNpub = takeText_(o["npub"], out.npub, sizeof(out.npub));
    out.hasLocation = takeLocation_(o, out.latitude, out.longitude);

    const char* service = o["service"] | "";
    out.isRelay = (strcmp(service, PeerDefaults::RelayServiceName) == 0) ||
                  (out.hasCallsign && startsWithNoCase_(out.callsign, PeerDefaults::RelayCallsignPrefix));
    return true;
}

bool parseDeviceConnected(const char* body, bool& connected)
{
    if (!body || body[0] == '\0') return false;

    StaticJsonDocument<Limits::PeerJson::DeviceReplyDoc> doc;
    if (deserializeJson(doc, body) || !doc.is<JsonObjectConst>()) return false;
    JsonVariantConst v = doc["connected"];
    if (!v.is<bool>()) return false;
    connected = v.as<bool>();
    return true;
}

uint8_t parseRelayClients(const char* body, RelayClient* out, uint8_t max)
{
    if (!body || !out || max == 0) return 0;

    DynamicJsonDocument doc(Limits::PeerJson::DevicesDoc);
    if (deserializeJson(doc, body)) return 0;
    JsonArrayConst list = doc["devices"].as<JsonArrayConst>();
    if (list.isNull()) return 0;

    uint8_t n = 0;
    for (JsonObjectConst d : list) {
        if (n >= max) break;
        const char* cs = d["callsign"] | "";
        if (cs[0] == '\0' || strcmp(cs, PeerDefaults::UnknownCallsign) == 0) continue;

        RelayClient c{};
        if (!normalizeCallsign(cs, c.callsign, sizeof(c.callsign))) continue;
        takeText_(d["nickname"], c.nickname, sizeof(c.nickname));
        takeText_(d["npub"], c.npub, sizeof(c.npub));
        c.hasLocation = takeLocation_(d, c.latitude, c.longitude);
        c.online = d["is_online"] | false;

        for (JsonVariantConst t : d["connection_types"].as<JsonArrayConst>()) {
            Transport tag;
            if (transportFromWireName(t.as<const char*>(), tag)) c.reported.add(tag);
        }
        out[n++] = c;
    }
    return n;
}

uint8_t parseFileCollections(const char* body, CollectionDescriptor* out, uint8_t max)
{
    if (!body || !out || max == 0) return 0;

    DynamicJsonDocument doc(Limits::PeerJson::FilesDoc);
    if (deserializeJson(doc, body)) return 0;
    JsonArrayConst entries = doc["entries"].as<JsonArrayConst>();
    if (entries.isNull()) return 0;

    uint8_t n = 0;
    for (JsonObjectConst e : entries) {
        if (n >= max) break;
        bool isDir = e["isDirectory"] | false;
        if (!isDir) isDir = strcmp(e["type"] | "", "directory") == 0;
        if (!isDir) continue;

        const char* name = e["name"] | "";
        if (!isKnownCollectionKind(name)) continue;

        CollectionDescriptor c{};
        if (!copyBounded(c.name, sizeof(c.name), name)) continue;
        size_t i = 0;
        for (; name[i] != '\0' && i + 1 < sizeof(c.kind); ++i) c.kind[i] = (char)tolower((unsigned char)name[i]);
        c.kind[i] = '\0';
        snprintf(c.description, sizeof(c.description), "%c%s collection",
                 (char)toupper((unsigned char)c.kind[0]), c.kind + 1);
        c.fileCount = e["fileCount"] | -1;
        c.isPublic = e["public"] | true;
        out[n++] = c;
    }
    return n;
}

bool parseRelayMessage(const char* text, RelayMessage& out)
{
    out = RelayMessage{};
    if (!text || text[0] == '\0') return false;

    StaticJsonDocument<Limits::PeerJson::RelayMsgDoc> doc;
    if (deserializeJson(doc, text) || !doc.is<JsonObjectConst>()) return false;

    const char* type = doc["type"] | "";
    if (strcmp(type, "hello_ack") == 0) {
        out.type = RelayMessageType::HelloAck;
        out.success = doc["success"] | false;
        const char* sid = doc["station_id"] | "";
        if (sid[0] != '\0' && !normalizeCallsign(sid, out.stationId, sizeof(out.stationId))) {
            out.stationId[0] = '\0';
        }
    } else if (strcmp(type, "PING") == 0) {
        out.type = RelayMessageType::Ping;
    } else if (strcmp(type, "PONG") == 0) {
        out.type = RelayMessageType::Pong;
    }
    return true;
}

bool buildRelayHello(const char* callsign, char* out, size_t outLen)
{
    if (!callsign || !out || outLen == 0) return false;
    StaticJsonDocument<128> doc;
    doc["type"] = "hello";
    doc["callsign"] = callsign;
    if (measureJson(doc) >= outLen) return false;
    serializeJson(doc, out, outLen);
    return true;
}

bool decodeRadioAdvert(const uint8_t* data, size_t len, const uint8_t addr[6],
                       char* key, size_t keyLen, bool& hasCallsign)
{
    hasCallsign = false;
    if (!addr || !key || keyLen == 0) return false;

    if (data && len > 1 && data[0] == PeerDefaults::RadioMarker) {
        char raw[Limits::Peers::CallsignBuf + 1];
        size_t n = 0;
        for (size_t i = 1; i < len && data[i] != 0 && n < sizeof(raw) - 1; ++i) {
            raw[n++] = (char)data[i];
        }
        raw[n] = '\0';
        if (normalizeCallsign(raw, key, keyLen)) {
            hasCallsign = true;
            return true;
        }
    }

    const int wrote = snprintf(key, keyLen, "%s%02X%02X%02X", PeerDefaults::RadioKeyPrefix,
                               (unsigned)addr[3], (unsigned)addr[4], (unsigned)addr[5]);
    return wrote > 0 && (size_t)wrote < keyLen;
}

bool parseWiredHello(const char* line, char* callsign, size_t callsignLen)
{
    if (!line || !callsign || callsignLen == 0) return false;

    StaticJsonDocument<Limits::PeerJson::RelayMsgDoc> doc;
    if (deserializeJson(doc, line) || !doc.is<JsonObjectConst>()) return false;
    if (strcmp(doc["type"] | "", "hello") != 0) return false;
    return normalizeCallsign(doc["callsign"] | "", callsign, callsignLen);
}
