/**
 * @file HttpProbes.cpp
 * @brief Implementation file.
 */

#include "HttpProbes.h"
#include "Core/SystemLimits.h"
#include "Domain/PeerDefaults.h"
#include "Modules/DevicesModule/NetAddress.h"
#include "Modules/DevicesModule/StatusParsers.h"
#define LOG_TAG "HttpProb"
#include "Core/ModuleLog.h"

#include <Arduino.h>
#include <HTTPClient.h>
#include <WiFiClient.h>
#include <WiFiClientSecure.h>
#include <string.h>

namespace {

enum class FetchResult : uint8_t {
    Ok,
    HttpError,
    Timeout,
    Unreachable,
    TooLarge
};

/// One GET; TLS peers are not certificate-checked.
FetchResult httpGet_(const char* url, uint32_t timeoutMs, String& body, int& code)
{
    code = 0;
    WiFiClient plain;
    WiFiClientSecure secure;
    const bool tls = strncmp(url, "https://", 8) == 0;
    if (tls) secure.setInsecure();

    HTTPClient http;
    http.setReuse(false);
    http.setConnectTimeout((int32_t)timeoutMs);
    http.setTimeout((uint16_t)((timeoutMs > 0xFFFFU) ? 0xFFFFU : timeoutMs));
    const bool begun = tls ? http.begin(secure, url) : http.begin(plain, url);
    if (!begun) return FetchResult::Unreachable;

    code = http.GET();
    if (code <= 0) {
        LOGD("GET %s: %s", url, http.errorToString(code).c_str());
        http.end();
        return (code == HTTPC_ERROR_READ_TIMEOUT) ? FetchResult::Timeout : FetchResult::Unreachable;
    }
    if (code != HTTP_CODE_OK) {
        http.end();
        return FetchResult::HttpError;
    }

    const int32_t size = http.getSize();
    if (size > (int32_t)Limits::Tasks::HttpBodyBuf) {
        LOGW("GET %s: body too large (%ld)", url, (long)size);
        http.end();
        return FetchResult::TooLarge;
    }
    body = http.getString();
    http.end();
    return FetchResult::Ok;
}

}  // namespace

DirectProbeResult HttpDirectProbe::probe(const char* endpoint, uint32_t timeoutMs)
{
    DirectProbeResult r;
    char url[Limits::Peers::UrlBuf + 16];
    if (!endpoint || !joinUrl(endpoint, PeerDefaults::StatusPath, url, sizeof(url))) {
        r.status = ProbeStatus::Unavailable;
        return r;
    }

    String body;
    int code = 0;
    const uint32_t start = millis();
    const FetchResult res = httpGet_(url, timeoutMs, body, code);
    const uint32_t elapsed = millis() - start;

    switch (res) {
    case FetchResult::Ok:
        r.status = ProbeStatus::Success;
        r.latencyMs = (int32_t)elapsed;
        r.hasInfo = parseStatusBody(body.c_str(), r.info);
        break;
    case FetchResult::Timeout:
        r.status = ProbeStatus::Timeout;
        break;
    case FetchResult::HttpError:
    case FetchResult::Unreachable:
    case FetchResult::TooLarge:
        r.status = (elapsed >= timeoutMs) ? ProbeStatus::Timeout : ProbeStatus::Unavailable;
        break;
    }
    return r;
}

ProxyProbeResult HttpRelayProbe::probe(const char* relayBase, const char* callsign, uint32_t timeoutMs)
{
    ProxyProbeResult r;
    char path[sizeof(PeerDefaults::DevicePathPrefix) + Limits::Peers::CallsignBuf];
    char url[Limits::Peers::UrlBuf + sizeof(path)];
    if (!relayBase || !callsign) {
        r.status = ProbeStatus::NoRelay;
        return r;
    }
    snprintf(path, sizeof(path), "%s%s", PeerDefaults::DevicePathPrefix, callsign);
    if (!joinUrl(relayBase, path, url, sizeof(url))) {
        r.status = ProbeStatus::NoRelay;
        return r;
    }

    String body;
    int code = 0;
    switch (httpGet_(url, timeoutMs, body, code)) {
    case FetchResult::Ok: {
        bool connected = false;
        if (!parseDeviceConnected(body.c_str(), connected)) r.status = ProbeStatus::Unavailable;
        else r.status = connected ? ProbeStatus::Success : ProbeStatus::Rejected;
        break;
    }
    case FetchResult::Timeout:
        r.status = ProbeStatus::Timeout;
        break;
    case FetchResult::HttpError:
    case FetchResult::Unreachable:
    case FetchResult::TooLarge:
        r.status = ProbeStatus::Unavailable;
        break;
    }
    return r;
}

bool fetchRelayClients(const char* relayBase, uint32_t timeoutMs,
                       RelayClient* out, uint8_t max, uint8_t& count)
{
    count = 0;
    char url[Limits::Peers::UrlBuf + 16];
    if (!relayBase || !joinUrl(relayBase, PeerDefaults::DevicesPath, url, sizeof(url))) return false;

    String body;
    int code = 0;
    if (httpGet_(url, timeoutMs, body, code) != FetchResult::Ok) {
        LOGD("relay clients unavailable (%d)", code);
        return false;
    }
    count = parseRelayClients(body.c_str(), out, max);
    return true;
}

bool fetchCollections(const char* callsign, const char* endpoint, const char* relayBase,
                      uint32_t timeoutMs, CollectionDescriptor* out, uint8_t max, uint8_t& count)
{
    count = 0;
    char url[Limits::Peers::UrlBuf + 32];
    String body;
    int code = 0;

    if (endpoint && endpoint[0] != '\0' &&
        joinUrl(endpoint, PeerDefaults::FilesPath, url, sizeof(url)) &&
        httpGet_(url, timeoutMs, body, code) == FetchResult::Ok) {
        count = parseFileCollections(body.c_str(), out, max);
        return true;
    }

    if (!relayBase || relayBase[0] == '\0' || !callsign) return false;
    char path[sizeof(PeerDefaults::DevicePathPrefix) + Limits::Peers::CallsignBuf + sizeof(PeerDefaults::FilesPath)];
    snprintf(path, sizeof(path), "%s%s%s", PeerDefaults::DevicePathPrefix, callsign, PeerDefaults::FilesPath);
    if (!joinUrl(relayBase, path, url, sizeof(url))) return false;
    if (httpGet_(url, timeoutMs, body, code) != FetchResult::Ok) return false;

    count = parseFileCollections(body.c_str(), out, max);
    return true;
}
