/**
 * @file NetAddress.cpp
 * @brief URL helpers implementation.
 */

#include "Modules/DevicesModule/NetAddress.h"
#include "Modules/DevicesModule/PeerTypes.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

static const char* skipScheme_(const char* url)
{
    const char* sep = strstr(url, "://");
    return sep ? sep + 3 : url;
}

bool urlHost(const char* url, char* out, size_t outLen)
{
    if (!url || !out || outLen == 0) return false;

    const char* p = skipScheme_(url);
    const char* at = strchr(p, '@');
    const char* slash = strchr(p, '/');
    if (at && (!slash || at < slash)) p = at + 1;

    size_t len = 0;
    if (*p == '[') {
        const char* close = strchr(p, ']');
        if (!close) return false;
        ++p;
        len = (size_t)(close - p);
    } else {
        while (p[len] != '\0' && p[len] != ':' && p[len] != '/' && p[len] != '?') ++len;
    }
    if (len == 0 || len >= outLen) return false;

    memcpy(out, p, len);
    out[len] = '\0';
    return true;
}

static bool parseIpv4_(const char* s, uint8_t out[4])
{
    for (uint8_t i = 0; i < 4; ++i) {
        if (*s < '0' || *s > '9') return false;
        char* end = nullptr;
        const long v = strtol(s, &end, 10);
        if (end == s || v < 0 || v > 255) return false;
        out[i] = (uint8_t)v;
        s = end;
        if (i < 3) {
            if (*s != '.') return false;
            ++s;
        }
    }
    return *s == '\0';
}

bool isPrivateHost(const char* url)
{
    char host[64];
    if (!urlHost(url, host, sizeof(host))) return false;

    if (compareNoCase(host, "localhost") == 0) return true;
    if (strcmp(host, "::1") == 0) return true;

    uint8_t ip[4];
    if (!parseIpv4_(host, ip)) return false;

    if (ip[0] == 127) return true;
    if (ip[0] == 10) return true;
    if (ip[0] == 172 && ip[1] >= 16 && ip[1] <= 31) return true;
    if (ip[0] == 192 && ip[1] == 168) return true;
    return false;
}

bool relayHttpBase(const char* socketUrl, char* out, size_t outLen)
{
    if (!socketUrl || !out || outLen == 0) return false;

    const char* scheme = nullptr;
    const char* rest = nullptr;
    if (strncmp(socketUrl, "wss://", 6) == 0) {
        scheme = "https://";
        rest = socketUrl + 6;
    } else if (strncmp(socketUrl, "ws://", 5) == 0) {
        scheme = "http://";
        rest = socketUrl + 5;
    } else if (strncmp(socketUrl, "https://", 8) == 0) {
        scheme = "https://";
        rest = socketUrl + 8;
    } else if (strncmp(socketUrl, "http://", 7) == 0) {
        scheme = "http://";
        rest = socketUrl + 7;
    } else {
        return false;
    }

    size_t authLen = 0;
    while (rest[authLen] != '\0' && rest[authLen] != '/' && rest[authLen] != '?') ++authLen;
    if (authLen == 0) return false;

    const int wrote = snprintf(out, outLen, "%s%.*s", scheme, (int)authLen, rest);
    return wrote > 0 && (size_t)wrote < outLen;
}

bool parseSocketUrl(const char* url, char* host, size_t hostLen, uint16_t& port,
                    char* path, size_t pathLen, bool& tls)
{
    if (!url || !host || !path || hostLen == 0 || pathLen == 0) return false;

    const char* rest = nullptr;
    if (strncmp(url, "wss://", 6) == 0) {
        tls = true;
        rest = url + 6;
    } else if (strncmp(url, "ws://", 5) == 0) {
        tls = false;
        rest = url + 5;
    } else {
        return false;
    }
    if (!urlHost(url, host, hostLen)) return false;

    port = tls ? 443 : 80;
    const char* slash = strchr(rest, '/');
    const char* colon = strchr(rest, ':');
    if (*rest == '[') {
        const char* close = strchr(rest, ']');
        colon = (close && close[1] == ':') ? close + 1 : nullptr;
    }
    if (colon && (!slash || colon < slash)) {
        char* end = nullptr;
        const long v = strtol(colon + 1, &end, 10);
        if (end == colon + 1 || v <= 0 || v > 65535) return false;
        if (*end != '\0' && *end != '/') return false;
        port = (uint16_t)v;
    }

    const char* p = slash ? slash : "/";
    if (strlen(p) >= pathLen) return false;
    strcpy(path, p);
    return true;
}

bool joinUrl(const char* base, const char* path, char* out, size_t outLen)
{
    if (!base || !path || !out || outLen == 0) return false;

    size_t baseLen = strlen(base);
    while (baseLen > 0 && base[baseLen - 1] == '/') --baseLen;
    while (*path == '/') ++path;

    const int wrote = snprintf(out, outLen, "%.*s/%s", (int)baseLen, base, path);
    return wrote > 0 && (size_t)wrote < outLen;
}

bool formatLocalUrl(const uint8_t ip[4], uint16_t port, char* out, size_t outLen)
{
    if (!ip || !out || outLen == 0) return false;
    const int wrote = snprintf(out, outLen, "http://%u.%u.%u.%u:%u",
                               (unsigned)ip[0], (unsigned)ip[1], (unsigned)ip[2], (unsigned)ip[3],
                               (unsigned)port);
    return wrote > 0 && (size_t)wrote < outLen;
}
