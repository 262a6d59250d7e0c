/**
 * @file PeerTypes.cpp
 * @brief Transport labels, callsign helpers and record utilities.
 */

#include "Modules/DevicesModule/PeerTypes.h"
#include "Domain/PeerDefaults.h"

#include <ctype.h>
#include <string.h>

const char* transportLabel(Transport t)
{
    switch (t) {
    case Transport::LocalNetwork:    return "LAN";
    case Transport::RelayPeerOnLan:  return "LAN relay";
    case Transport::Internet:        return "Internet";
    case Transport::ShortRangeRadio: return "Bluetooth";
    case Transport::RadioEnhanced:   return "Bluetooth+";
    case Transport::WiredLink:       return "USB";
    case Transport::Count:           break;
    }
    return "?";
}

const char* transportWireName(Transport t)
{
    switch (t) {
    case Transport::LocalNetwork:    return "local-network";
    case Transport::RelayPeerOnLan:  return "relay-peer-on-lan";
    case Transport::Internet:        return "internet";
    case Transport::ShortRangeRadio: return "short-range-radio";
    case Transport::RadioEnhanced:   return "radio-enhanced";
    case Transport::WiredLink:       return "wired-link";
    case Transport::Count:           break;
    }
    return "";
}

bool transportFromWireName(const char* name, Transport& out)
{
    if (!name || name[0] == '\0') return false;

    for (uint8_t i = 0; i < kTransportCount; ++i) {
        const Transport t = (Transport)i;
        if (strcmp(name, transportWireName(t)) == 0) {
            out = t;
            return true;
        }
    }

    // Aliases reported by relays and older peers.
    if (strcmp(name, "wifi_local") == 0) { out = Transport::LocalNetwork; return true; }
    if (strcmp(name, "lan") == 0) { out = Transport::RelayPeerOnLan; return true; }
    if (strcmp(name, "bluetooth") == 0) { out = Transport::ShortRangeRadio; return true; }
    if (strcmp(name, "bluetooth_plus") == 0) { out = Transport::RadioEnhanced; return true; }
    if (strcmp(name, "usb") == 0) { out = Transport::WiredLink; return true; }
    return false;
}

uint8_t TransportSet::count() const
{
    uint8_t n = 0;
    for (uint8_t i = 0; i < kTransportCount; ++i) {
        if (bits & (1U << i)) ++n;
    }
    return n;
}

bool TransportSet::first(Transport& out) const
{
    for (uint8_t i = 0; i < kTransportCount; ++i) {
        if (bits & (1U << i)) {
            out = (Transport)i;
            return true;
        }
    }
    return false;
}

bool isSessionOnly(Transport t)
{
    switch (t) {
    case Transport::LocalNetwork:
    case Transport::RelayPeerOnLan:
    case Transport::Internet:
    case Transport::ShortRangeRadio:
    case Transport::RadioEnhanced:
    case Transport::WiredLink:
        return true;
    case Transport::Count:
        break;
    }
    return true;
}

TransportSet withoutSessionTags(TransportSet set)
{
    for (uint8_t i = 0; i < kTransportCount; ++i) {
        const Transport t = (Transport)i;
        if (isSessionOnly(t)) set.remove(t);
    }
    return set;
}

const char* peerSourceName(PeerSource s)
{
    switch (s) {
    case PeerSource::LocalScan:       return "local-scan";
    case PeerSource::Relay:           return "relay";
    case PeerSource::ShortRangeRadio: return "short-range-radio";
    case PeerSource::WiredLink:       return "wired-link";
    case PeerSource::Manual:          return "manual";
    case PeerSource::Cache:           return "cache";
    }
    return "manual";
}

bool peerSourceFromName(const char* name, PeerSource& out)
{
    if (!name) return false;
    static const PeerSource kAll[] = {
        PeerSource::LocalScan, PeerSource::Relay, PeerSource::ShortRangeRadio,
        PeerSource::WiredLink, PeerSource::Manual, PeerSource::Cache
    };
    for (PeerSource s : kAll) {
        if (strcmp(name, peerSourceName(s)) == 0) {
            out = s;
            return true;
        }
    }
    return false;
}

const char* proximityLabel(int16_t rssi)
{
    if (rssi > PeerDefaults::RssiVeryClose) return "Very close";
    if (rssi > PeerDefaults::RssiNearby) return "Nearby";
    if (rssi > PeerDefaults::RssiInRange) return "In range";
    return "Far";
}

const char* displayName(const DeviceRecord& r)
{
    if (r.nickname[0] != '\0') return r.nickname;
    if (r.name[0] != '\0') return r.name;
    return r.callsign;
}

bool normalizeCallsign(const char* in, char* out, size_t outLen)
{
    if (!in || !out || outLen == 0) return false;

    while (*in == ' ' || *in == '\t') ++in;
    size_t len = strlen(in);
    while (len > 0 && (in[len - 1] == ' ' || in[len - 1] == '\t' ||
                       in[len - 1] == '\r' || in[len - 1] == '\n')) {
        --len;
    }
    if (len == 0 || len > Limits::Peers::CallsignMaxLen || len >= outLen) return false;

    for (size_t i = 0; i < len; ++i) {
        const char c = in[i];
        if (!isalnum((unsigned char)c) && c != '-' && c != '_') return false;
    }
    for (size_t i = 0; i < len; ++i) {
        out[i] = (char)toupper((unsigned char)in[i]);
    }
    out[len] = '\0';
    return true;
}

int compareNoCase(const char* a, const char* b)
{
    if (!a) a = "";
    if (!b) b = "";
    while (*a && *b) {
        const int ca = tolower((unsigned char)*a);
        const int cb = tolower((unsigned char)*b);
        if (ca != cb) return ca - cb;
        ++a;
        ++b;
    }
    return tolower((unsigned char)*a) - tolower((unsigned char)*b);
}

bool copyBounded(char* out, size_t outLen, const char* in)
{
    if (!out || outLen == 0 || !in) return false;
    const size_t len = strlen(in);
    if (len >= outLen) return false;
    memcpy(out, in, len + 1);
    return true;
}
