#pragma once
/**
 * @file PeerTypes.h
 * @brief Device record, transport tags and patch types shared by the peer logic.
 */

#include <stddef.h>
#include <stdint.h>

#include "Core/SystemLimits.h"

/** @brief Communication paths that can confirm a peer is reachable. */
enum class Transport : uint8_t {
    LocalNetwork = 0,
    RelayPeerOnLan,
    Internet,
    ShortRangeRadio,
    RadioEnhanced,
    WiredLink,
    Count
};

/** @brief Number of transport tags. */
constexpr uint8_t kTransportCount = (uint8_t)Transport::Count;

/** @brief Sentinel stored in event payloads when no single transport caused a change. */
constexpr uint8_t kTransportNone = 0xFF;

/** @brief Display label (`LAN`, `Internet`, `Bluetooth`...). */
const char* transportLabel(Transport t);
/** @brief Stable wire name (`local-network`, `internet`...). */
const char* transportWireName(Transport t);
/** @brief Parse a wire name or a legacy alias. */
bool transportFromWireName(const char* name, Transport& out);

/**
 * @brief Unordered set of transport tags (bitmask).
 */
struct TransportSet {
    uint8_t bits = 0;

    bool has(Transport t) const { return (bits & bit(t)) != 0; }
    void add(Transport t) { bits |= bit(t); }
    void remove(Transport t) { bits &= (uint8_t)~bit(t); }
    bool empty() const { return bits == 0; }
    void clear() { bits = 0; }
    bool hasLocal() const { return has(Transport::LocalNetwork) || has(Transport::RelayPeerOnLan); }
    bool hasRadio() const { return has(Transport::ShortRangeRadio) || has(Transport::RadioEnhanced); }
    uint8_t count() const;
    /** @brief First tag in enum order, false when empty. */
    bool first(Transport& out) const;

    bool operator==(const TransportSet& o) const { return bits == o.bits; }
    bool operator!=(const TransportSet& o) const { return bits != o.bits; }

    static uint8_t bit(Transport t) { return (uint8_t)(1U << (uint8_t)t); }
};

/** @brief Tags that describe only the current live session (never persisted). */
bool isSessionOnly(Transport t);
/** @brief Remove every session-only tag from a set. */
TransportSet withoutSessionTags(TransportSet set);

/** @brief Where a record was first learned from (display and cleanup only). */
enum class PeerSource : uint8_t {
    LocalScan = 0,
    Relay,
    ShortRangeRadio,
    WiredLink,
    Manual,
    Cache
};

/** @brief Wire name of a source tag. */
const char* peerSourceName(PeerSource s);
/** @brief Parse a source wire name. */
bool peerSourceFromName(const char* name, PeerSource& out);

/** @brief Radio proximity label from RSSI (`Very close`, `Nearby`, `In range`, `Far`). */
const char* proximityLabel(int16_t rssi);

/**
 * @brief One entry per peer, keyed by the uppercase callsign.
 */
struct DeviceRecord {
    char callsign[Limits::Peers::CallsignBuf] = {0};
    char npub[Limits::Peers::NpubBuf] = {0};
    char name[Limits::Peers::NameBuf] = {0};
    char nickname[Limits::Peers::NicknameBuf] = {0};
    char platform[Limits::Peers::PlatformBuf] = {0};
    char endpoint[Limits::Peers::UrlBuf] = {0};

    bool online = false;
    int32_t latencyMs = -1;
    uint32_t lastSeenMs = 0;
    uint32_t lastCheckedMs = 0;
    uint32_t lastFetchedMs = 0;
    uint32_t lastConfirmedMs = 0;   ///< last time the tag set was non-empty

    TransportSet transports;

    bool hasLocation = false;
    double latitude = 0.0;
    double longitude = 0.0;
    char description[Limits::Peers::DescriptionBuf] = {0};
    char color[Limits::Peers::ColorBuf] = {0};

    bool pinned = false;
    uint8_t folderId = 0;
    PeerSource source = PeerSource::Manual;

    bool hasRssi = false;
    int16_t rssi = 0;
    char proximity[Limits::Peers::ProximityBuf] = {0};
};

/** @brief Nickname, else name, else callsign. */
const char* displayName(const DeviceRecord& r);

/**
 * @brief Partial update applied by `DeviceRegistry::upsert`.
 *
 * String fields: nullptr leaves the field untouched, "" clears it.
 * Flagged fields are only applied when their `has*` flag is set.
 */
struct DevicePatch {
    const char* npub = nullptr;
    const char* name = nullptr;
    const char* nickname = nullptr;
    const char* platform = nullptr;
    const char* endpoint = nullptr;
    const char* description = nullptr;
    const char* color = nullptr;
    const char* proximity = nullptr;

    bool hasOnline = false;
    bool online = false;
    bool hasLatency = false;
    int32_t latencyMs = -1;
    bool hasSeenAt = false;
    uint32_t seenAtMs = 0;
    bool hasCheckedAt = false;
    uint32_t checkedAtMs = 0;
    bool hasFetchedAt = false;
    uint32_t fetchedAtMs = 0;

    TransportSet addTransports;
    TransportSet removeTransports;

    bool hasLocation = false;
    double latitude = 0.0;
    double longitude = 0.0;

    bool hasPinned = false;
    bool pinned = false;
    bool hasFolder = false;
    uint8_t folderId = 0;
    bool hasSource = false;
    PeerSource source = PeerSource::Manual;

    bool hasRssi = false;
    bool clearRssi = false;
    int16_t rssi = 0;
};

/** @brief Peer-exposed content descriptor (cached for offline browsing). */
struct CollectionDescriptor {
    char name[Limits::Peers::CollectionNameBuf] = {0};
    char kind[Limits::Peers::CollectionNameBuf] = {0};
    char description[Limits::Peers::CollectionDescBuf] = {0};
    int32_t fileCount = -1;   ///< -1 when unknown
    bool isPublic = true;
};

/** @brief Organizational folder overlay. */
struct Folder {
    uint8_t id = 0;
    char name[Limits::Peers::FolderNameBuf] = {0};
    uint8_t rank = 0;
    bool expanded = true;
    bool chatEnabled = false;
};

/** @brief Normalize a callsign into `out` (trimmed, uppercase); false when empty, too long or invalid. */
bool normalizeCallsign(const char* in, char* out, size_t outLen);
/** @brief Case-insensitive ASCII compare (strcasecmp semantics). */
int compareNoCase(const char* a, const char* b);
/** @brief Bounded copy; false (and `out` untouched) when `in` does not fit. */
bool copyBounded(char* out, size_t outLen, const char* in);
