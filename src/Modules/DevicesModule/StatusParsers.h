#pragma once
/**
 * @file StatusParsers.h
 * @brief Decoders for peer and relay HTTP bodies and socket messages.
 *
 * All parsers are tolerant: a malformed body yields `false` (or zero entries)
 * and leaves the output in its default state.
 */

#include <stddef.h>
#include <stdint.h>

#include "Modules/DevicesModule/PeerTypes.h"

/** @brief Optional fields reported by `GET /api/status`. Only `has*` fields are meaningful. */
struct StatusInfo {
    bool hasCallsign = false;
    char callsign[Limits::Peers::CallsignBuf] = {0};
    bool hasNickname = false;
    char nickname[Limits::Peers::NicknameBuf] = {0};
    bool hasColor = false;
    char color[Limits::Peers::ColorBuf] = {0};
    bool hasDescription = false;
    char description[Limits::Peers::DescriptionBuf] = {0};
    bool hasPlatform = false;
    char platform[Limits::Peers::PlatformBuf] = {0};
    bool hasNpub = false;
    char npub[Limits::Peers::NpubBuf] = {0};
    bool hasLocation = false;
    double latitude = 0.0;
    double longitude = 0.0;
    /** Peer identifies as a relay (callsign prefix or service name). */
    bool isRelay = false;
};

/** @brief One entry of the relay's `/api/devices` list. */
struct RelayClient {
    char callsign[Limits::Peers::CallsignBuf] = {0};
    char nickname[Limits::Peers::NicknameBuf] = {0};
    char npub[Limits::Peers::NpubBuf] = {0};
    bool hasLocation = false;
    double latitude = 0.0;
    double longitude = 0.0;
    bool online = false;
    TransportSet reported;
};

/** @brief Relay socket message kinds the client reacts to. */
enum class RelayMessageType : uint8_t {
    Other = 0,
    HelloAck,
    Ping,
    Pong
};

struct RelayMessage {
    RelayMessageType type = RelayMessageType::Other;
    bool success = false;
    char stationId[Limits::Peers::CallsignBuf] = {0};
};

/** @brief Parse a `/api/status` body. */
bool parseStatusBody(const char* body, StatusInfo& out);

/** @brief Parse a `/device/{callsign}` body; false unless `connected` is a boolean. */
bool parseDeviceConnected(const char* body, bool& connected);

/** @brief Parse a `/api/devices` body, skipping blank and `Unknown` callsigns. */
uint8_t parseRelayClients(const char* body, RelayClient* out, uint8_t max);

/** @brief Keep directory entries of a `/files` body whose name is a known collection kind. */
uint8_t parseFileCollections(const char* body, CollectionDescriptor* out, uint8_t max);

/** @brief Classify a text frame from the relay socket. */
bool parseRelayMessage(const char* text, RelayMessage& out);

/** @brief Build the relay `hello` frame. */
bool buildRelayHello(const char* callsign, char* out, size_t outLen);

/** @brief Extract the callsign from a wired-link handshake line. */
bool parseWiredHello(const char* line, char* callsign, size_t callsignLen);

/**
 * @brief Decode the radio service-data payload of one advertisement.
 *
 * Payload is the `>` marker followed by the callsign, optionally NUL
 * terminated. Without a usable callsign the key falls back to
 * `BLE-` + the last three address bytes (`addr` in display order).
 * Returns false only when `addr` or `key` is missing.
 */
bool decodeRadioAdvert(const uint8_t* data, size_t len, const uint8_t addr[6],
                       char* key, size_t keyLen, bool& hasCallsign);

/** @brief True when `name` is a known collection kind (case-insensitive). */
bool isKnownCollectionKind(const char* name);
