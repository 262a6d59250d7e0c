#pragma once
/**
 * @file EventPayloads.h
 * @brief Payload types used by EventBus events.
 */
#include <stdint.h>

// Keep payloads small and trivially copyable.
// EventBus will copy payload bytes into its queue buffer.

/** @brief Payload for ConfigChanged events. */
struct ConfigChangedPayload {
    char nvsKey[32];
};

/** @brief Payload carrying network readiness information. */
struct WifiNetReadyPayload {
  uint8_t ip[4];
  uint8_t gw[4];
  uint8_t mask[4];
};

/** @brief Payload for relay connection changes. */
struct RelayConnectionPayload {
    uint8_t connected; // 0/1
    char callsign[16];
};

/** @brief Payload for PeerStatusChanged events. */
struct PeerStatusPayload {
    char callsign[16];
    uint8_t online;     // 0/1
    uint8_t transport;  // Transport value, 0xFF when no single transport caused it
};

/** @brief Payload for PeerCameOnline events (dependent delivery trigger). */
struct PeerOnlinePayload {
    char callsign[16];
};

/** @brief Payload for PeerSnapshot events. */
struct PeerSnapshotPayload {
    uint32_t generation;
    uint8_t deviceCount;
    uint8_t onlineCount;
};

/** @brief Payload for ScanComplete events. */
struct ScanCompletePayload {
    uint32_t sweepId;
    uint16_t checks;
    uint8_t onlineCount;
};

/** @brief Payload for PeerRemoved events. */
struct PeerRemovedPayload {
    char callsign[16];
};
