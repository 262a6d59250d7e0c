#pragma once
/**
 * @file EventId.h
 * @brief Enumerates event identifiers used by EventBus.
 */
#include <stdint.h>

/** @brief Known event identifiers. */
enum class EventId : uint16_t {
    None = 0,

    // Network
    WifiNetReady = 20,
    WifiNetLost = 21,
    RelayConnectionChanged = 30,

    // Configuration
    ConfigChanged = 100,

    // Peer tracking
    PeerStatusChanged = 200,
    PeerCameOnline = 201,
    PeerSnapshot = 202,
    ScanComplete = 203,
    PeerRemoved = 204,
};
