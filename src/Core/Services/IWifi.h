#pragma once
/**
 * @file IWifi.h
 * @brief Station link service used by the IP transports.
 */
#include <stdint.h>
#include <stddef.h>

/** @brief WiFi connection state. */
enum class WifiState : uint8_t {
    Disabled,
    Idle,
    Connecting,
    Connected,
    ErrorWait
};

/** @brief Read-only view of the station link. */
struct WifiService {
    /** True once the station holds an address. */
    bool (*isConnected)(void* ctx);
    /** Station IPv4 address and netmask; false while disconnected. */
    bool (*localAddress)(void* ctx, uint8_t ip[4], uint8_t mask[4]);
    void* ctx;
};
