#pragma once
/**
 * @file IRelay.h
 * @brief Relay socket client state.
 */
#include <stddef.h>
#include <stdint.h>

/** @brief Relay connection status. */
struct RelayService {
    bool (*isConnected)(void* ctx);
    /** Relay callsign learned from `hello_ack` (empty until connected). */
    bool (*callsign)(void* ctx, char* out, size_t len);
    /** Socket URL as configured (`ws://` or `wss://`). */
    bool (*url)(void* ctx, char* out, size_t len);
    void* ctx;
};
