#pragma once
/**
 * @file ConfigTypes.h
 * @brief Config entry declarations and the metadata kept by ConfigStore.
 */
#include <stdint.h>
#include <stddef.h>
#include "Core/SystemLimits.h"

// Max NVS key length for Preferences (excluding null terminator).
// Always wrap literal NVS keys with NVS_KEY("...") to enforce length at compile time.
template <size_t N>
constexpr const char* NVS_KEY(const char (&s)[N]) {
    static_assert(N > 0, "NVS key cannot be empty");
    static_assert((N - 1) <= Limits::MaxNvsKeyLen, "NVS key too long");
    return s;
}

/** @brief Config persistence mode. */
enum class ConfigPersistence : uint8_t { Runtime, Persistent };

/** @brief Supported config value types. */
enum class ConfigType : uint8_t {
    Int32,
    UInt8,
    Bool,
    UInt32,
    CharArray
};

/**
 * @brief Binds one module field to a config entry (`module.name`, NVS key).
 *
 * Declared as a module member and handed to `ConfigStore::registerVar` during
 * `init()`. `size` is the buffer size for `CharArray`, 0 otherwise.
 */
template<typename T>
struct ConfigVariable {
    const char* nvsKey;
    const char* jsonName;
    const char* moduleName;
    ConfigType type;
    T* value;
    ConfigPersistence persistence;
    uint16_t size;
};

/** @brief Internal metadata for registered variables. */
struct ConfigMeta {
    const char* module;
    const char* name;
    const char* nvsKey;
    ConfigType type;
    ConfigPersistence persistence;
    void* valuePtr;
    uint16_t size;
};
