#pragma once
/**
 * @file StatusCache.h
 * @brief Persists the non-session subset of device records for cold-start bootstrap.
 */

#include <stddef.h>
#include <stdint.h>

#include "Modules/DevicesModule/PeerTypes.h"

/**
 * @brief Key/value storage used by the cache (NVS on target, in-memory in tests).
 */
class IStatusCacheBackend {
public:
    virtual ~IStatusCacheBackend() = default;

    /** @brief Store `value` under `key` (replaces). */
    virtual bool put(const char* key, const char* value) = 0;
    /** @brief Read `key` into `out`; false when missing or larger than `outLen`. */
    virtual bool get(const char* key, char* out, size_t outLen) = 0;
    /** @brief Remove `key`; true when absent afterwards. */
    virtual bool erase(const char* key) = 0;
    /** @brief Remove every key. */
    virtual bool clear() = 0;
};

/** @brief Callback invoked for each record restored by `StatusCache::loadAll`. */
using CacheRecordFn = void (*)(void* ctx, const DeviceRecord& rec);

/**
 * @brief Device cache: one JSON record per callsign plus an index, collections and folders.
 *
 * Records never carry transport tags, online state or radio metadata; those
 * describe only the running session and are cleared again on load.
 */
class StatusCache {
public:
    explicit StatusCache(IStatusCacheBackend& backend) : backend_(backend) {}

    bool save(const DeviceRecord& rec);
    bool load(const char* callsign, DeviceRecord& out);
    bool evict(const char* callsign);
    /** @brief Restore every indexed record; returns the number delivered to `fn`. */
    uint8_t loadAll(CacheRecordFn fn, void* ctx);

    bool saveCollections(const char* callsign, const CollectionDescriptor* items, uint8_t count);
    uint8_t loadCollections(const char* callsign, CollectionDescriptor* out, uint8_t max);

    bool saveFolders(const char* json);
    bool loadFolders(char* out, size_t outLen);

    /** @brief Drop every cached entry. */
    bool wipe();

    static bool encodeRecord(const DeviceRecord& rec, char* out, size_t outLen);
    static bool decodeRecord(const char* json, DeviceRecord& out);
    static bool encodeCollections(const CollectionDescriptor* items, uint8_t count, char* out, size_t outLen);
    static uint8_t decodeCollections(const char* json, CollectionDescriptor* out, uint8_t max);

private:
    IStatusCacheBackend& backend_;

    static bool recordKey_(const char* callsign, char prefix, char* out, size_t outLen);
    uint8_t readIndex_(char (*out)[Limits::Peers::CallsignBuf], uint8_t max);
    bool writeIndex_(const char (*items)[Limits::Peers::CallsignBuf], uint8_t count);
    bool indexAdd_(const char* callsign);
    bool indexRemove_(const char* callsign);
};
