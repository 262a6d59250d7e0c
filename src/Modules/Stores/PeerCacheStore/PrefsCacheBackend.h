#pragma once
/**
 * @file PrefsCacheBackend.h
 * @brief NVS (Preferences) storage behind the peer status cache.
 */

#include <Preferences.h>

#include "Modules/DevicesModule/StatusCache.h"

/**
 * @brief Peer cache entries in their own Preferences namespace.
 *
 * Writes of an unchanged value are skipped to spare flash cycles.
 */
class PrefsCacheBackend : public IStatusCacheBackend {
public:
    /** @brief Open the cache namespace (idempotent). */
    bool begin();

    bool put(const char* key, const char* value) override;
    bool get(const char* key, char* out, size_t outLen) override;
    bool erase(const char* key) override;
    bool clear() override;

private:
    Preferences prefs_;
    bool open_ = false;
};
