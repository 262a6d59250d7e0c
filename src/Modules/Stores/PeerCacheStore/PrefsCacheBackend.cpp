/**
 * @file PrefsCacheBackend.cpp
 * @brief Implementation file.
 */

#include "PrefsCacheBackend.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#define LOG_TAG "PeerNvs"
#include "Core/ModuleLog.h"

#include <string.h>

bool PrefsCacheBackend::begin()
{
    if (open_) return true;
    open_ = prefs_.begin(NvsKeys::PeerCacheNamespace, false);
    if (!open_) LOGE("cannot open namespace %s", NvsKeys::PeerCacheNamespace);
    return open_;
}

bool PrefsCacheBackend::put(const char* key, const char* value)
{
    if (!open_ || !key || !value) return false;

    const size_t len = strlen(value);
    if (len < Limits::PeerJson::CollectionsText) {
        char current[Limits::PeerJson::CollectionsText];
        const size_t got = prefs_.getString(key, current, sizeof(current));
        if (got > 0 && strcmp(current, value) == 0) return true;
    }

    if (prefs_.putString(key, value) != len) {
        LOGW("write %s failed (%u bytes)", key, (unsigned)len);
        return false;
    }
    return true;
}

bool PrefsCacheBackend::get(const char* key, char* out, size_t outLen)
{
    if (!open_ || !key || !out || outLen == 0) return false;
    if (!prefs_.isKey(key)) return false;
    return prefs_.getString(key, out, outLen) > 0;
}

bool PrefsCacheBackend::erase(const char* key)
{
    if (!open_ || !key) return false;
    if (!prefs_.isKey(key)) return true;
    return prefs_.remove(key);
}

bool PrefsCacheBackend::clear()
{
    if (!open_) return false;
    return prefs_.clear();
}
