/**
 * @file ConfigStore.cpp
 * @brief Implementation file.
 */
#include "Core/ConfigStore.h"
#include "Core/Log.h"
#include <ArduinoJson.h>
#include <stdio.h>

#define LOG_TAG_CORE "CfgStore"

static bool isMaskedKey(const char* key) {
    if (!key) return false;
    return strcmp(key, "pass") == 0 ||
           strcmp(key, "token") == 0 ||
           strcmp(key, "secret") == 0;
}

void ConfigStore::notifyChanged(const char* nvsKey)
{
    if (!_eventBus || !nvsKey) return;

    ConfigChangedPayload p{};
    strncpy(p.nvsKey, nvsKey, sizeof(p.nvsKey) - 1);
    p.nvsKey[sizeof(p.nvsKey) - 1] = '\0';

    _eventBus->post(EventId::ConfigChanged, &p, sizeof(p));
}

bool ConfigStore::writePersistent(const ConfigMeta& m)
{
    if (!_prefs) return false;
    if (m.persistence != ConfigPersistence::Persistent) return true;
    if (!m.nvsKey) return false;

    size_t wrote = 0;
    switch (m.type) {
        case ConfigType::Int32:
            wrote = _prefs->putInt(m.nvsKey, *(int32_t*)m.valuePtr);
            break;
        case ConfigType::UInt8:
            wrote = _prefs->putUChar(m.nvsKey, *(uint8_t*)m.valuePtr);
            break;
        case ConfigType::Bool:
            wrote = _prefs->putBool(m.nvsKey, *(bool*)m.valuePtr);
            break;
        case ConfigType::UInt32:
            wrote = _prefs->putUInt(m.nvsKey, *(uint32_t*)m.valuePtr);
            break;
        case ConfigType::CharArray:
            wrote = _prefs->putString(m.nvsKey, (const char*)m.valuePtr);
            break;
    }
    if (wrote == 0) {
        Log::warn(LOG_TAG_CORE, "NVS write failed (%s)", m.nvsKey);
        return false;
    }
    return true;
}

void ConfigStore::loadPersistent()
{
    if (!_prefs) return;

    Log::debug(LOG_TAG_CORE, "loadPersistent: vars=%u", (unsigned)_metaCount);
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (m.persistence != ConfigPersistence::Persistent) continue;
        if (!m.nvsKey) continue;
        if (!_prefs->isKey(m.nvsKey)) continue;

        switch (m.type) {
            case ConfigType::Int32:
                *(int32_t*)m.valuePtr = _prefs->getInt(m.nvsKey, *(int32_t*)m.valuePtr);
                break;
            case ConfigType::UInt8:
                *(uint8_t*)m.valuePtr = _prefs->getUChar(m.nvsKey, *(uint8_t*)m.valuePtr);
                break;
            case ConfigType::Bool:
                *(bool*)m.valuePtr = _prefs->getBool(m.nvsKey, *(bool*)m.valuePtr);
                break;
            case ConfigType::UInt32:
                *(uint32_t*)m.valuePtr = _prefs->getUInt(m.nvsKey, *(uint32_t*)m.valuePtr);
                break;
            case ConfigType::CharArray:
                _prefs->getString(m.nvsKey, (char*)m.valuePtr, m.size);
                break;
        }
    }
}

bool ConfigStore::erasePersistent()
{
    if (!_prefs) return false;
    const bool ok = _prefs->clear();
    Log::info(LOG_TAG_CORE, "erasePersistent: %s", ok ? "ok" : "failed");
    return ok;
}

size_t ConfigStore::writeModuleFields_(const char* module, char* out, size_t outLen, bool* any) const
{
    size_t pos = 0;
    bool first = true;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || strcmp(m.module, module) != 0) continue;

        int n = snprintf(out + pos, outLen - pos, "%s\"%s\":", first ? "" : ",", m.name ? m.name : "");
        if (n <= 0 || (size_t)n >= outLen - pos) return outLen;
        pos += (size_t)n;

        switch (m.type) {
            case ConfigType::Int32:
                n = snprintf(out + pos, outLen - pos, "%ld", (long)*(int32_t*)m.valuePtr);
                break;
            case ConfigType::UInt8:
                n = snprintf(out + pos, outLen - pos, "%u", (unsigned)*(uint8_t*)m.valuePtr);
                break;
            case ConfigType::Bool:
                n = snprintf(out + pos, outLen - pos, "%s", (*(bool*)m.valuePtr) ? "true" : "false");
                break;
            case ConfigType::UInt32:
                n = snprintf(out + pos, outLen - pos, "%lu", (unsigned long)*(uint32_t*)m.valuePtr);
                break;
            case ConfigType::CharArray:
                if (isMaskedKey(m.name)) {
                    n = snprintf(out + pos, outLen - pos, "\"***\"");
                } else {
                    n = snprintf(out + pos, outLen - pos, "\"%s\"", (const char*)m.valuePtr);
                }
                break;
        }
        if (n <= 0 || (size_t)n >= outLen - pos) return outLen;
        pos += (size_t)n;
        first = false;
    }
    if (any) *any = !first;
    return pos;
}

void ConfigStore::toJson(char* out, size_t outLen) const
{
    if (!out || outLen < 3) return;

    const char* modules[MAX_CONFIG_VARS];
    const uint8_t moduleCount = listModules(modules, (uint8_t)(MAX_CONFIG_VARS > 255 ? 255 : MAX_CONFIG_VARS));

    size_t pos = 0;
    out[pos++] = '{';
    for (uint8_t i = 0; i < moduleCount; ++i) {
        int n = snprintf(out + pos, outLen - pos, "%s\"%s\":{", i == 0 ? "" : ",", modules[i]);
        if (n <= 0 || (size_t)n >= outLen - pos) break;
        pos += (size_t)n;

        const size_t w = writeModuleFields_(modules[i], out + pos, outLen - pos, nullptr);
        if (w >= outLen - pos) break;
        pos += w;

        if (pos + 1 >= outLen) break;
        out[pos++] = '}';
    }

    if (pos + 2 <= outLen) {
        out[pos++] = '}';
        out[pos] = '\0';
    } else {
        Log::warn(LOG_TAG_CORE, "toJson truncated (len=%u)", (unsigned)outLen);
        out[outLen - 1] = '\0';
    }
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen, bool* truncated) const
{
    if (!out || outLen < 3) return false;
    if (!module || module[0] == '\0') {
        out[0] = '\0';
        return false;
    }

    bool any = false;
    out[0] = '{';
    const size_t w = writeModuleFields_(module, out + 1, outLen - 1, &any);
    const bool cut = (w >= outLen - 1) || (w + 3 > outLen);
    if (cut) {
        out[0] = '\0';
        if (truncated) *truncated = true;
        return false;
    }
    out[1 + w] = '}';
    out[2 + w] = '\0';
    if (truncated) *truncated = false;
    return any;
}

uint8_t ConfigStore::listModules(const char** out, uint8_t max) const
{
    if (!out || max == 0) return 0;
    uint8_t count = 0;

    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || m.module[0] == '\0') continue;

        bool exists = false;
        for (uint8_t j = 0; j < count; ++j) {
            if (strcmp(out[j], m.module) == 0) { exists = true; break; }
        }
        if (exists) continue;

        if (count < max) {
            out[count++] = m.module;
        } else {
            break;
        }
    }

    return count;
}

bool ConfigStore::applyJson(const char* json)
{
    if (!json) return false;

    static StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    doc.clear();
    const DeserializationError err = deserializeJson(doc, json);
    if (err || !doc.is<JsonObjectConst>()) {
        Log::warn(LOG_TAG_CORE, "applyJson: bad json (%s)", err.c_str());
        return false;
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();

    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (!m.module || !m.name) continue;
        JsonVariantConst v = root[m.module][m.name];
        if (v.isNull()) continue;

        bool changed = false;
        switch (m.type) {
        case ConfigType::Int32: {
            if (!v.is<int32_t>()) continue;
            const int32_t nv = v.as<int32_t>();
            if (*(int32_t*)m.valuePtr != nv) { *(int32_t*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::UInt8: {
            if (!v.is<uint8_t>()) continue;
            const uint8_t nv = v.as<uint8_t>();
            if (*(uint8_t*)m.valuePtr != nv) { *(uint8_t*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::Bool: {
            if (!v.is<bool>()) continue;
            const bool nv = v.as<bool>();
            if (*(bool*)m.valuePtr != nv) { *(bool*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::UInt32: {
            if (!v.is<uint32_t>()) continue;
            const uint32_t nv = v.as<uint32_t>();
            if (*(uint32_t*)m.valuePtr != nv) { *(uint32_t*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::CharArray: {
            const char* s = v.as<const char*>();
            if (!s || m.size == 0) continue;
            size_t len = strlen(s);
            if (len >= m.size) len = m.size - 1;

            /// compare before writing to avoid unnecessary events
            if (strncmp((char*)m.valuePtr, s, len) != 0 || ((char*)m.valuePtr)[len] != '\0') {
                memcpy(m.valuePtr, s, len);
                ((char*)m.valuePtr)[len] = '\0';
                changed = true;
            }
            break;
        }
        }

        if (!changed) continue;

        Log::debug(LOG_TAG_CORE, "applyJson: changed %s.%s", m.module, m.name);
        if (m.persistence == ConfigPersistence::Persistent) {
            writePersistent(m);
        }
        notifyChanged(m.nvsKey);
    }
    return true;
}
