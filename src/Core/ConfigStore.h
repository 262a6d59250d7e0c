#pragma once
/**
 * @file ConfigStore.h
 * @brief Persistent configuration store with JSON import/export.
 */

// Values change only through applyJson() (the `config.set` command). Each
// changed entry is written to NVS and announced as EventId::ConfigChanged
// carrying its NVS key; modules watch the key prefix they own.

#include <Preferences.h>
#include <cstdint>
#include <cstring>
#include <cstdlib>

#include "ConfigTypes.h"
#include "Core/Log.h"
#include "Core/Services/IEventBus.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"

#ifndef LOG_TAG_CORE
#define LOG_TAG_CORE "CfgStore"
#define LOG_TAG_CORE_LOCAL_DEFINED
#endif

/**
 * @brief Holds config variables, persistence, and JSON import/export.
 */
class ConfigStore {
public:
    static constexpr size_t MAX_CONFIG_VARS = Limits::MaxConfigVars;

    ConfigStore() = default;

    /** @brief Inject EventBus dependency for change notifications. */
    void setEventBus(EventBus* bus) { _eventBus = bus; }
    /** @brief Inject Preferences for NVS persistence. */
    void setPreferences(Preferences& prefs) { _prefs = &prefs; }

    /** @brief Register a config variable definition. */
    template<typename T>
    void registerVar(ConfigVariable<T>& var);

    /** @brief Load persistent values from NVS into registered variables. */
    void loadPersistent();
    /** @brief Erase every key of the config namespace. */
    bool erasePersistent();

    /** @brief Serialize all registered config to JSON (`{"module":{"name":value}}`). */
    void toJson(char* out, size_t outLen) const;
    /** @brief Serialize a single module's config (flat object). */
    bool toJsonModule(const char* module, char* out, size_t outLen, bool* truncated = nullptr) const;
    /** @brief List unique module names present in config metadata. */
    uint8_t listModules(const char** out, uint8_t max) const;
    /** @brief Apply JSON patch to registered config variables. */
    bool applyJson(const char* json);

private:
    Preferences* _prefs = nullptr;
    EventBus* _eventBus = nullptr;
    ConfigMeta _meta[MAX_CONFIG_VARS];
    uint16_t _metaCount = 0;

    void notifyChanged(const char* nvsKey);
    bool writePersistent(const ConfigMeta& m);
    size_t writeModuleFields_(const char* module, char* out, size_t outLen, bool* any) const;
};

// -------------------------
// Template implementation
// -------------------------
template<typename T>
void ConfigStore::registerVar(ConfigVariable<T>& var)
{
    if (_metaCount >= MAX_CONFIG_VARS) {
        Log::warn(LOG_TAG_CORE, "config table full (%s.%s)",
                  var.moduleName ? var.moduleName : "-", var.jsonName ? var.jsonName : "-");
        return;
    }
    if (var.nvsKey && strlen(var.nvsKey) > Limits::MaxNvsKeyLen) {
        Log::warn(LOG_TAG_CORE, "NVS key too long (%s)", var.nvsKey);
        return;
    }

    ConfigMeta& m = _meta[_metaCount++];

    m.module      = var.moduleName;
    m.name        = var.jsonName;
    m.nvsKey      = var.nvsKey;
    m.type        = var.type;
    m.persistence = var.persistence;
    m.valuePtr    = (void*)var.value;
    m.size        = var.size;
}

#ifdef LOG_TAG_CORE_LOCAL_DEFINED
#undef LOG_TAG_CORE
#undef LOG_TAG_CORE_LOCAL_DEFINED
#endif
