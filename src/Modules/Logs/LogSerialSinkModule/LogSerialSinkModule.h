#pragma once
/**
 * @file LogSerialSinkModule.h
 * @brief Serial log sink module.
 */
#include "Core/ModulePassive.h"
#include "Core/NvsKeys.h"
#include "Core/Services/ILogger.h"
#include "Core/ServiceRegistry.h"

/**
 * @brief Passive module that prints log entries on `Serial`.
 *
 * Entries below `log.level` are skipped. The console shares the port, so each
 * entry is written as one line.
 */
class LogSerialSinkModule : public ModulePassive {
public:
    const char* moduleId() const override { return "log.sink.serial"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    uint8_t minLevel_ = (uint8_t)LogLevel::Debug;

    ConfigVariable<uint8_t> levelVar {
        NVS_KEY(NvsKeys::Log::Level),"level","log",
        ConfigType::UInt8,
        &minLevel_,
        ConfigPersistence::Persistent,
        0
    };

    static void write_(void* ctx, const LogEntry& e);
};
