/**
 * @file LogSerialSinkModule.cpp
 * @brief Implementation file.
 */
#include "LogSerialSinkModule.h"
#include "Core/Log.h"
#include <Arduino.h>

namespace {

struct LevelStyle {
    char letter;
    const char* color;
};

LevelStyle styleFor(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return {'D', "\x1b[90m"};
        case LogLevel::Info:  return {'I', "\x1b[32m"};
        case LogLevel::Warn:  return {'W', "\x1b[33m"};
        case LogLevel::Error: return {'E', "\x1b[31m"};
    }
    return {'?', ""};
}

}  // namespace

void LogSerialSinkModule::write_(void* ctx, const LogEntry& e) {
    const LogSerialSinkModule* self = static_cast<const LogSerialSinkModule*>(ctx);
    if (self && (uint8_t)e.lvl < self->minLevel_) return;

    const uint32_t s = e.ts_ms / 1000U;
    const LevelStyle st = styleFor(e.lvl);
    Serial.printf("[%02lu:%02lu:%02lu.%03lu][%c][%s] %s%s\x1b[0m\n",
                  (unsigned long)((s / 3600U) % 24U),
                  (unsigned long)((s / 60U) % 60U),
                  (unsigned long)(s % 60U),
                  (unsigned long)(e.ts_ms % 1000U),
                  st.letter,
                  e.tag,
                  st.color,
                  e.msg);
}

void LogSerialSinkModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(levelVar);

    const LogSinkRegistryService* sinks = services.get<LogSinkRegistryService>("logsinks");
    if (!sinks || !sinks->add) {
        Log::error("LogSerSk", "sink registry unavailable");
        return;
    }

    LogSinkService sink{};
    sink.write = LogSerialSinkModule::write_;
    sink.ctx = this;
    if (!sinks->add(sinks->ctx, sink)) Log::error("LogSerSk", "serial sink not added");
}
