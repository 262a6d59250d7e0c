/**
 * @file LogHubModule.cpp
 * @brief Log queue and sink registry wiring.
 */
#include "LogHubModule.h"
#include "Core/Log.h"
#include "Core/SystemLimits.h"
#include <Arduino.h>

static uint32_t logClockMs_() {
    return millis();
}

void LogHubModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;

    const bool queueOk = hub.init(Limits::LogQueueLen);

    /// expose loghub service
    hubSvc.enqueue = [](void* ctx, const LogEntry& e) -> bool {
        return static_cast<LogHub*>(ctx)->enqueue(e);
    };
    hubSvc.ctx = &hub;

    /// expose sink registry service
    sinksSvc.add = [](void* ctx, LogSinkService sink) -> bool {
        return static_cast<LogSinkRegistry*>(ctx)->add(sink);
    };
    sinksSvc.dispatch = [](void* ctx, const LogEntry& e) {
        static_cast<LogSinkRegistry*>(ctx)->dispatch(e);
    };
    sinksSvc.ctx = &sinks;

    const bool hubOk = services.add("loghub", &hubSvc);
    const bool sinksOk = services.add("logsinks", &sinksSvc);

    Log::setClock(logClockMs_);
    Log::setHub(&hubSvc);
    if (!queueOk) Log::error("LogHubMo", "log queue allocation failed");
    if (!hubOk || !sinksOk) {
        Log::error("LogHubMo", "log services not registered (hub=%d sinks=%d)", hubOk ? 1 : 0, sinksOk ? 1 : 0);
    }
}
