/**
 * @file LogDispatcherModule.cpp
 * @brief Implementation file.
 */
#include "LogDispatcherModule.h"
#include "Core/Log.h"
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <stdio.h>

struct DispatcherCtx {
    LogHub* hub;
    const LogSinkRegistryService* sinks;
};

static DispatcherCtx g_ctx;

void LogDispatcherModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;

    _services = &services;

    /// hub and sink registry
    auto hubSvc = services.get<LogHubService>("loghub");
    _sinkReg = services.get<LogSinkRegistryService>("logsinks");

    /// The LogHub instance is the service ctx.
    if (!hubSvc || !hubSvc->ctx || !_sinkReg || !_sinkReg->dispatch) return;

    _hub = static_cast<LogHub*>(hubSvc->ctx);

    g_ctx.hub = _hub;
    g_ctx.sinks = _sinkReg;

    /// Dispatcher task
    const BaseType_t rc = xTaskCreatePinnedToCore(
        LogDispatcherModule::taskFn,
        "LogDispatch",
        4096,                ///< stack
        &g_ctx,              ///< param
        1,                   ///< low priority
        nullptr,
        1                    ///< core 1
    );
    if (rc != pdPASS) Log::error("LogDisp", "dispatcher task not started");
}

void LogDispatcherModule::taskFn(void* pv) {
    auto* ctx = static_cast<DispatcherCtx*>(pv);
    LogEntry e;

    while (true) {
        if (!ctx->hub->dequeue(e, portMAX_DELAY)) continue;
        ctx->sinks->dispatch(ctx->sinks->ctx, e);

        // Overflow is reported after the backlog drains.
        if (!ctx->hub->drained()) continue;
        const uint32_t dropped = ctx->hub->takeDropped();
        if (dropped == 0) continue;
        LogEntry notice{};
        notice.ts_ms = e.ts_ms;
        notice.lvl = LogLevel::Warn;
        snprintf(notice.tag, sizeof(notice.tag), "LogDisp");
        snprintf(notice.msg, sizeof(notice.msg), "%lu log entries dropped", (unsigned long)dropped);
        ctx->sinks->dispatch(ctx->sinks->ctx, notice);
    }
}
