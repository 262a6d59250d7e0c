/**
 * @file LogSinkRegistry.cpp
 * @brief Implementation file.
 */
#include "Core/LogSinkRegistry.h"

bool LogSinkRegistry::add(LogSinkService sink) {
    if (!sink.write || n >= MAX_SINKS) return false;
    for (int i = 0; i < n; ++i) {
        if (sinks[i].write == sink.write && sinks[i].ctx == sink.ctx) return false;
    }
    sinks[n++] = sink;
    return true;
}

void LogSinkRegistry::dispatch(const LogEntry& e) const {
    for (int i = 0; i < n; ++i) sinks[i].write(sinks[i].ctx, e);
}
