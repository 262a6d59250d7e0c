#pragma once
/**
 * @file LogSinkRegistry.h
 * @brief Fixed table of log sinks fed by the dispatcher task.
 */
#include "Core/Services/ILogger.h"

/**
 * @brief Holds up to `MAX_SINKS` sinks and fans entries out to them.
 *
 * Sinks are added during module init only; `dispatch` runs on the dispatcher task.
 */
class LogSinkRegistry {
public:
    /** @brief Add a sink. Rejects null writers, duplicates and overflow. */
    bool add(LogSinkService sink);
    /** @brief Number of registered sinks. */
    int count() const { return n; }
    /** @brief Write one entry to every sink in registration order. */
    void dispatch(const LogEntry& e) const;

private:
    static constexpr int MAX_SINKS = 4;
    LogSinkService sinks[MAX_SINKS]{};
    int n = 0;
};
