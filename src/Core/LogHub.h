#pragma once
/**
 * @file LogHub.h
 * @brief Central log queue for asynchronous logging.
 */
#include "Core/Services/ILogger.h"
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

/**
 * @brief Queue-based log hub for producers and consumers.
 *
 * Producers never block; entries that do not fit are counted and the
 * dispatcher reports the count once the queue drains.
 */
class LogHub {
public:
    /** @brief Initialize the log queue with a given length. */
    bool init(int queueLen = 32);

    /** @brief Enqueue a log entry (non-blocking). */
    bool enqueue(const LogEntry& e);
    /** @brief Dequeue a log entry (blocking up to waitTicks). */
    bool dequeue(LogEntry& out, TickType_t waitTicks);

    /** @brief True when no entry is waiting. */
    bool drained() const { return q && uxQueueMessagesWaiting(q) == 0; }

    /** @brief Entries dropped since the last call; resets the counter. */
    uint32_t takeDropped();

private:
    QueueHandle_t q = nullptr;
    portMUX_TYPE dropLock = portMUX_INITIALIZER_UNLOCKED;
    uint32_t dropped = 0;
};
