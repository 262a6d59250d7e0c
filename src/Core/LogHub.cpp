/**
 * @file LogHub.cpp
 * @brief Implementation file.
 */
#include "Core/LogHub.h"

bool LogHub::init(int queueLen) {
    q = xQueueCreate(queueLen, sizeof(LogEntry));
    return q != nullptr;
}

bool LogHub::enqueue(const LogEntry& e) {
    if (!q) return false;
    if (xQueueSend(q, &e, 0) == pdTRUE) return true;  ///< 0 => non-blocking
    portENTER_CRITICAL(&dropLock);
    ++dropped;
    portEXIT_CRITICAL(&dropLock);
    return false;
}

bool LogHub::dequeue(LogEntry& out, TickType_t waitTicks) {
    if (!q) return false;
    return xQueueReceive(q, &out, waitTicks) == pdTRUE;
}

uint32_t LogHub::takeDropped() {
    portENTER_CRITICAL(&dropLock);
    const uint32_t n = dropped;
    dropped = 0;
    portEXIT_CRITICAL(&dropLock);
    return n;
}
