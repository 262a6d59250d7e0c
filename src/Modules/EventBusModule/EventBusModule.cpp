/**
 * @file EventBusModule.cpp
 * @brief Implementation file.
 */
#include "EventBusModule.h"
#define LOG_TAG "EvtBusMd"
#include "Core/ModuleLog.h"


void EventBusModule::init(ConfigStore&, ServiceRegistry& services) {
    if (!services.add("eventbus", &_svc)) {
        LOGE("eventbus service not registered");
        return;
    }
    LOGI("EventBusService registered (queue=%u subs=%u)",
         (unsigned)EventBus::QUEUE_LENGTH, (unsigned)EventBus::MAX_SUBSCRIBERS);
}

void EventBusModule::loop() {
    /// Dispatch queued events.
    _bus.dispatch(8);

    const uint32_t dropped = _bus.droppedCount();
    if (dropped != _lastDropped) {
        LOGW("events dropped: total=%lu", (unsigned long)dropped);
        _lastDropped = dropped;
    }
    vTaskDelay(pdMS_TO_TICKS(5));
}
