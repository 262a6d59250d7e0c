#pragma once
/**
 * @file ConsoleModule.h
 * @brief Serial JSON-line command console.
 */
#include "Core/ErrorCodes.h"
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/EventBus/EventBus.h"
#include "Core/Services/Services.h"
#include "Core/SystemLimits.h"

/**
 * @brief Active module reading `{"cmd":"...","args":{...}}` lines from `Serial`.
 *
 * Each line is dispatched through `CommandService::execute` and answered with
 * one JSON line. With `console.events` on, bus notifications (peer status,
 * snapshot generation, sweep completion, removal, relay state) are printed as
 * `{"event":...}` lines from the EventBus task.
 */
class ConsoleModule : public Module {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "console"; }
    /** @brief Task name. */
    const char* taskName() const override { return "console"; }

    uint8_t dependencyCount() const override { return 3; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "cmd";
        if (i == 2) return "eventbus";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    uint16_t taskStackSize() const override { return Limits::Tasks::ConsoleStack; }

private:
    const CommandService* cmdSvc = nullptr;
    bool events_ = true;

    ConfigVariable<bool> eventsVar {
        NVS_KEY(NvsKeys::Console::Events),"events","console",
        ConfigType::Bool,
        &events_,
        ConfigPersistence::Persistent,
        0
    };

    char line_[Limits::Tasks::ConsoleLineBuf] = {0};
    size_t lineLen_ = 0;
    bool lineOverflow_ = false;
    char replyBuf_[Limits::Tasks::ConsoleReplyBuf] = {0};

    void processLine_(const char* line);
    void writeError_(ErrorCode code);
    static void onEventStatic(const Event& e, void* user);
};
