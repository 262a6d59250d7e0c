#pragma once
/**
 * @file ConfigStoreModule.h
 * @brief Module that exposes ConfigStore service and the config commands.
 */
#include "Core/ModulePassive.h"
#include "Core/CommandRegistry.h"
#include "Core/Services/Services.h"

/**
 * @brief Passive module exposing the config namespace to commands and factory reset.
 */
class ConfigStoreModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "config"; }

    /** @brief Config module depends on log hub and command service. */
    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "cmd";
        return nullptr;
    }

    /** @brief Register config services and `config.get` / `config.set`. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    ConfigStore* registry = nullptr;

    static bool svcErase(void* ctx);

    static bool cmdGet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdSet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
};
