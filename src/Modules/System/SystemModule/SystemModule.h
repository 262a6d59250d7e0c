#pragma once
/**
 * @file SystemModule.h
 * @brief Device-level commands: ping, info, reboot, factory reset.
 */
#include "Core/ModulePassive.h"
#include "Core/Services/Services.h"

/**
 * @brief Passive module registering the `system.*` commands.
 *
 * Factory reset erases the peer cache namespace, then the config namespace and
 * the WiFi driver credentials, then restarts.
 */
class SystemModule : public ModulePassive {
public:
    const char* moduleId() const override { return "system"; }

    uint8_t dependencyCount() const override { return 4; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "cmd";
        if (i == 2) return "config";
        if (i == 3) return "devices";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    const ConfigStoreService* cfgSvc_ = nullptr;
    const PeersService* peersSvc_ = nullptr;

    static bool cmdPing(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdInfo(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdReboot(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdFactoryReset(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
};
