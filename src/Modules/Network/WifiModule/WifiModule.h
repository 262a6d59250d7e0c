#pragma once
/**
 * @file WifiModule.h
 * @brief Station-mode WiFi link used by every IP transport.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Core/EventBus/EventBus.h"
#include <WiFi.h>
#include <ESPmDNS.h>

/** @brief WiFi configuration values. */
struct WifiConfig {
    bool enabled = true;
    char ssid[32] = "";
    char pass[64] = "";
    char mdns[32] = "peerlink";
};

/**
 * @brief Active module that keeps the station connected.
 *
 * Posts `WifiNetReady` once an address is assigned and `WifiNetLost` when the
 * station drops. Failed connects wait `WifiRetryBaseMs`, doubling up to
 * `WifiRetryMaxMs`. Any `wifi.*` config change restarts the connection.
 */
class WifiModule : public Module {
public:
    const char* moduleId() const override { return "wifi"; }
    const char* taskName() const override { return "wifi"; }
    BaseType_t taskCore() const override { return 0; }

    uint8_t dependencyCount() const override { return 3; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "cmd";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    WifiConfig cfg_;
    volatile WifiState state_ = WifiState::Idle;
    uint32_t stateSinceMs_ = 0;
    uint32_t retryDelayMs_ = 0;
    uint16_t failures_ = 0;
    uint32_t lastNoSsidLogMs_ = 0;
    bool netReadyPosted_ = false;
    volatile bool restartPending_ = false;
    char mdnsHost_[sizeof(cfg_.mdns)] = {0};
    EventBus* eventBus_ = nullptr;

    ConfigVariable<bool> enabledVar {
        NVS_KEY(NvsKeys::Wifi::Enabled),"enabled","wifi",
        ConfigType::Bool,
        &cfg_.enabled,
        ConfigPersistence::Persistent,
        0
    };
    ConfigVariable<char> ssidVar {
        NVS_KEY(NvsKeys::Wifi::Ssid),"ssid","wifi",
        ConfigType::CharArray,
        cfg_.ssid,
        ConfigPersistence::Persistent,
        sizeof(cfg_.ssid)
    };
    ConfigVariable<char> passVar {
        NVS_KEY(NvsKeys::Wifi::Pass),"pass","wifi",
        ConfigType::CharArray,
        cfg_.pass,
        ConfigPersistence::Persistent,
        sizeof(cfg_.pass)
    };
    ConfigVariable<char> mdnsVar {
        NVS_KEY(NvsKeys::Wifi::Mdns),"mdns","wifi",
        ConfigType::CharArray,
        cfg_.mdns,
        ConfigPersistence::Persistent,
        sizeof(cfg_.mdns)
    };

    static bool svcIsConnected(void* ctx);
    static bool svcLocalAddress(void* ctx, uint8_t ip[4], uint8_t mask[4]);
    static bool cmdStatus(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static void onEventStatic(const Event& e, void* user);

    void enter_(WifiState s);
    void beginConnect_();
    void onConnectFailed_(const char* why);
    void tickConnecting_();
    void tickConnected_();
    void restart_();
    void applyMdns_();
    void dropMdns_();
    void postNetReady_();
};
