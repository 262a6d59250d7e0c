#pragma once
/**
 * @file RelayModule.h
 * @brief Persistent socket session with the relay station.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Core/EventBus/EventBus.h"
#include "Core/SystemLimits.h"

#include <WebSocketsClient.h>

/** @brief Relay client configuration. */
struct RelayConfig {
    bool enabled = false;
    char url[Limits::Peers::UrlBuf] = "";
};

/**
 * @brief Active module driving a `WebSocketsClient`.
 *
 * The session counts as connected once `hello_ack` names the relay. Every
 * change is reported to the devices inbox and on the event bus.
 */
class RelayModule : public Module {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "relay"; }
    /** @brief Task name. */
    const char* taskName() const override { return "relay"; }

    /** @brief Depends on log hub, event bus, commands, WiFi and the devices inbox. */
    uint8_t dependencyCount() const override { return 5; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "cmd";
        if (i == 3) return "wifi";
        if (i == 4) return "devices";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    uint16_t taskStackSize() const override { return Limits::Tasks::RelayStack; }

private:
    RelayConfig cfgData;
    const WifiService* wifiSvc = nullptr;
    const PeersService* peersSvc = nullptr;
    const PeerInboxService* inbox = nullptr;
    EventBus* eventBus = nullptr;

    WebSocketsClient ws_;
    bool started_ = false;
    volatile bool restartPending_ = false;

    portMUX_TYPE lock_ = portMUX_INITIALIZER_UNLOCKED;
    bool connected_ = false;
    char relayCallsign_[Limits::Peers::CallsignBuf] = {0};
    uint32_t connectedSinceMs_ = 0;
    uint32_t lastPingMs_ = 0;
    uint32_t lastPongMs_ = 0;

    ConfigVariable<bool> enabledVar {
        NVS_KEY(NvsKeys::Relay::Enabled),"enabled","relay",
        ConfigType::Bool,
        &cfgData.enabled,
        ConfigPersistence::Persistent,
        0
    };
    ConfigVariable<char> urlVar {
        NVS_KEY(NvsKeys::Relay::Url),"url","relay",
        ConfigType::CharArray,
        cfgData.url,
        ConfigPersistence::Persistent,
        sizeof(cfgData.url)
    };

    bool start_();
    void stop_();
    void onSocketEvent_(WStype_t type, uint8_t* payload, size_t length);
    void onText_(const char* text);
    void sendHello_();
    void setConnected_(bool connected, const char* callsign);
    void publishState_();

    static bool cmdStatus(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

    static bool svcIsConnected(void* ctx);
    static bool svcCallsign(void* ctx, char* out, size_t len);
    static bool svcUrl(void* ctx, char* out, size_t len);

    static void onEventStatic(const Event& e, void* user);
};
