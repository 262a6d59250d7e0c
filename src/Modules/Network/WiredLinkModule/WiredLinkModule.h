#pragma once
/**
 * @file WiredLinkModule.h
 * @brief Wired serial link: connection detection and hello handshake.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Core/SystemLimits.h"
#include "Domain/PeerDefaults.h"

#include <HardwareSerial.h>

/** @brief Wired link configuration. */
struct WiredConfig {
    bool enabled = false;
    uint32_t baud = PeerDefaults::WiredBaud;
    int32_t detectPin = -1;   ///< -1: no detect line, the link lives while hello lines arrive
};

/**
 * @brief Active module reading the wired UART (`Serial1`) line by line.
 *
 * The remote identity comes from a `{"type":"hello","callsign":...}` line,
 * possibly well after the detect pin went high. A drop is reported once.
 */
class WiredLinkModule : public Module {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "wired"; }
    /** @brief Task name. */
    const char* taskName() const override { return "wired"; }

    /** @brief Depends on log hub and the devices services. */
    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "devices";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    uint16_t taskStackSize() const override { return Limits::Tasks::WiredStack; }

private:
    WiredConfig cfgData;
    const PeersService* peersSvc = nullptr;
    const PeerInboxService* inbox = nullptr;

    HardwareSerial& uart_ = Serial1;
    bool started_ = false;
    bool lineUp_ = false;          ///< detect pin high (or a hello seen without pin)
    bool identified_ = false;
    char remote_[Limits::Peers::CallsignBuf] = {0};
    uint32_t lastHelloMs_ = 0;

    char line_[Limits::Tasks::WiredLineBuf] = {0};
    size_t lineLen_ = 0;
    bool lineOverflow_ = false;

    ConfigVariable<bool> enabledVar {
        NVS_KEY(NvsKeys::Wired::Enabled),"enabled","wired",
        ConfigType::Bool,
        &cfgData.enabled,
        ConfigPersistence::Persistent,
        0
    };
    ConfigVariable<uint32_t> baudVar {
        NVS_KEY(NvsKeys::Wired::Baud),"baud","wired",
        ConfigType::UInt32,
        &cfgData.baud,
        ConfigPersistence::Persistent,
        0
    };
    ConfigVariable<int32_t> detectPinVar {
        NVS_KEY(NvsKeys::Wired::DetectPin),"detect_pin","wired",
        ConfigType::Int32,
        &cfgData.detectPin,
        ConfigPersistence::Persistent,
        0
    };

    void start_();
    void sendHello_();
    void onLine_(const char* line);
    void drop_();
    void readSerial_();
};
