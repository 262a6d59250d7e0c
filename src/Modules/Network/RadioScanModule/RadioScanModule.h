#pragma once
/**
 * @file RadioScanModule.h
 * @brief Short-range radio scanner reporting nearby peers.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Core/SystemLimits.h"

/** @brief Radio scanner configuration. */
struct RadioConfig {
    bool enabled = true;
};

/**
 * @brief Active module running one blocking NimBLE scan window per request.
 *
 * Each completed window is delivered to the devices inbox as the full list of
 * visible peers. A window that fails to start delivers nothing.
 */
class RadioScanModule : public Module {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "radio"; }
    /** @brief Task name. */
    const char* taskName() const override { return "radio"; }

    /** @brief Depends on log hub and the devices inbox. */
    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "devices";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    uint16_t taskStackSize() const override { return Limits::Tasks::RadioStack; }
    BaseType_t taskCore() const override { return 0; }

private:
    RadioConfig cfgData;
    const PeerInboxService* inbox = nullptr;

    bool stackReady_ = false;
    volatile bool scanning_ = false;
    bool clearPending_ = false;   ///< disabled since the last reported cycle
    RadioSighting seen_[Limits::Peers::MaxScanPeers];

    ConfigVariable<bool> enabledVar {
        NVS_KEY(NvsKeys::Radio::Enabled),"enabled","radio",
        ConfigType::Bool,
        &cfgData.enabled,
        ConfigPersistence::Persistent,
        0
    };

    bool ensureStack_();
    void runScan_();
    void keep_(const RadioSighting& s, uint8_t& count);

    static bool svcRequestScan(void* ctx);
    static bool svcIsAvailable(void* ctx);
};
