#pragma once
/**
 * @file LanDiscoveryModule.h
 * @brief Local-segment discovery: mDNS browse, optional /24 sweep and quick rechecks.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Core/SystemLimits.h"

/** @brief LAN discovery configuration. */
struct LanConfig {
    bool sweep = true;
};

/**
 * @brief Active module answering `LanService` requests on its own task.
 *
 * Candidates are probed with `ProbeService::probeStatus`. Results go to the
 * devices inbox in batches; the last batch of a request carries `done`.
 */
class LanDiscoveryModule : public Module {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "lan"; }
    /** @brief Task name. */
    const char* taskName() const override { return "lan"; }

    /** @brief Depends on log hub, WiFi, the devices inbox and the probe workers. */
    uint8_t dependencyCount() const override { return 4; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "wifi";
        if (i == 2) return "devices";
        if (i == 3) return "probe";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    uint16_t taskStackSize() const override { return Limits::Tasks::LanStack; }

private:
    LanConfig cfgData;
    const WifiService* wifiSvc = nullptr;
    const ProbeService* probeSvc = nullptr;
    const PeerInboxService* inbox = nullptr;

    portMUX_TYPE lock_ = portMUX_INITIALIZER_UNLOCKED;
    bool busy_ = false;
    bool fullPending_ = false;
    uint8_t targetCount_ = 0;
    LanTarget targets_[Limits::Peers::MaxDevices];

    char candidates_[Limits::Peers::MaxLanCandidates][Limits::Peers::UrlBuf];
    uint8_t candidateCount_ = 0;
    LocalSighting batch_[Limits::Peers::MaxScanPeers];
    uint8_t batchCount_ = 0;

    ConfigVariable<bool> sweepVar {
        NVS_KEY(NvsKeys::Lan::Sweep),"sweep","lan",
        ConfigType::Bool,
        &cfgData.sweep,
        ConfigPersistence::Persistent,
        0
    };

    bool wifiUp_() const;
    bool addCandidate_(const uint8_t ip[4], uint16_t port);
    void browseMdns_();
    void sweepSubnet_();
    bool probe_(const char* callsign, const char* endpoint);
    void flush_(bool done);
    void runDiscover_();
    void runRecheck_(uint8_t count);

    static bool svcDiscover(void* ctx);
    static bool svcRecheck(void* ctx, const LanTarget* targets, uint8_t count);
};
