#pragma once
/**
 * @file ProbeModule.h
 * @brief Worker pool running peer HTTP probes off the devices owner task.
 */
#include "Core/ModulePassive.h"
#include "Core/Services/Services.h"
#include "Modules/Network/ProbeModule/HttpProbes.h"

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

/**
 * @brief Passive module owning a job queue and `Limits::Tasks::ProbeWorkers` tasks.
 *
 * Results are reported through `PeerInboxService`; workers never touch the
 * device registry.
 */
class ProbeModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "probe"; }

    /** @brief Depends on log hub and the devices inbox. */
    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "devices";
        return nullptr;
    }

    /** @brief Register the probe service and start the workers. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    enum class JobKind : uint8_t {
        Check,
        RelayClients,
        Collections
    };

    struct ProbeJob {
        JobKind kind;
        uint32_t sweepId;
        CheckPlan plan;   ///< Collections: callsign, endpoint and relayBase; RelayClients: relayBase
    };

    const PeerInboxService* inbox = nullptr;
    QueueHandle_t jobs_ = nullptr;
    HttpDirectProbe direct_;
    HttpRelayProbe relay_;

    bool enqueue_(const ProbeJob& job);
    void runJob_(const ProbeJob& job);
    void runCheck_(const ProbeJob& job);
    void runRelayClients_(const ProbeJob& job);
    void runCollections_(const ProbeJob& job);

    static void workerFn(void* pv);

    static bool svcSubmitCheck(void* ctx, uint32_t sweepId, const CheckPlan& plan);
    static bool svcSubmitRelayClients(void* ctx, const char* relayBase);
    static bool svcSubmitCollections(void* ctx, const char* callsign, const char* endpoint, const char* relayBase);
    static bool svcProbeStatus(void* ctx, const char* endpoint, uint32_t timeoutMs, DirectProbeResult* out);
};
