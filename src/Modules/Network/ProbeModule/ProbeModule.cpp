/**
 * @file ProbeModule.cpp
 * @brief Implementation file.
 */
#include "ProbeModule.h"
#include "Domain/PeerDefaults.h"
#define LOG_TAG "ProbeMod"
#include "Core/ModuleLog.h"

#include <freertos/task.h>
#include <string.h>

bool ProbeModule::enqueue_(const ProbeJob& job)
{
    if (!jobs_) return false;
    if (xQueueSend(jobs_, &job, 0) != pdTRUE) {
        LOGW("job queue full, kind=%u dropped", (unsigned)job.kind);
        return false;
    }
    return true;
}

bool ProbeModule::svcSubmitCheck(void* ctx, uint32_t sweepId, const CheckPlan& plan)
{
    ProbeModule* self = static_cast<ProbeModule*>(ctx);
    if (!self) return false;
    ProbeJob job{};
    job.kind = JobKind::Check;
    job.sweepId = sweepId;
    job.plan = plan;
    return self->enqueue_(job);
}

bool ProbeModule::svcSubmitRelayClients(void* ctx, const char* relayBase)
{
    ProbeModule* self = static_cast<ProbeModule*>(ctx);
    if (!self || !relayBase) return false;
    ProbeJob job{};
    job.kind = JobKind::RelayClients;
    if (!copyBounded(job.plan.relayBase, sizeof(job.plan.relayBase), relayBase)) return false;
    return self->enqueue_(job);
}

bool ProbeModule::svcSubmitCollections(void* ctx, const char* callsign, const char* endpoint, const char* relayBase)
{
    ProbeModule* self = static_cast<ProbeModule*>(ctx);
    if (!self || !callsign) return false;
    ProbeJob job{};
    job.kind = JobKind::Collections;
    if (!copyBounded(job.plan.callsign, sizeof(job.plan.callsign), callsign)) return false;
    if (endpoint && !copyBounded(job.plan.endpoint, sizeof(job.plan.endpoint), endpoint)) return false;
    if (relayBase && !copyBounded(job.plan.relayBase, sizeof(job.plan.relayBase), relayBase)) return false;
    return self->enqueue_(job);
}

bool ProbeModule::svcProbeStatus(void* ctx, const char* endpoint, uint32_t timeoutMs, DirectProbeResult* out)
{
    ProbeModule* self = static_cast<ProbeModule*>(ctx);
    if (!self || !endpoint || !out) return false;
    *out = self->direct_.probe(endpoint, timeoutMs);
    return out->status == ProbeStatus::Success;
}

void ProbeModule::runCheck_(const ProbeJob& job)
{
    const CheckPlan& plan = job.plan;

    DirectProbeResult d;
    if (plan.runDirect) d = direct_.probe(plan.endpoint, PeerDefaults::ProbeTimeoutMs);

    ProxyProbeResult p;
    if (plan.runProxy) p = relay_.probe(plan.relayBase, plan.callsign, PeerDefaults::ProbeTimeoutMs);
    else if (!plan.selfRelay) p.status = ProbeStatus::NoRelay;

    if (!inbox || !inbox->checkResult(inbox->ctx, job.sweepId, plan, d, p)) {
        LOGW("check result for %s lost", plan.callsign);
    }
}

void ProbeModule::runRelayClients_(const ProbeJob& job)
{
    static RelayClient clients[Limits::Peers::MaxRelayClients];
    static portMUX_TYPE lock = portMUX_INITIALIZER_UNLOCKED;
    static bool busy = false;

    // One relay list at a time; the buffer is shared between workers.
    portENTER_CRITICAL(&lock);
    const bool mine = !busy;
    busy = true;
    portEXIT_CRITICAL(&lock);
    if (!mine) {
        if (inbox) inbox->relayClients(inbox->ctx, nullptr, 0, false);
        return;
    }

    uint8_t count = 0;
    const bool ok = fetchRelayClients(job.plan.relayBase, PeerDefaults::RelayClientsTimeoutMs,
                                      clients, Limits::Peers::MaxRelayClients, count);
    LOGD("relay clients: %s (%u)", ok ? "ok" : "failed", (unsigned)count);
    if (!inbox || !inbox->relayClients(inbox->ctx, clients, count, ok)) {
        LOGW("relay client list lost");
    }

    portENTER_CRITICAL(&lock);
    busy = false;
    portEXIT_CRITICAL(&lock);
}

void ProbeModule::runCollections_(const ProbeJob& job)
{
    CollectionDescriptor items[Limits::Peers::MaxCollections];
    uint8_t count = 0;
    const bool ok = fetchCollections(job.plan.callsign, job.plan.endpoint, job.plan.relayBase,
                                     PeerDefaults::CollectionsTimeoutMs,
                                     items, Limits::Peers::MaxCollections, count);
    if (!inbox || !inbox->collections(inbox->ctx, job.plan.callsign, items, count, ok)) {
        LOGW("collections for %s lost", job.plan.callsign);
    }
}

void ProbeModule::runJob_(const ProbeJob& job)
{
    switch (job.kind) {
    case JobKind::Check:        runCheck_(job); break;
    case JobKind::RelayClients: runRelayClients_(job); break;
    case JobKind::Collections:  runCollections_(job); break;
    }
}

void ProbeModule::workerFn(void* pv)
{
    ProbeModule* self = static_cast<ProbeModule*>(pv);
    ProbeJob job;
    while (true) {
        if (xQueueReceive(self->jobs_, &job, portMAX_DELAY) == pdTRUE) {
            self->runJob_(job);
        }
    }
}

void ProbeModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    (void)cfg;
    inbox = services.get<PeerInboxService>("peerinbox");
    if (!inbox) LOGE("peerinbox service missing");

    jobs_ = xQueueCreate(Limits::Tasks::ProbeJobQueueLen, sizeof(ProbeJob));
    if (!jobs_) {
        LOGE("job queue allocation failed");
        return;
    }

    static ProbeService svc{
        ProbeModule::svcSubmitCheck,
        ProbeModule::svcSubmitRelayClients,
        ProbeModule::svcSubmitCollections,
        ProbeModule::svcProbeStatus,
        this
    };
    if (!services.add("probe", &svc)) LOGE("probe service not registered");

    for (uint8_t i = 0; i < Limits::Tasks::ProbeWorkers; ++i) {
        char name[12];
        snprintf(name, sizeof(name), "probe%u", (unsigned)i);
        const BaseType_t rc = xTaskCreatePinnedToCore(
            ProbeModule::workerFn,
            name,
            Limits::Tasks::ProbeWorkerStack,
            this,
            1,
            nullptr,
            1
        );
        if (rc != pdPASS) LOGE("worker %u not started", (unsigned)i);
    }
    LOGI("ProbeService registered (%u workers)", (unsigned)Limits::Tasks::ProbeWorkers);
}
