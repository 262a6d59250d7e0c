/**
 * @file LanDiscoveryModule.cpp
 * @brief Implementation file.
 */
#include "LanDiscoveryModule.h"
#include "Domain/PeerDefaults.h"
#include "Modules/DevicesModule/NetAddress.h"
#define LOG_TAG "LanDisco"
#include "Core/ModuleLog.h"

#include <ESPmDNS.h>
#include <WiFi.h>
#include <string.h>

bool LanDiscoveryModule::wifiUp_() const
{
    return wifiSvc && wifiSvc->isConnected && wifiSvc->isConnected(wifiSvc->ctx);
}

bool LanDiscoveryModule::addCandidate_(const uint8_t ip[4], uint16_t port)
{
    if (candidateCount_ >= Limits::Peers::MaxLanCandidates) return false;
    char url[Limits::Peers::UrlBuf];
    if (!formatLocalUrl(ip, port, url, sizeof(url))) return false;
    for (uint8_t i = 0; i < candidateCount_; ++i) {
        if (strcmp(candidates_[i], url) == 0) return true;
    }
    memcpy(candidates_[candidateCount_++], url, sizeof(url));
    return true;
}

void LanDiscoveryModule::browseMdns_()
{
    const int n = MDNS.queryService("http", "tcp");
    if (n <= 0) {
        LOGD("mdns: no http services");
        return;
    }
    for (int i = 0; i < n; ++i) {
        const IPAddress addr = MDNS.IP(i);
        const uint8_t ip[4] = {addr[0], addr[1], addr[2], addr[3]};
        if (ip[0] == 0) continue;
        if (!addCandidate_(ip, MDNS.port(i))) break;
    }
    LOGD("mdns: %d services, %u candidates", n, (unsigned)candidateCount_);
}

void LanDiscoveryModule::sweepSubnet_()
{
    uint8_t self[4] = {0};
    uint8_t mask[4] = {0};
    if (!wifiSvc || !wifiSvc->localAddress || !wifiSvc->localAddress(wifiSvc->ctx, self, mask)) return;
    if (mask[0] != 255 || mask[1] != 255 || mask[2] != 255) {
        LOGD("subnet wider than /24, sweeping own /24 only");
    }
    uint8_t ip[4] = {self[0], self[1], self[2], 0};

    for (uint16_t host = 1; host < 255; ++host) {
        if (host == self[3]) continue;
        if (!wifiUp_()) {
            LOGW("sweep aborted, wifi down");
            return;
        }
        ip[3] = (uint8_t)host;
        for (uint16_t port : PeerDefaults::PrimaryPorts) {
            WiFiClient client;
            if (!client.connect(IPAddress(ip[0], ip[1], ip[2], ip[3]), port,
                                (int32_t)PeerDefaults::LanConnectGateMs)) {
                continue;
            }
            client.stop();
            if (!addCandidate_(ip, port)) return;
        }
    }
}

void LanDiscoveryModule::flush_(bool done)
{
    if (!inbox || !inbox->localDiscovery(inbox->ctx, batch_, batchCount_, done)) {
        LOGW("local batch lost (%u peers)", (unsigned)batchCount_);
    }
    batchCount_ = 0;
}

bool LanDiscoveryModule::probe_(const char* callsign, const char* endpoint)
{
    DirectProbeResult r;
    if (!probeSvc->probeStatus(probeSvc->ctx, endpoint, PeerDefaults::LocalHostTimeoutMs, &r)) {
        return false;
    }

    const char* cs = callsign;
    if (!cs) {
        if (!r.hasInfo || !r.info.hasCallsign) {
            LOGD("%s answered without callsign", endpoint);
            return false;
        }
        cs = r.info.callsign;
    }

    if (batchCount_ >= Limits::Peers::MaxScanPeers) flush_(false);
    LocalSighting& s = batch_[batchCount_];
    s = LocalSighting();
    if (!copyBounded(s.callsign, sizeof(s.callsign), cs)) return false;
    if (!copyBounded(s.endpoint, sizeof(s.endpoint), endpoint)) return false;
    s.latencyMs = r.latencyMs;
    if (r.hasInfo) s.info = r.info;
    ++batchCount_;
    return true;
}

void LanDiscoveryModule::runDiscover_()
{
    const uint32_t started = millis();
    candidateCount_ = 0;
    batchCount_ = 0;

    browseMdns_();
    if (cfgData.sweep) sweepSubnet_();

    uint8_t found = 0;
    for (uint8_t i = 0; i < candidateCount_ && wifiUp_(); ++i) {
        if (probe_(nullptr, candidates_[i])) ++found;
    }
    flush_(true);
    LOGI("discovery: %u candidates, %u peers in %lu ms",
         (unsigned)candidateCount_, (unsigned)found, (unsigned long)(millis() - started));
}

void LanDiscoveryModule::runRecheck_(uint8_t count)
{
    batchCount_ = 0;
    uint8_t found = 0;
    for (uint8_t i = 0; i < count && wifiUp_(); ++i) {
        if (probe_(targets_[i].callsign, targets_[i].endpoint)) ++found;
    }
    flush_(true);
    LOGD("recheck: %u/%u answered", (unsigned)found, (unsigned)count);
}

void LanDiscoveryModule::loop()
{
    if (ulTaskNotifyTake(pdTRUE, pdMS_TO_TICKS(1000)) == 0) return;

    portENTER_CRITICAL(&lock_);
    const bool full = fullPending_;
    const uint8_t count = targetCount_;
    portEXIT_CRITICAL(&lock_);

    if (full) runDiscover_();
    else if (count > 0) runRecheck_(count);

    portENTER_CRITICAL(&lock_);
    fullPending_ = false;
    targetCount_ = 0;
    busy_ = false;
    portEXIT_CRITICAL(&lock_);
}

bool LanDiscoveryModule::svcDiscover(void* ctx)
{
    LanDiscoveryModule* self = static_cast<LanDiscoveryModule*>(ctx);
    if (!self || !self->probeSvc || !self->wifiUp_()) return false;
    TaskHandle_t task = self->getTaskHandle();
    if (!task) return false;

    portENTER_CRITICAL(&self->lock_);
    const bool accepted = !self->busy_;
    if (accepted) {
        self->busy_ = true;
        self->fullPending_ = true;
    }
    portEXIT_CRITICAL(&self->lock_);
    if (!accepted) return false;

    xTaskNotifyGive(task);
    return true;
}

bool LanDiscoveryModule::svcRecheck(void* ctx, const LanTarget* targets, uint8_t count)
{
    LanDiscoveryModule* self = static_cast<LanDiscoveryModule*>(ctx);
    if (!self || !targets || count == 0 || !self->probeSvc || !self->wifiUp_()) return false;
    TaskHandle_t task = self->getTaskHandle();
    if (!task) return false;
    if (count > Limits::Peers::MaxDevices) count = Limits::Peers::MaxDevices;

    portENTER_CRITICAL(&self->lock_);
    const bool accepted = !self->busy_;
    if (accepted) self->busy_ = true;
    portEXIT_CRITICAL(&self->lock_);
    if (!accepted) return false;

    // The task does not read targets_ until targetCount_ is set.
    memcpy(self->targets_, targets, sizeof(LanTarget) * count);
    portENTER_CRITICAL(&self->lock_);
    self->targetCount_ = count;
    portEXIT_CRITICAL(&self->lock_);

    xTaskNotifyGive(task);
    return true;
}

void LanDiscoveryModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(sweepVar);

    wifiSvc = services.get<WifiService>("wifi");
    probeSvc = services.get<ProbeService>("probe");
    inbox = services.get<PeerInboxService>("peerinbox");
    if (!probeSvc) LOGE("probe service missing");
    if (!inbox) LOGE("peerinbox service missing");

    static LanService svc{
        LanDiscoveryModule::svcDiscover,
        LanDiscoveryModule::svcRecheck,
        this
    };
    if (!services.add("lan", &svc)) LOGE("lan service not registered");
    LOGI("LanService registered");
}
