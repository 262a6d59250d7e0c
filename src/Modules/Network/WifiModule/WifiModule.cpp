/**
 * @file WifiModule.cpp
 * @brief Station connect/retry state machine, mDNS host and wifi.status.
 */
#include "WifiModule.h"
#include "Core/CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include "Core/EventBus/EventPayloads.h"
#include "Domain/PeerDefaults.h"
#define LOG_TAG "WifiModu"
#include "Core/ModuleLog.h"
#include <ctype.h>
#include <string.h>

namespace {

const char* stateLabel(WifiState s)
{
    switch (s) {
    case WifiState::Disabled: return "disabled";
    case WifiState::Idle: return "idle";
    case WifiState::Connecting: return "connecting";
    case WifiState::Connected: return "connected";
    case WifiState::ErrorWait: return "retry_wait";
    }
    return "unknown";
}

// Lowercase letters, digits and '-' only; separators fold to '-', edges trimmed.
void toHostLabel(const char* in, char* out, size_t outLen)
{
    size_t w = 0;
    for (size_t i = 0; in[i] != '\0' && w + 1 < outLen; ++i) {
        const unsigned char c = (unsigned char)in[i];
        if (isalnum(c)) out[w++] = (char)tolower(c);
        else if ((c == '-' || c == ' ' || c == '_' || c == '.') && w > 0 && out[w - 1] != '-') out[w++] = '-';
    }
    while (w > 0 && out[w - 1] == '-') --w;
    out[w] = '\0';
}

}  // namespace

bool WifiModule::svcIsConnected(void* ctx)
{
    WifiModule* self = static_cast<WifiModule*>(ctx);
    return self && self->state_ == WifiState::Connected && WiFi.isConnected();
}

bool WifiModule::svcLocalAddress(void* ctx, uint8_t ip[4], uint8_t mask[4])
{
    if (!ip || !mask || !svcIsConnected(ctx)) return false;
    const IPAddress a = WiFi.localIP();
    const IPAddress m = WiFi.subnetMask();
    for (uint8_t i = 0; i < 4; ++i) {
        ip[i] = a[i];
        mask[i] = m[i];
    }
    return (uint32_t)a != 0;
}

void WifiModule::onEventStatic(const Event& e, void* user)
{
    WifiModule* self = static_cast<WifiModule*>(user);
    if (!self || e.id != EventId::ConfigChanged) return;
    const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
    if (!p || e.len < sizeof(ConfigChangedPayload)) return;
    if (strncmp(p->nvsKey, "wifi_", 5) == 0) self->restartPending_ = true;
}

bool WifiModule::cmdStatus(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    (void)req;
    WifiModule* self = static_cast<WifiModule*>(userCtx);
    if (!self) {
        writeErrorJson(reply, replyLen, ErrorCode::NotReady, "wifi.status");
        return false;
    }

    uint8_t a[4] = {0};
    uint8_t m[4] = {0};
    const bool up = svcLocalAddress(self, a, m);
    char ip[16] = "";
    if (up) snprintf(ip, sizeof(ip), "%u.%u.%u.%u", a[0], a[1], a[2], a[3]);
    const int wrote = snprintf(reply, replyLen,
                               "{\"ok\":true,\"state\":\"%s\",\"ssid\":\"%s\",\"ip\":\"%s\","
                               "\"rssi\":%d,\"mdns\":\"%s\",\"failures\":%u}",
                               stateLabel(self->state_),
                               self->cfg_.ssid,
                               ip,
                               up ? (int)WiFi.RSSI() : 0,
                               self->mdnsHost_,
                               (unsigned)self->failures_);
    if (wrote < 0 || (size_t)wrote >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::ReplyOverflow, "wifi.status");
        return false;
    }
    return true;
}

void WifiModule::enter_(WifiState s)
{
    if (s == state_) return;
    const bool wasUp = (state_ == WifiState::Connected);
    state_ = s;
    stateSinceMs_ = millis();
    if (!wasUp) return;

    dropMdns_();
    if (netReadyPosted_) {
        netReadyPosted_ = false;
        if (!eventBus_ || !eventBus_->post(EventId::WifiNetLost, nullptr, 0)) LOGW("WifiNetLost post failed");
    }
}

void WifiModule::beginConnect_()
{
    if (cfg_.ssid[0] == '\0') {
        const uint32_t now = millis();
        if (now - lastNoSsidLogMs_ >= 10000U) {
            lastNoSsidLogMs_ = now;
            LOGW("no ssid configured");
        }
        return;
    }

    LOGI("connecting to '%s' (attempt %u)", cfg_.ssid, (unsigned)failures_ + 1U);
    WiFi.disconnect(false, false);
    WiFi.mode(WIFI_MODE_STA);
    WiFi.setSleep(false);               ///< modem sleep delays probe replies
    WiFi.begin(cfg_.ssid, cfg_.pass);
    enter_(WifiState::Connecting);
}

void WifiModule::onConnectFailed_(const char* why)
{
    if (failures_ < 0xFFFF) ++failures_;
    const uint8_t shift = failures_ > 4 ? 4 : (uint8_t)(failures_ - 1);
    retryDelayMs_ = PeerDefaults::WifiRetryBaseMs << shift;
    if (retryDelayMs_ > PeerDefaults::WifiRetryMaxMs) retryDelayMs_ = PeerDefaults::WifiRetryMaxMs;
    LOGW("%s, retry in %lus", why, (unsigned long)(retryDelayMs_ / 1000U));
    WiFi.disconnect(false, false);
    enter_(WifiState::ErrorWait);
}

void WifiModule::tickConnecting_()
{
    if (WiFi.isConnected()) {
        const IPAddress ip = WiFi.localIP();
        LOGI("connected ip=%u.%u.%u.%u rssi=%d", ip[0], ip[1], ip[2], ip[3], WiFi.RSSI());
        failures_ = 0;
        enter_(WifiState::Connected);
        return;
    }
    if (millis() - stateSinceMs_ > PeerDefaults::WifiConnectTimeoutMs) onConnectFailed_("connect timeout");
}

void WifiModule::tickConnected_()
{
    if (!WiFi.isConnected()) {
        onConnectFailed_("link lost");
        return;
    }
    applyMdns_();
    if (netReadyPosted_) return;
    const IPAddress ip = WiFi.localIP();
    if ((uint32_t)ip == 0) return;
    postNetReady_();
    netReadyPosted_ = true;
}

void WifiModule::restart_()
{
    restartPending_ = false;
    failures_ = 0;
    WiFi.disconnect(false, false);
    enter_(cfg_.enabled ? WifiState::Idle : WifiState::Disabled);
    LOGI("station restart (enabled=%d)", cfg_.enabled ? 1 : 0);
}

void WifiModule::dropMdns_()
{
    if (mdnsHost_[0] == '\0') return;
    MDNS.end();
    mdnsHost_[0] = '\0';
}

void WifiModule::applyMdns_()
{
    char host[sizeof(mdnsHost_)];
    toHostLabel(cfg_.mdns, host, sizeof(host));
    if (strcmp(host, mdnsHost_) == 0) return;

    dropMdns_();
    if (host[0] == '\0') return;
    if (!MDNS.begin(host)) {
        LOGW("mDNS start failed host=%s", host);
        return;
    }
    snprintf(mdnsHost_, sizeof(mdnsHost_), "%s", host);
    LOGI("mDNS host %s.local", mdnsHost_);
}

void WifiModule::postNetReady_()
{
    const IPAddress ip = WiFi.localIP();
    const IPAddress gw = WiFi.gatewayIP();
    const IPAddress mask = WiFi.subnetMask();

    WifiNetReadyPayload p{};
    for (uint8_t i = 0; i < 4; ++i) {
        p.ip[i] = ip[i];
        p.gw[i] = gw[i];
        p.mask[i] = mask[i];
    }
    if (!eventBus_ || !eventBus_->post(EventId::WifiNetReady, &p, sizeof(p))) LOGW("WifiNetReady post failed");
}

void WifiModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(enabledVar);
    cfg.registerVar(ssidVar);
    cfg.registerVar(passVar);
    cfg.registerVar(mdnsVar);

    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;
    if (eventBus_) eventBus_->subscribe(EventId::ConfigChanged, WifiModule::onEventStatic, this);

    static WifiService svc {
        WifiModule::svcIsConnected,
        WifiModule::svcLocalAddress,
        this
    };
    if (!services.add("wifi", &svc)) LOGE("wifi service not registered");

    const CommandService* cmdSvc = services.get<CommandService>("cmd");
    if (!cmdSvc || !cmdSvc->registerHandler(cmdSvc->ctx, "wifi.status", WifiModule::cmdStatus, this)) {
        LOGW("wifi.status not registered");
    }

    // Credentials live in ConfigStore only.
    WiFi.persistent(false);
    LOGI("WifiService registered");
}

void WifiModule::loop()
{
    if (restartPending_) restart_();

    switch (state_) {
    case WifiState::Disabled:
        if (cfg_.enabled) enter_(WifiState::Idle);
        vTaskDelay(pdMS_TO_TICKS(2000));
        break;

    case WifiState::Idle:
        if (!cfg_.enabled) {
            enter_(WifiState::Disabled);
            break;
        }
        beginConnect_();
        vTaskDelay(pdMS_TO_TICKS(1000));
        break;

    case WifiState::Connecting:
        tickConnecting_();
        vTaskDelay(pdMS_TO_TICKS(200));
        break;

    case WifiState::Connected:
        tickConnected_();
        vTaskDelay(pdMS_TO_TICKS(1000));
        break;

    case WifiState::ErrorWait:
        if (millis() - stateSinceMs_ > retryDelayMs_) enter_(WifiState::Idle);
        vTaskDelay(pdMS_TO_TICKS(500));
        break;
    }
}
