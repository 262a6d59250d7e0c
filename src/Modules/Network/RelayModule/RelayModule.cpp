/**
 * @file RelayModule.cpp
 * @brief Implementation file.
 */
#include "RelayModule.h"
#include "Core/ErrorCodes.h"
#include "Core/EventBus/EventPayloads.h"
#include "Domain/PeerDefaults.h"
#include "Modules/DevicesModule/NetAddress.h"
#include "Modules/DevicesModule/StatusParsers.h"
#define LOG_TAG "RelayMod"
#include "Core/ModuleLog.h"

#include <Arduino.h>
#include <string.h>

bool RelayModule::start_()
{
    char host[64];
    char path[64];
    uint16_t port = 0;
    bool tls = false;
    if (!parseSocketUrl(cfgData.url, host, sizeof(host), port, path, sizeof(path), tls)) {
        LOGW("invalid relay url '%s'", cfgData.url);
        return false;
    }

    ws_.onEvent([this](WStype_t type, uint8_t* payload, size_t length) {
        onSocketEvent_(type, payload, length);
    });
    ws_.setReconnectInterval(PeerDefaults::RelayReconnectMs);
    if (tls) ws_.beginSSL(host, port, path);
    else ws_.begin(host, port, path);

    LOGI("connecting to %s://%s:%u%s", tls ? "wss" : "ws", host, (unsigned)port, path);
    started_ = true;
    return true;
}

void RelayModule::stop_()
{
    if (!started_) return;
    ws_.disconnect();
    started_ = false;
    setConnected_(false, nullptr);
}

void RelayModule::sendHello_()
{
    char callsign[Limits::Peers::CallsignBuf] = {0};
    if (!peersSvc || !peersSvc->localCallsign ||
        !peersSvc->localCallsign(peersSvc->ctx, callsign, sizeof(callsign))) {
        LOGW("no local callsign, hello not sent");
        return;
    }

    char frame[96];
    if (!buildRelayHello(callsign, frame, sizeof(frame))) return;
    if (!ws_.sendTXT(frame)) LOGW("hello send failed");
}

void RelayModule::setConnected_(bool connected, const char* callsign)
{
    bool changed = false;
    portENTER_CRITICAL(&lock_);
    if (connected_ != connected) {
        connected_ = connected;
        changed = true;
    }
    if (connected && callsign) {
        if (strcmp(relayCallsign_, callsign) != 0) changed = true;
        strncpy(relayCallsign_, callsign, sizeof(relayCallsign_) - 1);
        relayCallsign_[sizeof(relayCallsign_) - 1] = '\0';
    }
    portEXIT_CRITICAL(&lock_);

    if (!changed) return;
    if (connected) {
        connectedSinceMs_ = millis();
        lastPingMs_ = connectedSinceMs_;
    }
    publishState_();
}

void RelayModule::publishState_()
{
    RelayInfo info;
    portENTER_CRITICAL(&lock_);
    info.connected = connected_;
    memcpy(info.callsign, relayCallsign_, sizeof(info.callsign));
    portEXIT_CRITICAL(&lock_);
    strncpy(info.url, cfgData.url, sizeof(info.url) - 1);
    info.url[sizeof(info.url) - 1] = '\0';

    if (!inbox || !inbox->relayState(inbox->ctx, info)) LOGW("relay state not delivered");

    if (!eventBus) return;
    RelayConnectionPayload p{};
    p.connected = info.connected ? 1 : 0;
    memcpy(p.callsign, info.callsign, sizeof(info.callsign));
    eventBus->post(EventId::RelayConnectionChanged, &p, sizeof(p));
}

void RelayModule::onText_(const char* text)
{
    RelayMessage msg;
    if (!parseRelayMessage(text, msg)) {
        LOGD("unparsed frame");
        return;
    }

    switch (msg.type) {
    case RelayMessageType::HelloAck:
        if (msg.stationId[0] == '\0') {
            LOGW("hello_ack without station id");
            break;
        }
        LOGI("hello_ack from %s (success=%d)", msg.stationId, msg.success ? 1 : 0);
        setConnected_(true, msg.stationId);
        break;
    case RelayMessageType::Ping: {
        char pong[64];
        snprintf(pong, sizeof(pong), "{\"type\":\"PONG\",\"timestamp\":%lu}", (unsigned long)millis());
        ws_.sendTXT(pong);
        break;
    }
    case RelayMessageType::Pong:
        lastPongMs_ = millis();
        break;
    case RelayMessageType::Other:
        break;
    }
}

void RelayModule::onSocketEvent_(WStype_t type, uint8_t* payload, size_t length)
{
    switch (type) {
    case WStype_CONNECTED:
        LOGI("socket open");
        sendHello_();
        break;
    case WStype_DISCONNECTED:
        if (connected_) LOGW("socket closed");
        setConnected_(false, nullptr);
        break;
    case WStype_TEXT: {
        if (!payload || length == 0) break;
        if (length >= Limits::PeerJson::RelayMsgDoc) {
            LOGD("frame too large (%u)", (unsigned)length);
            break;
        }
        char text[Limits::PeerJson::RelayMsgDoc];
        memcpy(text, payload, length);
        text[length] = '\0';
        onText_(text);
        break;
    }
    case WStype_ERROR:
        LOGW("socket error");
        break;
    default:
        break;
    }
}

void RelayModule::loop()
{
    const bool wifiUp = wifiSvc && wifiSvc->isConnected && wifiSvc->isConnected(wifiSvc->ctx);
    const bool wanted = cfgData.enabled && cfgData.url[0] != '\0' && wifiUp;

    if (restartPending_) {
        restartPending_ = false;
        stop_();
    }

    if (!wanted) {
        stop_();
        vTaskDelay(pdMS_TO_TICKS(500));
        return;
    }
    if (!started_ && !start_()) {
        vTaskDelay(pdMS_TO_TICKS(PeerDefaults::RelayReconnectMs));
        return;
    }

    ws_.loop();

    const uint32_t now = millis();
    if (connected_ && (uint32_t)(now - lastPingMs_) >= PeerDefaults::RelayPingPeriodMs) {
        lastPingMs_ = now;
        if (!ws_.sendTXT("{\"type\":\"PING\"}")) LOGW("ping send failed");
    }
}

void RelayModule::onEventStatic(const Event& e, void* user)
{
    RelayModule* self = static_cast<RelayModule*>(user);
    if (!self || e.id != EventId::ConfigChanged) return;
    const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
    if (!p || e.len < sizeof(ConfigChangedPayload)) return;
    if (strncmp(p->nvsKey, "rl_", 3) == 0 || strcmp(p->nvsKey, NvsKeys::Peers::Callsign) == 0) {
        self->restartPending_ = true;
    }
}

bool RelayModule::cmdStatus(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    (void)req;
    RelayModule* self = static_cast<RelayModule*>(userCtx);
    if (!self) {
        writeErrorJson(reply, replyLen, ErrorCode::NotReady, "relay.status");
        return false;
    }

    bool connected = false;
    char callsign[Limits::Peers::CallsignBuf];
    portENTER_CRITICAL(&self->lock_);
    connected = self->connected_;
    memcpy(callsign, self->relayCallsign_, sizeof(callsign));
    portEXIT_CRITICAL(&self->lock_);

    const uint32_t now = millis();
    const int wrote = snprintf(reply, replyLen,
                               "{\"ok\":true,\"enabled\":%s,\"url\":\"%s\",\"connected\":%s,"
                               "\"callsign\":\"%s\",\"uptime_ms\":%lu,\"last_pong_ms\":%lu}",
                               self->cfgData.enabled ? "true" : "false",
                               self->cfgData.url,
                               connected ? "true" : "false",
                               callsign,
                               connected ? (unsigned long)(now - self->connectedSinceMs_) : 0UL,
                               (unsigned long)self->lastPongMs_);
    if (wrote < 0 || (size_t)wrote >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::ReplyOverflow, "relay.status");
        return false;
    }
    return true;
}

bool RelayModule::svcIsConnected(void* ctx)
{
    RelayModule* self = static_cast<RelayModule*>(ctx);
    if (!self) return false;
    portENTER_CRITICAL(&self->lock_);
    const bool c = self->connected_;
    portEXIT_CRITICAL(&self->lock_);
    return c;
}

bool RelayModule::svcCallsign(void* ctx, char* out, size_t len)
{
    RelayModule* self = static_cast<RelayModule*>(ctx);
    if (!self || !out || len == 0) return false;
    portENTER_CRITICAL(&self->lock_);
    strncpy(out, self->relayCallsign_, len - 1);
    out[len - 1] = '\0';
    const bool c = self->connected_;
    portEXIT_CRITICAL(&self->lock_);
    return c && out[0] != '\0';
}

bool RelayModule::svcUrl(void* ctx, char* out, size_t len)
{
    RelayModule* self = static_cast<RelayModule*>(ctx);
    if (!self || !out || len == 0) return false;
    const int wrote = snprintf(out, len, "%s", self->cfgData.url);
    return wrote > 0 && (size_t)wrote < len;
}

void RelayModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(enabledVar);
    cfg.registerVar(urlVar);

    wifiSvc = services.get<WifiService>("wifi");
    peersSvc = services.get<PeersService>("peers");
    inbox = services.get<PeerInboxService>("peerinbox");
    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus = ebSvc ? ebSvc->bus : nullptr;
    if (eventBus) eventBus->subscribe(EventId::ConfigChanged, RelayModule::onEventStatic, this);

    static RelayService svc{
        RelayModule::svcIsConnected,
        RelayModule::svcCallsign,
        RelayModule::svcUrl,
        this
    };
    if (!services.add("relay", &svc)) LOGE("relay service not registered");

    const CommandService* cmdSvc = services.get<CommandService>("cmd");
    if (!cmdSvc || !cmdSvc->registerHandler(cmdSvc->ctx, "relay.status", RelayModule::cmdStatus, this)) {
        LOGW("relay.status not registered");
    }

    LOGI("RelayService registered");
}
