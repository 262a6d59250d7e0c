/**
 * @file ConsoleModule.cpp
 * @brief Implementation file.
 */
#include "ConsoleModule.h"
#include "Core/ErrorCodes.h"
#include "Core/EventBus/EventPayloads.h"
#include "Modules/DevicesModule/PeerTypes.h"
#define LOG_TAG "ConsoleM"
#include "Core/ModuleLog.h"

#include <Arduino.h>
#include <ArduinoJson.h>
#include <string.h>

void ConsoleModule::writeError_(ErrorCode code)
{
    char err[128];
    if (!writeErrorJson(err, sizeof(err), code, "console")) return;
    Serial.println(err);
}

void ConsoleModule::onEventStatic(const Event& e, void* user)
{
    const ConsoleModule* self = static_cast<const ConsoleModule*>(user);
    if (!self || !self->events_ || !e.payload) return;

    char line[160];
    int wrote = -1;
    switch (e.id) {
    case EventId::PeerStatusChanged: {
        if (e.len < sizeof(PeerStatusPayload)) return;
        const PeerStatusPayload* p = static_cast<const PeerStatusPayload*>(e.payload);
        const char* via = p->transport < kTransportCount ? transportWireName((Transport)p->transport) : "";
        wrote = snprintf(line, sizeof(line),
                         "{\"event\":\"peer_status\",\"callsign\":\"%.15s\",\"online\":%s,\"via\":\"%s\"}",
                         p->callsign, p->online ? "true" : "false", via);
        break;
    }
    case EventId::ScanComplete: {
        if (e.len < sizeof(ScanCompletePayload)) return;
        const ScanCompletePayload* p = static_cast<const ScanCompletePayload*>(e.payload);
        wrote = snprintf(line, sizeof(line),
                         "{\"event\":\"scan_complete\",\"sweep\":%lu,\"checks\":%u,\"online\":%u}",
                         (unsigned long)p->sweepId, (unsigned)p->checks, (unsigned)p->onlineCount);
        break;
    }
    case EventId::PeerSnapshot: {
        if (e.len < sizeof(PeerSnapshotPayload)) return;
        const PeerSnapshotPayload* p = static_cast<const PeerSnapshotPayload*>(e.payload);
        wrote = snprintf(line, sizeof(line),
                         "{\"event\":\"snapshot\",\"generation\":%lu,\"devices\":%u,\"online\":%u}",
                         (unsigned long)p->generation, (unsigned)p->deviceCount, (unsigned)p->onlineCount);
        break;
    }
    case EventId::PeerRemoved: {
        if (e.len < sizeof(PeerRemovedPayload)) return;
        const PeerRemovedPayload* p = static_cast<const PeerRemovedPayload*>(e.payload);
        wrote = snprintf(line, sizeof(line), "{\"event\":\"peer_removed\",\"callsign\":\"%.15s\"}", p->callsign);
        break;
    }
    case EventId::RelayConnectionChanged: {
        if (e.len < sizeof(RelayConnectionPayload)) return;
        const RelayConnectionPayload* p = static_cast<const RelayConnectionPayload*>(e.payload);
        wrote = snprintf(line, sizeof(line),
                         "{\"event\":\"relay\",\"connected\":%s,\"callsign\":\"%.15s\"}",
                         p->connected ? "true" : "false", p->callsign);
        break;
    }
    default:
        return;
    }
    if (wrote > 0 && (size_t)wrote < sizeof(line)) Serial.println(line);
}

void ConsoleModule::processLine_(const char* line)
{
    static StaticJsonDocument<Limits::JsonCmdBuf> doc;
    doc.clear();
    const DeserializationError err = deserializeJson(doc, line);
    if (err || !doc.is<JsonObjectConst>()) {
        LOGW("bad cmd json (%s)", err.c_str());
        writeError_(ErrorCode::BadCmdJson);
        return;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    const char* cmd = root["cmd"].as<const char*>();
    if (!cmd || cmd[0] == '\0') {
        writeError_(ErrorCode::MissingCmd);
        return;
    }
    if (!cmdSvc || !cmdSvc->execute) {
        writeError_(ErrorCode::CmdServiceUnavailable);
        return;
    }

    const char* argsJson = nullptr;
    char argsBuf[Limits::PeerJson::CallArgsText] = {0};
    JsonVariantConst argsVar = root["args"];
    if (!argsVar.isNull()) {
        const size_t written = serializeJson(argsVar, argsBuf, sizeof(argsBuf));
        if (written == 0 || written >= sizeof(argsBuf)) {
            LOGW("args too large (cmd=%s)", cmd);
            writeError_(ErrorCode::ArgsTooLarge);
            return;
        }
        argsJson = argsBuf;
    }

    replyBuf_[0] = '\0';
    const bool ok = cmdSvc->execute(cmdSvc->ctx, cmd, line, argsJson, replyBuf_, sizeof(replyBuf_));
    if (!ok) LOGD("command failed (cmd=%s)", cmd);
    if (replyBuf_[0] == '\0') {
        writeError_(ok ? ErrorCode::Failed : ErrorCode::CmdHandlerFailed);
        return;
    }
    Serial.println(replyBuf_);
}

void ConsoleModule::loop()
{
    while (Serial.available() > 0) {
        const int c = Serial.read();
        if (c < 0) break;
        if (c == '\r') continue;
        if (c == '\n') {
            line_[lineLen_] = '\0';
            if (lineOverflow_) {
                LOGW("line too long, dropped");
                writeError_(ErrorCode::ArgsTooLarge);
            } else if (lineLen_ > 0) {
                processLine_(line_);
            }
            lineLen_ = 0;
            lineOverflow_ = false;
            continue;
        }
        if (lineLen_ + 1 >= sizeof(line_)) {
            lineOverflow_ = true;
            continue;
        }
        line_[lineLen_++] = (char)c;
    }
    vTaskDelay(pdMS_TO_TICKS(20));
}

void ConsoleModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(eventsVar);
    cmdSvc = services.get<CommandService>("cmd");
    if (!cmdSvc) LOGE("command service missing");

    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    EventBus* bus = ebSvc ? ebSvc->bus : nullptr;
    const EventId watched[] = {
        EventId::PeerStatusChanged, EventId::PeerSnapshot, EventId::ScanComplete,
        EventId::PeerRemoved, EventId::RelayConnectionChanged
    };
    for (EventId id : watched) {
        if (!bus || !bus->subscribe(id, ConsoleModule::onEventStatic, this)) {
            LOGW("event %u not subscribed", (unsigned)id);
        }
    }
    LOGI("console ready");
}
