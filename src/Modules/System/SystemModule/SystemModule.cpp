/**
 * @file SystemModule.cpp
 * @brief Implementation file.
 */
#include "SystemModule.h"
#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include <WiFi.h>
#include <esp_system.h>
#include <esp_wifi.h>
#define LOG_TAG "SysModul"
#include "Core/ModuleLog.h"

namespace {

const char* resetReasonLabel(esp_reset_reason_t r)
{
    switch (r) {
    case ESP_RST_POWERON: return "power_on";
    case ESP_RST_SW: return "software";
    case ESP_RST_PANIC: return "panic";
    case ESP_RST_INT_WDT:
    case ESP_RST_TASK_WDT:
    case ESP_RST_WDT: return "watchdog";
    case ESP_RST_BROWNOUT: return "brownout";
    case ESP_RST_DEEPSLEEP: return "deep_sleep";
    default: return "other";
    }
}

bool copyReply(char* reply, size_t replyLen, const char* json, const char* where)
{
    if (!reply || replyLen == 0) return false;
    const int wrote = snprintf(reply, replyLen, "%s", json);
    if (wrote > 0 && (size_t)wrote < replyLen) return true;
    writeErrorJson(reply, replyLen, ErrorCode::ReplyOverflow, where);
    return false;
}

// Station credentials from older firmware may still sit in the driver's NVS area.
esp_err_t eraseDriverCredentials()
{
    WiFi.disconnect(false, true);
    esp_err_t err = esp_wifi_restore();
    if (err == ESP_ERR_WIFI_NOT_INIT) {
        WiFi.mode(WIFI_MODE_STA);
        delay(20);
        err = esp_wifi_restore();
    }
    return err;
}

}  // namespace

bool SystemModule::cmdPing(void*, const CommandRequest&, char* reply, size_t replyLen)
{
    return copyReply(reply, replyLen, "{\"ok\":true,\"pong\":true}", "system.ping");
}

bool SystemModule::cmdInfo(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    SystemModule* self = static_cast<SystemModule*>(userCtx);
    const PeersService* peers = self ? self->peersSvc_ : nullptr;

    char callsign[Limits::Peers::CallsignBuf] = "";
    if (peers && peers->localCallsign) peers->localCallsign(peers->ctx, callsign, sizeof(callsign));
    const uint32_t generation = (peers && peers->generation) ? peers->generation(peers->ctx) : 0;

    const int wrote = snprintf(reply, replyLen,
                               "{\"ok\":true,\"callsign\":\"%s\",\"uptime_ms\":%lu,\"heap_free\":%lu,"
                               "\"heap_min\":%lu,\"generation\":%lu,\"reset\":\"%s\"}",
                               callsign,
                               (unsigned long)millis(),
                               (unsigned long)ESP.getFreeHeap(),
                               (unsigned long)ESP.getMinFreeHeap(),
                               (unsigned long)generation,
                               resetReasonLabel(esp_reset_reason()));
    if (wrote < 0 || (size_t)wrote >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::ReplyOverflow, "system.info");
        return false;
    }
    return true;
}

bool SystemModule::cmdReboot(void*, const CommandRequest&, char* reply, size_t replyLen)
{
    if (!copyReply(reply, replyLen, "{\"ok\":true,\"msg\":\"rebooting\"}", "system.reboot")) return false;
    LOGW("reboot requested");
    delay(200); ///< let the console flush the reply
    esp_restart();
    return true;
}

bool SystemModule::cmdFactoryReset(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    SystemModule* self = static_cast<SystemModule*>(userCtx);
    if (!self || !self->cfgSvc_ || !self->cfgSvc_->erase) {
        writeErrorJson(reply, replyLen, ErrorCode::NotReady, "system.factory_reset");
        return false;
    }

    const PeersService* peers = self->peersSvc_;
    const bool cacheOk = !peers || !peers->wipeCache || peers->wipeCache(peers->ctx);
    const bool cfgOk = self->cfgSvc_->erase(self->cfgSvc_->ctx);
    const esp_err_t drvErr = eraseDriverCredentials();
    const bool drvOk = (drvErr == ESP_OK || drvErr == ESP_ERR_WIFI_NOT_INIT);

    if (!cacheOk || !cfgOk || !drvOk) {
        LOGE("factory reset incomplete cache=%d cfg=%d wifi=%d (err=%d)",
             (int)cacheOk, (int)cfgOk, (int)drvOk, (int)drvErr);
        writeErrorJson(reply, replyLen, ErrorCode::Failed, "system.factory_reset");
        return false;
    }

    if (!copyReply(reply, replyLen, "{\"ok\":true,\"msg\":\"factory_reset\"}", "system.factory_reset")) return false;
    LOGW("factory reset done, restarting");
    delay(300); ///< let the console flush the reply
    esp_restart();
    return true;
}

void SystemModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    (void)cfg;
    cfgSvc_ = services.get<ConfigStoreService>("config");
    peersSvc_ = services.get<PeersService>("peers");

    const CommandService* cmdSvc = services.get<CommandService>("cmd");
    if (!cmdSvc || !cmdSvc->registerHandler) {
        LOGE("cmd service unavailable");
        return;
    }

    struct Entry { const char* name; CommandHandler fn; };
    static const Entry entries[] = {
        {"system.ping", cmdPing},
        {"system.info", cmdInfo},
        {"system.reboot", cmdReboot},
        {"system.factory_reset", cmdFactoryReset},
    };
    for (const Entry& e : entries) {
        if (!cmdSvc->registerHandler(cmdSvc->ctx, e.name, e.fn, this)) LOGW("%s not registered", e.name);
    }
    LOGI("system commands registered");
}
