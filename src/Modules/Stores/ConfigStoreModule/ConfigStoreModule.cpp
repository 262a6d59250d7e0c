/**
 * @file ConfigStoreModule.cpp
 * @brief Implementation file.
 */
#include "ConfigStoreModule.h"
#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include <ArduinoJson.h>
#include <string.h>
#define LOG_TAG "CfgModul"
#include "Core/ModuleLog.h"

static bool writeCfgError_(char* reply, size_t replyLen, ErrorCode code, const char* where)
{
    if (!writeErrorJson(reply, replyLen, code, where)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
    return false;
}

bool ConfigStoreModule::svcErase(void* ctx) {
    return ((ConfigStore*)ctx)->erasePersistent();
}

bool ConfigStoreModule::cmdGet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    ConfigStoreModule* self = static_cast<ConfigStoreModule*>(userCtx);
    if (!self || !self->registry) return writeCfgError_(reply, replyLen, ErrorCode::NotReady, "config.get");

    const char* module = nullptr;
    StaticJsonDocument<256> args;
    if (req.args && req.args[0] != '\0') {
        if (deserializeJson(args, req.args) || !args.is<JsonObjectConst>()) {
            return writeCfgError_(reply, replyLen, ErrorCode::BadCfgJson, "config.get");
        }
        module = args["module"] | (const char*)nullptr;
    }

    static char body[Limits::JsonConfigApplyBuf];
    if (module && module[0] != '\0') {
        bool truncated = false;
        if (!self->registry->toJsonModule(module, body, sizeof(body), &truncated)) {
            return writeCfgError_(reply, replyLen, ErrorCode::MissingValue, "config.get");
        }
        if (truncated) return writeCfgError_(reply, replyLen, ErrorCode::CfgTruncated, "config.get");
    } else {
        self->registry->toJson(body, sizeof(body));
    }

    const int wrote = snprintf(reply, replyLen, "{\"ok\":true,\"config\":%s}", body);
    if (!(wrote > 0 && (size_t)wrote < replyLen)) {
        return writeCfgError_(reply, replyLen, ErrorCode::ReplyOverflow, "config.get");
    }
    return true;
}

bool ConfigStoreModule::cmdSet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    ConfigStoreModule* self = static_cast<ConfigStoreModule*>(userCtx);
    if (!self || !self->registry) return writeCfgError_(reply, replyLen, ErrorCode::CfgServiceUnavailable, "config.set");
    if (!req.args || req.args[0] == '\0') return writeCfgError_(reply, replyLen, ErrorCode::MissingArgs, "config.set");

    if (!self->registry->applyJson(req.args)) {
        LOGW("config.set rejected");
        return writeCfgError_(reply, replyLen, ErrorCode::CfgApplyFailed, "config.set");
    }
    snprintf(reply, replyLen, "{\"ok\":true}");
    return true;
}

void ConfigStoreModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    registry = &cfg;

    static ConfigStoreService svc{ svcErase, nullptr };
    svc.ctx = registry;

    if (!services.add("config", &svc)) {
        LOGE("config service registration failed");
        return;
    }

    const CommandService* cmdSvc = services.get<CommandService>("cmd");
    if (!cmdSvc || !cmdSvc->registerHandler ||
        !cmdSvc->registerHandler(cmdSvc->ctx, "config.get", cmdGet, this) ||
        !cmdSvc->registerHandler(cmdSvc->ctx, "config.set", cmdSet, this)) {
        LOGW("config commands not registered");
    }
    LOGI("ConfigStoreService registered");
}
