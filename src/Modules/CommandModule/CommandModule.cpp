/**
 * @file CommandModule.cpp
 * @brief Implementation file.
 */
#include "CommandModule.h"
#include "Core/ErrorCodes.h"
#define LOG_TAG "CmdModul"
#include "Core/ModuleLog.h"


bool CommandModule::svcRegister(void* ctx, const char* cmd, CommandHandler fn, void* userCtx) {
    return ((CommandRegistry*)ctx)->registerHandler(cmd, fn, userCtx);
}

bool CommandModule::svcExecute(void* ctx, const char* cmd, const char* json, const char* args,
                               char* reply, size_t replyLen) {
    return ((CommandRegistry*)ctx)->execute(cmd, json, args, reply, replyLen);
}

bool CommandModule::cmdList(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen) {
    (void)req;
    const CommandRegistry* reg = static_cast<const CommandRegistry*>(userCtx);
    if (!reg) {
        writeErrorJson(reply, replyLen, ErrorCode::NotReady, "cmd.list");
        return false;
    }
    if (!reg->listJson(reply, replyLen)) {
        writeErrorJson(reply, replyLen, ErrorCode::ReplyOverflow, "cmd.list");
        return false;
    }
    return true;
}

void CommandModule::init(ConfigStore&, ServiceRegistry& services) {
    static CommandService svc{ svcRegister, svcExecute, nullptr };
    svc.ctx = &registry;
    if (!services.add("cmd", &svc)) {
        LOGE("cmd service registration failed");
        return;
    }

    if (!registry.registerHandler("cmd.list", cmdList, &registry)) {
        LOGW("cmd.list not registered");
    }
    LOGI("CommandService registered (max %u commands)", (unsigned)MAX_COMMANDS);
}
