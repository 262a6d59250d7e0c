/**
 * @file DevicesCommands.cpp
 * @brief `peers.*` and `folders.*` command handlers.
 *
 * Handlers run on the caller task. Read-only listing is served from the
 * published snapshot; everything else is executed on the owner task through
 * a synchronous inbox call.
 */

#include "DevicesModule.h"
#include "Core/ErrorCodes.h"
#include "Core/EventBus/EventPayloads.h"
#include "Modules/DevicesModule/PeerSnapshot.h"
#define LOG_TAG "DevicesC"
#include "Core/ModuleLog.h"

#include <Arduino.h>
#include <ArduinoJson.h>
#include <string.h>

static void writeCmdError_(char* reply, size_t replyLen, const char* where, ErrorCode code)
{
    if (!writeErrorJson(reply, replyLen, code, where)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
}

/// Owner task only: the document is shared between calls.
static bool parseArgs_(const char* args, JsonObjectConst& out)
{
    static StaticJsonDocument<Limits::PeerJson::CallArgsDoc> doc;
    doc.clear();
    if (!args || args[0] == '\0') return false;
    const DeserializationError err = deserializeJson(doc, args);
    if (err || !doc.is<JsonObject>()) return false;
    out = doc.as<JsonObjectConst>();
    return true;
}

static bool argCallsign_(JsonObjectConst args, char* out, size_t outLen)
{
    const char* raw = args["callsign"].as<const char*>();
    return raw && normalizeCallsign(raw, out, outLen);
}

static bool argFolderId_(JsonObjectConst args, uint8_t& out)
{
    JsonVariantConst v = args["id"];
    if (!v.is<int>()) return false;
    const int id = v.as<int>();
    if (id < 0 || id > 255) return false;
    out = (uint8_t)id;
    return true;
}

static ErrorCode folderError_(FolderResult r)
{
    switch (r) {
    case FolderResult::UnknownFolder: return ErrorCode::UnknownFolder;
    case FolderResult::TableFull:     return ErrorCode::FolderTableFull;
    case FolderResult::InvalidName:   return ErrorCode::InvalidLabel;
    case FolderResult::Protected:     return ErrorCode::Failed;
    case FolderResult::Ok:            break;
    }
    return ErrorCode::Failed;
}

static bool writeDoc_(const JsonDocument& doc, char* reply, size_t replyLen, const char* where)
{
    if (doc.overflowed() || measureJson(doc) >= replyLen) {
        writeCmdError_(reply, replyLen, where, ErrorCode::ReplyOverflow);
        return false;
    }
    serializeJson(doc, reply, replyLen);
    return true;
}

// ---------------------------------------------------------------------------
// Owner call plumbing
// ---------------------------------------------------------------------------

bool DevicesModule::callOwner_(CallOp op, const char* args, char* reply, size_t replyLen, const char* where)
{
    if (!reply || replyLen == 0) return false;
    if (!inbox_ || !callMutex_ || !callDone_) {
        writeCmdError_(reply, replyLen, where, ErrorCode::NotReady);
        return false;
    }

    CallBody body{};
    body.op = op;
    if (args && !copyBounded(body.args, sizeof(body.args), args)) {
        writeCmdError_(reply, replyLen, where, ErrorCode::ArgsTooLarge);
        return false;
    }

    const TickType_t wait = pdMS_TO_TICKS(Limits::Tasks::OwnerCallTimeoutMs);
    if (xSemaphoreTake(callMutex_, wait) != pdTRUE) {
        writeCmdError_(reply, replyLen, where, ErrorCode::NotReady);
        return false;
    }

    const uint32_t seq = ++callSeq_;
    bool answered = false;
    bool ok = false;
    if (postBody_(InboxKind::Call, false, seq, nullptr, body)) {
        const TickType_t deadline = xTaskGetTickCount() + wait;
        while (true) {
            const TickType_t now = xTaskGetTickCount();
            if ((int32_t)(deadline - now) <= 0) break;
            if (xSemaphoreTake(callDone_, deadline - now) != pdTRUE) break;
            // A late reply to an abandoned call may still be signalled first.
            if (callReplySeq_ == seq) {
                answered = true;
                break;
            }
        }
    }

    if (answered) {
        ok = callReplyOk_;
        const size_t len = strlen(callReply_);
        if (len < replyLen) {
            memcpy(reply, callReply_, len + 1);
        } else {
            ok = false;
            writeCmdError_(reply, replyLen, where, ErrorCode::ReplyOverflow);
        }
    } else {
        LOGW("%s: owner call timed out", where);
        writeCmdError_(reply, replyLen, where, ErrorCode::NotReady);
    }

    xSemaphoreGive(callMutex_);
    return ok;
}

void DevicesModule::executeCall_(uint32_t seq, const CallBody& call)
{
    callReply_[0] = '\0';
    const bool ok = execCall_(call, callReply_, sizeof(callReply_));
    callReplyOk_ = ok;
    callReplySeq_ = seq;
    xSemaphoreGive(callDone_);
}

bool DevicesModule::execCall_(const CallBody& call, char* reply, size_t replyLen)
{
    switch (call.op) {
    case CallOp::Get:          return execGet_(call.args, reply, replyLen);
    case CallOp::Refresh:      return execRefresh_(call.args, reply, replyLen);
    case CallOp::Add:          return execAdd_(call.args, reply, replyLen);
    case CallOp::Remove:       return execRemove_(call.args, reply, replyLen);
    case CallOp::Pin:          return execPin_(call.args, reply, replyLen);
    case CallOp::Move:         return execMove_(call.args, reply, replyLen);
    case CallOp::Collections:  return execCollections_(call.args, reply, replyLen);
    case CallOp::FolderList:   return execFolderList_(reply, replyLen);
    case CallOp::FolderAdd:    return execFolderAdd_(call.args, reply, replyLen);
    case CallOp::FolderRename: return execFolderRename_(call.args, reply, replyLen);
    case CallOp::FolderRemove: return execFolderRemove_(call.args, reply, replyLen);
    case CallOp::FolderSet:    return execFolderSet_(call.args, reply, replyLen);
    case CallOp::WipeCache:
        if (!cache_.wipe()) {
            writeCmdError_(reply, replyLen, "peers.wipe", ErrorCode::IoError);
            return false;
        }
        LOGI("peer cache wiped");
        snprintf(reply, replyLen, "{\"ok\":true}");
        return true;
    }
    writeCmdError_(reply, replyLen, "peers", ErrorCode::UnknownCmd);
    return false;
}

// ---------------------------------------------------------------------------
// Owner-side operations
// ---------------------------------------------------------------------------

bool DevicesModule::execGet_(const char* args, char* reply, size_t replyLen)
{
    JsonObjectConst a;
    if (!parseArgs_(args, a)) {
        writeCmdError_(reply, replyLen, "peers.get", ErrorCode::MissingArgs);
        return false;
    }
    char cs[Limits::Peers::CallsignBuf];
    if (!argCallsign_(a, cs, sizeof(cs))) {
        writeCmdError_(reply, replyLen, "peers.get", ErrorCode::InvalidCallsign);
        return false;
    }
    const DeviceRecord* rec = registry_.get(cs);
    if (!rec) {
        writeCmdError_(reply, replyLen, "peers.get", ErrorCode::UnknownPeer);
        return false;
    }
    if (!buildDeviceReply(*rec, reply, replyLen)) {
        writeCmdError_(reply, replyLen, "peers.get", ErrorCode::ReplyOverflow);
        return false;
    }
    return true;
}

bool DevicesModule::execRefresh_(const char* args, char* reply, size_t replyLen)
{
    bool force = false;
    JsonObjectConst a;
    if (parseArgs_(args, a)) {
        JsonVariantConst f = a["force"];
        if (!f.isNull() && !f.is<bool>()) {
            writeCmdError_(reply, replyLen, "peers.refresh", ErrorCode::InvalidBool);
            return false;
        }
        force = f | false;
    }

    const RefreshOutcome out = scheduler_.refreshAll(force, millis());
    snprintf(reply, replyLen, "{\"ok\":true,\"result\":\"%s\",\"sweep\":%lu}",
             (out == RefreshOutcome::Refreshed) ? "refreshed" : "cached",
             (unsigned long)scheduler_.sweepId());
    return true;
}

bool DevicesModule::execAdd_(const char* args, char* reply, size_t replyLen)
{
    JsonObjectConst a;
    if (!parseArgs_(args, a)) {
        writeCmdError_(reply, replyLen, "peers.add", ErrorCode::MissingArgs);
        return false;
    }
    char cs[Limits::Peers::CallsignBuf];
    if (!argCallsign_(a, cs, sizeof(cs)) || strcmp(cs, registry_.localCallsign()) == 0) {
        writeCmdError_(reply, replyLen, "peers.add", ErrorCode::InvalidCallsign);
        return false;
    }
    const char* url = a["url"] | "";
    const char* name = a["name"] | "";
    if (url[0] != '\0' && strncmp(url, "http://", 7) != 0 && strncmp(url, "https://", 8) != 0) {
        writeCmdError_(reply, replyLen, "peers.add", ErrorCode::InvalidLabel);
        return false;
    }

    const UpsertResult res = aggregator_.addManual(cs, url, name, millis());
    if (res == UpsertResult::Rejected) {
        writeCmdError_(reply, replyLen, "peers.add",
                       registry_.get(cs) ? ErrorCode::Failed : ErrorCode::RegistryFull);
        return false;
    }
    persist_(cs);
    const bool queued = dispatchCheck_(cs, 0);
    LOGI("added %s (%s)", cs, (res == UpsertResult::Created) ? "new" : "merged");

    snprintf(reply, replyLen, "{\"ok\":true,\"callsign\":\"%s\",\"created\":%s,\"checking\":%s}",
             cs,
             (res == UpsertResult::Created) ? "true" : "false",
             queued ? "true" : "false");
    return true;
}

bool DevicesModule::execRemove_(const char* args, char* reply, size_t replyLen)
{
    JsonObjectConst a;
    char cs[Limits::Peers::CallsignBuf];
    if (!parseArgs_(args, a) || !argCallsign_(a, cs, sizeof(cs))) {
        writeCmdError_(reply, replyLen, "peers.remove", ErrorCode::InvalidCallsign);
        return false;
    }
    if (!registry_.remove(cs)) {
        writeCmdError_(reply, replyLen, "peers.remove", ErrorCode::UnknownPeer);
        return false;
    }
    LOGI("removed %s", cs);

    if (eventBus) {
        PeerRemovedPayload p{};
        copyBounded(p.callsign, sizeof(p.callsign), cs);
        eventBus->post(EventId::PeerRemoved, &p, sizeof(p));
    }
    snprintf(reply, replyLen, "{\"ok\":true}");
    return true;
}

bool DevicesModule::execPin_(const char* args, char* reply, size_t replyLen)
{
    JsonObjectConst a;
    char cs[Limits::Peers::CallsignBuf];
    if (!parseArgs_(args, a) || !argCallsign_(a, cs, sizeof(cs))) {
        writeCmdError_(reply, replyLen, "peers.pin", ErrorCode::InvalidCallsign);
        return false;
    }
    JsonVariantConst pinned = a["pinned"];
    if (!pinned.is<bool>()) {
        writeCmdError_(reply, replyLen, "peers.pin", ErrorCode::InvalidBool);
        return false;
    }
    if (!registry_.get(cs)) {
        writeCmdError_(reply, replyLen, "peers.pin", ErrorCode::UnknownPeer);
        return false;
    }

    DevicePatch patch;
    patch.hasPinned = true;
    patch.pinned = pinned.as<bool>();
    registry_.upsert(cs, patch, millis());
    persist_(cs);
    snprintf(reply, replyLen, "{\"ok\":true,\"pinned\":%s}", patch.pinned ? "true" : "false");
    return true;
}

bool DevicesModule::execMove_(const char* args, char* reply, size_t replyLen)
{
    JsonObjectConst a;
    char cs[Limits::Peers::CallsignBuf];
    if (!parseArgs_(args, a) || !argCallsign_(a, cs, sizeof(cs))) {
        writeCmdError_(reply, replyLen, "peers.move", ErrorCode::InvalidCallsign);
        return false;
    }
    JsonVariantConst folder = a["folder"];
    if (!folder.is<int>() || folder.as<int>() < 0 || folder.as<int>() > 255 ||
        !folders_.exists((uint8_t)folder.as<int>())) {
        writeCmdError_(reply, replyLen, "peers.move", ErrorCode::UnknownFolder);
        return false;
    }
    if (!registry_.get(cs)) {
        writeCmdError_(reply, replyLen, "peers.move", ErrorCode::UnknownPeer);
        return false;
    }

    DevicePatch patch;
    patch.hasFolder = true;
    patch.folderId = (uint8_t)folder.as<int>();
    registry_.upsert(cs, patch, millis());
    persist_(cs);
    snprintf(reply, replyLen, "{\"ok\":true,\"folder\":%u}", (unsigned)patch.folderId);
    return true;
}

bool DevicesModule::execCollections_(const char* args, char* reply, size_t replyLen)
{
    JsonObjectConst a;
    char cs[Limits::Peers::CallsignBuf];
    if (!parseArgs_(args, a) || !argCallsign_(a, cs, sizeof(cs))) {
        writeCmdError_(reply, replyLen, "peers.collections", ErrorCode::InvalidCallsign);
        return false;
    }
    const bool refresh = a["refresh"] | false;

    const DeviceRecord* rec = registry_.get(cs);
    if (!rec) {
        writeCmdError_(reply, replyLen, "peers.collections", ErrorCode::UnknownPeer);
        return false;
    }

    static CollectionDescriptor items[Limits::Peers::MaxCollections];
    const uint8_t n = cache_.loadCollections(cs, items, Limits::Peers::MaxCollections);

    bool fetching = false;
    if (refresh || rec->lastFetchedMs == 0) {
        requestCollections_(cs);
        fetching = probeSvc != nullptr;
    }

    static StaticJsonDocument<Limits::PeerJson::CollectionsReplyDoc> doc;
    doc.clear();
    doc["ok"] = true;
    doc["callsign"] = rec->callsign;
    doc["fetching"] = fetching;
    doc["last_fetched_ms"] = rec->lastFetchedMs;
    JsonArray arr = doc.createNestedArray("collections");
    for (uint8_t i = 0; i < n; ++i) {
        JsonObject o = arr.createNestedObject();
        o["name"] = items[i].name;
        o["type"] = items[i].kind;
        o["description"] = items[i].description;
        if (items[i].fileCount >= 0) o["file_count"] = items[i].fileCount;
        o["public"] = items[i].isPublic;
    }
    return writeDoc_(doc, reply, replyLen, "peers.collections");
}

bool DevicesModule::execFolderList_(char* reply, size_t replyLen)
{
    uint8_t members[Limits::Peers::MaxFolders] = {0};
    for (uint8_t i = 0; i < registry_.count(); ++i) {
        const DeviceRecord* rec = registry_.at(i);
        if (!rec) continue;
        for (uint8_t f = 0; f < folders_.count(); ++f) {
            if (folders_.at(f)->id == rec->folderId) {
                ++members[f];
                break;
            }
        }
    }

    static StaticJsonDocument<Limits::PeerJson::FolderListDoc> doc;
    doc.clear();
    doc["ok"] = true;
    JsonArray arr = doc.createNestedArray("folders");
    for (uint8_t f = 0; f < folders_.count(); ++f) {
        const Folder* folder = folders_.at(f);
        JsonObject o = arr.createNestedObject();
        o["id"] = folder->id;
        o["name"] = folder->name;
        o["rank"] = folder->rank;
        o["expanded"] = folder->expanded;
        o["chat"] = folder->chatEnabled;
        o["devices"] = members[f];
    }
    return writeDoc_(doc, reply, replyLen, "folders.list");
}

bool DevicesModule::saveFolders_()
{
    char json[Limits::PeerJson::FoldersText];
    if (!folders_.toJson(json, sizeof(json))) return false;
    return cache_.saveFolders(json);
}

bool DevicesModule::execFolderAdd_(const char* args, char* reply, size_t replyLen)
{
    JsonObjectConst a;
    if (!parseArgs_(args, a)) {
        writeCmdError_(reply, replyLen, "folders.add", ErrorCode::MissingArgs);
        return false;
    }
    uint8_t id = 0;
    const FolderResult r = folders_.add(a["name"] | "", id);
    if (r != FolderResult::Ok) {
        writeCmdError_(reply, replyLen, "folders.add", folderError_(r));
        return false;
    }
    if (!saveFolders_()) LOGW("folders not persisted");
    snprintf(reply, replyLen, "{\"ok\":true,\"id\":%u}", (unsigned)id);
    return true;
}

bool DevicesModule::execFolderRename_(const char* args, char* reply, size_t replyLen)
{
    JsonObjectConst a;
    uint8_t id = 0;
    if (!parseArgs_(args, a) || !argFolderId_(a, id)) {
        writeCmdError_(reply, replyLen, "folders.rename", ErrorCode::MissingArgs);
        return false;
    }
    const FolderResult r = folders_.rename(id, a["name"] | "");
    if (r != FolderResult::Ok) {
        writeCmdError_(reply, replyLen, "folders.rename", folderError_(r));
        return false;
    }
    if (!saveFolders_()) LOGW("folders not persisted");
    snapshotPending_ = true;
    snprintf(reply, replyLen, "{\"ok\":true}");
    return true;
}

bool DevicesModule::execFolderRemove_(const char* args, char* reply, size_t replyLen)
{
    JsonObjectConst a;
    uint8_t id = 0;
    if (!parseArgs_(args, a) || !argFolderId_(a, id)) {
        writeCmdError_(reply, replyLen, "folders.remove", ErrorCode::MissingArgs);
        return false;
    }
    const FolderResult r = folders_.remove(id);
    if (r != FolderResult::Ok) {
        writeCmdError_(reply, replyLen, "folders.remove", folderError_(r));
        return false;
    }

    const uint8_t moved = registry_.reassignFolder(id, PeerDefaults::DefaultFolderId);
    if (moved) persistAll_();
    if (!saveFolders_()) LOGW("folders not persisted");
    snprintf(reply, replyLen, "{\"ok\":true,\"moved\":%u}", (unsigned)moved);
    return true;
}

bool DevicesModule::execFolderSet_(const char* args, char* reply, size_t replyLen)
{
    JsonObjectConst a;
    uint8_t id = 0;
    if (!parseArgs_(args, a) || !argFolderId_(a, id)) {
        writeCmdError_(reply, replyLen, "folders.set", ErrorCode::MissingArgs);
        return false;
    }

    JsonVariantConst ex = a["expanded"];
    JsonVariantConst chat = a["chat"];
    if ((!ex.isNull() && !ex.is<bool>()) || (!chat.isNull() && !chat.is<bool>())) {
        writeCmdError_(reply, replyLen, "folders.set", ErrorCode::InvalidBool);
        return false;
    }
    bool expanded = ex | false;
    bool chatEnabled = chat | false;
    const FolderResult r = folders_.setFlags(id,
                                             ex.isNull() ? nullptr : &expanded,
                                             chat.isNull() ? nullptr : &chatEnabled);
    if (r != FolderResult::Ok) {
        writeCmdError_(reply, replyLen, "folders.set", folderError_(r));
        return false;
    }
    if (!saveFolders_()) LOGW("folders not persisted");
    snprintf(reply, replyLen, "{\"ok\":true}");
    return true;
}

// ---------------------------------------------------------------------------
// Command handlers
// ---------------------------------------------------------------------------

bool DevicesModule::cmdList(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    (void)req;
    DevicesModule* self = static_cast<DevicesModule*>(userCtx);
    if (!self || !svcSnapshotJson(self, reply, replyLen, nullptr)) {
        writeCmdError_(reply, replyLen, "peers.list", self ? ErrorCode::ReplyOverflow : ErrorCode::NotReady);
        return false;
    }
    return true;
}

bool DevicesModule::cmdGet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    DevicesModule* self = static_cast<DevicesModule*>(userCtx);
    return self && self->callOwner_(CallOp::Get, req.args, reply, replyLen, "peers.get");
}

bool DevicesModule::cmdRefresh(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    DevicesModule* self = static_cast<DevicesModule*>(userCtx);
    return self && self->callOwner_(CallOp::Refresh, req.args, reply, replyLen, "peers.refresh");
}

bool DevicesModule::cmdCheck(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    DevicesModule* self = static_cast<DevicesModule*>(userCtx);
    if (!self) return false;

    StaticJsonDocument<Limits::PeerJson::CallArgsDoc> doc;
    char cs[Limits::Peers::CallsignBuf];
    const char* raw = nullptr;
    if (req.args) {
        const DeserializationError err = deserializeJson(doc, req.args);
        if (!err) raw = doc["callsign"].as<const char*>();
    }
    if (!raw || !normalizeCallsign(raw, cs, sizeof(cs))) {
        writeCmdError_(reply, replyLen, "peers.check", ErrorCode::InvalidCallsign);
        return false;
    }
    if (!self->postSimple_(InboxKind::Check, false, 0, cs)) {
        writeCmdError_(reply, replyLen, "peers.check", ErrorCode::NotReady);
        return false;
    }
    snprintf(reply, replyLen, "{\"ok\":true,\"callsign\":\"%s\",\"queued\":true}", cs);
    return true;
}

bool DevicesModule::cmdAdd(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    DevicesModule* self = static_cast<DevicesModule*>(userCtx);
    return self && self->callOwner_(CallOp::Add, req.args, reply, replyLen, "peers.add");
}

bool DevicesModule::cmdRemove(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    DevicesModule* self = static_cast<DevicesModule*>(userCtx);
    return self && self->callOwner_(CallOp::Remove, req.args, reply, replyLen, "peers.remove");
}

bool DevicesModule::cmdPin(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    DevicesModule* self = static_cast<DevicesModule*>(userCtx);
    return self && self->callOwner_(CallOp::Pin, req.args, reply, replyLen, "peers.pin");
}

bool DevicesModule::cmdMove(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    DevicesModule* self = static_cast<DevicesModule*>(userCtx);
    return self && self->callOwner_(CallOp::Move, req.args, reply, replyLen, "peers.move");
}

bool DevicesModule::cmdCollections(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    DevicesModule* self = static_cast<DevicesModule*>(userCtx);
    return self && self->callOwner_(CallOp::Collections, req.args, reply, replyLen, "peers.collections");
}

bool DevicesModule::cmdFolderList(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    (void)req;
    DevicesModule* self = static_cast<DevicesModule*>(userCtx);
    return self && self->callOwner_(CallOp::FolderList, nullptr, reply, replyLen, "folders.list");
}

bool DevicesModule::cmdFolderAdd(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    DevicesModule* self = static_cast<DevicesModule*>(userCtx);
    return self && self->callOwner_(CallOp::FolderAdd, req.args, reply, replyLen, "folders.add");
}

bool DevicesModule::cmdFolderRename(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    DevicesModule* self = static_cast<DevicesModule*>(userCtx);
    return self && self->callOwner_(CallOp::FolderRename, req.args, reply, replyLen, "folders.rename");
}

bool DevicesModule::cmdFolderRemove(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    DevicesModule* self = static_cast<DevicesModule*>(userCtx);
    return self && self->callOwner_(CallOp::FolderRemove, req.args, reply, replyLen, "folders.remove");
}

bool DevicesModule::cmdFolderSet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    DevicesModule* self = static_cast<DevicesModule*>(userCtx);
    return self && self->callOwner_(CallOp::FolderSet, req.args, reply, replyLen, "folders.set");
}
