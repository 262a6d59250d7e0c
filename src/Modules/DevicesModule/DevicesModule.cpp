/**
 * @file DevicesModule.cpp
 * @brief Owner task: inbox draining, sweep driving, snapshot publication and services.
 */

#include "DevicesModule.h"
#include "Core/ErrorCodes.h"
#include "Core/EventBus/EventPayloads.h"
#include "Modules/DevicesModule/NetAddress.h"
#include "Modules/DevicesModule/PeerSnapshot.h"
#define LOG_TAG "DevicesM"
#include "Core/ModuleLog.h"

#include <Arduino.h>
#include <string.h>

/// Peers learned without a fresh collection listing get one when they come online.
static constexpr uint32_t kCollectionsStaleMs = 600000UL;

DevicesModule::DevicesModule()
    : cache_(cacheBackend_),
      aggregator_(registry_),
      scheduler_(*this)
{
}

// ---------------------------------------------------------------------------
// Inbox
// ---------------------------------------------------------------------------

bool DevicesModule::post_(InboxMsg& m)
{
    if (!inbox_) return false;
    if (xQueueSend(inbox_, &m, pdMS_TO_TICKS(Limits::Tasks::InboxPostTimeoutMs)) != pdTRUE) {
        LOGW("inbox full, kind=%u dropped", (unsigned)m.kind);
        return false;
    }
    return true;
}

bool DevicesModule::postSimple_(InboxKind kind, bool flag, uint32_t u32, const char* callsign)
{
    InboxMsg m{};
    m.kind = kind;
    m.flag = flag;
    m.u32 = u32;
    if (callsign && !copyBounded(m.callsign, sizeof(m.callsign), callsign)) return false;
    return post_(m);
}

void DevicesModule::handle_(const InboxMsg& m)
{
    const uint32_t now = millis();

    switch (m.kind) {
    case InboxKind::Refresh:
        scheduler_.refreshAll(m.flag, now);
        break;

    case InboxKind::Check:
        if (!dispatchCheck_(m.callsign, 0)) LOGW("check %s not dispatched", m.callsign);
        break;

    case InboxKind::Sync: {
        const DeviceRecord* rec = registry_.get(m.callsign);
        if (!rec || rec->endpoint[0] == '\0') break;
        const bool stale = rec->lastFetchedMs == 0 || rec->lastFetchedMs > now ||
                           (uint32_t)(now - rec->lastFetchedMs) >= kCollectionsStaleMs;
        if (stale) requestCollections_(rec->callsign);
        break;
    }

    case InboxKind::RadioBegin:
        radioStageCount_ = 0;
        radioStageOpen_ = true;
        break;
    case InboxKind::RadioItem:
        if (radioStageOpen_ && radioStageCount_ < Limits::Peers::MaxScanPeers) {
            memcpy(&radioStage_[radioStageCount_++], m.body, sizeof(RadioSighting));
        }
        break;
    case InboxKind::RadioEnd:
        if (radioStageOpen_ && radioStageCount_ == m.u32) {
            aggregator_.applyRadioScan(radioStage_, radioStageCount_, now);
            snapshotPending_ = true;
        } else {
            LOGW("radio batch incomplete (%u/%lu)", (unsigned)radioStageCount_, (unsigned long)m.u32);
        }
        radioStageOpen_ = false;
        break;

    case InboxKind::LocalBegin:
        localStageCount_ = 0;
        localStageOpen_ = true;
        break;
    case InboxKind::LocalItem:
        if (localStageOpen_ && localStageCount_ < Limits::Peers::MaxScanPeers) {
            memcpy(&localStage_[localStageCount_++], m.body, sizeof(LocalSighting));
        }
        break;
    case InboxKind::LocalEnd:
        if (localStageOpen_ && localStageCount_ == m.u32) {
            aggregator_.applyLocalDiscovery(localStage_, localStageCount_, now);
            for (uint8_t i = 0; i < localStageCount_; ++i) persist_(localStage_[i].callsign);
            snapshotPending_ = true;
        } else if (m.u32 != 0) {
            LOGW("local batch incomplete (%u/%lu)", (unsigned)localStageCount_, (unsigned long)m.u32);
        }
        localStageOpen_ = false;
        if (m.flag) scheduler_.onLocalDiscoveryDone(now);
        break;

    case InboxKind::ClientsBegin:
        clientStageCount_ = 0;
        clientStageOpen_ = true;
        break;
    case InboxKind::ClientItem:
        if (clientStageOpen_ && clientStageCount_ < Limits::Peers::MaxRelayClients) {
            memcpy(&clientStage_[clientStageCount_++], m.body, sizeof(RelayClient));
        }
        break;
    case InboxKind::ClientsEnd:
        if (m.flag && clientStageOpen_ && clientStageCount_ == m.u32) {
            aggregator_.applyRelayClients(clientStage_, clientStageCount_, now);
            for (uint8_t i = 0; i < clientStageCount_; ++i) persist_(clientStage_[i].callsign);
            snapshotPending_ = true;
        } else if (!m.flag) {
            LOGD("relay client list unavailable");
        }
        clientStageOpen_ = false;
        scheduler_.onRelayClientsDone(now);
        break;

    case InboxKind::CollectionsBegin:
        collectionStageCount_ = 0;
        collectionStageOpen_ = true;
        copyBounded(collectionStageCallsign_, sizeof(collectionStageCallsign_), m.callsign);
        break;
    case InboxKind::CollectionItem:
        if (collectionStageOpen_ && collectionStageCount_ < Limits::Peers::MaxCollections) {
            memcpy(&collectionStage_[collectionStageCount_++], m.body, sizeof(CollectionDescriptor));
        }
        break;
    case InboxKind::CollectionsEnd: {
        const bool complete = collectionStageOpen_ && collectionStageCount_ == m.u32 &&
                              strcmp(collectionStageCallsign_, m.callsign) == 0;
        collectionStageOpen_ = false;
        if (!m.flag || !complete) {
            LOGD("collections for %s unavailable", m.callsign);
            break;
        }
        if (!registry_.get(m.callsign)) break;
        if (!cache_.saveCollections(m.callsign, collectionStage_, collectionStageCount_)) {
            LOGW("collections for %s not cached", m.callsign);
        }
        DevicePatch patch;
        patch.hasFetchedAt = true;
        patch.fetchedAtMs = now;
        registry_.upsert(m.callsign, patch, now);
        persist_(m.callsign);
        LOGI("%s: %u collections", m.callsign, (unsigned)collectionStageCount_);
        break;
    }

    case InboxKind::Wired:
        aggregator_.applyWiredLink(m.flag, m.callsign, now);
        if (m.flag) persist_(m.callsign);
        snapshotPending_ = true;
        break;

    case InboxKind::RelayState: {
        RelayInfo info;
        memcpy(&info, m.body, sizeof(info));
        const bool wasConnected = aggregator_.relay().connected;
        aggregator_.setRelay(info);
        if (info.connected && !wasConnected) {
            LOGI("relay %s connected", info.callsign);
            ensureRelayDevice();
            if (netReady_) scheduler_.refreshAll(false, now);
        } else if (!info.connected && wasConnected) {
            LOGI("relay disconnected");
        }
        snapshotPending_ = true;
        break;
    }

    case InboxKind::CheckResult: {
        CheckBody body;
        memcpy(&body, m.body, sizeof(body));
        aggregator_.applyCheck(body.plan, body.direct, body.proxy, now);
        if (m.u32 == 0) persist_(body.plan.callsign);
        else scheduler_.onCheckDone(m.u32);
        break;
    }

    case InboxKind::NetReady:
        netReady_ = true;
        lastAutoRefreshMs_ = now;
        scheduler_.refreshAll(!firstSweepDone_, now);
        break;

    case InboxKind::NetLost:
        netReady_ = false;
        break;

    case InboxKind::ConfigChanged:
        applyConfig_();
        break;

    case InboxKind::Call: {
        CallBody call;
        memcpy(&call, m.body, sizeof(call));
        executeCall_(m.u32, call);
        break;
    }
    }
}

void DevicesModule::applyConfig_()
{
    if (!registry_.setLocalCallsign(cfgData.callsign)) {
        LOGW("invalid local callsign '%s'", cfgData.callsign);
    }
    aggregator_.setLocalProbeEnabled(cfgData.localProbe);
    scheduler_.setPolicy(cfgData.connMode == PeerDefaults::ConnModeRestricted,
                         cfgData.connMode == PeerDefaults::ConnModeInternetOnly);
    snapshotPending_ = true;
}

// ---------------------------------------------------------------------------
// Sweep driver
// ---------------------------------------------------------------------------

void DevicesModule::ensureRelayDevice()
{
    if (aggregator_.ensureRelayDevice(millis())) persist_(aggregator_.relay().callsign);
}

bool DevicesModule::requestRelayClients()
{
    const RelayInfo& relay = aggregator_.relay();
    if (!relay.connected || !probeSvc || !probeSvc->submitRelayClients) return false;

    char base[Limits::Peers::UrlBuf];
    if (!relayHttpBase(relay.url, base, sizeof(base))) return false;
    return probeSvc->submitRelayClients(probeSvc->ctx, base);
}

bool DevicesModule::requestLocalDiscovery(bool fullScan)
{
    if (!lanSvc) return false;
    if (fullScan) return lanSvc->discover && lanSvc->discover(lanSvc->ctx);

    static LanTarget targets[Limits::Peers::MaxDevices];
    uint8_t n = 0;
    for (uint8_t i = 0; i < registry_.count(); ++i) {
        const DeviceRecord* rec = registry_.at(i);
        if (!rec || !rec->transports.hasLocal() || rec->endpoint[0] == '\0') continue;
        memcpy(targets[n].callsign, rec->callsign, sizeof(targets[n].callsign));
        memcpy(targets[n].endpoint, rec->endpoint, sizeof(targets[n].endpoint));
        ++n;
    }
    if (n == 0) return false;
    return lanSvc->recheck && lanSvc->recheck(lanSvc->ctx, targets, n);
}

bool DevicesModule::requestRadioScan()
{
    if (!radioSvc || !radioSvc->isAvailable || !radioSvc->isAvailable(radioSvc->ctx)) return false;
    // Refused while available: a scan window is already running and will report.
    if (!radioSvc->requestScan(radioSvc->ctx)) LOGD("radio scan already running");
    return true;
}

void DevicesModule::dropRadioSightings()
{
    aggregator_.applyRadioScan(nullptr, 0, millis());
    snapshotPending_ = true;
}

uint16_t DevicesModule::dispatchChecks(uint32_t sweepId)
{
    const DeviceRecord* list[Limits::Peers::MaxDevices];
    const uint8_t n = registry_.all(list, Limits::Peers::MaxDevices);

    uint16_t queued = 0;
    for (uint8_t i = 0; i < n; ++i) {
        if (dispatchCheck_(list[i]->callsign, sweepId)) ++queued;
    }
    if (queued < n) LOGW("sweep %lu: %u/%u checks queued", (unsigned long)sweepId, queued, n);
    return queued;
}

void DevicesModule::publishSnapshot()
{
    rebuildSnapshot_(millis());
}

void DevicesModule::onSweepComplete(uint32_t sweepId, uint16_t checks)
{
    const uint32_t now = millis();
    firstSweepDone_ = true;
    runIdleCleanup_(now);
    persistAll_();

    if (!eventBus) return;
    ScanCompletePayload p{};
    p.sweepId = sweepId;
    p.checks = checks;
    p.onlineCount = registry_.onlineCount();
    if (!eventBus->post(EventId::ScanComplete, &p, sizeof(p))) LOGW("ScanComplete post failed");
}

bool DevicesModule::dispatchCheck_(const char* callsign, uint32_t sweepId)
{
    if (!probeSvc || !probeSvc->submitCheck) return false;
    CheckPlan plan;
    if (!aggregator_.planCheck(callsign, plan)) return false;
    return probeSvc->submitCheck(probeSvc->ctx, sweepId, plan);
}

void DevicesModule::requestCollections_(const char* callsign)
{
    if (!probeSvc || !probeSvc->submitCollections) return;
    const DeviceRecord* rec = registry_.get(callsign);
    if (!rec) return;

    char relayBase[Limits::Peers::UrlBuf] = {0};
    const RelayInfo& relay = aggregator_.relay();
    if (relay.connected && !relayHttpBase(relay.url, relayBase, sizeof(relayBase))) relayBase[0] = '\0';
    if (rec->endpoint[0] == '\0' && relayBase[0] == '\0') return;

    if (!probeSvc->submitCollections(probeSvc->ctx, rec->callsign, rec->endpoint, relayBase)) {
        LOGW("collections fetch for %s not queued", rec->callsign);
    }
}

void DevicesModule::rebuildSnapshot_(uint32_t nowMs)
{
    if (!buildPeersSnapshot(registry_, scratch_, sizeof(scratch_))) {
        LOGW("snapshot does not fit (%u devices)", (unsigned)registry_.count());
        return;
    }

    const size_t len = strlen(scratch_) + 1;
    const uint32_t gen = registry_.generation();
    portENTER_CRITICAL(&snapMux_);
    memcpy(snapshot_, scratch_, len);
    snapshotGen_ = gen;
    portEXIT_CRITICAL(&snapMux_);

    lastSnapshotMs_ = nowMs;
    publishedGen_ = gen;
    snapshotPending_ = false;

    if (!eventBus) return;
    PeerSnapshotPayload p{};
    p.generation = gen;
    p.deviceCount = registry_.count();
    p.onlineCount = registry_.onlineCount();
    eventBus->post(EventId::PeerSnapshot, &p, sizeof(p));
}

void DevicesModule::persist_(const char* callsign)
{
    const DeviceRecord* rec = registry_.get(callsign);
    if (!rec) return;
    if (!cache_.save(*rec)) LOGW("cache save failed for %s", rec->callsign);
}

void DevicesModule::persistAll_()
{
    uint8_t failed = 0;
    for (uint8_t i = 0; i < registry_.count(); ++i) {
        const DeviceRecord* rec = registry_.at(i);
        if (rec && !cache_.save(*rec)) ++failed;
    }
    if (failed) LOGW("cache save failed for %u records", (unsigned)failed);
}

void DevicesModule::runIdleCleanup_(uint32_t nowMs)
{
    if (cfgData.idleHours == 0) return;
    const uint32_t idleMs = cfgData.idleHours * 3600000UL;
    const uint8_t removed = registry_.removeIdle(nowMs, idleMs, PeerDefaults::DefaultFolderId);
    if (removed) LOGI("idle cleanup removed %u devices", (unsigned)removed);
}

void DevicesModule::restoreRecord_(void* ctx, const DeviceRecord& rec)
{
    DevicesModule* self = static_cast<DevicesModule*>(ctx);
    if (!self) return;

    DevicePatch patch;
    patch.npub = rec.npub;
    patch.name = rec.name;
    patch.nickname = rec.nickname;
    patch.platform = rec.platform;
    patch.endpoint = rec.endpoint;
    patch.description = rec.description;
    patch.color = rec.color;
    patch.hasSeenAt = rec.lastSeenMs != 0;
    patch.seenAtMs = rec.lastSeenMs;
    patch.hasCheckedAt = rec.lastCheckedMs != 0;
    patch.checkedAtMs = rec.lastCheckedMs;
    patch.hasFetchedAt = rec.lastFetchedMs != 0;
    patch.fetchedAtMs = rec.lastFetchedMs;
    patch.hasLocation = rec.hasLocation;
    patch.latitude = rec.latitude;
    patch.longitude = rec.longitude;
    patch.hasPinned = true;
    patch.pinned = rec.pinned;
    patch.hasFolder = true;
    patch.folderId = self->folders_.exists(rec.folderId) ? rec.folderId : PeerDefaults::DefaultFolderId;
    patch.hasSource = true;
    patch.source = rec.source;

    if (self->registry_.upsert(rec.callsign, patch, millis()) == UpsertResult::Rejected) {
        LOGW("cached record %s not restored", rec.callsign);
    }
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void DevicesModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfgStore = &cfg;
    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus = ebSvc ? ebSvc->bus : nullptr;

    cfg.registerVar(callsignVar);
    cfg.registerVar(localProbeVar);
    cfg.registerVar(connModeVar);
    cfg.registerVar(autoRefreshVar);
    cfg.registerVar(idleHoursVar);

    inbox_ = xQueueCreate(Limits::Tasks::DevicesInboxLen, sizeof(InboxMsg));
    batchMutex_ = xSemaphoreCreateMutex();
    callMutex_ = xSemaphoreCreateMutex();
    callDone_ = xSemaphoreCreateBinary();
    if (!inbox_ || !batchMutex_ || !callMutex_ || !callDone_) {
        LOGE("inbox allocation failed");
    }

    if (!cacheBackend_.begin()) LOGE("peer cache namespace unavailable");
    registry_.setStatusCache(&cache_);

    AggregatorListener listener;
    listener.onStatusChanged = DevicesModule::onStatusChangedStatic;
    listener.onCameOnline = DevicesModule::onCameOnlineStatic;
    listener.ctx = this;
    aggregator_.setListener(listener);

    static PeersService peersSvc{
        DevicesModule::svcSnapshotJson,
        DevicesModule::svcGeneration,
        DevicesModule::svcRequestRefresh,
        DevicesModule::svcWipeCache,
        DevicesModule::svcLocalCallsign,
        this
    };
    static PeerInboxService inboxSvc{
        DevicesModule::inRadioScan,
        DevicesModule::inLocalDiscovery,
        DevicesModule::inRelayClients,
        DevicesModule::inWiredLink,
        DevicesModule::inRelayState,
        DevicesModule::inCheckResult,
        DevicesModule::inCollections,
        this
    };
    if (!services.add("peers", &peersSvc)) LOGE("peers service not registered");
    if (!services.add("peerinbox", &inboxSvc)) LOGE("peerinbox service not registered");

    if (eventBus) {
        eventBus->subscribe(EventId::WifiNetReady, DevicesModule::onEventStatic, this);
        eventBus->subscribe(EventId::WifiNetLost, DevicesModule::onEventStatic, this);
        eventBus->subscribe(EventId::ConfigChanged, DevicesModule::onEventStatic, this);
        eventBus->subscribe(EventId::PeerCameOnline, DevicesModule::onEventStatic, this);
    }

    const CommandService* cmdSvc = services.get<CommandService>("cmd");
    if (cmdSvc && cmdSvc->registerHandler) {
        struct Entry { const char* name; CommandHandler fn; };
        static const Entry entries[] = {
            {"peers.list", DevicesModule::cmdList},
            {"peers.get", DevicesModule::cmdGet},
            {"peers.refresh", DevicesModule::cmdRefresh},
            {"peers.check", DevicesModule::cmdCheck},
            {"peers.add", DevicesModule::cmdAdd},
            {"peers.remove", DevicesModule::cmdRemove},
            {"peers.pin", DevicesModule::cmdPin},
            {"peers.move", DevicesModule::cmdMove},
            {"peers.collections", DevicesModule::cmdCollections},
            {"folders.list", DevicesModule::cmdFolderList},
            {"folders.add", DevicesModule::cmdFolderAdd},
            {"folders.rename", DevicesModule::cmdFolderRename},
            {"folders.remove", DevicesModule::cmdFolderRemove},
            {"folders.set", DevicesModule::cmdFolderSet},
        };
        for (const Entry& e : entries) {
            if (!cmdSvc->registerHandler(cmdSvc->ctx, e.name, e.fn, this)) {
                LOGW("command %s not registered", e.name);
            }
        }
    } else {
        LOGW("cmd service unavailable");
    }

    LOGI("PeersService registered");
}

void DevicesModule::onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services)
{
    (void)cfg;
    probeSvc = services.get<ProbeService>("probe");
    lanSvc = services.get<LanService>("lan");
    radioSvc = services.get<RadioService>("radio");
    if (!probeSvc) LOGW("probe service unavailable, checks disabled");

    applyConfig_();

    char folders[Limits::PeerJson::FoldersText];
    if (cache_.loadFolders(folders, sizeof(folders)) && !folders_.fromJson(folders)) {
        LOGW("cached folders unreadable, using defaults");
        folders_.reset();
    }

    const uint8_t restored = cache_.loadAll(DevicesModule::restoreRecord_, this);
    LOGI("restored %u cached devices", (unsigned)restored);
    rebuildSnapshot_(millis());
}

void DevicesModule::loop()
{
    if (!inbox_) {
        vTaskDelay(pdMS_TO_TICKS(1000));
        return;
    }

    InboxMsg m;
    if (xQueueReceive(inbox_, &m, pdMS_TO_TICKS(Limits::Tasks::DevicesIdleWaitMs)) == pdTRUE) {
        handle_(m);
        for (uint8_t left = 16; left > 0 && xQueueReceive(inbox_, &m, 0) == pdTRUE; --left) {
            handle_(m);
        }
    }

    const uint32_t now = millis();
    scheduler_.tick(now);

    if (netReady_ && firstSweepDone_ && cfgData.autoRefreshMs > 0 &&
        (uint32_t)(now - lastAutoRefreshMs_) >= cfgData.autoRefreshMs) {
        lastAutoRefreshMs_ = now;
        scheduler_.refreshAll(false, now);
    }

    if ((snapshotPending_ || registry_.generation() != publishedGen_) &&
        (uint32_t)(now - lastSnapshotMs_) >= Limits::Tasks::SnapshotMinIntervalMs) {
        rebuildSnapshot_(now);
    }
}

// ---------------------------------------------------------------------------
// Services
// ---------------------------------------------------------------------------

bool DevicesModule::svcSnapshotJson(void* ctx, char* out, size_t outLen, uint32_t* generation)
{
    DevicesModule* self = static_cast<DevicesModule*>(ctx);
    if (!self || !out || outLen == 0) return false;

    bool ok = false;
    portENTER_CRITICAL(&self->snapMux_);
    const size_t len = strnlen(self->snapshot_, sizeof(self->snapshot_));
    if (len > 0 && len < outLen) {
        memcpy(out, self->snapshot_, len + 1);
        if (generation) *generation = self->snapshotGen_;
        ok = true;
    }
    portEXIT_CRITICAL(&self->snapMux_);
    return ok;
}

uint32_t DevicesModule::svcGeneration(void* ctx)
{
    DevicesModule* self = static_cast<DevicesModule*>(ctx);
    if (!self) return 0;
    portENTER_CRITICAL(&self->snapMux_);
    const uint32_t gen = self->snapshotGen_;
    portEXIT_CRITICAL(&self->snapMux_);
    return gen;
}

bool DevicesModule::svcRequestRefresh(void* ctx, bool force)
{
    DevicesModule* self = static_cast<DevicesModule*>(ctx);
    return self && self->postSimple_(InboxKind::Refresh, force, 0, nullptr);
}

bool DevicesModule::svcWipeCache(void* ctx)
{
    DevicesModule* self = static_cast<DevicesModule*>(ctx);
    if (!self) return false;
    char reply[128];
    return self->callOwner_(CallOp::WipeCache, nullptr, reply, sizeof(reply), "peers.wipe");
}

bool DevicesModule::svcLocalCallsign(void* ctx, char* out, size_t outLen)
{
    DevicesModule* self = static_cast<DevicesModule*>(ctx);
    if (!self || !out || outLen == 0) return false;
    char raw[sizeof(self->cfgData.callsign)];
    memcpy(raw, self->cfgData.callsign, sizeof(raw));
    raw[sizeof(raw) - 1] = '\0';
    return normalizeCallsign(raw, out, outLen);
}

// ---------------------------------------------------------------------------
// Inbox producers (listener and worker tasks)
// ---------------------------------------------------------------------------

bool DevicesModule::inRadioScan(void* ctx, const RadioSighting* seen, uint8_t count)
{
    DevicesModule* self = static_cast<DevicesModule*>(ctx);
    if (!self || !self->batchMutex_) return false;
    if (!seen) count = 0;
    if (count > Limits::Peers::MaxScanPeers) count = Limits::Peers::MaxScanPeers;

    if (xSemaphoreTake(self->batchMutex_, portMAX_DELAY) != pdTRUE) return false;
    bool ok = self->postSimple_(InboxKind::RadioBegin, false, 0, nullptr);
    for (uint8_t i = 0; ok && i < count; ++i) {
        ok = self->postBody_(InboxKind::RadioItem, false, 0, nullptr, seen[i]);
    }
    // Incomplete scans are never applied.
    if (ok) ok = self->postSimple_(InboxKind::RadioEnd, false, count, nullptr);
    xSemaphoreGive(self->batchMutex_);
    return ok;
}

bool DevicesModule::inLocalDiscovery(void* ctx, const LocalSighting* seen, uint8_t count, bool done)
{
    DevicesModule* self = static_cast<DevicesModule*>(ctx);
    if (!self || !self->batchMutex_) return false;
    if (!seen) count = 0;
    if (count > Limits::Peers::MaxScanPeers) count = Limits::Peers::MaxScanPeers;

    if (xSemaphoreTake(self->batchMutex_, portMAX_DELAY) != pdTRUE) return false;
    bool ok = self->postSimple_(InboxKind::LocalBegin, false, 0, nullptr);
    for (uint8_t i = 0; ok && i < count; ++i) {
        ok = self->postBody_(InboxKind::LocalItem, false, 0, nullptr, seen[i]);
    }
    // End marker is always sent; the sweep waits on it.
    const uint32_t expected = ok ? count : 0xFFFFFFFFUL;
    const bool ended = self->postSimple_(InboxKind::LocalEnd, done, expected, nullptr);
    xSemaphoreGive(self->batchMutex_);
    return ok && ended;
}

bool DevicesModule::inRelayClients(void* ctx, const RelayClient* clients, uint8_t count, bool ok)
{
    DevicesModule* self = static_cast<DevicesModule*>(ctx);
    if (!self || !self->batchMutex_) return false;
    if (!clients) count = 0;
    if (count > Limits::Peers::MaxRelayClients) count = Limits::Peers::MaxRelayClients;

    if (xSemaphoreTake(self->batchMutex_, portMAX_DELAY) != pdTRUE) return false;
    bool posted = self->postSimple_(InboxKind::ClientsBegin, false, 0, nullptr);
    for (uint8_t i = 0; ok && posted && i < count; ++i) {
        posted = self->postBody_(InboxKind::ClientItem, false, 0, nullptr, clients[i]);
    }
    const bool ended = self->postSimple_(InboxKind::ClientsEnd, ok && posted, count, nullptr);
    xSemaphoreGive(self->batchMutex_);
    return posted && ended;
}

bool DevicesModule::inWiredLink(void* ctx, bool connected, const char* callsign)
{
    DevicesModule* self = static_cast<DevicesModule*>(ctx);
    if (!self) return false;
    return self->postSimple_(InboxKind::Wired, connected, 0, connected ? callsign : nullptr);
}

bool DevicesModule::inRelayState(void* ctx, const RelayInfo& info)
{
    DevicesModule* self = static_cast<DevicesModule*>(ctx);
    return self && self->postBody_(InboxKind::RelayState, info.connected, 0, nullptr, info);
}

bool DevicesModule::inCheckResult(void* ctx, uint32_t sweepId, const CheckPlan& plan,
                                  const DirectProbeResult& direct, const ProxyProbeResult& proxy)
{
    DevicesModule* self = static_cast<DevicesModule*>(ctx);
    if (!self) return false;
    CheckBody body;
    body.plan = plan;
    body.direct = direct;
    body.proxy = proxy;
    return self->postBody_(InboxKind::CheckResult, false, sweepId, plan.callsign, body);
}

bool DevicesModule::inCollections(void* ctx, const char* callsign, const CollectionDescriptor* items,
                                  uint8_t count, bool ok)
{
    DevicesModule* self = static_cast<DevicesModule*>(ctx);
    if (!self || !self->batchMutex_ || !callsign) return false;
    if (!items) count = 0;
    if (count > Limits::Peers::MaxCollections) count = Limits::Peers::MaxCollections;

    if (xSemaphoreTake(self->batchMutex_, portMAX_DELAY) != pdTRUE) return false;
    bool posted = self->postSimple_(InboxKind::CollectionsBegin, false, 0, callsign);
    for (uint8_t i = 0; ok && posted && i < count; ++i) {
        posted = self->postBody_(InboxKind::CollectionItem, false, 0, callsign, items[i]);
    }
    if (posted) posted = self->postSimple_(InboxKind::CollectionsEnd, ok, count, callsign);
    xSemaphoreGive(self->batchMutex_);
    return posted;
}

// ---------------------------------------------------------------------------
// Listener and events
// ---------------------------------------------------------------------------

void DevicesModule::onStatusChangedStatic(void* ctx, const char* callsign, bool online, uint8_t cause)
{
    DevicesModule* self = static_cast<DevicesModule*>(ctx);
    if (!self) return;
    self->snapshotPending_ = true;
    if (!self->eventBus) return;

    PeerStatusPayload p{};
    copyBounded(p.callsign, sizeof(p.callsign), callsign);
    p.online = online ? 1 : 0;
    p.transport = cause;
    if (!self->eventBus->post(EventId::PeerStatusChanged, &p, sizeof(p))) {
        LOGW("PeerStatusChanged post failed (%s)", callsign);
    }
}

void DevicesModule::onCameOnlineStatic(void* ctx, const char* callsign)
{
    DevicesModule* self = static_cast<DevicesModule*>(ctx);
    if (!self || !self->eventBus) return;

    PeerOnlinePayload p{};
    copyBounded(p.callsign, sizeof(p.callsign), callsign);
    if (!self->eventBus->post(EventId::PeerCameOnline, &p, sizeof(p))) {
        LOGW("PeerCameOnline post failed (%s)", callsign);
    }
}

void DevicesModule::onEventStatic(const Event& e, void* user)
{
    DevicesModule* self = static_cast<DevicesModule*>(user);
    if (self) self->onEvent(e);
}

void DevicesModule::onEvent(const Event& e)
{
    switch (e.id) {
    case EventId::WifiNetReady:
        postSimple_(InboxKind::NetReady, false, 0, nullptr);
        break;
    case EventId::WifiNetLost:
        postSimple_(InboxKind::NetLost, false, 0, nullptr);
        break;
    case EventId::ConfigChanged: {
        const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
        if (!p || e.len < sizeof(ConfigChangedPayload)) break;
        if (strncmp(p->nvsKey, "pr_", 3) != 0) break;
        postSimple_(InboxKind::ConfigChanged, false, 0, nullptr);
        break;
    }
    case EventId::PeerCameOnline: {
        const PeerOnlinePayload* p = static_cast<const PeerOnlinePayload*>(e.payload);
        if (!p || e.len < sizeof(PeerOnlinePayload)) break;
        char cs[Limits::Peers::CallsignBuf];
        if (!normalizeCallsign(p->callsign, cs, sizeof(cs))) break;
        postSimple_(InboxKind::Sync, false, 0, cs);
        break;
    }
    default:
        break;
    }
}
