#pragma once
/**
 * @file DevicesModule.h
 * @brief Owner task of the peer registry: inbox, sweeps, snapshot and peer commands.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/CommandRegistry.h"
#include "Core/Services/Services.h"
#include "Core/EventBus/EventBus.h"
#include "Domain/PeerDefaults.h"

#include "Modules/DevicesModule/DeviceRegistry.h"
#include "Modules/DevicesModule/FolderTable.h"
#include "Modules/DevicesModule/ReachabilityAggregator.h"
#include "Modules/DevicesModule/RefreshScheduler.h"
#include "Modules/DevicesModule/StatusCache.h"
#include "Modules/Stores/PeerCacheStore/PrefsCacheBackend.h"

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/semphr.h>

#include <string.h>

/** @brief Peer tracking configuration values. */
struct DevicesConfig {
    char callsign[Limits::Peers::CallsignBuf] = "";
    bool localProbe = true;
    uint8_t connMode = PeerDefaults::ConnModeAll;
    uint32_t autoRefreshMs = PeerDefaults::AutoRefreshMs;
    uint32_t idleHours = PeerDefaults::IdleCleanupHours;
};

/**
 * @brief Active module owning the device registry.
 *
 * Every registry mutation happens on this task while it drains its inbox.
 * Listeners, probe workers and command handlers only post messages.
 */
class DevicesModule : public Module, private ISweepDriver {
public:
    DevicesModule();

    /** @brief Module id. */
    const char* moduleId() const override { return "devices"; }
    /** @brief Task name. */
    const char* taskName() const override { return "devices"; }

    /**
     * @brief Depends on log hub, event bus and commands.
     *
     * Transport modules depend on `devices` for the inbox; their services are
     * resolved in `onConfigLoaded`.
     */
    uint8_t dependencyCount() const override { return 3; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "cmd";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Restore folders and cached records once config is loaded. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    uint16_t taskStackSize() const override { return Limits::Tasks::DevicesStack; }
    UBaseType_t taskPriority() const override { return 2; }

private:
    enum class InboxKind : uint8_t {
        Refresh,
        Check,
        Sync,
        RadioBegin,
        RadioItem,
        RadioEnd,
        LocalBegin,
        LocalItem,
        LocalEnd,
        ClientsBegin,
        ClientItem,
        ClientsEnd,
        CollectionsBegin,
        CollectionItem,
        CollectionsEnd,
        Wired,
        RelayState,
        CheckResult,
        NetReady,
        NetLost,
        ConfigChanged,
        Call
    };

    enum class CallOp : uint8_t {
        Get,
        Refresh,
        Add,
        Remove,
        Pin,
        Move,
        Collections,
        FolderList,
        FolderAdd,
        FolderRename,
        FolderRemove,
        FolderSet,
        WipeCache
    };

    struct CheckBody {
        CheckPlan plan;
        DirectProbeResult direct;
        ProxyProbeResult proxy;
    };

    struct CallBody {
        CallOp op;
        char args[Limits::PeerJson::CallArgsText];
    };

    static constexpr size_t maxOf_(size_t a, size_t b) { return a > b ? a : b; }
    static constexpr size_t kInboxBody =
        maxOf_(sizeof(CheckBody),
        maxOf_(sizeof(LocalSighting),
        maxOf_(sizeof(RadioSighting),
        maxOf_(sizeof(RelayClient),
        maxOf_(sizeof(RelayInfo),
        maxOf_(sizeof(CollectionDescriptor), sizeof(CallBody)))))));

    /** @brief Fixed-size inbox entry; the body is copied in and out with memcpy. */
    struct InboxMsg {
        InboxKind kind;
        bool flag;
        uint32_t u32;
        char callsign[Limits::Peers::CallsignBuf];
        alignas(8) uint8_t body[kInboxBody];
    };

    DevicesConfig cfgData;
    ConfigStore* cfgStore = nullptr;
    EventBus* eventBus = nullptr;
    const ProbeService* probeSvc = nullptr;
    const LanService* lanSvc = nullptr;
    const RadioService* radioSvc = nullptr;

    PrefsCacheBackend cacheBackend_;
    StatusCache cache_;
    DeviceRegistry registry_;
    FolderTable folders_;
    ReachabilityAggregator aggregator_;
    RefreshScheduler scheduler_;

    QueueHandle_t inbox_ = nullptr;
    SemaphoreHandle_t batchMutex_ = nullptr;
    SemaphoreHandle_t callMutex_ = nullptr;
    SemaphoreHandle_t callDone_ = nullptr;
    volatile uint32_t callSeq_ = 0;
    volatile uint32_t callReplySeq_ = 0;
    volatile bool callReplyOk_ = false;
    char callReply_[Limits::PeerJson::CallReplyText] = {0};

    RadioSighting radioStage_[Limits::Peers::MaxScanPeers];
    uint8_t radioStageCount_ = 0;
    bool radioStageOpen_ = false;
    LocalSighting localStage_[Limits::Peers::MaxScanPeers];
    uint8_t localStageCount_ = 0;
    bool localStageOpen_ = false;
    RelayClient clientStage_[Limits::Peers::MaxRelayClients];
    uint8_t clientStageCount_ = 0;
    bool clientStageOpen_ = false;
    CollectionDescriptor collectionStage_[Limits::Peers::MaxCollections];
    uint8_t collectionStageCount_ = 0;
    bool collectionStageOpen_ = false;
    char collectionStageCallsign_[Limits::Peers::CallsignBuf] = {0};

    char snapshot_[Limits::PeerJson::SnapshotText] = {0};
    char scratch_[Limits::PeerJson::SnapshotText] = {0};
    uint32_t snapshotGen_ = 0;
    portMUX_TYPE snapMux_ = portMUX_INITIALIZER_UNLOCKED;
    bool snapshotPending_ = true;
    uint32_t lastSnapshotMs_ = 0;
    uint32_t publishedGen_ = 0xFFFFFFFFUL;

    bool netReady_ = false;
    bool firstSweepDone_ = false;
    uint32_t lastAutoRefreshMs_ = 0;

    ConfigVariable<char> callsignVar {
        NVS_KEY(NvsKeys::Peers::Callsign),"callsign","peers",
        ConfigType::CharArray,
        cfgData.callsign,
        ConfigPersistence::Persistent,
        sizeof(cfgData.callsign)
    };
    ConfigVariable<bool> localProbeVar {
        NVS_KEY(NvsKeys::Peers::LocalProbe),"local_probe","peers",
        ConfigType::Bool,
        &cfgData.localProbe,
        ConfigPersistence::Persistent,
        0
    };
    ConfigVariable<uint8_t> connModeVar {
        NVS_KEY(NvsKeys::Peers::ConnMode),"conn_mode","peers",
        ConfigType::UInt8,
        &cfgData.connMode,
        ConfigPersistence::Persistent,
        0
    };
    ConfigVariable<uint32_t> autoRefreshVar {
        NVS_KEY(NvsKeys::Peers::AutoRefreshMs),"auto_ms","peers",
        ConfigType::UInt32,
        &cfgData.autoRefreshMs,
        ConfigPersistence::Persistent,
        0
    };
    ConfigVariable<uint32_t> idleHoursVar {
        NVS_KEY(NvsKeys::Peers::IdleHours),"idle_h","peers",
        ConfigType::UInt32,
        &cfgData.idleHours,
        ConfigPersistence::Persistent,
        0
    };

    // inbox
    bool post_(InboxMsg& m);
    bool postSimple_(InboxKind kind, bool flag, uint32_t u32, const char* callsign);
    template <typename T>
    bool postBody_(InboxKind kind, bool flag, uint32_t u32, const char* callsign, const T& body);
    void handle_(const InboxMsg& m);
    void applyConfig_();

    // ISweepDriver
    void ensureRelayDevice() override;
    bool requestRelayClients() override;
    bool requestLocalDiscovery(bool fullScan) override;
    bool requestRadioScan() override;
    void dropRadioSightings() override;
    uint16_t dispatchChecks(uint32_t sweepId) override;
    void publishSnapshot() override;
    void onSweepComplete(uint32_t sweepId, uint16_t checks) override;

    bool dispatchCheck_(const char* callsign, uint32_t sweepId);
    void requestCollections_(const char* callsign);
    void rebuildSnapshot_(uint32_t nowMs);
    void persist_(const char* callsign);
    void persistAll_();
    void runIdleCleanup_(uint32_t nowMs);
    static void restoreRecord_(void* ctx, const DeviceRecord& rec);

    // owner calls (commands)
    bool callOwner_(CallOp op, const char* args, char* reply, size_t replyLen, const char* where);
    void executeCall_(uint32_t seq, const CallBody& call);
    bool execCall_(const CallBody& call, char* reply, size_t replyLen);
    bool execGet_(const char* args, char* reply, size_t replyLen);
    bool execRefresh_(const char* args, char* reply, size_t replyLen);
    bool execAdd_(const char* args, char* reply, size_t replyLen);
    bool execRemove_(const char* args, char* reply, size_t replyLen);
    bool execPin_(const char* args, char* reply, size_t replyLen);
    bool execMove_(const char* args, char* reply, size_t replyLen);
    bool execCollections_(const char* args, char* reply, size_t replyLen);
    bool execFolderList_(char* reply, size_t replyLen);
    bool execFolderAdd_(const char* args, char* reply, size_t replyLen);
    bool execFolderRename_(const char* args, char* reply, size_t replyLen);
    bool execFolderRemove_(const char* args, char* reply, size_t replyLen);
    bool execFolderSet_(const char* args, char* reply, size_t replyLen);
    bool saveFolders_();

    // command handlers (caller task)
    static bool cmdList(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdGet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdRefresh(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdCheck(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdAdd(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdRemove(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdPin(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdMove(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdCollections(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdFolderList(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdFolderAdd(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdFolderRename(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdFolderRemove(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdFolderSet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

    // services
    static bool svcSnapshotJson(void* ctx, char* out, size_t outLen, uint32_t* generation);
    static uint32_t svcGeneration(void* ctx);
    static bool svcRequestRefresh(void* ctx, bool force);
    static bool svcWipeCache(void* ctx);
    static bool svcLocalCallsign(void* ctx, char* out, size_t outLen);

    static bool inRadioScan(void* ctx, const RadioSighting* seen, uint8_t count);
    static bool inLocalDiscovery(void* ctx, const LocalSighting* seen, uint8_t count, bool done);
    static bool inRelayClients(void* ctx, const RelayClient* clients, uint8_t count, bool ok);
    static bool inWiredLink(void* ctx, bool connected, const char* callsign);
    static bool inRelayState(void* ctx, const RelayInfo& info);
    static bool inCheckResult(void* ctx, uint32_t sweepId, const CheckPlan& plan,
                              const DirectProbeResult& direct, const ProxyProbeResult& proxy);
    static bool inCollections(void* ctx, const char* callsign, const CollectionDescriptor* items,
                              uint8_t count, bool ok);

    // aggregator listener
    static void onStatusChangedStatic(void* ctx, const char* callsign, bool online, uint8_t cause);
    static void onCameOnlineStatic(void* ctx, const char* callsign);

    // event bus
    static void onEventStatic(const Event& e, void* user);
    void onEvent(const Event& e);
};

template <typename T>
inline bool DevicesModule::postBody_(InboxKind kind, bool flag, uint32_t u32, const char* callsign, const T& body)
{
    static_assert(sizeof(T) <= kInboxBody, "inbox body too small");
    InboxMsg m{};
    m.kind = kind;
    m.flag = flag;
    m.u32 = u32;
    if (callsign && !copyBounded(m.callsign, sizeof(m.callsign), callsign)) return false;
    memcpy(m.body, &body, sizeof(T));
    return post_(m);
}
