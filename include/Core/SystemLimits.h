#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief JSON capacity for console `cmd` line parsing in `ConsoleModule::processLine_`. */
constexpr size_t JsonCmdBuf = 1024;
/** @brief JSON capacity for `config.set` patches and `ConfigStore::applyJson`. */
constexpr size_t JsonCfgBuf = 1024;
/** @brief JSON capacity for `ConfigStore::applyJson` root document (covers full multi-module patch). */
constexpr size_t JsonConfigApplyBuf = JsonCfgBuf * 4;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 64;
/** @brief Maximum NVS key length (without null terminator) enforced by `ConfigTypes::NVS_KEY`. */
constexpr size_t MaxNvsKeyLen = 15;
/** @brief FreeRTOS log queue length used by `LogHub` (`LogHubModule::init`). */
constexpr uint8_t LogQueueLen = 32;
/** @brief FreeRTOS event queue length used by `EventBus` (`EventBus::QUEUE_LENGTH`). */
constexpr uint8_t EventQueueLen = 16;

/** @brief Peer registry limits and string capacities. */
namespace Peers {

/** @brief Maximum number of device records held by `DeviceRegistry`. */
constexpr uint8_t MaxDevices = 48;
/** @brief Longest accepted callsign; `d_` + callsign must fit an NVS key. */
constexpr size_t CallsignMaxLen = 12;
/** @brief Callsign buffer size (null terminated). */
constexpr size_t CallsignBuf = CallsignMaxLen + 1;
/** @brief Public-key identifier buffer (bech32 `npub1...` is 63 chars). */
constexpr size_t NpubBuf = 64;
/** @brief Human name buffer. */
constexpr size_t NameBuf = 32;
/** @brief Nickname buffer. */
constexpr size_t NicknameBuf = 32;
/** @brief Platform tag buffer. */
constexpr size_t PlatformBuf = 16;
/** @brief Endpoint URL buffer. */
constexpr size_t UrlBuf = 96;
/** @brief Free-text description buffer. */
constexpr size_t DescriptionBuf = 96;
/** @brief Display color buffer (`#rrggbb` or a color name). */
constexpr size_t ColorBuf = 16;
/** @brief Radio proximity label buffer. */
constexpr size_t ProximityBuf = 12;
/** @brief Maximum number of folders in `FolderTable` (default folder included). */
constexpr uint8_t MaxFolders = 8;
/** @brief Folder name buffer. */
constexpr size_t FolderNameBuf = 24;
/** @brief Maximum number of collections cached per peer. */
constexpr uint8_t MaxCollections = 12;
/** @brief Collection name buffer. */
constexpr size_t CollectionNameBuf = 24;
/** @brief Collection description buffer. */
constexpr size_t CollectionDescBuf = 40;
/** @brief Maximum number of peers carried by one radio scan or LAN discovery batch. */
constexpr uint8_t MaxScanPeers = 24;
/** @brief Maximum number of endpoints probed by one LAN discovery pass. */
constexpr uint8_t MaxLanCandidates = 32;
/** @brief Maximum number of clients merged from one relay `/api/devices` reply. */
constexpr uint8_t MaxRelayClients = 32;

}  // namespace Peers

/** @brief JSON capacities used by peer codecs and parsers. */
namespace PeerJson {

/** @brief `/api/status` body parse capacity. */
constexpr size_t StatusDoc = 2048;
/** @brief `/device/{callsign}` reply parse capacity. */
constexpr size_t DeviceReplyDoc = 256;
/** @brief `/api/devices` reply parse capacity. */
constexpr size_t DevicesDoc = 16384;
/** @brief `/files` listing parse capacity. */
constexpr size_t FilesDoc = 8192;
/** @brief Relay socket message parse capacity. */
constexpr size_t RelayMsgDoc = 512;
/** @brief One cached device record (encode and decode). */
constexpr size_t CacheRecordDoc = 1024;
/** @brief Cache index (array of callsigns). */
constexpr size_t CacheIndexDoc = 2560;
/** @brief Folder table document. */
constexpr size_t FolderDoc = 2048;
/** @brief Collections list document. */
constexpr size_t CollectionsDoc = 3072;
/** @brief Serialized cache record text buffer. */
constexpr size_t CacheRecordText = 640;
/** @brief Serialized cache index text buffer. */
constexpr size_t CacheIndexText = 800;
/** @brief Serialized collections text buffer. */
constexpr size_t CollectionsText = 1024;
/** @brief Serialized folders text buffer. */
constexpr size_t FoldersText = 768;
/** @brief Full snapshot JSON buffer published by `DevicesModule`. */
constexpr size_t SnapshotText = 16384;
/** @brief Snapshot document capacity. */
constexpr size_t SnapshotDoc = 32768;
/** @brief Reply buffer for commands executed on the devices owner task. */
constexpr size_t CallReplyText = 2048;
/** @brief Command args copied into the devices inbox. */
constexpr size_t CallArgsText = 256;
/** @brief Command args parse capacity on the owner task. */
constexpr size_t CallArgsDoc = 512;
/** @brief Folder list reply document. */
constexpr size_t FolderListDoc = 1536;
/** @brief Collections reply document. */
constexpr size_t CollectionsReplyDoc = 3072;

}  // namespace PeerJson

/** @brief Task and queue sizing for the peer modules. */
namespace Tasks {

/** @brief `DevicesModule` owner task stack. */
constexpr uint16_t DevicesStack = 8192;
/** @brief Inbound queue length drained by the `DevicesModule` owner task. */
constexpr uint8_t DevicesInboxLen = 24;
/** @brief Number of concurrent probe worker tasks started by `ProbeModule`. */
constexpr uint8_t ProbeWorkers = 3;
/** @brief Probe worker task stack (HTTPClient + JSON parse). */
constexpr uint16_t ProbeWorkerStack = 8192;
/** @brief Probe job queue length. */
constexpr uint8_t ProbeJobQueueLen = Peers::MaxDevices;
/** @brief `LanDiscoveryModule` task stack. */
constexpr uint16_t LanStack = 6144;
/** @brief `RelayModule` task stack. */
constexpr uint16_t RelayStack = 6144;
/** @brief `RadioScanModule` task stack. */
constexpr uint16_t RadioStack = 5120;
/** @brief `WiredLinkModule` task stack. */
constexpr uint16_t WiredStack = 3072;
/** @brief `ConsoleModule` task stack. */
constexpr uint16_t ConsoleStack = 6144;
/** @brief Console input line buffer. */
constexpr size_t ConsoleLineBuf = 512;
/** @brief Command reply buffer used by the console. */
constexpr size_t ConsoleReplyBuf = PeerJson::SnapshotText;
/** @brief Owner task wait per loop when the inbox is empty. */
constexpr uint32_t DevicesIdleWaitMs = 200;
/** @brief Producer wait when the devices inbox is full. */
constexpr uint32_t InboxPostTimeoutMs = 500;
/** @brief Caller wait for a command executed on the owner task. */
constexpr uint32_t OwnerCallTimeoutMs = 3000;
/** @brief Minimum spacing between two snapshot rebuilds. */
constexpr uint32_t SnapshotMinIntervalMs = 250;
/** @brief `RelayClient` reply body buffer read by probe workers. */
constexpr size_t HttpBodyBuf = 16384;
/** @brief Wired-link handshake line buffer. */
constexpr size_t WiredLineBuf = 160;

}  // namespace Tasks

}  // namespace Limits
