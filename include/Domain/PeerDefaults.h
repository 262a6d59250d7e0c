#pragma once
/**
 * @file PeerDefaults.h
 * @brief Protocol constants and default timings for peer tracking.
 */

#include <stdint.h>

namespace PeerDefaults {

constexpr uint32_t ProbeTimeoutMs = 5000;
constexpr uint32_t RelayClientsTimeoutMs = 10000;
constexpr uint32_t CollectionsTimeoutMs = 10000;
constexpr uint32_t RefreshCooldownMs = 60000;
constexpr uint32_t LocalFullScanIntervalMs = 300000;
constexpr uint32_t LocalHostTimeoutMs = 500;
constexpr uint32_t LanConnectGateMs = 150;
constexpr uint32_t RadioScanWindowMs = 10000;
constexpr uint32_t WiredBaud = 115200;
constexpr uint32_t WiredSilenceMs = 30000;
constexpr uint32_t WifiConnectTimeoutMs = 15000;
constexpr uint32_t WifiRetryBaseMs = 5000;
constexpr uint32_t WifiRetryMaxMs = 60000;
constexpr uint32_t RelayPingPeriodMs = 60000;
constexpr uint32_t RelayReconnectMs = 5000;
constexpr uint32_t AutoRefreshMs = 300000;
constexpr uint32_t SweepTimeoutMs = 240000;
constexpr uint16_t IdleCleanupHours = 24;

constexpr uint16_t PrimaryPorts[] = {3456, 8080};

constexpr int16_t RssiVeryClose = -50;
constexpr int16_t RssiNearby = -70;
constexpr int16_t RssiInRange = -85;

constexpr char RadioServiceUuid[] = "0000fff0-0000-1000-8000-00805f9b34fb";
constexpr uint8_t RadioMarker = '>';

constexpr char StatusPath[] = "/api/status";
constexpr char DevicesPath[] = "/api/devices";
constexpr char FilesPath[] = "/files";
constexpr char DevicePathPrefix[] = "/device/";
constexpr char RelayServiceName[] = "Geogram Station Server";
constexpr char RelayCallsignPrefix[] = "X3";
constexpr char UnknownCallsign[] = "Unknown";
constexpr char RadioKeyPrefix[] = "BLE-";

constexpr uint8_t DefaultFolderId = 0;
constexpr char DefaultFolderName[] = "Discovered";

constexpr uint8_t ConnModeAll = 0;
constexpr uint8_t ConnModeRestricted = 1;
constexpr uint8_t ConnModeInternetOnly = 2;

}  // namespace PeerDefaults
