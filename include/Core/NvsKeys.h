#pragma once
/**
 * @file NvsKeys.h
 * @brief Centralized NVS key constants used by ConfigStore-registered variables.
 */

namespace NvsKeys {

/** @brief Preferences namespace opened at boot (`main.cpp`). */
constexpr char StorageNamespace[] = "peerlink"; // Preferences namespace name used at boot to open the firmware NVS partition.
/** @brief Preferences namespace holding the peer status cache (`PrefsCacheBackend`). */
constexpr char PeerCacheNamespace[] = "peercache"; // Separate namespace so a cache wipe never touches config keys.

namespace Log {
constexpr char Level[] = "log_lvl"; // Serial log sink minimum level (0 debug .. 3 error).
}  // namespace Log

namespace Console {
constexpr char Events[] = "con_evt"; // Console switch for unsolicited event lines.
}  // namespace Console

namespace Wifi {
constexpr char Enabled[] = "wifi_en"; // WiFi module persisted key for field `wifi_en`.
constexpr char Ssid[] = "wifi_ssid"; // WiFi module persisted key for field `wifi_ssid`.
constexpr char Pass[] = "wifi_pass"; // WiFi module persisted key for field `wifi_pass`.
constexpr char Mdns[] = "wifi_mdns"; // WiFi module persisted key for field `wifi_mdns`.
}  // namespace Wifi

namespace Peers {
constexpr char Callsign[] = "pr_cs"; // Devices module persisted key for the local callsign.
constexpr char LocalProbe[] = "pr_lprobe"; // Devices module persisted key for the direct probe switch.
constexpr char ConnMode[] = "pr_cmode"; // Devices module persisted key for the connectivity mode.
constexpr char AutoRefreshMs[] = "pr_auto"; // Devices module persisted key for the periodic refresh interval.
constexpr char IdleHours[] = "pr_idle"; // Devices module persisted key for the idle cleanup threshold.
}  // namespace Peers

namespace Relay {
constexpr char Enabled[] = "rl_en"; // Relay module persisted key for field `rl_en`.
constexpr char Url[] = "rl_url"; // Relay module persisted key for field `rl_url`.
}  // namespace Relay

namespace Radio {
constexpr char Enabled[] = "rd_en"; // Radio scan module persisted key for field `rd_en`.
}  // namespace Radio

namespace Lan {
constexpr char Sweep[] = "lan_sweep"; // LAN discovery module persisted key for the /24 port sweep switch.
}  // namespace Lan

namespace Wired {
constexpr char Enabled[] = "wd_en"; // Wired link module persisted key for field `wd_en`.
constexpr char Baud[] = "wd_baud"; // Wired link module persisted key for field `wd_baud`.
constexpr char DetectPin[] = "wd_dpin"; // Wired link module persisted key for field `wd_dpin`.
}  // namespace Wired

}  // namespace NvsKeys
