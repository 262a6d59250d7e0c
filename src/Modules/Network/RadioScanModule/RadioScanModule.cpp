/**
 * @file RadioScanModule.cpp
 * @brief Implementation file.
 */
#include "RadioScanModule.h"
#include "Domain/PeerDefaults.h"
#include "Modules/DevicesModule/StatusParsers.h"
#define LOG_TAG "RadioScn"
#include "Core/ModuleLog.h"

#include <NimBLEDevice.h>
#include <string.h>

bool RadioScanModule::ensureStack_()
{
    if (stackReady_) return true;
    NimBLEDevice::init("");
    NimBLEScan* scan = NimBLEDevice::getScan();
    if (!scan) {
        LOGE("scanner unavailable");
        return false;
    }
    scan->setActiveScan(true);
    scan->setInterval(45);
    scan->setWindow(15);
    stackReady_ = true;
    LOGI("radio stack ready");
    return true;
}

void RadioScanModule::keep_(const RadioSighting& s, uint8_t& count)
{
    for (uint8_t i = 0; i < count; ++i) {
        if (strcmp(seen_[i].key, s.key) != 0) continue;
        if (s.rssi > seen_[i].rssi) seen_[i].rssi = s.rssi;
        if (s.enhanced) seen_[i].enhanced = true;
        if (seen_[i].nickname[0] == '\0') memcpy(seen_[i].nickname, s.nickname, sizeof(s.nickname));
        return;
    }
    if (count >= Limits::Peers::MaxScanPeers) return;
    seen_[count++] = s;
}

void RadioScanModule::runScan_()
{
    NimBLEScan* scan = NimBLEDevice::getScan();
    scan->clearResults();

    const uint32_t seconds = PeerDefaults::RadioScanWindowMs / 1000;
    NimBLEScanResults results = scan->start(seconds, false);

    const NimBLEUUID serviceUuid(PeerDefaults::RadioServiceUuid);
    uint8_t count = 0;
    const int total = results.getCount();
    for (int i = 0; i < total; ++i) {
        NimBLEAdvertisedDevice dev = results.getDevice(i);
        const std::string data = dev.getServiceData(serviceUuid);
        if (data.empty() && !dev.isAdvertisingService(serviceUuid)) continue;

        // Native address order is little-endian.
        const uint8_t* native = dev.getAddress().getNative();
        uint8_t addr[6];
        for (uint8_t b = 0; b < 6; ++b) addr[b] = native[5 - b];

        RadioSighting s;
        bool named = false;
        if (!decodeRadioAdvert((const uint8_t*)data.data(), data.size(), addr,
                               s.key, sizeof(s.key), named)) {
            continue;
        }
        s.rssi = (int16_t)dev.getRSSI();
        s.enhanced = named;
        if (dev.haveName()) {
            strncpy(s.nickname, dev.getName().c_str(), sizeof(s.nickname) - 1);
            s.nickname[sizeof(s.nickname) - 1] = '\0';
        }
        keep_(s, count);
    }
    scan->clearResults();

    LOGD("scan window done: %d adverts, %u peers", total, (unsigned)count);
    if (!inbox || !inbox->radioScan(inbox->ctx, seen_, count)) {
        LOGW("radio scan result lost");
    }
}

void RadioScanModule::loop()
{
    if (cfgData.enabled) {
        clearPending_ = true;
    } else if (clearPending_) {
        // Switched off: report an empty cycle so earlier sightings are dropped.
        if (!inbox || inbox->radioScan(inbox->ctx, nullptr, 0)) clearPending_ = false;
        else LOGW("radio clear not delivered");
    }

    // Woken by requestScan; the timeout only re-checks the enable switch.
    if (ulTaskNotifyTake(pdTRUE, pdMS_TO_TICKS(1000)) == 0) return;
    if (!cfgData.enabled) return;
    if (!ensureStack_()) return;

    scanning_ = true;
    runScan_();
    scanning_ = false;
}

bool RadioScanModule::svcRequestScan(void* ctx)
{
    RadioScanModule* self = static_cast<RadioScanModule*>(ctx);
    if (!self || !self->cfgData.enabled || self->scanning_) return false;
    TaskHandle_t task = self->getTaskHandle();
    if (!task) return false;
    xTaskNotifyGive(task);
    return true;
}

bool RadioScanModule::svcIsAvailable(void* ctx)
{
    RadioScanModule* self = static_cast<RadioScanModule*>(ctx);
    return self && self->cfgData.enabled && self->getTaskHandle() != nullptr;
}

void RadioScanModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(enabledVar);

    inbox = services.get<PeerInboxService>("peerinbox");
    if (!inbox) LOGE("peerinbox service missing");

    static RadioService svc{
        RadioScanModule::svcRequestScan,
        RadioScanModule::svcIsAvailable,
        this
    };
    if (!services.add("radio", &svc)) LOGE("radio service not registered");
    LOGI("RadioService registered");
}
