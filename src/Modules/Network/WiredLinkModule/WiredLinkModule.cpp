/**
 * @file WiredLinkModule.cpp
 * @brief Implementation file.
 */
#include "WiredLinkModule.h"
#include "Modules/DevicesModule/StatusParsers.h"
#define LOG_TAG "WiredLnk"
#include "Core/ModuleLog.h"

#include <Arduino.h>
#include <string.h>

void WiredLinkModule::start_()
{
    if (cfgData.detectPin >= 0) pinMode((uint8_t)cfgData.detectPin, INPUT_PULLDOWN);
    uart_.setRxBufferSize(256);
    uart_.begin(cfgData.baud);
    started_ = true;
    LOGI("wired link on Serial1 @%lu baud, detect pin %ld",
         (unsigned long)cfgData.baud, (long)cfgData.detectPin);
}

void WiredLinkModule::sendHello_()
{
    char callsign[Limits::Peers::CallsignBuf] = {0};
    if (!peersSvc || !peersSvc->localCallsign ||
        !peersSvc->localCallsign(peersSvc->ctx, callsign, sizeof(callsign))) {
        LOGD("no local callsign, hello not sent");
        return;
    }
    char frame[64];
    if (!buildRelayHello(callsign, frame, sizeof(frame))) return;
    uart_.write(reinterpret_cast<const uint8_t*>(frame), strlen(frame));
    uart_.write('\n');
}

void WiredLinkModule::drop_()
{
    const bool wasIdentified = identified_;
    lineUp_ = false;
    identified_ = false;
    remote_[0] = '\0';
    if (!wasIdentified) return;

    LOGI("wired link down");
    if (!inbox || !inbox->wiredLink(inbox->ctx, false, nullptr)) LOGW("wired drop not delivered");
}

void WiredLinkModule::onLine_(const char* line)
{
    char cs[Limits::Peers::CallsignBuf];
    if (!parseWiredHello(line, cs, sizeof(cs))) {
        LOGD("ignored line (%u bytes)", (unsigned)strlen(line));
        return;
    }

    const bool firstHello = !identified_;
    lineUp_ = true;
    lastHelloMs_ = millis();
    if (identified_ && strcmp(remote_, cs) == 0) return;

    if (identified_) drop_();
    identified_ = true;
    memcpy(remote_, cs, sizeof(remote_));
    LOGI("wired link up: %s", remote_);
    if (!inbox || !inbox->wiredLink(inbox->ctx, true, remote_)) LOGW("wired link not delivered");

    // Without a detect line the remote learns our identity from the reply.
    if (firstHello && cfgData.detectPin < 0) sendHello_();
}

void WiredLinkModule::readSerial_()
{
    while (uart_.available() > 0) {
        const int c = uart_.read();
        if (c < 0) break;
        if (c == '\r') continue;
        if (c == '\n') {
            line_[lineLen_] = '\0';
            if (!lineOverflow_ && lineLen_ > 0) onLine_(line_);
            lineLen_ = 0;
            lineOverflow_ = false;
            continue;
        }
        if (lineLen_ + 1 >= sizeof(line_)) {
            lineOverflow_ = true;
            continue;
        }
        line_[lineLen_++] = (char)c;
    }
}

void WiredLinkModule::loop()
{
    if (!cfgData.enabled) {
        if (lineUp_ || identified_) drop_();
        vTaskDelay(pdMS_TO_TICKS(500));
        return;
    }
    if (!started_) start_();

    if (cfgData.detectPin >= 0) {
        const bool up = digitalRead((uint8_t)cfgData.detectPin) == HIGH;
        if (up && !lineUp_) {
            lineUp_ = true;
            LOGI("wired line detected, waiting for hello");
            sendHello_();
        } else if (!up && lineUp_) {
            drop_();
        }
    }

    readSerial_();

    if (cfgData.detectPin < 0 && identified_ &&
        (uint32_t)(millis() - lastHelloMs_) > PeerDefaults::WiredSilenceMs) {
        LOGW("no hello from %s for %lu ms", remote_, (unsigned long)PeerDefaults::WiredSilenceMs);
        drop_();
    }

    vTaskDelay(pdMS_TO_TICKS(20));
}

void WiredLinkModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(enabledVar);
    cfg.registerVar(baudVar);
    cfg.registerVar(detectPinVar);

    peersSvc = services.get<PeersService>("peers");
    inbox = services.get<PeerInboxService>("peerinbox");
    if (!inbox) LOGE("peerinbox service missing");
}
