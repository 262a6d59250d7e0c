/**
 * @file RefreshScheduler.cpp
 * @brief Cooldown-gated, staged multi-transport sweep.
 */

#define LOG_TAG "PeerSwep"
#include "Core/ModuleLog.h"

#include "Modules/DevicesModule/RefreshScheduler.h"
#include "Domain/PeerDefaults.h"

RefreshOutcome RefreshScheduler::refreshAll(bool force, uint32_t nowMs)
{
    if (busy()) {
        LOGD("sweep %lu in progress, serving cached", (unsigned long)sweepId_);
        driver_.publishSnapshot();
        return RefreshOutcome::Cached;
    }
    if (!force && hasRun_ && (uint32_t)(nowMs - lastStartMs_) < PeerDefaults::RefreshCooldownMs) {
        driver_.publishSnapshot();
        return RefreshOutcome::Cached;
    }

    hasRun_ = true;
    lastStartMs_ = nowMs;
    ++sweepId_;
    checks_ = 0;
    pending_ = 0;
    fullScan_ = force || !hasFullScan_ ||
                (uint32_t)(nowMs - lastFullScanMs_) >= PeerDefaults::LocalFullScanIntervalMs;
    LOGI("sweep %lu start (force=%d full=%d)", (unsigned long)sweepId_, force ? 1 : 0, fullScan_ ? 1 : 0);

    driver_.ensureRelayDevice();

    stage_ = Stage::RelayClients;
    if (!driver_.requestRelayClients()) startLocalDiscovery_(nowMs);
    return RefreshOutcome::Refreshed;
}

void RefreshScheduler::startLocalDiscovery_(uint32_t nowMs)
{
    stage_ = Stage::LocalDiscovery;
    if (!skipLocal_) {
        if (driver_.requestLocalDiscovery(fullScan_)) {
            if (fullScan_) {
                hasFullScan_ = true;
                lastFullScanMs_ = nowMs;
            }
            return;
        }
        if (fullScan_) LOGD("full local scan refused, retried next sweep");
    }
    startChecks_();
}

void RefreshScheduler::startChecks_()
{
    // Radio tags only ever reflect the latest cycle.
    if (skipRadio_ || !driver_.requestRadioScan()) driver_.dropRadioSightings();

    stage_ = Stage::Checks;
    checks_ = driver_.dispatchChecks(sweepId_);
    pending_ = checks_;
    driver_.publishSnapshot();
    if (pending_ == 0) finish_();
}

void RefreshScheduler::finish_()
{
    stage_ = Stage::Idle;
    pending_ = 0;
    LOGI("sweep %lu complete (%u checks)", (unsigned long)sweepId_, (unsigned)checks_);
    driver_.onSweepComplete(sweepId_, checks_);
    driver_.publishSnapshot();
}

void RefreshScheduler::onRelayClientsDone(uint32_t nowMs)
{
    if (stage_ != Stage::RelayClients) return;
    startLocalDiscovery_(nowMs);
}

void RefreshScheduler::onLocalDiscoveryDone(uint32_t nowMs)
{
    (void)nowMs;
    if (stage_ != Stage::LocalDiscovery) return;
    startChecks_();
}

void RefreshScheduler::onCheckDone(uint32_t sweepId)
{
    if (stage_ != Stage::Checks || sweepId != sweepId_ || pending_ == 0) return;
    --pending_;
    if (pending_ == 0) finish_();
}

void RefreshScheduler::tick(uint32_t nowMs)
{
    if (!busy()) return;
    if ((uint32_t)(nowMs - lastStartMs_) < PeerDefaults::SweepTimeoutMs) return;
    LOGW("sweep %lu timed out in stage %u", (unsigned long)sweepId_, (unsigned)stage_);
    finish_();
}
