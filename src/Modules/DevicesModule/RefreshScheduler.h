#pragma once
/**
 * @file RefreshScheduler.h
 * @brief Cooldown-gated, staged multi-transport sweep.
 */

#include <stdint.h>

/** @brief Result of `RefreshScheduler::refreshAll`. */
enum class RefreshOutcome : uint8_t {
    Refreshed,
    Cached
};

/**
 * @brief Side effects of a sweep, implemented by the devices owner task.
 *
 * `request*` calls start asynchronous work and return false when the step is
 * not available; the scheduler then moves on immediately.
 */
class ISweepDriver {
public:
    virtual ~ISweepDriver() = default;
    virtual void ensureRelayDevice() = 0;
    virtual bool requestRelayClients() = 0;
    virtual bool requestLocalDiscovery(bool fullScan) = 0;
    /** @brief False when no scan result will arrive for this sweep. */
    virtual bool requestRadioScan() = 0;
    /** @brief Reconcile an empty radio cycle, stripping every radio tag. */
    virtual void dropRadioSightings() = 0;
    /** @brief Queue one check per known device; returns the number queued. */
    virtual uint16_t dispatchChecks(uint32_t sweepId) = 0;
    virtual void publishSnapshot() = 0;
    virtual void onSweepComplete(uint32_t sweepId, uint16_t checks) = 0;
};

class RefreshScheduler {
public:
    enum class Stage : uint8_t {
        Idle,
        RelayClients,
        LocalDiscovery,
        Checks
    };

    explicit RefreshScheduler(ISweepDriver& driver) : driver_(driver) {}

    /** @brief Restricted mode skips local discovery, internet-only mode skips the radio scan. */
    void setPolicy(bool skipLocal, bool skipRadio)
    {
        skipLocal_ = skipLocal;
        skipRadio_ = skipRadio;
    }

    /**
     * @brief Start a sweep unless inside the cooldown or already sweeping.
     *
     * A refused call republishes the current snapshot and returns `Cached`.
     */
    RefreshOutcome refreshAll(bool force, uint32_t nowMs);

    void onRelayClientsDone(uint32_t nowMs);
    void onLocalDiscoveryDone(uint32_t nowMs);
    void onCheckDone(uint32_t sweepId);

    /** @brief Abandon a sweep stuck past its overall bound. */
    void tick(uint32_t nowMs);

    bool busy() const { return stage_ != Stage::Idle; }
    Stage stage() const { return stage_; }
    uint32_t sweepId() const { return sweepId_; }
    uint16_t pendingChecks() const { return pending_; }

private:
    ISweepDriver& driver_;
    Stage stage_ = Stage::Idle;
    bool skipLocal_ = false;
    bool skipRadio_ = false;

    bool hasRun_ = false;
    uint32_t lastStartMs_ = 0;
    bool hasFullScan_ = false;
    uint32_t lastFullScanMs_ = 0;
    bool fullScan_ = false;

    uint32_t sweepId_ = 0;
    uint16_t checks_ = 0;
    uint16_t pending_ = 0;

    void startLocalDiscovery_(uint32_t nowMs);
    void startChecks_();
    void finish_();
};
