#include <unity.h>
#include <string.h>

#include "Modules/DevicesModule/RefreshScheduler.h"

class FakeDriver : public ISweepDriver {
public:
    void ensureRelayDevice() override { log('E'); }
    bool requestRelayClients() override { log('R'); return relayAsync; }
    bool requestLocalDiscovery(bool full) override
    {
        log(full ? 'L' : 'l');
        return localAsync;
    }
    bool requestRadioScan() override { log('B'); return radioAvailable; }
    void dropRadioSightings() override { log('b'); }
    uint16_t dispatchChecks(uint32_t sweepId) override
    {
        log('C');
        lastSweep = sweepId;
        ++probeRounds;
        return devices;
    }
    void publishSnapshot() override { ++snapshots; }
    void onSweepComplete(uint32_t sweepId, uint16_t checks) override
    {
        log('S');
        completedSweep = sweepId;
        completedChecks = checks;
    }

    void log(char c)
    {
        if (n < sizeof(trace) - 1) trace[n++] = c;
        trace[n] = '\0';
    }

    bool relayAsync = false;
    bool localAsync = false;
    bool radioAvailable = true;
    uint16_t devices = 0;
    uint32_t lastSweep = 0;
    uint32_t completedSweep = 0;
    uint16_t completedChecks = 0;
    uint16_t probeRounds = 0;
    uint16_t snapshots = 0;
    char trace[64] = {0};
    size_t n = 0;
};

static FakeDriver drv;

void setUp()
{
    drv = FakeDriver{};
}

void tearDown() {}

void test_second_call_inside_cooldown_is_cached()
{
    RefreshScheduler sched(drv);
    drv.devices = 0;
    TEST_ASSERT_EQUAL(RefreshOutcome::Refreshed, sched.refreshAll(false, 1000));
    const uint16_t rounds = drv.probeRounds;
    const uint16_t snaps = drv.snapshots;

    TEST_ASSERT_EQUAL(RefreshOutcome::Cached, sched.refreshAll(false, 11000));
    TEST_ASSERT_EQUAL_UINT16(rounds, drv.probeRounds);
    TEST_ASSERT_EQUAL_UINT16(snaps + 1, drv.snapshots);
}

void test_cooldown_expires_after_one_minute()
{
    RefreshScheduler sched(drv);
    sched.refreshAll(false, 1000);
    TEST_ASSERT_EQUAL(RefreshOutcome::Cached, sched.refreshAll(false, 60999));
    TEST_ASSERT_EQUAL(RefreshOutcome::Refreshed, sched.refreshAll(false, 61000));
    TEST_ASSERT_EQUAL_UINT32(2, sched.sweepId());
}

void test_force_bypasses_cooldown()
{
    RefreshScheduler sched(drv);
    sched.refreshAll(false, 1000);
    TEST_ASSERT_EQUAL(RefreshOutcome::Refreshed, sched.refreshAll(true, 2000));
    TEST_ASSERT_EQUAL_UINT16(2, drv.probeRounds);
}

void test_synchronous_steps_run_in_order()
{
    RefreshScheduler sched(drv);
    drv.devices = 0;
    sched.refreshAll(true, 1000);
    TEST_ASSERT_EQUAL_STRING("ERLBCS", drv.trace);
    TEST_ASSERT_FALSE(sched.busy());
}

void test_async_steps_advance_on_completion()
{
    RefreshScheduler sched(drv);
    drv.relayAsync = true;
    drv.localAsync = true;
    drv.devices = 3;

    TEST_ASSERT_EQUAL(RefreshOutcome::Refreshed, sched.refreshAll(false, 1000));
    TEST_ASSERT_EQUAL_STRING("ER", drv.trace);
    TEST_ASSERT_TRUE(sched.stage() == RefreshScheduler::Stage::RelayClients);

    sched.onLocalDiscoveryDone(1100);
    TEST_ASSERT_EQUAL_STRING("ER", drv.trace);

    sched.onRelayClientsDone(1500);
    TEST_ASSERT_EQUAL_STRING("ERL", drv.trace);

    sched.onLocalDiscoveryDone(2000);
    TEST_ASSERT_EQUAL_STRING("ERLBC", drv.trace);
    TEST_ASSERT_EQUAL_UINT16(3, sched.pendingChecks());

    const uint32_t id = drv.lastSweep;
    sched.onCheckDone(id);
    sched.onCheckDone(id + 7);
    sched.onCheckDone(id);
    TEST_ASSERT_TRUE(sched.busy());
    sched.onCheckDone(id);
    TEST_ASSERT_FALSE(sched.busy());
    TEST_ASSERT_EQUAL_STRING("ERLBCS", drv.trace);
    TEST_ASSERT_EQUAL_UINT32(id, drv.completedSweep);
    TEST_ASSERT_EQUAL_UINT16(3, drv.completedChecks);
}

void test_call_during_sweep_is_cached_even_when_forced()
{
    RefreshScheduler sched(drv);
    drv.relayAsync = true;
    sched.refreshAll(false, 1000);
    const uint16_t snaps = drv.snapshots;

    TEST_ASSERT_EQUAL(RefreshOutcome::Cached, sched.refreshAll(true, 1500));
    TEST_ASSERT_EQUAL_UINT32(1, sched.sweepId());
    TEST_ASSERT_EQUAL_UINT16(snaps + 1, drv.snapshots);
}

void test_skip_modes()
{
    RefreshScheduler sched(drv);
    sched.setPolicy(true, false);
    sched.refreshAll(true, 1000);
    TEST_ASSERT_EQUAL_STRING("ERBCS", drv.trace);

    drv.n = 0;
    drv.trace[0] = '\0';
    sched.setPolicy(false, true);
    sched.refreshAll(true, 2000);
    TEST_ASSERT_EQUAL_STRING("ERLbCS", drv.trace);
}

void test_quick_recheck_between_full_scans()
{
    RefreshScheduler sched(drv);
    drv.localAsync = true;
    sched.refreshAll(false, 1000);
    sched.onLocalDiscoveryDone(2000);
    sched.refreshAll(false, 70000);
    sched.onLocalDiscoveryDone(71000);
    sched.refreshAll(false, 301000);
    sched.onLocalDiscoveryDone(302000);
    TEST_ASSERT_EQUAL_STRING("ERLBCSERlBCSERLBCS", drv.trace);
}

void test_refused_full_scan_is_retried_next_sweep()
{
    RefreshScheduler sched(drv);
    sched.refreshAll(false, 1000);
    TEST_ASSERT_EQUAL_STRING("ERLBCS", drv.trace);

    drv.n = 0;
    drv.trace[0] = '\0';
    drv.localAsync = true;
    sched.refreshAll(false, 70000);
    TEST_ASSERT_EQUAL_STRING("ERL", drv.trace);
    sched.onLocalDiscoveryDone(71000);

    drv.n = 0;
    drv.trace[0] = '\0';
    sched.refreshAll(false, 140000);
    TEST_ASSERT_EQUAL_STRING("ERl", drv.trace);
}

void test_unavailable_radio_drops_sightings()
{
    RefreshScheduler sched(drv);
    drv.radioAvailable = false;
    sched.refreshAll(true, 1000);
    TEST_ASSERT_EQUAL_STRING("ERLBbCS", drv.trace);
}

void test_stuck_sweep_is_abandoned()
{
    RefreshScheduler sched(drv);
    drv.relayAsync = true;
    sched.refreshAll(false, 1000);
    sched.tick(100000);
    TEST_ASSERT_TRUE(sched.busy());
    sched.tick(1000 + 240000);
    TEST_ASSERT_FALSE(sched.busy());
    TEST_ASSERT_EQUAL_UINT32(1, drv.completedSweep);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_second_call_inside_cooldown_is_cached);
    RUN_TEST(test_cooldown_expires_after_one_minute);
    RUN_TEST(test_force_bypasses_cooldown);
    RUN_TEST(test_synchronous_steps_run_in_order);
    RUN_TEST(test_async_steps_advance_on_completion);
    RUN_TEST(test_call_during_sweep_is_cached_even_when_forced);
    RUN_TEST(test_skip_modes);
    RUN_TEST(test_quick_recheck_between_full_scans);
    RUN_TEST(test_refused_full_scan_is_retried_next_sweep);
    RUN_TEST(test_unavailable_radio_drops_sightings);
    RUN_TEST(test_stuck_sweep_is_abandoned);
    return UNITY_END();
}
