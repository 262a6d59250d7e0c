#include <unity.h>
#include <string.h>

#include "Modules/DevicesModule/ReachabilityAggregator.h"
#include "Modules/DevicesModule/TransportReconcile.h"

struct Transitions {
    uint8_t changes = 0;
    uint8_t cameOnline = 0;
    bool lastOnline = false;
    uint8_t lastCause = kTransportNone;
    char lastCallsign[Limits::Peers::CallsignBuf] = {0};
};

static Transitions seen;
static DeviceRegistry reg;
static ReachabilityAggregator agg(reg);

static void onChanged(void* ctx, const char* callsign, bool online, uint8_t cause)
{
    Transitions* t = static_cast<Transitions*>(ctx);
    ++t->changes;
    t->lastOnline = online;
    t->lastCause = cause;
    strncpy(t->lastCallsign, callsign, sizeof(t->lastCallsign) - 1);
}

static void onOnline(void* ctx, const char*)
{
    ++static_cast<Transitions*>(ctx)->cameOnline;
}

void setUp()
{
    seen = Transitions{};
    reg = DeviceRegistry{};
    agg.setRelay(RelayInfo{});
    agg.setLocalProbeEnabled(true);
    AggregatorListener l;
    l.onStatusChanged = onChanged;
    l.onCameOnline = onOnline;
    l.ctx = &seen;
    agg.setListener(l);
}

void tearDown() {}

static RadioSighting sighting(const char* key, int16_t rssi, bool enhanced = false)
{
    RadioSighting s;
    strncpy(s.key, key, sizeof(s.key) - 1);
    s.rssi = rssi;
    s.enhanced = enhanced;
    return s;
}

void test_reconcile_replaces_only_radio_tags()
{
    TransportSet old;
    old.add(Transport::Internet);
    old.add(Transport::RadioEnhanced);

    TransportSet inScan = reconcile(old, true, false);
    TEST_ASSERT_TRUE(inScan.has(Transport::Internet));
    TEST_ASSERT_TRUE(inScan.has(Transport::ShortRangeRadio));
    TEST_ASSERT_FALSE(inScan.has(Transport::RadioEnhanced));

    TransportSet enhanced = reconcile(old, true, true);
    TEST_ASSERT_TRUE(enhanced.has(Transport::RadioEnhanced));

    TransportSet gone = reconcile(enhanced, false, true);
    TEST_ASSERT_FALSE(gone.hasRadio());
    TEST_ASSERT_TRUE(gone.has(Transport::Internet));
}

void test_transition_cause()
{
    TransportSet none;
    TransportSet radio;
    radio.add(Transport::ShortRangeRadio);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Transport::ShortRangeRadio, transitionCause(none, radio, true));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Transport::ShortRangeRadio, transitionCause(radio, none, false));
    TEST_ASSERT_EQUAL_UINT8(kTransportNone, transitionCause(none, none, false));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Transport::ShortRangeRadio, transitionCause(radio, radio, true));
}

void test_scan_creates_peers_and_marks_online()
{
    RadioSighting scan[2] = {sighting("x1abc", -45), sighting("BLE-A1B2C3", -80, true)};
    agg.applyRadioScan(scan, 2, 1000);

    const DeviceRecord* a = reg.get("X1ABC");
    TEST_ASSERT_NOT_NULL(a);
    TEST_ASSERT_TRUE(a->online);
    TEST_ASSERT_TRUE(a->transports.has(Transport::ShortRangeRadio));
    TEST_ASSERT_EQUAL_STRING("Very close", a->proximity);
    TEST_ASSERT_EQUAL_INT16(-45, a->rssi);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PeerSource::ShortRangeRadio, (uint8_t)a->source);

    const DeviceRecord* b = reg.get("ble-a1b2c3");
    TEST_ASSERT_NOT_NULL(b);
    TEST_ASSERT_TRUE(b->transports.has(Transport::RadioEnhanced));
    TEST_ASSERT_EQUAL_STRING("In range", b->proximity);

    TEST_ASSERT_EQUAL_UINT8(2, seen.changes);
    TEST_ASSERT_EQUAL_UINT8(2, seen.cameOnline);
}

void test_radio_tags_match_latest_cycle_exactly()
{
    RadioSighting first[2] = {sighting("A1", -60), sighting("B1", -60)};
    agg.applyRadioScan(first, 2, 1000);

    RadioSighting second[1] = {sighting("B1", -65)};
    agg.applyRadioScan(second, 1, 11000);

    const DeviceRecord* a = reg.get("A1");
    const DeviceRecord* b = reg.get("B1");
    TEST_ASSERT_FALSE(a->transports.hasRadio());
    TEST_ASSERT_FALSE(a->hasRssi);
    TEST_ASSERT_EQUAL_STRING("", a->proximity);
    TEST_ASSERT_TRUE(b->transports.has(Transport::ShortRangeRadio));
    TEST_ASSERT_EQUAL_STRING("Nearby", b->proximity);
}

void test_absent_radio_only_peer_goes_offline_with_event()
{
    RadioSighting first[1] = {sighting("A1", -60)};
    agg.applyRadioScan(first, 1, 1000);
    TEST_ASSERT_TRUE(reg.get("A1")->online);
    seen = Transitions{};

    agg.applyRadioScan(nullptr, 0, 11000);

    const DeviceRecord* a = reg.get("A1");
    TEST_ASSERT_FALSE(a->online);
    TEST_ASSERT_TRUE(a->transports.empty());
    TEST_ASSERT_EQUAL_UINT8(1, seen.changes);
    TEST_ASSERT_FALSE(seen.lastOnline);
    TEST_ASSERT_EQUAL_STRING("A1", seen.lastCallsign);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Transport::ShortRangeRadio, seen.lastCause);
}

void test_absent_radio_peer_with_other_tag_stays_online()
{
    RelayClient c;
    strcpy(c.callsign, "A1");
    c.online = true;
    agg.applyRelayClients(&c, 1, 500);

    RadioSighting first[1] = {sighting("A1", -60)};
    agg.applyRadioScan(first, 1, 1000);
    seen = Transitions{};

    agg.applyRadioScan(nullptr, 0, 11000);
    const DeviceRecord* a = reg.get("A1");
    TEST_ASSERT_TRUE(a->online);
    TEST_ASSERT_TRUE(a->transports.has(Transport::Internet));
    TEST_ASSERT_FALSE(a->transports.hasRadio());
    TEST_ASSERT_EQUAL_UINT8(0, seen.changes);
}

void test_wired_link_connect_and_disconnect()
{
    agg.applyWiredLink(true, "w1", 100);
    const DeviceRecord* w = reg.get("W1");
    TEST_ASSERT_NOT_NULL(w);
    TEST_ASSERT_TRUE(w->online);
    TEST_ASSERT_TRUE(w->transports.has(Transport::WiredLink));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PeerSource::WiredLink, (uint8_t)w->source);

    RadioSighting scan[1] = {sighting("W2", -60)};
    agg.applyRadioScan(scan, 1, 200);
    agg.applyWiredLink(true, "W2", 300);
    seen = Transitions{};

    agg.applyWiredLink(false, nullptr, 400);
    TEST_ASSERT_FALSE(reg.get("W1")->online);
    TEST_ASSERT_TRUE(reg.get("W1")->transports.empty());
    TEST_ASSERT_TRUE(reg.get("W2")->online);
    TEST_ASSERT_FALSE(reg.get("W2")->transports.has(Transport::WiredLink));
    TEST_ASSERT_EQUAL_UINT8(1, seen.changes);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Transport::WiredLink, seen.lastCause);
}

void test_local_identity_is_ignored_by_listeners()
{
    reg.setLocalCallsign("ME1");
    RadioSighting scan[1] = {sighting("me1", -40)};
    agg.applyRadioScan(scan, 1, 100);
    agg.applyWiredLink(true, "ME1", 100);
    TEST_ASSERT_NULL(reg.get("ME1"));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_reconcile_replaces_only_radio_tags);
    RUN_TEST(test_transition_cause);
    RUN_TEST(test_scan_creates_peers_and_marks_online);
    RUN_TEST(test_radio_tags_match_latest_cycle_exactly);
    RUN_TEST(test_absent_radio_only_peer_goes_offline_with_event);
    RUN_TEST(test_absent_radio_peer_with_other_tag_stays_online);
    RUN_TEST(test_wired_link_connect_and_disconnect);
    RUN_TEST(test_local_identity_is_ignored_by_listeners);
    return UNITY_END();
}
