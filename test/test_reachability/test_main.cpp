#include <unity.h>
#include <string.h>

#include "Modules/DevicesModule/ReachabilityAggregator.h"

class FakeDirect : public IDirectProbe {
public:
    DirectProbeResult probe(const char* endpoint, uint32_t timeoutMs) override
    {
        ++calls;
        lastTimeout = timeoutMs;
        strncpy(lastEndpoint, endpoint, sizeof(lastEndpoint) - 1);
        return next;
    }

    DirectProbeResult next;
    uint8_t calls = 0;
    uint32_t lastTimeout = 0;
    char lastEndpoint[96] = {0};
};

class FakeRelay : public IRelayProbe {
public:
    ProxyProbeResult probe(const char* relayBase, const char* callsign, uint32_t) override
    {
        ++calls;
        strncpy(lastBase, relayBase, sizeof(lastBase) - 1);
        strncpy(lastCallsign, callsign, sizeof(lastCallsign) - 1);
        return next;
    }

    ProxyProbeResult next;
    uint8_t calls = 0;
    char lastBase[96] = {0};
    char lastCallsign[16] = {0};
};

struct Events {
    uint8_t changes = 0;
    uint8_t cameOnline = 0;
    bool lastOnline = false;
    uint8_t lastCause = kTransportNone;
};

static Events ev;
static DeviceRegistry reg;
static ReachabilityAggregator agg(reg);
static FakeDirect direct;
static FakeRelay relay;

static void onChanged(void* ctx, const char*, bool online, uint8_t cause)
{
    Events* e = static_cast<Events*>(ctx);
    ++e->changes;
    e->lastOnline = online;
    e->lastCause = cause;
}

static void onOnline(void* ctx, const char*)
{
    ++static_cast<Events*>(ctx)->cameOnline;
}

void setUp()
{
    ev = Events{};
    reg = DeviceRegistry{};
    direct = FakeDirect{};
    relay = FakeRelay{};
    agg.setRelay(RelayInfo{});
    agg.setLocalProbeEnabled(true);
    AggregatorListener l;
    l.onStatusChanged = onChanged;
    l.onCameOnline = onOnline;
    l.ctx = &ev;
    agg.setListener(l);
}

void tearDown() {}

static void addPeer(const char* callsign, const char* url, TransportSet tags = TransportSet{})
{
    DevicePatch p;
    p.endpoint = url;
    p.addTransports = tags;
    if (!tags.empty()) {
        p.hasOnline = true;
        p.online = true;
    }
    reg.upsert(callsign, p, 0);
}

static void connectRelay(const char* callsign)
{
    RelayInfo info;
    info.connected = true;
    strcpy(info.callsign, callsign);
    strcpy(info.url, "wss://relay.example.org/ws");
    agg.setRelay(info);
}

void test_private_endpoint_success_tags_local_network()
{
    addPeer("X1ABC", "http://192.168.1.5:8080");
    direct.next.status = ProbeStatus::Success;
    direct.next.latencyMs = 300;

    TEST_ASSERT_TRUE(agg.checkReachability("x1abc", direct, relay, 5000));

    const DeviceRecord* r = reg.get("X1ABC");
    TEST_ASSERT_TRUE(r->online);
    TEST_ASSERT_TRUE(r->transports.has(Transport::LocalNetwork));
    TEST_ASSERT_EQUAL_INT32(300, r->latencyMs);
    TEST_ASSERT_EQUAL_UINT32(5000, r->lastCheckedMs);
    TEST_ASSERT_EQUAL_UINT32(5000, r->lastSeenMs);
    TEST_ASSERT_EQUAL_UINT32(5000, direct.lastTimeout);
    TEST_ASSERT_EQUAL_STRING("http://192.168.1.5:8080", direct.lastEndpoint);
    TEST_ASSERT_EQUAL_UINT8(0, relay.calls);
    TEST_ASSERT_EQUAL_UINT8(1, ev.changes);
    TEST_ASSERT_EQUAL_UINT8(1, ev.cameOnline);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Transport::LocalNetwork, ev.lastCause);
}

void test_public_endpoint_success_tags_internet_without_relay()
{
    addPeer("X1PUB", "https://peer.example.org");
    direct.next.status = ProbeStatus::Success;
    direct.next.latencyMs = 80;

    TEST_ASSERT_TRUE(agg.checkReachability("X1PUB", direct, relay, 100));
    const DeviceRecord* r = reg.get("X1PUB");
    TEST_ASSERT_TRUE(r->transports.has(Transport::Internet));
    TEST_ASSERT_FALSE(r->transports.hasLocal());
}

void test_enrichment_applies_only_present_fields()
{
    DevicePatch seed;
    seed.endpoint = "http://10.0.0.4:3456";
    seed.color = "red";
    seed.nickname = "Old";
    reg.upsert("X1ABC", seed, 0);

    direct.next.status = ProbeStatus::Success;
    direct.next.latencyMs = 12;
    direct.next.hasInfo = true;
    direct.next.info.hasNickname = true;
    strcpy(direct.next.info.nickname, "Alpha");
    direct.next.info.hasLocation = true;
    direct.next.info.latitude = 38.7;
    direct.next.info.longitude = -9.1;

    agg.checkReachability("X1ABC", direct, relay, 100);
    const DeviceRecord* r = reg.get("X1ABC");
    TEST_ASSERT_EQUAL_STRING("Alpha", r->nickname);
    TEST_ASSERT_EQUAL_STRING("red", r->color);
    TEST_ASSERT_TRUE(r->hasLocation);
    TEST_ASSERT_TRUE(r->latitude > 38.69 && r->latitude < 38.71);
    TEST_ASSERT_TRUE(r->longitude < -9.09 && r->longitude > -9.11);
}

void test_self_relay_mirrors_live_flag_without_probe()
{
    addPeer("RELAY1", "");
    connectRelay("RELAY1");

    TEST_ASSERT_TRUE(agg.checkReachability("relay1", direct, relay, 100));
    TEST_ASSERT_EQUAL_UINT8(0, relay.calls);
    TEST_ASSERT_EQUAL_UINT8(0, direct.calls);
    TEST_ASSERT_TRUE(reg.get("RELAY1")->transports.has(Transport::Internet));

    RelayInfo down = agg.relay();
    down.connected = false;
    agg.setRelay(down);
    TEST_ASSERT_FALSE(agg.checkReachability("RELAY1", direct, relay, 200));
    TEST_ASSERT_EQUAL_UINT8(0, relay.calls);
    TEST_ASSERT_FALSE(reg.get("RELAY1")->transports.has(Transport::Internet));
    TEST_ASSERT_FALSE(ev.lastOnline);
}

void test_relay_negative_keeps_direct_success()
{
    TransportSet tags;
    tags.add(Transport::Internet);
    addPeer("X1ABC", "http://192.168.1.5:8080", tags);
    connectRelay("RELAY1");

    direct.next.status = ProbeStatus::Success;
    direct.next.latencyMs = 40;
    relay.next.status = ProbeStatus::Rejected;

    TEST_ASSERT_TRUE(agg.checkReachability("X1ABC", direct, relay, 100));
    const DeviceRecord* r = reg.get("X1ABC");
    TEST_ASSERT_TRUE(r->online);
    TEST_ASSERT_FALSE(r->transports.has(Transport::Internet));
    TEST_ASSERT_TRUE(r->transports.has(Transport::LocalNetwork));
    TEST_ASSERT_EQUAL_UINT8(1, relay.calls);
    TEST_ASSERT_EQUAL_STRING("https://relay.example.org", relay.lastBase);
    TEST_ASSERT_EQUAL_STRING("X1ABC", relay.lastCallsign);
    TEST_ASSERT_EQUAL_UINT8(0, ev.changes);
}

void test_relay_success_alone_brings_peer_online()
{
    addPeer("X1ABC", "");
    connectRelay("RELAY1");
    relay.next.status = ProbeStatus::Success;

    TEST_ASSERT_TRUE(agg.checkReachability("X1ABC", direct, relay, 100));
    TEST_ASSERT_EQUAL_UINT8(0, direct.calls);
    TEST_ASSERT_TRUE(reg.get("X1ABC")->transports.has(Transport::Internet));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Transport::Internet, ev.lastCause);
}

void test_direct_failure_strips_local_tags_and_timeout_keeps_internet_tag()
{
    TransportSet tags;
    tags.add(Transport::LocalNetwork);
    tags.add(Transport::Internet);
    addPeer("X1ABC", "http://192.168.1.5:8080", tags);
    connectRelay("RELAY1");

    direct.next.status = ProbeStatus::Timeout;
    relay.next.status = ProbeStatus::Timeout;

    TEST_ASSERT_FALSE(agg.checkReachability("X1ABC", direct, relay, 100));
    const DeviceRecord* r = reg.get("X1ABC");
    TEST_ASSERT_FALSE(r->online);
    TEST_ASSERT_FALSE(r->transports.hasLocal());
    TEST_ASSERT_TRUE(r->transports.has(Transport::Internet));
    TEST_ASSERT_EQUAL_INT32(-1, r->latencyMs);
    TEST_ASSERT_EQUAL_UINT8(1, ev.changes);
    TEST_ASSERT_FALSE(ev.lastOnline);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Transport::LocalNetwork, ev.lastCause);
}

void test_no_relay_strips_internet_tag()
{
    TransportSet tags;
    tags.add(Transport::Internet);
    addPeer("X1ABC", "", tags);

    TEST_ASSERT_FALSE(agg.checkReachability("X1ABC", direct, relay, 100));
    TEST_ASSERT_TRUE(reg.get("X1ABC")->transports.empty());
    TEST_ASSERT_EQUAL_UINT8(0, relay.calls);
}

void test_radio_tag_keeps_peer_online_when_probes_fail()
{
    TransportSet tags;
    tags.add(Transport::ShortRangeRadio);
    addPeer("X1ABC", "http://192.168.1.5:8080", tags);
    direct.next.status = ProbeStatus::Unavailable;

    TEST_ASSERT_TRUE(agg.checkReachability("X1ABC", direct, relay, 100));
    TEST_ASSERT_TRUE(reg.get("X1ABC")->online);
    TEST_ASSERT_EQUAL_UINT8(0, ev.changes);
}

void test_relay_unavailable_keeps_internet_tag()
{
    TransportSet tags;
    tags.add(Transport::Internet);
    addPeer("X1ABC", "", tags);
    connectRelay("RELAY1");
    relay.next.status = ProbeStatus::Unavailable;

    TEST_ASSERT_FALSE(agg.checkReachability("X1ABC", direct, relay, 100));
    const DeviceRecord* r = reg.get("X1ABC");
    TEST_ASSERT_FALSE(r->online);
    TEST_ASSERT_TRUE(r->transports.has(Transport::Internet));
    TEST_ASSERT_EQUAL_UINT8(1, relay.calls);
}

void test_empty_radio_cycle_lets_failed_checks_go_offline()
{
    RadioSighting s;
    strcpy(s.key, "X1BT");
    s.rssi = -60;
    agg.applyRadioScan(&s, 1, 100);
    connectRelay("RELAY1");
    direct.next.status = ProbeStatus::Timeout;
    relay.next.status = ProbeStatus::Rejected;

    TEST_ASSERT_TRUE(agg.checkReachability("X1BT", direct, relay, 1000));

    agg.applyRadioScan(nullptr, 0, 2000);
    for (uint32_t t = 3000; t < 8000; t += 1000) {
        TEST_ASSERT_FALSE(agg.checkReachability("X1BT", direct, relay, t));
    }
    const DeviceRecord* r = reg.get("X1BT");
    TEST_ASSERT_FALSE(r->online);
    TEST_ASSERT_FALSE(r->transports.hasRadio());
}

void test_repeated_success_fires_single_transition()
{
    addPeer("X1ABC", "http://192.168.1.5:8080");
    direct.next.status = ProbeStatus::Success;
    direct.next.latencyMs = 10;

    agg.checkReachability("X1ABC", direct, relay, 100);
    agg.checkReachability("X1ABC", direct, relay, 200);
    agg.checkReachability("X1ABC", direct, relay, 300);
    TEST_ASSERT_EQUAL_UINT8(1, ev.changes);
    TEST_ASSERT_EQUAL_UINT8(1, ev.cameOnline);
}

void test_local_probe_switch_disables_direct_probe()
{
    addPeer("X1ABC", "http://192.168.1.5:8080");
    agg.setLocalProbeEnabled(false);
    direct.next.status = ProbeStatus::Success;

    TEST_ASSERT_FALSE(agg.checkReachability("X1ABC", direct, relay, 100));
    TEST_ASSERT_EQUAL_UINT8(0, direct.calls);
}

void test_relay_peer_on_lan_keeps_its_tag()
{
    TransportSet tags;
    tags.add(Transport::RelayPeerOnLan);
    addPeer("X3RELAY", "http://192.168.1.9:8080", tags);
    direct.next.status = ProbeStatus::Success;
    direct.next.latencyMs = 5;

    agg.checkReachability("X3RELAY", direct, relay, 100);
    const DeviceRecord* r = reg.get("X3RELAY");
    TEST_ASSERT_TRUE(r->transports.has(Transport::RelayPeerOnLan));
    TEST_ASSERT_FALSE(r->transports.has(Transport::LocalNetwork));
}

void test_unknown_callsign_reports_false()
{
    CheckPlan plan;
    TEST_ASSERT_FALSE(agg.planCheck("NOPE", plan));
    TEST_ASSERT_FALSE(agg.checkReachability("NOPE", direct, relay, 100));
    TEST_ASSERT_EQUAL_UINT8(0, direct.calls);
}

void test_relay_client_merge_touches_only_listed_devices()
{
    TransportSet tags;
    tags.add(Transport::Internet);
    addPeer("KEEP1", "", tags);
    addPeer("DROP1", "", tags);

    RelayClient list[3];
    strcpy(list[0].callsign, "DROP1");
    list[0].online = false;
    strcpy(list[1].callsign, "NEW1");
    list[1].online = true;
    strcpy(list[1].nickname, "Newbie");
    strcpy(list[2].callsign, "IDLE1");
    list[2].online = false;

    agg.applyRelayClients(list, 3, 100);

    TEST_ASSERT_TRUE(reg.get("KEEP1")->transports.has(Transport::Internet));
    TEST_ASSERT_TRUE(reg.get("KEEP1")->online);
    TEST_ASSERT_FALSE(reg.get("DROP1")->online);
    TEST_ASSERT_TRUE(reg.get("NEW1")->online);
    TEST_ASSERT_EQUAL_STRING("Newbie", reg.get("NEW1")->nickname);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PeerSource::Relay, (uint8_t)reg.get("NEW1")->source);
    TEST_ASSERT_NOT_NULL(reg.get("IDLE1"));
    TEST_ASSERT_FALSE(reg.get("IDLE1")->online);
}

void test_ensure_relay_device_and_local_discovery()
{
    connectRelay("RELAY1");
    TEST_ASSERT_TRUE(agg.ensureRelayDevice(100));
    const DeviceRecord* relayRec = reg.get("RELAY1");
    TEST_ASSERT_TRUE(relayRec->transports.has(Transport::Internet));
    TEST_ASSERT_EQUAL_STRING("https://relay.example.org", relayRec->endpoint);

    addPeer("X1ABC", "https://peer.example.org");
    LocalSighting found[2];
    strcpy(found[0].callsign, "X1ABC");
    strcpy(found[0].endpoint, "http://192.168.1.5:3456");
    found[0].latencyMs = 20;
    strcpy(found[1].callsign, "X3LAN");
    strcpy(found[1].endpoint, "http://192.168.1.6:8080");
    found[1].info.isRelay = true;

    agg.applyLocalDiscovery(found, 2, 200);
    const DeviceRecord* peer = reg.get("X1ABC");
    TEST_ASSERT_EQUAL_STRING("http://192.168.1.5:3456", peer->endpoint);
    TEST_ASSERT_TRUE(peer->transports.has(Transport::LocalNetwork));
    TEST_ASSERT_TRUE(peer->online);
    TEST_ASSERT_TRUE(reg.get("X3LAN")->transports.has(Transport::RelayPeerOnLan));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PeerSource::LocalScan, (uint8_t)reg.get("X3LAN")->source);
}

void test_manual_add_creates_offline_record()
{
    TEST_ASSERT_EQUAL(UpsertResult::Created, agg.addManual("x1abc", "http://10.0.0.2:3456", "Base", 100));
    const DeviceRecord* r = reg.get("X1ABC");
    TEST_ASSERT_FALSE(r->online);
    TEST_ASSERT_EQUAL_STRING("Base", r->name);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PeerSource::Manual, (uint8_t)r->source);
    TEST_ASSERT_EQUAL(UpsertResult::Unchanged, agg.addManual("X1ABC", "http://10.0.0.2:3456", "Base", 200));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_private_endpoint_success_tags_local_network);
    RUN_TEST(test_public_endpoint_success_tags_internet_without_relay);
    RUN_TEST(test_enrichment_applies_only_present_fields);
    RUN_TEST(test_self_relay_mirrors_live_flag_without_probe);
    RUN_TEST(test_relay_negative_keeps_direct_success);
    RUN_TEST(test_relay_success_alone_brings_peer_online);
    RUN_TEST(test_direct_failure_strips_local_tags_and_timeout_keeps_internet_tag);
    RUN_TEST(test_no_relay_strips_internet_tag);
    RUN_TEST(test_radio_tag_keeps_peer_online_when_probes_fail);
    RUN_TEST(test_relay_unavailable_keeps_internet_tag);
    RUN_TEST(test_empty_radio_cycle_lets_failed_checks_go_offline);
    RUN_TEST(test_repeated_success_fires_single_transition);
    RUN_TEST(test_local_probe_switch_disables_direct_probe);
    RUN_TEST(test_relay_peer_on_lan_keeps_its_tag);
    RUN_TEST(test_unknown_callsign_reports_false);
    RUN_TEST(test_relay_client_merge_touches_only_listed_devices);
    RUN_TEST(test_ensure_relay_device_and_local_discovery);
    RUN_TEST(test_manual_add_creates_offline_record);
    return UNITY_END();
}
