#include <unity.h>
#include <string.h>

#include "Modules/DevicesModule/NetAddress.h"
#include "Modules/DevicesModule/PeerTypes.h"

void setUp() {}
void tearDown() {}

void test_every_transport_has_label_and_wire_name()
{
    for (uint8_t i = 0; i < kTransportCount; ++i) {
        const Transport t = (Transport)i;
        TEST_ASSERT_TRUE(strlen(transportLabel(t)) > 0);
        TEST_ASSERT_NOT_EQUAL(0, strcmp(transportLabel(t), "?"));

        Transport back = Transport::Count;
        TEST_ASSERT_TRUE(transportFromWireName(transportWireName(t), back));
        TEST_ASSERT_EQUAL_UINT8(i, (uint8_t)back);
    }
    TEST_ASSERT_EQUAL_STRING("LAN", transportLabel(Transport::LocalNetwork));
    TEST_ASSERT_EQUAL_STRING("Internet", transportLabel(Transport::Internet));
    TEST_ASSERT_EQUAL_STRING("Bluetooth", transportLabel(Transport::ShortRangeRadio));
    TEST_ASSERT_EQUAL_STRING("USB", transportLabel(Transport::WiredLink));
}

void test_legacy_aliases_are_accepted()
{
    Transport t = Transport::Count;
    TEST_ASSERT_TRUE(transportFromWireName("wifi_local", t));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Transport::LocalNetwork, (uint8_t)t);
    TEST_ASSERT_TRUE(transportFromWireName("bluetooth_plus", t));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Transport::RadioEnhanced, (uint8_t)t);
    TEST_ASSERT_TRUE(transportFromWireName("usb", t));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Transport::WiredLink, (uint8_t)t);
    TEST_ASSERT_FALSE(transportFromWireName("carrier-pigeon", t));
    TEST_ASSERT_FALSE(transportFromWireName("", t));
}

void test_session_tags_are_stripped()
{
    TransportSet s;
    s.add(Transport::Internet);
    s.add(Transport::ShortRangeRadio);
    s.add(Transport::WiredLink);
    TEST_ASSERT_EQUAL_UINT8(3, s.count());
    TEST_ASSERT_TRUE(withoutSessionTags(s).empty());
}

void test_transport_set_first_follows_enum_order()
{
    TransportSet s;
    Transport t;
    TEST_ASSERT_FALSE(s.first(t));
    s.add(Transport::WiredLink);
    s.add(Transport::Internet);
    TEST_ASSERT_TRUE(s.first(t));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Transport::Internet, (uint8_t)t);
    TEST_ASSERT_FALSE(s.hasRadio());
    TEST_ASSERT_FALSE(s.hasLocal());
}

void test_normalize_callsign()
{
    char out[Limits::Peers::CallsignBuf];
    TEST_ASSERT_TRUE(normalizeCallsign("  x1abc \r\n", out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("X1ABC", out);
    TEST_ASSERT_TRUE(normalizeCallsign("ble-a1b2c3", out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("BLE-A1B2C3", out);
    TEST_ASSERT_FALSE(normalizeCallsign("", out, sizeof(out)));
    TEST_ASSERT_FALSE(normalizeCallsign("   ", out, sizeof(out)));
    TEST_ASSERT_FALSE(normalizeCallsign("has space", out, sizeof(out)));
    TEST_ASSERT_FALSE(normalizeCallsign("ABCDEFGHIJKLM", out, sizeof(out)));
    TEST_ASSERT_FALSE(normalizeCallsign(nullptr, out, sizeof(out)));
}

void test_proximity_labels()
{
    TEST_ASSERT_EQUAL_STRING("Very close", proximityLabel(-40));
    TEST_ASSERT_EQUAL_STRING("Nearby", proximityLabel(-50));
    TEST_ASSERT_EQUAL_STRING("Nearby", proximityLabel(-69));
    TEST_ASSERT_EQUAL_STRING("In range", proximityLabel(-70));
    TEST_ASSERT_EQUAL_STRING("In range", proximityLabel(-84));
    TEST_ASSERT_EQUAL_STRING("Far", proximityLabel(-85));
    TEST_ASSERT_EQUAL_STRING("Far", proximityLabel(-100));
}

void test_display_name_precedence()
{
    DeviceRecord r;
    strcpy(r.callsign, "X1ABC");
    TEST_ASSERT_EQUAL_STRING("X1ABC", displayName(r));
    strcpy(r.name, "Base");
    TEST_ASSERT_EQUAL_STRING("Base", displayName(r));
    strcpy(r.nickname, "Alpha");
    TEST_ASSERT_EQUAL_STRING("Alpha", displayName(r));
}

void test_private_host_classification()
{
    TEST_ASSERT_TRUE(isPrivateHost("http://192.168.1.5:8080"));
    TEST_ASSERT_TRUE(isPrivateHost("http://10.0.0.7/api"));
    TEST_ASSERT_TRUE(isPrivateHost("http://172.16.4.1"));
    TEST_ASSERT_TRUE(isPrivateHost("http://172.31.255.1:3456"));
    TEST_ASSERT_TRUE(isPrivateHost("http://127.0.0.1:3456"));
    TEST_ASSERT_TRUE(isPrivateHost("http://localhost:3456"));
    TEST_ASSERT_FALSE(isPrivateHost("http://172.32.0.1"));
    TEST_ASSERT_FALSE(isPrivateHost("https://relay.example.org"));
    TEST_ASSERT_FALSE(isPrivateHost("http://8.8.8.8"));
}

void test_url_host_extraction()
{
    char host[64];
    TEST_ASSERT_TRUE(urlHost("https://user@relay.example.org:443/ws", host, sizeof(host)));
    TEST_ASSERT_EQUAL_STRING("relay.example.org", host);
    TEST_ASSERT_TRUE(urlHost("http://[::1]:8080/", host, sizeof(host)));
    TEST_ASSERT_EQUAL_STRING("::1", host);
}

void test_relay_socket_url_rewrite()
{
    char base[96];
    TEST_ASSERT_TRUE(relayHttpBase("wss://relay.example.org/ws", base, sizeof(base)));
    TEST_ASSERT_EQUAL_STRING("https://relay.example.org", base);
    TEST_ASSERT_TRUE(relayHttpBase("ws://192.168.1.2:8080/", base, sizeof(base)));
    TEST_ASSERT_EQUAL_STRING("http://192.168.1.2:8080", base);
    TEST_ASSERT_TRUE(relayHttpBase("https://relay.example.org", base, sizeof(base)));
    TEST_ASSERT_EQUAL_STRING("https://relay.example.org", base);
    TEST_ASSERT_FALSE(relayHttpBase("ftp://relay.example.org", base, sizeof(base)));
}

void test_join_url_single_slash()
{
    char url[96];
    TEST_ASSERT_TRUE(joinUrl("http://a:1/", "/api/status", url, sizeof(url)));
    TEST_ASSERT_EQUAL_STRING("http://a:1/api/status", url);
    TEST_ASSERT_TRUE(joinUrl("http://a:1", "api/status", url, sizeof(url)));
    TEST_ASSERT_EQUAL_STRING("http://a:1/api/status", url);

    const uint8_t ip[4] = {192, 168, 1, 5};
    TEST_ASSERT_TRUE(formatLocalUrl(ip, 8080, url, sizeof(url)));
    TEST_ASSERT_EQUAL_STRING("http://192.168.1.5:8080", url);
}

void test_socket_url_split()
{
    char host[48];
    char path[32];
    uint16_t port = 0;
    bool tls = false;

    TEST_ASSERT_TRUE(parseSocketUrl("wss://relay.example.org/ws", host, sizeof(host), port, path, sizeof(path), tls));
    TEST_ASSERT_EQUAL_STRING("relay.example.org", host);
    TEST_ASSERT_EQUAL_UINT16(443, port);
    TEST_ASSERT_EQUAL_STRING("/ws", path);
    TEST_ASSERT_TRUE(tls);

    TEST_ASSERT_TRUE(parseSocketUrl("ws://192.168.1.2:8080", host, sizeof(host), port, path, sizeof(path), tls));
    TEST_ASSERT_EQUAL_STRING("192.168.1.2", host);
    TEST_ASSERT_EQUAL_UINT16(8080, port);
    TEST_ASSERT_EQUAL_STRING("/", path);
    TEST_ASSERT_FALSE(tls);

    TEST_ASSERT_FALSE(parseSocketUrl("http://relay.example.org", host, sizeof(host), port, path, sizeof(path), tls));
    TEST_ASSERT_FALSE(parseSocketUrl("ws://relay:99999/", host, sizeof(host), port, path, sizeof(path), tls));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_every_transport_has_label_and_wire_name);
    RUN_TEST(test_legacy_aliases_are_accepted);
    RUN_TEST(test_session_tags_are_stripped);
    RUN_TEST(test_transport_set_first_follows_enum_order);
    RUN_TEST(test_normalize_callsign);
    RUN_TEST(test_proximity_labels);
    RUN_TEST(test_display_name_precedence);
    RUN_TEST(test_private_host_classification);
    RUN_TEST(test_url_host_extraction);
    RUN_TEST(test_relay_socket_url_rewrite);
    RUN_TEST(test_join_url_single_slash);
    RUN_TEST(test_socket_url_split);
    return UNITY_END();
}
