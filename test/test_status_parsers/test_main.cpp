#include <unity.h>
#include <string.h>

#include "Modules/DevicesModule/StatusParsers.h"

void setUp() {}
void tearDown() {}

void test_status_body_with_nested_location()
{
    StatusInfo info;
    TEST_ASSERT_TRUE(parseStatusBody(
        "{\"callsign\":\"x1abc\",\"nickname\":\"Alpha\",\"color\":\"blue\","
        "\"platform\":\"android\",\"location\":{\"latitude\":38.7,\"longitude\":-9.1}}",
        info));
    TEST_ASSERT_TRUE(info.hasCallsign);
    TEST_ASSERT_EQUAL_STRING("X1ABC", info.callsign);
    TEST_ASSERT_TRUE(info.hasNickname);
    TEST_ASSERT_EQUAL_STRING("Alpha", info.nickname);
    TEST_ASSERT_TRUE(info.hasColor);
    TEST_ASSERT_TRUE(info.hasPlatform);
    TEST_ASSERT_FALSE(info.hasDescription);
    TEST_ASSERT_FALSE(info.hasNpub);
    TEST_ASSERT_TRUE(info.hasLocation);
    TEST_ASSERT_TRUE(info.latitude > 38.69 && info.latitude < 38.71);
    TEST_ASSERT_FALSE(info.isRelay);
}

void test_status_body_relay_detection()
{
    StatusInfo info;
    TEST_ASSERT_TRUE(parseStatusBody("{\"stationCallsign\":\"X3RELAY\"}", info));
    TEST_ASSERT_EQUAL_STRING("X3RELAY", info.callsign);
    TEST_ASSERT_TRUE(info.isRelay);

    TEST_ASSERT_TRUE(parseStatusBody("{\"service\":\"Geogram Station Server\",\"latitude\":1.5,\"longitude\":2.5}", info));
    TEST_ASSERT_TRUE(info.isRelay);
    TEST_ASSERT_FALSE(info.hasCallsign);
    TEST_ASSERT_TRUE(info.hasLocation);
}

void test_status_body_malformed_leaves_fields_unset()
{
    StatusInfo info;
    TEST_ASSERT_FALSE(parseStatusBody("<html>ok</html>", info));
    TEST_ASSERT_FALSE(info.hasNickname);
    TEST_ASSERT_FALSE(parseStatusBody("", info));
    TEST_ASSERT_FALSE(parseStatusBody(nullptr, info));
    TEST_ASSERT_FALSE(parseStatusBody("[1,2]", info));

    TEST_ASSERT_TRUE(parseStatusBody("{\"nickname\":\"\",\"latitude\":\"north\"}", info));
    TEST_ASSERT_FALSE(info.hasNickname);
    TEST_ASSERT_FALSE(info.hasLocation);
}

void test_device_connected_flag()
{
    bool connected = false;
    TEST_ASSERT_TRUE(parseDeviceConnected("{\"connected\":true}", connected));
    TEST_ASSERT_TRUE(connected);
    TEST_ASSERT_TRUE(parseDeviceConnected("{\"connected\":false,\"callsign\":\"A1\"}", connected));
    TEST_ASSERT_FALSE(connected);

    connected = true;
    TEST_ASSERT_FALSE(parseDeviceConnected("{\"connected\":\"yes\"}", connected));
    TEST_ASSERT_FALSE(parseDeviceConnected("{}", connected));
    TEST_ASSERT_FALSE(parseDeviceConnected("garbage", connected));
    TEST_ASSERT_TRUE(connected);
}

void test_relay_client_list()
{
    RelayClient out[4];
    const uint8_t n = parseRelayClients(
        "{\"devices\":["
        "{\"callsign\":\"a1\",\"nickname\":\"Ann\",\"is_online\":true,"
        "\"connection_types\":[\"internet\",\"bluetooth\",\"bogus\"],\"latitude\":1.0,\"longitude\":2.0},"
        "{\"callsign\":\"\",\"is_online\":true},"
        "{\"callsign\":\"Unknown\",\"is_online\":true},"
        "{\"callsign\":\"B1\",\"is_online\":false}"
        "]}",
        out, 4);
    TEST_ASSERT_EQUAL_UINT8(2, n);
    TEST_ASSERT_EQUAL_STRING("A1", out[0].callsign);
    TEST_ASSERT_EQUAL_STRING("Ann", out[0].nickname);
    TEST_ASSERT_TRUE(out[0].online);
    TEST_ASSERT_TRUE(out[0].hasLocation);
    TEST_ASSERT_TRUE(out[0].reported.has(Transport::Internet));
    TEST_ASSERT_TRUE(out[0].reported.has(Transport::ShortRangeRadio));
    TEST_ASSERT_EQUAL_UINT8(2, out[0].reported.count());
    TEST_ASSERT_EQUAL_STRING("B1", out[1].callsign);
    TEST_ASSERT_FALSE(out[1].online);

    TEST_ASSERT_EQUAL_UINT8(0, parseRelayClients("{\"other\":[]}", out, 4));
    TEST_ASSERT_EQUAL_UINT8(0, parseRelayClients("nope", out, 4));
}

void test_file_listing_keeps_known_collection_directories()
{
    CollectionDescriptor out[8];
    const uint8_t n = parseFileCollections(
        "{\"entries\":["
        "{\"name\":\"chat\",\"isDirectory\":true},"
        "{\"name\":\"Blog\",\"type\":\"directory\"},"
        "{\"name\":\"photos\",\"isDirectory\":true},"
        "{\"name\":\"forum\",\"isDirectory\":false},"
        "{\"name\":\"readme.txt\",\"type\":\"file\"}"
        "]}",
        out, 8);
    TEST_ASSERT_EQUAL_UINT8(2, n);
    TEST_ASSERT_EQUAL_STRING("chat", out[0].kind);
    TEST_ASSERT_EQUAL_STRING("Chat collection", out[0].description);
    TEST_ASSERT_EQUAL_STRING("Blog", out[1].name);
    TEST_ASSERT_EQUAL_STRING("blog", out[1].kind);
    TEST_ASSERT_EQUAL_STRING("Blog collection", out[1].description);

    TEST_ASSERT_EQUAL_UINT8(0, parseFileCollections("{\"entries\":5}", out, 8));
    TEST_ASSERT_TRUE(isKnownCollectionKind("POSTCARDS"));
    TEST_ASSERT_FALSE(isKnownCollectionKind("photos"));
}

void test_relay_messages()
{
    RelayMessage msg;
    TEST_ASSERT_TRUE(parseRelayMessage("{\"type\":\"hello_ack\",\"success\":true,\"station_id\":\"x3relay\"}", msg));
    TEST_ASSERT_TRUE(msg.type == RelayMessageType::HelloAck);
    TEST_ASSERT_TRUE(msg.success);
    TEST_ASSERT_EQUAL_STRING("X3RELAY", msg.stationId);

    TEST_ASSERT_TRUE(parseRelayMessage("{\"type\":\"hello_ack\",\"success\":false}", msg));
    TEST_ASSERT_FALSE(msg.success);

    TEST_ASSERT_TRUE(parseRelayMessage("{\"type\":\"PING\"}", msg));
    TEST_ASSERT_TRUE(msg.type == RelayMessageType::Ping);

    TEST_ASSERT_TRUE(parseRelayMessage("{\"type\":\"chat\"}", msg));
    TEST_ASSERT_TRUE(msg.type == RelayMessageType::Other);
    TEST_ASSERT_FALSE(parseRelayMessage("not json", msg));

    char hello[64];
    TEST_ASSERT_TRUE(buildRelayHello("X1ABC", hello, sizeof(hello)));
    TEST_ASSERT_EQUAL_STRING("{\"type\":\"hello\",\"callsign\":\"X1ABC\"}", hello);
    TEST_ASSERT_FALSE(buildRelayHello("X1ABC", hello, 10));
}

void test_wired_hello_line()
{
    char cs[Limits::Peers::CallsignBuf];
    TEST_ASSERT_TRUE(parseWiredHello("{\"type\":\"hello\",\"callsign\":\"w1abc\"}", cs, sizeof(cs)));
    TEST_ASSERT_EQUAL_STRING("W1ABC", cs);
    TEST_ASSERT_FALSE(parseWiredHello("{\"type\":\"data\",\"callsign\":\"w1abc\"}", cs, sizeof(cs)));
    TEST_ASSERT_FALSE(parseWiredHello("{\"type\":\"hello\"}", cs, sizeof(cs)));
    TEST_ASSERT_FALSE(parseWiredHello("hello w1abc", cs, sizeof(cs)));
}

void test_radio_advert_decoding()
{
    const uint8_t addr[6] = {0x24, 0x6F, 0x28, 0xA1, 0xB2, 0xC3};
    char key[Limits::Peers::CallsignBuf];
    bool named = false;

    const uint8_t withCallsign[] = {'>', 'x', '1', 'a', 'b', 'c', 0, 0xFF};
    TEST_ASSERT_TRUE(decodeRadioAdvert(withCallsign, sizeof(withCallsign), addr, key, sizeof(key), named));
    TEST_ASSERT_TRUE(named);
    TEST_ASSERT_EQUAL_STRING("X1ABC", key);

    const uint8_t noMarker[] = {'X', '1', 'A', 'B', 'C'};
    TEST_ASSERT_TRUE(decodeRadioAdvert(noMarker, sizeof(noMarker), addr, key, sizeof(key), named));
    TEST_ASSERT_FALSE(named);
    TEST_ASSERT_EQUAL_STRING("BLE-A1B2C3", key);

    const uint8_t markerOnly[] = {'>'};
    TEST_ASSERT_TRUE(decodeRadioAdvert(markerOnly, sizeof(markerOnly), addr, key, sizeof(key), named));
    TEST_ASSERT_FALSE(named);

    TEST_ASSERT_TRUE(decodeRadioAdvert(nullptr, 0, addr, key, sizeof(key), named));
    TEST_ASSERT_EQUAL_STRING("BLE-A1B2C3", key);
    TEST_ASSERT_FALSE(decodeRadioAdvert(withCallsign, sizeof(withCallsign), nullptr, key, sizeof(key), named));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_status_body_with_nested_location);
    RUN_TEST(test_status_body_relay_detection);
    RUN_TEST(test_status_body_malformed_leaves_fields_unset);
    RUN_TEST(test_device_connected_flag);
    RUN_TEST(test_relay_client_list);
    RUN_TEST(test_file_listing_keeps_known_collection_directories);
    RUN_TEST(test_relay_messages);
    RUN_TEST(test_wired_hello_line);
    RUN_TEST(test_radio_advert_decoding);
    return UNITY_END();
}
