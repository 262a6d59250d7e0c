#include <unity.h>
#include <map>
#include <string>
#include <string.h>

#include "Modules/DevicesModule/StatusCache.h"

class MemoryBackend : public IStatusCacheBackend {
public:
    bool put(const char* key, const char* value) override { kv[key] = value; return true; }
    bool get(const char* key, char* out, size_t outLen) override
    {
        auto it = kv.find(key);
        if (it == kv.end() || it->second.size() >= outLen) return false;
        memcpy(out, it->second.c_str(), it->second.size() + 1);
        return true;
    }
    bool erase(const char* key) override { kv.erase(key); return true; }
    bool clear() override { kv.clear(); return true; }

    std::map<std::string, std::string> kv;
};

static MemoryBackend backend;
static StatusCache cache(backend);

void setUp()
{
    backend.kv.clear();
}

void tearDown() {}

static DeviceRecord liveRecord(const char* callsign)
{
    DeviceRecord r;
    strcpy(r.callsign, callsign);
    strcpy(r.name, "Base");
    strcpy(r.nickname, "Alpha");
    strcpy(r.endpoint, "http://192.168.1.5:8080");
    strcpy(r.color, "blue");
    r.online = true;
    r.latencyMs = 300;
    r.lastSeenMs = 1234;
    r.lastFetchedMs = 999;
    r.transports.add(Transport::LocalNetwork);
    r.transports.add(Transport::ShortRangeRadio);
    r.transports.add(Transport::WiredLink);
    r.hasRssi = true;
    r.rssi = -55;
    strcpy(r.proximity, "Nearby");
    r.hasLocation = true;
    r.latitude = 38.5;
    r.longitude = -9.25;
    r.pinned = true;
    r.folderId = 2;
    r.source = PeerSource::LocalScan;
    return r;
}

void test_round_trip_keeps_identity_and_drops_session_state()
{
    TEST_ASSERT_TRUE(cache.save(liveRecord("X1ABC")));

    const std::string& text = backend.kv["d_X1ABC"];
    TEST_ASSERT_TRUE(text.find("local-network") == std::string::npos);
    TEST_ASSERT_TRUE(text.find("Nearby") == std::string::npos);

    DeviceRecord r;
    TEST_ASSERT_TRUE(cache.load("x1abc", r));
    TEST_ASSERT_EQUAL_STRING("X1ABC", r.callsign);
    TEST_ASSERT_EQUAL_STRING("Base", r.name);
    TEST_ASSERT_EQUAL_STRING("Alpha", r.nickname);
    TEST_ASSERT_EQUAL_STRING("http://192.168.1.5:8080", r.endpoint);
    TEST_ASSERT_EQUAL_STRING("blue", r.color);
    TEST_ASSERT_EQUAL_UINT32(1234, r.lastSeenMs);
    TEST_ASSERT_EQUAL_UINT32(999, r.lastFetchedMs);
    TEST_ASSERT_TRUE(r.hasLocation);
    TEST_ASSERT_TRUE(r.pinned);
    TEST_ASSERT_EQUAL_UINT8(2, r.folderId);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PeerSource::LocalScan, (uint8_t)r.source);

    TEST_ASSERT_FALSE(r.online);
    TEST_ASSERT_TRUE(r.transports.empty());
    TEST_ASSERT_FALSE(r.hasRssi);
    TEST_ASSERT_EQUAL_STRING("", r.proximity);
    TEST_ASSERT_EQUAL_INT32(-1, r.latencyMs);
}

void test_session_fields_written_by_others_are_stripped_on_load()
{
    backend.kv["d_X1ABC"] =
        "{\"cs\":\"x1abc\",\"nm\":\"Base\",\"online\":true,\"tags\":[\"internet\"],\"rssi\":-40}";
    DeviceRecord r;
    TEST_ASSERT_TRUE(cache.load("X1ABC", r));
    TEST_ASSERT_EQUAL_STRING("Base", r.name);
    TEST_ASSERT_FALSE(r.online);
    TEST_ASSERT_TRUE(r.transports.empty());
    TEST_ASSERT_FALSE(r.hasRssi);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PeerSource::Cache, (uint8_t)r.source);
}

static uint8_t restored = 0;
static void countRecord(void* ctx, const DeviceRecord& rec)
{
    (void)ctx;
    TEST_ASSERT_TRUE(rec.transports.empty());
    ++restored;
}

void test_index_tracks_saved_and_evicted_records()
{
    restored = 0;
    cache.save(liveRecord("A1"));
    cache.save(liveRecord("B1"));
    cache.save(liveRecord("A1"));
    TEST_ASSERT_EQUAL_UINT8(2, cache.loadAll(countRecord, nullptr));
    TEST_ASSERT_EQUAL_UINT8(2, restored);

    TEST_ASSERT_TRUE(cache.evict("a1"));
    restored = 0;
    TEST_ASSERT_EQUAL_UINT8(1, cache.loadAll(countRecord, nullptr));
    TEST_ASSERT_EQUAL(0, (int)backend.kv.count("d_A1"));
}

void test_malformed_record_is_skipped()
{
    backend.kv["d_X1ABC"] = "{not json";
    backend.kv["idx"] = "[\"X1ABC\"]";
    DeviceRecord r;
    TEST_ASSERT_FALSE(cache.load("X1ABC", r));
    restored = 0;
    TEST_ASSERT_EQUAL_UINT8(0, cache.loadAll(countRecord, nullptr));
}

void test_collections_round_trip()
{
    CollectionDescriptor items[2];
    strcpy(items[0].name, "chat");
    strcpy(items[0].kind, "chat");
    strcpy(items[0].description, "Chat collection");
    strcpy(items[1].name, "blog");
    strcpy(items[1].kind, "blog");
    items[1].fileCount = 7;
    items[1].isPublic = false;

    TEST_ASSERT_TRUE(cache.saveCollections("X1ABC", items, 2));
    TEST_ASSERT_EQUAL(1, (int)backend.kv.count("c_X1ABC"));

    CollectionDescriptor out[4];
    TEST_ASSERT_EQUAL_UINT8(2, cache.loadCollections("x1abc", out, 4));
    TEST_ASSERT_EQUAL_STRING("chat", out[0].name);
    TEST_ASSERT_EQUAL_STRING("Chat collection", out[0].description);
    TEST_ASSERT_EQUAL_INT32(-1, out[0].fileCount);
    TEST_ASSERT_EQUAL_INT32(7, out[1].fileCount);
    TEST_ASSERT_FALSE(out[1].isPublic);

    cache.save(liveRecord("X1ABC"));
    cache.evict("X1ABC");
    TEST_ASSERT_EQUAL(0, (int)backend.kv.count("c_X1ABC"));
}

void test_folders_and_wipe()
{
    TEST_ASSERT_TRUE(cache.saveFolders("[{\"id\":0,\"name\":\"Discovered\"}]"));
    char buf[128];
    TEST_ASSERT_TRUE(cache.loadFolders(buf, sizeof(buf)));
    TEST_ASSERT_EQUAL_STRING("[{\"id\":0,\"name\":\"Discovered\"}]", buf);

    cache.save(liveRecord("X1ABC"));
    TEST_ASSERT_TRUE(cache.wipe());
    TEST_ASSERT_TRUE(backend.kv.empty());
    TEST_ASSERT_FALSE(cache.loadFolders(buf, sizeof(buf)));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_round_trip_keeps_identity_and_drops_session_state);
    RUN_TEST(test_session_fields_written_by_others_are_stripped_on_load);
    RUN_TEST(test_index_tracks_saved_and_evicted_records);
    RUN_TEST(test_malformed_record_is_skipped);
    RUN_TEST(test_collections_round_trip);
    RUN_TEST(test_folders_and_wipe);
    return UNITY_END();
}
