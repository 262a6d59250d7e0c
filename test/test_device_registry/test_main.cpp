#include <unity.h>
#include <map>
#include <stdio.h>
#include <string>
#include <string.h>

#include "Modules/DevicesModule/DeviceRegistry.h"
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

static DeviceRegistry reg;

void setUp()
{
    reg = DeviceRegistry{};
}

void tearDown() {}

static DevicePatch namePatch(const char* name)
{
    DevicePatch p;
    p.name = name;
    return p;
}

void test_lookup_is_case_insensitive()
{
    TEST_ASSERT_EQUAL(UpsertResult::Created, reg.upsert("x1abc", namePatch("Alpha"), 10));
    const DeviceRecord* r = reg.get("X1ABC");
    TEST_ASSERT_NOT_NULL(r);
    TEST_ASSERT_EQUAL_STRING("X1ABC", r->callsign);
    TEST_ASSERT_EQUAL_PTR(r, reg.get("x1AbC"));
    TEST_ASSERT_EQUAL(UpsertResult::Updated, reg.upsert("X1abc", namePatch("Beta"), 20));
    TEST_ASSERT_EQUAL_UINT8(1, reg.count());
    TEST_ASSERT_EQUAL_STRING("Beta", reg.get("x1abc")->name);
}

void test_identical_patch_is_unchanged_and_keeps_generation()
{
    DevicePatch p = namePatch("Alpha");
    p.addTransports.add(Transport::Internet);
    p.hasOnline = true;
    p.online = true;
    TEST_ASSERT_EQUAL(UpsertResult::Created, reg.upsert("X1ABC", p, 10));
    const uint32_t gen = reg.generation();

    TEST_ASSERT_EQUAL(UpsertResult::Unchanged, reg.upsert("X1ABC", p, 20));
    TEST_ASSERT_EQUAL(UpsertResult::Unchanged, reg.upsert("x1abc", p, 30));
    TEST_ASSERT_EQUAL_UINT32(gen, reg.generation());
}

void test_absent_fields_are_kept_and_empty_string_clears()
{
    DevicePatch p = namePatch("Alpha");
    p.nickname = "Al";
    reg.upsert("X1ABC", p, 10);

    DevicePatch latency;
    latency.hasLatency = true;
    latency.latencyMs = 42;
    reg.upsert("X1ABC", latency, 20);
    TEST_ASSERT_EQUAL_STRING("Alpha", reg.get("X1ABC")->name);
    TEST_ASSERT_EQUAL_STRING("Al", reg.get("X1ABC")->nickname);

    DevicePatch clear;
    clear.nickname = "";
    TEST_ASSERT_EQUAL(UpsertResult::Updated, reg.upsert("X1ABC", clear, 30));
    TEST_ASSERT_EQUAL_STRING("", reg.get("X1ABC")->nickname);
    TEST_ASSERT_EQUAL_STRING("Alpha", reg.get("X1ABC")->name);
}

void test_oversized_patch_is_rejected_whole()
{
    reg.upsert("X1ABC", namePatch("Alpha"), 10);
    const uint32_t gen = reg.generation();

    char longName[Limits::Peers::NameBuf + 8];
    memset(longName, 'n', sizeof(longName) - 1);
    longName[sizeof(longName) - 1] = '\0';

    DevicePatch p;
    p.nickname = "Short";
    p.name = longName;
    p.hasOnline = true;
    p.online = true;
    TEST_ASSERT_EQUAL(UpsertResult::Rejected, reg.upsert("X1ABC", p, 20));

    const DeviceRecord* r = reg.get("X1ABC");
    TEST_ASSERT_EQUAL_STRING("Alpha", r->name);
    TEST_ASSERT_EQUAL_STRING("", r->nickname);
    TEST_ASSERT_FALSE(r->online);
    TEST_ASSERT_EQUAL_UINT32(gen, reg.generation());
}

void test_invalid_callsign_and_full_table_are_rejected()
{
    TEST_ASSERT_EQUAL(UpsertResult::Rejected, reg.upsert("", namePatch("x"), 0));
    TEST_ASSERT_EQUAL(UpsertResult::Rejected, reg.upsert("bad callsign", namePatch("x"), 0));

    char cs[Limits::Peers::CallsignBuf];
    for (uint8_t i = 0; i < Limits::Peers::MaxDevices; ++i) {
        snprintf(cs, sizeof(cs), "N%u", (unsigned)i);
        TEST_ASSERT_EQUAL(UpsertResult::Created, reg.upsert(cs, DevicePatch{}, 0));
    }
    TEST_ASSERT_EQUAL(UpsertResult::Rejected, reg.upsert("OVERFLOW", DevicePatch{}, 0));
    TEST_ASSERT_EQUAL(UpsertResult::Unchanged, reg.upsert("N0", DevicePatch{}, 0));
}

void test_all_orders_pinned_online_then_name()
{
    DevicePatch p;

    p = namePatch("delta");
    reg.upsert("D1", p, 0);

    p = namePatch("Charlie");
    p.hasOnline = true;
    p.online = true;
    reg.upsert("C1", p, 0);

    p = namePatch("bravo");
    p.hasOnline = true;
    p.online = true;
    reg.upsert("B1", p, 0);

    p = namePatch("zulu");
    p.hasPinned = true;
    p.pinned = true;
    reg.upsert("Z1", p, 0);

    p = namePatch("Alpha");
    reg.upsert("A1", p, 0);

    const DeviceRecord* out[Limits::Peers::MaxDevices];
    const uint8_t n = reg.all(out, Limits::Peers::MaxDevices);
    TEST_ASSERT_EQUAL_UINT8(5, n);
    TEST_ASSERT_EQUAL_STRING("Z1", out[0]->callsign);
    TEST_ASSERT_EQUAL_STRING("B1", out[1]->callsign);
    TEST_ASSERT_EQUAL_STRING("C1", out[2]->callsign);
    TEST_ASSERT_EQUAL_STRING("A1", out[3]->callsign);
    TEST_ASSERT_EQUAL_STRING("D1", out[4]->callsign);
}

void test_all_excludes_local_identity()
{
    reg.upsert("ME1", namePatch("me"), 0);
    reg.upsert("YOU1", namePatch("you"), 0);
    TEST_ASSERT_TRUE(reg.setLocalCallsign("me1"));

    const DeviceRecord* out[4];
    TEST_ASSERT_EQUAL_UINT8(1, reg.all(out, 4));
    TEST_ASSERT_EQUAL_STRING("YOU1", out[0]->callsign);
    TEST_ASSERT_EQUAL_UINT8(2, reg.count());
}

void test_remove_evicts_cache_entry()
{
    MemoryBackend backend;
    StatusCache cache(backend);
    reg.setStatusCache(&cache);

    reg.upsert("X1ABC", namePatch("Alpha"), 0);
    TEST_ASSERT_TRUE(cache.save(reg.get("X1ABC")));
    TEST_ASSERT_EQUAL(1, (int)backend.kv.count("d_X1ABC"));

    TEST_ASSERT_TRUE(reg.remove("x1abc"));
    TEST_ASSERT_NULL(reg.get("X1ABC"));
    TEST_ASSERT_EQUAL(0, (int)backend.kv.count("d_X1ABC"));

    DeviceRecord restored;
    TEST_ASSERT_FALSE(cache.load("X1ABC", restored));
    TEST_ASSERT_FALSE(reg.remove("X1ABC"));
}

void test_idle_cleanup_only_removes_unpinned_default_folder_records()
{
    const uint32_t day = 24UL * 3600UL * 1000UL;

    reg.upsert("IDLE1", DevicePatch{}, 0);

    DevicePatch pinned;
    pinned.hasPinned = true;
    pinned.pinned = true;
    reg.upsert("PIN1", pinned, 0);

    DevicePatch filed;
    filed.hasFolder = true;
    filed.folderId = 3;
    reg.upsert("FOLD1", filed, 0);

    DevicePatch live;
    live.addTransports.add(Transport::Internet);
    live.hasOnline = true;
    live.online = true;
    live.hasSeenAt = true;
    live.seenAtMs = 0;
    reg.upsert("LIVE1", live, 0);

    DevicePatch recent;
    recent.addTransports.add(Transport::LocalNetwork);
    recent.hasSeenAt = true;
    recent.seenAtMs = day;
    reg.upsert("RECENT1", recent, 0);
    DevicePatch drop;
    drop.removeTransports.add(Transport::LocalNetwork);
    reg.upsert("RECENT1", drop, day);

    TEST_ASSERT_EQUAL_UINT8(0, reg.removeIdle(day - 1, day, 0));
    TEST_ASSERT_EQUAL_UINT8(1, reg.removeIdle(day + 10, day, 0));
    TEST_ASSERT_NULL(reg.get("IDLE1"));
    TEST_ASSERT_NOT_NULL(reg.get("PIN1"));
    TEST_ASSERT_NOT_NULL(reg.get("FOLD1"));
    TEST_ASSERT_NOT_NULL(reg.get("LIVE1"));
    TEST_ASSERT_NOT_NULL(reg.get("RECENT1"));

    TEST_ASSERT_EQUAL_UINT8(1, reg.removeIdle(2 * day, day, 0));
    TEST_ASSERT_NULL(reg.get("RECENT1"));
}

void test_reassign_folder_moves_records()
{
    DevicePatch filed;
    filed.hasFolder = true;
    filed.folderId = 2;
    reg.upsert("A1", filed, 0);
    reg.upsert("B1", filed, 0);
    reg.upsert("C1", DevicePatch{}, 0);

    TEST_ASSERT_EQUAL_UINT8(2, reg.reassignFolder(2, 0));
    TEST_ASSERT_EQUAL_UINT8(0, reg.get("A1")->folderId);
    TEST_ASSERT_EQUAL_UINT8(0, reg.get("B1")->folderId);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_lookup_is_case_insensitive);
    RUN_TEST(test_identical_patch_is_unchanged_and_keeps_generation);
    RUN_TEST(test_absent_fields_are_kept_and_empty_string_clears);
    RUN_TEST(test_oversized_patch_is_rejected_whole);
    RUN_TEST(test_invalid_callsign_and_full_table_are_rejected);
    RUN_TEST(test_all_orders_pinned_online_then_name);
    RUN_TEST(test_all_excludes_local_identity);
    RUN_TEST(test_remove_evicts_cache_entry);
    RUN_TEST(test_idle_cleanup_only_removes_unpinned_default_folder_records);
    RUN_TEST(test_reassign_folder_moves_records);
    return UNITY_END();
}
