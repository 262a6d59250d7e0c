#include <unity.h>
#include <string.h>

#include "Modules/DevicesModule/FolderTable.h"

void setUp() {}
void tearDown() {}

void test_default_folder_always_present()
{
    FolderTable t;
    TEST_ASSERT_EQUAL_UINT8(1, t.count());
    const Folder* f = t.get(0);
    TEST_ASSERT_NOT_NULL(f);
    TEST_ASSERT_EQUAL_STRING("Discovered", f->name);
    TEST_ASSERT_TRUE(f->expanded);
    TEST_ASSERT_TRUE(t.remove(0) == FolderResult::Protected);
    TEST_ASSERT_TRUE(t.rename(0, "Other") == FolderResult::Protected);
    TEST_ASSERT_EQUAL_STRING("Discovered", t.get(0)->name);
}

void test_add_rename_remove()
{
    FolderTable t;
    uint8_t work = 0;
    uint8_t home = 0;
    TEST_ASSERT_TRUE(t.add("Work", work) == FolderResult::Ok);
    TEST_ASSERT_TRUE(t.add("Home", home) == FolderResult::Ok);
    TEST_ASSERT_NOT_EQUAL(work, home);
    TEST_ASSERT_NOT_EQUAL(0, work);
    TEST_ASSERT_EQUAL_UINT8(3, t.count());
    TEST_ASSERT_TRUE(t.get(home)->rank > t.get(work)->rank);

    TEST_ASSERT_TRUE(t.rename(work, "Office") == FolderResult::Ok);
    TEST_ASSERT_EQUAL_STRING("Office", t.get(work)->name);

    TEST_ASSERT_TRUE(t.remove(work) == FolderResult::Ok);
    TEST_ASSERT_FALSE(t.exists(work));
    TEST_ASSERT_TRUE(t.remove(work) == FolderResult::UnknownFolder);
    TEST_ASSERT_TRUE(t.rename(work, "Again") == FolderResult::UnknownFolder);
}

void test_invalid_names_and_full_table()
{
    FolderTable t;
    uint8_t id = 0;
    TEST_ASSERT_TRUE(t.add("", id) == FolderResult::InvalidName);
    TEST_ASSERT_TRUE(t.add("   ", id) == FolderResult::InvalidName);
    TEST_ASSERT_TRUE(t.add(nullptr, id) == FolderResult::InvalidName);
    TEST_ASSERT_TRUE(t.add("a name that is far too long for a folder", id) == FolderResult::InvalidName);

    for (uint8_t i = 1; i < Limits::Peers::MaxFolders; ++i) {
        TEST_ASSERT_TRUE(t.add("F", id) == FolderResult::Ok);
    }
    TEST_ASSERT_TRUE(t.add("Overflow", id) == FolderResult::TableFull);
}

void test_flags()
{
    FolderTable t;
    uint8_t id = 0;
    t.add("Work", id);
    const bool collapsed = false;
    const bool chat = true;
    TEST_ASSERT_TRUE(t.setFlags(id, &collapsed, nullptr) == FolderResult::Ok);
    TEST_ASSERT_FALSE(t.get(id)->expanded);
    TEST_ASSERT_FALSE(t.get(id)->chatEnabled);
    TEST_ASSERT_TRUE(t.setFlags(id, nullptr, &chat) == FolderResult::Ok);
    TEST_ASSERT_TRUE(t.get(id)->chatEnabled);
    TEST_ASSERT_TRUE(t.setFlags(99, &chat, &chat) == FolderResult::UnknownFolder);
}

void test_json_codec_restores_table()
{
    FolderTable t;
    uint8_t work = 0;
    t.add("Work", work);
    const bool chat = true;
    t.setFlags(work, nullptr, &chat);

    char json[Limits::PeerJson::FoldersText];
    TEST_ASSERT_TRUE(t.toJson(json, sizeof(json)));

    FolderTable back;
    TEST_ASSERT_TRUE(back.fromJson(json));
    TEST_ASSERT_EQUAL_UINT8(2, back.count());
    TEST_ASSERT_EQUAL_STRING("Work", back.get(work)->name);
    TEST_ASSERT_TRUE(back.get(work)->chatEnabled);
    TEST_ASSERT_EQUAL_UINT8(0, back.at(0)->id);
}

void test_json_without_default_folder_gets_it_back()
{
    FolderTable t;
    TEST_ASSERT_TRUE(t.fromJson("[{\"id\":4,\"name\":\"Team\",\"rank\":1},{\"id\":4,\"name\":\"Dup\"},{\"name\":\"NoId\"}]"));
    TEST_ASSERT_EQUAL_UINT8(2, t.count());
    TEST_ASSERT_EQUAL_STRING("Discovered", t.get(0)->name);
    TEST_ASSERT_EQUAL_STRING("Team", t.get(4)->name);

    TEST_ASSERT_FALSE(t.fromJson("{\"id\":1}"));
    TEST_ASSERT_FALSE(t.fromJson(""));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_default_folder_always_present);
    RUN_TEST(test_add_rename_remove);
    RUN_TEST(test_invalid_names_and_full_table);
    RUN_TEST(test_flags);
    RUN_TEST(test_json_codec_restores_table);
    RUN_TEST(test_json_without_default_folder_gets_it_back);
    return UNITY_END();
}
