#include "storage.h"

#include <gtest/gtest.h>

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <string>
#include <vector>

namespace {

// Fresh directory under /tmp, removed with its snapshots afterwards
class FileStorageTest : public ::testing::Test {
protected:
    void SetUp() {
        char templ[] = "/tmp/canvas_room_storage_XXXXXX";
        char* dir = mkdtemp(templ);
        ASSERT_NE(dir, nullptr);
        m_dir = dir;
    }

    void TearDown() {
        for (size_t i = 0; i < m_created.size(); i++) {
            unlink(m_created[i].c_str());
        }
        rmdir(m_dir.c_str());
    }

    void track(const std::string& path) { m_created.push_back(path); }

    std::string m_dir;
    std::vector<std::string> m_created;
};

}  // namespace

TEST(StorageKeys, escapes_unsafe_room_ids) {
    EXPECT_EQ(escape_room_id("doc-1"), "doc-1");
    EXPECT_EQ(escape_room_id("canvas_2.v1"), "canvas_2.v1");
    EXPECT_EQ(escape_room_id("../etc/passwd"), "%2E.%2Fetc%2Fpasswd");
    EXPECT_EQ(escape_room_id("a b"), "a%20b");
}

TEST(StorageKeys, long_room_ids_get_bounded_names) {
    std::string longest(255, 'a');
    std::string key = escape_room_id(longest);
    EXPECT_LE(key.size(), 200u);
    EXPECT_EQ(key.compare(0, 10, "aaaaaaaaaa"), 0);
    EXPECT_NE(key.find('~'), std::string::npos);

    // Same prefix, different tail
    std::string other = longest;
    other[254] = 'b';
    EXPECT_NE(escape_room_id(other), key);

    // Every byte escaped triples the length
    std::string escaped = escape_room_id(std::string(255, '/'));
    EXPECT_LE(escaped.size(), 200u);
    size_t tilde = escaped.find('~');
    ASSERT_NE(tilde, std::string::npos);
    EXPECT_EQ(tilde % 3, 0u);

    EXPECT_EQ(escape_room_id(std::string(200, 'a')), std::string(200, 'a'));
}

TEST_F(FileStorageTest, maximum_length_room_ids_round_trip) {
    FileStorage storage(m_dir);
    ASSERT_TRUE(storage.init());

    std::string ascii(252, 'a');
    std::string utf8;
    for (int i = 0; i < 15; i++) utf8 += "\xE7\x94\xBB\xE5\xB8\x83";
    std::string escaped(255, '%');
    track(storage.path_for(ascii));
    track(storage.path_for(utf8));
    track(storage.path_for(escaped));

    std::vector<uint8_t> out;
    EXPECT_EQ(storage.get(ascii, &out), STORAGE_NOT_FOUND);
    ASSERT_TRUE(storage.put(ascii, std::vector<uint8_t>(1, 1)));
    ASSERT_TRUE(storage.put(utf8, std::vector<uint8_t>(1, 2)));
    ASSERT_TRUE(storage.put(escaped, std::vector<uint8_t>(1, 3)));

    ASSERT_EQ(storage.get(ascii, &out), STORAGE_OK);
    EXPECT_EQ(out[0], 1);
    ASSERT_EQ(storage.get(utf8, &out), STORAGE_OK);
    EXPECT_EQ(out[0], 2);
    ASSERT_EQ(storage.get(escaped, &out), STORAGE_OK);
    EXPECT_EQ(out[0], 3);
}

TEST_F(FileStorageTest, missing_snapshot_is_not_found) {
    FileStorage storage(m_dir);
    ASSERT_TRUE(storage.init());

    std::vector<uint8_t> out;
    EXPECT_EQ(storage.get("doc-1", &out), STORAGE_NOT_FOUND);
}

TEST_F(FileStorageTest, put_then_get_returns_bytes) {
    FileStorage storage(m_dir);
    ASSERT_TRUE(storage.init());
    track(storage.path_for("doc-1"));

    std::vector<uint8_t> data = {0, 1, 2, 250, 0};
    ASSERT_TRUE(storage.put("doc-1", data));

    std::vector<uint8_t> out;
    ASSERT_EQ(storage.get("doc-1", &out), STORAGE_OK);
    EXPECT_EQ(out, data);

    // Overwrite replaces the previous snapshot
    std::vector<uint8_t> newer = {7};
    ASSERT_TRUE(storage.put("doc-1", newer));
    ASSERT_EQ(storage.get("doc-1", &out), STORAGE_OK);
    EXPECT_EQ(out, newer);
}

TEST_F(FileStorageTest, rooms_do_not_share_files) {
    FileStorage storage(m_dir);
    ASSERT_TRUE(storage.init());
    track(storage.path_for("a/b"));
    track(storage.path_for("a_b"));

    EXPECT_NE(storage.path_for("a/b"), storage.path_for("a_b"));
    ASSERT_TRUE(storage.put("a/b", std::vector<uint8_t>(1, 1)));
    ASSERT_TRUE(storage.put("a_b", std::vector<uint8_t>(1, 2)));

    std::vector<uint8_t> out;
    ASSERT_EQ(storage.get("a/b", &out), STORAGE_OK);
    EXPECT_EQ(out[0], 1);
}

TEST_F(FileStorageTest, put_fails_when_directory_is_gone) {
    FileStorage storage(m_dir + "/missing");
    EXPECT_FALSE(storage.put("doc-1", std::vector<uint8_t>(3, 0)));
}

TEST(Storage, alarms_fire_once_when_due) {
    MemoryStorage storage;
    ASSERT_TRUE(storage.set_alarm("a", 100));
    ASSERT_TRUE(storage.set_alarm("b", 300));

    EXPECT_TRUE(storage.take_due_alarms(99).empty());

    std::vector<std::string> due = storage.take_due_alarms(100);
    ASSERT_EQ(due.size(), 1u);
    EXPECT_EQ(due[0], "a");
    EXPECT_TRUE(storage.take_due_alarms(200).empty());
    EXPECT_TRUE(storage.has_alarm("b", nullptr));
}

TEST(Storage, set_alarm_replaces_previous_slot) {
    MemoryStorage storage;
    storage.set_alarm("a", 100);
    storage.set_alarm("a", 500);

    EXPECT_TRUE(storage.take_due_alarms(100).empty());
    EXPECT_EQ(storage.take_due_alarms(500).size(), 1u);
}

TEST(Storage, deleted_alarm_never_fires) {
    MemoryStorage storage;
    storage.set_alarm("a", 100);
    storage.delete_alarm("a");
    EXPECT_TRUE(storage.take_due_alarms(1000).empty());
}

TEST(Storage, memory_storage_failure_switches) {
    MemoryStorage storage;
    std::vector<uint8_t> out;

    storage.set_fail_writes(true);
    EXPECT_FALSE(storage.put("a", std::vector<uint8_t>(1, 1)));
    storage.set_fail_writes(false);
    EXPECT_TRUE(storage.put("a", std::vector<uint8_t>(1, 1)));

    storage.set_fail_reads(true);
    EXPECT_EQ(storage.get("a", &out), STORAGE_ERROR);
    storage.set_fail_reads(false);
    EXPECT_EQ(storage.get("a", &out), STORAGE_OK);
}
