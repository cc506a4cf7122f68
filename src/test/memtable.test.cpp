// src/test/memtable.test.cpp
#include "gtest/gtest.h"
#include "lsm/arena.h"
#include "lsm/memtable.h"
#include "lsm/skiplist.h"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace strata;
using namespace strata::lsm;

namespace {

std::vector<Record> drain(EntryIterator& it) {
    std::vector<Record> out;
    while (it.hasNext()) {
        auto r = it.next();
        EXPECT_TRUE(r.isOk());
        if (!r.isOk()) break;
        out.push_back(r.value());
    }
    return out;
}

} // namespace

TEST(SkipListTest, UpsertFindAndOrder) {
    Arena arena;
    SkipList list(arena);

    EXPECT_EQ(list.Upsert("b", "2", 1, false), nullptr);
    EXPECT_EQ(list.Upsert("a", "1", 2, false), nullptr);
    EXPECT_EQ(list.Upsert("c", "3", 3, false), nullptr);

    const SkipList::Value* previous = list.Upsert("b", "22", 4, false);
    ASSERT_NE(previous, nullptr);
    EXPECT_EQ(previous->view(), "2");
    EXPECT_EQ(list.Count(), 3u);

    const SkipList::Value* found = list.Find("b");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->view(), "22");
    EXPECT_EQ(found->timestamp, 4);
    EXPECT_EQ(list.Find("zz"), nullptr);

    SkipList::Iterator it(&list);
    it.SeekToFirst();
    std::string keys;
    for (; it.Valid(); it.Next()) keys += std::string(it.key());
    EXPECT_EQ(keys, "abc");

    it.Seek("bb");
    ASSERT_TRUE(it.Valid());
    EXPECT_EQ(it.key(), "c");
}

TEST(SkipListTest, ArenaServesLargeAllocations) {
    Arena arena;
    char* small = arena.Allocate(16);
    char* big = arena.Allocate(64 * 1024);
    ASSERT_NE(small, nullptr);
    ASSERT_NE(big, nullptr);
    EXPECT_GE(arena.MemoryUsage(), 64u * 1024u);
}

TEST(MemTableTest, PutGetOverwrite) {
    MemTable mt;
    mt.put("k1", "v1", 1);
    mt.put("k2", "v2", 2);
    mt.put("k1", "v1b", 3);

    EXPECT_EQ(mt.get("k1"), std::optional<std::string>("v1b"));
    EXPECT_EQ(mt.get("k2"), std::optional<std::string>("v2"));
    EXPECT_FALSE(mt.get("missing").has_value());
    EXPECT_EQ(mt.entryCount(), 2u);
}

TEST(MemTableTest, TombstoneHidesValueButIsKept) {
    MemTable mt;
    mt.put("k", "value", 1);
    mt.remove("k", 2);

    EXPECT_FALSE(mt.get("k").has_value());
    auto record = mt.getRecord("k");
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->deleted);
    EXPECT_EQ(record->timestamp, 2);
    EXPECT_EQ(mt.entryCount(), 1u);

    mt.put("k", "again", 3);
    EXPECT_EQ(mt.get("k"), std::optional<std::string>("again"));
}

TEST(MemTableTest, SizeTracksReplacements) {
    MemTable mt;
    EXPECT_EQ(mt.size(), 0u);
    mt.put("key", "12345", 1);
    EXPECT_EQ(mt.size(), 3u + 5u);
    mt.put("key", "1", 2);
    EXPECT_EQ(mt.size(), 3u + 1u);
    mt.remove("key", 3);
    EXPECT_EQ(mt.size(), 3u);
    mt.put("other", "", 4);
    EXPECT_EQ(mt.size(), 3u + 5u);
}

TEST(MemTableTest, IteratorsAreSortedAndInclusive) {
    MemTable mt;
    for (char c : std::string("edcba")) {
        mt.put(std::string(1, c), std::string(2, c), c);
    }
    mt.remove("c", 100);

    auto all = mt.newIterator();
    auto records = drain(*all);
    ASSERT_EQ(records.size(), 5u);
    EXPECT_EQ(records[0].key, "a");
    EXPECT_EQ(records[4].key, "e");
    EXPECT_TRUE(records[2].deleted);

    auto range = mt.newRangeIterator("b", "d");
    auto ranged = drain(*range);
    ASSERT_EQ(ranged.size(), 3u);
    EXPECT_EQ(ranged.front().key, "b");
    EXPECT_EQ(ranged.back().key, "d");

    auto empty_range = mt.newRangeIterator("x", "z");
    EXPECT_FALSE(empty_range->hasNext());
}

TEST(MemTableTest, ConcurrentReadersWithOneWriter) {
    MemTable mt;
    std::atomic<bool> done{false};
    std::atomic<int> bad_reads{0};

    std::thread writer([&]() {
        for (int i = 0; i < 2000; ++i) {
            mt.put("key_" + std::to_string(i), "value_" + std::to_string(i), i + 1);
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&]() {
            while (!done.load()) {
                for (int i = 0; i < 2000; i += 97) {
                    auto v = mt.get("key_" + std::to_string(i));
                    if (v && *v != "value_" + std::to_string(i)) bad_reads++;
                }
            }
        });
    }
    writer.join();
    for (auto& r : readers) r.join();

    EXPECT_EQ(bad_reads.load(), 0);
    EXPECT_EQ(mt.entryCount(), 2000u);
}
