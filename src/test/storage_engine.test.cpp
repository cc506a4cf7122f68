// src/test/storage_engine.test.cpp
#include "gtest/gtest.h"
#include "strata.h"
#include "lsm/compaction_engine.h"
#include "lsm/size_tiered_compaction_strategy.h"
#include "lsm/sstable_builder.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace strata;
using strata::storage::ErrorCode;

class StorageEngineTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::unique_ptr<StorageEngine> db;

    void SetUp() override {
        test_dir = "./test_data_engine_" + std::to_string(time(nullptr)) + "_" + std::to_string(rand());
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        db.reset();
        std::error_code ec;
        fs::remove_all(test_dir, ec);
        fs::remove_all(test_dir + "_copy", ec);
        if (ec) {
            std::cerr << "Warning: Could not clean up test directory " << test_dir << ": " << ec.message() << std::endl;
        }
    }

    EngineConfig baseConfig(const std::string& dir) const {
        EngineConfig config;
        config.data_dir = dir;
        config.compaction_interval_ms = 0; // tests drive compaction explicitly
        config.log_level = log::LogLevel::WARN;
        return config;
    }

    std::unique_ptr<StorageEngine> openEngine(const EngineConfig& config) {
        auto opened = StorageEngine::open(config);
        EXPECT_TRUE(opened.isOk()) << (opened.isOk() ? "" : opened.error().toString());
        return opened.isOk() ? std::move(opened.value()) : nullptr;
    }

    std::optional<std::string> mustGet(const std::string& key) {
        auto r = db->get(key);
        EXPECT_TRUE(r.isOk()) << (r.isOk() ? "" : r.error().toString());
        return r.isOk() ? r.value() : std::nullopt;
    }
};

TEST_F(StorageEngineTest, PutGetRemove) {
    db = openEngine(baseConfig(test_dir));
    ASSERT_NE(db, nullptr);

    ASSERT_TRUE(db->put("user:1", "alice").isOk());
    ASSERT_TRUE(db->put("user:2", "bob").isOk());
    ASSERT_TRUE(db->put("user:1", "alice2").isOk());

    EXPECT_EQ(mustGet("user:1"), std::optional<std::string>("alice2"));
    EXPECT_EQ(mustGet("user:2"), std::optional<std::string>("bob"));
    EXPECT_FALSE(mustGet("user:3").has_value());

    ASSERT_TRUE(db->remove("user:2").isOk());
    EXPECT_FALSE(mustGet("user:2").has_value());
    EXPECT_EQ(db->stats().deleted_keys, 1u);

    ASSERT_TRUE(db->put("user:2", "back").isOk());
    EXPECT_EQ(mustGet("user:2"), std::optional<std::string>("back"));
    EXPECT_EQ(db->stats().deleted_keys, 0u);
}

TEST_F(StorageEngineTest, RecoversFromWalAlone) {
    db = openEngine(baseConfig(test_dir));
    ASSERT_NE(db, nullptr);
    ASSERT_TRUE(db->put("a", "1").isOk());
    ASSERT_TRUE(db->put("b", std::string("nul\0byte", 8)).isOk());
    ASSERT_TRUE(db->put("c", "3").isOk());
    ASSERT_TRUE(db->remove("c").isOk());

    // Snapshot the directory while the engine is live: only WAL segments exist.
    const std::string copy = test_dir + "_copy";
    fs::copy(test_dir, copy, fs::copy_options::recursive);

    auto recovered = openEngine(baseConfig(copy));
    ASSERT_NE(recovered, nullptr);
    EXPECT_EQ(recovered->stats().sstable_count, 0u);
    EXPECT_EQ(recovered->get("a").value(), std::optional<std::string>("1"));
    EXPECT_EQ(recovered->get("b").value(), std::optional<std::string>(std::string("nul\0byte", 8)));
    EXPECT_FALSE(recovered->get("c").value().has_value());
    EXPECT_EQ(recovered->stats().deleted_keys, 1u);
    ASSERT_TRUE(recovered->close().isOk());
}

TEST_F(StorageEngineTest, FlushWritesL0AndTrimsWal) {
    db = openEngine(baseConfig(test_dir));
    ASSERT_NE(db, nullptr);
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(db->put("key" + std::to_string(i), "value" + std::to_string(i)).isOk());
    }
    ASSERT_TRUE(db->flush().isOk());

    EngineStats s = db->stats();
    EXPECT_EQ(s.sstable_count, 1u);
    EXPECT_EQ(s.level_counts[0], 1u);
    EXPECT_EQ(s.memtable_entries, 0u);
    EXPECT_EQ(s.flush_count, 1u);
    EXPECT_EQ(s.wal.file_count, 1u);
    EXPECT_EQ(s.wal.entry_count, 0u);

    EXPECT_EQ(mustGet("key7"), std::optional<std::string>("value7"));

    // Nothing new: no second table.
    ASSERT_TRUE(db->flush().isOk());
    EXPECT_EQ(db->stats().sstable_count, 1u);
}

TEST_F(StorageEngineTest, PutTriggersFlushAtThreshold) {
    EngineConfig config = baseConfig(test_dir);
    config.memtable_max_bytes = 1024;
    db = openEngine(config);
    ASSERT_NE(db, nullptr);

    const std::string value(100, 'v');
    for (int i = 0; i < 30; ++i) {
        ASSERT_TRUE(db->put("k" + std::to_string(i), value).isOk());
    }
    EngineStats s = db->stats();
    EXPECT_GE(s.flush_count, 2u);
    EXPECT_LT(s.memtable_size, 1024u);
    for (int i = 0; i < 30; ++i) {
        EXPECT_EQ(mustGet("k" + std::to_string(i)), std::optional<std::string>(value));
    }
}

TEST_F(StorageEngineTest, TombstoneShadowsOlderTable) {
    db = openEngine(baseConfig(test_dir));
    ASSERT_NE(db, nullptr);
    ASSERT_TRUE(db->put("k", "v").isOk());
    ASSERT_TRUE(db->flush().isOk());
    ASSERT_TRUE(db->remove("k").isOk());
    EXPECT_FALSE(mustGet("k").has_value());

    ASSERT_TRUE(db->flush().isOk());
    EXPECT_EQ(db->stats().deleted_keys, 0u);
    EXPECT_FALSE(mustGet("k").has_value());
}

TEST_F(StorageEngineTest, CloseIsIdempotentAndFinal) {
    db = openEngine(baseConfig(test_dir));
    ASSERT_NE(db, nullptr);
    ASSERT_TRUE(db->put("k", "v").isOk());

    ASSERT_TRUE(db->close().isOk());
    EXPECT_EQ(db->state(), EngineState::Closed);
    const uint64_t flushes = db->stats().flush_count;
    EXPECT_EQ(flushes, 1u);

    ASSERT_TRUE(db->close().isOk());
    EXPECT_EQ(db->stats().flush_count, flushes);

    auto put = db->put("x", "y");
    ASSERT_FALSE(put.isOk());
    EXPECT_EQ(put.error().code, ErrorCode::STORAGE_NOT_INITIALIZED);
    auto get = db->get("k");
    ASSERT_FALSE(get.isOk());
    EXPECT_EQ(get.error().code, ErrorCode::STORAGE_NOT_INITIALIZED);
    EXPECT_FALSE(db->remove("k").isOk());
    EXPECT_FALSE(db->flush().isOk());
}

TEST_F(StorageEngineTest, ReopenContinuesSequences) {
    {
        auto first = openEngine(baseConfig(test_dir));
        ASSERT_NE(first, nullptr);
        ASSERT_TRUE(first->put("a", "1").isOk());
        ASSERT_TRUE(first->close().isOk());
    }
    db = openEngine(baseConfig(test_dir));
    ASSERT_NE(db, nullptr);
    EXPECT_EQ(mustGet("a"), std::optional<std::string>("1"));

    ASSERT_TRUE(db->put("a", "2").isOk());
    ASSERT_TRUE(db->flush().isOk());
    EXPECT_EQ(db->stats().sstable_count, 2u);
    EXPECT_EQ(mustGet("a"), std::optional<std::string>("2"));
}

TEST_F(StorageEngineTest, CompactNowMergesLevelZero) {
    EngineConfig config = baseConfig(test_dir);
    config.max_l0_files = 2;
    db = openEngine(config);
    ASSERT_NE(db, nullptr);

    ASSERT_TRUE(db->put("a", "old").isOk());
    ASSERT_TRUE(db->put("b", "keep").isOk());
    ASSERT_TRUE(db->flush().isOk());
    ASSERT_TRUE(db->put("a", "new").isOk());
    ASSERT_TRUE(db->remove("b").isOk());
    ASSERT_TRUE(db->flush().isOk());

    auto ran = db->compactNow();
    ASSERT_TRUE(ran.isOk()) << ran.error().toString();
    EXPECT_TRUE(ran.value());

    EngineStats s = db->stats();
    EXPECT_EQ(s.sstable_count, 1u);
    EXPECT_EQ(s.level_counts[1], 1u);
    EXPECT_EQ(s.compactions_completed, 1u);

    EXPECT_EQ(mustGet("a"), std::optional<std::string>("new"));
    EXPECT_FALSE(mustGet("b").has_value());

    auto idle = db->compactNow();
    ASSERT_TRUE(idle.isOk());
    EXPECT_FALSE(idle.value());
}

TEST_F(StorageEngineTest, InterruptedInputRemovalKeepsKeyDeleted) {
    const std::string l1 = (fs::path(test_dir) / lsm::generateSSTableFileName(1, 1)).string();
    const std::string l0 = (fs::path(test_dir) / lsm::generateSSTableFileName(0, 2)).string();
    {
        lsm::SSTableBuilder builder(l1, 1, 1);
        builder.add(Record("k", "v", false, 1));
        builder.finish();
    }
    {
        lsm::SSTableBuilder builder(l0, 0, 1);
        builder.add(Record("k", "", true, 2));
        builder.finish();
    }
    const std::string saved_l0 = test_dir + "_copy";
    fs::copy_file(l0, saved_l0);

    lsm::CompactionJob job(0, 1, {l0, l1});
    job.drop_tombstones = true;
    lsm::CompactionEngine compactor(test_dir, std::make_unique<lsm::SizeTieredCompactionStrategy>(),
                                    []() { return uint64_t{3}; });
    ASSERT_TRUE(compactor.executeCompaction(job).isOk());
    EXPECT_FALSE(fs::exists(l0));
    EXPECT_FALSE(fs::exists(l1));

    // A crash between the two unlinks leaves only the newer tombstone table.
    fs::copy_file(saved_l0, l0);
    db = openEngine(baseConfig(test_dir));
    ASSERT_NE(db, nullptr);
    EXPECT_FALSE(mustGet("k").has_value());
}

TEST_F(StorageEngineTest, QuarantinedTableNamesAreNotReused) {
    const std::string quarantined =
        (fs::path(test_dir) / lsm::generateSSTableFileName(0, 9)).string() + lsm::kQuarantineSuffix;
    std::ofstream(quarantined) << "garbage";

    db = openEngine(baseConfig(test_dir));
    ASSERT_NE(db, nullptr);
    ASSERT_TRUE(db->put("a", "1").isOk());
    ASSERT_TRUE(db->flush().isOk());

    EXPECT_TRUE(fs::exists(fs::path(test_dir) / lsm::generateSSTableFileName(0, 10)));
    EXPECT_TRUE(fs::exists(quarantined));
    EXPECT_EQ(db->stats().sstable_count, 1u);
    EXPECT_EQ(mustGet("a"), std::optional<std::string>("1"));
}

TEST_F(StorageEngineTest, ReadsRacingCompactionSwapsStillFindKey) {
    EngineConfig config = baseConfig(test_dir);
    config.max_l0_files = 1;
    db = openEngine(config);
    ASSERT_NE(db, nullptr);
    ASSERT_TRUE(db->put("stable", "v").isOk());
    ASSERT_TRUE(db->flush().isOk());

    std::atomic<bool> done{false};
    std::atomic<int> missing{0};
    std::atomic<int> unexpected_errors{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 3; ++t) {
        readers.emplace_back([&]() {
            while (!done.load()) {
                auto r = db->get("stable");
                if (!r.isOk()) {
                    if (r.error().code != ErrorCode::CONCURRENT_MODIFICATION) unexpected_errors++;
                } else if (r.value() != std::optional<std::string>("v")) {
                    missing++;
                }
            }
        });
    }

    for (int round = 0; round < 100; ++round) {
        bool ok = db->put("filler_" + std::to_string(round), "x").isOk() && db->flush().isOk();
        auto ran = db->compactNow();
        ok = ok && ran.isOk();
        EXPECT_TRUE(ok) << "round " << round;
        if (!ok) break;
    }
    done = true;
    for (auto& t : readers) t.join();

    EXPECT_EQ(missing.load(), 0);
    EXPECT_EQ(unexpected_errors.load(), 0);
    EXPECT_EQ(mustGet("stable"), std::optional<std::string>("v"));
}

TEST_F(StorageEngineTest, ScansMergeMemoryAndDisk) {
    db = openEngine(baseConfig(test_dir));
    ASSERT_NE(db, nullptr);
    ASSERT_TRUE(db->put("user:1", "a").isOk());
    ASSERT_TRUE(db->put("user:2", "b").isOk());
    ASSERT_TRUE(db->put("user:3", "c").isOk());
    ASSERT_TRUE(db->put("order:1", "o").isOk());
    ASSERT_TRUE(db->flush().isOk());
    ASSERT_TRUE(db->put("user:2", "b2").isOk());
    ASSERT_TRUE(db->remove("user:3").isOk());
    ASSERT_TRUE(db->put("user:4", "d").isOk());

    auto range = db->scanRange("user:1", "user:3");
    ASSERT_TRUE(range.isOk());
    std::vector<StorageEngine::KeyValue> expected = {{"user:1", "a"}, {"user:2", "b2"}};
    EXPECT_EQ(range.value(), expected);

    auto prefix = db->scanPrefix("user:");
    ASSERT_TRUE(prefix.isOk());
    expected = {{"user:1", "a"}, {"user:2", "b2"}, {"user:4", "d"}};
    EXPECT_EQ(prefix.value(), expected);

    auto all = db->scanPrefix("");
    ASSERT_TRUE(all.isOk());
    EXPECT_EQ(all.value().size(), 4u);

    auto inverted = db->scanRange("z", "a");
    ASSERT_TRUE(inverted.isOk());
    EXPECT_TRUE(inverted.value().empty());
}

TEST_F(StorageEngineTest, CorruptTableSkippedOnRead) {
    db = openEngine(baseConfig(test_dir));
    ASSERT_NE(db, nullptr);
    ASSERT_TRUE(db->put("k", "older").isOk());
    ASSERT_TRUE(db->flush().isOk());
    ASSERT_TRUE(db->put("k", "newer").isOk());
    ASSERT_TRUE(db->flush().isOk());

    auto files = lsm::listSSTableFiles(test_dir);
    ASSERT_TRUE(files.isOk());
    ASSERT_EQ(files.value().size(), 2u);
    const std::string newest = files.value().back().path;
    fs::resize_file(newest, 8);

    EXPECT_EQ(mustGet("k"), std::optional<std::string>("older"));
}

TEST_F(StorageEngineTest, StaleTempFilesRemovedOnOpen) {
    const fs::path stale = fs::path(test_dir) / "level_0_000042.sst.tmp";
    {
        std::ofstream out(stale);
        out << "partial";
    }
    db = openEngine(baseConfig(test_dir));
    ASSERT_NE(db, nullptr);
    EXPECT_FALSE(fs::exists(stale));
}

TEST_F(StorageEngineTest, InvalidConfigRejected) {
    EngineConfig config;
    config.memtable_max_bytes = 0;
    config.bloom_filter_fpr = 1.5;
    auto opened = StorageEngine::open(config);
    ASSERT_FALSE(opened.isOk());
    EXPECT_EQ(opened.error().code, ErrorCode::INVALID_CONFIGURATION);
    const std::string details = opened.error().details;
    EXPECT_NE(details.find("data_dir"), std::string::npos);
    EXPECT_NE(details.find("memtable_max_bytes"), std::string::npos);
    EXPECT_NE(details.find("bloom_filter_fpr"), std::string::npos);
}

TEST_F(StorageEngineTest, StatsSerializeToJson) {
    db = openEngine(baseConfig(test_dir));
    ASSERT_NE(db, nullptr);
    ASSERT_TRUE(db->put("k", "v").isOk());
    auto j = nlohmann::json::parse(db->stats().toJson());
    EXPECT_EQ(j["memtable_entries"].get<size_t>(), 1u);
    EXPECT_EQ(j["wal"]["entry_count"].get<uint64_t>(), 1u);
    EXPECT_TRUE(j.contains("level_counts"));
}

TEST(EngineConfigTest, JsonOverlayAndRoundTrip) {
    EngineConfig base;
    base.data_dir = "/var/lib/strata";

    auto parsed = EngineConfig::fromJson(R"({"memtable_max_bytes": 8192, "sstable_compression": "ZSTD",
                                             "log_level": "ERROR", "compaction_interval_ms": -1})", base);
    ASSERT_TRUE(parsed.isOk()) << parsed.error().toString();
    EXPECT_EQ(parsed.value().data_dir, "/var/lib/strata");
    EXPECT_EQ(parsed.value().memtable_max_bytes, 8192u);
    EXPECT_EQ(parsed.value().sstable_compression, CompressionType::ZSTD);
    EXPECT_EQ(parsed.value().log_level, log::LogLevel::ERROR);
    EXPECT_EQ(parsed.value().compaction_interval_ms, -1);
    EXPECT_TRUE(parsed.value().is_valid());

    auto again = EngineConfig::fromJson(parsed.value().toJson());
    ASSERT_TRUE(again.isOk());
    EXPECT_EQ(again.value().toJson(), parsed.value().toJson());
}

TEST(EngineConfigTest, JsonRejectsUnknownAndMistyped) {
    auto unknown = EngineConfig::fromJson(R"({"memtable_size": 1})");
    ASSERT_FALSE(unknown.isOk());
    EXPECT_EQ(unknown.error().code, ErrorCode::INVALID_CONFIGURATION);

    auto mistyped = EngineConfig::fromJson(R"({"max_levels": "seven"})");
    ASSERT_FALSE(mistyped.isOk());
    EXPECT_EQ(mistyped.error().code, ErrorCode::INVALID_CONFIGURATION);

    auto bad_enum = EngineConfig::fromJson(R"({"sstable_compression": "BROTLI"})");
    ASSERT_FALSE(bad_enum.isOk());

    auto not_json = EngineConfig::fromJson("{");
    ASSERT_FALSE(not_json.isOk());
}
