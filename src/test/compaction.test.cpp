// src/test/compaction.test.cpp
#include "gtest/gtest.h"
#include "lsm/compaction_engine.h"
#include "lsm/size_tiered_compaction_strategy.h"
#include "lsm/sstable_builder.h"
#include "lsm/sstable_reader.h"
#include "storage_error/storage_error.h"

#include <atomic>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace strata;
using namespace strata::lsm;
using strata::storage::ErrorCode;
using strata::storage::StorageError;

namespace {

SSTableFileInfo fakeFile(int level, uint64_t seq, uint64_t size) {
    SSTableFileInfo f;
    f.path = "/nowhere/" + generateSSTableFileName(level, seq);
    f.level = level;
    f.sequence = seq;
    f.size_bytes = size;
    return f;
}

} // namespace

TEST(SizeTieredStrategyTest, FourL0FilesTriggerJobToL1) {
    SizeTieredCompactionStrategy strategy;
    LevelSnapshot levels(7);
    for (uint64_t s = 1; s <= 4; ++s) levels[0].push_back(fakeFile(0, s, 100));

    ASSERT_TRUE(strategy.shouldCompact(levels));
    auto job = strategy.selectSSTables(levels);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->source_level, 0);
    EXPECT_EQ(job->target_level, 1);
    EXPECT_EQ(job->input_files.size(), 4u);
    EXPECT_EQ(strategy.getMetrics().l0_compactions_selected, 1u);
}

TEST(SizeTieredStrategyTest, NoJobUnderThresholds) {
    SizeTieredCompactionStrategy strategy;
    LevelSnapshot levels(7);
    for (int level = 0; level < 7; ++level) {
        levels[static_cast<size_t>(level)].push_back(fakeFile(level, static_cast<uint64_t>(level) + 1, 1024));
    }
    EXPECT_FALSE(strategy.shouldCompact(levels));
    EXPECT_FALSE(strategy.selectSSTables(levels).has_value());
    EXPECT_EQ(strategy.getMetrics().selections_without_job, 1u);
}

TEST(SizeTieredStrategyTest, OversizedLevelPushesDownWithTargetFiles) {
    SizeTieredCompactionConfig config;
    config.base_level_size_bytes = 1000;
    SizeTieredCompactionStrategy strategy(config);

    EXPECT_EQ(strategy.levelTargetBytes(1), 1000u);
    EXPECT_EQ(strategy.levelTargetBytes(2), 10000u);

    LevelSnapshot levels(7);
    levels[1].push_back(fakeFile(1, 10, 800));
    levels[1].push_back(fakeFile(1, 11, 800));
    levels[2].push_back(fakeFile(2, 5, 5000));

    auto job = strategy.selectSSTables(levels);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->source_level, 1);
    EXPECT_EQ(job->target_level, 2);
    EXPECT_EQ(job->input_files.size(), 3u);
}

TEST(SizeTieredStrategyTest, L0TakesPriorityOverLevelSize) {
    SizeTieredCompactionConfig config;
    config.base_level_size_bytes = 10;
    SizeTieredCompactionStrategy strategy(config);

    LevelSnapshot levels(7);
    for (uint64_t s = 1; s <= 4; ++s) levels[0].push_back(fakeFile(0, s, 1));
    levels[1].push_back(fakeFile(1, 9, 1000));

    auto job = strategy.selectSSTables(levels);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->source_level, 0);
    EXPECT_EQ(job->input_files.size(), 5u);
}

TEST(SizeTieredStrategyTest, LastLevelNeverCompacts) {
    SizeTieredCompactionConfig config;
    config.base_level_size_bytes = 1;
    config.max_levels = 3;
    SizeTieredCompactionStrategy strategy(config);

    LevelSnapshot levels(3);
    levels[2].push_back(fakeFile(2, 1, 1u << 30));
    EXPECT_FALSE(strategy.shouldCompact(levels));
}

TEST(SizeTieredStrategyTest, InvalidConfigRejected) {
    SizeTieredCompactionConfig config;
    config.level_size_multiplier = 1.0;
    EXPECT_THROW(SizeTieredCompactionStrategy{config}, StorageError);
}

TEST(SizeTieredStrategyTest, GroupByLevelSortsBySequence) {
    std::vector<SSTableFileInfo> flat = {fakeFile(1, 9, 1), fakeFile(0, 3, 1), fakeFile(1, 2, 1)};
    LevelSnapshot levels = groupByLevel(flat, 4);
    ASSERT_EQ(levels.size(), 4u);
    ASSERT_EQ(levels[1].size(), 2u);
    EXPECT_EQ(levels[1][0].sequence, 2u);
    EXPECT_EQ(levels[1][1].sequence, 9u);
}

class CompactionEngineTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::atomic<uint64_t> next_seq{100};

    void SetUp() override {
        test_dir = "./test_data_compaction_" + std::to_string(time(nullptr)) + "_" + std::to_string(rand());
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    std::unique_ptr<CompactionEngine> makeEngine() {
        return std::make_unique<CompactionEngine>(
            test_dir,
            std::make_unique<SizeTieredCompactionStrategy>(),
            [this]() { return next_seq.fetch_add(1); });
    }

    std::string writeTable(int level, uint64_t seq, const std::vector<Record>& records) {
        std::string path = (fs::path(test_dir) / generateSSTableFileName(level, seq)).string();
        SSTableBuilder builder(path, level, records.size());
        for (const auto& r : records) builder.add(r);
        builder.finish();
        return path;
    }

    std::vector<SSTableFileInfo> listing() {
        auto files = listSSTableFiles(test_dir);
        EXPECT_TRUE(files.isOk());
        return files.isOk() ? files.value() : std::vector<SSTableFileInfo>{};
    }

    static std::string readFile(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
};

TEST_F(CompactionEngineTest, MergesFourL0FilesIntoL1) {
    writeTable(0, 1, {Record("a", "a1", false, 10), Record("b", "b1", false, 10)});
    writeTable(0, 2, {Record("b", "b2", false, 20), Record("c", "c2", false, 20)});
    writeTable(0, 3, {Record("c", "", true, 30)});
    writeTable(0, 4, {Record("d", "d4", false, 40)});

    auto engine = makeEngine();
    auto ran = engine->compactIfNeeded();
    ASSERT_TRUE(ran.isOk()) << ran.error().toString();
    EXPECT_TRUE(ran.value());

    auto files = listing();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].level, 1);

    auto reader = SSTableReader::open(files[0].path);
    ASSERT_TRUE(reader.isOk());
    EXPECT_EQ(reader.value()->get("a").value(), std::optional<std::string>("a1"));
    EXPECT_EQ(reader.value()->get("b").value(), std::optional<std::string>("b2"));
    EXPECT_EQ(reader.value()->lookup("c").value().status, LookupStatus::kNotFound); // purged at the bottom
    EXPECT_EQ(reader.value()->get("d").value(), std::optional<std::string>("d4"));

    auto stats = engine->getStats();
    EXPECT_EQ(stats.compactions_completed, 1u);
    EXPECT_GT(stats.bytes_written, 0u);

    auto again = engine->compactIfNeeded();
    ASSERT_TRUE(again.isOk());
    EXPECT_FALSE(again.value());
}

TEST_F(CompactionEngineTest, TombstonePurgeRemovesRawKey) {
    std::string input = writeTable(0, 1, {Record("k1", "live", false, 1), Record("k2", "", true, 2)});

    CompactionJob job(0, 1, {input});
    job.output_file = (fs::path(test_dir) / generateSSTableFileName(1, 50)).string();
    job.drop_tombstones = true;

    auto engine = makeEngine();
    ASSERT_TRUE(engine->executeCompaction(job).isOk());
    EXPECT_FALSE(fs::exists(input));

    auto reader = SSTableReader::open(job.output_file);
    ASSERT_TRUE(reader.isOk());
    EXPECT_EQ(reader.value()->get("k1").value(), std::optional<std::string>("live"));
    EXPECT_FALSE(reader.value()->get("k2").value().has_value());
    EXPECT_EQ(reader.value()->getMetadata().tombstone_count, 0u);

    std::string raw = readFile(job.output_file);
    EXPECT_EQ(raw.find("k2"), std::string::npos);
}

TEST_F(CompactionEngineTest, TombstonesKeptWhenDeeperLevelsExist) {
    writeTable(0, 1, {Record("x", "", true, 50)});
    writeTable(0, 2, {Record("y", "y", false, 51)});
    writeTable(0, 3, {Record("z", "z", false, 52)});
    writeTable(0, 4, {Record("w", "w", false, 53)});
    writeTable(3, 5, {Record("x", "ancient", false, 1)});

    auto engine = makeEngine();
    auto ran = engine->compactIfNeeded();
    ASSERT_TRUE(ran.isOk());
    ASSERT_TRUE(ran.value());

    std::string l1_path;
    for (const auto& f : listing()) {
        if (f.level == 1) l1_path = f.path;
    }
    ASSERT_FALSE(l1_path.empty());
    auto reader = SSTableReader::open(l1_path);
    ASSERT_TRUE(reader.isOk());
    EXPECT_EQ(reader.value()->lookup("x").value().status, LookupStatus::kDeleted);
}

TEST_F(CompactionEngineTest, AllTombstoneOutputIsNotPublished) {
    std::string input = writeTable(0, 1, {Record("a", "", true, 1), Record("b", "", true, 2)});
    CompactionJob job(0, 1, {input});
    job.drop_tombstones = true;

    auto engine = makeEngine();
    ASSERT_TRUE(engine->executeCompaction(job).isOk());
    EXPECT_TRUE(listing().empty());
    for (const auto& entry : fs::directory_iterator(test_dir)) {
        ADD_FAILURE() << "unexpected file " << entry.path();
    }
}

TEST_F(CompactionEngineTest, FailedJobLeavesInputsInPlace) {
    std::string good = writeTable(0, 1, {Record("a", "1", false, 1)});
    std::string bad = writeTable(0, 2, {Record("b", "2", false, 2)});
    fs::resize_file(bad, 10);

    CompactionJob job(0, 1, {good, bad});
    auto engine = makeEngine();
    auto status = engine->executeCompaction(job);
    ASSERT_FALSE(status.isOk());
    EXPECT_EQ(status.error().code, ErrorCode::LSM_SSTABLE_CORRUPTION);

    EXPECT_TRUE(fs::exists(good));
    EXPECT_FALSE(fs::exists(bad));
    EXPECT_TRUE(fs::exists(bad + ".corrupt"));
    EXPECT_EQ(engine->getStats().compactions_failed, 1u);
    auto files = listing();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].path, good);
}

TEST_F(CompactionEngineTest, CorruptInputDoesNotBlockLaterCompactions) {
    writeTable(0, 1, {Record("a", "1", false, 1)});
    std::string bad = writeTable(0, 2, {Record("b", "2", false, 2)});
    writeTable(0, 3, {Record("c", "3", false, 3)});
    writeTable(0, 4, {Record("d", "4", false, 4)});
    fs::resize_file(bad, 10);

    auto engine = makeEngine();
    auto first = engine->compactIfNeeded();
    ASSERT_FALSE(first.isOk());
    EXPECT_TRUE(fs::exists(bad + ".corrupt"));
    EXPECT_EQ(listing().size(), 3u);

    writeTable(0, 5, {Record("e", "5", false, 5)});
    auto second = engine->compactIfNeeded();
    ASSERT_TRUE(second.isOk()) << second.error().toString();
    EXPECT_TRUE(second.value());

    auto files = listing();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].level, 1);
    auto reader = SSTableReader::open(files[0].path);
    ASSERT_TRUE(reader.isOk());
    EXPECT_EQ(reader.value()->getMetadata().entry_count, 4u);
    EXPECT_FALSE(reader.value()->get("b").value().has_value());
    EXPECT_TRUE(fs::exists(bad + ".corrupt"));

    auto stats = engine->getStats();
    EXPECT_EQ(stats.compactions_failed, 1u);
    EXPECT_EQ(stats.compactions_completed, 1u);
}

TEST_F(CompactionEngineTest, InputsRemovedOldestFirst) {
    auto path = [this](int level, uint64_t seq) {
        return (fs::path(test_dir) / generateSSTableFileName(level, seq)).string();
    };
    CompactionJob job(0, 1, {path(0, 7), path(0, 5), path(1, 4), path(1, 3), path(1, 9)});
    job.output_file = path(1, 9);

    auto order = inputRemovalOrder(job);
    ASSERT_TRUE(order.isOk());
    EXPECT_EQ(order.value(), (std::vector<std::string>{path(1, 3), path(1, 4), path(0, 5), path(0, 7)}));

    CompactionJob misnamed(0, 1, {(fs::path(test_dir) / "notes.txt").string()});
    auto rejected = inputRemovalOrder(misnamed);
    ASSERT_FALSE(rejected.isOk());
    EXPECT_EQ(rejected.error().code, ErrorCode::INVALID_DATA_FORMAT);
}

TEST_F(CompactionEngineTest, NewerL0VersionBeatsOlderTargetVersion) {
    writeTable(1, 1, {Record("k", "from_l1", false, 100)});
    // Same timestamp: the newer file (lower level) still wins.
    std::string l0 = writeTable(0, 2, {Record("k", "from_l0", false, 100)});

    CompactionJob job(0, 1, {l0, (fs::path(test_dir) / generateSSTableFileName(1, 1)).string()});
    auto engine = makeEngine();
    ASSERT_TRUE(engine->executeCompaction(job).isOk());

    auto files = listing();
    ASSERT_EQ(files.size(), 1u);
    auto reader = SSTableReader::open(files[0].path);
    ASSERT_TRUE(reader.isOk());
    EXPECT_EQ(reader.value()->get("k").value(), std::optional<std::string>("from_l0"));
}
