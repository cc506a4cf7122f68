// src/test/sstable.test.cpp
#include "gtest/gtest.h"
#include "lsm/sstable_builder.h"
#include "lsm/sstable_meta.h"
#include "lsm/sstable_reader.h"
#include "storage_error/storage_error.h"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace strata;
using namespace strata::lsm;
using strata::storage::ErrorCode;
using strata::storage::StorageError;

class SSTableTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        test_dir = "./test_data_sstable_" + std::to_string(time(nullptr)) + "_" + std::to_string(rand());
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    std::string tablePath(int level, uint64_t seq) const {
        return (fs::path(test_dir) / generateSSTableFileName(level, seq)).string();
    }

    static std::string key(int i) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "key_%06d", i);
        return buf;
    }

    // Every third key is a tombstone.
    std::string writeTable(int count, const SSTableBuilder::Options& options = SSTableBuilder::Options{}) {
        std::string path = tablePath(0, 1);
        SSTableBuilder builder(path, 0, count, options);
        for (int i = 0; i < count; ++i) {
            bool deleted = (i % 3 == 2);
            builder.add(Record(key(i), deleted ? "" : "value_" + std::to_string(i), deleted, 1000 + i));
        }
        builder.finish();
        return path;
    }

    static void flipByte(const std::string& path, std::streamoff offset) {
        std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
        f.seekg(offset);
        char c = 0;
        f.read(&c, 1);
        c = static_cast<char>(c ^ 0x5a);
        f.seekp(offset);
        f.write(&c, 1);
    }
};

TEST_F(SSTableTest, FileNamesRoundTrip) {
    EXPECT_EQ(generateSSTableFileName(2, 17), "level_2_000017.sst");
    auto parsed = parseSSTableFileName("level_2_000017.sst");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->first, 2);
    EXPECT_EQ(parsed->second, 17u);
    EXPECT_FALSE(parseSSTableFileName("level_2_000017.sst.tmp").has_value());
    EXPECT_FALSE(parseSSTableFileName("wal-000001.log").has_value());
}

TEST_F(SSTableTest, WriteThenLookupAcrossBlocks) {
    SSTableBuilder::Options options;
    options.target_block_size = 256;
    std::string path = writeTable(500, options);

    EXPECT_TRUE(fs::exists(path));
    EXPECT_FALSE(fs::exists(path + ".tmp"));

    auto reader = SSTableReader::open(path);
    ASSERT_TRUE(reader.isOk()) << reader.error().toString();
    auto& r = reader.value();
    EXPECT_GT(r->getBlockCount(), 1u);
    EXPECT_EQ(r->getMetadata().entry_count, 500u);
    EXPECT_EQ(r->getMetadata().min_key, key(0));
    EXPECT_EQ(r->getMetadata().max_key, key(499));
    EXPECT_EQ(r->getMetadata().max_timestamp, 1499);

    for (int i = 0; i < 500; i += 7) {
        auto lookup = r->lookup(key(i));
        ASSERT_TRUE(lookup.isOk());
        if (i % 3 == 2) {
            EXPECT_EQ(lookup.value().status, LookupStatus::kDeleted) << key(i);
        } else {
            EXPECT_EQ(lookup.value().status, LookupStatus::kFound) << key(i);
            EXPECT_EQ(lookup.value().value, "value_" + std::to_string(i));
        }
    }

    auto absent = r->lookup("key_999999");
    ASSERT_TRUE(absent.isOk());
    EXPECT_EQ(absent.value().status, LookupStatus::kNotFound);

    auto tombstone = r->get(key(2));
    ASSERT_TRUE(tombstone.isOk());
    EXPECT_FALSE(tombstone.value().has_value());
}

TEST_F(SSTableTest, IteratorsYieldSortedRecords) {
    SSTableBuilder::Options options;
    options.target_block_size = 128;
    std::string path = writeTable(100, options);
    auto reader = SSTableReader::open(path);
    ASSERT_TRUE(reader.isOk());

    auto it = reader.value()->newIterator();
    int n = 0;
    std::string last;
    while (it->hasNext()) {
        auto rec = it->next();
        ASSERT_TRUE(rec.isOk());
        EXPECT_GT(rec.value().key, last);
        last = rec.value().key;
        n++;
    }
    EXPECT_EQ(n, 100);

    auto range = reader.value()->newRangeIterator(key(10), key(20));
    std::vector<std::string> keys;
    while (range->hasNext()) keys.push_back(range->next().value().key);
    ASSERT_EQ(keys.size(), 11u);
    EXPECT_EQ(keys.front(), key(10));
    EXPECT_EQ(keys.back(), key(20));
}

TEST_F(SSTableTest, IteratorOutlivesReaderHandle) {
    std::string path = writeTable(20);
    std::unique_ptr<EntryIterator> it;
    {
        auto reader = SSTableReader::open(path);
        ASSERT_TRUE(reader.isOk());
        it = reader.value()->newIterator();
    }
    fs::remove(path);
    int n = 0;
    while (it->hasNext()) {
        ASSERT_TRUE(it->next().isOk());
        n++;
    }
    EXPECT_EQ(n, 20);
}

TEST_F(SSTableTest, CompressedTablesReadBack) {
    for (CompressionType type : {CompressionType::ZSTD, CompressionType::LZ4}) {
        std::string path = tablePath(1, static_cast<uint64_t>(type) + 10);
        SSTableBuilder::Options options;
        options.compression_type = type;
        {
            SSTableBuilder builder(path, 1, 200, options);
            for (int i = 0; i < 200; ++i) {
                builder.add(Record(key(i), std::string(200, 'a' + (i % 3)), false, i + 1));
            }
            builder.finish();
        }
        // 200 x 200 bytes of highly repetitive values must shrink.
        EXPECT_LT(fs::file_size(path), 200u * 200u);

        auto reader = SSTableReader::open(path);
        ASSERT_TRUE(reader.isOk());
        auto v = reader.value()->get(key(150));
        ASSERT_TRUE(v.isOk());
        ASSERT_TRUE(v.value().has_value());
        EXPECT_EQ(*v.value(), std::string(200, 'a'));
    }
}

TEST_F(SSTableTest, EmptyTableWhenNothingExpected) {
    std::string path = tablePath(0, 5);
    {
        SSTableBuilder builder(path, 0, 0);
        builder.finish();
    }
    auto reader = SSTableReader::open(path);
    ASSERT_TRUE(reader.isOk());
    EXPECT_EQ(reader.value()->getMetadata().entry_count, 0u);
    EXPECT_FALSE(reader.value()->newIterator()->hasNext());
    EXPECT_EQ(reader.value()->lookup("a").value().status, LookupStatus::kNotFound);
}

TEST_F(SSTableTest, FinishWithoutEntriesFailsWhenSomeWereExpected) {
    std::string path = tablePath(0, 6);
    SSTableBuilder builder(path, 0, 10);
    try {
        builder.finish();
        FAIL() << "finish() should have thrown";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code, ErrorCode::INVALID_DATA_FORMAT);
    }
    EXPECT_FALSE(fs::exists(path));
    EXPECT_FALSE(fs::exists(path + ".tmp"));
}

TEST_F(SSTableTest, ContractViolations) {
    std::string path = tablePath(0, 7);
    SSTableBuilder builder(path, 0, 2);
    builder.add(Record("b", "1", false, 1));
    try {
        builder.add(Record("a", "2", false, 2));
        FAIL() << "out-of-order add should have thrown";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code, ErrorCode::INVALID_KEY);
    }
    EXPECT_THROW(builder.add(Record("b", "dup", false, 3)), StorageError);

    builder.finish();
    EXPECT_TRUE(builder.isFinished());
    EXPECT_THROW(builder.finish(), std::logic_error);
    EXPECT_THROW(builder.add(Record("c", "3", false, 4)), std::logic_error);
}

TEST_F(SSTableTest, AbandonLeavesNoFiles) {
    std::string path = tablePath(0, 8);
    {
        SSTableBuilder builder(path, 0, 1);
        builder.add(Record("a", "1", false, 1));
        builder.abandon();
    }
    EXPECT_FALSE(fs::exists(path));
    EXPECT_FALSE(fs::exists(path + ".tmp"));
}

TEST_F(SSTableTest, MissingFileIsNotFound) {
    auto reader = SSTableReader::open(tablePath(0, 999));
    ASSERT_FALSE(reader.isOk());
    EXPECT_EQ(reader.error().code, ErrorCode::FILE_NOT_FOUND);
}

TEST_F(SSTableTest, CorruptFooterRejected) {
    std::string path = writeTable(50);
    flipByte(path, static_cast<std::streamoff>(fs::file_size(path) - 10));
    auto reader = SSTableReader::open(path);
    ASSERT_FALSE(reader.isOk());
    EXPECT_EQ(reader.error().code, ErrorCode::LSM_SSTABLE_CORRUPTION);
}

TEST_F(SSTableTest, CorruptDataBlockDetectedOnRead) {
    std::string path = writeTable(50);
    // First data block payload starts right after its header at offset 0.
    flipByte(path, static_cast<std::streamoff>(SSTableBlockHeader::kEncodedSize + 8));

    auto reader = SSTableReader::open(path);
    ASSERT_TRUE(reader.isOk());
    auto lookup = reader.value()->lookup(key(0));
    ASSERT_FALSE(lookup.isOk());
    EXPECT_EQ(lookup.error().code, ErrorCode::CHECKSUM_MISMATCH);
}

TEST_F(SSTableTest, TruncatedFileRejected) {
    std::string path = writeTable(50);
    fs::resize_file(path, 20);
    auto reader = SSTableReader::open(path);
    ASSERT_FALSE(reader.isOk());
    EXPECT_EQ(reader.error().code, ErrorCode::LSM_SSTABLE_CORRUPTION);
}
