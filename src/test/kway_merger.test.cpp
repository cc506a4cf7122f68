// src/test/kway_merger.test.cpp
#include "gtest/gtest.h"
#include "lsm/kway_merger.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace strata;
using namespace strata::lsm;
using strata::storage::ErrorCode;
using strata::storage::Result;
using strata::storage::StorageError;

namespace {

class VectorIterator : public EntryIterator {
public:
    explicit VectorIterator(std::vector<Record> records, size_t fail_at = SIZE_MAX)
        : records_(std::move(records)), fail_at_(fail_at) {}

    bool hasNext() const override { return pos_ < records_.size() && !failed_; }

    Result<Record> next() override {
        if (pos_ == fail_at_) {
            failed_ = true;
            return StorageError(ErrorCode::IO_READ_ERROR, "injected");
        }
        return records_[pos_++];
    }

private:
    std::vector<Record> records_;
    size_t fail_at_;
    size_t pos_ = 0;
    bool failed_ = false;
};

std::unique_ptr<EntryIterator> source(std::vector<Record> records) {
    return std::make_unique<VectorIterator>(std::move(records));
}

std::vector<Record> drain(KWayMerger& merger) {
    std::vector<Record> out;
    while (merger.hasNext()) {
        auto r = merger.next();
        EXPECT_TRUE(r.isOk());
        if (!r.isOk()) break;
        out.push_back(r.value());
    }
    return out;
}

} // namespace

TEST(KWayMergerTest, NewestTimestampWins) {
    std::vector<std::unique_ptr<EntryIterator>> sources;
    sources.push_back(source({Record("k1", "old", false, 1000)}));
    sources.push_back(source({Record("k1", "new", false, 2000)}));

    KWayMerger merger(std::move(sources));
    auto out = drain(merger);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].key, "k1");
    EXPECT_EQ(out[0].value, "new");
    EXPECT_EQ(merger.duplicatesDropped(), 1u);
}

TEST(KWayMergerTest, TimestampTieGoesToLowestSource) {
    std::vector<std::unique_ptr<EntryIterator>> sources;
    sources.push_back(source({Record("k", "first", false, 5)}));
    sources.push_back(source({Record("k", "second", false, 5)}));
    sources.push_back(source({Record("k", "third", false, 5)}));

    KWayMerger merger(std::move(sources));
    auto out = drain(merger);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].value, "first");
}

TEST(KWayMergerTest, InterleavesSourcesInKeyOrder) {
    std::vector<std::unique_ptr<EntryIterator>> sources;
    sources.push_back(source({Record("a", "1", false, 1), Record("d", "4", false, 1)}));
    sources.push_back(source({}));
    sources.push_back(source({Record("b", "2", false, 1), Record("e", "5", false, 1)}));
    sources.push_back(source({Record("c", "3", false, 1), Record("d", "old", false, 0)}));

    KWayMerger merger(std::move(sources));
    auto out = drain(merger);
    std::string keys;
    std::string values;
    for (const auto& r : out) {
        keys += r.key;
        values += r.value;
    }
    EXPECT_EQ(keys, "abcde");
    EXPECT_EQ(values, "12345");
}

TEST(KWayMergerTest, TombstonesPassThrough) {
    std::vector<std::unique_ptr<EntryIterator>> sources;
    sources.push_back(source({Record("k", "", true, 10)}));
    sources.push_back(source({Record("k", "live", false, 5)}));

    KWayMerger merger(std::move(sources));
    auto out = drain(merger);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_TRUE(out[0].deleted);
}

TEST(KWayMergerTest, EmptyInput) {
    KWayMerger merger(std::vector<std::unique_ptr<EntryIterator>>{});
    EXPECT_FALSE(merger.hasNext());
}

TEST(KWayMergerTest, SourceErrorSurfaces) {
    std::vector<std::unique_ptr<EntryIterator>> sources;
    sources.push_back(source({Record("a", "1", false, 1)}));
    sources.push_back(std::make_unique<VectorIterator>(
        std::vector<Record>{Record("b", "2", false, 1), Record("c", "3", false, 1)}, 1));

    KWayMerger merger(std::move(sources));
    bool saw_error = false;
    while (merger.hasNext()) {
        auto r = merger.next();
        if (!r.isOk()) {
            EXPECT_EQ(r.error().code, ErrorCode::IO_READ_ERROR);
            saw_error = true;
            break;
        }
    }
    EXPECT_TRUE(saw_error);
}
