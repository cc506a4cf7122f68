// include/lsm/sstable_reader.h
#pragma once

#include "bloom_filter.h"
#include "lsm/entry_iterator.h"
#include "lsm/sstable_meta.h"
#include "storage_error/result.h"
#include "types.h"

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace strata {
namespace lsm {

enum class LookupStatus {
    kFound,
    kDeleted,  // the table holds a tombstone for the key
    kNotFound,
};

struct LookupResult {
    LookupStatus status = LookupStatus::kNotFound;
    std::string value;
    int64_t timestamp = 0;
};

/**
 * @class SSTableReader
 * @brief Read access to one published SSTable.
 *
 * open() loads the footer, Bloom filter, sparse index and metadata; data
 * blocks are read on demand through one ifstream guarded by a mutex.
 * Iterators hold a shared_ptr to the reader, so the open descriptor stays
 * valid even after compaction unlinks the file.
 */
class SSTableReader : public std::enable_shared_from_this<SSTableReader> {
public:
    // FILE_NOT_FOUND when the file is absent, LSM_SSTABLE_CORRUPTION when it cannot be parsed.
    static storage::Result<std::shared_ptr<SSTableReader>> open(const std::string& path);

    ~SSTableReader() = default;

    SSTableReader(const SSTableReader&) = delete;
    SSTableReader& operator=(const SSTableReader&) = delete;

    // Value for key; a tombstone and an absent key both read as std::nullopt.
    storage::Result<std::optional<std::string>> get(const std::string& key) const;

    // Like get(), but tells a tombstone apart from an absent key.
    storage::Result<LookupResult> lookup(const std::string& key) const;

    // Cheap rejection through the key range and the Bloom filter.
    bool mayContain(const std::string& key) const;

    std::unique_ptr<EntryIterator> newIterator() const;
    // Keys in [start, end], both inclusive.
    std::unique_ptr<EntryIterator> newRangeIterator(const std::string& start, const std::string& end) const;

    const SSTableMetadata& getMetadata() const { return meta_; }
    const std::string& getFilePath() const { return path_; }
    size_t getBlockCount() const { return index_.size(); }

    // First block an iterator starting at key needs to read.
    size_t firstBlockFor(const std::string& key) const;

    // Decoded records of one data block.
    storage::Result<std::vector<Record>> readBlock(size_t block_index) const;

private:
    explicit SSTableReader(std::string path);

    storage::StorageError corruption(const std::string& what) const;
    // Index of the block that could hold key, if any.
    std::optional<size_t> findBlock(const std::string& key) const;

    std::string path_;
    mutable std::ifstream file_stream_;
    mutable std::mutex file_mutex_;

    SSTableMetadata meta_;
    BloomFilter filter_;
    std::vector<BlockIndexEntry> index_;
};

} // namespace lsm
} // namespace strata
