// include/lsm/memtable.h
#pragma once

#include "lsm/arena.h"
#include "lsm/entry_iterator.h"
#include "lsm/skiplist.h"
#include "types.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace strata {
namespace lsm {

struct MemTableStats {
    size_t entry_count = 0;
    size_t size_bytes = 0;
    size_t memory_usage_bytes = 0;
    std::chrono::system_clock::time_point created_at;
    std::chrono::milliseconds age{0};
};

/**
 * @class MemTable
 * @brief Mutable, ordered buffer of the most recent writes.
 *
 * Overwrites replace the previous entry for a key; a delete leaves a tombstone.
 * size() counts key + value bytes of every key (key bytes only for tombstones)
 * and drives the engine's flush decision.
 *
 * Iterators read the skip list directly and must not outlive the MemTable.
 */
class MemTable {
public:
    MemTable();

    MemTable(const MemTable&) = delete;
    MemTable& operator=(const MemTable&) = delete;

    void put(const std::string& key, const std::string& value, int64_t timestamp);
    void remove(const std::string& key, int64_t timestamp);

    // Value for key; a tombstone reads as std::nullopt.
    std::optional<std::string> get(const std::string& key) const;
    // Raw entry for key, tombstones included.
    std::optional<Record> getRecord(const std::string& key) const;

    std::unique_ptr<EntryIterator> newIterator() const;
    // Keys in [start, end], both inclusive.
    std::unique_ptr<EntryIterator> newRangeIterator(const std::string& start, const std::string& end) const;

    size_t size() const { return size_bytes_.load(std::memory_order_relaxed); }
    size_t entryCount() const { return skiplist_.Count(); }
    bool empty() const { return skiplist_.Empty(); }
    size_t approximateMemoryUsage() const { return arena_.MemoryUsage(); }

    MemTableStats getStats() const;

private:
    void upsert(const std::string& key, const std::string& value, int64_t timestamp, bool tombstone);

    Arena arena_;
    SkipList skiplist_;
    std::atomic<size_t> size_bytes_{0};
    const std::chrono::system_clock::time_point created_at_;
    mutable std::shared_mutex mutex_;
};

} // namespace lsm
} // namespace strata
