// src/lsm/memtable.cpp
#include "lsm/memtable.h"

#include <mutex>

namespace strata {
namespace lsm {

namespace {

class MemTableIterator : public EntryIterator {
public:
    MemTableIterator(const SkipList* list, std::optional<std::string> start, std::optional<std::string> end)
        : iter_(list), end_(std::move(end)) {
        if (start) {
            iter_.Seek(*start);
        } else {
            iter_.SeekToFirst();
        }
    }

    bool hasNext() const override {
        if (!iter_.Valid()) return false;
        return !end_ || iter_.key().compare(*end_) <= 0;
    }

    storage::Result<Record> next() override {
        if (!hasNext()) {
            return storage::StorageError(storage::ErrorCode::INTERNAL_ERROR, "MemTable iterator exhausted");
        }
        const SkipList::Value* v = iter_.value();
        Record record(std::string(iter_.key()), std::string(v->view()), v->is_tombstone, v->timestamp);
        iter_.Next();
        return record;
    }

private:
    SkipList::Iterator iter_;
    std::optional<std::string> end_;
};

size_t contribution(size_t key_size, const SkipList::Value* v) {
    return key_size + (v->is_tombstone ? 0 : v->size);
}

} // namespace

MemTable::MemTable()
    : skiplist_(arena_), created_at_(std::chrono::system_clock::now()) {
}

void MemTable::put(const std::string& key, const std::string& value, int64_t timestamp) {
    upsert(key, value, timestamp, false);
}

void MemTable::remove(const std::string& key, int64_t timestamp) {
    upsert(key, std::string(), timestamp, true);
}

void MemTable::upsert(const std::string& key, const std::string& value, int64_t timestamp, bool tombstone) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const SkipList::Value* previous = skiplist_.Upsert(key, value, timestamp, tombstone);
    size_t added = key.size() + (tombstone ? 0 : value.size());
    size_t removed = previous ? contribution(key.size(), previous) : 0;
    size_bytes_.store(size_bytes_.load(std::memory_order_relaxed) + added - removed, std::memory_order_relaxed);
}

std::optional<std::string> MemTable::get(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const SkipList::Value* v = skiplist_.Find(key);
    if (v == nullptr || v->is_tombstone) {
        return std::nullopt;
    }
    return std::string(v->view());
}

std::optional<Record> MemTable::getRecord(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const SkipList::Value* v = skiplist_.Find(key);
    if (v == nullptr) {
        return std::nullopt;
    }
    return Record(key, std::string(v->view()), v->is_tombstone, v->timestamp);
}

std::unique_ptr<EntryIterator> MemTable::newIterator() const {
    return std::make_unique<MemTableIterator>(&skiplist_, std::nullopt, std::nullopt);
}

std::unique_ptr<EntryIterator> MemTable::newRangeIterator(const std::string& start, const std::string& end) const {
    return std::make_unique<MemTableIterator>(&skiplist_, start, end);
}

MemTableStats MemTable::getStats() const {
    MemTableStats stats;
    stats.entry_count = entryCount();
    stats.size_bytes = size();
    stats.memory_usage_bytes = approximateMemoryUsage();
    stats.created_at = created_at_;
    stats.age = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - created_at_);
    return stats;
}

} // namespace lsm
} // namespace strata
