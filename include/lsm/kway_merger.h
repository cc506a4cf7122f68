// include/lsm/kway_merger.h
#pragma once

#include "lsm/entry_iterator.h"
#include "types.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <queue>
#include <vector>

namespace strata {
namespace lsm {

struct MergeHeapEntry {
    Record record;
    size_t source_index;

    // Orders by key ascending, then timestamp descending, then source index ascending,
    // so the heap top for a key is its newest version.
    bool operator>(const MergeHeapEntry& other) const {
        if (record.key != other.record.key) return record.key > other.record.key;
        if (record.timestamp != other.record.timestamp) return record.timestamp < other.record.timestamp;
        return source_index > other.source_index;
    }
};

/**
 * @class KWayMerger
 * @brief Merges sorted, per-source-unique iterators into one sorted stream with
 * exactly one record per key: the one with the largest timestamp, or, on a
 * timestamp tie, the one from the lowest source index. Callers pass sources
 * newest first.
 */
class KWayMerger : public EntryIterator {
public:
    explicit KWayMerger(std::vector<std::unique_ptr<EntryIterator>> sources);

    bool hasNext() const override;
    storage::Result<Record> next() override;

    // Records discarded because a newer version of the same key won.
    size_t duplicatesDropped() const { return duplicates_dropped_; }

private:
    // Pulls the next record of sources_[index] into the heap.
    storage::Status advance(size_t index);

    std::vector<std::unique_ptr<EntryIterator>> sources_;
    std::priority_queue<MergeHeapEntry, std::vector<MergeHeapEntry>, std::greater<MergeHeapEntry>> heap_;
    std::optional<storage::StorageError> init_error_;
    size_t duplicates_dropped_ = 0;
};

} // namespace lsm
} // namespace strata
