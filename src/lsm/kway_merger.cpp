// src/lsm/kway_merger.cpp
#include "lsm/kway_merger.h"
#include "storage_error/error_utils.h"

namespace strata {
namespace lsm {

using storage::Result;
using storage::Status;

KWayMerger::KWayMerger(std::vector<std::unique_ptr<EntryIterator>> sources)
    : sources_(std::move(sources)) {
    for (size_t i = 0; i < sources_.size(); ++i) {
        if (!sources_[i]) continue;
        Status s = advance(i);
        if (!s.isOk()) {
            init_error_ = std::move(s.error());
            return;
        }
    }
}

Status KWayMerger::advance(size_t index) {
    EntryIterator* source = sources_[index].get();
    if (!source->hasNext()) {
        return Status();
    }
    ASSIGN_OR_RETURN_AUTO(record, source->next());
    heap_.push(MergeHeapEntry{std::move(record), index});
    return Status();
}

bool KWayMerger::hasNext() const {
    return init_error_.has_value() || !heap_.empty();
}

Result<Record> KWayMerger::next() {
    if (init_error_) {
        storage::StorageError err = std::move(*init_error_);
        init_error_.reset();
        heap_ = decltype(heap_)();
        return err;
    }
    if (heap_.empty()) {
        return storage::StorageError(storage::ErrorCode::INTERNAL_ERROR, "K-way merger exhausted");
    }

    MergeHeapEntry top = heap_.top();
    heap_.pop();
    RETURN_IF_ERROR(advance(top.source_index));

    // Older versions of the same key: drop them and pull their successors.
    while (!heap_.empty() && heap_.top().record.key == top.record.key) {
        size_t source = heap_.top().source_index;
        heap_.pop();
        duplicates_dropped_++;
        RETURN_IF_ERROR(advance(source));
    }
    return std::move(top.record);
}

} // namespace lsm
} // namespace strata
