// include/lsm/entry_iterator.h
#pragma once

#include "types.h"
#include "storage_error/result.h"

namespace strata {
namespace lsm {

/**
 * @brief One-pass, ascending stream of records. Implemented by MemTable and
 * SSTable iterators and consumed by the K-way merger.
 */
class EntryIterator {
public:
    virtual ~EntryIterator() = default;

    virtual bool hasNext() const = 0;
    // Returns the next record and advances. A read error is returned once by next(),
    // after which hasNext() is false.
    virtual storage::Result<Record> next() = 0;
};

} // namespace lsm
} // namespace strata
