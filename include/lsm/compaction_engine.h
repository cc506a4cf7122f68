// include/lsm/compaction_engine.h
#pragma once

#include "lsm/compaction_strategy.h"
#include "lsm/sstable_builder.h"
#include "storage_error/result.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace strata {
namespace lsm {

// Hands out SSTable sequence numbers shared with the flush path.
using SequenceAllocator = std::function<uint64_t()>;

struct CompactionEngineOptions {
    int max_levels = 7;
    SSTableBuilder::Options builder_options;
};

struct CompactionEngineStats {
    uint64_t compactions_completed = 0;
    uint64_t compactions_failed = 0;
    uint64_t bytes_written = 0;
    // Tombstones purged plus versions superseded by a newer one.
    uint64_t entries_dropped = 0;
};

// The job's inputs other than its output, deepest level first and then lowest
// sequence first. Deleting in this order never leaves a value without the newer
// tombstone that shadows it.
storage::Result<std::vector<std::string>> inputRemovalOrder(const CompactionJob& job);

/**
 * @class CompactionEngine
 * @brief Runs compaction jobs chosen by a CompactionStrategy over the SSTables of one directory.
 *
 * Jobs are serialized. Input files are removed only after the output has been
 * published, so a failed merge leaves the directory as it found it. An input
 * found corrupt is renamed to `<name>.corrupt` so later jobs skip it.
 */
class CompactionEngine {
public:
    CompactionEngine(std::string data_dir,
                     std::unique_ptr<CompactionStrategy> strategy,
                     SequenceAllocator allocate_sequence,
                     const CompactionEngineOptions& options = CompactionEngineOptions{});

    CompactionEngine(const CompactionEngine&) = delete;
    CompactionEngine& operator=(const CompactionEngine&) = delete;

    /**
     * @brief Lists the directory, asks the strategy for a job and runs it.
     * @return true if a job ran, false if there was nothing to do.
     */
    storage::Result<bool> compactIfNeeded();

    // Runs a job as given. An empty output_file is assigned a fresh name at the target level.
    storage::Status executeCompaction(const CompactionJob& job);

    /**
     * @brief Lists the directory's SSTables while no job is retiring inputs.
     *
     * An output published during the pass may be missed, but then every one
     * of its inputs is still listed.
     */
    storage::Result<std::vector<SSTableFileInfo>> listFiles() const;

    CompactionEngineStats getStats() const;
    const CompactionStrategy& getStrategy() const { return *strategy_; }

private:
    storage::Status runJobLocked(CompactionJob job);
    storage::Status mergeInto(const CompactionJob& job, uint64_t& entries_written);
    // Stops at the first failed unlink.
    storage::Status removeInputs(const CompactionJob& job);
    void quarantineCorruptInput(const CompactionJob& job, const storage::StorageError& error);

    const std::string data_dir_;
    std::unique_ptr<CompactionStrategy> strategy_;
    SequenceAllocator allocate_sequence_;
    const CompactionEngineOptions options_;

    std::mutex compaction_mutex_;
    // Exclusive while inputs are unlinked, shared while listing.
    mutable std::shared_mutex retire_mutex_;

    std::atomic<uint64_t> compactions_completed_{0};
    std::atomic<uint64_t> compactions_failed_{0};
    std::atomic<uint64_t> bytes_written_{0};
    std::atomic<uint64_t> entries_dropped_{0};
};

} // namespace lsm
} // namespace strata
