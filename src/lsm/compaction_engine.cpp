// src/lsm/compaction_engine.cpp
#include "lsm/compaction_engine.h"
#include "lsm/kway_merger.h"
#include "lsm/sstable_reader.h"
#include "debug_utils.h"
#include "file_utils.h"
#include "storage_error/error_utils.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace strata {
namespace lsm {

using storage::ErrorCode;
using storage::Result;
using storage::Status;
using storage::StorageError;

namespace {

struct OrderedInput {
    std::string path;
    int level;
    uint64_t sequence;
};

} // namespace

Result<std::vector<std::string>> inputRemovalOrder(const CompactionJob& job) {
    std::vector<OrderedInput> inputs;
    inputs.reserve(job.input_files.size());
    for (const auto& path : job.input_files) {
        if (path == job.output_file) continue;
        auto parsed = parseSSTableFileName(fs::path(path).filename().string());
        if (!parsed) {
            return STORAGE_ERROR(ErrorCode::INVALID_DATA_FORMAT, "Compaction input is not an SSTable file name")
                .withFilePath(path);
        }
        inputs.push_back(OrderedInput{path, parsed->first, parsed->second});
    }
    std::sort(inputs.begin(), inputs.end(), [](const OrderedInput& a, const OrderedInput& b) {
        if (a.level != b.level) return a.level > b.level;
        return a.sequence < b.sequence;
    });

    std::vector<std::string> order;
    order.reserve(inputs.size());
    for (auto& input : inputs) order.push_back(std::move(input.path));
    return order;
}

CompactionEngine::CompactionEngine(std::string data_dir,
                                   std::unique_ptr<CompactionStrategy> strategy,
                                   SequenceAllocator allocate_sequence,
                                   const CompactionEngineOptions& options)
    : data_dir_(std::move(data_dir)),
      strategy_(std::move(strategy)),
      allocate_sequence_(std::move(allocate_sequence)),
      options_(options)
{
    if (!strategy_) {
        throw STORAGE_ERROR(ErrorCode::INVALID_CONFIGURATION, "CompactionEngine requires a strategy.");
    }
    if (!allocate_sequence_) {
        throw STORAGE_ERROR(ErrorCode::INVALID_CONFIGURATION, "CompactionEngine requires a sequence allocator.");
    }
    LOG_INFO("[CompactionEngine] Initialized for '{}' with strategy {}.", data_dir_, strategy_->name());
}

Result<bool> CompactionEngine::compactIfNeeded() {
    std::lock_guard<std::mutex> lock(compaction_mutex_);

    ASSIGN_OR_RETURN_AUTO(files, listSSTableFiles(data_dir_));
    LevelSnapshot levels = groupByLevel(files, options_.max_levels);

    std::optional<CompactionJob> job = strategy_->selectSSTables(levels);
    if (!job) {
        return false;
    }

    job->output_file = (fs::path(data_dir_) /
                        generateSSTableFileName(job->target_level, allocate_sequence_())).string();

    // Purging is safe only when nothing older can sit below the output.
    job->drop_tombstones = true;
    for (size_t i = static_cast<size_t>(job->target_level) + 1; i < levels.size(); ++i) {
        if (!levels[i].empty()) {
            job->drop_tombstones = false;
            break;
        }
    }

    RETURN_IF_ERROR(runJobLocked(std::move(*job)));
    return true;
}

Status CompactionEngine::executeCompaction(const CompactionJob& job) {
    std::lock_guard<std::mutex> lock(compaction_mutex_);
    return runJobLocked(job);
}

Status CompactionEngine::runJobLocked(CompactionJob job) {
    if (job.input_files.empty()) {
        LOG_WARN("[CompactionEngine] L{} -> L{} job has no inputs. Nothing to do.", job.source_level, job.target_level);
        return Status();
    }
    if (job.target_level < 0 || job.target_level >= options_.max_levels) {
        compactions_failed_.fetch_add(1, std::memory_order_relaxed);
        return STORAGE_ERROR(ErrorCode::LSM_COMPACTION_FAILED, "Target level out of range")
            .withContext("target_level", std::to_string(job.target_level));
    }
    if (job.output_file.empty()) {
        job.output_file = (fs::path(data_dir_) /
                           generateSSTableFileName(job.target_level, allocate_sequence_())).string();
    }

    LOG_INFO("[CompactionEngine] Starting L{} -> L{}: {} input(s) -> {} (drop_tombstones={}).",
             job.source_level, job.target_level, job.input_files.size(),
             fs::path(job.output_file).filename().string(), job.drop_tombstones);
    auto start_time = std::chrono::steady_clock::now();

    uint64_t entries_written = 0;
    Status merged = mergeInto(job, entries_written);
    if (!merged.isOk()) {
        compactions_failed_.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("[CompactionEngine] L{} -> L{} failed, inputs left in place: {}",
                  job.source_level, job.target_level, merged.error().toString());
        if (storage::error_utils::isCorruption(merged.error().code)) {
            quarantineCorruptInput(job, merged.error());
        }
        return merged;
    }

    Status removed = removeInputs(job);
    if (!removed.isOk()) {
        // The output is live and the inputs left are the job's newest, which
        // agree with it. The next tick merges them again.
        compactions_failed_.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("[CompactionEngine] L{} -> L{} published {} but could not retire every input: {}",
                  job.source_level, job.target_level,
                  fs::path(job.output_file).filename().string(), removed.error().toString());
        return removed;
    }
    compactions_completed_.fetch_add(1, std::memory_order_relaxed);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    LOG_INFO("[CompactionEngine] Finished L{} -> L{} in {}ms. Entries written: {}.",
             job.source_level, job.target_level, elapsed.count(), entries_written);
    return Status();
}

Status CompactionEngine::mergeInto(const CompactionJob& job, uint64_t& entries_written) {
    // Newest first: lower level, then higher sequence.
    std::vector<OrderedInput> inputs;
    inputs.reserve(job.input_files.size());
    for (const auto& path : job.input_files) {
        auto parsed = parseSSTableFileName(fs::path(path).filename().string());
        if (!parsed) {
            return STORAGE_ERROR(ErrorCode::INVALID_DATA_FORMAT, "Compaction input is not an SSTable file name")
                .withFilePath(path);
        }
        inputs.push_back(OrderedInput{path, parsed->first, parsed->second});
    }
    std::sort(inputs.begin(), inputs.end(), [](const OrderedInput& a, const OrderedInput& b) {
        if (a.level != b.level) return a.level < b.level;
        return a.sequence > b.sequence;
    });

    std::vector<std::unique_ptr<EntryIterator>> sources;
    uint64_t estimated_entries = 0;
    for (const auto& input : inputs) {
        ASSIGN_OR_RETURN_AUTO(reader, SSTableReader::open(input.path));
        estimated_entries += reader->getMetadata().entry_count;
        sources.push_back(reader->newIterator());
    }

    KWayMerger merger(std::move(sources));
    uint64_t tombstones_dropped = 0;

    try {
        SSTableBuilder builder(job.output_file, job.target_level, estimated_entries, options_.builder_options);

        while (merger.hasNext()) {
            Result<Record> next = merger.next();
            if (!next.isOk()) {
                builder.abandon();
                return std::move(next.error());
            }
            const Record& record = next.value();
            if (record.deleted && job.drop_tombstones) {
                tombstones_dropped++;
                continue;
            }
            builder.add(record);
        }

        entries_written = builder.getRecordCount();
        if (entries_written == 0) {
            // Everything was purged; publish nothing.
            builder.abandon();
            LOG_INFO("[CompactionEngine] Output {} would be empty. Not published.",
                     fs::path(job.output_file).filename().string());
        } else {
            builder.finish();
            std::error_code ec;
            auto size = fs::file_size(job.output_file, ec);
            if (!ec) bytes_written_.fetch_add(size, std::memory_order_relaxed);
        }
    } catch (const StorageError& e) {
        return e;
    } catch (const std::exception& e) {
        return StorageError::compactionFailed(e.what()).withFilePath(job.output_file);
    }

    entries_dropped_.fetch_add(tombstones_dropped + merger.duplicatesDropped(), std::memory_order_relaxed);
    return Status();
}

Status CompactionEngine::removeInputs(const CompactionJob& job) {
    ASSIGN_OR_RETURN_AUTO(order, inputRemovalOrder(job));
    std::unique_lock<std::shared_mutex> lock(retire_mutex_);
    for (const auto& path : order) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            return StorageError::ioErrorFromErrno(ec.value(), "remove compaction input", path);
        }
        // Each unlink must be durable before the next, newer one.
        RETURN_IF_ERROR(file_utils::syncDirectory(data_dir_));
        LOG_TRACE("  - Deleted input {}", path);
    }
    return Status();
}

void CompactionEngine::quarantineCorruptInput(const CompactionJob& job, const StorageError& error) {
    if (!error.file_path) {
        return;
    }
    auto it = std::find(job.input_files.begin(), job.input_files.end(), *error.file_path);
    if (it == job.input_files.end() || *it == job.output_file ||
        !parseSSTableFileName(fs::path(*it).filename().string())) {
        return;
    }
    const std::string target = *it + kQuarantineSuffix;
    Status renamed = file_utils::durableRename(*it, target);
    if (!renamed.isOk()) {
        LOG_ERROR("[CompactionEngine] Could not quarantine corrupt table '{}': {}", *it, renamed.error().toString());
        return;
    }
    LOG_ERROR("[CompactionEngine] Quarantined corrupt table '{}' as '{}'. Its entries are no longer served.",
              *it, fs::path(target).filename().string());
}

Result<std::vector<SSTableFileInfo>> CompactionEngine::listFiles() const {
    std::shared_lock<std::shared_mutex> lock(retire_mutex_);
    return listSSTableFiles(data_dir_);
}

CompactionEngineStats CompactionEngine::getStats() const {
    CompactionEngineStats stats;
    stats.compactions_completed = compactions_completed_.load(std::memory_order_relaxed);
    stats.compactions_failed = compactions_failed_.load(std::memory_order_relaxed);
    stats.bytes_written = bytes_written_.load(std::memory_order_relaxed);
    stats.entries_dropped = entries_dropped_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace lsm
} // namespace strata
