// include/storage_engine.h
#pragma once

#include "engine_config.h"
#include "lsm/compaction_engine.h"
#include "lsm/memtable.h"
#include "lsm/sstable_meta.h"
#include "lsm/sstable_reader.h"
#include "storage_error/error_context.h"
#include "storage_error/result.h"
#include "wal/wal_manager.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

namespace strata {

enum class EngineState { Open, Closing, Closed };

struct EngineStats {
    size_t memtable_size = 0;
    size_t memtable_entries = 0;
    size_t deleted_keys = 0;
    size_t sstable_count = 0;
    std::map<int, size_t> level_counts;
    wal::WALStats wal;
    uint64_t compactions_completed = 0;
    uint64_t compactions_failed = 0;
    uint64_t flush_count = 0;
    uint64_t flush_failures = 0;
    uint64_t background_errors = 0;

    std::string toJson() const;
};

/**
 * @class StorageEngine
 * @brief Single-directory LSM key-value store: WAL, MemTable, leveled SSTables
 * and a background compaction thread.
 *
 * Writers (put, remove, flush, close) take the engine lock exclusively, readers
 * (get, scans, stats) share it. Compaction runs outside the engine lock and only
 * publishes or unlinks whole files, which readers tolerate.
 */
class StorageEngine {
public:
    using KeyValue = std::pair<std::string, std::string>;

    /**
     * @brief Opens (or creates) the store in config.data_dir and replays its WAL.
     * @return INVALID_CONFIGURATION for a bad config, STORAGE_RECOVERY_FAILED if the
     *         log cannot be read back.
     */
    static storage::Result<std::unique_ptr<StorageEngine>> open(const EngineConfig& config);

    ~StorageEngine();

    StorageEngine(const StorageEngine&) = delete;
    StorageEngine& operator=(const StorageEngine&) = delete;

    // Durable once this returns OK.
    storage::Status put(const std::string& key, const std::string& value);
    storage::Result<std::optional<std::string>> get(const std::string& key) const;
    storage::Status remove(const std::string& key);

    // Writes the MemTable to a level-0 SSTable and drops the WAL segments it covered.
    storage::Status flush();

    // Runs one compaction pass on the calling thread. true if a job ran.
    storage::Result<bool> compactNow();

    // Live pairs with start <= key <= end, in key order.
    storage::Result<std::vector<KeyValue>> scanRange(const std::string& start, const std::string& end) const;
    storage::Result<std::vector<KeyValue>> scanPrefix(const std::string& prefix) const;

    EngineStats stats() const;

    // Stops background work, flushes, closes the WAL. Safe to call more than once.
    storage::Status close();

    EngineState state() const { return state_.load(std::memory_order_acquire); }
    const EngineConfig& getConfig() const { return config_; }
    const storage::ErrorContext& getErrorContext() const { return error_context_; }

private:
    explicit StorageEngine(EngineConfig config);

    storage::Status initialize();
    storage::Status removeStaleTempFiles();
    storage::Status recoverFromWAL();

    storage::Status flushLocked();
    int64_t nextTimestampLocked();
    storage::Status checkOpen(const char* operation) const;

    storage::Result<std::optional<std::string>> getFromSSTables(const std::string& key) const;
    // Merged, tombstone-free view of [start, end]; an absent end means unbounded.
    storage::Result<std::vector<KeyValue>> scanLocked(const std::string& start,
                                                      const std::optional<std::string>& end) const;

    // SSTables newest first: level ascending, sequence descending.
    storage::Result<std::vector<lsm::SSTableFileInfo>> listSSTablesNewestFirst() const;
    // Cached reader for path. Entries not in `live` are evicted.
    storage::Result<std::shared_ptr<lsm::SSTableReader>> getReader(const std::string& path) const;
    void pruneReaderCache(const std::vector<lsm::SSTableFileInfo>& live) const;

    void startCompactionThread();
    void stopCompactionThread();
    void compactionThreadLoop();
    void reportBackgroundError(const storage::StorageError& error);

    const EngineConfig config_;
    std::atomic<EngineState> state_{EngineState::Closed};

    mutable std::shared_mutex mutex_;
    std::unique_ptr<lsm::MemTable> memtable_;
    std::unordered_set<std::string> deleted_keys_;
    std::unique_ptr<wal::WALManager> wal_;
    int64_t last_timestamp_ = 0;

    std::atomic<uint64_t> next_sstable_sequence_{1};
    std::unique_ptr<lsm::CompactionEngine> compaction_engine_;

    mutable std::mutex reader_cache_mutex_;
    mutable std::map<std::string, std::shared_ptr<lsm::SSTableReader>> reader_cache_;

    std::thread compaction_thread_;
    std::mutex scheduler_mutex_;
    std::condition_variable scheduler_cv_;
    std::atomic<bool> scheduler_running_{false};

    std::mutex close_mutex_;

    std::atomic<uint64_t> flush_count_{0};
    std::atomic<uint64_t> flush_failures_{0};
    std::atomic<uint64_t> background_errors_{0};
    storage::ErrorContext error_context_;
};

} // namespace strata
