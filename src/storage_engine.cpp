// src/storage_engine.cpp
#include "storage_engine.h"
#include "debug_utils.h"
#include "lsm/kway_merger.h"
#include "lsm/size_tiered_compaction_strategy.h"
#include "lsm/sstable_builder.h"
#include "storage_error/error_utils.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace strata {

using storage::ErrorCode;
using storage::Result;
using storage::Status;
using storage::StorageError;

namespace {

constexpr int kMaxLookupAttempts = 5;
constexpr const char* kTempSuffix = ".sst.tmp";

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Smallest string greater than every string with this prefix, if one exists.
std::optional<std::string> prefixSuccessor(std::string prefix) {
    while (!prefix.empty()) {
        unsigned char last = static_cast<unsigned char>(prefix.back());
        if (last != 0xff) {
            prefix.back() = static_cast<char>(last + 1);
            return prefix;
        }
        prefix.pop_back();
    }
    return std::nullopt;
}

} // namespace

std::string EngineStats::toJson() const {
    nlohmann::json j;
    j["memtable_size"] = memtable_size;
    j["memtable_entries"] = memtable_entries;
    j["deleted_keys"] = deleted_keys;
    j["sstable_count"] = sstable_count;
    nlohmann::json levels = nlohmann::json::object();
    for (const auto& [level, count] : level_counts) {
        levels[std::to_string(level)] = count;
    }
    j["level_counts"] = levels;
    j["wal"] = {
        {"file_count", wal.file_count},
        {"total_size", wal.total_size},
        {"entry_count", wal.entry_count},
        {"current_file", wal.current_file},
    };
    j["compactions_completed"] = compactions_completed;
    j["compactions_failed"] = compactions_failed;
    j["flush_count"] = flush_count;
    j["flush_failures"] = flush_failures;
    j["background_errors"] = background_errors;
    return j.dump(2);
}

StorageEngine::StorageEngine(EngineConfig config)
    : config_(std::move(config)),
      error_context_(config_.error_handler) {}

StorageEngine::~StorageEngine() {
    Status s = close();
    if (!s.isOk()) {
        LOG_ERROR("[StorageEngine] Close during destruction failed: {}", s.error().toString());
    }
}

Result<std::unique_ptr<StorageEngine>> StorageEngine::open(const EngineConfig& config) {
    RETURN_IF_ERROR(config.validate());
    log::setLogLevel(config.log_level);

    std::unique_ptr<StorageEngine> engine(new StorageEngine(config));
    RETURN_IF_ERROR(engine->initialize());
    return std::move(engine);
}

Status StorageEngine::initialize() {
    const std::string& dir = config_.data_dir;
    LOG_INFO("[StorageEngine] Opening data directory '{}'.", dir);

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return StorageError::ioErrorFromErrno(ec.value(), "create_directories", dir);
    }
    RETURN_IF_ERROR(removeStaleTempFiles());

    // Sequence and timestamp clocks continue past everything already on disk.
    ASSIGN_OR_RETURN_AUTO(files, lsm::listSSTableFiles(dir));
    uint64_t max_sequence = 0;
    for (const auto& f : files) {
        max_sequence = std::max(max_sequence, f.sequence);
        auto reader = lsm::SSTableReader::open(f.path);
        if (!reader.isOk()) {
            LOG_WARN("[StorageEngine] Skipping unreadable SSTable {} at startup: {}", f.path, reader.error().toString());
            continue;
        }
        last_timestamp_ = std::max(last_timestamp_, reader.value()->getMetadata().max_timestamp);
    }
    // Quarantined tables keep their names reserved.
    ASSIGN_OR_RETURN_AUTO(max_quarantined, lsm::maxQuarantinedSSTableSequence(dir));
    max_sequence = std::max(max_sequence, max_quarantined);
    next_sstable_sequence_.store(max_sequence + 1, std::memory_order_relaxed);
    LOG_INFO("[StorageEngine] Found {} SSTable(s). Next sequence: {}.", files.size(), max_sequence + 1);

    memtable_ = std::make_unique<lsm::MemTable>();

    auto wal = wal::WALManager::open(dir, config_.wal_segment_max_bytes);
    if (!wal.isOk()) {
        return STORAGE_ERROR(ErrorCode::STORAGE_RECOVERY_FAILED, "Failed to open the write-ahead log")
            .withUnderlyingError(wal.error().code)
            .withDetails(wal.error().toString())
            .withFilePath(dir);
    }
    wal_ = std::move(wal.value());
    RETURN_IF_ERROR(recoverFromWAL());

    try {
        lsm::CompactionEngineOptions options;
        options.max_levels = config_.max_levels;
        options.builder_options = config_.builderOptions();
        compaction_engine_ = std::make_unique<lsm::CompactionEngine>(
            dir,
            std::make_unique<lsm::SizeTieredCompactionStrategy>(config_.compactionConfig()),
            [this]() { return next_sstable_sequence_.fetch_add(1, std::memory_order_relaxed); },
            options);
    } catch (const StorageError& e) {
        return e;
    }

    state_.store(EngineState::Open, std::memory_order_release);

    if (memtable_->size() >= config_.memtable_max_bytes) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        Status s = flushLocked();
        if (!s.isOk()) {
            flush_failures_.fetch_add(1, std::memory_order_relaxed);
            LOG_WARN("[StorageEngine] Post-recovery flush failed, keeping data in the WAL: {}", s.error().toString());
            reportBackgroundError(s.error());
        }
    }

    startCompactionThread();
    LOG_INFO("[StorageEngine] Open. Recovered {} MemTable entries, {} deleted key(s).",
             memtable_->entryCount(), deleted_keys_.size());
    return Status();
}

Status StorageEngine::removeStaleTempFiles() {
    std::error_code ec;
    fs::directory_iterator it(config_.data_dir, ec);
    if (ec) {
        return StorageError::ioErrorFromErrno(ec.value(), "directory_iterator", config_.data_dir);
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return StorageError::ioErrorFromErrno(ec.value(), "directory_iterator", config_.data_dir);
        }
        const std::string name = it->path().filename().string();
        if (!endsWith(name, kTempSuffix)) continue;

        std::error_code rm_ec;
        fs::remove(it->path(), rm_ec);
        if (rm_ec) {
            LOG_WARN("[StorageEngine] Could not remove stale temporary file {}: {}", name, rm_ec.message());
        } else {
            LOG_INFO("[StorageEngine] Removed stale temporary file {}.", name);
        }
    }
    return Status();
}

Status StorageEngine::recoverFromWAL() {
    auto entries = wal_->readAll();
    if (!entries.isOk()) {
        return STORAGE_ERROR(ErrorCode::STORAGE_RECOVERY_FAILED, "Failed to replay the write-ahead log")
            .withUnderlyingError(entries.error().code)
            .withDetails(entries.error().toString())
            .withFilePath(config_.data_dir);
    }

    for (const auto& entry : entries.value()) {
        if (entry.kind == EntryKind::PUT) {
            memtable_->put(entry.key, entry.value, entry.timestamp);
            deleted_keys_.erase(entry.key);
        } else {
            memtable_->remove(entry.key, entry.timestamp);
            deleted_keys_.insert(entry.key);
        }
        last_timestamp_ = std::max(last_timestamp_, entry.timestamp);
    }
    LOG_INFO("[StorageEngine] Replayed {} WAL entries.", entries.value().size());
    return Status();
}

int64_t StorageEngine::nextTimestampLocked() {
    last_timestamp_ = std::max(now_nanos(), last_timestamp_ + 1);
    return last_timestamp_;
}

Status StorageEngine::checkOpen(const char* operation) const {
    if (state_.load(std::memory_order_acquire) != EngineState::Open) {
        return StorageError::notOpen(operation);
    }
    return Status();
}

Status StorageEngine::put(const std::string& key, const std::string& value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    RETURN_IF_ERROR(checkOpen("put"));

    int64_t ts = nextTimestampLocked();
    RETURN_IF_ERROR(wal_->append(wal::WALEntry::put(key, value, ts)));
    memtable_->put(key, value, ts);
    deleted_keys_.erase(key);

    if (memtable_->size() >= config_.memtable_max_bytes) {
        Status s = flushLocked();
        if (!s.isOk()) {
            // The write is in the WAL; the next flush retries.
            flush_failures_.fetch_add(1, std::memory_order_relaxed);
            LOG_ERROR("[StorageEngine] Flush after put failed: {}", s.error().toString());
            reportBackgroundError(s.error());
        }
    }
    return Status();
}

Status StorageEngine::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    RETURN_IF_ERROR(checkOpen("remove"));

    int64_t ts = nextTimestampLocked();
    RETURN_IF_ERROR(wal_->append(wal::WALEntry::remove(key, ts)));
    memtable_->remove(key, ts);
    deleted_keys_.insert(key);

    if (memtable_->size() >= config_.memtable_max_bytes) {
        Status s = flushLocked();
        if (!s.isOk()) {
            flush_failures_.fetch_add(1, std::memory_order_relaxed);
            LOG_ERROR("[StorageEngine] Flush after remove failed: {}", s.error().toString());
            reportBackgroundError(s.error());
        }
    }
    return Status();
}

Result<std::optional<std::string>> StorageEngine::get(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    RETURN_IF_ERROR(checkOpen("get"));

    if (deleted_keys_.count(key) > 0) {
        return std::optional<std::string>{};
    }
    if (auto record = memtable_->getRecord(key)) {
        if (record->deleted) return std::optional<std::string>{};
        return std::optional<std::string>(std::move(record->value));
    }
    return getFromSSTables(key);
}

Result<std::vector<lsm::SSTableFileInfo>> StorageEngine::listSSTablesNewestFirst() const {
    ASSIGN_OR_RETURN_AUTO(files, compaction_engine_ ? compaction_engine_->listFiles()
                                                    : lsm::listSSTableFiles(config_.data_dir));
    std::sort(files.begin(), files.end(), [](const lsm::SSTableFileInfo& a, const lsm::SSTableFileInfo& b) {
        if (a.level != b.level) return a.level < b.level;
        return a.sequence > b.sequence;
    });
    return files;
}

Result<std::shared_ptr<lsm::SSTableReader>> StorageEngine::getReader(const std::string& path) const {
    {
        std::lock_guard<std::mutex> lock(reader_cache_mutex_);
        auto it = reader_cache_.find(path);
        if (it != reader_cache_.end()) return it->second;
    }
    ASSIGN_OR_RETURN_AUTO(reader, lsm::SSTableReader::open(path));
    std::lock_guard<std::mutex> lock(reader_cache_mutex_);
    reader_cache_.emplace(path, reader);
    return reader;
}

void StorageEngine::pruneReaderCache(const std::vector<lsm::SSTableFileInfo>& live) const {
    std::set<std::string> live_paths;
    for (const auto& f : live) live_paths.insert(f.path);

    std::lock_guard<std::mutex> lock(reader_cache_mutex_);
    for (auto it = reader_cache_.begin(); it != reader_cache_.end();) {
        if (live_paths.count(it->first) == 0) {
            it = reader_cache_.erase(it);
        } else {
            ++it;
        }
    }
}

Result<std::optional<std::string>> StorageEngine::getFromSSTables(const std::string& key) const {
    for (int attempt = 0; attempt < kMaxLookupAttempts; ++attempt) {
        ASSIGN_OR_RETURN_AUTO(files, listSSTablesNewestFirst());
        pruneReaderCache(files);

        bool vanished = false;
        for (const auto& f : files) {
            auto reader = getReader(f.path);
            if (!reader.isOk()) {
                if (reader.error().code == ErrorCode::FILE_NOT_FOUND) {
                    vanished = true;
                    break;
                }
                if (storage::error_utils::isCorruption(reader.error().code)) {
                    LOG_WARN("[StorageEngine] Skipping corrupt SSTable {}: {}", f.path, reader.error().toString());
                    continue;
                }
                return std::move(reader.error());
            }

            auto result = reader.value()->lookup(key);
            if (!result.isOk()) {
                if (storage::error_utils::isCorruption(result.error().code)) {
                    LOG_WARN("[StorageEngine] Skipping corrupt SSTable {}: {}", f.path, result.error().toString());
                    continue;
                }
                return std::move(result.error());
            }
            switch (result.value().status) {
                case lsm::LookupStatus::kFound:
                    return std::optional<std::string>(std::move(result.value().value));
                case lsm::LookupStatus::kDeleted:
                    return std::optional<std::string>{};
                case lsm::LookupStatus::kNotFound:
                    break;
            }
        }
        if (!vanished) {
            return std::optional<std::string>{};
        }
        LOG_TRACE("  [StorageEngine] SSTable set changed during lookup of '{}'. Retrying.", format_key_for_print(key));
    }
    return STORAGE_ERROR(ErrorCode::CONCURRENT_MODIFICATION, "SSTable set kept changing during lookup")
        .withContext("key", format_key_for_print(key));
}

Status StorageEngine::flush() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    RETURN_IF_ERROR(checkOpen("flush"));
    Status s = flushLocked();
    if (!s.isOk()) {
        flush_failures_.fetch_add(1, std::memory_order_relaxed);
    }
    return s;
}

Status StorageEngine::flushLocked() {
    if (memtable_->empty() && deleted_keys_.empty()) {
        return Status();
    }

    const uint64_t sequence = next_sstable_sequence_.fetch_add(1, std::memory_order_relaxed);
    const std::string path = (fs::path(config_.data_dir) / lsm::generateSSTableFileName(0, sequence)).string();
    const size_t entries = memtable_->entryCount();

    try {
        lsm::SSTableBuilder builder(path, 0, entries, config_.builderOptions());
        auto it = memtable_->newIterator();
        while (it->hasNext()) {
            Result<Record> record = it->next();
            if (!record.isOk()) {
                builder.abandon();
                return std::move(record.error());
            }
            builder.add(record.value());
        }
        builder.finish();
    } catch (const StorageError& e) {
        return STORAGE_ERROR(ErrorCode::LSM_FLUSH_FAILED, "MemTable flush failed")
            .withUnderlyingError(e.code)
            .withDetails(e.toString())
            .withFilePath(path);
    } catch (const std::exception& e) {
        return STORAGE_ERROR(ErrorCode::LSM_FLUSH_FAILED, e.what()).withFilePath(path);
    }

    // The table now holds everything the current WAL segments do.
    ASSIGN_OR_RETURN_AUTO(sealed_index, wal_->rotate());
    Status truncated = wal_->truncate(sealed_index);
    if (!truncated.isOk()) {
        // Replaying the leftover segments only rewrites what the table already holds.
        LOG_WARN("[StorageEngine] WAL truncation after flush failed: {}", truncated.error().toString());
        reportBackgroundError(truncated.error());
    }

    memtable_ = std::make_unique<lsm::MemTable>();
    deleted_keys_.clear();
    flush_count_.fetch_add(1, std::memory_order_relaxed);

    LOG_INFO("[StorageEngine] Flushed {} entries to {}.", entries, fs::path(path).filename().string());
    return Status();
}

Result<bool> StorageEngine::compactNow() {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        RETURN_IF_ERROR(checkOpen("compactNow"));
    }
    return compaction_engine_->compactIfNeeded();
}

Result<std::vector<StorageEngine::KeyValue>> StorageEngine::scanRange(const std::string& start,
                                                                      const std::string& end) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    RETURN_IF_ERROR(checkOpen("scanRange"));
    if (end < start) {
        return std::vector<KeyValue>{};
    }
    return scanLocked(start, end);
}

Result<std::vector<StorageEngine::KeyValue>> StorageEngine::scanPrefix(const std::string& prefix) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    RETURN_IF_ERROR(checkOpen("scanPrefix"));

    // The successor bound is inclusive, so it is filtered out below.
    ASSIGN_OR_RETURN_AUTO(pairs, scanLocked(prefix, prefixSuccessor(prefix)));
    pairs.erase(std::remove_if(pairs.begin(), pairs.end(),
                               [&prefix](const KeyValue& kv) { return kv.first.compare(0, prefix.size(), prefix) != 0; }),
                pairs.end());
    return pairs;
}

Result<std::vector<StorageEngine::KeyValue>> StorageEngine::scanLocked(const std::string& start,
                                                                       const std::optional<std::string>& end) const {
    for (int attempt = 0; attempt < kMaxLookupAttempts; ++attempt) {
        ASSIGN_OR_RETURN_AUTO(files, listSSTablesNewestFirst());
        pruneReaderCache(files);

        std::vector<std::unique_ptr<lsm::EntryIterator>> sources;
        sources.push_back(end ? memtable_->newRangeIterator(start, *end) : memtable_->newIterator());

        bool vanished = false;
        for (const auto& f : files) {
            auto reader = getReader(f.path);
            if (!reader.isOk()) {
                if (reader.error().code == ErrorCode::FILE_NOT_FOUND) {
                    vanished = true;
                    break;
                }
                if (storage::error_utils::isCorruption(reader.error().code)) {
                    LOG_WARN("[StorageEngine] Scan skipping corrupt SSTable {}: {}", f.path, reader.error().toString());
                    continue;
                }
                return std::move(reader.error());
            }
            sources.push_back(end ? reader.value()->newRangeIterator(start, *end) : reader.value()->newIterator());
        }
        if (vanished) continue;

        std::vector<KeyValue> out;
        lsm::KWayMerger merger(std::move(sources));
        while (merger.hasNext()) {
            ASSIGN_OR_RETURN_AUTO(record, merger.next());
            if (record.key < start) continue;
            if (record.deleted || deleted_keys_.count(record.key) > 0) continue;
            out.emplace_back(std::move(record.key), std::move(record.value));
        }
        return out;
    }
    return STORAGE_ERROR(ErrorCode::CONCURRENT_MODIFICATION, "SSTable set kept changing during scan");
}

EngineStats StorageEngine::stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    EngineStats s;
    if (memtable_) {
        s.memtable_size = memtable_->size();
        s.memtable_entries = memtable_->entryCount();
    }
    s.deleted_keys = deleted_keys_.size();

    auto files = lsm::listSSTableFiles(config_.data_dir);
    if (files.isOk()) {
        s.sstable_count = files.value().size();
        for (const auto& f : files.value()) s.level_counts[f.level]++;
    } else {
        LOG_WARN("[StorageEngine] stats() could not list SSTables: {}", files.error().toString());
    }

    if (wal_) s.wal = wal_->getStats();
    if (compaction_engine_) {
        auto c = compaction_engine_->getStats();
        s.compactions_completed = c.compactions_completed;
        s.compactions_failed = c.compactions_failed;
    }
    s.flush_count = flush_count_.load(std::memory_order_relaxed);
    s.flush_failures = flush_failures_.load(std::memory_order_relaxed);
    s.background_errors = background_errors_.load(std::memory_order_relaxed);
    return s;
}

Status StorageEngine::close() {
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    if (state_.load(std::memory_order_acquire) != EngineState::Open) {
        return Status();
    }
    state_.store(EngineState::Closing, std::memory_order_release);
    LOG_INFO("[StorageEngine] Closing '{}'.", config_.data_dir);

    // An in-flight compaction finishes before the thread exits.
    stopCompactionThread();

    Status result;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        Status flushed = flushLocked();
        if (!flushed.isOk()) {
            flush_failures_.fetch_add(1, std::memory_order_relaxed);
            LOG_ERROR("[StorageEngine] Final flush failed, data remains in the WAL: {}", flushed.error().toString());
            result = flushed;
        }
        Status wal_closed = wal_->close();
        if (!wal_closed.isOk() && result.isOk()) {
            result = wal_closed;
        }
    }
    {
        std::lock_guard<std::mutex> lock(reader_cache_mutex_);
        reader_cache_.clear();
    }

    state_.store(EngineState::Closed, std::memory_order_release);
    LOG_INFO("[StorageEngine] Closed.");
    return result;
}

void StorageEngine::startCompactionThread() {
    if (config_.compaction_interval_ms <= 0) {
        LOG_INFO("[StorageEngine] Background compaction disabled.");
        return;
    }
    scheduler_running_.store(true, std::memory_order_release);
    compaction_thread_ = std::thread(&StorageEngine::compactionThreadLoop, this);
    LOG_INFO("[StorageEngine] Compaction thread started (interval {}ms).", config_.compaction_interval_ms);
}

void StorageEngine::stopCompactionThread() {
    bool was_running = scheduler_running_.exchange(false, std::memory_order_acq_rel);
    if (was_running) {
        { std::lock_guard<std::mutex> lock(scheduler_mutex_); scheduler_cv_.notify_one(); }
    }
    if (compaction_thread_.joinable()) compaction_thread_.join();
}

void StorageEngine::compactionThreadLoop() {
    LOG_INFO("[CompactionThread ThdID: {}] Started.", std::this_thread::get_id());
    const auto interval = std::chrono::milliseconds(config_.compaction_interval_ms);
    while (scheduler_running_.load(std::memory_order_relaxed)) {
        {
            std::unique_lock<std::mutex> lock(scheduler_mutex_);
            if (scheduler_cv_.wait_for(lock, interval, [this] {
                return !scheduler_running_.load(std::memory_order_relaxed);
            })) {
                break;
            }
        }

        try {
            Result<bool> ran = compaction_engine_->compactIfNeeded();
            if (!ran.isOk()) {
                LOG_ERROR("[CompactionThread] Compaction pass failed: {}", ran.error().toString());
                reportBackgroundError(ran.error());
            }
        } catch (const StorageError& e) {
            LOG_ERROR("[CompactionThread] StorageError: {}", e.toString());
            reportBackgroundError(e);
        } catch (const std::exception& e) {
            LOG_ERROR("[CompactionThread ThdID: {}] Exception: {}", std::this_thread::get_id(), e.what());
            reportBackgroundError(StorageError(ErrorCode::INTERNAL_ERROR, e.what()));
        }
    }
    LOG_INFO("[CompactionThread ThdID: {}] Stopped.", std::this_thread::get_id());
}

void StorageEngine::reportBackgroundError(const StorageError& error) {
    background_errors_.fetch_add(1, std::memory_order_relaxed);
    error_context_.reportError(error);
}

} // namespace strata
