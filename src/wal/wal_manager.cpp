// src/wal/wal_manager.cpp
#include "wal/wal_manager.h"
#include "debug_utils.h"
#include "file_utils.h"
#include "storage_error/error_utils.h"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace strata {
namespace wal {

using storage::ErrorCode;
using storage::Result;
using storage::Status;
using storage::StorageError;

WALManager::WALManager(std::string dir, uint64_t segment_max_bytes)
    : dir_(std::move(dir)), segment_max_bytes_(segment_max_bytes) {
}

WALManager::~WALManager() {
    Status s = close();
    if (!s.isOk()) {
        LOG_ERROR("[WALManager] Close in destructor failed: {}", s.error().toString());
    }
}

Result<std::unique_ptr<WALManager>> WALManager::open(const std::string& dir, uint64_t segment_max_bytes) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return StorageError::ioErrorFromErrno(ec.value(), "create WAL directory", dir);
    }

    std::map<uint32_t, std::string> found;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file()) continue;
        auto index = WALSegment::parseSegmentFileName(it->path().filename().string());
        if (index) {
            found[*index] = it->path().string();
        }
    }
    if (ec) {
        return StorageError::ioErrorFromErrno(ec.value(), "list WAL directory", dir);
    }

    std::unique_ptr<WALManager> manager(new WALManager(dir, segment_max_bytes));

    if (found.empty()) {
        std::string path = (fs::path(dir) / WALSegment::segmentFileName(0)).string();
        ASSIGN_OR_RETURN_AUTO(segment, WALSegment::open(path, 0));
        RETURN_IF_ERROR(file_utils::syncDirectory(dir));
        manager->active_ = std::move(segment);
        LOG_INFO("[WALManager] Created new log '{}'.", path);
        return std::move(manager);
    }

    uint32_t last_index = found.rbegin()->first;
    for (const auto& [index, path] : found) {
        ASSIGN_OR_RETURN_AUTO(contents, WALSegment::readFile(path));
        if (index != last_index) {
            if (contents.torn) {
                LOG_WARN("[WALManager] Sealed segment '{}' has {} trailing bytes past its last complete record.",
                         path, contents.file_bytes - contents.valid_bytes);
            }
            manager->sealed_[index] = SealedSegment{path, contents.file_bytes, contents.entries.size()};
            continue;
        }

        ASSIGN_OR_RETURN_AUTO(segment, WALSegment::open(path, index));
        if (contents.torn) {
            LOG_WARN("[WALManager] Active segment '{}' has a torn tail; cutting {} bytes back to offset {}.",
                     path, contents.file_bytes - contents.valid_bytes, contents.valid_bytes);
            RETURN_IF_ERROR(segment->truncateTo(contents.valid_bytes));
        }
        manager->active_ = std::move(segment);
        manager->active_entries_ = contents.entries.size();
    }

    LOG_INFO("[WALManager] Opened log in '{}': {} sealed segment(s), active segment {}.",
             dir, manager->sealed_.size(), last_index);
    return std::move(manager);
}

Status WALManager::append(const WALEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !active_) {
        return StorageError::notOpen("WAL append");
    }

    std::string encoded;
    try {
        encoded = encodeWALEntry(entry);
    } catch (const std::length_error& e) {
        return StorageError(ErrorCode::INVALID_VALUE, "Entry too large for the WAL").withDetails(e.what());
    }

    if (active_->getCurrentSize() > 0 &&
        active_->getCurrentSize() + encoded.size() > segment_max_bytes_) {
        auto rotated = rotateLocked();
        if (!rotated.isOk()) {
            return std::move(rotated.error());
        }
    }

    RETURN_IF_ERROR(active_->append(encoded));
    active_entries_++;
    return Status();
}

Result<std::vector<WALEntry>> WALManager::readAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WALEntry> all;

    auto read_one = [&all](const std::string& path) -> Status {
        ASSIGN_OR_RETURN_AUTO(contents, WALSegment::readFile(path));
        if (contents.torn) {
            LOG_WARN("[WALManager] Stopped reading '{}' at offset {} of {}.", path,
                     contents.valid_bytes, contents.file_bytes);
        }
        for (auto& entry : contents.entries) {
            all.push_back(std::move(entry));
        }
        return Status();
    };

    for (const auto& [index, sealed] : sealed_) {
        (void)index;
        RETURN_IF_ERROR(read_one(sealed.path));
    }
    if (active_) {
        RETURN_IF_ERROR(read_one(active_->getFilePath()));
    }
    return all;
}

Status WALManager::truncate(uint32_t before_index) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed_any = false;
    for (auto it = sealed_.begin(); it != sealed_.end() && it->first <= before_index;) {
        std::error_code ec;
        fs::remove(it->second.path, ec);
        if (ec) {
            return StorageError::ioErrorFromErrno(ec.value(), "remove WAL segment", it->second.path);
        }
        LOG_TRACE("[WALManager] Removed sealed segment '{}'.", it->second.path);
        it = sealed_.erase(it);
        removed_any = true;
    }
    if (removed_any) {
        RETURN_IF_ERROR(file_utils::syncDirectory(dir_));
    }
    return Status();
}

Result<uint32_t> WALManager::rotate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !active_) {
        return StorageError::notOpen("WAL rotate");
    }
    return rotateLocked();
}

Result<uint32_t> WALManager::rotateLocked() {
    uint32_t sealed_index = active_->getIndex();
    std::string sealed_path = active_->getFilePath();
    uint64_t sealed_size = active_->getCurrentSize();

    RETURN_IF_ERROR(openNextSegmentLocked());
    sealed_[sealed_index] = SealedSegment{sealed_path, sealed_size, active_entries_};
    active_entries_ = 0;
    LOG_TRACE("[WALManager] Sealed segment {} ({} bytes); active is now {}.",
              sealed_index, sealed_size, active_->getIndex());
    return sealed_index;
}

Status WALManager::openNextSegmentLocked() {
    uint32_t next_index = active_->getIndex() + 1;
    std::string path = (fs::path(dir_) / WALSegment::segmentFileName(next_index)).string();
    ASSIGN_OR_RETURN_AUTO(next, WALSegment::open(path, next_index));
    RETURN_IF_ERROR(file_utils::syncDirectory(dir_));
    RETURN_IF_ERROR(active_->close());
    active_ = std::move(next);
    return Status();
}

WALStats WALManager::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    WALStats stats;
    for (const auto& [index, sealed] : sealed_) {
        (void)index;
        stats.total_size += sealed.size;
        stats.entry_count += sealed.entries;
    }
    stats.file_count = sealed_.size();
    if (active_) {
        stats.file_count += 1;
        stats.total_size += active_->getCurrentSize();
        stats.entry_count += active_entries_;
        stats.current_file = active_->getFilePath();
    }
    return stats;
}

uint32_t WALManager::activeIndex() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ ? active_->getIndex() : 0;
}

Status WALManager::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return Status();
    }
    closed_ = true;
    if (active_) {
        return active_->close();
    }
    return Status();
}

} // namespace wal
} // namespace strata
