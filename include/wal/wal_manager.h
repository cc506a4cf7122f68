// include/wal/wal_manager.h
#pragma once

#include "wal/wal_record.h"
#include "wal/wal_segment.h"
#include "storage_error/result.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace strata {
namespace wal {

struct WALStats {
    size_t file_count = 0;
    uint64_t total_size = 0;
    uint64_t entry_count = 0;
    std::string current_file;
};

/**
 * @brief Segmented write-ahead log living in the engine's data directory.
 *
 * Segments are `wal-NNNNNN.log`, numbered from the directory listing.
 * The highest-numbered segment is the active one; all others are sealed.
 */
class WALManager {
public:
    ~WALManager();

    WALManager(const WALManager&) = delete;
    WALManager& operator=(const WALManager&) = delete;

    /**
     * @brief Opens the log in `dir`, creating `wal-000000.log` when none exists.
     * A torn tail on the active segment is cut back to its last complete record.
     */
    static storage::Result<std::unique_ptr<WALManager>> open(const std::string& dir, uint64_t segment_max_bytes);

    // Encodes, writes and fsyncs one entry. Rotates first when the entry would overflow a non-empty segment.
    storage::Status append(const WALEntry& entry);

    // Every entry of every segment, oldest segment first, in write order.
    storage::Result<std::vector<WALEntry>> readAll() const;

    // Deletes segments with index <= before_index. The active segment is kept.
    storage::Status truncate(uint32_t before_index);

    // Seals the active segment and opens the next one. Returns the sealed index.
    storage::Result<uint32_t> rotate();

    WALStats getStats() const;
    uint32_t activeIndex() const;

    storage::Status close();

private:
    struct SealedSegment {
        std::string path;
        uint64_t size = 0;
        uint64_t entries = 0;
    };

    WALManager(std::string dir, uint64_t segment_max_bytes);

    storage::Status openNextSegmentLocked();
    storage::Result<uint32_t> rotateLocked();

    std::string dir_;
    uint64_t segment_max_bytes_;

    mutable std::mutex mutex_;
    std::map<uint32_t, SealedSegment> sealed_;
    std::unique_ptr<WALSegment> active_;
    uint64_t active_entries_ = 0;
    bool closed_ = false;
};

} // namespace wal
} // namespace strata
