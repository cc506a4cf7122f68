// include/wal/wal_segment.h
#pragma once

#include "wal/wal_record.h"
#include "storage_error/result.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata {
namespace wal {

// Everything readable from one segment file.
struct SegmentContents {
    std::vector<WALEntry> entries;
    uint64_t valid_bytes = 0; // end offset of the last complete record
    uint64_t file_bytes = 0;
    bool torn = false;        // bytes after valid_bytes did not form a record
};

/**
 * @brief One `wal-NNNNNN.log` file. Appends go through a POSIX descriptor and
 * are fsync'ed before append() returns.
 */
class WALSegment {
public:
    ~WALSegment();

    WALSegment(const WALSegment&) = delete;
    WALSegment& operator=(const WALSegment&) = delete;

    // Opens (creating if absent) the segment for appending at its current end.
    static storage::Result<std::unique_ptr<WALSegment>> open(const std::string& file_path, uint32_t index);

    // Reads a segment file without opening it for writes.
    static storage::Result<SegmentContents> readFile(const std::string& file_path);

    storage::Status append(const std::string& encoded_record);
    storage::Status sync();
    // Cuts the file back to `size` bytes (used to drop a torn tail).
    storage::Status truncateTo(uint64_t size);
    storage::Status close();

    storage::Result<SegmentContents> readAll() const { return readFile(file_path_); }

    uint32_t getIndex() const { return index_; }
    const std::string& getFilePath() const { return file_path_; }
    uint64_t getCurrentSize() const { return current_size_; }
    bool isOpen() const { return fd_ >= 0; }

    static std::string segmentFileName(uint32_t index);
    static std::optional<uint32_t> parseSegmentFileName(const std::string& file_name);

private:
    WALSegment(std::string file_path, uint32_t index, int fd, uint64_t size);
    // Cuts the file back to current_size_ after a write or sync that failed.
    void rollbackAppend();

    std::string file_path_;
    uint32_t index_;
    int fd_;
    uint64_t current_size_;
};

} // namespace wal
} // namespace strata
