// src/wal/wal_segment.cpp
#include "wal/wal_segment.h"
#include "debug_utils.h"
#include "file_utils.h"
#include "storage_error/error_utils.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <unistd.h>

namespace strata {
namespace wal {

using storage::ErrorCode;
using storage::Result;
using storage::Status;
using storage::StorageError;

WALSegment::WALSegment(std::string file_path, uint32_t index, int fd, uint64_t size)
    : file_path_(std::move(file_path)), index_(index), fd_(fd), current_size_(size) {
}

WALSegment::~WALSegment() {
    if (fd_ >= 0) {
        LOG_WARN("[WALSegment {}] Destructor called on open segment '{}'. Closing.", index_, file_path_);
        Status s = close();
        if (!s.isOk()) {
            LOG_ERROR("[WALSegment {}] Close in destructor failed: {}", index_, s.error().toString());
        }
    }
}

Result<std::unique_ptr<WALSegment>> WALSegment::open(const std::string& file_path, uint32_t index) {
    int fd = ::open(file_path.c_str(), O_RDWR | O_CREAT | O_APPEND, 0644);
    if (fd < 0) {
        return StorageError::ioErrorFromErrno(errno, "open WAL segment", file_path);
    }
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        return StorageError::ioErrorFromErrno(err, "fstat WAL segment", file_path);
    }
    LOG_TRACE("[WALSegment {}] Opened '{}' at {} bytes.", index, file_path, static_cast<uint64_t>(st.st_size));
    return std::unique_ptr<WALSegment>(new WALSegment(file_path, index, fd, static_cast<uint64_t>(st.st_size)));
}

Result<SegmentContents> WALSegment::readFile(const std::string& file_path) {
    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        return StorageError(ErrorCode::IO_READ_ERROR, "Failed to open WAL segment for reading")
            .withFilePath(file_path);
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return StorageError(ErrorCode::IO_READ_ERROR, "Failed to read WAL segment")
            .withFilePath(file_path);
    }

    SegmentContents contents;
    contents.file_bytes = data.size();
    std::string_view cursor(data);
    while (!cursor.empty()) {
        WALEntry entry;
        DecodeStatus status = decodeWALEntry(cursor, entry);
        if (status != DecodeStatus::kOk) {
            contents.torn = true;
            if (status == DecodeStatus::kCorrupt) {
                LOG_WARN("[WALSegment] Malformed record at offset {} in '{}'. Treating it as the end of the log.",
                         contents.valid_bytes, file_path);
            }
            break;
        }
        contents.entries.push_back(std::move(entry));
        contents.valid_bytes = data.size() - cursor.size();
    }
    return contents;
}

Status WALSegment::append(const std::string& encoded_record) {
    if (fd_ < 0) {
        return StorageError(ErrorCode::IO_WRITE_ERROR, "WAL segment is closed").withFilePath(file_path_);
    }
    int err = file_utils::writeFully(fd_, encoded_record.data(), encoded_record.size());
    if (err != 0) {
        rollbackAppend();
        return StorageError::ioErrorFromErrno(err, "append WAL record", file_path_);
    }
    Status synced = sync();
    if (!synced.isOk()) {
        // The caller is told the write failed, so it must not replay on restart.
        rollbackAppend();
        return synced;
    }
    current_size_ += encoded_record.size();
    return Status();
}

void WALSegment::rollbackAppend() {
    if (::ftruncate(fd_, static_cast<off_t>(current_size_)) != 0) {
        LOG_ERROR("[WALSegment {}] Failed to roll back failed append: {}", index_, std::strerror(errno));
        return;
    }
    if (::fdatasync(fd_) != 0) {
        LOG_ERROR("[WALSegment {}] Failed to sync rollback of failed append: {}", index_, std::strerror(errno));
    }
}

Status WALSegment::sync() {
    if (fd_ < 0) {
        return Status();
    }
    if (::fdatasync(fd_) != 0) {
        return StorageError(ErrorCode::IO_SYNC_ERROR, "fsync of WAL segment failed")
            .withDetails(std::strerror(errno))
            .withFilePath(file_path_);
    }
    return Status();
}

Status WALSegment::truncateTo(uint64_t size) {
    if (fd_ < 0) {
        return StorageError(ErrorCode::IO_WRITE_ERROR, "WAL segment is closed").withFilePath(file_path_);
    }
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        return StorageError::ioErrorFromErrno(errno, "truncate WAL segment", file_path_);
    }
    current_size_ = size;
    return sync();
}

Status WALSegment::close() {
    if (fd_ < 0) {
        return Status();
    }
    Status synced = sync();
    int rc = ::close(fd_);
    int err = errno;
    fd_ = -1;
    RETURN_IF_ERROR(synced);
    if (rc != 0) {
        return StorageError::ioErrorFromErrno(err, "close WAL segment", file_path_);
    }
    return Status();
}

std::string WALSegment::segmentFileName(uint32_t index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "wal-%06u.log", index);
    return buf;
}

std::optional<uint32_t> WALSegment::parseSegmentFileName(const std::string& file_name) {
    unsigned int index = 0;
    int consumed = 0;
    if (std::sscanf(file_name.c_str(), "wal-%u.log%n", &index, &consumed) == 1 &&
        static_cast<size_t>(consumed) == file_name.size()) {
        return static_cast<uint32_t>(index);
    }
    return std::nullopt;
}

} // namespace wal
} // namespace strata
