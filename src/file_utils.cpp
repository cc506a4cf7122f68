// src/file_utils.cpp
#include "file_utils.h"
#include "storage_error/error_utils.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace strata {
namespace file_utils {

using storage::Status;
using storage::StorageError;

Status syncFile(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return StorageError::ioErrorFromErrno(errno, "open for fsync", path);
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        return StorageError::ioErrorFromErrno(err, "fsync", path)
            .withUnderlyingError(storage::ErrorCode::IO_SYNC_ERROR);
    }
    ::close(fd);
    return Status();
}

Status syncDirectory(const std::string& dir) {
    int dfd = ::open(dir.c_str(), O_DIRECTORY | O_RDONLY);
    if (dfd < 0) {
        return StorageError::ioErrorFromErrno(errno, "open directory", dir);
    }
    if (::fsync(dfd) != 0) {
        int err = errno;
        ::close(dfd);
        return StorageError(storage::ErrorCode::IO_SYNC_ERROR, "fsync directory failed")
            .withDetails(std::strerror(err))
            .withFilePath(dir);
    }
    ::close(dfd);
    return Status();
}

Status durableRename(const std::string& from, const std::string& to) {
    if (::rename(from.c_str(), to.c_str()) != 0) {
        return StorageError::ioErrorFromErrno(errno, "rename to " + to, from);
    }
    fs::path parent = fs::path(to).parent_path();
    return syncDirectory(parent.empty() ? std::string(".") : parent.string());
}

int writeFully(int fd, const char* buf, size_t len) {
    size_t left = len;
    while (left > 0) {
        ssize_t w = ::write(fd, buf, left);
        if (w < 0) {
            if (errno == EINTR) continue;
            return errno;
        }
        buf += w;
        left -= static_cast<size_t>(w);
    }
    return 0;
}

} // namespace file_utils
} // namespace strata
