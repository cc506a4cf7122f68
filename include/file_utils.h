// include/file_utils.h
#pragma once

#include "storage_error/result.h"

#include <string>

namespace strata {
namespace file_utils {

// fsync an existing file by path.
storage::Status syncFile(const std::string& path);

// fsync a directory so entry creations/renames/unlinks inside it are durable.
storage::Status syncDirectory(const std::string& dir);

// rename(from, to) followed by an fsync of the destination's directory.
storage::Status durableRename(const std::string& from, const std::string& to);

// Writes buf fully to fd, retrying on short writes and EINTR. Returns 0 or errno.
int writeFully(int fd, const char* buf, size_t len);

} // namespace file_utils
} // namespace strata
