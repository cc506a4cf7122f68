// include/storage_error/storage_error.h
#pragma once

#include "error_codes.h"
#include <string>
#include <optional>
#include <chrono>
#include <exception>
#include <unordered_map>

namespace strata {
namespace storage {

/**
 * @brief An engine error with the file and call site it came from.
 *
 * Returned inside Result<T>/Status by the engine, WAL and readers; thrown by
 * SSTableBuilder and the codec helpers, which have no return channel.
 */
class StorageError : public std::exception {
public:
    ErrorCode code;
    ErrorSeverity severity; // derived from code
    ErrorCategory category; // derived from code
    std::string message;
    std::string details;
    std::string suggested_action;
    std::optional<std::string> file_path;
    std::optional<size_t> line_number;
    std::optional<std::string> function_name;
    std::chrono::system_clock::time_point timestamp;
    std::optional<ErrorCode> underlying_error;
    std::unordered_map<std::string, std::string> context;

    StorageError(ErrorCode code, const std::string& message = "");
    StorageError(ErrorCode code, const std::string& message, const std::string& details);

    StorageError& withDetails(const std::string& details);
    StorageError& withSuggestedAction(const std::string& action);
    StorageError& withLocation(const std::string& file, size_t line, const std::string& function);
    StorageError& withUnderlyingError(ErrorCode underlying);
    StorageError& withContext(const std::string& key, const std::string& value);
    // Data file the error concerns. Shares the slot written by withLocation.
    StorageError& withFilePath(const std::string& path);

    bool isRecoverable() const;
    std::string toString() const;
    std::string toJson() const;

    const char* what() const noexcept override { return message.c_str(); }

    static StorageError corruption(const std::string& details);
    // Maps errno to FILE_NOT_FOUND, DISK_FULL, ... and keeps strerror() as details.
    static StorageError ioErrorFromErrno(int err, const std::string& operation, const std::string& path);
    static StorageError compactionFailed(const std::string& reason);
    static StorageError notOpen(const std::string& operation);
};

} // namespace storage
} // namespace strata
