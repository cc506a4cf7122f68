// src/storage_error/storage_error.cpp
#include "storage_error/storage_error.h"
#include "storage_error/error_utils.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <sstream>

namespace strata {
namespace storage {

StorageError::StorageError(ErrorCode code, const std::string& message)
    : code(code)
    , severity(error_utils::getErrorSeverity(code))
    , category(error_utils::getErrorCategory(code))
    , message(message.empty() ? std::string(error_utils::errorCodeToString(code)) : message)
    , timestamp(std::chrono::system_clock::now()) {
}

StorageError::StorageError(ErrorCode code, const std::string& message, const std::string& details)
    : StorageError(code, message) {
    this->details = details;
}

StorageError& StorageError::withDetails(const std::string& d) {
    details = d;
    return *this;
}

StorageError& StorageError::withSuggestedAction(const std::string& action) {
    suggested_action = action;
    return *this;
}

StorageError& StorageError::withLocation(const std::string& file, size_t line, const std::string& function) {
    file_path = file;
    line_number = line;
    function_name = function;
    return *this;
}

StorageError& StorageError::withUnderlyingError(ErrorCode underlying) {
    underlying_error = underlying;
    return *this;
}

StorageError& StorageError::withContext(const std::string& key, const std::string& value) {
    context[key] = value;
    return *this;
}

StorageError& StorageError::withFilePath(const std::string& path) {
    file_path = path;
    return *this;
}

bool StorageError::isRecoverable() const {
    return error_utils::isRecoverable(code);
}

std::string StorageError::toString() const {
    std::ostringstream oss;
    oss << error_utils::errorCodeToString(code) << ": " << message;
    if (!details.empty()) {
        oss << " (" << details << ")";
    }
    if (file_path) {
        oss << " [" << *file_path << "]";
    }
    if (underlying_error) {
        oss << " caused by " << error_utils::errorCodeToString(*underlying_error);
    }
    return oss.str();
}

std::string StorageError::toJson() const {
    nlohmann::json j;
    j["code"] = std::string(error_utils::errorCodeToString(code));
    j["severity"] = std::string(error_utils::severityToString(severity));
    j["category"] = std::string(error_utils::categoryToString(category));
    j["message"] = message;
    if (!details.empty()) j["details"] = details;
    if (!suggested_action.empty()) j["suggested_action"] = suggested_action;
    if (file_path) {
        if (line_number) {
            j["location"] = {{"file", *file_path}, {"line", *line_number},
                             {"function", function_name.value_or("")}};
        } else {
            j["file_path"] = *file_path;
        }
    }
    if (underlying_error) {
        j["underlying_error"] = std::string(error_utils::errorCodeToString(*underlying_error));
    }
    if (!context.empty()) j["context"] = context;
    j["timestamp_ms"] =
        std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
    // Keys and paths may hold arbitrary bytes.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

StorageError StorageError::corruption(const std::string& d) {
    return StorageError(ErrorCode::LSM_SSTABLE_CORRUPTION, "SSTable is corrupt").withDetails(d);
}

StorageError StorageError::ioErrorFromErrno(int err, const std::string& operation, const std::string& path) {
    ErrorCode mapped = ErrorCode::IO_WRITE_ERROR;
    switch (err) {
        case ENOENT: mapped = ErrorCode::FILE_NOT_FOUND; break;
        case EACCES:
        case EPERM: mapped = ErrorCode::FILE_PERMISSION_DENIED; break;
        case EEXIST: mapped = ErrorCode::FILE_ALREADY_EXISTS; break;
        case ENOSPC:
        case EDQUOT: mapped = ErrorCode::DISK_FULL; break;
        case ENOTDIR: mapped = ErrorCode::DIRECTORY_NOT_FOUND; break;
        default: break;
    }
    return StorageError(mapped, operation + " failed")
        .withDetails(std::strerror(err))
        .withFilePath(path)
        .withContext("errno", std::to_string(err));
}

StorageError StorageError::compactionFailed(const std::string& reason) {
    return StorageError(ErrorCode::LSM_COMPACTION_FAILED, "Compaction failed")
        .withDetails(reason)
        .withSuggestedAction("Inputs are left in place; the job is retried on the next tick");
}

StorageError StorageError::notOpen(const std::string& operation) {
    return StorageError(ErrorCode::STORAGE_NOT_INITIALIZED, "Engine is closed")
        .withDetails("Operation: " + operation);
}

} // namespace storage
} // namespace strata
