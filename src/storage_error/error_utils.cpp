// src/storage_error/error_utils.cpp
#include "storage_error/error_utils.h"

#include <magic_enum/magic_enum.hpp>

namespace strata {
namespace storage {
namespace error_utils {

std::string_view errorCodeToString(ErrorCode code) {
    auto name = magic_enum::enum_name(code);
    return name.empty() ? std::string_view("UNKNOWN_ERROR_CODE") : name;
}

std::string_view severityToString(ErrorSeverity severity) {
    return magic_enum::enum_name(severity);
}

std::string_view categoryToString(ErrorCategory category) {
    return magic_enum::enum_name(category);
}

ErrorSeverity getErrorSeverity(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return ErrorSeverity::INFO;

        // open() refuses to continue past these
        case ErrorCode::STORAGE_CORRUPTION:
        case ErrorCode::STORAGE_RECOVERY_FAILED:
            return ErrorSeverity::FATAL;

        // A damaged table is skipped by readers and left in place by compaction.
        case ErrorCode::LSM_SSTABLE_CORRUPTION:
        case ErrorCode::CHECKSUM_MISMATCH:
        case ErrorCode::DISK_FULL:
            return ErrorSeverity::CRITICAL;

        // Retried by the next lookup attempt or the next compaction tick.
        case ErrorCode::CONCURRENT_MODIFICATION:
            return ErrorSeverity::WARNING;

        default:
            return ErrorSeverity::ERROR;
    }
}

ErrorCategory getErrorCategory(ErrorCode code) {
    switch (static_cast<int>(code) / 10) {
        case 1: return ErrorCategory::STORAGE_ENGINE;
        case 2: return ErrorCategory::LSM_TREE;
        case 4: return ErrorCategory::IO_FILESYSTEM;
        case 5: return ErrorCategory::DATA_VALIDATION;
        case 6: return ErrorCategory::CONCURRENCY;
        case 8: return ErrorCategory::CONFIGURATION;
        default: return ErrorCategory::GENERIC;
    }
}

bool isStorageError(ErrorCode code) { return getErrorCategory(code) == ErrorCategory::STORAGE_ENGINE; }
bool isLsmError(ErrorCode code) { return getErrorCategory(code) == ErrorCategory::LSM_TREE; }
bool isIoError(ErrorCode code) { return getErrorCategory(code) == ErrorCategory::IO_FILESYSTEM; }

bool isCorruption(ErrorCode code) {
    return code == ErrorCode::STORAGE_CORRUPTION || code == ErrorCode::LSM_SSTABLE_CORRUPTION ||
           code == ErrorCode::CHECKSUM_MISMATCH || code == ErrorCode::INVALID_DATA_FORMAT ||
           code == ErrorCode::COMPRESSION_ERROR;
}

bool isRecoverable(ErrorCode code) {
    ErrorSeverity severity = getErrorSeverity(code);
    return severity != ErrorSeverity::FATAL && severity != ErrorSeverity::CRITICAL;
}

} // namespace error_utils
} // namespace storage
} // namespace strata
