// include/storage_error/error_codes.h
#pragma once

namespace strata {
namespace storage {

/**
 * @brief Codes carried by StorageError. The tens digit selects the category
 * (see error_utils::getErrorCategory). Values stay inside magic_enum's default
 * reflection range so codes can be printed by name.
 */
enum class ErrorCode : int {
    OK = 0,

    // Engine lifecycle (1x)
    STORAGE_CORRUPTION = 11,
    STORAGE_NOT_INITIALIZED = 12,
    STORAGE_RECOVERY_FAILED = 13,

    // LSM components (2x)
    LSM_COMPACTION_FAILED = 21,
    LSM_SSTABLE_CORRUPTION = 22,
    LSM_FLUSH_FAILED = 23,

    // Filesystem (4x)
    IO_READ_ERROR = 41,
    IO_WRITE_ERROR = 42,
    IO_SYNC_ERROR = 43,
    FILE_NOT_FOUND = 44,
    FILE_PERMISSION_DENIED = 45,
    FILE_ALREADY_EXISTS = 46,
    DIRECTORY_NOT_FOUND = 47,
    DISK_FULL = 48,

    // Record and block validation (5x)
    INVALID_KEY = 51,
    INVALID_VALUE = 52,
    CHECKSUM_MISMATCH = 53,
    INVALID_DATA_FORMAT = 54,
    COMPRESSION_ERROR = 55,

    // Concurrency (6x)
    CONCURRENT_MODIFICATION = 61,

    // Configuration (8x)
    INVALID_CONFIGURATION = 81,

    INTERNAL_ERROR = 91
};

enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,      // the call failed, the engine keeps serving
    CRITICAL,   // a file or subsystem is damaged
    FATAL       // the engine cannot open or continue
};

enum class ErrorCategory {
    STORAGE_ENGINE,
    LSM_TREE,
    IO_FILESYSTEM,
    DATA_VALIDATION,
    CONCURRENCY,
    CONFIGURATION,
    GENERIC
};

} // namespace storage
} // namespace strata
