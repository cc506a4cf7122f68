// include/storage_error/error_utils.h
#pragma once

#include "error_codes.h"
#include "storage_error.h" // STORAGE_ERROR macros
#include "result.h"        // RETURN_IF_ERROR macros

#include <string>
#include <string_view>

namespace strata {
namespace storage {
namespace error_utils {

    // Enum names via magic_enum.
    std::string_view errorCodeToString(ErrorCode code);
    std::string_view severityToString(ErrorSeverity severity);
    std::string_view categoryToString(ErrorCategory category);

    ErrorSeverity getErrorSeverity(ErrorCode code);
    ErrorCategory getErrorCategory(ErrorCode code);

    bool isStorageError(ErrorCode code);
    bool isLsmError(ErrorCode code);
    bool isIoError(ErrorCode code);
    // Damaged on-disk bytes, as opposed to a failed system call.
    bool isCorruption(ErrorCode code);
    bool isRecoverable(ErrorCode code);

} // namespace error_utils
} // namespace storage
} // namespace strata

// Helper macros for error reporting with location info
#define STORAGE_ERROR(code, message) \
    ::strata::storage::StorageError(code, message).withLocation(__FILE__, __LINE__, __FUNCTION__)

#define STORAGE_ERROR_WITH_DETAILS(code, message, details) \
    ::strata::storage::StorageError(code, message, details).withLocation(__FILE__, __LINE__, __FUNCTION__)

// Propagates the error of a Result/Status expression to the caller.
#define RETURN_IF_ERROR(result_expression) \
    do { \
        auto&& _tmp_status_macro_result = (result_expression); \
        if (!_tmp_status_macro_result.isOk()) { \
            return std::move(_tmp_status_macro_result.error()); \
        } \
    } while(0)

// Requires var to be declared first.
#define ASSIGN_OR_RETURN(var, result_expression) \
    do { \
        auto&& _tmp_assign_macro_result = (result_expression); \
        if (!_tmp_assign_macro_result.isOk()) { \
            return std::move(_tmp_assign_macro_result.error()); \
        } \
        var = std::move(_tmp_assign_macro_result.value()); \
    } while(0)

#define STRATA_CONCAT_INNER(a, b) a##b
#define STRATA_CONCAT(a, b) STRATA_CONCAT_INNER(a, b)

// Declares var_name. Usage: ASSIGN_OR_RETURN_AUTO(reader, SSTableReader::open(path));
#define ASSIGN_OR_RETURN_AUTO(var_name, result_expression) \
    ASSIGN_OR_RETURN_AUTO_IMPL(var_name, STRATA_CONCAT(_tmp_auto_macro_result_, __LINE__), result_expression)

#define ASSIGN_OR_RETURN_AUTO_IMPL(var_name, tmp_name, result_expression) \
    auto tmp_name = (result_expression); \
    if (!tmp_name.isOk()) { \
        return std::move(tmp_name.error()); \
    } \
    auto var_name = std::move(tmp_name.value())
