// include/storage_error/error_handler.h
#pragma once

#include "storage_error.h"

namespace strata {
namespace storage {

/**
 * @brief Receives errors raised by background work (flushes, compactions)
 * that have no caller to return them to.
 */
class ErrorHandler {
public:
    virtual ~ErrorHandler() = default;
    virtual void handleError(const StorageError& error) = 0;
    virtual void handleCriticalError(const StorageError& error) = 0;
};

} // namespace storage
} // namespace strata
