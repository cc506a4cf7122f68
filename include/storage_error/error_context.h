// include/storage_error/error_context.h
#pragma once

#include "storage_error.h"
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace strata {
namespace storage {

class ErrorHandler;

/**
 * @brief Bookkeeping for errors raised where no caller is waiting: background
 * compaction, flushes triggered by put/remove, WAL trimming.
 *
 * Keeps the last kMaxRecentErrors errors and a per-code count, and forwards
 * every report to the optional ErrorHandler outside the internal lock.
 */
class ErrorContext {
public:
    static constexpr size_t kMaxRecentErrors = 100;

    explicit ErrorContext(std::shared_ptr<ErrorHandler> handler = nullptr);

    void reportError(const StorageError& error);
    void reportError(ErrorCode code, const std::string& message);

    size_t getErrorCount(ErrorCode code) const;
    size_t getTotalErrorCount() const;
    // Newest last.
    std::vector<StorageError> getRecentErrors(size_t count = 10) const;
    bool hasRepeatedErrors(ErrorCode code, size_t threshold = 5) const;

    void clearErrors();

private:
    std::shared_ptr<ErrorHandler> handler_;
    std::deque<StorageError> recent_errors_;
    std::unordered_map<ErrorCode, size_t> error_counts_;
    size_t total_errors_ = 0;
    mutable std::mutex mutex_;
};

} // namespace storage
} // namespace strata
