// src/storage_error/error_context.cpp
#include "storage_error/error_context.h"
#include "storage_error/error_handler.h"

#include <algorithm>
#include <cstddef>

namespace strata {
namespace storage {

ErrorContext::ErrorContext(std::shared_ptr<ErrorHandler> handler)
    : handler_(std::move(handler)) {}

void ErrorContext::reportError(const StorageError& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++error_counts_[error.code];
        ++total_errors_;
        recent_errors_.push_back(error);
        while (recent_errors_.size() > kMaxRecentErrors) {
            recent_errors_.pop_front();
        }
    }

    if (!handler_) return;
    if (error.isRecoverable()) {
        handler_->handleError(error);
    } else {
        handler_->handleCriticalError(error);
    }
}

void ErrorContext::reportError(ErrorCode code, const std::string& message) {
    reportError(StorageError(code, message));
}

size_t ErrorContext::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = error_counts_.find(code);
    return it == error_counts_.end() ? 0 : it->second;
}

size_t ErrorContext::getTotalErrorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_errors_;
}

std::vector<StorageError> ErrorContext::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = std::min(count, recent_errors_.size());
    return std::vector<StorageError>(recent_errors_.end() - static_cast<std::ptrdiff_t>(n),
                                     recent_errors_.end());
}

bool ErrorContext::hasRepeatedErrors(ErrorCode code, size_t threshold) const {
    return getErrorCount(code) >= threshold;
}

void ErrorContext::clearErrors() {
    std::lock_guard<std::mutex> lock(mutex_);
    recent_errors_.clear();
    error_counts_.clear();
    total_errors_ = 0;
}

} // namespace storage
} // namespace strata
