// include/storage_error/result.h
#pragma once

#include "storage_error.h"
#include <optional>
#include <stdexcept>
#include <utility>

namespace strata {
namespace storage {

/**
 * @brief Either a T or the StorageError that prevented producing one.
 *
 * Accessing value() on an error rethrows the held StorageError, so callers
 * that cannot handle the failure locally still see the original code.
 */
template<typename T>
class Result {
private:
    std::optional<T> value_;
    std::optional<StorageError> error_;

    void requireValue() const {
        if (error_) throw *error_;
    }

public:
    Result(T val) : value_(std::move(val)) {}
    Result(StorageError err) : error_(std::move(err)) {}

    bool isOk() const { return !error_.has_value(); }
    bool hasError() const { return error_.has_value(); }
    explicit operator bool() const { return isOk(); }

    const T& value() const& { requireValue(); return *value_; }
    T& value() & { requireValue(); return *value_; }
    T&& value() && { requireValue(); return std::move(*value_); }

    const T* operator->() const { requireValue(); return &*value_; }
    T* operator->() { requireValue(); return &*value_; }
    const T& operator*() const& { return value(); }
    T& operator*() & { return value(); }
    T&& operator*() && { return std::move(*this).value(); }

    const StorageError& error() const& {
        if (!error_) throw std::logic_error("Result holds a value, not an error");
        return *error_;
    }
    StorageError& error() & {
        if (!error_) throw std::logic_error("Result holds a value, not an error");
        return *error_;
    }
    StorageError&& error() && {
        if (!error_) throw std::logic_error("Result holds a value, not an error");
        return std::move(*error_);
    }

    T valueOr(T fallback) const& { return isOk() ? *value_ : std::move(fallback); }
    T valueOr(T fallback) && { return isOk() ? std::move(*value_) : std::move(fallback); }
};

template<>
class Result<void> {
private:
    std::optional<StorageError> error_;

public:
    Result() = default;
    Result(StorageError err) : error_(std::move(err)) {}

    bool isOk() const { return !error_.has_value(); }
    bool hasError() const { return error_.has_value(); }
    explicit operator bool() const { return isOk(); }

    const StorageError& error() const& {
        if (!error_) throw std::logic_error("Status is OK, no error to read");
        return *error_;
    }
    StorageError& error() & {
        if (!error_) throw std::logic_error("Status is OK, no error to read");
        return *error_;
    }
    StorageError&& error() && {
        if (!error_) throw std::logic_error("Status is OK, no error to read");
        return std::move(*error_);
    }
};

using Status = Result<void>;

} // namespace storage
} // namespace strata
