// src/debug_utils.cpp
#include "debug_utils.h"

#include <atomic>
#include <cstdlib>

namespace strata {
namespace log {

namespace {
std::atomic<int> g_log_level{static_cast<int>(LogLevel::INFO)};
}

void setLogLevel(LogLevel level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel getLogLevel() {
    return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

bool isEnabled(LogLevel level) {
    return level != LogLevel::OFF &&
           static_cast<int>(level) >= g_log_level.load(std::memory_order_relaxed);
}

std::mutex& logMutex() {
    static std::mutex mutex;
    return mutex;
}

namespace detail {

void applySpec(std::ostringstream& os, std::string_view spec) {
    // Only "{:.Nf}" is honoured; other specs print the value as-is.
    if (spec.size() >= 4 && spec[0] == ':' && spec[1] == '.' && spec.back() == 'f') {
        std::string digits(spec.substr(2, spec.size() - 3));
        int precision = std::atoi(digits.c_str());
        os << std::fixed << std::setprecision(precision);
    }
}

} // namespace detail
} // namespace log
} // namespace strata
