// include/debug_utils.h
#pragma once

#include <magic_enum/magic_enum.hpp>

#include <cctype>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace strata {
namespace log {

enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6,
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();
bool isEnabled(LogLevel level);

// Serializes whole lines across threads.
std::mutex& logMutex();

namespace detail {

template<typename T>
void appendArg(std::ostringstream& os, const T& value) {
    if constexpr (std::is_enum_v<T>) {
        auto name = magic_enum::enum_name(value);
        if (name.empty()) {
            os << static_cast<std::underlying_type_t<T>>(value);
        } else {
            os << name;
        }
    } else {
        os << value;
    }
}

// Applies a "{:.Nf}" precision spec to the stream for the next argument.
void applySpec(std::ostringstream& os, std::string_view spec);

inline void formatInto(std::ostringstream& os, std::string_view fmt) {
    os << fmt;
}

template<typename T, typename... Rest>
void formatInto(std::ostringstream& os, std::string_view fmt, const T& first, const Rest&... rest) {
    size_t open = fmt.find('{');
    while (open != std::string_view::npos) {
        size_t close = fmt.find('}', open);
        if (close == std::string_view::npos) break;
        std::string_view spec = fmt.substr(open + 1, close - open - 1);
        if (spec.empty() || spec[0] == ':') {
            os << fmt.substr(0, open);
            std::ios_base::fmtflags flags = os.flags();
            std::streamsize precision = os.precision();
            applySpec(os, spec);
            appendArg(os, first);
            os.flags(flags);
            os.precision(precision);
            formatInto(os, fmt.substr(close + 1), rest...);
            return;
        }
        open = fmt.find('{', close);
    }
    // More arguments than placeholders: append the rest separated by spaces.
    os << fmt << ' ';
    appendArg(os, first);
    ((os << ' ', appendArg(os, rest)), ...);
}

} // namespace detail

template<typename... Args>
std::string format(std::string_view fmt, const Args&... args) {
    std::ostringstream oss;
    detail::formatInto(oss, fmt, args...);
    return oss.str();
}

template<typename... Args>
void print_log_line(LogLevel level, std::string_view tag, std::string_view fmt, const Args&... args) {
    if (!isEnabled(level)) return;
    std::string line = format(fmt, args...);
    std::ostream& os = (level >= LogLevel::WARN) ? std::cerr : std::cout;
    std::lock_guard<std::mutex> lock(logMutex());
    os << "[" << tag << "] " << line << std::endl;
}

} // namespace log

// Helper to safely print potentially non-printable key data
inline std::string format_key_for_print(const std::string& key) {
    std::ostringstream oss;
    for (unsigned char c : key) {
        if (std::isprint(c)) {
            oss << c;
        } else {
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

inline std::string hex_dump_string(const std::string& str) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char c : str) {
        oss << std::setw(2) << static_cast<int>(c);
    }
    return oss.str();
}

} // namespace strata

// --- Logging Macros ---

#ifdef STRATA_DEBUG_LOG
    #define LOG_DEBUG(...) ::strata::log::print_log_line(::strata::log::LogLevel::DEBUG, "DEBUG", __VA_ARGS__)
#else
    #define LOG_DEBUG(...) do {} while(0)
#endif

#define LOG_TRACE(...) ::strata::log::print_log_line(::strata::log::LogLevel::TRACE, "TRACE", __VA_ARGS__)
#define LOG_INFO(...)  ::strata::log::print_log_line(::strata::log::LogLevel::INFO, "INFO", __VA_ARGS__)
#define LOG_WARN(...)  ::strata::log::print_log_line(::strata::log::LogLevel::WARN, "WARN", __VA_ARGS__)
#define LOG_ERROR(...) ::strata::log::print_log_line(::strata::log::LogLevel::ERROR, "ERROR", __VA_ARGS__)
#define LOG_FATAL(...) ::strata::log::print_log_line(::strata::log::LogLevel::FATAL, "FATAL", __VA_ARGS__)
