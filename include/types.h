// include/types.h
#pragma once

#include <zlib.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace strata {

// --- Compression ---
enum class CompressionType : uint8_t {
    NONE = 0,
    ZSTD = 1,
    LZ4  = 2,
};

// --- Mutation kinds as written to the WAL ---
enum class EntryKind : uint8_t {
    PUT = 0,
    DELETE = 1,
};

/**
 * @brief One versioned key/value entry. Shared by the MemTable, SSTables and the merger.
 * A tombstone has deleted == true and an empty value.
 */
struct Record {
    std::string key;
    std::string value;
    bool deleted = false;
    int64_t timestamp = 0; // nanoseconds since epoch, monotonic per engine

    Record() = default;
    Record(std::string k, std::string v, bool del, int64_t ts)
        : key(std::move(k)), value(std::move(v)), deleted(del), timestamp(ts) {}

    bool operator==(const Record& other) const {
        return key == other.key && value == other.value &&
               deleted == other.deleted && timestamp == other.timestamp;
    }
};

inline uint32_t calculate_payload_checksum(const uint8_t* data, size_t len) {
    if (data == nullptr || len == 0) {
        return 0;
    }
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, data, static_cast<uInt>(len));
    return static_cast<uint32_t>(crc);
}

inline int64_t now_nanos() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace strata
