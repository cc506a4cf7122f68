// include/wal/wal_record.h
#pragma once

#include "types.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace strata {
namespace wal {

/**
 * @brief One logged mutation.
 *
 * On disk (little-endian):
 *   [total_len:u32][type:u8][timestamp:i64][key_len:u32][key][value_len:u32][value]
 * total_len covers every field after itself. Delete records carry value_len 0.
 */
struct WALEntry {
    EntryKind kind = EntryKind::PUT;
    std::string key;
    std::string value;
    int64_t timestamp = 0;

    static WALEntry put(std::string key, std::string value, int64_t timestamp) {
        return WALEntry{EntryKind::PUT, std::move(key), std::move(value), timestamp};
    }
    static WALEntry remove(std::string key, int64_t timestamp) {
        return WALEntry{EntryKind::DELETE, std::move(key), std::string(), timestamp};
    }

    bool operator==(const WALEntry& other) const {
        return kind == other.kind && key == other.key && value == other.value &&
               timestamp == other.timestamp;
    }
};

enum class DecodeStatus {
    kOk,
    kIncomplete, // input ends inside the record
    kCorrupt,    // framing fields contradict each other
};

constexpr size_t WAL_LENGTH_PREFIX_SIZE = 4;
// type + timestamp + key_len + value_len
constexpr size_t WAL_FIXED_BODY_SIZE = 1 + 8 + 4 + 4;
// Upper bound accepted for a single record body.
constexpr uint32_t WAL_MAX_RECORD_BODY = 1u << 30;

std::string encodeWALEntry(const WALEntry& entry);
size_t encodedWALEntrySize(const WALEntry& entry);

// Decodes one record from the front of input. On kOk the record is consumed.
DecodeStatus decodeWALEntry(std::string_view& input, WALEntry& out);

} // namespace wal
} // namespace strata
