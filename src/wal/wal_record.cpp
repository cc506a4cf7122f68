// src/wal/wal_record.cpp
#include "wal/wal_record.h"
#include "serialization_utils.h"

#include <stdexcept>

namespace strata {
namespace wal {

size_t encodedWALEntrySize(const WALEntry& entry) {
    return WAL_LENGTH_PREFIX_SIZE + WAL_FIXED_BODY_SIZE + entry.key.size() + entry.value.size();
}

std::string encodeWALEntry(const WALEntry& entry) {
    size_t body = WAL_FIXED_BODY_SIZE + entry.key.size() + entry.value.size();
    if (body > WAL_MAX_RECORD_BODY) {
        throw std::length_error("WAL record body of " + std::to_string(body) + " bytes exceeds limit");
    }
    std::string out;
    out.reserve(WAL_LENGTH_PREFIX_SIZE + body);
    PutFixed32(out, static_cast<uint32_t>(body));
    out.push_back(static_cast<char>(entry.kind));
    PutFixed64(out, static_cast<uint64_t>(entry.timestamp));
    PutLengthPrefixed(out, entry.key);
    if (entry.kind == EntryKind::DELETE) {
        PutFixed32(out, 0);
    } else {
        PutLengthPrefixed(out, entry.value);
    }
    return out;
}

DecodeStatus decodeWALEntry(std::string_view& input, WALEntry& out) {
    std::string_view cursor = input;
    uint32_t total_len = 0;
    if (!GetFixed32(cursor, total_len)) {
        return DecodeStatus::kIncomplete;
    }
    if (total_len < WAL_FIXED_BODY_SIZE || total_len > WAL_MAX_RECORD_BODY) {
        return DecodeStatus::kCorrupt;
    }
    if (cursor.size() < total_len) {
        return DecodeStatus::kIncomplete;
    }

    std::string_view body = cursor.substr(0, total_len);
    uint8_t type = static_cast<uint8_t>(body[0]);
    body.remove_prefix(1);
    if (type > static_cast<uint8_t>(EntryKind::DELETE)) {
        return DecodeStatus::kCorrupt;
    }

    uint64_t ts = 0;
    std::string_view key;
    std::string_view value;
    if (!GetFixed64(body, ts) || !GetLengthPrefixed(body, key) || !GetLengthPrefixed(body, value)) {
        return DecodeStatus::kCorrupt;
    }
    if (!body.empty()) {
        return DecodeStatus::kCorrupt;
    }

    out.kind = static_cast<EntryKind>(type);
    out.timestamp = static_cast<int64_t>(ts);
    out.key.assign(key.data(), key.size());
    out.value.assign(value.data(), value.size());
    input.remove_prefix(WAL_LENGTH_PREFIX_SIZE + total_len);
    return DecodeStatus::kOk;
}

} // namespace wal
} // namespace strata
