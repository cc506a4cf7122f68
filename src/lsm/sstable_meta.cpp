// src/lsm/sstable_meta.cpp
#include "lsm/sstable_meta.h"
#include "serialization_utils.h"
#include "storage_error/error_utils.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace strata {
namespace lsm {

void SSTableBlockHeader::encodeTo(std::string& dst) const {
    dst.push_back(static_cast<char>(compression));
    PutFixed32(dst, record_count);
    PutFixed32(dst, raw_size);
    PutFixed32(dst, stored_size);
    PutFixed32(dst, crc32);
}

bool SSTableBlockHeader::decodeFrom(std::string_view src, SSTableBlockHeader& out) {
    if (src.size() < kEncodedSize) return false;
    uint8_t c = static_cast<uint8_t>(src[0]);
    if (c > static_cast<uint8_t>(CompressionType::LZ4)) return false;
    out.compression = static_cast<CompressionType>(c);
    src.remove_prefix(1);
    return GetFixed32(src, out.record_count) && GetFixed32(src, out.raw_size) &&
           GetFixed32(src, out.stored_size) && GetFixed32(src, out.crc32);
}

std::string SSTableFooter::encode() const {
    std::string out;
    PutFixed64(out, filter_offset);
    PutFixed64(out, filter_size);
    PutFixed64(out, index_offset);
    PutFixed64(out, index_size);
    PutFixed64(out, meta_offset);
    PutFixed64(out, meta_size);
    PutFixed32(out, magic);
    uint32_t crc = calculate_payload_checksum(reinterpret_cast<const uint8_t*>(out.data()), out.size());
    PutFixed32(out, crc);
    return out;
}

bool SSTableFooter::decodeFrom(std::string_view src, SSTableFooter& out) {
    if (src.size() != kEncodedSize) return false;
    uint32_t expected_crc = calculate_payload_checksum(
        reinterpret_cast<const uint8_t*>(src.data()), kEncodedSize - 4);
    std::string_view cursor = src;
    bool ok = GetFixed64(cursor, out.filter_offset) && GetFixed64(cursor, out.filter_size) &&
              GetFixed64(cursor, out.index_offset) && GetFixed64(cursor, out.index_size) &&
              GetFixed64(cursor, out.meta_offset) && GetFixed64(cursor, out.meta_size) &&
              GetFixed32(cursor, out.magic) && GetFixed32(cursor, out.crc32);
    return ok && out.magic == SSTABLE_MAGIC_NUMBER && out.crc32 == expected_crc;
}

std::string encodeBlockIndex(const std::vector<BlockIndexEntry>& index) {
    std::string out;
    PutFixed32(out, static_cast<uint32_t>(index.size()));
    for (const auto& entry : index) {
        PutLengthPrefixed(out, entry.first_key);
        PutFixed64(out, entry.offset);
        PutFixed32(out, entry.size);
    }
    return out;
}

bool decodeBlockIndex(std::string_view src, std::vector<BlockIndexEntry>& out) {
    uint32_t count = 0;
    if (!GetFixed32(src, count)) return false;
    out.clear();
    // Each entry takes at least 16 bytes; reject counts the buffer cannot hold.
    if (static_cast<uint64_t>(count) * 16 > src.size()) return false;
    out.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        BlockIndexEntry entry;
        std::string_view key;
        if (!GetLengthPrefixed(src, key) || !GetFixed64(src, entry.offset) || !GetFixed32(src, entry.size)) {
            return false;
        }
        entry.first_key.assign(key.data(), key.size());
        out.push_back(std::move(entry));
    }
    return src.empty();
}

std::string SSTableMetadata::encode() const {
    std::string out;
    PutFixed32(out, static_cast<uint32_t>(level));
    PutFixed64(out, entry_count);
    PutFixed64(out, tombstone_count);
    PutFixed64(out, data_size);
    PutLengthPrefixed(out, min_key);
    PutLengthPrefixed(out, max_key);
    PutFixed64(out, static_cast<uint64_t>(created_at_ms));
    PutFixed64(out, static_cast<uint64_t>(max_timestamp));
    out.push_back(static_cast<char>(compression));
    return out;
}

bool SSTableMetadata::decodeFrom(std::string_view src, SSTableMetadata& out) {
    uint32_t lvl = 0;
    uint64_t created = 0;
    uint64_t max_ts = 0;
    std::string_view min_k;
    std::string_view max_k;
    if (!GetFixed32(src, lvl) || !GetFixed64(src, out.entry_count) || !GetFixed64(src, out.tombstone_count) ||
        !GetFixed64(src, out.data_size) || !GetLengthPrefixed(src, min_k) || !GetLengthPrefixed(src, max_k) ||
        !GetFixed64(src, created) || !GetFixed64(src, max_ts) || src.size() != 1) {
        return false;
    }
    uint8_t c = static_cast<uint8_t>(src[0]);
    if (c > static_cast<uint8_t>(CompressionType::LZ4)) return false;
    out.level = static_cast<int>(lvl);
    out.min_key.assign(min_k.data(), min_k.size());
    out.max_key.assign(max_k.data(), max_k.size());
    out.created_at_ms = static_cast<int64_t>(created);
    out.max_timestamp = static_cast<int64_t>(max_ts);
    out.compression = static_cast<CompressionType>(c);
    return true;
}

void encodeSSTableRecord(std::string& dst, const Record& record) {
    const std::string& value = record.deleted ? std::string() : record.value;
    uint32_t body = static_cast<uint32_t>(1 + 8 + 4 + record.key.size() + 4 + value.size());
    PutFixed32(dst, body);
    dst.push_back(record.deleted ? 1 : 0);
    PutFixed64(dst, static_cast<uint64_t>(record.timestamp));
    PutLengthPrefixed(dst, record.key);
    PutLengthPrefixed(dst, value);
}

bool decodeSSTableRecord(std::string_view& src, Record& out) {
    std::string_view cursor = src;
    uint32_t body_len = 0;
    if (!GetFixed32(cursor, body_len) || cursor.size() < body_len || body_len < 1 + 8 + 4 + 4) {
        return false;
    }
    std::string_view body = cursor.substr(0, body_len);
    uint8_t deleted = static_cast<uint8_t>(body[0]);
    body.remove_prefix(1);
    uint64_t ts = 0;
    std::string_view key;
    std::string_view value;
    if (deleted > 1 || !GetFixed64(body, ts) || !GetLengthPrefixed(body, key) ||
        !GetLengthPrefixed(body, value) || !body.empty()) {
        return false;
    }
    out.key.assign(key.data(), key.size());
    out.value.assign(value.data(), value.size());
    out.deleted = deleted == 1;
    out.timestamp = static_cast<int64_t>(ts);
    cursor.remove_prefix(body_len);
    src = cursor;
    return true;
}

std::string generateSSTableFileName(int level, uint64_t sequence) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "level_%d_%06llu.sst", level, static_cast<unsigned long long>(sequence));
    return buf;
}

std::optional<std::pair<int, uint64_t>> parseSSTableFileName(const std::string& file_name) {
    int level = -1;
    unsigned long long seq = 0;
    int consumed = 0;
    if (std::sscanf(file_name.c_str(), "level_%d_%llu.sst%n", &level, &seq, &consumed) == 2 &&
        static_cast<size_t>(consumed) == file_name.size() && level >= 0) {
        return std::make_pair(level, static_cast<uint64_t>(seq));
    }
    return std::nullopt;
}

storage::Result<std::vector<SSTableFileInfo>> listSSTableFiles(const std::string& dir) {
    // directory_iterator is not a snapshot: a file created or removed during
    // the pass may or may not be seen.
    std::vector<SSTableFileInfo> files;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        auto parsed = parseSSTableFileName(name);
        if (!parsed) continue;

        std::error_code size_ec;
        uint64_t size = fs::file_size(it->path(), size_ec);
        if (size_ec) {
            // Removed by a concurrent compaction between listing and stat.
            continue;
        }
        files.push_back(SSTableFileInfo{it->path().string(), parsed->first, parsed->second, size});
    }
    if (ec) {
        return storage::StorageError::ioErrorFromErrno(ec.value(), "list SSTable directory", dir)
            .withUnderlyingError(storage::ErrorCode::IO_READ_ERROR);
    }
    std::sort(files.begin(), files.end(), [](const SSTableFileInfo& a, const SSTableFileInfo& b) {
        if (a.level != b.level) return a.level < b.level;
        return a.sequence < b.sequence;
    });
    return files;
}

storage::Result<uint64_t> maxQuarantinedSSTableSequence(const std::string& dir) {
    const std::string suffix = kQuarantineSuffix;
    uint64_t max_sequence = 0;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.size() <= suffix.size() ||
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        auto parsed = parseSSTableFileName(name.substr(0, name.size() - suffix.size()));
        if (parsed) max_sequence = std::max(max_sequence, parsed->second);
    }
    if (ec) {
        return storage::StorageError::ioErrorFromErrno(ec.value(), "list SSTable directory", dir)
            .withUnderlyingError(storage::ErrorCode::IO_READ_ERROR);
    }
    return max_sequence;
}

} // namespace lsm
} // namespace strata
