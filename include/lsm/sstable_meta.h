// include/lsm/sstable_meta.h
#pragma once

#include "types.h"
#include "storage_error/result.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace strata {
namespace lsm {

// File layout:
//   [data block]* [filter block] [index block] [metadata block] [footer]
// All integers little-endian.

static constexpr uint32_t SSTABLE_MAGIC_NUMBER = 0x53545241; // "STRA"

// Precedes every data block payload.
struct SSTableBlockHeader {
    CompressionType compression = CompressionType::NONE;
    uint32_t record_count = 0;
    uint32_t raw_size = 0;    // payload size before compression
    uint32_t stored_size = 0; // payload size on disk
    uint32_t crc32 = 0;       // of the stored payload

    static constexpr size_t kEncodedSize = 1 + 4 + 4 + 4 + 4;

    void encodeTo(std::string& dst) const;
    static bool decodeFrom(std::string_view src, SSTableBlockHeader& out);
};

struct SSTableFooter {
    uint64_t filter_offset = 0;
    uint64_t filter_size = 0;
    uint64_t index_offset = 0;
    uint64_t index_size = 0;
    uint64_t meta_offset = 0;
    uint64_t meta_size = 0;
    uint32_t magic = SSTABLE_MAGIC_NUMBER;
    uint32_t crc32 = 0; // of the 52 bytes before it

    static constexpr size_t kEncodedSize = 6 * 8 + 4 + 4;

    std::string encode() const;
    // Fails on a bad magic or checksum.
    static bool decodeFrom(std::string_view src, SSTableFooter& out);
};

// One entry of the sparse index: a data block and the first key it holds.
struct BlockIndexEntry {
    std::string first_key;
    uint64_t offset = 0;
    uint32_t size = 0; // header + stored payload
};

std::string encodeBlockIndex(const std::vector<BlockIndexEntry>& index);
bool decodeBlockIndex(std::string_view src, std::vector<BlockIndexEntry>& out);

struct SSTableMetadata {
    std::string filename;
    int level = 0;
    uint64_t entry_count = 0;
    uint64_t tombstone_count = 0;
    uint64_t data_size = 0; // bytes of the data block section
    std::string min_key;
    std::string max_key;
    int64_t created_at_ms = 0;
    int64_t max_timestamp = 0; // newest record timestamp in the table
    CompressionType compression = CompressionType::NONE;
    uint64_t file_size = 0; // not serialized; filled in by the reader

    std::string encode() const;
    static bool decodeFrom(std::string_view src, SSTableMetadata& out);
};

// Record framing inside a data block:
//   [total_len:u32][deleted:u8][timestamp:i64][key_len:u32][key][value_len:u32][value]
void encodeSSTableRecord(std::string& dst, const Record& record);
bool decodeSSTableRecord(std::string_view& src, Record& out);

// --- File naming: level_<level>_<seq:06>.sst ---

struct SSTableFileInfo {
    std::string path;
    int level = 0;
    uint64_t sequence = 0;
    uint64_t size_bytes = 0;
};

std::string generateSSTableFileName(int level, uint64_t sequence);
std::optional<std::pair<int, uint64_t>> parseSSTableFileName(const std::string& file_name);

// Appended to a table compaction found corrupt. Quarantined files are never listed.
constexpr const char* kQuarantineSuffix = ".corrupt";

// All *.sst files in dir, sorted by (level, sequence) ascending. Files that vanish while listing are skipped.
// One directory pass, not a snapshot. Readers racing a compaction list through
// CompactionEngine::listFiles().
storage::Result<std::vector<SSTableFileInfo>> listSSTableFiles(const std::string& dir);

// Highest sequence among quarantined tables in dir, 0 if there are none.
storage::Result<uint64_t> maxQuarantinedSSTableSequence(const std::string& dir);

} // namespace lsm
} // namespace strata
