// src/lsm/sstable_builder.cpp
#include "lsm/sstable_builder.h"
#include "compression_utils.h"
#include "debug_utils.h"
#include "file_utils.h"
#include "storage_error/error_utils.h"

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace strata {
namespace lsm {

using storage::ErrorCode;
using storage::StorageError;

SSTableBuilder::SSTableBuilder(const std::string& filepath, int level, uint64_t expected_entry_count,
                               const Options& options)
    : options_(options),
      filepath_(filepath),
      tmp_path_(filepath + ".tmp"),
      expected_entry_count_(expected_entry_count),
      filter_(static_cast<size_t>(expected_entry_count), options.bloom_filter_fpr)
{
    meta_.filename = filepath;
    meta_.level = level;
    meta_.created_at_ms = now_millis();
    meta_.compression = options_.compression_type;

    output_file_.open(tmp_path_, std::ios::binary | std::ios::trunc);
    if (!output_file_) {
        throw StorageError(ErrorCode::IO_WRITE_ERROR, "Failed to open SSTable file for builder.")
            .withFilePath(tmp_path_);
    }
}

SSTableBuilder::SSTableBuilder(const std::string& filepath, int level, uint64_t expected_entry_count)
    : SSTableBuilder(filepath, level, expected_entry_count, Options()) {
}

SSTableBuilder::~SSTableBuilder() {
    if (state_ == State::kBuilding) {
        cleanupTempFile();
    }
}

void SSTableBuilder::add(const Record& record) {
    if (state_ != State::kBuilding) {
        throw std::logic_error("Cannot add records to a finished SSTableBuilder.");
    }
    if (has_last_key_ && record.key <= meta_.max_key) {
        throw StorageError(ErrorCode::INVALID_KEY, "Keys must be added in strictly increasing order.")
            .withDetails("Last key: '" + format_key_for_print(meta_.max_key) +
                         "', New key: '" + format_key_for_print(record.key) + "'")
            .withFilePath(filepath_);
    }

    std::string serialized_record;
    encodeSSTableRecord(serialized_record, record);

    if (!block_buffer_.empty() && (block_buffer_.size() + serialized_record.size() > options_.target_block_size)) {
        writeDataBlock();
    }
    if (block_buffer_.empty()) {
        first_key_in_block_ = record.key;
    }
    block_buffer_.append(serialized_record);
    records_in_block_++;

    filter_.add(record.key);
    if (!has_last_key_) meta_.min_key = record.key;
    meta_.max_key = record.key;
    has_last_key_ = true;
    meta_.entry_count++;
    if (record.deleted) meta_.tombstone_count++;
    if (record.timestamp > meta_.max_timestamp) meta_.max_timestamp = record.timestamp;
}

void SSTableBuilder::finish() {
    if (state_ != State::kBuilding) {
        throw std::logic_error("SSTableBuilder::finish() called on a finished builder: " + filepath_);
    }

    if (meta_.entry_count == 0 && expected_entry_count_ > 0) {
        state_ = State::kFailed;
        cleanupTempFile();
        throw StorageError(ErrorCode::INVALID_DATA_FORMAT, "No entries were written to the SSTable.")
            .withDetails("Expected " + std::to_string(expected_entry_count_) + " entries")
            .withFilePath(filepath_);
    }

    LOG_TRACE("[SSTableBuilder] Finishing SSTable file: {}", filepath_);

    try {
        // --- Phase 1: Flush remaining buffered data ---
        if (!block_buffer_.empty()) {
            writeDataBlock();
        }
        meta_.data_size = offset_;

        // --- Phase 2: Filter, index and metadata blocks ---
        SSTableFooter footer;
        std::string filter_bytes = filter_.serialize();
        footer.filter_offset = offset_;
        footer.filter_size = filter_bytes.size();
        writeRaw(filter_bytes, "filter block");

        std::string index_bytes = encodeBlockIndex(index_);
        footer.index_offset = offset_;
        footer.index_size = index_bytes.size();
        writeRaw(index_bytes, "index block");

        std::string meta_bytes = meta_.encode();
        footer.meta_offset = offset_;
        footer.meta_size = meta_bytes.size();
        writeRaw(meta_bytes, "metadata block");

        // --- Phase 3: Footer ---
        writeRaw(footer.encode(), "footer");

        // --- Phase 4: Make it durable, then publish ---
        output_file_.flush();
        output_file_.close();
        if (output_file_.fail()) {
            throw StorageError(ErrorCode::IO_WRITE_ERROR, "Stream error after closing SSTable file.")
                .withFilePath(tmp_path_);
        }
        storage::Status synced = file_utils::syncFile(tmp_path_);
        if (!synced.isOk()) throw synced.error();
        storage::Status renamed = file_utils::durableRename(tmp_path_, filepath_);
        if (!renamed.isOk()) throw renamed.error();

        meta_.file_size = offset_;
        state_ = State::kFinished;
        LOG_TRACE("[SSTableBuilder] Published '{}': {} entries ({} tombstones), {} bytes.",
                  filepath_, meta_.entry_count, meta_.tombstone_count, meta_.file_size);
    } catch (const StorageError& e) {
        LOG_ERROR("[SSTableBuilder] Failure during finish() for '{}': {}. Cleaning up.", filepath_, e.toString());
        state_ = State::kFailed;
        cleanupTempFile();
        throw;
    }
}

void SSTableBuilder::abandon() {
    if (state_ == State::kBuilding) {
        state_ = State::kFailed;
        cleanupTempFile();
    }
}

// --- Private Helpers ---

void SSTableBuilder::writeRaw(const std::string& bytes, const char* what) {
    output_file_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!output_file_) {
        throw StorageError(ErrorCode::IO_WRITE_ERROR, std::string("Failed to write SSTable ") + what)
            .withFilePath(tmp_path_);
    }
    offset_ += bytes.size();
}

void SSTableBuilder::writeDataBlock() {
    if (block_buffer_.empty()) return;

    SSTableBlockHeader header;
    header.record_count = records_in_block_;
    header.raw_size = static_cast<uint32_t>(block_buffer_.size());

    // Compress only when it actually shrinks the block.
    std::string payload;
    header.compression = CompressionType::NONE;
    if (options_.compression_type != CompressionType::NONE) {
        try {
            std::vector<uint8_t> compressed = CompressionManager::compress(
                reinterpret_cast<const uint8_t*>(block_buffer_.data()), block_buffer_.size(),
                options_.compression_type, options_.compression_level);
            if (compressed.size() < block_buffer_.size()) {
                payload.assign(compressed.begin(), compressed.end());
                header.compression = options_.compression_type;
            }
        } catch (const StorageError& e) {
            LOG_WARN("[SSTableBuilder] Error compressing block for '{}': {}. Storing uncompressed.", filepath_, e.toString());
        }
    }
    if (header.compression == CompressionType::NONE) {
        payload.swap(block_buffer_);
    }

    header.stored_size = static_cast<uint32_t>(payload.size());
    header.crc32 = calculate_payload_checksum(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());

    std::string encoded_header;
    header.encodeTo(encoded_header);

    BlockIndexEntry entry;
    entry.first_key = first_key_in_block_;
    entry.offset = offset_;
    entry.size = static_cast<uint32_t>(SSTableBlockHeader::kEncodedSize + payload.size());

    writeRaw(encoded_header, "block header");
    writeRaw(payload, "data block");
    index_.push_back(std::move(entry));

    block_buffer_.clear();
    records_in_block_ = 0;
}

void SSTableBuilder::cleanupTempFile() {
    if (output_file_.is_open()) {
        output_file_.close();
    }
    std::error_code ec;
    fs::remove(tmp_path_, ec);
    if (ec) {
        LOG_WARN("[SSTableBuilder] Could not remove temporary file '{}': {}", tmp_path_, ec.message());
    }
}

} // namespace lsm
} // namespace strata
