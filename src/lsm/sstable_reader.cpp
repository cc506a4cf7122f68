// src/lsm/sstable_reader.cpp
#include "lsm/sstable_reader.h"
#include "compression_utils.h"
#include "debug_utils.h"
#include "storage_error/error_utils.h"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace strata {
namespace lsm {

using storage::ErrorCode;
using storage::Result;
using storage::StorageError;

namespace {

/**
 * Walks the data blocks of one table in order. Loads one block at a time and
 * keeps the reader alive through a shared_ptr.
 */
class SSTableIterator : public EntryIterator {
public:
    SSTableIterator(std::shared_ptr<const SSTableReader> reader,
                    std::optional<std::string> start, std::optional<std::string> end)
        : reader_(std::move(reader)), end_(std::move(end)) {
        if (start) {
            // Blocks before the one that could hold start are skipped without reading.
            next_block_ = reader_->firstBlockFor(*start);
            start_ = std::move(start);
        }
        advanceToValid();
    }

    bool hasNext() const override {
        if (pending_error_) return true;
        if (position_ >= records_.size()) return false;
        return !end_ || records_[position_].key <= *end_;
    }

    Result<Record> next() override {
        if (pending_error_) {
            StorageError err = std::move(*pending_error_);
            pending_error_.reset();
            exhausted_ = true;
            records_.clear();
            position_ = 0;
            return err;
        }
        if (!hasNext()) {
            return StorageError(ErrorCode::INTERNAL_ERROR, "SSTable iterator exhausted")
                .withFilePath(reader_->getFilePath());
        }
        Record record = std::move(records_[position_++]);
        advanceToValid();
        return record;
    }

private:
    // Leaves position_ on the next record >= start_, loading blocks as needed.
    void advanceToValid() {
        while (!exhausted_) {
            while (position_ < records_.size()) {
                if (start_ && records_[position_].key < *start_) {
                    position_++;
                    continue;
                }
                start_.reset();
                return;
            }
            if (next_block_ >= reader_->getBlockCount()) {
                exhausted_ = true;
                records_.clear();
                position_ = 0;
                return;
            }
            auto block = reader_->readBlock(next_block_++);
            if (!block.isOk()) {
                pending_error_ = std::move(block.error());
                exhausted_ = true;
                records_.clear();
                position_ = 0;
                return;
            }
            records_ = std::move(block.value());
            position_ = 0;
        }
    }

    std::shared_ptr<const SSTableReader> reader_;
    std::optional<std::string> start_;
    std::optional<std::string> end_;
    std::vector<Record> records_;
    size_t position_ = 0;
    size_t next_block_ = 0;
    bool exhausted_ = false;
    std::optional<StorageError> pending_error_;
};

} // namespace

SSTableReader::SSTableReader(std::string path) : path_(std::move(path)) {}

StorageError SSTableReader::corruption(const std::string& what) const {
    return StorageError::corruption(what)
        .withFilePath(path_)
        .withSuggestedAction("Remove or restore the damaged file");
}

Result<std::shared_ptr<SSTableReader>> SSTableReader::open(const std::string& path) {
    std::shared_ptr<SSTableReader> reader(new SSTableReader(path));

    std::error_code ec;
    uint64_t file_size = fs::file_size(path, ec);
    if (ec) {
        return StorageError::ioErrorFromErrno(ec.value(), "stat SSTable", path)
            .withUnderlyingError(ErrorCode::IO_READ_ERROR);
    }
    reader->file_stream_.open(path, std::ios::binary);
    if (!reader->file_stream_) {
        int err = errno != 0 ? errno : ENOENT;
        return StorageError::ioErrorFromErrno(err, "open SSTable", path)
            .withUnderlyingError(ErrorCode::IO_READ_ERROR);
    }
    if (file_size < SSTableFooter::kEncodedSize) {
        return reader->corruption("File too small for a footer (" + std::to_string(file_size) + " bytes)");
    }

    auto read_range = [&reader](uint64_t offset, uint64_t size, std::string& out) -> bool {
        out.resize(static_cast<size_t>(size));
        reader->file_stream_.seekg(static_cast<std::streamoff>(offset));
        if (size > 0) {
            reader->file_stream_.read(&out[0], static_cast<std::streamsize>(size));
        }
        return static_cast<bool>(reader->file_stream_);
    };

    std::string buf;
    if (!read_range(file_size - SSTableFooter::kEncodedSize, SSTableFooter::kEncodedSize, buf)) {
        return reader->corruption("Failed to read footer");
    }
    SSTableFooter footer;
    if (!SSTableFooter::decodeFrom(buf, footer)) {
        return reader->corruption("Bad footer magic or checksum");
    }

    uint64_t body_end = file_size - SSTableFooter::kEncodedSize;
    auto in_bounds = [body_end](uint64_t off, uint64_t size) {
        return off <= body_end && size <= body_end - off;
    };
    if (!in_bounds(footer.filter_offset, footer.filter_size) ||
        !in_bounds(footer.index_offset, footer.index_size) ||
        !in_bounds(footer.meta_offset, footer.meta_size)) {
        return reader->corruption("Footer points outside the file");
    }

    if (!read_range(footer.filter_offset, footer.filter_size, buf) || !reader->filter_.deserialize(buf)) {
        return reader->corruption("Unreadable filter block");
    }
    if (!read_range(footer.index_offset, footer.index_size, buf) || !decodeBlockIndex(buf, reader->index_)) {
        return reader->corruption("Unreadable index block");
    }
    if (!read_range(footer.meta_offset, footer.meta_size, buf) || !SSTableMetadata::decodeFrom(buf, reader->meta_)) {
        return reader->corruption("Unreadable metadata block");
    }
    for (const auto& entry : reader->index_) {
        if (!in_bounds(entry.offset, entry.size) || entry.offset + entry.size > footer.filter_offset) {
            return reader->corruption("Index entry points outside the data section");
        }
    }
    reader->meta_.filename = path;
    reader->meta_.file_size = file_size;

    LOG_TRACE("[SSTableReader] Opened '{}': level {}, {} entries, {} blocks.",
              path, reader->meta_.level, reader->meta_.entry_count, reader->index_.size());
    return reader;
}

Result<std::vector<Record>> SSTableReader::readBlock(size_t block_index) const {
    if (block_index >= index_.size()) {
        return StorageError(ErrorCode::INTERNAL_ERROR, "Block index out of range").withFilePath(path_);
    }
    const BlockIndexEntry& entry = index_[block_index];
    if (entry.size < SSTableBlockHeader::kEncodedSize) {
        return corruption("Block " + std::to_string(block_index) + " smaller than its header");
    }

    std::string raw(entry.size, '\0');
    {
        std::lock_guard<std::mutex> lock(file_mutex_);
        file_stream_.clear();
        file_stream_.seekg(static_cast<std::streamoff>(entry.offset));
        file_stream_.read(&raw[0], static_cast<std::streamsize>(entry.size));
        if (!file_stream_) {
            file_stream_.clear();
            return StorageError(ErrorCode::IO_READ_ERROR, "Failed to read SSTable data block")
                .withFilePath(path_)
                .withContext("block", std::to_string(block_index));
        }
    }

    SSTableBlockHeader header;
    if (!SSTableBlockHeader::decodeFrom(raw, header) ||
        header.stored_size != entry.size - SSTableBlockHeader::kEncodedSize) {
        return corruption("Bad header on block " + std::to_string(block_index));
    }
    const uint8_t* payload = reinterpret_cast<const uint8_t*>(raw.data()) + SSTableBlockHeader::kEncodedSize;
    if (calculate_payload_checksum(payload, header.stored_size) != header.crc32) {
        return StorageError(ErrorCode::CHECKSUM_MISMATCH, "SSTable block checksum mismatch")
            .withFilePath(path_)
            .withContext("block", std::to_string(block_index));
    }

    std::string plain;
    if (header.compression == CompressionType::NONE) {
        plain.assign(reinterpret_cast<const char*>(payload), header.stored_size);
    } else {
        try {
            std::vector<uint8_t> out = CompressionManager::decompress(payload, header.stored_size,
                                                                      header.raw_size, header.compression);
            plain.assign(out.begin(), out.end());
        } catch (const StorageError& e) {
            return corruption("Block " + std::to_string(block_index) + " failed to decompress: " + e.toString());
        }
    }
    if (plain.size() != header.raw_size) {
        return corruption("Block " + std::to_string(block_index) + " raw size mismatch");
    }

    std::vector<Record> records;
    records.reserve(header.record_count);
    std::string_view cursor(plain);
    while (!cursor.empty()) {
        Record record;
        if (!decodeSSTableRecord(cursor, record)) {
            return corruption("Malformed record in block " + std::to_string(block_index));
        }
        records.push_back(std::move(record));
    }
    if (records.size() != header.record_count) {
        return corruption("Record count mismatch in block " + std::to_string(block_index));
    }
    return std::move(records);
}

bool SSTableReader::mayContain(const std::string& key) const {
    if (meta_.entry_count == 0 || index_.empty()) return false;
    if (key < meta_.min_key || key > meta_.max_key) return false;
    return filter_.mightContain(key);
}

std::optional<size_t> SSTableReader::findBlock(const std::string& key) const {
    // Last block whose first key <= key.
    auto it = std::upper_bound(index_.begin(), index_.end(), key,
                               [](const std::string& k, const BlockIndexEntry& e) { return k < e.first_key; });
    if (it == index_.begin()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(index_.begin(), it) - 1);
}

Result<LookupResult> SSTableReader::lookup(const std::string& key) const {
    LookupResult result;
    if (!mayContain(key)) {
        return result;
    }
    auto block_index = findBlock(key);
    if (!block_index) {
        return result;
    }
    ASSIGN_OR_RETURN_AUTO(records, readBlock(*block_index));
    auto it = std::lower_bound(records.begin(), records.end(), key,
                               [](const Record& r, const std::string& k) { return r.key < k; });
    if (it != records.end() && it->key == key) {
        result.status = it->deleted ? LookupStatus::kDeleted : LookupStatus::kFound;
        result.timestamp = it->timestamp;
        if (!it->deleted) {
            result.value = std::move(it->value);
        }
    }
    return result;
}

Result<std::optional<std::string>> SSTableReader::get(const std::string& key) const {
    ASSIGN_OR_RETURN_AUTO(found, lookup(key));
    if (found.status == LookupStatus::kFound) {
        return std::optional<std::string>(std::move(found.value));
    }
    return std::optional<std::string>{};
}

size_t SSTableReader::firstBlockFor(const std::string& key) const {
    return findBlock(key).value_or(0);
}

std::unique_ptr<EntryIterator> SSTableReader::newIterator() const {
    return std::make_unique<SSTableIterator>(shared_from_this(), std::nullopt, std::nullopt);
}

std::unique_ptr<EntryIterator> SSTableReader::newRangeIterator(const std::string& start, const std::string& end) const {
    return std::make_unique<SSTableIterator>(shared_from_this(), start, end);
}

} // namespace lsm
} // namespace strata
