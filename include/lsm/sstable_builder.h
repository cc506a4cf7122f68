// include/lsm/sstable_builder.h
#pragma once

#include "bloom_filter.h"
#include "lsm/sstable_meta.h"
#include "types.h"

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace strata {
namespace lsm {

/**
 * @class SSTableBuilder
 * @brief Writes one immutable SSTable from records supplied in strictly increasing key order.
 *
 * Output goes to `<path>.tmp` and is renamed into place by finish(), so a
 * reader never observes a partial table. Errors are thrown as StorageError;
 * contract violations (add or finish after finish) as std::logic_error.
 */
class SSTableBuilder {
public:
    struct Options {
        CompressionType compression_type = CompressionType::NONE;
        int compression_level = 0;
        size_t target_block_size = 4 * 1024;
        double bloom_filter_fpr = 0.01;
    };

    SSTableBuilder(const std::string& filepath, int level, uint64_t expected_entry_count, const Options& options);
    SSTableBuilder(const std::string& filepath, int level, uint64_t expected_entry_count);
    ~SSTableBuilder();

    SSTableBuilder(const SSTableBuilder&) = delete;
    SSTableBuilder& operator=(const SSTableBuilder&) = delete;

    // Throws StorageError(INVALID_KEY) unless record.key sorts after the previous key.
    void add(const Record& record);

    /**
     * @brief Writes filter, index, metadata and footer, fsyncs and publishes the file.
     * Fails without leaving a file when entries were expected but none were added.
     */
    void finish();

    // Removes the temporary file without publishing anything.
    void abandon();

    const SSTableMetadata& getMetadata() const { return meta_; }
    uint64_t getRecordCount() const { return meta_.entry_count; }
    bool isFinished() const { return state_ == State::kFinished; }
    const std::string& getFilePath() const { return filepath_; }

private:
    enum class State { kBuilding, kFinished, kFailed };

    void writeDataBlock();
    void writeRaw(const std::string& bytes, const char* what);
    void cleanupTempFile();

    Options options_;
    std::string filepath_;
    std::string tmp_path_;
    uint64_t expected_entry_count_;
    std::ofstream output_file_;
    uint64_t offset_ = 0;
    State state_ = State::kBuilding;

    SSTableMetadata meta_;
    BloomFilter filter_;
    std::vector<BlockIndexEntry> index_;
    bool has_last_key_ = false;

    std::string block_buffer_;
    std::string first_key_in_block_;
    uint32_t records_in_block_ = 0;
};

} // namespace lsm
} // namespace strata
