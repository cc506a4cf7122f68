// include/engine_config.h
#pragma once

#include "debug_utils.h"
#include "lsm/size_tiered_compaction_strategy.h"
#include "lsm/sstable_builder.h"
#include "storage_error/result.h"
#include "types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace strata {

namespace storage { class ErrorHandler; }

struct EngineConfig {
    std::string data_dir;
    size_t memtable_max_bytes = 4 * 1024 * 1024;
    uint64_t wal_segment_max_bytes = 16 * 1024 * 1024;
    int64_t compaction_interval_ms = 10000; // <= 0 disables background compaction
    int max_levels = 7;
    size_t max_l0_files = 4;
    uint64_t level_base_bytes = 10 * 1024 * 1024;
    double level_size_multiplier = 10.0;
    double bloom_filter_fpr = 0.01;
    size_t sstable_block_size = 4 * 1024;
    CompressionType sstable_compression = CompressionType::NONE;
    int compression_level = 0; // 0 = codec default
    log::LogLevel log_level = log::LogLevel::INFO;

    // Receives errors from background flushes and compactions. Not serialized.
    std::shared_ptr<storage::ErrorHandler> error_handler;

    bool is_valid() const { return validate().isOk(); }

    // INVALID_CONFIGURATION naming every offending field.
    storage::Status validate() const;

    /**
     * @brief Overlays a (partial) JSON object on `base`.
     *
     * Keys are the field names above; enums are given by name ("ZSTD", "WARN").
     * Unknown keys and mistyped values fail with INVALID_CONFIGURATION.
     */
    static storage::Result<EngineConfig> fromJson(const std::string& json_text,
                                                  const EngineConfig& base = EngineConfig{});
    std::string toJson() const;

    lsm::SizeTieredCompactionConfig compactionConfig() const;
    lsm::SSTableBuilder::Options builderOptions() const;
};

} // namespace strata
