// include/lsm/size_tiered_compaction_strategy.h
#pragma once

#include "lsm/compaction_strategy.h"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace strata {
namespace lsm {

/**
 * @struct CompactionMetricsSnapshot
 * @brief A plain, copyable snapshot of CompactionMetrics.
 */
struct CompactionMetricsSnapshot {
    uint64_t l0_compactions_selected = 0;
    uint64_t level_compactions_selected = 0;
    uint64_t selections_without_job = 0;
    double average_selection_time_us = 0.0;
};

/**
 * @struct CompactionMetrics
 * @brief Selection counters, updated from const selection calls.
 */
struct CompactionMetrics {
    std::atomic<uint64_t> l0_compactions_selected{0};
    std::atomic<uint64_t> level_compactions_selected{0};
    std::atomic<uint64_t> selections_without_job{0};
    std::atomic<uint64_t> total_selection_time_us{0};
    std::atomic<uint64_t> selection_calls{0};

    void record_selection_time(std::chrono::microseconds duration) {
        total_selection_time_us.fetch_add(duration.count(), std::memory_order_relaxed);
        selection_calls.fetch_add(1, std::memory_order_relaxed);
    }

    double average_selection_time_us() const {
        uint64_t calls = selection_calls.load(std::memory_order_relaxed);
        return calls > 0 ? static_cast<double>(total_selection_time_us.load(std::memory_order_relaxed)) / calls : 0.0;
    }
};

struct SizeTieredCompactionConfig {
    size_t max_l0_files = 4;
    uint64_t base_level_size_bytes = 10 * 1024 * 1024; // 10MB budget for level 1
    double level_size_multiplier = 10.0;
    int max_levels = 7;

    bool is_valid() const {
        return max_l0_files > 0 &&
               base_level_size_bytes > 0 &&
               level_size_multiplier > 1.0 &&
               max_levels >= 2;
    }
};

/**
 * @class SizeTieredCompactionStrategy
 * @brief Level 0 compacts on file count, deeper levels on byte size.
 *
 * Level 0 reaching max_l0_files always wins. Otherwise the shallowest level
 * i >= 1 (excluding the last) whose size exceeds base * multiplier^(i-1) is
 * pushed down. A job takes every file of the source level and every file of
 * the target level.
 */
class SizeTieredCompactionStrategy : public CompactionStrategy {
public:
    // Throws StorageError(INVALID_CONFIGURATION) if !config.is_valid().
    explicit SizeTieredCompactionStrategy(const SizeTieredCompactionConfig& config = SizeTieredCompactionConfig{});
    ~SizeTieredCompactionStrategy() override;

    bool shouldCompact(const LevelSnapshot& levels) const override;
    std::optional<CompactionJob> selectSSTables(const LevelSnapshot& levels) const override;
    std::string name() const override { return "SizeTiered"; }

    // Byte budget of a level >= 1. Level 0 has none.
    uint64_t levelTargetBytes(int level) const;

    CompactionMetricsSnapshot getMetrics() const;
    const SizeTieredCompactionConfig& getConfig() const { return config_; }

private:
    // Source level of the next job, or -1.
    int pickSourceLevel(const LevelSnapshot& levels) const;

    const SizeTieredCompactionConfig config_;
    mutable CompactionMetrics metrics_;
    const std::chrono::steady_clock::time_point creation_time_;
};

} // namespace lsm
} // namespace strata
