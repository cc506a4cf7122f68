// src/lsm/size_tiered_compaction_strategy.cpp
#include "lsm/size_tiered_compaction_strategy.h"
#include "debug_utils.h"
#include "storage_error/error_utils.h"

#include <sstream>

namespace strata {
namespace lsm {

SizeTieredCompactionStrategy::SizeTieredCompactionStrategy(const SizeTieredCompactionConfig& config)
    : config_(config),
      creation_time_(std::chrono::steady_clock::now())
{
    if (!config_.is_valid()) {
        std::ostringstream oss;
        oss << "Invalid SizeTieredCompactionConfig: "
            << "max_l0_files=" << config_.max_l0_files
            << ", base_level_size_bytes=" << config_.base_level_size_bytes
            << ", multiplier=" << config_.level_size_multiplier
            << ", max_levels=" << config_.max_levels;
        throw STORAGE_ERROR(storage::ErrorCode::INVALID_CONFIGURATION, oss.str());
    }

    LOG_INFO("[SizeTieredCompaction] Created with config: L0_trigger={}, base={}MB, multiplier={:.1f}, levels={}",
             config_.max_l0_files, config_.base_level_size_bytes / (1024 * 1024),
             config_.level_size_multiplier, config_.max_levels);
}

SizeTieredCompactionStrategy::~SizeTieredCompactionStrategy() {
    auto lifetime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - creation_time_);
    LOG_TRACE("[SizeTieredCompaction] Destroyed after {}s. L0_jobs={}, Level_jobs={}, Avg_select_time={:.2f}us",
              lifetime.count(),
              metrics_.l0_compactions_selected.load(),
              metrics_.level_compactions_selected.load(),
              metrics_.average_selection_time_us());
}

uint64_t SizeTieredCompactionStrategy::levelTargetBytes(int level) const {
    if (level <= 0) return 0;
    double target = static_cast<double>(config_.base_level_size_bytes);
    for (int i = 2; i <= level; ++i) {
        target *= config_.level_size_multiplier;
    }
    return static_cast<uint64_t>(target);
}

int SizeTieredCompactionStrategy::pickSourceLevel(const LevelSnapshot& levels) const {
    if (!levels.empty() && levels[0].size() >= config_.max_l0_files) {
        return 0;
    }

    // The last level has no budget; it only receives data.
    const int last_level = config_.max_levels - 1;
    for (int i = 1; i < last_level && i < static_cast<int>(levels.size()); ++i) {
        const auto& level = levels[static_cast<size_t>(i)];
        if (level.empty()) continue;
        uint64_t size = levelSizeBytes(level);
        uint64_t target = levelTargetBytes(i);
        if (size > target) {
            LOG_TRACE("  [SizeTieredCompaction] L{} holds {}B over its {}B budget.", i, size, target);
            return i;
        }
    }
    return -1;
}

bool SizeTieredCompactionStrategy::shouldCompact(const LevelSnapshot& levels) const {
    return pickSourceLevel(levels) >= 0;
}

std::optional<CompactionJob> SizeTieredCompactionStrategy::selectSSTables(const LevelSnapshot& levels) const {
    auto start_time = std::chrono::steady_clock::now();

    std::optional<CompactionJob> result;
    int source = pickSourceLevel(levels);
    if (source >= 0) {
        int target = source + 1;
        std::vector<std::string> inputs;
        for (const auto& f : levels[static_cast<size_t>(source)]) inputs.push_back(f.path);
        if (target < static_cast<int>(levels.size())) {
            for (const auto& f : levels[static_cast<size_t>(target)]) inputs.push_back(f.path);
        }
        result.emplace(source, target, std::move(inputs));

        if (source == 0) {
            metrics_.l0_compactions_selected.fetch_add(1, std::memory_order_relaxed);
        } else {
            metrics_.level_compactions_selected.fetch_add(1, std::memory_order_relaxed);
        }
        LOG_INFO("[SizeTieredCompaction] Selected L{} -> L{} with {} input file(s).",
                 source, target, result->input_files.size());
    } else {
        metrics_.selections_without_job.fetch_add(1, std::memory_order_relaxed);
    }

    metrics_.record_selection_time(std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time));
    return result;
}

CompactionMetricsSnapshot SizeTieredCompactionStrategy::getMetrics() const {
    CompactionMetricsSnapshot snapshot;
    snapshot.l0_compactions_selected = metrics_.l0_compactions_selected.load(std::memory_order_relaxed);
    snapshot.level_compactions_selected = metrics_.level_compactions_selected.load(std::memory_order_relaxed);
    snapshot.selections_without_job = metrics_.selections_without_job.load(std::memory_order_relaxed);
    snapshot.average_selection_time_us = metrics_.average_selection_time_us();
    return snapshot;
}

} // namespace lsm
} // namespace strata
