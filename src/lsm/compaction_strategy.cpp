// src/lsm/compaction_strategy.cpp
#include "lsm/compaction_strategy.h"

#include <algorithm>

namespace strata {
namespace lsm {

LevelSnapshot groupByLevel(const std::vector<SSTableFileInfo>& files, int max_levels) {
    int level_count = std::max(max_levels, 1);
    for (const auto& f : files) {
        level_count = std::max(level_count, f.level + 1);
    }
    LevelSnapshot levels(static_cast<size_t>(level_count));
    for (const auto& f : files) {
        if (f.level < 0) continue;
        levels[static_cast<size_t>(f.level)].push_back(f);
    }
    for (auto& level : levels) {
        std::sort(level.begin(), level.end(), [](const SSTableFileInfo& a, const SSTableFileInfo& b) {
            return a.sequence < b.sequence;
        });
    }
    return levels;
}

uint64_t levelSizeBytes(const std::vector<SSTableFileInfo>& level) {
    uint64_t total = 0;
    for (const auto& f : level) total += f.size_bytes;
    return total;
}

} // namespace lsm
} // namespace strata
