// include/lsm/compaction_strategy.h
#pragma once

#include "lsm/compaction_job.h"
#include "lsm/sstable_meta.h"

#include <optional>
#include <string>
#include <vector>

namespace strata {
namespace lsm {

// levels[i] holds the SSTables of level i, sorted by sequence ascending.
using LevelSnapshot = std::vector<std::vector<SSTableFileInfo>>;

/**
 * @class CompactionStrategy
 * @brief Decides which SSTables to merge next.
 *
 * Implementations only pick inputs; the CompactionEngine assigns the output
 * path, the tombstone policy and runs the merge.
 */
class CompactionStrategy {
public:
    virtual ~CompactionStrategy() = default;

    virtual bool shouldCompact(const LevelSnapshot& levels) const = 0;

    /**
     * @brief Selects at most one job from an immutable snapshot of the levels.
     * @return std::nullopt when nothing needs compacting.
     */
    virtual std::optional<CompactionJob> selectSSTables(const LevelSnapshot& levels) const = 0;

    virtual std::string name() const = 0;
};

// Groups a flat listing by level. The snapshot has at least max_levels entries.
LevelSnapshot groupByLevel(const std::vector<SSTableFileInfo>& files, int max_levels);

uint64_t levelSizeBytes(const std::vector<SSTableFileInfo>& level);

} // namespace lsm
} // namespace strata
