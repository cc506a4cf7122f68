// include/lsm/compaction_job.h
#pragma once

#include <string>
#include <vector>

namespace strata {
namespace lsm {

struct CompactionJob {
    int source_level = 0;
    int target_level = 1;
    std::vector<std::string> input_files;
    std::string output_file; // assigned by the CompactionEngine
    bool drop_tombstones = false;

    CompactionJob() = default;
    CompactionJob(int source, int target, std::vector<std::string> inputs)
        : source_level(source), target_level(target), input_files(std::move(inputs)) {}
};

} // namespace lsm
} // namespace strata
