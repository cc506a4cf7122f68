// src/engine_config.cpp
#include "engine_config.h"
#include "storage_error/error_utils.h"

#include <magic_enum/magic_enum.hpp>
#include <nlohmann/json.hpp>

#include <vector>

namespace strata {

using json = nlohmann::json;
using storage::ErrorCode;
using storage::Result;
using storage::Status;

namespace {

template<typename E>
E enumFromJson(const json& value, const char* field) {
    auto parsed = magic_enum::enum_cast<E>(value.get<std::string>());
    if (!parsed) {
        throw STORAGE_ERROR(ErrorCode::INVALID_CONFIGURATION, std::string("Unknown value for ") + field)
            .withContext(field, value.get<std::string>());
    }
    return *parsed;
}

} // namespace

Status EngineConfig::validate() const {
    std::vector<std::string> bad;
    if (data_dir.empty()) bad.push_back("data_dir");
    if (memtable_max_bytes == 0) bad.push_back("memtable_max_bytes");
    if (wal_segment_max_bytes == 0) bad.push_back("wal_segment_max_bytes");
    if (max_levels < 2) bad.push_back("max_levels");
    if (max_l0_files == 0) bad.push_back("max_l0_files");
    if (level_base_bytes == 0) bad.push_back("level_base_bytes");
    if (!(level_size_multiplier > 1.0)) bad.push_back("level_size_multiplier");
    if (!(bloom_filter_fpr > 0.0 && bloom_filter_fpr < 1.0)) bad.push_back("bloom_filter_fpr");
    if (sstable_block_size == 0) bad.push_back("sstable_block_size");
    if (compression_level < 0) bad.push_back("compression_level");

    if (bad.empty()) return Status();

    std::string fields;
    for (const auto& f : bad) {
        if (!fields.empty()) fields += ", ";
        fields += f;
    }
    return STORAGE_ERROR(ErrorCode::INVALID_CONFIGURATION, "Invalid engine configuration")
        .withDetails("Offending fields: " + fields)
        .withSuggestedAction("Check the listed EngineConfig fields.");
}

Result<EngineConfig> EngineConfig::fromJson(const std::string& json_text, const EngineConfig& base) {
    EngineConfig cfg = base;
    try {
        json doc = json::parse(json_text);
        if (!doc.is_object()) {
            return STORAGE_ERROR(ErrorCode::INVALID_CONFIGURATION, "Engine configuration must be a JSON object");
        }
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            const std::string& key = it.key();
            const json& v = it.value();
            if (key == "data_dir") cfg.data_dir = v.get<std::string>();
            else if (key == "memtable_max_bytes") cfg.memtable_max_bytes = v.get<size_t>();
            else if (key == "wal_segment_max_bytes") cfg.wal_segment_max_bytes = v.get<uint64_t>();
            else if (key == "compaction_interval_ms") cfg.compaction_interval_ms = v.get<int64_t>();
            else if (key == "max_levels") cfg.max_levels = v.get<int>();
            else if (key == "max_l0_files") cfg.max_l0_files = v.get<size_t>();
            else if (key == "level_base_bytes") cfg.level_base_bytes = v.get<uint64_t>();
            else if (key == "level_size_multiplier") cfg.level_size_multiplier = v.get<double>();
            else if (key == "bloom_filter_fpr") cfg.bloom_filter_fpr = v.get<double>();
            else if (key == "sstable_block_size") cfg.sstable_block_size = v.get<size_t>();
            else if (key == "sstable_compression") cfg.sstable_compression = enumFromJson<CompressionType>(v, "sstable_compression");
            else if (key == "compression_level") cfg.compression_level = v.get<int>();
            else if (key == "log_level") cfg.log_level = enumFromJson<log::LogLevel>(v, "log_level");
            else {
                return STORAGE_ERROR(ErrorCode::INVALID_CONFIGURATION, "Unknown configuration key")
                    .withContext("key", key);
            }
        }
    } catch (const json::exception& e) {
        return STORAGE_ERROR(ErrorCode::INVALID_CONFIGURATION, "Malformed engine configuration")
            .withDetails(e.what());
    } catch (const storage::StorageError& e) {
        return e;
    }
    return cfg;
}

std::string EngineConfig::toJson() const {
    json j;
    j["data_dir"] = data_dir;
    j["memtable_max_bytes"] = memtable_max_bytes;
    j["wal_segment_max_bytes"] = wal_segment_max_bytes;
    j["compaction_interval_ms"] = compaction_interval_ms;
    j["max_levels"] = max_levels;
    j["max_l0_files"] = max_l0_files;
    j["level_base_bytes"] = level_base_bytes;
    j["level_size_multiplier"] = level_size_multiplier;
    j["bloom_filter_fpr"] = bloom_filter_fpr;
    j["sstable_block_size"] = sstable_block_size;
    j["sstable_compression"] = std::string(magic_enum::enum_name(sstable_compression));
    j["compression_level"] = compression_level;
    j["log_level"] = std::string(magic_enum::enum_name(log_level));
    return j.dump(2);
}

lsm::SizeTieredCompactionConfig EngineConfig::compactionConfig() const {
    lsm::SizeTieredCompactionConfig c;
    c.max_l0_files = max_l0_files;
    c.base_level_size_bytes = level_base_bytes;
    c.level_size_multiplier = level_size_multiplier;
    c.max_levels = max_levels;
    return c;
}

lsm::SSTableBuilder::Options EngineConfig::builderOptions() const {
    lsm::SSTableBuilder::Options o;
    o.compression_type = sstable_compression;
    o.compression_level = compression_level;
    o.target_block_size = sstable_block_size;
    o.bloom_filter_fpr = bloom_filter_fpr;
    return o;
}

} // namespace strata
