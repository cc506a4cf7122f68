// src/compression_utils.cpp
#include "compression_utils.h"
#include "debug_utils.h"
#include "storage_error/error_utils.h"

#include <lz4.h>
#include <zstd.h>

#include <climits>
#include <string>

namespace strata {

using storage::ErrorCode;
using storage::StorageError;

namespace {

std::vector<uint8_t> zstdCompress(const uint8_t* src, size_t len, int level) {
    std::vector<uint8_t> out(ZSTD_compressBound(len));
    const int effective_level = level == 0 ? ZSTD_CLEVEL_DEFAULT : level;
    const size_t written = ZSTD_compress(out.data(), out.size(), src, len, effective_level);
    if (ZSTD_isError(written)) {
        throw STORAGE_ERROR(ErrorCode::COMPRESSION_ERROR, "ZSTD_compress failed")
            .withDetails(ZSTD_getErrorName(written));
    }
    out.resize(written);
    return out;
}

std::vector<uint8_t> lz4Compress(const uint8_t* src, size_t len) {
    if (len > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
        throw STORAGE_ERROR(ErrorCode::COMPRESSION_ERROR, "Block too large for LZ4")
            .withContext("size", std::to_string(len));
    }
    const int bound = LZ4_compressBound(static_cast<int>(len));
    std::vector<uint8_t> out(static_cast<size_t>(bound));
    const int written = LZ4_compress_default(reinterpret_cast<const char*>(src),
                                             reinterpret_cast<char*>(out.data()),
                                             static_cast<int>(len), bound);
    if (written <= 0) {
        throw STORAGE_ERROR(ErrorCode::COMPRESSION_ERROR, "LZ4_compress_default failed");
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

void zstdDecompress(const uint8_t* src, size_t len, std::vector<uint8_t>& out) {
    const size_t got = ZSTD_decompress(out.data(), out.size(), src, len);
    if (ZSTD_isError(got)) {
        throw STORAGE_ERROR(ErrorCode::COMPRESSION_ERROR, "ZSTD_decompress failed")
            .withDetails(ZSTD_getErrorName(got));
    }
    if (got != out.size()) {
        throw STORAGE_ERROR(ErrorCode::COMPRESSION_ERROR, "ZSTD block decompressed to the wrong size")
            .withDetails("expected " + std::to_string(out.size()) + ", got " + std::to_string(got));
    }
}

void lz4Decompress(const uint8_t* src, size_t len, std::vector<uint8_t>& out) {
    if (len > static_cast<size_t>(INT_MAX) || out.size() > static_cast<size_t>(INT_MAX)) {
        throw STORAGE_ERROR(ErrorCode::COMPRESSION_ERROR, "LZ4 block size out of range");
    }
    const int got = LZ4_decompress_safe(reinterpret_cast<const char*>(src),
                                        reinterpret_cast<char*>(out.data()),
                                        static_cast<int>(len), static_cast<int>(out.size()));
    if (got < 0 || static_cast<size_t>(got) != out.size()) {
        throw STORAGE_ERROR(ErrorCode::COMPRESSION_ERROR, "LZ4_decompress_safe failed")
            .withContext("result", std::to_string(got));
    }
}

} // namespace

std::vector<uint8_t> CompressionManager::compress(const uint8_t* data, size_t size,
                                                  CompressionType type, int level) {
    if (size == 0) {
        return {};
    }
    switch (type) {
        case CompressionType::NONE:
            return std::vector<uint8_t>(data, data + size);
        case CompressionType::ZSTD: {
            auto out = zstdCompress(data, size, level);
            LOG_TRACE("[CompressionManager] zstd {} -> {} bytes", size, out.size());
            return out;
        }
        case CompressionType::LZ4: {
            auto out = lz4Compress(data, size);
            LOG_TRACE("[CompressionManager] lz4 {} -> {} bytes", size, out.size());
            return out;
        }
    }
    throw STORAGE_ERROR(ErrorCode::COMPRESSION_ERROR, "Unsupported compression type")
        .withContext("type", std::to_string(static_cast<int>(type)));
}

std::vector<uint8_t> CompressionManager::decompress(const uint8_t* data, size_t size,
                                                    size_t raw_size, CompressionType type) {
    if (type == CompressionType::NONE) {
        return std::vector<uint8_t>(data, data + size);
    }
    if (raw_size == 0) {
        throw STORAGE_ERROR(ErrorCode::COMPRESSION_ERROR, "Compressed block with zero raw size");
    }
    std::vector<uint8_t> out(raw_size);
    switch (type) {
        case CompressionType::ZSTD:
            zstdDecompress(data, size, out);
            return out;
        case CompressionType::LZ4:
            lz4Decompress(data, size, out);
            return out;
        default:
            break;
    }
    throw STORAGE_ERROR(ErrorCode::COMPRESSION_ERROR, "Unsupported compression type")
        .withContext("type", std::to_string(static_cast<int>(type)));
}

} // namespace strata
