// include/compression_utils.h
#pragma once

#include "types.h"

#include <cstdint>
#include <vector>

namespace strata {

// Block codecs for SSTable data blocks.
class CompressionManager {
public:
    // Compresses data. Throws storage::StorageError(COMPRESSION_ERROR) on failure.
    // level: 0 for the codec's default, zstd accepts 1-22.
    static std::vector<uint8_t> compress(const uint8_t* data, size_t size,
                                         CompressionType type, int level = 0);

    // Decompresses data. Throws storage::StorageError(COMPRESSION_ERROR) on failure or size mismatch.
    // raw_size is the exact size recorded in the block header.
    static std::vector<uint8_t> decompress(const uint8_t* data, size_t size,
                                           size_t raw_size, CompressionType type);
};

} // namespace strata
