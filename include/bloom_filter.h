// include/bloom_filter.h
#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

/**
 * @brief Existence filter over SSTable keys. A negative answer is exact,
 * a positive one is wrong with roughly the configured false-positive rate.
 */
class BloomFilter {
private:
    std::vector<bool> bitArray;
    size_t arraySize;
    size_t hashFunctionCount;
    size_t itemCount; // items added, not distinct items
    std::vector<uint64_t> hashSeeds;
    mutable std::mutex mutex;

    static uint64_t murmurHash3(std::string_view key, uint64_t seed);
    void initializeHashSeeds();

public:
    BloomFilter(size_t expectedItems, double falsePositiveRate);
    BloomFilter(size_t size, size_t numHashFunctions);
    BloomFilter();

    BloomFilter(const BloomFilter& other);
    BloomFilter& operator=(const BloomFilter& other);

    static size_t calculateOptimalSize(size_t n, double p);
    static size_t calculateOptimalHashFunctions(size_t n, size_t m);

    void add(std::string_view item);
    bool mightContain(std::string_view item) const;

    // Throws std::invalid_argument when the two filters are not shaped alike.
    void merge(const BloomFilter& other);
    void clear();

    // Format: [bits:u64][hashes:u32][items:u64][seed:u64]*hashes[packed bits]
    std::string serialize() const;
    // Returns false on a truncated or inconsistent buffer; the filter is left unchanged.
    bool deserialize(std::string_view data);

    double estimateFalsePositiveRate() const;

    size_t size() const;
    size_t getArraySize() const { return arraySize; }
    size_t getHashFunctionCount() const { return hashFunctionCount; }
    size_t getMemoryUsageBytes() const { return (arraySize + 7) / 8; }
};

} // namespace strata
