// src/bloom_filter.cpp
#include "bloom_filter.h"
#include "serialization_utils.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <random>
#include <stdexcept>

namespace strata {

namespace {
constexpr size_t kDefaultBits = 1024;
constexpr size_t kDefaultHashes = 3;
// Caps what a corrupt header may ask us to allocate.
constexpr uint64_t kMaxBits = uint64_t(1) << 34;
constexpr uint32_t kMaxHashes = 64;

inline uint64_t rotl64(uint64_t x, int r) { return (x << r) | (x >> (64 - r)); }

inline uint64_t fmix64(uint64_t k) {
    k ^= k >> 33;
    k *= 0xff51afd7ed558ccdULL;
    k ^= k >> 33;
    k *= 0xc4ceb9fe1a85ec53ULL;
    k ^= k >> 33;
    return k;
}
} // namespace

BloomFilter::BloomFilter(size_t expectedItems, double falsePositiveRate)
    : itemCount(0) {
    if (expectedItems == 0) {
        arraySize = kDefaultBits;
        hashFunctionCount = kDefaultHashes;
    } else {
        arraySize = calculateOptimalSize(expectedItems, falsePositiveRate);
        hashFunctionCount = calculateOptimalHashFunctions(expectedItems, arraySize);
    }
    if (arraySize == 0) arraySize = 1;
    if (hashFunctionCount == 0) hashFunctionCount = 1;
    bitArray.resize(arraySize, false);
    initializeHashSeeds();
}

BloomFilter::BloomFilter(size_t size, size_t numHashFunctions)
    : arraySize(size == 0 ? 1 : size),
      hashFunctionCount(numHashFunctions == 0 ? 1 : numHashFunctions),
      itemCount(0) {
    bitArray.resize(arraySize, false);
    initializeHashSeeds();
}

BloomFilter::BloomFilter() : BloomFilter(kDefaultBits, kDefaultHashes) {}

BloomFilter::BloomFilter(const BloomFilter& other) {
    std::lock_guard<std::mutex> lock(other.mutex);
    arraySize = other.arraySize;
    hashFunctionCount = other.hashFunctionCount;
    itemCount = other.itemCount;
    hashSeeds = other.hashSeeds;
    bitArray = other.bitArray;
}

BloomFilter& BloomFilter::operator=(const BloomFilter& other) {
    if (this == &other) {
        return *this;
    }
    std::scoped_lock locks(mutex, other.mutex);
    arraySize = other.arraySize;
    hashFunctionCount = other.hashFunctionCount;
    itemCount = other.itemCount;
    hashSeeds = other.hashSeeds;
    bitArray = other.bitArray;
    return *this;
}

void BloomFilter::initializeHashSeeds() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    hashSeeds.resize(hashFunctionCount);
    for (size_t i = 0; i < hashFunctionCount; ++i) {
        hashSeeds[i] = dis(gen);
    }
}

// MurmurHash3 x64_128, folded to 64 bits.
uint64_t BloomFilter::murmurHash3(std::string_view key, uint64_t seed) {
    const uint64_t c1 = 0x87c37b91114253d5ULL;
    const uint64_t c2 = 0x4cf5ad432745937fULL;

    uint64_t h1 = seed;
    uint64_t h2 = seed;

    const auto* data = reinterpret_cast<const uint8_t*>(key.data());
    const size_t nblocks = key.size() / 16;

    for (size_t i = 0; i < nblocks; i++) {
        uint64_t k1;
        uint64_t k2;
        std::memcpy(&k1, data + i * 16, sizeof(k1));
        std::memcpy(&k2, data + i * 16 + 8, sizeof(k2));

        k1 *= c1; k1 = rotl64(k1, 31); k1 *= c2; h1 ^= k1;
        h1 = rotl64(h1, 27); h1 += h2; h1 = h1 * 5 + 0x52dce729;

        k2 *= c2; k2 = rotl64(k2, 33); k2 *= c1; h2 ^= k2;
        h2 = rotl64(h2, 31); h2 += h1; h2 = h2 * 5 + 0x38495ab5;
    }

    const uint8_t* tail = data + nblocks * 16;
    uint64_t k1 = 0;
    uint64_t k2 = 0;

    switch (key.size() & 15) {
        case 15: k2 ^= uint64_t(tail[14]) << 48; [[fallthrough]];
        case 14: k2 ^= uint64_t(tail[13]) << 40; [[fallthrough]];
        case 13: k2 ^= uint64_t(tail[12]) << 32; [[fallthrough]];
        case 12: k2 ^= uint64_t(tail[11]) << 24; [[fallthrough]];
        case 11: k2 ^= uint64_t(tail[10]) << 16; [[fallthrough]];
        case 10: k2 ^= uint64_t(tail[9]) << 8;   [[fallthrough]];
        case 9:  k2 ^= uint64_t(tail[8]);
                 k2 *= c2; k2 = rotl64(k2, 33); k2 *= c1; h2 ^= k2;
                 [[fallthrough]];
        case 8:  k1 ^= uint64_t(tail[7]) << 56; [[fallthrough]];
        case 7:  k1 ^= uint64_t(tail[6]) << 48; [[fallthrough]];
        case 6:  k1 ^= uint64_t(tail[5]) << 40; [[fallthrough]];
        case 5:  k1 ^= uint64_t(tail[4]) << 32; [[fallthrough]];
        case 4:  k1 ^= uint64_t(tail[3]) << 24; [[fallthrough]];
        case 3:  k1 ^= uint64_t(tail[2]) << 16; [[fallthrough]];
        case 2:  k1 ^= uint64_t(tail[1]) << 8;  [[fallthrough]];
        case 1:  k1 ^= uint64_t(tail[0]);
                 k1 *= c1; k1 = rotl64(k1, 31); k1 *= c2; h1 ^= k1;
                 break;
        default: break;
    }

    h1 ^= key.size();
    h2 ^= key.size();
    h1 += h2;
    h2 += h1;
    h1 = fmix64(h1);
    h2 = fmix64(h2);
    h1 += h2;
    h2 += h1;
    return h1 ^ h2;
}

size_t BloomFilter::calculateOptimalSize(size_t n, double p) {
    if (n == 0 || p <= 0.0 || p >= 1.0) return kDefaultBits;
    return static_cast<size_t>(std::ceil(-static_cast<double>(n) * std::log(p) / (std::log(2.0) * std::log(2.0))));
}

size_t BloomFilter::calculateOptimalHashFunctions(size_t n, size_t m) {
    if (n == 0 || m == 0) return kDefaultHashes;
    double k = std::round(static_cast<double>(m) / static_cast<double>(n) * std::log(2.0));
    return static_cast<size_t>(std::clamp(k, 1.0, static_cast<double>(kMaxHashes)));
}

void BloomFilter::add(std::string_view item) {
    std::lock_guard<std::mutex> lock(mutex);
    for (size_t i = 0; i < hashFunctionCount; ++i) {
        bitArray[murmurHash3(item, hashSeeds[i]) % arraySize] = true;
    }
    itemCount++;
}

bool BloomFilter::mightContain(std::string_view item) const {
    std::lock_guard<std::mutex> lock(mutex);
    for (size_t i = 0; i < hashFunctionCount; ++i) {
        if (!bitArray[murmurHash3(item, hashSeeds[i]) % arraySize]) {
            return false;
        }
    }
    return true;
}

void BloomFilter::merge(const BloomFilter& other) {
    if (this == &other) return;
    std::scoped_lock locks(mutex, other.mutex);
    if (arraySize != other.arraySize || hashFunctionCount != other.hashFunctionCount ||
        hashSeeds != other.hashSeeds) {
        throw std::invalid_argument("Cannot merge Bloom filters with different size, hash count or seeds");
    }
    for (size_t i = 0; i < arraySize; ++i) {
        bitArray[i] = bitArray[i] || other.bitArray[i];
    }
    itemCount += other.itemCount;
}

void BloomFilter::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    std::fill(bitArray.begin(), bitArray.end(), false);
    itemCount = 0;
}

std::string BloomFilter::serialize() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::string out;
    PutFixed64(out, arraySize);
    PutFixed32(out, static_cast<uint32_t>(hashFunctionCount));
    PutFixed64(out, itemCount);
    for (uint64_t seed : hashSeeds) {
        PutFixed64(out, seed);
    }

    // Pack 8 bits per byte.
    std::string packed((arraySize + 7) / 8, '\0');
    for (size_t i = 0; i < arraySize; ++i) {
        if (bitArray[i]) {
            packed[i / 8] = static_cast<char>(packed[i / 8] | (1 << (i % 8)));
        }
    }
    out.append(packed);
    return out;
}

bool BloomFilter::deserialize(std::string_view data) {
    uint64_t bits = 0;
    uint32_t hashes = 0;
    uint64_t items = 0;
    if (!GetFixed64(data, bits) || !GetFixed32(data, hashes) || !GetFixed64(data, items)) {
        return false;
    }
    if (bits == 0 || bits > kMaxBits || hashes == 0 || hashes > kMaxHashes) {
        return false;
    }
    std::vector<uint64_t> seeds(hashes);
    for (uint32_t i = 0; i < hashes; ++i) {
        if (!GetFixed64(data, seeds[i])) return false;
    }
    size_t packedSize = static_cast<size_t>((bits + 7) / 8);
    if (data.size() != packedSize) {
        return false;
    }
    std::vector<bool> loaded(static_cast<size_t>(bits), false);
    for (size_t i = 0; i < loaded.size(); ++i) {
        loaded[i] = (static_cast<uint8_t>(data[i / 8]) & (1 << (i % 8))) != 0;
    }

    std::lock_guard<std::mutex> lock(mutex);
    arraySize = static_cast<size_t>(bits);
    hashFunctionCount = hashes;
    itemCount = static_cast<size_t>(items);
    hashSeeds = std::move(seeds);
    bitArray = std::move(loaded);
    return true;
}

double BloomFilter::estimateFalsePositiveRate() const {
    std::lock_guard<std::mutex> lock(mutex);
    if (itemCount == 0 || arraySize == 0) return 0.0;
    double p_bit_zero = 1.0 - 1.0 / static_cast<double>(arraySize);
    double p_all_zero = std::pow(p_bit_zero, static_cast<double>(itemCount * hashFunctionCount));
    return std::pow(1.0 - p_all_zero, static_cast<double>(hashFunctionCount));
}

size_t BloomFilter::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return itemCount;
}

} // namespace strata
