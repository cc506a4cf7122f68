// src/lsm/arena.cpp
#include "lsm/arena.h"

namespace strata {
namespace lsm {

Arena::Arena() : alloc_ptr_(nullptr), alloc_bytes_remaining_(0), memory_usage_(0) {}

char* Arena::Allocate(size_t bytes) {
    if (bytes <= alloc_bytes_remaining_) {
        char* result = alloc_ptr_;
        alloc_ptr_ += bytes;
        alloc_bytes_remaining_ -= bytes;
        return result;
    }
    return AllocateFallback(bytes);
}

char* Arena::AllocateAligned(size_t bytes) {
    constexpr size_t align = sizeof(void*);
    static_assert((align & (align - 1)) == 0, "Pointer size should be a power of 2");
    size_t current_mod = reinterpret_cast<uintptr_t>(alloc_ptr_) & (align - 1);
    size_t slop = (current_mod == 0) ? 0 : align - current_mod;
    size_t needed = bytes + slop;
    if (needed <= alloc_bytes_remaining_) {
        char* result = alloc_ptr_ + slop;
        alloc_ptr_ += needed;
        alloc_bytes_remaining_ -= needed;
        return result;
    }
    // New blocks come from operator new[] and are suitably aligned.
    return AllocateFallback(bytes);
}

char* Arena::AllocateFallback(size_t bytes) {
    if (bytes > kBlockSize / 4) {
        // Large object: own block, keep the current block's leftovers for later requests.
        return AllocateNewBlock(bytes);
    }
    char* new_block_start = AllocateNewBlock(kBlockSize);
    alloc_ptr_ = new_block_start + bytes;
    alloc_bytes_remaining_ = kBlockSize - bytes;
    return new_block_start;
}

char* Arena::AllocateNewBlock(size_t block_bytes) {
    auto new_block = std::make_unique<char[]>(block_bytes);
    char* result = new_block.get();
    blocks_.push_back(std::move(new_block));
    memory_usage_.fetch_add(block_bytes + sizeof(char*), std::memory_order_relaxed);
    return result;
}

} // namespace lsm
} // namespace strata
