// include/lsm/arena.h
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace strata {
namespace lsm {

/**
 * @class Arena
 * @brief Bump allocator backing the MemTable skip list.
 *
 * Serves small requests from 4 KiB blocks and gives oversized requests a block
 * of their own. Memory is released all at once when the arena is destroyed.
 * Allocation requires external synchronization; MemoryUsage() may be read
 * concurrently.
 */
class Arena {
public:
    Arena();
    ~Arena() = default;

    Arena(const Arena&) = delete;
    Arena& operator=(const Arena&) = delete;

    char* Allocate(size_t bytes);

    // Allocates with pointer-size alignment.
    char* AllocateAligned(size_t bytes);

    // Total bytes of all blocks handed out by the system allocator.
    size_t MemoryUsage() const { return memory_usage_.load(std::memory_order_relaxed); }

private:
    static constexpr size_t kBlockSize = 4096;

    char* AllocateFallback(size_t bytes);
    char* AllocateNewBlock(size_t block_bytes);

    char* alloc_ptr_;
    size_t alloc_bytes_remaining_;
    std::vector<std::unique_ptr<char[]>> blocks_;
    std::atomic<size_t> memory_usage_;
};

} // namespace lsm
} // namespace strata
