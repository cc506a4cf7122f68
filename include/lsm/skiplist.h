// include/lsm/skiplist.h
#pragma once

#include "lsm/arena.h"

#include <atomic>
#include <cstdint>
#include <random>
#include <string_view>

namespace strata {
namespace lsm {

/**
 * @class SkipList
 * @brief Ordered map from key to the latest Value, allocated entirely in an Arena.
 *
 * One writer at a time (the MemTable serializes them). Readers may traverse
 * concurrently with that writer: nodes are never unlinked, links are published
 * with release stores, and an overwrite swaps the node's value pointer atomically.
 */
class SkipList {
private:
    struct Node;

public:
    using Key = std::string_view;

    // Immutable once published. Bytes live in the arena right after the struct.
    struct Value {
        const char* data;
        uint32_t size;
        bool is_tombstone;
        int64_t timestamp;

        std::string_view view() const { return std::string_view(data, size); }
    };

    explicit SkipList(Arena& arena);

    SkipList(const SkipList&) = delete;
    SkipList& operator=(const SkipList&) = delete;

    /**
     * @brief Inserts key or replaces its value in place.
     * @return The value that was replaced, or nullptr if the key is new.
     */
    const Value* Upsert(Key key, std::string_view value, int64_t timestamp, bool is_tombstone);

    // Latest value for key (tombstones included), or nullptr.
    const Value* Find(Key key) const;

    size_t Count() const { return count_.load(std::memory_order_relaxed); }
    bool Empty() const { return Count() == 0; }

    class Iterator {
    public:
        explicit Iterator(const SkipList* list);
        bool Valid() const { return node_ != nullptr; }
        void Next();
        void SeekToFirst();
        void Seek(Key target); // first node with key >= target
        Key key() const;
        const Value* value() const;
    private:
        const SkipList* list_;
        Node* node_;
    };

private:
    enum { kMaxHeight = 12 };

    Node* NewNode(Key key, const Value* value, int height);
    const Value* NewValue(std::string_view value, int64_t timestamp, bool is_tombstone);
    int RandomHeight();
    bool KeyIsAfterNode(Key key, Node* n) const;
    Node* FindGreaterOrEqual(Key key, Node** prev) const;

    Arena& arena_;
    Node* const head_;
    std::atomic<int> max_height_;
    std::atomic<size_t> count_{0};

    std::mt19937 rnd_generator_;
    std::uniform_int_distribution<int> rnd_dist_;
};

} // namespace lsm
} // namespace strata
