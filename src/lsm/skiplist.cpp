// src/lsm/skiplist.cpp
#include "lsm/skiplist.h"

#include <cstring>
#include <new>

namespace strata {
namespace lsm {

struct SkipList::Node {
private:
    const char* key_ptr;
    size_t key_size;
    std::atomic<const Value*> value_ptr;
    std::atomic<Node*> next_[1];

public:
    static Node* Create(Arena& arena, Key key, const Value* value, int height) {
        const size_t key_size = key.size();
        size_t node_header_size = sizeof(Node) + sizeof(std::atomic<Node*>) * (height - 1);
        char* mem = arena.AllocateAligned(node_header_size + key_size);

        Node* node = new (mem) Node();
        for (int i = 1; i < height; ++i) {
            new (&node->next_[i]) std::atomic<Node*>(nullptr);
        }
        char* key_dst = mem + node_header_size;
        if (key_size > 0) {
            std::memcpy(key_dst, key.data(), key_size);
        }
        node->key_ptr = key_dst;
        node->key_size = key_size;
        node->value_ptr.store(value, std::memory_order_relaxed);
        node->next_[0].store(nullptr, std::memory_order_relaxed);
        return node;
    }

    const Value* GetValue() const { return value_ptr.load(std::memory_order_acquire); }
    void SetValue(const Value* v) { value_ptr.store(v, std::memory_order_release); }
    Key GetKey() const { return Key(key_ptr, key_size); }

    Node* Next(int n) { return next_[n].load(std::memory_order_acquire); }
    void SetNext(int n, Node* x) { next_[n].store(x, std::memory_order_release); }
    Node* NoBarrierNext(int n) { return next_[n].load(std::memory_order_relaxed); }
    void NoBarrierSetNext(int n, Node* x) { next_[n].store(x, std::memory_order_relaxed); }
};

SkipList::SkipList(Arena& arena)
    : arena_(arena),
      head_(NewNode(Key(), nullptr, kMaxHeight)),
      max_height_(1),
      rnd_generator_(std::random_device{}()),
      rnd_dist_(0, 3) {
    for (int i = 0; i < kMaxHeight; ++i) {
        head_->SetNext(i, nullptr);
    }
}

const SkipList::Value* SkipList::Upsert(Key key, std::string_view value, int64_t timestamp, bool is_tombstone) {
    Node* prev[kMaxHeight];
    Node* existing = FindGreaterOrEqual(key, prev);
    const Value* new_value = NewValue(is_tombstone ? std::string_view() : value, timestamp, is_tombstone);

    if (existing != nullptr && existing->GetKey() == key) {
        const Value* old_value = existing->GetValue();
        existing->SetValue(new_value);
        return old_value;
    }

    int height = RandomHeight();
    int current_max = max_height_.load(std::memory_order_relaxed);
    if (height > current_max) {
        for (int i = current_max; i < height; i++) {
            prev[i] = head_;
        }
        // Readers seeing the new height before the links find nullptr in head_ and drop a level.
        max_height_.store(height, std::memory_order_relaxed);
    }

    Node* x = NewNode(key, new_value, height);
    for (int i = 0; i < height; i++) {
        x->NoBarrierSetNext(i, prev[i]->NoBarrierNext(i));
        prev[i]->SetNext(i, x);
    }
    count_.fetch_add(1, std::memory_order_relaxed);
    return nullptr;
}

const SkipList::Value* SkipList::Find(Key key) const {
    Node* x = FindGreaterOrEqual(key, nullptr);
    if (x != nullptr && x->GetKey() == key) {
        return x->GetValue();
    }
    return nullptr;
}

SkipList::Node* SkipList::NewNode(Key key, const Value* value, int height) {
    return Node::Create(arena_, key, value, height);
}

const SkipList::Value* SkipList::NewValue(std::string_view value, int64_t timestamp, bool is_tombstone) {
    char* mem = arena_.AllocateAligned(sizeof(Value) + value.size());
    char* bytes = mem + sizeof(Value);
    if (!value.empty()) {
        std::memcpy(bytes, value.data(), value.size());
    }
    return new (mem) Value{bytes, static_cast<uint32_t>(value.size()), is_tombstone, timestamp};
}

SkipList::Node* SkipList::FindGreaterOrEqual(Key key, Node** prev) const {
    Node* x = head_;
    int level = max_height_.load(std::memory_order_relaxed) - 1;
    while (true) {
        Node* next = x->Next(level);
        if (KeyIsAfterNode(key, next)) {
            x = next;
        } else {
            if (prev != nullptr) prev[level] = x;
            if (level == 0) {
                return next;
            }
            level--;
        }
    }
}

int SkipList::RandomHeight() {
    // Branching factor 4.
    int height = 1;
    while (height < kMaxHeight && rnd_dist_(rnd_generator_) == 0) {
        height++;
    }
    return height;
}

bool SkipList::KeyIsAfterNode(Key key, Node* n) const {
    return (n != nullptr) && (key.compare(n->GetKey()) > 0);
}

// --- SkipList::Iterator ---
SkipList::Iterator::Iterator(const SkipList* list) : list_(list), node_(nullptr) {}
void SkipList::Iterator::Next() { if (node_ != nullptr) node_ = node_->Next(0); }
void SkipList::Iterator::SeekToFirst() { node_ = list_->head_->Next(0); }
void SkipList::Iterator::Seek(Key target) { node_ = list_->FindGreaterOrEqual(target, nullptr); }
SkipList::Key SkipList::Iterator::key() const { return node_->GetKey(); }
const SkipList::Value* SkipList::Iterator::value() const { return node_->GetValue(); }

} // namespace lsm
} // namespace strata
