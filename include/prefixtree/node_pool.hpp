#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

// Branch prediction hints
#if defined(__GNUC__) || defined(__clang__)
    #define PREFIXTREE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define PREFIXTREE_UNLIKELY(x) (x)
#endif

namespace prefixtree {

/**
 * @brief Stable reference to a node inside a NodePool.
 *
 * Format: [8-bit chunk index][24-bit offset inside the chunk]
 */
using NodeHandle = uint32_t;

/// Sentinel handle meaning "no node".
constexpr NodeHandle NIL_NODE = 0xFFFFFFFFu;

/**
 * @brief One node of a binary prefix trie.
 *
 * @tparam V Payload type stored at registered prefixes
 */
template<typename V>
struct RadixNode {
    NodeHandle left;            ///< Child for a 0 bit, owned
    NodeHandle right;           ///< Child for a 1 bit, owned; next link while on the free list
    NodeHandle parent;          ///< Back reference, NIL_NODE for the root
    std::optional<V> value;     ///< Present only on registered prefixes

    RadixNode() : left(NIL_NODE), right(NIL_NODE), parent(NIL_NODE) {}

    /**
     * @brief Drop all links and the payload.
     */
    void reset() {
        left = NIL_NODE;
        right = NIL_NODE;
        parent = NIL_NODE;
        value.reset();
    }

    bool has_children() const {
        return left != NIL_NODE || right != NIL_NODE;
    }
};

/**
 * @brief Chunked node allocator with free-list reuse.
 *
 * Nodes live in chunks that are allocated once and never resized, so a node
 * stays at the same address for the lifetime of the pool. Released nodes are
 * chained through their `right` field and handed out again before any new
 * storage is touched.
 *
 * @tparam V Payload type of the nodes
 *
 * Growth Policy:
 * - First chunk holds max(initial_capacity, MIN_CHUNK_SIZE) slots
 * - Every further chunk doubles the previous one, capped at MAX_CHUNK_SIZE
 * - At most MAX_CHUNKS chunks; beyond that allocate() throws std::length_error
 *
 * Performance Characteristics:
 * - allocate: O(1) amortized
 * - recycle: O(1)
 * - operator[]: O(1), two shifts and an index
 *
 * Usage Example:
 * @code
 * prefixtree::NodePool<int> pool;
 *
 * prefixtree::NodeHandle a = pool.allocate();
 * pool[a].value = 42;
 *
 * pool.recycle(a);
 * prefixtree::NodeHandle b = pool.allocate(); // b == a, value cleared
 * @endcode
 *
 * @warning Not thread-safe. One pool belongs to one tree.
 */
template<typename V>
class NodePool {
public:
    using Node = RadixNode<V>;

    static constexpr size_t MIN_CHUNK_SIZE = 256;
    static constexpr size_t MAX_CHUNK_SIZE = size_t(1) << 24;
    static constexpr size_t MAX_CHUNKS = 255;

    /**
     * @brief Create an empty pool.
     *
     * @param initial_capacity Size hint for the first chunk
     * @complexity O(1), no storage is allocated until the first allocate()
     */
    explicit NodePool(size_t initial_capacity = 0);

    NodePool(const NodePool&) = delete;
    NodePool& operator=(const NodePool&) = delete;

    /**
     * @brief Take over the storage of `other`.
     *
     * `other` is left as a freshly constructed pool with no chunks; handles
     * issued by it now refer to this pool.
     */
    NodePool(NodePool&& other) noexcept;
    NodePool& operator=(NodePool&& other) noexcept;

    void swap(NodePool& other) noexcept;

    /**
     * @brief Obtain a cleared node.
     *
     * @return Handle of a node with no links and no value
     * @complexity O(1) amortized
     * @exception_safety Strong guarantee - throws std::bad_alloc or
     *                  std::length_error, pool unchanged
     *
     * @note Reuses the most recently recycled node when one is available.
     */
    NodeHandle allocate();

    /**
     * @brief Return a node to the free list.
     *
     * @param handle Node to release; must be live and no longer linked
     * @complexity O(1) plus the payload destructor
     */
    void recycle(NodeHandle handle);

    Node& operator[](NodeHandle handle) {
        return chunks_[handle >> OFFSET_BITS].nodes[handle & OFFSET_MASK];
    }

    const Node& operator[](NodeHandle handle) const {
        return chunks_[handle >> OFFSET_BITS].nodes[handle & OFFSET_MASK];
    }

    /// Total slots across all chunks (the storage high-water mark).
    size_t capacity() const { return capacity_; }

    /// Nodes currently handed out.
    size_t live() const { return live_; }

    /// Nodes waiting on the free list.
    size_t free_count() const { return free_count_; }

    size_t chunk_count() const { return chunks_.size(); }

private:
    static constexpr unsigned OFFSET_BITS = 24;
    static constexpr NodeHandle OFFSET_MASK = (NodeHandle(1) << OFFSET_BITS) - 1;

    struct Chunk {
        std::unique_ptr<Node[]> nodes;
        size_t size;
    };

    /**
     * @brief Append a new chunk, larger than the previous one.
     */
    void grow();

    std::vector<Chunk> chunks_;
    size_t initial_capacity_;
    size_t used_;           ///< Slots handed out from the last chunk
    size_t capacity_;
    size_t live_;
    size_t free_count_;
    NodeHandle free_head_;
};

// Implementation

template<typename V>
NodePool<V>::NodePool(size_t initial_capacity)
    : initial_capacity_(initial_capacity), used_(0), capacity_(0),
      live_(0), free_count_(0), free_head_(NIL_NODE) {}

template<typename V>
NodePool<V>::NodePool(NodePool&& other) noexcept
    : chunks_(std::move(other.chunks_)),
      initial_capacity_(std::exchange(other.initial_capacity_, 0)),
      used_(std::exchange(other.used_, 0)),
      capacity_(std::exchange(other.capacity_, 0)),
      live_(std::exchange(other.live_, 0)),
      free_count_(std::exchange(other.free_count_, 0)),
      free_head_(std::exchange(other.free_head_, NIL_NODE)) {
    other.chunks_.clear();
}

template<typename V>
NodePool<V>& NodePool<V>::operator=(NodePool&& other) noexcept {
    if (this != &other) {
        NodePool taken(std::move(other));
        swap(taken);
    }
    return *this;
}

template<typename V>
void NodePool<V>::swap(NodePool& other) noexcept {
    chunks_.swap(other.chunks_);
    std::swap(initial_capacity_, other.initial_capacity_);
    std::swap(used_, other.used_);
    std::swap(capacity_, other.capacity_);
    std::swap(live_, other.live_);
    std::swap(free_count_, other.free_count_);
    std::swap(free_head_, other.free_head_);
}

template<typename V>
NodeHandle NodePool<V>::allocate() {
    if (free_head_ != NIL_NODE) {
        NodeHandle handle = free_head_;
        Node& node = (*this)[handle];
        free_head_ = node.right;
        node.reset();
        --free_count_;
        ++live_;
        return handle;
    }

    if (PREFIXTREE_UNLIKELY(chunks_.empty() || used_ == chunks_.back().size)) {
        grow();
    }

    NodeHandle handle = (static_cast<NodeHandle>(chunks_.size() - 1) << OFFSET_BITS)
                        | static_cast<NodeHandle>(used_);
    ++used_;
    ++live_;
    return handle;
}

template<typename V>
void NodePool<V>::recycle(NodeHandle handle) {
    Node& node = (*this)[handle];
    node.reset();
    node.right = free_head_;
    free_head_ = handle;
    ++free_count_;
    --live_;
}

template<typename V>
void NodePool<V>::grow() {
    if (chunks_.size() >= MAX_CHUNKS) {
        throw std::length_error("prefixtree: node pool exhausted");
    }

    size_t size = chunks_.empty()
        ? std::clamp(initial_capacity_, MIN_CHUNK_SIZE, MAX_CHUNK_SIZE)
        : std::min(chunks_.back().size * 2, MAX_CHUNK_SIZE);

    Chunk chunk{std::unique_ptr<Node[]>(new Node[size]), size};
    chunks_.push_back(std::move(chunk));
    used_ = 0;
    capacity_ += size;
}

} // namespace prefixtree

#undef PREFIXTREE_UNLIKELY
