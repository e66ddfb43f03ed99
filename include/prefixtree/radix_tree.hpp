#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <utility>

#include "prefixtree/ip_prefix.hpp"
#include "prefixtree/node_pool.hpp"
#include "prefixtree/status.hpp"

// Branch prediction hints
#if defined(__GNUC__) || defined(__clang__)
    #define PREFIXTREE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define PREFIXTREE_UNLIKELY(x) (x)
#endif

namespace prefixtree {

/**
 * @brief Binary radix tree mapping IP prefixes to values with longest-prefix-match lookup.
 *
 * Every node stands for one bit string: the root is the empty prefix, a left
 * edge appends 0 and a right edge appends 1. Registering "10.0.0.0/8" walks
 * the 104 bits of ::ffff:10.0.0.0/104 and stores the value on the node
 * reached. A lookup walks the address bits and remembers the deepest node
 * carrying a value.
 *
 * @tparam V Payload type. Must be copy-constructible for lookup() and find().
 *
 * Key Features:
 * - IPv4 and IPv6 in one tree (IPv4 is mapped into ::ffff:0:0/96)
 * - Insert-only and upsert policies (add_prefix / set_prefix)
 * - Exact prefix delete that keeps longer prefixes below it
 * - Whole-range delete that drops a subnet with everything inside it
 * - Nodes come from a chunked pool and are recycled on delete, so churn
 *   does not grow memory beyond the previous high-water mark
 *
 * Performance Characteristics:
 * - All operations: O(w) where w is the address width in bits (at most 128)
 * - Range delete: O(w + k) where k is the size of the removed subtree
 * - Memory: O(n*w) nodes in the worst case, shared prefixes share nodes
 *
 * Usage Example:
 * @code
 * prefixtree::RadixTree<std::string> routes;
 *
 * routes.add_prefix("10.0.0.0/8", "core");
 * routes.add_prefix("10.1.0.0/16", "lab");
 *
 * std::optional<std::string> hop;
 * if (routes.lookup("10.1.2.3", hop) == prefixtree::Status::Ok && hop) {
 *     std::cout << "via " << *hop << std::endl;   // via lab
 * }
 *
 * routes.delete_range("10.0.0.0/8");               // both entries gone
 * @endcode
 *
 * @warning Not thread-safe. Serialize mutations externally; concurrent const
 *          lookups are fine while no mutation is running.
 */
template<typename V>
class RadixTree {
private:
    using Pool = NodePool<V>;
    using Node = typename Pool::Node;

    Pool pool_;             ///< Node storage and free list
    NodeHandle root_;       ///< Empty prefix, never recycled
    size_t size_;           ///< Number of registered prefixes

    /**
     * @brief Bit `index` of `key`, counted from the most significant bit of byte 0.
     */
    static bool bit_at(const AddressBytes& key, size_t index) {
        return (key[index >> 3] >> (7 - (index & 7))) & 1;
    }

    /**
     * @brief Validate widths and compute the walk length.
     * @return false if key and mask widths differ or the key is empty
     */
    static bool walk_length(const AddressBytes& key, const AddressBytes& mask, size_t& bits) {
        if (PREFIXTREE_UNLIKELY(key.empty() || key.size() != mask.size())) {
            return false;
        }
        bits = prefix_length(mask);
        return true;
    }

    /**
     * @brief Follow `bits` bits of `key` from the root without creating nodes.
     * @return The node reached, or NIL_NODE if a child is missing on the way
     */
    NodeHandle descend(const AddressBytes& key, size_t bits) const;

    /**
     * @brief Recycle `handle` and everything below it.
     * @return Number of values dropped
     */
    size_t release_recursive(NodeHandle handle);

    /**
     * @brief Walk upward recycling nodes that are childless, valueless and not the root.
     */
    void prune(NodeHandle handle);

public:
    /**
     * @brief Create an empty tree.
     *
     * @param preallocate Expected node count; sizes the first storage chunk
     * @complexity O(preallocate) for chunk construction
     */
    explicit RadixTree(size_t preallocate = 0);

    // Non-copyable but movable for resource management
    RadixTree(const RadixTree&) = delete;
    RadixTree& operator=(const RadixTree&) = delete;

    /**
     * @brief Take over every prefix stored in `other`.
     *
     * `other` is left as a valid empty tree with a fresh root.
     *
     * @exception_safety Strong guarantee - the replacement root for `other`
     *                  is allocated before anything changes hands
     */
    RadixTree(RadixTree&& other);
    RadixTree& operator=(RadixTree&& other);

    void swap(RadixTree& other) noexcept;

    /**
     * @brief Register a prefix, failing if it already carries a value.
     *
     * @param cidr "a.b.c.d/len", "x:x::x/len" or a bare address (host prefix)
     * @param value Payload to store
     * @return Ok, BadAddress for unparsable text, NodeBusy if already registered
     * @complexity O(w)
     * @exception_safety Strong guarantee - on std::bad_alloc the nodes
     *                  created for the new path are released again
     */
    Status add_prefix(const std::string& cidr, V value);

    /**
     * @brief Register a prefix, replacing any existing value.
     *
     * @return Ok or BadAddress
     * @complexity O(w)
     */
    Status set_prefix(const std::string& cidr, V value);

    /**
     * @brief Remove the value of exactly this prefix.
     *
     * Longer prefixes registered below it stay in place.
     *
     * @return Ok, BadAddress, or NotFound if the prefix holds no value
     * @complexity O(w)
     */
    Status delete_prefix(const std::string& cidr);

    /**
     * @brief Remove this prefix and every longer prefix inside it.
     *
     * @return Ok, BadAddress, or NotFound if nothing is stored in the range
     * @complexity O(w + k) where k is the number of nodes removed
     */
    Status delete_range(const std::string& cidr);

    /**
     * @brief Longest-prefix match for an address or prefix.
     *
     * @param cidr Address to classify; with "/len" only the first len bits are considered
     * @param result Receives the value of the longest covering prefix, or std::nullopt
     * @return Ok (match or no match) or BadAddress
     * @complexity O(w)
     */
    Status lookup(const std::string& cidr, std::optional<V>& result) const;

    /**
     * @brief Byte-level insert.
     *
     * @param key Address bytes, most significant first
     * @param mask Contiguous mask of the same width; its leading set bits give the prefix length
     * @param value Payload to store
     * @param overwrite Replace an existing value instead of failing with NodeBusy
     * @return Ok, BadAddress on width mismatch, NodeBusy on conflict
     */
    Status insert(const AddressBytes& key, const AddressBytes& mask, V value, bool overwrite);

    /**
     * @brief Byte-level delete.
     *
     * @param whole_range Drop the whole subtree instead of only this prefix's value
     * @return Ok, BadAddress on width mismatch, NotFound if absent
     */
    Status remove(const AddressBytes& key, const AddressBytes& mask, bool whole_range);

    /**
     * @brief Byte-level longest-prefix match.
     *
     * @param mask Bounds how many leading bits of key take part in the walk
     * @return Ok with result set or cleared, BadAddress on width mismatch
     */
    Status find(const AddressBytes& key, const AddressBytes& mask, std::optional<V>& result) const;

    /// Number of registered prefixes.
    size_t size() const { return size_; }

    bool empty() const { return size_ == 0; }

    /// Nodes currently in the tree, root included.
    size_t node_count() const { return pool_.live(); }

    /// Node slots reserved so far; never shrinks.
    size_t capacity() const { return pool_.capacity(); }

    /// Recycled nodes ready for reuse.
    size_t free_nodes() const { return pool_.free_count(); }
};

// Implementation

template<typename V>
RadixTree<V>::RadixTree(size_t preallocate)
    : pool_(preallocate), root_(NIL_NODE), size_(0) {
    root_ = pool_.allocate();
}

template<typename V>
RadixTree<V>::RadixTree(RadixTree&& other)
    : RadixTree() {
    swap(other);
}

template<typename V>
RadixTree<V>& RadixTree<V>::operator=(RadixTree&& other) {
    if (this != &other) {
        RadixTree taken;
        taken.swap(other);
        swap(taken);
    }
    return *this;
}

template<typename V>
void RadixTree<V>::swap(RadixTree& other) noexcept {
    pool_.swap(other.pool_);
    std::swap(root_, other.root_);
    std::swap(size_, other.size_);
}

template<typename V>
Status RadixTree<V>::add_prefix(const std::string& cidr, V value) {
    AddressBytes key, mask;
    Status status = parse_prefix(cidr, key, mask);
    if (status != Status::Ok) {
        return status;
    }
    return insert(key, mask, std::move(value), false);
}

template<typename V>
Status RadixTree<V>::set_prefix(const std::string& cidr, V value) {
    AddressBytes key, mask;
    Status status = parse_prefix(cidr, key, mask);
    if (status != Status::Ok) {
        return status;
    }
    return insert(key, mask, std::move(value), true);
}

template<typename V>
Status RadixTree<V>::delete_prefix(const std::string& cidr) {
    AddressBytes key, mask;
    Status status = parse_prefix(cidr, key, mask);
    if (status != Status::Ok) {
        return status;
    }
    return remove(key, mask, false);
}

template<typename V>
Status RadixTree<V>::delete_range(const std::string& cidr) {
    AddressBytes key, mask;
    Status status = parse_prefix(cidr, key, mask);
    if (status != Status::Ok) {
        return status;
    }
    return remove(key, mask, true);
}

template<typename V>
Status RadixTree<V>::lookup(const std::string& cidr, std::optional<V>& result) const {
    AddressBytes key, mask;
    Status status = parse_prefix(cidr, key, mask);
    if (status != Status::Ok) {
        return status;
    }
    return find(key, mask, result);
}

template<typename V>
Status RadixTree<V>::insert(const AddressBytes& key, const AddressBytes& mask, V value, bool overwrite) {
    size_t bits = 0;
    if (!walk_length(key, mask, bits)) {
        return Status::BadAddress;
    }

    // Follow the existing path as far as it goes
    NodeHandle node = root_;
    size_t depth = 0;
    for (; depth < bits; ++depth) {
        const Node& current = pool_[node];
        NodeHandle next = bit_at(key, depth) ? current.right : current.left;
        if (next == NIL_NODE) {
            break;
        }
        node = next;
    }

    if (depth == bits) {
        Node& target = pool_[node];
        if (target.value) {
            if (!overwrite) {
                return Status::NodeBusy;
            }
        } else {
            ++size_;
        }
        target.value = std::move(value);
        return Status::Ok;
    }

    // Grow the missing tail; a fresh leaf can never be busy
    try {
        for (; depth < bits; ++depth) {
            NodeHandle next = pool_.allocate();
            pool_[next].parent = node;
            if (bit_at(key, depth)) {
                pool_[node].right = next;
            } else {
                pool_[node].left = next;
            }
            node = next;
        }
    } catch (const std::exception&) {
        // drop the valueless tail linked so far
        prune(node);
        throw;
    }
    pool_[node].value = std::move(value);
    ++size_;
    return Status::Ok;
}

template<typename V>
Status RadixTree<V>::remove(const AddressBytes& key, const AddressBytes& mask, bool whole_range) {
    size_t bits = 0;
    if (!walk_length(key, mask, bits)) {
        return Status::BadAddress;
    }

    NodeHandle node = descend(key, bits);
    if (node == NIL_NODE) {
        return Status::NotFound;
    }

    Node& target = pool_[node];
    if (!whole_range) {
        if (!target.value) {
            return Status::NotFound;
        }
        target.value.reset();
        --size_;
        if (target.has_children()) {
            // keep structure for longer prefixes
            return Status::Ok;
        }
    } else {
        if (!target.value && !target.has_children()) {
            return Status::NotFound;   // only the bare root can look like this
        }
        size_t dropped = 0;
        if (target.left != NIL_NODE) {
            dropped += release_recursive(target.left);
            target.left = NIL_NODE;
        }
        if (target.right != NIL_NODE) {
            dropped += release_recursive(target.right);
            target.right = NIL_NODE;
        }
        if (target.value) {
            target.value.reset();
            ++dropped;
        }
        size_ -= dropped;
    }

    prune(node);
    return Status::Ok;
}

template<typename V>
Status RadixTree<V>::find(const AddressBytes& key, const AddressBytes& mask, std::optional<V>& result) const {
    size_t bits = 0;
    if (!walk_length(key, mask, bits)) {
        return Status::BadAddress;
    }

    const Node* best = nullptr;
    NodeHandle node = root_;
    for (size_t depth = 0; ; ++depth) {
        const Node& current = pool_[node];
        if (current.value) {
            best = &current;
        }
        if (depth == bits) {
            break;
        }
        node = bit_at(key, depth) ? current.right : current.left;
        if (node == NIL_NODE) {
            break;
        }
    }

    if (best) {
        result = *best->value;
    } else {
        result.reset();
    }
    return Status::Ok;
}

template<typename V>
NodeHandle RadixTree<V>::descend(const AddressBytes& key, size_t bits) const {
    NodeHandle node = root_;
    for (size_t depth = 0; depth < bits && node != NIL_NODE; ++depth) {
        const Node& current = pool_[node];
        node = bit_at(key, depth) ? current.right : current.left;
    }
    return node;
}

template<typename V>
size_t RadixTree<V>::release_recursive(NodeHandle handle) {
    Node& node = pool_[handle];
    size_t dropped = node.value ? 1 : 0;
    if (node.left != NIL_NODE) {
        dropped += release_recursive(node.left);
    }
    if (node.right != NIL_NODE) {
        dropped += release_recursive(node.right);
    }
    pool_.recycle(handle);
    return dropped;
}

template<typename V>
void RadixTree<V>::prune(NodeHandle handle) {
    while (handle != root_) {
        Node& node = pool_[handle];
        if (node.value || node.has_children()) {
            break;
        }
        NodeHandle parent = node.parent;
        Node& up = pool_[parent];
        if (up.right == handle) {
            up.right = NIL_NODE;
        } else {
            up.left = NIL_NODE;
        }
        // reserve this node for future use
        pool_.recycle(handle);
        handle = parent;
    }
}

} // namespace prefixtree

#undef PREFIXTREE_UNLIKELY
