#include <iostream>
#include <cassert>
#include <vector>
#include <set>
#include <memory>
#include <stdexcept>
#include <string>
#include "prefixtree/node_pool.hpp"

using namespace prefixtree;

void test_basic_allocation() {
    std::cout << "Testing basic allocation... ";

    NodePool<int> pool;
    assert(pool.capacity() == 0);
    assert(pool.live() == 0);
    assert(pool.chunk_count() == 0);

    NodeHandle a = pool.allocate();
    NodeHandle b = pool.allocate();
    assert(a != b);
    assert(a != NIL_NODE && b != NIL_NODE);
    assert(pool.live() == 2);
    assert(pool.chunk_count() == 1);
    assert(pool.capacity() == NodePool<int>::MIN_CHUNK_SIZE);

    // Fresh nodes carry no links and no value
    assert(pool[a].left == NIL_NODE);
    assert(pool[a].right == NIL_NODE);
    assert(pool[a].parent == NIL_NODE);
    assert(!pool[a].value);
    assert(!pool[a].has_children());

    pool[a].value = 7;
    pool[a].left = b;
    pool[b].parent = a;
    assert(pool[a].has_children());
    assert(*pool[a].value == 7);
    assert(pool[b].parent == a);

    std::cout << "✓\n";
}

void test_free_list_reuse() {
    std::cout << "Testing free list reuse... ";

    NodePool<std::string> pool;
    NodeHandle a = pool.allocate();
    NodeHandle b = pool.allocate();
    NodeHandle c = pool.allocate();

    pool[b].value = "payload";
    pool[b].left = a;
    pool[b].right = c;
    pool[b].parent = a;

    pool.recycle(b);
    assert(pool.live() == 2);
    assert(pool.free_count() == 1);

    // Most recently recycled node comes back first, fully cleared
    NodeHandle reused = pool.allocate();
    assert(reused == b);
    assert(pool.free_count() == 0);
    assert(!pool[reused].value);
    assert(pool[reused].left == NIL_NODE);
    assert(pool[reused].right == NIL_NODE);
    assert(pool[reused].parent == NIL_NODE);

    // LIFO order across several recycled nodes
    pool.recycle(a);
    pool.recycle(c);
    assert(pool.allocate() == c);
    assert(pool.allocate() == a);
    assert(pool.live() == 3);

    std::cout << "✓\n";
}

void test_chunk_growth() {
    std::cout << "Testing chunk growth... ";

    NodePool<int> pool;
    const size_t first = NodePool<int>::MIN_CHUNK_SIZE;

    for (size_t i = 0; i < first; ++i) {
        pool.allocate();
    }
    assert(pool.chunk_count() == 1);
    assert(pool.capacity() == first);

    // Next chunk doubles the previous one
    pool.allocate();
    assert(pool.chunk_count() == 2);
    assert(pool.capacity() == first + 2 * first);

    for (size_t i = 1; i < 2 * first; ++i) {
        pool.allocate();
    }
    assert(pool.chunk_count() == 2);
    pool.allocate();
    assert(pool.chunk_count() == 3);
    assert(pool.capacity() == first + 2 * first + 4 * first);
    assert(pool.live() == first + 2 * first + 1);

    std::cout << "✓\n";
}

void test_preallocation_hint() {
    std::cout << "Testing preallocation hint... ";

    NodePool<int> pool(5000);
    assert(pool.capacity() == 0);
    pool.allocate();
    assert(pool.capacity() == 5000);

    for (int i = 1; i < 5000; ++i) {
        pool.allocate();
    }
    assert(pool.chunk_count() == 1);
    pool.allocate();
    assert(pool.chunk_count() == 2);
    assert(pool.capacity() == 15000);

    // Hints below the minimum are rounded up
    NodePool<int> small(3);
    small.allocate();
    assert(small.capacity() == NodePool<int>::MIN_CHUNK_SIZE);

    std::cout << "✓\n";
}

void test_address_stability() {
    std::cout << "Testing address stability... ";

    NodePool<int> pool;
    std::vector<NodeHandle> handles;
    std::vector<const RadixNode<int>*> addresses;

    for (int i = 0; i < 100; ++i) {
        NodeHandle h = pool.allocate();
        pool[h].value = i;
        handles.push_back(h);
        addresses.push_back(&pool[h]);
    }

    // Force several new chunks
    for (int i = 0; i < 10000; ++i) {
        pool.allocate();
    }
    assert(pool.chunk_count() > 3);

    for (size_t i = 0; i < handles.size(); ++i) {
        assert(&pool[handles[i]] == addresses[i]);
        assert(*pool[handles[i]].value == static_cast<int>(i));
    }

    std::cout << "✓\n";
}

void test_payload_released_on_recycle() {
    std::cout << "Testing payload release on recycle... ";

    auto shared = std::make_shared<int>(42);
    NodePool<std::shared_ptr<int>> pool;

    NodeHandle h = pool.allocate();
    pool[h].value = shared;
    assert(shared.use_count() == 2);

    pool.recycle(h);
    assert(shared.use_count() == 1);

    std::cout << "✓\n";
}

void test_churn_does_not_grow() {
    std::cout << "Testing churn without growth... ";

    NodePool<int> pool;
    constexpr int batch = 3000;
    std::vector<NodeHandle> handles;

    for (int i = 0; i < batch; ++i) {
        handles.push_back(pool.allocate());
    }
    const size_t high_water = pool.capacity();

    for (int round = 0; round < 10; ++round) {
        for (NodeHandle h : handles) {
            pool.recycle(h);
        }
        assert(pool.live() == 0);
        assert(pool.free_count() == static_cast<size_t>(batch));

        std::set<NodeHandle> seen;
        for (auto& h : handles) {
            h = pool.allocate();
            seen.insert(h);
        }
        assert(seen.size() == static_cast<size_t>(batch));
        assert(pool.capacity() == high_water);
    }

    std::cout << "✓\n";
}

void test_move_semantics() {
    std::cout << "Testing move semantics... ";

    NodePool<int> pool;
    NodeHandle h = pool.allocate();
    pool[h].value = 99;
    const RadixNode<int>* address = &pool[h];

    NodeHandle spare = pool.allocate();
    pool.recycle(spare);

    NodePool<int> moved(std::move(pool));
    assert(moved.live() == 1);
    assert(moved.free_count() == 1);
    assert(&moved[h] == address);
    assert(*moved[h].value == 99);

    // Source is back to a fresh pool and usable again
    assert(pool.live() == 0);
    assert(pool.free_count() == 0);
    assert(pool.capacity() == 0);
    assert(pool.chunk_count() == 0);
    NodeHandle again = pool.allocate();
    assert(again == 0);
    assert(!pool[again].value);
    assert(pool.capacity() == NodePool<int>::MIN_CHUNK_SIZE);

    // Move assignment drops the target's own storage
    NodePool<int> target;
    for (int i = 0; i < 10; ++i) {
        target.allocate();
    }
    target = std::move(moved);
    assert(target.live() == 1);
    assert(target.free_count() == 1);
    assert(*target[h].value == 99);
    assert(target.allocate() == spare);
    assert(moved.live() == 0);
    assert(moved.chunk_count() == 0);

    std::cout << "✓\n";
}

int main() {
    std::cout << "NodePool Test Suite\n";
    std::cout << "===================\n\n";

    try {
        test_basic_allocation();
        test_free_list_reuse();
        test_chunk_growth();
        test_preallocation_hint();
        test_address_stability();
        test_payload_released_on_recycle();
        test_churn_does_not_grow();
        test_move_semantics();

        std::cout << "\n✅ All tests passed!\n";

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
