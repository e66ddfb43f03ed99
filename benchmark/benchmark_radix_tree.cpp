#include <iostream>
#include <iomanip>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include "prefixtree/radix_tree.hpp"

using namespace prefixtree;

// Hash-per-length table for comparison: one exact-match map per IPv4 prefix
// length, probed from /32 down to /0.
class HashPrefixTable {
private:
    std::vector<std::unordered_map<uint32_t, int>> tables_;

    static uint32_t network_of(uint32_t address, int length) {
        return length == 0 ? 0 : address & (0xFFFFFFFFu << (32 - length));
    }

public:
    HashPrefixTable() : tables_(33) {}

    bool insert(uint32_t network, int length, int value) {
        return tables_[length].emplace(network_of(network, length), value).second;
    }

    std::optional<int> lookup(uint32_t address) const {
        for (int length = 32; length >= 0; --length) {
            const auto& table = tables_[length];
            if (table.empty()) {
                continue;
            }
            auto it = table.find(network_of(address, length));
            if (it != table.end()) {
                return it->second;
            }
        }
        return std::nullopt;
    }
};

namespace {

std::string ipv4_text(uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "." +
           std::to_string((address >> 16) & 0xFF) + "." +
           std::to_string((address >> 8) & 0xFF) + "." +
           std::to_string(address & 0xFF);
}

void report(const std::string& label, size_t operations, std::chrono::microseconds duration) {
    double throughput = duration.count() > 0
        ? (operations * 1000000.0) / duration.count()
        : 0.0;
    std::cout << "  " << std::left << std::setw(28) << label
              << std::right << std::setw(10) << duration.count() << " μs"
              << std::setw(14) << static_cast<long>(throughput) << " ops/sec\n";
}

} // namespace

void benchmark_dense_slash24() {
    std::cout << "=== 1,000,000 x /24 table, single address lookup ===\n\n";

    constexpr int side = 100;
    RadixTree<int> tree;
    HashPrefixTable table;

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < side; ++i) {
        for (int j = 0; j < side; ++j) {
            for (int k = 0; k < side; ++k) {
                std::string cidr = std::to_string(i) + "." + std::to_string(j) + "." +
                                   std::to_string(k) + ".0/24";
                if (tree.add_prefix(cidr, 1337) != Status::Ok) {
                    std::cerr << "insert failed for " << cidr << "\n";
                    return;
                }
            }
        }
    }
    auto end = std::chrono::high_resolution_clock::now();
    report("RadixTree add_prefix", side * side * side,
           std::chrono::duration_cast<std::chrono::microseconds>(end - start));

    for (uint32_t i = 0; i < side; ++i) {
        for (uint32_t j = 0; j < side; ++j) {
            for (uint32_t k = 0; k < side; ++k) {
                table.insert((i << 24) | (j << 16) | (k << 8), 24, 1337);
            }
        }
    }

    std::cout << "  nodes: " << tree.node_count() << ", slots: " << tree.capacity() << "\n";

    constexpr int lookups = 1000000;
    std::optional<int> result;

    start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < lookups; ++i) {
        if (tree.lookup("73.26.28.24", result) != Status::Ok || !result) {
            std::cerr << "error occurred in lookup\n";
            return;
        }
    }
    end = std::chrono::high_resolution_clock::now();
    report("RadixTree lookup (text)", lookups,
           std::chrono::duration_cast<std::chrono::microseconds>(end - start));

    AddressBytes key, mask;
    if (parse_prefix("73.26.28.24", key, mask) != Status::Ok) {
        std::cerr << "parse failed\n";
        return;
    }
    start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < lookups; ++i) {
        if (tree.find(key, mask, result) != Status::Ok || !result) {
            std::cerr << "error occurred in find\n";
            return;
        }
    }
    end = std::chrono::high_resolution_clock::now();
    report("RadixTree find (bytes)", lookups,
           std::chrono::duration_cast<std::chrono::microseconds>(end - start));

    const uint32_t address = (73u << 24) | (26u << 16) | (28u << 8) | 24u;
    start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < lookups; ++i) {
        if (!table.lookup(address)) {
            std::cerr << "error occurred in hash lookup\n";
            return;
        }
    }
    end = std::chrono::high_resolution_clock::now();
    report("HashPrefixTable lookup", lookups,
           std::chrono::duration_cast<std::chrono::microseconds>(end - start));
    std::cout << "\n";
}

void benchmark_mixed_lengths() {
    std::cout << "=== Random prefixes /8../32, random lookups ===\n\n";

    constexpr int entries = 200000;
    constexpr int lookups = 500000;

    std::mt19937 gen(42);
    std::uniform_int_distribution<uint32_t> address_dist;
    std::uniform_int_distribution<int> length_dist(8, 32);

    RadixTree<int> tree;
    HashPrefixTable table;
    for (int i = 0; i < entries; ++i) {
        uint32_t network = address_dist(gen);
        int length = length_dist(gen);
        AddressBytes key, mask;
        if (parse_prefix(ipv4_text(network) + "/" + std::to_string(length), key, mask) != Status::Ok) {
            continue;
        }
        if (tree.insert(key, mask, i, true) != Status::Ok) {
            std::cerr << "insert failed\n";
            return;
        }
        table.insert(network, length, i);
    }

    std::vector<AddressBytes> keys;
    std::vector<uint32_t> raw;
    keys.reserve(lookups);
    raw.reserve(lookups);
    for (int i = 0; i < lookups; ++i) {
        uint32_t address = address_dist(gen);
        AddressBytes key, mask;
        if (parse_prefix(ipv4_text(address), key, mask) == Status::Ok) {
            keys.push_back(std::move(key));
            raw.push_back(address);
        }
    }

    size_t hits = 0;
    std::optional<int> result;
    auto start = std::chrono::high_resolution_clock::now();
    for (const auto& key : keys) {
        if (tree.find(key, full_mask(), result) == Status::Ok && result) {
            ++hits;
        }
    }
    auto end = std::chrono::high_resolution_clock::now();
    report("RadixTree find (bytes)", keys.size(),
           std::chrono::duration_cast<std::chrono::microseconds>(end - start));

    size_t hash_hits = 0;
    start = std::chrono::high_resolution_clock::now();
    for (uint32_t address : raw) {
        if (table.lookup(address)) {
            ++hash_hits;
        }
    }
    end = std::chrono::high_resolution_clock::now();
    report("HashPrefixTable lookup", raw.size(),
           std::chrono::duration_cast<std::chrono::microseconds>(end - start));

    std::cout << "  hits: " << hits << " / " << hash_hits << "\n\n";
}

void benchmark_churn() {
    std::cout << "=== Insert/delete churn ===\n\n";

    constexpr int batch = 50000;
    constexpr int rounds = 10;
    RadixTree<int> tree;
    size_t failures = 0;

    auto start = std::chrono::high_resolution_clock::now();
    for (int round = 0; round < rounds; ++round) {
        int octet = 10 + round % 2;
        for (int i = 0; i < batch; ++i) {
            std::string cidr = std::to_string(octet) + "." + std::to_string(i / 256) + "." +
                               std::to_string(i % 256) + ".0/24";
            if (tree.add_prefix(cidr, i) != Status::Ok) {
                ++failures;
            }
        }
        for (int i = 0; i < batch; ++i) {
            std::string cidr = std::to_string(octet) + "." + std::to_string(i / 256) + "." +
                               std::to_string(i % 256) + ".0/24";
            if (tree.delete_prefix(cidr) != Status::Ok) {
                ++failures;
            }
        }
        std::cout << "  round " << std::setw(2) << round
                  << ": slots " << tree.capacity()
                  << ", free " << tree.free_nodes() << "\n";
    }
    auto end = std::chrono::high_resolution_clock::now();
    report("add + delete", static_cast<size_t>(batch) * rounds * 2,
           std::chrono::duration_cast<std::chrono::microseconds>(end - start));
    if (failures > 0) {
        std::cerr << "  " << failures << " operations failed\n";
    }
    std::cout << "\n";
}

int main() {
    std::cout << "RadixTree Performance Benchmark\n";
    std::cout << "===============================\n\n";

    benchmark_dense_slash24();
    benchmark_mixed_lengths();
    benchmark_churn();

    return 0;
}
