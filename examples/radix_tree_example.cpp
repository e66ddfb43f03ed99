#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "prefixtree/radix_tree.hpp"

using namespace prefixtree;

namespace {

void route(const RadixTree<std::string>& table, const std::string& address) {
    std::optional<std::string> hop;
    Status status = table.lookup(address, hop);
    if (status != Status::Ok) {
        std::cout << "  " << address << " -> error: " << to_string(status) << "\n";
    } else if (hop) {
        std::cout << "  " << address << " -> " << *hop << "\n";
    } else {
        std::cout << "  " << address << " -> unreachable\n";
    }
}

} // namespace

int main() {
    RadixTree<std::string> table;

    std::cout << "Routing Table Example\n";
    std::cout << "=====================\n\n";

    const std::vector<std::pair<std::string, std::string>> routes = {
        {"0.0.0.0/0",        "upstream (default)"},
        {"10.0.0.0/8",       "core"},
        {"10.1.0.0/16",      "lab"},
        {"10.1.42.0/24",     "lab-storage"},
        {"192.168.0.0/16",   "office"},
        {"2001:db8::/32",    "v6-core"},
        {"2001:db8:beef::/48", "v6-lab"},
    };

    for (const auto& entry : routes) {
        Status status = table.add_prefix(entry.first, entry.second);
        if (status != Status::Ok) {
            std::cerr << "Failed to add " << entry.first << ": " << to_string(status) << "\n";
            return 1;
        }
    }
    std::cout << "Loaded " << table.size() << " routes using " << table.node_count() << " nodes\n\n";

    const std::vector<std::string> probes = {
        "10.1.42.7", "10.1.7.7", "10.200.0.1", "8.8.8.8",
        "2001:db8:beef::1", "2001:db8:1::1", "2001:dead::1", "not-an-ip",
    };

    std::cout << "Lookups:\n";
    for (const auto& probe : probes) {
        route(table, probe);
    }

    std::cout << "\nConflicting add: "
              << to_string(table.add_prefix("10.0.0.0/8", "other")) << "\n";
    std::cout << "Upsert:           "
              << to_string(table.set_prefix("10.0.0.0/8", "core-v2")) << "\n";

    std::cout << "\nDropping 10.1.0.0/16 (exact) keeps 10.1.42.0/24:\n";
    std::cout << "  status: " << to_string(table.delete_prefix("10.1.0.0/16")) << "\n";
    route(table, "10.1.42.7");
    route(table, "10.1.7.7");

    std::cout << "\nDropping 10.0.0.0/8 (whole range):\n";
    std::cout << "  status: " << to_string(table.delete_range("10.0.0.0/8")) << "\n";
    route(table, "10.1.42.7");
    route(table, "10.200.0.1");

    std::cout << "\n" << table.size() << " routes left, "
              << table.node_count() << " nodes live, "
              << table.free_nodes() << " nodes ready for reuse\n";

    return 0;
}
