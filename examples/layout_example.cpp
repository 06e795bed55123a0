/**
 * @file layout_example.cpp
 * @brief Example: laying out a negotiation header for three recipients
 */

#include <iostream>
#include <string>
#include <vector>
#include "../src/core/include/nego_writer.hpp"
#include "../src/core/include/nego_errors.hpp"

using namespace nego;

int main() {
    std::cout << "=== Negotiation Header Layout Example ===\n\n";

    auto registry = SuiteRegistry::with_standard_suites();
    auto x25519 = registry.find("x25519-elligator2-chacha20");
    auto x448   = registry.find("x448-elligator2-shake256");
    auto k1     = registry.find("secp256k1-ellswift-sha256");

    // Every suite standardizes its level bound for the number of
    // suites it expects to coexist with
    int levels = recommended_levels(8);
    std::vector<SuiteLevel> suites = {
        {x25519, levels},
        {x448, levels},
        {k1, levels},
    };

    SodiumRandom rng;
    std::vector<Entry> entries = {
        {x25519, rng.bytes(32), {}},
        {x25519, rng.bytes(32), {}},
        {x448,   rng.bytes(56), {}},
        {k1,     rng.bytes(33), {}},
    };

    std::cout << "1. Computing layout (levels " << levels << ", 4 entries)...\n";
    Writer writer;
    try {
        writer.init(suites, 48, entries);
    } catch (const PlacementExhausted& e) {
        std::cout << "   ✗ " << e.what() << "\n";
        return 1;
    }

    std::cout << "   ✓ Header length: " << writer.header_length() << " bytes\n\n";

    std::cout << "2. Point positions:\n";
    for (const auto& p : writer.layout().placements) {
        std::cout << "   - " << p.suite->name() << ": level " << p.level
                  << ", bytes [" << p.offset << ", " << p.end() << ")\n";
    }

    std::cout << "\n3. Suites in use: " << writer.suites_in_use().size() << "\n";
    return 0;
}
