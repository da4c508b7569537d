// SPDX-License-Identifier: Apache-2.0
#include "server/game/catalog.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <map>

using namespace reef::game;

int main()
{
    const auto &table = fish_table();
    assert(table.size() == 12);
    double total = 0.0;
    for (const auto &s : table)
        total += s.chance;

    std::mt19937 rng{4242};
    constexpr int kDraws = 100000;
    std::map<uint32_t, int> counts;
    for (int i = 0; i < kDraws; ++i)
        counts[pick_species(table, rng).id]++;
    for (const auto &s : table) {
        double expected = s.chance / total;
        double observed = static_cast<double>(counts[s.id]) / kDraws;
        if (std::fabs(observed - expected) > 0.01) {
            std::cerr << "species " << s.id << " expected " << expected << " observed " << observed << std::endl;
            assert(false);
        }
    }

    // Entries without an explicit chance weigh 1.
    std::vector<FishSpecies> even{{0, "a", 1}, {1, "b", 1}};
    assert(even[0].chance == 1.0f);
    std::map<uint32_t, int> even_counts;
    for (int i = 0; i < 20000; ++i)
        even_counts[pick_species(even, rng).id]++;
    assert(std::abs(even_counts[0] - even_counts[1]) < 1000);

    // A single entry is always chosen.
    std::vector<FishSpecies> one{{7, "only", 9, 0.2f}};
    for (int i = 0; i < 100; ++i)
        assert(pick_species(one, rng).id == 7);

    // Catalog lookups.
    assert(find_boat(0) && find_boat(0)->cost == 0);
    assert(find_boat(12) != nullptr);
    assert(find_boat(13) == nullptr);
    assert(find_species(11) && find_species(99) == nullptr);
    assert(combination_table().size() == 2);
    std::cout << "unit_weighted_spawn OK" << std::endl;
    return 0;
}
