// SPDX-License-Identifier: Apache-2.0
// catalog.hpp - Static reference data (boats, fish species, boat combinations) and weighted selection.
#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string_view>
#include <vector>

namespace reef::game {

inline constexpr uint32_t kStarterBoatId = 0;

struct BoatSpec
{
    uint32_t id;
    std::string_view key;
    std::string_view name;
    uint32_t cost;
};

struct FishSpecies
{
    uint32_t id;
    std::string_view name;
    uint32_t reward;
    float chance{1.0f}; // unnormalized spawn weight
};

// Three boat keys that unlock a rare species. Delivered to clients only; no server rule consumes it.
struct BoatCombination
{
    std::array<std::string_view, 3> combo;
    std::string_view result;
};

const std::vector<BoatSpec> &boat_catalog();
const std::vector<FishSpecies> &fish_table();
const std::vector<BoatCombination> &combination_table();

// nullptr when the id is not in the catalog
const BoatSpec *find_boat(uint32_t id);
const FishSpecies *find_species(uint32_t id);

// Weighted random selection. Draws r in [0, total) and returns the first item whose running
// weight sum reaches r; falls back to the first item when floating point drift prevents a match.
// items must not be empty.
template <typename T, typename WeightFn>
const T &weighted_pick(const std::vector<T> &items, std::mt19937 &rng, WeightFn &&weight)
{
    double total = 0.0;
    for (const auto &it : items)
        total += static_cast<double>(weight(it));
    std::uniform_real_distribution<double> dist(0.0, total);
    double r = dist(rng);
    double acc = 0.0;
    for (const auto &it : items) {
        acc += static_cast<double>(weight(it));
        if (r <= acc)
            return it;
    }
    return items.front();
}

inline const FishSpecies &pick_species(const std::vector<FishSpecies> &table, std::mt19937 &rng)
{
    return weighted_pick(table, rng, [](const FishSpecies &s) { return s.chance; });
}

} // namespace reef::game
