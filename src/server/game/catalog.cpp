// SPDX-License-Identifier: Apache-2.0
#include "server/game/catalog.hpp"

#include <algorithm>

namespace reef::game {

const std::vector<BoatSpec> &boat_catalog()
{
    static const std::vector<BoatSpec> boats{
        {0, "boat", "Wooden Boat", 0},
        {1, "skiff", "Skiff", 300},
        {2, "speedboat", "Speedboat", 700},
        {3, "sailboat", "Sailboat", 1200},
        {4, "fishing_v", "Fishing Vessel", 1500},
        {5, "large_fishing", "Large Fishing Vessel", 4000},
        {6, "ambush", "Ambush", 2200},
        {7, "yacht", "Yacht", 8000},
        {8, "dredger", "Dredger", 10000},
        {9, "icecruiser", "Ice Cruiser", 9000},
        {10, "exhibit", "Naval Exhibit", 12000},
        {11, "research", "Research Center", 15000},
        {12, "sub_basic", "Submarine", 50000},
    };
    return boats;
}

const std::vector<FishSpecies> &fish_table()
{
    static const std::vector<FishSpecies> fish{
        {0, "Small Fish", 8, 10.0f},
        {1, "Common Fish", 12, 10.0f},
        {2, "Large Fish", 18, 8.0f},
        {3, "Piranha", 22, 6.0f},
        {4, "Mackerel", 28, 5.0f},
        {5, "Small Shark", 40, 4.0f},
        {6, "Horn Flower", 55, 2.5f},
        {7, "Japanese Spider", 60, 1.8f},
        {8, "Chinese Spider", 65, 0.6f},
        {9, "Marlin", 80, 1.5f},
        {10, "Small Whale", 180, 0.5f},
        {11, "Great Whale", 350, 0.2f},
    };
    return fish;
}

const std::vector<BoatCombination> &combination_table()
{
    static const std::vector<BoatCombination> combos{
        {{"ambush", "ambush", "skiff"}, "Japanese Spider"},
        {{"dredger", "fishing_v", "boat"}, "Horn Flower"},
    };
    return combos;
}

const BoatSpec *find_boat(uint32_t id)
{
    const auto &boats = boat_catalog();
    auto it = std::find_if(boats.begin(), boats.end(), [id](const BoatSpec &b) { return b.id == id; });
    return it == boats.end() ? nullptr : &*it;
}

const FishSpecies *find_species(uint32_t id)
{
    const auto &fish = fish_table();
    auto it = std::find_if(fish.begin(), fish.end(), [id](const FishSpecies &f) { return f.id == id; });
    return it == fish.end() ? nullptr : &*it;
}

} // namespace reef::game
