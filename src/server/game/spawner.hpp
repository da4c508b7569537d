// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/catalog.hpp"
#include "server/game/world.hpp"

namespace reef::game {

// Materialize one fish picked from table by weight. Position is uniform over
// x in [0, W) and y in [50, 0.6H + 50). Caller holds world.mutex.
const Fish &spawn_fish(World &world, const std::vector<FishSpecies> &table = fish_table());

} // namespace reef::game
