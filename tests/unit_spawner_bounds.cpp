// SPDX-License-Identifier: Apache-2.0
#include "server/game/catalog.hpp"
#include "server/game/spawner.hpp"

#include <cassert>
#include <iostream>

using namespace reef::game;

int main()
{
    WorldConfig cfg;
    cfg.rng_seed = 7;
    World world{cfg};
    for (int i = 0; i < 2000; ++i) {
        const Fish &f = spawn_fish(world);
        assert(f.pos.x >= 0.f && f.pos.x <= cfg.width);
        assert(f.pos.y >= 50.f && f.pos.y <= cfg.height * 0.6f + 50.f);
        assert(f.ttl_ms == cfg.fish_ttl_ms);
        const FishSpecies *sp = find_species(f.type);
        assert(sp && sp->reward == f.reward);
    }
    assert(world.registry.fishes().size() == 2000);
    // Ascending, unique ids.
    auto fishes = world.registry.fishes();
    for (size_t i = 1; i < fishes.size(); ++i)
        assert(fishes[i].id > fishes[i - 1].id);

    // Custom table: reward is copied at spawn time.
    std::vector<FishSpecies> table{{5, "test", 77}};
    const Fish &f = spawn_fish(world, table);
    assert(f.type == 5 && f.reward == 77);
    std::cout << "unit_spawner_bounds OK" << std::endl;
    return 0;
}
