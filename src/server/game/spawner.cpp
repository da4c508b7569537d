// SPDX-License-Identifier: Apache-2.0
#include "server/game/spawner.hpp"

#include "common/metrics.hpp"

namespace reef::game {

const Fish &spawn_fish(World &world, const std::vector<FishSpecies> &table)
{
    const FishSpecies &species = pick_species(table, world.rng);
    std::uniform_real_distribution<float> ux(0.f, world.cfg.width);
    std::uniform_real_distribution<float> uy(0.f, world.cfg.height * 0.6f);
    FishSpawn spec{};
    spec.pos = {ux(world.rng), uy(world.rng) + 50.f};
    spec.type = species.id;
    spec.reward = species.reward;
    spec.ttl_ms = world.cfg.fish_ttl_ms;
    const Fish &fish = world.registry.create_fish(spec);
    auto &rt = reef::metrics::runtime();
    rt.fish_spawned.fetch_add(1, std::memory_order_relaxed);
    rt.fish_active.store(world.registry.fishes().size(), std::memory_order_relaxed);
    return fish;
}

} // namespace reef::game
