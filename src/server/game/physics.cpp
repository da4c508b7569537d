// SPDX-License-Identifier: Apache-2.0
#include "server/game/physics.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>

namespace reef::game {

void step_bullets(World &world, TickSummary &summary)
{
    const auto &cfg = world.cfg;
    auto players = world.registry.players();
    for (auto &b : world.registry.bullets()) {
        b.pos = b2Add(b.pos, b.vel);
        b.ttl_ms -= cfg.tick_ms;
        for (auto &p : players) {
            if (p.id == b.owner)
                continue;
            if (b2Distance(p.pos, b.pos) < cfg.hit_radius) {
                p.hp = p.hp > cfg.bullet_damage ? p.hp - cfg.bullet_damage : 0;
                b.ttl_ms = 0;
                summary.hits.push_back(HitEvent{b.id, b.owner, p.id, p.hp});
            }
        }
    }
    summary.bullets_expired = world.registry.remove_expired_bullets();
}

void step_fish(World &world, TickSummary &summary)
{
    const auto &cfg = world.cfg;
    std::uniform_real_distribution<float> jitter(-cfg.fish_jitter, cfg.fish_jitter);
    const float lo = cfg.fish_margin;
    const float hi = std::max(lo, cfg.width - cfg.fish_margin);
    for (auto &f : world.registry.fishes()) {
        f.ttl_ms -= cfg.tick_ms;
        f.pos.x = std::clamp(f.pos.x + jitter(world.rng), lo, hi);
    }
    summary.fish_expired = world.registry.remove_expired_fish();
}

TickSummary resolve_tick(World &world)
{
    TickSummary summary;
    step_bullets(world, summary);
    step_fish(world, summary);
    for (const auto &h : summary.hits) {
        reef::log::debug("[tick] hit bullet={} owner={} victim={} hp={}", h.bullet_id, h.owner, h.victim, h.hp_after);
    }
    auto &rt = reef::metrics::runtime();
    rt.bullet_hits.fetch_add(summary.hits.size(), std::memory_order_relaxed);
    rt.fish_expired.fetch_add(summary.fish_expired, std::memory_order_relaxed);
    rt.fish_active.store(world.registry.fishes().size(), std::memory_order_relaxed);
    rt.bullets_active.store(world.registry.bullets().size(), std::memory_order_relaxed);
    return summary;
}

} // namespace reef::game
