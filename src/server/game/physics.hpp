// SPDX-License-Identifier: Apache-2.0
// physics.hpp - Per-tick bullet/fish integration, bullet-vs-player hits and ttl expiry.
#pragma once

#include "server/game/world.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace reef::game {

struct HitEvent
{
    uint32_t bullet_id;
    std::string owner;
    std::string victim;
    uint32_t hp_after;
};

struct TickSummary
{
    std::vector<HitEvent> hits;
    size_t bullets_expired{0};
    size_t fish_expired{0};
};

// Bullets: integrate, age, damage every non-owner player within hit_radius (the scan does not
// stop at the first hit, so one bullet can damage several players in the same tick), then
// remove bullets whose ttl reached zero. A hit forces ttl to zero.
void step_bullets(World &world, TickSummary &summary);

// Fish: age, apply horizontal jitter, clamp x to [margin, width - margin], remove expired.
void step_fish(World &world, TickSummary &summary);

// One resolver pass in the fixed order bullets then fish. Caller holds world.mutex.
TickSummary resolve_tick(World &world);

} // namespace reef::game
