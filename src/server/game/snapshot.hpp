// SPDX-License-Identifier: Apache-2.0
// snapshot.hpp - Registry -> protobuf conversion for the per-tick state and the welcome payload.
#pragma once

#include "reef.pb.h"
#include "server/game/catalog.hpp"
#include "server/game/world.hpp"

#include <string>

namespace reef::game {

void fill_player(const Player &p, reef::PlayerState *out);
void fill_fish(const Fish &f, reef::FishState *out);
void fill_bullet(const Bullet &b, reef::BulletState *out);
void fill_boat(const BoatSpec &b, reef::BoatInfo *out);

// Full snapshot of every collection (no delta). Caller holds world.mutex.
void fill_state(const World &world, reef::WorldState *out);

// One-time payload for a newly active session: its id, static reference data and identity.
// username == nullptr for guests.
void fill_welcome(const WorldConfig &cfg, const std::string &session_id, const std::string *username, reef::Welcome *out);

} // namespace reef::game
