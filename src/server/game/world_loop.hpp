// SPDX-License-Identifier: Apache-2.0
// world_loop.hpp - The two periodic tasks that drive the world: spawner and tick (resolve + broadcast).
#pragma once
#include "server/game/physics.hpp"
#include "server/game/world.hpp"
#include "server/session/session_manager.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <memory>

namespace reef::game {

// Resolve one tick under the world lock, then queue the full state to every active session.
TickSummary tick_once(World &world, session::SessionManager &sessions);

// Spawn one fish under the world lock.
void spawn_once(World &world);

// Fixed-rate loops; both exit once world->running is cleared.
coro::task<void> run_tick_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<World> world,
    std::shared_ptr<session::SessionManager> sessions);

coro::task<void> run_spawner(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<World> world);

} // namespace reef::game
