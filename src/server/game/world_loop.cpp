// SPDX-License-Identifier: Apache-2.0
#include "server/game/world_loop.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/snapshot.hpp"
#include "server/game/spawner.hpp"

#include <chrono>

namespace reef::game {

TickSummary tick_once(World &world, session::SessionManager &sessions)
{
    auto msg = std::make_shared<reef::ServerMessage>();
    TickSummary summary;
    {
        std::scoped_lock lk{world.mutex};
        summary = resolve_tick(world);
        world.tick++;
        fill_state(world, msg->mutable_state());
    }
    // Serialization and fan-out run outside the world lock.
    size_t receivers = sessions.broadcast(msg);
    auto &rt = reef::metrics::runtime();
    rt.state_broadcasts.fetch_add(1, std::memory_order_relaxed);
    rt.state_bytes.fetch_add(msg->ByteSizeLong() * receivers, std::memory_order_relaxed);
    return summary;
}

void spawn_once(World &world)
{
    std::scoped_lock lk{world.mutex};
    const Fish &f = spawn_fish(world);
    reef::log::debug("[spawner] fish id={} type={} reward={} at ({}, {})", f.id, f.type, f.reward, f.pos.x, f.pos.y);
}

coro::task<void> run_tick_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<World> world,
    std::shared_ptr<session::SessionManager> sessions)
{
    co_await scheduler->schedule();
    using clock = std::chrono::steady_clock;
    const auto tick_interval = std::chrono::milliseconds(world->cfg.tick_ms);
    reef::log::info("[tick] loop start interval={}ms", world->cfg.tick_ms);
    auto next = clock::now();
    while (world->running.load()) {
        auto now = clock::now();
        if (now < next) {
            co_await scheduler->yield_for(next - now);
            continue;
        }
        next += tick_interval;
        // Falling more than a full interval behind resyncs instead of bursting catch-up ticks.
        if (now - next > tick_interval)
            next = now + tick_interval;
        auto tick_start = clock::now();
        auto summary = tick_once(*world, *sessions);
        auto dur = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - tick_start).count();
        reef::metrics::add_tick_duration(static_cast<uint64_t>(dur));
        REEF_LOG_EVERY_N(
            debug,
            150,
            "[tick] hits={} bullets_expired={} fish_expired={} tick_ns={}",
            summary.hits.size(),
            summary.bullets_expired,
            summary.fish_expired,
            dur);
    }
    reef::log::info("[tick] loop stopped");
    co_return;
}

coro::task<void> run_spawner(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<World> world)
{
    co_await scheduler->schedule();
    const auto period = std::chrono::milliseconds(world->cfg.spawn_interval_ms);
    reef::log::info("[spawner] start period={}ms", world->cfg.spawn_interval_ms);
    while (world->running.load()) {
        co_await scheduler->yield_for(period);
        if (!world->running.load())
            break;
        spawn_once(*world);
    }
    reef::log::info("[spawner] stopped");
    co_return;
}

} // namespace reef::game
