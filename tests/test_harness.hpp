// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/world.hpp"
#include "server/profile/profile_store.hpp"
#include "server/profile/progress_sync.hpp"
#include "server/session/gateway.hpp"
#include "server/session/session_manager.hpp"

#include <memory>
#include <string>
#include <vector>

namespace reef::test {

// In-process server stack without sockets: sessions are detached and replies are drained directly.
struct Harness
{
    explicit Harness(game::WorldConfig cfg = fixed_seed())
        : world(std::make_shared<game::World>(cfg)),
          sessions(std::make_shared<session::SessionManager>()),
          store(std::make_shared<profile::MemoryProfileStore>()),
          progress(std::make_shared<profile::ProgressSync>(store)),
          gateway(std::make_shared<session::Gateway>(world, sessions, store, progress))
    {}

    static game::WorldConfig fixed_seed()
    {
        game::WorldConfig cfg;
        cfg.rng_seed = 12345;
        return cfg;
    }

    // New detached session after hello; its welcome is already drained.
    std::shared_ptr<session::Session> join(const std::string &token = "")
    {
        auto s = sessions->add_detached();
        gateway->hello(s, token);
        sessions->drain_messages(s);
        return s;
    }

    game::Player &player(const std::shared_ptr<session::Session> &s)
    {
        auto *p = world->registry.find_player(s->id);
        return *p;
    }

    // Place the player, bypassing the gateway's clamping.
    void place(const std::shared_ptr<session::Session> &s, b2Vec2 pos)
    {
        std::scoped_lock lk{world->mutex};
        player(s).pos = pos;
    }

    uint32_t add_fish(b2Vec2 pos, uint32_t reward, uint32_t type = 0, int32_t ttl_ms = 30000)
    {
        std::scoped_lock lk{world->mutex};
        return world->registry.create_fish(game::FishSpawn{pos, type, reward, ttl_ms}).id;
    }

    std::vector<session::OutMessage> drain(const std::shared_ptr<session::Session> &s)
    {
        return sessions->drain_messages(s);
    }

    std::shared_ptr<game::World> world;
    std::shared_ptr<session::SessionManager> sessions;
    std::shared_ptr<profile::MemoryProfileStore> store;
    std::shared_ptr<profile::ProgressSync> progress;
    std::shared_ptr<session::Gateway> gateway;
};

} // namespace reef::test
