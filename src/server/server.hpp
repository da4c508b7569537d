// SPDX-License-Identifier: Apache-2.0
// server.hpp - Owns the world, sessions, profile plumbing and the periodic tasks.
#pragma once

#include "server/config.hpp"
#include "server/game/world.hpp"
#include "server/profile/profile_store.hpp"
#include "server/profile/progress_sync.hpp"
#include "server/session/gateway.hpp"
#include "server/session/session_manager.hpp"

#include <coro/io_scheduler.hpp>

#include <memory>

namespace reef {

class Server
{
public:
    Server(const ServerConfig &cfg, std::shared_ptr<profile::IProfileStore> store);
    ~Server();

    Server(const Server &) = delete;
    Server &operator=(const Server &) = delete;

    // Spawn listener, tick loop, spawner and (when metrics_port != 0) the metrics endpoint.
    void start(const std::shared_ptr<coro::io_scheduler> &scheduler);
    // Stop the periodic tasks and drain pending profile writes. Idempotent.
    void shutdown();

    const ServerConfig &config() const { return m_cfg; }
    const std::shared_ptr<game::World> &world() const { return m_world; }
    const std::shared_ptr<session::SessionManager> &sessions() const { return m_sessions; }
    const std::shared_ptr<session::Gateway> &gateway() const { return m_gateway; }
    const std::shared_ptr<profile::ProgressSync> &progress() const { return m_progress; }

private:
    ServerConfig m_cfg;
    std::shared_ptr<game::World> m_world;
    std::shared_ptr<session::SessionManager> m_sessions;
    std::shared_ptr<profile::IProfileStore> m_store;
    std::shared_ptr<profile::ProgressSync> m_progress;
    std::shared_ptr<session::Gateway> m_gateway;
};

} // namespace reef
