// SPDX-License-Identifier: Apache-2.0
#include "server/server.hpp"

#include "common/logger.hpp"
#include "server/game/world_loop.hpp"
#include "server/net/listener.hpp"
#include "server/net/metrics_http.hpp"

namespace reef {

Server::Server(const ServerConfig &cfg, std::shared_ptr<profile::IProfileStore> store)
    : m_cfg(cfg),
      m_world(std::make_shared<game::World>(to_world_config(cfg))),
      m_sessions(std::make_shared<session::SessionManager>()),
      m_store(std::move(store)),
      m_progress(std::make_shared<profile::ProgressSync>(m_store)),
      m_gateway(std::make_shared<session::Gateway>(m_world, m_sessions, m_store, m_progress))
{}

Server::~Server()
{
    shutdown();
}

void Server::start(const std::shared_ptr<coro::io_scheduler> &scheduler)
{
    scheduler->spawn(net::run_listener(scheduler, m_cfg.listen_port, net::ListenerContext{m_world, m_sessions, m_gateway}));
    scheduler->spawn(game::run_tick_loop(scheduler, m_world, m_sessions));
    scheduler->spawn(game::run_spawner(scheduler, m_world));
    if (m_cfg.metrics_port != 0) {
        // Shares ownership with the world; the flag lives as long as either holder.
        std::shared_ptr<std::atomic_bool> running(m_world, &m_world->running);
        scheduler->spawn(net::run_metrics_endpoint(scheduler, m_cfg.metrics_port, running));
    }
}

void Server::shutdown()
{
    if (m_world->running.exchange(false)) {
        // Tear down live players here so their progress is queued before the sync worker stops.
        auto active = m_sessions->snapshot_active();
        for (auto &s : active)
            m_gateway->disconnect(s);
        reef::log::info("[progress] draining pending profile writes ({} sessions closed)", active.size());
    }
    m_progress->stop();
}

} // namespace reef
