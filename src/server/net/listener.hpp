// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/world.hpp"
#include "server/session/gateway.hpp"
#include "server/session/session_manager.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>

namespace reef::net {

struct ListenerContext
{
    std::shared_ptr<game::World> world; // running flag stops accept and connection loops
    std::shared_ptr<session::SessionManager> sessions;
    std::shared_ptr<session::Gateway> gateway;
};

// Starts the TCP accept loop on the given port.
// The read poll timeout inside each connection loop is half a tick so queued state
// broadcasts are flushed within one tick interval.
coro::task<void> run_listener(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, ListenerContext ctx);

} // namespace reef::net
