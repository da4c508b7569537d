// SPDX-License-Identifier: Apache-2.0
// End-to-end over TCP: authenticated hello, movement, shooting, purchase, disconnect and restore.
#include "client/wire.hpp"
#include "server/config.hpp"
#include "server/profile/profile_store.hpp"
#include "server/server.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <cassert>
#include <functional>
#include <iostream>
#include <optional>
#include <thread>

using namespace std::chrono_literals;
using Inbox = std::vector<reef::ServerMessage>;

// Read until pred matches a message or the deadline passes; returns the matching message.
static coro::task<std::optional<reef::ServerMessage>> wait_for(
    coro::net::tcp::client &cli,
    reef::netutil::FrameParseState &fps,
    std::function<bool(const reef::ServerMessage &)> pred,
    std::chrono::milliseconds budget = 3s)
{
    auto deadline = std::chrono::steady_clock::now() + budget;
    Inbox inbox;
    while (std::chrono::steady_clock::now() < deadline) {
        if (co_await reef::client::read_messages(cli, fps, inbox, 50ms) == reef::client::ReadStatus::closed)
            co_return std::nullopt;
        for (auto &m : inbox) {
            if (pred(m))
                co_return m;
        }
        inbox.clear();
    }
    co_return std::nullopt;
}

static const reef::PlayerState *find_self(const reef::WorldState &st, const std::string &id)
{
    for (const auto &p : st.players()) {
        if (p.id() == id)
            return &p;
    }
    return nullptr;
}

static coro::task<void> first_session(std::shared_ptr<coro::io_scheduler> sched, uint16_t port)
{
    co_await sched->yield_for(100ms);
    coro::net::tcp::client cli{sched, {.address = coro::net::ip_address::from_string("127.0.0.1"), .port = port}};
    auto st = co_await cli.connect(2s);
    assert(st == coro::net::connect_status::connected);
    reef::netutil::FrameParseState fps;

    reef::ClientMessage hello;
    hello.mutable_hello()->set_token("tok-e2e");
    assert(co_await reef::client::send_message(cli, hello));
    auto welcome = co_await wait_for(cli, fps, [](const reef::ServerMessage &m) { return m.has_welcome(); });
    assert(welcome && welcome->welcome().has_user() && welcome->welcome().user() == "ivy");
    const std::string my_id = welcome->welcome().id();
    assert(welcome->welcome().boats_size() == 13);

    // Movement shows up in the broadcast state.
    reef::ClientMessage move;
    move.mutable_update()->set_x(321.f);
    move.mutable_update()->set_y(222.f);
    assert(co_await reef::client::send_message(cli, move));
    auto moved = co_await wait_for(cli, fps, [&](const reef::ServerMessage &m) {
        if (!m.has_state())
            return false;
        auto *self = find_self(m.state(), my_id);
        return self && self->x() == 321.f && self->y() == 222.f;
    });
    assert(moved);
    assert(find_self(moved->state(), my_id)->gold() == 1000);

    // Shooting creates a bullet owned by this session.
    reef::ClientMessage shot;
    shot.mutable_shoot()->set_tx(900.f);
    shot.mutable_shoot()->set_ty(222.f);
    assert(co_await reef::client::send_message(cli, shot));
    auto with_bullet = co_await wait_for(cli, fps, [&](const reef::ServerMessage &m) {
        if (!m.has_state())
            return false;
        for (const auto &b : m.state().bullets()) {
            if (b.owner() == my_id)
                return true;
        }
        return false;
    });
    assert(with_bullet);

    // Purchase: skiff costs 300.
    reef::ClientMessage buy;
    buy.mutable_buy_boat()->set_boat_id(1);
    assert(co_await reef::client::send_message(cli, buy));
    auto bought = co_await wait_for(cli, fps, [](const reef::ServerMessage &m) { return m.has_buy_result(); });
    assert(bought && bought->buy_result().ok() && bought->buy_result().boat().id() == 1);
    co_return; // client socket closes here
}

static coro::task<void> second_session(std::shared_ptr<coro::io_scheduler> sched, uint16_t port)
{
    coro::net::tcp::client cli{sched, {.address = coro::net::ip_address::from_string("127.0.0.1"), .port = port}};
    auto st = co_await cli.connect(2s);
    assert(st == coro::net::connect_status::connected);
    reef::netutil::FrameParseState fps;
    reef::ClientMessage hello;
    hello.mutable_hello()->set_token("tok-e2e");
    assert(co_await reef::client::send_message(cli, hello));
    auto welcome = co_await wait_for(cli, fps, [](const reef::ServerMessage &m) { return m.has_welcome(); });
    assert(welcome);
    const std::string my_id = welcome->welcome().id();
    auto state = co_await wait_for(cli, fps, [&](const reef::ServerMessage &m) {
        return m.has_state() && find_self(m.state(), my_id) != nullptr;
    });
    assert(state);
    const auto *self = find_self(state->state(), my_id);
    assert(self->gold() == 700);
    assert(self->boats_size() == 2 && self->boats(1) == 1);

    // A corrupt frame closes only this connection.
    std::string junk(4, '\xff');
    std::span<const char> rest(junk.data(), junk.size());
    co_await cli.poll(coro::poll_op::write);
    auto [sent, unsent] = cli.send(rest);
    assert(sent == coro::net::send_status::ok && unsent.empty());
    Inbox inbox;
    bool closed = false;
    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (!closed && std::chrono::steady_clock::now() < deadline) {
        closed = co_await reef::client::read_messages(cli, fps, inbox, 50ms) == reef::client::ReadStatus::closed;
        inbox.clear();
    }
    assert(closed);
    co_return;
}

int main()
{
    const uint16_t port = 41110;
    reef::ServerConfig cfg;
    cfg.listen_port = port;
    cfg.tick_ms = 30;
    cfg.rng_seed = 5;
    auto store = std::make_shared<reef::profile::MemoryProfileStore>();
    reef::profile::Profile ivy;
    ivy.gold = 1000;
    store->add_user("ivy", "tok-e2e", ivy);
    reef::Server server{cfg, store};
    auto sched = coro::default_executor::io_executor();
    server.start(sched);

    coro::sync_wait(first_session(sched, port));

    // Server notices the close, removes the player and flushes the profile.
    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (server.sessions()->live_count() > 0 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(20ms);
    assert(server.sessions()->live_count() == 0);
    server.progress()->wait_idle();
    auto saved = store->load_profile("ivy");
    assert(saved && saved->gold == 700);
    assert((saved->boats == std::vector<uint32_t>{0, 1}));
    {
        std::scoped_lock lk{server.world()->mutex};
        assert(server.world()->registry.players().empty());
    }

    coro::sync_wait(second_session(sched, port));
    server.shutdown();
    std::cout << "e2e_session_flow OK" << std::endl;
    return 0;
}
