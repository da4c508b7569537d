// SPDX-License-Identifier: Apache-2.0
// Scripted bot: joins, wanders, shoots, catches the nearest fish and buys a boat when affordable.
#include "client/wire.hpp"
#include "common/logger.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <cmath>
#include <cstdlib>
#include <optional>
#include <random>
#include <string>

using namespace std::chrono_literals;

struct BotOptions
{
    uint16_t port{40100};
    std::string token; // empty joins as guest
    uint32_t active_secs{20};
};

static coro::task<void> client_flow(std::shared_ptr<coro::io_scheduler> scheduler, BotOptions opts)
{
    co_await scheduler->schedule();
    coro::net::tcp::client cli{
        scheduler, {.address = coro::net::ip_address::from_string("127.0.0.1"), .port = opts.port}};
    auto cstatus = co_await cli.connect(5s);
    if (cstatus != coro::net::connect_status::connected) {
        reef::log::error("client connect failed");
        co_return;
    }
    reef::log::info("client connected");
    reef::ClientMessage hello;
    hello.mutable_hello()->set_token(opts.token);
    if (!co_await reef::client::send_message(cli, hello))
        co_return;

    reef::netutil::FrameParseState fps;
    std::vector<reef::ServerMessage> inbox;
    std::string my_id;
    std::vector<reef::BoatInfo> boats;
    // Phase 1: wait for the welcome
    auto wait_start = std::chrono::steady_clock::now();
    while (my_id.empty() && std::chrono::steady_clock::now() - wait_start < 5s) {
        if (co_await reef::client::read_messages(cli, fps, inbox, 100ms) == reef::client::ReadStatus::closed)
            co_return;
        for (auto &m : inbox) {
            if (m.has_welcome()) {
                my_id = m.welcome().id();
                boats.assign(m.welcome().boats().begin(), m.welcome().boats().end());
                reef::log::info(
                    "Welcome id={} user={} boats={} fish_types={}",
                    my_id,
                    m.welcome().has_user() ? m.welcome().user() : std::string("<guest>"),
                    m.welcome().boats_size(),
                    m.welcome().fish_types_size());
            }
        }
        inbox.clear();
    }
    if (my_id.empty()) {
        reef::log::warn("Timeout waiting for welcome");
        co_return;
    }
    // Phase 2: wander, shoot, catch and shop
    std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<float> step(-20.f, 20.f);
    float x = 0.f, y = 0.f;
    uint64_t gold = 0;
    size_t owned = 1;
    uint64_t iteration = 0;
    auto active_start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - active_start < std::chrono::seconds(opts.active_secs)) {
        if (co_await reef::client::read_messages(cli, fps, inbox, 50ms) == reef::client::ReadStatus::closed) {
            reef::log::warn("server closed the connection");
            co_return;
        }
        std::optional<reef::FishState> nearest;
        float best = 0.f;
        for (auto &m : inbox) {
            if (m.has_state()) {
                for (auto &p : m.state().players()) {
                    if (p.id() == my_id) {
                        x = p.x();
                        y = p.y();
                        gold = p.gold();
                        owned = static_cast<size_t>(p.boats_size());
                    }
                }
                nearest.reset();
                for (auto &f : m.state().fishes()) {
                    float d = std::hypot(f.x() - x, f.y() - y);
                    if (!nearest || d < best) {
                        nearest = f;
                        best = d;
                    }
                }
            } else if (m.has_caught()) {
                reef::log::info("Caught fish id={} reward={}", m.caught().fish().id(), m.caught().fish().reward());
            } else if (m.has_buy_result()) {
                if (m.buy_result().ok())
                    reef::log::info("Bought boat {}", m.buy_result().boat().name());
                else
                    reef::log::info("Purchase rejected: {}", m.buy_result().reason());
            }
        }
        inbox.clear();

        reef::ClientMessage out;
        if (nearest) {
            // Swim to the fish, then reel it in.
            out.mutable_update()->set_x(nearest->x());
            out.mutable_update()->set_y(nearest->y());
            co_await reef::client::send_message(cli, out);
            out.Clear();
            out.mutable_catch_fish()->set_fish_id(nearest->id());
        } else {
            out.mutable_update()->set_x(x + step(rng));
            out.mutable_update()->set_y(y + step(rng));
        }
        co_await reef::client::send_message(cli, out);
        if (++iteration % 15 == 0) {
            reef::ClientMessage sh;
            sh.mutable_shoot()->set_tx(x + step(rng));
            sh.mutable_shoot()->set_ty(y + step(rng));
            co_await reef::client::send_message(cli, sh);
        }
        if (owned < 3) {
            for (auto &b : boats) {
                if (b.cost() > 0 && b.cost() <= gold) {
                    reef::ClientMessage buy;
                    buy.mutable_buy_boat()->set_boat_id(b.id());
                    co_await reef::client::send_message(cli, buy);
                    gold -= b.cost();
                    break;
                }
            }
        }
        co_await scheduler->yield_for(100ms);
    }
    reef::log::info("Active phase complete (secs={})", opts.active_secs);
}

int main(int argc, char **argv)
{
    BotOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--active-seconds" && i + 1 < argc) {
            opts.active_secs = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (a == "--token" && i + 1 < argc) {
            opts.token = argv[++i];
        } else if (!a.empty() && a[0] != '-') {
            // positional first non-flag is port
            opts.port = static_cast<uint16_t>(std::strtoul(a.c_str(), nullptr, 10));
        }
    }
    if (auto env_active = std::getenv("REEF_ACTIVE_SECS")) {
        try {
            opts.active_secs = static_cast<uint32_t>(std::stoul(env_active));
        } catch (const std::exception &) {
            reef::log::warn("Invalid REEF_ACTIVE_SECS env value");
        }
    }
    auto scheduler = coro::default_executor::io_executor();
    coro::sync_wait(client_flow(scheduler, opts));
    return 0;
}
