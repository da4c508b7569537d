// SPDX-License-Identifier: Apache-2.0
#include "server/net/metrics_http.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <span>
#include <sstream>
#include <string>

namespace reef::net {

static void emit(std::ostringstream &oss, const char *name, const char *type, uint64_t value)
{
    oss << "# TYPE reef_" << name << ' ' << type << "\n";
    oss << "reef_" << name << ' ' << value << "\n";
}

std::string build_metrics_body()
{
    std::ostringstream oss;
    auto &rt = reef::metrics::runtime();
    // Gauges
    emit(oss, "connected_players", "gauge", rt.connected_players.load());
    emit(oss, "fish_active", "gauge", rt.fish_active.load());
    emit(oss, "bullets_active", "gauge", rt.bullets_active.load());
    emit(oss, "avg_tick_ns", "gauge", reef::metrics::avg_tick_ns());
    emit(oss, "p99_tick_ns", "gauge", reef::metrics::approx_tick_p99());
    // Counters
    emit(oss, "fish_spawned", "counter", rt.fish_spawned.load());
    emit(oss, "fish_caught", "counter", rt.fish_caught.load());
    emit(oss, "fish_expired", "counter", rt.fish_expired.load());
    emit(oss, "bullets_fired", "counter", rt.bullets_fired.load());
    emit(oss, "bullet_hits", "counter", rt.bullet_hits.load());
    emit(oss, "boats_purchased", "counter", rt.boats_purchased.load());
    emit(oss, "purchases_rejected", "counter", rt.purchases_rejected.load());
    emit(oss, "profile_saves", "counter", rt.profile_saves.load());
    emit(oss, "profile_save_failures", "counter", rt.profile_save_failures.load());
    emit(oss, "profile_load_failures", "counter", rt.profile_load_failures.load());
    emit(oss, "state_broadcasts", "counter", rt.state_broadcasts.load());
    emit(oss, "state_bytes", "counter", rt.state_bytes.load());
    // Tick duration histogram (nanoseconds), geometric x2 buckets from 0.25ms.
    oss << "# TYPE reef_tick_duration_ns histogram\n";
    uint64_t cumulative = 0;
    constexpr uint64_t base = 250000;
    for (int i = 0; i < reef::metrics::RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load();
        oss << "reef_tick_duration_ns_bucket{le=\"" << (base << i) << "\"} " << cumulative << "\n";
    }
    oss << "reef_tick_duration_ns_bucket{le=\"+Inf\"} " << cumulative << "\n";
    oss << "reef_tick_duration_ns_sum " << rt.tick_duration_ns_accum.load() << "\n";
    oss << "reef_tick_duration_ns_count " << rt.tick_samples.load() << "\n";
    return oss.str();
}

static coro::task<void> handle_client(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    auto pol = co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(200));
    if (pol != coro::poll_status::event)
        co_return;
    std::string buf(1024, '\0');
    auto [rs, span] = client.recv(buf);
    if (rs != coro::net::recv_status::ok)
        co_return;
    std::string_view req(span.data(), span.size());
    bool metrics = req.rfind("GET /metrics", 0) == 0;
    std::string body = metrics ? build_metrics_body() : std::string("not found\n");
    std::ostringstream resp;
    resp << "HTTP/1.1 " << (metrics ? "200 OK" : "404 Not Found") << "\r\n";
    resp << "Content-Type: text/plain; version=0.0.4\r\n";
    resp << "Content-Length: " << body.size() << "\r\n";
    resp << "Connection: close\r\n\r\n";
    resp << body;
    auto s = resp.str();
    std::span<const char> out{s.data(), s.size()};
    while (!out.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [st, rest] = client.send(out);
        if (st == coro::net::send_status::ok || st == coro::net::send_status::would_block) {
            out = rest;
            continue;
        }
        break;
    }
    co_return;
}

coro::task<void> run_metrics_endpoint(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, std::shared_ptr<std::atomic_bool> running)
{
    co_await scheduler->schedule();
    reef::log::info("[metrics] HTTP endpoint on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (running->load()) {
        auto st = co_await server.poll(std::chrono::milliseconds(500));
        if (st == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid())
                scheduler->spawn(handle_client(scheduler, std::move(client)));
        } else if (st == coro::poll_status::error || st == coro::poll_status::closed) {
            reef::log::error("[metrics] server poll error/closed");
            co_return;
        }
    }
}

} // namespace reef::net
