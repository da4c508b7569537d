// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "common/framing.hpp"
#include "common/logger.hpp"
#include "reef.pb.h"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <algorithm>
#include <chrono>
#include <span>
#include <string>
#include <vector>

namespace reef::net {

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<session::Session> session, ListenerContext ctx);

coro::task<void> run_listener(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, ListenerContext ctx)
{
    co_await scheduler->schedule();
    reef::log::info("[listener] TCP listener on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (ctx.world->running.load()) {
        auto status = co_await server.poll(std::chrono::milliseconds(200));
        if (status == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                auto session = ctx.sessions->add_connection(std::move(client));
                scheduler->spawn(connection_loop(scheduler, session, ctx));
            }
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            reef::log::error("[listener] poll error/closed, exiting listener loop");
            co_return;
        }
    }
    reef::log::info("[listener] stopped");
}

// Returns false when the peer is gone or the socket errored.
static coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [s, remaining] = client.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

// Serialize every pending message into one batch of frames.
static std::string build_batch(const std::vector<session::OutMessage> &pending)
{
    std::string batch;
    std::string payload;
    for (auto &msg : pending) {
        payload.clear();
        if (!msg->SerializeToString(&payload)) {
            reef::log::warn("[conn] failed to serialize outbound message, skipped");
            continue;
        }
        netutil::append_frame(batch, payload);
    }
    return batch;
}

enum class ReadResult
{
    keep_open,
    close
};

static ReadResult handle_payloads(
    netutil::FrameParseState &fps, const std::shared_ptr<session::Session> &session, session::Gateway &gateway)
{
    std::string payload;
    while (true) {
        auto st = netutil::try_extract(fps, payload);
        if (st == netutil::FrameStatus::incomplete)
            return ReadResult::keep_open;
        if (st == netutil::FrameStatus::invalid) {
            reef::log::warn("[conn] {} invalid frame length, dropping connection", session->id);
            return ReadResult::close;
        }
        reef::ClientMessage cmsg;
        if (!cmsg.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
            reef::log::warn("[conn] {} failed to parse protobuf, dropping connection", session->id);
            return ReadResult::close;
        }
        gateway.dispatch(session, cmsg);
    }
}

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<session::Session> session, ListenerContext ctx)
{
    co_await scheduler->schedule();
    reef::log::info("[conn] {} connected", session->id);
    const auto read_timeout = std::chrono::milliseconds(std::max<int32_t>(1, ctx.world->cfg.tick_ms / 2));
    netutil::FrameParseState fps;
    std::string tmp(4096, '\0');
    while (ctx.world->running.load()) {
        auto pending = ctx.sessions->drain_messages(session);
        if (!pending.empty()) {
            auto batch = build_batch(pending);
            if (!co_await send_all(*session->client, std::span<const char>(batch.data(), batch.size()))) {
                reef::log::info("[conn] {} send failed", session->id);
                break;
            }
        }
        if (ctx.sessions->state_of(session) == session::SessionState::disconnected)
            break;
        auto pstat = co_await session->client->poll(coro::poll_op::read, read_timeout);
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat == coro::poll_status::error || pstat == coro::poll_status::closed) {
            reef::log::info("[conn] {} poll closed", session->id);
            break;
        }
        auto [rstatus, span] = session->client->recv(tmp);
        if (rstatus == coro::net::recv_status::closed) {
            reef::log::info("[conn] {} closed by peer", session->id);
            break;
        }
        if (rstatus == coro::net::recv_status::would_block)
            continue;
        if (rstatus != coro::net::recv_status::ok) {
            reef::log::warn("[conn] {} recv error", session->id);
            break;
        }
        fps.feed(span.data(), span.size());
        if (handle_payloads(fps, session, *ctx.gateway) == ReadResult::close)
            break;
    }
    ctx.gateway->disconnect(session);
    reef::log::info("[conn] {} disconnected", session->id);
    co_return;
}

} // namespace reef::net
