// SPDX-License-Identifier: Apache-2.0
// wire.hpp - Client-side framing helpers shared by the test client and the end-to-end tests.
#pragma once

#include "common/framing.hpp"
#include "reef.pb.h"

#include <coro/coro.hpp>
#include <coro/net/tcp/client.hpp>

#include <chrono>
#include <span>
#include <string>
#include <vector>

namespace reef::client {

// False when serialization or the socket failed.
inline coro::task<bool> send_message(coro::net::tcp::client &client, const reef::ClientMessage &msg)
{
    std::string payload;
    if (!msg.SerializeToString(&payload))
        co_return false;
    auto frame = netutil::build_frame(payload);
    std::span<const char> rest(frame.data(), frame.size());
    while (!rest.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [st, remaining] = client.send(rest);
        if (st == coro::net::send_status::ok || st == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

enum class ReadStatus
{
    ok, // zero or more messages appended
    closed // peer closed, socket error or corrupt stream
};

// Wait up to timeout for readable data and append every complete message to out.
inline coro::task<ReadStatus> read_messages(
    coro::net::tcp::client &client,
    netutil::FrameParseState &state,
    std::vector<reef::ServerMessage> &out,
    std::chrono::milliseconds timeout)
{
    auto pst = co_await client.poll(coro::poll_op::read, timeout);
    if (pst == coro::poll_status::timeout)
        co_return ReadStatus::ok;
    if (pst != coro::poll_status::event)
        co_return ReadStatus::closed;
    std::string tmp(4096, '\0');
    auto [st, span] = client.recv(tmp);
    if (st == coro::net::recv_status::would_block)
        co_return ReadStatus::ok;
    if (st != coro::net::recv_status::ok)
        co_return ReadStatus::closed;
    state.feed(span.data(), span.size());
    std::string payload;
    while (true) {
        auto fs = netutil::try_extract(state, payload);
        if (fs == netutil::FrameStatus::incomplete)
            break;
        if (fs == netutil::FrameStatus::invalid)
            co_return ReadStatus::closed;
        reef::ServerMessage sm;
        if (!sm.ParseFromArray(payload.data(), static_cast<int>(payload.size())))
            co_return ReadStatus::closed;
        out.push_back(std::move(sm));
    }
    co_return ReadStatus::ok;
}

} // namespace reef::client
