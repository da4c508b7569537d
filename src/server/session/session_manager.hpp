// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "reef.pb.h"

#include <coro/net/tcp/client.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace reef::session {

enum class SessionState
{
    connecting, // socket accepted, hello not processed yet
    active, // player registered, receives broadcasts
    disconnected // terminal
};

struct Guest
{};

struct Authenticated
{
    std::string username;
};

// Resolved once when the session becomes active.
using Identity = std::variant<Guest, Authenticated>;

inline const std::string *username_of(const Identity &id)
{
    if (auto *a = std::get_if<Authenticated>(&id))
        return &a->username;
    return nullptr;
}

using OutMessage = std::shared_ptr<const reef::ServerMessage>;

struct Session : public std::enable_shared_from_this<Session>
{
    uint64_t seq{0};
    std::string id; // connection-scoped, unique among live sessions
    // Fields below are guarded by SessionManager's mutex.
    SessionState state{SessionState::connecting};
    Identity identity{Guest{}};
    std::vector<OutMessage> outgoing; // pending outbound messages

    std::unique_ptr<coro::net::tcp::client> client; // nullptr for detached sessions

    Session(uint64_t s, std::string sid, coro::net::tcp::client c)
        : seq(s), id(std::move(sid)), client(std::make_unique<coro::net::tcp::client>(std::move(c)))
    {}

    Session(uint64_t s, std::string sid) : seq(s), id(std::move(sid)) {}
};

class SessionManager
{
public:
    std::shared_ptr<Session> add_connection(coro::net::tcp::client client);
    // Session without a socket (local harnesses, tests); messages accumulate until drained.
    std::shared_ptr<Session> add_detached();

    // connecting -> active. False when the session is not connecting.
    bool activate(const std::shared_ptr<Session> &s, Identity identity);
    // Any state -> disconnected. Returns the previous state only for the call that performed
    // the transition, so teardown runs exactly once per session.
    std::optional<SessionState> close(const std::shared_ptr<Session> &s);

    SessionState state_of(const std::shared_ptr<Session> &s);
    Identity identity_of(const std::shared_ptr<Session> &s);

    void push_message(const std::shared_ptr<Session> &s, OutMessage msg);
    void push_message(const std::shared_ptr<Session> &s, reef::ServerMessage msg);
    // Queue the same message for every active session.
    size_t broadcast(const OutMessage &msg);
    std::vector<OutMessage> drain_messages(const std::shared_ptr<Session> &s);

    std::vector<std::shared_ptr<Session>> snapshot_active();
    size_t active_count();
    size_t live_count();

private:
    std::shared_ptr<Session> register_session(std::shared_ptr<Session> s);

    std::mutex m_mutex;
    uint64_t m_connection_counter{0};
    std::unordered_map<std::string, std::shared_ptr<Session>> m_sessions; // not yet disconnected
};

} // namespace reef::session
