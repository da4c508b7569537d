// SPDX-License-Identifier: Apache-2.0
#include "server/session/session_manager.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

namespace reef::session {

std::shared_ptr<Session> SessionManager::register_session(std::shared_ptr<Session> s)
{
    m_sessions.emplace(s->id, s);
    return s;
}

std::shared_ptr<Session> SessionManager::add_connection(coro::net::tcp::client client)
{
    std::scoped_lock lk{m_mutex};
    uint64_t seq = ++m_connection_counter;
    return register_session(std::make_shared<Session>(seq, "conn_" + std::to_string(seq), std::move(client)));
}

std::shared_ptr<Session> SessionManager::add_detached()
{
    std::scoped_lock lk{m_mutex};
    uint64_t seq = ++m_connection_counter;
    return register_session(std::make_shared<Session>(seq, "conn_" + std::to_string(seq)));
}

bool SessionManager::activate(const std::shared_ptr<Session> &s, Identity identity)
{
    std::scoped_lock lk{m_mutex};
    if (s->state != SessionState::connecting)
        return false;
    s->state = SessionState::active;
    s->identity = std::move(identity);
    reef::metrics::runtime().connected_players.fetch_add(1, std::memory_order_relaxed);
    return true;
}

std::optional<SessionState> SessionManager::close(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (s->state == SessionState::disconnected)
        return std::nullopt;
    SessionState prev = s->state;
    s->state = SessionState::disconnected;
    s->outgoing.clear();
    m_sessions.erase(s->id);
    if (prev == SessionState::active) {
        auto &cp = reef::metrics::runtime().connected_players;
        if (cp.load(std::memory_order_relaxed) > 0)
            cp.fetch_sub(1, std::memory_order_relaxed);
    }
    reef::log::debug("[conn] {} closed (live={})", s->id, m_sessions.size());
    return prev;
}

SessionState SessionManager::state_of(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    return s->state;
}

Identity SessionManager::identity_of(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    return s->identity;
}

void SessionManager::push_message(const std::shared_ptr<Session> &s, OutMessage msg)
{
    std::scoped_lock lk{m_mutex};
    if (s->state == SessionState::disconnected)
        return;
    s->outgoing.push_back(std::move(msg));
}

void SessionManager::push_message(const std::shared_ptr<Session> &s, reef::ServerMessage msg)
{
    push_message(s, std::make_shared<const reef::ServerMessage>(std::move(msg)));
}

size_t SessionManager::broadcast(const OutMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    size_t n = 0;
    for (auto &[id, s] : m_sessions) {
        if (s->state != SessionState::active)
            continue;
        s->outgoing.push_back(msg);
        ++n;
    }
    return n;
}

std::vector<OutMessage> SessionManager::drain_messages(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    std::vector<OutMessage> out;
    out.swap(s->outgoing);
    return out;
}

std::vector<std::shared_ptr<Session>> SessionManager::snapshot_active()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Session>> res;
    res.reserve(m_sessions.size());
    for (auto &[id, s] : m_sessions) {
        if (s->state == SessionState::active)
            res.push_back(s);
    }
    return res;
}

size_t SessionManager::active_count()
{
    std::scoped_lock lk{m_mutex};
    size_t n = 0;
    for (auto &[id, s] : m_sessions) {
        if (s->state == SessionState::active)
            ++n;
    }
    return n;
}

size_t SessionManager::live_count()
{
    std::scoped_lock lk{m_mutex};
    return m_sessions.size();
}

} // namespace reef::session
