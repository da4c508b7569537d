// SPDX-License-Identifier: Apache-2.0
// gateway.hpp
// Translates per-connection intents into world mutations. Each handler takes the world lock
// for its whole mutation and queues replies/flushes only after releasing it.
#pragma once

#include "reef.pb.h"
#include "server/game/world.hpp"
#include "server/profile/profile_store.hpp"
#include "server/profile/progress_sync.hpp"
#include "server/session/session_manager.hpp"

#include <cstdint>
#include <memory>
#include <string_view>

namespace reef::session {

enum class BuyOutcome
{
    ignored, // unknown boat, unknown player or inactive session
    rejected_max,
    rejected_funds,
    purchased
};

class Gateway
{
public:
    Gateway(
        std::shared_ptr<game::World> world,
        std::shared_ptr<SessionManager> sessions,
        std::shared_ptr<profile::IProfileStore> store,
        std::shared_ptr<profile::ProgressSync> progress);

    // Connecting -> Active. Empty token joins as guest without touching the store; an unknown
    // token also yields a guest. Sends the welcome payload. Ignored unless connecting.
    void hello(const std::shared_ptr<Session> &s, std::string_view token);

    // Absent or non-finite coordinates keep the previous value; others are clamped into the world.
    void update(const std::shared_ptr<Session> &s, const reef::PlayerUpdate &u);
    // Absent or non-finite target is ignored.
    void shoot(const std::shared_ptr<Session> &s, const reef::Shoot &sh);
    // Returns true when the fish was caught.
    bool catch_fish(const std::shared_ptr<Session> &s, uint32_t fish_id);
    BuyOutcome buy_boat(const std::shared_ptr<Session> &s, uint32_t boat_id);
    // Exactly once per session; later calls are no-ops.
    void disconnect(const std::shared_ptr<Session> &s);

    // Route one decoded client message to the matching handler.
    void dispatch(const std::shared_ptr<Session> &s, const reef::ClientMessage &msg);

private:
    Identity resolve_identity(std::string_view token);
    profile::Profile load_or_default(const std::string &username);
    void flush_progress(const Identity &id, const game::Player &p);
    bool is_active(const std::shared_ptr<Session> &s);

    std::shared_ptr<game::World> m_world;
    std::shared_ptr<SessionManager> m_sessions;
    std::shared_ptr<profile::IProfileStore> m_store;
    std::shared_ptr<profile::ProgressSync> m_progress;
};

// Economy fields of a player as persisted by the profile store.
profile::Profile profile_of(const game::Player &p);

// Starter boat present and at most max_boats entries (first owned boats win).
std::vector<uint32_t> normalize_boats(std::vector<uint32_t> boats, uint32_t max_boats);

} // namespace reef::session
