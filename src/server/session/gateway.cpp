// SPDX-License-Identifier: Apache-2.0
#include "server/session/gateway.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/catalog.hpp"
#include "server/game/snapshot.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <optional>

namespace reef::session {

namespace {
bool finite_field(bool present, float v)
{
    return present && std::isfinite(v);
}
} // namespace

profile::Profile profile_of(const game::Player &p)
{
    profile::Profile out;
    out.gold = p.gold;
    out.boats = p.boats;
    out.level = p.level;
    out.fishes_caught = p.fishes_caught;
    return out;
}

std::vector<uint32_t> normalize_boats(std::vector<uint32_t> boats, uint32_t max_boats)
{
    if (std::find(boats.begin(), boats.end(), game::kStarterBoatId) == boats.end())
        boats.insert(boats.begin(), game::kStarterBoatId);
    if (boats.size() <= max_boats)
        return boats;
    // Over the cap: keep the starter boat plus the earliest other boats.
    std::vector<uint32_t> out;
    out.reserve(max_boats);
    bool starter_kept = false;
    for (auto b : boats) {
        if (out.size() >= max_boats)
            break;
        if (b == game::kStarterBoatId && !starter_kept) {
            out.push_back(b);
            starter_kept = true;
        } else if (out.size() + (starter_kept ? 0 : 1) < max_boats) {
            out.push_back(b);
        }
    }
    return out;
}

Gateway::Gateway(
    std::shared_ptr<game::World> world,
    std::shared_ptr<SessionManager> sessions,
    std::shared_ptr<profile::IProfileStore> store,
    std::shared_ptr<profile::ProgressSync> progress)
    : m_world(std::move(world)),
      m_sessions(std::move(sessions)),
      m_store(std::move(store)),
      m_progress(std::move(progress))
{}

bool Gateway::is_active(const std::shared_ptr<Session> &s)
{
    return m_sessions->state_of(s) == SessionState::active;
}

Identity Gateway::resolve_identity(std::string_view token)
{
    if (token.empty())
        return Guest{};
    try {
        if (auto user = m_store->resolve_token(token))
            return Authenticated{*user};
        reef::log::info("[gateway] unknown token, joining as guest");
    } catch (const std::exception &ex) {
        reef::log::warn("[gateway] token lookup failed: {}", ex.what());
    }
    return Guest{};
}

profile::Profile Gateway::load_or_default(const std::string &username)
{
    profile::Profile def;
    def.gold = m_world->cfg.starting_gold;
    try {
        if (auto p = m_store->load_profile(username))
            return *p;
        reef::log::info("[gateway] no stored profile for {}, using defaults", username);
    } catch (const std::exception &ex) {
        reef::metrics::runtime().profile_load_failures.fetch_add(1, std::memory_order_relaxed);
        reef::log::warn("[gateway] profile load for {} failed: {}", username, ex.what());
    }
    return def;
}

void Gateway::hello(const std::shared_ptr<Session> &s, std::string_view token)
{
    if (m_sessions->state_of(s) != SessionState::connecting) {
        reef::log::debug("[gateway] repeated hello from {} ignored", s->id);
        return;
    }
    Identity identity = resolve_identity(token);
    const std::string *user = username_of(identity);
    profile::Profile prof;
    prof.gold = m_world->cfg.starting_gold;
    if (user)
        prof = load_or_default(*user);
    std::vector<uint32_t> boats = normalize_boats(prof.boats, m_world->cfg.max_boats);
    if (boats != prof.boats)
        reef::log::warn("[gateway] stored boats for {} normalized ({} -> {})", s->id, prof.boats.size(), boats.size());

    game::Player initial;
    initial.name = user ? *user : "Guest-" + std::to_string(s->seq);
    initial.username = user ? *user : std::string();
    initial.gold = prof.gold;
    initial.boats = std::move(boats);
    initial.selected_boat = game::kStarterBoatId;
    initial.level = prof.level;
    initial.fishes_caught = prof.fishes_caught;
    initial.last_seen = std::chrono::steady_clock::now();
    {
        std::scoped_lock lk{m_world->mutex};
        std::uniform_real_distribution<float> ux(100.f, 900.f);
        std::uniform_real_distribution<float> uy(200.f, 500.f);
        float x = ux(m_world->rng);
        float y = uy(m_world->rng);
        initial.pos = game::clamp_to_world(m_world->cfg, {x, y});
        m_world->registry.create_player(s->id, std::move(initial));
    }

    reef::ServerMessage welcome;
    game::fill_welcome(m_world->cfg, s->id, user, welcome.mutable_welcome());
    m_sessions->push_message(s, std::move(welcome));
    if (!m_sessions->activate(s, identity)) {
        // closed while the player was being built
        std::scoped_lock lk{m_world->mutex};
        m_world->registry.remove_player(s->id);
        return;
    }
    reef::log::info("[gateway] session {} active user={}", s->id, user ? *user : std::string("guest"));
}

void Gateway::update(const std::shared_ptr<Session> &s, const reef::PlayerUpdate &u)
{
    if (!is_active(s))
        return;
    std::scoped_lock lk{m_world->mutex};
    auto *p = m_world->registry.find_player(s->id);
    if (!p)
        return;
    const auto &cfg = m_world->cfg;
    if (finite_field(u.has_x(), u.x()))
        p->pos.x = std::clamp(u.x(), 0.f, cfg.width);
    if (finite_field(u.has_y(), u.y()))
        p->pos.y = std::clamp(u.y(), 0.f, cfg.height);
    if (finite_field(u.has_angle(), u.angle()))
        p->angle = u.angle();
    p->last_seen = std::chrono::steady_clock::now();
}

void Gateway::shoot(const std::shared_ptr<Session> &s, const reef::Shoot &sh)
{
    if (!finite_field(sh.has_tx(), sh.tx()) || !finite_field(sh.has_ty(), sh.ty()))
        return;
    if (!is_active(s))
        return;
    std::scoped_lock lk{m_world->mutex};
    auto *p = m_world->registry.find_player(s->id);
    if (!p)
        return;
    const auto &cfg = m_world->cfg;
    b2Vec2 d = b2Sub(b2Vec2{sh.tx(), sh.ty()}, p->pos);
    float mag = std::max(0.0001f, b2Length(d));
    game::BulletSpawn spec{p->id, p->pos, b2MulSV(cfg.bullet_speed / mag, d), cfg.bullet_ttl_ms};
    m_world->registry.create_bullet(spec);
    reef::metrics::runtime().bullets_fired.fetch_add(1, std::memory_order_relaxed);
}

bool Gateway::catch_fish(const std::shared_ptr<Session> &s, uint32_t fish_id)
{
    if (!is_active(s))
        return false;
    Identity identity = m_sessions->identity_of(s);
    const std::string *user = username_of(identity);
    reef::ServerMessage reply;
    std::optional<profile::Profile> flush;
    uint32_t reward = 0;
    {
        std::scoped_lock lk{m_world->mutex};
        auto *p = m_world->registry.find_player(s->id);
        if (!p)
            return false;
        auto *f = m_world->registry.find_fish(fish_id);
        if (!f)
            return false;
        if (b2Distance(p->pos, f->pos) >= m_world->cfg.catch_radius)
            return false;
        reward = f->reward;
        p->gold += reward;
        p->fishes_caught++;
        game::fill_fish(*f, reply.mutable_caught()->mutable_fish());
        m_world->registry.remove_fish(fish_id);
        if (user)
            flush = profile_of(*p);
    }
    m_sessions->push_message(s, std::move(reply));
    if (flush)
        m_progress->queue(*user, std::move(*flush));
    reef::metrics::runtime().fish_caught.fetch_add(1, std::memory_order_relaxed);
    reef::log::info("[gateway] player {} caught fish {} reward {}", s->id, fish_id, reward);
    return true;
}

BuyOutcome Gateway::buy_boat(const std::shared_ptr<Session> &s, uint32_t boat_id)
{
    if (!is_active(s))
        return BuyOutcome::ignored;
    const game::BoatSpec *boat = game::find_boat(boat_id);
    if (!boat)
        return BuyOutcome::ignored;
    Identity identity = m_sessions->identity_of(s);
    const std::string *user = username_of(identity);
    BuyOutcome outcome;
    std::optional<profile::Profile> flush;
    {
        std::scoped_lock lk{m_world->mutex};
        auto *p = m_world->registry.find_player(s->id);
        if (!p)
            return BuyOutcome::ignored;
        if (p->boats.size() >= m_world->cfg.max_boats) {
            outcome = BuyOutcome::rejected_max;
        } else if (p->gold < boat->cost) {
            outcome = BuyOutcome::rejected_funds;
        } else {
            p->gold -= boat->cost;
            p->boats.push_back(boat->id);
            outcome = BuyOutcome::purchased;
            if (user)
                flush = profile_of(*p);
        }
    }
    reef::ServerMessage reply;
    auto *br = reply.mutable_buy_result();
    auto &rt = reef::metrics::runtime();
    if (outcome == BuyOutcome::purchased) {
        br->set_ok(true);
        game::fill_boat(*boat, br->mutable_boat());
        rt.boats_purchased.fetch_add(1, std::memory_order_relaxed);
        reef::log::info("[gateway] player {} bought boat {}", s->id, boat->key);
    } else {
        br->set_ok(false);
        br->set_reason(outcome == BuyOutcome::rejected_max ? "max" : "funds");
        rt.purchases_rejected.fetch_add(1, std::memory_order_relaxed);
    }
    m_sessions->push_message(s, std::move(reply));
    if (flush)
        m_progress->queue(*user, std::move(*flush));
    return outcome;
}

void Gateway::disconnect(const std::shared_ptr<Session> &s)
{
    auto prev = m_sessions->close(s);
    if (!prev)
        return;
    if (*prev != SessionState::active) {
        reef::log::info("[gateway] session {} closed before hello", s->id);
        return;
    }
    Identity identity = m_sessions->identity_of(s);
    const std::string *user = username_of(identity);
    std::optional<profile::Profile> flush;
    {
        std::scoped_lock lk{m_world->mutex};
        if (auto *p = m_world->registry.find_player(s->id)) {
            if (user)
                flush = profile_of(*p);
        }
        m_world->registry.remove_player(s->id);
    }
    if (flush)
        m_progress->queue(*user, std::move(*flush));
    reef::log::info("[gateway] disconnect {}", s->id);
}

void Gateway::dispatch(const std::shared_ptr<Session> &s, const reef::ClientMessage &msg)
{
    switch (msg.payload_case()) {
        case reef::ClientMessage::kHello:
            hello(s, msg.hello().token());
            break;
        case reef::ClientMessage::kUpdate:
            update(s, msg.update());
            break;
        case reef::ClientMessage::kShoot:
            shoot(s, msg.shoot());
            break;
        case reef::ClientMessage::kCatchFish:
            catch_fish(s, msg.catch_fish().fish_id());
            break;
        case reef::ClientMessage::kBuyBoat:
            buy_boat(s, msg.buy_boat().boat_id());
            break;
        case reef::ClientMessage::PAYLOAD_NOT_SET:
            break;
    }
}

} // namespace reef::session
