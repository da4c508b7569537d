// SPDX-License-Identifier: Apache-2.0
#include "server/game/world.hpp"

#include <algorithm>

namespace reef::game {

namespace {
template <typename T, typename Key, typename Proj>
auto find_by(std::vector<T> &v, const Key &key, Proj proj)
{
    return std::find_if(v.begin(), v.end(), [&](const T &e) { return proj(e) == key; });
}
} // namespace

Player &Registry::create_player(std::string session_id, Player initial)
{
    // A reconnect under the same id replaces the stale entry instead of duplicating it.
    remove_player(session_id);
    initial.id = std::move(session_id);
    m_players.push_back(std::move(initial));
    return m_players.back();
}

void Registry::remove_player(std::string_view session_id)
{
    auto it = find_by(m_players, session_id, [](const Player &p) { return std::string_view(p.id); });
    if (it != m_players.end())
        m_players.erase(it);
}

Player *Registry::find_player(std::string_view session_id)
{
    auto it = find_by(m_players, session_id, [](const Player &p) { return std::string_view(p.id); });
    return it == m_players.end() ? nullptr : &*it;
}

const Player *Registry::find_player(std::string_view session_id) const
{
    auto it = std::find_if(
        m_players.begin(), m_players.end(), [&](const Player &p) { return p.id == session_id; });
    return it == m_players.end() ? nullptr : &*it;
}

Fish &Registry::create_fish(const FishSpawn &spec)
{
    m_fishes.push_back(Fish{m_next_fish_id++, spec.pos, spec.type, spec.reward, spec.ttl_ms});
    return m_fishes.back();
}

void Registry::remove_fish(uint32_t id)
{
    auto it = find_by(m_fishes, id, [](const Fish &f) { return f.id; });
    if (it != m_fishes.end())
        m_fishes.erase(it);
}

Fish *Registry::find_fish(uint32_t id)
{
    auto it = find_by(m_fishes, id, [](const Fish &f) { return f.id; });
    return it == m_fishes.end() ? nullptr : &*it;
}

Bullet &Registry::create_bullet(const BulletSpawn &spec)
{
    m_bullets.push_back(Bullet{m_next_bullet_id++, spec.owner, spec.pos, spec.vel, spec.ttl_ms});
    return m_bullets.back();
}

void Registry::remove_bullet(uint32_t id)
{
    auto it = find_by(m_bullets, id, [](const Bullet &b) { return b.id; });
    if (it != m_bullets.end())
        m_bullets.erase(it);
}

Bullet *Registry::find_bullet(uint32_t id)
{
    auto it = find_by(m_bullets, id, [](const Bullet &b) { return b.id; });
    return it == m_bullets.end() ? nullptr : &*it;
}

size_t Registry::remove_expired_fish()
{
    return std::erase_if(m_fishes, [](const Fish &f) { return f.ttl_ms <= 0; });
}

size_t Registry::remove_expired_bullets()
{
    return std::erase_if(m_bullets, [](const Bullet &b) { return b.ttl_ms <= 0; });
}

World::World(WorldConfig c) : cfg(c), rng(c.rng_seed != 0 ? c.rng_seed : std::random_device{}()) {}

} // namespace reef::game
