// SPDX-License-Identifier: Apache-2.0
// world.hpp - Entity registry (players, fish, bullets) and the shared World that owns it.
#pragma once

#include <box2d/math_functions.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace reef::game {

struct WorldConfig
{
    float width{1200.f};
    float height{700.f};
    int32_t tick_ms{66};
    int32_t spawn_interval_ms{3000};
    int32_t fish_ttl_ms{30000};
    int32_t bullet_ttl_ms{3000};
    float bullet_speed{12.f}; // units per tick
    float hit_radius{28.f};
    uint32_t bullet_damage{25};
    float catch_radius{120.f};
    float fish_jitter{0.8f}; // max horizontal drift per tick
    float fish_margin{10.f}; // fish x stays within [margin, width - margin]
    uint64_t starting_gold{250};
    uint32_t max_boats{3};
    uint32_t rng_seed{0}; // 0 = seed from std::random_device
};

struct Player
{
    std::string id; // session id
    std::string name;
    std::string username; // empty for guests
    b2Vec2 pos{0.f, 0.f};
    float angle{0.f};
    uint32_t hp{100};
    uint32_t energy{100};
    uint64_t gold{250};
    std::vector<uint32_t> boats{0};
    uint32_t selected_boat{0};
    uint32_t level{1};
    uint64_t fishes_caught{0};
    std::chrono::steady_clock::time_point last_seen{};
};

struct FishSpawn
{
    b2Vec2 pos;
    uint32_t type;
    uint32_t reward;
    int32_t ttl_ms;
};

struct Fish
{
    uint32_t id;
    b2Vec2 pos;
    uint32_t type;
    uint32_t reward; // copied from the species table at spawn time
    int32_t ttl_ms;
};

struct BulletSpawn
{
    std::string owner;
    b2Vec2 pos;
    b2Vec2 vel;
    int32_t ttl_ms;
};

struct Bullet
{
    uint32_t id;
    std::string owner;
    b2Vec2 pos;
    b2Vec2 vel; // units per tick
    int32_t ttl_ms;
};

// Canonical collections. Membership changes only through the create/remove methods; element
// access is handed out as spans so collaborators can update fields but not add or drop entities.
// Returned references and spans are invalidated by the next membership change.
// Not thread-safe: callers hold World::mutex.
class Registry
{
public:
    Player &create_player(std::string session_id, Player initial);
    void remove_player(std::string_view session_id);
    Player *find_player(std::string_view session_id);
    const Player *find_player(std::string_view session_id) const;

    Fish &create_fish(const FishSpawn &spec);
    void remove_fish(uint32_t id);
    Fish *find_fish(uint32_t id);

    Bullet &create_bullet(const BulletSpawn &spec);
    void remove_bullet(uint32_t id);
    Bullet *find_bullet(uint32_t id);

    // Drop every fish/bullet whose ttl reached zero; returns the number removed.
    size_t remove_expired_fish();
    size_t remove_expired_bullets();

    std::span<Player> players() { return m_players; }
    std::span<const Player> players() const { return m_players; }
    std::span<Fish> fishes() { return m_fishes; }
    std::span<const Fish> fishes() const { return m_fishes; }
    std::span<Bullet> bullets() { return m_bullets; }
    std::span<const Bullet> bullets() const { return m_bullets; }

private:
    std::vector<Player> m_players; // join order
    std::vector<Fish> m_fishes; // ascending id
    std::vector<Bullet> m_bullets; // ascending id
    uint32_t m_next_fish_id{1};
    uint32_t m_next_bullet_id{1};
};

// Shared authoritative state. Every read or write of registry/rng/tick happens under mutex:
// the tick pass holds it for resolve + snapshot build, intent handlers for their whole mutation.
struct World
{
    explicit World(WorldConfig c);

    WorldConfig cfg;
    std::mutex mutex;
    Registry registry;
    std::mt19937 rng;
    uint64_t tick{0};
    std::atomic_bool running{true}; // cleared to stop the periodic tasks
};

inline b2Vec2 clamp_to_world(const WorldConfig &cfg, b2Vec2 p)
{
    return {std::clamp(p.x, 0.f, cfg.width), std::clamp(p.y, 0.f, cfg.height)};
}

} // namespace reef::game
