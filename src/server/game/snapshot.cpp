// SPDX-License-Identifier: Apache-2.0
#include "server/game/snapshot.hpp"

namespace reef::game {

void fill_player(const Player &p, reef::PlayerState *out)
{
    out->set_id(p.id);
    out->set_name(p.name);
    out->set_x(p.pos.x);
    out->set_y(p.pos.y);
    out->set_angle(p.angle);
    out->set_hp(p.hp);
    out->set_energy(p.energy);
    out->set_gold(p.gold);
    for (auto b : p.boats)
        out->add_boats(b);
    out->set_selected_boat(p.selected_boat);
    out->set_fishes_caught(p.fishes_caught);
    out->set_level(p.level);
}

void fill_fish(const Fish &f, reef::FishState *out)
{
    out->set_id(f.id);
    out->set_x(f.pos.x);
    out->set_y(f.pos.y);
    out->set_type(f.type);
    out->set_reward(f.reward);
    out->set_ttl_ms(f.ttl_ms);
}

void fill_bullet(const Bullet &b, reef::BulletState *out)
{
    out->set_id(b.id);
    out->set_owner(b.owner);
    out->set_x(b.pos.x);
    out->set_y(b.pos.y);
    out->set_vx(b.vel.x);
    out->set_vy(b.vel.y);
    out->set_ttl_ms(b.ttl_ms);
}

void fill_boat(const BoatSpec &b, reef::BoatInfo *out)
{
    out->set_id(b.id);
    out->set_key(std::string(b.key));
    out->set_name(std::string(b.name));
    out->set_cost(b.cost);
}

void fill_state(const World &world, reef::WorldState *out)
{
    const auto &reg = world.registry;
    out->set_tick(world.tick);
    auto players = reg.players();
    auto fishes = reg.fishes();
    auto bullets = reg.bullets();
    out->mutable_players()->Reserve(static_cast<int>(players.size()));
    out->mutable_fishes()->Reserve(static_cast<int>(fishes.size()));
    out->mutable_bullets()->Reserve(static_cast<int>(bullets.size()));
    for (const auto &p : players)
        fill_player(p, out->add_players());
    for (const auto &f : fishes)
        fill_fish(f, out->add_fishes());
    for (const auto &b : bullets)
        fill_bullet(b, out->add_bullets());
}

void fill_welcome(const WorldConfig &cfg, const std::string &session_id, const std::string *username, reef::Welcome *out)
{
    out->set_id(session_id);
    for (const auto &b : boat_catalog())
        fill_boat(b, out->add_boats());
    for (const auto &f : fish_table()) {
        auto *ft = out->add_fish_types();
        ft->set_id(f.id);
        ft->set_name(std::string(f.name));
        ft->set_reward(f.reward);
        ft->set_chance(f.chance);
    }
    for (const auto &c : combination_table()) {
        auto *cm = out->add_combinations();
        for (auto key : c.combo)
            cm->add_combo(std::string(key));
        cm->set_result(std::string(c.result));
    }
    if (username)
        out->set_user(*username);
    out->set_world_width(cfg.width);
    out->set_world_height(cfg.height);
}

} // namespace reef::game
