// SPDX-License-Identifier: Apache-2.0
#include "server/config.hpp"

#include <yaml-cpp/yaml.h>

namespace reef {

namespace {

ServerConfig from_node(const YAML::Node &root)
{
    ServerConfig cfg;
    if (root["listen_port"])
        cfg.listen_port = root["listen_port"].as<uint16_t>();
    if (root["metrics_port"])
        cfg.metrics_port = root["metrics_port"].as<uint16_t>();
    if (root["log_level"])
        cfg.log_level = root["log_level"].as<std::string>();
    if (root["log_json"])
        cfg.log_json = root["log_json"].as<bool>();
    if (root["world_width"])
        cfg.world_width = root["world_width"].as<float>();
    if (root["world_height"])
        cfg.world_height = root["world_height"].as<float>();
    if (root["tick_ms"])
        cfg.tick_ms = root["tick_ms"].as<int32_t>();
    if (root["spawn_interval_ms"])
        cfg.spawn_interval_ms = root["spawn_interval_ms"].as<int32_t>();
    if (root["fish_ttl_ms"])
        cfg.fish_ttl_ms = root["fish_ttl_ms"].as<int32_t>();
    if (root["bullet_ttl_ms"])
        cfg.bullet_ttl_ms = root["bullet_ttl_ms"].as<int32_t>();
    if (root["bullet_speed"])
        cfg.bullet_speed = root["bullet_speed"].as<float>();
    if (root["hit_radius"])
        cfg.hit_radius = root["hit_radius"].as<float>();
    if (root["bullet_damage"])
        cfg.bullet_damage = root["bullet_damage"].as<uint32_t>();
    if (root["catch_radius"])
        cfg.catch_radius = root["catch_radius"].as<float>();
    if (root["fish_jitter"])
        cfg.fish_jitter = root["fish_jitter"].as<float>();
    if (root["starting_gold"])
        cfg.starting_gold = root["starting_gold"].as<uint64_t>();
    if (root["max_boats"])
        cfg.max_boats = root["max_boats"].as<uint32_t>();
    if (root["profile_store"])
        cfg.profile_store = root["profile_store"].as<std::string>();
    if (root["profile_path"])
        cfg.profile_path = root["profile_path"].as<std::string>();
    if (root["rng_seed"])
        cfg.rng_seed = root["rng_seed"].as<uint32_t>();
    // Non-positive periods would spin the periodic tasks.
    if (cfg.tick_ms <= 0)
        cfg.tick_ms = 66;
    if (cfg.spawn_interval_ms <= 0)
        cfg.spawn_interval_ms = 3000;
    return cfg;
}

} // namespace

ServerConfig load_config(const std::string &path)
{
    return from_node(YAML::LoadFile(path));
}

ServerConfig parse_config(const std::string &yaml_text)
{
    return from_node(YAML::Load(yaml_text));
}

game::WorldConfig to_world_config(const ServerConfig &cfg)
{
    game::WorldConfig w;
    w.width = cfg.world_width;
    w.height = cfg.world_height;
    w.tick_ms = cfg.tick_ms;
    w.spawn_interval_ms = cfg.spawn_interval_ms;
    w.fish_ttl_ms = cfg.fish_ttl_ms;
    w.bullet_ttl_ms = cfg.bullet_ttl_ms;
    w.bullet_speed = cfg.bullet_speed;
    w.hit_radius = cfg.hit_radius;
    w.bullet_damage = cfg.bullet_damage;
    w.catch_radius = cfg.catch_radius;
    w.fish_jitter = cfg.fish_jitter;
    w.starting_gold = cfg.starting_gold;
    w.max_boats = cfg.max_boats;
    w.rng_seed = cfg.rng_seed;
    return w;
}

} // namespace reef
