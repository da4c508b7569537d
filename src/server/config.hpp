// SPDX-License-Identifier: Apache-2.0
// config.hpp - Server configuration loaded from YAML (every key optional).
#pragma once

#include "server/game/world.hpp"

#include <cstdint>
#include <string>

namespace reef {

struct ServerConfig
{
    uint16_t listen_port{40100};
    uint16_t metrics_port{0}; // 0 disables
    std::string log_level{"info"};
    bool log_json{false};
    float world_width{1200.f};
    float world_height{700.f};
    int32_t tick_ms{66};
    int32_t spawn_interval_ms{3000};
    int32_t fish_ttl_ms{30000};
    int32_t bullet_ttl_ms{3000};
    float bullet_speed{12.f};
    float hit_radius{28.f};
    uint32_t bullet_damage{25};
    float catch_radius{120.f};
    float fish_jitter{0.8f};
    uint64_t starting_gold{250};
    uint32_t max_boats{3};
    std::string profile_store{"memory"};
    std::string profile_path{"data/users.yaml"};
    uint32_t rng_seed{0};
};

// Throws YAML::Exception when the file is missing or malformed.
ServerConfig load_config(const std::string &path);
// Same key handling, from an in-memory document.
ServerConfig parse_config(const std::string &yaml_text);

game::WorldConfig to_world_config(const ServerConfig &cfg);

} // namespace reef
