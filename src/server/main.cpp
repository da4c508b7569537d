// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/config.hpp"
#include "server/profile/profile_store.hpp"
#include "server/server.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#ifndef REEF_VERSION
#define REEF_VERSION "dev"
#endif

namespace {

std::atomic_bool g_shutdown{false};

void handle_signal(int)
{
    g_shutdown.store(true);
}

std::string runtime_metrics_json(const char *name)
{
    auto &rt = reef::metrics::runtime();
    std::ostringstream j;
    j << "{\"metric\":\"" << name << "\"";
    j << ",\"avg_tick_ns\":" << reef::metrics::avg_tick_ns();
    j << ",\"p99_tick_ns\":" << reef::metrics::approx_tick_p99();
    j << ",\"samples\":" << rt.tick_samples.load();
    j << ",\"connected_players\":" << rt.connected_players.load();
    j << ",\"fish_active\":" << rt.fish_active.load();
    j << ",\"bullets_active\":" << rt.bullets_active.load();
    j << ",\"fish_caught\":" << rt.fish_caught.load();
    j << ",\"bullet_hits\":" << rt.bullet_hits.load();
    j << ",\"boats_purchased\":" << rt.boats_purchased.load();
    j << ",\"profile_save_failures\":" << rt.profile_save_failures.load();
    j << "}";
    return j.str();
}

} // namespace

int main(int argc, char **argv)
{
    std::string config_path = "config/server.yaml";
    bool cli_port_override = false;
    uint16_t port_override = 0;
    int duration_override_sec = 0; // 0 means run until signal
    // First non-flag argument is the config path.
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port" && i + 1 < argc) {
            try {
                port_override = static_cast<uint16_t>(std::stoi(argv[++i]));
                cli_port_override = true;
            } catch (const std::exception &) {
                reef::log::warn("Invalid --port value '{}', ignoring", argv[i]);
            }
        } else if (a == "--duration" && i + 1 < argc) {
            try {
                duration_override_sec = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                reef::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        }
    }
    reef::ServerConfig cfg;
    try {
        cfg = reef::load_config(config_path);
    } catch (const std::exception &ex) {
        reef::log::error("Failed to load config '{}': {}", config_path, ex.what());
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // An explicit REEF_LOG_LEVEL in the environment wins over the config file.
    if (!cfg.log_level.empty() && std::getenv("REEF_LOG_LEVEL") == nullptr)
        reef::log::set_level(cfg.log_level);
    if (cfg.log_json)
        reef::log::set_json(true);
    reef::log::init();
    reef::log::info("reef server starting (version: {})", REEF_VERSION);
    if (cli_port_override) {
        cfg.listen_port = port_override;
        reef::log::info("CLI override: listen_port set to {}", cfg.listen_port);
    }
    if (duration_override_sec > 0)
        reef::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);
    reef::log::info("Tick: {} ms, spawn every {} ms", cfg.tick_ms, cfg.spawn_interval_ms);
    reef::log::info("World: {}x{}", cfg.world_width, cfg.world_height);
    reef::log::info("Profile store: {} ({})", cfg.profile_store, cfg.profile_path);

    std::shared_ptr<reef::profile::IProfileStore> store = reef::profile::make_store(cfg.profile_store, cfg.profile_path);
    auto server = std::make_unique<reef::Server>(cfg, store);
    auto scheduler = coro::default_executor::io_executor();
    server->start(scheduler);

    auto run_start = std::chrono::steady_clock::now();
    auto last_metrics = run_start;
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        auto now = std::chrono::steady_clock::now();
        if (duration_override_sec > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - run_start).count();
            if (elapsed >= duration_override_sec) {
                reef::log::info("Duration reached ({}s >= {}s); initiating shutdown", elapsed, duration_override_sec);
                g_shutdown.store(true);
            }
        }
        if (now - last_metrics >= std::chrono::seconds(60)) {
            last_metrics = now;
            reef::log::info("{}", runtime_metrics_json("runtime"));
        }
    }
    reef::log::info("Signal or duration shutdown requested");
    server->shutdown();
    // Give connection and periodic coroutines one poll interval to observe the stop flag.
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    reef::log::info("{}", runtime_metrics_json("runtime_final"));
    reef::log::info("Shutdown complete.");
    return 0;
}
