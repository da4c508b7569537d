// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide runtime counters (atomics, no dynamic allocation).
#pragma once
#include <atomic>
#include <cstdint>

namespace reef::metrics {

struct RuntimeCounters
{
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    // Power-of-two buckets for tick durations (base 250k ns) -> up to ~128ms.
    static constexpr int TICK_BUCKETS = 10;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{};
    // Gauges
    std::atomic<uint64_t> connected_players{0};
    std::atomic<uint64_t> fish_active{0};
    std::atomic<uint64_t> bullets_active{0};
    // Counters
    std::atomic<uint64_t> fish_spawned{0};
    std::atomic<uint64_t> fish_caught{0};
    std::atomic<uint64_t> fish_expired{0};
    std::atomic<uint64_t> bullets_fired{0};
    std::atomic<uint64_t> bullet_hits{0};
    std::atomic<uint64_t> boats_purchased{0};
    std::atomic<uint64_t> purchases_rejected{0};
    std::atomic<uint64_t> profile_saves{0};
    std::atomic<uint64_t> profile_save_failures{0};
    std::atomic<uint64_t> profile_load_failures{0};
    std::atomic<uint64_t> state_broadcasts{0};
    std::atomic<uint64_t> state_bytes{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline void add_tick_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.tick_samples.fetch_add(1, std::memory_order_relaxed);
    constexpr uint64_t base = 250000; // 0.25ms
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        if (ns < (base << i)) {
            rt.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.tick_hist[RuntimeCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

inline uint64_t approx_tick_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99 - 1) / 100; // ceil(total*0.99)
    constexpr uint64_t base = 250000;
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return (base << i);
    }
    return (base << (RuntimeCounters::TICK_BUCKETS - 1));
}

inline uint64_t avg_tick_ns()
{
    auto &rt = runtime();
    uint64_t samples = rt.tick_samples.load(std::memory_order_relaxed);
    return samples ? rt.tick_duration_ns_accum.load(std::memory_order_relaxed) / samples : 0;
}

} // namespace reef::metrics
