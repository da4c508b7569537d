// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

// Per-callsite rate-limited logging: emits every Nth invocation at the given level.
// Usage: REEF_LOG_EVERY_N(debug, 150, "[tick] n={} fish={}", n, fish);
#define REEF_LOG_EVERY_N_CONCAT_(a, b) a##b
#define REEF_LOG_EVERY_N_NAME_(line) REEF_LOG_EVERY_N_CONCAT_(reef_log_counter_, line)
#define REEF_LOG_EVERY_N(level, N, ...) \
    do { \
        static std::atomic<uint64_t> REEF_LOG_EVERY_N_NAME_(__LINE__){0}; \
        if ((REEF_LOG_EVERY_N_NAME_(__LINE__).fetch_add(1, std::memory_order_relaxed) + 1) % (N) == 0) { \
            reef::log::level(__VA_ARGS__); \
        } \
    } while (0)
