// SPDX-License-Identifier: Apache-2.0
// metrics_http.hpp
// Prometheus text-format metrics endpoint (HTTP/1.1, one request per connection).
#pragma once
#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace reef::net {

std::string build_metrics_body();

// Serves GET /metrics until running is cleared.
coro::task<void> run_metrics_endpoint(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, std::shared_ptr<std::atomic_bool> running);

} // namespace reef::net
