// SPDX-License-Identifier: Apache-2.0
// progress_sync.hpp
// Pushes economy snapshots to the profile store from a background thread so that
// store I/O never runs under the world lock or on the scheduler threads.
#pragma once

#include "server/profile/profile_store.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace reef::profile {

class ProgressSync
{
public:
    explicit ProgressSync(std::shared_ptr<IProfileStore> store);
    ~ProgressSync();

    ProgressSync(const ProgressSync &) = delete;
    ProgressSync &operator=(const ProgressSync &) = delete;

    // Copy the economy fields and return immediately. Writes are applied in FIFO order;
    // a failed write is logged and dropped. Ignored after stop().
    void queue(std::string username, Profile p);
    // Block until every queued write has been attempted.
    void wait_idle();
    // Drain pending writes and join the worker. Idempotent.
    void stop();

    uint64_t attempted() const;
    uint64_t failed() const;

private:
    struct Job
    {
        std::string username;
        Profile profile;
    };

    void worker();

    std::shared_ptr<IProfileStore> m_store;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv; // new job or stop
    std::condition_variable m_idle_cv; // queue drained
    std::deque<Job> m_jobs;
    bool m_running{true};
    bool m_busy{false};
    uint64_t m_attempted{0};
    uint64_t m_failed{0};
    std::thread m_thread;
};

} // namespace reef::profile
