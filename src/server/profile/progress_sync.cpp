// SPDX-License-Identifier: Apache-2.0
#include "server/profile/progress_sync.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <exception>

namespace reef::profile {

ProgressSync::ProgressSync(std::shared_ptr<IProfileStore> store) : m_store(std::move(store))
{
    m_thread = std::thread([this] { worker(); });
}

ProgressSync::~ProgressSync()
{
    stop();
}

void ProgressSync::queue(std::string username, Profile p)
{
    {
        std::scoped_lock lk{m_mutex};
        if (!m_running) {
            reef::log::warn("[progress] dropped write for {} after shutdown", username);
            return;
        }
        m_jobs.push_back(Job{std::move(username), std::move(p)});
    }
    m_cv.notify_one();
}

void ProgressSync::wait_idle()
{
    std::unique_lock lk{m_mutex};
    m_idle_cv.wait(lk, [this] { return m_jobs.empty() && !m_busy; });
}

void ProgressSync::stop()
{
    {
        std::scoped_lock lk{m_mutex};
        if (!m_running)
            return;
        m_running = false;
    }
    m_cv.notify_all();
    if (m_thread.joinable())
        m_thread.join();
}

uint64_t ProgressSync::attempted() const
{
    std::scoped_lock lk{m_mutex};
    return m_attempted;
}

uint64_t ProgressSync::failed() const
{
    std::scoped_lock lk{m_mutex};
    return m_failed;
}

void ProgressSync::worker()
{
    auto &rt = reef::metrics::runtime();
    std::unique_lock lk{m_mutex};
    while (true) {
        m_cv.wait(lk, [this] { return !m_running || !m_jobs.empty(); });
        if (m_jobs.empty()) {
            if (!m_running)
                break;
            continue;
        }
        Job job = std::move(m_jobs.front());
        m_jobs.pop_front();
        m_busy = true;
        lk.unlock();
        bool ok = false;
        try {
            ok = m_store->save_profile(job.username, job.profile);
        } catch (const std::exception &ex) {
            reef::log::error("[progress] save for {} threw: {}", job.username, ex.what());
        } catch (...) {
            reef::log::error("[progress] save for {} threw a non-standard exception", job.username);
        }
        if (ok) {
            rt.profile_saves.fetch_add(1, std::memory_order_relaxed);
            reef::log::debug(
                "[progress] saved {} gold={} boats={} caught={}",
                job.username,
                job.profile.gold,
                job.profile.boats.size(),
                job.profile.fishes_caught);
        } else {
            rt.profile_save_failures.fetch_add(1, std::memory_order_relaxed);
            reef::log::warn("[progress] save for {} failed, not retried", job.username);
        }
        lk.lock();
        ++m_attempted;
        if (!ok)
            ++m_failed;
        m_busy = false;
        if (m_jobs.empty())
            m_idle_cv.notify_all();
    }
    m_idle_cv.notify_all();
}

} // namespace reef::profile
