// SPDX-License-Identifier: Apache-2.0
#include "server/profile/profile_store.hpp"

#include "common/logger.hpp"

namespace reef::profile {

void MemoryProfileStore::add_user(const std::string &username, const std::string &token, Profile p)
{
    std::scoped_lock lk{m_mutex};
    m_users[username] = Entry{token, std::move(p)};
}

std::optional<std::string> MemoryProfileStore::resolve_token(std::string_view token)
{
    m_resolve_calls.fetch_add(1, std::memory_order_relaxed);
    std::scoped_lock lk{m_mutex};
    for (const auto &[name, e] : m_users) {
        if (!e.token.empty() && e.token == token)
            return name;
    }
    return std::nullopt;
}

std::optional<Profile> MemoryProfileStore::load_profile(const std::string &username)
{
    m_load_calls.fetch_add(1, std::memory_order_relaxed);
    std::scoped_lock lk{m_mutex};
    auto it = m_users.find(username);
    if (it == m_users.end())
        return std::nullopt;
    return it->second.profile;
}

bool MemoryProfileStore::save_profile(const std::string &username, const Profile &p)
{
    m_save_calls.fetch_add(1, std::memory_order_relaxed);
    if (m_fail_writes.load(std::memory_order_relaxed))
        return false;
    std::scoped_lock lk{m_mutex};
    m_users[username].profile = p;
    return true;
}

std::unique_ptr<IProfileStore> make_store(const std::string &mode, const std::string &path)
{
    if (mode == "yaml")
        return std::make_unique<YamlProfileStore>(path);
    if (mode != "memory")
        reef::log::warn("[profile] unknown store mode '{}', using memory", mode);
    return std::make_unique<MemoryProfileStore>();
}

} // namespace reef::profile
