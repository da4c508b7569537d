// SPDX-License-Identifier: Apache-2.0
#include "server/profile/profile_store.hpp"

#include "common/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>

namespace reef::profile {

YamlProfileStore::YamlProfileStore(std::string path) : m_path(std::move(path))
{
    load_file();
}

void YamlProfileStore::load_file()
{
    std::scoped_lock lk{m_mutex};
    m_users.clear();
    std::error_code ec;
    if (!std::filesystem::exists(m_path, ec)) {
        reef::log::info("[profile] ledger {} not found, starting empty", m_path);
        return;
    }
    try {
        YAML::Node root = YAML::LoadFile(m_path);
        YAML::Node users = root["users"];
        if (!users || !users.IsMap())
            return;
        for (const auto &kv : users) {
            const auto name = kv.first.as<std::string>();
            const YAML::Node &u = kv.second;
            Entry e;
            if (u["token"])
                e.token = u["token"].as<std::string>();
            if (u["gold"])
                e.profile.gold = u["gold"].as<uint64_t>();
            if (u["boats"] && u["boats"].IsSequence()) {
                e.profile.boats.clear();
                for (const auto &b : u["boats"])
                    e.profile.boats.push_back(b.as<uint32_t>());
            }
            if (u["level"])
                e.profile.level = u["level"].as<uint32_t>();
            if (u["fishes_caught"])
                e.profile.fishes_caught = u["fishes_caught"].as<uint64_t>();
            m_users.emplace(name, std::move(e));
        }
        reef::log::info("[profile] loaded {} users from {}", m_users.size(), m_path);
    } catch (const YAML::Exception &ex) {
        reef::log::error("[profile] failed to read {}: {}", m_path, ex.what());
        m_users.clear();
    }
}

bool YamlProfileStore::write_file(const Ledger &users)
{
    YAML::Emitter emitter;
    emitter << YAML::BeginMap << YAML::Key << "users" << YAML::Value << YAML::BeginMap;
    for (const auto &[name, e] : users) {
        emitter << YAML::Key << name << YAML::Value << YAML::BeginMap;
        emitter << YAML::Key << "token" << YAML::Value << e.token;
        emitter << YAML::Key << "gold" << YAML::Value << e.profile.gold;
        emitter << YAML::Key << "boats" << YAML::Value << YAML::Flow << YAML::BeginSeq;
        for (auto b : e.profile.boats)
            emitter << b;
        emitter << YAML::EndSeq;
        emitter << YAML::Key << "level" << YAML::Value << e.profile.level;
        emitter << YAML::Key << "fishes_caught" << YAML::Value << e.profile.fishes_caught;
        emitter << YAML::EndMap;
    }
    emitter << YAML::EndMap << YAML::EndMap;
    if (!emitter.good()) {
        reef::log::error("[profile] emitting ledger failed: {}", emitter.GetLastError());
        return false;
    }
    std::error_code ec;
    auto parent = std::filesystem::path(m_path).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent, ec);
    const std::string tmp = m_path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            reef::log::error("[profile] cannot open {} for writing", tmp);
            return false;
        }
        out << emitter.c_str() << '\n';
        if (!out) {
            reef::log::error("[profile] write to {} failed", tmp);
            return false;
        }
    }
    std::filesystem::rename(tmp, m_path, ec);
    if (ec) {
        reef::log::error("[profile] rename {} -> {} failed: {}", tmp, m_path, ec.message());
        return false;
    }
    return true;
}

std::optional<std::string> YamlProfileStore::resolve_token(std::string_view token)
{
    std::scoped_lock lk{m_mutex};
    for (const auto &[name, e] : m_users) {
        if (!e.token.empty() && e.token == token)
            return name;
    }
    return std::nullopt;
}

std::optional<Profile> YamlProfileStore::load_profile(const std::string &username)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_users.find(username);
    if (it == m_users.end())
        return std::nullopt;
    return it->second.profile;
}

bool YamlProfileStore::save_profile(const std::string &username, const Profile &p)
{
    // Writers queue on m_write_mutex so files land in save order; readers
    // only wait for the in-memory update and copy.
    std::scoped_lock write_lk{m_write_mutex};
    Ledger snapshot;
    {
        std::scoped_lock lk{m_mutex};
        m_users[username].profile = p;
        snapshot = m_users;
    }
    return write_file(snapshot);
}

size_t YamlProfileStore::user_count()
{
    std::scoped_lock lk{m_mutex};
    return m_users.size();
}

} // namespace reef::profile
