// SPDX-License-Identifier: Apache-2.0
// profile_store.hpp
// Collaborator boundary for the persisted per-user economy (gold, boats, level, catch count).
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace reef::profile {

struct Profile
{
    uint64_t gold{250};
    std::vector<uint32_t> boats{0};
    uint32_t level{1};
    uint64_t fishes_caught{0};

    bool operator==(const Profile &) const = default;
};

class IProfileStore
{
public:
    virtual ~IProfileStore() = default;
    // Bearer token -> username; nullopt when no user holds the token.
    virtual std::optional<std::string> resolve_token(std::string_view token) = 0;
    // nullopt when the user is unknown or the read failed.
    virtual std::optional<Profile> load_profile(const std::string &username) = 0;
    // Overwrites the stored economy fields; false when the write failed.
    virtual bool save_profile(const std::string &username, const Profile &p) = 0;
};

// In-process store. Counts calls so callers can verify which paths touched it.
class MemoryProfileStore : public IProfileStore
{
public:
    void add_user(const std::string &username, const std::string &token, Profile p = {});
    void set_fail_writes(bool fail) noexcept { m_fail_writes.store(fail, std::memory_order_relaxed); }

    std::optional<std::string> resolve_token(std::string_view token) override;
    std::optional<Profile> load_profile(const std::string &username) override;
    bool save_profile(const std::string &username, const Profile &p) override;

    uint64_t resolve_calls() const noexcept { return m_resolve_calls.load(); }
    uint64_t load_calls() const noexcept { return m_load_calls.load(); }
    uint64_t save_calls() const noexcept { return m_save_calls.load(); }

private:
    struct Entry
    {
        std::string token;
        Profile profile;
    };

    std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_users;
    std::atomic<bool> m_fail_writes{false};
    std::atomic<uint64_t> m_resolve_calls{0};
    std::atomic<uint64_t> m_load_calls{0};
    std::atomic<uint64_t> m_save_calls{0};
};

// YAML ledger file:
//   users:
//     alice: {token: "...", gold: 250, boats: [0], level: 1, fishes_caught: 0}
// Read once at construction and rewritten in full on every save.
class YamlProfileStore : public IProfileStore
{
public:
    explicit YamlProfileStore(std::string path);

    std::optional<std::string> resolve_token(std::string_view token) override;
    std::optional<Profile> load_profile(const std::string &username) override;
    bool save_profile(const std::string &username, const Profile &p) override;

    size_t user_count();

private:
    struct Entry
    {
        std::string token;
        Profile profile;
    };

    using Ledger = std::unordered_map<std::string, Entry>;

    void load_file();
    bool write_file(const Ledger &users);

    std::string m_path;
    // Serializes ledger rewrites; never held together with m_mutex across I/O.
    std::mutex m_write_mutex;
    std::mutex m_mutex;
    Ledger m_users;
};

// Factory by mode string ("memory", "yaml"). Unknown modes fall back to memory.
std::unique_ptr<IProfileStore> make_store(const std::string &mode, const std::string &path);

} // namespace reef::profile
