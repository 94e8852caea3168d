#pragma once

#include "chanvault/transport/transport.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace chanvault {

/// Per-owner channel registry and delegated (bot) tokens, with a TTL cache
/// in front of SQLite. Writes go straight to the database and drop the
/// affected cache entries.
class ChannelDirectory {
public:
    /// Open or create the directory tables. Throws std::runtime_error on failure.
    ChannelDirectory(const std::filesystem::path& db_path, std::chrono::seconds cache_ttl);
    ~ChannelDirectory();

    ChannelDirectory(const ChannelDirectory&) = delete;
    ChannelDirectory& operator=(const ChannelDirectory&) = delete;

    /// The owner's selected channel, if any
    std::optional<transport::ChannelId> default_channel(int64_t owner_id);

    /// Bot tokens registered for (owner, channel), sorted
    std::vector<std::string> bot_tokens(int64_t owner_id, transport::ChannelId channel);

    /// Register a channel. selected = true makes it the owner's default.
    bool add_channel(int64_t owner_id, transport::ChannelId channel,
                     const std::string& name, bool selected);

    /// Make a registered channel the owner's default. False if not registered.
    bool select_channel(int64_t owner_id, transport::ChannelId channel);

    bool add_bot(int64_t owner_id, transport::ChannelId channel, const std::string& token);
    bool remove_bot(int64_t owner_id, transport::ChannelId channel, const std::string& token);

private:
    using Clock = std::chrono::steady_clock;

    template <typename T>
    struct Cached {
        T value;
        Clock::time_point expires;
    };

    bool set_selected_locked(int64_t owner_id, transport::ChannelId channel);
    void finalize_all();

    std::chrono::seconds cache_ttl_;

    std::mutex cache_mutex_;
    std::map<int64_t, Cached<std::optional<transport::ChannelId>>> default_cache_;
    std::map<std::pair<int64_t, transport::ChannelId>, Cached<std::vector<std::string>>> bot_cache_;
    uint64_t generation_ = 0;  // Bumped on every write; reads started earlier are not cached

    std::mutex db_mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_default_ = nullptr;
    sqlite3_stmt* stmt_bots_ = nullptr;
    sqlite3_stmt* stmt_add_channel_ = nullptr;
    sqlite3_stmt* stmt_clear_selected_ = nullptr;
    sqlite3_stmt* stmt_set_selected_ = nullptr;
    sqlite3_stmt* stmt_add_bot_ = nullptr;
    sqlite3_stmt* stmt_remove_bot_ = nullptr;
};

}  // namespace chanvault
