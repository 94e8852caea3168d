#include "chanvault/storage/channel_directory.hpp"
#include "chanvault/core/log.hpp"
#include "sqlite_util.hpp"

namespace chanvault {

using detail::sql_exec;
using detail::sql_step_retry;

namespace {

constexpr const char* DIRECTORY_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS channels (
    owner_id INTEGER NOT NULL,
    channel_id INTEGER NOT NULL,
    channel_name TEXT NOT NULL DEFAULT '',
    selected INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (owner_id, channel_id)
) WITHOUT ROWID;

CREATE TABLE IF NOT EXISTS bots (
    owner_id INTEGER NOT NULL,
    channel_id INTEGER NOT NULL,
    token TEXT NOT NULL,
    PRIMARY KEY (owner_id, channel_id, token)
) WITHOUT ROWID;
)";

}  // namespace

ChannelDirectory::ChannelDirectory(const std::filesystem::path& db_path,
                                   std::chrono::seconds cache_ttl)
    : cache_ttl_(cache_ttl) {
    db_ = detail::open_database(db_path, DIRECTORY_SCHEMA, "channel directory");
    try {
        stmt_default_ = detail::prepare(db_,
            "SELECT channel_id FROM channels WHERE owner_id = ?1 AND selected = 1 LIMIT 1");
        stmt_bots_ = detail::prepare(db_,
            "SELECT token FROM bots WHERE owner_id = ?1 AND channel_id = ?2 ORDER BY token");
        stmt_add_channel_ = detail::prepare(db_,
            "INSERT INTO channels (owner_id, channel_id, channel_name, selected) "
            "VALUES (?1, ?2, ?3, 0) "
            "ON CONFLICT(owner_id, channel_id) DO UPDATE SET channel_name = excluded.channel_name");
        stmt_clear_selected_ = detail::prepare(db_,
            "UPDATE channels SET selected = 0 WHERE owner_id = ?1 AND channel_id != ?2");
        stmt_set_selected_ = detail::prepare(db_,
            "UPDATE channels SET selected = 1 WHERE owner_id = ?1 AND channel_id = ?2");
        stmt_add_bot_ = detail::prepare(db_,
            "INSERT OR IGNORE INTO bots (owner_id, channel_id, token) VALUES (?1, ?2, ?3)");
        stmt_remove_bot_ = detail::prepare(db_,
            "DELETE FROM bots WHERE owner_id = ?1 AND channel_id = ?2 AND token = ?3");
    } catch (...) {
        finalize_all();
        throw;
    }
}

ChannelDirectory::~ChannelDirectory() {
    finalize_all();
}

void ChannelDirectory::finalize_all() {
    for (auto* stmt : {stmt_default_, stmt_bots_, stmt_add_channel_, stmt_clear_selected_,
                       stmt_set_selected_, stmt_add_bot_, stmt_remove_bot_}) {
        if (stmt) sqlite3_finalize(stmt);
    }
    stmt_default_ = stmt_bots_ = stmt_add_channel_ = stmt_clear_selected_ = nullptr;
    stmt_set_selected_ = stmt_add_bot_ = stmt_remove_bot_ = nullptr;
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::optional<transport::ChannelId> ChannelDirectory::default_channel(int64_t owner_id) {
    auto now = Clock::now();
    uint64_t generation;
    {
        std::lock_guard lock(cache_mutex_);
        auto it = default_cache_.find(owner_id);
        if (it != default_cache_.end() && it->second.expires > now) return it->second.value;
        generation = generation_;
    }

    std::optional<transport::ChannelId> channel;
    {
        std::lock_guard lock(db_mutex_);
        sqlite3_reset(stmt_default_);
        sqlite3_bind_int64(stmt_default_, 1, owner_id);
        if (sql_step_retry(stmt_default_) == SQLITE_ROW) {
            channel = sqlite3_column_int64(stmt_default_, 0);
        }
        sqlite3_reset(stmt_default_);
    }

    if (cache_ttl_.count() > 0) {
        std::lock_guard lock(cache_mutex_);
        // A write since the read may have made it stale
        if (generation == generation_) default_cache_[owner_id] = {channel, now + cache_ttl_};
    }
    return channel;
}

std::vector<std::string> ChannelDirectory::bot_tokens(int64_t owner_id,
                                                      transport::ChannelId channel) {
    auto key = std::make_pair(owner_id, channel);
    auto now = Clock::now();
    uint64_t generation;
    {
        std::lock_guard lock(cache_mutex_);
        auto it = bot_cache_.find(key);
        if (it != bot_cache_.end() && it->second.expires > now) return it->second.value;
        generation = generation_;
    }

    std::vector<std::string> tokens;
    {
        std::lock_guard lock(db_mutex_);
        sqlite3_reset(stmt_bots_);
        sqlite3_bind_int64(stmt_bots_, 1, owner_id);
        sqlite3_bind_int64(stmt_bots_, 2, channel);
        while (sql_step_retry(stmt_bots_) == SQLITE_ROW) {
            auto text = sqlite3_column_text(stmt_bots_, 0);
            if (text) tokens.emplace_back(reinterpret_cast<const char*>(text));
        }
        sqlite3_reset(stmt_bots_);
    }

    if (cache_ttl_.count() > 0) {
        std::lock_guard lock(cache_mutex_);
        if (generation == generation_) bot_cache_[key] = {tokens, now + cache_ttl_};
    }
    return tokens;
}

bool ChannelDirectory::set_selected_locked(int64_t owner_id, transport::ChannelId channel) {
    if (!sql_exec(db_, "BEGIN IMMEDIATE")) return false;

    sqlite3_reset(stmt_set_selected_);
    sqlite3_bind_int64(stmt_set_selected_, 1, owner_id);
    sqlite3_bind_int64(stmt_set_selected_, 2, channel);
    bool ok = sql_step_retry(stmt_set_selected_) == SQLITE_DONE && sqlite3_changes(db_) == 1;

    if (ok) {
        sqlite3_reset(stmt_clear_selected_);
        sqlite3_bind_int64(stmt_clear_selected_, 1, owner_id);
        sqlite3_bind_int64(stmt_clear_selected_, 2, channel);
        ok = sql_step_retry(stmt_clear_selected_) == SQLITE_DONE;
    }
    sqlite3_reset(stmt_set_selected_);
    sqlite3_reset(stmt_clear_selected_);

    sql_exec(db_, ok ? "COMMIT" : "ROLLBACK");
    return ok;
}

bool ChannelDirectory::add_channel(int64_t owner_id, transport::ChannelId channel,
                                   const std::string& name, bool selected) {
    bool ok;
    {
        std::lock_guard lock(db_mutex_);
        sqlite3_reset(stmt_add_channel_);
        sqlite3_bind_int64(stmt_add_channel_, 1, owner_id);
        sqlite3_bind_int64(stmt_add_channel_, 2, channel);
        sqlite3_bind_text(stmt_add_channel_, 3, name.c_str(), -1, SQLITE_TRANSIENT);
        ok = sql_step_retry(stmt_add_channel_) == SQLITE_DONE;
        if (!ok) log_error("directory: cannot add channel %lld: %s",
                           static_cast<long long>(channel), sqlite3_errmsg(db_));
        sqlite3_reset(stmt_add_channel_);
        if (ok && selected) ok = set_selected_locked(owner_id, channel);
    }

    std::lock_guard lock(cache_mutex_);
    default_cache_.erase(owner_id);
    ++generation_;
    return ok;
}

bool ChannelDirectory::select_channel(int64_t owner_id, transport::ChannelId channel) {
    bool ok;
    {
        std::lock_guard lock(db_mutex_);
        ok = set_selected_locked(owner_id, channel);
    }
    std::lock_guard lock(cache_mutex_);
    default_cache_.erase(owner_id);
    ++generation_;
    return ok;
}

bool ChannelDirectory::add_bot(int64_t owner_id, transport::ChannelId channel,
                               const std::string& token) {
    bool ok;
    {
        std::lock_guard lock(db_mutex_);
        sqlite3_reset(stmt_add_bot_);
        sqlite3_bind_int64(stmt_add_bot_, 1, owner_id);
        sqlite3_bind_int64(stmt_add_bot_, 2, channel);
        sqlite3_bind_text(stmt_add_bot_, 3, token.c_str(), -1, SQLITE_TRANSIENT);
        ok = sql_step_retry(stmt_add_bot_) == SQLITE_DONE;
        if (!ok) log_error("directory: cannot add bot: %s", sqlite3_errmsg(db_));
        sqlite3_reset(stmt_add_bot_);
    }
    std::lock_guard lock(cache_mutex_);
    bot_cache_.erase(std::make_pair(owner_id, channel));
    ++generation_;
    return ok;
}

bool ChannelDirectory::remove_bot(int64_t owner_id, transport::ChannelId channel,
                                  const std::string& token) {
    bool ok;
    {
        std::lock_guard lock(db_mutex_);
        sqlite3_reset(stmt_remove_bot_);
        sqlite3_bind_int64(stmt_remove_bot_, 1, owner_id);
        sqlite3_bind_int64(stmt_remove_bot_, 2, channel);
        sqlite3_bind_text(stmt_remove_bot_, 3, token.c_str(), -1, SQLITE_TRANSIENT);
        ok = sql_step_retry(stmt_remove_bot_) == SQLITE_DONE && sqlite3_changes(db_) > 0;
        sqlite3_reset(stmt_remove_bot_);
    }
    std::lock_guard lock(cache_mutex_);
    bot_cache_.erase(std::make_pair(owner_id, channel));
    ++generation_;
    return ok;
}

}  // namespace chanvault
