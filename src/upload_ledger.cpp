#include "chanvault/storage/upload_ledger.hpp"
#include "chanvault/core/constants.hpp"
#include "chanvault/core/log.hpp"
#include "sqlite_util.hpp"

#include <algorithm>
#include <stdexcept>

namespace chanvault {

using detail::sql_exec;
using detail::sql_step_retry;

namespace {

constexpr const char* LEDGER_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS uploads (
    upload_id TEXT NOT NULL,
    part_no INTEGER NOT NULL,
    name TEXT NOT NULL,
    channel_id INTEGER NOT NULL,
    message_id INTEGER NOT NULL,
    size INTEGER NOT NULL,
    owner_id INTEGER NOT NULL,
    encrypted INTEGER NOT NULL DEFAULT 0,
    salt TEXT NOT NULL DEFAULT '',
    created_at INTEGER NOT NULL,
    PRIMARY KEY (upload_id, part_no)
) WITHOUT ROWID;

CREATE INDEX IF NOT EXISTS idx_uploads_created
    ON uploads(created_at);

CREATE INDEX IF NOT EXISTS idx_uploads_owner_day
    ON uploads(owner_id, created_at);
)";

// Calendar spine of the last ?3 days ending at ?2, left-joined to the ledger
constexpr const char* DAILY_TOTALS_SQL = R"(
WITH RECURSIVE days(day) AS (
    SELECT date(?2, 'unixepoch', '-' || (?3 - 1) || ' days')
    UNION ALL
    SELECT date(day, '+1 day') FROM days WHERE day < date(?2, 'unixepoch')
)
SELECT days.day, COALESCE(SUM(u.size), 0), COUNT(u.part_no)
FROM days
LEFT JOIN uploads u
    ON u.owner_id = ?1 AND date(u.created_at, 'unixepoch') = days.day
GROUP BY days.day
ORDER BY days.day
)";

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

}  // namespace

UploadLedger::UploadLedger(const std::filesystem::path& db_path, std::chrono::seconds retention)
    : retention_(retention) {
    db_ = detail::open_database(db_path, LEDGER_SCHEMA, "upload ledger");
    try {
        stmt_insert_ = detail::prepare(db_,
            "INSERT INTO uploads (upload_id, part_no, name, channel_id, message_id, size, "
            "owner_id, encrypted, salt, created_at) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)");
        stmt_purge_key_ = detail::prepare(db_,
            "DELETE FROM uploads WHERE upload_id = ?1 AND part_no = ?2 AND created_at < ?3");
        stmt_exists_ = detail::prepare(db_,
            "SELECT 1 FROM uploads WHERE upload_id = ?1 AND part_no = ?2 AND created_at >= ?3");
        stmt_list_ = detail::prepare(db_,
            "SELECT upload_id, part_no, name, channel_id, message_id, size, owner_id, "
            "encrypted, salt, created_at FROM uploads "
            "WHERE upload_id = ?1 AND created_at >= ?2 ORDER BY part_no ASC");
        stmt_delete_session_ = detail::prepare(db_,
            "DELETE FROM uploads WHERE upload_id = ?1");
        stmt_sweep_ = detail::prepare(db_,
            "DELETE FROM uploads WHERE created_at < ?1");
        stmt_daily_ = detail::prepare(db_, DAILY_TOTALS_SQL);
        stmt_stats_ = detail::prepare(db_,
            "SELECT COUNT(*), COALESCE(SUM(size), 0) FROM uploads");
    } catch (...) {
        finalize_all();
        throw;
    }
}

UploadLedger::~UploadLedger() {
    finalize_all();
}

void UploadLedger::finalize_all() {
    for (auto* stmt : {stmt_insert_, stmt_purge_key_, stmt_exists_, stmt_list_,
                       stmt_delete_session_, stmt_sweep_, stmt_daily_, stmt_stats_}) {
        if (stmt) sqlite3_finalize(stmt);
    }
    stmt_insert_ = stmt_purge_key_ = stmt_exists_ = stmt_list_ = stmt_delete_session_ = nullptr;
    stmt_sweep_ = stmt_daily_ = stmt_stats_ = nullptr;

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

LedgerWrite UploadLedger::insert(const PartRecord& record) {
    LedgerWrite result;
    std::lock_guard lock(mutex_);

    if (!sql_exec(db_, "BEGIN IMMEDIATE")) {
        result.error_message = std::string("ledger insert failed: ") + sqlite3_errmsg(db_);
        return result;
    }

    // An expired row for the same key no longer counts; replace it
    sqlite3_reset(stmt_purge_key_);
    sqlite3_bind_text(stmt_purge_key_, 1, record.upload_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt_purge_key_, 2, record.part_no);
    sqlite3_bind_int64(stmt_purge_key_, 3, record.created_at - retention_.count());
    if (sql_step_retry(stmt_purge_key_) != SQLITE_DONE) {
        result.error_message = std::string("ledger insert failed: ") + sqlite3_errmsg(db_);
        sqlite3_reset(stmt_purge_key_);
        sql_exec(db_, "ROLLBACK");
        return result;
    }
    sqlite3_reset(stmt_purge_key_);

    sqlite3_reset(stmt_insert_);
    sqlite3_bind_text(stmt_insert_, 1, record.upload_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt_insert_, 2, record.part_no);
    sqlite3_bind_text(stmt_insert_, 3, record.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_insert_, 4, record.channel_id);
    sqlite3_bind_int64(stmt_insert_, 5, record.message_id);
    sqlite3_bind_int64(stmt_insert_, 6, static_cast<int64_t>(record.size));
    sqlite3_bind_int64(stmt_insert_, 7, record.owner_id);
    sqlite3_bind_int(stmt_insert_, 8, record.encrypted ? 1 : 0);
    sqlite3_bind_text(stmt_insert_, 9, record.salt.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_insert_, 10, record.created_at);

    int rc = sql_step_retry(stmt_insert_);
    if (rc == SQLITE_DONE) {
        sqlite3_reset(stmt_insert_);
        if (sql_exec(db_, "COMMIT")) {
            result.success = true;
        } else {
            result.error_message = std::string("ledger commit failed: ") + sqlite3_errmsg(db_);
            sql_exec(db_, "ROLLBACK");
        }
        return result;
    }

    int extended = sqlite3_extended_errcode(db_);
    result.duplicate = extended == SQLITE_CONSTRAINT_PRIMARYKEY;
    result.error_message = result.duplicate
        ? "part " + std::to_string(record.part_no) + " of upload " + record.upload_id +
              " already exists"
        : std::string("ledger insert failed: ") + sqlite3_errmsg(db_);
    sqlite3_reset(stmt_insert_);
    sql_exec(db_, "ROLLBACK");
    return result;
}

bool UploadLedger::exists(const std::string& upload_id, int part_no, int64_t now) {
    std::lock_guard lock(mutex_);
    sqlite3_reset(stmt_exists_);
    sqlite3_bind_text(stmt_exists_, 1, upload_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt_exists_, 2, part_no);
    sqlite3_bind_int64(stmt_exists_, 3, now - retention_.count());
    bool found = sql_step_retry(stmt_exists_) == SQLITE_ROW;
    sqlite3_reset(stmt_exists_);
    return found;
}

std::vector<PartRecord> UploadLedger::list_parts(const std::string& upload_id, int64_t now) {
    std::vector<PartRecord> parts;
    std::lock_guard lock(mutex_);

    sqlite3_reset(stmt_list_);
    sqlite3_bind_text(stmt_list_, 1, upload_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_list_, 2, now - retention_.count());

    int rc;
    while ((rc = sql_step_retry(stmt_list_)) == SQLITE_ROW) {
        PartRecord part;
        part.upload_id = column_text(stmt_list_, 0);
        part.part_no = sqlite3_column_int(stmt_list_, 1);
        part.name = column_text(stmt_list_, 2);
        part.channel_id = sqlite3_column_int64(stmt_list_, 3);
        part.message_id = sqlite3_column_int64(stmt_list_, 4);
        part.size = static_cast<uint64_t>(sqlite3_column_int64(stmt_list_, 5));
        part.owner_id = sqlite3_column_int64(stmt_list_, 6);
        part.encrypted = sqlite3_column_int(stmt_list_, 7) != 0;
        part.salt = column_text(stmt_list_, 8);
        part.created_at = sqlite3_column_int64(stmt_list_, 9);
        parts.push_back(std::move(part));
    }
    if (rc != SQLITE_DONE) {
        log_error("ledger: listing %s failed: %s", upload_id.c_str(), sqlite3_errmsg(db_));
    }
    sqlite3_reset(stmt_list_);
    return parts;
}

int64_t UploadLedger::delete_session(const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    sqlite3_reset(stmt_delete_session_);
    sqlite3_bind_text(stmt_delete_session_, 1, upload_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sql_step_retry(stmt_delete_session_) != SQLITE_DONE) {
        log_error("ledger: deleting %s failed: %s", upload_id.c_str(), sqlite3_errmsg(db_));
        sqlite3_reset(stmt_delete_session_);
        return -1;
    }
    return sqlite3_changes(db_);
}

int64_t UploadLedger::sweep_expired(int64_t now) {
    std::lock_guard lock(mutex_);
    sqlite3_reset(stmt_sweep_);
    sqlite3_bind_int64(stmt_sweep_, 1, now - retention_.count());
    if (sql_step_retry(stmt_sweep_) != SQLITE_DONE) {
        log_error("ledger: retention sweep failed: %s", sqlite3_errmsg(db_));
        sqlite3_reset(stmt_sweep_);
        return -1;
    }
    int64_t removed = sqlite3_changes(db_);
    if (removed > 0) {
        log_info("Retention sweep removed %lld expired parts", static_cast<long long>(removed));
    }
    return removed;
}

std::vector<DailyTotal> UploadLedger::daily_totals(int64_t owner_id, int days, int64_t today) {
    std::vector<DailyTotal> totals;
    days = std::clamp(days, 1, constants::MAX_STATS_DAYS);
    std::lock_guard lock(mutex_);

    sqlite3_reset(stmt_daily_);
    sqlite3_bind_int64(stmt_daily_, 1, owner_id);
    sqlite3_bind_int64(stmt_daily_, 2, today);
    sqlite3_bind_int(stmt_daily_, 3, days);

    int rc;
    while ((rc = sql_step_retry(stmt_daily_)) == SQLITE_ROW) {
        DailyTotal day;
        day.day = column_text(stmt_daily_, 0);
        day.total_size = static_cast<uint64_t>(sqlite3_column_int64(stmt_daily_, 1));
        day.parts = static_cast<uint64_t>(sqlite3_column_int64(stmt_daily_, 2));
        totals.push_back(std::move(day));
    }
    if (rc != SQLITE_DONE) {
        log_error("ledger: daily totals failed: %s", sqlite3_errmsg(db_));
    }
    sqlite3_reset(stmt_daily_);
    return totals;
}

LedgerStats UploadLedger::stats() {
    LedgerStats stats;
    std::lock_guard lock(mutex_);
    sqlite3_reset(stmt_stats_);
    if (sql_step_retry(stmt_stats_) == SQLITE_ROW) {
        stats.rows = static_cast<uint64_t>(sqlite3_column_int64(stmt_stats_, 0));
        stats.bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt_stats_, 1));
    }
    sqlite3_reset(stmt_stats_);
    return stats;
}

}  // namespace chanvault
