#include "sqlite_util.hpp"
#include "chanvault/core/constants.hpp"
#include "chanvault/core/log.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

namespace chanvault::detail {

bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < constants::SQLITE_BUSY_RETRIES; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < constants::SQLITE_BUSY_RETRIES; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

sqlite3* open_database(const std::filesystem::path& path, const char* schema, const char* what) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw std::runtime_error(std::string("Cannot open ") + what + ": " + msg);
    }

    // WAL mode for concurrent readers
    sql_exec(db, "PRAGMA journal_mode=WAL");
    sql_exec(db, "PRAGMA synchronous=NORMAL");
    sql_exec(db, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db, schema)) {
        sqlite3_close(db);
        throw std::runtime_error(std::string("Cannot create schema for ") + what);
    }
    return db;
}

sqlite3_stmt* prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Cannot prepare statement: ") + sqlite3_errmsg(db));
    }
    return stmt;
}

}  // namespace chanvault::detail
