#pragma once

#include <filesystem>
#include <sqlite3.h>

namespace chanvault::detail {

/// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql);

/// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt);

/// Open a database in WAL mode and apply the schema.
/// Throws std::runtime_error if the file cannot be opened or the schema fails.
sqlite3* open_database(const std::filesystem::path& path, const char* schema, const char* what);

/// Prepare a statement. Throws std::runtime_error with the SQLite message on failure.
sqlite3_stmt* prepare(sqlite3* db, const char* sql);

}  // namespace chanvault::detail
