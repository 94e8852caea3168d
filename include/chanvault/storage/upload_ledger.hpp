#pragma once

#include "chanvault/transport/transport.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace chanvault {

/// One transmitted and verified part of an upload session.
struct PartRecord {
    std::string upload_id;
    int part_no = 0;
    std::string name;
    transport::ChannelId channel_id = 0;
    transport::MessageId message_id = 0;
    uint64_t size = 0;       // Bytes sent; the ciphertext length when encrypted
    int64_t owner_id = 0;
    bool encrypted = false;
    std::string salt;        // Non-empty iff encrypted
    int64_t created_at = 0;  // Epoch seconds (UTC)
};

struct LedgerWrite {
    bool success = false;
    bool duplicate = false;  // (upload_id, part_no) already recorded
    std::string error_message;
};

struct DailyTotal {
    std::string day;  // YYYY-MM-DD (UTC)
    uint64_t total_size = 0;
    uint64_t parts = 0;
};

struct LedgerStats {
    uint64_t rows = 0;
    uint64_t bytes = 0;
};

/// Durable record of uploaded parts, keyed by (upload_id, part_no).
///
/// Rows are written once and never updated; an expired row may be replaced
/// by a new insert of the same key. Reads only see rows inside the
/// retention window; sweep_expired() removes the rest. All calls are
/// serialized on one connection.
class UploadLedger {
public:
    /// Open or create the ledger. Throws std::runtime_error on failure.
    UploadLedger(const std::filesystem::path& db_path, std::chrono::seconds retention);
    ~UploadLedger();

    UploadLedger(const UploadLedger&) = delete;
    UploadLedger& operator=(const UploadLedger&) = delete;

    /// Insert a record. A live row with the same key fails with
    /// duplicate = true; an expired one is replaced.
    LedgerWrite insert(const PartRecord& record);

    /// True if the part is recorded and inside the retention window at now.
    bool exists(const std::string& upload_id, int part_no, int64_t now);

    /// Parts of a session created at or after now - retention, by part_no.
    std::vector<PartRecord> list_parts(const std::string& upload_id, int64_t now);

    /// Remove every part of a session. Returns rows removed, or -1 on error.
    int64_t delete_session(const std::string& upload_id);

    /// Remove rows older than the retention window. Returns rows removed, or -1.
    int64_t sweep_expired(int64_t now);

    /// Bytes uploaded per UTC day for the trailing window ending at today,
    /// one entry per day (zero days included), oldest first.
    /// days is clamped to [1, 366].
    std::vector<DailyTotal> daily_totals(int64_t owner_id, int days, int64_t today);

    LedgerStats stats();

    std::chrono::seconds retention() const { return retention_; }

private:
    void finalize_all();

    std::chrono::seconds retention_;
    std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_insert_ = nullptr;
    sqlite3_stmt* stmt_purge_key_ = nullptr;
    sqlite3_stmt* stmt_exists_ = nullptr;
    sqlite3_stmt* stmt_list_ = nullptr;
    sqlite3_stmt* stmt_delete_session_ = nullptr;
    sqlite3_stmt* stmt_sweep_ = nullptr;
    sqlite3_stmt* stmt_daily_ = nullptr;
    sqlite3_stmt* stmt_stats_ = nullptr;
};

}  // namespace chanvault
