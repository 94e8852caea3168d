#pragma once

#include "chanvault/core/constants.hpp"
#include "chanvault/transport/middleware.hpp"
#include "chanvault/transport/uploader.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chanvault {

/// Configuration for the upload engine and the chanvault CLI.
struct ServiceConfig {
    // State directory (ledger + directory database). Default: ./.chanvault
    std::filesystem::path state_dir;
    std::filesystem::path db_path;         // Default: <state_dir>/chanvault.db
    std::filesystem::path transport_root;  // Default: <state_dir>/channels

    // Master secret for part encryption. Empty = encrypted uploads are refused.
    // Falls back to CHANVAULT_ENCRYPTION_KEY.
    std::string encryption_key;

    // Ledger
    int retention_hours = constants::DEFAULT_RETENTION_HOURS;

    // Connections and uploader
    size_t pool_size = constants::DEFAULT_POOL_SIZE;
    size_t upload_threads = constants::DEFAULT_UPLOAD_THREADS;
    size_t part_size = constants::DEFAULT_UPLOAD_PART_SIZE;

    // Middleware
    int rate_interval_ms = constants::DEFAULT_RATE_INTERVAL_MS;
    int rate_burst = constants::DEFAULT_RATE_BURST;
    int flood_wait_max_secs = constants::DEFAULT_FLOOD_WAIT_MAX_SECONDS;
    int max_retries = constants::DEFAULT_MAX_RETRIES;
    int retry_delay_secs = constants::DEFAULT_RETRY_DELAY_SECONDS;
    int reconnect_initial_ms = constants::DEFAULT_RECONNECT_INITIAL_MS;
    double reconnect_multiplier = constants::DEFAULT_RECONNECT_MULTIPLIER;
    int reconnect_max_elapsed_secs = constants::DEFAULT_RECONNECT_MAX_ELAPSED_SECONDS;

    // Channel directory cache
    int cache_ttl_secs = constants::DEFAULT_CACHE_TTL_SECONDS;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;  // e.g. /var/lib/node_exporter/textfile/chanvault.prom
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECS;

    bool verbose = false;
    std::filesystem::path log_file;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<ServiceConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in state_dir, db_path and transport_root.
    void apply_defaults();

    /// Validate ranges. Returns error message or empty string.
    std::string validate() const;

    std::chrono::seconds retention() const { return std::chrono::hours(retention_hours); }
    transport::ResilienceOptions resilience() const;
    transport::UploaderOptions uploader() const;

    static const char* usage();
};

}  // namespace chanvault
