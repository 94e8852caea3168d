#pragma once

#include <cstddef>
#include <cstdint>

namespace chanvault::constants {

// Ledger defaults
constexpr int DEFAULT_RETENTION_HOURS = 7 * 24;
constexpr const char* DEFAULT_DB_NAME = "chanvault.db";
constexpr int SQLITE_BUSY_RETRIES = 10;

// Connection pool
constexpr size_t DEFAULT_POOL_SIZE = 8;

// Uploader
constexpr size_t DEFAULT_UPLOAD_THREADS = 8;
constexpr size_t DEFAULT_UPLOAD_PART_SIZE = 512 * 1024;           // 512KB
constexpr size_t MAX_UPLOAD_PART_SIZE = 512 * 1024;
constexpr size_t UPLOAD_PART_ALIGNMENT = 1024;

// Rate limiting (token bucket)
constexpr int DEFAULT_RATE_INTERVAL_MS = 100;
constexpr int DEFAULT_RATE_BURST = 5;

// Flood control
constexpr int DEFAULT_FLOOD_WAIT_MAX_SECONDS = 60;
constexpr int DEFAULT_FLOOD_WAIT_MAX_ATTEMPTS = 3;

// Reconnection backoff
constexpr int DEFAULT_RECONNECT_INITIAL_MS = 500;
constexpr double DEFAULT_RECONNECT_MULTIPLIER = 1.1;
constexpr double DEFAULT_RECONNECT_JITTER = 0.5;
constexpr int DEFAULT_RECONNECT_MAX_ELAPSED_SECONDS = 120;

// Retry ceiling
constexpr int DEFAULT_MAX_RETRIES = 5;
constexpr int DEFAULT_RETRY_DELAY_SECONDS = 5;

// Encryption
constexpr size_t SALT_RANDOM_BYTES = 32;
constexpr size_t CIPHER_BLOCK_SIZE = 64 * 1024;                   // 64KB plaintext per block
constexpr size_t CIPHER_TAG_SIZE = 16;
constexpr size_t CIPHER_NONCE_SIZE = 12;
constexpr size_t CIPHER_MAGIC_SIZE = 8;
constexpr size_t CIPHER_HEADER_SIZE = CIPHER_MAGIC_SIZE + CIPHER_NONCE_SIZE;
constexpr const char* CIPHER_MAGIC = "CHVCRYPT";
constexpr uint64_t SCRYPT_N = 16384;
constexpr uint64_t SCRYPT_R = 8;
constexpr uint64_t SCRYPT_P = 1;

// Channel directory cache
constexpr int DEFAULT_CACHE_TTL_SECONDS = 300;

// Metrics
constexpr size_t DEFAULT_METRICS_INTERVAL_SECS = 15;

// Daily stats window
constexpr int DEFAULT_STATS_DAYS = 7;
constexpr int MAX_STATS_DAYS = 366;

} // namespace chanvault::constants
