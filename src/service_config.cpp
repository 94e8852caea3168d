#include "chanvault/service_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace chanvault {

std::optional<ServiceConfig> ServiceConfig::from_args(int argc, char* argv[]) {
    ServiceConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--state-dir") {
                auto* v = next_arg(i, "--state-dir");
                if (!v) return std::nullopt;
                config.state_dir = v;
            } else if (arg == "--db") {
                auto* v = next_arg(i, "--db");
                if (!v) return std::nullopt;
                config.db_path = v;
            } else if (arg == "--transport-root") {
                auto* v = next_arg(i, "--transport-root");
                if (!v) return std::nullopt;
                config.transport_root = v;
            } else if (arg == "--encryption-key") {
                auto* v = next_arg(i, "--encryption-key");
                if (!v) return std::nullopt;
                config.encryption_key = v;
            } else if (arg == "--retention-hours") {
                auto* v = next_arg(i, "--retention-hours");
                if (!v) return std::nullopt;
                config.retention_hours = std::stoi(v);
            } else if (arg == "--pool-size") {
                auto* v = next_arg(i, "--pool-size");
                if (!v) return std::nullopt;
                config.pool_size = std::stoull(v);
            } else if (arg == "--upload-threads") {
                auto* v = next_arg(i, "--upload-threads");
                if (!v) return std::nullopt;
                config.upload_threads = std::stoull(v);
            } else if (arg == "--part-size-kb") {
                auto* v = next_arg(i, "--part-size-kb");
                if (!v) return std::nullopt;
                config.part_size = std::stoull(v) * 1024;
            } else if (arg == "--rate-interval-ms") {
                auto* v = next_arg(i, "--rate-interval-ms");
                if (!v) return std::nullopt;
                config.rate_interval_ms = std::stoi(v);
            } else if (arg == "--rate-burst") {
                auto* v = next_arg(i, "--rate-burst");
                if (!v) return std::nullopt;
                config.rate_burst = std::stoi(v);
            } else if (arg == "--flood-wait-max") {
                auto* v = next_arg(i, "--flood-wait-max");
                if (!v) return std::nullopt;
                config.flood_wait_max_secs = std::stoi(v);
            } else if (arg == "--max-retries") {
                auto* v = next_arg(i, "--max-retries");
                if (!v) return std::nullopt;
                config.max_retries = std::stoi(v);
            } else if (arg == "--retry-delay") {
                auto* v = next_arg(i, "--retry-delay");
                if (!v) return std::nullopt;
                config.retry_delay_secs = std::stoi(v);
            } else if (arg == "--reconnect-initial-ms") {
                auto* v = next_arg(i, "--reconnect-initial-ms");
                if (!v) return std::nullopt;
                config.reconnect_initial_ms = std::stoi(v);
            } else if (arg == "--reconnect-multiplier") {
                auto* v = next_arg(i, "--reconnect-multiplier");
                if (!v) return std::nullopt;
                config.reconnect_multiplier = std::stod(v);
            } else if (arg == "--reconnect-max-elapsed") {
                auto* v = next_arg(i, "--reconnect-max-elapsed");
                if (!v) return std::nullopt;
                config.reconnect_max_elapsed_secs = std::stoi(v);
            } else if (arg == "--cache-ttl") {
                auto* v = next_arg(i, "--cache-ttl");
                if (!v) return std::nullopt;
                config.cache_ttl_secs = std::stoi(v);
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--help" || arg == "-h") {
                std::cerr << usage();
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        // std::stoi and friends on malformed numbers
        std::cerr << "Error: invalid numeric argument: " << e.what() << "\n";
        return std::nullopt;
    }

    if (config.encryption_key.empty()) {
        if (const char* v = std::getenv("CHANVAULT_ENCRYPTION_KEY")) {
            config.encryption_key = v;
        }
    }

    config.apply_defaults();
    return config;
}

bool ServiceConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("state_dir")) state_dir = j["state_dir"].get<std::string>();
        if (j.contains("db_path")) db_path = j["db_path"].get<std::string>();
        if (j.contains("transport_root")) transport_root = j["transport_root"].get<std::string>();
        if (j.contains("encryption_key")) encryption_key = j["encryption_key"].get<std::string>();
        if (j.contains("retention_hours")) retention_hours = j["retention_hours"].get<int>();
        if (j.contains("pool_size")) pool_size = j["pool_size"].get<size_t>();
        if (j.contains("upload_threads")) upload_threads = j["upload_threads"].get<size_t>();
        if (j.contains("part_size_kb")) part_size = j["part_size_kb"].get<size_t>() * 1024;
        if (j.contains("rate_interval_ms")) rate_interval_ms = j["rate_interval_ms"].get<int>();
        if (j.contains("rate_burst")) rate_burst = j["rate_burst"].get<int>();
        if (j.contains("flood_wait_max")) flood_wait_max_secs = j["flood_wait_max"].get<int>();
        if (j.contains("max_retries")) max_retries = j["max_retries"].get<int>();
        if (j.contains("retry_delay")) retry_delay_secs = j["retry_delay"].get<int>();
        if (j.contains("reconnect_initial_ms"))
            reconnect_initial_ms = j["reconnect_initial_ms"].get<int>();
        if (j.contains("reconnect_multiplier"))
            reconnect_multiplier = j["reconnect_multiplier"].get<double>();
        if (j.contains("reconnect_max_elapsed"))
            reconnect_max_elapsed_secs = j["reconnect_max_elapsed"].get<int>();
        if (j.contains("cache_ttl")) cache_ttl_secs = j["cache_ttl"].get<int>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void ServiceConfig::apply_defaults() {
    if (state_dir.empty()) state_dir = ".chanvault";
    if (db_path.empty()) db_path = state_dir / constants::DEFAULT_DB_NAME;
    if (transport_root.empty()) transport_root = state_dir / "channels";
}

std::string ServiceConfig::validate() const {
    if (retention_hours <= 0) return "retention_hours must be > 0";
    if (pool_size == 0) return "pool_size must be > 0";
    if (upload_threads == 0) return "upload_threads must be > 0";
    if (part_size == 0 || part_size % constants::UPLOAD_PART_ALIGNMENT != 0)
        return "part size must be a positive multiple of 1 KiB";
    if (part_size > constants::MAX_UPLOAD_PART_SIZE ||
        constants::MAX_UPLOAD_PART_SIZE % part_size != 0)
        return "part size must divide 512 KiB";
    if (rate_interval_ms <= 0) return "rate_interval_ms must be > 0";
    if (rate_burst <= 0) return "rate_burst must be > 0";
    if (flood_wait_max_secs < 0) return "flood_wait_max must be >= 0";
    if (max_retries <= 0) return "max_retries must be > 0";
    if (retry_delay_secs < 0) return "retry_delay must be >= 0";
    if (reconnect_initial_ms <= 0) return "reconnect_initial_ms must be > 0";
    if (reconnect_multiplier < 1.0) return "reconnect_multiplier must be >= 1.0";
    if (reconnect_max_elapsed_secs <= 0) return "reconnect_max_elapsed must be > 0";
    if (cache_ttl_secs < 0) return "cache_ttl must be >= 0";
    if (!metrics_file.empty() && metrics_interval_secs == 0)
        return "metrics_interval must be > 0";
    return {};
}

transport::ResilienceOptions ServiceConfig::resilience() const {
    transport::ResilienceOptions options;
    options.flood.max_wait = std::chrono::seconds(flood_wait_max_secs);
    options.flood.max_attempts = constants::DEFAULT_FLOOD_WAIT_MAX_ATTEMPTS;
    options.rate.interval = std::chrono::milliseconds(rate_interval_ms);
    options.rate.burst = rate_burst;
    options.reconnect.initial_interval = std::chrono::milliseconds(reconnect_initial_ms);
    options.reconnect.multiplier = reconnect_multiplier;
    options.reconnect.randomization = constants::DEFAULT_RECONNECT_JITTER;
    options.reconnect.max_elapsed = std::chrono::seconds(reconnect_max_elapsed_secs);
    options.retry.max_attempts = max_retries;
    options.retry.delay = std::chrono::seconds(retry_delay_secs);
    return options;
}

transport::UploaderOptions ServiceConfig::uploader() const {
    transport::UploaderOptions options;
    options.threads = upload_threads;
    options.part_size = part_size;
    return options;
}

const char* ServiceConfig::usage() {
    return
        "Usage: chanvault <command> [command options] [global options]\n"
        "\n"
        "Commands:\n"
        "  upload <upload-id> <part-no> <file> [--owner N] [--session S] [--channel C]\n"
        "         [--name NAME] [--encrypt]     Upload one part (file '-' = stdin)\n"
        "  list <upload-id>                     List recorded parts of a session\n"
        "  delete <upload-id>                   Remove a session from the ledger\n"
        "  stats --owner N [--days D]           Bytes uploaded per day\n"
        "  sweep                                Remove parts older than the retention window\n"
        "  add-channel --owner N --channel C [--name NAME] [--select]\n"
        "  add-bot --owner N --channel C --token T\n"
        "  cat <upload-id> [--owner N] [--session S]\n"
        "                                       Write the session's parts to stdout\n"
        "\n"
        "Global options:\n"
        "  --config <path>                  JSON config file\n"
        "  --state-dir <path>               State directory (default: ./.chanvault)\n"
        "  --db <path>                      Database path (default: <state-dir>/chanvault.db)\n"
        "  --transport-root <path>          Channel store root (default: <state-dir>/channels)\n"
        "  --encryption-key <key>           Master key (or CHANVAULT_ENCRYPTION_KEY env)\n"
        "  --retention-hours <N>            Upload session retention (default: 168)\n"
        "  --pool-size <N>                  Connections per upload (default: 8)\n"
        "  --upload-threads <N>             Uploader threads (default: 8)\n"
        "  --part-size-kb <N>               Transport part size in KiB (default: 512)\n"
        "  --rate-interval-ms <N>           Token bucket interval (default: 100)\n"
        "  --rate-burst <N>                 Token bucket capacity (default: 5)\n"
        "  --flood-wait-max <secs>          Longest flood wait to sleep through (default: 60)\n"
        "  --max-retries <N>                Attempts per call (default: 5)\n"
        "  --retry-delay <secs>             Delay between attempts (default: 5)\n"
        "  --reconnect-initial-ms <N>       First reconnect backoff (default: 500)\n"
        "  --reconnect-multiplier <X>       Backoff multiplier (default: 1.1)\n"
        "  --reconnect-max-elapsed <secs>   Give up reconnecting after (default: 120)\n"
        "  --cache-ttl <secs>               Channel directory cache TTL (default: 300)\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --verbose                        Verbose output\n"
        "  --log-file <path>                Log file path\n"
        "  --help                           Show this help\n";
}

}  // namespace chanvault
