#include "chanvault/core/cancel.hpp"
#include "chanvault/core/log.hpp"
#include "chanvault/metrics.hpp"
#include "chanvault/service_config.hpp"
#include "chanvault/storage/channel_directory.hpp"
#include "chanvault/storage/upload_ledger.hpp"
#include "chanvault/transport/credential_pool.hpp"
#include "chanvault/transport/local_transport.hpp"
#include "chanvault/upload_service.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

chanvault::CancelFlag g_cancel;

void signal_handler(int sig) {
    (void)sig;
    // Lock-free atomic store; safe in a handler
    g_cancel.cancel();
}

// Options that belong to a command; everything else is a global option
struct CommandArgs {
    std::vector<std::string> positional;
    std::optional<int64_t> owner;
    std::string session;
    std::optional<int64_t> channel;
    std::string name;
    std::string file_name;
    std::string token;
    std::optional<uint64_t> size;
    std::string out;
    int days = chanvault::constants::DEFAULT_STATS_DAYS;
    bool encrypt = false;
    bool select = false;
};

// Split argv into command options and global options (argv[0] kept first).
bool split_args(int argc, char* argv[], CommandArgs& cmd, std::vector<char*>& global) {
    global.push_back(argv[0]);
    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--owner") {
                auto* v = next_arg(i, "--owner");
                if (!v) return false;
                cmd.owner = std::stoll(v);
            } else if (arg == "--session") {
                auto* v = next_arg(i, "--session");
                if (!v) return false;
                cmd.session = v;
            } else if (arg == "--channel") {
                auto* v = next_arg(i, "--channel");
                if (!v) return false;
                cmd.channel = std::stoll(v);
            } else if (arg == "--name") {
                auto* v = next_arg(i, "--name");
                if (!v) return false;
                cmd.name = v;
            } else if (arg == "--file-name") {
                auto* v = next_arg(i, "--file-name");
                if (!v) return false;
                cmd.file_name = v;
            } else if (arg == "--token") {
                auto* v = next_arg(i, "--token");
                if (!v) return false;
                cmd.token = v;
            } else if (arg == "--size") {
                auto* v = next_arg(i, "--size");
                if (!v) return false;
                cmd.size = std::stoull(v);
            } else if (arg == "--out") {
                auto* v = next_arg(i, "--out");
                if (!v) return false;
                cmd.out = v;
            } else if (arg == "--days") {
                auto* v = next_arg(i, "--days");
                if (!v) return false;
                cmd.days = std::stoi(v);
            } else if (arg == "--encrypt") {
                cmd.encrypt = true;
            } else if (arg == "--select") {
                cmd.select = true;
            } else if (arg.compare(0, 2, "--") == 0 || arg == "-h") {
                global.push_back(argv[i]);
                // Global options with a value carry it along
                if (arg != "--verbose" && arg != "--help" && arg != "-h" && i + 1 < argc) {
                    global.push_back(argv[++i]);
                }
            } else {
                cmd.positional.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument: " << e.what() << "\n";
        return false;
    }
    return true;
}

nlohmann::json part_to_json(const chanvault::PartRecord& part) {
    return {
        {"upload_id", part.upload_id},
        {"part_no", part.part_no},
        {"name", part.name},
        {"channel_id", part.channel_id},
        {"part_id", part.message_id},
        {"size", part.size},
        {"owner_id", part.owner_id},
        {"encrypted", part.encrypted},
        {"salt", part.salt},
        {"created_at", part.created_at},
    };
}

int require_owner(const CommandArgs& cmd) {
    if (!cmd.owner) {
        std::cerr << "Error: --owner is required\n";
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h") {
        std::cerr << chanvault::ServiceConfig::usage();
        return argc < 2 ? 1 : 0;
    }
    std::string command = argv[1];

    CommandArgs cmd;
    std::vector<char*> global;
    if (!split_args(argc, argv, cmd, global)) return 1;

    auto config_opt = chanvault::ServiceConfig::from_args(static_cast<int>(global.size()),
                                                          global.data());
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // stdout carries command results only
    chanvault::set_log_output(stderr);

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        }
    }
    chanvault::set_verbose(config.verbose);

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    std::unique_ptr<chanvault::UploadLedger> ledger;
    std::unique_ptr<chanvault::ChannelDirectory> directory;
    std::shared_ptr<chanvault::transport::LocalChannelStore> store;
    try {
        ledger = std::make_unique<chanvault::UploadLedger>(config.db_path, config.retention());
        directory = std::make_unique<chanvault::ChannelDirectory>(
            config.db_path, std::chrono::seconds(config.cache_ttl_secs));
        store = std::make_shared<chanvault::transport::LocalChannelStore>(config.transport_root);
    } catch (const std::exception& e) {
        std::cerr << "Failed to open state: " << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<chanvault::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<chanvault::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{});
        metrics->set_ledger(ledger.get());
        metrics->start();
    }

    chanvault::transport::CredentialPool credentials;
    chanvault::transport::LocalClientFactory factory(store);
    chanvault::UploadService service(config, *ledger, *directory, credentials, factory,
                                     metrics.get());

    int rc = 0;

    if (command == "upload") {
        if (cmd.positional.size() != 3) {
            std::cerr << "Usage: chanvault upload <upload-id> <part-no> <file> [options]\n";
            return 1;
        }
        if ((rc = require_owner(cmd)) != 0) return rc;

        const auto& path = cmd.positional[2];
        chanvault::UploadRequest request;
        request.upload_id = cmd.positional[0];
        try {
            request.part_no = std::stoi(cmd.positional[1]);
        } catch (const std::exception&) {
            std::cerr << "Error: invalid part number: " << cmd.positional[1] << "\n";
            return 1;
        }
        request.owner_id = *cmd.owner;
        request.user_session = cmd.session;
        request.channel_id = cmd.channel;
        request.encrypted = cmd.encrypt;
        request.file_name = cmd.file_name.empty() ? path : cmd.file_name;
        request.part_name = cmd.name.empty()
            ? std::filesystem::path(path).filename().string() + "." + cmd.positional[1]
            : cmd.name;

        std::ifstream file;
        std::istream* in = &std::cin;
        if (path != "-") {
            std::error_code ec;
            auto size = std::filesystem::file_size(path, ec);
            if (ec) {
                std::cerr << "Error: cannot stat " << path << ": " << ec.message() << "\n";
                return 1;
            }
            file.open(path, std::ios::binary);
            if (!file) {
                std::cerr << "Error: cannot open " << path << "\n";
                return 1;
            }
            in = &file;
            request.size = cmd.size.value_or(size);
        } else if (cmd.size) {
            request.size = *cmd.size;
        } else {
            std::cerr << "Error: --size is required when reading stdin\n";
            return 1;
        }

        chanvault::transport::StreamSource source(*in);
        auto result = service.upload_part(request, source, g_cancel);
        if (!result.success) {
            std::cerr << "Upload failed (" << result.status << " "
                      << chanvault::error_class_name(result.error_class) << "): "
                      << result.error_message << std::endl;
            rc = 1;
        } else {
            std::cout << part_to_json(result.part).dump(2) << std::endl;
        }
    } else if (command == "list") {
        if (cmd.positional.size() != 1) {
            std::cerr << "Usage: chanvault list <upload-id>\n";
            return 1;
        }
        auto out = nlohmann::json::array();
        for (const auto& part : service.get_upload(cmd.positional[0])) {
            out.push_back(part_to_json(part));
        }
        std::cout << out.dump(2) << std::endl;
    } else if (command == "delete") {
        if (cmd.positional.size() != 1) {
            std::cerr << "Usage: chanvault delete <upload-id>\n";
            return 1;
        }
        auto removed = service.delete_upload(cmd.positional[0]);
        if (removed < 0) {
            rc = 1;
        } else {
            std::cout << "Removed " << removed << " parts" << std::endl;
        }
    } else if (command == "stats") {
        if ((rc = require_owner(cmd)) != 0) return rc;
        auto out = nlohmann::json::array();
        for (const auto& day : service.upload_stats(*cmd.owner, cmd.days)) {
            out.push_back({{"upload_date", day.day},
                           {"total_uploaded", day.total_size},
                           {"parts", day.parts}});
        }
        std::cout << out.dump(2) << std::endl;
    } else if (command == "sweep") {
        auto now = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch()).count();
        auto removed = ledger->sweep_expired(now);
        if (removed < 0) {
            rc = 1;
        } else {
            std::cout << "Removed " << removed << " expired parts" << std::endl;
        }
    } else if (command == "add-channel") {
        if ((rc = require_owner(cmd)) != 0) return rc;
        if (!cmd.channel) {
            std::cerr << "Error: --channel is required\n";
            return 1;
        }
        if (!store->create_channel(*cmd.channel) ||
            !directory->add_channel(*cmd.owner, *cmd.channel, cmd.name, cmd.select)) {
            std::cerr << "Failed to add channel " << *cmd.channel << std::endl;
            rc = 1;
        }
    } else if (command == "add-bot") {
        if ((rc = require_owner(cmd)) != 0) return rc;
        if (!cmd.channel || cmd.token.empty()) {
            std::cerr << "Error: --channel and --token are required\n";
            return 1;
        }
        if (!chanvault::transport::LocalTransport::valid_bot_token(cmd.token)) {
            std::cerr << "Error: token must look like <bot id>:<secret>\n";
            return 1;
        }
        if (!directory->add_bot(*cmd.owner, *cmd.channel, cmd.token)) {
            rc = 1;
        }
    } else if (command == "cat") {
        if (cmd.positional.size() != 1) {
            std::cerr << "Usage: chanvault cat <upload-id> [--owner N] [--session S] [--out FILE]\n";
            return 1;
        }
        if ((rc = require_owner(cmd)) != 0) return rc;

        std::ofstream file;
        std::ostream* out = &std::cout;
        if (!cmd.out.empty()) {
            file.open(cmd.out, std::ios::binary | std::ios::trunc);
            if (!file) {
                std::cerr << "Error: cannot create " << cmd.out << "\n";
                return 1;
            }
            out = &file;
        }
        auto result = service.download_upload(cmd.positional[0], *cmd.owner, cmd.session,
                                              *out, g_cancel);
        out->flush();
        if (!result.success) {
            std::cerr << "Download failed (" << result.status << "): "
                      << result.error_message << std::endl;
            rc = 1;
        } else {
            chanvault::log_debug("wrote %d parts, %llu bytes", result.parts,
                                 static_cast<unsigned long long>(result.bytes));
        }
    } else {
        std::cerr << "Error: unknown command: " << command << "\n\n"
                  << chanvault::ServiceConfig::usage();
        rc = 1;
    }

    if (metrics) metrics->stop();
    return rc;
}
