#include "chanvault/transport/local_transport.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>

namespace chanvault::transport {

namespace fs = std::filesystem;

namespace {

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Write to a temp file then rename (atomic)
bool write_atomic(const fs::path& path, const char* data, size_t size) {
    auto temp_path = path.string() + ".tmp." +
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) return false;
        file.write(data, static_cast<std::streamsize>(size));
        if (!file) {
            file.close();
            std::error_code ec;
            fs::remove(temp_path, ec);
            return false;
        }
    }
    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        fs::remove(temp_path, ec);
        return false;
    }
    return true;
}

}  // namespace

// ============================================================================
// LocalChannelStore
// ============================================================================

LocalChannelStore::LocalChannelStore(const fs::path& root)
    : root_(fs::absolute(root)) {
    fs::create_directories(root_ / ".parts");
}

fs::path LocalChannelStore::channel_dir(ChannelId channel) const {
    return root_ / std::to_string(channel);
}

fs::path LocalChannelStore::message_path(ChannelId channel, MessageId id) const {
    return channel_dir(channel) / (std::to_string(id) + ".msg");
}

fs::path LocalChannelStore::parts_dir(int64_t file_id) const {
    return root_ / ".parts" / std::to_string(file_id);
}

bool LocalChannelStore::create_channel(ChannelId channel) {
    std::unique_lock lock(mutex_);
    std::error_code ec;
    fs::create_directories(channel_dir(channel), ec);
    return !ec;
}

bool LocalChannelStore::has_channel(ChannelId channel) const {
    std::shared_lock lock(mutex_);
    std::error_code ec;
    return fs::is_directory(channel_dir(channel), ec);
}

MessageId LocalChannelStore::allocate_id_locked(ChannelId channel) {
    auto counter_path = channel_dir(channel) / ".last_id";
    MessageId last = 0;
    {
        std::ifstream in(counter_path);
        if (in) in >> last;
    }
    MessageId next = last + 1;
    auto text = std::to_string(next);
    if (!write_atomic(counter_path, text.data(), text.size())) return 0;
    return next;
}

CallStatus LocalChannelStore::store_part(int64_t file_id, int part,
                                         std::span<const uint8_t> bytes) {
    // Parts of different files never collide, so a shared lock is enough
    std::shared_lock lock(mutex_);
    auto dir = parts_dir(file_id);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return CallStatus::failure(ErrorKind::Transient, "cannot create part directory: " + ec.message());
    }
    if (!write_atomic(dir / std::to_string(part),
                      reinterpret_cast<const char*>(bytes.data()), bytes.size())) {
        return CallStatus::failure(ErrorKind::Transient, "cannot write part " + std::to_string(part));
    }
    return {};
}

SendResult LocalChannelStore::publish(ChannelId channel, int64_t file_id, int total_parts,
                                      const std::string& name, uint64_t size,
                                      const std::string& sender) {
    SendResult result;
    std::unique_lock lock(mutex_);

    std::error_code ec;
    if (!fs::is_directory(channel_dir(channel), ec)) {
        result.status = CallStatus::failure(ErrorKind::NotFound,
                                            "channel not found: " + std::to_string(channel));
        return result;
    }

    auto dir = parts_dir(file_id);
    auto staging = channel_dir(channel) / (".incoming." + std::to_string(file_id));
    uint64_t written = 0;
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            result.status = CallStatus::failure(ErrorKind::Transient, "cannot create message file");
            return result;
        }
        std::vector<char> buf(64 * 1024);
        for (int part = 0; part < total_parts; ++part) {
            std::ifstream in(dir / std::to_string(part), std::ios::binary);
            if (!in) {
                out.close();
                fs::remove(staging, ec);
                result.status = CallStatus::failure(ErrorKind::Fatal,
                                                    "file part " + std::to_string(part) + " missing");
                return result;
            }
            while (in) {
                in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
                auto n = in.gcount();
                if (n <= 0) break;
                out.write(buf.data(), n);
                written += static_cast<uint64_t>(n);
            }
        }
        out.close();
        if (!out.good()) {
            fs::remove(staging, ec);
            result.status = CallStatus::failure(ErrorKind::Transient, "cannot write message file");
            return result;
        }
    }

    if (written != size) {
        fs::remove(staging, ec);
        result.status = CallStatus::failure(
            ErrorKind::Fatal, "file size mismatch: declared " + std::to_string(size) +
            ", received " + std::to_string(written));
        return result;
    }

    MessageId id = allocate_id_locked(channel);
    if (id == 0) {
        fs::remove(staging, ec);
        result.status = CallStatus::failure(ErrorKind::Transient, "cannot allocate message id");
        return result;
    }

    nlohmann::json meta = {
        {"id", id},
        {"name", name},
        {"size", size},
        {"date", now_epoch()},
        {"sender", sender},
    };
    auto meta_text = meta.dump();
    auto meta_path = channel_dir(channel) / (std::to_string(id) + ".json");
    if (!write_atomic(meta_path, meta_text.data(), meta_text.size())) {
        fs::remove(staging, ec);
        result.status = CallStatus::failure(ErrorKind::Transient, "cannot write message metadata");
        return result;
    }

    fs::rename(staging, message_path(channel, id), ec);
    if (ec) {
        fs::remove(staging, ec);
        fs::remove(meta_path, ec);
        result.status = CallStatus::failure(ErrorKind::Transient, "cannot publish message: " + ec.message());
        return result;
    }

    fs::remove_all(dir, ec);
    result.message_id = id;
    return result;
}

FetchResult LocalChannelStore::lookup(ChannelId channel, const std::vector<MessageId>& ids) const {
    FetchResult result;
    std::shared_lock lock(mutex_);

    std::error_code ec;
    if (!fs::is_directory(channel_dir(channel), ec)) {
        result.status = CallStatus::failure(ErrorKind::NotFound,
                                            "channel not found: " + std::to_string(channel));
        return result;
    }

    for (auto id : ids) {
        auto path = message_path(channel, id);
        if (!fs::exists(path, ec)) continue;

        Message msg;
        msg.id = id;
        msg.size = fs::file_size(path, ec);
        std::ifstream in(channel_dir(channel) / (std::to_string(id) + ".json"));
        if (in) {
            try {
                auto meta = nlohmann::json::parse(in);
                msg.file_name = meta.value("name", "");
                msg.date = std::chrono::system_clock::time_point(
                    std::chrono::seconds(meta.value("date", int64_t{0})));
            } catch (const nlohmann::json::exception&) {
                // Metadata is informational; the message itself exists
            }
        }
        result.messages.push_back(std::move(msg));
    }
    return result;
}

CallStatus LocalChannelStore::remove(ChannelId channel, const std::vector<MessageId>& ids) {
    std::unique_lock lock(mutex_);
    std::error_code ec;
    if (!fs::is_directory(channel_dir(channel), ec)) {
        return CallStatus::failure(ErrorKind::NotFound, "channel not found: " + std::to_string(channel));
    }
    for (auto id : ids) {
        fs::remove(message_path(channel, id), ec);
        if (ec) {
            return CallStatus::failure(ErrorKind::Transient,
                                       "cannot delete message " + std::to_string(id) + ": " + ec.message());
        }
        fs::remove(channel_dir(channel) / (std::to_string(id) + ".json"), ec);
    }
    return {};
}

ReadResult LocalChannelStore::read(ChannelId channel, MessageId id,
                                   uint64_t offset, uint64_t limit) const {
    ReadResult result;
    std::shared_lock lock(mutex_);

    auto path = message_path(channel, id);
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        result.status = CallStatus::failure(ErrorKind::NotFound,
                                            "message not found: " + std::to_string(id));
        return result;
    }

    auto tellg_val = file.tellg();
    if (tellg_val < 0) {
        result.status = CallStatus::failure(ErrorKind::Transient, "cannot determine file size");
        return result;
    }
    uint64_t file_size = static_cast<uint64_t>(tellg_val);
    if (offset > file_size) offset = file_size;
    uint64_t length = file_size - offset;
    if (limit > 0) length = std::min(length, limit);

    file.seekg(static_cast<std::streamoff>(offset));
    result.data.resize(length);
    file.read(reinterpret_cast<char*>(result.data.data()), static_cast<std::streamsize>(length));
    if (!file) {
        result.data.clear();
        result.status = CallStatus::failure(ErrorKind::Transient, "failed to read message file");
    }
    return result;
}

size_t LocalChannelStore::message_count(ChannelId channel) const {
    std::shared_lock lock(mutex_);
    size_t count = 0;
    std::error_code ec;
    for (auto it = fs::directory_iterator(channel_dir(channel), ec);
         !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (it->path().extension() == ".msg") ++count;
    }
    return count;
}

// ============================================================================
// LocalTransport
// ============================================================================

LocalTransport::LocalTransport(std::shared_ptr<LocalChannelStore> store, Identity identity)
    : store_(std::move(store)), identity_(std::move(identity)) {}

bool LocalTransport::valid_bot_token(const std::string& token) {
    auto colon = token.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= token.size()) return false;
    return std::all_of(token.begin(), token.begin() + static_cast<std::ptrdiff_t>(colon),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

CallStatus LocalTransport::connect() {
    if (const auto* user = std::get_if<UserIdentity>(&identity_)) {
        if (user->user_id <= 0 || user->session.empty()) {
            return CallStatus::failure(ErrorKind::Auth, "invalid user session");
        }
    } else if (!valid_bot_token(std::get<DelegatedIdentity>(identity_).token)) {
        return CallStatus::failure(ErrorKind::Auth, "invalid bot token");
    }
    connected_ = true;
    return {};
}

void LocalTransport::close() {
    connected_ = false;
}

CallStatus LocalTransport::require_connected() const {
    if (!connected_) return CallStatus::failure(ErrorKind::Disconnected, "not connected");
    return {};
}

CallStatus LocalTransport::save_file_part(int64_t file_id, int part, int total_parts,
                                          std::span<const uint8_t> bytes) {
    auto status = require_connected();
    if (!status.ok()) return status;
    if (part < 0 || part >= total_parts) {
        return CallStatus::failure(ErrorKind::Fatal, "part index out of range");
    }
    return store_->store_part(file_id, part, bytes);
}

SendResult LocalTransport::send_document(ChannelId channel, int64_t file_id, int total_parts,
                                         const std::string& name, uint64_t size) {
    SendResult result;
    result.status = require_connected();
    if (!result.status.ok()) return result;
    return store_->publish(channel, file_id, total_parts, name, size, identity_label(identity_));
}

FetchResult LocalTransport::get_messages(ChannelId channel, const std::vector<MessageId>& ids) {
    FetchResult result;
    result.status = require_connected();
    if (!result.status.ok()) return result;
    return store_->lookup(channel, ids);
}

CallStatus LocalTransport::delete_messages(ChannelId channel, const std::vector<MessageId>& ids) {
    auto status = require_connected();
    if (!status.ok()) return status;
    return store_->remove(channel, ids);
}

ReadResult LocalTransport::read_file(ChannelId channel, MessageId id,
                                     uint64_t offset, uint64_t limit) {
    ReadResult result;
    result.status = require_connected();
    if (!result.status.ok()) return result;
    return store_->read(channel, id, offset, limit);
}

std::unique_ptr<Transport> LocalClientFactory::create(const Identity& identity) {
    return std::make_unique<LocalTransport>(store_, identity);
}

}  // namespace chanvault::transport
