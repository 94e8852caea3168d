#include "chanvault/upload_service.hpp"
#include "chanvault/core/log.hpp"
#include "chanvault/crypto/part_cipher.hpp"
#include "chanvault/metrics.hpp"
#include "chanvault/storage/channel_directory.hpp"
#include "chanvault/transport/connection_pool.hpp"
#include "chanvault/transport/credential_pool.hpp"
#include "chanvault/transport/uploader.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>

namespace chanvault {

using transport::CallStatus;
using transport::ErrorKind;

namespace {

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

const char* error_class_name(ErrorClass error_class) {
    switch (error_class) {
        case ErrorClass::None: return "none";
        case ErrorClass::Validation: return "validation";
        case ErrorClass::Auth: return "auth";
        case ErrorClass::Transport: return "transport";
        case ErrorClass::Consistency: return "consistency";
        case ErrorClass::Cancelled: return "cancelled";
    }
    return "unknown";
}

UploadService::UploadService(const ServiceConfig& config, UploadLedger& ledger,
                             ChannelDirectory& directory,
                             transport::CredentialPool& credentials,
                             transport::ClientFactory& factory, MetricsExporter* metrics)
    : config_(config)
    , ledger_(ledger)
    , directory_(directory)
    , credentials_(credentials)
    , factory_(factory)
    , metrics_(metrics)
    , resilience_(config.resilience()) {}

transport::ResilienceOptions UploadService::request_resilience() const {
    auto options = resilience_;
    if (metrics_) {
        auto* metrics = metrics_;
        options.flood.on_wait = [metrics](std::chrono::seconds wait) {
            metrics->flood_waits_total().Increment();
            metrics->flood_wait_seconds_total().Increment(static_cast<double>(wait.count()));
        };
    }
    return options;
}

UploadService::ResolvedIdentity UploadService::resolve_identity(int64_t owner_id,
                                                                const std::string& session,
                                                                transport::ChannelId channel) {
    auto tokens = directory_.bot_tokens(owner_id, channel);
    if (!tokens.empty()) {
        credentials_.set(tokens, channel);
        if (auto next = credentials_.next(channel)) {
            transport::Identity identity = transport::DelegatedIdentity{next->first};
            auto label = transport::identity_label(identity);
            return {std::move(identity), std::move(label), next->second};
        }
    }
    return {transport::UserIdentity{owner_id, session}, std::to_string(owner_id), 0};
}

UploadResult UploadService::fail(UploadResult result, ErrorClass error_class, int status,
                                 std::string message) {
    result.success = false;
    result.error_class = error_class;
    result.status = status;
    result.error_message = std::move(message);
    if (metrics_) {
        metrics_->parts_failure().Increment();
        metrics_->upload_errors(error_class_name(error_class)).Increment();
    }
    return result;
}

UploadResult UploadService::fail_transport(UploadResult result, const CallStatus& status) {
    switch (status.kind) {
        case ErrorKind::Auth:
            return fail(std::move(result), ErrorClass::Auth, 401, status.error_message);
        case ErrorKind::NotFound:
            return fail(std::move(result), ErrorClass::Validation, 404, status.error_message);
        case ErrorKind::Cancelled:
            return fail(std::move(result), ErrorClass::Cancelled, 499, status.error_message);
        default:
            return fail(std::move(result), ErrorClass::Transport, 502, status.error_message);
    }
}

void UploadService::compensate(const transport::Identity& identity, transport::ChannelId channel,
                               transport::MessageId message_id) {
    // Own pool and cancel flag: the request may already be cancelled, the
    // sent message still has to go.
    CancelFlag cancel;
    transport::ConnectionPool pool(factory_, identity, 1,
                                   transport::build_middlewares(request_resilience(), cancel),
                                   cancel);
    auto status = pool.default_handle().delete_messages(channel, {message_id});
    if (status.ok()) {
        log_info("Compensated message %lld in channel %lld",
                 static_cast<long long>(message_id), static_cast<long long>(channel));
        if (metrics_) metrics_->compensations_success().Increment();
    } else {
        log_error("compensating delete of message %lld in channel %lld failed: %s",
                  static_cast<long long>(message_id), static_cast<long long>(channel),
                  status.error_message.c_str());
        if (metrics_) metrics_->compensations_failure().Increment();
    }
}

UploadResult UploadService::upload_part(const UploadRequest& request,
                                        transport::ByteSource& stream, CancelFlag cancel) {
    UploadResult result;
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->upload_duration());

    // --- Validation (no side effects) ---

    if (request.upload_id.empty()) {
        return fail(std::move(result), ErrorClass::Validation, 400, "upload id is required");
    }
    if (request.part_name.empty()) {
        return fail(std::move(result), ErrorClass::Validation, 400, "part name is required");
    }
    if (request.part_no < 1) {
        return fail(std::move(result), ErrorClass::Validation, 400, "part number must be >= 1");
    }
    if (request.encrypted && config_.encryption_key.empty()) {
        return fail(std::move(result), ErrorClass::Validation, 400, "encryption key not found");
    }
    if (ledger_.exists(request.upload_id, request.part_no, now_epoch())) {
        return fail(std::move(result), ErrorClass::Validation, 409,
                    "part " + std::to_string(request.part_no) + " of upload " +
                    request.upload_id + " already exists");
    }

    transport::ChannelId channel = 0;
    if (request.channel_id) {
        channel = *request.channel_id;
    } else if (auto def = directory_.default_channel(request.owner_id)) {
        channel = *def;
    } else {
        return fail(std::move(result), ErrorClass::Validation, 404, "default channel not set");
    }

    auto resolved = resolve_identity(request.owner_id, request.user_session, channel);
    result.channel_user = resolved.channel_user;

    log_debug("uploading part %d of %s (%s) as %s [%zu], %llu bytes",
              request.part_no, request.file_name.c_str(), request.part_name.c_str(),
              resolved.channel_user.c_str(), resolved.index,
              static_cast<unsigned long long>(request.size));

    // --- Connect (auth failure leaves no side effect) ---

    transport::ConnectionPool pool(factory_, resolved.identity, config_.pool_size,
                                   transport::build_middlewares(request_resilience(), cancel),
                                   cancel);
    auto& client = pool.default_handle();

    auto status = client.connect();
    if (!status.ok()) return fail_transport(std::move(result), status);

    // Resolve the destination before sending anything
    auto lookup = client.get_messages(channel, {});
    if (!lookup.status.ok()) return fail_transport(std::move(result), lookup.status);

    // --- Encrypt ---

    std::string salt;
    std::unique_ptr<PartCipher> cipher;
    std::unique_ptr<EncryptingSource> encrypting;
    transport::ByteSource* source = &stream;
    uint64_t declared_size = request.size;

    if (request.encrypted) {
        try {
            salt = generate_salt();
            cipher = std::make_unique<PartCipher>(config_.encryption_key, salt);
            encrypting = std::make_unique<EncryptingSource>(*cipher, stream, request.size);
        } catch (const std::exception& e) {
            return fail(std::move(result), ErrorClass::Consistency, 500,
                        std::string("encryption setup failed: ") + e.what());
        }
        source = encrypting.get();
        declared_size = encrypted_size(request.size);
    }

    // --- Transmit ---

    transport::Uploader uploader(client, config_.uploader(), cancel);
    auto uploaded = uploader.upload(*source, declared_size);
    if (!uploaded.status.ok()) {
        if (uploaded.source_error) {
            return fail(std::move(result), ErrorClass::Validation, 400,
                        uploaded.status.error_message);
        }
        return fail_transport(std::move(result), uploaded.status);
    }

    auto sent = client.send_document(channel, uploaded.file_id, uploaded.total_parts,
                                     request.part_name, declared_size);
    if (!sent.status.ok()) return fail_transport(std::move(result), sent.status);

    if (sent.message_id == 0) {
        return fail(std::move(result), ErrorClass::Consistency, 500, "upload failed");
    }

    // --- Verify, then persist ---

    auto fetched = client.get_messages(channel, {sent.message_id});
    if (!fetched.status.ok() || fetched.messages.empty()) {
        log_error("message %lld for part %d of %s not found after send",
                  static_cast<long long>(sent.message_id), request.part_no,
                  request.upload_id.c_str());
        compensate(resolved.identity, channel, sent.message_id);
        return fail(std::move(result), ErrorClass::Consistency, 500, "upload failed");
    }

    PartRecord record;
    record.upload_id = request.upload_id;
    record.part_no = request.part_no;
    record.name = request.part_name;
    record.channel_id = channel;
    record.message_id = sent.message_id;
    record.size = declared_size;
    record.owner_id = request.owner_id;
    record.encrypted = request.encrypted;
    record.salt = salt;
    record.created_at = now_epoch();

    auto write = ledger_.insert(record);
    if (!write.success) {
        log_error("recording part %d of %s failed: %s", request.part_no,
                  request.upload_id.c_str(), write.error_message.c_str());
        compensate(resolved.identity, channel, sent.message_id);
        if (write.duplicate) {
            return fail(std::move(result), ErrorClass::Validation, 409, write.error_message);
        }
        return fail(std::move(result), ErrorClass::Consistency, 500, write.error_message);
    }

    log_debug("uploaded part %d of %s as message %lld", request.part_no,
              request.upload_id.c_str(), static_cast<long long>(sent.message_id));

    if (metrics_) {
        metrics_->parts_success().Increment();
        metrics_->upload_bytes_total().Increment(static_cast<double>(declared_size));
    }

    result.success = true;
    result.part = std::move(record);
    return result;
}

std::vector<PartRecord> UploadService::get_upload(const std::string& upload_id) {
    return ledger_.list_parts(upload_id, now_epoch());
}

int64_t UploadService::delete_upload(const std::string& upload_id) {
    return ledger_.delete_session(upload_id);
}

std::vector<DailyTotal> UploadService::upload_stats(int64_t owner_id, int days) {
    return ledger_.daily_totals(owner_id, days, now_epoch());
}

DownloadResult UploadService::download_upload(const std::string& upload_id, int64_t owner_id,
                                              const std::string& user_session, std::ostream& out,
                                              CancelFlag cancel) {
    DownloadResult result;
    auto fail_with = [&](int status, std::string message) {
        result.success = false;
        result.status = status;
        result.error_message = std::move(message);
        return result;
    };

    auto parts = get_upload(upload_id);
    if (parts.empty()) return fail_with(404, "upload not found: " + upload_id);

    std::map<transport::ChannelId, std::unique_ptr<transport::ConnectionPool>> pools;

    for (const auto& part : parts) {
        if (part.encrypted && config_.encryption_key.empty()) {
            return fail_with(400, "encryption key not found");
        }

        auto& pool = pools[part.channel_id];
        if (!pool) {
            auto resolved = resolve_identity(owner_id, user_session, part.channel_id);
            pool = std::make_unique<transport::ConnectionPool>(
                factory_, resolved.identity, 1,
                transport::build_middlewares(request_resilience(), cancel), cancel);
        }

        auto read = pool->default_handle().read_file(part.channel_id, part.message_id, 0, 0);
        if (!read.status.ok()) {
            int status = read.status.kind == ErrorKind::Auth       ? 401
                       : read.status.kind == ErrorKind::NotFound   ? 404
                       : read.status.kind == ErrorKind::Cancelled  ? 499
                                                                   : 502;
            return fail_with(status, "part " + std::to_string(part.part_no) + ": " +
                                     read.status.error_message);
        }
        if (read.data.size() != part.size) {
            return fail_with(500, "part " + std::to_string(part.part_no) + " has " +
                                  std::to_string(read.data.size()) + " bytes, expected " +
                                  std::to_string(part.size));
        }

        if (!part.encrypted) {
            out.write(reinterpret_cast<const char*>(read.data.data()),
                      static_cast<std::streamsize>(read.data.size()));
            result.bytes += read.data.size();
        } else {
            try {
                PartCipher cipher(config_.encryption_key, part.salt);
                transport::MemorySource sealed(read.data);
                DecryptingSource plain(cipher, sealed, part.size);
                std::vector<uint8_t> buf(constants::CIPHER_BLOCK_SIZE);
                size_t n;
                while ((n = plain.read(buf.data(), buf.size())) > 0) {
                    out.write(reinterpret_cast<const char*>(buf.data()),
                              static_cast<std::streamsize>(n));
                    result.bytes += n;
                }
            } catch (const std::exception& e) {
                return fail_with(500, "part " + std::to_string(part.part_no) +
                                      ": decryption failed: " + e.what());
            }
        }
        if (!out) return fail_with(500, "write failed");
        ++result.parts;
    }

    result.success = true;
    return result;
}

}  // namespace chanvault
