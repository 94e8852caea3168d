#pragma once

#include "chanvault/core/cancel.hpp"
#include "chanvault/service_config.hpp"
#include "chanvault/storage/upload_ledger.hpp"
#include "chanvault/transport/byte_source.hpp"
#include "chanvault/transport/middleware.hpp"
#include "chanvault/transport/transport.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace chanvault {

class ChannelDirectory;
class MetricsExporter;

namespace transport {
class CredentialPool;
}

/// Where a failed request went wrong. Every class maps to one status code.
enum class ErrorClass {
    None,
    Validation,   // 400 / 404 / 409, rejected before anything was sent
    Auth,         // 401, credentials refused
    Transport,    // 502, transport errors left after retries and reconnects
    Consistency,  // 500, sent but not recorded; the message was compensated
    Cancelled     // 499, the caller cancelled the request
};

const char* error_class_name(ErrorClass error_class);

struct UploadRequest {
    std::string upload_id;
    int part_no = 0;
    std::string part_name;
    std::string file_name;  // Logging only
    int64_t owner_id = 0;
    std::string user_session;
    std::optional<transport::ChannelId> channel_id;  // Empty = owner's default channel
    bool encrypted = false;
    uint64_t size = 0;  // Plaintext bytes in the stream
};

struct UploadResult {
    bool success = false;
    PartRecord part;
    ErrorClass error_class = ErrorClass::None;
    int status = 200;
    std::string error_message;
    std::string channel_user;  // Identity that sent the part
};

struct DownloadResult {
    bool success = false;
    int status = 200;
    std::string error_message;
    uint64_t bytes = 0;
    int parts = 0;
};

/// Chunked upload engine: takes one part of a file, sends it through the
/// transport and records it in the ledger.
///
/// A part is recorded only after the transport confirmed the message. When
/// the message was sent but cannot be recorded, it is deleted again.
class UploadService {
public:
    UploadService(const ServiceConfig& config, UploadLedger& ledger, ChannelDirectory& directory,
                  transport::CredentialPool& credentials, transport::ClientFactory& factory,
                  MetricsExporter* metrics = nullptr);

    /// Upload one part read from stream (request.size bytes).
    UploadResult upload_part(const UploadRequest& request, transport::ByteSource& stream,
                             CancelFlag cancel = {});

    /// Non-expired parts of an upload session ordered by part_no.
    std::vector<PartRecord> get_upload(const std::string& upload_id);

    /// Forget an upload session. Messages stay in their channels.
    /// Returns rows removed, or -1 on error.
    int64_t delete_upload(const std::string& upload_id);

    /// Bytes uploaded per day over the last days days (zero days included).
    std::vector<DailyTotal> upload_stats(int64_t owner_id, int days);

    /// Fetch the parts of a session in order, decrypt them and write the
    /// plaintext to out.
    DownloadResult download_upload(const std::string& upload_id, int64_t owner_id,
                                   const std::string& user_session, std::ostream& out,
                                   CancelFlag cancel = {});

    /// Replace the sleep used by backoffs (tests).
    void set_sleep(transport::SleepFn sleep) { resilience_.sleep = std::move(sleep); }

private:
    struct ResolvedIdentity {
        transport::Identity identity;
        std::string channel_user;
        size_t index = 0;  // Position in the credential rotation
    };

    ResolvedIdentity resolve_identity(int64_t owner_id, const std::string& session,
                                      transport::ChannelId channel);
    transport::ResilienceOptions request_resilience() const;
    void compensate(const transport::Identity& identity, transport::ChannelId channel,
                    transport::MessageId message_id);
    UploadResult fail(UploadResult result, ErrorClass error_class, int status,
                      std::string message);
    UploadResult fail_transport(UploadResult result, const transport::CallStatus& status);

    const ServiceConfig& config_;
    UploadLedger& ledger_;
    ChannelDirectory& directory_;
    transport::CredentialPool& credentials_;
    transport::ClientFactory& factory_;
    MetricsExporter* metrics_;
    transport::ResilienceOptions resilience_;
};

}  // namespace chanvault
