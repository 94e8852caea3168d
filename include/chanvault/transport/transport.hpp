#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace chanvault::transport {

using ChannelId = int64_t;
using MessageId = int64_t;

// Classification of a failed transport call
enum class ErrorKind {
    None,
    FloodWait,     // Rate limited; retry_after says how long to back off
    Disconnected,  // Connection dropped; reconnect and retry
    Transient,     // Temporary server-side failure; safe to retry
    Auth,          // Credentials rejected
    NotFound,      // Channel or message does not exist
    Cancelled,     // The owning request was cancelled
    Fatal          // Anything else; not retried
};

const char* error_kind_name(ErrorKind kind);

// Outcome of a single transport call
struct CallStatus {
    ErrorKind kind = ErrorKind::None;
    std::chrono::seconds retry_after{0};
    std::string error_message;

    bool ok() const { return kind == ErrorKind::None; }

    static CallStatus failure(ErrorKind kind, std::string message,
                              std::chrono::seconds retry_after = std::chrono::seconds(0)) {
        CallStatus status;
        status.kind = kind;
        status.retry_after = retry_after;
        status.error_message = std::move(message);
        return status;
    }
};

// A message stored in a channel
struct Message {
    MessageId id = 0;
    std::string file_name;
    uint64_t size = 0;
    std::chrono::system_clock::time_point date;
};

// Result of sending a document
struct SendResult {
    CallStatus status;
    MessageId message_id = 0;  // 0 means the transport did not report an id
};

// Result of a message lookup
struct FetchResult {
    CallStatus status;
    std::vector<Message> messages;  // Missing ids are simply absent
};

// Result of reading a message's attached file
struct ReadResult {
    CallStatus status;
    std::vector<uint8_t> data;
};

// Abstract RPC-level interface to the message transport.
// A Transport instance is one authenticated connection for one identity.
// Calls may be issued concurrently only where an implementation says so;
// the connection pool hands each handle to one caller at a time.
class Transport {
public:
    virtual ~Transport() = default;

    // Get the transport type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    // Establish the connection and authenticate
    virtual CallStatus connect() = 0;

    // Drop the connection. Safe to call more than once.
    virtual void close() = 0;

    // Store one part of a file being uploaded.
    // Parts are addressed by a caller-chosen random file_id.
    virtual CallStatus save_file_part(int64_t file_id, int part, int total_parts,
                                      std::span<const uint8_t> bytes) = 0;

    // Post the uploaded file as a document message in a channel
    virtual SendResult send_document(ChannelId channel, int64_t file_id, int total_parts,
                                     const std::string& name, uint64_t size) = 0;

    // Look up messages by id
    virtual FetchResult get_messages(ChannelId channel,
                                     const std::vector<MessageId>& ids) = 0;

    // Delete messages by id
    virtual CallStatus delete_messages(ChannelId channel,
                                       const std::vector<MessageId>& ids) = 0;

    // Read a byte range of a message's file (limit 0 = to the end)
    virtual ReadResult read_file(ChannelId channel, MessageId id,
                                 uint64_t offset, uint64_t limit) = 0;
};

// Authenticate as the owning user with a stored session
struct UserIdentity {
    int64_t user_id = 0;
    std::string session;
};

// Authenticate as a delegated worker (bot) with its token
struct DelegatedIdentity {
    std::string token;
};

using Identity = std::variant<UserIdentity, DelegatedIdentity>;

/// Name recorded for attribution: the user id, or the bot id prefix of a token.
std::string identity_label(const Identity& identity);

// Creates transport handles for an identity. Handles are returned
// unconnected; connect() performs authentication.
class ClientFactory {
public:
    virtual ~ClientFactory() = default;
    virtual std::unique_ptr<Transport> create(const Identity& identity) = 0;
};

}  // namespace chanvault::transport
