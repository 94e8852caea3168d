#pragma once

#include "chanvault/transport/transport.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <shared_mutex>

namespace chanvault::transport {

/// Filesystem-backed channels, shared by every LocalTransport handle.
///
/// Layout under root:
///   <channel>/             one directory per channel
///   <channel>/<id>.msg     file attached to message <id>
///   <channel>/<id>.json    message metadata (name, size, date, sender)
///   <channel>/.last_id     last allocated message id
///   .parts/<file_id>/<n>   uploaded parts waiting for send_document
class LocalChannelStore {
public:
    explicit LocalChannelStore(const std::filesystem::path& root);

    const std::filesystem::path& root() const { return root_; }

    /// Create a channel directory. Returns false on filesystem errors.
    bool create_channel(ChannelId channel);
    bool has_channel(ChannelId channel) const;

    CallStatus store_part(int64_t file_id, int part, std::span<const uint8_t> bytes);
    SendResult publish(ChannelId channel, int64_t file_id, int total_parts,
                       const std::string& name, uint64_t size, const std::string& sender);
    FetchResult lookup(ChannelId channel, const std::vector<MessageId>& ids) const;
    CallStatus remove(ChannelId channel, const std::vector<MessageId>& ids);
    ReadResult read(ChannelId channel, MessageId id, uint64_t offset, uint64_t limit) const;

    /// Number of messages currently stored in a channel
    size_t message_count(ChannelId channel) const;

private:
    std::filesystem::path channel_dir(ChannelId channel) const;
    std::filesystem::path message_path(ChannelId channel, MessageId id) const;
    std::filesystem::path parts_dir(int64_t file_id) const;
    MessageId allocate_id_locked(ChannelId channel);

    std::filesystem::path root_;
    mutable std::shared_mutex mutex_;
};

/// One "connection" to a LocalChannelStore. Credentials are checked on
/// connect(); calls on a closed handle report Disconnected.
class LocalTransport : public Transport {
public:
    LocalTransport(std::shared_ptr<LocalChannelStore> store, Identity identity);

    std::string type_name() const override { return "local"; }

    CallStatus connect() override;
    void close() override;

    CallStatus save_file_part(int64_t file_id, int part, int total_parts,
                              std::span<const uint8_t> bytes) override;
    SendResult send_document(ChannelId channel, int64_t file_id, int total_parts,
                             const std::string& name, uint64_t size) override;
    FetchResult get_messages(ChannelId channel, const std::vector<MessageId>& ids) override;
    CallStatus delete_messages(ChannelId channel, const std::vector<MessageId>& ids) override;
    ReadResult read_file(ChannelId channel, MessageId id,
                         uint64_t offset, uint64_t limit) override;

    /// Token format accepted for delegated identities: "<bot id>:<secret>"
    static bool valid_bot_token(const std::string& token);

private:
    CallStatus require_connected() const;

    std::shared_ptr<LocalChannelStore> store_;
    Identity identity_;
    std::atomic<bool> connected_{false};
};

class LocalClientFactory : public ClientFactory {
public:
    explicit LocalClientFactory(std::shared_ptr<LocalChannelStore> store)
        : store_(std::move(store)) {}

    std::unique_ptr<Transport> create(const Identity& identity) override;

private:
    std::shared_ptr<LocalChannelStore> store_;
};

}  // namespace chanvault::transport
