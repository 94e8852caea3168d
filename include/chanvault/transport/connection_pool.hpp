#pragma once

#include "chanvault/core/cancel.hpp"
#include "chanvault/transport/middleware.hpp"
#include "chanvault/transport/transport.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace chanvault::transport {

/// Bounded pool of authenticated handles for a single identity.
///
/// A pool lives for one upload request: handles are created lazily up to
/// max_size, each wrapped in the request's middleware chain, reused by the
/// uploader threads of that request and closed when the pool goes away.
class ConnectionPool {
public:
    ConnectionPool(ClientFactory& factory, Identity identity, size_t max_size,
                   std::vector<Middleware> middlewares, CancelFlag cancel);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /// Exclusive use of one handle; returned to the pool on destruction.
    class Lease {
    public:
        Lease() = default;
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        explicit operator bool() const { return handle_ != nullptr; }
        Transport* operator->() const { return handle_.get(); }
        Transport& operator*() const { return *handle_; }

        /// The handle is dropped instead of being returned to the pool.
        void discard() { broken_ = true; }

    private:
        friend class ConnectionPool;
        Lease(ConnectionPool* pool, std::unique_ptr<Transport> handle)
            : pool_(pool), handle_(std::move(handle)) {}
        void release();

        ConnectionPool* pool_ = nullptr;
        std::unique_ptr<Transport> handle_;
        bool broken_ = false;
    };

    /// Take an idle handle, or create and authenticate a new one while under
    /// the bound, or wait for a release. An empty lease comes back with the
    /// failure in status.
    Lease acquire(CallStatus& status);

    /// Transport facade that leases a handle for every call, so several
    /// threads can share the pool through one reference.
    Transport& default_handle() { return facade_; }

    /// Close every handle. Later acquires fail.
    void close();

    size_t max_size() const { return max_size_; }
    size_t created() const;
    size_t idle() const;

private:
    class PooledTransport : public Transport {
    public:
        explicit PooledTransport(ConnectionPool& pool) : pool_(pool) {}

        std::string type_name() const override { return "pooled"; }
        CallStatus connect() override;
        void close() override { pool_.close(); }
        CallStatus save_file_part(int64_t file_id, int part, int total_parts,
                                  std::span<const uint8_t> bytes) override;
        SendResult send_document(ChannelId channel, int64_t file_id, int total_parts,
                                 const std::string& name, uint64_t size) override;
        FetchResult get_messages(ChannelId channel, const std::vector<MessageId>& ids) override;
        CallStatus delete_messages(ChannelId channel, const std::vector<MessageId>& ids) override;
        ReadResult read_file(ChannelId channel, MessageId id,
                             uint64_t offset, uint64_t limit) override;

    private:
        ConnectionPool& pool_;
    };

    void release(std::unique_ptr<Transport> handle, bool broken);

    ClientFactory& factory_;
    Identity identity_;
    size_t max_size_;
    std::vector<Middleware> middlewares_;
    CancelFlag cancel_;
    PooledTransport facade_;

    mutable std::mutex pool_mutex_;
    std::condition_variable pool_cv_;
    std::vector<std::unique_ptr<Transport>> idle_handles_;
    size_t active_ = 0;   // Leased + idle
    size_t created_ = 0;  // Total ever created
    bool closed_ = false;
};

}  // namespace chanvault::transport
