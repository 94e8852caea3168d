#include "chanvault/transport/connection_pool.hpp"
#include "chanvault/core/log.hpp"

#include <chrono>
#include <exception>

namespace chanvault::transport {

namespace {

CallStatus& status_of(CallStatus& status) { return status; }

template <typename R>
CallStatus& status_of(R& result) { return result.status; }

// A handle that lost its connection or its credentials is not reused
bool should_discard(const CallStatus& status) {
    return status.kind == ErrorKind::Disconnected || status.kind == ErrorKind::Auth;
}

template <typename R, typename F>
R leased_call(ConnectionPool& pool, F&& fn) {
    CallStatus status;
    auto lease = pool.acquire(status);
    R result{};
    if (!lease) {
        status_of(result) = status;
        return result;
    }
    result = fn(*lease);
    if (should_discard(status_of(result))) lease.discard();
    return result;
}

}  // namespace

// --- Lease ---

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), handle_(std::move(other.handle_)), broken_(other.broken_) {
    other.pool_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        handle_ = std::move(other.handle_);
        broken_ = other.broken_;
        other.pool_ = nullptr;
    }
    return *this;
}

ConnectionPool::Lease::~Lease() {
    release();
}

void ConnectionPool::Lease::release() {
    if (pool_ && handle_) {
        pool_->release(std::move(handle_), broken_);
    }
    pool_ = nullptr;
    broken_ = false;
}

// --- ConnectionPool ---

ConnectionPool::ConnectionPool(ClientFactory& factory, Identity identity, size_t max_size,
                               std::vector<Middleware> middlewares, CancelFlag cancel)
    : factory_(factory)
    , identity_(std::move(identity))
    , max_size_(max_size == 0 ? 1 : max_size)
    , middlewares_(std::move(middlewares))
    , cancel_(std::move(cancel))
    , facade_(*this) {}

ConnectionPool::~ConnectionPool() {
    close();
}

ConnectionPool::Lease ConnectionPool::acquire(CallStatus& status) {
    {
        std::unique_lock<std::mutex> lock(pool_mutex_);
        while (true) {
            if (closed_) {
                status = CallStatus::failure(ErrorKind::Fatal, "connection pool closed");
                return {};
            }
            if (cancel_.cancelled()) {
                status = CallStatus::failure(ErrorKind::Cancelled, "request cancelled");
                return {};
            }
            if (!idle_handles_.empty()) {
                auto handle = std::move(idle_handles_.back());
                idle_handles_.pop_back();
                status = {};
                return Lease(this, std::move(handle));
            }
            // Create new handle if under limit
            if (active_ < max_size_) {
                ++active_;
                ++created_;
                break;
            }
            pool_cv_.wait_for(lock, std::chrono::milliseconds(100));
        }
    }

    // Connect outside the lock; authentication may take a while
    std::unique_ptr<Transport> handle;
    try {
        handle = apply_middlewares(factory_.create(identity_), middlewares_);
        status = handle->connect();
    } catch (const std::exception& e) {
        status = CallStatus::failure(ErrorKind::Fatal,
                                     std::string("cannot create client: ") + e.what());
    }

    if (!status.ok()) {
        log_error("pool: client for %s failed to connect: %s",
                  identity_label(identity_).c_str(), status.error_message.c_str());
        if (handle) handle->close();
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            --active_;
        }
        pool_cv_.notify_one();
        return {};
    }

    log_debug("pool: opened connection %zu/%zu for %s",
              created(), max_size_, identity_label(identity_).c_str());
    return Lease(this, std::move(handle));
}

void ConnectionPool::release(std::unique_ptr<Transport> handle, bool broken) {
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (!closed_ && !broken) {
            idle_handles_.push_back(std::move(handle));
        } else {
            --active_;
        }
    }
    if (handle) handle->close();
    pool_cv_.notify_one();
}

void ConnectionPool::close() {
    std::vector<std::unique_ptr<Transport>> handles;
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        closed_ = true;
        handles.swap(idle_handles_);
        active_ -= handles.size();
    }
    for (auto& handle : handles) {
        handle->close();
    }
    pool_cv_.notify_all();
}

size_t ConnectionPool::created() const {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return created_;
}

size_t ConnectionPool::idle() const {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return idle_handles_.size();
}

// --- PooledTransport ---

CallStatus ConnectionPool::PooledTransport::connect() {
    CallStatus status;
    auto lease = pool_.acquire(status);
    return status;
}

CallStatus ConnectionPool::PooledTransport::save_file_part(int64_t file_id, int part,
                                                           int total_parts,
                                                           std::span<const uint8_t> bytes) {
    return leased_call<CallStatus>(pool_, [&](Transport& t) {
        return t.save_file_part(file_id, part, total_parts, bytes);
    });
}

SendResult ConnectionPool::PooledTransport::send_document(ChannelId channel, int64_t file_id,
                                                          int total_parts,
                                                          const std::string& name,
                                                          uint64_t size) {
    return leased_call<SendResult>(pool_, [&](Transport& t) {
        return t.send_document(channel, file_id, total_parts, name, size);
    });
}

FetchResult ConnectionPool::PooledTransport::get_messages(ChannelId channel,
                                                          const std::vector<MessageId>& ids) {
    return leased_call<FetchResult>(pool_, [&](Transport& t) {
        return t.get_messages(channel, ids);
    });
}

CallStatus ConnectionPool::PooledTransport::delete_messages(ChannelId channel,
                                                            const std::vector<MessageId>& ids) {
    return leased_call<CallStatus>(pool_, [&](Transport& t) {
        return t.delete_messages(channel, ids);
    });
}

ReadResult ConnectionPool::PooledTransport::read_file(ChannelId channel, MessageId id,
                                                      uint64_t offset, uint64_t limit) {
    return leased_call<ReadResult>(pool_, [&](Transport& t) {
        return t.read_file(channel, id, offset, limit);
    });
}

}  // namespace chanvault::transport
