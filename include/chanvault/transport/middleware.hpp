#pragma once

#include "chanvault/core/cancel.hpp"
#include "chanvault/transport/transport.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace chanvault::transport {

/// Sleep hook used by every backoff. Returns false if the wait was cut short
/// by cancellation. Tests replace it to avoid real sleeps.
using SleepFn = std::function<bool(std::chrono::milliseconds, const CancelFlag&)>;

SleepFn default_sleep();

struct FloodWaitOptions {
    std::chrono::seconds max_wait{60};  // Longer advertised waits are returned as errors
    int max_attempts = 3;               // Waits per call before giving up
    std::function<void(std::chrono::seconds)> on_wait;  // Optional observer
};

struct RateLimitOptions {
    std::chrono::milliseconds interval{100};  // One token per interval
    int burst = 5;                            // Bucket capacity
};

struct ReconnectOptions {
    std::chrono::milliseconds initial_interval{500};
    std::chrono::milliseconds max_interval{60000};
    double multiplier = 1.1;
    double randomization = 0.5;  // Jitter: interval * [1 - r, 1 + r]
    std::chrono::seconds max_elapsed{120};
};

struct RetryOptions {
    int max_attempts = 5;
    std::chrono::milliseconds delay{5000};
};

/// Settings for the whole chain, configured once and reused across requests.
struct ResilienceOptions {
    FloodWaitOptions flood;
    RateLimitOptions rate;
    ReconnectOptions reconnect;
    RetryOptions retry;
    SleepFn sleep;  // Empty = default_sleep()
};

/// Token bucket shared by every handle of one middleware chain.
class TokenBucket {
public:
    TokenBucket(std::chrono::milliseconds interval, int burst);

    /// Take a token, blocking until one is available.
    /// Returns false if cancelled while waiting.
    bool acquire(const SleepFn& sleep, const CancelFlag& cancel);

    /// Take a token if one is available right now.
    bool try_acquire();

private:
    // Refill from elapsed time and return the wait until the next token
    std::chrono::milliseconds refill_locked(std::chrono::steady_clock::time_point now);

    std::mutex mutex_;
    std::chrono::milliseconds interval_;
    double capacity_;
    double tokens_;
    std::chrono::steady_clock::time_point last_refill_;
};

/// Base for decorators: every RPC is funnelled through invoke(), so a
/// policy only has to say how one call is run.
class TransportDecorator : public Transport {
public:
    explicit TransportDecorator(std::unique_ptr<Transport> next) : next_(std::move(next)) {}

    std::string type_name() const override { return next_->type_name(); }

    CallStatus connect() override;
    void close() override { next_->close(); }

    CallStatus save_file_part(int64_t file_id, int part, int total_parts,
                              std::span<const uint8_t> bytes) override;
    SendResult send_document(ChannelId channel, int64_t file_id, int total_parts,
                             const std::string& name, uint64_t size) override;
    FetchResult get_messages(ChannelId channel, const std::vector<MessageId>& ids) override;
    CallStatus delete_messages(ChannelId channel, const std::vector<MessageId>& ids) override;
    ReadResult read_file(ChannelId channel, MessageId id,
                         uint64_t offset, uint64_t limit) override;

protected:
    virtual CallStatus invoke(const std::function<CallStatus()>& call) = 0;

    std::unique_ptr<Transport> next_;
};

// Sleeps through flood-control errors and repeats the call
class FloodWaitTransport : public TransportDecorator {
public:
    FloodWaitTransport(std::unique_ptr<Transport> next, FloodWaitOptions options,
                       SleepFn sleep, CancelFlag cancel);

protected:
    CallStatus invoke(const std::function<CallStatus()>& call) override;

private:
    FloodWaitOptions options_;
    SleepFn sleep_;
    CancelFlag cancel_;
};

// Proactive rate limiting with a shared token bucket
class RateLimitTransport : public TransportDecorator {
public:
    RateLimitTransport(std::unique_ptr<Transport> next, std::shared_ptr<TokenBucket> bucket,
                       SleepFn sleep, CancelFlag cancel);

protected:
    CallStatus invoke(const std::function<CallStatus()>& call) override;

private:
    std::shared_ptr<TokenBucket> bucket_;
    SleepFn sleep_;
    CancelFlag cancel_;
};

// Reconnects with exponential backoff when the connection drops
class ReconnectTransport : public TransportDecorator {
public:
    ReconnectTransport(std::unique_ptr<Transport> next, ReconnectOptions options,
                       SleepFn sleep, CancelFlag cancel);

protected:
    CallStatus invoke(const std::function<CallStatus()>& call) override;

private:
    std::chrono::milliseconds jittered(std::chrono::milliseconds interval);

    ReconnectOptions options_;
    SleepFn sleep_;
    CancelFlag cancel_;
};

// Caps the number of attempts per logical call
class RetryTransport : public TransportDecorator {
public:
    RetryTransport(std::unique_ptr<Transport> next, RetryOptions options,
                   SleepFn sleep, CancelFlag cancel);

protected:
    CallStatus invoke(const std::function<CallStatus()>& call) override;

private:
    RetryOptions options_;
    SleepFn sleep_;
    CancelFlag cancel_;
};

bool is_retryable(ErrorKind kind);

using Middleware = std::function<std::unique_ptr<Transport>(std::unique_ptr<Transport>)>;

/// Build the chain for one request, innermost first:
/// flood wait, rate limit, reconnect, retry ceiling.
/// All handles wrapped with the returned middlewares share one token bucket.
std::vector<Middleware> build_middlewares(const ResilienceOptions& options,
                                          const CancelFlag& cancel);

/// Wrap a base transport with the middlewares (first element innermost).
std::unique_ptr<Transport> apply_middlewares(std::unique_ptr<Transport> base,
                                             const std::vector<Middleware>& middlewares);

}  // namespace chanvault::transport
