#include "chanvault/transport/middleware.hpp"
#include "chanvault/core/log.hpp"

#include <algorithm>
#include <random>

namespace chanvault::transport {

SleepFn default_sleep() {
    return [](std::chrono::milliseconds duration, const CancelFlag& cancel) {
        return interruptible_sleep(duration, cancel);
    };
}

namespace {

CallStatus cancelled_status() {
    return CallStatus::failure(ErrorKind::Cancelled, "request cancelled");
}

}  // namespace

// --- TokenBucket ---

TokenBucket::TokenBucket(std::chrono::milliseconds interval, int burst)
    : interval_(std::max(interval, std::chrono::milliseconds(1)))
    , capacity_(static_cast<double>(std::max(burst, 1)))
    , tokens_(capacity_)
    , last_refill_(std::chrono::steady_clock::now()) {}

std::chrono::milliseconds TokenBucket::refill_locked(std::chrono::steady_clock::time_point now) {
    auto elapsed = std::chrono::duration<double, std::milli>(now - last_refill_).count();
    tokens_ = std::min(capacity_, tokens_ + elapsed / static_cast<double>(interval_.count()));
    last_refill_ = now;
    if (tokens_ >= 1.0) return std::chrono::milliseconds(0);
    auto missing = (1.0 - tokens_) * static_cast<double>(interval_.count());
    return std::chrono::milliseconds(static_cast<long>(missing) + 1);
}

bool TokenBucket::acquire(const SleepFn& sleep, const CancelFlag& cancel) {
    while (true) {
        std::chrono::milliseconds wait;
        {
            std::lock_guard lock(mutex_);
            wait = refill_locked(std::chrono::steady_clock::now());
            if (wait.count() == 0) {
                tokens_ -= 1.0;
                return true;
            }
        }
        if (!sleep(wait, cancel)) return false;
    }
}

bool TokenBucket::try_acquire() {
    std::lock_guard lock(mutex_);
    if (refill_locked(std::chrono::steady_clock::now()).count() != 0) return false;
    tokens_ -= 1.0;
    return true;
}

// --- TransportDecorator ---

CallStatus TransportDecorator::connect() {
    return invoke([this] { return next_->connect(); });
}

CallStatus TransportDecorator::save_file_part(int64_t file_id, int part, int total_parts,
                                              std::span<const uint8_t> bytes) {
    return invoke([&] { return next_->save_file_part(file_id, part, total_parts, bytes); });
}

SendResult TransportDecorator::send_document(ChannelId channel, int64_t file_id, int total_parts,
                                             const std::string& name, uint64_t size) {
    SendResult result;
    result.status = invoke([&] {
        result = next_->send_document(channel, file_id, total_parts, name, size);
        return result.status;
    });
    return result;
}

FetchResult TransportDecorator::get_messages(ChannelId channel, const std::vector<MessageId>& ids) {
    FetchResult result;
    result.status = invoke([&] {
        result = next_->get_messages(channel, ids);
        return result.status;
    });
    return result;
}

CallStatus TransportDecorator::delete_messages(ChannelId channel, const std::vector<MessageId>& ids) {
    return invoke([&] { return next_->delete_messages(channel, ids); });
}

ReadResult TransportDecorator::read_file(ChannelId channel, MessageId id,
                                         uint64_t offset, uint64_t limit) {
    ReadResult result;
    result.status = invoke([&] {
        result = next_->read_file(channel, id, offset, limit);
        return result.status;
    });
    return result;
}

// --- FloodWaitTransport ---

FloodWaitTransport::FloodWaitTransport(std::unique_ptr<Transport> next, FloodWaitOptions options,
                                       SleepFn sleep, CancelFlag cancel)
    : TransportDecorator(std::move(next))
    , options_(std::move(options))
    , sleep_(std::move(sleep))
    , cancel_(std::move(cancel)) {}

CallStatus FloodWaitTransport::invoke(const std::function<CallStatus()>& call) {
    for (int waits = 0;; ++waits) {
        auto status = call();
        if (status.kind != ErrorKind::FloodWait) return status;
        if (waits >= options_.max_attempts || status.retry_after > options_.max_wait) {
            return status;
        }

        auto wait = std::max(status.retry_after, std::chrono::seconds(1));
        log_debug("flood wait: sleeping %llds", static_cast<long long>(wait.count()));
        if (options_.on_wait) options_.on_wait(wait);
        if (!sleep_(std::chrono::duration_cast<std::chrono::milliseconds>(wait), cancel_)) {
            return cancelled_status();
        }
    }
}

// --- RateLimitTransport ---

RateLimitTransport::RateLimitTransport(std::unique_ptr<Transport> next,
                                       std::shared_ptr<TokenBucket> bucket,
                                       SleepFn sleep, CancelFlag cancel)
    : TransportDecorator(std::move(next))
    , bucket_(std::move(bucket))
    , sleep_(std::move(sleep))
    , cancel_(std::move(cancel)) {}

CallStatus RateLimitTransport::invoke(const std::function<CallStatus()>& call) {
    if (!bucket_->acquire(sleep_, cancel_)) return cancelled_status();
    return call();
}

// --- ReconnectTransport ---

ReconnectTransport::ReconnectTransport(std::unique_ptr<Transport> next, ReconnectOptions options,
                                       SleepFn sleep, CancelFlag cancel)
    : TransportDecorator(std::move(next))
    , options_(options)
    , sleep_(std::move(sleep))
    , cancel_(std::move(cancel)) {}

std::chrono::milliseconds ReconnectTransport::jittered(std::chrono::milliseconds interval) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    double r = std::clamp(options_.randomization, 0.0, 1.0);
    std::uniform_real_distribution<double> dist(1.0 - r, 1.0 + r);
    return std::chrono::milliseconds(
        static_cast<long>(static_cast<double>(interval.count()) * dist(rng)));
}

CallStatus ReconnectTransport::invoke(const std::function<CallStatus()>& call) {
    auto status = call();
    if (status.kind != ErrorKind::Disconnected) return status;

    // Elapsed time counts both wall time and scheduled backoff, so an
    // injected sleep still terminates the loop.
    auto start = std::chrono::steady_clock::now();
    std::chrono::milliseconds waited{0};
    auto interval = options_.initial_interval;
    int attempt = 0;

    while (true) {
        auto elapsed = std::max(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start),
            waited);
        if (elapsed >= options_.max_elapsed) {
            log_error("reconnect gave up after %d attempts: %s",
                      attempt, status.error_message.c_str());
            return CallStatus::failure(ErrorKind::Disconnected,
                                       "reconnect failed: " + status.error_message);
        }

        auto delay = jittered(interval);
        if (!sleep_(delay, cancel_)) return cancelled_status();
        waited += delay;
        ++attempt;
        interval = std::min(
            std::chrono::milliseconds(static_cast<long>(
                static_cast<double>(interval.count()) * options_.multiplier)),
            options_.max_interval);

        auto conn = next_->connect();
        if (conn.kind == ErrorKind::Disconnected || conn.kind == ErrorKind::Transient) {
            status = conn;
            continue;
        }
        if (!conn.ok()) return conn;

        log_debug("reconnected after %d attempts", attempt);
        status = call();
        if (status.kind != ErrorKind::Disconnected) return status;
    }
}

// --- RetryTransport ---

RetryTransport::RetryTransport(std::unique_ptr<Transport> next, RetryOptions options,
                               SleepFn sleep, CancelFlag cancel)
    : TransportDecorator(std::move(next))
    , options_(options)
    , sleep_(std::move(sleep))
    , cancel_(std::move(cancel)) {}

bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::FloodWait || kind == ErrorKind::Disconnected ||
           kind == ErrorKind::Transient;
}

CallStatus RetryTransport::invoke(const std::function<CallStatus()>& call) {
    int max_attempts = std::max(options_.max_attempts, 1);
    CallStatus status;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        status = call();
        if (status.ok() || !is_retryable(status.kind)) return status;
        if (attempt == max_attempts) break;

        log_debug("retrying call (attempt %d/%d): %s",
                  attempt + 1, max_attempts, status.error_message.c_str());
        if (!sleep_(options_.delay, cancel_)) return cancelled_status();
    }
    return status;
}

// --- Chain ---

std::vector<Middleware> build_middlewares(const ResilienceOptions& options,
                                          const CancelFlag& cancel) {
    SleepFn sleep = options.sleep ? options.sleep : default_sleep();
    auto bucket = std::make_shared<TokenBucket>(options.rate.interval, options.rate.burst);

    std::vector<Middleware> chain;
    chain.push_back([flood = options.flood, sleep, cancel](std::unique_ptr<Transport> next) {
        return std::make_unique<FloodWaitTransport>(std::move(next), flood, sleep, cancel);
    });
    chain.push_back([bucket, sleep, cancel](std::unique_ptr<Transport> next) {
        return std::make_unique<RateLimitTransport>(std::move(next), bucket, sleep, cancel);
    });
    chain.push_back([reconnect = options.reconnect, sleep, cancel](std::unique_ptr<Transport> next) {
        return std::make_unique<ReconnectTransport>(std::move(next), reconnect, sleep, cancel);
    });
    chain.push_back([retry = options.retry, sleep, cancel](std::unique_ptr<Transport> next) {
        return std::make_unique<RetryTransport>(std::move(next), retry, sleep, cancel);
    });
    return chain;
}

std::unique_ptr<Transport> apply_middlewares(std::unique_ptr<Transport> base,
                                             const std::vector<Middleware>& middlewares) {
    for (const auto& middleware : middlewares) {
        base = middleware(std::move(base));
    }
    return base;
}

}  // namespace chanvault::transport
