#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace chanvault {

/// Cancellation flag shared between a request and the work it started.
/// Copies observe the same state.
class CancelFlag {
public:
    CancelFlag() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { state_->store(true, std::memory_order_relaxed); }
    bool cancelled() const { return state_->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

/// Sleep in short slices so a cancelled request wakes up promptly.
/// Returns false if the flag was raised before the full duration elapsed.
inline bool interruptible_sleep(std::chrono::milliseconds duration, const CancelFlag& cancel) {
    constexpr auto slice = std::chrono::milliseconds(50);
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!cancel.cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, slice));
    }
    return false;
}

}  // namespace chanvault
