#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace sturdy {

// Cooperative cancellation shared between a caller and the request it
// started. cancel() may be called from any thread; it wakes every sleeper
// and sets the flag polled by in-flight transfers.
class Cancellation {
public:
    Cancellation() = default;
    Cancellation(const Cancellation&) = delete;
    Cancellation& operator=(const Cancellation&) = delete;

    void cancel();
    bool cancelled() const { return flag_.load(std::memory_order_acquire); }

    // Flag for transports, which poll it during I/O.
    const std::atomic<bool>* flag() const { return &flag_; }

    // Sleep until `deadline`. Returns false if cancelled before or during
    // the wait, true if the deadline passed.
    bool wait_until(std::chrono::steady_clock::time_point deadline) const;

private:
    std::atomic<bool> flag_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

// Sleep `seconds`, interruptible through `cancel` (may be null).
// Throws CancelledError when interrupted.
void sleep_seconds(double seconds, const Cancellation* cancel);

} // namespace sturdy
