#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>

namespace sturdy {

class Cancellation;

// Token bucket admission control: admits at most calls_per_period
// operations per period_seconds on average. burst_multiplier > 1 lets the
// bucket hold more than one period's worth of tokens.
//
// Thread-safe. Waiting never holds the lock.
class RateLimiter {
public:
    RateLimiter(uint32_t calls_per_period, double period_seconds,
                double burst_multiplier = 1.0);

    // Block until `tokens` are available, then consume them. The wait is
    // unbounded; pass `cancel` to be able to abort it, in which case
    // CancelledError is thrown and nothing is consumed.
    bool acquire(double tokens = 1.0, const Cancellation* cancel = nullptr);

    // Consume `tokens` only if available right now.
    bool try_acquire(double tokens = 1.0);

    // Seconds until one token is available (0 if available now).
    double get_wait_time();

    double available_tokens();
    void reset();

    uint32_t calls_per_period() const { return calls_per_period_; }
    double period_seconds() const { return period_seconds_; }
    double max_tokens() const { return max_tokens_; }
    double refill_rate() const { return refill_rate_; }

private:
    using Clock = std::chrono::steady_clock;

    // Must be called with mutex_ held.
    void refill();

    uint32_t calls_per_period_;
    double period_seconds_;
    double max_tokens_;
    double refill_rate_;  // tokens per second

    double tokens_;
    Clock::time_point last_refill_;
    std::mutex mutex_;
};

} // namespace sturdy
