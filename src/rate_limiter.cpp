#include "rate_limiter.hpp"
#include "cancellation.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace sturdy {

RateLimiter::RateLimiter(uint32_t calls_per_period, double period_seconds,
                         double burst_multiplier)
    : calls_per_period_(calls_per_period), period_seconds_(period_seconds) {
    if (calls_per_period == 0)
        throw std::invalid_argument("RateLimiter: calls_per_period must be positive");
    if (!(period_seconds > 0.0))
        throw std::invalid_argument("RateLimiter: period_seconds must be positive");
    if (!(burst_multiplier > 0.0))
        throw std::invalid_argument("RateLimiter: burst_multiplier must be positive");

    max_tokens_  = calls_per_period * burst_multiplier;
    refill_rate_ = calls_per_period / period_seconds;
    tokens_      = max_tokens_;
    last_refill_ = Clock::now();
}

void RateLimiter::refill() {
    auto now = Clock::now();
    double elapsed = std::chrono::duration<double>(now - last_refill_).count();
    if (elapsed > 0.0) {
        tokens_ = std::min(max_tokens_, tokens_ + elapsed * refill_rate_);
        last_refill_ = now;
    }
}

bool RateLimiter::acquire(double tokens, const Cancellation* cancel) {
    if (tokens > max_tokens_)
        throw std::invalid_argument("RateLimiter: cannot acquire " + std::to_string(tokens) +
                                    " tokens from a bucket of " + std::to_string(max_tokens_));

    while (true) {
        double wait_seconds;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            refill();
            if (tokens_ >= tokens) {
                tokens_ -= tokens;
                return true;
            }
            wait_seconds = (tokens - tokens_) / refill_rate_;
        }
        // Other acquirers may take the refilled tokens first; loop and
        // re-check rather than assuming the wait was enough.
        sleep_seconds(wait_seconds, cancel);
    }
}

bool RateLimiter::try_acquire(double tokens) {
    std::lock_guard<std::mutex> lock(mutex_);
    refill();
    if (tokens_ < tokens) return false;
    tokens_ -= tokens;
    return true;
}

double RateLimiter::get_wait_time() {
    std::lock_guard<std::mutex> lock(mutex_);
    refill();
    if (tokens_ >= 1.0) return 0.0;
    return (1.0 - tokens_) / refill_rate_;
}

double RateLimiter::available_tokens() {
    std::lock_guard<std::mutex> lock(mutex_);
    refill();
    return tokens_;
}

void RateLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_ = max_tokens_;
    last_refill_ = Clock::now();
}

} // namespace sturdy
