#pragma once
#include "cancellation.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <string>

namespace sturdy {

struct RetryConfig {
    uint32_t max_attempts = 3;     // total attempts, not retries after the first
    double base_delay = 1.0;       // seconds
    double max_delay = 30.0;       // hard cap, jitter included
    double exponential_base = 2.0;
    double jitter_factor = 0.5;    // delay varies by up to ±jitter_factor × delay
};

// base_delay × exponential_base^attempt, moved by (2u - 1) × jitter_factor
// × delay for u in [0, 1), then clamped to [0, max_delay].
double backoff_delay(uint32_t attempt, const RetryConfig& config, double unit_random);

// Same, with u drawn from a per-thread generator.
double backoff_delay(uint32_t attempt, const RetryConfig& config);

// Default predicate: ApiError instances decide by their kind, anything
// else is not retried.
bool retryable_api_error(const std::exception& e);

using RetryPredicate = std::function<bool(const std::exception&)>;

// Call fn(attempt) up to config.max_attempts times. Exceptions for which
// is_retryable returns false propagate at once; a retryable failure on the
// last attempt propagates as-is. Between attempts sleeps backoff_delay(),
// interruptibly when cancel is given (CancelledError on interrupt).
template <typename Fn>
auto retry_call(Fn&& fn, const RetryConfig& config,
                const RetryPredicate& is_retryable = retryable_api_error,
                const Cancellation* cancel = nullptr,
                const std::string& label = "call") -> decltype(fn(uint32_t{0})) {
    uint32_t max_attempts = config.max_attempts == 0 ? 1 : config.max_attempts;
    for (uint32_t attempt = 0;; ++attempt) {
        try {
            return fn(attempt);
        } catch (const std::exception& e) {
            if (!is_retryable(e)) throw;
            if (attempt + 1 >= max_attempts) {
                std::cerr << "[retry] " << label << " failed after " << max_attempts
                          << " attempts: " << e.what() << '\n';
                throw;
            }
            double delay = backoff_delay(attempt, config);
            std::cerr << "[retry] " << label << " attempt " << (attempt + 1) << "/"
                      << max_attempts << " failed: " << e.what()
                      << " (retrying in " << delay << "s)\n";
            sleep_seconds(delay, cancel);
        }
    }
}

} // namespace sturdy
