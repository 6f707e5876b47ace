#include "retry.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace sturdy {

double backoff_delay(uint32_t attempt, const RetryConfig& config, double unit_random) {
    double delay = config.base_delay * std::pow(config.exponential_base, static_cast<double>(attempt));
    double jitter_range = delay * config.jitter_factor;
    delay += (unit_random * 2.0 - 1.0) * jitter_range;

    // Clamp after jitter so the cap is never exceeded
    delay = std::min(delay, config.max_delay);
    if (!(delay > 0.0)) return 0.0;
    return delay;
}

double backoff_delay(uint32_t attempt, const RetryConfig& config) {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return backoff_delay(attempt, config, dist(rng));
}

bool retryable_api_error(const std::exception& e) {
    if (auto* api = dynamic_cast<const ApiError*>(&e))
        return api->retryable();
    return false;
}

} // namespace sturdy
