#include "cancellation.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <thread>

namespace sturdy {

void Cancellation::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        flag_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool Cancellation::wait_until(std::chrono::steady_clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_until(lock, deadline, [this] { return cancelled(); });
}

void sleep_seconds(double seconds, const Cancellation* cancel) {
    if (cancel && cancel->cancelled())
        throw CancelledError("cancelled");
    if (seconds <= 0.0) return;

    auto deadline = steady_deadline(seconds);
    if (!cancel) {
        std::this_thread::sleep_until(deadline);
        return;
    }
    if (!cancel->wait_until(deadline))
        throw CancelledError("cancelled while waiting");
}

} // namespace sturdy
