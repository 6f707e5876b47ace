#include "response_cache.hpp"
#include "util.hpp"

#include <iostream>
#include <iterator>
#include <stdexcept>

namespace sturdy {

nlohmann::json CacheStats::to_json() const {
    return {
        {"hits", hits},
        {"misses", misses},
        {"size", size},
        {"max_size", max_size},
        {"hit_rate", hit_rate},
        {"total_requests", total_requests}
    };
}

ResponseCache::ResponseCache(double default_ttl_seconds, size_t max_size,
                             double cleanup_interval_seconds)
    : default_ttl_seconds_(default_ttl_seconds),
      max_size_(max_size),
      cleanup_interval_seconds_(cleanup_interval_seconds) {
    if (max_size == 0)
        throw std::invalid_argument("ResponseCache: max_size must be positive");
    if (!(default_ttl_seconds >= 0.0))
        throw std::invalid_argument("ResponseCache: default_ttl_seconds must not be negative");

    if (cleanup_interval_seconds_ > 0.0)
        cleanup_thread_ = std::thread([this]() { cleanup_loop(); });
}

ResponseCache::~ResponseCache() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cleanup_cv_.notify_all();
    if (cleanup_thread_.joinable()) cleanup_thread_.join();
}

void ResponseCache::cleanup_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        // Deadline rather than wait_for: a huge interval saturates instead of
        // overflowing the clock, and a saturated one means no sweeps at all.
        auto next = steady_deadline(cleanup_interval_seconds_);
        if (next == Clock::time_point::max()) {
            cleanup_cv_.wait(lock, [this] { return stopping_; });
            break;
        }
        if (cleanup_cv_.wait_until(lock, next, [this] { return stopping_; }))
            break;
        lock.unlock();
        size_t removed = cleanup_expired();
        if (removed > 0)
            std::cerr << "[cache] Cleanup removed " << removed << " expired entries\n";
        lock.lock();
    }
}

void ResponseCache::erase_locked(Order::iterator it) {
    index_.erase(it->first);
    order_.erase(it);
}

std::optional<nlohmann::json> ResponseCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto found = index_.find(key);
    if (found == index_.end()) {
        ++misses_;
        return std::nullopt;
    }

    auto it = found->second;
    if (it->second.expired(Clock::now())) {
        erase_locked(it);
        ++misses_;
        return std::nullopt;
    }

    order_.splice(order_.begin(), order_, it);
    ++hits_;
    return it->second.value;
}

void ResponseCache::set(const std::string& key, nlohmann::json value,
                        std::optional<double> ttl_seconds) {
    double ttl = ttl_seconds.value_or(default_ttl_seconds_);
    CacheEntry entry{std::move(value), steady_deadline(ttl)};

    std::lock_guard<std::mutex> lock(mutex_);

    auto found = index_.find(key);
    if (found != index_.end()) {
        found->second->second = std::move(entry);
        order_.splice(order_.begin(), order_, found->second);
        return;
    }

    if (order_.size() >= max_size_) erase_locked(std::prev(order_.end()));

    order_.emplace_front(key, std::move(entry));
    index_[key] = order_.begin();
}

bool ResponseCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = index_.find(key);
    if (found == index_.end()) return false;
    erase_locked(found->second);
    return true;
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    order_.clear();
    index_.clear();
    hits_ = 0;
    misses_ = 0;
}

size_t ResponseCache::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    size_t removed = 0;
    for (auto it = order_.begin(); it != order_.end(); ) {
        if (it->second.expired(now)) {
            index_.erase(it->first);
            it = order_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

CacheStats ResponseCache::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.size = order_.size();
    stats.max_size = max_size_;
    stats.total_requests = hits_ + misses_;
    stats.hit_rate = stats.total_requests > 0
        ? static_cast<double>(hits_) / static_cast<double>(stats.total_requests)
        : 0.0;
    return stats;
}

size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

std::string ResponseCache::generate_key(const std::string& endpoint,
                                        const nlohmann::json& params) {
    std::string key_str = endpoint;

    bool has_params = !params.is_null() && !(params.is_object() && params.empty());
    if (has_params) {
        // nlohmann objects iterate in key order, so insertion order of the
        // caller's params never reaches the hash.
        nlohmann::json pairs = nlohmann::json::array();
        if (params.is_object()) {
            for (auto& [k, v] : params.items())
                pairs.push_back(nlohmann::json::array({k, v}));
        } else {
            pairs = params;
        }
        key_str += "|" + pairs.dump();
    }

    std::string segment = endpoint;
    size_t slash = segment.rfind('/');
    if (slash != std::string::npos) segment = segment.substr(slash + 1);

    return segment + "_" + sha256_hex(key_str).substr(0, 16);
}

ResponseCache::Loader ResponseCache::cached(const std::string& key_namespace, Loader fn,
                                            std::optional<double> ttl_seconds) {
    if (!fn) throw std::invalid_argument("ResponseCache::cached: empty function");

    return [this, key_namespace, fn = std::move(fn), ttl_seconds](const nlohmann::json& args) {
        std::string key = generate_key(key_namespace, nlohmann::json{{"args", args}});
        if (auto hit = get(key)) return *hit;

        nlohmann::json result = fn(args);
        set(key, result, ttl_seconds);
        return result;
    };
}

} // namespace sturdy
