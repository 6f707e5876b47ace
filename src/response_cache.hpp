#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace sturdy {

struct CacheEntry {
    nlohmann::json value;
    std::chrono::steady_clock::time_point expires_at;

    bool expired(std::chrono::steady_clock::time_point now) const { return now >= expires_at; }
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    size_t size = 0;
    size_t max_size = 0;
    double hit_rate = 0.0;
    uint64_t total_requests = 0;

    nlohmann::json to_json() const;
};

// In-memory TTL + LRU cache for decoded responses.
//
// Expiry is checked lazily on get(); when cleanup_interval_seconds > 0 a
// background thread also sweeps expired entries on that interval. A stored
// JSON null is a hit, distinct from a miss (nullopt).
//
// Thread-safe.
class ResponseCache {
public:
    using Clock = std::chrono::steady_clock;
    using Loader = std::function<nlohmann::json(const nlohmann::json& args)>;

    explicit ResponseCache(double default_ttl_seconds = 3600.0,
                           size_t max_size = 1000,
                           double cleanup_interval_seconds = 300.0);
    ~ResponseCache();

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    // Look up a live entry and mark it most recently used.
    std::optional<nlohmann::json> get(const std::string& key);

    // Insert or replace. A new key in a full cache evicts the least
    // recently used entry first.
    void set(const std::string& key, nlohmann::json value,
             std::optional<double> ttl_seconds = std::nullopt);

    bool remove(const std::string& key);

    // Drop every entry and reset hit/miss counters.
    void clear();

    // Remove expired entries; returns how many were removed.
    size_t cleanup_expired();

    CacheStats get_stats() const;
    size_t size() const;
    size_t max_size() const { return max_size_; }
    double default_ttl_seconds() const { return default_ttl_seconds_; }

    // "<last endpoint segment>_<16 hex chars of SHA-256>". Independent of
    // the order params were inserted in.
    static std::string generate_key(const std::string& endpoint,
                                    const nlohmann::json& params = nlohmann::json());

    // Memoize `fn` in this cache. The key is derived from key_namespace and
    // the JSON arguments. The returned function must not outlive the cache.
    Loader cached(const std::string& key_namespace, Loader fn,
                  std::optional<double> ttl_seconds = std::nullopt);

private:
    using Order = std::list<std::pair<std::string, CacheEntry>>;

    // Must be called with mutex_ held.
    void erase_locked(Order::iterator it);
    void cleanup_loop();

    double default_ttl_seconds_;
    size_t max_size_;
    double cleanup_interval_seconds_;

    // Front is most recently used.
    Order order_;
    std::unordered_map<std::string, Order::iterator> index_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    mutable std::mutex mutex_;

    std::thread cleanup_thread_;
    std::condition_variable cleanup_cv_;
    bool stopping_ = false;
};

} // namespace sturdy
