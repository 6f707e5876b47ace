#pragma once
#include "http.hpp"
#include "rate_limiter.hpp"
#include "response_cache.hpp"
#include "retry.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sturdy {

class Cancellation;

struct ClientConfig {
    std::string base_url;
    std::string api_key;                 // sent as a bearer token when set
    double timeout_seconds = 30.0;       // per network call
    uint32_t max_retries = 3;            // total attempts
    uint32_t rate_limit_calls = 100;
    double rate_limit_period_seconds = 60.0;
    double burst_multiplier = 1.0;
    bool cache_enabled = true;
    double cache_ttl_seconds = 3600.0;
    size_t cache_max_size = 1000;
    double cleanup_interval_seconds = 300.0;
    RetryConfig retry;                   // backoff shape; max_attempts comes from max_retries
    std::string user_agent = "sturdy/1.0";
};

struct RequestOptions {
    nlohmann::json params;                  // query parameters (object)
    std::optional<nlohmann::json> json_body;
    std::optional<nlohmann::json> form_body; // object, sent url-encoded
    std::vector<Header> headers;            // override the defaults by name
    bool skip_cache = false;
    const Cancellation* cancel = nullptr;
};

using SessionFactory = std::function<std::unique_ptr<HttpClient>()>;

// Request layer for one remote API: response cache for GETs, token-bucket
// admission, retries with exponential backoff for transient failures.
//
// The HTTP session is created on first use by at most one thread and then
// reused until close(). An injected session is borrowed: the client never
// closes or destroys it. Each attempt holds its own reference to the session,
// so close() during an in-flight request only drops the client's reference
// and the request finishes on a live session.
//
// Failures are thrown as ApiError subclasses (see errors.hpp).
class ResilientClient {
public:
    // Uses an injected session when given, else creates a PlatformHttpClient
    // lazily. Throws ValidationError on a bad base URL or settings.
    explicit ResilientClient(ClientConfig config, HttpClient* session = nullptr);
    ResilientClient(ClientConfig config, SessionFactory factory);
    ~ResilientClient();

    ResilientClient(const ResilientClient&) = delete;
    ResilientClient& operator=(const ResilientClient&) = delete;

    nlohmann::json request(HttpMethod method, const std::string& endpoint,
                           const RequestOptions& options = {});

    nlohmann::json get(const std::string& endpoint,
                       const nlohmann::json& params = nlohmann::json(),
                       bool skip_cache = false);
    // A null body sends no body.
    nlohmann::json post(const std::string& endpoint, const nlohmann::json& json_body = nullptr);
    nlohmann::json put(const std::string& endpoint, const nlohmann::json& json_body = nullptr);
    nlohmann::json patch(const std::string& endpoint, const nlohmann::json& json_body = nullptr);
    nlohmann::json del(const std::string& endpoint);

    // Release the session if this client created it. Idempotent; the
    // client refuses further requests afterwards.
    void close();
    bool closed() const { return closed_.load(std::memory_order_acquire); }
    bool session_ready() const { return std::atomic_load(&session_) != nullptr; }

    // nullopt when caching is disabled.
    std::optional<CacheStats> cache_stats() const;
    double rate_limit_wait_time();
    nlohmann::json health();

    const std::string& base_url() const { return config_.base_url; }
    const ClientConfig& config() const { return config_; }
    RateLimiter& rate_limiter() { return rate_limiter_; }
    ResponseCache* cache() { return cache_.get(); }

    // base_url + endpoint, without query string.
    std::string build_url(const std::string& endpoint) const;
    std::vector<Header> build_headers(const std::vector<Header>& custom,
                                      const std::string& content_type = "") const;

private:
    std::shared_ptr<HttpClient> session();
    nlohmann::json attempt(const HttpRequest& request, const Cancellation* cancel);
    nlohmann::json interpret(const HttpRequest& request, const HttpResponse& response) const;

    ClientConfig config_;

    SessionFactory factory_;
    // Read and written with std::atomic_load / std::atomic_store.
    std::shared_ptr<HttpClient> session_;
    bool owns_session_ = false;
    std::mutex session_mutex_;
    std::atomic<bool> closed_{false};

    RateLimiter rate_limiter_;
    std::unique_ptr<ResponseCache> cache_;
};

// "k1=v1&k2=v2" with keys in sorted order; strings unquoted, other scalars
// as JSON text, arrays as repeated keys, nulls skipped.
std::string encode_query(const nlohmann::json& params);

} // namespace sturdy
