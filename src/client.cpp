#include "client.hpp"
#include "cancellation.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <utility>

namespace sturdy {

namespace {

constexpr size_t kBodyExcerptBytes = 512;

ClientConfig validated(ClientConfig config) {
    ParsedUrl url;
    if (!parse_url(config.base_url, url))
        throw ValidationError("Invalid URL: missing scheme in '" + config.base_url + "'");
    if (url.scheme != "http" && url.scheme != "https")
        throw ValidationError("Invalid URL scheme '" + url.scheme + "'. Only http/https allowed.");
    if (url.host.empty())
        throw ValidationError("Invalid URL: missing host in '" + config.base_url + "'");

    if (config.max_retries == 0)
        throw ValidationError("max_retries must be at least 1");
    if (!(config.timeout_seconds > 0.0))
        throw ValidationError("timeout_seconds must be positive");
    if (config.rate_limit_calls == 0 || !(config.rate_limit_period_seconds > 0.0) ||
        !(config.burst_multiplier > 0.0))
        throw ValidationError("rate limit settings must be positive");
    if (config.rate_limit_calls * config.burst_multiplier < 1.0)
        throw ValidationError("rate limit bucket must hold at least one token");
    if (config.cache_enabled && config.cache_max_size == 0)
        throw ValidationError("cache_max_size must be positive");
    if (config.cache_enabled && !(config.cache_ttl_seconds >= 0.0))
        throw ValidationError("cache_ttl_seconds must not be negative");

    while (!config.base_url.empty() && config.base_url.back() == '/')
        config.base_url.pop_back();
    return config;
}

std::string format_seconds(double seconds) {
    std::ostringstream out;
    out << seconds;
    return out.str();
}

std::string scalar_text(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

bool is_client_error(long status) {
    // 408 and 429 say "try again later", not "this request is wrong"
    return status >= 400 && status < 500 && status != 408 && status != 429;
}

} // namespace

std::string encode_query(const nlohmann::json& params) {
    if (!params.is_object()) return {};

    std::string out;
    auto append = [&out](const std::string& key, const nlohmann::json& value) {
        if (value.is_null()) return;
        if (!out.empty()) out += '&';
        out += url_encode(key) + "=" + url_encode(scalar_text(value));
    };
    for (auto& [key, value] : params.items()) {
        if (value.is_array()) {
            for (const auto& item : value) append(key, item);
        } else {
            append(key, value);
        }
    }
    return out;
}

// ── Construction / lifecycle ──────────────────────────────────────

ResilientClient::ResilientClient(ClientConfig config, SessionFactory factory)
    : config_(validated(std::move(config))),
      factory_(std::move(factory)),
      rate_limiter_(config_.rate_limit_calls, config_.rate_limit_period_seconds,
                    config_.burst_multiplier) {
    if (!factory_) throw ValidationError("session factory must not be empty");

    if (config_.cache_enabled) {
        cache_ = std::make_unique<ResponseCache>(config_.cache_ttl_seconds,
                                                 config_.cache_max_size,
                                                 config_.cleanup_interval_seconds);
    }

    std::cerr << "[client] Initialized " << config_.base_url
              << " (timeout " << config_.timeout_seconds << "s, "
              << config_.max_retries << " attempts, rate "
              << config_.rate_limit_calls << "/" << config_.rate_limit_period_seconds << "s, cache "
              << (config_.cache_enabled ? "on" : "off") << ")\n";
}

ResilientClient::ResilientClient(ClientConfig config, HttpClient* session)
    : ResilientClient(std::move(config), SessionFactory([] {
          return std::make_unique<PlatformHttpClient>();
      })) {
    // Borrowed: the no-op deleter leaves the caller's session alone.
    if (session)
        std::atomic_store(&session_, std::shared_ptr<HttpClient>(session, [](HttpClient*) {}));
}

ResilientClient::~ResilientClient() {
    close();
}

std::shared_ptr<HttpClient> ResilientClient::session() {
    // Fast path: no lock once a session exists.
    auto current = std::atomic_load(&session_);
    if (current) return current;

    std::lock_guard<std::mutex> lock(session_mutex_);
    if (closed()) throw ClosedError("client is closed", {0, 0, 0.0, "", config_.base_url, ""});

    // Another thread may have created it while we waited for the lock.
    current = std::atomic_load(&session_);
    if (!current) {
        current = factory_();
        if (!current)
            throw UnexpectedError("session factory returned no session",
                                  {0, 0, 0.0, "", config_.base_url, ""});
        owns_session_ = true;
        std::atomic_store(&session_, current);
        std::cerr << "[client] Session created for " << config_.base_url << "\n";
    }
    return current;
}

void ResilientClient::close() {
    std::shared_ptr<HttpClient> released;
    bool owned = false;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (closed_.exchange(true, std::memory_order_acq_rel)) return;
        released = std::atomic_exchange(&session_, std::shared_ptr<HttpClient>());
        owned = owns_session_;
    }
    if (released && owned)
        std::cerr << "[client] Session closed for " << config_.base_url << "\n";
    // An attempt still using the session keeps it alive until send() returns.
}

// ── URL / header building ─────────────────────────────────────────

std::string ResilientClient::build_url(const std::string& endpoint) const {
    if (endpoint.empty() || endpoint.front() != '/')
        return config_.base_url + "/" + endpoint;
    return config_.base_url + endpoint;
}

std::vector<Header> ResilientClient::build_headers(const std::vector<Header>& custom,
                                                   const std::string& content_type) const {
    std::vector<Header> headers = {
        {"User-Agent", config_.user_agent},
        {"Accept", "application/json"},
    };
    if (!config_.api_key.empty())
        headers.emplace_back("Authorization", "Bearer " + config_.api_key);
    if (!content_type.empty())
        headers.emplace_back("Content-Type", content_type);

    // Caller headers win over defaults with the same (case-insensitive) name
    for (const auto& h : custom) {
        std::string name = to_lower(h.first);
        bool replaced = false;
        for (auto& existing : headers) {
            if (to_lower(existing.first) == name) {
                existing = h;
                replaced = true;
                break;
            }
        }
        if (!replaced) headers.push_back(h);
    }
    return headers;
}

// ── Request execution ─────────────────────────────────────────────

nlohmann::json ResilientClient::interpret(const HttpRequest& request,
                                          const HttpResponse& response) const {
    ErrorContext ctx;
    ctx.status_code = response.status_code;
    ctx.method = method_name(request.method);
    ctx.url = request.url;

    switch (response.transport) {
        case TransportStatus::Ok:
            break;
        case TransportStatus::Timeout:
            throw TimeoutError("Request timeout after " + format_seconds(config_.timeout_seconds) +
                               " seconds", ctx);
        case TransportStatus::ConnectFailed:
        case TransportStatus::IoError:
            throw TransportError("Request failed: " + response.error, ctx);
        case TransportStatus::Aborted:
            throw CancelledError("Request cancelled", ctx);
        case TransportStatus::InvalidUrl:
            throw UnexpectedError("Unexpected error: " + response.error, ctx);
    }

    long status = response.status_code;
    if (status >= 400) {
        ctx.body_excerpt = excerpt(response.body, kBodyExcerptBytes);
        std::string message = "API request failed with status " + std::to_string(status) +
                              ": " + ctx.body_excerpt;
        if (is_client_error(status)) throw ClientError(message, ctx);
        throw ServerError(message, ctx);
    }
    if (status < 100)
        throw UnexpectedError("Unexpected error: invalid HTTP status " + std::to_string(status), ctx);

    if (response.body.empty()) return nullptr;
    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_discarded())
        return nlohmann::json{{"raw_response", response.body}};
    return parsed;
}

nlohmann::json ResilientClient::attempt(const HttpRequest& request, const Cancellation* cancel) {
    if (cancel && cancel->cancelled())
        throw CancelledError("Request cancelled", {0, 0, 0.0, method_name(request.method), request.url, ""});
    rate_limiter_.acquire(1.0, cancel);

    // Held for the whole send so a concurrent close() cannot free it.
    std::shared_ptr<HttpClient> http = session();
    try {
        return interpret(request, http->send(request));
    } catch (const ApiError&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[client] Unexpected error in " << method_name(request.method) << " "
                  << request.url << ": " << e.what() << "\n";
        throw UnexpectedError(std::string("Unexpected error: ") + e.what(),
                              {0, 0, 0.0, method_name(request.method), request.url, ""});
    }
}

nlohmann::json ResilientClient::request(HttpMethod method, const std::string& endpoint,
                                        const RequestOptions& options) {
    auto started = std::chrono::steady_clock::now();
    auto elapsed = [started]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    };

    std::string base = build_url(endpoint);
    if (closed())
        throw ClosedError("client is closed", {0, 0, 0.0, method_name(method), base, ""});
    if (options.json_body && options.form_body)
        throw ValidationError("json_body and form_body are mutually exclusive");

    HttpRequest req;
    req.method = method;
    req.url = base;
    std::string query = encode_query(options.params);
    if (!query.empty()) req.url += (base.find('?') == std::string::npos ? "?" : "&") + query;
    req.timeout_seconds = config_.timeout_seconds;
    req.abort_flag = options.cancel ? options.cancel->flag() : nullptr;

    std::string content_type;
    if (options.json_body) {
        req.body = options.json_body->dump();
        content_type = "application/json";
    } else if (options.form_body) {
        req.body = encode_query(*options.form_body);
        content_type = "application/x-www-form-urlencoded";
    }
    req.headers = build_headers(options.headers, content_type);

    bool cacheable = method == HttpMethod::GET && cache_;
    std::string cache_key;
    if (cacheable) {
        cache_key = ResponseCache::generate_key(base, options.params);
        if (!options.skip_cache) {
            if (auto hit = cache_->get(cache_key)) return *hit;
        }
    }

    RetryConfig policy = config_.retry;
    policy.max_attempts = config_.max_retries;

    uint32_t attempts = 0;
    try {
        nlohmann::json result = retry_call(
            [&](uint32_t n) {
                attempts = n + 1;
                return attempt(req, options.cancel);
            },
            policy, retryable_api_error, options.cancel,
            std::string(method_name(method)) + " " + req.url);

        if (cacheable) cache_->set(cache_key, result);
        return result;
    } catch (ApiError& e) {
        e.set_attempts(static_cast<int>(attempts), elapsed());
        if (!e.retryable() && e.kind() != ErrorKind::Cancelled) {
            std::cerr << "[client] " << error_kind_name(e.kind()) << " error (no retry) "
                      << method_name(method) << " " << req.url << ": " << e.what() << "\n";
        }
        throw;
    }
}

nlohmann::json ResilientClient::get(const std::string& endpoint, const nlohmann::json& params,
                                    bool skip_cache) {
    RequestOptions options;
    options.params = params;
    options.skip_cache = skip_cache;
    return request(HttpMethod::GET, endpoint, options);
}

nlohmann::json ResilientClient::post(const std::string& endpoint, const nlohmann::json& json_body) {
    RequestOptions options;
    if (!json_body.is_null()) options.json_body = json_body;
    return request(HttpMethod::POST, endpoint, options);
}

nlohmann::json ResilientClient::put(const std::string& endpoint, const nlohmann::json& json_body) {
    RequestOptions options;
    if (!json_body.is_null()) options.json_body = json_body;
    return request(HttpMethod::PUT, endpoint, options);
}

nlohmann::json ResilientClient::patch(const std::string& endpoint, const nlohmann::json& json_body) {
    RequestOptions options;
    if (!json_body.is_null()) options.json_body = json_body;
    return request(HttpMethod::PATCH, endpoint, options);
}

nlohmann::json ResilientClient::del(const std::string& endpoint) {
    return request(HttpMethod::DEL, endpoint);
}

// ── Observability ─────────────────────────────────────────────────

std::optional<CacheStats> ResilientClient::cache_stats() const {
    if (!cache_) return std::nullopt;
    return cache_->get_stats();
}

double ResilientClient::rate_limit_wait_time() {
    return rate_limiter_.get_wait_time();
}

nlohmann::json ResilientClient::health() {
    nlohmann::json out = {
        {"base_url", config_.base_url},
        {"closed", closed()},
        {"session_ready", session_ready()},
        {"rate_limit", {
            {"calls_per_period", rate_limiter_.calls_per_period()},
            {"period_seconds", rate_limiter_.period_seconds()},
            {"available_tokens", rate_limiter_.available_tokens()},
            {"wait_time", rate_limiter_.get_wait_time()}
        }},
        {"cache", nullptr}
    };
    if (cache_) out["cache"] = cache_->get_stats().to_json();
    return out;
}

} // namespace sturdy
