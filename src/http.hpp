#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>
#include <memory>

namespace sturdy {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

enum class HttpMethod {
    GET,
    POST,
    PUT,
    PATCH,
    DEL  // DELETE collides with a Windows macro
};

inline const char* method_name(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET:   return "GET";
        case HttpMethod::POST:  return "POST";
        case HttpMethod::PUT:   return "PUT";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::DEL:   return "DELETE";
    }
    return "GET";
}

using Header = std::pair<std::string, std::string>;

// Outcome of the transfer itself, independent of the HTTP status.
enum class TransportStatus {
    Ok,
    Timeout,
    ConnectFailed,  // DNS, refused, TLS handshake
    IoError,        // reset or truncated mid-transfer
    Aborted,        // abort_flag was raised
    InvalidUrl,
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;  // absolute, query string included
    std::string body;
    std::vector<Header> headers;
    double timeout_seconds = 30.0;

    // Polled during the transfer (~1s granularity); when it becomes true
    // the transfer stops and reports TransportStatus::Aborted.
    const std::atomic<bool>* abort_flag = nullptr;
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
    TransportStatus transport = TransportStatus::Ok;
    std::string error;  // transport failure detail

    bool transport_ok() const { return transport == TransportStatus::Ok; }
};

// Abstract HTTP client (injectable for testing). One instance is a session:
// it owns whatever per-session state the backend reuses across requests and
// must be safe to call from several threads at once.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency).
// The TLS context is created once per session and shared by its requests.
class SocketHttpClient : public HttpClient {
public:
    SocketHttpClient();
    ~SocketHttpClient() override;
    SocketHttpClient(const SocketHttpClient&) = delete;
    SocketHttpClient& operator=(const SocketHttpClient&) = delete;

    HttpResponse send(const HttpRequest& request) override;

private:
    struct TlsContext;
    std::unique_ptr<TlsContext> tls_;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Elsewhere: libcurl. The session shares DNS, TLS session and connection
// caches between requests so keep-alive connections are reused.
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;
    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse send(const HttpRequest& request) override;

private:
    struct Share;
    std::unique_ptr<Share> share_;
};
using PlatformHttpClient = CurlHttpClient;

#endif

} // namespace sturdy
