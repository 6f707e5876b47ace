// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same HttpClient interface as http.cpp (libcurl).
// http_init/cleanup are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"
#include "util.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <string>

namespace sturdy {

void http_init() {}
void http_cleanup() {}

using Clock = std::chrono::steady_clock;

// ── Session TLS context ───────────────────────────────────────

struct SocketHttpClient::TlsContext {
    SSL_CTX* ctx = nullptr;

    TlsContext() {
        ctx = SSL_CTX_new(TLS_client_method());
        if (!ctx) return;
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx);
        SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
    }
    ~TlsContext() {
        if (ctx) SSL_CTX_free(ctx);
    }
    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;
};

SocketHttpClient::SocketHttpClient() : tls_(std::make_unique<TlsContext>()) {}

SocketHttpClient::~SocketHttpClient() = default;

// ── RAII connection (TCP + optional TLS) ──────────────────────

namespace {

struct Connection {
    int  fd  = -1;
    SSL* ssl = nullptr;

    Clock::time_point deadline;
    const std::atomic<bool>* abort_flag = nullptr;

    // First failure seen on this connection; Ok while healthy.
    TransportStatus failure = TransportStatus::Ok;
    std::string error;

    Connection(Clock::time_point deadline_at, const std::atomic<bool>* abort)
        : deadline(deadline_at), abort_flag(abort) {}
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool fail(TransportStatus status, std::string message) {
        if (failure == TransportStatus::Ok) {
            failure = status;
            error = std::move(message);
        }
        return false;
    }

    bool aborted() const {
        return abort_flag && abort_flag->load(std::memory_order_relaxed);
    }

    // Milliseconds until the deadline, clamped to a 1-second slice so the
    // abort flag is polled regularly. <= 0 once the deadline has passed.
    int slice_ms() const {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        if (left <= 0) return 0;
        return static_cast<int>(std::min<long long>(left, 1000));
    }

    // Wait until fd is ready for `events`. Returns false (with failure set)
    // on timeout or abort.
    bool wait_ready(short events) {
        while (true) {
            if (aborted()) return fail(TransportStatus::Aborted, "request aborted");
            int ms = slice_ms();
            if (ms <= 0) return fail(TransportStatus::Timeout, "request timed out");

            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = events;
            int rc = ::poll(&pfd, 1, ms);
            if (rc > 0) return true;
            if (rc < 0 && errno != EINTR)
                return fail(TransportStatus::IoError, std::strerror(errno));
        }
    }

    bool connect(const ParsedUrl& url, SSL_CTX* tls_ctx) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0)
            return fail(TransportStatus::ConnectFailed,
                        "cannot resolve " + url.host + ": " + gai_strerror(gai));

        bool connected = false;
        std::string last_error = "connection refused";
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking for the whole lifetime; I/O waits go through poll()
            // so the deadline and abort flag are honoured.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                connected = true;
            } else if (errno == EINPROGRESS) {
                if (wait_ready(POLLOUT)) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) connected = true;
                    else last_error = std::strerror(err);
                } else if (failure != TransportStatus::Ok) {
                    break;  // timed out or aborted; don't try other addresses
                }
            } else {
                last_error = std::strerror(errno);
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (failure != TransportStatus::Ok) return false;
        if (!connected)
            return fail(TransportStatus::ConnectFailed,
                        "cannot connect to " + url.host + ":" + url.port + ": " + last_error);

        if (url.scheme == "https") {
            if (!tls_ctx) return fail(TransportStatus::ConnectFailed, "TLS context unavailable");
            ssl = SSL_new(tls_ctx);
            if (!ssl) return fail(TransportStatus::ConnectFailed, "SSL_new failed");
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI
            SSL_set1_host(ssl, url.host.c_str());

            while (true) {
                int rc = SSL_connect(ssl);
                if (rc == 1) break;
                int err = SSL_get_error(ssl, rc);
                if (err == SSL_ERROR_WANT_READ) {
                    if (!wait_ready(POLLIN)) return false;
                } else if (err == SSL_ERROR_WANT_WRITE) {
                    if (!wait_ready(POLLOUT)) return false;
                } else {
                    char buf[256];
                    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
                    return fail(TransportStatus::ConnectFailed,
                                std::string("TLS handshake failed: ") + buf);
                }
            }
        }
        return true;
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on failure
    // (timeout, abort or I/O error; see `failure`).
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ) {
                    if (!wait_ready(POLLIN)) return -1;
                    continue;
                }
                if (err == SSL_ERROR_WANT_WRITE) {
                    if (!wait_ready(POLLOUT)) return -1;
                    continue;
                }
                if (err == SSL_ERROR_SYSCALL && n == 0) return 0; // peer closed
                fail(TransportStatus::IoError, "TLS read failed");
                return -1;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    if (!wait_ready(POLLIN)) return -1;
                    continue;
                }
                fail(TransportStatus::IoError, std::strerror(errno));
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE) {
                        if (!wait_ready(POLLOUT)) return false;
                        continue;
                    }
                    if (err == SSL_ERROR_WANT_READ) {
                        if (!wait_ready(POLLIN)) return false;
                        continue;
                    }
                    return fail(TransportStatus::IoError, "TLS write failed");
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                        if (!wait_ready(POLLOUT)) return false;
                        continue;
                    }
                    return fail(TransportStatus::IoError, std::strerror(errno));
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }
};

// ── Request building ───────────────────────────────────────────

std::string build_request(const HttpRequest& request, const ParsedUrl& url) {
    const std::string& body = request.body;
    std::string req;
    req.reserve(512 + body.size());
    req += std::string(method_name(request.method)) + " " + url.path + " HTTP/1.1\r\n";

    bool default_port = (url.scheme == "https" && url.port == "443") ||
                        (url.scheme == "http" && url.port == "80");
    req += "Host: " + url.host + (default_port ? "" : ":" + url.port) + "\r\n";

    bool has_content_length = false;
    for (const auto& h : request.headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (to_lower(h.first) == "content-length") has_content_length = true;
    }
    if (!has_content_length &&
        (!body.empty() || request.method == HttpMethod::POST ||
         request.method == HttpMethod::PUT || request.method == HttpMethod::PATCH))
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// Returns false on EOF or failure before a full line arrived.
bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

// Parse status line + headers; populates is_chunked / content_length.
long parse_response_headers(Connection& conn, std::string& leftover,
                            bool& is_chunked, long long& content_length) {
    is_chunked     = false;
    content_length = -1;

    std::string status_line;
    if (!read_line(conn, leftover, status_line)) {
        conn.fail(TransportStatus::IoError, "connection closed before response");
        return 0;
    }

    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos || status_line.size() < sp1 + 4) {
        conn.fail(TransportStatus::IoError, "malformed status line");
        return 0;
    }
    long status = std::strtol(status_line.substr(sp1 + 1, 3).c_str(), nullptr, 10);
    if (status < 100 || status > 999) {
        conn.fail(TransportStatus::IoError, "malformed status line");
        return 0;
    }

    std::string line;
    while (read_line(conn, leftover, line)) {
        if (line.empty()) return status; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = to_lower(trim(line.substr(0, colon)));
        std::string value = to_lower(trim(line.substr(colon + 1)));

        if (name == "transfer-encoding")
            is_chunked = (value.find("chunked") != std::string::npos);
        else if (name == "content-length")
            content_length = std::strtoll(value.c_str(), nullptr, 10);
    }
    conn.fail(TransportStatus::IoError, "connection closed inside headers");
    return 0;
}

// Read exactly n bytes, consuming leftover first.
bool read_exactly(Connection& conn, std::string& leftover,
                  size_t n, std::string& out) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            out.append(leftover, 0, take);
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
        if (got <= 0) return false;
        out.append(buf, static_cast<size_t>(got));
        n -= static_cast<size_t>(got);
    }
    return true;
}

bool read_until_eof(Connection& conn, std::string& leftover, std::string& out) {
    out += leftover;
    leftover.clear();
    char buf[4096];
    for (;;) {
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n == 0) return true;
        if (n < 0) return false;
        out.append(buf, static_cast<size_t>(n));
    }
}

// Accumulate full body (handles chunked + content-length + read-to-close).
bool read_body(Connection& conn, std::string& leftover,
               bool is_chunked, long long content_length, std::string& body) {
    if (is_chunked) {
        for (;;) {
            std::string size_line;
            if (!read_line(conn, leftover, size_line))
                return conn.fail(TransportStatus::IoError, "truncated chunked body");
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) return true;
            if (!read_exactly(conn, leftover, chunk_size, body))
                return conn.fail(TransportStatus::IoError, "truncated chunk");
            std::string crlf;
            read_exactly(conn, leftover, 2, crlf); // trailing \r\n
        }
    }
    if (content_length >= 0) {
        if (!read_exactly(conn, leftover, static_cast<size_t>(content_length), body))
            return conn.fail(TransportStatus::IoError, "truncated body");
        return true;
    }
    return read_until_eof(conn, leftover, body);
}

HttpResponse failure_response(const Connection& conn) {
    HttpResponse resp;
    resp.transport = conn.failure;
    resp.error = conn.error;
    return resp;
}

} // namespace

// ── Core request executor ──────────────────────────────────────

HttpResponse SocketHttpClient::send(const HttpRequest& request) {
    ParsedUrl url;
    if (!parse_url(request.url, url) || url.host.empty() ||
        (url.scheme != "http" && url.scheme != "https")) {
        HttpResponse resp;
        resp.transport = TransportStatus::InvalidUrl;
        resp.error = "invalid URL: " + request.url;
        return resp;
    }

    Connection conn(steady_deadline(request.timeout_seconds), request.abort_flag);
    if (!conn.connect(url, tls_->ctx)) return failure_response(conn);

    std::string wire = build_request(request, url);
    if (!conn.write_all(wire.c_str(), wire.size())) return failure_response(conn);

    std::string leftover;
    bool      is_chunked     = false;
    long long content_length = -1;
    long status = parse_response_headers(conn, leftover, is_chunked, content_length);
    if (status == 0) return failure_response(conn);

    HttpResponse resp;
    resp.status_code = status;
    if (status == 204 || status == 304) return resp;
    if (!read_body(conn, leftover, is_chunked, content_length, resp.body))
        return failure_response(conn);
    return resp;
}

} // namespace sturdy

#endif // __linux__
