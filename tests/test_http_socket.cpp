#ifdef __linux__

#include <catch2/catch_test_macros.hpp>
#include "http.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <mutex>
#include <chrono>
#include <string>
#include <thread>
#include <utility>

using namespace sturdy;

// One-shot HTTP server on 127.0.0.1: accepts a single connection, records
// the request head, writes `reply` (if any) and keeps the socket open for
// `hold` before closing.
class LocalServer {
public:
    explicit LocalServer(std::string reply,
                         std::chrono::milliseconds hold = std::chrono::milliseconds(0))
        : reply_(std::move(reply)), hold_(hold) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listen_fd_, 1);

        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this]() { serve(); });
    }

    ~LocalServer() {
        stop_ = true;
        ::shutdown(listen_fd_, SHUT_RDWR);
        if (thread_.joinable()) thread_.join();
        ::close(listen_fd_);
    }

    std::string url(const std::string& path = "/") const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::string request_head() {
        std::lock_guard<std::mutex> lock(mutex_);
        return request_;
    }

private:
    void serve() {
        int client = ::accept(listen_fd_, nullptr, nullptr);
        if (client < 0) return;

        std::string head;
        char buf[4096];
        while (head.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = ::recv(client, buf, sizeof(buf), 0);
            if (n <= 0) break;
            head.append(buf, static_cast<size_t>(n));
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            request_ = head;
        }
        if (!reply_.empty())
            ::send(client, reply_.data(), reply_.size(), MSG_NOSIGNAL);

        auto until = std::chrono::steady_clock::now() + hold_;
        while (!stop_ && std::chrono::steady_clock::now() < until)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        ::close(client);
    }

    std::string reply_;
    std::chrono::milliseconds hold_;
    int listen_fd_ = -1;
    int port_ = 0;
    std::string request_;
    std::mutex mutex_;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

static HttpRequest make_request(const std::string& url, double timeout = 5.0) {
    HttpRequest req;
    req.url = url;
    req.timeout_seconds = timeout;
    return req;
}

// ── Response parsing ─────────────────────────────────────────────

TEST_CASE("SocketHttpClient: content-length response", "[http]") {
    LocalServer server("HTTP/1.1 200 OK\r\nContent-Length: 11\r\n\r\n{\"ok\":true}");
    SocketHttpClient http;

    auto req = make_request(server.url("/v1/near?lat=1"));
    req.headers = {{"Accept", "application/json"}};
    auto resp = http.send(req);

    REQUIRE(resp.transport_ok());
    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "{\"ok\":true}");

    auto head = server.request_head();
    REQUIRE(head.rfind("GET /v1/near?lat=1 HTTP/1.1\r\n", 0) == 0);
    REQUIRE(head.find("Accept: application/json\r\n") != std::string::npos);
    REQUIRE(head.find("Connection: close\r\n") != std::string::npos);
}

TEST_CASE("SocketHttpClient: chunked response", "[http]") {
    LocalServer server("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                       "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n");
    SocketHttpClient http;
    auto resp = http.send(make_request(server.url()));

    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "hello world");
}

TEST_CASE("SocketHttpClient: body read until close", "[http]") {
    LocalServer server("HTTP/1.0 503 Service Unavailable\r\n\r\nbusy");
    SocketHttpClient http;
    auto resp = http.send(make_request(server.url()));

    REQUIRE(resp.transport_ok());
    REQUIRE(resp.status_code == 503);
    REQUIRE(resp.body == "busy");
}

TEST_CASE("SocketHttpClient: post carries body and length", "[http]") {
    LocalServer server("HTTP/1.1 201 Created\r\nContent-Length: 0\r\n\r\n");
    SocketHttpClient http;

    auto req = make_request(server.url("/items"));
    req.method = HttpMethod::POST;
    req.body = "{\"a\":1}";
    auto resp = http.send(req);

    REQUIRE(resp.status_code == 201);
    REQUIRE(resp.body.empty());
    auto head = server.request_head();
    REQUIRE(head.rfind("POST /items HTTP/1.1\r\n", 0) == 0);
    REQUIRE(head.find("Content-Length: 7\r\n") != std::string::npos);
}

TEST_CASE("SocketHttpClient: huge timeout does not expire at once", "[http]") {
    LocalServer server("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\n{}");
    SocketHttpClient http;
    auto resp = http.send(make_request(server.url(), 1e12));

    REQUIRE(resp.transport_ok());
    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "{}");
}

// ── Transport failures ───────────────────────────────────────────

TEST_CASE("SocketHttpClient: refused connection", "[http]") {
    int port;
    {
        // Grab a free port, then release it so nothing listens there
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        socklen_t len = sizeof(addr);
        getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
        port = ntohs(addr.sin_port);
        ::close(fd);
    }

    SocketHttpClient http;
    auto resp = http.send(make_request("http://127.0.0.1:" + std::to_string(port) + "/"));
    REQUIRE(resp.transport == TransportStatus::ConnectFailed);
    REQUIRE(resp.status_code == 0);
    REQUIRE_FALSE(resp.error.empty());
}

TEST_CASE("SocketHttpClient: silent server times out", "[http]") {
    LocalServer server("", std::chrono::milliseconds(3000));
    SocketHttpClient http;

    auto start = std::chrono::steady_clock::now();
    auto resp = http.send(make_request(server.url(), 0.3));
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(resp.transport == TransportStatus::Timeout);
    REQUIRE(elapsed >= std::chrono::milliseconds(250));
    REQUIRE(elapsed < std::chrono::seconds(2));
}

TEST_CASE("SocketHttpClient: abort flag stops a pending read", "[http]") {
    LocalServer server("", std::chrono::milliseconds(5000));
    SocketHttpClient http;

    std::atomic<bool> stop_flag{false};
    auto req = make_request(server.url(), 10.0);
    req.abort_flag = &stop_flag;

    std::thread aborter([&stop_flag]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        stop_flag = true;
    });
    auto start = std::chrono::steady_clock::now();
    auto resp = http.send(req);
    aborter.join();

    REQUIRE(resp.transport == TransportStatus::Aborted);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(3));
}

TEST_CASE("SocketHttpClient: invalid URL", "[http]") {
    SocketHttpClient http;
    REQUIRE(http.send(make_request("not a url")).transport == TransportStatus::InvalidUrl);
    REQUIRE(http.send(make_request("ftp://host/x")).transport == TransportStatus::InvalidUrl);
}

#endif // __linux__
