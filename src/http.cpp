// libcurl HTTP client for non-Linux targets.
#ifndef __linux__

#include "http.hpp"
#include "util.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <chrono>
#include <climits>
#include <mutex>
#include <string>

namespace sturdy {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

// ── Session share handle ──────────────────────────────────────

// curl share handles need external locking when easy handles on several
// threads use them.
struct CurlHttpClient::Share {
    CURLSH* handle = curl_share_init();
    std::mutex locks[CURL_LOCK_DATA_LAST];

    Share() {
        if (!handle) return;
        curl_share_setopt(handle, CURLSHOPT_LOCKFUNC, lock_cb);
        curl_share_setopt(handle, CURLSHOPT_UNLOCKFUNC, unlock_cb);
        curl_share_setopt(handle, CURLSHOPT_USERDATA, this);
        curl_share_setopt(handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        curl_share_setopt(handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    }
    ~Share() {
        if (handle) curl_share_cleanup(handle);
    }
    Share(const Share&) = delete;
    Share& operator=(const Share&) = delete;

    static void lock_cb(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<Share*>(userptr)->locks[data].lock();
    }
    static void unlock_cb(CURL*, curl_lock_data data, void* userptr) {
        static_cast<Share*>(userptr)->locks[data].unlock();
    }
};

CurlHttpClient::CurlHttpClient() : share_(std::make_unique<Share>()) {}

CurlHttpClient::~CurlHttpClient() = default;

namespace {

// Called by curl ~once per second; return non-zero to abort the transfer.
int abort_progress_cb(void* clientp,
                      curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* flag = static_cast<const std::atomic<bool>*>(clientp);
    if (flag && flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII curl handle ──────────────────────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

TransportStatus classify(CURLcode code) {
    switch (code) {
        case CURLE_OK:
            return TransportStatus::Ok;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportStatus::Timeout;
        case CURLE_ABORTED_BY_CALLBACK:
            return TransportStatus::Aborted;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return TransportStatus::InvalidUrl;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            return TransportStatus::ConnectFailed;
        default:
            return TransportStatus::IoError;
    }
}

} // namespace

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::send(const HttpRequest& request) {
    HttpResponse response;
    CurlRequest req;
    if (!req) {
        response.transport = TransportStatus::IoError;
        response.error = "curl_easy_init failed";
        return response;
    }

    req.hlist = build_headers(request.headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    auto timeout_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        to_steady_duration(request.timeout_seconds)).count();
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(std::min<long long>(timeout_ms, LONG_MAX)));
    curl_easy_setopt(req.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(req.curl, CURLOPT_PROTOCOLS_STR, "http,https");
    if (share_->handle)
        curl_easy_setopt(req.curl, CURLOPT_SHARE, share_->handle);

    if (request.abort_flag) {
        curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFODATA,
                         const_cast<std::atomic<bool>*>(request.abort_flag));
    }

    switch (request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::POST:
            curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
            break;
        default:
            curl_easy_setopt(req.curl, CURLOPT_CUSTOMREQUEST, method_name(request.method));
            break;
    }
    if (request.method != HttpMethod::GET) {
        curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(req.curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    } else {
        response.transport = classify(res);
        response.error = curl_easy_strerror(res);
        response.body.clear();
    }
    return response;
}

} // namespace sturdy

#endif // !__linux__
