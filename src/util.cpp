#include "util.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>

namespace sturdy {

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(SHA256_DIGEST_LENGTH * 2);
    for (unsigned char byte : hash) {
        out += digits[byte >> 4];
        out += digits[byte & 0x0F];
    }
    return out;
}

std::string url_encode(const std::string& s) {
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

std::string excerpt(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;
    return s.substr(0, max_len) + "...";
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

bool atomic_write_file(const std::string& path, const std::string& content) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return false;
    }

    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) return false;
        out << content;
        if (!out.good()) return false;
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

bool parse_url(const std::string& url, ParsedUrl& out) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return false;

    out.scheme = to_lower(url.substr(0, scheme_end));

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?#", host_start);
    std::string authority = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    if (path_start == std::string::npos) {
        out.path = "/";
    } else if (url[path_start] == '/') {
        out.path = url.substr(path_start);
    } else {
        out.path = "/" + url.substr(path_start);
    }
    size_t fragment = out.path.find('#');
    if (fragment != std::string::npos) out.path.erase(fragment);

    // Drop userinfo so "user@host" resolves to host
    size_t at = authority.rfind('@');
    if (at != std::string::npos) authority.erase(0, at + 1);

    size_t colon = authority.rfind(':');
    bool bracketed = !authority.empty() && authority.front() == '[';
    size_t close_bracket = authority.find(']');
    if (colon != std::string::npos && (!bracketed || colon > close_bracket)) {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    } else {
        out.host = authority;
        out.port.clear();
    }
    if (bracketed && out.host.size() >= 2 && out.host.back() == ']')
        out.host = out.host.substr(1, out.host.size() - 2);
    out.host = to_lower(out.host);

    if (out.port.empty())
        out.port = (out.scheme == "https") ? "443" : "80";
    return true;
}

std::chrono::steady_clock::duration to_steady_duration(double seconds) {
    using Duration = std::chrono::steady_clock::duration;
    if (!(seconds > 0.0)) return Duration::zero();

    double ticks = seconds * static_cast<double>(Duration::period::den) /
                   static_cast<double>(Duration::period::num);
    if (ticks >= static_cast<double>(std::numeric_limits<Duration::rep>::max()))
        return Duration::max();
    return Duration(static_cast<Duration::rep>(ticks));
}

std::chrono::steady_clock::time_point steady_deadline(double seconds) {
    using Clock = std::chrono::steady_clock;
    auto now = Clock::now();
    auto span = to_steady_duration(seconds);
    if (span >= Clock::time_point::max() - now) return Clock::time_point::max();
    return now + span;
}

} // namespace sturdy
