#pragma once
#include <chrono>
#include <string>
#include <cstdint>

namespace sturdy {

// Trim whitespace
std::string trim(const std::string& s);

// Lowercase ASCII copy
std::string to_lower(const std::string& s);

// Hex-encoded SHA-256 digest of data
std::string sha256_hex(const std::string& data);

// Percent-encode for query strings and form bodies (RFC 3986 unreserved kept)
std::string url_encode(const std::string& s);

// Truncate to max_len bytes, appending "..." when cut
std::string excerpt(const std::string& s, size_t max_len);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write content to path via a temp file + rename, creating parent
// directories as needed. Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Seconds as a steady_clock duration. Saturates at duration::max() for
// huge or infinite values; zero for NaN and non-positive values.
std::chrono::steady_clock::duration to_steady_duration(double seconds);

// steady_clock::now() + seconds, saturating at time_point::max().
std::chrono::steady_clock::time_point steady_deadline(double seconds);

// Parsed absolute URL. path includes the leading '/' and any query string.
struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

// Split an absolute URL into its parts. Returns false when there is no
// "scheme://" prefix. Scheme and host are lowercased.
bool parse_url(const std::string& url, ParsedUrl& out);

} // namespace sturdy
