#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace sturdy {

enum class ErrorKind {
    Validation,
    Client,      // 4xx, never retried
    Server,      // 5xx, 408, 429
    Timeout,
    Transport,   // DNS, refused, reset, TLS
    Unexpected,
    Cancelled,
    Closed,      // request issued after close()
};

const char* error_kind_name(ErrorKind kind);

// Whether a failure of this kind may succeed on a later attempt.
bool is_retryable(ErrorKind kind);

// Request context attached to a failure so callers can decide whether to
// surface it or retry at a higher layer.
struct ErrorContext {
    long status_code = 0;
    int attempts = 0;
    double elapsed_seconds = 0.0;
    std::string method;
    std::string url;
    std::string body_excerpt;
};

class ApiError : public std::runtime_error {
public:
    ApiError(ErrorKind kind, const std::string& message, ErrorContext context = {});

    ErrorKind kind() const { return kind_; }
    bool retryable() const { return is_retryable(kind_); }

    long status_code() const { return context_.status_code; }
    int attempts() const { return context_.attempts; }
    double elapsed_seconds() const { return context_.elapsed_seconds; }
    const std::string& method() const { return context_.method; }
    const std::string& url() const { return context_.url; }
    const std::string& body_excerpt() const { return context_.body_excerpt; }
    const ErrorContext& context() const { return context_; }

    // Record the final attempt count and elapsed time before rethrowing.
    void set_attempts(int attempts, double elapsed_seconds) {
        context_.attempts = attempts;
        context_.elapsed_seconds = elapsed_seconds;
    }

private:
    ErrorKind kind_;
    ErrorContext context_;
};

class ValidationError : public ApiError {
public:
    explicit ValidationError(const std::string& message)
        : ApiError(ErrorKind::Validation, message) {}
};

class ClientError : public ApiError {
public:
    ClientError(const std::string& message, ErrorContext context)
        : ApiError(ErrorKind::Client, message, std::move(context)) {}
};

class ServerError : public ApiError {
public:
    ServerError(const std::string& message, ErrorContext context)
        : ApiError(ErrorKind::Server, message, std::move(context)) {}
};

class TimeoutError : public ApiError {
public:
    TimeoutError(const std::string& message, ErrorContext context)
        : ApiError(ErrorKind::Timeout, message, std::move(context)) {}
};

class TransportError : public ApiError {
public:
    TransportError(const std::string& message, ErrorContext context)
        : ApiError(ErrorKind::Transport, message, std::move(context)) {}
};

class UnexpectedError : public ApiError {
public:
    UnexpectedError(const std::string& message, ErrorContext context)
        : ApiError(ErrorKind::Unexpected, message, std::move(context)) {}
};

class CancelledError : public ApiError {
public:
    explicit CancelledError(const std::string& message, ErrorContext context = {})
        : ApiError(ErrorKind::Cancelled, message, std::move(context)) {}
};

class ClosedError : public ApiError {
public:
    ClosedError(const std::string& message, ErrorContext context)
        : ApiError(ErrorKind::Closed, message, std::move(context)) {}
};

} // namespace sturdy
