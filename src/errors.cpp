#include "errors.hpp"

#include <utility>

namespace sturdy {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Client:     return "client";
        case ErrorKind::Server:     return "server";
        case ErrorKind::Timeout:    return "timeout";
        case ErrorKind::Transport:  return "transport";
        case ErrorKind::Unexpected: return "unexpected";
        case ErrorKind::Cancelled:  return "cancelled";
        case ErrorKind::Closed:     return "closed";
    }
    return "unknown";
}

bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::Server ||
           kind == ErrorKind::Timeout ||
           kind == ErrorKind::Transport;
}

ApiError::ApiError(ErrorKind kind, const std::string& message, ErrorContext context)
    : std::runtime_error(message), kind_(kind), context_(std::move(context)) {}

} // namespace sturdy
