#include "errors.hpp"

namespace callgate {

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "none";
        case ErrorKind::Configuration:     return "configuration";
        case ErrorKind::RateLimitExceeded: return "rate_limit_exceeded";
        case ErrorKind::Transport:         return "transport";
        case ErrorKind::Timeout:           return "timeout";
        case ErrorKind::Upstream:          return "upstream";
        case ErrorKind::Processing:        return "processing";
        case ErrorKind::Cancelled:         return "cancelled";
    }
    return "unknown";
}

bool is_retryable(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::RateLimitExceeded:
        case ErrorKind::Transport:
        case ErrorKind::Timeout:
        case ErrorKind::Upstream:
            return true;
        default:
            return false;
    }
}

} // namespace callgate
