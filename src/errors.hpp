#pragma once
#include <stdexcept>
#include <string>
#include <cstdint>

namespace callgate {

// Outcome classification carried by QueryResult and observability events.
enum class ErrorKind : uint8_t {
    None,
    Configuration,      // unregistered API, invalid parameters (never retried)
    RateLimitExceeded,  // upstream 429
    Transport,          // connect / DNS / TLS / I/O failure
    Timeout,            // deadline exceeded
    Upstream,           // non-2xx, non-429
    Processing,         // response processor threw (never retried)
    Cancelled
};

std::string error_kind_to_string(ErrorKind kind);

// True for the kinds that consume the shared retry budget.
bool is_retryable(ErrorKind kind);

// Unknown API name or invalid registration / request parameters.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

// A cancel flag was observed while waiting.
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& what)
        : std::runtime_error(what) {}
};

// Thrown by cache stores; the response cache logs and absorbs it, so it
// never reaches a QueryResult and has no ErrorKind.
class CacheWriteError : public std::runtime_error {
public:
    explicit CacheWriteError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace callgate
