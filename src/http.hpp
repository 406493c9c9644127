#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>
#include <cstdint>

namespace callgate {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

// Why a request produced no HTTP status.
enum class HttpFailure : uint8_t {
    None,
    InvalidUrl,
    Connect,   // DNS, TCP connect or TLS handshake
    Io,        // send/receive failed or response was malformed
    Timeout,
    Aborted    // abort flag observed
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
    HttpFailure failure = HttpFailure::None;
    std::string error;

    static HttpResponse failed(HttpFailure f, std::string message) {
        HttpResponse r;
        r.failure = f;
        r.error = std::move(message);
        return r;
    }
};

// Abstract HTTP client interface (injectable for testing).
// Implementations never throw for network conditions; they report them
// through HttpResponse::failure.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;

    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 30) = 0;

    // Flag checked by in-flight transfers (~1s granularity). When it becomes
    // true, requests abort promptly. Set before the client is shared.
    void set_abort_flag(const std::atomic<bool>* flag) { abort_flag_ = flag; }

protected:
    bool abort_requested() const {
        return abort_flag_ && abort_flag_->load(std::memory_order_relaxed);
    }

    const std::atomic<bool>* abort_flag_ = nullptr;
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Other platforms: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

inline const char* http_failure_name(HttpFailure failure) {
    switch (failure) {
        case HttpFailure::None:       return "none";
        case HttpFailure::InvalidUrl: return "invalid_url";
        case HttpFailure::Connect:    return "connect";
        case HttpFailure::Io:         return "io";
        case HttpFailure::Timeout:    return "timeout";
        case HttpFailure::Aborted:    return "aborted";
    }
    return "unknown";
}

} // namespace callgate
