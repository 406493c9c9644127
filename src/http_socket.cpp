// Linux transport: POSIX sockets + OpenSSL, HTTP/1.1 with Connection: close.
// One TLS context is shared by every transfer; http_init() builds it up
// front so certificate loading happens once at start-up.
#ifdef __linux__

#include "http.hpp"
#include "util.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/select.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace callgate {

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr size_t kMaxBodyBytes = 16 * 1024 * 1024;
constexpr size_t kMaxHeaderLine = 16 * 1024;
constexpr size_t kReadChunk = 8192;

// ── Shared TLS context ─────────────────────────────────────────

std::mutex g_tls_mutex;
SSL_CTX* g_tls_ctx = nullptr;

SSL_CTX* tls_context() {
    std::lock_guard<std::mutex> lock(g_tls_mutex);
    if (g_tls_ctx) return g_tls_ctx;

    SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
    if (!ctx) return nullptr;
    SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Many APIs close without close_notify once Content-Length is satisfied.
    SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    if (SSL_CTX_set_default_verify_paths(ctx) != 1)
        std::cerr << "[http] Could not load default CA certificates\n";
    g_tls_ctx = ctx;
    return g_tls_ctx;
}

// ── URL ────────────────────────────────────────────────────────

struct Endpoint {
    bool tls = false;
    std::string host;
    std::string port;
    std::string request_target; // path + query, always starts with '/'

    std::string host_header() const {
        bool default_port = (tls && port == "443") || (!tls && port == "80");
        std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        return default_port ? h : h + ":" + port;
    }
};

// nullopt with error set when the URL cannot be used.
std::optional<Endpoint> parse_endpoint(const std::string& url, std::string& error) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        error = "missing scheme in " + url;
        return std::nullopt;
    }
    std::string scheme = to_lower(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") {
        error = "unsupported scheme '" + scheme + "'";
        return std::nullopt;
    }

    Endpoint ep;
    ep.tls = scheme == "https";

    std::string rest = url.substr(scheme_end + 3);
    size_t fragment = rest.find('#');
    if (fragment != std::string::npos) rest.erase(fragment);

    size_t target_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, target_start);
    if (target_start == std::string::npos) {
        ep.request_target = "/";
    } else {
        ep.request_target = rest.substr(target_start);
        if (ep.request_target[0] == '?') ep.request_target.insert(0, "/");
    }

    if (authority.find('@') != std::string::npos) {
        error = "credentials in URL are not supported; pass them as headers";
        return std::nullopt;
    }

    std::string port;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            error = "unterminated IPv6 literal in " + url;
            return std::nullopt;
        }
        ep.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':')
            port = authority.substr(close + 2);
    } else {
        size_t colon = authority.rfind(':');
        ep.host = authority.substr(0, colon);
        if (colon != std::string::npos) port = authority.substr(colon + 1);
    }

    if (ep.host.empty()) {
        error = "missing host in " + url;
        return std::nullopt;
    }
    if (!port.empty() &&
        (port.size() > 5 || port.find_first_not_of("0123456789") != std::string::npos)) {
        error = "invalid port '" + port + "'";
        return std::nullopt;
    }
    ep.port = port.empty() ? (ep.tls ? "443" : "80") : port;
    return ep;
}

// ── Connection ─────────────────────────────────────────────────

// Socket plus optional TLS session, bounded by one overall deadline. Reads
// and writes run in 1-second slices so the abort flag is noticed promptly.
class Connection {
public:
    Connection(const std::atomic<bool>* abort_flag, long timeout_seconds)
        : abort_flag_(abort_flag),
          deadline_(SteadyClock::now() + std::chrono::seconds(std::max(1L, timeout_seconds))) {}

    ~Connection() {
        if (ssl_) {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
        }
        if (fd_ >= 0) ::close(fd_);
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    HttpFailure failure() const { return failure_; }

    HttpFailure open(const Endpoint& ep) {
        HttpFailure f = open_socket(ep);
        if (f != HttpFailure::None || !ep.tls) return f;
        return start_tls(ep);
    }

    // >0 bytes read, 0 on orderly close, -1 on failure (see failure()).
    ssize_t read_some(char* buf, size_t len) {
        for (;;) {
            if (!still_allowed()) return -1;

            if (ssl_) {
                int n = SSL_read(ssl_, buf, static_cast<int>(len));
                if (n > 0) return n;
                int err = SSL_get_error(ssl_, n);
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) continue;
                if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue;
                if (err == SSL_ERROR_SYSCALL && n == 0) return 0; // peer closed without close_notify
                failure_ = HttpFailure::Io;
                return -1;
            }

            ssize_t n = ::recv(fd_, buf, len, 0);
            if (n >= 0) return n;
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            failure_ = HttpFailure::Io;
            return -1;
        }
    }

    bool write_all(const std::string& data) {
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            if (!still_allowed()) return false;

            ssize_t n;
            if (ssl_) {
                int w = SSL_write(ssl_, p, static_cast<int>(left));
                if (w <= 0) {
                    int err = SSL_get_error(ssl_, w);
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) continue;
                    failure_ = HttpFailure::Io;
                    return false;
                }
                n = w;
            } else {
                n = ::send(fd_, p, left, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    failure_ = HttpFailure::Io;
                    return false;
                }
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    bool still_allowed() {
        if (abort_flag_ && abort_flag_->load(std::memory_order_relaxed)) {
            failure_ = HttpFailure::Aborted;
            return false;
        }
        if (SteadyClock::now() >= deadline_) {
            failure_ = HttpFailure::Timeout;
            return false;
        }
        return true;
    }

    long seconds_left() const {
        auto left = std::chrono::duration_cast<std::chrono::seconds>(
            deadline_ - SteadyClock::now()).count();
        return left > 0 ? static_cast<long>(left) : 0;
    }

    void set_io_slice(long seconds) {
        struct timeval tv{seconds, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    // Non-blocking connect to each resolved address in turn, waiting in
    // 1-second selects so abort and deadline are honoured.
    HttpFailure open_socket(const Endpoint& ep) {
        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(ep.host.c_str(), ep.port.c_str(), &hints, &res) != 0)
            return HttpFailure::Connect;

        HttpFailure result = HttpFailure::Connect;
        for (auto* ai = res; ai && fd_ < 0; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            bool connected = ::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0;
            bool pending = !connected && errno == EINPROGRESS;
            while (pending) {
                if (!still_allowed()) {
                    result = failure_;
                    break;
                }
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{std::min(1L, seconds_left()), 200000};
                int rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc == 0) continue;
                pending = false;
                if (rc < 0) break;
                int err = 0;
                socklen_t elen = sizeof(err);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                connected = err == 0;
            }

            if (connected) {
                fcntl(fd, F_SETFL, flags);
                fd_ = fd;
            } else {
                ::close(fd);
                if (result == HttpFailure::Aborted || result == HttpFailure::Timeout) break;
            }
        }
        freeaddrinfo(res);
        if (fd_ < 0) return result;

        set_io_slice(1);
        return HttpFailure::None;
    }

    HttpFailure start_tls(const Endpoint& ep) {
        SSL_CTX* ctx = tls_context();
        if (!ctx) return HttpFailure::Connect;

        ssl_ = SSL_new(ctx);
        if (!ssl_) return HttpFailure::Connect;
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, ep.host.c_str());
        SSL_set1_host(ssl_, ep.host.c_str());

        // The handshake gets the remaining budget in one piece.
        set_io_slice(std::max(1L, seconds_left()));
        int rc = SSL_connect(ssl_);
        set_io_slice(1);
        if (rc == 1) return HttpFailure::None;

        unsigned long err = ERR_get_error();
        if (err != 0) {
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            std::cerr << "[http] TLS handshake with " << ep.host << " failed: " << buf << "\n";
        }
        return SteadyClock::now() >= deadline_ ? HttpFailure::Timeout : HttpFailure::Connect;
    }

    const std::atomic<bool>* abort_flag_;
    SteadyClock::time_point deadline_;
    int fd_ = -1;
    SSL* ssl_ = nullptr;
    HttpFailure failure_ = HttpFailure::None;
};

// ── Request ────────────────────────────────────────────────────

bool is_managed_header(const std::string& name) {
    std::string n = to_lower(name);
    return n == "host" || n == "connection" || n == "content-length";
}

std::string serialize_request(const char* method, const Endpoint& ep,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              bool send_body) {
    std::string out;
    out.reserve(256 + body.size());
    out.append(method).append(" ").append(ep.request_target).append(" HTTP/1.1\r\n");
    out.append("Host: ").append(ep.host_header()).append("\r\n");
    for (const auto& h : headers) {
        if (is_managed_header(h.first)) continue;
        out.append(h.first).append(": ").append(h.second).append("\r\n");
    }
    if (send_body)
        out.append("Content-Length: ").append(std::to_string(body.size())).append("\r\n");
    out.append("Accept-Encoding: identity\r\n");
    out.append("Connection: close\r\n\r\n");
    if (send_body) out.append(body);
    return out;
}

// ── Response ───────────────────────────────────────────────────

// Pulls bytes from the connection through a look-ahead buffer.
class ResponseReader {
public:
    explicit ResponseReader(Connection& conn) : conn_(conn) {}

    // Why reading stopped early; None while the stream is healthy.
    HttpFailure failure() const {
        if (conn_.failure() != HttpFailure::None) return conn_.failure();
        return malformed_ ? HttpFailure::Io : HttpFailure::None;
    }
    const std::string& problem() const { return problem_; }

    // Status code of the final response, skipping 1xx interim responses.
    // 0 when no usable status line arrived.
    long read_head() {
        for (;;) {
            std::string status_line;
            if (!line(status_line)) return 0;
            if (status_line.compare(0, 5, "HTTP/") != 0) return fail("bad status line");

            size_t sp = status_line.find(' ');
            long status = sp == std::string::npos
                ? 0 : std::strtol(status_line.c_str() + sp + 1, nullptr, 10);
            if (status < 100 || status > 599) return fail("bad status code");

            chunked_ = false;
            content_length_.reset();
            std::string header;
            for (;;) {
                if (!line(header)) return 0;
                if (header.empty()) break;
                take_header(header);
            }
            if (status >= 200) return status;
        }
    }

    bool read_body(std::string& body, bool head_only) {
        if (head_only) return true;
        if (chunked_) return read_chunked(body);
        if (content_length_) {
            if (*content_length_ > kMaxBodyBytes) return fail("response body too large") != 0;
            return exact(*content_length_, body);
        }
        return until_close(body);
    }

private:
    long fail(const std::string& what) {
        malformed_ = true;
        problem_ = what;
        return 0;
    }

    bool fill() {
        char buf[kReadChunk];
        ssize_t n = conn_.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        buffer_.append(buf, static_cast<size_t>(n));
        return true;
    }

    bool line(std::string& out) {
        for (;;) {
            size_t nl = buffer_.find('\n');
            if (nl != std::string::npos) {
                out.assign(buffer_, 0, nl);
                buffer_.erase(0, nl + 1);
                if (!out.empty() && out.back() == '\r') out.pop_back();
                return true;
            }
            if (buffer_.size() > kMaxHeaderLine) return fail("header line too long") != 0;
            if (!fill()) {
                if (failure() == HttpFailure::None) fail("connection closed mid-header");
                return false;
            }
        }
    }

    void take_header(const std::string& header) {
        size_t colon = header.find(':');
        if (colon == std::string::npos) return;
        std::string name = to_lower(trim(header.substr(0, colon)));
        std::string value = to_lower(trim(header.substr(colon + 1)));
        if (name == "transfer-encoding") {
            chunked_ = value.find("chunked") != std::string::npos;
        } else if (name == "content-length") {
            char* end = nullptr;
            unsigned long long n = std::strtoull(value.c_str(), &end, 10);
            if (end && *end == '\0' && !value.empty()) content_length_ = static_cast<size_t>(n);
        }
    }

    bool exact(size_t n, std::string& out) {
        while (buffer_.size() < n) {
            if (!fill()) {
                if (failure() == HttpFailure::None) fail("response body truncated");
                return false;
            }
        }
        out.append(buffer_, 0, n);
        buffer_.erase(0, n);
        return true;
    }

    bool until_close(std::string& out) {
        for (;;) {
            out += buffer_;
            buffer_.clear();
            if (out.size() > kMaxBodyBytes) return fail("response body too large") != 0;
            if (!fill()) return failure() == HttpFailure::None;
        }
    }

    bool read_chunked(std::string& out) {
        for (;;) {
            std::string size_line;
            if (!line(size_line)) return false;
            char* end = nullptr;
            errno = 0;
            unsigned long size = std::strtoul(size_line.c_str(), &end, 16);
            if (end == size_line.c_str() || errno == ERANGE)
                return fail("bad chunk size") != 0;
            if (size == 0) {
                // Trailer section ends with an empty line.
                std::string trailer;
                while (line(trailer) && !trailer.empty()) {}
                return true;
            }
            if (size > kMaxBodyBytes - out.size()) return fail("response body too large") != 0;
            std::string crlf;
            if (!exact(size, out) || !exact(2, crlf)) return false;
        }
    }

    Connection& conn_;
    std::string buffer_;
    bool chunked_ = false;
    std::optional<size_t> content_length_;
    bool malformed_ = false;
    std::string problem_;
};

HttpResponse transfer(const char* method, const std::string& url,
                      const std::string& body, const std::vector<Header>& headers,
                      long timeout_seconds, const std::atomic<bool>* abort_flag) {
    std::string error;
    auto ep = parse_endpoint(url, error);
    if (!ep) return HttpResponse::failed(HttpFailure::InvalidUrl, error);

    Connection conn(abort_flag, timeout_seconds);
    HttpFailure opened = conn.open(*ep);
    if (opened != HttpFailure::None)
        return HttpResponse::failed(opened, "cannot reach " + ep->host + ":" + ep->port);

    bool is_post = std::string(method) == "POST";
    if (!conn.write_all(serialize_request(method, *ep, body, headers, is_post)))
        return HttpResponse::failed(conn.failure(), "sending request to " + ep->host + " failed");

    ResponseReader reader(conn);
    long status = reader.read_head();
    if (status == 0) {
        HttpFailure f = reader.failure() == HttpFailure::None ? HttpFailure::Io : reader.failure();
        std::string why = reader.problem().empty() ? "no HTTP response" : reader.problem();
        return HttpResponse::failed(f, why + " from " + ep->host);
    }

    HttpResponse resp;
    resp.status_code = status;
    bool no_body = status == 204 || status == 304;
    if (!reader.read_body(resp.body, no_body)) {
        HttpFailure f = reader.failure() == HttpFailure::None ? HttpFailure::Io : reader.failure();
        std::string why = reader.problem().empty() ? "response body incomplete" : reader.problem();
        return HttpResponse::failed(f, why + " from " + ep->host);
    }
    return resp;
}

} // anonymous namespace

void http_init() {
    if (!tls_context())
        std::cerr << "[http] TLS context unavailable; https requests will fail\n";
}

void http_cleanup() {
    std::lock_guard<std::mutex> lock(g_tls_mutex);
    if (g_tls_ctx) {
        SSL_CTX_free(g_tls_ctx);
        g_tls_ctx = nullptr;
    }
}

HttpResponse SocketHttpClient::get(const std::string& url,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    return transfer("GET", url, "", headers, timeout_seconds, abort_flag_);
}

HttpResponse SocketHttpClient::post(const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return transfer("POST", url, body, headers, timeout_seconds, abort_flag_);
}

} // namespace callgate

#endif // __linux__
