#pragma once
#include "bounded_cache.hpp"
#include "cache/response_cache.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "performance_monitor.hpp"
#include "rate_limiter.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace callgate {

enum class Method : uint8_t { Get, Post };

const char* method_name(Method method);

// Outcome of one logical query. Never thrown; always returned.
struct QueryResult {
    bool success = false;
    std::optional<nlohmann::json> data;  // set only on success
    long status = 0;                     // last HTTP status, 0 if none
    ErrorKind error = ErrorKind::None;
    std::string detail;                  // human-readable failure reason
    bool from_cache = false;
    uint32_t attempts = 0;               // network attempts made
    std::chrono::duration<double> latency{0};
};

nlohmann::json result_to_json(const QueryResult& result);

// Applied to a successful live payload before it is cached and returned.
// Throwing fails the query with ErrorKind::Processing.
using ResponseProcessor = std::function<nlohmann::json(const nlohmann::json&)>;

struct QueryRequest {
    std::string api_name;
    std::string target;                  // absolute http(s) URL
    nlohmann::json params = nlohmann::json::object();
    Method method = Method::Get;
    bool use_cache = true;
    std::vector<Header> headers;         // passed through untouched
    ResponseProcessor processor;
    const std::atomic<bool>* cancel = nullptr; // per-query cancel flag
};

struct GatewayConfig {
    uint32_t max_retries = 3;            // total attempts per query
    double base_retry_delay = 1.0;       // seconds; doubles per failed attempt
    uint32_t request_timeout_seconds = 30;
    bool cache_enabled = true;
    uint32_t cache_ttl_seconds = 86400;  // used for the memo when no persistent cache
    uint32_t bounded_cache_max_size = 1000;
    std::string user_agent = "callgate/1.0";
    RateLimitPolicy rate_limit;

    static GatewayConfig from_config(const Config& config);
};

struct GatewayStats {
    PerformanceSummary performance;
    BoundedCacheStats memo;
};

nlohmann::json stats_to_json(const GatewayStats& stats);

// Resilient access to named HTTP APIs: cache lookup, rate-limited calls
// with retry and exponential backoff, outcome recording and cache write.
//
// Thread-safe; query() may be called concurrently from any number of
// threads. The HttpClient must outlive the gateway, and the gateway installs
// its cancel flag on it as the transfer abort flag.
class Gateway {
public:
    // cache may be null, in which case only the in-memory memo is used.
    // Throws ConfigurationError for invalid settings.
    Gateway(GatewayConfig config, HttpClient& http,
            std::unique_ptr<ResponseCache> cache = nullptr);

    // Cancels outstanding work and waits for running queries to return.
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // headers are sent with every call to this API (before request headers).
    void register_api(const std::string& name, double calls_per_second,
                      uint32_t max_concurrent, std::vector<Header> headers = {});

    QueryResult query(const std::string& api_name, const std::string& target,
                      const nlohmann::json& params = nlohmann::json::object(),
                      Method method = Method::Get, bool use_cache = true,
                      ResponseProcessor processor = {});

    QueryResult execute(const QueryRequest& request);

    // Runs execute() on its own thread.
    std::future<QueryResult> query_async(QueryRequest request);

    // Ends waits and backoff sleeps with a Cancelled result and aborts
    // in-flight transfers. Every later query is cancelled as well.
    void cancel_all();
    bool cancelled() const { return cancel_all_.load(std::memory_order_relaxed); }

    GatewayStats stats() const;

    RateLimiter& limiter() { return limiter_; }
    PerformanceMonitor& monitor() { return monitor_; }
    EventBus& events() { return events_; }
    ResponseCache* cache() { return cache_.get(); }
    const GatewayConfig& config() const { return config_; }

private:
    // Keeps the destructor waiting while a query is running.
    class InflightToken {
    public:
        explicit InflightToken(Gateway* gw);
        InflightToken(InflightToken&& other) noexcept;
        InflightToken& operator=(InflightToken&&) = delete;
        ~InflightToken();
        void release() noexcept;
    private:
        Gateway* gw_;
    };

    QueryResult run(const QueryRequest& request);
    std::optional<nlohmann::json> cached_payload(const std::string& api_name,
                                                 const std::string& fingerprint);
    void remember(const std::string& fingerprint, const nlohmann::json& payload);
    bool memo_fresh(const CacheEntry& entry) const;
    std::vector<Header> build_headers(const QueryRequest& request, bool json_body) const;
    bool cancel_requested(const std::atomic<bool>* per_query) const;
    // false if interrupted by cancellation
    bool sleep_for_retry(std::chrono::duration<double> delay,
                         const std::atomic<bool>* per_query) const;

    GatewayConfig config_;
    HttpClient& http_;
    std::unique_ptr<ResponseCache> cache_;
    BoundedCache<std::string, CacheEntry> memo_;
    RateLimiter limiter_;
    PerformanceMonitor monitor_;
    EventBus events_;

    mutable std::mutex headers_mutex_;
    std::unordered_map<std::string, std::vector<Header>> api_headers_;

    std::atomic<bool> cancel_all_{false};
    std::mutex inflight_mutex_;
    std::condition_variable inflight_cv_;
    uint32_t inflight_ = 0;
};

} // namespace callgate
