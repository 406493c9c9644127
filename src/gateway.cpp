#include "gateway.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace callgate {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kCancelPoll = std::chrono::milliseconds(50);

GatewayConfig validated(GatewayConfig config) {
    if (config.max_retries == 0)
        throw ConfigurationError("max_retries must be >= 1");
    if (!(config.base_retry_delay >= 0.0) || !std::isfinite(config.base_retry_delay))
        throw ConfigurationError("base_retry_delay must be >= 0");
    if (config.request_timeout_seconds == 0)
        throw ConfigurationError("request_timeout_seconds must be >= 1");
    if (config.bounded_cache_max_size == 0)
        throw ConfigurationError("bounded_cache_max_size must be >= 1");
    return config;
}

QueryResult failure(ErrorKind kind, std::string detail, long status = 0) {
    QueryResult r;
    r.success = false;
    r.error = kind;
    r.status = status;
    r.detail = std::move(detail);
    return r;
}

std::string param_value(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

// GET parameters in sorted key order, appended to target.
std::string build_get_url(const std::string& target, const nlohmann::json& params) {
    if (!params.is_object() || params.empty()) return target;
    std::vector<std::pair<std::string, std::string>> pairs;
    pairs.reserve(params.size());
    for (auto& [key, value] : params.items()) {
        pairs.emplace_back(key, param_value(value));
    }
    char sep = target.find('?') == std::string::npos ? '?' : '&';
    return target + sep + form_encode(pairs);
}

nlohmann::json parse_payload(const std::string& body) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) return nlohmann::json(body);
    return j;
}

ErrorKind classify(const HttpResponse& resp) {
    switch (resp.failure) {
        case HttpFailure::None:       break;
        case HttpFailure::Timeout:    return ErrorKind::Timeout;
        case HttpFailure::Aborted:    return ErrorKind::Cancelled;
        case HttpFailure::InvalidUrl: return ErrorKind::Configuration;
        case HttpFailure::Connect:
        case HttpFailure::Io:         return ErrorKind::Transport;
    }
    if (resp.status_code >= 200 && resp.status_code < 300) return ErrorKind::None;
    if (resp.status_code == 429) return ErrorKind::RateLimitExceeded;
    return ErrorKind::Upstream;
}

std::string describe(const HttpResponse& resp) {
    if (resp.failure != HttpFailure::None)
        return std::string(http_failure_name(resp.failure)) + ": " + resp.error;
    std::string detail = "HTTP " + std::to_string(resp.status_code);
    if (!resp.body.empty()) {
        constexpr size_t kMaxBody = 200;
        detail += ": " + (resp.body.size() > kMaxBody
                              ? resp.body.substr(0, kMaxBody) + "..."
                              : resp.body);
    }
    return detail;
}

bool has_header(const std::vector<Header>& headers, const std::string& name) {
    std::string wanted = to_lower(name);
    return std::any_of(headers.begin(), headers.end(), [&](const Header& h) {
        return to_lower(h.first) == wanted;
    });
}

} // anonymous namespace

const char* method_name(Method method) {
    return method == Method::Post ? "POST" : "GET";
}

nlohmann::json result_to_json(const QueryResult& result) {
    nlohmann::json j = {
        {"success", result.success},
        {"status", result.status},
        {"error", error_kind_to_string(result.error)},
        {"from_cache", result.from_cache},
        {"attempts", result.attempts},
        {"latency_ms", result.latency.count() * 1000.0}
    };
    j["data"] = result.data ? *result.data : nlohmann::json(nullptr);
    if (!result.detail.empty()) j["detail"] = result.detail;
    return j;
}

nlohmann::json stats_to_json(const GatewayStats& stats) {
    return {
        {"performance", summary_to_json(stats.performance)},
        {"memo_cache", {
            {"size", stats.memo.size},
            {"max_size", stats.memo.max_size},
            {"hits", stats.memo.hits},
            {"misses", stats.memo.misses},
            {"hit_rate", stats.memo.hit_rate},
            {"utilization", stats.memo.utilization}
        }}
    };
}

GatewayConfig GatewayConfig::from_config(const Config& config) {
    GatewayConfig gc;
    gc.max_retries = config.retry.max_retries;
    gc.base_retry_delay = config.retry.base_delay;
    gc.request_timeout_seconds = config.retry.timeout_seconds;
    gc.cache_enabled = config.cache.enabled;
    gc.cache_ttl_seconds = config.cache.ttl_seconds;
    gc.bounded_cache_max_size = config.cache.memo_max_size;
    gc.user_agent = config.user_agent;
    gc.rate_limit = config.rate_limit;
    return gc;
}

// ── InflightToken ────────────────────────────────────────────────

Gateway::InflightToken::InflightToken(Gateway* gw) : gw_(gw) {
    std::lock_guard<std::mutex> lock(gw_->inflight_mutex_);
    gw_->inflight_++;
}

Gateway::InflightToken::InflightToken(InflightToken&& other) noexcept : gw_(other.gw_) {
    other.gw_ = nullptr;
}

Gateway::InflightToken::~InflightToken() {
    release();
}

void Gateway::InflightToken::release() noexcept {
    if (!gw_) return;
    // Notify under the lock: the destructor may free the condvar as soon as
    // it can reacquire the mutex.
    std::lock_guard<std::mutex> lock(gw_->inflight_mutex_);
    gw_->inflight_--;
    gw_->inflight_cv_.notify_all();
    gw_ = nullptr;
}

// ── Gateway ──────────────────────────────────────────────────────

Gateway::Gateway(GatewayConfig config, HttpClient& http,
                 std::unique_ptr<ResponseCache> cache)
    : config_(validated(std::move(config))),
      http_(http),
      cache_(std::move(cache)),
      memo_(config_.bounded_cache_max_size),
      limiter_(config_.rate_limit) {
    http_.set_abort_flag(&cancel_all_);
}

Gateway::~Gateway() {
    cancel_all();
    std::unique_lock<std::mutex> lock(inflight_mutex_);
    inflight_cv_.wait(lock, [this] { return inflight_ == 0; });
    lock.unlock();
    http_.set_abort_flag(nullptr);
}

void Gateway::register_api(const std::string& name, double calls_per_second,
                           uint32_t max_concurrent, std::vector<Header> headers) {
    limiter_.register_api(name, calls_per_second, max_concurrent);
    if (!headers.empty()) {
        std::lock_guard<std::mutex> lock(headers_mutex_);
        api_headers_[name] = std::move(headers);
    }
}

void Gateway::cancel_all() {
    if (!cancel_all_.exchange(true))
        std::cerr << "[gateway] Cancelling all queries\n";
}

GatewayStats Gateway::stats() const {
    GatewayStats s;
    s.performance = monitor_.summary();
    s.memo = memo_.stats();
    return s;
}

bool Gateway::cancel_requested(const std::atomic<bool>* per_query) const {
    return cancel_all_.load(std::memory_order_relaxed) ||
           (per_query && per_query->load(std::memory_order_relaxed));
}

bool Gateway::sleep_for_retry(std::chrono::duration<double> delay,
                              const std::atomic<bool>* per_query) const {
    auto deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(delay);
    while (Clock::now() < deadline) {
        if (cancel_requested(per_query)) return false;
        auto slice = std::min<Clock::duration>(deadline - Clock::now(), kCancelPoll);
        std::this_thread::sleep_for(slice);
    }
    return !cancel_requested(per_query);
}

bool Gateway::memo_fresh(const CacheEntry& entry) const {
    if (cache_) return cache_->is_fresh(entry);
    uint64_t now = epoch_seconds();
    return now <= entry.stored_at || now - entry.stored_at <= config_.cache_ttl_seconds;
}

std::optional<nlohmann::json> Gateway::cached_payload(const std::string& api_name,
                                                      const std::string& fingerprint) {
    bool from_memo = false;
    std::optional<nlohmann::json> payload;

    if (auto memo = memo_.get(fingerprint)) {
        if (memo_fresh(*memo)) {
            payload = std::move(memo->payload);
            from_memo = true;
        } else {
            memo_.erase(fingerprint);
        }
    }

    if (!payload && cache_) {
        if (auto entry = cache_->get_entry(fingerprint)) {
            payload = entry->payload;
            memo_.set(fingerprint, std::move(*entry));
        }
    }

    if (payload) {
        CacheHitEvent ev;
        ev.api_name = api_name;
        ev.fingerprint = fingerprint;
        ev.from_memo = from_memo;
        events_.publish(ev);
    }
    return payload;
}

void Gateway::remember(const std::string& fingerprint, const nlohmann::json& payload) {
    if (cache_) {
        memo_.set(fingerprint, cache_->set(fingerprint, payload));
    } else {
        memo_.set(fingerprint, CacheEntry{fingerprint, payload, epoch_seconds()});
    }
}

std::vector<Header> Gateway::build_headers(const QueryRequest& request,
                                           bool json_body) const {
    std::vector<Header> headers;
    {
        std::lock_guard<std::mutex> lock(headers_mutex_);
        auto it = api_headers_.find(request.api_name);
        if (it != api_headers_.end()) {
            for (const auto& h : it->second) {
                if (!has_header(request.headers, h.first)) headers.push_back(h);
            }
        }
    }
    headers.insert(headers.end(), request.headers.begin(), request.headers.end());
    if (!config_.user_agent.empty() && !has_header(headers, "User-Agent"))
        headers.emplace_back("User-Agent", config_.user_agent);
    if (json_body && !has_header(headers, "Content-Type"))
        headers.emplace_back("Content-Type", "application/json");
    return headers;
}

QueryResult Gateway::query(const std::string& api_name, const std::string& target,
                           const nlohmann::json& params, Method method,
                           bool use_cache, ResponseProcessor processor) {
    QueryRequest request;
    request.api_name = api_name;
    request.target = target;
    request.params = params;
    request.method = method;
    request.use_cache = use_cache;
    request.processor = std::move(processor);
    return execute(request);
}

QueryResult Gateway::execute(const QueryRequest& request) {
    InflightToken token(this);
    auto started = Clock::now();

    QueryResult result;
    try {
        result = run(request);
    } catch (const std::exception& e) {
        // Last-resort boundary: nothing may escape a query.
        std::cerr << "[gateway] " << request.api_name
                  << ": unexpected error: " << e.what() << "\n";
        result = failure(ErrorKind::Transport, std::string("unexpected error: ") + e.what());
    }
    result.latency = Clock::now() - started;

    QueryCompletedEvent ev;
    ev.api_name = request.api_name;
    ev.target = request.target;
    ev.success = result.success;
    ev.from_cache = result.from_cache;
    ev.attempts = result.attempts;
    ev.error = result.error;
    events_.publish(ev);

    return result;
}

std::future<QueryResult> Gateway::query_async(QueryRequest request) {
    // Count the query before the thread starts so the destructor cannot miss it.
    InflightToken token(this);
    return std::async(std::launch::async,
        [this, req = std::move(request), token = std::move(token)]() mutable {
            QueryResult result = execute(req);
            token.release();
            return result;
        });
}

QueryResult Gateway::run(const QueryRequest& request) {
    const std::string& api = request.api_name;

    if (api.empty())
        return failure(ErrorKind::Configuration, "API name must not be empty");
    if (!limiter_.is_registered(api) && !config_.rate_limit.auto_register)
        return failure(ErrorKind::Configuration, "API not registered: " + api);
    if (request.target.empty())
        return failure(ErrorKind::Configuration, "target URL must not be empty");
    if (request.method == Method::Get && !request.params.is_null() &&
        !request.params.is_object())
        return failure(ErrorKind::Configuration,
                       std::string("GET parameters must be an object, got ") +
                       request.params.type_name());
    std::string serialized_params;
    try {
        serialized_params = request.params.dump();
    } catch (const nlohmann::json::type_error& e) {
        return failure(ErrorKind::Configuration,
                       std::string("parameters cannot be serialized: ") + e.what());
    }
    if (cancel_requested(request.cancel))
        return failure(ErrorKind::Cancelled, "cancelled before start");

    bool cacheable = request.method == Method::Get && config_.cache_enabled &&
                     request.use_cache;
    std::string fingerprint;
    if (cacheable) {
        fingerprint = ResponseCache::fingerprint(request.target, request.params);
        if (auto payload = cached_payload(api, fingerprint)) {
            QueryResult r;
            r.success = true;
            r.data = std::move(payload);
            r.from_cache = true;
            return r;
        }
    }

    bool is_post = request.method == Method::Post;
    std::string url = is_post ? request.target : build_get_url(request.target, request.params);
    std::string body;
    if (is_post) body = request.params.is_null() ? "{}" : serialized_params;
    std::vector<Header> headers = build_headers(request, is_post);

    auto cancel_check = [this, &request] { return cancel_requested(request.cancel); };

    ErrorKind last_error = ErrorKind::None;
    long last_status = 0;
    std::string last_detail;
    uint32_t attempts = 0;

    for (uint32_t attempt = 1; attempt <= config_.max_retries; ++attempt) {
        HttpResponse resp;
        std::chrono::duration<double> latency{0};
        {
            Permit permit;
            try {
                permit = limiter_.acquire_cancellable(api, cancel_check);
            } catch (const CancelledError& e) {
                QueryResult r = failure(ErrorKind::Cancelled, e.what(), last_status);
                r.attempts = attempts;
                return r;
            } catch (const ConfigurationError& e) {
                QueryResult r = failure(ErrorKind::Configuration, e.what());
                r.attempts = attempts;
                return r;
            }

            attempts = attempt;
            auto t0 = Clock::now();
            resp = is_post
                ? http_.post(url, body, headers, config_.request_timeout_seconds)
                : http_.get(url, headers, config_.request_timeout_seconds);
            latency = Clock::now() - t0;
        } // permit released here, before any backoff sleep

        ErrorKind kind = classify(resp);
        bool ok = kind == ErrorKind::None;
        monitor_.record_call(ok, latency);

        AttemptCompletedEvent attempt_ev;
        attempt_ev.api_name = api;
        attempt_ev.attempt = attempt;
        attempt_ev.status_code = resp.status_code;
        attempt_ev.error = kind;
        attempt_ev.latency_ms = latency.count() * 1000.0;
        events_.publish(attempt_ev);

        if (ok) {
            limiter_.record_success(api);

            nlohmann::json payload = parse_payload(resp.body);
            if (request.processor) {
                try {
                    payload = request.processor(payload);
                } catch (const std::exception& e) {
                    std::cerr << "[gateway] " << api << ": response processing failed: "
                              << e.what() << "\n";
                    QueryResult r = failure(ErrorKind::Processing,
                                            std::string("processing failed: ") + e.what(),
                                            resp.status_code);
                    r.attempts = attempts;
                    return r;
                }
            }
            if (cacheable) remember(fingerprint, payload);

            QueryResult r;
            r.success = true;
            r.status = resp.status_code;
            r.data = std::move(payload);
            r.attempts = attempts;
            return r;
        }

        last_error = kind;
        last_status = resp.status_code;
        last_detail = describe(resp);

        if (!is_retryable(kind)) {
            // Cancelled transfers and malformed URLs: retrying cannot help.
            std::cerr << "[gateway] " << api << ": " << last_detail << "\n";
            QueryResult r = failure(kind, last_detail, last_status);
            r.attempts = attempts;
            return r;
        }

        limiter_.record_error(api);

        if (attempt == config_.max_retries) break;

        std::chrono::duration<double> delay(
            config_.base_retry_delay * std::pow(2.0, static_cast<double>(attempt - 1)));

        std::ostringstream delay_text;
        delay_text << std::fixed << std::setprecision(2) << delay.count();
        std::cerr << "[gateway] " << api << ": attempt " << attempt << "/"
                  << config_.max_retries << " failed (" << error_kind_to_string(kind)
                  << ", " << last_detail << "); retrying in " << delay_text.str() << "s\n";

        RetryScheduledEvent retry_ev;
        retry_ev.api_name = api;
        retry_ev.attempt = attempt;
        retry_ev.delay_seconds = delay.count();
        retry_ev.reason = kind;
        events_.publish(retry_ev);

        if (!sleep_for_retry(delay, request.cancel)) {
            QueryResult r = failure(ErrorKind::Cancelled, "cancelled during retry backoff",
                                    last_status);
            r.attempts = attempts;
            return r;
        }
    }

    std::cerr << "[gateway] " << api << ": giving up after " << attempts
              << " attempt(s): " << last_detail << "\n";
    QueryResult r = failure(last_error, last_detail, last_status);
    r.attempts = attempts;
    return r;
}

} // namespace callgate
