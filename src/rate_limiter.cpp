#include "rate_limiter.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <iostream>
#include <set>
#include <stdexcept>

namespace callgate {

namespace detail {

struct ApiState {
    ApiRegistration registration;
    uint32_t consecutive_errors = 0;
    uint32_t success_streak = 0;
    uint64_t next_ticket = 1;
    std::set<uint64_t> outstanding; // tickets of slots currently held
    bool has_granted = false;
    std::chrono::steady_clock::time_point last_grant;
    std::mutex mutex;
    std::condition_variable slot_freed;
};

} // namespace detail

namespace {

using Clock = std::chrono::steady_clock;

// Upper bound on how long a waiter goes without checking its cancel flag.
constexpr auto kCancelPoll = std::chrono::milliseconds(50);

void release_slot(detail::ApiState& state, uint64_t ticket) noexcept {
    bool freed;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        freed = state.outstanding.erase(ticket) != 0;
    }
    if (freed) state.slot_freed.notify_all();
}

void validate_registration(const std::string& name, double calls_per_second,
                           uint32_t max_concurrent) {
    if (name.empty())
        throw ConfigurationError("API name must not be empty");
    if (!(calls_per_second > 0.0) || !std::isfinite(calls_per_second))
        throw ConfigurationError("calls_per_second must be > 0 for API: " + name);
    if (max_concurrent == 0)
        throw ConfigurationError("max_concurrent must be >= 1 for API: " + name);
}

} // anonymous namespace

// ── Permit ───────────────────────────────────────────────────────

Permit::~Permit() {
    release();
}

Permit::Permit(Permit&& other) noexcept : state_(other.state_), ticket_(other.ticket_) {
    other.state_ = nullptr;
}

Permit& Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        state_ = other.state_;
        ticket_ = other.ticket_;
        other.state_ = nullptr;
    }
    return *this;
}

void Permit::release() noexcept {
    if (!state_) return;
    release_slot(*state_, ticket_);
    state_ = nullptr;
}

// ── RateLimiter ──────────────────────────────────────────────────

RateLimiter::RateLimiter(RateLimitPolicy policy) : policy_(policy) {
    if (policy_.backoff_multiplier < 1.0)
        throw ConfigurationError("backoff_multiplier must be >= 1");
    if (policy_.max_backoff_multiplier < 1.0)
        throw ConfigurationError("max_backoff_multiplier must be >= 1");
    if (!(policy_.acceleration_factor > 0.0) || policy_.acceleration_factor > 1.0)
        throw ConfigurationError("acceleration_factor must be in (0, 1]");
    if (policy_.auto_register) {
        validate_registration("default", policy_.default_calls_per_second,
                              policy_.default_max_concurrent);
    }
}

RateLimiter::~RateLimiter() = default;

void RateLimiter::register_api(const std::string& name, double calls_per_second,
                               uint32_t max_concurrent) {
    validate_registration(name, calls_per_second, max_concurrent);

    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (apis_.count(name))
        throw ConfigurationError("API already registered: " + name);

    auto state = std::make_unique<ApiState>();
    state->registration = ApiRegistration{name, calls_per_second, max_concurrent};
    apis_.emplace(name, std::move(state));

    std::cerr << "[rate_limiter] Registered " << name << " ("
              << calls_per_second << " calls/s, max "
              << max_concurrent << " concurrent)\n";
}

bool RateLimiter::is_registered(const std::string& name) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return apis_.count(name) != 0;
}

std::vector<std::string> RateLimiter::api_names() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        names.reserve(apis_.size());
        for (const auto& [name, _] : apis_) names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

RateLimiter::ApiState& RateLimiter::find_state(const std::string& name) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = apis_.find(name);
    if (it == apis_.end())
        throw ConfigurationError("API not registered: " + name);
    return *it->second;
}

RateLimiter::ApiState& RateLimiter::state_for_acquire(const std::string& name) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = apis_.find(name);
    if (it != apis_.end()) return *it->second;

    if (!policy_.auto_register || name.empty())
        throw ConfigurationError("API not registered: " + name);

    std::cerr << "[rate_limiter] Warning: API '" << name
              << "' not registered; auto-registering with "
              << policy_.default_calls_per_second << " calls/s, max "
              << policy_.default_max_concurrent << " concurrent\n";

    auto state = std::make_unique<ApiState>();
    state->registration = ApiRegistration{name, policy_.default_calls_per_second,
                                          policy_.default_max_concurrent};
    auto& ref = *state;
    apis_.emplace(name, std::move(state));
    return ref;
}

RateLimiter::Interval RateLimiter::interval_locked(const ApiState& state) const {
    double seconds = 1.0 / state.registration.calls_per_second;
    if (state.consecutive_errors > 0) {
        double factor = std::pow(policy_.backoff_multiplier,
                                 static_cast<double>(state.consecutive_errors));
        seconds *= std::min(factor, policy_.max_backoff_multiplier);
    } else if (state.success_streak > policy_.success_streak_threshold) {
        seconds *= policy_.acceleration_factor;
    }
    return Interval(seconds);
}

Permit RateLimiter::acquire(const std::string& name, const std::atomic<bool>* cancel) {
    return acquire_cancellable(name, [cancel] {
        return cancel && cancel->load(std::memory_order_relaxed);
    });
}

Permit RateLimiter::acquire_cancellable(const std::string& name,
                                        const CancelCheck& cancelled) {
    ApiState& state = state_for_acquire(name);
    std::unique_lock<std::mutex> lock(state.mutex);

    while (state.outstanding.size() >= state.registration.max_concurrent) {
        if (cancelled && cancelled())
            throw CancelledError("cancelled while waiting for a slot on " + name);
        state.slot_freed.wait_for(lock, kCancelPoll);
    }
    uint64_t ticket = state.next_ticket++;
    state.outstanding.insert(ticket);

    // Reserve the next grant time while holding the lock so concurrent
    // acquirers queue up one interval apart, then sleep until it arrives.
    auto now = Clock::now();
    auto grant = now;
    if (state.has_granted) {
        auto earliest = state.last_grant +
            std::chrono::duration_cast<Clock::duration>(interval_locked(state));
        if (earliest > now) grant = earliest;
    }
    state.last_grant = grant;
    state.has_granted = true;

    while (Clock::now() < grant) {
        if (cancelled && cancelled()) {
            state.outstanding.erase(ticket);
            lock.unlock();
            state.slot_freed.notify_all();
            throw CancelledError("cancelled while pacing calls to " + name);
        }
        state.slot_freed.wait_until(lock, std::min(grant, Clock::now() + kCancelPoll));
    }

    return Permit(&state, ticket);
}

void RateLimiter::release(const std::string& name) {
    ApiState& state = find_state(name);
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.outstanding.empty())
            throw std::logic_error("release without matching acquire for " + name);
        state.outstanding.erase(state.outstanding.begin());
    }
    state.slot_freed.notify_all();
}

void RateLimiter::record_success(const std::string& name) {
    ApiState& state = find_state(name);
    std::lock_guard<std::mutex> lock(state.mutex);
    state.consecutive_errors = 0;
    state.success_streak++;
}

void RateLimiter::record_error(const std::string& name) {
    ApiState& state = find_state(name);
    std::lock_guard<std::mutex> lock(state.mutex);
    state.consecutive_errors++;
    state.success_streak = 0;
}

RateLimiter::Interval RateLimiter::current_interval(const std::string& name) const {
    ApiState& state = find_state(name);
    std::lock_guard<std::mutex> lock(state.mutex);
    return interval_locked(state);
}

LimiterSnapshot RateLimiter::snapshot(const std::string& name) const {
    ApiState& state = find_state(name);
    std::lock_guard<std::mutex> lock(state.mutex);
    LimiterSnapshot snap;
    snap.registration = state.registration;
    snap.consecutive_errors = state.consecutive_errors;
    snap.success_streak = state.success_streak;
    snap.in_flight = static_cast<uint32_t>(state.outstanding.size());
    return snap;
}

} // namespace callgate
