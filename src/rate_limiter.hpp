#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace callgate {

struct RateLimitPolicy {
    double backoff_multiplier = 1.5;       // interval *= multiplier^errors ...
    double max_backoff_multiplier = 8.0;   // ... capped at this factor
    uint32_t success_streak_threshold = 5;
    double acceleration_factor = 0.8;      // applied once the streak exceeds the threshold

    // Unknown API names fail with ConfigurationError unless this is set, in
    // which case they are registered with the defaults below and a warning
    // is logged.
    bool auto_register = false;
    double default_calls_per_second = 1.0;
    uint32_t default_max_concurrent = 5;
};

struct ApiRegistration {
    std::string name;
    double calls_per_second = 1.0;
    uint32_t max_concurrent = 1;
};

// Read-only copy of one API's limiter state.
struct LimiterSnapshot {
    ApiRegistration registration;
    uint32_t consecutive_errors = 0;
    uint32_t success_streak = 0;
    uint32_t in_flight = 0;
};

class RateLimiter;

namespace detail {
struct ApiState;
} // namespace detail

// Scoped concurrency slot. Releases on destruction unless released earlier,
// either through release() or through RateLimiter::release(name). Each slot
// carries a ticket, so a slot is only ever freed once.
class Permit {
public:
    Permit() = default;
    ~Permit();
    Permit(Permit&& other) noexcept;
    Permit& operator=(Permit&& other) noexcept;
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

    void release() noexcept;
    bool held() const noexcept { return state_ != nullptr; }

private:
    friend class RateLimiter;
    Permit(detail::ApiState* state, uint64_t ticket) : state_(state), ticket_(ticket) {}

    detail::ApiState* state_ = nullptr;
    uint64_t ticket_ = 0;
};

// Per-named-API pacing and concurrency admission with adaptive backoff.
//
// A permit for an API is granted once a concurrency slot is free and the
// current interval has elapsed since the previous grant. The interval is
// 1/calls_per_second, stretched by backoff_multiplier^consecutive_errors
// (capped) after errors, or shortened by acceleration_factor after a long
// success streak.
//
// Thread-safe. Each API has its own mutex; waiting threads are released in
// best-effort order, not FIFO.
class RateLimiter {
public:
    using Interval = std::chrono::duration<double>;
    using CancelCheck = std::function<bool()>;

    explicit RateLimiter(RateLimitPolicy policy = {});
    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Throws ConfigurationError for an empty name, non-positive rate, zero
    // concurrency, or a name that is already registered.
    void register_api(const std::string& name, double calls_per_second,
                      uint32_t max_concurrent);

    bool is_registered(const std::string& name) const;
    std::vector<std::string> api_names() const;

    // Blocks until a slot is free and the pacing interval has elapsed.
    // Throws ConfigurationError for unknown names (see auto_register) and
    // CancelledError if *cancel becomes true while waiting; in that case
    // nothing stays held.
    [[nodiscard]] Permit acquire(const std::string& name,
                                 const std::atomic<bool>* cancel = nullptr);

    // Same, polling an arbitrary predicate instead of a single flag.
    [[nodiscard]] Permit acquire_cancellable(const std::string& name,
                                             const CancelCheck& cancelled);

    // Frees the oldest slot still held for name. The Permit that owned it
    // becomes a no-op. Throws std::logic_error when no slot is held.
    void release(const std::string& name);

    void record_success(const std::string& name);
    void record_error(const std::string& name);

    // Interval the next acquire() for name would enforce.
    Interval current_interval(const std::string& name) const;

    LimiterSnapshot snapshot(const std::string& name) const;

    const RateLimitPolicy& policy() const noexcept { return policy_; }

private:
    using ApiState = detail::ApiState;

    ApiState& find_state(const std::string& name) const;
    ApiState& state_for_acquire(const std::string& name);
    Interval interval_locked(const ApiState& state) const;

    RateLimitPolicy policy_;
    mutable std::mutex registry_mutex_;
    std::unordered_map<std::string, std::unique_ptr<ApiState>> apis_;
};

} // namespace callgate
