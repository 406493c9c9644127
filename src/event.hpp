#pragma once
#include "errors.hpp"
#include <string>
#include <cstdint>

namespace callgate {

// Tag-based event dispatch without RTTI.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* CacheHit         = "CacheHit";
    constexpr const char* AttemptCompleted = "AttemptCompleted";
    constexpr const char* RetryScheduled   = "RetryScheduled";
    constexpr const char* QueryCompleted   = "QueryCompleted";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct CacheHitEvent : Event {
    static constexpr const char* TAG = event_tags::CacheHit;
    std::string api_name;
    std::string fingerprint;
    bool from_memo = false; // served by the in-memory memo, not the store

    CacheHitEvent() { type_tag = TAG; }
};

// One network attempt finished (successfully or not).
struct AttemptCompletedEvent : Event {
    static constexpr const char* TAG = event_tags::AttemptCompleted;
    std::string api_name;
    uint32_t attempt = 0;     // 1-based
    long status_code = 0;     // 0 when the transport failed
    ErrorKind error = ErrorKind::None;
    double latency_ms = 0.0;

    AttemptCompletedEvent() { type_tag = TAG; }
};

struct RetryScheduledEvent : Event {
    static constexpr const char* TAG = event_tags::RetryScheduled;
    std::string api_name;
    uint32_t attempt = 0;     // the attempt that failed
    double delay_seconds = 0.0;
    ErrorKind reason = ErrorKind::None;

    RetryScheduledEvent() { type_tag = TAG; }
};

struct QueryCompletedEvent : Event {
    static constexpr const char* TAG = event_tags::QueryCompleted;
    std::string api_name;
    std::string target;
    bool success = false;
    bool from_cache = false;
    uint32_t attempts = 0;
    ErrorKind error = ErrorKind::None;

    QueryCompletedEvent() { type_tag = TAG; }
};

} // namespace callgate
