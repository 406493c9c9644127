#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>

namespace callgate {

struct PerformanceSummary {
    uint64_t total_calls = 0;
    uint64_t success_count = 0;
    uint64_t fail_count = 0;
    double success_rate = 0.0;       // 0 when total_calls == 0
    double average_latency_ms = 0.0;
    double uptime_seconds = 0.0;     // since construction or last reset()
};

nlohmann::json summary_to_json(const PerformanceSummary& s);

// Passive aggregation of network call outcomes. Never gates behaviour and
// never throws. All methods are thread-safe.
class PerformanceMonitor {
public:
    PerformanceMonitor();

    void record_call(bool success, std::chrono::duration<double> latency) noexcept;

    PerformanceSummary summary() const noexcept;

    // Zero all counters and restart the uptime anchor.
    void reset() noexcept;

private:
    mutable std::mutex mutex_;
    uint64_t total_ = 0;
    uint64_t succeeded_ = 0;
    uint64_t failed_ = 0;
    double total_latency_ms_ = 0.0;
    double average_latency_ms_ = 0.0;
    std::chrono::steady_clock::time_point started_;
};

} // namespace callgate
