#include "performance_monitor.hpp"

namespace callgate {

PerformanceMonitor::PerformanceMonitor()
    : started_(std::chrono::steady_clock::now()) {}

void PerformanceMonitor::record_call(bool success,
                                     std::chrono::duration<double> latency) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    total_++;
    if (success) {
        succeeded_++;
    } else {
        failed_++;
    }
    double ms = latency.count() * 1000.0;
    if (ms > 0.0) total_latency_ms_ += ms;
    average_latency_ms_ = total_latency_ms_ / static_cast<double>(total_);
}

PerformanceSummary PerformanceMonitor::summary() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    PerformanceSummary s;
    s.total_calls = total_;
    s.success_count = succeeded_;
    s.fail_count = failed_;
    s.success_rate = total_ == 0
        ? 0.0
        : static_cast<double>(succeeded_) / static_cast<double>(total_);
    s.average_latency_ms = average_latency_ms_;
    s.uptime_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started_).count();
    return s;
}

void PerformanceMonitor::reset() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    total_ = 0;
    succeeded_ = 0;
    failed_ = 0;
    total_latency_ms_ = 0.0;
    average_latency_ms_ = 0.0;
    started_ = std::chrono::steady_clock::now();
}

nlohmann::json summary_to_json(const PerformanceSummary& s) {
    return {
        {"total_calls", s.total_calls},
        {"success_count", s.success_count},
        {"fail_count", s.fail_count},
        {"success_rate", s.success_rate},
        {"average_latency_ms", s.average_latency_ms},
        {"uptime_seconds", s.uptime_seconds}
    };
}

} // namespace callgate
