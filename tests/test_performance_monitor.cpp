#include <catch2/catch.hpp>
#include "performance_monitor.hpp"
#include <thread>
#include <vector>

using namespace callgate;
using Catch::Detail::Approx;
using std::chrono::duration;

TEST_CASE("PerformanceMonitor: empty summary", "[monitor]") {
    PerformanceMonitor m;
    auto s = m.summary();
    REQUIRE(s.total_calls == 0);
    REQUIRE(s.success_rate == 0.0);
    REQUIRE(s.average_latency_ms == 0.0);
    REQUIRE(s.uptime_seconds >= 0.0);
}

TEST_CASE("PerformanceMonitor: counts and running average", "[monitor]") {
    PerformanceMonitor m;
    m.record_call(true, duration<double>(0.100));
    m.record_call(true, duration<double>(0.300));
    m.record_call(false, duration<double>(0.200));

    auto s = m.summary();
    REQUIRE(s.total_calls == 3);
    REQUIRE(s.success_count == 2);
    REQUIRE(s.fail_count == 1);
    REQUIRE(s.success_rate == Approx(2.0 / 3.0));
    REQUIRE(s.average_latency_ms == Approx(200.0));
}

TEST_CASE("PerformanceMonitor: reset zeroes counters", "[monitor]") {
    PerformanceMonitor m;
    m.record_call(false, duration<double>(1.0));
    m.reset();

    auto s = m.summary();
    REQUIRE(s.total_calls == 0);
    REQUIRE(s.fail_count == 0);
    REQUIRE(s.average_latency_ms == 0.0);
    REQUIRE(s.uptime_seconds < 1.0);
}

TEST_CASE("PerformanceMonitor: concurrent recording loses nothing", "[monitor]") {
    PerformanceMonitor m;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&m, t] {
            for (int i = 0; i < 250; i++) m.record_call(t % 2 == 0, duration<double>(0.01));
        });
    }
    for (auto& th : threads) th.join();

    auto s = m.summary();
    REQUIRE(s.total_calls == 1000);
    REQUIRE(s.success_count == 500);
    REQUIRE(s.average_latency_ms == Approx(10.0));
}

TEST_CASE("summary_to_json: field names", "[monitor]") {
    PerformanceMonitor m;
    m.record_call(true, duration<double>(0.05));
    auto j = summary_to_json(m.summary());
    REQUIRE(j["total_calls"] == 1);
    REQUIRE(j["success_count"] == 1);
    REQUIRE(j["fail_count"] == 0);
    REQUIRE(j["success_rate"] == 1.0);
    REQUIRE(j.contains("average_latency_ms"));
    REQUIRE(j.contains("uptime_seconds"));
}
