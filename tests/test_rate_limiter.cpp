#include <catch2/catch.hpp>
#include "rate_limiter.hpp"
#include "errors.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

using namespace callgate;
using Catch::Detail::Approx;
using namespace std::chrono_literals;

// ── Registration ────────────────────────────────────────────────

TEST_CASE("RateLimiter: register and query", "[rate_limiter]") {
    RateLimiter rl;
    rl.register_api("svcB", 2.0, 3);
    rl.register_api("svcA", 1.0, 1);

    REQUIRE(rl.is_registered("svcA"));
    REQUIRE_FALSE(rl.is_registered("svcC"));
    REQUIRE(rl.api_names() == std::vector<std::string>{"svcA", "svcB"});

    auto snap = rl.snapshot("svcB");
    REQUIRE(snap.registration.calls_per_second == 2.0);
    REQUIRE(snap.registration.max_concurrent == 3);
    REQUIRE(snap.in_flight == 0);
}

TEST_CASE("RateLimiter: duplicate registration is rejected", "[rate_limiter]") {
    RateLimiter rl;
    rl.register_api("svcA", 1.0, 1);
    REQUIRE_THROWS_AS(rl.register_api("svcA", 5.0, 5), ConfigurationError);
    REQUIRE(rl.snapshot("svcA").registration.calls_per_second == 1.0);
}

TEST_CASE("RateLimiter: invalid registrations are rejected", "[rate_limiter]") {
    RateLimiter rl;
    REQUIRE_THROWS_AS(rl.register_api("", 1.0, 1), ConfigurationError);
    REQUIRE_THROWS_AS(rl.register_api("a", 0.0, 1), ConfigurationError);
    REQUIRE_THROWS_AS(rl.register_api("a", -1.0, 1), ConfigurationError);
    REQUIRE_THROWS_AS(rl.register_api("a", 1.0, 0), ConfigurationError);
    REQUIRE(rl.api_names().empty());
}

TEST_CASE("RateLimiter: invalid policy is rejected", "[rate_limiter]") {
    RateLimitPolicy p;
    p.acceleration_factor = 0.0;
    REQUIRE_THROWS_AS(RateLimiter(p), ConfigurationError);
    p = RateLimitPolicy{};
    p.backoff_multiplier = 0.9;
    REQUIRE_THROWS_AS(RateLimiter(p), ConfigurationError);
}

TEST_CASE("RateLimiter: unregistered API fails by default", "[rate_limiter]") {
    RateLimiter rl;
    REQUIRE_THROWS_AS(rl.acquire("ghost"), ConfigurationError);
    REQUIRE_THROWS_AS(rl.record_error("ghost"), ConfigurationError);
    REQUIRE_THROWS_AS(rl.current_interval("ghost"), ConfigurationError);
    REQUIRE_FALSE(rl.is_registered("ghost"));
}

TEST_CASE("RateLimiter: auto_register uses documented defaults", "[rate_limiter]") {
    RateLimitPolicy p;
    p.auto_register = true;
    RateLimiter rl(p);

    {
        Permit permit = rl.acquire("ghost");
        REQUIRE(permit.held());
    }
    REQUIRE(rl.is_registered("ghost"));
    auto snap = rl.snapshot("ghost");
    REQUIRE(snap.registration.calls_per_second == 1.0);
    REQUIRE(snap.registration.max_concurrent == 5);
    REQUIRE(snap.in_flight == 0);
}

// ── Interval computation ────────────────────────────────────────

TEST_CASE("RateLimiter: base interval is 1/calls_per_second", "[rate_limiter]") {
    RateLimiter rl;
    rl.register_api("svcA", 4.0, 1);
    REQUIRE(rl.current_interval("svcA").count() == Approx(0.25));
}

TEST_CASE("RateLimiter: backoff grows per error and is capped", "[rate_limiter]") {
    RateLimiter rl;
    rl.register_api("svcA", 2.0, 1);

    double previous = rl.current_interval("svcA").count();
    for (int k = 1; k <= 10; k++) {
        rl.record_error("svcA");
        double expected = 0.5 * std::min(std::pow(1.5, k), 8.0);
        double actual = rl.current_interval("svcA").count();
        REQUIRE(actual == Approx(expected));
        REQUIRE(actual >= previous);
        previous = actual;
    }
    REQUIRE(previous == Approx(4.0));
    REQUIRE(rl.snapshot("svcA").consecutive_errors == 10);
}

TEST_CASE("RateLimiter: one success removes backoff", "[rate_limiter]") {
    RateLimiter rl;
    rl.register_api("svcA", 2.0, 1);
    rl.record_error("svcA");
    rl.record_error("svcA");
    rl.record_success("svcA");

    REQUIRE(rl.current_interval("svcA").count() == Approx(0.5));
    auto snap = rl.snapshot("svcA");
    REQUIRE(snap.consecutive_errors == 0);
    REQUIRE(snap.success_streak == 1);
}

TEST_CASE("RateLimiter: acceleration only after the streak exceeds threshold", "[rate_limiter]") {
    RateLimiter rl;
    rl.register_api("svcA", 1.0, 1);

    for (int i = 0; i < 5; i++) rl.record_success("svcA");
    REQUIRE(rl.current_interval("svcA").count() == Approx(1.0));

    rl.record_success("svcA");
    REQUIRE(rl.current_interval("svcA").count() == Approx(0.8));

    rl.record_error("svcA");
    REQUIRE(rl.snapshot("svcA").success_streak == 0);
    REQUIRE(rl.current_interval("svcA").count() == Approx(1.5));
}

// ── Pacing and concurrency ──────────────────────────────────────

TEST_CASE("RateLimiter: grants are spaced by the interval", "[rate_limiter]") {
    RateLimiter rl;
    rl.register_api("svcA", 20.0, 1); // 50ms

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 5; i++) {
        Permit p = rl.acquire("svcA");
        rl.record_error("svcA");   // keep the streak from accelerating
        rl.record_success("svcA");
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(elapsed >= 200ms);
}

TEST_CASE("RateLimiter: concurrent acquirers are spaced too", "[rate_limiter]") {
    RateLimiter rl;
    rl.register_api("svcA", 20.0, 4); // 50ms, plenty of slots

    std::vector<std::chrono::steady_clock::time_point> grants;
    std::mutex grants_mutex;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&] {
            Permit p = rl.acquire("svcA");
            std::lock_guard<std::mutex> lock(grants_mutex);
            grants.push_back(std::chrono::steady_clock::now());
        });
    }
    for (auto& th : threads) th.join();

    std::sort(grants.begin(), grants.end());
    REQUIRE(grants.size() == 4);
    REQUIRE(grants.back() - grants.front() >= 150ms);
}

TEST_CASE("RateLimiter: never more than max_concurrent in flight", "[rate_limiter]") {
    RateLimiter rl;
    rl.register_api("svcA", 1000.0, 2);

    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 6; t++) {
        threads.emplace_back([&] {
            Permit p = rl.acquire("svcA");
            int now = ++in_flight;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(20ms);
            --in_flight;
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(peak.load() <= 2);
    REQUIRE(peak.load() >= 1);
    REQUIRE(rl.snapshot("svcA").in_flight == 0);
}

// ── Permit ──────────────────────────────────────────────────────

TEST_CASE("Permit: release is idempotent and moves transfer ownership", "[rate_limiter]") {
    RateLimiter rl;
    rl.register_api("svcA", 1000.0, 2);

    Permit a = rl.acquire("svcA");
    REQUIRE(rl.snapshot("svcA").in_flight == 1);

    Permit b = std::move(a);
    REQUIRE_FALSE(a.held());
    REQUIRE(b.held());
    REQUIRE(rl.snapshot("svcA").in_flight == 1);

    b.release();
    b.release();
    REQUIRE(rl.snapshot("svcA").in_flight == 0);
}

TEST_CASE("RateLimiter: manual release without acquire is an error", "[rate_limiter]") {
    RateLimiter rl;
    rl.register_api("svcA", 1.0, 1);
    REQUIRE_THROWS_AS(rl.release("svcA"), std::logic_error);
}

TEST_CASE("RateLimiter: manual release retires the permit's slot once", "[rate_limiter]") {
    RateLimiter rl;
    rl.register_api("svcA", 1000.0, 1);

    std::optional<Permit> first = rl.acquire("svcA");
    rl.release("svcA");
    REQUIRE(rl.snapshot("svcA").in_flight == 0);

    Permit second = rl.acquire("svcA");
    REQUIRE(rl.snapshot("svcA").in_flight == 1);

    // Dropping the manually released permit must not free the second slot.
    first.reset();
    REQUIRE(rl.snapshot("svcA").in_flight == 1);

    std::atomic<bool> cancel{false};
    std::atomic<bool> granted{false};
    std::thread third([&] {
        try {
            Permit p = rl.acquire("svcA", &cancel);
            granted = true;
        } catch (const CancelledError&) {
        }
    });
    std::this_thread::sleep_for(150ms);
    cancel = true;
    third.join();

    REQUIRE_FALSE(granted.load());
    second.release();
    REQUIRE(rl.snapshot("svcA").in_flight == 0);
    REQUIRE_THROWS_AS(rl.release("svcA"), std::logic_error);
}

// ── Cancellation ────────────────────────────────────────────────

TEST_CASE("RateLimiter: cancel while waiting for a slot", "[rate_limiter]") {
    RateLimiter rl;
    rl.register_api("svcA", 1000.0, 1);
    Permit held = rl.acquire("svcA");

    std::atomic<bool> cancel{false};
    std::atomic<bool> threw{false};
    std::thread waiter([&] {
        try {
            Permit p = rl.acquire("svcA", &cancel);
        } catch (const CancelledError&) {
            threw = true;
        }
    });

    std::this_thread::sleep_for(100ms);
    cancel = true;
    waiter.join();

    REQUIRE(threw.load());
    REQUIRE(rl.snapshot("svcA").in_flight == 1);
    held.release();
    REQUIRE(rl.snapshot("svcA").in_flight == 0);
}

TEST_CASE("RateLimiter: cancel during the pacing wait gives the slot back", "[rate_limiter]") {
    RateLimiter rl;
    rl.register_api("svcA", 0.5, 1); // 2s interval
    { Permit first = rl.acquire("svcA"); }

    std::atomic<bool> cancel{false};
    std::thread canceller([&] {
        std::this_thread::sleep_for(100ms);
        cancel = true;
    });

    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(rl.acquire("svcA", &cancel), CancelledError);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    REQUIRE(elapsed < 1s);
    REQUIRE(rl.snapshot("svcA").in_flight == 0);
}

TEST_CASE("RateLimiter: acquire_cancellable polls the predicate", "[rate_limiter]") {
    RateLimiter rl;
    rl.register_api("svcA", 1000.0, 1);
    Permit held = rl.acquire("svcA");

    REQUIRE_THROWS_AS(rl.acquire_cancellable("svcA", [] { return true; }), CancelledError);
    REQUIRE(rl.snapshot("svcA").in_flight == 1);
}
