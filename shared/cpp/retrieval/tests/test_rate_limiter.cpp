#include <catch2/catch.hpp>
#include "../include/rate_limiter.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace ragcore;
using Clock = std::chrono::steady_clock;

namespace {

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

}

TEST_CASE("acquires are spaced by the rate", "[limiter]") {
    RateLimiter limiter(20.0);
    auto start = Clock::now();
    for (int i = 0; i < 5; ++i) limiter.acquire();
    // The first slot is free; the other four wait 1/20 s each.
    CHECK(seconds_since(start) >= 4.0 / 20.0 - 0.01);
}

TEST_CASE("burst slots are granted without waiting", "[limiter]") {
    RateLimiter limiter(1.0, 3.0);
    auto start = Clock::now();
    for (int i = 0; i < 3; ++i) limiter.acquire();
    CHECK(seconds_since(start) < 0.5);
}

TEST_CASE("concurrent callers share one budget", "[limiter]") {
    RateLimiter limiter(25.0);
    auto start = Clock::now();
    std::vector<std::thread> threads;
    for (int t = 0; t < 3; ++t) {
        threads.emplace_back([&limiter] {
            for (int i = 0; i < 2; ++i) limiter.acquire();
        });
    }
    for (auto& th : threads) th.join();
    CHECK(seconds_since(start) >= 5.0 / 25.0 - 0.01);
}

TEST_CASE("a non-positive rate never blocks", "[limiter]") {
    for (double rate : {0.0, -3.0}) {
        RateLimiter limiter(rate);
        auto start = Clock::now();
        for (int i = 0; i < 1000; ++i) limiter.acquire();
        CHECK(seconds_since(start) < 0.5);
    }
}
