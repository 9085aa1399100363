#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "../../src/throttle/limiter/rate_limiter.hpp"
#include "fakes.hpp"

using namespace Bulwark::Throttle;
using Bulwark::Testing::FakeClock;

namespace {

RateLimiterConfig no_gap_config() {
    RateLimiterConfig config;
    config.min_delay           = 0.0;
    config.max_delay           = 0.0;
    config.requests_per_minute = 1000;
    config.requests_per_hour   = 10000;
    config.jitter_range        = 0.0;
    return config;
}

}  // namespace

TEST(RateLimiterTest, FirstRequestDoesNotWait) {
    auto        clock = std::make_shared<FakeClock>();
    RateLimiter limiter(RateLimiterConfig{}, clock, 1);
    limiter.wait();
    EXPECT_EQ(clock->sleeps(), 0);
    EXPECT_EQ(limiter.get_stats().requests_last_minute, 1);
}

TEST(RateLimiterTest, MinimumGapBetweenRequests) {
    auto clock        = std::make_shared<FakeClock>();
    auto config       = no_gap_config();
    config.min_delay  = 2.0;
    config.max_delay  = 2.0;
    RateLimiter limiter(config, clock, 1);

    limiter.wait();
    limiter.wait();
    EXPECT_NEAR(clock->total_slept(), 2.0, 1e-6);

    clock->advance(10.0);
    limiter.wait();
    EXPECT_NEAR(clock->total_slept(), 2.0, 1e-6);
}

TEST(RateLimiterTest, RandomGapStaysInRange) {
    auto clock       = std::make_shared<FakeClock>();
    auto config      = no_gap_config();
    config.min_delay = 2.0;
    config.max_delay = 5.0;
    RateLimiter limiter(config, clock, 42);

    limiter.wait();
    for (int i = 0; i < 10; ++i) {
        double before = clock->total_slept();
        limiter.wait();
        double gap = clock->total_slept() - before;
        EXPECT_GE(gap, 2.0);
        EXPECT_LE(gap, 5.0 + 1e-6);
    }
}

TEST(RateLimiterTest, MinuteWindowCeiling) {
    auto clock                 = std::make_shared<FakeClock>();
    auto config                = no_gap_config();
    config.requests_per_minute = 3;
    RateLimiter limiter(config, clock, 1);

    for (int i = 0; i < 3; ++i)
        limiter.wait();
    EXPECT_EQ(clock->sleeps(), 0);

    limiter.wait();
    EXPECT_NEAR(clock->total_slept(), 60.0, 1e-6);

    auto stats = limiter.get_stats();
    EXPECT_EQ(stats.requests_last_minute, 1);
    EXPECT_EQ(stats.requests_last_hour, 4);
}

TEST(RateLimiterTest, HourWindowCeiling) {
    auto clock               = std::make_shared<FakeClock>();
    auto config              = no_gap_config();
    config.requests_per_hour = 2;
    RateLimiter limiter(config, clock, 1);

    limiter.wait();
    clock->advance(100.0);
    limiter.wait();
    limiter.wait();
    // The oldest request leaves the hour window 3600s after it was made.
    EXPECT_NEAR(clock->total_slept(), 3500.0, 1e-6);
    EXPECT_EQ(limiter.get_stats().requests_last_hour, 2);
}

TEST(RateLimiterTest, WindowsNeverExceeded) {
    auto clock                 = std::make_shared<FakeClock>();
    auto config                = no_gap_config();
    config.requests_per_minute = 5;
    config.min_delay           = 0.5;
    config.max_delay           = 1.5;
    RateLimiter limiter(config, clock, 7);

    for (int i = 0; i < 40; ++i) {
        limiter.wait();
        auto stats = limiter.get_stats();
        EXPECT_LE(stats.requests_last_minute, 5);
        EXPECT_LE(stats.requests_last_hour, static_cast<size_t>(config.requests_per_hour));
    }
}

TEST(RateLimiterTest, BackoffGrowsAndCaps) {
    auto              clock = std::make_shared<FakeClock>();
    RateLimiterConfig config;
    config.backoff_base = 5.0;
    config.backoff_max  = 60.0;
    RateLimiter limiter(config, clock, 1);

    EXPECT_DOUBLE_EQ(limiter.backoff_seconds(), 0.0);
    const double expected[] = {5.0, 10.0, 20.0, 40.0, 60.0, 60.0};
    for (double e : expected) {
        limiter.record_rate_limit();
        EXPECT_DOUBLE_EQ(limiter.backoff_seconds(), e);
    }
    EXPECT_EQ(limiter.consecutive_failures(), 6);

    limiter.record_success();
    EXPECT_EQ(limiter.consecutive_failures(), 0);
    EXPECT_DOUBLE_EQ(limiter.backoff_seconds(), 0.0);
}

TEST(RateLimiterTest, BlockEscalatesToAtLeastFour) {
    auto        clock = std::make_shared<FakeClock>();
    RateLimiter limiter(RateLimiterConfig{}, clock, 1);

    limiter.record_block();
    EXPECT_EQ(limiter.consecutive_failures(), 4);
    EXPECT_DOUBLE_EQ(limiter.backoff_seconds(), 40.0);

    limiter.record_block();
    EXPECT_EQ(limiter.consecutive_failures(), 6);
    EXPECT_DOUBLE_EQ(limiter.backoff_seconds(), 60.0);

    limiter.record_success();
    limiter.record_rate_limit();
    limiter.record_rate_limit();
    limiter.record_rate_limit();
    limiter.record_block();
    EXPECT_EQ(limiter.consecutive_failures(), 5);
}

TEST(RateLimiterTest, WaitHonoursBackoffWithJitter) {
    auto clock          = std::make_shared<FakeClock>();
    auto config         = no_gap_config();
    config.backoff_base = 5.0;
    config.jitter_range = 1.0;
    RateLimiter limiter(config, clock, 3);

    limiter.record_rate_limit();
    limiter.wait();
    EXPECT_GE(clock->total_slept(), 5.0);
    EXPECT_LE(clock->total_slept(), 6.0 + 1e-6);

    limiter.record_rate_limit();
    double before = clock->total_slept();
    limiter.wait();
    double slept = clock->total_slept() - before;
    EXPECT_GE(slept, 10.0);
    EXPECT_LE(slept, 11.0 + 1e-6);
}

TEST(RateLimiterTest, BackoffMeasuredFromFailure) {
    auto clock          = std::make_shared<FakeClock>();
    auto config         = no_gap_config();
    config.backoff_base = 5.0;
    RateLimiter limiter(config, clock, 1);

    limiter.record_rate_limit();
    clock->advance(30.0);
    limiter.wait();
    EXPECT_EQ(clock->sleeps(), 0);

    // Success clears the penalty.
    limiter.record_rate_limit();
    limiter.record_success();
    limiter.wait();
    EXPECT_EQ(clock->sleeps(), 0);
}

TEST(RateLimiterTest, StatsJson) {
    auto clock                 = std::make_shared<FakeClock>();
    auto config                = no_gap_config();
    config.requests_per_minute = 15;
    config.requests_per_hour   = 500;
    RateLimiter limiter(config, clock, 1);

    limiter.wait();
    limiter.wait();
    limiter.record_rate_limit();
    clock->advance(61.0);

    nlohmann::json j = limiter.get_stats();
    EXPECT_EQ(j["requests_last_minute"], 0);
    EXPECT_EQ(j["requests_last_hour"], 2);
    EXPECT_EQ(j["consecutive_failures"], 1);
    EXPECT_EQ(j["limits"]["per_minute"], 15);
    EXPECT_EQ(j["limits"]["per_hour"], 500);
}

TEST(RateLimiterTest, SharedAcrossThreads) {
    auto        clock = std::make_shared<FakeClock>();
    RateLimiter limiter(no_gap_config(), clock, 1);

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&limiter]() {
            for (int j = 0; j < 25; ++j)
                limiter.wait();
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(limiter.get_stats().requests_last_minute, 100);
}
