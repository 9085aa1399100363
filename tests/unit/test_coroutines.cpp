#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <gtest/gtest.h>
#include "../../src/throttle/limiter/async_rate_limiter.hpp"
#include "fakes.hpp"

using namespace Bulwark::Throttle;
using Bulwark::Testing::FakeClock;

namespace {

std::shared_ptr<RateLimiter> make_limiter(std::shared_ptr<FakeClock> clock, double gap) {
    RateLimiterConfig config;
    config.min_delay    = gap;
    config.max_delay    = gap;
    config.jitter_range = 0.0;
    return std::make_shared<RateLimiter>(config, clock, 1);
}

boost::asio::awaitable<void> paced_requests(AsyncRateLimiter& limiter, int count, int& done) {
    for (int i = 0; i < count; ++i) {
        co_await limiter.wait();
        limiter.record_success();
        ++done;
    }
    co_return;
}

}  // namespace

TEST(CoroutineTest, AsyncWaitPacesRequests) {
    auto                    clock = std::make_shared<FakeClock>();
    AsyncRateLimiter        limiter(make_limiter(clock, 1.5));
    boost::asio::io_context io_context;
    int                     done = 0;

    boost::asio::co_spawn(io_context, paced_requests(limiter, 3, done), boost::asio::detached);
    io_context.run();

    EXPECT_EQ(done, 3);
    EXPECT_NEAR(clock->total_slept(), 3.0, 1e-6);
    EXPECT_EQ(limiter.get_stats().requests_last_minute, 3);
}

TEST(CoroutineTest, ConcurrentCoroutinesShareLimiter) {
    auto                    clock = std::make_shared<FakeClock>();
    auto                    shared = make_limiter(clock, 0.0);
    AsyncRateLimiter        a(shared);
    AsyncRateLimiter        b(shared, 2);
    boost::asio::io_context io_context;
    int                     done_a = 0;
    int                     done_b = 0;

    boost::asio::co_spawn(io_context, paced_requests(a, 5, done_a), boost::asio::detached);
    boost::asio::co_spawn(io_context, paced_requests(b, 5, done_b), boost::asio::detached);
    io_context.run();

    EXPECT_EQ(done_a + done_b, 10);
    EXPECT_EQ(shared->get_stats().requests_last_minute, 10);
}

TEST(CoroutineTest, FailureSignalsReachLimiter) {
    auto             clock = std::make_shared<FakeClock>();
    AsyncRateLimiter limiter(make_limiter(clock, 0.0));

    limiter.record_rate_limit();
    limiter.record_block();
    EXPECT_EQ(limiter.limiter()->consecutive_failures(), 4);
    EXPECT_EQ(limiter.get_stats().consecutive_failures, 4);
}

TEST(CoroutineTest, RequiresLimiter) {
    EXPECT_THROW(AsyncRateLimiter(nullptr), std::invalid_argument);
}
