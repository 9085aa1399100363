#pragma once
#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>
#include <memory>

#include "rate_limiter.hpp"

namespace Bulwark {
namespace Throttle {

// Coroutine front for a shared RateLimiter. The blocking wait runs on a private
// thread pool so it never stalls the caller's executor.
class AsyncRateLimiter {
public:
    explicit AsyncRateLimiter(std::shared_ptr<RateLimiter> limiter, size_t threads = 1);
    ~AsyncRateLimiter();

    AsyncRateLimiter(const AsyncRateLimiter&)            = delete;
    AsyncRateLimiter& operator=(const AsyncRateLimiter&) = delete;

    boost::asio::awaitable<void> wait();

    void record_success() {
        limiter_->record_success();
    }
    void record_rate_limit() {
        limiter_->record_rate_limit();
    }
    void record_block() {
        limiter_->record_block();
    }
    RateLimiterStats get_stats() {
        return limiter_->get_stats();
    }

    const std::shared_ptr<RateLimiter>& limiter() const {
        return limiter_;
    }

private:
    std::shared_ptr<RateLimiter> limiter_;
    boost::asio::thread_pool     pool_;
};

}  // namespace Throttle
}  // namespace Bulwark
