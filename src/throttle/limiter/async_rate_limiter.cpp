#include "async_rate_limiter.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <stdexcept>

namespace Bulwark {
namespace Throttle {

AsyncRateLimiter::AsyncRateLimiter(std::shared_ptr<RateLimiter> limiter, size_t threads)
    : limiter_(std::move(limiter)), pool_(threads == 0 ? 1 : threads) {
    if (!limiter_)
        throw std::invalid_argument("AsyncRateLimiter requires a rate limiter");
}

AsyncRateLimiter::~AsyncRateLimiter() {
    pool_.join();
}

boost::asio::awaitable<void> AsyncRateLimiter::wait() {
    auto limiter = limiter_;
    co_await boost::asio::co_spawn(
        pool_,
        [limiter]() -> boost::asio::awaitable<void> {
            limiter->wait();
            co_return;
        },
        boost::asio::use_awaitable);
}

}  // namespace Throttle
}  // namespace Bulwark
