#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>

#include "../../core/clock/clock.hpp"
#include "../../core/types/constants.hpp"

namespace Bulwark {
namespace Throttle {

struct RateLimiterConfig {
    double min_delay           = Core::Constants::DEFAULT_MIN_DELAY;
    double max_delay           = Core::Constants::DEFAULT_MAX_DELAY;
    int    requests_per_minute = Core::Constants::DEFAULT_REQUESTS_PER_MINUTE;
    int    requests_per_hour   = Core::Constants::DEFAULT_REQUESTS_PER_HOUR;
    double backoff_base        = Core::Constants::DEFAULT_BACKOFF_BASE;
    double backoff_max         = Core::Constants::DEFAULT_BACKOFF_MAX;
    double jitter_range        = Core::Constants::DEFAULT_JITTER_RANGE;
};

struct RateLimiterStats {
    size_t requests_last_minute = 0;
    size_t requests_last_hour   = 0;
    int    consecutive_failures = 0;
    int    per_minute           = 0;
    int    per_hour             = 0;
};

void to_json(nlohmann::json& j, const RateLimiterStats& stats);

// Sliding-window limiter with exponential backoff after rate-limit and block signals.
// Safe to share between threads; every public call takes the same lock.
class RateLimiter {
public:
    explicit RateLimiter(RateLimiterConfig              config = {},
                         std::shared_ptr<Core::Clock>   clock  = Core::default_clock(),
                         std::optional<std::uint32_t>   seed   = std::nullopt);

    RateLimiter(const RateLimiter&)            = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Blocks until the minimum gap, both windows and any active backoff allow another request,
    // then stamps the request.
    void wait();

    void record_success();
    void record_rate_limit();
    void record_block();

    // Backoff for the current failure count, without jitter. Zero when there are no failures.
    double           backoff_seconds() const;
    int              consecutive_failures() const;
    RateLimiterStats get_stats();

    const RateLimiterConfig& config() const {
        return config_;
    }

private:
    using time_point = Core::Clock::time_point;

    RateLimiterConfig            config_;
    std::shared_ptr<Core::Clock> clock_;

    mutable std::mutex        mutex_;
    std::deque<time_point>    minute_window_;
    std::deque<time_point>    hour_window_;
    int                       consecutive_failures_ = 0;
    std::optional<time_point> last_request_time_;
    std::optional<time_point> last_failure_time_;
    std::mt19937              rng_;

    void   prune(time_point now);
    double backoff_for(int failures) const;
    double uniform(double low, double high);
};

}  // namespace Throttle
}  // namespace Bulwark
