#include "rate_limiter.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

#include "../../core/logger/logger.hpp"

namespace Bulwark {
namespace Throttle {

using namespace Bulwark::Core;

namespace {

std::string format_seconds(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1fs", value);
    return buf;
}

}  // namespace

void to_json(nlohmann::json& j, const RateLimiterStats& stats) {
    j = nlohmann::json{{"requests_last_minute", stats.requests_last_minute},
                       {"requests_last_hour", stats.requests_last_hour},
                       {"consecutive_failures", stats.consecutive_failures},
                       {"limits", {{"per_minute", stats.per_minute}, {"per_hour", stats.per_hour}}}};
}

RateLimiter::RateLimiter(RateLimiterConfig            config,
                         std::shared_ptr<Core::Clock> clock,
                         std::optional<std::uint32_t> seed)
    : config_(config), clock_(clock ? std::move(clock) : default_clock()) {
    if (seed)
        rng_.seed(*seed);
    else
        rng_.seed(std::random_device{}());
}

double RateLimiter::uniform(double low, double high) {
    if (high <= low)
        return low;
    std::uniform_real_distribution<double> dist(low, high);
    return dist(rng_);
}

double RateLimiter::backoff_for(int failures) const {
    if (failures <= 0)
        return 0.0;
    double raw = config_.backoff_base * std::pow(2.0, failures - 1);
    return std::min(raw, config_.backoff_max);
}

void RateLimiter::prune(time_point now) {
    const auto minute_cutoff = now - std::chrono::duration_cast<Clock::time_point::duration>(
                                         seconds(Constants::MINUTE_WINDOW_SECONDS));
    const auto hour_cutoff   = now - std::chrono::duration_cast<Clock::time_point::duration>(
                                       seconds(Constants::HOUR_WINDOW_SECONDS));

    while (!minute_window_.empty() && minute_window_.front() <= minute_cutoff)
        minute_window_.pop_front();
    while (!hour_window_.empty() && hour_window_.front() <= hour_cutoff)
        hour_window_.pop_front();
}

void RateLimiter::wait() {
    using Duration = Clock::time_point::duration;

    std::optional<double> min_gap;
    std::optional<double> jitter;

    while (true) {
        Clock::duration pause{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto                  now = clock_->now();
            prune(now);

            time_point ready = now;

            if (last_request_time_) {
                if (!min_gap)
                    min_gap = uniform(config_.min_delay, config_.max_delay);
                ready = std::max(ready,
                                 *last_request_time_
                                     + std::chrono::duration_cast<Duration>(seconds(*min_gap)));
            }

            if (config_.requests_per_minute > 0
                && minute_window_.size() >= static_cast<size_t>(config_.requests_per_minute)) {
                ready = std::max(ready,
                                 minute_window_.front()
                                     + std::chrono::duration_cast<Duration>(
                                         seconds(Constants::MINUTE_WINDOW_SECONDS)));
            }

            if (config_.requests_per_hour > 0
                && hour_window_.size() >= static_cast<size_t>(config_.requests_per_hour)) {
                ready = std::max(ready,
                                 hour_window_.front()
                                     + std::chrono::duration_cast<Duration>(
                                         seconds(Constants::HOUR_WINDOW_SECONDS)));
            }

            if (consecutive_failures_ > 0 && last_failure_time_) {
                if (!jitter)
                    jitter = uniform(0.0, config_.jitter_range);
                double backoff = backoff_for(consecutive_failures_) + *jitter;
                ready          = std::max(ready,
                                 *last_failure_time_
                                     + std::chrono::duration_cast<Duration>(seconds(backoff)));
            }

            if (ready <= now) {
                last_request_time_ = now;
                minute_window_.push_back(now);
                hour_window_.push_back(now);
                return;
            }
            pause = ready - now;
        }

        Logger::debug("Rate limiter waiting " + format_seconds(pause.count()));
        clock_->sleep_for(pause);
    }
}

void RateLimiter::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_failures_ = 0;
}

void RateLimiter::record_rate_limit() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_failures_++;
    last_failure_time_ = clock_->now();
    Logger::warn("Rate limited (consecutive failures: " + std::to_string(consecutive_failures_)
                 + ", next backoff: " + format_seconds(backoff_for(consecutive_failures_)) + ")");
}

void RateLimiter::record_block() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_failures_ = std::max(consecutive_failures_ + 2, 4);
    last_failure_time_    = clock_->now();
    Logger::warn("Block detected (severity: " + std::to_string(consecutive_failures_)
                 + ", next backoff: " + format_seconds(backoff_for(consecutive_failures_)) + ")");
}

double RateLimiter::backoff_seconds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backoff_for(consecutive_failures_);
}

int RateLimiter::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_failures_;
}

RateLimiterStats RateLimiter::get_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    prune(clock_->now());

    RateLimiterStats stats;
    stats.requests_last_minute = minute_window_.size();
    stats.requests_last_hour   = hour_window_.size();
    stats.consecutive_failures = consecutive_failures_;
    stats.per_minute           = config_.requests_per_minute;
    stats.per_hour             = config_.requests_per_hour;
    return stats;
}

}  // namespace Throttle
}  // namespace Bulwark
