#include "proxy_pool.hpp"
#include <algorithm>
#include <cmath>

#include "../../core/logger/logger.hpp"
#include "proxy_list_parser.hpp"

namespace Bulwark {
namespace Proxy {
namespace Pool {

using namespace Bulwark::Core;

namespace {

constexpr size_t STATS_TOP_N       = 20;
constexpr size_t STATS_URL_MAX_LEN = 30;

std::string truncate_url(const std::string& url) {
    if (url.size() <= STATS_URL_MAX_LEN)
        return url;
    return url.substr(0, STATS_URL_MAX_LEN) + "...";
}

}  // namespace

void to_json(nlohmann::json& j, const ProxySummary& summary) {
    j = nlohmann::json{{"url", summary.url},
                       {"score", summary.score},
                       {"successes", summary.successes},
                       {"failures", summary.failures},
                       {"blocks", summary.blocks},
                       {"banned", summary.banned}};
}

void to_json(nlohmann::json& j, const ProxyPoolStats& stats) {
    j = nlohmann::json{{"total", stats.total},
                       {"available", stats.available},
                       {"banned", stats.banned},
                       {"api_url", stats.api_url},
                       {"proxies", stats.proxies}};
}

ProxyPool::ProxyPool(ProxyPoolConfig                            config,
                     std::shared_ptr<Network::Http::HttpClient> http,
                     std::shared_ptr<Core::Clock>               clock,
                     std::optional<std::uint32_t>               seed)
    : config_(std::move(config)),
      http_(std::move(http)),
      clock_(clock ? std::move(clock) : default_clock()) {
    if (seed)
        rng_.seed(*seed);
    else
        rng_.seed(std::random_device{}());
}

bool ProxyPool::insert_locked(const std::string& url) {
    if (url.empty() || index_.count(url))
        return false;
    ProxyRecord record;
    record.url = url;
    index_.emplace(url, records_.size());
    records_.push_back(std::move(record));
    return true;
}

ProxyRecord* ProxyPool::lookup_locked(const std::string& url) {
    auto it = index_.find(url);
    if (it == index_.end())
        return nullptr;
    return &records_[it->second];
}

size_t ProxyPool::available_locked(Clock::time_point now) const {
    return static_cast<size_t>(std::count_if(records_.begin(), records_.end(), [&](const ProxyRecord& r) {
        return !r.is_banned(now);
    }));
}

Clock::time_point ProxyPool::ban_until(double secs) const {
    return clock_->now() + std::chrono::duration_cast<Clock::time_point::duration>(seconds(secs));
}

void ProxyPool::add(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    insert_locked(url);
}

size_t ProxyPool::add_many(const std::vector<std::string>& urls) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t                      added = 0;
    for (const auto& url : urls) {
        if (insert_locked(url))
            added++;
    }
    return added;
}

size_t ProxyPool::refresh() {
    if (config_.api_url.empty())
        return 0;
    if (!http_) {
        Logger::warn("Proxy provider configured but no HTTP client available");
        return 0;
    }

    Response response = http_->get(config_.api_url, {});
    if (!response.success) {
        Logger::warn("Failed to refresh proxy pool: " + response.error);
        return 0;
    }

    auto   entries = parse_proxy_list(response.body);
    size_t added   = 0;
    size_t total   = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& url : entries) {
            if (config_.max_pool_size > 0 && records_.size() >= static_cast<size_t>(config_.max_pool_size))
                break;
            if (insert_locked(url))
                added++;
        }
        last_refresh_ = clock_->now();
        total         = records_.size();
    }

    Logger::info("Refreshed proxy pool: " + std::to_string(added) + " new, " + std::to_string(total)
                 + " total");
    return added;
}

void ProxyPool::maybe_auto_refresh() {
    if (config_.api_url.empty())
        return;

    bool needs_refresh = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  now = clock_->now();
        const bool                  stale =
            !last_refresh_
            || std::chrono::duration<double>(now - *last_refresh_).count() > config_.refresh_interval;
        needs_refresh =
            stale || available_locked(now) < static_cast<size_t>(std::max(config_.min_pool_size, 0));
    }

    if (needs_refresh)
        refresh();
}

std::optional<ProxyRecord> ProxyPool::get_best() {
    maybe_auto_refresh();

    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  now  = clock_->now();
    ProxyRecord*                best = nullptr;
    for (auto& record : records_) {
        if (record.is_banned(now))
            continue;
        if (!best || record.score() > best->score())
            best = &record;
    }
    if (!best)
        return std::nullopt;

    best->last_used = now;
    return *best;
}

std::optional<ProxyRecord> ProxyPool::get_random() {
    maybe_auto_refresh();

    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  now = clock_->now();

    std::vector<ProxyRecord*> available;
    std::vector<double>       weights;
    for (auto& record : records_) {
        if (record.is_banned(now))
            continue;
        available.push_back(&record);
        weights.push_back(std::max(record.score(), Constants::MIN_SAMPLING_WEIGHT));
    }
    if (available.empty())
        return std::nullopt;

    std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
    ProxyRecord*                       chosen = available[dist(rng_)];
    chosen->last_used                         = now;
    return *chosen;
}

void ProxyPool::record_success(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* record = lookup_locked(url))
        record->successes++;
}

void ProxyPool::record_failure(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto*                       record = lookup_locked(url);
    if (!record)
        return;

    record->failures++;
    if (record->failures >= static_cast<std::uint64_t>(Constants::FAILURES_BEFORE_BAN)
        && record->score() < Constants::BAN_SCORE_THRESHOLD) {
        record->banned_until = std::max(record->banned_until, ban_until(config_.ban_duration));
        Logger::info("Proxy banned for " + std::to_string(static_cast<int>(config_.ban_duration))
                     + "s: " + url);
    }
}

void ProxyPool::record_block(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto*                       record = lookup_locked(url);
    if (!record)
        return;

    record->blocks++;
    record->banned_until = std::max(record->banned_until, ban_until(config_.ban_duration * 2));
    Logger::warn("Proxy blocked and banned: " + url);
}

std::optional<ProxyRecord> ProxyPool::find(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = index_.find(url);
    if (it == index_.end())
        return std::nullopt;
    return records_[it->second];
}

ProxyPoolStats ProxyPool::get_stats() const {
    std::vector<ProxyRecord> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = records_;
    }
    const auto now = clock_->now();

    ProxyPoolStats stats;
    stats.total = snapshot.size();
    for (const auto& r : snapshot) {
        if (r.is_banned(now))
            stats.banned++;
        else
            stats.available++;
    }
    stats.api_url = config_.api_url.empty() ? "not configured" : config_.api_url;

    std::stable_sort(snapshot.begin(), snapshot.end(), [](const ProxyRecord& a, const ProxyRecord& b) {
        return a.score() > b.score();
    });
    for (size_t i = 0; i < snapshot.size() && i < STATS_TOP_N; ++i) {
        const auto&  r = snapshot[i];
        ProxySummary summary;
        summary.url       = truncate_url(r.url);
        summary.score     = std::round(r.score() * 100.0) / 100.0;
        summary.successes = r.successes;
        summary.failures  = r.failures;
        summary.blocks    = r.blocks;
        summary.banned    = r.is_banned(now);
        stats.proxies.push_back(std::move(summary));
    }
    return stats;
}

size_t ProxyPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

size_t ProxyPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_locked(clock_->now());
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Bulwark
