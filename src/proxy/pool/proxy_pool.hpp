#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "../../core/clock/clock.hpp"
#include "../../network/http/http_client.hpp"
#include "proxy_record.hpp"

namespace Bulwark {
namespace Proxy {
namespace Pool {

struct ProxyPoolConfig {
    std::string api_url;  // empty: no provider, refresh is a no-op
    double      ban_duration     = Core::Constants::DEFAULT_BAN_DURATION;
    double      refresh_interval = Core::Constants::DEFAULT_REFRESH_INTERVAL;
    int         min_pool_size    = Core::Constants::DEFAULT_MIN_POOL_SIZE;
    int         max_pool_size    = Core::Constants::DEFAULT_MAX_POOL_SIZE;
};

struct ProxySummary {
    std::string   url;  // truncated for display
    double        score = 0.0;
    std::uint64_t successes = 0;
    std::uint64_t failures  = 0;
    std::uint64_t blocks    = 0;
    bool          banned    = false;
};

struct ProxyPoolStats {
    size_t                    total     = 0;
    size_t                    available = 0;
    size_t                    banned    = 0;
    std::string               api_url;
    std::vector<ProxySummary> proxies;  // best 20 by score
};

void to_json(nlohmann::json& j, const ProxySummary& summary);
void to_json(nlohmann::json& j, const ProxyPoolStats& stats);

class ProxyPool {
public:
    explicit ProxyPool(ProxyPoolConfig                         config = {},
                       std::shared_ptr<Network::Http::HttpClient> http   = nullptr,
                       std::shared_ptr<Core::Clock>               clock  = Core::default_clock(),
                       std::optional<std::uint32_t>               seed   = std::nullopt);

    ProxyPool(const ProxyPool&)            = delete;
    ProxyPool& operator=(const ProxyPool&) = delete;

    void   add(const std::string& url);
    size_t add_many(const std::vector<std::string>& urls);

    // Fetches the provider list and adds unseen entries. Returns how many were added;
    // failures are logged and yield 0.
    size_t refresh();

    std::optional<ProxyRecord> get_best();
    std::optional<ProxyRecord> get_random();

    void record_success(const std::string& url);
    void record_failure(const std::string& url);
    void record_block(const std::string& url);

    std::optional<ProxyRecord> find(const std::string& url) const;
    ProxyPoolStats             get_stats() const;
    size_t                     size() const;
    size_t                     available() const;

    const ProxyPoolConfig& config() const {
        return config_;
    }

private:
    ProxyPoolConfig                            config_;
    std::shared_ptr<Network::Http::HttpClient> http_;
    std::shared_ptr<Core::Clock>               clock_;

    mutable std::mutex                      mutex_;
    std::vector<ProxyRecord>                records_;
    std::unordered_map<std::string, size_t> index_;
    std::optional<Core::Clock::time_point>  last_refresh_;
    std::mt19937                            rng_;

    bool         insert_locked(const std::string& url);
    ProxyRecord* lookup_locked(const std::string& url);
    size_t       available_locked(Core::Clock::time_point now) const;
    void         maybe_auto_refresh();
    Core::Clock::time_point ban_until(double seconds) const;
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Bulwark
