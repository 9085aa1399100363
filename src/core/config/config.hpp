#pragma once
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Bulwark {
namespace Core {

struct Config {
    std::string              command;  // sign | classify | proxies | fetch
    std::vector<std::string> args;
    std::string              config_path;
    std::string              log_level = "info";

    // Rate limiter
    double min_delay           = Constants::DEFAULT_MIN_DELAY;
    double max_delay           = Constants::DEFAULT_MAX_DELAY;
    int    requests_per_minute = Constants::DEFAULT_REQUESTS_PER_MINUTE;
    int    requests_per_hour   = Constants::DEFAULT_REQUESTS_PER_HOUR;
    double backoff_base        = Constants::DEFAULT_BACKOFF_BASE;
    double backoff_max         = Constants::DEFAULT_BACKOFF_MAX;
    double jitter_range        = Constants::DEFAULT_JITTER_RANGE;

    // Proxy pool
    std::vector<std::string> proxies;
    std::string              proxy_list;  // file, one proxy per line
    std::string              proxy_api;
    double                   ban_duration     = Constants::DEFAULT_BAN_DURATION;
    double                   refresh_interval = Constants::DEFAULT_REFRESH_INTERVAL;
    int                      min_pool_size    = Constants::DEFAULT_MIN_POOL_SIZE;
    int                      max_pool_size    = Constants::DEFAULT_MAX_POOL_SIZE;
    bool                     require_proxy    = false;

    // CAPTCHA
    std::string captcha_provider = "none";
    std::string captcha_api_key;
    std::string captcha_api_url       = Constants::DEFAULT_CAPTCHA_API_URL;
    int         captcha_timeout       = Constants::DEFAULT_CAPTCHA_TIMEOUT;
    double      captcha_poll_interval = Constants::DEFAULT_CAPTCHA_POLL_INTERVAL;

    // Signing and strategies
    std::string              signature_version = "new";
    std::string              version_tag       = Constants::DEFAULT_VERSION_TAG;
    std::string              token_cookie      = Constants::DEFAULT_TOKEN_COOKIE;
    std::string              api_base_url      = Constants::DEFAULT_API_BASE_URL;
    std::string              session_state;  // browser storage-state JSON with cookies
    std::vector<std::string> strategies;
    double                   captcha_wait = Constants::DEFAULT_CAPTCHA_WAIT_SECONDS;
    bool                     interactive  = false;

    // Throws ConfigError on inconsistent values.
    void validate() const;

    static Config parse(int argc, char* argv[]);
};

void load_yaml(Config& config, const std::string& path);

// Reads one proxy per line; blank lines and '#' comments are skipped.
std::vector<std::string> load_proxy_list(const std::string& path);

}  // namespace Core
}  // namespace Bulwark
