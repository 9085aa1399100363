#include "config.hpp"
#include <CLI/CLI.hpp>
#include <fstream>
#include <yaml-cpp/yaml.h>

#include "../errors/errors.hpp"

namespace Bulwark {
namespace Core {

namespace {

template <typename T>
void read_scalar(const YAML::Node& yaml, const char* key, T& target) {
    if (yaml[key])
        target = yaml[key].as<T>();
}

std::vector<std::string> read_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (node.IsSequence()) {
        for (const auto& item : node)
            out.push_back(item.as<std::string>());
    }
    else if (node.IsScalar()) {
        std::string value = node.as<std::string>();
        size_t      start = 0;
        while (start <= value.size()) {
            size_t comma = value.find(',', start);
            if (comma == std::string::npos)
                comma = value.size();
            std::string item  = value.substr(start, comma - start);
            size_t      first = item.find_first_not_of(" \t");
            if (first != std::string::npos)
                out.push_back(item.substr(first, item.find_last_not_of(" \t") - first + 1));
            start = comma + 1;
        }
    }
    return out;
}

}  // namespace

std::vector<std::string> load_proxy_list(const std::string& path) {
    std::ifstream file(path);
    if (!file)
        throw ConfigError("Cannot open proxy list: " + path);

    std::vector<std::string> proxies;
    std::string              line;
    while (std::getline(file, line)) {
        size_t hash = line.find('#');
        if (hash != std::string::npos)
            line = line.substr(0, hash);

        size_t first = line.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            continue;
        size_t last = line.find_last_not_of(" \t\r\n");
        proxies.push_back(line.substr(first, last - first + 1));
    }
    return proxies;
}

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);

        read_scalar(yaml, "log_level", config.log_level);

        YAML::Node limiter = yaml["rate_limit"] ? yaml["rate_limit"] : yaml;
        read_scalar(limiter, "min_delay", config.min_delay);
        read_scalar(limiter, "max_delay", config.max_delay);
        read_scalar(limiter, "requests_per_minute", config.requests_per_minute);
        read_scalar(limiter, "requests_per_hour", config.requests_per_hour);
        read_scalar(limiter, "backoff_base", config.backoff_base);
        read_scalar(limiter, "backoff_max", config.backoff_max);
        read_scalar(limiter, "jitter_range", config.jitter_range);

        if (yaml["proxies"])
            config.proxies = read_list(yaml["proxies"]);
        read_scalar(yaml, "proxy_list", config.proxy_list);
        read_scalar(yaml, "proxy_api", config.proxy_api);
        read_scalar(yaml, "ban_duration", config.ban_duration);
        read_scalar(yaml, "refresh_interval", config.refresh_interval);
        read_scalar(yaml, "min_pool_size", config.min_pool_size);
        read_scalar(yaml, "max_pool_size", config.max_pool_size);
        read_scalar(yaml, "require_proxy", config.require_proxy);

        read_scalar(yaml, "captcha_provider", config.captcha_provider);
        read_scalar(yaml, "captcha_api_key", config.captcha_api_key);
        read_scalar(yaml, "captcha_api_url", config.captcha_api_url);
        read_scalar(yaml, "captcha_timeout", config.captcha_timeout);
        read_scalar(yaml, "captcha_poll_interval", config.captcha_poll_interval);

        read_scalar(yaml, "signature_version", config.signature_version);
        read_scalar(yaml, "version_tag", config.version_tag);
        read_scalar(yaml, "token_cookie", config.token_cookie);
        read_scalar(yaml, "api_base_url", config.api_base_url);
        read_scalar(yaml, "session_state", config.session_state);
        if (yaml["strategies"])
            config.strategies = read_list(yaml["strategies"]);
        read_scalar(yaml, "captcha_wait", config.captcha_wait);
        read_scalar(yaml, "interactive", config.interactive);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

void Config::validate() const {
    if (min_delay < 0 || max_delay < 0)
        throw ConfigError("min_delay and max_delay must not be negative");
    if (min_delay > max_delay)
        throw ConfigError("min_delay must not exceed max_delay");
    if (requests_per_minute <= 0 || requests_per_hour <= 0)
        throw ConfigError("requests_per_minute and requests_per_hour must be positive");
    if (backoff_base < 0 || backoff_max < 0 || jitter_range < 0)
        throw ConfigError("backoff and jitter settings must not be negative");
    if (ban_duration < 0 || refresh_interval < 0)
        throw ConfigError("ban_duration and refresh_interval must not be negative");
    if (min_pool_size < 0 || max_pool_size < 0)
        throw ConfigError("pool sizes must not be negative");
    if (captcha_timeout < 0 || captcha_poll_interval <= 0)
        throw ConfigError("captcha_timeout must not be negative and captcha_poll_interval must be positive");
    if (captcha_wait < 0)
        throw ConfigError("captcha_wait must not be negative");
    if (token_cookie.empty())
        throw ConfigError("token_cookie must not be empty");
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Bulwark - resilient signed access to anti-bot protected APIs"};

    std::string single_proxy;

    app.add_option("-c,--config", config.config_path, "Path to YAML configuration file");
    app.add_option("--log-level", config.log_level, "none, error, warn, info or debug");

    app.add_option("--min-delay", config.min_delay, "Minimum seconds between requests");
    app.add_option("--max-delay", config.max_delay, "Maximum seconds between requests");
    app.add_option("--rpm", config.requests_per_minute, "Requests per minute ceiling");
    app.add_option("--rph", config.requests_per_hour, "Requests per hour ceiling");
    app.add_option("--backoff-base", config.backoff_base, "Backoff base in seconds");
    app.add_option("--backoff-max", config.backoff_max, "Backoff ceiling in seconds");
    app.add_option("--jitter", config.jitter_range, "Backoff jitter range in seconds");

    app.add_option("-p,--proxy", single_proxy, "Single proxy URL");
    app.add_option("--proxy-list", config.proxy_list, "File containing list of proxies");
    app.add_option("--proxy-api", config.proxy_api, "Proxy provider URL");
    app.add_option("--ban-duration", config.ban_duration, "Seconds a failing proxy stays banned");
    app.add_option("--refresh-interval", config.refresh_interval, "Seconds between provider refreshes");
    app.add_option("--min-pool-size", config.min_pool_size, "Refresh when fewer proxies are available");
    app.add_option("--max-pool-size", config.max_pool_size, "Upper bound on pooled proxies");
    app.add_flag("--require-proxy", config.require_proxy, "Fail instead of connecting directly");

    app.add_option("--captcha-provider", config.captcha_provider, "none or 2captcha");
    app.add_option("--captcha-api-key", config.captcha_api_key, "CAPTCHA provider API key");
    app.add_option("--captcha-api-url", config.captcha_api_url, "CAPTCHA provider base URL");
    app.add_option("--captcha-timeout", config.captcha_timeout, "Seconds to wait for a solution");
    app.add_option("--captcha-poll-interval", config.captcha_poll_interval, "Seconds between polls");

    app.add_option("--signature-version", config.signature_version, "new or old");
    app.add_option("--version-tag", config.version_tag, "Signature version header value");
    app.add_option("--token-cookie", config.token_cookie, "Session token cookie name");
    app.add_option("--api-base", config.api_base_url, "Protected API base URL");
    app.add_option("--session-state", config.session_state, "Browser storage-state file with cookies");
    app.add_option("--strategy", config.strategies, "Strategy order, comma separated")->delimiter(',');
    app.add_option("--captcha-wait", config.captcha_wait, "Seconds to wait for manual CAPTCHA resolution");
    app.add_flag("--interactive", config.interactive, "Allow manual CAPTCHA resolution");

    app.add_option("command", config.command, "sign, classify, proxies or fetch");
    app.add_option("args", config.args, "Command arguments");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    if (!config.proxy_list.empty()) {
        for (auto& proxy : load_proxy_list(config.proxy_list))
            config.proxies.push_back(std::move(proxy));
    }
    if (!single_proxy.empty())
        config.proxies.push_back(single_proxy);

    config.validate();
    return config;
}

}  // namespace Core
}  // namespace Bulwark
