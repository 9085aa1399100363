#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/config/config.hpp"
#include "../../src/core/errors/errors.hpp"

using namespace Bulwark::Core;

TEST(ConfigTest, Defaults) {
    char* argv[] = {(char*)"bulwark", (char*)"proxies"};
    auto  config = Config::parse(2, argv);
    EXPECT_EQ(config.command, "proxies");
    EXPECT_DOUBLE_EQ(config.min_delay, 2.0);
    EXPECT_DOUBLE_EQ(config.max_delay, 5.0);
    EXPECT_EQ(config.requests_per_minute, 15);
    EXPECT_EQ(config.requests_per_hour, 500);
    EXPECT_DOUBLE_EQ(config.ban_duration, 300.0);
    EXPECT_EQ(config.token_cookie, "d_c0");
    EXPECT_EQ(config.captcha_provider, "none");
    EXPECT_FALSE(config.require_proxy);
    EXPECT_FALSE(config.interactive);
    EXPECT_TRUE(config.proxies.empty());
}

TEST(ConfigTest, ComplexCLI) {
    char* argv[] = {(char*)"bulwark",
                    (char*)"fetch",
                    (char*)"/api/v4/me",
                    (char*)"--rpm",
                    (char*)"10",
                    (char*)"--min-delay",
                    (char*)"1.5",
                    (char*)"--max-delay",
                    (char*)"3",
                    (char*)"--proxy",
                    (char*)"http://p1.com:80",
                    (char*)"--strategy",
                    (char*)"pure_api,dom",
                    (char*)"--interactive",
                    (char*)"--require-proxy",
                    (char*)"--signature-version",
                    (char*)"old"};
    auto  config = Config::parse(17, argv);
    EXPECT_EQ(config.command, "fetch");
    ASSERT_EQ(config.args.size(), 1);
    EXPECT_EQ(config.args[0], "/api/v4/me");
    EXPECT_EQ(config.requests_per_minute, 10);
    EXPECT_DOUBLE_EQ(config.min_delay, 1.5);
    EXPECT_DOUBLE_EQ(config.max_delay, 3.0);
    ASSERT_EQ(config.proxies.size(), 1);
    EXPECT_EQ(config.proxies[0], "http://p1.com:80");
    ASSERT_EQ(config.strategies.size(), 2);
    EXPECT_EQ(config.strategies[1], "dom");
    EXPECT_TRUE(config.interactive);
    EXPECT_TRUE(config.require_proxy);
    EXPECT_EQ(config.signature_version, "old");
}

TEST(ConfigTest, YamlLoading) {
    std::string   yaml_content = R"(
        log_level: debug
        rate_limit:
          min_delay: 1
          max_delay: 4
          requests_per_minute: 20
          requests_per_hour: 300
          backoff_base: 2
        proxies:
          - "http://yaml_p1:80"
          - "http://yaml_p2:80"
        proxy_api: "https://provider.example/list"
        min_pool_size: 5
        captcha_provider: 2captcha
        captcha_api_key: "abc123"
        token_cookie: sid
        strategies: "api_direct, dom"
        captcha_wait: 90
    )";
    std::ofstream ofs("test_config.yaml");
    ofs << yaml_content;
    ofs.close();

    char* argv[] = {(char*)"bulwark", (char*)"--config", (char*)"test_config.yaml"};
    auto  config = Config::parse(3, argv);

    EXPECT_EQ(config.log_level, "debug");
    EXPECT_DOUBLE_EQ(config.min_delay, 1.0);
    EXPECT_DOUBLE_EQ(config.max_delay, 4.0);
    EXPECT_EQ(config.requests_per_minute, 20);
    EXPECT_EQ(config.requests_per_hour, 300);
    EXPECT_DOUBLE_EQ(config.backoff_base, 2.0);
    ASSERT_EQ(config.proxies.size(), 2);
    EXPECT_EQ(config.proxies[1], "http://yaml_p2:80");
    EXPECT_EQ(config.proxy_api, "https://provider.example/list");
    EXPECT_EQ(config.min_pool_size, 5);
    EXPECT_EQ(config.captcha_provider, "2captcha");
    EXPECT_EQ(config.captcha_api_key, "abc123");
    EXPECT_EQ(config.token_cookie, "sid");
    ASSERT_EQ(config.strategies.size(), 2);
    EXPECT_EQ(config.strategies[0], "api_direct");
    EXPECT_EQ(config.strategies[1], "dom");
    EXPECT_DOUBLE_EQ(config.captcha_wait, 90.0);

    std::remove("test_config.yaml");
}

TEST(ConfigTest, CliOverridesYaml) {
    std::ofstream ofs("test_override.yaml");
    ofs << "requests_per_minute: 20\nban_duration: 100\n";
    ofs.close();

    char* argv[] = {(char*)"bulwark", (char*)"-c", (char*)"test_override.yaml", (char*)"--rpm", (char*)"7"};
    auto  config = Config::parse(5, argv);
    EXPECT_EQ(config.requests_per_minute, 7);
    EXPECT_DOUBLE_EQ(config.ban_duration, 100.0);

    std::remove("test_override.yaml");
}

TEST(ConfigTest, ProxyListFile) {
    std::ofstream ofs("test_proxies.txt");
    ofs << "# provider export\n10.0.0.1:80\n\n  socks5://10.0.0.2:1080  # backup\n";
    ofs.close();

    auto list = load_proxy_list("test_proxies.txt");
    ASSERT_EQ(list.size(), 2);
    EXPECT_EQ(list[0], "10.0.0.1:80");
    EXPECT_EQ(list[1], "socks5://10.0.0.2:1080");

    char* argv[] = {(char*)"bulwark", (char*)"--proxy-list", (char*)"test_proxies.txt", (char*)"-p", (char*)"http://one:1"};
    auto  config = Config::parse(5, argv);
    ASSERT_EQ(config.proxies.size(), 3);
    EXPECT_EQ(config.proxies[2], "http://one:1");

    std::remove("test_proxies.txt");
    EXPECT_THROW(load_proxy_list("test_proxies.txt"), ConfigError);
}

TEST(ConfigTest, Validation) {
    Config config;
    EXPECT_NO_THROW(config.validate());

    config.min_delay = 6.0;
    EXPECT_THROW(config.validate(), ConfigError);

    config           = Config{};
    config.requests_per_minute = 0;
    EXPECT_THROW(config.validate(), ConfigError);

    config              = Config{};
    config.token_cookie = "";
    EXPECT_THROW(config.validate(), ConfigError);

    config                       = Config{};
    config.captcha_poll_interval = 0;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ConfigTest, InvalidValuesRejected) {
    char* argv[] = {(char*)"bulwark", (char*)"--min-delay", (char*)"9"};
    EXPECT_THROW(Config::parse(3, argv), ConfigError);
}

TEST(ConfigTest, MalformedYaml) {
    std::ofstream ofs("test_bad.yaml");
    ofs << "rate_limit: [unclosed\n";
    ofs.close();

    Config config;
    EXPECT_THROW(load_yaml(config, "test_bad.yaml"), std::runtime_error);
    std::remove("test_bad.yaml");
}
