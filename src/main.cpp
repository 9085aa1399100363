#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

#include "captcha/solver/solver_factory.hpp"
#include "core/config/config.hpp"
#include "core/errors/errors.hpp"
#include "core/logger/logger.hpp"
#include "detection/block/block_detector.hpp"
#include "detection/session/session_monitor.hpp"
#include "engine/api/signed_api_caller.hpp"
#include "engine/orchestrator/orchestrator.hpp"
#include "network/http/curl_client.hpp"
#include "proxy/pool/proxy_list_parser.hpp"
#include "proxy/pool/proxy_pool.hpp"
#include "session/cookie_jar.hpp"
#include "signature/engine/signature_engine.hpp"
#include "throttle/limiter/rate_limiter.hpp"
#include "utils/url/url.hpp"

using namespace Bulwark;
using namespace Bulwark::Core;

namespace {

void print_usage() {
    std::cout << "Usage: bulwark [options] <command> [args]\n"
              << "  sign <api_path> [token]     Print the signature headers for a request\n"
              << "  classify <status> [body]    Classify an API response\n"
              << "  proxies                     Refresh the proxy pool and print its stats\n"
              << "  fetch <api_path>            Fetch a signed API path through the strategy chain\n"
              << "Run with --help for all options.\n";
}

Session::CookieJar load_cookies(const Config& config) {
    if (config.session_state.empty())
        return {};
    return Session::CookieJar::load_state_file(config.session_state);
}

Throttle::RateLimiterConfig limiter_config(const Config& config) {
    Throttle::RateLimiterConfig out;
    out.min_delay           = config.min_delay;
    out.max_delay           = config.max_delay;
    out.requests_per_minute = config.requests_per_minute;
    out.requests_per_hour   = config.requests_per_hour;
    out.backoff_base        = config.backoff_base;
    out.backoff_max         = config.backoff_max;
    out.jitter_range        = config.jitter_range;
    return out;
}

std::shared_ptr<Proxy::Pool::ProxyPool> build_proxy_pool(const Config& config) {
    Proxy::Pool::ProxyPoolConfig pool_config;
    pool_config.api_url          = config.proxy_api;
    pool_config.ban_duration     = config.ban_duration;
    pool_config.refresh_interval = config.refresh_interval;
    pool_config.min_pool_size    = config.min_pool_size;
    pool_config.max_pool_size    = config.max_pool_size;

    auto http = std::make_shared<Network::Http::CurlClient>();
    http->set_timeout(std::chrono::seconds(Constants::REFRESH_TIMEOUT_SECONDS));

    auto pool = std::make_shared<Proxy::Pool::ProxyPool>(pool_config, http);
    std::vector<std::string> normalized;
    for (const auto& proxy : config.proxies) {
        std::string url = Proxy::Pool::normalize_proxy(proxy);
        if (!Proxy::Pool::is_valid_proxy(url)) {
            Logger::warn("Skipping malformed proxy: " + proxy);
            continue;
        }
        normalized.push_back(std::move(url));
    }
    pool->add_many(normalized);
    return pool;
}

Engine::ApiCallerConfig api_config(const Config& config) {
    Engine::ApiCallerConfig out;
    out.base_url     = config.api_base_url;
    out.version_tag  = config.version_tag;
    out.token_cookie = config.token_cookie;
    out.version      = Signature::parse_algorithm_version(config.signature_version);
    return out;
}

int run_sign(const Config& config) {
    if (config.args.empty()) {
        Logger::error("sign requires an API path");
        return 1;
    }

    std::string token;
    if (config.args.size() > 1) {
        token = config.args[1];
    }
    else {
        Detection::SessionHealthMonitor monitor(config.token_cookie);
        token = monitor.get_token(load_cookies(config)).value_or("");
    }
    if (token.empty())
        throw SignatureUnavailableError(config.token_cookie);

    Signature::SignatureContext ctx;
    ctx.version_tag   = config.version_tag;
    ctx.api_path      = Utils::Url::path_and_query(config.args[0]);
    ctx.session_token = token;

    Signature::SignatureEngine engine(Signature::parse_algorithm_version(config.signature_version));
    for (const auto& [name, value] : engine.headers(ctx))
        std::cout << name << ": " << value << "\n";
    return 0;
}

int run_classify(const Config& config) {
    if (config.args.empty()) {
        Logger::error("classify requires a status code");
        return 1;
    }

    long status = 0;
    try {
        status = std::stol(config.args[0]);
    } catch (const std::exception&) {
        Logger::error("Invalid status code: " + config.args[0]);
        return 1;
    }

    nlohmann::json body;
    if (config.args.size() > 1) {
        try {
            body = nlohmann::json::parse(config.args[1]);
        } catch (const nlohmann::json::parse_error& e) {
            Logger::error("Body is not valid JSON: " + std::string(e.what()));
            return 1;
        }
    }

    Detection::BlockDetector detector;
    auto                     result = detector.classify_api(status, body);
    nlohmann::json           out    = {{"kind", Detection::to_string(result.kind)},
                                       {"blocked", result.is_blocked()},
                                       {"message", result.message},
                                       {"should_rotate_proxy", result.should_rotate_proxy},
                                       {"should_wait", result.should_wait},
                                       {"wait_seconds", result.wait_seconds},
                                       {"should_notify_user", result.should_notify_user}};
    std::cout << out.dump(2) << "\n";
    return 0;
}

int run_proxies(const Config& config) {
    auto pool = build_proxy_pool(config);
    pool->refresh();
    nlohmann::json stats = pool->get_stats();
    std::cout << stats.dump(2) << "\n";
    return 0;
}

int run_fetch(const Config& config) {
    if (config.args.empty()) {
        Logger::error("fetch requires an API path");
        return 1;
    }

    Engine::OrchestratorConfig orchestrator_config;
    orchestrator_config.captcha_wait  = config.captcha_wait;
    orchestrator_config.interactive   = config.interactive;
    orchestrator_config.require_proxy = config.require_proxy;
    orchestrator_config.token_cookie  = config.token_cookie;
    if (!config.strategies.empty()) {
        orchestrator_config.strategies.clear();
        for (const auto& name : config.strategies)
            orchestrator_config.strategies.push_back(Engine::parse_strategy_kind(name));
    }

    auto api_http = std::make_shared<Network::Http::CurlClient>();

    Captcha::SolverConfig solver_config;
    solver_config.kind                   = Captcha::parse_solver_kind(config.captcha_provider);
    solver_config.provider.api_key       = config.captcha_api_key;
    solver_config.provider.api_url       = config.captcha_api_url;
    solver_config.provider.timeout       = config.captcha_timeout;
    solver_config.provider.poll_interval = config.captcha_poll_interval;

    Engine::OrchestratorDeps deps;
    deps.rate_limiter   = std::make_shared<Throttle::RateLimiter>(limiter_config(config));
    deps.proxy_pool     = build_proxy_pool(config);
    deps.captcha_solver = Captcha::make_captcha_solver(solver_config, std::make_shared<Network::Http::CurlClient>());
    deps.api_caller     = std::make_shared<Engine::SignedApiCaller>(api_http, api_config(config));

    Engine::StrategyOrchestrator orchestrator(orchestrator_config, deps);
    orchestrator.set_session_cookies(load_cookies(config));

    Engine::ExtractionRequest request;
    request.api_path  = Utils::Url::path_and_query(config.args[0]);
    request.parse_api = [](const nlohmann::json& body) -> std::optional<nlohmann::json> {
        if (body.is_null() || body.empty())
            return std::nullopt;
        return body;
    };

    auto result = orchestrator.run(request);
    nlohmann::json out = {{"data_source", Engine::to_string(result.data_source)},
                          {"payload", result.payload},
                          {"stats", orchestrator.stats_json()}};
    std::cout << out.dump(2) << "\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = Config::parse(argc, argv);
        Logger::set_level(Logger::parse_level(config.log_level));

        if (config.command == "sign")
            return run_sign(config);
        if (config.command == "classify")
            return run_classify(config);
        if (config.command == "proxies")
            return run_proxies(config);
        if (config.command == "fetch")
            return run_fetch(config);

        if (!config.command.empty())
            Logger::error("Unknown command: " + config.command);
        print_usage();
        return config.command.empty() ? 0 : 1;
    } catch (const StrategyExhaustedError&) {
        // The orchestrator has already logged every attempt.
        return 2;
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
