#include "orchestrator.hpp"
#include <stdexcept>

#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"

namespace Bulwark {
namespace Engine {

using namespace Bulwark::Core;

void to_json(nlohmann::json& j, const StrategyStats& stats) {
    j = nlohmann::json{{"attempts", stats.attempts},
                       {"successes", stats.successes},
                       {"failures", stats.failures},
                       {"skips", stats.skips},
                       {"blocks", stats.blocks}};
}

StrategyOrchestrator::StrategyOrchestrator(OrchestratorConfig config, OrchestratorDeps deps)
    : config_(std::move(config)), deps_(std::move(deps)), session_monitor_(config_.token_cookie) {
    if (!deps_.rate_limiter)
        throw std::invalid_argument("StrategyOrchestrator requires a rate limiter");
    if (!deps_.clock)
        deps_.clock = default_clock();
    if (!deps_.captcha_solver)
        deps_.captcha_solver = std::make_shared<Captcha::NullCaptchaSolver>();
    if (config_.strategies.empty())
        config_.strategies = default_strategy_order();
}

void StrategyOrchestrator::set_session_cookies(Session::CookieJar cookies) {
    stored_cookies_ = std::move(cookies);
}

StrategyResult StrategyOrchestrator::run(const ExtractionRequest& request, std::optional<StrategyKind> pinned) {
    const std::vector<StrategyKind> order =
        pinned ? std::vector<StrategyKind>{*pinned} : config_.strategies;

    deps_.rate_limiter->wait();
    handled_page_block_.reset();

    std::vector<StrategyAttempt> attempts;
    for (StrategyKind kind : order) {
        auto& stats = stats_for(kind);
        Logger::debug(std::string("Trying strategy ") + to_string(kind));

        StrategyOutcome outcome = run_strategy(kind, request);
        switch (outcome.kind) {
            case OutcomeKind::Succeeded: {
                stats.attempts++;
                stats.successes++;
                deps_.rate_limiter->record_success();
                Logger::success(std::string("Strategy ") + to_string(kind) + " succeeded");

                StrategyResult result;
                result.payload     = std::move(outcome.payload);
                result.data_source = kind;
                result.attempts    = std::move(attempts);
                return result;
            }
            case OutcomeKind::Skipped:
                stats.skips++;
                Logger::info(std::string("Skipping ") + to_string(kind) + ": " + outcome.reason);
                attempts.push_back({to_string(kind), true, outcome.reason});
                break;
            case OutcomeKind::Failed:
                stats.attempts++;
                stats.failures++;
                Logger::warn(std::string("Strategy ") + to_string(kind) + " failed: " + outcome.reason);
                attempts.push_back({to_string(kind), false, outcome.reason});
                break;
        }
    }

    StrategyExhaustedError error(std::move(attempts));
    Logger::error(error.what());
    throw error;
}

StrategyOutcome StrategyOrchestrator::run_strategy(StrategyKind kind, const ExtractionRequest& request) {
    try {
        switch (kind) {
            case StrategyKind::PureApi:
                return try_pure_api(request);
            case StrategyKind::ApiDirect:
                return try_api_direct(request);
            case StrategyKind::ApiIntercept:
                return try_api_intercept(request);
            case StrategyKind::Dom:
                return try_dom(request);
        }
    } catch (const BulwarkError&) {
        throw;
    } catch (const std::exception& e) {
        // Driver and parser errors end this strategy, not the chain.
        return StrategyOutcome::failed(e.what());
    }
    return StrategyOutcome::failed("unknown strategy");
}

std::optional<std::string> StrategyOrchestrator::select_proxy() {
    if (!deps_.proxy_pool) {
        if (config_.require_proxy)
            throw ProxyExhaustedError();
        return std::nullopt;
    }

    auto proxy = deps_.proxy_pool->get_best();
    if (!proxy) {
        if (config_.require_proxy)
            throw ProxyExhaustedError();
        Logger::debug("No proxy available, connecting directly");
        return std::nullopt;
    }
    return proxy->url;
}

nlohmann::json StrategyOrchestrator::stats_json() const {
    nlohmann::json out = nlohmann::json::object();
    for (StrategyKind kind : default_strategy_order())
        out[to_string(kind)] = stats_[static_cast<size_t>(kind)];
    return out;
}

}  // namespace Engine
}  // namespace Bulwark
