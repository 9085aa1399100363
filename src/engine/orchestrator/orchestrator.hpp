#pragma once
#include <array>
#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "../../browser/driver/automation_driver.hpp"
#include "../../captcha/solver/captcha_solver.hpp"
#include "../../core/clock/clock.hpp"
#include "../../core/types/constants.hpp"
#include "../../detection/block/block_detector.hpp"
#include "../../detection/session/session_monitor.hpp"
#include "../../proxy/pool/proxy_pool.hpp"
#include "../../session/cookie_jar.hpp"
#include "../../throttle/limiter/rate_limiter.hpp"
#include "../api/signed_api_caller.hpp"
#include "../strategy/strategy.hpp"

namespace Bulwark {
namespace Engine {

struct OrchestratorConfig {
    std::vector<StrategyKind> strategies         = default_strategy_order();
    double                    captcha_wait       = Core::Constants::DEFAULT_CAPTCHA_WAIT_SECONDS;
    bool                      interactive        = false;  // a person may clear CAPTCHAs in the driver
    bool                      require_proxy      = false;
    std::string               token_cookie       = Core::Constants::DEFAULT_TOKEN_COOKIE;
    std::string               extra_token_script = Core::Constants::DEFAULT_EXTRA_TOKEN_JS;
};

// Shared collaborators. Only the rate limiter is mandatory; a missing driver or API
// caller makes the strategies that need it skip.
struct OrchestratorDeps {
    std::shared_ptr<Throttle::RateLimiter>     rate_limiter;
    std::shared_ptr<Proxy::Pool::ProxyPool>    proxy_pool;
    std::shared_ptr<Captcha::CaptchaSolver>    captcha_solver;
    std::shared_ptr<SignedApiCaller>           api_caller;
    std::shared_ptr<Browser::AutomationDriver> driver;
    std::shared_ptr<Core::Clock>               clock;
};

struct StrategyStats {
    size_t attempts  = 0;
    size_t successes = 0;
    size_t failures  = 0;
    size_t skips     = 0;
    size_t blocks    = 0;
};

using OrchestratorStats = std::array<StrategyStats, 4>;  // indexed by StrategyKind

void to_json(nlohmann::json& j, const StrategyStats& stats);

/**
 * Answers one extraction request by walking the strategy chain
 * (pure_api, api_direct, api_intercept, dom) until one yields content.
 *
 * Each attempt is classified with BlockDetector. Blocks feed the rate limiter
 * and proxy pool, apply the recommended wait, and for CAPTCHAs go through the
 * solver or a bounded wait for manual resolution.
 *
 * Throws StrategyExhaustedError when nothing succeeded, BlockedError for a
 * CAPTCHA nobody can solve, and CaptchaUnsolvedError when the configured solver
 * failed and manual resolution is disabled. A required proxy that is not
 * available fails the signed strategies; the browser strategies still run.
 *
 * Instances are not meant to run two requests at once; the shared limiter and
 * pool may be used by many orchestrators.
 */
class StrategyOrchestrator {
public:
    StrategyOrchestrator(OrchestratorConfig config, OrchestratorDeps deps);

    StrategyOrchestrator(const StrategyOrchestrator&)            = delete;
    StrategyOrchestrator& operator=(const StrategyOrchestrator&) = delete;

    // Cookies for pure_api (no driver), e.g. from a saved browser state file.
    void set_session_cookies(Session::CookieJar cookies);

    StrategyResult run(const ExtractionRequest& request, std::optional<StrategyKind> pinned = std::nullopt);

    OrchestratorStats get_stats() const {
        return stats_;
    }
    nlohmann::json stats_json() const;

    const OrchestratorConfig& config() const {
        return config_;
    }

private:
    enum class BlockResolution { Resolved, Unresolved };

    struct PageCheck {
        Detection::BlockStatus status;
        BlockResolution        resolution = BlockResolution::Unresolved;
    };

    OrchestratorConfig              config_;
    OrchestratorDeps                deps_;
    Session::CookieJar              stored_cookies_;
    Detection::BlockDetector        detector_;
    Detection::SessionHealthMonitor session_monitor_;
    OrchestratorStats               stats_{};
    std::optional<std::string>      handled_page_block_;  // url + body of the last unresolved page block this run

    StrategyOutcome run_strategy(StrategyKind kind, const ExtractionRequest& request);
    StrategyOutcome try_pure_api(const ExtractionRequest& request);
    StrategyOutcome try_api_direct(const ExtractionRequest& request);
    StrategyOutcome try_api_intercept(const ExtractionRequest& request);
    StrategyOutcome try_dom(const ExtractionRequest& request);

    StrategyOutcome call_signed_api(StrategyKind              kind,
                                    const ExtractionRequest&  request,
                                    const Session::CookieJar& cookies,
                                    const std::string&        extra_token);

    std::optional<std::string> select_proxy();

    BlockResolution handle_block(StrategyKind                      kind,
                                 const Detection::BlockStatus&     status,
                                 const ExtractionRequest&          request,
                                 const std::optional<std::string>& proxy_url);
    PageCheck       check_page(StrategyKind kind, const ExtractionRequest& request);
    BlockResolution resolve_captcha(const Detection::BlockStatus& status, const ExtractionRequest& request);
    bool            page_is_clear();

    StrategyStats& stats_for(StrategyKind kind) {
        return stats_[static_cast<size_t>(kind)];
    }
};

}  // namespace Engine
}  // namespace Bulwark
