#include "../../../core/errors/errors.hpp"
#include "../../../core/logger/logger.hpp"
#include "../orchestrator.hpp"

namespace Bulwark {
namespace Engine {

using namespace Bulwark::Core;
using Detection::BlockKind;

StrategyOrchestrator::BlockResolution StrategyOrchestrator::handle_block(
    StrategyKind                      kind,
    const Detection::BlockStatus&     status,
    const ExtractionRequest&          request,
    const std::optional<std::string>& proxy_url) {
    stats_for(kind).blocks++;
    Logger::warn("Block detected (" + std::string(Detection::to_string(status.kind)) + "): " + status.message);

    if (status.should_rotate_proxy && proxy_url && deps_.proxy_pool) {
        Logger::info("Rotating proxy due to block");
        deps_.proxy_pool->record_block(*proxy_url);
    }

    if (status.kind == BlockKind::RateLimited)
        deps_.rate_limiter->record_rate_limit();
    else if (status.kind == BlockKind::IpBanned)
        deps_.rate_limiter->record_block();

    if (status.should_wait && status.wait_seconds > 0) {
        Logger::info("Waiting " + std::to_string(static_cast<int>(status.wait_seconds)) + "s due to block");
        deps_.clock->sleep_for(seconds(status.wait_seconds));
    }

    if (status.kind == BlockKind::Captcha)
        return resolve_captcha(status, request);
    return BlockResolution::Unresolved;
}

StrategyOrchestrator::PageCheck StrategyOrchestrator::check_page(StrategyKind kind, const ExtractionRequest& request) {
    std::string url  = deps_.driver->current_url();
    std::string body = deps_.driver->body_text();

    PageCheck check{detector_.classify_page(url, body)};
    if (!check.status.is_blocked())
        return check;

    // The same block page seen again in one run is one signal, not two.
    std::string snapshot = url + "\n" + body;
    if (handled_page_block_ && *handled_page_block_ == snapshot) {
        Logger::debug("Page block already handled in this run: " + check.status.message);
        return check;
    }

    check.resolution = handle_block(kind, check.status, request, std::nullopt);
    if (check.resolution == BlockResolution::Unresolved)
        handled_page_block_ = std::move(snapshot);
    return check;
}

bool StrategyOrchestrator::page_is_clear() {
    auto status = detector_.classify_page(deps_.driver->current_url(), deps_.driver->body_text());
    return !status.is_blocked();
}

StrategyOrchestrator::BlockResolution StrategyOrchestrator::resolve_captcha(const Detection::BlockStatus& status,
                                                                            const ExtractionRequest& request) {
    auto&       solver       = *deps_.captcha_solver;
    std::string solver_error = "no automation driver to apply a solution";

    if (solver.can_solve() && deps_.driver) {
        Captcha::CaptchaChallenge challenge;
        challenge.type     = request.captcha_type;
        challenge.site_url = deps_.driver->current_url();
        challenge.site_key = request.captcha_site_key;

        auto solution = solver.solve(challenge);
        if (solution.success) {
            if (deps_.driver->apply_captcha_solution(solution) && page_is_clear()) {
                Logger::success("CAPTCHA solved by " + solver.name());
                return BlockResolution::Resolved;
            }
            solver_error = "solution was not accepted by the page";
        }
        else {
            solver_error = solution.error.value_or("unknown error");
        }
        Logger::warn("CAPTCHA not solved by " + solver.name() + ": " + solver_error);
    }

    if (!config_.interactive) {
        if (!solver.can_solve())
            throw BlockedError(status);
        throw CaptchaUnsolvedError("CAPTCHA not solved by " + solver.name() + ": " + solver_error);
    }
    if (!deps_.driver)
        return BlockResolution::Unresolved;

    Logger::warn("CAPTCHA detected, waiting up to " + std::to_string(static_cast<int>(config_.captcha_wait))
                 + "s for manual resolution");
    const auto deadline = deps_.clock->now()
                          + std::chrono::duration_cast<Clock::time_point::duration>(seconds(config_.captcha_wait));
    while (deps_.clock->now() < deadline) {
        deps_.clock->sleep_for(seconds(Constants::CAPTCHA_RECHECK_SECONDS));
        if (page_is_clear()) {
            Logger::success("CAPTCHA resolved");
            return BlockResolution::Resolved;
        }
    }

    Logger::warn("CAPTCHA still present after " + std::to_string(static_cast<int>(config_.captcha_wait)) + "s");
    return BlockResolution::Unresolved;
}

}  // namespace Engine
}  // namespace Bulwark
