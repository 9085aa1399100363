#include "../../../core/errors/errors.hpp"
#include "../../../core/logger/logger.hpp"
#include "../orchestrator.hpp"

namespace Bulwark {
namespace Engine {

using namespace Bulwark::Core;

namespace {

// Stops an active capture if the strategy leaves early.
class CaptureGuard {
public:
    CaptureGuard(Browser::AutomationDriver& driver, const std::string& pattern) : driver_(driver) {
        driver_.start_capture(pattern);
    }

    ~CaptureGuard() {
        if (!active_)
            return;
        try {
            driver_.stop_capture();
        } catch (const std::exception& e) {
            Logger::warn("Failed to stop response capture: " + std::string(e.what()));
        }
    }

    std::vector<Browser::CapturedResponse> stop() {
        active_ = false;
        return driver_.stop_capture();
    }

private:
    Browser::AutomationDriver& driver_;
    bool                       active_ = true;
};

std::string token_preview(const std::string& token) {
    return token.substr(0, static_cast<size_t>(Constants::TOKEN_LOG_PREFIX)) + "...";
}

std::string blocked_reason(const Detection::BlockStatus& status) {
    return std::string("blocked (") + Detection::to_string(status.kind) + "): " + status.message;
}

}  // namespace

StrategyOutcome StrategyOrchestrator::call_signed_api(StrategyKind              kind,
                                                      const ExtractionRequest&  request,
                                                      const Session::CookieJar& cookies,
                                                      const std::string&        extra_token) {
    auto token = session_monitor_.get_token(cookies);
    if (!token)
        return StrategyOutcome::skipped("session token cookie '" + config_.token_cookie + "' not available");

    Logger::debug(std::string(to_string(kind)) + ": signing " + request.api_path + " with token "
                  + token_preview(*token));

    std::optional<std::string> proxy;
    try {
        proxy = select_proxy();
    } catch (const ProxyExhaustedError& e) {
        return StrategyOutcome::failed(e.what());
    }
    auto result = deps_.api_caller->call(request.api_path, *token, cookies, extra_token, proxy);

    if (result.block.is_blocked()) {
        handle_block(kind, result.block, request, proxy);
        return StrategyOutcome::failed(blocked_reason(result.block));
    }

    if (!result.response.success) {
        if (proxy && deps_.proxy_pool && result.response.status_code == 0)
            deps_.proxy_pool->record_failure(*proxy);
        return StrategyOutcome::failed(result.response.error.empty()
                                           ? "HTTP " + std::to_string(result.response.status_code)
                                           : result.response.error);
    }

    if (proxy && deps_.proxy_pool)
        deps_.proxy_pool->record_success(*proxy);

    if (!result.json)
        return StrategyOutcome::failed("API response is not JSON");

    auto payload = request.parse_api(*result.json);
    if (!payload)
        return StrategyOutcome::failed("API response contained no usable content");

    Logger::info(std::string(to_string(kind)) + " returned content for " + request.api_path);
    return StrategyOutcome::succeeded(std::move(*payload));
}

StrategyOutcome StrategyOrchestrator::try_pure_api(const ExtractionRequest& request) {
    if (!deps_.api_caller)
        return StrategyOutcome::skipped("no signed API caller configured");
    if (request.api_path.empty() || !request.parse_api)
        return StrategyOutcome::skipped("request has no API path");
    if (!session_monitor_.check(stored_cookies_))
        return StrategyOutcome::skipped("session token cookie '" + config_.token_cookie + "' not available");

    return call_signed_api(StrategyKind::PureApi, request, stored_cookies_, "");
}

StrategyOutcome StrategyOrchestrator::try_api_direct(const ExtractionRequest& request) {
    if (!deps_.driver)
        return StrategyOutcome::skipped("no automation driver");
    if (!deps_.api_caller)
        return StrategyOutcome::skipped("no signed API caller configured");
    if (request.api_path.empty() || !request.parse_api)
        return StrategyOutcome::skipped("request has no API path");

    auto cookies = deps_.driver->cookies();
    if (!session_monitor_.check(cookies))
        return StrategyOutcome::skipped("session token cookie '" + config_.token_cookie + "' not available");

    std::string extra_token;
    if (!config_.extra_token_script.empty()) {
        extra_token = deps_.driver->evaluate(config_.extra_token_script);
        if (extra_token == "null" || extra_token == "undefined")
            extra_token.clear();
    }

    return call_signed_api(StrategyKind::ApiDirect, request, cookies, extra_token);
}

StrategyOutcome StrategyOrchestrator::try_api_intercept(const ExtractionRequest& request) {
    if (!deps_.driver)
        return StrategyOutcome::skipped("no automation driver");
    if (request.page_url.empty() || request.intercept_pattern.empty() || !request.parse_api)
        return StrategyOutcome::skipped("request has no interception pattern");

    auto&        driver = *deps_.driver;
    CaptureGuard capture(driver, request.intercept_pattern);

    if (!driver.navigate(request.page_url))
        return StrategyOutcome::failed("navigation to " + request.page_url + " failed");

    auto page = check_page(StrategyKind::ApiIntercept, request);
    if (page.status.is_blocked()) {
        bool fatal = page.status.kind == Detection::BlockKind::SessionExpired
                     || (page.status.kind == Detection::BlockKind::Captcha
                         && page.resolution == BlockResolution::Unresolved);
        if (fatal)
            return StrategyOutcome::failed(blocked_reason(page.status));
    }

    auto captures = capture.stop();
    for (const auto& captured : captures) {
        if (captured.body.empty())
            continue;

        nlohmann::json body;
        try {
            body = nlohmann::json::parse(captured.body);
        } catch (const nlohmann::json::parse_error&) {
            Logger::debug("Captured response is not JSON: " + captured.url);
            continue;
        }

        auto api_status = detector_.classify_api(captured.status, body);
        if (api_status.is_blocked()) {
            Logger::debug("Captured response was blocked (" + std::string(Detection::to_string(api_status.kind))
                          + "): " + captured.url);
            continue;
        }

        if (auto payload = request.parse_api(body)) {
            Logger::info("api_intercept returned content from " + captured.url);
            return StrategyOutcome::succeeded(std::move(*payload));
        }
    }

    return StrategyOutcome::failed(captures.empty() ? "no API response matched the interception pattern"
                                                    : "captured API responses contained no usable content");
}

StrategyOutcome StrategyOrchestrator::try_dom(const ExtractionRequest& request) {
    if (!deps_.driver)
        return StrategyOutcome::skipped("no automation driver");
    if (request.page_url.empty() || !request.parse_dom)
        return StrategyOutcome::skipped("request has no DOM parser");

    auto& driver = *deps_.driver;
    // Reload after an earlier block wait so the page is not judged on a stale body.
    bool reload = driver.current_url() != request.page_url || handled_page_block_.has_value();
    if (reload && !driver.navigate(request.page_url))
        return StrategyOutcome::failed("navigation to " + request.page_url + " failed");

    auto page = check_page(StrategyKind::Dom, request);
    if (page.status.is_blocked()) {
        if (page.status.kind != Detection::BlockKind::Captcha || page.resolution != BlockResolution::Resolved)
            return StrategyOutcome::failed(blocked_reason(page.status));
    }

    auto payload = request.parse_dom(driver);
    if (!payload)
        return StrategyOutcome::failed("DOM parser found no content");
    return StrategyOutcome::succeeded(std::move(*payload));
}

}  // namespace Engine
}  // namespace Bulwark
