#pragma once
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "../../browser/driver/automation_driver.hpp"
#include "../../captcha/solver/captcha_types.hpp"
#include "../../core/errors/errors.hpp"

namespace Bulwark {
namespace Engine {

// Also the data_source tag of a result.
enum class StrategyKind { PureApi, ApiDirect, ApiIntercept, Dom };

const char*                      to_string(StrategyKind kind);
StrategyKind                     parse_strategy_kind(const std::string& name);
const std::vector<StrategyKind>& default_strategy_order();

enum class OutcomeKind { Succeeded, Skipped, Failed };

struct StrategyOutcome {
    OutcomeKind    kind = OutcomeKind::Failed;
    nlohmann::json payload;
    std::string    reason;

    static StrategyOutcome succeeded(nlohmann::json payload) {
        return {OutcomeKind::Succeeded, std::move(payload), {}};
    }
    static StrategyOutcome skipped(std::string reason) {
        return {OutcomeKind::Skipped, nullptr, std::move(reason)};
    }
    static StrategyOutcome failed(std::string reason) {
        return {OutcomeKind::Failed, nullptr, std::move(reason)};
    }
};

using ApiParser = std::function<std::optional<nlohmann::json>(const nlohmann::json&)>;
using DomParser = std::function<std::optional<nlohmann::json>(Browser::AutomationDriver&)>;

// One logical extraction. Strategies without the inputs they need are skipped.
struct ExtractionRequest {
    std::string api_path;           // path + query for pure_api / api_direct
    std::string page_url;           // page to render for api_intercept / dom
    std::string intercept_pattern;  // regex over captured response URLs
    ApiParser   parse_api;          // nullopt: response carried no usable content
    DomParser   parse_dom;

    Captcha::CaptchaType       captcha_type = Captcha::CaptchaType::Custom;
    std::optional<std::string> captcha_site_key;
};

struct StrategyResult {
    nlohmann::json                     payload;
    StrategyKind                       data_source = StrategyKind::Dom;
    std::vector<Core::StrategyAttempt> attempts;  // skipped/failed strategies before the winner
};

}  // namespace Engine
}  // namespace Bulwark
