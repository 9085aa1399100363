#include "solver_factory.hpp"
#include "../../core/errors/errors.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Bulwark {
namespace Captcha {

SolverKind parse_solver_kind(const std::string& name) {
    std::string lowered = Utils::Text::to_lower(Utils::Text::trim(name));
    if (lowered.empty() || lowered == "none" || lowered == "null")
        return SolverKind::None;
    if (lowered == "2captcha" || lowered == "twocaptcha" || lowered == "rucaptcha")
        return SolverKind::TwoCaptcha;
    throw Core::ConfigError("Unknown CAPTCHA provider: " + name);
}

const char* to_string(SolverKind kind) {
    switch (kind) {
        case SolverKind::TwoCaptcha:
            return "2captcha";
        case SolverKind::None:
            return "none";
    }
    return "none";
}

std::shared_ptr<CaptchaSolver> make_captcha_solver(const SolverConfig&                        config,
                                                   std::shared_ptr<Network::Http::HttpClient> http,
                                                   std::shared_ptr<Core::Clock>               clock) {
    switch (config.kind) {
        case SolverKind::TwoCaptcha:
            if (config.provider.api_key.empty())
                throw Core::ConfigError("captcha_api_key is required for the 2captcha provider");
            return std::make_shared<TwoCaptchaSolver>(config.provider, std::move(http), std::move(clock));
        case SolverKind::None:
            break;
    }
    return std::make_shared<NullCaptchaSolver>();
}

}  // namespace Captcha
}  // namespace Bulwark
