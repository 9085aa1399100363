#pragma once
#include <memory>
#include <string>

#include "../../core/clock/clock.hpp"
#include "../../network/http/http_client.hpp"
#include "captcha_solver.hpp"
#include "two_captcha_solver.hpp"

namespace Bulwark {
namespace Captcha {

enum class SolverKind { None, TwoCaptcha };

SolverKind  parse_solver_kind(const std::string& name);
const char* to_string(SolverKind kind);

struct SolverConfig {
    SolverKind       kind = SolverKind::None;
    TwoCaptchaConfig provider;
};

// Picks the solver variant once, at construction time.
std::shared_ptr<CaptchaSolver> make_captcha_solver(const SolverConfig&                        config,
                                                   std::shared_ptr<Network::Http::HttpClient> http,
                                                   std::shared_ptr<Core::Clock> clock = Core::default_clock());

}  // namespace Captcha
}  // namespace Bulwark
