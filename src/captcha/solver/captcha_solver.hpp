#pragma once
#include <optional>
#include <string>

#include "../../core/logger/logger.hpp"
#include "captcha_types.hpp"

namespace Bulwark {
namespace Captcha {

class CaptchaSolver {
public:
    virtual ~CaptchaSolver() = default;

    // Never throws for provider-side failures; they come back in CaptchaSolution::error.
    virtual CaptchaSolution       solve(const CaptchaChallenge& challenge) = 0;
    virtual std::optional<double> get_balance()                            = 0;
    virtual std::string           name() const                             = 0;

    // False for the no-op solver, so callers can tell "nobody will solve this" apart.
    virtual bool can_solve() const {
        return true;
    }
};

class NullCaptchaSolver : public CaptchaSolver {
public:
    CaptchaSolution solve(const CaptchaChallenge& challenge) override {
        Core::Logger::warn(std::string("No CAPTCHA solver configured, cannot solve ")
                           + to_string(challenge.type) + " at " + challenge.site_url);
        return CaptchaSolution::failure("No CAPTCHA solver configured");
    }

    std::optional<double> get_balance() override {
        return std::nullopt;
    }

    std::string name() const override {
        return "NullCaptchaSolver";
    }

    bool can_solve() const override {
        return false;
    }
};

}  // namespace Captcha
}  // namespace Bulwark
