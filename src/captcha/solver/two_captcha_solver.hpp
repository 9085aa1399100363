#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "../../core/clock/clock.hpp"
#include "../../core/types/constants.hpp"
#include "../../network/http/http_client.hpp"
#include "captcha_solver.hpp"

namespace Bulwark {
namespace Captcha {

struct TwoCaptchaConfig {
    std::string api_key;
    std::string api_url       = Core::Constants::DEFAULT_CAPTCHA_API_URL;
    int         timeout       = Core::Constants::DEFAULT_CAPTCHA_TIMEOUT;  // seconds
    double      poll_interval = Core::Constants::DEFAULT_CAPTCHA_POLL_INTERVAL;
};

/**
 * Submit-then-poll client for 2Captcha-compatible providers.
 *
 * POST {api_url}/in.php submits the task and returns its id. GET {api_url}/res.php
 * is polled every poll_interval seconds until the answer arrives, the provider
 * reports an error other than CAPCHA_NOT_READY, or the timeout passes.
 *
 * Supports reCAPTCHA v2/v3, hCaptcha, Turnstile and image OCR.
 */
class TwoCaptchaSolver : public CaptchaSolver {
public:
    TwoCaptchaSolver(TwoCaptchaConfig                           config,
                     std::shared_ptr<Network::Http::HttpClient> http,
                     std::shared_ptr<Core::Clock>               clock = Core::default_clock());

    CaptchaSolution       solve(const CaptchaChallenge& challenge) override;
    std::optional<double> get_balance() override;
    std::string           name() const override {
        return "TwoCaptchaSolver";
    }

private:
    TwoCaptchaConfig                           config_;
    std::shared_ptr<Network::Http::HttpClient> http_;
    std::shared_ptr<Core::Clock>               clock_;

    std::optional<Utils::QueryParams> submit_params(const CaptchaChallenge& challenge) const;
    std::optional<std::string>        submit(const CaptchaChallenge& challenge, std::string& error);
    CaptchaSolution                   poll(const std::string& task_id, CaptchaType type);
    std::optional<nlohmann::json>     fetch_json(const Response& response, std::string& error) const;
};

}  // namespace Captcha
}  // namespace Bulwark
