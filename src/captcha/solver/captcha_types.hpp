#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Bulwark {
namespace Captcha {

enum class CaptchaType {
    RecaptchaV2,
    RecaptchaV3,
    HCaptcha,
    ImageText,
    Slider,
    ClickSelect,
    Turnstile,
    Custom
};

inline const char* to_string(CaptchaType type) {
    switch (type) {
        case CaptchaType::RecaptchaV2:
            return "recaptcha_v2";
        case CaptchaType::RecaptchaV3:
            return "recaptcha_v3";
        case CaptchaType::HCaptcha:
            return "hcaptcha";
        case CaptchaType::ImageText:
            return "image_text";
        case CaptchaType::Slider:
            return "slider";
        case CaptchaType::ClickSelect:
            return "click_select";
        case CaptchaType::Turnstile:
            return "turnstile";
        case CaptchaType::Custom:
            return "custom";
    }
    return "custom";
}

struct CaptchaChallenge {
    CaptchaType                        type = CaptchaType::Custom;
    std::string                        site_url;
    std::optional<std::string>         site_key;
    std::optional<std::string>         image_base64;  // OCR payload
    std::map<std::string, std::string> extra;         // e.g. "action" for reCAPTCHA v3
};

struct CaptchaSolution {
    bool                                     success = false;
    std::optional<std::string>               token;  // token-based challenges
    std::optional<std::string>               text;   // OCR
    std::vector<std::pair<double, double>>   coordinates;
    std::optional<std::string>               error;

    static CaptchaSolution failure(std::string message) {
        CaptchaSolution s;
        s.error = std::move(message);
        return s;
    }
};

}  // namespace Captcha
}  // namespace Bulwark
