#include "two_captcha_solver.hpp"
#include <stdexcept>

#include "../../core/logger/logger.hpp"

namespace Bulwark {
namespace Captcha {

using namespace Bulwark::Core;

namespace {

std::string request_field(const nlohmann::json& data) {
    if (!data.contains("request"))
        return "unknown";
    const auto& value = data["request"];
    return value.is_string() ? value.get<std::string>() : value.dump();
}

bool status_ok(const nlohmann::json& data) {
    if (!data.contains("status"))
        return false;
    const auto& status = data["status"];
    return status.is_number_integer() && status.get<int>() == 1;
}

}  // namespace

TwoCaptchaSolver::TwoCaptchaSolver(TwoCaptchaConfig                           config,
                                   std::shared_ptr<Network::Http::HttpClient> http,
                                   std::shared_ptr<Core::Clock>               clock)
    : config_(std::move(config)), http_(std::move(http)), clock_(clock ? std::move(clock) : default_clock()) {
    if (!http_)
        throw std::invalid_argument("TwoCaptchaSolver requires an HTTP client");
    while (!config_.api_url.empty() && config_.api_url.back() == '/')
        config_.api_url.pop_back();
}

std::optional<nlohmann::json> TwoCaptchaSolver::fetch_json(const Response& response,
                                                           std::string&    error) const {
    if (!response.success) {
        error = response.error.empty() ? "HTTP " + std::to_string(response.status_code) : response.error;
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        error = std::string("Invalid provider response: ") + e.what();
        return std::nullopt;
    }
}

std::optional<Utils::QueryParams> TwoCaptchaSolver::submit_params(const CaptchaChallenge& challenge) const {
    Utils::QueryParams params{{"key", config_.api_key}, {"json", "1"}};
    const std::string  site_key = challenge.site_key.value_or("");

    switch (challenge.type) {
        case CaptchaType::RecaptchaV2:
        case CaptchaType::RecaptchaV3:
            params.emplace_back("method", "userrecaptcha");
            params.emplace_back("googlekey", site_key);
            params.emplace_back("pageurl", challenge.site_url);
            if (challenge.type == CaptchaType::RecaptchaV3) {
                auto action = challenge.extra.find("action");
                params.emplace_back("version", "v3");
                params.emplace_back("action", action != challenge.extra.end() ? action->second : "verify");
            }
            return params;
        case CaptchaType::HCaptcha:
            params.emplace_back("method", "hcaptcha");
            params.emplace_back("sitekey", site_key);
            params.emplace_back("pageurl", challenge.site_url);
            return params;
        case CaptchaType::Turnstile:
            params.emplace_back("method", "turnstile");
            params.emplace_back("sitekey", site_key);
            params.emplace_back("pageurl", challenge.site_url);
            return params;
        case CaptchaType::ImageText:
            params.emplace_back("method", "base64");
            params.emplace_back("body", challenge.image_base64.value_or(""));
            return params;
        default:
            return std::nullopt;
    }
}

std::optional<std::string> TwoCaptchaSolver::submit(const CaptchaChallenge& challenge, std::string& error) {
    auto params = submit_params(challenge);
    if (!params) {
        error = std::string("Unsupported CAPTCHA type: ") + to_string(challenge.type);
        return std::nullopt;
    }

    auto data = fetch_json(http_->post_form(config_.api_url + "/in.php", *params, {}), error);
    if (!data)
        return std::nullopt;

    if (status_ok(*data))
        return request_field(*data);

    error = request_field(*data);
    Logger::warn("2Captcha submit failed: " + data->dump());
    return std::nullopt;
}

CaptchaSolution TwoCaptchaSolver::poll(const std::string& task_id, CaptchaType type) {
    const auto deadline =
        clock_->now() + std::chrono::duration_cast<Clock::time_point::duration>(seconds(config_.timeout));
    const std::string url = config_.api_url + "/res.php?"
                            + Utils::Url::build_query({{"key", config_.api_key},
                                                       {"action", "get"},
                                                       {"id", task_id},
                                                       {"json", "1"}});

    while (clock_->now() < deadline) {
        clock_->sleep_for(seconds(config_.poll_interval));

        std::string error;
        auto        data = fetch_json(http_->get(url, {}), error);
        if (!data)
            return CaptchaSolution::failure(error);

        if (status_ok(*data)) {
            CaptchaSolution solution;
            solution.success = true;
            if (type == CaptchaType::ImageText)
                solution.text = request_field(*data);
            else
                solution.token = request_field(*data);
            return solution;
        }

        std::string answer = request_field(*data);
        if (answer != Constants::CAPTCHA_NOT_READY)
            return CaptchaSolution::failure(answer);
    }

    return CaptchaSolution::failure("Timeout waiting for solution");
}

CaptchaSolution TwoCaptchaSolver::solve(const CaptchaChallenge& challenge) {
    std::string error;
    auto        task_id = submit(challenge, error);
    if (!task_id) {
        Logger::error("TwoCaptcha solve error: " + error);
        return CaptchaSolution::failure(error.empty() ? "Failed to submit task" : error);
    }

    Logger::info("CAPTCHA task submitted: " + *task_id);
    auto solution = poll(*task_id, challenge.type);
    if (!solution.success)
        Logger::warn("CAPTCHA task " + *task_id + " failed: " + solution.error.value_or("unknown"));
    return solution;
}

std::optional<double> TwoCaptchaSolver::get_balance() {
    const std::string url =
        config_.api_url + "/res.php?"
        + Utils::Url::build_query({{"key", config_.api_key}, {"action", "getbalance"}, {"json", "1"}});

    std::string error;
    auto        data = fetch_json(http_->get(url, {}), error);
    if (!data) {
        Logger::warn("Failed to get 2Captcha balance: " + error);
        return std::nullopt;
    }
    if (!status_ok(*data))
        return std::nullopt;

    const auto& value = (*data)["request"];
    if (value.is_number())
        return value.get<double>();
    try {
        return std::stod(request_field(*data));
    } catch (const std::exception& e) {
        Logger::warn("Failed to get 2Captcha balance: " + std::string(e.what()));
        return std::nullopt;
    }
}

}  // namespace Captcha
}  // namespace Bulwark
