#include "signed_api_caller.hpp"
#include <stdexcept>

#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Bulwark {
namespace Engine {

using namespace Bulwark::Core;

SignedApiCaller::SignedApiCaller(std::shared_ptr<Network::Http::HttpClient> http,
                                 ApiCallerConfig                            config,
                                 Signature::SignatureEngine::ByteSource     random_byte)
    : http_(std::move(http)), config_(std::move(config)), engine_(config_.version, std::move(random_byte)) {
    if (!http_)
        throw std::invalid_argument("SignedApiCaller requires an HTTP client");
    while (!config_.base_url.empty() && config_.base_url.back() == '/')
        config_.base_url.pop_back();
}

Network::Http::Headers SignedApiCaller::build_headers(const std::string&        api_path,
                                                      const std::string&        session_token,
                                                      const Session::CookieJar& cookies,
                                                      const std::string&        extra_token) const {
    Signature::SignatureContext ctx;
    ctx.version_tag   = config_.version_tag;
    ctx.api_path      = api_path;
    ctx.session_token = session_token;
    ctx.extra_token   = extra_token;

    const std::string origin = Utils::Url::origin(config_.base_url);

    Network::Http::Headers headers = {
        {"Accept", "application/json, text/plain, */*"},
        {"Referer", origin + "/"},
        {"Origin", origin},
        {"x-requested-with", "fetch"},
    };
    for (auto& header : engine_.headers(ctx))
        headers.push_back(std::move(header));

    std::string cookie_header = cookies.header_value();
    if (!cookie_header.empty())
        headers.emplace_back("Cookie", cookie_header);
    return headers;
}

ApiCallResult SignedApiCaller::call(const std::string&                api_path,
                                    const std::string&                session_token,
                                    const Session::CookieJar&         cookies,
                                    const std::string&                extra_token,
                                    const std::optional<std::string>& proxy_url) {
    if (session_token.empty())
        throw SignatureUnavailableError(config_.token_cookie);

    ApiCallResult result;
    http_->set_proxy(proxy_url.value_or(""));
    result.response = http_->get(config_.base_url + api_path,
                                 build_headers(api_path, session_token, cookies, extra_token));

    if (!result.response.body.empty()) {
        try {
            result.json = nlohmann::json::parse(result.response.body);
        } catch (const nlohmann::json::parse_error& e) {
            Logger::debug("API response for " + api_path + " is not JSON: " + e.what());
        }
    }

    if (result.response.status_code > 0) {
        result.block = detector_.classify_api(result.response.status_code,
                                             result.json ? *result.json : nlohmann::json());
    }
    if (result.block.is_blocked()) {
        Logger::warn("API blocked: " + result.block.message + " (status="
                     + std::to_string(result.response.status_code) + ")");
    }
    else if (!result.response.success) {
        Logger::debug("API returned " + std::to_string(result.response.status_code) + " for " + api_path);
    }
    return result;
}

}  // namespace Engine
}  // namespace Bulwark
