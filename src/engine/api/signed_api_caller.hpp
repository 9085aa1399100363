#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "../../detection/block/block_detector.hpp"
#include "../../network/http/http_client.hpp"
#include "../../session/cookie_jar.hpp"
#include "../../signature/engine/signature_engine.hpp"

namespace Bulwark {
namespace Engine {

struct ApiCallResult {
    Response                      response;
    std::optional<nlohmann::json> json;  // set when the body parsed as JSON
    Detection::BlockStatus        block;
};

struct ApiCallerConfig {
    std::string                 base_url    = Core::Constants::DEFAULT_API_BASE_URL;
    std::string                 version_tag = Core::Constants::DEFAULT_VERSION_TAG;
    std::string                 token_cookie = Core::Constants::DEFAULT_TOKEN_COOKIE;
    Signature::AlgorithmVersion version     = Signature::AlgorithmVersion::New;
};

// Issues one signed GET against the protected API and classifies the answer.
class SignedApiCaller {
public:
    explicit SignedApiCaller(std::shared_ptr<Network::Http::HttpClient> http,
                             ApiCallerConfig                            config      = {},
                             Signature::SignatureEngine::ByteSource     random_byte = {});

    // Throws SignatureUnavailableError when session_token is empty.
    ApiCallResult call(const std::string&                api_path,
                       const std::string&                session_token,
                       const Session::CookieJar&         cookies,
                       const std::string&                extra_token = "",
                       const std::optional<std::string>& proxy_url   = std::nullopt);

    Network::Http::Headers build_headers(const std::string&        api_path,
                                         const std::string&        session_token,
                                         const Session::CookieJar& cookies,
                                         const std::string&        extra_token = "") const;

    const ApiCallerConfig& config() const {
        return config_;
    }

private:
    std::shared_ptr<Network::Http::HttpClient> http_;
    ApiCallerConfig                            config_;
    Signature::SignatureEngine                 engine_;
    Detection::BlockDetector                   detector_;
};

}  // namespace Engine
}  // namespace Bulwark
