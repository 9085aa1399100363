#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "../../utils/url/url.hpp"

namespace Bulwark {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Proxy, Timeout, Other };

enum class HTTPCode { Ok = 200, NetworkError = 0 };

enum class MaxCode { ClientError = 400 };

}  // namespace Http
}  // namespace Network
}  // namespace Bulwark

namespace Bulwark {

struct Response {
    std::string              effective_url;
    long                     status_code = 0;
    std::string              content_type;
    std::string              body;
    std::string              error;
    bool                     success    = false;
    Network::Http::ErrorType error_type = Network::Http::ErrorType::None;
};

namespace Network {
namespace Http {

using Headers = std::vector<std::pair<std::string, std::string>>;

// Blocking HTTP transport. One attempt per call; no retries.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void set_proxy(const std::string& proxy) = 0;
    virtual void set_timeout(std::chrono::seconds /*timeout*/){};

    virtual Response get(const std::string& url, const Headers& headers) = 0;
    virtual Response post_form(const std::string&        url,
                               const Utils::QueryParams& form,
                               const Headers&            headers) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Bulwark
