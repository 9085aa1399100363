#include "curl_client.hpp"
#include <string_view>

#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Bulwark {
namespace Network {
namespace Http {

namespace {

constexpr std::string_view CONTENT_TYPE_HEADER = "content-type:";

struct CurlGlobal {
    CurlGlobal() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobal() {
        curl_global_cleanup();
    }
};

void ensure_curl_global() {
    static CurlGlobal global;
}

ErrorType map_curl_code_to_error_type(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_RECV_ERROR:
            return ErrorType::Proxy;
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorType::Timeout;
        default:
            return ErrorType::Network;
    }
}

}  // namespace

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->body)
        return 0;

    size_t total = size * nmemb;
    ctx->body->append(static_cast<const char*>(contents), total);
    return total;
}

size_t CurlClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->content_type)
        return size * nitems;

    std::string header(buffer, size * nitems);
    if (!Utils::Text::icontains(header, CONTENT_TYPE_HEADER))
        return size * nitems;

    auto colon = header.find(':');
    if (colon == std::string::npos)
        return size * nitems;

    *ctx->content_type = Utils::Text::trim(header.substr(colon + 1));
    return size * nitems;
}

Response CurlClient::create_error_response(const std::string& msg) const {
    Response r;
    r.success     = false;
    r.error       = msg;
    r.error_type  = ErrorType::Network;
    r.status_code = static_cast<long>(HTTPCode::NetworkError);
    return r;
}

CurlClient::HeaderList CurlClient::setup_curl_options(CURL*           curl,
                                                      const Request&  req,
                                                      RequestContext& ctx) const {
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, req.follow_location ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, req.timeout_seconds);

    if (!req.user_agent.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, req.user_agent.c_str());

    if (req.method == HttpMethod::POST) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.post_body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.post_body.size()));
    }
    else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    if (!proxy_.empty())
        curl_easy_setopt(curl, CURLOPT_PROXY, proxy_.c_str());

    curl_slist* raw = nullptr;
    for (const auto& h : req.extra_headers)
        raw = curl_slist_append(raw, h.c_str());
    HeaderList header_list(raw);
    if (raw)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, raw);
    // The list must outlive curl_easy_perform.
    return header_list;
}

Response CurlClient::handle_response(CURLcode           res,
                                     long               response_code,
                                     const std::string& effective_url,
                                     std::string&       body,
                                     std::string&       content_type) const {
    Response response;
    response.effective_url = effective_url;
    response.status_code   = response_code;
    response.content_type  = content_type;

    if (res != CURLE_OK) {
        response.success     = false;
        response.error       = curl_easy_strerror(res);
        response.error_type  = map_curl_code_to_error_type(res);
        response.status_code = static_cast<long>(HTTPCode::NetworkError);
        return response;
    }

    response.body    = std::move(body);
    response.success = (response.status_code >= 200
                        && response.status_code < static_cast<long>(MaxCode::ClientError));
    if (!response.success && response.error.empty()) {
        response.error      = "HTTP " + std::to_string(response.status_code);
        response.error_type = ErrorType::Other;
    }
    return response;
}

CurlClient::Request CurlClient::create_request(const std::string& url,
                                               HttpMethod         method,
                                               const Headers&     headers) const {
    Request req;
    req.method          = method;
    req.url             = url;
    req.timeout_seconds = timeout_seconds_;
    req.user_agent      = Core::Constants::USER_AGENT;
    for (const auto& [name, value] : headers) {
        if (Utils::Text::to_lower(name) == "user-agent") {
            req.user_agent = value;
            continue;
        }
        req.extra_headers.push_back(name + ": " + value);
    }
    return req;
}

CurlClient::CurlClient() : timeout_seconds_(Core::Constants::API_TIMEOUT_SECONDS) {
    ensure_curl_global();
    curl_.reset(curl_easy_init());
}

void CurlClient::set_proxy(const std::string& proxy) {
    std::lock_guard<std::mutex> lock(mutex_);
    proxy_ = proxy;
}

void CurlClient::set_timeout(std::chrono::seconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    timeout_seconds_ = static_cast<long>(timeout.count());
}

Response CurlClient::perform(const Request& req) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!curl_)
        return create_error_response("Failed to initialize CURL handle");

    std::string    body_buffer;
    std::string    content_type;
    RequestContext ctx{&body_buffer, &content_type};

    auto     header_list = setup_curl_options(curl_.get(), req, ctx);
    CURLcode res         = curl_easy_perform(curl_.get());

    long response_code = 0;
    curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &response_code);
    char* eff_url_ptr = nullptr;
    curl_easy_getinfo(curl_.get(), CURLINFO_EFFECTIVE_URL, &eff_url_ptr);
    std::string effective_url = eff_url_ptr ? std::string(eff_url_ptr) : req.url;

    return handle_response(res, response_code, effective_url, body_buffer, content_type);
}

Response CurlClient::get(const std::string& url, const Headers& headers) {
    Request req;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        req = create_request(url, HttpMethod::GET, headers);
    }
    return perform(req);
}

Response CurlClient::post_form(const std::string&        url,
                               const Utils::QueryParams& form,
                               const Headers&            headers) {
    Request req;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        req = create_request(url, HttpMethod::POST, headers);
    }
    req.post_body = Utils::Url::build_query(form);
    req.extra_headers.push_back("Content-Type: application/x-www-form-urlencoded");
    return perform(req);
}

}  // namespace Http
}  // namespace Network
}  // namespace Bulwark
