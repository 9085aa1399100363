#pragma once
#include "http_client.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Bulwark {
namespace Network {
namespace Http {

class CurlClient : public HttpClient {
public:
    enum class HttpMethod { GET, POST };

    CurlClient();
    ~CurlClient() = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    void     set_proxy(const std::string& proxy) override;
    void     set_timeout(std::chrono::seconds timeout) override;
    Response get(const std::string& url, const Headers& headers) override;
    Response post_form(const std::string&        url,
                       const Utils::QueryParams& form,
                       const Headers&            headers) override;

private:
    struct Request {
        HttpMethod               method = HttpMethod::GET;
        std::string              url;
        std::string              post_body;
        long                     timeout_seconds = 30;
        bool                     follow_location = true;
        std::vector<std::string> extra_headers;
        std::string              user_agent;
    };

    struct RequestContext {
        std::string* body         = nullptr;
        std::string* content_type = nullptr;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    struct CurlSlistDeleter {
        void operator()(curl_slist* list) const noexcept {
            curl_slist_free_all(list);
        }
    };
    using HeaderList = std::unique_ptr<curl_slist, CurlSlistDeleter>;

    std::unique_ptr<CURL, CurlDeleter> curl_;
    std::string                        proxy_;
    long                               timeout_seconds_;
    std::mutex                         mutex_;

    Response perform(const Request& req);

    Response   create_error_response(const std::string& msg) const;
    HeaderList setup_curl_options(CURL* curl, const Request& req, RequestContext& ctx) const;
    Response   handle_response(CURLcode           res,
                               long               response_code,
                               const std::string& effective_url,
                               std::string&       body,
                               std::string&       content_type) const;
    Request    create_request(const std::string& url, HttpMethod method, const Headers& headers) const;

    // Callbacks must be static. userp is guaranteed to be RequestContext*.
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
};

}  // namespace Http
}  // namespace Network
}  // namespace Bulwark
