#pragma once
#include <string>
#include <utility>
#include <vector>

namespace Bulwark {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string user;
    std::string password;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string start_url;
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string path_and_query(const std::string& url);
    static std::string origin(const std::string& url);
    static std::string encode_component(const std::string& value);
    static std::string build_query(const QueryParams& params);
};

}  // namespace Utils
}  // namespace Bulwark
