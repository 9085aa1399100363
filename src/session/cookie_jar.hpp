#pragma once
#include <optional>
#include <string>
#include <vector>

namespace Bulwark {
namespace Session {

struct Cookie {
    std::string name;
    std::string value;
    std::string domain;
    std::string path = "/";
    double      expires = -1;  // seconds since epoch; <= 0 means session cookie
};

// Read-only view over the cookies exposed by a driver or a saved browser state file.
class CookieJar {
public:
    CookieJar() = default;
    explicit CookieJar(std::vector<Cookie> cookies) : cookies_(std::move(cookies)) {
    }

    // Loads {"cookies":[{name,value,domain,path,expires}, ...]} (browser storage-state format).
    static CookieJar load_state_file(const std::string& path);
    static CookieJar from_json(const std::string& json_text);

    std::optional<Cookie> find(const std::string& name) const;
    std::string           header_value(const std::string& domain_filter = "") const;

    const std::vector<Cookie>& cookies() const {
        return cookies_;
    }
    bool empty() const {
        return cookies_.empty();
    }

private:
    std::vector<Cookie> cookies_;
};

}  // namespace Session
}  // namespace Bulwark
