#include "cookie_jar.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace Bulwark {
namespace Session {

CookieJar CookieJar::load_state_file(const std::string& path) {
    std::ifstream file(path);
    if (!file)
        throw std::runtime_error("Cannot open session state file: " + path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

CookieJar CookieJar::from_json(const std::string& json_text) {
    nlohmann::json state;
    try {
        state = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid session state JSON: " + std::string(e.what()));
    }

    std::vector<Cookie> cookies;
    const auto&         list = state.is_array() ? state : state.value("cookies", nlohmann::json::array());
    for (const auto& item : list) {
        if (!item.is_object() || !item.contains("name"))
            continue;
        Cookie c;
        c.name    = item.value("name", "");
        c.value   = item.value("value", "");
        c.domain  = item.value("domain", "");
        c.path    = item.value("path", "/");
        c.expires = item.contains("expires") && item["expires"].is_number()
                        ? item["expires"].get<double>()
                        : -1;
        cookies.push_back(std::move(c));
    }
    return CookieJar(std::move(cookies));
}

std::optional<Cookie> CookieJar::find(const std::string& name) const {
    for (const auto& c : cookies_) {
        if (c.name == name)
            return c;
    }
    return std::nullopt;
}

std::string CookieJar::header_value(const std::string& domain_filter) const {
    std::string out;
    for (const auto& c : cookies_) {
        if (c.name.empty())
            continue;
        if (!domain_filter.empty() && !c.domain.empty()
            && c.domain.find(domain_filter) == std::string::npos)
            continue;
        if (!out.empty())
            out += "; ";
        out += c.name + "=" + c.value;
    }
    return out;
}

}  // namespace Session
}  // namespace Bulwark
