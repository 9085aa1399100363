#include "proxy_list_parser.hpp"
#include <algorithm>
#include <cctype>

#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Bulwark {
namespace Proxy {
namespace Pool {

using Utils::Text::starts_with;
using Utils::Text::trim;

namespace {

std::string scalar_to_string(const nlohmann::json& value) {
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_null())
        return "";
    return value.dump();
}

std::string first_of(const nlohmann::json& obj, const char* key, const char* alt, const std::string& fallback) {
    if (obj.contains(key) && !obj[key].is_null())
        return scalar_to_string(obj[key]);
    if (obj.contains(alt) && !obj[alt].is_null())
        return scalar_to_string(obj[alt]);
    return fallback;
}

bool is_empty_entry(const nlohmann::json& entry) {
    if (entry.is_null())
        return true;
    if (entry.is_string())
        return trim(entry.get<std::string>()).empty();
    if (entry.is_object() || entry.is_array())
        return entry.empty();
    return false;
}

void keep_if_valid(std::string proxy, std::vector<std::string>& out) {
    if (!is_valid_proxy(proxy)) {
        Core::Logger::debug("Ignoring malformed proxy entry: " + proxy);
        return;
    }
    out.push_back(std::move(proxy));
}

void collect(const nlohmann::json& list, std::vector<std::string>& out) {
    for (const auto& entry : list) {
        if (is_empty_entry(entry))
            continue;
        keep_if_valid(normalize_proxy(entry), out);
    }
}

// Providers wrap the list under "data", "proxies", "result" or "list", sometimes nested.
const nlohmann::json* find_list(const nlohmann::json& node, int depth = 0) {
    if (node.is_array())
        return &node;
    if (!node.is_object() || depth > 2)
        return nullptr;
    for (const char* key : {"data", "proxies", "result", "list"}) {
        auto it = node.find(key);
        if (it == node.end())
            continue;
        if (auto list = find_list(*it, depth + 1))
            return list;
    }
    return nullptr;
}

}  // namespace

std::string normalize_proxy(const std::string& entry) {
    std::string s = trim(entry);
    if (!starts_with(s, "http://") && !starts_with(s, "https://") && !starts_with(s, "socks"))
        s = "http://" + s;
    return s;
}

std::string normalize_proxy(const nlohmann::json& entry) {
    if (!entry.is_object())
        return normalize_proxy(scalar_to_string(entry));

    std::string host   = first_of(entry, "ip", "host", "");
    std::string port   = first_of(entry, "port", "port", "");
    std::string user   = first_of(entry, "user", "username", "");
    std::string pass   = first_of(entry, "pass", "password", "");
    std::string scheme = first_of(entry, "scheme", "protocol", "http");

    if (!user.empty() && !pass.empty())
        return scheme + "://" + user + ":" + pass + "@" + host + ":" + port;
    return scheme + "://" + host + ":" + port;
}

bool is_valid_proxy(const std::string& url) {
    auto parsed = Utils::Url::parse(url);
    if (parsed.scheme.empty() || parsed.host.empty() || parsed.port.empty())
        return false;
    if (parsed.host.find_first_of("{}\" \t") != std::string::npos)
        return false;
    return parsed.port.size() <= 5
           && std::all_of(parsed.port.begin(), parsed.port.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::vector<std::string> parse_proxy_list(const std::string& text) {
    std::vector<std::string> results;
    const std::string        body = trim(text);

    if (starts_with(body, "{") || starts_with(body, "[")) {
        nlohmann::json data;
        try {
            data = nlohmann::json::parse(body);
        } catch (const nlohmann::json::parse_error& e) {
            Core::Logger::warn("Proxy provider returned malformed JSON: " + std::string(e.what()));
            return results;
        }
        if (auto list = find_list(data))
            collect(*list, results);
        else
            Core::Logger::warn("Proxy provider response has no proxy list: " + body.substr(0, 120));
        return results;
    }

    for (const auto& raw : Utils::Text::split_lines(body)) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#')
            continue;
        keep_if_valid(normalize_proxy(line), results);
    }
    return results;
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Bulwark
