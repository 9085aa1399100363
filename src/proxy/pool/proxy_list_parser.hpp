#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Bulwark {
namespace Proxy {
namespace Pool {

// Parses a provider response: a JSON array, an object wrapping the list under
// "data", "proxies", "result" or "list", or plain text with one proxy per line
// ('#' comments). A JSON body is never re-read as text. Entries that do not
// normalize to scheme://[user:pass@]host:port are dropped.
std::vector<std::string> parse_proxy_list(const std::string& text);

// True for scheme://[user:pass@]host:port with a numeric port.
bool is_valid_proxy(const std::string& url);

// "host:port" -> "http://host:port"; URLs with an http(s) or socks scheme pass through.
std::string normalize_proxy(const std::string& entry);

// Provider objects: {ip|host, port, user|username, pass|password, scheme|protocol}.
std::string normalize_proxy(const nlohmann::json& entry);

}  // namespace Pool
}  // namespace Proxy
}  // namespace Bulwark
