#include "url.hpp"
#include <algorithm>
#include <string_view>

namespace Bulwark {
namespace Utils {

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    parsed.start_url = url;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;
    // "host:port" without "//" is an authority, not a scheme
    if (has_scheme && sv.substr(colon + 1, 2) != "//")
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = std::string(sv.substr(0, colon));
        sv.remove_prefix(colon + 1);
    }

    bool has_authority = false;
    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        has_authority = true;
    }
    else if (!has_scheme && !sv.empty() && sv[0] != '/' && sv[0] != '?' && sv[0] != '#') {
        has_authority = true;
    }

    if (has_authority) {
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));

        if (end_auth != std::string_view::npos) {
            sv.remove_prefix(end_auth);
        }
        else {
            sv = "";
        }

        if (!authority.empty()) {
            size_t      at = authority.find_last_of('@');
            std::string host_port =
                (at != std::string::npos) ? authority.substr(at + 1) : authority;

            if (at != std::string::npos) {
                std::string userinfo = authority.substr(0, at);
                size_t      sep      = userinfo.find(':');
                parsed.user          = userinfo.substr(0, sep);
                if (sep != std::string::npos)
                    parsed.password = userinfo.substr(sep + 1);
            }

            if (!host_port.empty() && host_port[0] == '[') {
                size_t end_bracket = host_port.find(']');
                if (end_bracket != std::string::npos) {
                    parsed.host    = host_port.substr(0, end_bracket + 1);
                    size_t p_colon = host_port.find(':', end_bracket + 1);
                    if (p_colon != std::string::npos) {
                        parsed.port = host_port.substr(p_colon + 1);
                    }
                }
                else {
                    parsed.host = host_port;
                }
            }
            else {
                size_t p_colon = host_port.find_last_of(':');
                if (p_colon != std::string::npos) {
                    parsed.host = host_port.substr(0, p_colon);
                    parsed.port = host_port.substr(p_colon + 1);
                }
                else {
                    parsed.host = host_port;
                }
            }
        }
    }

    size_t q_pos = sv.find('?');
    size_t h_pos = sv.find('#');

    size_t path_end = sv.length();
    if (q_pos != std::string_view::npos)
        path_end = std::min(path_end, q_pos);
    if (h_pos != std::string_view::npos)
        path_end = std::min(path_end, h_pos);

    parsed.path = std::string(sv.substr(0, path_end));
    if (q_pos != std::string_view::npos && (h_pos == std::string_view::npos || q_pos < h_pos)) {
        size_t q_end = (h_pos == std::string_view::npos) ? sv.length() : h_pos;
        parsed.query = std::string(sv.substr(q_pos + 1, q_end - q_pos - 1));
    }

    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::path_and_query(const std::string& url) {
    UrlParsed p = parse(url);
    return p.query.empty() ? p.path : p.path + "?" + p.query;
}

std::string Url::origin(const std::string& url) {
    UrlParsed p = parse(url);
    if (p.host.empty())
        return "";
    std::string out = (p.scheme.empty() ? "https" : p.scheme) + "://" + p.host;
    if (!p.port.empty())
        out += ":" + p.port;
    return out;
}

std::string Url::encode_component(const std::string& value) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string           out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
                          || c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out += static_cast<char>(c);
        }
        else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string Url::build_query(const QueryParams& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty())
            out += '&';
        out += encode_component(key) + "=" + encode_component(value);
    }
    return out;
}

}  // namespace Utils
}  // namespace Bulwark
