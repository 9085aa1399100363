#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Bulwark {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

bool icontains(std::string_view haystack, std::string_view needle) {
    auto it = std::search(
        haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char c1, char c2) {
            return std::tolower(static_cast<unsigned char>(c1))
                   == std::tolower(static_cast<unsigned char>(c2));
        });
    return it != haystack.end();
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::stringstream        ss(text);
    std::string              line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::string strip_quotes(const std::string& str) {
    size_t first = str.find_first_not_of('"');
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of('"');
    return str.substr(first, last - first + 1);
}

}  // namespace Text
}  // namespace Utils
}  // namespace Bulwark
