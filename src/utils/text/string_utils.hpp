#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace Bulwark {
namespace Utils {
namespace Text {

std::string              trim(const std::string& str);
std::string              to_lower(const std::string& str);
bool                     starts_with(const std::string& str, const std::string& prefix);
bool                     icontains(std::string_view haystack, std::string_view needle);
std::vector<std::string> split_lines(const std::string& text);
std::string              strip_quotes(const std::string& str);

}  // namespace Text
}  // namespace Utils
}  // namespace Bulwark
