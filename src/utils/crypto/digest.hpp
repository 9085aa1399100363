#pragma once
#include <string>

namespace Bulwark {
namespace Utils {
namespace Crypto {

// Lowercase hex MD5 of the input bytes (32 characters).
std::string md5_hex(const std::string& input);

}  // namespace Crypto
}  // namespace Utils
}  // namespace Bulwark
