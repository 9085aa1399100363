#pragma once
#include <chrono>
#include <optional>
#include <string>

#include "../../core/types/constants.hpp"
#include "../../session/cookie_jar.hpp"

namespace Bulwark {
namespace Detection {

// Checks the named session-token cookie for presence and expiry.
class SessionHealthMonitor {
public:
    explicit SessionHealthMonitor(std::string token_cookie = Core::Constants::DEFAULT_TOKEN_COOKIE);

    // Always recomputes; the result is cached for is_healthy()/last_check().
    bool check(const Session::CookieJar& cookies);

    std::optional<std::string> get_token(const Session::CookieJar& cookies) const;

    bool is_healthy() const {
        return healthy_;
    }
    std::optional<std::chrono::system_clock::time_point> last_check() const {
        return last_check_;
    }
    const std::string& token_cookie() const {
        return token_cookie_;
    }

private:
    std::string                                          token_cookie_;
    bool                                                 healthy_ = false;
    std::optional<std::chrono::system_clock::time_point> last_check_;
};

}  // namespace Detection
}  // namespace Bulwark
