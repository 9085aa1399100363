#include "session_monitor.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Bulwark {
namespace Detection {

using namespace Bulwark::Core;

SessionHealthMonitor::SessionHealthMonitor(std::string token_cookie)
    : token_cookie_(std::move(token_cookie)) {
}

bool SessionHealthMonitor::check(const Session::CookieJar& cookies) {
    auto now    = std::chrono::system_clock::now();
    last_check_ = now;

    auto cookie = cookies.find(token_cookie_);
    if (!cookie || cookie->value.empty()) {
        Logger::warn(token_cookie_ + " cookie not found, session may be expired");
        healthy_ = false;
        return false;
    }

    if (cookie->expires > 0) {
        double now_seconds = std::chrono::duration<double>(now.time_since_epoch()).count();
        if (cookie->expires < now_seconds) {
            Logger::warn(token_cookie_ + " cookie expired");
            healthy_ = false;
            return false;
        }
    }

    healthy_ = true;
    return true;
}

std::optional<std::string> SessionHealthMonitor::get_token(const Session::CookieJar& cookies) const {
    auto cookie = cookies.find(token_cookie_);
    if (!cookie)
        return std::nullopt;
    std::string value = Utils::Text::strip_quotes(cookie->value);
    if (value.empty())
        return std::nullopt;
    return value;
}

}  // namespace Detection
}  // namespace Bulwark
