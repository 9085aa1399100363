#include "block_detector.hpp"
#include <array>
#include <string_view>

#include "../../utils/text/string_utils.hpp"

namespace Bulwark {
namespace Detection {

using Utils::Text::icontains;

namespace {

constexpr std::array<std::string_view, 4> CAPTCHA_URL_PATTERNS = {
    "unhuman", "captcha", "/account/unhuman", "/challenge"};
constexpr std::array<std::string_view, 4> LOGIN_URL_PATTERNS = {
    "/signin", "/signup", "/login", "passport."};

constexpr std::array<std::string_view, 6> CAPTCHA_TEXT_PATTERNS = {
    "验证码", "请完成验证", "安全验证", "verify you are human", "complete the security check",
    "are you a robot"};
constexpr std::array<std::string_view, 6> RATE_LIMIT_TEXT_PATTERNS = {
    "操作太频繁", "请求太多", "请稍后再试", "频率过高", "too many requests", "rate limit exceeded"};
constexpr std::array<std::string_view, 5> BAN_TEXT_PATTERNS = {
    "访问受限", "IP 被封", "禁止访问", "403 Forbidden", "access denied"};

constexpr std::array<std::string_view, 5> AUTH_MESSAGE_PATTERNS = {
    "unauthorized", "not logged in", "login required", "session expired", "请先登录"};
constexpr std::array<std::string_view, 8> RATE_MESSAGE_PATTERNS = {
    "rate limit", "too many", "too frequent", "frequency", "verification", "verify", "频繁",
    "验证"};

template <size_t N>
const std::string_view* find_pattern(std::string_view text,
                                     const std::array<std::string_view, N>& patterns) {
    for (const auto& p : patterns) {
        if (icontains(text, p))
            return &p;
    }
    return nullptr;
}

BlockStatus captcha(std::string message) {
    BlockStatus s;
    s.kind               = BlockKind::Captcha;
    s.message            = std::move(message);
    s.should_notify_user = true;
    s.should_wait        = true;
    // zero: waits on manual action rather than a timer
    s.wait_seconds       = 0.0;
    return s;
}

BlockStatus session_expired(std::string message) {
    BlockStatus s;
    s.kind               = BlockKind::SessionExpired;
    s.message            = std::move(message);
    s.should_notify_user = true;
    return s;
}

BlockStatus throttled(BlockKind kind, std::string message, double wait) {
    BlockStatus s;
    s.kind                = kind;
    s.message             = std::move(message);
    s.should_rotate_proxy = true;
    s.should_wait         = true;
    s.wait_seconds        = wait;
    return s;
}

}  // namespace

BlockStatus BlockDetector::classify_page(const std::string& url,
                                         const std::string& body_text) const {
    if (find_pattern(url, CAPTCHA_URL_PATTERNS))
        return captcha("CAPTCHA detected in URL: " + url);

    if (find_pattern(url, LOGIN_URL_PATTERNS))
        return session_expired("Redirected to login page, session expired");

    if (auto p = find_pattern(body_text, CAPTCHA_TEXT_PATTERNS))
        return captcha("CAPTCHA text detected: " + std::string(*p));

    if (auto p = find_pattern(body_text, RATE_LIMIT_TEXT_PATTERNS))
        return throttled(BlockKind::RateLimited,
                         "Rate limit text detected: " + std::string(*p),
                         RATE_LIMIT_WAIT_SECONDS);

    if (auto p = find_pattern(body_text, BAN_TEXT_PATTERNS))
        return throttled(
            BlockKind::IpBanned, "IP ban text detected: " + std::string(*p), BAN_WAIT_SECONDS);

    return {};
}

std::string BlockDetector::error_message(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("error"))
        return "";
    const auto& error = body["error"];
    if (error.is_string())
        return error.get<std::string>();
    if (error.is_object() && error.contains("message")) {
        const auto& msg = error["message"];
        return msg.is_string() ? msg.get<std::string>() : msg.dump();
    }
    return "";
}

long BlockDetector::error_code(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("error") || !body["error"].is_object())
        return 0;
    const auto& error = body["error"];
    if (!error.contains("code"))
        return 0;
    const auto& code = error["code"];
    if (code.is_number_integer())
        return code.get<long>();
    if (code.is_string()) {
        try {
            return std::stol(code.get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

BlockStatus BlockDetector::classify_api(long status_code, const nlohmann::json& body) const {
    if (status_code == 429)
        return throttled(
            BlockKind::RateLimited, "HTTP 429 Too Many Requests", RATE_LIMIT_WAIT_SECONDS);

    std::string msg = error_message(body);

    if (status_code == 403) {
        if (icontains(msg, "banned") || icontains(msg, "forbidden"))
            return throttled(BlockKind::IpBanned, "HTTP 403 Forbidden: " + msg, BAN_WAIT_SECONDS);
        return throttled(BlockKind::IpBanned, "HTTP 403 Forbidden", FORBIDDEN_WAIT_SECONDS);
    }

    if (status_code == 401)
        return session_expired("HTTP 401 Unauthorized");

    long code = error_code(body);
    if (code == AUTH_ERROR_CODE || find_pattern(msg, AUTH_MESSAGE_PATTERNS))
        return session_expired("API auth error: " + msg);

    if (code == 429 || find_pattern(msg, RATE_MESSAGE_PATTERNS))
        return throttled(BlockKind::RateLimited,
                         "API rate/verification error: " + msg,
                         RATE_LIMIT_WAIT_SECONDS);

    return {};
}

}  // namespace Detection
}  // namespace Bulwark
