#pragma once
#include <chrono>
#include <string>

namespace Bulwark {
namespace Core {

struct Constants {
    static constexpr const char* VERSION    = "0.1.0";
    static constexpr const char* USER_AGENT =
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/131.0.0.0 Safari/537.36";

    // Rate limiter
    static constexpr double DEFAULT_MIN_DELAY           = 2.0;
    static constexpr double DEFAULT_MAX_DELAY           = 5.0;
    static constexpr int    DEFAULT_REQUESTS_PER_MINUTE = 15;
    static constexpr int    DEFAULT_REQUESTS_PER_HOUR   = 500;
    static constexpr double DEFAULT_BACKOFF_BASE        = 5.0;
    static constexpr double DEFAULT_BACKOFF_MAX         = 60.0;
    static constexpr double DEFAULT_JITTER_RANGE        = 1.0;
    static constexpr double MINUTE_WINDOW_SECONDS       = 60.0;
    static constexpr double HOUR_WINDOW_SECONDS         = 3600.0;

    // Proxy pool
    static constexpr double DEFAULT_BAN_DURATION      = 300.0;
    static constexpr double DEFAULT_REFRESH_INTERVAL  = 600.0;
    static constexpr int    DEFAULT_MIN_POOL_SIZE     = 3;
    static constexpr int    DEFAULT_MAX_POOL_SIZE     = 50;
    static constexpr double NEUTRAL_PROXY_SCORE       = 0.5;
    static constexpr double BLOCK_SCORE_PENALTY       = 0.2;
    static constexpr double MIN_SAMPLING_WEIGHT       = 0.01;
    static constexpr int    FAILURES_BEFORE_BAN       = 3;
    static constexpr double BAN_SCORE_THRESHOLD       = 0.3;
    static constexpr int    REFRESH_TIMEOUT_SECONDS   = 10;

    // CAPTCHA provider
    static constexpr const char* DEFAULT_CAPTCHA_API_URL       = "https://2captcha.com";
    static constexpr int         DEFAULT_CAPTCHA_TIMEOUT       = 120;
    static constexpr double      DEFAULT_CAPTCHA_POLL_INTERVAL = 5.0;
    static constexpr const char* CAPTCHA_NOT_READY             = "CAPCHA_NOT_READY";

    // Signature
    static constexpr const char* DEFAULT_VERSION_TAG      = "101_3_3.0";
    static constexpr const char* VERSION_HEADER           = "x-zse-93";
    static constexpr const char* SIGNATURE_HEADER         = "x-zse-96";
    static constexpr const char* SIGNATURE_PREFIX         = "2.0_";
    static constexpr const char* DEFAULT_TOKEN_COOKIE     = "d_c0";
    static constexpr const char* DEFAULT_API_BASE_URL     = "https://www.zhihu.com";
    static constexpr const char* DEFAULT_EXTRA_TOKEN_JS   = "window.__zst81 || ''";

    // Orchestrator
    static constexpr double DEFAULT_CAPTCHA_WAIT_SECONDS  = 60.0;
    static constexpr double CAPTCHA_RECHECK_SECONDS       = 1.5;
    static constexpr int    API_TIMEOUT_SECONDS           = 30;
    static constexpr int    TOKEN_LOG_PREFIX              = 10;
};

inline std::chrono::duration<double> seconds(double value) {
    return std::chrono::duration<double>(value);
}

}  // namespace Core
}  // namespace Bulwark
