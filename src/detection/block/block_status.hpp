#pragma once
#include <string>

namespace Bulwark {
namespace Detection {

enum class BlockKind { None, Captcha, RateLimited, IpBanned, SessionExpired, Unknown };

inline const char* to_string(BlockKind kind) {
    switch (kind) {
        case BlockKind::None: return "none";
        case BlockKind::Captcha: return "captcha";
        case BlockKind::RateLimited: return "rate_limited";
        case BlockKind::IpBanned: return "ip_banned";
        case BlockKind::SessionExpired: return "session_expired";
        case BlockKind::Unknown: return "unknown";
    }
    return "unknown";
}

// Classification of one response plus the recommended remediation.
struct BlockStatus {
    BlockKind   kind = BlockKind::None;
    std::string message;
    bool        should_rotate_proxy = false;
    bool        should_wait         = false;
    double      wait_seconds        = 0.0;
    bool        should_notify_user  = false;

    bool is_blocked() const {
        return kind != BlockKind::None;
    }
};

}  // namespace Detection
}  // namespace Bulwark
