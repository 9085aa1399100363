#pragma once
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

#include "../../core/clock/clock.hpp"
#include "../../core/types/constants.hpp"

namespace Bulwark {
namespace Proxy {
namespace Pool {

struct ProxyRecord {
    std::string                              url;  // unique key
    std::uint64_t                            successes = 0;
    std::uint64_t                            failures  = 0;
    std::uint64_t                            blocks    = 0;
    std::optional<Core::Clock::time_point>   last_used;
    Core::Clock::time_point                  banned_until{};

    // Success rate minus a per-block penalty, clamped to [0, 1]. Unused proxies are neutral.
    double score() const {
        const std::uint64_t total = successes + failures + blocks;
        if (total == 0)
            return Core::Constants::NEUTRAL_PROXY_SCORE;
        double rate = static_cast<double>(successes) / static_cast<double>(total);
        double s    = rate - Core::Constants::BLOCK_SCORE_PENALTY * static_cast<double>(blocks);
        return std::clamp(s, 0.0, 1.0);
    }

    bool is_banned(Core::Clock::time_point now) const {
        return now < banned_until;
    }
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Bulwark
