#pragma once
#include <nlohmann/json.hpp>
#include <string>

#include "block_status.hpp"

namespace Bulwark {
namespace Detection {

/**
 * Classifies pages and API responses into block conditions.
 *
 * Total over its inputs: anything not recognised maps to BlockKind::None.
 * Unknown is never produced here.
 */
class BlockDetector {
public:
    static constexpr double RATE_LIMIT_WAIT_SECONDS = 30.0;
    static constexpr double FORBIDDEN_WAIT_SECONDS  = 60.0;
    static constexpr double BAN_WAIT_SECONDS        = 120.0;
    static constexpr int    AUTH_ERROR_CODE         = 40354;

    BlockStatus classify_page(const std::string& url, const std::string& body_text) const;
    BlockStatus classify_api(long status_code, const nlohmann::json& body = nullptr) const;

private:
    static std::string error_message(const nlohmann::json& body);
    static long        error_code(const nlohmann::json& body);
};

}  // namespace Detection
}  // namespace Bulwark
