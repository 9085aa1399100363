#include "strategy.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Bulwark {
namespace Engine {

const char* to_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::PureApi:
            return "pure_api";
        case StrategyKind::ApiDirect:
            return "api_direct";
        case StrategyKind::ApiIntercept:
            return "api_intercept";
        case StrategyKind::Dom:
            return "dom";
    }
    return "dom";
}

StrategyKind parse_strategy_kind(const std::string& name) {
    std::string lowered = Utils::Text::to_lower(Utils::Text::trim(name));
    if (lowered == "pure_api")
        return StrategyKind::PureApi;
    if (lowered == "api_direct" || lowered == "api")
        return StrategyKind::ApiDirect;
    if (lowered == "api_intercept" || lowered == "intercept")
        return StrategyKind::ApiIntercept;
    if (lowered == "dom")
        return StrategyKind::Dom;
    throw Core::ConfigError("Unknown strategy: " + name);
}

const std::vector<StrategyKind>& default_strategy_order() {
    static const std::vector<StrategyKind> order = {
        StrategyKind::PureApi, StrategyKind::ApiDirect, StrategyKind::ApiIntercept, StrategyKind::Dom};
    return order;
}

}  // namespace Engine
}  // namespace Bulwark
