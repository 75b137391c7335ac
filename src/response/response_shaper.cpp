/// @file src/response/response_shaper.cpp

#include "efe/response.hpp"

namespace efe::response {

CalculationResult shape(CalculationResult result, bool include_all_components) {
    if (!include_all_components && result.metric_components) {
        result.metric_components->g_theta_theta.reset();
        result.metric_components->g_phi_phi.reset();
    }
    return result;
}

bool include_all_flag(const Json::Value& member) {
    return !(member.isBool() && !member.asBool());
}

} // namespace efe::response
