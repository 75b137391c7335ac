/// @file src/cache/cache_key.cpp

#include "efe/cache.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <type_traits>
#include <vector>

namespace efe::cache {

namespace {

std::string numeric_key(CalculationType type, const std::vector<double>& values) {
    return fmt::format("{}:[{}]", to_string(type), fmt::join(values, ","));
}

} // namespace

std::string make_cache_key(const CalculationParams& params) {
    return std::visit([](const auto& p) -> std::string {
        using P = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<P, SchwarzschildParams>) {
            return numeric_key(CalculationType::Schwarzschild,
                               {p.mass, p.radius, p.theta});
        } else if constexpr (std::is_same_v<P, KerrParams>) {
            return numeric_key(CalculationType::Kerr,
                               {p.mass, p.angular_momentum, p.radius, p.theta});
        } else if constexpr (std::is_same_v<P, FlrwParams>) {
            return numeric_key(CalculationType::Flrw,
                               {p.scale_factor, p.k, p.radius, p.theta,
                                p.hubble_parameter});
        } else if constexpr (std::is_same_v<P, HawkingParams>) {
            return numeric_key(CalculationType::HawkingRadiation,
                               {p.mass, p.charge, p.angular_momentum});
        } else if constexpr (std::is_same_v<P, EinsteinTensorParams>) {
            return fmt::format("{}:[{}]", to_string(CalculationType::EinsteinTensor),
                               p.metric_type);
        } else {
            return fmt::format("{}:[]", to_string(p.type));
        }
    }, params);
}

} // namespace efe::cache
