/// @file src/core/result.cpp
/// @brief CalculationResult helpers.

#include "efe/result.hpp"

#include <cmath>

namespace efe {

MetricComponents MetricComponents::from_metric(const MetricMatrix& g) noexcept {
    return MetricComponents{
        .g_tt          = g(T, T),
        .g_rr          = g(R, R),
        .g_theta_theta = g(THETA, THETA),
        .g_phi_phi     = g(PHI, PHI),
    };
}

std::optional<double> CalculationResult::scalar(std::string_view name) const noexcept {
    for (const auto& s : scalars) {
        if (s.name == name) {
            return s.value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> CalculationResult::first_non_finite() const {
    if (metric_components) {
        const auto& m = *metric_components;
        if (!std::isfinite(m.g_tt)) return std::string("g_tt");
        if (!std::isfinite(m.g_rr)) return std::string("g_rr");
        if (m.g_theta_theta && !std::isfinite(*m.g_theta_theta)) {
            return std::string("g_theta_theta");
        }
        if (m.g_phi_phi && !std::isfinite(*m.g_phi_phi)) {
            return std::string("g_phi_phi");
        }
    }

    for (const auto& s : scalars) {
        if (!std::isfinite(s.value)) {
            return s.name;
        }
    }

    if (components) {
        for (const auto& v : components->values) {
            if (!std::isfinite(v.value)) {
                return components->name + "." + v.name;
            }
        }
    }

    return std::nullopt;
}

} // namespace efe
