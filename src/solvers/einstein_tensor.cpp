/// @file src/solvers/einstein_tensor.cpp

#include "efe/solvers.hpp"

#include <fmt/format.h>

namespace efe::solvers {

Outcome<CalculationResult> solve_einstein_tensor(const EinsteinTensorParams& p) {
    const auto metric = parse_calculation_type(p.metric_type);
    if (!metric || !is_vacuum_metric(*metric)) {
        return unsupported_type(fmt::format("Unsupported metric type: {}", p.metric_type));
    }

    // R_μν = 0 for a vacuum solution, hence G_μν = R_μν − ½ R g_μν = 0.
    const MetricMatrix einstein = MetricMatrix::Zero();

    return CalculationResult{
        .type       = CalculationType::EinsteinTensor,
        .components = ComponentGroup{
            .name   = "einsteinTensorComponents",
            .values = {
                {"G_tt",          einstein(T, T)},
                {"G_rr",          einstein(R, R)},
                {"G_theta_theta", einstein(THETA, THETA)},
                {"G_phi_phi",     einstein(PHI, PHI)},
            },
        },
    };
}

} // namespace efe::solvers
