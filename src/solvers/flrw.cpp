/// @file src/solvers/flrw.cpp

#include "efe/solvers.hpp"
#include "efe/tensor.hpp"

namespace efe::solvers {

CalculationResult solve_flrw(const FlrwParams& p) {
    const double a2 = p.scale_factor * p.scale_factor;

    const auto metric = tensor::MetricTensor::make_flrw(p.scale_factor, p.k);
    const MetricMatrix g = metric.evaluate(tensor::make_point(0.0, p.radius, p.theta, 0.0));

    return CalculationResult{
        .type              = CalculationType::Flrw,
        .metric_components = MetricComponents::from_metric(g),
        .scalars           = {
            {"ricciScalar",     6.0 * (a2 + p.k) / (a2 * a2)},
            {"hubbleParameter", p.hubble_parameter},
        },
    };
}

} // namespace efe::solvers
