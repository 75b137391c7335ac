/// @file src/solvers/kerr.cpp

#include "efe/solvers.hpp"
#include "efe/tensor.hpp"

#include <cmath>

namespace efe::solvers {

CalculationResult solve_kerr(const KerrParams& p) {
    const double a = p.angular_momentum / p.mass;

    const auto metric = tensor::MetricTensor::make_kerr(p.mass, p.angular_momentum);
    const MetricMatrix g = metric.evaluate(tensor::make_point(0.0, p.radius, p.theta, 0.0));

    // a = J/M can exceed M even when J² ≤ M² (M < 1); the horizon is then NaN.
    const double horizon = p.mass + std::sqrt(p.mass * p.mass - a * a);

    return CalculationResult{
        .type              = CalculationType::Kerr,
        .metric_components = MetricComponents::from_metric(g),
        .scalars           = {{"ricciScalar", 0.0}, {"eventHorizon", horizon}},
    };
}

} // namespace efe::solvers
