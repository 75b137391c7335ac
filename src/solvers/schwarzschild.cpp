/// @file src/solvers/schwarzschild.cpp

#include "efe/solvers.hpp"
#include "efe/tensor.hpp"

namespace efe::solvers {

CalculationResult solve_schwarzschild(const SchwarzschildParams& p) {
    const double rs = 2.0 * p.mass;

    const auto metric = tensor::MetricTensor::make_schwarzschild(p.mass);
    const MetricMatrix g = metric.evaluate(tensor::make_point(0.0, p.radius, p.theta, 0.0));

    const double ricci = 2.0 * constants::G * p.mass /
                         (constants::C * constants::C * p.radius * p.radius * p.radius);

    return CalculationResult{
        .type              = CalculationType::Schwarzschild,
        .metric_components = MetricComponents::from_metric(g),
        .scalars           = {{"ricciScalar", ricci}, {"eventHorizon", rs}},
    };
}

} // namespace efe::solvers
