/// @file src/solvers/hawking.cpp
/// @brief Surface gravity, Hawking temperature and Bekenstein entropy.

#include "efe/solvers.hpp"

#include <cmath>

namespace efe::solvers {

CalculationResult solve_hawking(const HawkingParams& p) {
    const double m  = p.mass;
    const double a  = p.angular_momentum / m;
    const double q2 = p.charge * p.charge;

    const double r_plus  = m + std::sqrt(m * m - a * a - q2);
    const double kappa   = (r_plus - m) / (2.0 * r_plus * r_plus + 2.0 * a * a);
    const double temp    = kappa / (2.0 * constants::PI);
    const double entropy = constants::PI * (r_plus * r_plus + a * a);

    return CalculationResult{
        .type    = CalculationType::HawkingRadiation,
        .scalars = {
            {"surfaceGravity",     kappa},
            {"temperature",        temp},
            {"entropy",            entropy},
            {"outerHorizonRadius", r_plus},
        },
    };
}

} // namespace efe::solvers
