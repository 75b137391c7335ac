/// @file src/tensor/metric_tensor.cpp
/// @brief Implementation of MetricTensor and the closed-form metric factories.

#include "efe/tensor.hpp"

#include <cmath>

namespace efe::tensor {

SpacetimePoint make_point(double t, double r, double theta, double phi) noexcept {
    SpacetimePoint x;
    x << t, r, theta, phi;
    return x;
}

// ─── Construction ─────────────────────────────────────────────────────────────

MetricTensor::MetricTensor(MetricFunction metric_fn)
    : metric_fn_(std::move(metric_fn)) {}

// ─── Core Operations ──────────────────────────────────────────────────────────

MetricMatrix MetricTensor::evaluate(const SpacetimePoint& x) const {
    return metric_fn_(x);
}

// ─── Factories ────────────────────────────────────────────────────────────────

MetricTensor MetricTensor::make_schwarzschild(double mass) {
    return MetricTensor([mass](const SpacetimePoint& x) {
        const double rs        = 2.0 * mass;
        const double r         = x(R);
        const double sin_theta = std::sin(x(THETA));
        const double f         = 1.0 - rs / r;

        MetricMatrix g = MetricMatrix::Zero();
        g(T, T)         = -f;
        g(R, R)         = 1.0 / f;
        g(THETA, THETA) = r * r;
        g(PHI, PHI)     = r * r * sin_theta * sin_theta;
        return g;
    });
}

MetricTensor MetricTensor::make_kerr(double mass, double angular_momentum) {
    return MetricTensor([mass, angular_momentum](const SpacetimePoint& x) {
        const double rs        = 2.0 * mass;
        const double a         = angular_momentum / mass;
        const double r         = x(R);
        const double sin_theta = std::sin(x(THETA));
        const double cos_theta = std::cos(x(THETA));
        const double sin2      = sin_theta * sin_theta;

        const double rho2  = r * r + a * a * cos_theta * cos_theta;
        const double delta = r * r - rs * r + a * a;

        MetricMatrix g = MetricMatrix::Zero();
        g(T, T)         = -(1.0 - rs * r / rho2);
        g(R, R)         = rho2 / delta;
        g(THETA, THETA) = rho2;
        g(PHI, PHI)     = (r * r + a * a + rs * r * a * a * sin2 / rho2) * sin2;
        return g;
    });
}

MetricTensor MetricTensor::make_flrw(double scale_factor, double k) {
    return MetricTensor([scale_factor, k](const SpacetimePoint& x) {
        const double a         = scale_factor;
        const double r         = x(R);
        const double sin_theta = std::sin(x(THETA));

        double g_rr = a * a;
        if (k == 1.0) {
            g_rr = a * a / (1.0 - r * r);
        } else if (k == -1.0) {
            g_rr = a * a / (1.0 + r * r);
        }

        MetricMatrix g = MetricMatrix::Zero();
        g(T, T)         = -1.0;
        g(R, R)         = g_rr;
        g(THETA, THETA) = a * a * r * r;
        g(PHI, PHI)     = a * a * r * r * sin_theta * sin_theta;
        return g;
    });
}

} // namespace efe::tensor
