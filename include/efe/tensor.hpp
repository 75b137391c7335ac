#pragma once

/// @file include/efe/tensor.hpp
/// @brief Position-dependent metric tensors over (t, r, θ, φ).
///
/// # Module: Metric Tensor
///
/// ## Responsibility
/// Represents a spacetime metric as a callable that maps a coordinate point to
/// the 4×4 covariant matrix g_μν at that point, and provides factories for the
/// closed-form metrics the solvers report:
///   - `make_schwarzschild`: exterior of a non-rotating mass
///   - `make_kerr`         : rotating mass (diagonal part, see below)
///   - `make_flrw`         : homogeneous, isotropic cosmology
///
/// The signature convention is (−,+,+,+) and coordinates are [t, r, θ, φ].
///
/// ## Guarantees
/// - Evaluation is pure: the same point always yields the same matrix
/// - No exceptions; singular points produce non-finite entries, which the
///   dispatcher rejects
/// - Eigen3 is used for all matrix arithmetic
///
/// ## NOT Responsible For
/// - Christoffel symbols or curvature tensors (not computed by this service)
/// - Input validation (see validator.hpp)

#include "efe/types.hpp"

#include <functional>

namespace efe::tensor {

/// A callable that maps a spacetime point to the metric matrix at that point.
using MetricFunction = std::function<MetricMatrix(const SpacetimePoint&)>;

/// Build the point [t, r, θ, φ].
[[nodiscard]] SpacetimePoint make_point(double t, double r,
                                        double theta, double phi) noexcept;

/// A position-dependent 4×4 symmetric tensor g_μν.
///
/// # Example
/// ```cpp
/// auto g  = efe::tensor::MetricTensor::make_schwarzschild(1.0);
/// auto gx = g.evaluate(efe::tensor::make_point(0.0, 10.0, efe::constants::PI / 2, 0.0));
/// // gx(0,0) == -0.8, gx(1,1) == 1.25
/// ```
class MetricTensor {
public:
    explicit MetricTensor(MetricFunction metric_fn);

    /// Evaluate g_μν at the given point.
    MetricMatrix evaluate(const SpacetimePoint& x) const;

    // ── Factories ────────────────────────────────────────────────────────────

    /// Schwarzschild metric with rs = 2·mass:
    ///   g = diag(−(1 − rs/r), 1/(1 − rs/r), r², r² sin²θ)
    static MetricTensor make_schwarzschild(double mass);

    /// Diagonal Boyer–Lindquist entries of the Kerr metric, with
    /// a = angular_momentum / mass, ρ² = r² + a² cos²θ, Δ = r² − rs·r + a²:
    ///   g_tt = −(1 − rs·r/ρ²)       g_rr = ρ²/Δ
    ///   g_θθ = ρ²                   g_φφ = (r² + a² + rs·r·a² sin²θ/ρ²) sin²θ
    ///
    /// The frame-dragging term g_tφ is not represented.
    static MetricTensor make_kerr(double mass, double angular_momentum);

    /// FLRW metric at fixed cosmic time with scale factor a and curvature k:
    ///   g = diag(−1, g_rr(k), a² r², a² r² sin²θ)
    /// where g_rr is a²/(1 − r²) for k = 1, a²/(1 + r²) for k = −1, and a²
    /// otherwise.
    static MetricTensor make_flrw(double scale_factor, double k);

private:
    MetricFunction metric_fn_;
};

} // namespace efe::tensor
