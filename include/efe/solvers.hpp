#pragma once

/// @file include/efe/solvers.hpp
/// @brief Metric Solvers: closed-form GR quantities from validated inputs.
///
/// # Module: Metric Solvers
///
/// ## Responsibility
/// One pure function per calculation family. Inputs are the typed parameter
/// sets produced by the Physical Validator, so no solver re-checks ranges.
///
/// Units follow the service convention rs = 2·mass: the G/c² factor is
/// folded into how `mass` is supplied. Only `ricciScalar` of Schwarzschild
/// reintroduces G and c explicitly.
///
/// ## Guarantees
/// - Deterministic: equal parameters give bit-identical results
/// - No exceptions; singular points yield non-finite fields, which the
///   dispatcher turns into an Internal error
/// - Stub solvers set `implemented = false` and zero every field
///
/// ## NOT Responsible For
/// - Caching (see cache.hpp)
/// - Payload trimming (see response.hpp)

#include "efe/error.hpp"
#include "efe/request.hpp"
#include "efe/result.hpp"

#include <span>
#include <string_view>

namespace efe::solvers {

/// Schwarzschild g_μν diagonal at (radius, θ), ricciScalar and eventHorizon.
[[nodiscard]] CalculationResult solve_schwarzschild(const SchwarzschildParams& p);

/// Kerr diagonal entries at (radius, θ), ricciScalar = 0 and the outer horizon
/// mass + sqrt(mass² − a²).
[[nodiscard]] CalculationResult solve_kerr(const KerrParams& p);

/// FLRW metric at comoving radius r, ricciScalar = 6(a² + k)/a⁴ and the
/// Hubble parameter.
[[nodiscard]] CalculationResult solve_flrw(const FlrwParams& p);

/// Horizon thermodynamics: surfaceGravity, temperature, entropy and
/// outerHorizonRadius.
[[nodiscard]] CalculationResult solve_hawking(const HawkingParams& p);

/// Einstein tensor of a named metric. Vacuum metrics give G_μν = 0; any other
/// metric type is UnsupportedType.
[[nodiscard]] Outcome<CalculationResult>
solve_einstein_tensor(const EinsteinTensorParams& p);

/// Placeholder result for a type without a closed-form solver.
[[nodiscard]] CalculationResult solve_unimplemented(CalculationType type);

/// Component names reported by the placeholder of `type`. Empty for the
/// implemented types.
struct StubLayout {
    std::string_view                  group;
    std::span<const std::string_view> components;
};
[[nodiscard]] StubLayout stub_layout(CalculationType type) noexcept;

/// Run the solver matching the active alternative of `params`.
[[nodiscard]] Outcome<CalculationResult> solve(const CalculationParams& params);

} // namespace efe::solvers
