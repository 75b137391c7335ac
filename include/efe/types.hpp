#pragma once

/// @file include/efe/types.hpp
/// @brief Shared primitive types for the EFE compute core.
///
/// Every module includes this file. It defines the request-side value types
/// (raw inputs and the closed set of calculation types) and the Eigen-based
/// linear-algebra aliases used by the metric solvers.

#include <Eigen/Dense>

#include <array>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace efe {

/// Dimensionality of spacetime (1 time + 3 space).
static constexpr int SPACETIME_DIM = 4;

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// A point in 4-dimensional spacetime in spherical-type coordinates.
/// Component layout: [t, r, θ, φ].
using SpacetimePoint = Eigen::Vector<double, SPACETIME_DIM>;

/// The covariant metric tensor g_μν: a 4×4 symmetric matrix.
using MetricMatrix = Eigen::Matrix<double, SPACETIME_DIM, SPACETIME_DIM>;

/// Coordinate indices into SpacetimePoint / MetricMatrix.
enum Coordinate : int { T = 0, R = 1, THETA = 2, PHI = 3 };

// ─── Raw Inputs ───────────────────────────────────────────────────────────────

/// A single scalar input as it arrives from the transport layer.
using InputValue = std::variant<double, std::string, bool>;

/// Field name → raw value. Ordered so that iteration (and logging) is stable.
using InputMap = std::map<std::string, InputValue, std::less<>>;

// ─── CalculationType ──────────────────────────────────────────────────────────

/// Every calculation type advertised by the service.
///
/// The first five are computed in closed form. The remainder are recognised
/// but not yet implemented; their solvers return results tagged
/// `implemented == false`.
enum class CalculationType {
    Schwarzschild,
    Kerr,
    Flrw,
    EinsteinTensor,
    HawkingRadiation,

    ChristoffelSymbols,
    RicciTensor,
    RiemannTensor,
    WeylTensor,
    GeodesicEquation,
    EventHorizon,
    GravitationalRedshift,
    GravitationalLensing,
    GravitationalWaves,
    EnergyConditions,
    StressEnergyTensor,
    VacuumSolution,
    MatterSolution,
    ReissnerNordstrom,
    KerrNewman,
    GodelMetric,
    FriedmannEquations,
    BianchiIdentities,
    KretschmannScalar,
    PenroseDiagram,
    BlackHoleThermodynamics,
    CosmologicalConstant,
    DarkEnergy,
    DarkMatter,
    InflationModel,
    WormholeSolution,
};

/// Number of CalculationType enumerators.
static constexpr std::size_t CALCULATION_TYPE_COUNT = 31;

/// All calculation types in declaration order.
[[nodiscard]] const std::array<CalculationType, CALCULATION_TYPE_COUNT>&
all_calculation_types() noexcept;

/// Wire name of a calculation type, e.g. "hawking_radiation".
[[nodiscard]] std::string_view to_string(CalculationType type) noexcept;

/// Parse a wire name. Returns `nullopt` for unknown names.
[[nodiscard]] std::optional<CalculationType>
parse_calculation_type(std::string_view name) noexcept;

/// True for the types that have a closed-form solver.
[[nodiscard]] bool is_implemented(CalculationType type) noexcept;

/// True for vacuum solutions (Einstein tensor identically zero).
[[nodiscard]] bool is_vacuum_metric(CalculationType type) noexcept;

} // namespace efe
