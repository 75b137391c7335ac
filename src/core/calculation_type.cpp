/// @file src/core/calculation_type.cpp
/// @brief Wire names and classification of CalculationType.

#include "efe/types.hpp"

#include <algorithm>

namespace efe {

namespace {

struct TypeName {
    CalculationType type;
    std::string_view name;
};

// Declaration order of CalculationType.
constexpr std::array<TypeName, CALCULATION_TYPE_COUNT> TYPE_NAMES{{
    {CalculationType::Schwarzschild,           "schwarzschild"},
    {CalculationType::Kerr,                    "kerr"},
    {CalculationType::Flrw,                    "flrw"},
    {CalculationType::EinsteinTensor,          "einstein_tensor"},
    {CalculationType::HawkingRadiation,        "hawking_radiation"},
    {CalculationType::ChristoffelSymbols,      "christoffel_symbols"},
    {CalculationType::RicciTensor,             "ricci_tensor"},
    {CalculationType::RiemannTensor,           "riemann_tensor"},
    {CalculationType::WeylTensor,              "weyl_tensor"},
    {CalculationType::GeodesicEquation,        "geodesic_equation"},
    {CalculationType::EventHorizon,            "event_horizon"},
    {CalculationType::GravitationalRedshift,   "gravitational_redshift"},
    {CalculationType::GravitationalLensing,    "gravitational_lensing"},
    {CalculationType::GravitationalWaves,      "gravitational_waves"},
    {CalculationType::EnergyConditions,        "energy_conditions"},
    {CalculationType::StressEnergyTensor,      "stress_energy_tensor"},
    {CalculationType::VacuumSolution,          "vacuum_solution"},
    {CalculationType::MatterSolution,          "matter_solution"},
    {CalculationType::ReissnerNordstrom,       "reissner_nordstrom"},
    {CalculationType::KerrNewman,              "kerr_newman"},
    {CalculationType::GodelMetric,             "godel_metric"},
    {CalculationType::FriedmannEquations,      "friedmann_equations"},
    {CalculationType::BianchiIdentities,       "bianchi_identities"},
    {CalculationType::KretschmannScalar,       "kretschmann_scalar"},
    {CalculationType::PenroseDiagram,          "penrose_diagram"},
    {CalculationType::BlackHoleThermodynamics, "black_hole_thermodynamics"},
    {CalculationType::CosmologicalConstant,    "cosmological_constant"},
    {CalculationType::DarkEnergy,              "dark_energy"},
    {CalculationType::DarkMatter,              "dark_matter"},
    {CalculationType::InflationModel,          "inflation_model"},
    {CalculationType::WormholeSolution,        "wormhole_solution"},
}};

constexpr std::array<CalculationType, CALCULATION_TYPE_COUNT> make_all_types() {
    std::array<CalculationType, CALCULATION_TYPE_COUNT> out{};
    for (std::size_t i = 0; i < TYPE_NAMES.size(); ++i) {
        out[i] = TYPE_NAMES[i].type;
    }
    return out;
}

constexpr auto ALL_TYPES = make_all_types();

} // namespace

const std::array<CalculationType, CALCULATION_TYPE_COUNT>&
all_calculation_types() noexcept {
    return ALL_TYPES;
}

std::string_view to_string(CalculationType type) noexcept {
    return TYPE_NAMES[static_cast<std::size_t>(type)].name;
}

std::optional<CalculationType>
parse_calculation_type(std::string_view name) noexcept {
    const auto it = std::find_if(TYPE_NAMES.begin(), TYPE_NAMES.end(),
        [name](const TypeName& tn) { return tn.name == name; });
    if (it == TYPE_NAMES.end()) {
        return std::nullopt;
    }
    return it->type;
}

bool is_implemented(CalculationType type) noexcept {
    switch (type) {
        case CalculationType::Schwarzschild:
        case CalculationType::Kerr:
        case CalculationType::Flrw:
        case CalculationType::EinsteinTensor:
        case CalculationType::HawkingRadiation:
            return true;
        default:
            return false;
    }
}

bool is_vacuum_metric(CalculationType type) noexcept {
    return type == CalculationType::Schwarzschild ||
           type == CalculationType::Kerr;
}

} // namespace efe
