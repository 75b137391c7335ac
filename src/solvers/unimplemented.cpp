/// @file src/solvers/unimplemented.cpp
/// @brief Placeholder results for advertised but uncomputed types.

#include "efe/solvers.hpp"

#include <array>

namespace efe::solvers {

namespace {

using Names = std::string_view;

constexpr std::array<Names, 4> DIAGONAL_METRIC{"g_tt", "g_rr", "g_theta_theta", "g_phi_phi"};

constexpr std::array<Names, 2> CHRISTOFFEL{"Gamma_ttt", "Gamma_ttr"};
constexpr std::array<Names, 4> RICCI{"R_tt", "R_rr", "R_theta_theta", "R_phi_phi"};
constexpr std::array<Names, 1> RIEMANN{"R_trtr"};
constexpr std::array<Names, 1> WEYL{"W_trtr"};
constexpr std::array<Names, 4> GEODESIC{"d2t_dtau2", "d2r_dtau2", "d2theta_dtau2", "d2phi_dtau2"};
constexpr std::array<Names, 1> EVENT_HORIZON{"r_event_horizon"};
constexpr std::array<Names, 1> REDSHIFT{"redshift"};
constexpr std::array<Names, 1> LENSING{"deflection_angle"};
constexpr std::array<Names, 1> WAVES{"amplitude"};
constexpr std::array<Names, 3> ENERGY_CONDITIONS{
    "weak_energy_condition", "strong_energy_condition", "dominant_energy_condition"};
constexpr std::array<Names, 4> STRESS_ENERGY{"T_tt", "T_rr", "T_theta_theta", "T_phi_phi"};
constexpr std::array<Names, 1> FRIEDMANN{"H"};
constexpr std::array<Names, 3> BIANCHI{"B_1", "B_2", "B_3"};
constexpr std::array<Names, 1> KRETSCHMANN{"K"};
constexpr std::array<Names, 1> PENROSE{"P"};
constexpr std::array<Names, 1> ENTROPY{"entropy"};
constexpr std::array<Names, 1> LAMBDA{"LAMBDA"};
constexpr std::array<Names, 1> DENSITY{"density"};
constexpr std::array<Names, 1> SCALE_FACTOR{"scale_factor"};

} // namespace

StubLayout stub_layout(CalculationType type) noexcept {
    using CT = CalculationType;
    switch (type) {
        case CT::ChristoffelSymbols:      return {"christoffelSymbols", CHRISTOFFEL};
        case CT::RicciTensor:             return {"ricciTensorComponents", RICCI};
        case CT::RiemannTensor:           return {"riemannTensorComponents", RIEMANN};
        case CT::WeylTensor:              return {"weylTensorComponents", WEYL};
        case CT::GeodesicEquation:        return {"geodesicEquationComponents", GEODESIC};
        case CT::EventHorizon:            return {"eventHorizonComponents", EVENT_HORIZON};
        case CT::GravitationalRedshift:   return {"gravitationalRedshiftComponents", REDSHIFT};
        case CT::GravitationalLensing:    return {"gravitationalLensingComponents", LENSING};
        case CT::GravitationalWaves:      return {"gravitationalWavesComponents", WAVES};
        case CT::EnergyConditions:        return {"energyConditionsComponents", ENERGY_CONDITIONS};
        case CT::StressEnergyTensor:      return {"stressEnergyTensorComponents", STRESS_ENERGY};
        case CT::VacuumSolution:          return {"vacuumSolutionComponents", DIAGONAL_METRIC};
        case CT::MatterSolution:          return {"matterSolutionComponents", DIAGONAL_METRIC};
        case CT::ReissnerNordstrom:       return {"reissnerNordstromComponents", DIAGONAL_METRIC};
        case CT::KerrNewman:              return {"kerrNewmanComponents", DIAGONAL_METRIC};
        case CT::GodelMetric:             return {"godelComponents", DIAGONAL_METRIC};
        case CT::FriedmannEquations:      return {"friedmannComponents", FRIEDMANN};
        case CT::BianchiIdentities:       return {"bianchiComponents", BIANCHI};
        case CT::KretschmannScalar:       return {"kretschmannComponents", KRETSCHMANN};
        case CT::PenroseDiagram:          return {"penroseComponents", PENROSE};
        case CT::BlackHoleThermodynamics: return {"blackHoleThermodynamicsComponents", ENTROPY};
        case CT::CosmologicalConstant:    return {"cosmologicalConstantComponents", LAMBDA};
        case CT::DarkEnergy:              return {"darkEnergyComponents", DENSITY};
        case CT::DarkMatter:              return {"darkMatterComponents", DENSITY};
        case CT::InflationModel:          return {"inflationModelComponents", SCALE_FACTOR};
        case CT::WormholeSolution:        return {"wormholeComponents", DIAGONAL_METRIC};
        default:                          return {};
    }
}

CalculationResult solve_unimplemented(CalculationType type) {
    const StubLayout layout = stub_layout(type);

    ComponentGroup group{.name = std::string(layout.group), .values = {}};
    group.values.reserve(layout.components.size());
    for (auto name : layout.components) {
        group.values.push_back(NamedValue{std::string(name), 0.0});
    }

    return CalculationResult{
        .type        = type,
        .implemented = false,
        .components  = std::move(group),
    };
}

} // namespace efe::solvers
