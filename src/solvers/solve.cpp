/// @file src/solvers/solve.cpp
/// @brief Route a validated parameter set to its solver.

#include "efe/solvers.hpp"

#include <type_traits>

namespace efe::solvers {

Outcome<CalculationResult> solve(const CalculationParams& params) {
    return std::visit([](const auto& p) -> Outcome<CalculationResult> {
        using P = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<P, SchwarzschildParams>) {
            return solve_schwarzschild(p);
        } else if constexpr (std::is_same_v<P, KerrParams>) {
            return solve_kerr(p);
        } else if constexpr (std::is_same_v<P, FlrwParams>) {
            return solve_flrw(p);
        } else if constexpr (std::is_same_v<P, HawkingParams>) {
            return solve_hawking(p);
        } else if constexpr (std::is_same_v<P, EinsteinTensorParams>) {
            return solve_einstein_tensor(p);
        } else {
            return solve_unimplemented(p.type);
        }
    }, params);
}

} // namespace efe::solvers
