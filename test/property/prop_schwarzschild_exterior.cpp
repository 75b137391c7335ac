/**
 * @file  prop_schwarzschild_exterior.cpp
 * @brief Property: ∀ r > 2M: g_tt < 0 < g_rr, g_tt·g_rr = −1, results are
 *        bit-identical on repeat, and dispatch through the cache agrees
 *        with the solver
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_schwarzschild_exterior
 *
 * Physical basis:
 *   Outside the horizon the Schwarzschild metric has
 *     g_tt = −(1 − 2M/r),   g_rr = 1 / (1 − 2M/r)
 *   so the signature is (−,+,+,+) and the product g_tt·g_rr is exactly −1
 *   up to rounding.  A memoized answer must equal a fresh computation.
 */

#include <rapidcheck.h>

#include <cmath>
#include <cstdlib>

#include "efe/dispatcher.hpp"
#include "efe/log.hpp"
#include "efe/solvers.hpp"

using namespace efe;

namespace {

double unit_interval(int raw) {
    return (static_cast<double>(std::abs(raw % 10000)) + 1.0) / 10001.0;
}

} // namespace

int main() {
    log::set_level(log::Level::Off);

    // ── Property 1: exterior signature and g_tt·g_rr = −1 ────────────────────
    rc::check(
        "schwarzschild_exterior: signature (-,+) and g_tt*g_rr = -1",
        [](int raw_m, int raw_r) {
            const double m = 100.0 * unit_interval(raw_m);
            const double r = 2.0 * m * (1.0 + 50.0 * unit_interval(raw_r));

            const auto res = solvers::solve_schwarzschild({.mass = m, .radius = r});
            const auto& g  = *res.metric_components;

            RC_ASSERT(g.g_tt < 0.0);
            RC_ASSERT(g.g_rr > 0.0);
            RC_ASSERT(std::abs(g.g_tt * g.g_rr + 1.0) < 1e-9);
            RC_ASSERT(*res.scalar("eventHorizon") == 2.0 * m);
        }
    );

    // ── Property 2: solvers are pure ──────────────────────────────────────────
    rc::check(
        "schwarzschild_exterior: repeated solve is bit-identical",
        [](int raw_m, int raw_r, int raw_theta) {
            const SchwarzschildParams p{
                .mass   = 10.0 * unit_interval(raw_m),
                .radius = 100.0 + 100.0 * unit_interval(raw_r),
                .theta  = constants::PI * unit_interval(raw_theta),
            };
            RC_ASSERT(solvers::solve_schwarzschild(p) == solvers::solve_schwarzschild(p));
        }
    );

    // ── Property 3: a cache hit equals a fresh computation ───────────────────
    rc::check(
        "schwarzschild_exterior: cached dispatch equals direct solve",
        [](int raw_m, int raw_r) {
            const double m = 10.0 * unit_interval(raw_m);
            const double r = 100.0 + 100.0 * unit_interval(raw_r);

            cache::FifoResultCache cache(4);
            dispatch::CalculationDispatcher d(cache);
            const CalculationRequest req{"schwarzschild", {{"mass", m}, {"radius", r}}};

            const auto first  = d.dispatch(req);
            const auto second = d.dispatch(req);
            RC_ASSERT(is_ok(first));
            RC_ASSERT(is_ok(second));
            RC_ASSERT(cache.stats().hits == 1u);

            const auto direct = solvers::solve_schwarzschild({.mass = m, .radius = r});
            RC_ASSERT(std::get<CalculationResult>(second) == direct);
        }
    );

    return 0;
}
