#pragma once

/// @file include/efe/dispatcher.hpp
/// @brief Calculation Dispatcher: type string → {Validator, Solver} + cache.
///
/// # Module: Calculation Dispatcher
///
/// ## Responsibility
/// Orchestrate one calculation:
///   type lookup → validate → cache key → cache hit? → solve → finite check
///   → cache store
///
/// ## Usage
/// ```cpp
/// efe::cache::FifoResultCache cache;
/// efe::dispatch::CalculationDispatcher dispatcher(cache);
/// auto out = dispatcher.dispatch({"schwarzschild", {{"mass", 1.0}, {"radius", 10.0}}});
/// ```
///
/// ## Guarantees
/// - Failures are returned, never thrown; nothing is retried
/// - Results with a non-finite field are reported as Internal and not cached
/// - The registry is injectable so tests can substitute instrumented solvers
///
/// ## NOT Responsible For
/// - Trimming metric components (see response.hpp)
/// - Timing and transport status codes (see http.hpp)

#include "efe/cache.hpp"
#include "efe/error.hpp"
#include "efe/request.hpp"
#include "efe/result.hpp"

#include <functional>
#include <map>
#include <vector>

namespace efe::dispatch {

using Validator = std::function<Outcome<CalculationParams>(const InputMap&)>;
using Solver    = std::function<Outcome<CalculationResult>(const CalculationParams&)>;

struct RegistryEntry {
    Validator validate;
    Solver    solve;
};

using CalculationRegistry = std::map<CalculationType, RegistryEntry>;

/// Registry covering every CalculationType with the built-in validators and
/// solvers.
[[nodiscard]] CalculationRegistry make_default_registry();

struct DispatcherConfig {
    /// Report stub types as Unimplemented instead of returning their
    /// placeholder result.
    bool reject_unimplemented = false;
};

class CalculationDispatcher {
public:
    explicit CalculationDispatcher(cache::ResultCache& cache,
                                   CalculationRegistry registry = make_default_registry(),
                                   DispatcherConfig config = {});

    /// Run one request through validation, cache and solver.
    [[nodiscard]] Outcome<CalculationResult> dispatch(const CalculationRequest& request);

    /// Types present in the registry, in enum order.
    [[nodiscard]] std::vector<CalculationType> supported_types() const;

    [[nodiscard]] const DispatcherConfig& config() const noexcept { return config_; }
    [[nodiscard]] cache::ResultCache& cache() noexcept { return cache_; }

private:
    cache::ResultCache& cache_;
    CalculationRegistry registry_;
    DispatcherConfig    config_;
};

} // namespace efe::dispatch
