/// @file src/dispatch/dispatcher.cpp
/// @brief CalculationDispatcher and the default registry.

#include "efe/dispatcher.hpp"

#include "efe/log.hpp"
#include "efe/solvers.hpp"
#include "efe/validator.hpp"

#include <fmt/format.h>

namespace efe::dispatch {

CalculationRegistry make_default_registry() {
    CalculationRegistry registry;
    for (CalculationType type : all_calculation_types()) {
        registry.emplace(type, RegistryEntry{
            .validate = [type](const InputMap& inputs) {
                return validation::validate(type, inputs);
            },
            .solve = [](const CalculationParams& params) {
                return solvers::solve(params);
            },
        });
    }
    return registry;
}

// ─── Construction ─────────────────────────────────────────────────────────────

CalculationDispatcher::CalculationDispatcher(cache::ResultCache& cache,
                                             CalculationRegistry registry,
                                             DispatcherConfig config)
    : cache_(cache), registry_(std::move(registry)), config_(config) {}

// ─── Dispatch ─────────────────────────────────────────────────────────────────

Outcome<CalculationResult>
CalculationDispatcher::dispatch(const CalculationRequest& request) {
    const auto type = parse_calculation_type(request.type);
    if (!type) {
        return unsupported_type(
            fmt::format("Unsupported calculation type: {}", request.type));
    }

    auto entry = registry_.find(*type);
    if (entry == registry_.end()) {
        return unsupported_type(
            fmt::format("Unsupported calculation type: {}", request.type));
    }

    auto params = entry->second.validate(request.inputs);
    if (auto* err = std::get_if<CalcError>(&params)) {
        return std::move(*err);
    }
    const auto& typed = std::get<CalculationParams>(params);

    if (config_.reject_unimplemented && !is_implemented(*type)) {
        return unimplemented(fmt::format(
            "Calculation type '{}' is not implemented yet", request.type));
    }

    const std::string key = cache::make_cache_key(typed);
    if (auto cached = cache_.get(key)) {
        log::debug("cache hit: {}", key);
        return std::move(*cached);
    }
    log::debug("cache miss: {}", key);

    auto solved = entry->second.solve(typed);
    if (auto* err = std::get_if<CalcError>(&solved)) {
        return std::move(*err);
    }
    auto& result = std::get<CalculationResult>(solved);

    if (auto field = result.first_non_finite()) {
        return internal_error(fmt::format(
            "Non-finite value in '{}' for {} calculation", *field, request.type));
    }

    cache_.put(key, result);
    return std::move(result);
}

std::vector<CalculationType> CalculationDispatcher::supported_types() const {
    std::vector<CalculationType> out;
    out.reserve(registry_.size());
    for (const auto& kv : registry_) {
        out.push_back(kv.first);
    }
    return out;
}

} // namespace efe::dispatch
