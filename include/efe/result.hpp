#pragma once

/// @file include/efe/result.hpp
/// @brief Output record shared by every solver.
///
/// A `CalculationResult` carries any combination of:
///   - `metric_components`: the diagonal g_μν entries at the requested point
///   - `scalars`          : derived quantities (ricciScalar, eventHorizon, …)
///   - `components`       : a named group of tensor components
///                           (e.g. einsteinTensorComponents)
///
/// Stub solvers set `implemented = false`; every numeric field of a stub is
/// zero and must not be read as a physical answer.

#include "efe/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace efe {

/// Diagonal metric components. The angular entries are optional so that the
/// response shaper can trim them.
struct MetricComponents {
    double                g_tt;
    double                g_rr;
    std::optional<double> g_theta_theta;
    std::optional<double> g_phi_phi;

    /// Extract the diagonal of a 4×4 metric evaluated at a point.
    [[nodiscard]] static MetricComponents
    from_metric(const MetricMatrix& g) noexcept;

    bool operator==(const MetricComponents&) const = default;
};

/// A single named number in a result.
struct NamedValue {
    std::string name;
    double      value;

    bool operator==(const NamedValue&) const = default;
};

/// A labelled set of tensor components, serialized as one JSON object.
struct ComponentGroup {
    std::string             name;
    std::vector<NamedValue> values;

    bool operator==(const ComponentGroup&) const = default;
};

struct CalculationResult {
    CalculationType                 type;
    bool                            implemented = true;
    std::optional<MetricComponents> metric_components;
    std::vector<NamedValue>         scalars;
    std::optional<ComponentGroup>   components;

    /// Look up a derived scalar by name.
    [[nodiscard]] std::optional<double>
    scalar(std::string_view name) const noexcept;

    /// Name of the first non-finite numeric field, or `nullopt` if every
    /// field is finite.
    [[nodiscard]] std::optional<std::string> first_non_finite() const;

    bool operator==(const CalculationResult&) const = default;
};

} // namespace efe
