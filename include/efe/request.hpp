#pragma once

/// @file include/efe/request.hpp
/// @brief Calculation requests and their validated, typed parameter sets.
///
/// A `CalculationRequest` is what the transport hands the core: a type name
/// and a loosely-shaped input map. The Physical Validator turns the map into
/// one `CalculationParams` alternative with every field present, defaulted
/// and range-checked, so solvers never see raw inputs.

#include "efe/types.hpp"
#include "efe/constants.hpp"

#include <string>
#include <variant>

namespace efe {

/// One call into the core. Transient; created per request.
struct CalculationRequest {
    std::string type;                   ///< Wire name of the calculation
    InputMap    inputs;                 ///< Raw numeric/string/boolean inputs
    bool        include_all_components = true;
};

// ─── Typed Parameter Sets ─────────────────────────────────────────────────────

struct SchwarzschildParams {
    double mass;
    double radius;
    double theta = constants::DEFAULT_THETA;
};

struct KerrParams {
    double mass;
    double angular_momentum;
    double radius;
    double theta = constants::DEFAULT_THETA;
};

/// Friedmann–Lemaître–Robertson–Walker inputs. `k` is the curvature sign.
struct FlrwParams {
    double scale_factor;
    double k;
    double radius;
    double theta            = constants::DEFAULT_THETA;
    double hubble_parameter = constants::DEFAULT_HUBBLE_PARAMETER;
};

struct HawkingParams {
    double mass;
    double charge           = 0.0;
    double angular_momentum = 0.0;
};

/// The metric whose Einstein tensor is requested, as given on the wire.
/// Whether the metric is supported is decided by the solver.
struct EinsteinTensorParams {
    std::string metric_type;
};

/// Parameter set for a type without a closed-form solver.
struct StubParams {
    CalculationType type;
};

/// Validated inputs for exactly one calculation family.
using CalculationParams = std::variant<SchwarzschildParams,
                                       KerrParams,
                                       FlrwParams,
                                       HawkingParams,
                                       EinsteinTensorParams,
                                       StubParams>;

} // namespace efe
