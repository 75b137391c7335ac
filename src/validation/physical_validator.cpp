/// @file src/validation/physical_validator.cpp
/// @brief Per-family presence and range checks.

#include "efe/validator.hpp"

#include "input_reader.hpp"

#include <fmt/format.h>

namespace efe::validation {

namespace {

std::optional<CalcError> require_positive(std::string_view label,
                                          std::string_view field, double value) {
    if (value > 0.0) {
        return std::nullopt;
    }
    return constraint_violation(
        fmt::format("{} must be positive ({} = {})", label, field, value));
}

} // namespace

Outcome<CalculationParams> validate_schwarzschild(const InputMap& inputs) {
    InputReader in(inputs, CalculationType::Schwarzschild);
    SchwarzschildParams p{
        .mass   = in.number("mass"),
        .radius = in.number("radius"),
        .theta  = in.number_or("theta", constants::DEFAULT_THETA),
    };
    if (in.error()) return *in.error();

    if (auto e = require_positive("Mass", "mass", p.mass))       return *e;
    if (auto e = require_positive("Radius", "radius", p.radius)) return *e;
    return p;
}

Outcome<CalculationParams> validate_kerr(const InputMap& inputs) {
    InputReader in(inputs, CalculationType::Kerr);
    KerrParams p{
        .mass             = in.number("mass"),
        .angular_momentum = in.number("angular_momentum"),
        .radius           = in.number("radius"),
        .theta            = in.number_or("theta", constants::DEFAULT_THETA),
    };
    if (in.error()) return *in.error();

    if (auto e = require_positive("Mass", "mass", p.mass))       return *e;
    if (auto e = require_positive("Radius", "radius", p.radius)) return *e;

    const double j2 = p.angular_momentum * p.angular_momentum;
    const double m2 = p.mass * p.mass;
    if (j2 > m2) {
        return constraint_violation(fmt::format(
            "Angular momentum squared cannot exceed mass squared "
            "(angular_momentum² = {} > mass² = {})", j2, m2));
    }
    return p;
}

Outcome<CalculationParams> validate_flrw(const InputMap& inputs) {
    InputReader in(inputs, CalculationType::Flrw);
    FlrwParams p{
        .scale_factor     = in.number("scale_factor"),
        .k                = in.number("k"),
        .radius           = in.number("radius"),
        .theta            = in.number_or("theta", constants::DEFAULT_THETA),
        .hubble_parameter = in.number_or("hubble_parameter",
                                         constants::DEFAULT_HUBBLE_PARAMETER),
    };
    if (in.error()) return *in.error();

    if (p.hubble_parameter == 0.0) {
        p.hubble_parameter = constants::DEFAULT_HUBBLE_PARAMETER;
    }

    if (auto e = require_positive("Scale factor", "scale_factor", p.scale_factor)) {
        return *e;
    }
    return p;
}

Outcome<CalculationParams> validate_hawking(const InputMap& inputs) {
    InputReader in(inputs, CalculationType::HawkingRadiation);
    HawkingParams p{
        .mass             = in.number("mass"),
        .charge           = in.number_or("charge", 0.0),
        .angular_momentum = in.number_or("angular_momentum", 0.0),
    };
    if (in.error()) return *in.error();

    if (auto e = require_positive("Mass", "mass", p.mass)) return *e;

    const double lhs = p.angular_momentum * p.angular_momentum + p.charge * p.charge;
    const double m2  = p.mass * p.mass;
    if (lhs > m2) {
        return constraint_violation(fmt::format(
            "Cosmic censorship constraint violated: a² + Q² ≤ M² required "
            "(angular_momentum² + charge² = {} > mass² = {})", lhs, m2));
    }
    return p;
}

Outcome<CalculationParams> validate_einstein_tensor(const InputMap& inputs) {
    InputReader in(inputs, CalculationType::EinsteinTensor);
    EinsteinTensorParams p{
        .metric_type = in.string("metric_type",
                                 "Missing metric type for Einstein tensor calculation"),
    };
    if (in.error()) return *in.error();
    return p;
}

Outcome<CalculationParams> validate_stub(CalculationType type, const InputMap&) {
    return StubParams{type};
}

Outcome<CalculationParams> validate(CalculationType type, const InputMap& inputs) {
    switch (type) {
        case CalculationType::Schwarzschild:    return validate_schwarzschild(inputs);
        case CalculationType::Kerr:             return validate_kerr(inputs);
        case CalculationType::Flrw:             return validate_flrw(inputs);
        case CalculationType::HawkingRadiation: return validate_hawking(inputs);
        case CalculationType::EinsteinTensor:   return validate_einstein_tensor(inputs);
        default:                                return validate_stub(type, inputs);
    }
}

} // namespace efe::validation
