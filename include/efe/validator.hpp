#pragma once

/// @file include/efe/validator.hpp
/// @brief Physical Validator: raw inputs → typed, admissible parameter sets.
///
/// # Module: Physical Validator
///
/// ## Responsibility
/// Turn the loosely-shaped `InputMap` of a request into exactly one
/// `CalculationParams` alternative, or fail before any solver runs.
///
/// Checks run in two passes:
///   1. presence and type of every required field (defaults filled in)
///   2. range rules, in the order the fields are declared
///
/// | Type              | Range rules                                      |
/// |-------------------|--------------------------------------------------|
/// | schwarzschild     | mass > 0, radius > 0                             |
/// | kerr              | mass > 0, radius > 0, J² ≤ M²                    |
/// | hawking_radiation | mass > 0, J² + Q² ≤ M² (cosmic censorship)       |
/// | flrw              | scale_factor > 0                                 |
///
/// ## Guarantees
/// - Pure: no side effects, no exceptions
/// - Every failure names the offending field or inequality with its values
/// - Stub types accept any inputs

#include "efe/error.hpp"
#include "efe/request.hpp"
#include "efe/types.hpp"

namespace efe::validation {

/// Validate `inputs` for `type`.
[[nodiscard]] Outcome<CalculationParams>
validate(CalculationType type, const InputMap& inputs);

[[nodiscard]] Outcome<CalculationParams> validate_schwarzschild(const InputMap& inputs);
[[nodiscard]] Outcome<CalculationParams> validate_kerr(const InputMap& inputs);
[[nodiscard]] Outcome<CalculationParams> validate_flrw(const InputMap& inputs);
[[nodiscard]] Outcome<CalculationParams> validate_hawking(const InputMap& inputs);
[[nodiscard]] Outcome<CalculationParams> validate_einstein_tensor(const InputMap& inputs);

/// Accepts anything; yields `StubParams{type}`.
[[nodiscard]] Outcome<CalculationParams>
validate_stub(CalculationType type, const InputMap& inputs);

} // namespace efe::validation
