#pragma once

/// @file src/validation/input_reader.hpp
/// @brief Typed field access over an InputMap with first-error capture.
///
/// Callers read every field of a parameter set unconditionally, then check
/// `error()` once. This keeps all presence/type checks ahead of any range
/// check without nesting.

#include "efe/error.hpp"
#include "efe/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace efe::validation {

class InputReader {
public:
    InputReader(const InputMap& inputs, CalculationType type) noexcept
        : inputs_(inputs), type_(type) {}

    /// Required finite number. Records MissingField or MalformedRequest.
    double number(std::string_view field);

    /// Optional finite number; `fallback` when absent.
    double number_or(std::string_view field, double fallback);

    /// Required string. `missing_message` is reported verbatim when absent.
    std::string string(std::string_view field, std::string_view missing_message);

    /// First error recorded, if any.
    [[nodiscard]] const std::optional<CalcError>& error() const noexcept { return error_; }

private:
    const InputValue* find(std::string_view field) const;
    std::optional<double> as_number(std::string_view field, const InputValue& v);
    void record(CalcError err);

    const InputMap&          inputs_;
    CalculationType          type_;
    std::optional<CalcError> error_;
};

} // namespace efe::validation
