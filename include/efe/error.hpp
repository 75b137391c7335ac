#pragma once

/// @file include/efe/error.hpp
/// @brief Typed failure taxonomy for the EFE core.
///
/// # Module: Errors
///
/// ## Responsibility
/// Every fallible operation in the core reports failure as a `CalcError`
/// value rather than by throwing. Each `ErrorKind` carries its own HTTP
/// status, so the boundary never needs to inspect message text for
/// errors that originate inside the core.
///
/// ## Guarantees
/// - Status mapping is total: every kind maps to exactly one status
/// - `Outcome<T>` holds either a value or an error, never both

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace efe {

/// Failure categories surfaced at the service boundary.
enum class ErrorKind {
    MissingField,         ///< `type`, `inputs` or a required input is absent
    MalformedRequest,     ///< Body is not JSON, or a field has the wrong type
    UnsupportedType,      ///< Unknown calculation type or metric type
    ConstraintViolation,  ///< Physically inadmissible inputs
    Unimplemented,        ///< Advertised type whose solver is a stub
    Internal,             ///< Anything else, e.g. a non-finite solver output
};

/// A classified failure with a caller-facing message.
struct CalcError {
    ErrorKind   kind;
    std::string message;
};

/// Either a computed value or the error that prevented it.
template <typename T>
using Outcome = std::variant<T, CalcError>;

/// True when `o` holds a value.
template <typename T>
[[nodiscard]] bool is_ok(const Outcome<T>& o) noexcept {
    return std::holds_alternative<T>(o);
}

/// HTTP status for an error kind (400, 500 or 501).
[[nodiscard]] int http_status(ErrorKind kind) noexcept;

/// Stable name reported as `error_type` in error bodies.
[[nodiscard]] std::string_view error_type_name(ErrorKind kind) noexcept;

// ─── Constructors ─────────────────────────────────────────────────────────────

[[nodiscard]] inline CalcError missing_field(std::string message) {
    return CalcError{ErrorKind::MissingField, std::move(message)};
}

[[nodiscard]] inline CalcError malformed_request(std::string message) {
    return CalcError{ErrorKind::MalformedRequest, std::move(message)};
}

[[nodiscard]] inline CalcError unsupported_type(std::string message) {
    return CalcError{ErrorKind::UnsupportedType, std::move(message)};
}

[[nodiscard]] inline CalcError constraint_violation(std::string message) {
    return CalcError{ErrorKind::ConstraintViolation, std::move(message)};
}

[[nodiscard]] inline CalcError unimplemented(std::string message) {
    return CalcError{ErrorKind::Unimplemented, std::move(message)};
}

[[nodiscard]] inline CalcError internal_error(std::string message) {
    return CalcError{ErrorKind::Internal, std::move(message)};
}

} // namespace efe
