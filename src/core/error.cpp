/// @file src/core/error.cpp
/// @brief ErrorKind → HTTP status and error_type name.

#include "efe/error.hpp"

namespace efe {

int http_status(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MissingField:
        case ErrorKind::MalformedRequest:
        case ErrorKind::UnsupportedType:
        case ErrorKind::ConstraintViolation:
            return 400;
        case ErrorKind::Unimplemented:
            return 501;
        case ErrorKind::Internal:
            return 500;
    }
    return 500;
}

std::string_view error_type_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MissingField:        return "MissingField";
        case ErrorKind::MalformedRequest:    return "MalformedRequest";
        case ErrorKind::UnsupportedType:     return "UnsupportedCalculationType";
        case ErrorKind::ConstraintViolation: return "ConstraintViolation";
        case ErrorKind::Unimplemented:       return "UnimplementedCalculation";
        case ErrorKind::Internal:            return "InternalComputationError";
    }
    return "InternalComputationError";
}

} // namespace efe
