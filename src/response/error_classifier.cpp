/// @file src/response/error_classifier.cpp
/// @brief Message-based status for failures that carry no ErrorKind.

#include "efe/response.hpp"

#include <array>

namespace efe::response {

namespace {

constexpr std::array<std::string_view, 3> CLIENT_ERROR_MARKERS{
    "must be positive",
    "constraint violated",
    "cannot exceed",
};

} // namespace

int classify_message(std::string_view message) noexcept {
    for (auto marker : CLIENT_ERROR_MARKERS) {
        if (message.find(marker) != std::string_view::npos) {
            return 400;
        }
    }
    return 500;
}

CalcError classify_exception(const std::exception& e) {
    std::string message = e.what();
    if (classify_message(message) == 400) {
        return constraint_violation(std::move(message));
    }
    return internal_error(std::move(message));
}

} // namespace efe::response
