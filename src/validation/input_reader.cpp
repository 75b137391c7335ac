/// @file src/validation/input_reader.cpp

#include "input_reader.hpp"

#include <fmt/format.h>

#include <cmath>

namespace efe::validation {

const InputValue* InputReader::find(std::string_view field) const {
    auto it = inputs_.find(field);
    return it == inputs_.end() ? nullptr : &it->second;
}

void InputReader::record(CalcError err) {
    if (!error_) {
        error_ = std::move(err);
    }
}

std::optional<double> InputReader::as_number(std::string_view field,
                                             const InputValue& v) {
    const double* d = std::get_if<double>(&v);
    if (d == nullptr) {
        record(malformed_request(
            fmt::format("Input '{}' must be a number", field)));
        return std::nullopt;
    }
    if (!std::isfinite(*d)) {
        record(malformed_request(
            fmt::format("Input '{}' must be a finite number", field)));
        return std::nullopt;
    }
    return *d;
}

double InputReader::number(std::string_view field) {
    const InputValue* v = find(field);
    if (v == nullptr) {
        record(missing_field(fmt::format(
            "Missing required input '{}' for {} calculation", field, to_string(type_))));
        return 0.0;
    }
    return as_number(field, *v).value_or(0.0);
}

double InputReader::number_or(std::string_view field, double fallback) {
    const InputValue* v = find(field);
    if (v == nullptr) {
        return fallback;
    }
    return as_number(field, *v).value_or(fallback);
}

std::string InputReader::string(std::string_view field,
                                std::string_view missing_message) {
    const InputValue* v = find(field);
    if (v == nullptr) {
        record(missing_field(std::string(missing_message)));
        return {};
    }
    const std::string* s = std::get_if<std::string>(v);
    if (s == nullptr) {
        record(malformed_request(
            fmt::format("Input '{}' must be a string", field)));
        return {};
    }
    if (s->empty()) {
        record(missing_field(std::string(missing_message)));
    }
    return *s;
}

} // namespace efe::validation
