#pragma once

/// @file include/efe/response.hpp
/// @brief Response Shaper, JSON codec and Error Classifier.
///
/// # Module: Response
///
/// ## Responsibility
///   - `shape`           : trim metric components to {g_tt, g_rr} on request
///   - `decode_request`  : JSON body → CalculationRequest
///   - `to_json`         : CalculationResult → `results` object
///   - `success_body` / `error_body`: full response payloads
///   - `classify_message` / `classify_exception`: status for untyped failures
///
/// JSON handling uses JsonCpp. Decoding never throws for well-formed or
/// malformed input alike; the JsonCpp reader may still throw on resource
/// limits, which the request handler catches.

#include "efe/error.hpp"
#include "efe/request.hpp"
#include "efe/result.hpp"

#include <json/json.h>

#include <exception>
#include <string>
#include <string_view>

namespace efe::response {

// ─── Shaping ──────────────────────────────────────────────────────────────────

/// Drop g_theta_theta and g_phi_phi when `include_all_components` is false.
/// Every other field is returned unchanged.
[[nodiscard]] CalculationResult shape(CalculationResult result,
                                      bool include_all_components);

/// `include_all_components` flag from a request body member: true unless the
/// member is the literal boolean `false`.
[[nodiscard]] bool include_all_flag(const Json::Value& member);

// ─── Codec ────────────────────────────────────────────────────────────────────

/// Parse `{type, inputs, include_all_components?}`.
[[nodiscard]] Outcome<CalculationRequest> decode_request(std::string_view body);

/// `results` object: metricComponents, scalars and the component group at the
/// top level, plus `implemented`.
[[nodiscard]] Json::Value to_json(const CalculationResult& result);

/// `{results, calculation_time}`.
[[nodiscard]] Json::Value success_body(const CalculationResult& result,
                                       double elapsed_seconds);

/// `{error, error_type, calculation_time}`.
[[nodiscard]] Json::Value error_body(const CalcError& error, double elapsed_seconds);

/// `{error}` with no classification, used for routing failures (405).
[[nodiscard]] Json::Value plain_error_body(std::string_view message);

/// Compact single-line serialization.
[[nodiscard]] std::string write_compact(const Json::Value& value);

// ─── Classification ───────────────────────────────────────────────────────────

/// 400 if `message` mentions "must be positive", "constraint violated" or
/// "cannot exceed"; 500 otherwise.
[[nodiscard]] int classify_message(std::string_view message) noexcept;

/// Map an exception that escaped a library into a CalcError whose kind has the
/// status `classify_message` chooses.
[[nodiscard]] CalcError classify_exception(const std::exception& e);

} // namespace efe::response
