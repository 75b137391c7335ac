/// @file src/response/json_codec.cpp
/// @brief JsonCpp request decoding and response encoding.

#include "efe/response.hpp"

#include <fmt/format.h>

#include <memory>

namespace efe::response {

namespace {

/// Nesting limit for request bodies; a calculation request is two levels deep.
constexpr int MAX_JSON_DEPTH = 32;

Outcome<InputMap> decode_inputs(const Json::Value& inputs) {
    InputMap out;
    for (auto it = inputs.begin(); it != inputs.end(); ++it) {
        const std::string name = it.name();
        const Json::Value& v   = *it;

        switch (v.type()) {
            case Json::nullValue:
                break;
            case Json::intValue:
            case Json::uintValue:
            case Json::realValue:
                out.emplace(name, v.asDouble());
                break;
            case Json::stringValue:
                out.emplace(name, v.asString());
                break;
            case Json::booleanValue:
                out.emplace(name, v.asBool());
                break;
            case Json::arrayValue:
            case Json::objectValue:
                return malformed_request(fmt::format(
                    "Input '{}' must be a number, string or boolean", name));
        }
    }
    return out;
}

} // namespace

Outcome<CalculationRequest> decode_request(std::string_view body) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"]     = true;
    builder["stackLimit"]      = MAX_JSON_DEPTH;

    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errs)) {
        return malformed_request(fmt::format("Invalid JSON in request body: {}", errs));
    }
    if (!root.isObject()) {
        return malformed_request("Request body must be a JSON object");
    }

    const Json::Value& type = root["type"];
    if (type.isNull()) {
        return missing_field("Missing calculation type");
    }
    if (!type.isString()) {
        return malformed_request("Field 'type' must be a string");
    }
    if (type.asString().empty()) {
        return missing_field("Missing calculation type");
    }

    const Json::Value& inputs = root["inputs"];
    if (inputs.isNull()) {
        return missing_field("Missing calculation inputs");
    }
    if (!inputs.isObject()) {
        return malformed_request("Field 'inputs' must be an object");
    }

    auto decoded = decode_inputs(inputs);
    if (auto* err = std::get_if<CalcError>(&decoded)) {
        return std::move(*err);
    }

    return CalculationRequest{
        .type                   = type.asString(),
        .inputs                 = std::move(std::get<InputMap>(decoded)),
        .include_all_components = include_all_flag(root["include_all_components"]),
    };
}

Json::Value to_json(const CalculationResult& result) {
    Json::Value out(Json::objectValue);

    if (result.metric_components) {
        const auto& m = *result.metric_components;
        Json::Value metric(Json::objectValue);
        metric["g_tt"] = m.g_tt;
        metric["g_rr"] = m.g_rr;
        if (m.g_theta_theta) metric["g_theta_theta"] = *m.g_theta_theta;
        if (m.g_phi_phi)     metric["g_phi_phi"]     = *m.g_phi_phi;
        out["metricComponents"] = std::move(metric);
    }

    for (const auto& s : result.scalars) {
        out[s.name] = s.value;
    }

    if (result.components) {
        Json::Value group(Json::objectValue);
        for (const auto& v : result.components->values) {
            group[v.name] = v.value;
        }
        out[result.components->name] = std::move(group);
    }

    out["implemented"] = result.implemented;
    return out;
}

Json::Value success_body(const CalculationResult& result, double elapsed_seconds) {
    Json::Value body(Json::objectValue);
    body["results"]          = to_json(result);
    body["calculation_time"] = elapsed_seconds;
    return body;
}

Json::Value error_body(const CalcError& error, double elapsed_seconds) {
    Json::Value body(Json::objectValue);
    body["error"]            = error.message;
    body["error_type"]       = std::string(error_type_name(error.kind));
    body["calculation_time"] = elapsed_seconds;
    return body;
}

Json::Value plain_error_body(std::string_view message) {
    Json::Value body(Json::objectValue);
    body["error"] = std::string(message);
    return body;
}

std::string write_compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

} // namespace efe::response
