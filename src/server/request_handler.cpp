/// @file src/server/request_handler.cpp
/// @brief Routing, CORS, timing and the single catch point.

#include "efe/http.hpp"

#include "efe/log.hpp"
#include "efe/response.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

namespace efe::http {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::string_view CONTENT_TYPE_JSON = "application/json";

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

void add_cors_headers(HttpResponse& r) {
    r.headers.emplace_back("Access-Control-Allow-Origin", "*");
    r.headers.emplace_back("Access-Control-Allow-Methods", "POST, OPTIONS");
    r.headers.emplace_back("Access-Control-Allow-Headers", "Content-Type, Authorization");
}

HttpResponse json_response(int status, const Json::Value& body) {
    HttpResponse r{.status = status, .headers = {}, .body = response::write_compact(body)};
    r.headers.emplace_back("Content-Type", std::string(CONTENT_TYPE_JSON));
    return r;
}

HttpResponse error_response(const CalcError& error, double elapsed) {
    const int status = http_status(error.kind);
    if (status >= 500) {
        log::error("{}: {}", error_type_name(error.kind), error.message);
    } else {
        log::warn("{}: {}", error_type_name(error.kind), error.message);
    }
    return json_response(status, response::error_body(error, elapsed));
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](unsigned char x, unsigned char y) {
                          return std::tolower(x) == std::tolower(y);
                      });
}

HttpResponse method_not_allowed() {
    return json_response(405, response::plain_error_body("Method not allowed"));
}

std::string iso8601_now() {
    const auto now = std::chrono::system_clock::now();
    const auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                         now.time_since_epoch()) % 1000;
    const std::time_t tt = std::chrono::system_clock::to_time_t(now);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z",
                       fmt::gmtime(tt), static_cast<int>(ms.count()));
}

} // namespace

std::optional<std::string_view> HttpRequest::header(std::string_view name) const {
    auto it = headers.find(name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

std::optional<std::string_view> HttpResponse::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return std::string_view(value);
        }
    }
    return std::nullopt;
}

HttpResponse status_only(int status) {
    return HttpResponse{.status = status, .headers = {}, .body = {}};
}

RequestHandler::RequestHandler(dispatch::CalculationDispatcher& dispatcher)
    : dispatcher_(dispatcher) {}

// ─── Calculation ──────────────────────────────────────────────────────────────

HttpResponse RequestHandler::calculate(std::string_view body) {
    const auto start = Clock::now();
    try {
        auto decoded = response::decode_request(body);
        if (auto* err = std::get_if<CalcError>(&decoded)) {
            return error_response(*err, seconds_since(start));
        }
        const auto& request = std::get<CalculationRequest>(decoded);

        auto outcome = dispatcher_.dispatch(request);
        if (auto* err = std::get_if<CalcError>(&outcome)) {
            return error_response(*err, seconds_since(start));
        }

        const auto shaped = response::shape(std::get<CalculationResult>(std::move(outcome)),
                                            request.include_all_components);

        HttpResponse r = json_response(200, response::success_body(shaped, seconds_since(start)));
        r.headers.emplace_back("Cache-Control",
                               fmt::format("max-age={}", constants::RESPONSE_MAX_AGE_SECONDS));
        return r;
    } catch (const std::exception& e) {
        return error_response(response::classify_exception(e), seconds_since(start));
    }
}

// ─── Health ───────────────────────────────────────────────────────────────────

HttpResponse RequestHandler::health() {
    const auto start = Clock::now();

    Json::Value supported(Json::arrayValue);
    Json::Value implemented(Json::arrayValue);
    for (CalculationType type : dispatcher_.supported_types()) {
        supported.append(std::string(to_string(type)));
        if (is_implemented(type)) {
            implemented.append(std::string(to_string(type)));
        }
    }

    Json::Value calculator(Json::objectValue);
    calculator["status"] = "healthy";
    calculator["details"]["supported_types"]   = std::move(supported);
    calculator["details"]["implemented_types"] = std::move(implemented);
    calculator["details"]["strict_mode"]       = dispatcher_.config().reject_unimplemented;

    const cache::CacheStats stats = dispatcher_.cache().stats();
    Json::Value cache(Json::objectValue);
    cache["status"] = "healthy";
    cache["details"]["entries"]   = static_cast<Json::UInt64>(stats.entries);
    cache["details"]["capacity"]  = static_cast<Json::UInt64>(stats.capacity);
    cache["details"]["hits"]      = static_cast<Json::UInt64>(stats.hits);
    cache["details"]["misses"]    = static_cast<Json::UInt64>(stats.misses);
    cache["details"]["evictions"] = static_cast<Json::UInt64>(stats.evictions);

    Json::Value body(Json::objectValue);
    body["status"]                   = "healthy";
    body["timestamp"]                = iso8601_now();
    body["components"]["calculator"] = std::move(calculator);
    body["components"]["cache"]      = std::move(cache);

    const double ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    body["responseTime"] = fmt::format("{:.3f}ms", ms);

    return json_response(200, body);
}

// ─── Routing ──────────────────────────────────────────────────────────────────

HttpResponse RequestHandler::route(const HttpRequest& request) {
    if (request.method == "OPTIONS") {
        return status_only(204);
    }

    if (request.path == "/health") {
        if (request.method != "GET") {
            return method_not_allowed();
        }
        return health();
    }

    // Every other path is the calculation endpoint.
    if (request.method != "POST") {
        return method_not_allowed();
    }
    return calculate(request.body);
}

HttpResponse RequestHandler::handle(const HttpRequest& request) {
    const auto start = Clock::now();

    HttpResponse r;
    try {
        r = route(request);
    } catch (const std::exception& e) {
        log::error("unhandled failure routing {} {}: {}", request.method, request.path, e.what());
        r = status_only(500);
    }
    add_cors_headers(r);

    log::info("{} {} -> {} ({:.3f} ms)", request.method, request.path, r.status,
              std::chrono::duration<double, std::milli>(Clock::now() - start).count());
    return r;
}

} // namespace efe::http
