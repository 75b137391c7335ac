#pragma once

/// @file include/efe/http.hpp
/// @brief Transport-independent HTTP messages and the Request Handler.
///
/// # Module: HTTP
///
/// ## Responsibility
///   - Route requests: GET /health, OPTIONS on any path, POST on any other
///     path is a calculation
///   - Time each calculation and attach it to the response body
///   - Be the single place where a `std::exception` escaping a library is
///     caught and classified
///
/// ## Routes
/// | Path              | Method  | Result                                  |
/// |-------------------|---------|-----------------------------------------|
/// | any               | OPTIONS | 204, empty body, CORS headers           |
/// | /health           | GET     | 200 JSON                                |
/// | /health           | other   | 405 `{"error":"Method not allowed"}`    |
/// | any other path    | POST    | 200 / 400 / 500 / 501 JSON              |
/// | any other path    | other   | 405 `{"error":"Method not allowed"}`    |
///
/// Framing, body limits and sockets belong to the drogon adapter
/// (`efe/routes.hpp`); nothing here does I/O.

#include "efe/dispatcher.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace efe::http {

/// Header names are stored lower-cased.
using HeaderMap = std::map<std::string, std::string, std::less<>>;

struct HttpRequest {
    std::string method;
    std::string path;      ///< Target without the query string
    HeaderMap   headers;
    std::string body;

    /// Header value by lower-case name.
    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
};

struct HttpResponse {
    int                                              status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string                                      body;

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
};

/// Bare response with the given status and no body.
[[nodiscard]] HttpResponse status_only(int status);

// ─── RequestHandler ───────────────────────────────────────────────────────────

class RequestHandler {
public:
    explicit RequestHandler(dispatch::CalculationDispatcher& dispatcher);

    /// Route and answer one request. Never throws.
    [[nodiscard]] HttpResponse handle(const HttpRequest& request);

    /// Evaluate one calculation body. Used by POST routes and by the CLI.
    [[nodiscard]] HttpResponse calculate(std::string_view body);

    /// Liveness report with calculator and cache details.
    [[nodiscard]] HttpResponse health();

private:
    HttpResponse route(const HttpRequest& request);

    dispatch::CalculationDispatcher& dispatcher_;
};

} // namespace efe::http
