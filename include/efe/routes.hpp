#pragma once

/// @file include/efe/routes.hpp
/// @brief drogon adapter: request/response conversion and route registration.
///
/// # Module: HTTP Server
///
/// ## Responsibility
/// Bind the transport-independent `http::RequestHandler` to drogon. drogon
/// owns sockets, HTTP/1.1 framing, keep-alive and the body size limit (413);
/// every request that reaches a route is converted, handled and converted back.
///
/// ## Guarantees
/// - All paths and methods reach `RequestHandler::handle`, so routing lives in
///   one place
/// - Header names are lower-cased on the way in

#include "efe/config.hpp"
#include "efe/http.hpp"

#include <drogon/HttpAppFramework.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>

namespace efe::server {

/// Copy method, path, headers and body out of a drogon request.
[[nodiscard]] http::HttpRequest from_drogon(const drogon::HttpRequest& request);

/// Build a drogon response carrying the status, headers and body of `response`.
[[nodiscard]] drogon::HttpResponsePtr to_drogon(const http::HttpResponse& response);

/// Route every path and method to `handler`. `handler` must outlive `app`'s run loop.
void register_routes(drogon::HttpAppFramework& app, http::RequestHandler& handler);

/// Listener address, body limit, idle timeout and thread count from `config`.
void configure(drogon::HttpAppFramework& app, const ServiceConfig& config);

} // namespace efe::server
