/// @file src/server/drogon_routes.cpp
/// @brief drogon listener setup and the catch-all route.

#include "efe/routes.hpp"

#include "efe/log.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <string>

namespace efe::server {

namespace {

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

http::HttpRequest from_drogon(const drogon::HttpRequest& request) {
    http::HttpRequest out;
    out.method = request.methodString();
    out.path   = request.path();
    for (const auto& [name, value] : request.headers()) {
        out.headers.emplace(lowercase(name), value);
    }
    out.body = std::string(request.body());
    return out;
}

drogon::HttpResponsePtr to_drogon(const http::HttpResponse& response) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(response.status));

    bool has_content_type = false;
    for (const auto& [name, value] : response.headers) {
        if (lowercase(name) == "content-type") {
            resp->setContentTypeString(value);
            has_content_type = true;
        } else {
            resp->addHeader(name, value);
        }
    }
    if (!has_content_type) {
        resp->setContentTypeCode(drogon::CT_NONE);
    }
    resp->setBody(response.body);
    return resp;
}

void register_routes(drogon::HttpAppFramework& app, http::RequestHandler& handler) {
    app.registerHandlerViaRegex(
        "/.*",
        [&handler](const drogon::HttpRequestPtr& req,
                   std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            callback(to_drogon(handler.handle(from_drogon(*req))));
        },
        {drogon::Get, drogon::Post, drogon::Head, drogon::Put,
         drogon::Delete, drogon::Options, drogon::Patch});
}

void configure(drogon::HttpAppFramework& app, const ServiceConfig& config) {
    app.addListener(config.host, config.port)
        .setClientMaxBodySize(config.max_body_bytes)
        .setIdleConnectionTimeout(config.idle_timeout_s)
        .setThreadNum(1);
    log::info("efe serving on {}:{} (cache capacity {}, max body {} bytes)",
              config.host, config.port, config.cache_capacity, config.max_body_bytes);
}

} // namespace efe::server
