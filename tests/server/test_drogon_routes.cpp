#include <gtest/gtest.h>
#include "efe/routes.hpp"
#include "efe/log.hpp"

#include <string>

using namespace efe;

class DrogonRoutesTest : public ::testing::Test {
protected:
    void SetUp() override { log::set_level(log::Level::Off); }
    void TearDown() override { log::set_level(log::Level::Info); }

    cache::FifoResultCache          cache{};
    dispatch::CalculationDispatcher dispatcher{cache};
    http::RequestHandler            handler{dispatcher};
};

// ─── Request conversion ───────────────────────────────────────────────────────

TEST_F(DrogonRoutesTest, RequestFieldsAreCopied) {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Post);
    req->setPath("/calculate");
    req->addHeader("X-Request-Id", "abc");
    req->setBody(R"({"type":"hawking_radiation","inputs":{"mass":1}})");

    const auto out = server::from_drogon(*req);
    EXPECT_EQ(out.method, "POST");
    EXPECT_EQ(out.path, "/calculate");
    EXPECT_EQ(out.header("x-request-id"), "abc");
    EXPECT_EQ(out.body, R"({"type":"hawking_radiation","inputs":{"mass":1}})");
}

TEST_F(DrogonRoutesTest, OptionsMethodName) {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Options);
    req->setPath("/");
    EXPECT_EQ(server::from_drogon(*req).method, "OPTIONS");
}

// ─── Response conversion ──────────────────────────────────────────────────────

TEST_F(DrogonRoutesTest, CalculationResponseKeepsStatusHeadersAndBody) {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Post);
    req->setPath("/calculate");
    req->setBody(R"({"type":"schwarzschild","inputs":{"mass":1,"radius":10}})");

    const auto handled = handler.handle(server::from_drogon(*req));
    const auto resp    = server::to_drogon(handled);

    EXPECT_EQ(resp->statusCode(), drogon::k200OK);
    EXPECT_EQ(std::string(resp->body()), handled.body);
    EXPECT_EQ(resp->getHeader("Cache-Control"), "max-age=3600");
    EXPECT_EQ(resp->getHeader("Access-Control-Allow-Origin"), "*");
}

TEST_F(DrogonRoutesTest, ErrorStatusIsPreserved) {
    const auto resp = server::to_drogon(handler.calculate(R"({"type":"foo","inputs":{}})"));
    EXPECT_EQ(resp->statusCode(), drogon::k400BadRequest);
}

TEST_F(DrogonRoutesTest, PreflightHasNoBodyOrLength) {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Options);
    req->setPath("/calculate");

    const auto resp = server::to_drogon(handler.handle(server::from_drogon(*req)));
    EXPECT_EQ(resp->statusCode(), drogon::k204NoContent);
    EXPECT_TRUE(resp->body().empty());
    EXPECT_TRUE(resp->getHeader("Content-Length").empty());
    EXPECT_EQ(resp->getHeader("Access-Control-Allow-Methods"), "POST, OPTIONS");
}

TEST_F(DrogonRoutesTest, MethodNotAllowedOnArbitraryPath) {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Get);
    req->setPath("/foo");

    const auto resp = server::to_drogon(handler.handle(server::from_drogon(*req)));
    EXPECT_EQ(resp->statusCode(), drogon::k405MethodNotAllowed);
}
