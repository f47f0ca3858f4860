/**
 * @file test_header_logging.cpp
 * @brief Tests for header redaction and the logging decorator.
 *
 * Validates:
 *  - Sensitive header names match case-insensitively
 *  - Redaction and joining of repeated headers in the JSON rendering
 *  - The decorator passes the inner response through untouched and never
 *    writes a credential value to the log
 */

#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>

#include "meshnode/net/run_blocking.hpp"
#include "meshnode/obs/header_logging.hpp"
#include "meshnode/obs/logger.hpp"

namespace http = boost::beast::http;
using meshnode::net::Request;
using meshnode::net::RequestContext;
using meshnode::net::Response;
using meshnode::net::run_blocking;
using meshnode::obs::HeaderLoggingHandler;
using meshnode::obs::headers_to_json;
using meshnode::obs::is_sensitive_header;

namespace {

class EchoHandler final : public meshnode::net::RequestHandler {
public:
  boost::asio::awaitable<Response> handle(const Request& req, const RequestContext&) const override {
    ++calls;
    Response res{http::status::accepted, req.version()};
    res.set(http::field::set_cookie, "session=s3cr3t-cookie");
    res.set("X-Echo", std::string(req.target()));
    res.body() = "echo";
    res.prepare_payload();
    co_return res;
  }
  mutable int calls = 0;
};

} // namespace

/**
 * @test Sensitive_Names
 * @brief Credential headers in any case; ordinary headers are not.
 */
TEST(HeaderLogging, Sensitive_Names) {
  for (const char* n : {"Authorization", "authorization", "COOKIE", "Set-Cookie",
                        "Proxy-Authorization", "X-Api-Key", "x-auth-token"}) {
    EXPECT_TRUE(is_sensitive_header(n)) << n;
  }
  for (const char* n : {"Accept", "Content-Type", "X-Request-Id", "Authorization-Hint", ""}) {
    EXPECT_FALSE(is_sensitive_header(n)) << n;
  }
}

/**
 * @test Headers_To_Json
 * @brief Sensitive values are replaced; repeated headers are joined.
 */
TEST(HeaderLogging, Headers_To_Json) {
  http::fields h;
  h.set(http::field::authorization, "Bearer top-secret");
  h.insert(http::field::accept, "text/html");
  h.insert(http::field::accept, "application/json");
  h.set("X-Api-Key", "k-123");

  const auto v = headers_to_json(h);
  ASSERT_TRUE(v.isObject());
  EXPECT_EQ(v["Authorization"].asString(), "[REDACTED]");
  EXPECT_EQ(v["X-Api-Key"].asString(), "[REDACTED]");
  EXPECT_EQ(v["Accept"].asString(), "text/html, application/json");
}

/**
 * @test Decorator_Logs_Redacted_And_Delegates
 * @brief Two records (request, response); response is the inner one verbatim.
 */
TEST(HeaderLogging, Decorator_Logs_Redacted_And_Delegates) {
  std::ostringstream out;
  auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = meshnode::obs::make_logger(sink, meshnode::obs::LogLevel::Info,
                                           meshnode::obs::LogFormat::Json, "edge");

  auto inner = std::make_shared<EchoHandler>();
  HeaderLoggingHandler handler(inner, logger);

  Request req{http::verb::get, "/proxy/b:8080", 11};
  req.set(http::field::authorization, "Bearer top-secret");
  req.set(http::field::cookie, "id=cookie-value");
  req.set(http::field::user_agent, "curl/8.0");

  RequestContext ctx;
  ctx.request_id = "1-1";
  auto res = run_blocking(handler.handle(req, ctx));

  EXPECT_EQ(inner->calls, 1);
  EXPECT_EQ(res.result(), http::status::accepted);
  EXPECT_EQ(res["X-Echo"], "/proxy/b:8080");
  EXPECT_EQ(res[http::field::set_cookie], "session=s3cr3t-cookie");
  EXPECT_EQ(res.body(), "echo");

  const std::string text = out.str();
  EXPECT_NE(text.find("\"msg\":\"Request headers\""), std::string::npos) << text;
  EXPECT_NE(text.find("\"msg\":\"Response headers\""), std::string::npos) << text;
  EXPECT_NE(text.find("[REDACTED]"), std::string::npos) << text;
  EXPECT_NE(text.find("curl/8.0"), std::string::npos) << text;
  EXPECT_NE(text.find("\"request_id\":\"1-1\""), std::string::npos) << text;
  EXPECT_NE(text.find("\"service\":\"edge\""), std::string::npos) << text;
  EXPECT_EQ(text.find("top-secret"), std::string::npos) << text;
  EXPECT_EQ(text.find("cookie-value"), std::string::npos) << text;
  EXPECT_EQ(text.find("s3cr3t-cookie"), std::string::npos) << text;
}

/**
 * @test Text_Format_Flattens_Headers
 * @brief Text rendering uses dotted keys and still redacts.
 */
TEST(HeaderLogging, Text_Format_Flattens_Headers) {
  std::ostringstream out;
  auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = meshnode::obs::make_logger(sink, meshnode::obs::LogLevel::Debug,
                                           meshnode::obs::LogFormat::Text, "edge");

  HeaderLoggingHandler handler(std::make_shared<EchoHandler>(), logger);
  Request req{http::verb::post, "/", 11};
  req.set(http::field::authorization, "Basic dXNlcjpwYXNz");
  (void)run_blocking(handler.handle(req, RequestContext{}));

  const std::string text = out.str();
  EXPECT_NE(text.find("request_headers.Authorization=[REDACTED]"), std::string::npos) << text;
  EXPECT_EQ(text.find("dXNlcjpwYXNz"), std::string::npos) << text;
}

/**
 * @test Level_Filters_Records
 * @brief At error level nothing from the decorator is written.
 */
TEST(HeaderLogging, Level_Filters_Records) {
  std::ostringstream out;
  auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = meshnode::obs::make_logger(sink, meshnode::obs::LogLevel::Error,
                                           meshnode::obs::LogFormat::Json, "edge");

  HeaderLoggingHandler handler(std::make_shared<EchoHandler>(), logger);
  Request req{http::verb::get, "/", 11};
  auto res = run_blocking(handler.handle(req, RequestContext{}));
  EXPECT_EQ(res.result(), http::status::accepted);
  EXPECT_TRUE(out.str().empty());
}
