#include <gtest/gtest.h>

#include "loopmux/http/response_builder.h"

using namespace loopmux;
using namespace loopmux::http;

namespace {

std::string bodyOf(const std::string& response) {
  auto pos = response.find("\r\n\r\n");
  return pos == std::string::npos ? "" : response.substr(pos + 4);
}

bool hasHeader(const std::string& response, const std::string& line) {
  return response.find(line + "\r\n") != std::string::npos;
}

class ResponseBuilderTest : public ::testing::Test {
 protected:
  ResponseBuilder builder_;
  config::SseConfig sse_;
};

TEST_F(ResponseBuilderTest, JsonResponseCarriesCorsAndSession) {
  json body = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", json::object()}};
  std::string response = builder_.jsonResponse(200, body, std::string("s-1"));

  EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
  EXPECT_TRUE(hasHeader(response, "Content-Type: application/json"));
  EXPECT_TRUE(hasHeader(response, "Content-Length: " +
                                      std::to_string(body.dump().size())));
  EXPECT_TRUE(hasHeader(response, "Access-Control-Allow-Origin: *"));
  EXPECT_TRUE(hasHeader(response,
                        "Access-Control-Allow-Methods: GET, POST, OPTIONS"));
  EXPECT_TRUE(hasHeader(
      response,
      "Access-Control-Allow-Headers: Content-Type, Accept, "
      "X-Claude-Code-IDE-Authorization, Mcp-Session-Id, Last-Event-ID"));
  EXPECT_TRUE(hasHeader(response, "Mcp-Session-Id: s-1"));
  EXPECT_EQ(json::parse(bodyOf(response)), body);
}

TEST_F(ResponseBuilderTest, JsonResponseWithoutSession) {
  std::string response =
      builder_.jsonResponse(400, json::object(), std::nullopt);
  EXPECT_EQ(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u);
  EXPECT_EQ(response.find("Mcp-Session-Id"), std::string::npos);
}

TEST_F(ResponseBuilderTest, CustomAuthHeaderInAllowList) {
  ResponseBuilder builder("X-Token");
  EXPECT_EQ(builder.allowHeaders(),
            "Content-Type, Accept, X-Token, Mcp-Session-Id, Last-Event-ID");
}

TEST_F(ResponseBuilderTest, SseHead) {
  std::string head = builder_.sseHead(std::string("abc"));

  EXPECT_EQ(head.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
  EXPECT_TRUE(hasHeader(head, "Content-Type: text/event-stream"));
  EXPECT_TRUE(hasHeader(head, "Cache-Control: no-cache"));
  EXPECT_TRUE(hasHeader(head, "Connection: keep-alive"));
  EXPECT_TRUE(hasHeader(head, "Mcp-Session-Id: abc"));
  EXPECT_EQ(head.find("Content-Length"), std::string::npos);
  EXPECT_EQ(head.substr(head.size() - 4), "\r\n\r\n");
}

TEST_F(ResponseBuilderTest, OptionsResponse) {
  std::string response = builder_.optionsResponse();
  EXPECT_TRUE(hasHeader(response, "Access-Control-Max-Age: 86400"));
  EXPECT_TRUE(hasHeader(response, "Content-Length: 0"));
  EXPECT_EQ(bodyOf(response), "");
}

TEST_F(ResponseBuilderTest, NotFoundNamesPath) {
  std::string response = builder_.notFound(std::string("/nope"));
  EXPECT_EQ(response.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
  EXPECT_TRUE(hasHeader(response, "Content-Type: text/plain"));
  EXPECT_TRUE(hasHeader(response, "Connection: close"));
  EXPECT_EQ(bodyOf(response),
            "Not Found: /nope\nSupported SSE endpoints: GET /mcp, POST "
            "/messages");

  EXPECT_EQ(bodyOf(builder_.notFound(std::nullopt)), "Not Found");
}

TEST_F(ResponseBuilderTest, UnknownRouteStatuses) {
  auto status = [](const std::string& response) {
    return response.substr(0, response.find("\r\n"));
  };

  EXPECT_EQ(status(builder_.unknownRoute(std::string("/other"), sse_)),
            "HTTP/1.1 404 Not Found");
  EXPECT_EQ(status(builder_.unknownRoute(std::string("/messages"), sse_)),
            "HTTP/1.1 405 Method Not Allowed");
  EXPECT_EQ(bodyOf(builder_.unknownRoute(std::string("/register"), sse_)),
            "Method Not Allowed");
  EXPECT_EQ(status(builder_.unknownRoute(
                std::string("/messages?sessionId=abc"), sse_)),
            "HTTP/1.1 405 Method Not Allowed");

  sse_.enabled = false;
  std::string unavailable = builder_.unknownRoute(std::string("/mcp"), sse_);
  EXPECT_EQ(status(unavailable), "HTTP/1.1 503 Service Unavailable");
  EXPECT_EQ(bodyOf(unavailable), "SSE service not enabled");
  EXPECT_EQ(status(builder_.unknownRoute(std::string("/other"), sse_)),
            "HTTP/1.1 404 Not Found");
}

}  // namespace
