#include <gtest/gtest.h>

#include "loopmux/http/request_router.h"

using namespace loopmux;
using namespace loopmux::http;

namespace {

RequestInfo request(const std::string& method,
                    const std::string& path,
                    std::map<std::string, std::string> headers = {}) {
  RequestInfo info;
  info.method = method;
  info.path = path;
  info.version = "HTTP/1.1";
  info.headers = std::move(headers);
  return info;
}

class RequestRouterTest : public ::testing::Test {
 protected:
  config::SseConfig sse_;
};

TEST_F(RequestRouterTest, ParsesRequestLineAndHeaders) {
  auto info = parseHttpRequest(
      "GET /mcp HTTP/1.1\r\n"
      "Host: 127.0.0.1\r\n"
      "Last-Event-ID:   17  \r\n"
      "MCP-Session-Id: abc\r\n"
      "\r\n");

  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->method, "GET");
  EXPECT_EQ(info->path, "/mcp");
  EXPECT_EQ(info->version, "HTTP/1.1");
  EXPECT_EQ(info->headers.at("last-event-id"), "17");
  EXPECT_EQ(info->header("Mcp-Session-Id").value(), "abc");
  EXPECT_FALSE(info->header("content-length").has_value());
}

TEST_F(RequestRouterTest, IncompleteOrMalformedRequestLine) {
  EXPECT_FALSE(parseHttpRequest("").has_value());
  EXPECT_FALSE(parseHttpRequest("GET /mcp HTT").has_value());
  EXPECT_FALSE(parseHttpRequest("GET /mcp\r\n\r\n").has_value());
  EXPECT_FALSE(parseHttpRequest("GET /a b HTTP/1.1\r\n\r\n").has_value());
  EXPECT_FALSE(parseHttpRequest("\r\nGET / HTTP/1.1\r\n").has_value());
}

TEST_F(RequestRouterTest, BodyIsNotParsedAsHeaders) {
  auto info = parseHttpRequest(
      "POST /messages HTTP/1.1\r\nContent-Length: 12\r\n\r\nupgrade: websocket");
  ASSERT_TRUE(info.has_value());
  EXPECT_FALSE(info->header("upgrade").has_value());
}

TEST_F(RequestRouterTest, WebSocketUpgradeWinsOverEverything) {
  auto decision = determineRoute(
      request("OPTIONS", "/mcp", {{"upgrade", "WebSocket"}}), sse_);
  EXPECT_EQ(decision.kind, RouteKind::WebSocket);
  EXPECT_EQ(decision.path, "/mcp");
}

TEST_F(RequestRouterTest, OptionsIsPreflightOnAnyPath) {
  EXPECT_EQ(determineRoute(request("OPTIONS", "*"), sse_).kind,
            RouteKind::CorsPreflight);
  EXPECT_EQ(determineRoute(request("OPTIONS", "/anything"), sse_).kind,
            RouteKind::CorsPreflight);

  sse_.enabled = false;
  EXPECT_EQ(determineRoute(request("OPTIONS", "/mcp"), sse_).kind,
            RouteKind::CorsPreflight);
}

TEST_F(RequestRouterTest, SseEndpoints) {
  EXPECT_EQ(determineRoute(request("GET", "/mcp"), sse_).kind, RouteKind::Sse);
  EXPECT_EQ(determineRoute(request("GET", "/sse"), sse_).kind, RouteKind::Sse);
  EXPECT_EQ(determineRoute(request("GET", "/messages"), sse_).kind,
            RouteKind::Unknown);
}

TEST_F(RequestRouterTest, PostEndpoints) {
  EXPECT_EQ(determineRoute(request("POST", "/mcp"), sse_).kind,
            RouteKind::JsonRpcPost);
  EXPECT_EQ(determineRoute(request("POST", "/messages"), sse_).kind,
            RouteKind::JsonRpcPost);
  EXPECT_EQ(determineRoute(request("POST", "/register"), sse_).kind,
            RouteKind::RegistrationPost);
  EXPECT_EQ(determineRoute(request("PUT", "/messages"), sse_).kind,
            RouteKind::Unknown);
}

TEST_F(RequestRouterTest, QueryStringIgnoredForRouting) {
  auto post = determineRoute(request("POST", "/messages?sessionId=abc"), sse_);
  EXPECT_EQ(post.kind, RouteKind::JsonRpcPost);
  EXPECT_EQ(post.path, "/messages?sessionId=abc");

  EXPECT_EQ(determineRoute(request("GET", "/mcp?x=1"), sse_).kind,
            RouteKind::Sse);
  EXPECT_EQ(determineRoute(request("POST", "/register?a=b"), sse_).kind,
            RouteKind::RegistrationPost);
  EXPECT_EQ(determineRoute(request("POST", "/messagesx?a=b"), sse_).kind,
            RouteKind::Unknown);

  EXPECT_EQ(stripQuery("/messages?sessionId=abc"), "/messages");
  EXPECT_EQ(stripQuery("/messages"), "/messages");
}

TEST_F(RequestRouterTest, ConfiguredMessagePath) {
  sse_.message_path = "/rpc";
  EXPECT_EQ(determineRoute(request("POST", "/rpc?sessionId=s"), sse_).kind,
            RouteKind::JsonRpcPost);
  EXPECT_EQ(determineRoute(request("GET", "/rpc"), sse_).kind,
            RouteKind::Unknown);
}

TEST_F(RequestRouterTest, ConfiguredSsePath) {
  sse_.path = "/events";
  EXPECT_EQ(determineRoute(request("GET", "/events"), sse_).kind,
            RouteKind::Sse);
  EXPECT_EQ(determineRoute(request("POST", "/events"), sse_).kind,
            RouteKind::JsonRpcPost);
  // The literal aliases stay accepted
  EXPECT_EQ(determineRoute(request("POST", "/mcp"), sse_).kind,
            RouteKind::JsonRpcPost);
  EXPECT_EQ(determineRoute(request("GET", "/mcp"), sse_).kind,
            RouteKind::Unknown);
}

TEST_F(RequestRouterTest, DisabledSseRoutesEverythingUnknown) {
  sse_.enabled = false;
  EXPECT_EQ(determineRoute(request("GET", "/mcp"), sse_).kind,
            RouteKind::Unknown);
  auto decision = determineRoute(request("POST", "/register"), sse_);
  EXPECT_EQ(decision.kind, RouteKind::Unknown);
  EXPECT_EQ(decision.path, "/register");
}

TEST_F(RequestRouterTest, BodyWithoutContentLengthIsEmpty) {
  auto check = hasCompleteBody("GET /mcp HTTP/1.1\r\nHost: x\r\n\r\n");
  EXPECT_TRUE(check.complete);
  EXPECT_EQ(check.body, "");
  EXPECT_EQ(check.consumed, 30u);

  EXPECT_FALSE(hasCompleteBody("GET /mcp HTTP/1.1\r\nHost: x\r\n").complete);
}

TEST_F(RequestRouterTest, BodyCompletesAtDeclaredLength) {
  const std::string head =
      "POST /messages HTTP/1.1\r\nContent-Length: 10\r\n\r\n";
  const std::string body = "0123456789";

  for (size_t n = 0; n < body.size(); ++n) {
    EXPECT_FALSE(hasCompleteBody(head + body.substr(0, n)).complete) << n;
  }

  auto exact = hasCompleteBody(head + body);
  EXPECT_TRUE(exact.complete);
  EXPECT_EQ(exact.body, body);
  EXPECT_EQ(exact.consumed, head.size() + body.size());

  auto pipelined = hasCompleteBody(head + body + "GET / HTTP/1.1\r\n");
  EXPECT_TRUE(pipelined.complete);
  EXPECT_EQ(pipelined.body, body);
  EXPECT_EQ(pipelined.consumed, head.size() + body.size());
}

TEST_F(RequestRouterTest, ChunkedNeverCompletes) {
  auto check = hasCompleteBody(
      "POST /messages HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"
      "5\r\nhello\r\n0\r\n\r\n");
  EXPECT_FALSE(check.complete);
}

TEST_F(RequestRouterTest, ContentLengthParsing) {
  EXPECT_EQ(contentLength("POST / HTTP/1.1\r\ncontent-length: 42\r\n\r\n"),
            std::optional<size_t>(42));
  EXPECT_FALSE(
      contentLength("POST / HTTP/1.1\r\nContent-Length: abc\r\n\r\n")
          .has_value());
  EXPECT_FALSE(contentLength("POST / HTTP/1.1\r\n\r\n").has_value());
}

TEST_F(RequestRouterTest, RouteKindNames) {
  EXPECT_STREQ(routeKindToString(RouteKind::JsonRpcPost), "json_rpc_post");
  EXPECT_STREQ(routeKindToString(RouteKind::CorsPreflight), "cors_preflight");
}

}  // namespace
