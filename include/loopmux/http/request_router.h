#ifndef LOOPMUX_HTTP_REQUEST_ROUTER_H
#define LOOPMUX_HTTP_REQUEST_ROUTER_H

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "loopmux/config/server_config.h"

namespace loopmux {
namespace http {

/**
 * Protocol a connection is classified into. Decided once per connection
 * from its first complete request head.
 */
enum class RouteKind {
  Undetermined,
  WebSocket,
  Sse,
  JsonRpcPost,
  RegistrationPost,
  CorsPreflight,
  Unknown
};

const char* routeKindToString(RouteKind kind);

struct RequestInfo {
  std::string method;
  std::string path;
  std::string version;
  // Keys lowercased, values trimmed
  std::map<std::string, std::string> headers;

  // Case-insensitive lookup
  std::optional<std::string> header(const std::string& name) const;
};

struct RouteDecision {
  RouteKind kind{RouteKind::Unknown};
  std::string path;
};

struct BodyCheck {
  bool complete{false};
  // Exactly Content-Length bytes; empty when no Content-Length was sent
  std::string body;
  // Head plus body length; bytes past this belong to the next request
  size_t consumed{0};
};

/**
 * @brief Parse request line and headers
 *
 * Needs at least one full request line "METHOD PATH VERSION". Header lines
 * without a colon are skipped. Parsing stops at the blank line ending the
 * head, so body bytes are never mistaken for headers.
 *
 * @return std::nullopt when the request line is absent or malformed; callers
 *         keep buffering
 */
std::optional<RequestInfo> parseHttpRequest(const std::string& raw);

// Offset one past the "\r\n\r\n" terminating the head
std::optional<size_t> findHeadEnd(const std::string& raw);

// Request target up to the first '?'
std::string stripQuery(const std::string& target);

/**
 * @brief Classify a parsed request
 *
 * Paths are compared without their query string. First match wins:
 *   Upgrade: websocket           -> WebSocket
 *   OPTIONS                      -> CorsPreflight (any path)
 *   GET  sse path or /sse        -> Sse             (SSE enabled only)
 *   POST message path, /messages, sse path, /mcp -> JsonRpcPost
 *                                                   (SSE enabled only)
 *   POST /register               -> RegistrationPost (SSE enabled only)
 *   anything else                -> Unknown
 *
 * The decision carries the raw target.
 */
RouteDecision determineRoute(const RequestInfo& request,
                             const config::SseConfig& sse);

/**
 * @brief Framing check for a request body
 *
 * Without Content-Length the request is complete once the head is, with an
 * empty body. Chunked transfer-encoding is not supported: a request sent
 * with it never completes.
 */
BodyCheck hasCompleteBody(const std::string& raw);

// Decimal Content-Length of the head in raw, if present and well formed
std::optional<size_t> contentLength(const std::string& raw);

}  // namespace http
}  // namespace loopmux

#endif  // LOOPMUX_HTTP_REQUEST_ROUTER_H
