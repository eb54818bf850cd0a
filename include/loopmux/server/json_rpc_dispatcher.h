#ifndef LOOPMUX_SERVER_JSON_RPC_DISPATCHER_H
#define LOOPMUX_SERVER_JSON_RPC_DISPATCHER_H

#include <functional>
#include <map>
#include <optional>
#include <string>

#include "loopmux/http/response_builder.h"
#include "loopmux/json.h"
#include "loopmux/server/connection.h"
#include "loopmux/server/sse_session_manager.h"

namespace loopmux {
namespace server {

/**
 * Outcome of a method handler.
 *
 * A deferred result means the handler wants to answer later; the POST
 * transport cannot hold the request open and reports that to the client.
 */
struct HandlerResult {
  json result;
  std::optional<Error> error;
  bool deferred{false};

  static HandlerResult success(json value) {
    HandlerResult r;
    r.result = std::move(value);
    return r;
  }

  static HandlerResult failure(Error error) {
    HandlerResult r;
    r.error = std::move(error);
    return r;
  }

  static HandlerResult deferredResponse() {
    HandlerResult r;
    r.deferred = true;
    return r;
  }
};

// sse_client is the active SSE connection, or null when there is none
using MethodHandler = std::function<HandlerResult(
    const ConnectionSharedPtr& sse_client, const json& params)>;

class HandlerTable {
 public:
  // Replaces any handler already registered under method
  void registerHandler(const std::string& method, MethodHandler handler);
  bool removeHandler(const std::string& method);

  const MethodHandler* find(const std::string& method) const;
  size_t size() const { return handlers_.size(); }

  // Advertised to clients by /register
  void setCapabilities(json capabilities) {
    capabilities_ = std::move(capabilities);
  }
  const json& capabilities() const { return capabilities_; }

 private:
  std::map<std::string, MethodHandler> handlers_;
  json capabilities_ = json::object();
};

/**
 * Turns one complete POST request into one complete HTTP response.
 *
 * Framing problems (no Content-Length, no head terminator) are answered
 * with 400. Everything that reaches JSON parsing is answered with 200 and a
 * JSON-RPC body, errors included.
 */
class JsonRpcDispatcher {
 public:
  JsonRpcDispatcher(SseSessionManager& sessions,
                    const HandlerTable& handlers,
                    const http::ResponseBuilder& responses);

  // POST to /messages, the SSE path or /mcp
  std::string handlePost(const std::string& raw_request);

  // POST /register
  std::string handleRegister(const std::string& raw_request);

 private:
  // Returns a 400 response when the request cannot be framed, otherwise
  // stores the body
  std::optional<std::string> extractBody(const std::string& raw_request,
                                         std::string& body) const;

  json invoke(const MethodHandler& handler,
              const json& id,
              const json& params) const;

  std::string respond(int status_code, const json& body) const;

  SseSessionManager& sessions_;
  const HandlerTable& handlers_;
  const http::ResponseBuilder& responses_;
};

}  // namespace server
}  // namespace loopmux

#endif  // LOOPMUX_SERVER_JSON_RPC_DISPATCHER_H
