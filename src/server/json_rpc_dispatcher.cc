#define LOOPMUX_LOG_COMPONENT "server.jsonrpc"

#include "loopmux/server/json_rpc_dispatcher.h"

#include <exception>

#include "loopmux/http/request_router.h"
#include "loopmux/logging/log_macros.h"

namespace loopmux {
namespace server {

void HandlerTable::registerHandler(const std::string& method,
                                   MethodHandler handler) {
  handlers_[method] = std::move(handler);
}

bool HandlerTable::removeHandler(const std::string& method) {
  return handlers_.erase(method) > 0;
}

const MethodHandler* HandlerTable::find(const std::string& method) const {
  auto it = handlers_.find(method);
  if (it == handlers_.end()) {
    return nullptr;
  }
  return &it->second;
}

JsonRpcDispatcher::JsonRpcDispatcher(SseSessionManager& sessions,
                                     const HandlerTable& handlers,
                                     const http::ResponseBuilder& responses)
    : sessions_(sessions), handlers_(handlers), responses_(responses) {}

std::string JsonRpcDispatcher::respond(int status_code,
                                       const json& body) const {
  return responses_.jsonResponse(status_code, body, sessions_.sessionId());
}

std::optional<std::string> JsonRpcDispatcher::extractBody(
    const std::string& raw_request, std::string& body) const {
  auto length = http::contentLength(raw_request);
  if (!length) {
    return respond(400, jsonrpc::makeError(
                            nullptr, Error(jsonrpc::PARSE_ERROR, "Parse error",
                                           "Missing Content-Length header")));
  }

  auto head_end = http::findHeadEnd(raw_request);
  if (!head_end) {
    return respond(400, jsonrpc::makeError(
                            nullptr, Error(jsonrpc::PARSE_ERROR, "Parse error",
                                           "Malformed HTTP request")));
  }

  body = raw_request.substr(*head_end, *length);
  return std::nullopt;
}

std::string JsonRpcDispatcher::handlePost(const std::string& raw_request) {
  auto request = http::parseHttpRequest(raw_request);
  if (request) {
    auto session_id = request->header("mcp-session-id");
    if (session_id) {
      sessions_.adoptSessionId(*session_id);
    }
  }

  std::string body;
  if (auto framing_error = extractBody(raw_request, body)) {
    LOOPMUX_LOG(Debug, "rejecting POST: bad framing");
    return *framing_error;
  }

  json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    return respond(200, jsonrpc::makeError(
                            nullptr, Error(jsonrpc::PARSE_ERROR, "Parse error",
                                           "Invalid JSON")));
  }

  json id = parsed.is_object() ? parsed.value("id", json()) : json();

  if (!parsed.is_object() || !parsed.contains("jsonrpc") ||
      parsed["jsonrpc"] != jsonrpc::VERSION) {
    return respond(200, jsonrpc::makeError(
                            id, Error(jsonrpc::INVALID_REQUEST,
                                      "Invalid Request",
                                      "Not a valid JSON-RPC 2.0 request")));
  }

  std::string method;
  if (parsed.contains("method") && parsed["method"].is_string()) {
    method = parsed["method"].get<std::string>();
  } else if (parsed.contains("method")) {
    method = parsed["method"].dump();
  } else {
    method = "nil";
  }

  json params = parsed.value("params", json::object());
  if (params.is_null()) {
    params = json::object();
  }

  LOOPMUX_LOG(Debug, "processing POST method={} id={}", method, id.dump());

  const MethodHandler* handler = handlers_.find(method);
  if (!handler) {
    return respond(200, jsonrpc::makeError(
                            id, Error(jsonrpc::METHOD_NOT_FOUND,
                                      "Method not found",
                                      "Unknown method: " + method)));
  }

  return respond(200, invoke(*handler, id, params));
}

json JsonRpcDispatcher::invoke(const MethodHandler& handler,
                               const json& id,
                               const json& params) const {
  HandlerResult outcome;
  try {
    outcome = handler(sessions_.activeClient(), params);
  } catch (const std::exception& e) {
    LOOPMUX_LOG(Error, "handler raised: {}", e.what());
    return jsonrpc::makeError(
        id, Error(jsonrpc::INTERNAL_ERROR, "Internal error", e.what()));
  } catch (...) {
    LOOPMUX_LOG(Error, "handler raised a non-standard exception");
    return jsonrpc::makeError(
        id, Error(jsonrpc::INTERNAL_ERROR, "Internal error", "Unknown error"));
  }

  if (outcome.deferred) {
    return jsonrpc::makeError(
        id, Error(jsonrpc::TRANSPORT_UNSUPPORTED,
                  "Blocking tools not supported over SSE",
                  "This tool requires blocking operation which is not yet "
                  "supported over SSE transport"));
  }
  if (outcome.error) {
    return jsonrpc::makeError(id, *outcome.error);
  }
  return jsonrpc::makeResult(id, outcome.result);
}

std::string JsonRpcDispatcher::handleRegister(const std::string& raw_request) {
  std::string body;
  if (auto framing_error = extractBody(raw_request, body)) {
    return *framing_error;
  }

  json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    return respond(200, jsonrpc::makeError(
                            nullptr, Error(jsonrpc::PARSE_ERROR, "Parse error",
                                           "Invalid JSON")));
  }

  LOOPMUX_LOG(Debug, "client registration: {}", parsed.dump());

  json id = parsed.is_object() ? parsed.value("id", json()) : json();
  json result = {{"sessionId", sessions_.currentOrNewSessionId()},
                 {"capabilities", handlers_.capabilities()}};
  return respond(200, jsonrpc::makeResult(id, result));
}

}  // namespace server
}  // namespace loopmux
