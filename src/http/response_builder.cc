#include "loopmux/http/response_builder.h"

#include <sstream>

#include "loopmux/http/request_router.h"

namespace loopmux {
namespace http {

namespace {

constexpr const char kCrlf[] = "\r\n";

bool isSseEndpointPath(const std::string& target,
                       const config::SseConfig& sse) {
  const std::string path = stripQuery(target);
  return path == sse.path || path == sse.message_path || path == "/sse" ||
         path == "/mcp" || path == "/messages" || path == "/register";
}

}  // namespace

ResponseBuilder::ResponseBuilder(std::string auth_header)
    : allow_headers_("Content-Type, Accept, " + auth_header +
                     ", Mcp-Session-Id, Last-Event-ID") {}

const char* ResponseBuilder::statusText(int status_code) {
  switch (status_code) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default: return "Unknown";
  }
}

std::string ResponseBuilder::corsHeaders() const {
  std::ostringstream out;
  out << "Access-Control-Allow-Origin: *" << kCrlf;
  out << "Access-Control-Allow-Methods: GET, POST, OPTIONS" << kCrlf;
  out << "Access-Control-Allow-Headers: " << allow_headers_ << kCrlf;
  return out.str();
}

std::string ResponseBuilder::jsonResponse(
    int status_code,
    const json& body,
    const std::optional<std::string>& session_id) const {
  const std::string payload = body.dump();

  std::ostringstream out;
  out << "HTTP/1.1 " << status_code << " " << statusText(status_code) << kCrlf;
  out << "Content-Type: application/json" << kCrlf;
  out << "Content-Length: " << payload.size() << kCrlf;
  out << corsHeaders();
  if (session_id) {
    out << "Mcp-Session-Id: " << *session_id << kCrlf;
  }
  out << kCrlf;
  out << payload;
  return out.str();
}

std::string ResponseBuilder::sseHead(
    const std::optional<std::string>& session_id) const {
  std::ostringstream out;
  out << "HTTP/1.1 200 OK" << kCrlf;
  out << "Content-Type: text/event-stream" << kCrlf;
  out << "Cache-Control: no-cache" << kCrlf;
  out << "Connection: keep-alive" << kCrlf;
  out << corsHeaders();
  if (session_id) {
    out << "Mcp-Session-Id: " << *session_id << kCrlf;
  }
  out << kCrlf;
  return out.str();
}

std::string ResponseBuilder::optionsResponse() const {
  std::ostringstream out;
  out << "HTTP/1.1 200 OK" << kCrlf;
  out << corsHeaders();
  out << "Access-Control-Max-Age: 86400" << kCrlf;
  out << "Content-Length: 0" << kCrlf;
  out << kCrlf;
  return out.str();
}

std::string ResponseBuilder::textResponse(int status_code,
                                          const std::string& body) const {
  std::ostringstream out;
  out << "HTTP/1.1 " << status_code << " " << statusText(status_code) << kCrlf;
  out << "Content-Type: text/plain" << kCrlf;
  out << "Content-Length: " << body.size() << kCrlf;
  out << "Connection: close" << kCrlf;
  out << kCrlf;
  out << body;
  return out.str();
}

std::string ResponseBuilder::notFound(
    const std::optional<std::string>& path) const {
  if (!path) {
    return textResponse(404, "Not Found");
  }
  return textResponse(404, "Not Found: " + *path +
                               "\nSupported SSE endpoints: GET /mcp, POST "
                               "/messages");
}

std::string ResponseBuilder::methodNotAllowed() const {
  return textResponse(405, "Method Not Allowed");
}

std::string ResponseBuilder::serviceUnavailable() const {
  return textResponse(503, "SSE service not enabled");
}

std::string ResponseBuilder::unknownRoute(const std::optional<std::string>& path,
                                          const config::SseConfig& sse) const {
  if (path && isSseEndpointPath(*path, sse)) {
    return sse.enabled ? methodNotAllowed() : serviceUnavailable();
  }
  return notFound(path);
}

}  // namespace http
}  // namespace loopmux
