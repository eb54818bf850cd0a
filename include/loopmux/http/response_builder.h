#ifndef LOOPMUX_HTTP_RESPONSE_BUILDER_H
#define LOOPMUX_HTTP_RESPONSE_BUILDER_H

#include <optional>
#include <string>

#include "loopmux/config/server_config.h"
#include "loopmux/json.h"

namespace loopmux {
namespace http {

/**
 * Renders the fixed HTTP/1.1 response shapes of the server.
 *
 * Every response is complete (head and body) and uses CRLF line endings.
 * JSON and SSE responses carry the CORS set:
 *   Access-Control-Allow-Origin: *
 *   Access-Control-Allow-Methods: GET, POST, OPTIONS
 *   Access-Control-Allow-Headers: Content-Type, Accept, <auth>,
 *                                 Mcp-Session-Id, Last-Event-ID
 */
class ResponseBuilder {
 public:
  explicit ResponseBuilder(
      std::string auth_header = "X-Claude-Code-IDE-Authorization");

  static const char* statusText(int status_code);

  const std::string& allowHeaders() const { return allow_headers_; }

  std::string jsonResponse(int status_code,
                           const json& body,
                           const std::optional<std::string>& session_id) const;

  // Head of the event stream; the body follows as SSE frames
  std::string sseHead(const std::optional<std::string>& session_id) const;

  // Preflight answer, empty body, Access-Control-Max-Age: 86400
  std::string optionsResponse() const;

  // Plain-text 404 naming the path and the supported endpoints
  std::string notFound(const std::optional<std::string>& path) const;

  std::string methodNotAllowed() const;

  std::string serviceUnavailable() const;

  /**
   * @brief Response for a request that matched no route
   *
   * 503 when SSE is disabled and the path names one of its endpoints, 405
   * when SSE is enabled and the path is a known endpoint hit with the wrong
   * method, 404 otherwise.
   */
  std::string unknownRoute(const std::optional<std::string>& path,
                           const config::SseConfig& sse) const;

 private:
  std::string textResponse(int status_code, const std::string& body) const;
  std::string corsHeaders() const;

  std::string allow_headers_;
};

}  // namespace http
}  // namespace loopmux

#endif  // LOOPMUX_HTTP_RESPONSE_BUILDER_H
