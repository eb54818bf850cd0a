#define LOOPMUX_LOG_COMPONENT "http.router"

#include "loopmux/http/request_router.h"

#include <algorithm>
#include <cctype>

#include "loopmux/logging/log_macros.h"

namespace loopmux {
namespace http {

namespace {

constexpr const char kHeadTerminator[] = "\r\n\r\n";
constexpr size_t kHeadTerminatorLength = 4;

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

std::string trim(const std::string& value) {
  const char* whitespace = " \t";
  auto begin = value.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return "";
  }
  auto end = value.find_last_not_of(whitespace);
  return value.substr(begin, end - begin + 1);
}

// Splits "A B C" on single spaces/tabs into exactly three tokens
bool splitRequestLine(const std::string& line,
                      std::string& method,
                      std::string& path,
                      std::string& version) {
  std::string tokens[3];
  size_t count = 0;
  size_t pos = 0;
  while (pos < line.size()) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
      ++pos;
    }
    if (pos >= line.size()) {
      break;
    }
    size_t end = pos;
    while (end < line.size() && line[end] != ' ' && line[end] != '\t') {
      ++end;
    }
    if (count == 3) {
      return false;
    }
    tokens[count++] = line.substr(pos, end - pos);
    pos = end;
  }
  if (count != 3) {
    return false;
  }
  method = tokens[0];
  path = tokens[1];
  version = tokens[2];
  return true;
}

}  // namespace

const char* routeKindToString(RouteKind kind) {
  switch (kind) {
    case RouteKind::Undetermined: return "undetermined";
    case RouteKind::WebSocket: return "websocket";
    case RouteKind::Sse: return "sse";
    case RouteKind::JsonRpcPost: return "json_rpc_post";
    case RouteKind::RegistrationPost: return "registration_post";
    case RouteKind::CorsPreflight: return "cors_preflight";
    case RouteKind::Unknown: return "unknown";
  }
  return "unknown";
}

std::optional<std::string> RequestInfo::header(const std::string& name) const {
  auto it = headers.find(toLower(name));
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<size_t> findHeadEnd(const std::string& raw) {
  auto pos = raw.find(kHeadTerminator);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  return pos + kHeadTerminatorLength;
}

std::optional<RequestInfo> parseHttpRequest(const std::string& raw) {
  auto line_end = raw.find_first_of("\r\n");
  if (line_end == 0 || raw.empty()) {
    return std::nullopt;
  }
  // A request line is only trusted once its line break has arrived
  if (line_end == std::string::npos) {
    return std::nullopt;
  }

  RequestInfo info;
  if (!splitRequestLine(raw.substr(0, line_end), info.method, info.path,
                        info.version)) {
    LOOPMUX_LOG(Debug, "unparseable request line");
    return std::nullopt;
  }

  size_t head_end = raw.find(kHeadTerminator);
  const size_t limit = head_end == std::string::npos ? raw.size() : head_end;

  size_t pos = line_end;
  while (pos < limit) {
    while (pos < limit && (raw[pos] == '\r' || raw[pos] == '\n')) {
      ++pos;
    }
    if (pos >= limit) {
      break;
    }
    size_t end = raw.find_first_of("\r\n", pos);
    if (end == std::string::npos || end > limit) {
      end = limit;
    }

    const std::string line = raw.substr(pos, end - pos);
    auto colon = line.find(':');
    if (colon != std::string::npos && colon > 0) {
      std::string value = trim(line.substr(colon + 1));
      if (!value.empty()) {
        info.headers[toLower(trim(line.substr(0, colon)))] = value;
      }
    }
    pos = end;
  }

  return info;
}

std::string stripQuery(const std::string& target) {
  return target.substr(0, target.find('?'));
}

RouteDecision determineRoute(const RequestInfo& request,
                             const config::SseConfig& sse) {
  const std::string& method = request.method;
  const std::string& target = request.path;
  const std::string path = stripQuery(target);

  auto upgrade = request.header("upgrade");
  if (upgrade && toLower(*upgrade) == "websocket") {
    LOOPMUX_LOG(Debug, "WebSocket upgrade detected");
    return {RouteKind::WebSocket, target};
  }

  if (method == "OPTIONS") {
    return {RouteKind::CorsPreflight, target};
  }

  if (sse.enabled) {
    if (method == "GET" && (path == sse.path || path == "/sse")) {
      return {RouteKind::Sse, target};
    }

    // A dedicated messages endpoint or the stream endpoint itself
    if (method == "POST" && (path == sse.message_path || path == "/messages" ||
                             path == sse.path || path == "/mcp")) {
      return {RouteKind::JsonRpcPost, target};
    }

    if (method == "POST" && path == "/register") {
      return {RouteKind::RegistrationPost, target};
    }
  }

  LOOPMUX_LOG(Debug, "unknown request type: {} {}", method, target);
  return {RouteKind::Unknown, target};
}

std::optional<size_t> contentLength(const std::string& raw) {
  auto head_end = findHeadEnd(raw);
  auto info = parseHttpRequest(head_end ? raw.substr(0, *head_end) : raw);
  if (!info) {
    return std::nullopt;
  }

  auto value = info->header("content-length");
  if (!value || value->empty()) {
    return std::nullopt;
  }

  size_t digits = 0;
  while (digits < value->size() &&
         std::isdigit(static_cast<unsigned char>((*value)[digits]))) {
    ++digits;
  }
  if (digits == 0 || digits > 18) {
    return std::nullopt;
  }
  return static_cast<size_t>(std::stoull(value->substr(0, digits)));
}

BodyCheck hasCompleteBody(const std::string& raw) {
  BodyCheck check;

  auto head_end = findHeadEnd(raw);
  if (!head_end) {
    return check;
  }

  auto info = parseHttpRequest(raw.substr(0, *head_end));
  if (info) {
    auto encoding = info->header("transfer-encoding");
    if (encoding && toLower(*encoding).find("chunked") != std::string::npos) {
      return check;
    }
  }

  auto length = contentLength(raw);
  if (!length) {
    check.complete = true;
    check.consumed = *head_end;
    return check;
  }

  if (raw.size() - *head_end < *length) {
    return check;
  }

  check.complete = true;
  check.body = raw.substr(*head_end, *length);
  check.consumed = *head_end + *length;
  return check;
}

}  // namespace http
}  // namespace loopmux
