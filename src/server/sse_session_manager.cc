#define LOOPMUX_LOG_COMPONENT "server.sse"

#include "loopmux/server/sse_session_manager.h"

#include <cctype>
#include <sstream>

#include "loopmux/logging/log_macros.h"

namespace loopmux {
namespace server {

namespace {

std::optional<uint64_t> parsePositiveInteger(const std::string& value) {
  if (value.empty() || value.size() > 19) {
    return std::nullopt;
  }
  for (char c : value) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
  }
  uint64_t parsed = std::stoull(value);
  if (parsed == 0) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace

SseSessionManager::SseSessionManager(const config::SseConfig& config,
                                     const http::ResponseBuilder& responses)
    : config_(config),
      responses_(responses),
      random_(std::random_device{}()) {}

std::string SseSessionManager::handleSseConnect(
    const ConnectionSharedPtr& connection, const http::RequestInfo& request) {
  auto previous = activeClient();
  if (previous && previous->id() != connection->id()) {
    LOOPMUX_LOG(Debug, "replacing SSE client {} with {}", previous->id(),
                connection->id());
  }

  auto requested_session = request.header("mcp-session-id");
  if (requested_session) {
    session_id_ = *requested_session;
    LOOPMUX_LOG(Debug, "using client-provided session id {}", *session_id_);
  } else {
    session_id_ = generateSessionId(random_);
  }

  auto last_event_id = request.header("last-event-id");
  if (last_event_id) {
    auto resume_from = parsePositiveInteger(*last_event_id);
    if (resume_from && *resume_from > event_id_counter_) {
      event_id_counter_ = *resume_from;
      LOOPMUX_LOG(Debug, "resuming from event id {}", *resume_from);
    }
  }

  client_ = connection;
  client_id_ = connection->id();
  connection->setSessionId(session_id_);

  LOOPMUX_LOG(Info, "SSE client {} connected with session {}",
              connection->id(), *session_id_);
  return responses_.sseHead(session_id_);
}

std::string SseSessionManager::endpointUrl() const {
  std::string url = config_.message_path;
  if (session_id_) {
    url += "?sessionId=" + *session_id_;
  }
  return url;
}

bool SseSessionManager::sendEndpointEvent(Connection& connection) {
  return emit(connection, endpointUrl(), "endpoint");
}

bool SseSessionManager::sendEvent(Connection& connection,
                                  const json& payload,
                                  const std::string& event_type) {
  return emit(connection, payload.dump(), event_type);
}

bool SseSessionManager::emit(Connection& connection,
                             const std::string& data,
                             const std::string& event_type) {
  if (!connection.isOpen()) {
    return false;
  }

  event_id_counter_++;
  const uint64_t id = event_id_counter_;
  return connection.write(
      formatEvent(id, data, event_type),
      [id](const std::optional<SystemError>& error) {
        if (error) {
          LOOPMUX_LOG(Error, "failed to send SSE event {}: {}", id,
                      error->message);
        }
      });
}

bool SseSessionManager::sendHeartbeat(Connection& connection,
                                      Connection::WriteCompleteCb cb) {
  return connection.write(kHeartbeatFrame, std::move(cb));
}

bool SseSessionManager::notify(const std::string& method, const json& params) {
  auto client = activeClient();
  if (!client) {
    return false;
  }
  return sendEvent(*client, jsonrpc::makeNotification(method, params),
                   "notification");
}

void SseSessionManager::cleanupClient(uint64_t connection_id) {
  if (client_id_ == 0 || client_id_ != connection_id) {
    return;
  }
  LOOPMUX_LOG(Debug, "cleaning up SSE client {}", connection_id);
  client_.reset();
  client_id_ = 0;
  session_id_.reset();
}

ConnectionSharedPtr SseSessionManager::activeClient() const {
  auto client = client_.lock();
  if (!client || !client->isOpen() ||
      client->state() != ConnectionState::Connected) {
    return nullptr;
  }
  return client;
}

void SseSessionManager::adoptSessionId(const std::string& session_id) {
  session_id_ = session_id;
}

std::string SseSessionManager::currentOrNewSessionId() {
  if (session_id_) {
    return *session_id_;
  }
  return generateSessionId(random_);
}

std::string SseSessionManager::formatEvent(uint64_t id,
                                           const std::string& data,
                                           const std::string& event_type) {
  std::ostringstream out;
  if (!event_type.empty()) {
    out << "event: " << event_type << "\n";
  }
  out << "id: " << id << "\n";

  // Multi-line payloads become one data field per line
  std::istringstream lines(data);
  std::string line;
  bool wrote_data = false;
  while (std::getline(lines, line)) {
    out << "data: " << line << "\n";
    wrote_data = true;
  }
  if (!wrote_data) {
    out << "data: \n";
  }

  out << "\n";
  return out.str();
}

std::string SseSessionManager::generateSessionId(std::mt19937& random) {
  std::uniform_int_distribution<int> nibble(0, 15);
  static const char* kHex = "0123456789abcdef";

  std::string uuid;
  uuid.reserve(36);
  for (int i = 0; i < 36; ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      uuid += '-';
    } else if (i == 14) {
      uuid += '4';
    } else if (i == 19) {
      // Variant bits 10xx
      uuid += kHex[(nibble(random) & 0x3) | 0x8];
    } else {
      uuid += kHex[nibble(random)];
    }
  }
  return uuid;
}

}  // namespace server
}  // namespace loopmux
