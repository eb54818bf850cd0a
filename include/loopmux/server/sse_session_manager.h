#ifndef LOOPMUX_SERVER_SSE_SESSION_MANAGER_H
#define LOOPMUX_SERVER_SSE_SESSION_MANAGER_H

#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include "loopmux/config/server_config.h"
#include "loopmux/http/request_router.h"
#include "loopmux/http/response_builder.h"
#include "loopmux/json.h"
#include "loopmux/server/connection.h"

namespace loopmux {
namespace server {

/**
 * @brief Owner of the single active SSE subscriber
 *
 * Holds the session id, the process-wide event id counter and a weak
 * reference to the current SSE connection. A newer SSE connection replaces
 * the reference; the older socket is reclaimed by its own EOF path.
 *
 * The counter is never reset on disconnect so a later session can resume
 * from ids issued by an earlier one.
 *
 * Not thread safe: every call must come from the dispatcher thread.
 */
class SseSessionManager {
 public:
  static constexpr const char* kHeartbeatFrame = ":\n\n";

  SseSessionManager(const config::SseConfig& config,
                    const http::ResponseBuilder& responses);

  /**
   * @brief Take over a classified SSE request
   *
   * Adopts Mcp-Session-Id when supplied, otherwise generates one. A positive
   * integer Last-Event-ID above the counter becomes the counter value so the
   * next event continues the sequence; the counter never moves backward.
   *
   * @return response head to write to the connection
   */
  std::string handleSseConnect(const ConnectionSharedPtr& connection,
                               const http::RequestInfo& request);

  // "<message_path>?sessionId=<id>" sent raw as the first event
  bool sendEndpointEvent(Connection& connection);
  std::string endpointUrl() const;

  // JSON-encodes payload into one event with the next id
  bool sendEvent(Connection& connection,
                 const json& payload,
                 const std::string& event_type = "");

  // Comment frame; does not consume an event id
  bool sendHeartbeat(Connection& connection,
                     Connection::WriteCompleteCb cb = nullptr);

  // No-op returning false without an active SSE client
  bool notify(const std::string& method, const json& params = json::object());

  // Clears the session if connection_id is the active client
  void cleanupClient(uint64_t connection_id);

  // Null until the connection reaches Connected (SSE head written)
  ConnectionSharedPtr activeClient() const;

  const std::optional<std::string>& sessionId() const { return session_id_; }
  void adoptSessionId(const std::string& session_id);

  // Current session id, or a fresh one without storing it
  std::string currentOrNewSessionId();

  uint64_t eventIdCounter() const { return event_id_counter_; }

  static std::string formatEvent(uint64_t id,
                                 const std::string& data,
                                 const std::string& event_type);

  // Random RFC 4122 version 4 UUID
  static std::string generateSessionId(std::mt19937& random);

 private:
  bool emit(Connection& connection,
            const std::string& data,
            const std::string& event_type);

  const config::SseConfig& config_;
  const http::ResponseBuilder& responses_;

  std::optional<std::string> session_id_;
  uint64_t event_id_counter_{0};
  ConnectionWeakPtr client_;
  uint64_t client_id_{0};

  std::mt19937 random_;
};

}  // namespace server
}  // namespace loopmux

#endif  // LOOPMUX_SERVER_SSE_SESSION_MANAGER_H
