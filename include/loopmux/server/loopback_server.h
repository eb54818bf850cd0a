#ifndef LOOPMUX_SERVER_LOOPBACK_SERVER_H
#define LOOPMUX_SERVER_LOOPBACK_SERVER_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "loopmux/config/server_config.h"
#include "loopmux/event/event_loop.h"
#include "loopmux/http/response_builder.h"
#include "loopmux/network/tcp_listener.h"
#include "loopmux/result.h"
#include "loopmux/server/connection.h"
#include "loopmux/server/connection_registry.h"
#include "loopmux/server/json_rpc_dispatcher.h"
#include "loopmux/server/sse_session_manager.h"
#include "loopmux/server/websocket_session.h"

namespace loopmux {
namespace server {

// Hooks for the embedding application; any may be left empty
struct ServerCallbacks {
  // SSE stream opened or WebSocket handshake completed
  std::function<void(Connection& client)> on_connect;
  // Decoded WebSocket text message
  std::function<void(Connection& client, const std::string& message)>
      on_message;
  std::function<void(Connection& client, uint16_t code,
                     const std::string& reason)>
      on_disconnect;
  std::function<void(const std::string& message)> on_error;
};

struct ClientInfo {
  uint64_t id{0};
  ClientType type{ClientType::Undetermined};
  ConnectionState state{ConnectionState::Accepted};
  std::optional<std::string> session_id;
  size_t buffered_bytes{0};
  std::string peer_address;
  std::chrono::steady_clock::time_point last_activity;
};

/**
 * Loopback TCP server multiplexing WebSocket, SSE and plain HTTP POST
 * clients on one port.
 *
 * Each accepted connection buffers bytes until its first request head is
 * complete, is classified once, and is then served by the matching handler:
 * SSE and WebSocket connections stay open, every other route gets exactly
 * one response followed by a close.
 *
 * All methods must be called from the dispatcher thread.
 */
class LoopbackServer : public network::TcpListenerCallbacks,
                       public ConnectionCallbacks {
 public:
  using SendCompleteCb =
      std::function<void(const std::optional<std::string>& error)>;

  LoopbackServer(event::Dispatcher& dispatcher,
                 const config::ServerConfig& config,
                 ServerCallbacks callbacks = ServerCallbacks());
  ~LoopbackServer() override;

  LoopbackServer(const LoopbackServer&) = delete;
  LoopbackServer& operator=(const LoopbackServer&) = delete;

  /**
   * @brief Allocate a port in the configured range and start accepting
   *
   * Fails with "No available ports in range <min>-<max>", or with the bind
   * or listen failure for the chosen port.
   */
  VoidResult start();

  // Closes every client (WebSocket clients get 1001) and the listener
  void stop();

  bool isRunning() const { return listener_ != nullptr; }
  uint16_t port() const { return port_; }

  HandlerTable& handlers() { return handlers_; }

  void setWebSocketSessionFactory(WebSocketSessionFactorySharedPtr factory) {
    websocket_factory_ = std::move(factory);
  }
  void setAuthToken(std::optional<std::string> token) {
    auth_token_ = std::move(token);
  }

  // Notification to the active SSE client; false when there is none
  bool notify(const std::string& method, const json& params = json::object());

  // WebSocket clients only; cb gets an error string on failure
  bool sendToClient(uint64_t client_id,
                    const std::string& message,
                    SendCompleteCb cb = nullptr);

  // Sends to every connected WebSocket client; returns how many were sent to
  size_t broadcast(const std::string& message);

  size_t clientCount() const { return registry_.size(); }
  std::vector<ClientInfo> clientsInfo() const;

  bool closeClient(uint64_t client_id,
                   uint16_t code = 1000,
                   const std::string& reason = "");

  /**
   * @brief Periodic WebSocket keepalive
   *
   * Clients heard from within two intervals are pinged; older ones are
   * reported through on_error, closed with 1006 and removed.
   */
  void startPingTimer(std::chrono::milliseconds interval);
  void stopPingTimer();

  SseSessionManager& sseSessions() { return sse_; }
  const config::ServerConfig& config() const { return config_; }

  // network::TcpListenerCallbacks
  void onAccept(network::IoSocketHandlePtr socket) override;
  void onAcceptError(const SystemError& error) override;

  // ConnectionCallbacks
  void onData(Connection& connection) override;
  void onRemoteClose(Connection& connection) override;
  void onTransportError(Connection& connection,
                        const SystemError& error) override;

 private:
  class WebSocketBridge;

  void routeNewRequest(const ConnectionSharedPtr& connection);
  void startWebSocket(const ConnectionSharedPtr& connection,
                      const std::string& path);
  void feedWebSocket(const ConnectionSharedPtr& connection);
  void startSse(const ConnectionSharedPtr& connection,
                const http::RequestInfo& request,
                size_t head_length);
  void startSseHeartbeat(const ConnectionSharedPtr& connection);
  void tryCompletePost(const ConnectionSharedPtr& connection);

  // One response, then close
  void respondAndClose(const ConnectionSharedPtr& connection,
                       const std::string& response);

  // Idempotent teardown: registry, SSE session, heartbeat, socket
  void removeClient(uint64_t client_id);

  void onPingTick();
  void reportError(const std::string& message);

  event::Dispatcher& dispatcher_;
  const config::ServerConfig config_;
  ServerCallbacks callbacks_;

  http::ResponseBuilder responses_;
  SseSessionManager sse_;
  HandlerTable handlers_;
  JsonRpcDispatcher rpc_;
  ConnectionRegistry registry_;

  network::TcpListenerPtr listener_;
  uint16_t port_{0};

  WebSocketSessionFactorySharedPtr websocket_factory_;
  std::optional<std::string> auth_token_;

  event::TimerPtr ping_timer_;
  std::chrono::milliseconds ping_interval_{0};
};

}  // namespace server
}  // namespace loopmux

#endif  // LOOPMUX_SERVER_LOOPBACK_SERVER_H
