#define LOOPMUX_LOG_COMPONENT "server.loopback"

#include "loopmux/server/loopback_server.h"

#include "loopmux/http/request_router.h"
#include "loopmux/logging/log_macros.h"
#include "loopmux/network/port_allocator.h"

namespace loopmux {
namespace server {

// Routes codec output for one WebSocket connection back into the server
class LoopbackServer::WebSocketBridge : public WebSocketSessionCallbacks {
 public:
  WebSocketBridge(LoopbackServer& server, ConnectionSharedPtr connection)
      : server_(server), connection_(std::move(connection)) {}

  void onSend(const std::string& bytes) override {
    const uint64_t id = connection_->id();
    LoopbackServer* server = &server_;
    connection_->write(bytes,
                       [server, id](const std::optional<SystemError>& error) {
                         if (error) {
                           server->reportError("Client " + std::to_string(id) +
                                               " write error: " +
                                               error->message);
                           server->removeClient(id);
                         }
                       });
  }

  void onHandshakeComplete() override {
    connection_->setState(ConnectionState::Connected);
    connection_->touch();
    LOOPMUX_CLIENT_LOG(Info, connection_->id(), "WebSocket connected");
    if (server_.callbacks_.on_connect) {
      server_.callbacks_.on_connect(*connection_);
    }
  }

  void onMessage(const std::string& text) override {
    connection_->touch();
    if (server_.callbacks_.on_message) {
      server_.callbacks_.on_message(*connection_, text);
    }
  }

  void onClose(uint16_t code, const std::string& reason) override {
    LOOPMUX_CLIENT_LOG(Debug, connection_->id(), "WebSocket closed: {} {}",
                       code, reason);
    if (server_.callbacks_.on_disconnect) {
      server_.callbacks_.on_disconnect(*connection_, code, reason);
    }
    server_.removeClient(connection_->id());
  }

  void onError(const std::string& message) override {
    server_.reportError("Client " + std::to_string(connection_->id()) +
                        " error: " + message);
    server_.removeClient(connection_->id());
  }

 private:
  LoopbackServer& server_;
  ConnectionSharedPtr connection_;
};

LoopbackServer::LoopbackServer(event::Dispatcher& dispatcher,
                               const config::ServerConfig& config,
                               ServerCallbacks callbacks)
    : dispatcher_(dispatcher),
      config_(config),
      callbacks_(std::move(callbacks)),
      responses_(config_.auth_header),
      sse_(config_.sse, responses_),
      rpc_(sse_, handlers_, responses_),
      registry_(dispatcher) {}

LoopbackServer::~LoopbackServer() { stop(); }

VoidResult LoopbackServer::start() {
  if (listener_) {
    return makeVoidError(
        Error(jsonrpc::INTERNAL_ERROR, "Server already running"));
  }

  auto port = network::findAvailablePort(
      config_.port_range.min, config_.port_range.max, config_.bind_address);
  if (!port) {
    return makeVoidError(
        Error(jsonrpc::INTERNAL_ERROR,
              "No available ports in range " +
                  std::to_string(config_.port_range.min) + "-" +
                  std::to_string(config_.port_range.max)));
  }

  auto socket = network::TcpListener::createListenSocket(
      config_.bind_address, *port, config_.listen_backlog);
  if (!socket.ok()) {
    return makeVoidError(
        Error(jsonrpc::INTERNAL_ERROR, socket.error_message()));
  }

  listener_ = std::make_unique<network::TcpListener>(
      dispatcher_, std::move(*socket), *this);
  listener_->enable();
  port_ = *port;

  LOOPMUX_LOG(Info, "listening on {}:{}", config_.bind_address, port_);
  return makeVoidSuccess();
}

void LoopbackServer::stop() {
  stopPingTimer();

  for (const auto& connection : registry_.snapshot()) {
    WebSocketSession* session = connection->webSocketSession();
    if (session && session->isHandshakeComplete()) {
      connection->write(
          session->encodeClose(close_code::GOING_AWAY, "Server shutting down"));
    }
    removeClient(connection->id());
  }

  if (listener_) {
    listener_->disable();
    listener_.reset();
    LOOPMUX_LOG(Info, "stopped listening on port {}", port_);
  }
}

bool LoopbackServer::notify(const std::string& method, const json& params) {
  return sse_.notify(method, params);
}

bool LoopbackServer::sendToClient(uint64_t client_id,
                                  const std::string& message,
                                  SendCompleteCb cb) {
  auto connection = registry_.find(client_id);
  if (!connection) {
    if (cb) {
      cb("Client not found: " + std::to_string(client_id));
    }
    return false;
  }

  WebSocketSession* session = connection->webSocketSession();
  if (connection->clientType() != ClientType::WebSocket || !session ||
      !session->isHandshakeComplete()) {
    if (cb) {
      cb("Client " + std::to_string(client_id) +
         " is not a connected WebSocket client");
    }
    return false;
  }

  return connection->write(
      session->encodeText(message),
      [cb](const std::optional<SystemError>& error) {
        if (!cb) {
          return;
        }
        if (error) {
          cb(error->message);
        } else {
          cb(std::nullopt);
        }
      });
}

size_t LoopbackServer::broadcast(const std::string& message) {
  size_t sent = 0;
  for (const auto& connection : registry_.snapshot()) {
    if (connection->clientType() != ClientType::WebSocket ||
        connection->state() != ConnectionState::Connected) {
      continue;
    }
    if (sendToClient(connection->id(), message)) {
      sent++;
    }
  }
  return sent;
}

std::vector<ClientInfo> LoopbackServer::clientsInfo() const {
  std::vector<ClientInfo> result;
  for (const auto& connection : registry_.snapshot()) {
    ClientInfo info;
    info.id = connection->id();
    info.type = connection->clientType();
    info.state = connection->state();
    info.session_id = connection->sessionId();
    info.buffered_bytes = connection->buffer().size();
    info.peer_address = connection->peerAddress();
    info.last_activity = connection->lastActivity();
    result.push_back(std::move(info));
  }
  return result;
}

bool LoopbackServer::closeClient(uint64_t client_id,
                                 uint16_t code,
                                 const std::string& reason) {
  auto connection = registry_.find(client_id);
  if (!connection) {
    return false;
  }

  WebSocketSession* session = connection->webSocketSession();
  if (session && session->isHandshakeComplete() && connection->isOpen()) {
    connection->setState(ConnectionState::Closing);
    connection->write(session->encodeClose(code, reason),
                      [this, client_id](const std::optional<SystemError>&) {
                        removeClient(client_id);
                      });
    return true;
  }

  removeClient(client_id);
  return true;
}

void LoopbackServer::startPingTimer(std::chrono::milliseconds interval) {
  stopPingTimer();
  ping_interval_ = interval;
  ping_timer_ = dispatcher_.createTimer([this]() {
    onPingTick();
    if (ping_timer_) {
      ping_timer_->enableTimer(ping_interval_);
    }
  });
  ping_timer_->enableTimer(ping_interval_);
}

void LoopbackServer::stopPingTimer() {
  if (!ping_timer_) {
    return;
  }
  ping_timer_->disableTimer();
  std::shared_ptr<event::Timer> released(std::move(ping_timer_));
  dispatcher_.post([released]() {});
}

void LoopbackServer::onPingTick() {
  const auto now = std::chrono::steady_clock::now();
  for (const auto& connection : registry_.snapshot()) {
    if (connection->clientType() != ClientType::WebSocket ||
        connection->state() != ConnectionState::Connected) {
      continue;
    }
    WebSocketSession* session = connection->webSocketSession();
    if (!session) {
      continue;
    }

    if (now - connection->lastActivity() < ping_interval_ * 2) {
      connection->write(session->encodePing("ping"));
      continue;
    }

    reportError("Client " + std::to_string(connection->id()) +
                " appears dead, closing");
    connection->write(
        session->encodeClose(close_code::ABNORMAL, "Connection timeout"));
    removeClient(connection->id());
  }
}

void LoopbackServer::onAccept(network::IoSocketHandlePtr socket) {
  auto connection = registry_.add(std::move(socket));
  connection->setCallbacks(*this);
  LOOPMUX_LOG(Debug, "accepted client {} from {}", connection->id(),
              connection->peerAddress());
}

void LoopbackServer::onAcceptError(const SystemError& error) {
  reportError("Failed to accept connection: " + error.message);
}

void LoopbackServer::onData(Connection& connection) {
  // Holds the connection alive while its handlers run
  auto client = registry_.find(connection.id());
  if (!client) {
    return;
  }

  if (!client->routeDetermined()) {
    routeNewRequest(client);
    return;
  }

  switch (client->clientType()) {
    case ClientType::WebSocket:
      feedWebSocket(client);
      break;
    case ClientType::JsonRpcPost:
    case ClientType::RegistrationPost:
      tryCompletePost(client);
      break;
    case ClientType::Sse:
      // The stream is one-way
      LOOPMUX_CLIENT_LOG(Debug, client->id(), "discarding {} bytes on SSE",
                         client->buffer().size());
      client->buffer().clear();
      break;
    default:
      break;
  }
}

void LoopbackServer::onRemoteClose(Connection& connection) {
  LOOPMUX_CLIENT_LOG(Debug, connection.id(), "peer closed its side");
  if (connection.clientType() == ClientType::WebSocket &&
      connection.state() == ConnectionState::Connected &&
      callbacks_.on_disconnect) {
    callbacks_.on_disconnect(connection, close_code::ABNORMAL,
                             "Connection lost");
  }
  removeClient(connection.id());
}

void LoopbackServer::onTransportError(Connection& connection,
                                      const SystemError& error) {
  reportError("Client read error: " + error.message);
  removeClient(connection.id());
}

void LoopbackServer::routeNewRequest(const ConnectionSharedPtr& connection) {
  auto head_end = http::findHeadEnd(connection->buffer());
  if (!head_end) {
    return;
  }

  auto request =
      http::parseHttpRequest(connection->buffer().substr(0, *head_end));
  if (!request) {
    connection->markRouted(ClientType::Unknown);
    respondAndClose(connection, responses_.notFound(std::nullopt));
    return;
  }

  auto route = http::determineRoute(*request, config_.sse);
  connection->markRouted(route.kind);
  LOOPMUX_CLIENT_LOG(Debug, connection->id(), "routed as {} {}",
                     http::routeKindToString(route.kind), route.path);

  switch (route.kind) {
    case ClientType::WebSocket:
      startWebSocket(connection, route.path);
      break;
    case ClientType::Sse:
      startSse(connection, *request, *head_end);
      break;
    case ClientType::JsonRpcPost:
    case ClientType::RegistrationPost:
      tryCompletePost(connection);
      break;
    case ClientType::CorsPreflight:
      respondAndClose(connection, responses_.optionsResponse());
      break;
    default:
      respondAndClose(connection,
                      responses_.unknownRoute(route.path, config_.sse));
      break;
  }
}

void LoopbackServer::startWebSocket(const ConnectionSharedPtr& connection,
                                    const std::string& path) {
  WebSocketSessionPtr session;
  if (websocket_factory_) {
    session = websocket_factory_->createSession(auth_token_);
  }
  if (!session) {
    LOOPMUX_CLIENT_LOG(Warning, connection->id(),
                       "WebSocket upgrade without a session factory");
    respondAndClose(connection, responses_.notFound(path));
    return;
  }

  connection->setWebSocketSession(std::move(session));
  // The codec consumes the upgrade request itself as the handshake
  feedWebSocket(connection);
}

void LoopbackServer::feedWebSocket(const ConnectionSharedPtr& connection) {
  WebSocketSession* session = connection->webSocketSession();
  if (!session || !connection->isOpen()) {
    return;
  }
  WebSocketBridge bridge(*this, connection);
  session->processData(connection->buffer(), bridge);
}

void LoopbackServer::startSse(const ConnectionSharedPtr& connection,
                              const http::RequestInfo& request,
                              size_t head_length) {
  std::string head = sse_.handleSseConnect(connection, request);
  connection->buffer().erase(0, head_length);

  ConnectionWeakPtr weak = connection;
  connection->write(head, [this,
                           weak](const std::optional<SystemError>& error) {
    auto client = weak.lock();
    if (!client) {
      return;
    }
    if (error) {
      LOOPMUX_CLIENT_LOG(Error, client->id(), "failed to send SSE head: {}",
                         error->message);
      removeClient(client->id());
      return;
    }

    client->setState(ConnectionState::Connected);
    sse_.sendEndpointEvent(*client);
    if (callbacks_.on_connect) {
      callbacks_.on_connect(*client);
    }
    if (client->isOpen()) {
      startSseHeartbeat(client);
    }
  });
}

void LoopbackServer::startSseHeartbeat(const ConnectionSharedPtr& connection) {
  const uint64_t id = connection->id();
  connection->startHeartbeat(config_.sse.heartbeat_interval, [this, id]() {
    auto client = registry_.find(id);
    if (!client || !client->isOpen()) {
      return;
    }
    sse_.sendHeartbeat(*client, [this, id](
                                    const std::optional<SystemError>& error) {
      if (error) {
        LOOPMUX_CLIENT_LOG(Debug, id, "heartbeat failed: {}", error->message);
        removeClient(id);
      }
    });
  });
}

void LoopbackServer::tryCompletePost(const ConnectionSharedPtr& connection) {
  if (connection->state() == ConnectionState::Closing) {
    return;
  }
  auto check = http::hasCompleteBody(connection->buffer());
  if (!check.complete) {
    return;
  }

  std::string request = connection->buffer().substr(0, check.consumed);
  connection->buffer().erase(0, check.consumed);

  std::string response = connection->clientType() == ClientType::JsonRpcPost
                             ? rpc_.handlePost(request)
                             : rpc_.handleRegister(request);
  respondAndClose(connection, response);
}

void LoopbackServer::respondAndClose(const ConnectionSharedPtr& connection,
                                     const std::string& response) {
  connection->setState(ConnectionState::Closing);
  const uint64_t id = connection->id();
  connection->write(response,
                    [this, id](const std::optional<SystemError>& error) {
                      if (error) {
                        LOOPMUX_LOG(Error,
                                    "failed to send response to client {}: {}",
                                    id, error->message);
                      }
                      removeClient(id);
                    });
}

void LoopbackServer::removeClient(uint64_t client_id) {
  auto connection = registry_.find(client_id);
  if (!connection) {
    return;
  }
  if (connection->clientType() == ClientType::Sse) {
    sse_.cleanupClient(client_id);
  }
  connection->stopHeartbeat();
  connection->close();
  registry_.remove(client_id);
}

void LoopbackServer::reportError(const std::string& message) {
  LOOPMUX_LOG(Error, "{}", message);
  if (callbacks_.on_error) {
    callbacks_.on_error(message);
  }
}

}  // namespace server
}  // namespace loopmux
