#ifndef LOOPMUX_SERVER_CONNECTION_H
#define LOOPMUX_SERVER_CONNECTION_H

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "loopmux/event/event_loop.h"
#include "loopmux/http/request_router.h"
#include "loopmux/io_result.h"
#include "loopmux/network/io_socket_handle.h"

namespace loopmux {
namespace server {

class WebSocketSession;

// A connection's client type is its route
using ClientType = http::RouteKind;

enum class ConnectionState { Accepted, Routed, Connected, Closing, Closed };

const char* connectionStateToString(ConnectionState state);

class Connection;
using ConnectionSharedPtr = std::shared_ptr<Connection>;
using ConnectionWeakPtr = std::weak_ptr<Connection>;

class ConnectionCallbacks {
 public:
  virtual ~ConnectionCallbacks() = default;

  // New bytes were appended to connection.buffer()
  virtual void onData(Connection& connection) = 0;

  // Peer closed its side
  virtual void onRemoteClose(Connection& connection) = 0;

  // Read or write failed; the connection is no longer usable
  virtual void onTransportError(Connection& connection,
                                const SystemError& error) = 0;
};

/**
 * One accepted socket with its routing and session state.
 *
 * Lives on the dispatcher thread. Writes are queued and flushed as the
 * socket becomes writable; each write may carry a completion callback that
 * receives std::nullopt on success or the error that aborted it.
 */
class Connection : public std::enable_shared_from_this<Connection> {
 public:
  using WriteCompleteCb =
      std::function<void(const std::optional<SystemError>& error)>;

  Connection(uint64_t id,
             event::Dispatcher& dispatcher,
             network::IoSocketHandlePtr socket);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  uint64_t id() const { return id_; }
  event::Dispatcher& dispatcher() { return dispatcher_; }

  // Starts watching the socket for reads
  void setCallbacks(ConnectionCallbacks& callbacks);

  ConnectionState state() const { return state_; }
  void setState(ConnectionState state) { state_ = state; }

  bool routeDetermined() const { return route_determined_; }
  ClientType clientType() const { return client_type_; }

  // Fixes the client type. Returns false if already routed.
  bool markRouted(ClientType type);

  const std::optional<std::string>& sessionId() const { return session_id_; }
  void setSessionId(std::optional<std::string> session_id) {
    session_id_ = std::move(session_id);
  }

  // Bytes received and not yet consumed
  std::string& buffer() { return buffer_; }
  const std::string& buffer() const { return buffer_; }

  /**
   * @brief Queue bytes for sending
   * @return false if the connection is closed or the write failed at once;
   *         the callback, if any, has then already been told
   */
  bool write(const std::string& data, WriteCompleteCb cb = nullptr);

  size_t pendingWriteBytes() const;

  bool isOpen() const { return socket_ && socket_->isOpen(); }

  /**
   * @brief Release the socket and heartbeat timer
   *
   * Idempotent. Pending write callbacks are dropped. Event registrations are
   * released on the next loop iteration so a close from inside one of this
   * connection's own callbacks is safe.
   */
  void close();

  // Periodic timer owned by this connection; replaces any previous one
  void startHeartbeat(std::chrono::milliseconds interval,
                      std::function<void()> on_tick);
  void stopHeartbeat();
  bool hasHeartbeat() const { return heartbeat_timer_ != nullptr; }

  std::chrono::steady_clock::time_point lastActivity() const {
    return last_activity_;
  }
  void touch();

  const std::string& peerAddress() const { return peer_address_; }

  void setWebSocketSession(std::unique_ptr<WebSocketSession> session);
  WebSocketSession* webSocketSession() { return websocket_session_.get(); }

 private:
  struct PendingWrite {
    std::string data;
    size_t offset{0};
    WriteCompleteCb cb;
  };

  void onFileEvent(uint32_t events);
  void onReadReady();
  void flushWrites();
  void failPendingWrites(const SystemError& error);
  void updateEvents();

  const uint64_t id_;
  event::Dispatcher& dispatcher_;
  network::IoSocketHandlePtr socket_;
  event::FileEventPtr file_event_;
  ConnectionCallbacks* callbacks_{nullptr};

  ConnectionState state_{ConnectionState::Accepted};
  bool route_determined_{false};
  ClientType client_type_{ClientType::Undetermined};
  std::optional<std::string> session_id_;

  std::string buffer_;
  std::deque<PendingWrite> write_queue_;
  bool flushing_{false};

  std::unique_ptr<event::Timer> heartbeat_timer_;
  std::chrono::milliseconds heartbeat_interval_{0};
  std::function<void()> heartbeat_cb_;

  std::chrono::steady_clock::time_point last_activity_;
  std::string peer_address_;

  std::unique_ptr<WebSocketSession> websocket_session_;
};

}  // namespace server
}  // namespace loopmux

#endif  // LOOPMUX_SERVER_CONNECTION_H
