#ifndef LOOPMUX_SERVER_WEBSOCKET_SESSION_H
#define LOOPMUX_SERVER_WEBSOCKET_SESSION_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace loopmux {
namespace server {

class WebSocketSessionCallbacks {
 public:
  virtual ~WebSocketSessionCallbacks() = default;

  // Bytes the codec wants on the wire (handshake response, pong, close echo)
  virtual void onSend(const std::string& bytes) = 0;

  virtual void onHandshakeComplete() = 0;

  virtual void onMessage(const std::string& text) = 0;

  // Peer sent a close frame
  virtual void onClose(uint16_t code, const std::string& reason) = 0;

  // Handshake rejected or protocol violation
  virtual void onError(const std::string& message) = 0;
};

/**
 * WebSocket handshake and frame codec for one connection.
 *
 * The server treats it as a black box: raw bytes go in, decoded messages and
 * bytes to send come out through the callbacks.
 */
class WebSocketSession {
 public:
  virtual ~WebSocketSession() = default;

  // Consumes what it can from buffer, leaving any partial frame in place
  virtual void processData(std::string& buffer,
                           WebSocketSessionCallbacks& callbacks) = 0;

  virtual bool isHandshakeComplete() const = 0;

  virtual std::string encodeText(const std::string& text) = 0;
  virtual std::string encodePing(const std::string& payload) = 0;
  virtual std::string encodeClose(uint16_t code, const std::string& reason) = 0;
};

using WebSocketSessionPtr = std::unique_ptr<WebSocketSession>;

class WebSocketSessionFactory {
 public:
  virtual ~WebSocketSessionFactory() = default;

  // auth_token, when set, must be presented by the client during the handshake
  virtual WebSocketSessionPtr createSession(
      const std::optional<std::string>& auth_token) = 0;
};

using WebSocketSessionFactorySharedPtr =
    std::shared_ptr<WebSocketSessionFactory>;

// Close codes used by the server
namespace close_code {
constexpr uint16_t GOING_AWAY = 1001;
constexpr uint16_t ABNORMAL = 1006;
}  // namespace close_code

}  // namespace server
}  // namespace loopmux

#endif  // LOOPMUX_SERVER_WEBSOCKET_SESSION_H
