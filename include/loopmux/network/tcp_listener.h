#ifndef LOOPMUX_NETWORK_TCP_LISTENER_H
#define LOOPMUX_NETWORK_TCP_LISTENER_H

#include <memory>
#include <string>

#include "loopmux/event/event_loop.h"
#include "loopmux/network/io_socket_handle.h"

namespace loopmux {
namespace network {

class TcpListenerCallbacks {
 public:
  virtual ~TcpListenerCallbacks() = default;

  // Ownership of the accepted non-blocking socket passes to the callee
  virtual void onAccept(IoSocketHandlePtr socket) = 0;

  // accept() failed with something other than EAGAIN
  virtual void onAcceptError(const SystemError& error) = 0;
};

/**
 * Accepts connections on a listening socket from the dispatcher thread.
 */
class TcpListener {
 public:
  TcpListener(event::Dispatcher& dispatcher,
              IoSocketHandlePtr socket,
              TcpListenerCallbacks& cb,
              uint32_t max_connections_per_event = 64);
  ~TcpListener();

  // Creates, binds and listens in one step
  static IoResult<IoSocketHandlePtr> createListenSocket(
      const std::string& address, uint16_t port, int backlog);

  void enable();
  void disable();
  bool enabled() const { return enabled_; }

  uint16_t port() const { return port_; }

 private:
  void onSocketEvent(uint32_t events);
  bool doAccept();

  event::Dispatcher& dispatcher_;
  IoSocketHandlePtr socket_;
  TcpListenerCallbacks& cb_;
  uint32_t max_connections_per_event_;
  event::FileEventPtr file_event_;
  bool enabled_{false};
  uint16_t port_{0};
};

using TcpListenerPtr = std::unique_ptr<TcpListener>;

}  // namespace network
}  // namespace loopmux

#endif  // LOOPMUX_NETWORK_TCP_LISTENER_H
