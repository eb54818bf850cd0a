#define LOOPMUX_LOG_COMPONENT "network.listener"

#include "loopmux/network/tcp_listener.h"

#include "loopmux/logging/log_macros.h"

namespace loopmux {
namespace network {

TcpListener::TcpListener(event::Dispatcher& dispatcher,
                         IoSocketHandlePtr socket,
                         TcpListenerCallbacks& cb,
                         uint32_t max_connections_per_event)
    : dispatcher_(dispatcher),
      socket_(std::move(socket)),
      cb_(cb),
      max_connections_per_event_(max_connections_per_event) {
  auto port = socket_->localPort();
  if (port.ok()) {
    port_ = *port;
  }

  // Created disabled; enable() starts accepting
  file_event_ = dispatcher_.createFileEvent(
      socket_->fd(), [this](uint32_t events) { onSocketEvent(events); }, 0);
}

TcpListener::~TcpListener() {
  disable();
  file_event_.reset();
  socket_->close();
}

IoResult<IoSocketHandlePtr> TcpListener::createListenSocket(
    const std::string& address, uint16_t port, int backlog) {
  auto socket = IoSocketHandle::createTcp();
  if (!socket.ok()) {
    return socket;
  }

  auto reuse = (*socket)->setReuseAddress(true);
  if (!reuse.ok()) {
    LOOPMUX_LOG(Warning, "SO_REUSEADDR failed: {}", reuse.error_message());
  }

  auto bound = (*socket)->bind(address, port);
  if (!bound.ok()) {
    return IoResult<IoSocketHandlePtr>::error(
        bound.error_code(), "Failed to bind to port " + std::to_string(port) +
                                ": " + bound.error_message());
  }

  auto listening = (*socket)->listen(backlog);
  if (!listening.ok()) {
    return IoResult<IoSocketHandlePtr>::error(
        listening.error_code(), "Failed to listen on port " +
                                    std::to_string(port) + ": " +
                                    listening.error_message());
  }
  return socket;
}

void TcpListener::enable() {
  if (enabled_) {
    return;
  }
  enabled_ = true;
  file_event_->setEnabled(event::FileReady::Read);
}

void TcpListener::disable() {
  if (!enabled_) {
    return;
  }
  enabled_ = false;
  file_event_->setEnabled(0);
}

void TcpListener::onSocketEvent(uint32_t events) {
  if (!(events & event::FileReady::Read)) {
    return;
  }

  // Batch accepts; level triggering picks up whatever is left next iteration
  uint32_t accepted = 0;
  while (enabled_ && accepted < max_connections_per_event_) {
    if (!doAccept()) {
      break;
    }
    accepted++;
  }
}

bool TcpListener::doAccept() {
  auto result = socket_->accept();
  if (!result.ok()) {
    if (!result.wouldBlock()) {
      LOOPMUX_LOG(Error, "accept failed: {}", result.error_message());
      cb_.onAcceptError(*result.error_info);
    }
    return false;
  }

  cb_.onAccept(std::move(*result));
  return true;
}

}  // namespace network
}  // namespace loopmux
