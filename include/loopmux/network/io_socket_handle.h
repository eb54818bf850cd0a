#ifndef LOOPMUX_NETWORK_IO_SOCKET_HANDLE_H
#define LOOPMUX_NETWORK_IO_SOCKET_HANDLE_H

#include <cstdint>
#include <memory>
#include <string>

#include "loopmux/io_result.h"

namespace loopmux {
namespace network {

class IoSocketHandle;
using IoSocketHandlePtr = std::unique_ptr<IoSocketHandle>;

/**
 * Owning wrapper around a non-blocking IPv4 stream socket.
 *
 * The descriptor is closed on destruction. All operations report failures
 * through IoResult and never throw.
 */
class IoSocketHandle {
 public:
  static constexpr int INVALID_FD = -1;

  explicit IoSocketHandle(int fd = INVALID_FD);
  ~IoSocketHandle();

  IoSocketHandle(const IoSocketHandle&) = delete;
  IoSocketHandle& operator=(const IoSocketHandle&) = delete;

  // New non-blocking, close-on-exec TCP socket
  static IoResult<IoSocketHandlePtr> createTcp();

  int fd() const { return fd_; }
  bool isOpen() const { return fd_ != INVALID_FD; }

  IoVoidResult close();

  // Appends up to max_length bytes to buffer. Zero means orderly shutdown.
  IoCallResult read(std::string& buffer, size_t max_length = 16384);

  IoCallResult write(const char* data, size_t length);

  IoVoidResult setReuseAddress(bool enable);

  IoVoidResult bind(const std::string& address, uint16_t port);

  IoVoidResult listen(int backlog);

  IoResult<IoSocketHandlePtr> accept();

  // Port the socket is bound to
  IoResult<uint16_t> localPort() const;

  // Peer address as "ip:port"
  IoResult<std::string> peerAddress() const;

 private:
  int fd_;
};

}  // namespace network
}  // namespace loopmux

#endif  // LOOPMUX_NETWORK_IO_SOCKET_HANDLE_H
