#include "loopmux/network/io_socket_handle.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>

namespace loopmux {
namespace network {

namespace {

IoVoidResult fillAddress(const std::string& address,
                         uint16_t port,
                         sockaddr_in& addr) {
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
    return IoVoidResult::error(EINVAL, "Invalid IPv4 address: " + address);
  }
  return IoVoidResult::success();
}

}  // namespace

IoSocketHandle::IoSocketHandle(int fd) : fd_(fd) {}

IoSocketHandle::~IoSocketHandle() {
  if (isOpen()) {
    close();
  }
}

IoResult<IoSocketHandlePtr> IoSocketHandle::createTcp() {
  int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return IoResult<IoSocketHandlePtr>::from_errno(errno);
  }
  return IoResult<IoSocketHandlePtr>::success(
      std::make_unique<IoSocketHandle>(fd));
}

IoVoidResult IoSocketHandle::close() {
  if (!isOpen()) {
    return IoVoidResult::success();
  }
  int result = ::close(fd_);
  fd_ = INVALID_FD;
  if (result != 0) {
    return IoVoidResult::from_errno(errno);
  }
  return IoVoidResult::success();
}

IoCallResult IoSocketHandle::read(std::string& buffer, size_t max_length) {
  if (!isOpen()) {
    return IoCallResult::error(EBADF, "Socket is closed");
  }

  char chunk[16384];
  size_t to_read = std::min(max_length, sizeof(chunk));
  ssize_t result;
  do {
    result = ::recv(fd_, chunk, to_read, 0);
  } while (result < 0 && errno == EINTR);

  if (result < 0) {
    return IoCallResult::from_errno(errno);
  }
  buffer.append(chunk, static_cast<size_t>(result));
  return IoCallResult::success(static_cast<size_t>(result));
}

IoCallResult IoSocketHandle::write(const char* data, size_t length) {
  if (!isOpen()) {
    return IoCallResult::error(EBADF, "Socket is closed");
  }

  ssize_t result;
  do {
    result = ::send(fd_, data, length, MSG_NOSIGNAL);
  } while (result < 0 && errno == EINTR);

  if (result < 0) {
    return IoCallResult::from_errno(errno);
  }
  return IoCallResult::success(static_cast<size_t>(result));
}

IoVoidResult IoSocketHandle::setReuseAddress(bool enable) {
  int value = enable ? 1 : 0;
  if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &value, sizeof(value)) !=
      0) {
    return IoVoidResult::from_errno(errno);
  }
  return IoVoidResult::success();
}

IoVoidResult IoSocketHandle::bind(const std::string& address, uint16_t port) {
  sockaddr_in addr;
  auto filled = fillAddress(address, port, addr);
  if (!filled.ok()) {
    return filled;
  }
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    return IoVoidResult::from_errno(errno);
  }
  return IoVoidResult::success();
}

IoVoidResult IoSocketHandle::listen(int backlog) {
  if (::listen(fd_, backlog) != 0) {
    return IoVoidResult::from_errno(errno);
  }
  return IoVoidResult::success();
}

IoResult<IoSocketHandlePtr> IoSocketHandle::accept() {
  sockaddr_in addr;
  socklen_t addr_len = sizeof(addr);
  int new_fd;
  do {
    new_fd = ::accept4(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len,
                       SOCK_NONBLOCK | SOCK_CLOEXEC);
  } while (new_fd < 0 && errno == EINTR);

  if (new_fd < 0) {
    return IoResult<IoSocketHandlePtr>::from_errno(errno);
  }
  return IoResult<IoSocketHandlePtr>::success(
      std::make_unique<IoSocketHandle>(new_fd));
}

IoResult<uint16_t> IoSocketHandle::localPort() const {
  sockaddr_in addr;
  socklen_t addr_len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len) != 0) {
    return IoResult<uint16_t>::from_errno(errno);
  }
  return IoResult<uint16_t>::success(ntohs(addr.sin_port));
}

IoResult<std::string> IoSocketHandle::peerAddress() const {
  sockaddr_in addr;
  socklen_t addr_len = sizeof(addr);
  if (::getpeername(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len) != 0) {
    return IoResult<std::string>::from_errno(errno);
  }
  char ip[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
  return IoResult<std::string>::success(std::string(ip) + ":" +
                                        std::to_string(ntohs(addr.sin_port)));
}

}  // namespace network
}  // namespace loopmux
