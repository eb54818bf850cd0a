#define LOOPMUX_LOG_COMPONENT "network.port_allocator"

#include "loopmux/network/port_allocator.h"

#include <algorithm>
#include <numeric>
#include <vector>

#include "loopmux/logging/log_macros.h"
#include "loopmux/network/io_socket_handle.h"

namespace loopmux {
namespace network {

bool isPortBindable(uint16_t port, const std::string& address) {
  auto socket = IoSocketHandle::createTcp();
  if (!socket.ok()) {
    LOOPMUX_LOG(Warning, "probe socket creation failed: {}",
                socket.error_message());
    return false;
  }
  auto bound = (*socket)->bind(address, port);
  (*socket)->close();
  return bound.ok();
}

std::optional<uint16_t> findAvailablePort(int min_port,
                                          int max_port,
                                          const std::string& address,
                                          std::mt19937& random) {
  min_port = std::max(min_port, 1);
  max_port = std::min(max_port, 65535);
  if (min_port > max_port) {
    LOOPMUX_LOG(Warning, "empty port range {}-{}", min_port, max_port);
    return std::nullopt;
  }

  std::vector<int> candidates(static_cast<size_t>(max_port - min_port + 1));
  std::iota(candidates.begin(), candidates.end(), min_port);
  std::shuffle(candidates.begin(), candidates.end(), random);

  for (int port : candidates) {
    if (isPortBindable(static_cast<uint16_t>(port), address)) {
      LOOPMUX_LOG(Debug, "selected port {}", port);
      return static_cast<uint16_t>(port);
    }
  }

  LOOPMUX_LOG(Warning, "no bindable port in range {}-{}", min_port, max_port);
  return std::nullopt;
}

std::optional<uint16_t> findAvailablePort(int min_port,
                                          int max_port,
                                          const std::string& address) {
  std::mt19937 random(std::random_device{}());
  return findAvailablePort(min_port, max_port, address, random);
}

}  // namespace network
}  // namespace loopmux
