#ifndef LOOPMUX_NETWORK_PORT_ALLOCATOR_H
#define LOOPMUX_NETWORK_PORT_ALLOCATOR_H

#include <cstdint>
#include <optional>
#include <random>
#include <string>

namespace loopmux {
namespace network {

/**
 * Picks a bindable TCP port from [min_port, max_port].
 *
 * Candidates are tried once each in a uniformly shuffled order so that
 * concurrently starting instances rarely race for the same port. A candidate
 * is accepted when a bind probe on the address succeeds; the probe socket is
 * released immediately.
 *
 * Returns std::nullopt when every candidate is taken or the range is empty
 * or inverted.
 */
std::optional<uint16_t> findAvailablePort(int min_port,
                                          int max_port,
                                          const std::string& address,
                                          std::mt19937& random);

std::optional<uint16_t> findAvailablePort(
    int min_port,
    int max_port,
    const std::string& address = "127.0.0.1");

// Single bind-and-release probe
bool isPortBindable(uint16_t port, const std::string& address = "127.0.0.1");

}  // namespace network
}  // namespace loopmux

#endif  // LOOPMUX_NETWORK_PORT_ALLOCATOR_H
