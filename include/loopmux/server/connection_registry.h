#ifndef LOOPMUX_SERVER_CONNECTION_REGISTRY_H
#define LOOPMUX_SERVER_CONNECTION_REGISTRY_H

#include <cstdint>
#include <functional>
#include <map>
#include <vector>

#include "loopmux/event/event_loop.h"
#include "loopmux/network/io_socket_handle.h"
#include "loopmux/server/connection.h"

namespace loopmux {
namespace server {

/**
 * Live connections keyed by id.
 *
 * Ids start at 1 and are never reused within one registry. Removal drops
 * the registry's reference on the next loop iteration, so a connection may
 * remove itself from inside its own callbacks.
 */
class ConnectionRegistry {
 public:
  explicit ConnectionRegistry(event::Dispatcher& dispatcher);

  ConnectionSharedPtr add(network::IoSocketHandlePtr socket);

  // Idempotent
  bool remove(uint64_t id);

  ConnectionSharedPtr find(uint64_t id) const;

  size_t size() const { return connections_.size(); }
  bool empty() const { return connections_.empty(); }

  // Copy of the current set; safe to iterate while callbacks mutate the map
  std::vector<ConnectionSharedPtr> snapshot() const;

  void forEach(const std::function<void(Connection&)>& fn) const;

  // Closes and removes everything
  void clear();

 private:
  event::Dispatcher& dispatcher_;
  std::map<uint64_t, ConnectionSharedPtr> connections_;
  uint64_t next_id_{1};
};

}  // namespace server
}  // namespace loopmux

#endif  // LOOPMUX_SERVER_CONNECTION_REGISTRY_H
