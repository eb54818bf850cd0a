#define LOOPMUX_LOG_COMPONENT "server.registry"

#include "loopmux/server/connection_registry.h"

#include "loopmux/logging/log_macros.h"

namespace loopmux {
namespace server {

ConnectionRegistry::ConnectionRegistry(event::Dispatcher& dispatcher)
    : dispatcher_(dispatcher) {}

ConnectionSharedPtr ConnectionRegistry::add(
    network::IoSocketHandlePtr socket) {
  const uint64_t id = next_id_++;
  auto connection =
      std::make_shared<Connection>(id, dispatcher_, std::move(socket));
  connections_.emplace(id, connection);
  LOOPMUX_LOG(Debug, "registered connection {} from {}", id,
              connection->peerAddress());
  return connection;
}

bool ConnectionRegistry::remove(uint64_t id) {
  auto it = connections_.find(id);
  if (it == connections_.end()) {
    return false;
  }
  ConnectionSharedPtr released = std::move(it->second);
  connections_.erase(it);
  dispatcher_.post([released]() {});
  LOOPMUX_LOG(Debug, "removed connection {}", id);
  return true;
}

ConnectionSharedPtr ConnectionRegistry::find(uint64_t id) const {
  auto it = connections_.find(id);
  if (it == connections_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<ConnectionSharedPtr> ConnectionRegistry::snapshot() const {
  std::vector<ConnectionSharedPtr> result;
  result.reserve(connections_.size());
  for (const auto& entry : connections_) {
    result.push_back(entry.second);
  }
  return result;
}

void ConnectionRegistry::forEach(
    const std::function<void(Connection&)>& fn) const {
  for (const auto& connection : snapshot()) {
    fn(*connection);
  }
}

void ConnectionRegistry::clear() {
  auto all = snapshot();
  for (const auto& connection : all) {
    connection->close();
    remove(connection->id());
  }
}

}  // namespace server
}  // namespace loopmux
