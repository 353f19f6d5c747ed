#pragma once

#include "collab/Types.hpp"

#include <optional>
#include <string>

namespace collab::core {

class ConnectionRegistry;

// Fan-out over the registry. Frames are pre-encoded; sinks only enqueue.
class RoomBroadcaster {
public:
  explicit RoomBroadcaster(const ConnectionRegistry* registry) : registry_(registry) {}

  // Every connection joined to workspaceId, except all connections of
  // excludeUserId. Returns the number of connections delivered to.
  std::size_t broadcast(const std::string& workspaceId, const std::string& frame,
                        const std::optional<std::string>& excludeUserId = std::nullopt) const;

  std::size_t broadcastAll(const std::string& frame) const;

  // Direct reply path. False when the connection is gone.
  bool sendTo(ConnId connId, const std::string& frame) const;

private:
  const ConnectionRegistry* registry_;
};

} // namespace collab::core
