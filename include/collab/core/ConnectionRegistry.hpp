#pragma once

#include "collab/Types.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace collab::core {

class ConnectionSink;

// Tracks socket <-> user <-> workspace. One reader/writer mutex guards the
// cross indexes; it is never held across store calls or sends.
class ConnectionRegistry {
public:
  struct Target {
    ConnId      connId = 0;
    std::string userId;
    std::shared_ptr<ConnectionSink> sink;
  };

  struct Removal {
    bool        found = false;
    std::string userId;
    bool        lastConnection = false;
    // Workspaces the user is no longer present in after this removal.
    std::vector<std::string> departedWorkspaces;
  };

  // Returns false if connId is already registered.
  bool registerConnection(const std::string& userId, ConnId connId,
                          std::shared_ptr<ConnectionSink> sink);
  Removal unregisterConnection(ConnId connId);

  // Returns true when this is the user's first connection in the workspace.
  bool joinWorkspace(const std::string& userId, ConnId connId,
                     const std::string& workspaceId, WorkspaceRole role);
  // Returns true when the user has no other connection left in the workspace.
  bool leaveWorkspace(const std::string& userId, ConnId connId, const std::string& workspaceId);

  std::vector<ConnId>      connectionsOf(const std::string& userId) const;
  std::vector<ConnId>      connectionsIn(const std::string& workspaceId) const;
  std::vector<std::string> membersOf(const std::string& workspaceId) const;
  std::vector<std::string> workspacesOf(const std::string& userId) const;
  std::vector<ConnId>      allConnections() const;

  std::optional<WorkspaceRole> roleOf(ConnId connId, const std::string& workspaceId) const;
  bool isJoined(ConnId connId, const std::string& workspaceId) const;
  bool isPresent(const std::string& userId, const std::string& workspaceId) const;
  std::optional<std::string> userOf(ConnId connId) const;

  // Fan-out targets: connections joined to the workspace, minus every
  // connection of excludeUserId when given.
  std::vector<Target> targetsIn(const std::string& workspaceId,
                                const std::optional<std::string>& excludeUserId) const;
  std::vector<Target> allTargets() const;
  std::shared_ptr<ConnectionSink> sinkOf(ConnId connId) const;

  std::size_t connectionCount() const;
  std::size_t userCount() const;

private:
  struct Connection {
    std::string userId;
    std::shared_ptr<ConnectionSink> sink;
    std::unordered_map<std::string, WorkspaceRole> workspaces;
  };

  // Recomputes presence of userId in workspaceId from its connections. Caller holds _mutex.
  bool userStillIn(const std::string& userId, const std::string& workspaceId) const;

  mutable std::shared_mutex _mutex;
  std::unordered_map<ConnId, Connection> _connections;
  std::unordered_map<std::string, std::unordered_set<ConnId>> _byUser;
  std::unordered_map<std::string, std::unordered_set<ConnId>> _byWorkspace;
  std::unordered_map<std::string, std::unordered_set<std::string>> _userWorkspaces;
  std::unordered_map<std::string, std::unordered_set<std::string>> _workspaceMembers;
};

} // namespace collab::core
