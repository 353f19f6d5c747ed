#include "collab/core/ConnectionRegistry.hpp"
#include "collab/core/ConnectionSink.hpp"
#include "collab/Errors.hpp"
#include "collab/util/Logger.hpp"
#include "collab/util/Metrics.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace collab::core {

namespace {

template <typename Set>
auto sortedCopy(const Set& s) {
  std::vector<typename Set::value_type> out(s.begin(), s.end());
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace

bool ConnectionRegistry::registerConnection(const std::string& userId, ConnId connId,
                                            std::shared_ptr<ConnectionSink> sink) {
  std::size_t conns = 0;
  {
    std::unique_lock lock(_mutex);
    if (_connections.count(connId)) return false;
    _connections.emplace(connId, Connection{userId, std::move(sink), {}});
    _byUser[userId].insert(connId);
    conns = _connections.size();
  }

  COLLAB_METRIC_SET("registry.connections", static_cast<double>(conns));
  util::logger().log(util::LogLevel::Info, "Registered connection",
                     {{"userId", userId}, {"connId", std::to_string(connId)}});
  return true;
}

ConnectionRegistry::Removal ConnectionRegistry::unregisterConnection(ConnId connId) {
  Removal out;
  std::size_t conns = 0;
  {
    std::unique_lock lock(_mutex);
    auto it = _connections.find(connId);
    if (it == _connections.end()) return out;

    Connection conn = std::move(it->second);
    _connections.erase(it);
    out.found = true;
    out.userId = conn.userId;

    auto& mine = _byUser[conn.userId];
    mine.erase(connId);
    out.lastConnection = mine.empty();
    if (out.lastConnection) _byUser.erase(conn.userId);

    for (auto& kv : conn.workspaces) {
      const std::string& ws = kv.first;
      auto wsIt = _byWorkspace.find(ws);
      if (wsIt != _byWorkspace.end()) {
        wsIt->second.erase(connId);
        if (wsIt->second.empty()) _byWorkspace.erase(wsIt);
      }
      if (!userStillIn(conn.userId, ws)) {
        out.departedWorkspaces.push_back(ws);
        auto mIt = _workspaceMembers.find(ws);
        if (mIt != _workspaceMembers.end()) {
          mIt->second.erase(conn.userId);
          if (mIt->second.empty()) _workspaceMembers.erase(mIt);
        }
        auto uIt = _userWorkspaces.find(conn.userId);
        if (uIt != _userWorkspaces.end()) {
          uIt->second.erase(ws);
          if (uIt->second.empty()) _userWorkspaces.erase(uIt);
        }
      }
    }

    // No ghosts: a user without connections is in no workspace.
    if (out.lastConnection) {
      auto uIt = _userWorkspaces.find(conn.userId);
      if (uIt != _userWorkspaces.end()) {
        for (const auto& ws : uIt->second) {
          auto mIt = _workspaceMembers.find(ws);
          if (mIt != _workspaceMembers.end()) {
            mIt->second.erase(conn.userId);
            if (mIt->second.empty()) _workspaceMembers.erase(mIt);
          }
        }
        _userWorkspaces.erase(uIt);
      }
    }
    conns = _connections.size();
  }

  std::sort(out.departedWorkspaces.begin(), out.departedWorkspaces.end());
  COLLAB_METRIC_SET("registry.connections", static_cast<double>(conns));
  util::logger().log(util::LogLevel::Info, "Unregistered connection",
                     {{"userId", out.userId},
                      {"connId", std::to_string(connId)},
                      {"last", out.lastConnection ? "true" : "false"}});
  return out;
}

bool ConnectionRegistry::joinWorkspace(const std::string& userId, ConnId connId,
                                       const std::string& workspaceId, WorkspaceRole role) {
  std::unique_lock lock(_mutex);
  auto it = _connections.find(connId);
  if (it == _connections.end() || it->second.userId != userId) {
    throw AuthorizationError("Connection is not registered for this user");
  }

  const bool first = !userStillIn(userId, workspaceId);
  it->second.workspaces[workspaceId] = role;
  _byWorkspace[workspaceId].insert(connId);
  _workspaceMembers[workspaceId].insert(userId);
  _userWorkspaces[userId].insert(workspaceId);
  return first;
}

bool ConnectionRegistry::leaveWorkspace(const std::string& userId, ConnId connId,
                                        const std::string& workspaceId) {
  std::unique_lock lock(_mutex);
  auto it = _connections.find(connId);
  if (it == _connections.end() || it->second.userId != userId) return false;
  if (it->second.workspaces.erase(workspaceId) == 0) return false;

  auto wsIt = _byWorkspace.find(workspaceId);
  if (wsIt != _byWorkspace.end()) {
    wsIt->second.erase(connId);
    if (wsIt->second.empty()) _byWorkspace.erase(wsIt);
  }

  if (userStillIn(userId, workspaceId)) return false;

  auto mIt = _workspaceMembers.find(workspaceId);
  if (mIt != _workspaceMembers.end()) {
    mIt->second.erase(userId);
    if (mIt->second.empty()) _workspaceMembers.erase(mIt);
  }
  auto uIt = _userWorkspaces.find(userId);
  if (uIt != _userWorkspaces.end()) {
    uIt->second.erase(workspaceId);
    if (uIt->second.empty()) _userWorkspaces.erase(uIt);
  }
  return true;
}

bool ConnectionRegistry::userStillIn(const std::string& userId, const std::string& workspaceId) const {
  auto uIt = _byUser.find(userId);
  if (uIt == _byUser.end()) return false;
  for (ConnId c : uIt->second) {
    auto it = _connections.find(c);
    if (it != _connections.end() && it->second.workspaces.count(workspaceId)) return true;
  }
  return false;
}

std::vector<ConnId> ConnectionRegistry::connectionsOf(const std::string& userId) const {
  std::shared_lock lock(_mutex);
  auto it = _byUser.find(userId);
  if (it == _byUser.end()) return {};
  return sortedCopy(it->second);
}

std::vector<ConnId> ConnectionRegistry::connectionsIn(const std::string& workspaceId) const {
  std::shared_lock lock(_mutex);
  auto it = _byWorkspace.find(workspaceId);
  if (it == _byWorkspace.end()) return {};
  return sortedCopy(it->second);
}

std::vector<std::string> ConnectionRegistry::membersOf(const std::string& workspaceId) const {
  std::shared_lock lock(_mutex);
  auto it = _workspaceMembers.find(workspaceId);
  if (it == _workspaceMembers.end()) return {};
  return sortedCopy(it->second);
}

std::vector<std::string> ConnectionRegistry::workspacesOf(const std::string& userId) const {
  std::shared_lock lock(_mutex);
  auto it = _userWorkspaces.find(userId);
  if (it == _userWorkspaces.end()) return {};
  return sortedCopy(it->second);
}

std::vector<ConnId> ConnectionRegistry::allConnections() const {
  std::shared_lock lock(_mutex);
  std::vector<ConnId> out;
  out.reserve(_connections.size());
  for (auto& kv : _connections) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

std::optional<WorkspaceRole> ConnectionRegistry::roleOf(ConnId connId,
                                                        const std::string& workspaceId) const {
  std::shared_lock lock(_mutex);
  auto it = _connections.find(connId);
  if (it == _connections.end()) return std::nullopt;
  auto r = it->second.workspaces.find(workspaceId);
  if (r == it->second.workspaces.end()) return std::nullopt;
  return r->second;
}

bool ConnectionRegistry::isJoined(ConnId connId, const std::string& workspaceId) const {
  return roleOf(connId, workspaceId).has_value();
}

bool ConnectionRegistry::isPresent(const std::string& userId, const std::string& workspaceId) const {
  std::shared_lock lock(_mutex);
  auto it = _workspaceMembers.find(workspaceId);
  return it != _workspaceMembers.end() && it->second.count(userId) > 0;
}

std::optional<std::string> ConnectionRegistry::userOf(ConnId connId) const {
  std::shared_lock lock(_mutex);
  auto it = _connections.find(connId);
  if (it == _connections.end()) return std::nullopt;
  return it->second.userId;
}

std::vector<ConnectionRegistry::Target>
ConnectionRegistry::targetsIn(const std::string& workspaceId,
                              const std::optional<std::string>& excludeUserId) const {
  std::shared_lock lock(_mutex);
  std::vector<Target> out;
  auto it = _byWorkspace.find(workspaceId);
  if (it == _byWorkspace.end()) return out;
  out.reserve(it->second.size());
  for (ConnId c : it->second) {
    auto conn = _connections.find(c);
    if (conn == _connections.end()) continue;
    if (excludeUserId && conn->second.userId == *excludeUserId) continue;
    out.push_back(Target{c, conn->second.userId, conn->second.sink});
  }
  return out;
}

std::vector<ConnectionRegistry::Target> ConnectionRegistry::allTargets() const {
  std::shared_lock lock(_mutex);
  std::vector<Target> out;
  out.reserve(_connections.size());
  for (auto& kv : _connections) {
    out.push_back(Target{kv.first, kv.second.userId, kv.second.sink});
  }
  return out;
}

std::shared_ptr<ConnectionSink> ConnectionRegistry::sinkOf(ConnId connId) const {
  std::shared_lock lock(_mutex);
  auto it = _connections.find(connId);
  if (it == _connections.end()) return nullptr;
  return it->second.sink;
}

std::size_t ConnectionRegistry::connectionCount() const {
  std::shared_lock lock(_mutex);
  return _connections.size();
}

std::size_t ConnectionRegistry::userCount() const {
  std::shared_lock lock(_mutex);
  return _byUser.size();
}

} // namespace collab::core
