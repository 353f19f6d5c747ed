#pragma once

#include "collab/Types.hpp"
#include "collab/rt/KeyedMutex.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace collab::store { class CollabStore; }
namespace collab::util  { class Clock; }

namespace collab::core {

class ConnectionRegistry;
class LockManager;
class RoomBroadcaster;

// Per (user, workspace) presence. The store is the system of record; the
// cache here only serves broadcast routing and snapshots.
class PresenceTracker {
public:
  struct Options {
    std::size_t activityLimit = 50;
  };

  PresenceTracker(store::CollabStore* store,
                  const ConnectionRegistry* registry,
                  const RoomBroadcaster* broadcaster,
                  const LockManager* locks,
                  const util::Clock* clock,
                  Options opts);

  // Online + persist, then member_joined to the room (joiner excluded) and
  // workspace_state to connId only. Throws StoreError before any broadcast;
  // a failed snapshot restores the previous record in cache and store.
  void onJoin(const std::string& userId, ConnId connId, const std::string& workspaceId);

  PresenceRecord update(const std::string& userId,
                        const std::string& workspaceId,
                        PresenceStatus status,
                        std::optional<std::string> currentPage,
                        std::optional<CursorPosition> cursor);

  // Offline + persist, then member_left. Evicts the cache entry.
  void onLeave(const std::string& userId, const std::string& workspaceId);

  WorkspaceSnapshot snapshot(const std::string& workspaceId) const;

  // Cached records idle since before cutoff go offline in the store and are
  // evicted, unless the user is still joined to the workspace.
  std::size_t expireInactive(Timestamp cutoff);

  std::optional<PresenceRecord> cached(const std::string& userId,
                                       const std::string& workspaceId) const;
  std::size_t cacheSize() const;

private:
  using Key = std::pair<std::string, std::string>;
  struct KeyHash {
    std::size_t operator()(const Key& k) const {
      return std::hash<std::string>{}(k.first) * 31u ^ std::hash<std::string>{}(k.second);
    }
  };

  void remember(const PresenceRecord& rec);
  void undoJoin(const std::optional<PresenceRecord>& prev, const PresenceRecord& joined);
  // Serializes presence writes per (user, workspace).
  std::mutex& keyFor(const std::string& userId, const std::string& workspaceId) const;

  store::CollabStore*       store_;
  const ConnectionRegistry* registry_;
  const RoomBroadcaster*    broadcaster_;
  const LockManager*        locks_;
  const util::Clock*        clock_;
  Options                   opts_;

  mutable rt::KeyedMutex _keys;
  mutable std::mutex _mutex;
  std::unordered_map<Key, PresenceRecord, KeyHash> _cache;
};

} // namespace collab::core
