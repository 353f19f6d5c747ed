#pragma once

#include "collab/Types.hpp"
#include "collab/protocol/Messages.hpp"
#include "collab/rt/KeyedMutex.hpp"

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace collab::store { class CollabStore; }
namespace collab::util  { class Clock; }

namespace collab::core {

class ActivityRecorder;
class LockManager;
class RoomBroadcaster;

// Field-level last-writer-wins edits with a server-assigned version per order.
class EditCoordinator {
public:
  struct Options {
    // Reject edits from anyone but the order's live lock holder.
    bool requireLock = true;
  };

  EditCoordinator(store::CollabStore* store,
                  const LockManager* locks,
                  const RoomBroadcaster* broadcaster,
                  ActivityRecorder* activity,
                  const util::Clock* clock,
                  Options opts);

  // Persists, confirms the apply, then broadcasts order_edit to the room
  // (sender excluded). Version = max(last, edit.version) + 1.
  // With requireLock, the whole sequence runs under the order's lock stripe
  // and only for the holder of a live lock taken in edit.workspaceId.
  // Throws AuthorizationError, ProtocolError (version overflow) or StoreError;
  // on throw nothing is broadcast and the order's version is unchanged.
  EditRecord proposeEdit(const std::string& userId,
                         WorkspaceRole role,
                         const protocol::OrderEdit& edit);

  std::int64_t currentVersion(const std::string& orderId) const;

private:
  EditRecord persistAndBroadcast(const std::string& userId, const protocol::OrderEdit& edit);

  store::CollabStore*    store_;
  const LockManager*     locks_;
  const RoomBroadcaster* broadcaster_;
  ActivityRecorder*      activity_;
  const util::Clock*     clock_;
  Options                opts_;

  // Held across persist and broadcast so frames leave in version order.
  rt::KeyedMutex _orderKeys;
  mutable std::shared_mutex _versionMutex;
  std::unordered_map<std::string, std::int64_t> _versions;
};

} // namespace collab::core
