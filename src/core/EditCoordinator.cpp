#include "collab/core/EditCoordinator.hpp"
#include "collab/core/ActivityRecorder.hpp"
#include "collab/core/LockManager.hpp"
#include "collab/core/RoomBroadcaster.hpp"
#include "collab/Errors.hpp"
#include "collab/protocol/Codec.hpp"
#include "collab/store/Stores.hpp"
#include "collab/util/Clock.hpp"
#include "collab/util/Logger.hpp"
#include "collab/util/Metrics.hpp"

#include <algorithm>
#include <limits>
#include <mutex>

namespace collab::core {

EditCoordinator::EditCoordinator(store::CollabStore* store,
                                 const LockManager* locks,
                                 const RoomBroadcaster* broadcaster,
                                 ActivityRecorder* activity,
                                 const util::Clock* clock,
                                 Options opts)
  : store_(store)
  , locks_(locks)
  , broadcaster_(broadcaster)
  , activity_(activity)
  , clock_(clock ? clock : &util::systemClock())
  , opts_(opts)
{}

std::int64_t EditCoordinator::currentVersion(const std::string& orderId) const {
  std::shared_lock lock(_versionMutex);
  auto it = _versions.find(orderId);
  return it == _versions.end() ? 0 : it->second;
}

EditRecord EditCoordinator::proposeEdit(const std::string& userId,
                                        WorkspaceRole role,
                                        const protocol::OrderEdit& edit) {
  if (!canEditOrders(role)) {
    COLLAB_METRIC_HIT("edits.rejected");
    throw AuthorizationError("Role does not allow editing orders");
  }

  EditRecord rec;
  auto commit = [&]{ rec = persistAndBroadcast(userId, edit); };

  if (!opts_.requireLock) {
    commit();
  } else if (!locks_ || !locks_->runAsHolder(edit.orderId, userId, edit.workspaceId, commit)) {
    COLLAB_METRIC_HIT("edits.rejected");
    throw AuthorizationError("Order lock required");
  }

  if (activity_) {
    ActivityEntry a;
    a.workspaceId = rec.workspaceId;
    a.userId = userId;
    a.activityType = "order_updated";
    a.entityType = "order";
    a.entityId = rec.orderId;
    a.description = "Updated " + rec.fieldPath;
    a.createdAt = rec.timestamp;
    activity_->record(std::move(a));
  }

  util::logger().log(util::LogLevel::Debug, "edit.accepted",
                     {{"orderId", rec.orderId}, {"userId", userId},
                      {"field", rec.fieldPath}, {"version", std::to_string(rec.version)}});
  return rec;
}

EditRecord EditCoordinator::persistAndBroadcast(const std::string& userId,
                                                const protocol::OrderEdit& edit) {
  std::lock_guard<std::mutex> key(_orderKeys.forKey(edit.orderId));

  const std::int64_t base = std::max(currentVersion(edit.orderId), edit.version);
  if (base == std::numeric_limits<std::int64_t>::max()) {
    COLLAB_METRIC_HIT("edits.rejected");
    throw ProtocolError("version out of range");
  }

  EditRecord rec;
  rec.orderId = edit.orderId;
  rec.userId = userId;
  rec.workspaceId = edit.workspaceId;
  rec.fieldPath = edit.fieldPath;
  rec.oldValue = edit.oldValue;
  rec.newValue = edit.newValue;
  rec.version = base + 1;
  rec.timestamp = clock_->now();

  rec.editId = store_->appendEdit(rec);
  if (!store_->applyEdit(rec.editId)) {
    COLLAB_METRIC_HIT("edits.failed");
    throw StoreError("Edit was not applied by the store");
  }

  {
    std::unique_lock lock(_versionMutex);
    _versions[rec.orderId] = rec.version;
  }

  COLLAB_METRIC_HIT("edits.accepted");
  broadcaster_->broadcast(rec.workspaceId, protocol::encodeEdit(rec), userId);
  return rec;
}

} // namespace collab::core
