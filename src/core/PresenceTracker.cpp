#include "collab/core/PresenceTracker.hpp"
#include "collab/core/ConnectionRegistry.hpp"
#include "collab/core/LockManager.hpp"
#include "collab/core/RoomBroadcaster.hpp"
#include "collab/protocol/Codec.hpp"
#include "collab/store/Stores.hpp"
#include "collab/util/Clock.hpp"
#include "collab/util/Logger.hpp"
#include "collab/util/Metrics.hpp"

#include <exception>
#include <unordered_map>
#include <vector>

namespace collab::core {

PresenceTracker::PresenceTracker(store::CollabStore* store,
                                 const ConnectionRegistry* registry,
                                 const RoomBroadcaster* broadcaster,
                                 const LockManager* locks,
                                 const util::Clock* clock,
                                 Options opts)
  : store_(store)
  , registry_(registry)
  , broadcaster_(broadcaster)
  , locks_(locks)
  , clock_(clock ? clock : &util::systemClock())
  , opts_(opts)
{}

void PresenceTracker::remember(const PresenceRecord& rec) {
  std::lock_guard<std::mutex> lk(_mutex);
  _cache[{rec.userId, rec.workspaceId}] = rec;
}

std::mutex& PresenceTracker::keyFor(const std::string& userId,
                                    const std::string& workspaceId) const {
  return _keys.forKey(userId + '\x1f' + workspaceId);
}

void PresenceTracker::onJoin(const std::string& userId, ConnId connId,
                             const std::string& workspaceId) {
  std::lock_guard<std::mutex> key(keyFor(userId, workspaceId));
  const Timestamp now = clock_->now();

  const auto prev = cached(userId, workspaceId);
  PresenceRecord rec;
  if (prev) rec = *prev;
  rec.userId = userId;
  rec.workspaceId = workspaceId;
  rec.status = PresenceStatus::Online;
  rec.lastActivity = now;

  store_->upsertPresence(rec);
  remember(rec);

  // Built before announcing so a snapshot failure leaves the room unaware.
  WorkspaceSnapshot snap;
  try {
    snap = snapshot(workspaceId);
  } catch (const std::exception&) {
    undoJoin(prev, rec);
    throw;
  }

  broadcaster_->broadcast(workspaceId,
                          protocol::encodeMember(protocol::events::MemberJoined, userId,
                                                 workspaceId, rec.status, now),
                          userId);
  broadcaster_->sendTo(connId, protocol::encodeWorkspaceState(snap));

  util::logger().log(util::LogLevel::Info, "presence.joined",
                     {{"userId", userId}, {"workspaceId", workspaceId}});
}

void PresenceTracker::undoJoin(const std::optional<PresenceRecord>& prev,
                               const PresenceRecord& joined) {
  PresenceRecord restored;
  if (prev) {
    restored = *prev;
    remember(restored);
  } else {
    restored = joined;
    restored.status = PresenceStatus::Offline;
    std::lock_guard<std::mutex> lk(_mutex);
    _cache.erase({joined.userId, joined.workspaceId});
  }

  try {
    store_->upsertPresence(restored);
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Warn, "presence.join_undo_failed",
                       {{"userId", joined.userId}, {"workspaceId", joined.workspaceId},
                        {"error", ex.what()}});
  }
}

PresenceRecord PresenceTracker::update(const std::string& userId,
                                       const std::string& workspaceId,
                                       PresenceStatus status,
                                       std::optional<std::string> currentPage,
                                       std::optional<CursorPosition> cursor) {
  std::lock_guard<std::mutex> key(keyFor(userId, workspaceId));
  PresenceRecord rec;
  rec.userId = userId;
  rec.workspaceId = workspaceId;
  rec.status = status;
  rec.currentPage = std::move(currentPage);
  rec.cursorPosition = std::move(cursor);
  rec.lastActivity = clock_->now();

  store_->upsertPresence(rec);
  remember(rec);

  COLLAB_METRIC_HIT("presence.updates");
  broadcaster_->broadcast(workspaceId, protocol::encodePresence(rec), userId);
  return rec;
}

void PresenceTracker::onLeave(const std::string& userId, const std::string& workspaceId) {
  std::lock_guard<std::mutex> key(keyFor(userId, workspaceId));
  const Timestamp now = clock_->now();

  PresenceRecord rec;
  if (auto prev = cached(userId, workspaceId)) rec = *prev;
  rec.userId = userId;
  rec.workspaceId = workspaceId;
  rec.status = PresenceStatus::Offline;
  rec.lastActivity = now;

  {
    std::lock_guard<std::mutex> lk(_mutex);
    _cache.erase({userId, workspaceId});
  }
  store_->upsertPresence(rec);

  broadcaster_->broadcast(workspaceId,
                          protocol::encodeMember(protocol::events::MemberLeft, userId,
                                                 workspaceId, rec.status, now),
                          userId);

  util::logger().log(util::LogLevel::Info, "presence.left",
                     {{"userId", userId}, {"workspaceId", workspaceId}});
}

WorkspaceSnapshot PresenceTracker::snapshot(const std::string& workspaceId) const {
  WorkspaceSnapshot snap;
  snap.workspaceId = workspaceId;
  snap.timestamp = clock_->now();

  std::unordered_map<std::string, PresenceRecord> stored;
  for (auto& p : store_->listPresence(workspaceId)) {
    stored.emplace(p.userId, std::move(p));
  }

  for (const auto& userId : registry_->membersOf(workspaceId)) {
    if (auto c = cached(userId, workspaceId)) {
      snap.members.push_back(*c);
      continue;
    }
    auto it = stored.find(userId);
    if (it != stored.end()) {
      snap.members.push_back(it->second);
      continue;
    }
    PresenceRecord rec;
    rec.userId = userId;
    rec.workspaceId = workspaceId;
    rec.status = PresenceStatus::Online;
    rec.lastActivity = snap.timestamp;
    snap.members.push_back(rec);
  }

  snap.activities = store_->recentActivity(workspaceId, opts_.activityLimit);
  if (locks_) snap.orderLocks = locks_->activeLocks(workspaceId);
  return snap;
}

std::size_t PresenceTracker::expireInactive(Timestamp cutoff) {
  auto isStale = [cutoff](const PresenceRecord& r) {
    return r.status != PresenceStatus::Offline && r.lastActivity < cutoff;
  };

  std::vector<Key> candidates;
  {
    std::lock_guard<std::mutex> lk(_mutex);
    for (const auto& kv : _cache) {
      if (isStale(kv.second)) candidates.push_back(kv.first);
    }
  }

  std::size_t expired = 0;
  for (const auto& k : candidates) {
    std::lock_guard<std::mutex> key(keyFor(k.first, k.second));
    // Still joined through some connection: idle, not gone.
    if (registry_ && registry_->isPresent(k.first, k.second)) continue;

    PresenceRecord rec;
    {
      std::lock_guard<std::mutex> lk(_mutex);
      auto it = _cache.find(k);
      if (it == _cache.end() || !isStale(it->second)) continue;
      rec = it->second;
      _cache.erase(it);
    }

    rec.status = PresenceStatus::Offline;
    ++expired;
    try {
      store_->upsertPresence(rec);
    } catch (const std::exception& ex) {
      util::logger().log(util::LogLevel::Warn, "presence.expire_failed",
                         {{"userId", rec.userId}, {"workspaceId", rec.workspaceId},
                          {"error", ex.what()}});
    }
  }

  if (expired) {
    COLLAB_METRIC_INC("presence.expired", static_cast<double>(expired));
    util::logger().log(util::LogLevel::Info, "presence.expired",
                       {{"count", std::to_string(expired)}});
  }
  return expired;
}

std::optional<PresenceRecord> PresenceTracker::cached(const std::string& userId,
                                                      const std::string& workspaceId) const {
  std::lock_guard<std::mutex> lk(_mutex);
  auto it = _cache.find({userId, workspaceId});
  if (it == _cache.end()) return std::nullopt;
  return it->second;
}

std::size_t PresenceTracker::cacheSize() const {
  std::lock_guard<std::mutex> lk(_mutex);
  return _cache.size();
}

} // namespace collab::core
