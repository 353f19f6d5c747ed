#include "collab/core/LockManager.hpp"
#include "collab/core/RoomBroadcaster.hpp"
#include "collab/protocol/Codec.hpp"
#include "collab/store/Stores.hpp"
#include "collab/util/Clock.hpp"
#include "collab/util/Logger.hpp"
#include "collab/util/Metrics.hpp"
#include "collab/util/Time.hpp"

#include <algorithm>
#include <exception>
#include <mutex>

namespace collab::core {

LockManager::LockManager(store::CollabStore* store,
                         const RoomBroadcaster* broadcaster,
                         const util::Clock* clock)
  : LockManager(store, broadcaster, clock, Options{})
{}

LockManager::LockManager(store::CollabStore* store,
                         const RoomBroadcaster* broadcaster,
                         const util::Clock* clock,
                         Options opts)
  : store_(store)
  , broadcaster_(broadcaster)
  , clock_(clock ? clock : &util::systemClock())
  , opts_(opts)
  , _keys(opts.stripes)
{
  if (opts_.maxMinutes < 1) opts_.maxMinutes = 1;
  opts_.defaultMinutes = std::clamp(opts_.defaultMinutes, 1, opts_.maxMinutes);
}

int LockManager::clampMinutes(std::optional<int> requested) const {
  const int m = requested.value_or(opts_.defaultMinutes);
  return std::clamp(m, 1, opts_.maxMinutes);
}

std::optional<OrderLock> LockManager::find(const std::string& orderId) const {
  std::shared_lock lock(_mapMutex);
  auto it = _locks.find(orderId);
  if (it == _locks.end()) return std::nullopt;
  return it->second;
}

void LockManager::put(const OrderLock& l) {
  {
    std::unique_lock lock(_mapMutex);
    _locks[l.orderId] = l;
  }
  publishGauge();
}

void LockManager::erase(const std::string& orderId) {
  {
    std::unique_lock lock(_mapMutex);
    _locks.erase(orderId);
  }
  publishGauge();
}

void LockManager::publishGauge() const {
  std::size_t n = 0;
  {
    std::shared_lock lock(_mapMutex);
    n = _locks.size();
  }
  COLLAB_METRIC_SET("locks.active", static_cast<double>(n));
}

LockResponse LockManager::requestLock(const std::string& orderId,
                                      const std::string& userId,
                                      const std::string& workspaceId,
                                      std::optional<int> durationMinutes) {
  const auto duration = std::chrono::minutes(clampMinutes(durationMinutes));

  std::lock_guard<std::mutex> key(_keys.forKey(orderId));
  const Timestamp now = clock_->now();
  auto current = find(orderId);
  // An expired lock the sweeper has not reached yet is treated as absent.
  if (current && current->expiresAt <= now) current.reset();

  LockResponse resp;
  resp.orderId = orderId;

  // Held through another workspace: refuse without naming the holder.
  if (current && current->workspaceId != workspaceId) {
    COLLAB_METRIC_HIT("locks.contended");
    resp.success = false;
    resp.message = "Order is locked in another workspace";
    return resp;
  }

  if (current && current->holder != userId) {
    COLLAB_METRIC_HIT("locks.contended");
    resp.success = false;
    resp.lockedBy = current->holder;
    resp.lockedUntil = current->expiresAt;
    resp.message = "Order is already locked by another user";
    return resp;
  }

  if (current) {
    OrderLock renewed = *current;
    renewed.expiresAt = std::max(current->expiresAt, now + duration);
    store_->setOrderLock(renewed);
    put(renewed);

    COLLAB_METRIC_HIT("locks.renewed");
    resp.success = true;
    resp.lockedBy = renewed.holder;
    resp.lockedUntil = renewed.expiresAt;
    resp.message = "Lock extended";
    return resp;
  }

  OrderLock granted{orderId, workspaceId, userId, now + duration};
  store_->setOrderLock(granted);
  put(granted);

  COLLAB_METRIC_HIT("locks.granted");
  util::logger().log(util::LogLevel::Debug, "lock.granted",
                     {{"orderId", orderId}, {"userId", userId},
                      {"expiresAt", util::toIso8601(granted.expiresAt)}});

  if (broadcaster_) {
    broadcaster_->broadcast(workspaceId, protocol::encodeOrderLock(granted, now), userId);
  }

  resp.success = true;
  resp.lockedBy = userId;
  resp.lockedUntil = granted.expiresAt;
  resp.message = "Order locked successfully";
  return resp;
}

LockManager::ReleaseResult LockManager::releaseLock(const std::string& orderId,
                                                    const std::string& userId,
                                                    const std::string& workspaceId) {
  std::lock_guard<std::mutex> key(_keys.forKey(orderId));
  auto current = find(orderId);
  if (!current || current->workspaceId != workspaceId) return ReleaseResult::NotLocked;

  if (opts_.releaseRequiresOwnership && current->holder != userId) {
    COLLAB_METRIC_HIT("locks.release_denied");
    return ReleaseResult::Denied;
  }

  store_->clearOrderLock(orderId, workspaceId);
  erase(orderId);

  COLLAB_METRIC_HIT("locks.released");
  if (broadcaster_) {
    broadcaster_->broadcast(workspaceId,
                            protocol::encodeOrderUnlock(*current, userId,
                                                        protocol::reasons::Released,
                                                        clock_->now()),
                            userId);
  }
  return ReleaseResult::Released;
}

std::size_t LockManager::releaseAllLocksForUser(const std::string& userId,
                                                const std::optional<std::string>& workspaceId,
                                                const char* reason) {
  std::vector<std::string> candidates;
  {
    std::shared_lock lock(_mapMutex);
    for (auto& kv : _locks) {
      if (kv.second.holder != userId) continue;
      if (workspaceId && kv.second.workspaceId != *workspaceId) continue;
      candidates.push_back(kv.first);
    }
  }

  std::size_t released = 0;
  for (const auto& orderId : candidates) {
    std::lock_guard<std::mutex> key(_keys.forKey(orderId));
    auto current = find(orderId);
    if (!current || current->holder != userId) continue;
    if (workspaceId && current->workspaceId != *workspaceId) continue;

    try {
      store_->clearOrderLock(orderId, current->workspaceId);
    } catch (const std::exception& ex) {
      util::logger().log(util::LogLevel::Warn, "lock.clear_failed",
                         {{"orderId", orderId}, {"error", ex.what()}});
    }
    erase(orderId);
    ++released;

    if (broadcaster_) {
      broadcaster_->broadcast(current->workspaceId,
                              protocol::encodeOrderUnlock(*current, userId, reason, clock_->now()));
    }
  }

  if (released) {
    COLLAB_METRIC_INC("locks.released", static_cast<double>(released));
    util::logger().log(util::LogLevel::Info, "lock.released_for_user",
                       {{"userId", userId}, {"count", std::to_string(released)},
                        {"reason", reason ? reason : ""}});
  }
  return released;
}

std::size_t LockManager::sweepExpired(Timestamp now) {
  std::vector<std::string> candidates;
  {
    std::shared_lock lock(_mapMutex);
    for (auto& kv : _locks) {
      if (kv.second.expiresAt <= now) candidates.push_back(kv.first);
    }
  }

  std::size_t swept = 0;
  for (const auto& orderId : candidates) {
    std::lock_guard<std::mutex> key(_keys.forKey(orderId));
    auto current = find(orderId);
    // Renewed since the scan.
    if (!current || current->expiresAt > now) continue;

    try {
      store_->clearOrderLock(orderId, current->workspaceId);
    } catch (const std::exception& ex) {
      util::logger().log(util::LogLevel::Warn, "lock.clear_failed",
                         {{"orderId", orderId}, {"error", ex.what()}});
    }
    erase(orderId);
    ++swept;

    if (broadcaster_ && opts_.broadcastExpiry) {
      broadcaster_->broadcast(current->workspaceId,
                              protocol::encodeOrderUnlock(*current, current->holder,
                                                          protocol::reasons::Expired, now));
    }
  }

  if (swept) {
    COLLAB_METRIC_INC("locks.expired", static_cast<double>(swept));
    util::logger().log(util::LogLevel::Info, "lock.swept", {{"count", std::to_string(swept)}});
  }
  return swept;
}

std::size_t LockManager::restore() {
  const Timestamp now = clock_->now();
  std::size_t n = 0;
  for (const auto& l : store_->listOrderLocks("")) {
    if (l.expiresAt <= now || l.holder.empty()) continue;
    std::lock_guard<std::mutex> key(_keys.forKey(l.orderId));
    put(l);
    ++n;
  }
  util::logger().log(util::LogLevel::Info, "lock.restored", {{"count", std::to_string(n)}});
  return n;
}

std::vector<OrderLock> LockManager::activeLocks(const std::optional<std::string>& workspaceId) const {
  const Timestamp now = clock_->now();
  std::vector<OrderLock> out;
  {
    std::shared_lock lock(_mapMutex);
    for (auto& kv : _locks) {
      if (kv.second.expiresAt <= now) continue;
      if (workspaceId && kv.second.workspaceId != *workspaceId) continue;
      out.push_back(kv.second);
    }
  }
  std::sort(out.begin(), out.end(), [](const OrderLock& a, const OrderLock& b){
    return a.orderId < b.orderId;
  });
  return out;
}

std::optional<OrderLock> LockManager::liveLock(const std::string& orderId) const {
  auto l = find(orderId);
  if (!l || l->expiresAt <= clock_->now()) return std::nullopt;
  return l;
}

std::optional<std::string> LockManager::holderOf(const std::string& orderId) const {
  auto l = liveLock(orderId);
  if (!l) return std::nullopt;
  return l->holder;
}

bool LockManager::holds(const std::string& userId, const std::string& orderId) const {
  auto h = holderOf(orderId);
  return h && *h == userId;
}

bool LockManager::runAsHolder(const std::string& orderId,
                              const std::string& userId,
                              const std::string& workspaceId,
                              const std::function<void()>& fn) const {
  std::lock_guard<std::mutex> key(_keys.forKey(orderId));
  auto l = liveLock(orderId);
  if (!l || l->holder != userId || l->workspaceId != workspaceId) return false;
  fn();
  return true;
}

} // namespace collab::core
