#pragma once

#include "collab/Types.hpp"
#include "collab/rt/KeyedMutex.hpp"

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace collab::store { class CollabStore; }
namespace collab::util  { class Clock; }

namespace collab::core {

class RoomBroadcaster;

// Time-boxed exclusive edit locks, at most one live lock per order.
//
// Every mutation of an order's lock takes that order's stripe of _keys for
// the whole check / store call / map update sequence, so concurrent
// requests, releases and the sweeper never interleave on the same order.
// _mapMutex only protects the map structure and is held briefly.
class LockManager {
public:
  struct Options {
    int  defaultMinutes           = 5;
    int  maxMinutes               = 60;
    bool releaseRequiresOwnership = false;
    bool broadcastExpiry          = true;
    std::size_t stripes           = 64;
  };

  enum class ReleaseResult { Released, NotLocked, Denied };

  LockManager(store::CollabStore* store,
              const RoomBroadcaster* broadcaster,
              const util::Clock* clock);
  LockManager(store::CollabStore* store,
              const RoomBroadcaster* broadcaster,
              const util::Clock* clock,
              Options opts);

  // Grant, renew, or report contention. Throws StoreError when the store
  // rejects the write; in that case nothing changes and nothing is broadcast.
  LockResponse requestLock(const std::string& orderId,
                           const std::string& userId,
                           const std::string& workspaceId,
                           std::optional<int> durationMinutes = std::nullopt);

  ReleaseResult releaseLock(const std::string& orderId,
                            const std::string& userId,
                            const std::string& workspaceId);

  // Releases every lock held by userId (only in workspaceId when given).
  // Store failures are logged; the in-memory lock is dropped regardless.
  std::size_t releaseAllLocksForUser(const std::string& userId,
                                     const std::optional<std::string>& workspaceId,
                                     const char* reason);

  // Drops every lock with expiresAt <= now.
  std::size_t sweepExpired(Timestamp now);

  // Reloads unexpired lock mirrors from the store (process start).
  std::size_t restore();

  std::vector<OrderLock> activeLocks(const std::optional<std::string>& workspaceId = std::nullopt) const;
  std::optional<OrderLock> liveLock(const std::string& orderId) const;
  std::optional<std::string> holderOf(const std::string& orderId) const;
  bool holds(const std::string& userId, const std::string& orderId) const;

  // Runs fn with the order's stripe held, so the lock cannot be released,
  // swept or regranted meanwhile. fn runs only while userId holds a live lock
  // on orderId taken in workspaceId; returns false without running it otherwise.
  // Exceptions from fn propagate.
  bool runAsHolder(const std::string& orderId,
                   const std::string& userId,
                   const std::string& workspaceId,
                   const std::function<void()>& fn) const;

  int clampMinutes(std::optional<int> requested) const;
  const Options& options() const { return opts_; }

private:
  std::optional<OrderLock> find(const std::string& orderId) const;
  void put(const OrderLock& lock);
  void erase(const std::string& orderId);
  void publishGauge() const;

  store::CollabStore*    store_;
  const RoomBroadcaster* broadcaster_;
  const util::Clock*     clock_;
  Options                opts_;

  mutable rt::KeyedMutex _keys;
  mutable std::shared_mutex _mapMutex;
  std::unordered_map<std::string, OrderLock> _locks;
};

} // namespace collab::core
