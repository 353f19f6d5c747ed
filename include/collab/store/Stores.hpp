#pragma once

#include "collab/Types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Interfaces to the external collaborators. Implementations report
// failures by throwing collab::StoreError.
namespace collab::store {

class UserDirectory {
public:
  virtual ~UserDirectory() = default;
  virtual std::optional<Identity> findUser(const std::string& userId) = 0;
};

class MembershipStore {
public:
  virtual ~MembershipStore() = default;
  // Only memberships whose status is active are returned.
  virtual std::optional<Membership> findActiveMembership(const std::string& userId,
                                                         const std::string& workspaceId) = 0;
};

// System of record for presence, lock mirrors, edits and chat.
class CollabStore {
public:
  virtual ~CollabStore() = default;

  virtual void upsertPresence(const PresenceRecord& rec) = 0;
  virtual std::vector<PresenceRecord> listPresence(const std::string& workspaceId) = 0;

  virtual void setOrderLock(const OrderLock& lock) = 0;
  virtual void clearOrderLock(const std::string& orderId, const std::string& workspaceId) = 0;
  // Empty workspaceId lists every workspace.
  virtual std::vector<OrderLock> listOrderLocks(const std::string& workspaceId) = 0;

  // Appends the edit and returns its id; applyEdit() confirms the field replacement.
  virtual std::string appendEdit(const EditRecord& rec) = 0;
  virtual bool applyEdit(const std::string& editId) = 0;

  // Returns the stored message with its id assigned.
  virtual ChatMessage insertChatMessage(const ChatMessage& msg) = 0;

  // Most recent first.
  virtual std::vector<ActivityEntry> recentActivity(const std::string& workspaceId,
                                                    std::size_t limit) = 0;
};

// Fire-and-forget activity writer.
class ActivityFeed {
public:
  virtual ~ActivityFeed() = default;
  virtual void record(const ActivityEntry& entry) = 0;
};

} // namespace collab::store
