// include/collab/store/InMemoryStore.hpp
#pragma once

#include "collab/store/Stores.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace collab::store {

// Single-process implementation of every external collaborator.
// Used by collabd in development and by the tests.
class InMemoryStore : public UserDirectory,
                      public MembershipStore,
                      public CollabStore,
                      public ActivityFeed {
public:
  InMemoryStore() = default;

  // Fixture lines:  user <id> <name> <email>
  //                 member <workspaceId> <userId> <role> <status>
  // '#' starts a comment. Returns false if the file can't be read.
  bool loadFixture(const std::string& path);

  void addUser(const Identity& user);
  void addMembership(const Membership& m);

  // --- UserDirectory ---
  std::optional<Identity> findUser(const std::string& userId) override;

  // --- MembershipStore ---
  std::optional<Membership> findActiveMembership(const std::string& userId,
                                                 const std::string& workspaceId) override;

  // --- CollabStore ---
  void upsertPresence(const PresenceRecord& rec) override;
  std::vector<PresenceRecord> listPresence(const std::string& workspaceId) override;
  void setOrderLock(const OrderLock& lock) override;
  void clearOrderLock(const std::string& orderId, const std::string& workspaceId) override;
  std::vector<OrderLock> listOrderLocks(const std::string& workspaceId) override;
  std::string appendEdit(const EditRecord& rec) override;
  bool applyEdit(const std::string& editId) override;
  ChatMessage insertChatMessage(const ChatMessage& msg) override;
  std::vector<ActivityEntry> recentActivity(const std::string& workspaceId,
                                            std::size_t limit) override;

  // --- ActivityFeed ---
  void record(const ActivityEntry& entry) override;

  // --- inspection ---
  std::optional<PresenceRecord> presence(const std::string& userId, const std::string& workspaceId) const;
  std::optional<OrderLock> orderLock(const std::string& orderId) const;
  std::vector<EditRecord> edits(const std::string& orderId) const;
  // Field values after applied edits, keyed by fieldPath.
  std::map<std::string, std::string> orderFields(const std::string& orderId) const;
  std::vector<ChatMessage> chatMessages(const std::string& workspaceId) const;

private:
  static constexpr std::size_t kMaxActivityPerWorkspace = 1000;

  using Key = std::pair<std::string, std::string>;
  struct KeyHash {
    std::size_t operator()(const Key& k) const {
      return std::hash<std::string>{}(k.first) * 31u ^ std::hash<std::string>{}(k.second);
    }
  };

  struct StoredEdit {
    EditRecord rec;
    bool applied = false;
  };

  mutable std::shared_mutex _mutex;
  std::unordered_map<std::string, Identity> _users;
  std::unordered_map<Key, Membership, KeyHash> _memberships;    // (userId, workspaceId)
  std::unordered_map<Key, PresenceRecord, KeyHash> _presence;   // (userId, workspaceId)
  std::unordered_map<std::string, OrderLock> _locks;            // orderId
  std::unordered_map<std::string, StoredEdit> _edits;           // editId
  std::unordered_map<std::string, std::vector<std::string>> _editsByOrder;
  std::unordered_map<std::string, std::map<std::string, std::string>> _orderFields;
  std::unordered_map<std::string, std::vector<ChatMessage>> _chat;
  std::unordered_map<std::string, std::deque<ActivityEntry>> _activity;
  std::uint64_t _nextId = 1;
};

} // namespace collab::store
