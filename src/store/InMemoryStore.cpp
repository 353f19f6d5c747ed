// src/store/InMemoryStore.cpp
#include "collab/store/InMemoryStore.hpp"
#include "collab/Errors.hpp"
#include "collab/util/Logger.hpp"

#include <algorithm>
#include <fstream>
#include <mutex>
#include <sstream>

namespace collab::store {

bool InMemoryStore::loadFixture(const std::string& path) {
  std::ifstream in(path);
  if (!in) return false;

  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    auto hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);

    std::istringstream iss(line);
    std::string kind;
    if (!(iss >> kind)) continue;

    if (kind == "user") {
      Identity u;
      if (iss >> u.userId >> u.name >> u.email) {
        addUser(u);
        continue;
      }
    } else if (kind == "member") {
      std::string ws, user, role, status;
      if (iss >> ws >> user >> role >> status) {
        auto r = parseWorkspaceRole(role);
        auto s = parseMemberStatus(status);
        if (r && s) {
          addMembership(Membership{ws, user, *r, *s});
          continue;
        }
      }
    }
    util::logger().log(util::LogLevel::Warn, "store.fixture.bad_line",
                       {{"path", path}, {"line", std::to_string(lineNo)}});
  }
  return true;
}

void InMemoryStore::addUser(const Identity& user) {
  std::unique_lock lock(_mutex);
  _users[user.userId] = user;
}

void InMemoryStore::addMembership(const Membership& m) {
  std::unique_lock lock(_mutex);
  _memberships[{m.userId, m.workspaceId}] = m;
}

std::optional<Identity> InMemoryStore::findUser(const std::string& userId) {
  std::shared_lock lock(_mutex);
  auto it = _users.find(userId);
  if (it == _users.end()) return std::nullopt;
  return it->second;
}

std::optional<Membership> InMemoryStore::findActiveMembership(const std::string& userId,
                                                              const std::string& workspaceId) {
  std::shared_lock lock(_mutex);
  auto it = _memberships.find({userId, workspaceId});
  if (it == _memberships.end() || it->second.status != MemberStatus::Active) return std::nullopt;
  return it->second;
}

void InMemoryStore::upsertPresence(const PresenceRecord& rec) {
  std::unique_lock lock(_mutex);
  _presence[{rec.userId, rec.workspaceId}] = rec;
}

std::vector<PresenceRecord> InMemoryStore::listPresence(const std::string& workspaceId) {
  std::shared_lock lock(_mutex);
  std::vector<PresenceRecord> out;
  for (auto& kv : _presence) {
    if (kv.first.second == workspaceId) out.push_back(kv.second);
  }
  std::sort(out.begin(), out.end(), [](const PresenceRecord& a, const PresenceRecord& b){
    return a.userId < b.userId;
  });
  return out;
}

void InMemoryStore::setOrderLock(const OrderLock& lock) {
  std::unique_lock lk(_mutex);
  _locks[lock.orderId] = lock;
}

void InMemoryStore::clearOrderLock(const std::string& orderId, const std::string& workspaceId) {
  std::unique_lock lk(_mutex);
  auto it = _locks.find(orderId);
  if (it == _locks.end()) return;
  if (!workspaceId.empty() && it->second.workspaceId != workspaceId) return;
  _locks.erase(it);
}

std::vector<OrderLock> InMemoryStore::listOrderLocks(const std::string& workspaceId) {
  std::shared_lock lk(_mutex);
  std::vector<OrderLock> out;
  for (auto& kv : _locks) {
    if (workspaceId.empty() || kv.second.workspaceId == workspaceId) out.push_back(kv.second);
  }
  std::sort(out.begin(), out.end(), [](const OrderLock& a, const OrderLock& b){
    return a.orderId < b.orderId;
  });
  return out;
}

std::string InMemoryStore::appendEdit(const EditRecord& rec) {
  if (rec.orderId.empty() || rec.fieldPath.empty()) {
    throw StoreError("edit requires orderId and fieldPath");
  }
  std::unique_lock lock(_mutex);
  const std::string id = "edit-" + std::to_string(_nextId++);
  StoredEdit e{rec, false};
  e.rec.editId = id;
  _edits.emplace(id, std::move(e));
  _editsByOrder[rec.orderId].push_back(id);
  return id;
}

bool InMemoryStore::applyEdit(const std::string& editId) {
  std::unique_lock lock(_mutex);
  auto it = _edits.find(editId);
  if (it == _edits.end()) return false;
  if (!it->second.applied) {
    const auto& rec = it->second.rec;
    _orderFields[rec.orderId][rec.fieldPath] = rec.newValue;
    it->second.applied = true;
  }
  return true;
}

ChatMessage InMemoryStore::insertChatMessage(const ChatMessage& msg) {
  std::unique_lock lock(_mutex);
  ChatMessage stored = msg;
  stored.messageId = "msg-" + std::to_string(_nextId++);
  _chat[msg.workspaceId].push_back(stored);
  return stored;
}

std::vector<ActivityEntry> InMemoryStore::recentActivity(const std::string& workspaceId,
                                                         std::size_t limit) {
  std::shared_lock lock(_mutex);
  std::vector<ActivityEntry> out;
  auto it = _activity.find(workspaceId);
  if (it == _activity.end()) return out;
  // stored newest first
  for (auto& e : it->second) {
    if (out.size() >= limit) break;
    out.push_back(e);
  }
  return out;
}

void InMemoryStore::record(const ActivityEntry& entry) {
  std::unique_lock lock(_mutex);
  auto& q = _activity[entry.workspaceId];
  q.push_front(entry);
  if (q.size() > kMaxActivityPerWorkspace) q.pop_back();
}

std::optional<PresenceRecord> InMemoryStore::presence(const std::string& userId,
                                                      const std::string& workspaceId) const {
  std::shared_lock lock(_mutex);
  auto it = _presence.find({userId, workspaceId});
  if (it == _presence.end()) return std::nullopt;
  return it->second;
}

std::optional<OrderLock> InMemoryStore::orderLock(const std::string& orderId) const {
  std::shared_lock lock(_mutex);
  auto it = _locks.find(orderId);
  if (it == _locks.end()) return std::nullopt;
  return it->second;
}

std::vector<EditRecord> InMemoryStore::edits(const std::string& orderId) const {
  std::shared_lock lock(_mutex);
  std::vector<EditRecord> out;
  auto it = _editsByOrder.find(orderId);
  if (it == _editsByOrder.end()) return out;
  for (auto& id : it->second) {
    auto e = _edits.find(id);
    if (e != _edits.end()) out.push_back(e->second.rec);
  }
  return out;
}

std::map<std::string, std::string> InMemoryStore::orderFields(const std::string& orderId) const {
  std::shared_lock lock(_mutex);
  auto it = _orderFields.find(orderId);
  if (it == _orderFields.end()) return {};
  return it->second;
}

std::vector<ChatMessage> InMemoryStore::chatMessages(const std::string& workspaceId) const {
  std::shared_lock lock(_mutex);
  auto it = _chat.find(workspaceId);
  if (it == _chat.end()) return {};
  return it->second;
}

} // namespace collab::store
