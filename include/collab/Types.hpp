// include/collab/Types.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace collab {

using Timestamp = std::chrono::system_clock::time_point;
using ConnId    = std::uint64_t;

enum class PresenceStatus { Online, Away, Busy, Offline };
enum class WorkspaceRole  { Owner, Admin, Editor, Viewer };
enum class MemberStatus   { Active, Invited, Suspended, Left };
enum class ChatMessageType { Text, System, File, OrderMention, MemberMention };

const char* toString(PresenceStatus s);
const char* toString(WorkspaceRole r);
const char* toString(MemberStatus s);
const char* toString(ChatMessageType t);

std::optional<PresenceStatus>  parsePresenceStatus(std::string_view s);
std::optional<WorkspaceRole>   parseWorkspaceRole(std::string_view s);
std::optional<MemberStatus>    parseMemberStatus(std::string_view s);
std::optional<ChatMessageType> parseChatMessageType(std::string_view s);

// Viewers may read and chat but not lock or edit orders.
bool canEditOrders(WorkspaceRole r);

struct Identity {
  std::string userId;
  std::string name;
  std::string email;
};

struct Membership {
  std::string   workspaceId;
  std::string   userId;
  WorkspaceRole role   = WorkspaceRole::Viewer;
  MemberStatus  status = MemberStatus::Active;
};

struct TextSelection {
  int start = 0;
  int end   = 0;
  std::optional<std::string> text;
};

struct CursorPosition {
  double x = 0.0;
  double y = 0.0;
  std::optional<std::string>   page;
  std::optional<std::string>   element;
  std::optional<TextSelection> selection;
};

struct PresenceRecord {
  std::string    userId;
  std::string    workspaceId;
  PresenceStatus status = PresenceStatus::Offline;
  std::optional<std::string>    currentPage;
  std::optional<CursorPosition> cursorPosition;
  Timestamp      lastActivity{};
};

struct OrderLock {
  std::string orderId;
  std::string workspaceId;
  std::string holder;
  Timestamp   expiresAt{};
};

// Reply to a lock request. A failed response is a contention outcome, not an error.
struct LockResponse {
  bool        success = false;
  std::string orderId;
  std::optional<std::string> lockedBy;
  std::optional<Timestamp>   lockedUntil;
  std::string message;
};

// Append-only field replacement. oldValue/newValue hold serialized JSON.
struct EditRecord {
  std::string  editId;
  std::string  orderId;
  std::string  userId;
  std::string  workspaceId;
  std::string  operationType = "replace";
  std::string  fieldPath;
  std::string  oldValue;
  std::string  newValue;
  std::int64_t version = 0;
  Timestamp    timestamp{};
};

struct ChatMessage {
  std::string messageId;
  std::string workspaceId;
  std::string userId;
  std::optional<std::string> threadId;
  std::optional<std::string> parentMessageId;
  ChatMessageType messageType = ChatMessageType::Text;
  std::string content;
  Timestamp   createdAt{};
};

struct ActivityEntry {
  std::string workspaceId;
  std::string userId;
  std::string activityType;
  std::string entityType;
  std::string entityId;
  std::string description;
  Timestamp   createdAt{};
};

// Shipped to a joining connection so it can resynchronize without replay.
struct WorkspaceSnapshot {
  std::string                 workspaceId;
  std::vector<PresenceRecord> members;
  std::vector<ActivityEntry>  activities;
  std::vector<OrderLock>      orderLocks;
  Timestamp                   timestamp{};
};

} // namespace collab
