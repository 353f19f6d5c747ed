#pragma once

#include "collab/Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace collab::protocol {

// Typed inbound commands, one per client event.

struct JoinWorkspace {
  std::string workspaceId;
};

struct LeaveWorkspace {
  std::string workspaceId;
};

struct PresenceUpdate {
  std::string    workspaceId;
  PresenceStatus status = PresenceStatus::Online;
  std::optional<std::string>    currentPage;
  std::optional<CursorPosition> cursorPosition;
};

struct RequestOrderLock {
  std::string orderId;
  std::string workspaceId;
  std::optional<int> durationMinutes;
};

struct ReleaseOrderLock {
  std::string orderId;
  std::string workspaceId;
};

// oldValue/newValue are the serialized JSON of the client's values.
struct OrderEdit {
  std::string  orderId;
  std::string  workspaceId;
  std::string  fieldPath;
  std::string  oldValue;
  std::string  newValue;
  std::int64_t version = 0;
};

struct ChatSend {
  std::string     workspaceId;
  std::string     content;
  ChatMessageType messageType = ChatMessageType::Text;
  std::optional<std::string> threadId;
  std::optional<std::string> parentMessageId;
};

struct Typing {
  std::string workspaceId;
  std::optional<std::string> channelId;
  bool isTyping = false;
};

using Command = std::variant<JoinWorkspace,
                             LeaveWorkspace,
                             PresenceUpdate,
                             RequestOrderLock,
                             ReleaseOrderLock,
                             OrderEdit,
                             ChatSend,
                             Typing>;

struct Inbound {
  std::string event;
  Command     command;
};

} // namespace collab::protocol
