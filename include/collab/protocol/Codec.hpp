#pragma once

#include "collab/Result.hpp"
#include "collab/Types.hpp"
#include "collab/protocol/Messages.hpp"

#include <string>
#include <string_view>

namespace collab::protocol {

namespace events {
  // inbound
  inline constexpr const char* JoinWorkspace    = "join_workspace";
  inline constexpr const char* LeaveWorkspace   = "leave_workspace";
  inline constexpr const char* PresenceUpdate   = "presence_update";
  inline constexpr const char* RequestOrderLock = "request_order_lock";
  inline constexpr const char* ReleaseOrderLock = "release_order_lock";
  inline constexpr const char* OrderEdit        = "order_edit";
  inline constexpr const char* ChatMessage      = "chat_message";
  inline constexpr const char* TypingStart      = "typing_start";
  inline constexpr const char* TypingStop       = "typing_stop";
  // outbound
  inline constexpr const char* OrderLockResponse  = "order_lock_response";
  inline constexpr const char* OrderLock          = "order_lock";
  inline constexpr const char* OrderUnlock        = "order_unlock";
  inline constexpr const char* OrderEditAck       = "order_edit_ack";
  inline constexpr const char* MemberJoined       = "member_joined";
  inline constexpr const char* MemberLeft         = "member_left";
  inline constexpr const char* TypingIndicator    = "typing_indicator";
  inline constexpr const char* WorkspaceState     = "workspace_state";
  inline constexpr const char* CollaborationError = "collaboration_error";
  inline constexpr const char* Heartbeat          = "heartbeat";
} // namespace events

namespace codes {
  inline constexpr const char* Protocol       = "PROTOCOL_ERROR";
  inline constexpr const char* JoinWorkspace  = "JOIN_WORKSPACE_ERROR";
  inline constexpr const char* LeaveWorkspace = "LEAVE_WORKSPACE_ERROR";
  inline constexpr const char* PresenceUpdate = "PRESENCE_UPDATE_ERROR";
  inline constexpr const char* OrderLock      = "ORDER_LOCK_ERROR";
  inline constexpr const char* OrderUnlock    = "ORDER_UNLOCK_ERROR";
  inline constexpr const char* OrderEdit      = "ORDER_EDIT_ERROR";
  inline constexpr const char* ChatMessage    = "CHAT_MESSAGE_ERROR";
  inline constexpr const char* Typing         = "TYPING_ERROR";
} // namespace codes

// Error code reported for a failed handler of the given inbound event.
// Unknown events map to PROTOCOL_ERROR.
const char* errorCodeFor(std::string_view event);

// Parses one text frame. On failure the Error's code is the
// collaboration_error code to report (PROTOCOL_ERROR for a bad envelope
// or unknown event, the event's own code for a bad payload).
Result<Inbound> decode(const std::string& text);

// Unlock reasons carried by order_unlock.
namespace reasons {
  inline constexpr const char* Released     = "released";
  inline constexpr const char* Expired      = "expired";
  inline constexpr const char* Disconnected = "disconnected";
  inline constexpr const char* Left         = "left";
} // namespace reasons

// --- outbound frames: {"event": ..., "data": {...}} ---
std::string encodeLockResponse(const LockResponse& r);
std::string encodeOrderLock(const OrderLock& lock, Timestamp now);
std::string encodeOrderUnlock(const OrderLock& lock, const std::string& releasedBy,
                              const char* reason, Timestamp now);
std::string encodeEdit(const EditRecord& e);
std::string encodeEditAck(const EditRecord& e);
std::string encodePresence(const PresenceRecord& p);
std::string encodeMember(const char* event, const std::string& userId,
                         const std::string& workspaceId, PresenceStatus status, Timestamp now);
std::string encodeChat(const ChatMessage& m, Timestamp now);
std::string encodeTyping(const std::string& userId, const Typing& t, Timestamp now);
std::string encodeWorkspaceState(const WorkspaceSnapshot& s);
std::string encodeError(const std::string& code, const std::string& message, Timestamp now);
std::string encodeHeartbeat(Timestamp now);

} // namespace collab::protocol
