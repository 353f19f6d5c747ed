#include "collab/Types.hpp"
#include "collab/Errors.hpp"

namespace collab {

const char* toString(PresenceStatus s) {
  switch (s) {
    case PresenceStatus::Online:  return "online";
    case PresenceStatus::Away:    return "away";
    case PresenceStatus::Busy:    return "busy";
    case PresenceStatus::Offline: return "offline";
  }
  return "offline";
}

const char* toString(WorkspaceRole r) {
  switch (r) {
    case WorkspaceRole::Owner:  return "owner";
    case WorkspaceRole::Admin:  return "admin";
    case WorkspaceRole::Editor: return "editor";
    case WorkspaceRole::Viewer: return "viewer";
  }
  return "viewer";
}

const char* toString(MemberStatus s) {
  switch (s) {
    case MemberStatus::Active:    return "active";
    case MemberStatus::Invited:   return "invited";
    case MemberStatus::Suspended: return "suspended";
    case MemberStatus::Left:      return "left";
  }
  return "left";
}

const char* toString(ChatMessageType t) {
  switch (t) {
    case ChatMessageType::Text:          return "text";
    case ChatMessageType::System:        return "system";
    case ChatMessageType::File:          return "file";
    case ChatMessageType::OrderMention:  return "order_mention";
    case ChatMessageType::MemberMention: return "member_mention";
  }
  return "text";
}

const char* toString(ErrorKind k) {
  switch (k) {
    case ErrorKind::Authentication: return "authentication";
    case ErrorKind::Authorization:  return "authorization";
    case ErrorKind::Persistence:    return "persistence";
    case ErrorKind::Protocol:       return "protocol";
  }
  return "unknown";
}

std::optional<PresenceStatus> parsePresenceStatus(std::string_view s) {
  if (s == "online")  return PresenceStatus::Online;
  if (s == "away")    return PresenceStatus::Away;
  if (s == "busy")    return PresenceStatus::Busy;
  if (s == "offline") return PresenceStatus::Offline;
  return std::nullopt;
}

std::optional<WorkspaceRole> parseWorkspaceRole(std::string_view s) {
  if (s == "owner")  return WorkspaceRole::Owner;
  if (s == "admin")  return WorkspaceRole::Admin;
  if (s == "editor") return WorkspaceRole::Editor;
  if (s == "viewer") return WorkspaceRole::Viewer;
  return std::nullopt;
}

std::optional<MemberStatus> parseMemberStatus(std::string_view s) {
  if (s == "active")    return MemberStatus::Active;
  if (s == "invited")   return MemberStatus::Invited;
  if (s == "suspended") return MemberStatus::Suspended;
  if (s == "left")      return MemberStatus::Left;
  return std::nullopt;
}

std::optional<ChatMessageType> parseChatMessageType(std::string_view s) {
  if (s == "text")           return ChatMessageType::Text;
  if (s == "system")         return ChatMessageType::System;
  if (s == "file")           return ChatMessageType::File;
  if (s == "order_mention")  return ChatMessageType::OrderMention;
  if (s == "member_mention") return ChatMessageType::MemberMention;
  return std::nullopt;
}

bool canEditOrders(WorkspaceRole r) {
  return r != WorkspaceRole::Viewer;
}

} // namespace collab
