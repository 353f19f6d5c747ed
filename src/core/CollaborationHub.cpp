#include "collab/core/CollaborationHub.hpp"
#include "collab/core/ChatRelay.hpp"
#include "collab/core/ConnectionRegistry.hpp"
#include "collab/core/ConnectionSink.hpp"
#include "collab/core/EditCoordinator.hpp"
#include "collab/core/LockManager.hpp"
#include "collab/core/PresenceTracker.hpp"
#include "collab/core/RoomBroadcaster.hpp"
#include "collab/Errors.hpp"
#include "collab/protocol/Codec.hpp"
#include "collab/rt/SerialMailbox.hpp"
#include "collab/store/Stores.hpp"
#include "collab/util/Clock.hpp"
#include "collab/util/Logger.hpp"
#include "collab/util/Metrics.hpp"

#include <exception>
#include <utility>
#include <variant>

namespace collab::core {

CollaborationHub::CollaborationHub(Deps deps)
  : deps_(deps)
  , clock_(deps.clock ? deps.clock : &util::systemClock())
{}

bool CollaborationHub::onOpen(ConnId connId, const Identity& identity,
                              std::shared_ptr<ConnectionSink> sink) {
  if (!deps_.registry->registerConnection(identity.userId, connId, std::move(sink))) {
    util::logger().log(util::LogLevel::Warn, "hub.duplicate_connection",
                       {{"connId", std::to_string(connId)}});
    return false;
  }

  std::size_t n = 0;
  {
    std::lock_guard<std::mutex> lk(mx_);
    sessions_[connId] = Session{identity.userId, rt::SerialMailbox::create(deps_.pool)};
    n = sessions_.size();
  }
  COLLAB_METRIC_SET("hub.sessions", static_cast<double>(n));
  return true;
}

void CollaborationHub::onMessage(ConnId connId, std::string text) {
  std::shared_ptr<rt::SerialMailbox> mailbox;
  std::string userId;
  {
    std::lock_guard<std::mutex> lk(mx_);
    auto it = sessions_.find(connId);
    if (it == sessions_.end()) return;
    mailbox = it->second.mailbox;
    userId = it->second.userId;
  }

  COLLAB_METRIC_HIT("hub.frames_in");
  mailbox->post([this, connId, userId, t = std::move(text)]{
    process(connId, userId, t);
  });
}

void CollaborationHub::onClose(ConnId connId) {
  std::shared_ptr<rt::SerialMailbox> mailbox;
  std::size_t n = 0;
  {
    std::lock_guard<std::mutex> lk(mx_);
    auto it = sessions_.find(connId);
    if (it == sessions_.end()) return;
    mailbox = std::move(it->second.mailbox);
    sessions_.erase(it);
    n = sessions_.size();
  }
  COLLAB_METRIC_SET("hub.sessions", static_cast<double>(n));

  mailbox->post([this, connId]{ finalize(connId); });
  mailbox->close();
}

std::size_t CollaborationHub::sessionCount() const {
  std::lock_guard<std::mutex> lk(mx_);
  return sessions_.size();
}

void CollaborationHub::process(ConnId connId, const std::string& userId, const std::string& text) {
  auto decoded = protocol::decode(text);
  if (!decoded) {
    COLLAB_METRIC_HIT("hub.protocol_errors");
    util::logger().log(util::LogLevel::Info, "hub.decode_failed",
                       {{"connId", std::to_string(connId)}, {"error", decoded.error().message}});
    reportError(connId, decoded.error().code, decoded.error().message);
    return;
  }

  const protocol::Inbound& in = *decoded;
  util::Logger::Scoped ctx({{"connId", std::to_string(connId)}, {"userId", userId}});

  try {
    dispatch(connId, userId, in);
  } catch (const CollabError& ex) {
    util::logger().log(ex.kind() == ErrorKind::Persistence ? util::LogLevel::Warn
                                                           : util::LogLevel::Info,
                       "hub.handler_failed",
                       {{"event", in.event}, {"kind", toString(ex.kind())}, {"error", ex.what()}});
    reportError(connId, protocol::errorCodeFor(in.event), ex.what());
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Error, "hub.handler_crashed",
                       {{"event", in.event}, {"error", ex.what()}});
    reportError(connId, protocol::errorCodeFor(in.event), ex.what());
  }
}

void CollaborationHub::dispatch(ConnId connId, const std::string& userId,
                                const protocol::Inbound& in) {
  std::visit([&](const auto& cmd) { handle(connId, userId, cmd); }, in.command);
}

void CollaborationHub::reportError(ConnId connId, const std::string& code, const std::string& message) {
  COLLAB_METRIC_HIT("hub.errors");
  deps_.broadcaster->sendTo(connId, protocol::encodeError(code, message, clock_->now()));
}

WorkspaceRole CollaborationHub::requireJoined(ConnId connId, const std::string& workspaceId) const {
  auto role = deps_.registry->roleOf(connId, workspaceId);
  if (!role) throw AuthorizationError("Not joined to workspace " + workspaceId);
  return *role;
}

void CollaborationHub::handle(ConnId connId, const std::string& userId,
                              const protocol::JoinWorkspace& cmd) {
  // Checked on every join, never cached.
  auto membership = deps_.memberships->findActiveMembership(userId, cmd.workspaceId);
  if (!membership) {
    throw AuthorizationError("Not an active member of workspace " + cmd.workspaceId);
  }

  std::lock_guard<std::mutex> key(memberKey(userId, cmd.workspaceId));
  const bool wasJoined = deps_.registry->isJoined(connId, cmd.workspaceId);
  deps_.registry->joinWorkspace(userId, connId, cmd.workspaceId, membership->role);
  try {
    deps_.presence->onJoin(userId, connId, cmd.workspaceId);
  } catch (const std::exception&) {
    if (!wasJoined) deps_.registry->leaveWorkspace(userId, connId, cmd.workspaceId);
    throw;
  }
}

void CollaborationHub::handle(ConnId connId, const std::string& userId,
                              const protocol::LeaveWorkspace& cmd) {
  requireJoined(connId, cmd.workspaceId);
  std::lock_guard<std::mutex> key(memberKey(userId, cmd.workspaceId));
  const bool last = deps_.registry->leaveWorkspace(userId, connId, cmd.workspaceId);
  if (!last) return;

  deps_.locks->releaseAllLocksForUser(userId, cmd.workspaceId, protocol::reasons::Left);
  deps_.presence->onLeave(userId, cmd.workspaceId);
}

void CollaborationHub::handle(ConnId connId, const std::string& userId,
                              const protocol::PresenceUpdate& cmd) {
  requireJoined(connId, cmd.workspaceId);
  deps_.presence->update(userId, cmd.workspaceId, cmd.status, cmd.currentPage, cmd.cursorPosition);
}

void CollaborationHub::handle(ConnId connId, const std::string& userId,
                              const protocol::RequestOrderLock& cmd) {
  const auto role = requireJoined(connId, cmd.workspaceId);
  if (!canEditOrders(role)) throw AuthorizationError("Role does not allow locking orders");

  const LockResponse resp =
      deps_.locks->requestLock(cmd.orderId, userId, cmd.workspaceId, cmd.durationMinutes);
  deps_.broadcaster->sendTo(connId, protocol::encodeLockResponse(resp));
}

void CollaborationHub::handle(ConnId connId, const std::string& userId,
                              const protocol::ReleaseOrderLock& cmd) {
  requireJoined(connId, cmd.workspaceId);
  const auto result = deps_.locks->releaseLock(cmd.orderId, userId, cmd.workspaceId);
  if (result == LockManager::ReleaseResult::Denied) {
    throw AuthorizationError("Order is locked by another user");
  }
}

void CollaborationHub::handle(ConnId connId, const std::string& userId,
                              const protocol::OrderEdit& cmd) {
  const auto role = requireJoined(connId, cmd.workspaceId);
  const EditRecord rec = deps_.edits->proposeEdit(userId, role, cmd);
  deps_.broadcaster->sendTo(connId, protocol::encodeEditAck(rec));
}

void CollaborationHub::handle(ConnId connId, const std::string& userId,
                              const protocol::ChatSend& cmd) {
  requireJoined(connId, cmd.workspaceId);
  deps_.chat->sendMessage(userId, connId, cmd);
}

void CollaborationHub::handle(ConnId connId, const std::string& userId,
                              const protocol::Typing& cmd) {
  requireJoined(connId, cmd.workspaceId);
  deps_.chat->typing(userId, cmd);
}

std::mutex& CollaborationHub::memberKey(const std::string& userId,
                                        const std::string& workspaceId) {
  return memberKeys_.forKey(userId + '\x1f' + workspaceId);
}

void CollaborationHub::finalize(ConnId connId) {
  const auto removal = deps_.registry->unregisterConnection(connId);
  if (!removal.found) return;

  for (const auto& ws : removal.departedWorkspaces) {
    std::lock_guard<std::mutex> key(memberKey(removal.userId, ws));
    // Another connection of the user joined since the registry removal.
    if (deps_.registry->isPresent(removal.userId, ws)) continue;
    try {
      deps_.locks->releaseAllLocksForUser(removal.userId, ws, protocol::reasons::Disconnected);
    } catch (const std::exception& ex) {
      util::logger().log(util::LogLevel::Error, "hub.finalize_locks_failed",
                         {{"userId", removal.userId}, {"workspaceId", ws}, {"error", ex.what()}});
    }
    try {
      deps_.presence->onLeave(removal.userId, ws);
    } catch (const std::exception& ex) {
      util::logger().log(util::LogLevel::Error, "hub.finalize_presence_failed",
                         {{"userId", removal.userId}, {"workspaceId", ws}, {"error", ex.what()}});
    }
  }

  if (removal.lastConnection && deps_.registry->connectionsOf(removal.userId).empty()) {
    try {
      deps_.locks->releaseAllLocksForUser(removal.userId, std::nullopt,
                                          protocol::reasons::Disconnected);
    } catch (const std::exception& ex) {
      util::logger().log(util::LogLevel::Error, "hub.finalize_locks_failed",
                         {{"userId", removal.userId}, {"error", ex.what()}});
    }
  }

  util::logger().log(util::LogLevel::Info, "hub.connection_finalized",
                     {{"connId", std::to_string(connId)}, {"userId", removal.userId},
                      {"workspaces", std::to_string(removal.departedWorkspaces.size())}});
}

} // namespace collab::core
