#pragma once

#include "collab/Types.hpp"
#include "collab/protocol/Messages.hpp"
#include "collab/rt/KeyedMutex.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace collab::rt    { class SerialMailbox; class ThreadPool; }
namespace collab::store { class MembershipStore; }
namespace collab::util  { class Clock; }

namespace collab::core {

class ChatRelay;
class ConnectionRegistry;
class ConnectionSink;
class EditCoordinator;
class LockManager;
class PresenceTracker;
class RoomBroadcaster;

// Routes inbound frames of authenticated connections to the components.
// Each connection owns a serial mailbox: its handlers run one at a time in
// arrival order, different connections run concurrently on the pool.
class CollaborationHub {
public:
  struct Deps {
    ConnectionRegistry*     registry    = nullptr;
    store::MembershipStore* memberships = nullptr;
    PresenceTracker*        presence    = nullptr;
    LockManager*            locks       = nullptr;
    EditCoordinator*        edits       = nullptr;
    ChatRelay*              chat        = nullptr;
    const RoomBroadcaster*  broadcaster = nullptr;
    rt::ThreadPool*         pool        = nullptr; // null: run inline
    const util::Clock*      clock       = nullptr;
  };

  explicit CollaborationHub(Deps deps);

  ConnId nextConnectionId() { return nextId_.fetch_add(1); }

  // Call once the handshake has been accepted for identity.
  bool onOpen(ConnId connId, const Identity& identity, std::shared_ptr<ConnectionSink> sink);
  void onMessage(ConnId connId, std::string text);
  // Queues the disconnect finalizer behind pending handlers. Idempotent.
  void onClose(ConnId connId);

  std::size_t sessionCount() const;

private:
  struct Session {
    std::string userId;
    std::shared_ptr<rt::SerialMailbox> mailbox;
  };

  void process(ConnId connId, const std::string& userId, const std::string& text);
  void dispatch(ConnId connId, const std::string& userId, const protocol::Inbound& in);

  void handle(ConnId, const std::string&, const protocol::JoinWorkspace&);
  void handle(ConnId, const std::string&, const protocol::LeaveWorkspace&);
  void handle(ConnId, const std::string&, const protocol::PresenceUpdate&);
  void handle(ConnId, const std::string&, const protocol::RequestOrderLock&);
  void handle(ConnId, const std::string&, const protocol::ReleaseOrderLock&);
  void handle(ConnId, const std::string&, const protocol::OrderEdit&);
  void handle(ConnId, const std::string&, const protocol::ChatSend&);
  void handle(ConnId, const std::string&, const protocol::Typing&);

  // Role of connId in workspaceId; throws AuthorizationError if not joined.
  WorkspaceRole requireJoined(ConnId connId, const std::string& workspaceId) const;

  // Registry membership and presence for one (user, workspace) change
  // together under this key in join, leave and finalize.
  std::mutex& memberKey(const std::string& userId, const std::string& workspaceId);

  void finalize(ConnId connId);
  void reportError(ConnId connId, const std::string& code, const std::string& message);

  Deps deps_;
  const util::Clock* clock_;

  mutable std::mutex mx_;
  std::unordered_map<ConnId, Session> sessions_;
  std::atomic<ConnId> nextId_{1};
  rt::KeyedMutex memberKeys_;
};

} // namespace collab::core
