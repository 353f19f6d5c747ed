#pragma once

#include "collab/Types.hpp"
#include "collab/protocol/Messages.hpp"

#include <cstddef>
#include <string>

namespace collab::store { class CollabStore; }
namespace collab::util  { class Clock; }

namespace collab::core {

class ActivityRecorder;
class RoomBroadcaster;

class ChatRelay {
public:
  struct Options {
    std::size_t maxLength = 4000; // code points
  };

  ChatRelay(store::CollabStore* store,
            const RoomBroadcaster* broadcaster,
            ActivityRecorder* activity,
            const util::Clock* clock,
            Options opts);

  // Validates, persists, broadcasts to the room (sender excluded) and
  // replies chat_message to connId. Throws ProtocolError / StoreError.
  ChatMessage sendMessage(const std::string& userId, ConnId connId, const protocol::ChatSend& msg);

  // Ephemeral; never persisted.
  void typing(const std::string& userId, const protocol::Typing& t);

  static std::size_t codePoints(const std::string& utf8);

private:
  store::CollabStore*    store_;
  const RoomBroadcaster* broadcaster_;
  ActivityRecorder*      activity_;
  const util::Clock*     clock_;
  Options                opts_;
};

} // namespace collab::core
