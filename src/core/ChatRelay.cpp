#include "collab/core/ChatRelay.hpp"
#include "collab/core/ActivityRecorder.hpp"
#include "collab/core/RoomBroadcaster.hpp"
#include "collab/Errors.hpp"
#include "collab/protocol/Codec.hpp"
#include "collab/store/Stores.hpp"
#include "collab/util/Clock.hpp"
#include "collab/util/Metrics.hpp"

#include <algorithm>
#include <cctype>

namespace collab::core {

ChatRelay::ChatRelay(store::CollabStore* store,
                     const RoomBroadcaster* broadcaster,
                     ActivityRecorder* activity,
                     const util::Clock* clock,
                     Options opts)
  : store_(store)
  , broadcaster_(broadcaster)
  , activity_(activity)
  , clock_(clock ? clock : &util::systemClock())
  , opts_(opts)
{}

std::size_t ChatRelay::codePoints(const std::string& utf8) {
  std::size_t n = 0;
  for (unsigned char c : utf8) {
    if ((c & 0xC0) != 0x80) ++n;
  }
  return n;
}

ChatMessage ChatRelay::sendMessage(const std::string& userId, ConnId connId,
                                   const protocol::ChatSend& msg) {
  const bool blank = std::all_of(msg.content.begin(), msg.content.end(),
                                 [](unsigned char c){ return std::isspace(c) != 0; });
  if (blank) throw ProtocolError("Message content must not be empty");
  if (codePoints(msg.content) > opts_.maxLength) {
    throw ProtocolError("Message content exceeds " + std::to_string(opts_.maxLength) + " characters");
  }

  ChatMessage m;
  m.workspaceId = msg.workspaceId;
  m.userId = userId;
  m.threadId = msg.threadId;
  m.parentMessageId = msg.parentMessageId;
  m.messageType = msg.messageType;
  m.content = msg.content;
  m.createdAt = clock_->now();

  ChatMessage stored = store_->insertChatMessage(m);
  const std::string frame = protocol::encodeChat(stored, clock_->now());

  COLLAB_METRIC_HIT("chat.messages");
  broadcaster_->broadcast(stored.workspaceId, frame, userId);
  broadcaster_->sendTo(connId, frame);

  if (activity_) {
    ActivityEntry a;
    a.workspaceId = stored.workspaceId;
    a.userId = userId;
    a.activityType = "chat_message";
    a.entityType = "chat_message";
    a.entityId = stored.messageId;
    a.description = "Sent a message";
    a.createdAt = stored.createdAt;
    activity_->record(std::move(a));
  }
  return stored;
}

void ChatRelay::typing(const std::string& userId, const protocol::Typing& t) {
  broadcaster_->broadcast(t.workspaceId, protocol::encodeTyping(userId, t, clock_->now()), userId);
}

} // namespace collab::core
