#include "collab/protocol/Codec.hpp"
#include "collab/protocol/JsonValidator.hpp"
#include "collab/util/Time.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <cstring>
#include <limits>

namespace collab::protocol {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void putString(JsonWriter& w, const std::string& s) {
  w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
}

void putField(JsonWriter& w, const char* key, const std::string& s) {
  w.Key(key);
  putString(w, s);
}

void putOptional(JsonWriter& w, const char* key, const std::optional<std::string>& s) {
  if (!s) return;
  putField(w, key, *s);
}

void putTime(JsonWriter& w, const char* key, Timestamp tp) {
  putField(w, key, util::toIso8601(tp));
}

// Values arrive from decode() as serialized JSON; anything else is sent as a string.
void putRawJson(JsonWriter& w, const char* key, const std::string& json) {
  w.Key(key);
  if (json.empty()) {
    w.Null();
    return;
  }
  rapidjson::Document probe;
  if (probe.Parse(json.c_str(), json.size()).HasParseError()) {
    putString(w, json);
    return;
  }
  w.RawValue(json.c_str(), json.size(), probe.GetType());
}

template <typename Fn>
std::string frame(const char* event, Fn&& body) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key("event");
  w.String(event);
  w.Key("data");
  w.StartObject();
  body(w);
  w.EndObject();
  w.EndObject();
  return std::string(sb.GetString(), sb.GetSize());
}

void writePresence(JsonWriter& w, const PresenceRecord& p) {
  putField(w, "userId", p.userId);
  putField(w, "workspaceId", p.workspaceId);
  w.Key("status");
  w.String(toString(p.status));
  putOptional(w, "currentPage", p.currentPage);
  if (p.cursorPosition) {
    const auto& c = *p.cursorPosition;
    w.Key("cursorPosition");
    w.StartObject();
    w.Key("x"); w.Double(c.x);
    w.Key("y"); w.Double(c.y);
    putOptional(w, "page", c.page);
    putOptional(w, "element", c.element);
    if (c.selection) {
      w.Key("selection");
      w.StartObject();
      w.Key("start"); w.Int(c.selection->start);
      w.Key("end");   w.Int(c.selection->end);
      putOptional(w, "text", c.selection->text);
      w.EndObject();
    }
    w.EndObject();
  }
  putTime(w, "lastActivity", p.lastActivity);
  putTime(w, "timestamp", p.lastActivity);
}

void writeLock(JsonWriter& w, const OrderLock& l) {
  putField(w, "orderId", l.orderId);
  putField(w, "workspaceId", l.workspaceId);
  putField(w, "lockedBy", l.holder);
  putTime(w, "expiresAt", l.expiresAt);
}

void writeActivity(JsonWriter& w, const ActivityEntry& a) {
  putField(w, "workspaceId", a.workspaceId);
  putField(w, "userId", a.userId);
  putField(w, "activityType", a.activityType);
  putField(w, "entityType", a.entityType);
  putField(w, "entityId", a.entityId);
  putField(w, "description", a.description);
  putTime(w, "createdAt", a.createdAt);
}

std::string serialize(const rapidjson::Value& v) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  v.Accept(w);
  return std::string(sb.GetString(), sb.GetSize());
}

int narrowToInt(std::int64_t v, const char* name) {
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
    throw ProtocolError(std::string(name) + " out of range");
  }
  return static_cast<int>(v);
}

int requireInt(const rapidjson::Value& v, const char* name) {
  return narrowToInt(JsonValidator::requireInteger(v, name), name);
}

CursorPosition decodeCursor(const rapidjson::Value& v) {
  JsonValidator::requireObject(v, "cursorPosition");
  CursorPosition c;
  c.x = JsonValidator::optionalNumber(v, "x").value_or(0.0);
  c.y = JsonValidator::optionalNumber(v, "y").value_or(0.0);
  c.page = JsonValidator::optionalString(v, "page");
  c.element = JsonValidator::optionalString(v, "element");
  if (v.HasMember("selection") && !v["selection"].IsNull()) {
    const auto& s = v["selection"];
    JsonValidator::requireObject(s, "selection");
    TextSelection sel;
    sel.start = requireInt(s, "start");
    sel.end   = requireInt(s, "end");
    sel.text  = JsonValidator::optionalString(s, "text");
    c.selection = sel;
  }
  return c;
}

Command decodePayload(std::string_view event, const rapidjson::Value& d) {
  using V = JsonValidator;

  if (event == events::JoinWorkspace) {
    return JoinWorkspace{V::requireString(d, "workspaceId")};
  }
  if (event == events::LeaveWorkspace) {
    return LeaveWorkspace{V::requireString(d, "workspaceId")};
  }
  if (event == events::PresenceUpdate) {
    PresenceUpdate p;
    p.workspaceId = V::requireString(d, "workspaceId");
    const auto status = V::requireString(d, "status");
    auto parsed = parsePresenceStatus(status);
    if (!parsed) throw ProtocolError("Unknown presence status '" + status + "'");
    p.status = *parsed;
    p.currentPage = V::optionalString(d, "currentPage");
    if (d.HasMember("cursorPosition") && !d["cursorPosition"].IsNull()) {
      p.cursorPosition = decodeCursor(d["cursorPosition"]);
    }
    return p;
  }
  if (event == events::RequestOrderLock) {
    RequestOrderLock r;
    r.orderId = V::requireString(d, "orderId");
    r.workspaceId = V::requireString(d, "workspaceId");
    if (auto m = V::optionalInteger(d, "lockDurationMinutes")) {
      r.durationMinutes = narrowToInt(*m, "lockDurationMinutes");
    }
    return r;
  }
  if (event == events::ReleaseOrderLock) {
    return ReleaseOrderLock{V::requireString(d, "orderId"), V::requireString(d, "workspaceId")};
  }
  if (event == events::OrderEdit) {
    OrderEdit e;
    e.orderId = V::requireString(d, "orderId");
    e.workspaceId = V::requireString(d, "workspaceId");
    e.fieldPath = V::requireString(d, "fieldPath");
    if (!d.HasMember("newValue")) throw ProtocolError("Missing field 'newValue'");
    e.newValue = serialize(d["newValue"]);
    e.oldValue = d.HasMember("oldValue") ? serialize(d["oldValue"]) : std::string("null");
    e.version = V::requireInteger(d, "version");
    if (e.version < 0) throw ProtocolError("version must not be negative");
    // The server assigns version + 1.
    if (e.version == std::numeric_limits<std::int64_t>::max()) {
      throw ProtocolError("version out of range");
    }
    return e;
  }
  if (event == events::ChatMessage) {
    ChatSend c;
    c.workspaceId = V::requireString(d, "workspaceId");
    if (!d.HasMember("content") || !d["content"].IsString()) {
      throw ProtocolError("Missing string field 'content'");
    }
    c.content.assign(d["content"].GetString(), d["content"].GetStringLength());
    if (auto t = V::optionalString(d, "messageType")) {
      auto parsed = parseChatMessageType(*t);
      if (!parsed) throw ProtocolError("Unknown messageType '" + *t + "'");
      c.messageType = *parsed;
    }
    c.threadId = V::optionalString(d, "threadId");
    c.parentMessageId = V::optionalString(d, "parentMessageId");
    return c;
  }
  if (event == events::TypingStart || event == events::TypingStop) {
    Typing t;
    t.workspaceId = V::requireString(d, "workspaceId");
    t.channelId = V::optionalString(d, "channelId");
    t.isTyping = (event == events::TypingStart);
    return t;
  }
  throw ProtocolError("Unknown event '" + std::string(event) + "'");
}

} // namespace

const char* errorCodeFor(std::string_view event) {
  if (event == events::JoinWorkspace)    return codes::JoinWorkspace;
  if (event == events::LeaveWorkspace)   return codes::LeaveWorkspace;
  if (event == events::PresenceUpdate)   return codes::PresenceUpdate;
  if (event == events::RequestOrderLock) return codes::OrderLock;
  if (event == events::ReleaseOrderLock) return codes::OrderUnlock;
  if (event == events::OrderEdit)        return codes::OrderEdit;
  if (event == events::ChatMessage)      return codes::ChatMessage;
  if (event == events::TypingStart ||
      event == events::TypingStop)       return codes::Typing;
  return codes::Protocol;
}

Result<Inbound> decode(const std::string& text) {
  rapidjson::Document doc;
  doc.Parse(text.c_str(), text.size());
  if (doc.HasParseError()) {
    return Error{std::string("Invalid JSON: ") + rapidjson::GetParseError_En(doc.GetParseError()),
                 codes::Protocol};
  }

  std::string event;
  try {
    event = JsonValidator::validateEnvelope(doc);
  } catch (const ProtocolError& ex) {
    return Error{ex.what(), codes::Protocol};
  }

  const char* code = errorCodeFor(event);
  if (std::strcmp(code, codes::Protocol) == 0) {
    return Error{"Unknown event '" + event + "'", codes::Protocol};
  }

  if (!doc.HasMember("data") || !doc["data"].IsObject()) {
    return Error{"Event '" + event + "' requires a data object", code};
  }

  try {
    return Inbound{event, decodePayload(event, doc["data"])};
  } catch (const ProtocolError& ex) {
    return Error{ex.what(), code};
  }
}

std::string encodeLockResponse(const LockResponse& r) {
  return frame(events::OrderLockResponse, [&](JsonWriter& w) {
    w.Key("success"); w.Bool(r.success);
    putField(w, "orderId", r.orderId);
    putOptional(w, "lockedBy", r.lockedBy);
    if (r.lockedUntil) putTime(w, "lockedUntil", *r.lockedUntil);
    putField(w, "message", r.message);
  });
}

std::string encodeOrderLock(const OrderLock& lock, Timestamp now) {
  return frame(events::OrderLock, [&](JsonWriter& w) {
    writeLock(w, lock);
    putField(w, "userId", lock.holder);
    putTime(w, "timestamp", now);
  });
}

std::string encodeOrderUnlock(const OrderLock& lock, const std::string& releasedBy,
                              const char* reason, Timestamp now) {
  return frame(events::OrderUnlock, [&](JsonWriter& w) {
    putField(w, "orderId", lock.orderId);
    putField(w, "workspaceId", lock.workspaceId);
    putField(w, "userId", releasedBy);
    if (reason && *reason) {
      w.Key("reason");
      w.String(reason);
    }
    putTime(w, "timestamp", now);
  });
}

std::string encodeEdit(const EditRecord& e) {
  return frame(events::OrderEdit, [&](JsonWriter& w) {
    putField(w, "editId", e.editId);
    putField(w, "orderId", e.orderId);
    putField(w, "workspaceId", e.workspaceId);
    putField(w, "userId", e.userId);
    putField(w, "operationType", e.operationType);
    putField(w, "fieldPath", e.fieldPath);
    putRawJson(w, "oldValue", e.oldValue);
    putRawJson(w, "newValue", e.newValue);
    w.Key("version"); w.Int64(e.version);
    putTime(w, "timestamp", e.timestamp);
  });
}

std::string encodeEditAck(const EditRecord& e) {
  return frame(events::OrderEditAck, [&](JsonWriter& w) {
    putField(w, "orderId", e.orderId);
    putField(w, "editId", e.editId);
    w.Key("version"); w.Int64(e.version);
    putTime(w, "timestamp", e.timestamp);
  });
}

std::string encodePresence(const PresenceRecord& p) {
  return frame(events::PresenceUpdate, [&](JsonWriter& w) { writePresence(w, p); });
}

std::string encodeMember(const char* event, const std::string& userId,
                         const std::string& workspaceId, PresenceStatus status, Timestamp now) {
  return frame(event, [&](JsonWriter& w) {
    putField(w, "userId", userId);
    putField(w, "workspaceId", workspaceId);
    w.Key("status"); w.String(toString(status));
    putTime(w, "timestamp", now);
  });
}

std::string encodeChat(const ChatMessage& m, Timestamp now) {
  return frame(events::ChatMessage, [&](JsonWriter& w) {
    putField(w, "messageId", m.messageId);
    putField(w, "workspaceId", m.workspaceId);
    putField(w, "userId", m.userId);
    putOptional(w, "threadId", m.threadId);
    putOptional(w, "parentMessageId", m.parentMessageId);
    w.Key("messageType"); w.String(toString(m.messageType));
    putField(w, "content", m.content);
    putTime(w, "createdAt", m.createdAt);
    putTime(w, "timestamp", now);
  });
}

std::string encodeTyping(const std::string& userId, const Typing& t, Timestamp now) {
  return frame(events::TypingIndicator, [&](JsonWriter& w) {
    putField(w, "userId", userId);
    putField(w, "workspaceId", t.workspaceId);
    putOptional(w, "channelId", t.channelId);
    w.Key("isTyping"); w.Bool(t.isTyping);
    putTime(w, "timestamp", now);
  });
}

std::string encodeWorkspaceState(const WorkspaceSnapshot& s) {
  return frame(events::WorkspaceState, [&](JsonWriter& w) {
    putField(w, "workspaceId", s.workspaceId);
    w.Key("members");
    w.StartArray();
    for (const auto& p : s.members) {
      w.StartObject();
      writePresence(w, p);
      w.EndObject();
    }
    w.EndArray();
    w.Key("activities");
    w.StartArray();
    for (const auto& a : s.activities) {
      w.StartObject();
      writeActivity(w, a);
      w.EndObject();
    }
    w.EndArray();
    w.Key("orderLocks");
    w.StartArray();
    for (const auto& l : s.orderLocks) {
      w.StartObject();
      writeLock(w, l);
      w.EndObject();
    }
    w.EndArray();
    putTime(w, "timestamp", s.timestamp);
  });
}

std::string encodeError(const std::string& code, const std::string& message, Timestamp now) {
  return frame(events::CollaborationError, [&](JsonWriter& w) {
    putField(w, "code", code);
    putField(w, "message", message);
    putTime(w, "timestamp", now);
  });
}

std::string encodeHeartbeat(Timestamp now) {
  return frame(events::Heartbeat, [&](JsonWriter& w) { putTime(w, "timestamp", now); });
}

} // namespace collab::protocol
