#include "collab/protocol/Codec.hpp"
#include "support/TestSupport.hpp"
#include <gtest/gtest.h>
#include <string>
#include <variant>

using namespace collab;
using namespace collab::protocol;
using collab::test::parse;

namespace {

const Timestamp kNow = std::chrono::system_clock::time_point(std::chrono::seconds(1767225600));

Result<Inbound> decodeEvent(const std::string& event, const std::string& data) {
    return decode("{\"event\":\"" + event + "\",\"data\":" + data + "}");
}

} // namespace

TEST(CodecDecodeTest, InvalidJsonIsProtocolError) {
    auto r = decode("{not json");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, codes::Protocol);
}

TEST(CodecDecodeTest, UnknownEventIsProtocolError) {
    auto r = decodeEvent("self_destruct", "{}");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, codes::Protocol);
}

TEST(CodecDecodeTest, MissingDataUsesEventCode) {
    auto r = decode("{\"event\":\"request_order_lock\"}");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, codes::OrderLock);
}

TEST(CodecDecodeTest, BadPayloadUsesEventCode) {
    EXPECT_EQ(decodeEvent("join_workspace", "{}").error().code, codes::JoinWorkspace);
    EXPECT_EQ(decodeEvent("release_order_lock", "{\"orderId\":\"o1\"}").error().code, codes::OrderUnlock);
    EXPECT_EQ(decodeEvent("presence_update", "{\"workspaceId\":\"ws1\",\"status\":\"asleep\"}").error().code,
              codes::PresenceUpdate);
    EXPECT_EQ(decodeEvent("chat_message", "{\"workspaceId\":\"ws1\",\"content\":\"x\",\"messageType\":\"poem\"}").error().code,
              codes::ChatMessage);
    EXPECT_EQ(decodeEvent("typing_start", "{}").error().code, codes::Typing);
}

TEST(CodecDecodeTest, LockRequestCarriesOptionalDuration) {
    auto r = decodeEvent("request_order_lock",
                         "{\"orderId\":\"o1\",\"workspaceId\":\"ws1\",\"lockDurationMinutes\":15}");
    ASSERT_TRUE(r) << r.error().describe();
    const auto& cmd = std::get<RequestOrderLock>(r->command);
    EXPECT_EQ(cmd.orderId, "o1");
    ASSERT_TRUE(cmd.durationMinutes.has_value());
    EXPECT_EQ(*cmd.durationMinutes, 15);

    auto huge = decodeEvent("request_order_lock",
                            "{\"orderId\":\"o1\",\"workspaceId\":\"ws1\",\"lockDurationMinutes\":99999999999}");
    ASSERT_FALSE(huge);
    EXPECT_EQ(huge.error().code, codes::OrderLock);
}

TEST(CodecDecodeTest, OrderEditKeepsValuesAsJson) {
    auto r = decodeEvent("order_edit",
                         "{\"orderId\":\"o1\",\"workspaceId\":\"ws1\",\"fieldPath\":\"lines.0.qty\","
                         "\"newValue\":{\"n\":5},\"version\":3}");
    ASSERT_TRUE(r) << r.error().describe();
    const auto& e = std::get<OrderEdit>(r->command);
    EXPECT_EQ(e.newValue, "{\"n\":5}");
    EXPECT_EQ(e.oldValue, "null");
    EXPECT_EQ(e.version, 3);

    auto neg = decodeEvent("order_edit",
                           "{\"orderId\":\"o1\",\"workspaceId\":\"ws1\",\"fieldPath\":\"f\","
                           "\"newValue\":1,\"version\":-1}");
    ASSERT_FALSE(neg);
    EXPECT_EQ(neg.error().code, codes::OrderEdit);
}

TEST(CodecDecodeTest, EditVersionMustLeaveRoomForIncrement) {
    const std::string prefix =
        "{\"orderId\":\"o1\",\"workspaceId\":\"ws1\",\"fieldPath\":\"f\",\"newValue\":1,\"version\":";

    auto top = decodeEvent("order_edit", prefix + "9223372036854775807}");
    ASSERT_FALSE(top);
    EXPECT_EQ(top.error().code, codes::OrderEdit);

    auto belowTop = decodeEvent("order_edit", prefix + "9223372036854775806}");
    ASSERT_TRUE(belowTop) << belowTop.error().describe();
    EXPECT_EQ(std::get<OrderEdit>(belowTop->command).version, 9223372036854775806LL);

    for (const char* v : {"1e19}", "18446744073709551615}", "1e300}"}) {
        auto r = decodeEvent("order_edit", prefix + v);
        ASSERT_FALSE(r) << v;
        EXPECT_EQ(r.error().code, codes::OrderEdit);
    }
}

TEST(CodecDecodeTest, OutOfRangeIntegersAreRejected) {
    auto duration = decodeEvent("request_order_lock",
                                "{\"orderId\":\"o1\",\"workspaceId\":\"ws1\",\"lockDurationMinutes\":1e300}");
    ASSERT_FALSE(duration);
    EXPECT_EQ(duration.error().code, codes::OrderLock);

    auto selection = decodeEvent("presence_update",
                                 "{\"workspaceId\":\"ws1\",\"status\":\"online\","
                                 "\"cursorPosition\":{\"x\":1,\"y\":2,"
                                 "\"selection\":{\"start\":0,\"end\":3000000000}}}");
    ASSERT_FALSE(selection);
    EXPECT_EQ(selection.error().code, codes::PresenceUpdate);
}

TEST(CodecDecodeTest, PresenceCursorIsDecoded) {
    auto r = decodeEvent("presence_update",
                         "{\"workspaceId\":\"ws1\",\"status\":\"away\",\"currentPage\":\"/orders\","
                         "\"cursorPosition\":{\"x\":1.5,\"y\":2,\"selection\":{\"start\":1,\"end\":4}}}");
    ASSERT_TRUE(r) << r.error().describe();
    const auto& p = std::get<PresenceUpdate>(r->command);
    EXPECT_EQ(p.status, PresenceStatus::Away);
    ASSERT_TRUE(p.cursorPosition.has_value());
    EXPECT_DOUBLE_EQ(p.cursorPosition->x, 1.5);
    ASSERT_TRUE(p.cursorPosition->selection.has_value());
    EXPECT_EQ(p.cursorPosition->selection->end, 4);
}

TEST(CodecDecodeTest, TypingEventsSetFlag) {
    auto start = decodeEvent("typing_start", "{\"workspaceId\":\"ws1\"}");
    auto stop  = decodeEvent("typing_stop", "{\"workspaceId\":\"ws1\",\"channelId\":\"c1\"}");
    ASSERT_TRUE(start);
    ASSERT_TRUE(stop);
    EXPECT_TRUE(std::get<Typing>(start->command).isTyping);
    EXPECT_FALSE(std::get<Typing>(stop->command).isTyping);
    EXPECT_EQ(*std::get<Typing>(stop->command).channelId, "c1");
}

TEST(CodecEncodeTest, LockResponseOmitsAbsentFields) {
    LockResponse r;
    r.success = false;
    r.orderId = "o1";
    r.lockedBy = std::string("alice");
    r.message = "Order is already locked by another user";
    auto d = parse(encodeLockResponse(r));
    ASSERT_FALSE(d->HasParseError());
    EXPECT_STREQ((*d)["event"].GetString(), "order_lock_response");
    const auto& data = (*d)["data"];
    EXPECT_FALSE(data["success"].GetBool());
    EXPECT_STREQ(data["lockedBy"].GetString(), "alice");
    EXPECT_FALSE(data.HasMember("lockedUntil"));
}

TEST(CodecEncodeTest, EditFrameEmbedsRawValues) {
    EditRecord e;
    e.editId = "edit-1";
    e.orderId = "o1";
    e.workspaceId = "ws1";
    e.userId = "alice";
    e.fieldPath = "customer.name";
    e.oldValue = "\"Ann\"";
    e.newValue = "{\"first\":\"Anne\"}";
    e.version = 4;
    e.timestamp = kNow;
    auto d = parse(encodeEdit(e));
    ASSERT_FALSE(d->HasParseError());
    const auto& data = (*d)["data"];
    EXPECT_STREQ(data["oldValue"].GetString(), "Ann");
    EXPECT_STREQ(data["newValue"]["first"].GetString(), "Anne");
    EXPECT_EQ(data["version"].GetInt64(), 4);
    EXPECT_STREQ(data["timestamp"].GetString(), "2026-01-01T00:00:00.000Z");
}

TEST(CodecEncodeTest, WorkspaceStateListsMembersActivitiesAndLocks) {
    WorkspaceSnapshot s;
    s.workspaceId = "ws1";
    s.timestamp = kNow;
    PresenceRecord p;
    p.userId = "alice";
    p.workspaceId = "ws1";
    p.status = PresenceStatus::Online;
    p.lastActivity = kNow;
    s.members.push_back(p);
    s.orderLocks.push_back(OrderLock{"o1", "ws1", "alice", kNow + std::chrono::minutes(5)});
    auto d = parse(encodeWorkspaceState(s));
    ASSERT_FALSE(d->HasParseError());
    const auto& data = (*d)["data"];
    ASSERT_EQ(data["members"].Size(), 1u);
    EXPECT_STREQ(data["members"][0]["status"].GetString(), "online");
    EXPECT_EQ(data["activities"].Size(), 0u);
    EXPECT_STREQ(data["orderLocks"][0]["lockedBy"].GetString(), "alice");
    EXPECT_STREQ(data["orderLocks"][0]["expiresAt"].GetString(), "2026-01-01T00:05:00.000Z");
}

TEST(CodecEncodeTest, ErrorFrameEscapesMessage) {
    auto d = parse(encodeError(codes::OrderEdit, "bad \"value\"\n", kNow));
    ASSERT_FALSE(d->HasParseError());
    EXPECT_STREQ((*d)["event"].GetString(), "collaboration_error");
    EXPECT_STREQ((*d)["data"]["code"].GetString(), "ORDER_EDIT_ERROR");
    EXPECT_STREQ((*d)["data"]["message"].GetString(), "bad \"value\"\n");
}

TEST(CodecEncodeTest, UnlockCarriesReason) {
    auto d = parse(encodeOrderUnlock(OrderLock{"o1", "ws1", "alice", kNow}, "alice",
                                     reasons::Disconnected, kNow));
    ASSERT_FALSE(d->HasParseError());
    EXPECT_STREQ((*d)["data"]["reason"].GetString(), "disconnected");
    EXPECT_STREQ((*d)["data"]["userId"].GetString(), "alice");
}

TEST(CodecTest, ErrorCodeForMapsEveryInboundEvent) {
    EXPECT_STREQ(errorCodeFor("join_workspace"), "JOIN_WORKSPACE_ERROR");
    EXPECT_STREQ(errorCodeFor("leave_workspace"), "LEAVE_WORKSPACE_ERROR");
    EXPECT_STREQ(errorCodeFor("presence_update"), "PRESENCE_UPDATE_ERROR");
    EXPECT_STREQ(errorCodeFor("request_order_lock"), "ORDER_LOCK_ERROR");
    EXPECT_STREQ(errorCodeFor("release_order_lock"), "ORDER_UNLOCK_ERROR");
    EXPECT_STREQ(errorCodeFor("order_edit"), "ORDER_EDIT_ERROR");
    EXPECT_STREQ(errorCodeFor("chat_message"), "CHAT_MESSAGE_ERROR");
    EXPECT_STREQ(errorCodeFor("typing_stop"), "TYPING_ERROR");
    EXPECT_STREQ(errorCodeFor("heartbeat"), "PROTOCOL_ERROR");
}
