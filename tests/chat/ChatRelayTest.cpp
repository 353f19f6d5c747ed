#include "collab/core/ChatRelay.hpp"
#include "support/TestSupport.hpp"
#include <gtest/gtest.h>

using namespace collab;
using namespace collab::core;
using namespace collab::test;

class ChatRelayTest : public ::testing::Test {
protected:
    void SetUp() override {
        h.member("ws1", "alice");
        h.member("ws1", "bob", WorkspaceRole::Viewer);
        a = h.connect("alice");
        b = h.connect("bob");
        h.join(a, "ws1");
        h.join(b, "ws1");
        a.sink->clear();
        b.sink->clear();
    }

    Harness h{chatOptions()};
    Harness::Client a, b;

    static Harness::Options chatOptions() {
        Harness::Options o;
        o.chatMaxLength = 10;
        return o;
    }
};

TEST_F(ChatRelayTest, MessageReachesRoomAndSender) {
    h.send(a, "chat_message", R"({"workspaceId":"ws1","content":"hello","threadId":"t1"})");

    ASSERT_EQ(b.sink->count("chat_message"), 1u);
    ASSERT_EQ(a.sink->count("chat_message"), 1u);
    auto d = parse(b.sink->framesFor("chat_message")[0]);
    EXPECT_STREQ((*d)["data"]["content"].GetString(), "hello");
    EXPECT_STREQ((*d)["data"]["userId"].GetString(), "alice");
    EXPECT_STREQ((*d)["data"]["messageType"].GetString(), "text");
    EXPECT_STREQ((*d)["data"]["threadId"].GetString(), "t1");
    EXPECT_FALSE(std::string((*d)["data"]["messageId"].GetString()).empty());

    ASSERT_EQ(h.store.chatMessages("ws1").size(), 1u);
    auto recent = h.store.recentActivity("ws1", 1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].activityType, "chat_message");
}

TEST_F(ChatRelayTest, ViewersMayChat) {
    h.send(b, "chat_message", R"({"workspaceId":"ws1","content":"hi"})");
    EXPECT_EQ(a.sink->count("chat_message"), 1u);
    EXPECT_EQ(b.sink->count("collaboration_error"), 0u);
}

TEST_F(ChatRelayTest, BlankContentIsRejected) {
    h.send(a, "chat_message", R"({"workspaceId":"ws1","content":"   "})");
    EXPECT_EQ(b.sink->count("chat_message"), 0u);
    ASSERT_EQ(a.sink->count("collaboration_error"), 1u);
    auto d = parse(a.sink->framesFor("collaboration_error")[0]);
    EXPECT_STREQ((*d)["data"]["code"].GetString(), "CHAT_MESSAGE_ERROR");
    EXPECT_TRUE(h.store.chatMessages("ws1").empty());
}

TEST_F(ChatRelayTest, LengthIsCountedInCodePoints) {
    // Ten two-byte characters fit, eleven do not.
    std::string ten;
    for (int i = 0; i < 10; ++i) ten += "\xC3\xA9";
    EXPECT_EQ(ChatRelay::codePoints(ten), 10u);
    h.send(a, "chat_message", R"({"workspaceId":"ws1","content":")" + ten + "\"}");
    EXPECT_EQ(b.sink->count("chat_message"), 1u);

    h.send(a, "chat_message", R"({"workspaceId":"ws1","content":")" + ten + "x\"}");
    EXPECT_EQ(b.sink->count("chat_message"), 1u);
    EXPECT_EQ(a.sink->count("collaboration_error"), 1u);
}

TEST_F(ChatRelayTest, StoreFailureBroadcastsNothing) {
    h.store.failChat = true;
    h.send(a, "chat_message", R"({"workspaceId":"ws1","content":"hello"})");
    EXPECT_EQ(b.sink->count("chat_message"), 0u);
    EXPECT_EQ(a.sink->count("chat_message"), 0u);
    EXPECT_EQ(a.sink->count("collaboration_error"), 1u);
}

TEST_F(ChatRelayTest, TypingIsRelayedWithoutPersistence) {
    h.send(a, "typing_start", R"({"workspaceId":"ws1","channelId":"general"})");
    h.send(a, "typing_stop", R"({"workspaceId":"ws1"})");

    auto frames = b.sink->framesFor("typing_indicator");
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_TRUE((*parse(frames[0]))["data"]["isTyping"].GetBool());
    EXPECT_FALSE((*parse(frames[1]))["data"]["isTyping"].GetBool());
    EXPECT_EQ(a.sink->count("typing_indicator"), 0u);
    EXPECT_TRUE(h.store.chatMessages("ws1").empty());
}
