#include "collab/core/ConnectionRegistry.hpp"
#include "collab/Errors.hpp"
#include "support/TestSupport.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>
#include <string>

using namespace collab;
using namespace collab::core;
using collab::test::FakeSink;

TEST(ConnectionRegistryTest, RegisterRejectsDuplicateConnId) {
    ConnectionRegistry reg;
    EXPECT_TRUE(reg.registerConnection("alice", 1, std::make_shared<FakeSink>()));
    EXPECT_FALSE(reg.registerConnection("bob", 1, std::make_shared<FakeSink>()));
    EXPECT_EQ(reg.connectionCount(), 1u);
    EXPECT_EQ(*reg.userOf(1), "alice");
}

TEST(ConnectionRegistryTest, JoinReportsFirstConnectionInWorkspace) {
    ConnectionRegistry reg;
    reg.registerConnection("alice", 1, std::make_shared<FakeSink>());
    reg.registerConnection("alice", 2, std::make_shared<FakeSink>());

    EXPECT_TRUE(reg.joinWorkspace("alice", 1, "ws1", WorkspaceRole::Editor));
    EXPECT_FALSE(reg.joinWorkspace("alice", 2, "ws1", WorkspaceRole::Editor));
    EXPECT_EQ(reg.connectionsIn("ws1"), (std::vector<ConnId>{1, 2}));
    EXPECT_EQ(reg.membersOf("ws1"), (std::vector<std::string>{"alice"}));
    EXPECT_EQ(*reg.roleOf(1, "ws1"), WorkspaceRole::Editor);
    EXPECT_FALSE(reg.roleOf(1, "ws2").has_value());
}

TEST(ConnectionRegistryTest, JoinWithForeignConnectionThrows) {
    ConnectionRegistry reg;
    reg.registerConnection("alice", 1, std::make_shared<FakeSink>());
    EXPECT_THROW(reg.joinWorkspace("bob", 1, "ws1", WorkspaceRole::Editor), AuthorizationError);
    EXPECT_THROW(reg.joinWorkspace("alice", 9, "ws1", WorkspaceRole::Editor), AuthorizationError);
}

TEST(ConnectionRegistryTest, LeaveKeepsUserWhileAnotherConnectionRemains) {
    ConnectionRegistry reg;
    reg.registerConnection("alice", 1, std::make_shared<FakeSink>());
    reg.registerConnection("alice", 2, std::make_shared<FakeSink>());
    reg.joinWorkspace("alice", 1, "ws1", WorkspaceRole::Editor);
    reg.joinWorkspace("alice", 2, "ws1", WorkspaceRole::Editor);

    EXPECT_FALSE(reg.leaveWorkspace("alice", 1, "ws1"));
    EXPECT_TRUE(reg.isPresent("alice", "ws1"));
    EXPECT_FALSE(reg.isJoined(1, "ws1"));
    EXPECT_TRUE(reg.leaveWorkspace("alice", 2, "ws1"));
    EXPECT_FALSE(reg.isPresent("alice", "ws1"));
    EXPECT_TRUE(reg.membersOf("ws1").empty());
}

TEST(ConnectionRegistryTest, UnregisterReportsDepartedWorkspaces) {
    ConnectionRegistry reg;
    reg.registerConnection("alice", 1, std::make_shared<FakeSink>());
    reg.registerConnection("alice", 2, std::make_shared<FakeSink>());
    reg.joinWorkspace("alice", 1, "ws2", WorkspaceRole::Editor);
    reg.joinWorkspace("alice", 1, "ws1", WorkspaceRole::Editor);
    reg.joinWorkspace("alice", 2, "ws1", WorkspaceRole::Editor);

    auto first = reg.unregisterConnection(1);
    EXPECT_TRUE(first.found);
    EXPECT_FALSE(first.lastConnection);
    EXPECT_EQ(first.departedWorkspaces, (std::vector<std::string>{"ws2"}));
    EXPECT_EQ(reg.workspacesOf("alice"), (std::vector<std::string>{"ws1"}));

    auto second = reg.unregisterConnection(2);
    EXPECT_TRUE(second.lastConnection);
    EXPECT_EQ(second.departedWorkspaces, (std::vector<std::string>{"ws1"}));
    EXPECT_EQ(reg.userCount(), 0u);
    EXPECT_TRUE(reg.workspacesOf("alice").empty());

    EXPECT_FALSE(reg.unregisterConnection(2).found);
}

TEST(ConnectionRegistryTest, TargetsExcludeEveryConnectionOfUser) {
    ConnectionRegistry reg;
    reg.registerConnection("alice", 1, std::make_shared<FakeSink>());
    reg.registerConnection("alice", 2, std::make_shared<FakeSink>());
    reg.registerConnection("bob", 3, std::make_shared<FakeSink>());
    for (ConnId c : {1, 2}) reg.joinWorkspace("alice", c, "ws1", WorkspaceRole::Editor);
    reg.joinWorkspace("bob", 3, "ws1", WorkspaceRole::Viewer);

    auto targets = reg.targetsIn("ws1", std::string("alice"));
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets[0].connId, 3u);
    EXPECT_EQ(reg.targetsIn("ws1", std::nullopt).size(), 3u);
    EXPECT_EQ(reg.allTargets().size(), 3u);
}

TEST(ConnectionRegistryTest, ConcurrentRegisterJoinUnregisterLeavesNoGhosts) {
    ConnectionRegistry reg;
    const int threads = 8, perThread = 200;
    std::atomic<ConnId> next{1};
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t]{
            const std::string user = "user" + std::to_string(t % 3);
            for (int i = 0; i < perThread; ++i) {
                const ConnId id = next.fetch_add(1);
                reg.registerConnection(user, id, std::make_shared<FakeSink>());
                reg.joinWorkspace(user, id, "ws" + std::to_string(i % 4), WorkspaceRole::Editor);
                reg.unregisterConnection(id);
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(reg.connectionCount(), 0u);
    EXPECT_EQ(reg.userCount(), 0u);
    for (int w = 0; w < 4; ++w) {
        EXPECT_TRUE(reg.membersOf("ws" + std::to_string(w)).empty());
        EXPECT_TRUE(reg.connectionsIn("ws" + std::to_string(w)).empty());
    }
}
