#include "collab/util/Config.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>

using namespace collab::util;

namespace {

std::string writeTemp(const std::string& name, const std::string& body) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << body;
    return path;
}

} // namespace

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    Config cfg;
    EXPECT_EQ(cfg.serverPort, 8080);
    EXPECT_EQ(cfg.serverAddress, "0.0.0.0");
    EXPECT_EQ(cfg.serverThreads, 4u);
    EXPECT_EQ(cfg.lockDefaultMinutes, 5);
    EXPECT_EQ(cfg.lockMaxMinutes, 60);
    EXPECT_FALSE(cfg.lockReleaseRequiresOwnership);
    EXPECT_TRUE(cfg.editRequireLock);
    EXPECT_EQ(cfg.heartbeatIntervalSeconds, 30);
    EXPECT_TRUE(cfg.sweeperBroadcastExpiry);
    EXPECT_EQ(cfg.presenceInactiveHours, 24);
    EXPECT_EQ(cfg.snapshotActivityLimit, 50);
    EXPECT_EQ(cfg.chatMaxLength, 4000);
    EXPECT_TRUE(cfg.allowQueryToken);
    EXPECT_EQ(cfg.metricsReportSeconds, 0);
}

TEST(ConfigTest, LoadsKeyValuesAndSkipsComments) {
    const auto path = writeTemp("collab_cfg_basic.conf",
        "# comment\n"
        "; also a comment\n"
        "server.port = 9100\n"
        "auth.jwtSecret=s3cret\n"
        "lock.releaseRequiresOwnership = yes\n"
        "edit.requireLock = off\n"
        "log.level = debug\n");
    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(path));
    EXPECT_EQ(cfg.serverPort, 9100);
    EXPECT_EQ(cfg.jwtSecret, "s3cret");
    EXPECT_TRUE(cfg.lockReleaseRequiresOwnership);
    EXPECT_FALSE(cfg.editRequireLock);
    EXPECT_EQ(cfg.logLevel, "debug");
    std::remove(path.c_str());
}

TEST(ConfigTest, UnknownKeysAreIgnored) {
    const auto path = writeTemp("collab_cfg_unknown.conf",
        "no.such.key = 1\n"
        "chat.maxLength = 200\n");
    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(path));
    EXPECT_EQ(cfg.chatMaxLength, 200);
    EXPECT_FALSE(cfg.set("no.such.key", "1"));
    std::remove(path.c_str());
}

TEST(ConfigTest, MissingFileReturnsFalse) {
    Config cfg;
    EXPECT_FALSE(cfg.loadFromFile(::testing::TempDir() + "does_not_exist.conf"));
    EXPECT_EQ(cfg.serverPort, 8080);
}

TEST(ConfigTest, SanitizeClampsOutOfRangeValues) {
    Config cfg;
    EXPECT_TRUE(cfg.set("lock.maxMinutes", "10"));
    EXPECT_TRUE(cfg.set("lock.defaultMinutes", "45"));
    EXPECT_TRUE(cfg.set("heartbeat.intervalSeconds", "0"));
    EXPECT_TRUE(cfg.set("chat.maxLength", "-3"));
    cfg.sanitize();
    EXPECT_EQ(cfg.lockDefaultMinutes, 10);
    EXPECT_EQ(cfg.heartbeatIntervalSeconds, 30);
    EXPECT_EQ(cfg.chatMaxLength, 4000);
}

TEST(ConfigTest, BadBooleanKeepsPreviousValue) {
    Config cfg;
    EXPECT_TRUE(cfg.set("sweeper.broadcastExpiry", "maybe"));
    EXPECT_TRUE(cfg.sweeperBroadcastExpiry);
}
