#include "collab/util/Logger.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using namespace collab::util;

// Points the process logger at a temp file for the duration of a test.
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "collab_logger_test.log";
        std::remove(path_.c_str());
        ASSERT_TRUE(logger().setFile(path_));
        logger().setLevel(LogLevel::Trace);
        logger().setFormatJson(false);
    }
    void TearDown() override {
        logger().setFile("");
        logger().setLevel(LogLevel::Info);
        logger().setFormatJson(false);
        std::remove(path_.c_str());
    }
    std::string contents() const {
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
    std::string path_;
};

TEST_F(LoggerTest, TextLineCarriesLevelMessageAndFields) {
    logger().log(LogLevel::Info, "Hello", {{"userId", "u1"}});
    const auto out = contents();
    EXPECT_NE(out.find("INFO Hello"), std::string::npos);
    EXPECT_NE(out.find("userId=u1"), std::string::npos);
    EXPECT_EQ(out.back(), '\n');
}

TEST_F(LoggerTest, LevelFilterDropsLowerLevels) {
    logger().setLevel(LogLevel::Warn);
    logger().log(LogLevel::Info, "quiet");
    logger().log(LogLevel::Error, "loud");
    const auto out = contents();
    EXPECT_EQ(out.find("quiet"), std::string::npos);
    EXPECT_NE(out.find("ERROR loud"), std::string::npos);
}

TEST_F(LoggerTest, JsonFormatEscapesValues) {
    logger().setFormatJson(true);
    logger().log(LogLevel::Warn, "Line1\nLine2", {{"k", "say \"hi\""}});
    const auto out = contents();
    EXPECT_NE(out.find("\"lvl\":\"WARN\""), std::string::npos);
    EXPECT_NE(out.find("\"msg\":\"Line1\\nLine2\""), std::string::npos);
    EXPECT_NE(out.find("\"k\":\"say \\\"hi\\\"\""), std::string::npos);
}

TEST_F(LoggerTest, ScopedContextIsAppendedAndRestored) {
    {
        Logger::Scoped outer(std::vector<Field>{{"connId", "1"}});
        {
            Logger::Scoped inner({{"connId", "2"}, {"event", "join"}});
            logger().log(LogLevel::Info, "inner");
        }
        logger().log(LogLevel::Info, "outer");
    }
    logger().log(LogLevel::Info, "bare");

    std::istringstream lines(contents());
    std::string inner, outer, bare;
    std::getline(lines, inner);
    std::getline(lines, outer);
    std::getline(lines, bare);
    EXPECT_NE(inner.find("connId=2"), std::string::npos);
    EXPECT_NE(inner.find("event=join"), std::string::npos);
    EXPECT_NE(outer.find("connId=1"), std::string::npos);
    EXPECT_EQ(outer.find("event="), std::string::npos);
    EXPECT_EQ(bare.find("connId="), std::string::npos);
}

TEST(LoggerLevelTest, ParseLevelIsCaseInsensitiveWithInfoFallback) {
    EXPECT_EQ(parseLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLevel("warn"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("bogus"), LogLevel::Info);
    EXPECT_STREQ(levelName(LogLevel::Error), "ERROR");
}
