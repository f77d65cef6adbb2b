#include <gtest/gtest.h>
#include "tower.h"
#include "test_helpers.h"
#include "temp_dir.h"
#include <cerrno>
#include <cstring>

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(temp_dir.valid());
        log_path = temp_dir.file_path("tower.log");
        logger.set_console_output(false);
        ASSERT_TRUE(logger.set_log_file(log_path));
    }

    test_helpers::TempDir temp_dir{"logger_test_"};
    Logger logger;
    std::string log_path;
};

// =============================================================================
// Output
// =============================================================================

TEST_F(LoggerTest, WritesLevelAndMessage) {
    logger.warn("socket dir has loose permissions");
    std::string content = test_helpers::read_file(log_path);
    EXPECT_NE(content.find("[WARN ] socket dir has loose permissions"), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowLevel) {
    logger.debug("hidden by default");
    logger.set_log_level(LogLevel::DEBUG);
    logger.debug("now visible");
    std::string content = test_helpers::read_file(log_path);
    EXPECT_EQ(content.find("hidden by default"), std::string::npos);
    EXPECT_NE(content.find("now visible"), std::string::npos);
}

TEST_F(LoggerTest, ProcessTagPrefix) {
    logger.set_process_tag("shepherd[77]");
    logger.info("worker started");
    EXPECT_NE(test_helpers::read_file(log_path).find("[shepherd[77]] worker started"), std::string::npos);
}

TEST_F(LoggerTest, FormatPlaceholders) {
    logger.info_fmt("session {} restarted {} times", "build", 3);
    EXPECT_NE(test_helpers::read_file(log_path).find("session build restarted 3 times"), std::string::npos);
}

TEST_F(LoggerTest, UnwritableFile) {
    Logger other;
    other.set_console_output(false);
    EXPECT_FALSE(other.set_log_file(temp_dir.file_path("missing/dir/tower.log")));
}

// =============================================================================
// Helpers
// =============================================================================

TEST(LoggerLevelTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parse_level("WARNING"), LogLevel::WARN);
    EXPECT_EQ(Logger::parse_level("Error"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parse_level("nonsense"), LogLevel::INFO);
}

TEST(LoggerLevelTest, ErrnoString) {
    EXPECT_EQ(tower::errno_string("connect", ECONNREFUSED), std::string("connect: ") + strerror(ECONNREFUSED));
}
