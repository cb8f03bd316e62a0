#include "memcache/util/logger.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace memcache::util::test {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_output(&out_);
    }

    void TearDown() override {
        Logger::instance().set_output(nullptr);
        Logger::instance().set_level(LogLevel::Info);
    }

    std::ostringstream out_;
};

TEST_F(LoggerTest, DefaultLevelIsInfo) {
    EXPECT_EQ(Logger::instance().level(), LogLevel::Info);
}

TEST_F(LoggerTest, SetLevel) {
    Logger::instance().set_level(LogLevel::Debug);
    EXPECT_EQ(Logger::instance().level(), LogLevel::Debug);

    Logger::instance().set_level(LogLevel::Error);
    EXPECT_EQ(Logger::instance().level(), LogLevel::Error);
}

TEST_F(LoggerTest, LogMethods) {
    Logger::instance().set_level(LogLevel::Debug);

    Logger::instance().debug("debug message");
    Logger::instance().info("info message");
    LOG_WARN("macro warn");
    LOG_ERROR("macro error");

    std::string text = out_.str();
    EXPECT_NE(text.find("[DEBUG] debug message\n"), std::string::npos);
    EXPECT_NE(text.find("[INFO ] info message\n"), std::string::npos);
    EXPECT_NE(text.find("[WARN ] macro warn\n"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] macro error\n"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltering) {
    Logger::instance().set_level(LogLevel::Warn);

    LOG_DEBUG("filtered debug");
    LOG_INFO("filtered info");
    LOG_WARN("visible warn");

    std::string text = out_.str();
    EXPECT_EQ(text.find("filtered"), std::string::npos);
    EXPECT_NE(text.find("visible warn"), std::string::npos);
}

TEST_F(LoggerTest, NoneSilencesEverything) {
    Logger::instance().set_level(LogLevel::None);
    LOG_ERROR("nobody hears this");
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(LoggerTest, LineStartsWithTimestamp) {
    LOG_INFO("stamped");
    std::string text = out_.str();
    // "2024-01-15 10:30:45.123 [INFO ] stamped"
    ASSERT_GE(text.size(), 24u);
    EXPECT_EQ(text[4], '-');
    EXPECT_EQ(text[10], ' ');
    EXPECT_EQ(text[19], '.');
    EXPECT_EQ(text.substr(23, 8), " [INFO ]");
}

TEST(LogLevelTest, ParseAndPrint) {
    for (auto level :
         {LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::None}) {
        EXPECT_EQ(parse_log_level(to_string(level)), level);
    }
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::Info);
}

}  // namespace memcache::util::test
