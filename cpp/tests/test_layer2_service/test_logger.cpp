// tests/test_layer2_service/test_logger.cpp
/**
 * @file test_logger.cpp
 * @brief Logger sinks, level filtering and rotation, run against the shared
 *        Logger instance. Every test restores the console sink and the level.
 */
#include "ctxhub_service.hpp"
#include "shared_test_helpers.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <string>

using namespace ctxhub::utils;
using namespace ctxhub::tests::helper;
using ::testing::HasSubstr;
using ::testing::Not;

class LoggerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        saved_level_ = Logger::instance().level();
        Logger::instance().set_log_sink_messages_enabled(false);
    }

    void TearDown() override
    {
        Logger::instance().flush();
        Logger::instance().set_console();
        Logger::instance().set_level(saved_level_);
        Logger::instance().set_log_sink_messages_enabled(true);
    }

    std::string log_text(const fs::path &p)
    {
        Logger::instance().flush();
        std::string content;
        read_file_contents(p, content);
        return content;
    }

    TempDir dir_{"logger"};
    Logger::Level saved_level_{Logger::Level::L_INFO};
};

TEST_F(LoggerTest, WritesFormattedLineToFile)
{
    const fs::path log = dir_ / "basic.log";
    ASSERT_TRUE(Logger::instance().set_logfile(log.string()));
    Logger::instance().set_level(Logger::Level::L_TRACE);

    LOGGER_WARN("disk {} at {}%", "data", 93);
    const std::string text = log_text(log);
    EXPECT_THAT(text, HasSubstr("[WARN"));
    EXPECT_THAT(text, HasSubstr("disk data at 93%"));
    EXPECT_THAT(text, HasSubstr("PID:"));
}

TEST_F(LoggerTest, LevelFiltersLowerMessages)
{
    const fs::path log = dir_ / "levels.log";
    ASSERT_TRUE(Logger::instance().set_logfile(log.string()));
    Logger::instance().set_level(Logger::Level::L_WARNING);

    LOGGER_DEBUG("debug-line");
    LOGGER_INFO("info-line");
    LOGGER_WARN("warn-line");
    LOGGER_ERROR("error-line");

    const std::string text = log_text(log);
    EXPECT_THAT(text, Not(HasSubstr("debug-line")));
    EXPECT_THAT(text, Not(HasSubstr("info-line")));
    EXPECT_THAT(text, HasSubstr("warn-line"));
    EXPECT_THAT(text, HasSubstr("error-line"));
    EXPECT_FALSE(Logger::instance().should_log(Logger::Level::L_INFO));
    EXPECT_TRUE(Logger::instance().should_log(Logger::Level::L_SYSTEM));
}

TEST_F(LoggerTest, MessagesKeepSubmissionOrder)
{
    const fs::path log = dir_ / "order.log";
    ASSERT_TRUE(Logger::instance().set_logfile(log.string()));
    Logger::instance().set_level(Logger::Level::L_INFO);

    for (int i = 0; i < 200; ++i)
        LOGGER_INFO("seq={:03}", i);

    const std::string text = log_text(log);
    EXPECT_EQ(count_lines(text, "seq="), 200u);
    EXPECT_LT(text.find("seq=000"), text.find("seq=100"));
    EXPECT_LT(text.find("seq=100"), text.find("seq=199"));
}

TEST_F(LoggerTest, RotatingFileKeepsBackups)
{
    const fs::path log = dir_ / "daemon.log";
    std::error_code ec;
    ASSERT_TRUE(Logger::instance().set_rotating_logfile(log, 2048, 2, ec)) << ec.message();
    Logger::instance().set_level(Logger::Level::L_INFO);

    const std::string filler(100, 'x');
    for (int i = 0; i < 200; ++i)
        LOGGER_INFO("line {} {}", i, filler);
    Logger::instance().flush();

    EXPECT_TRUE(fs::exists(log));
    EXPECT_TRUE(fs::exists(dir_ / "daemon.log.1"));
    EXPECT_TRUE(fs::exists(dir_ / "daemon.log.2"));
    EXPECT_FALSE(fs::exists(dir_ / "daemon.log.3"));
}

TEST_F(LoggerTest, RotatingFileInUnwritableLocationFails)
{
    std::error_code ec;
    EXPECT_FALSE(
        Logger::instance().set_rotating_logfile("/proc/ctxhub_no_such_dir/x.log", 1024, 1, ec));
    EXPECT_TRUE(static_cast<bool>(ec));
}
