#include "Core/Logger.hpp"

#include <gtest/gtest.h>

TEST(LoggerTest, ParseSeverityNames)
{
    EXPECT_EQ(Logger::ParseSeverity("debug"), boost::log::trivial::debug);
    EXPECT_EQ(Logger::ParseSeverity("WARN"), boost::log::trivial::warning);
    EXPECT_EQ(Logger::ParseSeverity("Error"), boost::log::trivial::error);
    EXPECT_FALSE(Logger::ParseSeverity("loud").has_value());
    EXPECT_FALSE(Logger::ParseSeverity("").has_value());
}

// syslog(3) через native-бэкенд: подключение и запись не бросают даже без syslogd.
TEST(LoggerTest, SyslogSinkAcceptsMessages)
{
    Logger::Options opts;
    opts.app_name       = "tunredirect-test";
    opts.enable_console = false;
    Logger::Guard guard(opts);

    EXPECT_NO_THROW(guard.EnableSyslog());
    EXPECT_NO_THROW(guard.EnableSyslog());
    EXPECT_NO_THROW(LOGI("logger") << "syslog sink attached");
    guard.SetMinSeverity(boost::log::trivial::warning);
    EXPECT_NO_THROW(LOGW("logger") << "after severity change");
    Logger::FlushAll();
}
