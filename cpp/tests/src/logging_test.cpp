#include <stdexcept>

#include <gtest/gtest.h>

#include <boost/log/trivial.hpp>

#include <kridge>

using namespace kridge;

namespace trivial = boost::log::trivial;

TEST(LoggingTest, ParsesLevels) {
    EXPECT_EQ(parse_log_level("trace"), trivial::trace);
    EXPECT_EQ(parse_log_level("debug"), trivial::debug);
    EXPECT_EQ(parse_log_level("info"), trivial::info);
    EXPECT_EQ(parse_log_level("warning"), trivial::warning);
    EXPECT_EQ(parse_log_level("warn"), trivial::warning);
    EXPECT_EQ(parse_log_level("error"), trivial::error);
}

TEST(LoggingTest, UnknownLevelThrows) {
    EXPECT_THROW(parse_log_level("verbose"), std::invalid_argument);
    EXPECT_THROW(parse_log_level(""), std::invalid_argument);
    EXPECT_THROW(init_logging("loud"), std::invalid_argument);
}

TEST(LoggingTest, InitCanBeRepeated) {
    EXPECT_NO_THROW(init_logging("warning"));
    EXPECT_NO_THROW(init_logging("error"));
    KRIDGE_LOG_INFO("filtered out " << 1);
    KRIDGE_LOG_ERROR("logged after re-init " << 2);
}
