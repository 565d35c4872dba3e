#include <gtest/gtest.h>

#include "clink/log.hpp"

TEST(LogLevelTest, KnownNames) {
    EXPECT_EQ(clink::log::parseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(clink::log::parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(clink::log::parseLevel("off"), spdlog::level::off);
}

TEST(LogLevelTest, MisspelledNameKeepsWarnings) {
    EXPECT_EQ(clink::log::parseLevel("degub"), spdlog::level::warn);
    EXPECT_EQ(clink::log::parseLevel(""), spdlog::level::warn);
}

TEST(LogLevelTest, LoggerIsNamedClink) {
    ASSERT_NE(clink::log::logger(), nullptr);
    EXPECT_EQ(clink::log::logger()->name(), "clink");
}
