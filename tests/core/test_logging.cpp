#include <gtest/gtest.h>
#include "rmce/logging.hpp"

TEST(Logging, LoggerIsSharedAndNamed) {
    auto a = rmce::log::logger();
    auto b = rmce::log::logger();
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a.get(), b.get());
    EXPECT_EQ(a->name(), "rmce");
}

TEST(Logging, SetLevelAcceptsSpdlogNames) {
    EXPECT_TRUE(rmce::log::set_level("debug"));
    EXPECT_EQ(rmce::log::logger()->level(), spdlog::level::debug);
    EXPECT_TRUE(rmce::log::set_level("off"));
    EXPECT_EQ(rmce::log::logger()->level(), spdlog::level::off);
    EXPECT_TRUE(rmce::log::set_level("warn"));
}

TEST(Logging, SetLevelRejectsUnknownNameAndKeepsLevel) {
    ASSERT_TRUE(rmce::log::set_level("error"));
    EXPECT_FALSE(rmce::log::set_level("loud"));
    EXPECT_EQ(rmce::log::logger()->level(), spdlog::level::err);
    rmce::log::set_level("warn");
}
