#include <gtest/gtest.h>

#include "rotary_err.hpp"
#include "rotary_log.hpp"

TEST(RotaryErr, KnownCodesHaveNames)
{
    EXPECT_STREQ("ROTARY_OK", rotary_err_to_name(ROTARY_OK));
    EXPECT_STREQ("ROTARY_ERR_INVALID_ARG", rotary_err_to_name(ROTARY_ERR_INVALID_ARG));
    EXPECT_STREQ("ROTARY_ERR_NOT_PERMITTED", rotary_err_to_name(ROTARY_ERR_NOT_PERMITTED));
}

TEST(RotaryErr, UnknownCode)
{
    EXPECT_STREQ("ERROR", rotary_err_to_name(0x7777));
}

TEST(RotaryLog, LevelFromString)
{
    EXPECT_EQ(ROTARY_LOG_DEBUG, rotary_log_level_from_string("debug", ROTARY_LOG_INFO));
    EXPECT_EQ(ROTARY_LOG_WARN, rotary_log_level_from_string("WARN", ROTARY_LOG_INFO));
    EXPECT_EQ(ROTARY_LOG_NONE, rotary_log_level_from_string("none", ROTARY_LOG_INFO));
    EXPECT_EQ(ROTARY_LOG_INFO, rotary_log_level_from_string("loud", ROTARY_LOG_INFO));
    EXPECT_EQ(ROTARY_LOG_ERROR, rotary_log_level_from_string(nullptr, ROTARY_LOG_ERROR));
}

TEST(RotaryLog, EnabledFollowsLevel)
{
    rotary_log_level_t saved = rotary_log_level_get();

    rotary_log_level_set(ROTARY_LOG_WARN);
    EXPECT_TRUE(rotary_log_enabled(ROTARY_LOG_ERROR));
    EXPECT_TRUE(rotary_log_enabled(ROTARY_LOG_WARN));
    EXPECT_FALSE(rotary_log_enabled(ROTARY_LOG_INFO));
    EXPECT_FALSE(rotary_log_enabled(ROTARY_LOG_NONE));

    rotary_log_level_set(saved);
}
