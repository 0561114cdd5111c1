#include <gtest/gtest.h>

#include "rotary_decoder.hpp"

TEST(RotaryDecoder, ClockFallsWithDataHighIsClockwise)
{
    Direction dir;
    ASSERT_TRUE(decodeRotation(PinSnapshot{0, 1}, false, &dir));
    EXPECT_EQ(Direction::CLOCKWISE, dir);
}

TEST(RotaryDecoder, ClockFallsWithDataLowIsCounterClockwise)
{
    Direction dir;
    ASSERT_TRUE(decodeRotation(PinSnapshot{0, 0}, false, &dir));
    EXPECT_EQ(Direction::COUNTER_CLOCKWISE, dir);
}

TEST(RotaryDecoder, ClockRisingEdgeProducesNothing)
{
    Direction dir = Direction::CLOCKWISE;
    EXPECT_FALSE(decodeRotation(PinSnapshot{1, 0}, false, &dir));
    EXPECT_FALSE(decodeRotation(PinSnapshot{1, 1}, false, &dir));
    EXPECT_EQ(Direction::CLOCKWISE, dir);
}

TEST(RotaryDecoder, ReversedWiringSwapsDirections)
{
    Direction dir;
    ASSERT_TRUE(decodeRotation(PinSnapshot{0, 1}, true, &dir));
    EXPECT_EQ(Direction::COUNTER_CLOCKWISE, dir);
    ASSERT_TRUE(decodeRotation(PinSnapshot{0, 0}, true, &dir));
    EXPECT_EQ(Direction::CLOCKWISE, dir);
}

TEST(RotaryDecoder, NullOutputIsRejected)
{
    EXPECT_FALSE(decodeRotation(PinSnapshot{0, 1}, false, nullptr));
}

TEST(RotaryDecoder, DirectionNames)
{
    EXPECT_STREQ("clockwise", directionName(Direction::CLOCKWISE));
    EXPECT_STREQ("counter-clockwise", directionName(Direction::COUNTER_CLOCKWISE));
}
