#include <gtest/gtest.h>

#include <shade_position.h>

#include <limits>

using namespace SHADY;
using Direction = ShadePosition::Direction;

TEST(ShadePosition, IncrementIsRoundedShareOfTravel) {
    EXPECT_EQ(2, ShadePosition::computeIncrement(100, 500, 25000));
    EXPECT_EQ(2, ShadePosition::computeIncrement(100, 500, 30000));   // 1.67
    EXPECT_EQ(1, ShadePosition::computeIncrement(100, 500, 40000));   // 1.25
    EXPECT_EQ(0, ShadePosition::computeIncrement(100, 100, 60000));
    EXPECT_EQ(0, ShadePosition::computeIncrement(100, 500, 0));
}

TEST(ShadePosition, StartsOpenAndStopped) {
    ShadePosition position(100, 500, 25000);
    EXPECT_EQ(100, position.getPosition());
    EXPECT_EQ(Direction::Stopped, position.getDirection());
    EXPECT_FALSE(position.isMoving());
}

TEST(ShadePosition, StoppedDoesNotMove) {
    ShadePosition position(100, 500, 25000);
    EXPECT_EQ(100, position.advance());
    EXPECT_EQ(100, position.advance());
}

TEST(ShadePosition, ClosingClampsAtZeroAndStops) {
    ShadePosition position(100, 500, 30000);   // increment 2
    position.startClosing();
    for (int expected = 98; expected >= 0; expected -= 2)
        EXPECT_EQ(expected, position.advance());
    EXPECT_TRUE(position.isMoving());
    EXPECT_EQ(0, position.advance());
    EXPECT_EQ(Direction::Stopped, position.getDirection());
}

TEST(ShadePosition, OpeningClampsAtMax) {
    ShadePosition position(10, 500, 1500);   // increment 3
    position.startClosing();
    for (int i = 0; i < 4; ++i) position.advance();
    EXPECT_EQ(0, position.getPosition());

    position.startOpening();
    EXPECT_EQ(3, position.advance());
    EXPECT_EQ(6, position.advance());
    EXPECT_EQ(9, position.advance());
    EXPECT_EQ(10, position.advance());
    EXPECT_FALSE(position.isMoving());
    EXPECT_EQ(10, position.advance());
}

TEST(ShadePosition, StopHoldsPosition) {
    ShadePosition position(100, 500, 25000);
    position.startClosing();
    position.advance();
    position.advance();
    position.stop();
    EXPECT_EQ(96, position.advance());
    EXPECT_STREQ("stopped", directionToString(position.getDirection()));
}

TEST(ShadePosition, IncrementNeverExceedsFullTravel) {
    EXPECT_EQ(100, ShadePosition::computeIncrement(100, 60000, 1000));
    EXPECT_EQ(100, ShadePosition::computeIncrement(100, 1000, 1000));
}

TEST(ShadePosition, LargeScaleClampsWithoutWrapping) {
    const int max = std::numeric_limits<int>::max();
    ShadePosition position(max, 1000, 1000);
    EXPECT_EQ(max, position.getIncrement());

    position.startOpening();
    EXPECT_EQ(max, position.advance());
    EXPECT_EQ(Direction::Stopped, position.getDirection());

    position.startClosing();
    EXPECT_EQ(0, position.advance());
    EXPECT_EQ(0, position.advance());
    EXPECT_FALSE(position.isMoving());
}
