#include <gtest/gtest.h>

#include "input/InputManager.h"

using namespace EdgeShare::Input;

TEST(ScrollAccumulator, WholeNotchesPassStraightThrough)
{
    ScrollAccumulator acc;
    EXPECT_EQ(acc.add(240), 2);
    EXPECT_EQ(acc.add(-120), -1);
    EXPECT_EQ(acc.remainder(), 0);
}

TEST(ScrollAccumulator, FractionsCarryUntilANotchCompletes)
{
    ScrollAccumulator acc;
    EXPECT_EQ(acc.add(40), 0);
    EXPECT_EQ(acc.add(40), 0);
    EXPECT_EQ(acc.add(40), 1);
    EXPECT_EQ(acc.remainder(), 0);

    EXPECT_EQ(acc.add(200), 1);
    EXPECT_EQ(acc.remainder(), 80);
}

TEST(ScrollAccumulator, OppositeDirectionsCancel)
{
    ScrollAccumulator acc;
    EXPECT_EQ(acc.add(60), 0);
    EXPECT_EQ(acc.add(-60), 0);
    EXPECT_EQ(acc.remainder(), 0);

    EXPECT_EQ(acc.add(-60), 0);
    EXPECT_EQ(acc.add(-60), -1);
}

TEST(ScrollAccumulator, ResetDropsRemainder)
{
    ScrollAccumulator acc;
    acc.add(100);
    acc.reset();
    EXPECT_EQ(acc.add(100), 0);
    EXPECT_EQ(acc.remainder(), 100);
}

TEST(CaptureStatus, NamesAreReadable)
{
    EXPECT_EQ(captureStatusToString(CaptureStatus::PermissionDenied), "permission denied");
    EXPECT_EQ(captureStatusToString(CaptureStatus::NoDevices), "no input devices");
}
