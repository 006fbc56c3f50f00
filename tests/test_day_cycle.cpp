/**
 * @file test_day_cycle.cpp
 * @brief 日切过渡控制器单元测试
 */

#include <gtest/gtest.h>
#include "game/day_cycle.h"

using namespace Meadow;

TEST(DayCycleTest, IdleTickDoesNothing) {
    int days = 0;
    DayCycleController cycle(1.0f);
    cycle.OnDayAdvance([&]() { days++; });

    EXPECT_FALSE(cycle.Tick(5.0f));
    EXPECT_EQ(days, 0);
    EXPECT_EQ(cycle.FadeAlpha(), 0);
}

TEST(DayCycleTest, FiresOnceThenReturnsToIdle) {
    int days = 0;
    DayCycleController cycle(1.0f);
    cycle.OnDayAdvance([&]() { days++; });

    EXPECT_TRUE(cycle.Start());
    EXPECT_FALSE(cycle.Tick(0.6f));
    EXPECT_TRUE(cycle.IsRunning());
    EXPECT_TRUE(cycle.Tick(0.6f));
    EXPECT_FALSE(cycle.IsRunning());
    EXPECT_EQ(days, 1);

    cycle.Tick(10.0f);
    EXPECT_EQ(days, 1);
}

TEST(DayCycleTest, StartWhileRunningIsIgnored) {
    int days = 0;
    DayCycleController cycle(1.0f);
    cycle.OnDayAdvance([&]() { days++; });

    cycle.Start();
    cycle.Tick(0.8f);
    EXPECT_FALSE(cycle.Start());          // 不重置进度
    EXPECT_FLOAT_EQ(cycle.GetProgress(), 0.8f);

    cycle.Tick(0.3f);
    EXPECT_EQ(days, 1);

    // 回到 Idle 后可以再次开始
    EXPECT_TRUE(cycle.Start());
    cycle.Tick(1.0f);
    EXPECT_EQ(days, 2);
}

TEST(DayCycleTest, CallbackRunsBeforeTickReturns) {
    bool runningInCallback = true;
    DayCycleController cycle(0.5f);
    cycle.OnDayAdvance([&]() { runningInCallback = cycle.IsRunning(); });

    cycle.Start();
    cycle.Tick(0.5f);
    EXPECT_FALSE(runningInCallback);
}

TEST(DayCycleTest, FadeAlphaFollowsProgress) {
    DayCycleController cycle(2.0f);
    cycle.Start();
    cycle.Tick(1.0f);
    EXPECT_NEAR(cycle.FadeAlpha(), 127, 1);
    cycle.Tick(0.99f);
    EXPECT_GT(cycle.FadeAlpha(), 250);
}

TEST(DayCycleTest, NoCallbackRegistered) {
    DayCycleController cycle(0.1f);
    cycle.Start();
    EXPECT_TRUE(cycle.Tick(0.2f));
    EXPECT_FALSE(cycle.IsRunning());
}
