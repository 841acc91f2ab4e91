// Copyright (c) 2026, WH, All rights reserved.
#include "FramerateCapper.h"

#include <gtest/gtest.h>

using sdl3bind::FramerateCapper;

TEST(FramerateCapperTest, FirstFrameHasNoDelta) {
    FramerateCapper<double> capper{FramerateCapper<double>::Unlimited{}};
    EXPECT_FALSE(capper.isLimited());
    EXPECT_EQ(capper.delay(), 0.0);
    EXPECT_EQ(capper.frameNum(), 1u);
    EXPECT_EQ(capper.fps(), 0.0);
}

TEST(FramerateCapperTest, LimitedHoldsTheFrameTime) {
    constexpr uint32_t fps = 100;
    FramerateCapper<double> capper{FramerateCapper<double>::Limited{fps}};
    EXPECT_TRUE(capper.isLimited());

    capper.delay();
    double total = 0.0;
    for(int i = 0; i < 5; i++) {
        total += capper.delay();
    }

    // 5 frames at 10ms each, with some slack for the sleep granularity
    EXPECT_GE(total, 0.045);
    EXPECT_EQ(capper.frameNum(), 6u);
    EXPECT_GT(capper.fps(), 0.0);
}

TEST(FramerateCapperTest, UnlimitedDoesntSleep) {
    FramerateCapper<float> capper{FramerateCapper<float>::Unlimited{}};
    capper.delay();
    // nothing happens between the calls, so the delta is tiny
    EXPECT_LT(capper.delay(), 0.005f);
}

TEST(FramerateCapperTest, SetLimitSwitchesModes) {
    FramerateCapper<float> capper{FramerateCapper<float>::Unlimited{}};
    capper.setLimit(30);
    EXPECT_TRUE(capper.isLimited());
    capper.setLimit(0);
    EXPECT_FALSE(capper.isLimited());
}
