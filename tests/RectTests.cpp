// Copyright (c) 2026, WH, All rights reserved.
#include "Rect.h"

#include <gtest/gtest.h>

using namespace sdl3bind;

TEST(RectTest, Empty) {
    EXPECT_TRUE(isEmpty(Rect{0, 0, 0, 10}));
    EXPECT_TRUE(isEmpty(Rect{0, 0, 10, -1}));
    EXPECT_FALSE(isEmpty(Rect{5, 5, 1, 1}));
    EXPECT_TRUE(isEmpty(FRect{0.f, 0.f, 0.f, 1.f}));
    EXPECT_FALSE(isEmpty(FRect{0.f, 0.f, 0.5f, 0.5f}));
}

TEST(RectTest, Intersection) {
    const Rect a{0, 0, 10, 10};
    const Rect b{5, 5, 10, 10};
    const Rect far{100, 100, 1, 1};

    EXPECT_TRUE(hasIntersection(a, b));
    EXPECT_FALSE(hasIntersection(a, far));

    EXPECT_EQ(getIntersection(a, b), (Rect{5, 5, 5, 5}));
    EXPECT_EQ(getIntersection(a, far), std::nullopt);
}

TEST(RectTest, FloatIntersection) {
    const FRect a{0.f, 0.f, 2.f, 2.f};
    const FRect b{1.f, 1.f, 2.f, 2.f};
    ASSERT_TRUE(hasIntersection(a, b));
    const auto overlap = getIntersection(a, b);
    ASSERT_TRUE(overlap.has_value());
    EXPECT_FLOAT_EQ(overlap->x, 1.f);
    EXPECT_FLOAT_EQ(overlap->w, 1.f);
}

TEST(RectTest, UnionAndContains) {
    const auto joined = getUnion(Rect{0, 0, 1, 1}, Rect{4, 4, 1, 1});
    ASSERT_TRUE(joined.has_value());
    EXPECT_EQ(*joined, (Rect{0, 0, 5, 5}));

    const Rect area{10, 10, 5, 5};
    EXPECT_TRUE(contains(area, Point{10, 10}));
    EXPECT_TRUE(contains(area, Point{14, 14}));
    EXPECT_FALSE(contains(area, Point{15, 15}));
}
