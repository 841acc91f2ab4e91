// Copyright (c) 2026, WH, All rights reserved.
#include "Errors.h"
#include "Pixels.h"
#include "Surface.h"

#include <gtest/gtest.h>

#include <cstring>

using namespace sdl3bind;

namespace {

Uint32 pixelAt(SurfaceRef surface, int x, int y) {
    Uint32 ret = 0;
    const auto *row = static_cast<const unsigned char *>(surface.getPixels()) +
                      static_cast<size_t>(surface.getPitch()) * static_cast<size_t>(y);
    std::memcpy(&ret, row + static_cast<size_t>(x) * sizeof(Uint32), sizeof(Uint32));
    return ret;
}

}  // namespace

TEST(SurfaceTest, CreateReportsItsShape) {
    auto surface = Surface::create(16, 8, PixelFormat::rgba8888);
    ASSERT_TRUE(surface.has_value());
    EXPECT_EQ(surface->getWidth(), 16);
    EXPECT_EQ(surface->getHeight(), 8);
    EXPECT_GE(surface->getPitch(), 16 * 4);
    EXPECT_EQ(surface->getFormat(), PixelFormat::rgba8888);
}

TEST(SurfaceTest, FillRectTouchesOnlyTheRect) {
    auto surface = Surface::create(4, 4, PixelFormat::rgba8888);
    ASSERT_TRUE(surface.has_value());

    const Uint32 red = surface->mapRgb(255, 0, 0);
    const Uint32 blue = surface->mapRgb(0, 0, 255);
    ASSERT_TRUE(surface->fillRect(std::nullopt, red));
    ASSERT_TRUE(surface->fillRect(Rect{1, 1, 2, 2}, blue));

    EXPECT_EQ(pixelAt(*surface, 0, 0), red);
    EXPECT_EQ(pixelAt(*surface, 1, 1), blue);
    EXPECT_EQ(pixelAt(*surface, 2, 2), blue);
    EXPECT_EQ(pixelAt(*surface, 3, 3), red);
}

TEST(SurfaceTest, BlitCopiesPixels) {
    auto src = Surface::create(2, 2, PixelFormat::rgba8888);
    auto dst = Surface::create(4, 4, PixelFormat::rgba8888);
    ASSERT_TRUE(src.has_value());
    ASSERT_TRUE(dst.has_value());

    const Uint32 green = src->mapRgba(0, 255, 0, 255);
    ASSERT_TRUE(src->fillRect(std::nullopt, green));
    ASSERT_TRUE(dst->fillRect(std::nullopt, 0));
    ASSERT_TRUE(blit(*src, std::nullopt, *dst, Rect{2, 2, 2, 2}));

    EXPECT_EQ(pixelAt(*dst, 0, 0), 0u);
    EXPECT_EQ(pixelAt(*dst, 3, 3), green);
}

TEST(SurfaceTest, ConvertFormatKeepsSize) {
    auto surface = Surface::create(3, 5, PixelFormat::rgba8888);
    ASSERT_TRUE(surface.has_value());
    auto converted = surface->convertFormat(PixelFormat::abgr8888);
    ASSERT_TRUE(converted.has_value());
    EXPECT_EQ(converted->getWidth(), 3);
    EXPECT_EQ(converted->getHeight(), 5);
    EXPECT_EQ(converted->getFormat(), PixelFormat::abgr8888);
}

TEST(SurfaceTest, ReleaseGivesUpOwnership) {
    auto surface = Surface::create(1, 1, PixelFormat::rgba8888);
    ASSERT_TRUE(surface.has_value());
    SDL_Surface *raw = surface->release();
    ASSERT_NE(raw, nullptr);
    EXPECT_FALSE(*surface);
    SDL_DestroySurface(raw);
}

TEST(SurfaceTest, InvalidSizeFails) {
    const errors::ScopedCallback quiet{nullptr};
    EXPECT_FALSE(Surface::create(-1, 4, PixelFormat::rgba8888).has_value());
}

TEST(PixelsTest, FormatNames) {
    EXPECT_EQ(getPixelFormatName(PixelFormat::rgba8888), "SDL_PIXELFORMAT_RGBA8888");
    EXPECT_EQ(getPixelFormatName(std::nullopt), "SDL_PIXELFORMAT_UNKNOWN");
}
