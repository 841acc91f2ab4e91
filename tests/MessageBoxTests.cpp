// Copyright (c) 2026, WH, All rights reserved.
#include "MessageBox.h"

#include <gtest/gtest.h>

using namespace sdl3bind::message_box;

static_assert(Color::fromHex("ff8000") == Color{255, 128, 0});
static_assert(!Color::fromHex("ff80").has_value());

TEST(MessageBoxColorTest, FromHexAcceptsBothForms) {
    EXPECT_EQ(Color::fromHex("660aa8"), (Color{102, 10, 168}));
    EXPECT_EQ(Color::fromHex("#660aa8"), (Color{102, 10, 168}));
    EXPECT_EQ(Color::fromHex("FDFD22"), (Color{253, 253, 34}));
}

TEST(MessageBoxColorTest, FromHexRejectsMalformedInput) {
    EXPECT_EQ(Color::fromHex(""), std::nullopt);
    EXPECT_EQ(Color::fromHex("#"), std::nullopt);
    EXPECT_EQ(Color::fromHex("12345"), std::nullopt);
    EXPECT_EQ(Color::fromHex("1234567"), std::nullopt);
    EXPECT_EQ(Color::fromHex("gg0000"), std::nullopt);
    EXPECT_EQ(Color::fromHex("##000000"), std::nullopt);
}

TEST(MessageBoxColorTest, SchemeIndexesByColorType) {
    ColorScheme scheme;
    scheme[ColorType::background] = {1, 2, 3};
    scheme[ColorType::button_selected] = {4, 5, 6};

    const SDL_MessageBoxColorScheme native = scheme.toNative();
    const auto &bg = native.colors[SDL_MESSAGEBOX_COLOR_BACKGROUND];
    EXPECT_EQ(bg.r, 1);
    EXPECT_EQ(bg.g, 2);
    EXPECT_EQ(bg.b, 3);
    const auto &selected = native.colors[SDL_MESSAGEBOX_COLOR_BUTTON_SELECTED];
    EXPECT_EQ(selected.r, 4);
    EXPECT_EQ(selected.b, 6);
    EXPECT_EQ(native.colors[SDL_MESSAGEBOX_COLOR_TEXT].r, 0);
}
