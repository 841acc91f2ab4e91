// Copyright (c) 2026, WH, All rights reserved.
#include "Init.h"
#include "Window.h"

#include <gtest/gtest.h>

using namespace sdl3bind;
using video::Position;
using video::Window;

TEST(WindowPositionTest, ToNative) {
    EXPECT_EQ(Position::absolute(25).toNative(), 25);
    EXPECT_EQ(Position::absolute(-3).toNative(), -3);
    EXPECT_EQ(Position::centered().toNative(), static_cast<int>(SDL_WINDOWPOS_CENTERED));
    EXPECT_EQ(Position::undefined().toNative(), static_cast<int>(SDL_WINDOWPOS_UNDEFINED));
    EXPECT_EQ(Position{}, Position::undefined());
}

TEST(WindowCreatePropertiesTest, OnlySetFieldsArePresent) {
    const Window::CreateProperties props{
        .borderless = true,
        .height = 200,
        .resizable = false,
        .title = "props",
        .width = 300,
        .x = Position::centered(),
    };
    auto group = props.toProperties();
    ASSERT_TRUE(group.has_value());

    EXPECT_EQ(group->getAs<bool>(SDL_PROP_WINDOW_CREATE_BORDERLESS_BOOLEAN), true);
    EXPECT_EQ(group->getAs<bool>(SDL_PROP_WINDOW_CREATE_RESIZABLE_BOOLEAN), false);
    EXPECT_EQ(group->getAs<Sint64>(SDL_PROP_WINDOW_CREATE_WIDTH_NUMBER), 300);
    EXPECT_EQ(group->getAs<Sint64>(SDL_PROP_WINDOW_CREATE_HEIGHT_NUMBER), 200);
    EXPECT_EQ(group->getAs<std::string>(SDL_PROP_WINDOW_CREATE_TITLE_STRING), "props");
    EXPECT_EQ(group->getAs<Sint64>(SDL_PROP_WINDOW_CREATE_X_NUMBER), static_cast<Sint64>(SDL_WINDOWPOS_CENTERED));

    EXPECT_FALSE(group->has(SDL_PROP_WINDOW_CREATE_Y_NUMBER));
    EXPECT_FALSE(group->has(SDL_PROP_WINDOW_CREATE_HIDDEN_BOOLEAN));
    EXPECT_FALSE(group->has(SDL_PROP_WINDOW_CREATE_PARENT_POINTER));
}

TEST(WindowCreatePropertiesTest, EmptyPropertiesMakeAnEmptyGroup) {
    auto group = Window::CreateProperties{}.toProperties();
    ASSERT_TRUE(group.has_value());
    auto names = group->names();
    ASSERT_TRUE(names.has_value());
    EXPECT_TRUE(names->empty());
}

// runs against the dummy video driver
class WindowTest : public ::testing::Test {
   protected:
    void SetUp() override {
        ASSERT_TRUE(setHint(SDL_HINT_VIDEO_DRIVER, "dummy"));
        auto video = Subsystem::create({.video = true});
        ASSERT_TRUE(video.has_value());
        m_video.emplace(std::move(*video));
    }
    void TearDown() override { m_video.reset(); }

    std::optional<Subsystem> m_video;
};

TEST_F(WindowTest, CreateAndQuery) {
    auto window = Window::create("sdl3bind test", 320, 240, {.hidden = true});
    ASSERT_TRUE(window.has_value());

    EXPECT_EQ(window->getTitle(), "sdl3bind test");
    ASSERT_TRUE(window->setTitle("renamed"));
    EXPECT_EQ(window->getTitle(), "renamed");

    auto size = window->getSize();
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, (video::WindowSize{320, 240}));

    EXPECT_TRUE(window->getFlags().hidden);

    auto id = window->getID();
    ASSERT_TRUE(id.has_value());
    auto found = video::WindowRef::fromID(*id);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->get(), window->get());
}

TEST_F(WindowTest, CreateWithProperties) {
    auto window = Window::createWithProperties({.height = 64, .hidden = true, .title = "props", .width = 128});
    ASSERT_TRUE(window.has_value());
    EXPECT_EQ(window->getTitle(), "props");

    auto size = window->getSize();
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(size->w, 128);
    EXPECT_EQ(size->h, 64);
}
