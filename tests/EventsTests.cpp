// Copyright (c) 2026, WH, All rights reserved.
#include "Events.h"
#include "Init.h"

#include <gtest/gtest.h>

#include <variant>

using namespace sdl3bind;

TEST(EventConversionTest, QuitRoundTrips) {
    SDL_Event native{};
    native.type = SDL_EVENT_QUIT;
    native.quit.timestamp = 1234;

    const events::Event event = events::fromNative(native);
    ASSERT_TRUE(std::holds_alternative<events::Quit>(event));
    EXPECT_EQ(std::get<events::Quit>(event).timestamp, 1234u);

    const SDL_Event back = events::toNative(event);
    EXPECT_EQ(back.type, static_cast<Uint32>(SDL_EVENT_QUIT));
    EXPECT_EQ(back.quit.timestamp, 1234u);
}

TEST(EventConversionTest, KeyDownKeepsEveryField) {
    SDL_Event native{};
    native.key.type = SDL_EVENT_KEY_DOWN;
    native.key.windowID = 3;
    native.key.scancode = SDL_SCANCODE_ESCAPE;
    native.key.key = SDLK_ESCAPE;
    native.key.mod = SDL_KMOD_LSHIFT;
    native.key.down = true;
    native.key.repeat = true;

    const events::Event event = events::fromNative(native);
    const auto *key = std::get_if<events::KeyDown>(&event);
    ASSERT_NE(key, nullptr);
    EXPECT_EQ(key->window_id, 3u);
    EXPECT_EQ(key->scancode, SDL_SCANCODE_ESCAPE);
    EXPECT_EQ(key->key, SDLK_ESCAPE);
    EXPECT_EQ(key->mod, SDL_KMOD_LSHIFT);
    EXPECT_TRUE(key->repeat);

    const SDL_Event back = events::toNative(event);
    EXPECT_EQ(back.type, static_cast<Uint32>(SDL_EVENT_KEY_DOWN));
    EXPECT_TRUE(back.key.down);
    EXPECT_EQ(back.key.key, SDLK_ESCAPE);
}

TEST(EventConversionTest, KeyUpIsItsOwnAlternative) {
    SDL_Event native{};
    native.key.type = SDL_EVENT_KEY_UP;
    native.key.key = SDLK_A;

    const events::Event event = events::fromNative(native);
    ASSERT_TRUE(std::holds_alternative<events::KeyUp>(event));
    EXPECT_FALSE(events::toNative(event).key.down);
}

TEST(EventConversionTest, WindowEventsKeepTheirType) {
    SDL_Event native{};
    native.window.type = SDL_EVENT_WINDOW_RESIZED;
    native.window.windowID = 7;
    native.window.data1 = 800;
    native.window.data2 = 600;

    const events::Event event = events::fromNative(native);
    const auto *window = std::get_if<events::WindowEvent>(&event);
    ASSERT_NE(window, nullptr);
    EXPECT_EQ(window->type, static_cast<Uint32>(SDL_EVENT_WINDOW_RESIZED));
    EXPECT_EQ(window->data1, 800);
    EXPECT_EQ(window->data2, 600);
    EXPECT_EQ(events::typeOf(event), static_cast<Uint32>(SDL_EVENT_WINDOW_RESIZED));
}

TEST(EventConversionTest, UntranslatedEventsStayRaw) {
    SDL_Event native{};
    native.type = SDL_EVENT_CLIPBOARD_UPDATE;
    native.common.timestamp = 99;

    const events::Event event = events::fromNative(native);
    const auto *unknown = std::get_if<events::Unknown>(&event);
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->raw.type, static_cast<Uint32>(SDL_EVENT_CLIPBOARD_UPDATE));
    EXPECT_EQ(events::toNative(event).common.timestamp, 99u);
}

class EventQueueTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto subsystem = Subsystem::create({.events = true});
        ASSERT_TRUE(subsystem.has_value());
        m_events.emplace(std::move(*subsystem));
        events::flush(SDL_EVENT_FIRST, SDL_EVENT_LAST);
    }
    void TearDown() override { m_events.reset(); }

    std::optional<Subsystem> m_events;
};

TEST_F(EventQueueTest, PushThenPoll) {
    auto type = events::registerEvents(1);
    ASSERT_TRUE(type.has_value());

    int payload = 0;
    ASSERT_TRUE(events::push(events::User{.type = *type, .code = 17, .data1 = &payload}));
    EXPECT_TRUE(events::has(*type));

    auto event = events::poll();
    ASSERT_TRUE(event.has_value());
    const auto *user = std::get_if<events::User>(&*event);
    ASSERT_NE(user, nullptr);
    EXPECT_EQ(user->type, *type);
    EXPECT_EQ(user->code, 17);
    EXPECT_EQ(user->data1, &payload);

    EXPECT_FALSE(events::poll().has_value());
}

TEST_F(EventQueueTest, WaitTimeoutOnEmptyQueue) {
    EXPECT_FALSE(events::waitTimeout(1).has_value());
}

TEST_F(EventQueueTest, TextInputCantBePushed) {
    EXPECT_FALSE(events::push(events::TextInput{.text = "abc"}).has_value());
}

TEST_F(EventQueueTest, FlushDropsQueuedEvents) {
    ASSERT_TRUE(events::push(events::Quit{}));
    events::flush(SDL_EVENT_QUIT);
    EXPECT_FALSE(events::has(SDL_EVENT_QUIT));
}
