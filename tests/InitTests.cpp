// Copyright (c) 2026, WH, All rights reserved.
#include "Init.h"

#include <SDL3/SDL_hints.h>

#include <gtest/gtest.h>

#include <optional>
#include <utility>

using namespace sdl3bind;

TEST(VersionTest, AtLeastComparesMajorFirst) {
    constexpr Version v{.major = 3, .minor = 2, .micro = 4};

    static_assert(v.atLeast(3, 2, 4));
    EXPECT_TRUE(v.atLeast(3, 2, 3));
    EXPECT_FALSE(v.atLeast(3, 2, 5));
    EXPECT_TRUE(v.atLeast(3, 1, 9));
    EXPECT_FALSE(v.atLeast(3, 3, 0));
    // a newer major wins whatever the minor/micro
    EXPECT_TRUE(v.atLeast(2, 9, 9));
    EXPECT_FALSE(v.atLeast(4, 0, 0));
}

TEST(VersionTest, RuntimeIsAtLeastThree) {
    EXPECT_TRUE(Version::compiled().atLeast(3, 0, 0));
    EXPECT_TRUE(Version::get().atLeast(3, 0, 0));
}

TEST(HintTest, UnsetHintIsAbsent) {
    constexpr const char *HINT = "SDL3BIND_TEST_HINT";
    EXPECT_EQ(getHint(HINT), std::nullopt);

    ASSERT_TRUE(setHint(HINT, "1"));
    EXPECT_EQ(getHint(HINT), "1");

    ASSERT_TRUE(resetHint(HINT));
    EXPECT_EQ(getHint(HINT), std::nullopt);
}

TEST(AppMetadataTest, SetAndGet) {
    ASSERT_TRUE(setAppMetadata("sdl3bind tests", "1.2.3", "org.sdl3bind.tests"));
    EXPECT_EQ(getAppMetadataProperty(AppMetadataProperty::name), "sdl3bind tests");
    EXPECT_EQ(getAppMetadataProperty(AppMetadataProperty::version), "1.2.3");
    EXPECT_EQ(getAppMetadataProperty(AppMetadataProperty::identifier), "org.sdl3bind.tests");

    EXPECT_EQ(getAppMetadataProperty(AppMetadataProperty::url), std::nullopt);
    ASSERT_TRUE(setAppMetadataProperty(AppMetadataProperty::url, "https://example.org"));
    EXPECT_EQ(getAppMetadataProperty(AppMetadataProperty::url), "https://example.org");

    // nullptr clears it again
    ASSERT_TRUE(setAppMetadataProperty(AppMetadataProperty::url, nullptr));
    EXPECT_EQ(getAppMetadataProperty(AppMetadataProperty::url), std::nullopt);
}

// runs against the dummy video driver
class InitTest : public ::testing::Test {
   protected:
    void SetUp() override {
        shutdown();
        ASSERT_TRUE(setHint(SDL_HINT_VIDEO_DRIVER, "dummy"));
        ASSERT_FALSE(eventsUp());
    }
    void TearDown() override { shutdown(); }

    static bool eventsUp() { return wasInit({.events = true}).events; }
};

TEST_F(InitTest, WasInitFollowsInitAndQuit) {
    ASSERT_TRUE(init({.events = true}));
    EXPECT_TRUE(eventsUp());
    EXPECT_FALSE(wasInit({.audio = true}).audio);

    quit({.events = true});
    EXPECT_FALSE(eventsUp());
}

TEST_F(InitTest, InitIsReferenceCounted) {
    ASSERT_TRUE(init({.events = true}));
    ASSERT_TRUE(init({.events = true}));

    quit({.events = true});
    EXPECT_TRUE(eventsUp());
    quit({.events = true});
    EXPECT_FALSE(eventsUp());
}

TEST_F(InitTest, VideoBringsUpEvents) {
    {
        auto video = Subsystem::create({.video = true});
        ASSERT_TRUE(video.has_value());
        const InitFlags up = wasInit();
        EXPECT_TRUE(up.video);
        EXPECT_TRUE(up.events);
        EXPECT_TRUE(video->flags().video);
    }
    EXPECT_FALSE(wasInit({.video = true}).video);
}

TEST_F(InitTest, MovedSubsystemQuitsOnce) {
    std::optional<Subsystem> moved;
    {
        auto events = Subsystem::create({.events = true});
        ASSERT_TRUE(events.has_value());
        moved.emplace(std::move(*events));
    }
    // the moved-from one didn't quit
    EXPECT_TRUE(eventsUp());

    moved.reset();
    EXPECT_FALSE(eventsUp());
}

TEST_F(InitTest, MoveAssignQuitsThePreviousOne) {
    auto first = Subsystem::create({.events = true});
    ASSERT_TRUE(first.has_value());
    std::optional<Subsystem> kept{std::move(*first)};
    {
        auto second = Subsystem::create({.events = true});
        ASSERT_TRUE(second.has_value());

        // drops the reference kept held, takes over second's
        *kept = std::move(*second);
        EXPECT_TRUE(eventsUp());
    }
    EXPECT_TRUE(eventsUp());

    kept.reset();
    EXPECT_FALSE(eventsUp());
}
