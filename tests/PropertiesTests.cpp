// Copyright (c) 2026, WH, All rights reserved.
#include "Properties.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using namespace sdl3bind;

TEST(PropertiesTest, SetAndGetEveryType) {
    auto group = properties::Group::create();
    ASSERT_TRUE(group.has_value());

    int target = 0;
    ASSERT_TRUE(group->set("pointer", static_cast<void *>(&target)));
    ASSERT_TRUE(group->set("string", std::string{"hello"}));
    ASSERT_TRUE(group->set("number", Sint64{-42}));
    ASSERT_TRUE(group->set("float", 1.5f));
    ASSERT_TRUE(group->set("bool", true));

    EXPECT_EQ(group->getAs<void *>("pointer"), static_cast<void *>(&target));
    EXPECT_EQ(group->getAs<std::string>("string"), "hello");
    EXPECT_EQ(group->getAs<Sint64>("number"), -42);
    EXPECT_EQ(group->getAs<float>("float"), 1.5f);
    EXPECT_EQ(group->getAs<bool>("bool"), true);

    EXPECT_EQ(group->getType("pointer"), properties::Type::pointer);
    EXPECT_EQ(group->getType("string"), properties::Type::string);
    EXPECT_EQ(group->getType("number"), properties::Type::number);
    EXPECT_EQ(group->getType("float"), properties::Type::floating);
    EXPECT_EQ(group->getType("bool"), properties::Type::boolean);
}

TEST(PropertiesTest, MissingAndMismatched) {
    auto group = properties::Group::create();
    ASSERT_TRUE(group.has_value());

    EXPECT_FALSE(group->has("nothing"));
    EXPECT_EQ(group->get("nothing"), std::nullopt);
    EXPECT_EQ(group->getType("nothing"), std::nullopt);

    ASSERT_TRUE(group->set("number", Sint64{1}));
    EXPECT_EQ(group->getAs<std::string>("number"), std::nullopt);
}

TEST(PropertiesTest, ClearRemovesTheValue) {
    auto group = properties::Group::create();
    ASSERT_TRUE(group.has_value());

    ASSERT_TRUE(group->set("key", std::string{"value"}));
    EXPECT_TRUE(group->has("key"));
    ASSERT_TRUE(group->clear("key"));
    EXPECT_FALSE(group->has("key"));
}

TEST(PropertiesTest, NamesAndCopy) {
    auto src = properties::Group::create();
    auto dst = properties::Group::create();
    ASSERT_TRUE(src.has_value());
    ASSERT_TRUE(dst.has_value());

    ASSERT_TRUE(src->set("a", Sint64{1}));
    ASSERT_TRUE(src->set("b", false));

    auto names = src->names();
    ASSERT_TRUE(names.has_value());
    std::ranges::sort(*names);
    EXPECT_EQ(*names, (std::vector<std::string>{"a", "b"}));

    ASSERT_TRUE(src->copyTo(*dst));
    EXPECT_EQ(dst->getAs<Sint64>("a"), 1);
    EXPECT_EQ(dst->getAs<bool>("b"), false);
}

TEST(PropertiesTest, LockUnlock) {
    auto group = properties::Group::create();
    ASSERT_TRUE(group.has_value());
    ASSERT_TRUE(group->lock());
    EXPECT_TRUE(group->set("locked", true));
    group->unlock();
}

TEST(PropertiesTest, ReleasedGroupOutlivesTheOwner) {
    SDL_PropertiesID id = 0;
    {
        auto group = properties::Group::create();
        ASSERT_TRUE(group.has_value());
        ASSERT_TRUE(group->set("kept", Sint64{9}));
        id = group->release();
    }
    const properties::Borrowed borrowed{id};
    EXPECT_EQ(borrowed.getAs<Sint64>("kept"), 9);
    SDL_DestroyProperties(id);
}

TEST(PropertiesTest, GlobalGroupIsBorrowed) {
    auto global = properties::Group::getGlobal();
    ASSERT_TRUE(global.has_value());
    EXPECT_NE(global->id(), 0u);
}
