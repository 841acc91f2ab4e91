// Copyright (c) 2026, WH, All rights reserved.
#include "Errors.h"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using namespace sdl3bind;

namespace {

// what the observer saw, per failure
std::vector<std::optional<std::string>> g_seen;

void recordingCallback(std::optional<std::string_view> err) {
    g_seen.emplace_back(err ? std::optional<std::string>{std::string{*err}} : std::nullopt);
}

class ErrorsTest : public ::testing::Test {
   protected:
    void SetUp() override {
        g_seen.clear();
        errors::clear();
    }
    void TearDown() override { g_seen.clear(); }

    errors::ScopedCallback m_observer{recordingCallback};
};

}  // namespace

TEST_F(ErrorsTest, SentinelResultFailsAndNotifiesOnce) {
    ASSERT_FALSE(errors::set("first").has_value());
    g_seen.clear();

    const Result<int> ret = errors::wrapCall(-1, -1);
    EXPECT_FALSE(ret.has_value());
    ASSERT_EQ(g_seen.size(), 1u);
    EXPECT_EQ(g_seen[0], "first");
}

TEST_F(ErrorsTest, NonSentinelPassesThroughUntouched) {
    const Result<int> ret = errors::wrapCall(42, -1);
    ASSERT_TRUE(ret.has_value());
    EXPECT_EQ(*ret, 42);
    EXPECT_TRUE(g_seen.empty());

    EXPECT_TRUE(errors::wrapCallBool(true).has_value());
    EXPECT_TRUE(g_seen.empty());
}

TEST_F(ErrorsTest, PointerAndStringWrappers) {
    int value = 5;
    const Result<int *> ptr = errors::wrapCallPtr(&value);
    ASSERT_TRUE(ptr.has_value());
    EXPECT_EQ(*ptr, &value);

    const Result<int *> null = errors::wrapNull(static_cast<int *>(nullptr));
    EXPECT_FALSE(null.has_value());
    EXPECT_EQ(g_seen.size(), 1u);

    const Result<std::string_view> str = errors::wrapCallCString("hello");
    ASSERT_TRUE(str.has_value());
    EXPECT_EQ(*str, "hello");

    EXPECT_FALSE(errors::wrapCallCString(nullptr).has_value());
    EXPECT_EQ(g_seen.size(), 2u);
}

TEST_F(ErrorsTest, ObserverGetsNulloptWithoutDiagnostic) {
    errors::clear();
    EXPECT_FALSE(errors::wrapCallBool(false).has_value());
    ASSERT_EQ(g_seen.size(), 1u);
    EXPECT_EQ(g_seen[0], std::nullopt);
}

TEST_F(ErrorsTest, ClearAndSet) {
    errors::clear();
    EXPECT_EQ(errors::get(), std::nullopt);

    const Result<void> ret = errors::set("Hello world");
    EXPECT_FALSE(ret.has_value());
    EXPECT_EQ(errors::get(), "Hello world");
    ASSERT_EQ(g_seen.size(), 1u);
    EXPECT_EQ(g_seen[0], "Hello world");

    errors::clear();
    EXPECT_EQ(errors::get(), std::nullopt);
}

TEST_F(ErrorsTest, CannedDiagnostics) {
    EXPECT_FALSE(errors::invalidParamError("Hello world").has_value());
    EXPECT_EQ(errors::get(), "Parameter 'Hello world' is invalid");

    EXPECT_FALSE(errors::signalOutOfMemory().has_value());
    EXPECT_EQ(errors::get(), "Out of memory");

    EXPECT_FALSE(errors::unsupported().has_value());
    EXPECT_EQ(errors::get(), "That operation is not supported");

    EXPECT_EQ(g_seen.size(), 3u);
}

TEST_F(ErrorsTest, UnterminatedViewsStopAtTheirLength) {
    static_assert(noexcept(errors::set(std::string_view{})));
    static_assert(noexcept(errors::invalidParamError(std::string_view{})));

    constexpr std::string_view text{"shader.stage.extra"};
    EXPECT_FALSE(errors::set(text.substr(0, 6)).has_value());
    EXPECT_EQ(errors::get(), "shader");

    EXPECT_FALSE(errors::invalidParamError(text.substr(0, 12)).has_value());
    EXPECT_EQ(errors::get(), "Parameter 'shader.stage' is invalid");

    EXPECT_FALSE(errors::set(std::string_view{}).has_value());
    EXPECT_EQ(errors::get(), std::nullopt);
}

TEST_F(ErrorsTest, ScopedCallbackRestoresPrevious) {
    EXPECT_EQ(errors::getCallback(), &recordingCallback);
    {
        const errors::ScopedCallback quiet{nullptr};
        EXPECT_EQ(errors::getCallback(), nullptr);
        EXPECT_FALSE(errors::set("unobserved").has_value());
    }
    EXPECT_EQ(errors::getCallback(), &recordingCallback);
    EXPECT_TRUE(g_seen.empty());
}
