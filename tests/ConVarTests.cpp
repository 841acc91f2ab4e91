// Copyright (c) 2026, WH, All rights reserved.
#include "ConVar.h"
#include "ConVarHandler.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

ConVar test_int("test_int", 5, cv::CLIENT, "an int");
ConVar test_float("test_float", 0.5f, cv::CLIENT);
ConVar test_bool("test_bool", false, cv::CLIENT);
ConVar test_string("test_string", "default"sv, cv::CLIENT);
// no CLIENT flag: not changeable from outside
ConVar test_readonly("test_readonly", 1, 0);
ConVar test_noload("test_noload", 0, cv::CLIENT | cv::NOLOAD);

class ConVarTest : public ::testing::Test {
   protected:
    void SetUp() override {
        for(ConVar *cvar : {&test_int, &test_float, &test_bool, &test_string, &test_readonly, &test_noload}) {
            cvar->reset();
        }
    }
};

}  // namespace

TEST_F(ConVarTest, DefaultsAndTypes) {
    EXPECT_EQ(test_int.getInt(), 5);
    EXPECT_EQ(test_int.getType(), ConVar::CONVAR_TYPE::INT);
    EXPECT_FLOAT_EQ(test_float.getFloat(), 0.5f);
    EXPECT_EQ(test_float.getType(), ConVar::CONVAR_TYPE::FLOAT);
    EXPECT_FALSE(test_bool.getBool());
    EXPECT_EQ(test_bool.getType(), ConVar::CONVAR_TYPE::BOOL);
    EXPECT_EQ(test_string.getString(), "default");
    EXPECT_EQ(test_string.getType(), ConVar::CONVAR_TYPE::STRING);
    EXPECT_TRUE(test_int.isDefault());
}

TEST_F(ConVarTest, SetValueAndReset) {
    test_int.setValue(42);
    EXPECT_EQ(test_int.getInt(), 42);
    EXPECT_FALSE(test_int.isDefault());

    test_int.reset();
    EXPECT_EQ(test_int.getInt(), 5);
    EXPECT_EQ(test_int.getString(), test_int.getDefaultString());
}

TEST_F(ConVarTest, ReadOnlyIgnoresSetValue) {
    test_readonly.setValue(7);
    EXPECT_EQ(test_readonly.getInt(), 1);
}

TEST_F(ConVarTest, ChangeCallbackSeesOldAndNew) {
    std::vector<std::pair<float, float>> changes;
    test_float.setCallback([&changes](float oldValue, float newValue) { changes.emplace_back(oldValue, newValue); });

    test_float.setValue(2.0f);
    test_float.removeAllCallbacks();

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_FLOAT_EQ(changes[0].first, 0.5f);
    EXPECT_FLOAT_EQ(changes[0].second, 2.0f);
}

TEST_F(ConVarTest, LookupByName) {
    EXPECT_EQ(cvars().getConVarByName("test_int"), &test_int);
    EXPECT_EQ(cvars().getConVarByName("does_not_exist", false), nullptr);
    EXPECT_NE(cvars().getConVarByName("fps_max", false), nullptr);
}

TEST_F(ConVarTest, ApplyLine) {
    EXPECT_TRUE(cvars().applyLine("test_int 12"));
    EXPECT_EQ(test_int.getInt(), 12);

    // comments and surrounding whitespace
    EXPECT_TRUE(cvars().applyLine("  test_string   \"two words\"  // trailing comment"));
    EXPECT_EQ(test_string.getString(), "two words");

    // bare name resets
    EXPECT_TRUE(cvars().applyLine("test_int"));
    EXPECT_EQ(test_int.getInt(), 5);

    EXPECT_FALSE(cvars().applyLine("// only a comment"));
    EXPECT_FALSE(cvars().applyLine("test_readonly 3"));
    EXPECT_EQ(test_readonly.getInt(), 1);
}

TEST_F(ConVarTest, ApplyArgsReturnsTheRest) {
    const char *argv[] = {"program", "-test_int", "33", "positional", "-test_bool", "-unknown_option", "-test_string",
                          "hello"};
    const std::vector<std::string> rest = cvars().applyArgs(static_cast<int>(std::size(argv)), argv);

    EXPECT_EQ(test_int.getInt(), 33);
    EXPECT_TRUE(test_bool.getBool());
    EXPECT_EQ(test_string.getString(), "hello");
    EXPECT_EQ(rest, (std::vector<std::string>{"positional", "-unknown_option"}));
}

TEST_F(ConVarTest, LoadFileSkipsNoLoad) {
    const auto path = std::filesystem::temp_directory_path() / "sdl3bind_convar_test.cfg";
    {
        std::ofstream out(path);
        out << "// test config\n"
            << "test_int 77\n"
            << "test_float 1.25\n"
            << "test_noload 9\n"
            << "\n";
    }

    EXPECT_EQ(cvars().loadFile(path.string().c_str()), 2);
    EXPECT_EQ(test_int.getInt(), 77);
    EXPECT_FLOAT_EQ(test_float.getFloat(), 1.25f);
    EXPECT_EQ(test_noload.getInt(), 0);

    std::filesystem::remove(path);
}

TEST_F(ConVarTest, LoadFileMissing) {
    EXPECT_EQ(cvars().loadFile("/nonexistent/sdl3bind.cfg"), -1);
}

TEST(ConVarFlagsTest, FlagsToString) {
    EXPECT_EQ(ConVarHandler::flagsToString(0), "no flags");
    EXPECT_EQ(ConVarHandler::flagsToString(cv::CLIENT | cv::NOLOAD), "client noload");
    EXPECT_EQ(ConVarHandler::flagsToString(cv::HIDDEN), "hidden");
}
