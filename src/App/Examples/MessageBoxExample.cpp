// Copyright (c) 2026, WH, All rights reserved.
#include "Examples.h"

#include "Logging.h"
#include "MessageBox.h"

namespace Examples {
namespace {  // static

using namespace sdl3bind::message_box;

constexpr int RIGHT_ANSWER = 1;

Color colorOr(std::string_view hex, Color fallback) { return Color::fromHex(hex).value_or(fallback); }

sdl3bind::Result<bool> playRound() {
    const BoxData question{
        .title = "Question:",
        .message = "What is my favorite color?",
        .buttons =
            {
                {.value = 0, .text = "Red"},
                {.value = 0, .text = "Orange"},
                {.value = 0, .text = "Yellow"},
                {.value = 0, .text = "Green"},
                {.value = 0, .text = "Blue"},
                {.value = RIGHT_ANSWER, .text = "Purple"},
            },
    };

    auto answer = show(question);
    if(!answer) return std::unexpected(answer.error());

    if(*answer != RIGHT_ANSWER) {
        ColorScheme scheme;
        scheme[ColorType::background] = {10, 10, 10};
        scheme[ColorType::text] = colorOr("ffffff", {255, 255, 255});
        scheme[ColorType::button_border] = {75, 55, 50};
        scheme[ColorType::button_background] = {160, 20, 20};
        scheme[ColorType::button_selected] = colorOr("#fdfd22", {253, 253, 34});

        auto ok = show({
            .flags = {.buttons_right_to_left = true},
            .title = "Wrong!",
            .message = "You have chosen the wrong answer. Please try again.",
            .buttons = {{.value = 0, .text = "I Understand"}},
            .color_scheme = scheme,
        });
        if(!ok) return std::unexpected(ok.error());
        return false;
    }

    ColorScheme scheme;
    scheme[ColorType::background] = {195, 195, 195};
    scheme[ColorType::text] = colorOr("660aa8", {102, 10, 168});
    scheme[ColorType::button_border] = {50, 75, 55};
    scheme[ColorType::button_background] = {20, 160, 20};
    scheme[ColorType::button_selected] = colorOr("fdfd22", {253, 253, 34});

    auto ok = show({
        .flags = {.buttons_left_to_right = true},
        .title = "Correct!",
        .message = "You have guessed correctly. Yippee!",
        .buttons = {{.value = 0, .text = "Bye!"}},
        .color_scheme = scheme,
    });
    if(!ok) return std::unexpected(ok.error());
    return true;
}

}  // namespace

int runMessageBox(int /*argc*/, char * /*argv*/[]) {
    if(!sdl3bind::message_box::showSimple({}, "Start!", "Get ready to play the game.")) return 1;

    int rounds = 0;
    while(true) {
        rounds++;
        auto won = playRound();
        if(!won) return 1;
        if(*won) break;
    }

    debugLog("guessed right after {} round(s)", rounds);
    return 0;
}

}  // namespace Examples
