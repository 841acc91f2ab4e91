// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_MESSAGEBOX_H
#define SDL3BIND_MESSAGEBOX_H

#include "Errors.h"
#include "MessageBoxApi.h"
#include "Window.h"

#include <SDL3/SDL_messagebox.h>

#include <array>
#include <optional>
#include <string_view>
#include <vector>

// modal dialogs, usable before (and without) any video init
namespace sdl3bind::message_box {

struct Button {
    ButtonFlags flags;
    // what show() returns if this one gets pressed
    int value{0};
    const char *text{""};
};

struct Color {
    Uint8 r{0};
    Uint8 g{0};
    Uint8 b{0};

    // "rrggbb" or "#rrggbb", std::nullopt for anything else
    [[nodiscard]] static constexpr std::optional<Color> fromHex(std::string_view hex) noexcept {
        if(!hex.empty() && hex.front() == '#') hex.remove_prefix(1);
        if(hex.size() != 6) return std::nullopt;

        constexpr auto nibble = [](char c) -> int {
            if(c >= '0' && c <= '9') return c - '0';
            if(c >= 'a' && c <= 'f') return c - 'a' + 10;
            if(c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };

        std::array<Uint8, 3> channels{};
        for(size_t i = 0; i < channels.size(); i++) {
            const int hi = nibble(hex[i * 2]);
            const int lo = nibble(hex[i * 2 + 1]);
            if(hi < 0 || lo < 0) return std::nullopt;
            channels[i] = static_cast<Uint8>((hi << 4) | lo);
        }
        return Color{channels[0], channels[1], channels[2]};
    }

    [[nodiscard]] constexpr SDL_MessageBoxColor toNative() const noexcept { return {r, g, b}; }

    bool operator==(const Color &) const = default;
};

struct ColorScheme {
    std::array<Color, SDL_MESSAGEBOX_COLOR_COUNT> colors{};

    [[nodiscard]] constexpr Color &operator[](ColorType type) noexcept {
        return colors[static_cast<size_t>(sdl3bind::toNative(type))];
    }
    [[nodiscard]] constexpr const Color &operator[](ColorType type) const noexcept {
        return colors[static_cast<size_t>(sdl3bind::toNative(type))];
    }

    [[nodiscard]] SDL_MessageBoxColorScheme toNative() const noexcept;
};

struct BoxData {
    Flags flags;
    std::optional<video::WindowRef> parent;
    const char *title{""};
    const char *message{""};
    std::vector<Button> buttons;
    // nothing = system default
    std::optional<ColorScheme> color_scheme;
};

// blocks until a button was pressed, returns its value (-1 if the box was closed some other way)
[[nodiscard]] Result<int> show(const BoxData &data);

Result<void> showSimple(Flags flags, const char *title, const char *message,
                        std::optional<video::WindowRef> parent = std::nullopt) noexcept;

}  // namespace sdl3bind::message_box

#endif
