// Copyright (c) 2026, WH, All rights reserved.
#include "MessageBox.h"

namespace sdl3bind::message_box {

SDL_MessageBoxColorScheme ColorScheme::toNative() const noexcept {
    SDL_MessageBoxColorScheme ret{};
    for(size_t i = 0; i < colors.size(); i++) {
        ret.colors[i] = colors[i].toNative();
    }
    return ret;
}

Result<int> show(const BoxData &data) {
    std::vector<SDL_MessageBoxButtonData> buttons;
    buttons.reserve(data.buttons.size());
    for(const auto &button : data.buttons) {
        buttons.push_back({
            .flags = button.flags.toNative(),
            .buttonID = button.value,
            .text = button.text,
        });
    }

    SDL_MessageBoxColorScheme scheme{};
    if(data.color_scheme) scheme = data.color_scheme->toNative();

    const SDL_MessageBoxData native{
        .flags = data.flags.toNative(),
        .window = data.parent ? data.parent->get() : nullptr,
        .title = data.title,
        .message = data.message,
        .numbuttons = static_cast<int>(buttons.size()),
        .buttons = buttons.data(),
        .colorScheme = data.color_scheme ? &scheme : nullptr,
    };

    int pressed = -1;
    if(auto ok = errors::wrapCallBool(SDL_ShowMessageBox(&native, &pressed)); !ok) return std::unexpected(ok.error());
    return pressed;
}

Result<void> showSimple(Flags flags, const char *title, const char *message,
                        std::optional<video::WindowRef> parent) noexcept {
    return errors::wrapCallBool(
        SDL_ShowSimpleMessageBox(flags.toNative(), title, message, parent ? parent->get() : nullptr));
}

}  // namespace sdl3bind::message_box
