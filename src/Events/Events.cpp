// Copyright (c) 2026, WH, All rights reserved.
#include "Events.h"

#include <cstring>
#include <type_traits>

namespace sdl3bind::events {
namespace {  // static

Keyboard keyboardFromNative(const SDL_KeyboardEvent &key) {
    return {.timestamp = key.timestamp,
            .window_id = key.windowID,
            .which = key.which,
            .scancode = key.scancode,
            .key = key.key,
            .mod = key.mod,
            .raw = key.raw,
            .repeat = key.repeat};
}

MouseButton mouseButtonFromNative(const SDL_MouseButtonEvent &button) {
    return {.timestamp = button.timestamp,
            .window_id = button.windowID,
            .which = button.which,
            .button = button.button,
            .clicks = button.clicks,
            .x = button.x,
            .y = button.y};
}

void keyboardToNative(const Keyboard &key, bool down, SDL_Event &out) {
    out.key.type = down ? SDL_EVENT_KEY_DOWN : SDL_EVENT_KEY_UP;
    out.key.timestamp = key.timestamp;
    out.key.windowID = key.window_id;
    out.key.which = key.which;
    out.key.scancode = key.scancode;
    out.key.key = key.key;
    out.key.mod = key.mod;
    out.key.raw = key.raw;
    out.key.down = down;
    out.key.repeat = key.repeat;
}

void mouseButtonToNative(const MouseButton &button, bool down, SDL_Event &out) {
    out.button.type = down ? SDL_EVENT_MOUSE_BUTTON_DOWN : SDL_EVENT_MOUSE_BUTTON_UP;
    out.button.timestamp = button.timestamp;
    out.button.windowID = button.window_id;
    out.button.which = button.which;
    out.button.button = button.button;
    out.button.down = down;
    out.button.clicks = button.clicks;
    out.button.x = button.x;
    out.button.y = button.y;
}

}  // namespace

bool Unknown::operator==(const Unknown &other) const noexcept {
    return std::memcmp(&this->raw, &other.raw, sizeof(SDL_Event)) == 0;
}

Event fromNative(const SDL_Event &event) {
    const Uint32 type = event.type;

    if(type >= SDL_EVENT_WINDOW_FIRST && type <= SDL_EVENT_WINDOW_LAST) {
        return WindowEvent{.type = type,
                           .timestamp = event.window.timestamp,
                           .window_id = event.window.windowID,
                           .data1 = event.window.data1,
                           .data2 = event.window.data2};
    }
    if(type >= SDL_EVENT_DISPLAY_FIRST && type <= SDL_EVENT_DISPLAY_LAST) {
        return DisplayEvent{.type = type,
                            .timestamp = event.display.timestamp,
                            .display_id = event.display.displayID,
                            .data1 = event.display.data1,
                            .data2 = event.display.data2};
    }
    if(type >= SDL_EVENT_USER && type <= SDL_EVENT_LAST) {
        return User{.type = type,
                    .timestamp = event.user.timestamp,
                    .window_id = event.user.windowID,
                    .code = event.user.code,
                    .data1 = event.user.data1,
                    .data2 = event.user.data2};
    }

    switch(type) {
        case SDL_EVENT_QUIT:
            return Quit{.timestamp = event.quit.timestamp};
        case SDL_EVENT_TERMINATING:
            return Terminating{.timestamp = event.common.timestamp};
        case SDL_EVENT_KEY_DOWN:
            return KeyDown{keyboardFromNative(event.key)};
        case SDL_EVENT_KEY_UP:
            return KeyUp{keyboardFromNative(event.key)};
        case SDL_EVENT_TEXT_INPUT:
            return TextInput{.timestamp = event.text.timestamp,
                             .window_id = event.text.windowID,
                             .text = event.text.text != nullptr ? event.text.text : ""};
        case SDL_EVENT_MOUSE_MOTION:
            return MouseMotion{.timestamp = event.motion.timestamp,
                               .window_id = event.motion.windowID,
                               .which = event.motion.which,
                               .state = event.motion.state,
                               .x = event.motion.x,
                               .y = event.motion.y,
                               .xrel = event.motion.xrel,
                               .yrel = event.motion.yrel};
        case SDL_EVENT_MOUSE_BUTTON_DOWN:
            return MouseButtonDown{mouseButtonFromNative(event.button)};
        case SDL_EVENT_MOUSE_BUTTON_UP:
            return MouseButtonUp{mouseButtonFromNative(event.button)};
        case SDL_EVENT_MOUSE_WHEEL:
            return MouseWheel{.timestamp = event.wheel.timestamp,
                              .window_id = event.wheel.windowID,
                              .which = event.wheel.which,
                              .x = event.wheel.x,
                              .y = event.wheel.y,
                              .direction = event.wheel.direction,
                              .mouse_x = event.wheel.mouse_x,
                              .mouse_y = event.wheel.mouse_y};
        default:
            return Unknown{.raw = event};
    }
}

SDL_Event toNative(const Event &event) noexcept {
    SDL_Event out{};
    std::visit(
        [&](const auto &e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr(std::is_same_v<T, Quit>) {
                out.quit.type = SDL_EVENT_QUIT;
                out.quit.timestamp = e.timestamp;
            } else if constexpr(std::is_same_v<T, Terminating>) {
                out.common.type = SDL_EVENT_TERMINATING;
                out.common.timestamp = e.timestamp;
            } else if constexpr(std::is_same_v<T, KeyDown>) {
                keyboardToNative(e, true, out);
            } else if constexpr(std::is_same_v<T, KeyUp>) {
                keyboardToNative(e, false, out);
            } else if constexpr(std::is_same_v<T, TextInput>) {
                out.text.type = SDL_EVENT_TEXT_INPUT;
                out.text.timestamp = e.timestamp;
                out.text.windowID = e.window_id;
                out.text.text = e.text.c_str();
            } else if constexpr(std::is_same_v<T, MouseMotion>) {
                out.motion.type = SDL_EVENT_MOUSE_MOTION;
                out.motion.timestamp = e.timestamp;
                out.motion.windowID = e.window_id;
                out.motion.which = e.which;
                out.motion.state = e.state;
                out.motion.x = e.x;
                out.motion.y = e.y;
                out.motion.xrel = e.xrel;
                out.motion.yrel = e.yrel;
            } else if constexpr(std::is_same_v<T, MouseButtonDown>) {
                mouseButtonToNative(e, true, out);
            } else if constexpr(std::is_same_v<T, MouseButtonUp>) {
                mouseButtonToNative(e, false, out);
            } else if constexpr(std::is_same_v<T, MouseWheel>) {
                out.wheel.type = SDL_EVENT_MOUSE_WHEEL;
                out.wheel.timestamp = e.timestamp;
                out.wheel.windowID = e.window_id;
                out.wheel.which = e.which;
                out.wheel.x = e.x;
                out.wheel.y = e.y;
                out.wheel.direction = e.direction;
                out.wheel.mouse_x = e.mouse_x;
                out.wheel.mouse_y = e.mouse_y;
            } else if constexpr(std::is_same_v<T, WindowEvent>) {
                out.window.type = static_cast<SDL_EventType>(e.type);
                out.window.timestamp = e.timestamp;
                out.window.windowID = e.window_id;
                out.window.data1 = e.data1;
                out.window.data2 = e.data2;
            } else if constexpr(std::is_same_v<T, DisplayEvent>) {
                out.display.type = static_cast<SDL_EventType>(e.type);
                out.display.timestamp = e.timestamp;
                out.display.displayID = e.display_id;
                out.display.data1 = e.data1;
                out.display.data2 = e.data2;
            } else if constexpr(std::is_same_v<T, User>) {
                out.user.type = e.type;
                out.user.timestamp = e.timestamp;
                out.user.windowID = e.window_id;
                out.user.code = e.code;
                out.user.data1 = e.data1;
                out.user.data2 = e.data2;
            } else {
                out = e.raw;
            }
        },
        event);
    return out;
}

Uint32 typeOf(const Event &event) noexcept { return toNative(event).type; }

std::optional<Event> poll() {
    SDL_Event event;
    if(!SDL_PollEvent(&event)) return std::nullopt;
    return fromNative(event);
}

Result<Event> wait() {
    SDL_Event event;
    if(auto res = errors::wrapCallBool(SDL_WaitEvent(&event)); !res) return std::unexpected(res.error());
    return fromNative(event);
}

std::optional<Event> waitTimeout(int32_t timeoutMS) {
    SDL_Event event;
    if(!SDL_WaitEventTimeout(&event, timeoutMS)) return std::nullopt;
    return fromNative(event);
}

void pump() noexcept { SDL_PumpEvents(); }

Result<void> push(const Event &event) noexcept {
    if(std::holds_alternative<TextInput>(event)) return errors::unsupported();
    SDL_Event native = toNative(event);
    return errors::wrapCallBool(SDL_PushEvent(&native));
}

void flush(Uint32 type) noexcept { SDL_FlushEvent(type); }

void flush(Uint32 minType, Uint32 maxType) noexcept { SDL_FlushEvents(minType, maxType); }

bool has(Uint32 type) noexcept { return SDL_HasEvent(type); }

Result<Uint32> registerEvents(int numEvents) noexcept {
    return errors::wrapCall(SDL_RegisterEvents(numEvents), Uint32{0});
}

}  // namespace sdl3bind::events
