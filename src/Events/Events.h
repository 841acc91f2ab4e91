// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_EVENTS_H
#define SDL3BIND_EVENTS_H

#include "Errors.h"

#include <SDL3/SDL_events.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace sdl3bind::events {

struct Quit {
    Uint64 timestamp{0};
    bool operator==(const Quit &) const = default;
};

// the OS is about to kill the app (mobile)
struct Terminating {
    Uint64 timestamp{0};
    bool operator==(const Terminating &) const = default;
};

struct Keyboard {
    Uint64 timestamp{0};
    SDL_WindowID window_id{0};
    SDL_KeyboardID which{0};
    SDL_Scancode scancode{SDL_SCANCODE_UNKNOWN};
    SDL_Keycode key{SDLK_UNKNOWN};
    SDL_Keymod mod{SDL_KMOD_NONE};
    Uint16 raw{0};
    bool repeat{false};
    bool operator==(const Keyboard &) const = default;
};
struct KeyDown : Keyboard {};
struct KeyUp : Keyboard {};

// the text is copied out of the event queue
struct TextInput {
    Uint64 timestamp{0};
    SDL_WindowID window_id{0};
    std::string text;
    bool operator==(const TextInput &) const = default;
};

struct MouseMotion {
    Uint64 timestamp{0};
    SDL_WindowID window_id{0};
    SDL_MouseID which{0};
    SDL_MouseButtonFlags state{0};
    float x{0.f};
    float y{0.f};
    float xrel{0.f};
    float yrel{0.f};
    bool operator==(const MouseMotion &) const = default;
};

struct MouseButton {
    Uint64 timestamp{0};
    SDL_WindowID window_id{0};
    SDL_MouseID which{0};
    Uint8 button{0};
    Uint8 clicks{0};
    float x{0.f};
    float y{0.f};
    bool operator==(const MouseButton &) const = default;
};
struct MouseButtonDown : MouseButton {};
struct MouseButtonUp : MouseButton {};

struct MouseWheel {
    Uint64 timestamp{0};
    SDL_WindowID window_id{0};
    SDL_MouseID which{0};
    float x{0.f};
    float y{0.f};
    SDL_MouseWheelDirection direction{SDL_MOUSEWHEEL_NORMAL};
    float mouse_x{0.f};
    float mouse_y{0.f};
    bool operator==(const MouseWheel &) const = default;
};

// SDL_EVENT_WINDOW_FIRST..SDL_EVENT_WINDOW_LAST, type says which one
struct WindowEvent {
    Uint32 type{SDL_EVENT_WINDOW_SHOWN};
    Uint64 timestamp{0};
    SDL_WindowID window_id{0};
    Sint32 data1{0};
    Sint32 data2{0};
    bool operator==(const WindowEvent &) const = default;
};

// SDL_EVENT_DISPLAY_FIRST..SDL_EVENT_DISPLAY_LAST
struct DisplayEvent {
    Uint32 type{SDL_EVENT_DISPLAY_ORIENTATION};
    Uint64 timestamp{0};
    SDL_DisplayID display_id{0};
    Sint32 data1{0};
    Sint32 data2{0};
    bool operator==(const DisplayEvent &) const = default;
};

// app-defined, type is one of the values handed out by registerEvents()
struct User {
    Uint32 type{SDL_EVENT_USER};
    Uint64 timestamp{0};
    SDL_WindowID window_id{0};
    Sint32 code{0};
    void *data1{nullptr};
    void *data2{nullptr};
    bool operator==(const User &) const = default;
};

// everything not translated above, kept verbatim
struct Unknown {
    SDL_Event raw{};
    bool operator==(const Unknown &other) const noexcept;
};

using Event = std::variant<Quit, Terminating, KeyDown, KeyUp, TextInput, MouseMotion, MouseButtonDown, MouseButtonUp,
                           MouseWheel, WindowEvent, DisplayEvent, User, Unknown>;

[[nodiscard]] Event fromNative(const SDL_Event &event);

// the native TextInput event points into the host event's string, it must outlive the result
[[nodiscard]] SDL_Event toNative(const Event &event) noexcept;

[[nodiscard]] Uint32 typeOf(const Event &event) noexcept;

// std::nullopt when the queue is empty
[[nodiscard]] std::optional<Event> poll();

// blocks until there is an event
[[nodiscard]] Result<Event> wait();

// std::nullopt on timeout (or error)
[[nodiscard]] std::optional<Event> waitTimeout(int32_t timeoutMS);

void pump() noexcept;

// text input events can't be pushed, their string wouldn't outlive the call
Result<void> push(const Event &event) noexcept;

void flush(Uint32 type) noexcept;
void flush(Uint32 minType, Uint32 maxType) noexcept;

[[nodiscard]] bool has(Uint32 type) noexcept;

// reserves numEvents consecutive user event types, returns the first one
[[nodiscard]] Result<Uint32> registerEvents(int numEvents) noexcept;

}  // namespace sdl3bind::events

#endif
