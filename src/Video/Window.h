// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_WINDOW_H
#define SDL3BIND_WINDOW_H

#include "Errors.h"
#include "Properties.h"
#include "Rect.h"
#include "Surface.h"
#include "Video.h"

#include <SDL3/SDL_video.h>

#include <optional>
#include <string>
#include <string_view>

namespace sdl3bind::video {

class Window;

// where a window goes on one axis
struct Position {
    enum class Kind : uint8_t { absolute, centered, undefined };

    Kind kind{Kind::undefined};
    int value{0};

    [[nodiscard]] static constexpr Position absolute(int v) noexcept { return {Kind::absolute, v}; }
    [[nodiscard]] static constexpr Position centered() noexcept { return {Kind::centered, 0}; }
    [[nodiscard]] static constexpr Position undefined() noexcept { return {Kind::undefined, 0}; }

    [[nodiscard]] constexpr int toNative() const noexcept {
        switch(kind) {
            case Kind::absolute:
                return value;
            case Kind::centered:
                return SDL_WINDOWPOS_CENTERED;
            case Kind::undefined:
                break;
        }
        return SDL_WINDOWPOS_UNDEFINED;
    }

    bool operator==(const Position &) const = default;
};

struct WindowSize {
    int w{0};
    int h{0};
    bool operator==(const WindowSize &) const = default;
};

// a window someone else owns, every window operation lives here
class WindowRef {
   public:
    constexpr explicit WindowRef(SDL_Window *window) noexcept : m_window(window) {}

    [[nodiscard]] constexpr SDL_Window *get() const noexcept { return m_window; }
    [[nodiscard]] constexpr explicit operator bool() const noexcept { return m_window != nullptr; }

    // the window that currently has a grab, if any
    [[nodiscard]] static std::optional<WindowRef> getGrabbed() noexcept;
    [[nodiscard]] static Result<WindowRef> fromID(SDL_WindowID id) noexcept;

    // tooltip or popup menu, offsets are relative to this window
    [[nodiscard]] Result<Window> createPopup(int offsetX, int offsetY, int w, int h, WindowFlags flags) const noexcept;

    [[nodiscard]] Result<SDL_WindowID> getID() const noexcept;
    [[nodiscard]] Result<properties::Borrowed> getProperties() const noexcept;

    [[nodiscard]] std::string_view getTitle() const noexcept;
    Result<void> setTitle(const char *title) const noexcept;

    [[nodiscard]] Result<WindowSize> getSize() const noexcept;
    Result<void> setSize(int w, int h) const noexcept;
    [[nodiscard]] Result<WindowSize> getSizeInPixels() const noexcept;

    [[nodiscard]] Result<Point> getPosition() const noexcept;
    Result<void> setPosition(Position x, Position y) const noexcept;

    [[nodiscard]] WindowFlags getFlags() const noexcept;

    Result<void> show() const noexcept;
    Result<void> hide() const noexcept;
    Result<void> raise() const noexcept;
    Result<void> maximize() const noexcept;
    Result<void> minimize() const noexcept;
    Result<void> restore() const noexcept;

    Result<void> setFullscreen(bool fullscreen) const noexcept;
    Result<void> setResizable(bool resizable) const noexcept;
    Result<void> setBordered(bool bordered) const noexcept;

    [[nodiscard]] Result<float> getDisplayScale() const noexcept;
    [[nodiscard]] Result<float> getPixelDensity() const noexcept;
    [[nodiscard]] Result<Display> getDisplay() const noexcept;

    // block until pending position/size/state changes went through
    Result<void> sync() const noexcept;

    Result<void> flash(FlashOperation operation) const noexcept;

    // software framebuffer, can't be mixed with a renderer or the gpu api on the same window
    [[nodiscard]] Result<SurfaceRef> getSurface() const noexcept;
    Result<void> updateSurface() const noexcept;
    Result<void> destroySurface() const noexcept;

    // confine the mouse to a rect, relative to the window (nothing = no confinement)
    Result<void> setMouseRect(std::optional<Rect> rect) const noexcept;
    [[nodiscard]] std::optional<Rect> getMouseRect() const noexcept;

    bool operator==(const WindowRef &) const = default;

   protected:
    SDL_Window *m_window;
};

class Window : public WindowRef {
    NOCOPY(Window)
   public:
    struct CreateProperties {
        std::optional<bool> always_on_top;
        std::optional<bool> borderless;
        std::optional<bool> external_graphics_context;
        std::optional<bool> focusable;
        std::optional<bool> fullscreen;
        std::optional<int> height;
        std::optional<bool> hidden;
        std::optional<bool> high_pixel_density;
        std::optional<bool> maximized;
        std::optional<bool> menu;
        std::optional<bool> metal;
        std::optional<bool> minimized;
        std::optional<bool> modal;
        std::optional<bool> mouse_grabbed;
        std::optional<bool> open_gl;
        std::optional<WindowRef> parent;
        std::optional<bool> resizable;
        std::optional<std::string> title;
        std::optional<bool> transparent;
        std::optional<bool> tooltip;
        std::optional<bool> utility;
        std::optional<bool> vulkan;
        std::optional<int> width;
        std::optional<Position> x;
        std::optional<Position> y;

        // platform specific
        std::optional<void *> cocoa_window;
        std::optional<void *> cocoa_view;
        std::optional<bool> wayland_surface_role_custom;
        std::optional<bool> wayland_create_egl_window;
        std::optional<void *> wayland_wl_surface;
        std::optional<void *> win32_hwnd;
        std::optional<void *> win32_pixel_format_hwnd;
        std::optional<Sint64> x11_window;

        // only the fields that are set end up in the group
        [[nodiscard]] Result<properties::Group> toProperties() const noexcept;
    };

    [[nodiscard]] static Result<Window> create(const char *title, int w, int h, WindowFlags flags) noexcept;
    [[nodiscard]] static Result<Window> createWithProperties(const CreateProperties &props) noexcept;

    // takes ownership
    explicit Window(SDL_Window *window) noexcept : WindowRef(window) {}

    Window(Window &&other) noexcept;
    Window &operator=(Window &&other) noexcept;
    ~Window();

    [[nodiscard]] SDL_Window *release() noexcept;
};

}  // namespace sdl3bind::video

#endif
