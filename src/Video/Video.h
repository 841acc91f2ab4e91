// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_VIDEO_H
#define SDL3BIND_VIDEO_H

#include "Errors.h"
#include "PixelsApi.h"
#include "Properties.h"
#include "RectApi.h"
#include "VideoApi.h"

#include <SDL3/SDL_video.h>

#include <optional>
#include <string_view>
#include <vector>

namespace sdl3bind::video {

class WindowRef;
struct DisplayMode;

// a connected display, just an id (0 is never valid)
class Display {
   public:
    // hdr/panel state, only what the current driver knows about
    struct Properties {
        std::optional<bool> hdr_enabled;
        std::optional<Sint64> kmsdrm_panel_orientation;
    };

    constexpr explicit Display(SDL_DisplayID id) noexcept : m_id(id) {}

    [[nodiscard]] static Result<std::vector<Display>> getAll();
    [[nodiscard]] static Result<Display> getPrimaryDisplay() noexcept;

    [[nodiscard]] constexpr SDL_DisplayID id() const noexcept { return m_id; }

    [[nodiscard]] Result<Rect> getBounds() const noexcept;
    // bounds minus taskbars/docks/menus
    [[nodiscard]] Result<Rect> getUsableBounds() const noexcept;
    [[nodiscard]] Result<std::string_view> getName() const noexcept;
    [[nodiscard]] Result<float> getContentScale() const noexcept;

    [[nodiscard]] Result<DisplayMode> getCurrentMode() const noexcept;
    [[nodiscard]] Result<DisplayMode> getDesktopMode() const noexcept;
    [[nodiscard]] Result<std::vector<DisplayMode>> getFullscreenModes() const;
    [[nodiscard]] Result<DisplayMode> getClosestFullscreenMode(int w, int h, float refreshRate,
                                                               bool includeHighDensityModes) const noexcept;

    [[nodiscard]] std::optional<DisplayOrientation> getCurrentOrientation() const noexcept;
    [[nodiscard]] std::optional<DisplayOrientation> getNaturalOrientation() const noexcept;

    [[nodiscard]] Result<Properties> getProperties() const noexcept;

    bool operator==(const Display &) const = default;

   private:
    SDL_DisplayID m_id;
};

struct DisplayMode {
    Display display{0};
    std::optional<PixelFormat> format;
    int w{0};
    int h{0};
    // scale from screen coordinates to pixels
    float pixel_density{0.f};
    // 0 if unspecified
    float refresh_rate{0.f};
    int refresh_rate_numerator{0};
    int refresh_rate_denominator{0};

    [[nodiscard]] static DisplayMode fromNative(const SDL_DisplayMode &mode) noexcept;
    [[nodiscard]] SDL_DisplayMode toNative() const noexcept;

    bool operator==(const DisplayMode &) const = default;
};

Result<void> disableScreenSaver() noexcept;
Result<void> enableScreenSaver() noexcept;
[[nodiscard]] bool screenSaverEnabled() noexcept;

[[nodiscard]] std::optional<SystemTheme> getSystemTheme() noexcept;

// std::nullopt before the video subsystem is up
[[nodiscard]] std::optional<std::string_view> getCurrentDriverName() noexcept;
[[nodiscard]] int getNumDrivers() noexcept;
[[nodiscard]] std::optional<std::string_view> getDriverName(int index) noexcept;

[[nodiscard]] Result<Display> getDisplayForPoint(Point point) noexcept;
[[nodiscard]] Result<Display> getDisplayForRect(Rect rect) noexcept;
[[nodiscard]] Result<Display> getDisplayForWindow(const WindowRef &window) noexcept;

namespace egl {

using Config = SDL_EGLConfig;
using Display = SDL_EGLDisplay;
using Surface = SDL_EGLSurface;
using AttribArrayCallback = SDL_EGLAttribArrayCallback;
using IntArrayCallback = SDL_EGLIntArrayCallback;

// all of these need an EGL-backed window to exist
[[nodiscard]] Result<Config> getCurrentConfig() noexcept;
[[nodiscard]] Result<Display> getCurrentDisplay() noexcept;
[[nodiscard]] Result<SDL_FunctionPointer> getProcAddress(const char *proc) noexcept;
[[nodiscard]] Result<Surface> getWindowSurface(const WindowRef &window) noexcept;

// must be called before the window is created, nullptr callbacks keep SDL's defaults
void setAttributeCallbacks(AttribArrayCallback platformAttribCallback, IntArrayCallback surfaceAttribCallback,
                           IntArrayCallback contextAttribCallback, void *userdata) noexcept;

}  // namespace egl

}  // namespace sdl3bind::video

#endif
