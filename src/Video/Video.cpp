// Copyright (c) 2026, WH, All rights reserved.
#include "Video.h"

#include "Window.h"

#include <SDL3/SDL_stdinc.h>

namespace sdl3bind::video {
namespace {  // static

Result<Display> displayFrom(SDL_DisplayID id) noexcept {
    auto ret = errors::wrapCall<SDL_DisplayID>(id, 0);
    if(!ret) return std::unexpected(ret.error());
    return Display{*ret};
}

Result<DisplayMode> modeFrom(const SDL_DisplayMode *mode) noexcept {
    auto ret = errors::wrapCallPtr(mode);
    if(!ret) return std::unexpected(ret.error());
    return DisplayMode::fromNative(**ret);
}

Result<Rect> rectFrom(bool ok, const SDL_Rect &rect) noexcept {
    if(auto ret = errors::wrapCallBool(ok); !ret) return std::unexpected(ret.error());
    return sdl3bind::fromNative(rect);
}

std::optional<std::string_view> optionalString(const char *str) noexcept {
    if(str == nullptr) return std::nullopt;
    return std::string_view{str};
}

}  // namespace

Result<std::vector<Display>> Display::getAll() {
    int count = 0;
    auto ids = errors::wrapCallPtr(SDL_GetDisplays(&count));
    if(!ids) return std::unexpected(ids.error());

    std::vector<Display> ret;
    ret.reserve(count);
    for(int i = 0; i < count; i++) {
        ret.emplace_back((*ids)[i]);
    }
    SDL_free(*ids);
    return ret;
}

Result<Display> Display::getPrimaryDisplay() noexcept { return displayFrom(SDL_GetPrimaryDisplay()); }

Result<Rect> Display::getBounds() const noexcept {
    SDL_Rect rect{};
    const bool ok = SDL_GetDisplayBounds(m_id, &rect);
    return rectFrom(ok, rect);
}

Result<Rect> Display::getUsableBounds() const noexcept {
    SDL_Rect rect{};
    const bool ok = SDL_GetDisplayUsableBounds(m_id, &rect);
    return rectFrom(ok, rect);
}

Result<std::string_view> Display::getName() const noexcept { return errors::wrapCallCString(SDL_GetDisplayName(m_id)); }

Result<float> Display::getContentScale() const noexcept {
    return errors::wrapCall(SDL_GetDisplayContentScale(m_id), 0.f);
}

Result<DisplayMode> Display::getCurrentMode() const noexcept { return modeFrom(SDL_GetCurrentDisplayMode(m_id)); }

Result<DisplayMode> Display::getDesktopMode() const noexcept { return modeFrom(SDL_GetDesktopDisplayMode(m_id)); }

Result<std::vector<DisplayMode>> Display::getFullscreenModes() const {
    int count = 0;
    auto modes = errors::wrapCallPtr(SDL_GetFullscreenDisplayModes(m_id, &count));
    if(!modes) return std::unexpected(modes.error());

    std::vector<DisplayMode> ret;
    ret.reserve(count);
    for(int i = 0; i < count; i++) {
        ret.push_back(DisplayMode::fromNative(*(*modes)[i]));
    }
    // one allocation, the array and the modes it points at
    SDL_free(static_cast<void *>(*modes));
    return ret;
}

Result<DisplayMode> Display::getClosestFullscreenMode(int w, int h, float refreshRate,
                                                      bool includeHighDensityModes) const noexcept {
    SDL_DisplayMode mode{};
    if(auto ret = errors::wrapCallBool(
           SDL_GetClosestFullscreenDisplayMode(m_id, w, h, refreshRate, includeHighDensityModes, &mode));
       !ret)
        return std::unexpected(ret.error());
    return DisplayMode::fromNative(mode);
}

std::optional<DisplayOrientation> Display::getCurrentOrientation() const noexcept {
    return fromNative<DisplayOrientation>(SDL_GetCurrentDisplayOrientation(m_id));
}

std::optional<DisplayOrientation> Display::getNaturalOrientation() const noexcept {
    return fromNative<DisplayOrientation>(SDL_GetNaturalDisplayOrientation(m_id));
}

Result<Display::Properties> Display::getProperties() const noexcept {
    auto id = errors::wrapCall<SDL_PropertiesID>(SDL_GetDisplayProperties(m_id), 0);
    if(!id) return std::unexpected(id.error());

    const SDL_PropertiesID props = *id;
    Properties ret;
    if(SDL_HasProperty(props, SDL_PROP_DISPLAY_HDR_ENABLED_BOOLEAN))
        ret.hdr_enabled = SDL_GetBooleanProperty(props, SDL_PROP_DISPLAY_HDR_ENABLED_BOOLEAN, false);
    if(SDL_HasProperty(props, SDL_PROP_DISPLAY_KMSDRM_PANEL_ORIENTATION_NUMBER))
        ret.kmsdrm_panel_orientation =
            SDL_GetNumberProperty(props, SDL_PROP_DISPLAY_KMSDRM_PANEL_ORIENTATION_NUMBER, 0);
    return ret;
}

DisplayMode DisplayMode::fromNative(const SDL_DisplayMode &mode) noexcept {
    return {
        .display = Display{mode.displayID},
        .format = sdl3bind::fromNative<PixelFormat>(mode.format),
        .w = mode.w,
        .h = mode.h,
        .pixel_density = mode.pixel_density,
        .refresh_rate = mode.refresh_rate,
        .refresh_rate_numerator = mode.refresh_rate_numerator,
        .refresh_rate_denominator = mode.refresh_rate_denominator,
    };
}

SDL_DisplayMode DisplayMode::toNative() const noexcept {
    SDL_DisplayMode ret{};
    ret.displayID = display.id();
    ret.format = sdl3bind::toNative(format);
    ret.w = w;
    ret.h = h;
    ret.pixel_density = pixel_density;
    ret.refresh_rate = refresh_rate;
    ret.refresh_rate_numerator = refresh_rate_numerator;
    ret.refresh_rate_denominator = refresh_rate_denominator;
    ret.internal = nullptr;
    return ret;
}

Result<void> disableScreenSaver() noexcept { return errors::wrapCallBool(SDL_DisableScreenSaver()); }
Result<void> enableScreenSaver() noexcept { return errors::wrapCallBool(SDL_EnableScreenSaver()); }
bool screenSaverEnabled() noexcept { return SDL_ScreenSaverEnabled(); }

std::optional<SystemTheme> getSystemTheme() noexcept { return fromNative<SystemTheme>(SDL_GetSystemTheme()); }

std::optional<std::string_view> getCurrentDriverName() noexcept {
    return optionalString(SDL_GetCurrentVideoDriver());
}

int getNumDrivers() noexcept { return SDL_GetNumVideoDrivers(); }

std::optional<std::string_view> getDriverName(int index) noexcept { return optionalString(SDL_GetVideoDriver(index)); }

Result<Display> getDisplayForPoint(Point point) noexcept {
    const SDL_Point native = toNative(point);
    return displayFrom(SDL_GetDisplayForPoint(&native));
}

Result<Display> getDisplayForRect(Rect rect) noexcept {
    const SDL_Rect native = toNative(rect);
    return displayFrom(SDL_GetDisplayForRect(&native));
}

Result<Display> getDisplayForWindow(const WindowRef &window) noexcept {
    return displayFrom(SDL_GetDisplayForWindow(window.get()));
}

namespace egl {

Result<Config> getCurrentConfig() noexcept { return errors::wrapCallPtr(SDL_EGL_GetCurrentConfig()); }

Result<Display> getCurrentDisplay() noexcept { return errors::wrapCallPtr(SDL_EGL_GetCurrentDisplay()); }

Result<SDL_FunctionPointer> getProcAddress(const char *proc) noexcept {
    return errors::wrapCall<SDL_FunctionPointer>(SDL_EGL_GetProcAddress(proc), nullptr);
}

Result<Surface> getWindowSurface(const WindowRef &window) noexcept {
    return errors::wrapCallPtr(SDL_EGL_GetWindowSurface(window.get()));
}

void setAttributeCallbacks(AttribArrayCallback platformAttribCallback, IntArrayCallback surfaceAttribCallback,
                           IntArrayCallback contextAttribCallback, void *userdata) noexcept {
    SDL_EGL_SetAttributeCallbacks(platformAttribCallback, surfaceAttribCallback, contextAttribCallback, userdata);
}

}  // namespace egl

}  // namespace sdl3bind::video
