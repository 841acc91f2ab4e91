// Copyright (c) 2026, WH, All rights reserved.
#include "Window.h"

#include <utility>

namespace sdl3bind::video {
namespace {  // static

Result<Window> adopt(SDL_Window *window) noexcept {
    auto ret = errors::wrapCallPtr(window);
    if(!ret) return std::unexpected(ret.error());
    return Window{*ret};
}

}  // namespace

std::optional<WindowRef> WindowRef::getGrabbed() noexcept {
    SDL_Window *window = SDL_GetGrabbedWindow();
    if(window == nullptr) return std::nullopt;
    return WindowRef{window};
}

Result<WindowRef> WindowRef::fromID(SDL_WindowID id) noexcept {
    auto ret = errors::wrapCallPtr(SDL_GetWindowFromID(id));
    if(!ret) return std::unexpected(ret.error());
    return WindowRef{*ret};
}

Result<Window> WindowRef::createPopup(int offsetX, int offsetY, int w, int h, WindowFlags flags) const noexcept {
    return adopt(SDL_CreatePopupWindow(m_window, offsetX, offsetY, w, h, flags.toNative()));
}

Result<SDL_WindowID> WindowRef::getID() const noexcept {
    return errors::wrapCall<SDL_WindowID>(SDL_GetWindowID(m_window), 0);
}

Result<properties::Borrowed> WindowRef::getProperties() const noexcept {
    auto id = errors::wrapCall<SDL_PropertiesID>(SDL_GetWindowProperties(m_window), 0);
    if(!id) return std::unexpected(id.error());
    return properties::Borrowed{*id};
}

std::string_view WindowRef::getTitle() const noexcept { return SDL_GetWindowTitle(m_window); }

Result<void> WindowRef::setTitle(const char *title) const noexcept {
    return errors::wrapCallBool(SDL_SetWindowTitle(m_window, title));
}

Result<WindowSize> WindowRef::getSize() const noexcept {
    WindowSize ret;
    if(auto ok = errors::wrapCallBool(SDL_GetWindowSize(m_window, &ret.w, &ret.h)); !ok)
        return std::unexpected(ok.error());
    return ret;
}

Result<void> WindowRef::setSize(int w, int h) const noexcept {
    return errors::wrapCallBool(SDL_SetWindowSize(m_window, w, h));
}

Result<WindowSize> WindowRef::getSizeInPixels() const noexcept {
    WindowSize ret;
    if(auto ok = errors::wrapCallBool(SDL_GetWindowSizeInPixels(m_window, &ret.w, &ret.h)); !ok)
        return std::unexpected(ok.error());
    return ret;
}

Result<Point> WindowRef::getPosition() const noexcept {
    Point ret;
    if(auto ok = errors::wrapCallBool(SDL_GetWindowPosition(m_window, &ret.x, &ret.y)); !ok)
        return std::unexpected(ok.error());
    return ret;
}

Result<void> WindowRef::setPosition(Position x, Position y) const noexcept {
    return errors::wrapCallBool(SDL_SetWindowPosition(m_window, x.toNative(), y.toNative()));
}

WindowFlags WindowRef::getFlags() const noexcept { return WindowFlags::fromNative(SDL_GetWindowFlags(m_window)); }

Result<void> WindowRef::show() const noexcept { return errors::wrapCallBool(SDL_ShowWindow(m_window)); }
Result<void> WindowRef::hide() const noexcept { return errors::wrapCallBool(SDL_HideWindow(m_window)); }
Result<void> WindowRef::raise() const noexcept { return errors::wrapCallBool(SDL_RaiseWindow(m_window)); }
Result<void> WindowRef::maximize() const noexcept { return errors::wrapCallBool(SDL_MaximizeWindow(m_window)); }
Result<void> WindowRef::minimize() const noexcept { return errors::wrapCallBool(SDL_MinimizeWindow(m_window)); }
Result<void> WindowRef::restore() const noexcept { return errors::wrapCallBool(SDL_RestoreWindow(m_window)); }

Result<void> WindowRef::setFullscreen(bool fullscreen) const noexcept {
    return errors::wrapCallBool(SDL_SetWindowFullscreen(m_window, fullscreen));
}

Result<void> WindowRef::setResizable(bool resizable) const noexcept {
    return errors::wrapCallBool(SDL_SetWindowResizable(m_window, resizable));
}

Result<void> WindowRef::setBordered(bool bordered) const noexcept {
    return errors::wrapCallBool(SDL_SetWindowBordered(m_window, bordered));
}

Result<float> WindowRef::getDisplayScale() const noexcept {
    return errors::wrapCall(SDL_GetWindowDisplayScale(m_window), 0.f);
}

Result<float> WindowRef::getPixelDensity() const noexcept {
    return errors::wrapCall(SDL_GetWindowPixelDensity(m_window), 0.f);
}

Result<Display> WindowRef::getDisplay() const noexcept { return getDisplayForWindow(*this); }

Result<void> WindowRef::sync() const noexcept { return errors::wrapCallBool(SDL_SyncWindow(m_window)); }

Result<void> WindowRef::flash(FlashOperation operation) const noexcept {
    return errors::wrapCallBool(SDL_FlashWindow(m_window, toNative(operation)));
}

Result<SurfaceRef> WindowRef::getSurface() const noexcept {
    auto ret = errors::wrapCallPtr(SDL_GetWindowSurface(m_window));
    if(!ret) return std::unexpected(ret.error());
    return SurfaceRef{*ret};
}

Result<void> WindowRef::updateSurface() const noexcept {
    return errors::wrapCallBool(SDL_UpdateWindowSurface(m_window));
}

Result<void> WindowRef::destroySurface() const noexcept {
    return errors::wrapCallBool(SDL_DestroyWindowSurface(m_window));
}

Result<void> WindowRef::setMouseRect(std::optional<Rect> rect) const noexcept {
    if(!rect) return errors::wrapCallBool(SDL_SetWindowMouseRect(m_window, nullptr));
    const SDL_Rect native = sdl3bind::toNative(*rect);
    return errors::wrapCallBool(SDL_SetWindowMouseRect(m_window, &native));
}

std::optional<Rect> WindowRef::getMouseRect() const noexcept {
    const SDL_Rect *rect = SDL_GetWindowMouseRect(m_window);
    if(rect == nullptr) return std::nullopt;
    return sdl3bind::fromNative(*rect);
}

Result<properties::Group> Window::CreateProperties::toProperties() const noexcept {
    auto group = properties::Group::create();
    if(!group) return group;

    Result<void> status;
    const auto put = [&](const char *name, const properties::Value &value) {
        if(status) status = group->set(name, value);
    };
    const auto putBool = [&](const char *name, const std::optional<bool> &value) {
        if(value) put(name, *value);
    };
    const auto putPtr = [&](const char *name, const std::optional<void *> &value) {
        if(value) put(name, *value);
    };
    const auto putNumber = [&](const char *name, Sint64 value) { put(name, value); };

    putBool(SDL_PROP_WINDOW_CREATE_ALWAYS_ON_TOP_BOOLEAN, always_on_top);
    putBool(SDL_PROP_WINDOW_CREATE_BORDERLESS_BOOLEAN, borderless);
    putBool(SDL_PROP_WINDOW_CREATE_EXTERNAL_GRAPHICS_CONTEXT_BOOLEAN, external_graphics_context);
    putBool(SDL_PROP_WINDOW_CREATE_FOCUSABLE_BOOLEAN, focusable);
    putBool(SDL_PROP_WINDOW_CREATE_FULLSCREEN_BOOLEAN, fullscreen);
    if(height) putNumber(SDL_PROP_WINDOW_CREATE_HEIGHT_NUMBER, *height);
    putBool(SDL_PROP_WINDOW_CREATE_HIDDEN_BOOLEAN, hidden);
    putBool(SDL_PROP_WINDOW_CREATE_HIGH_PIXEL_DENSITY_BOOLEAN, high_pixel_density);
    putBool(SDL_PROP_WINDOW_CREATE_MAXIMIZED_BOOLEAN, maximized);
    putBool(SDL_PROP_WINDOW_CREATE_MENU_BOOLEAN, menu);
    putBool(SDL_PROP_WINDOW_CREATE_METAL_BOOLEAN, metal);
    putBool(SDL_PROP_WINDOW_CREATE_MINIMIZED_BOOLEAN, minimized);
    putBool(SDL_PROP_WINDOW_CREATE_MODAL_BOOLEAN, modal);
    putBool(SDL_PROP_WINDOW_CREATE_MOUSE_GRABBED_BOOLEAN, mouse_grabbed);
    putBool(SDL_PROP_WINDOW_CREATE_OPENGL_BOOLEAN, open_gl);
    if(parent) put(SDL_PROP_WINDOW_CREATE_PARENT_POINTER, static_cast<void *>(parent->get()));
    putBool(SDL_PROP_WINDOW_CREATE_RESIZABLE_BOOLEAN, resizable);
    if(title) put(SDL_PROP_WINDOW_CREATE_TITLE_STRING, *title);
    putBool(SDL_PROP_WINDOW_CREATE_TRANSPARENT_BOOLEAN, transparent);
    putBool(SDL_PROP_WINDOW_CREATE_TOOLTIP_BOOLEAN, tooltip);
    putBool(SDL_PROP_WINDOW_CREATE_UTILITY_BOOLEAN, utility);
    putBool(SDL_PROP_WINDOW_CREATE_VULKAN_BOOLEAN, vulkan);
    if(width) putNumber(SDL_PROP_WINDOW_CREATE_WIDTH_NUMBER, *width);
    if(x) putNumber(SDL_PROP_WINDOW_CREATE_X_NUMBER, x->toNative());
    if(y) putNumber(SDL_PROP_WINDOW_CREATE_Y_NUMBER, y->toNative());

    putPtr(SDL_PROP_WINDOW_CREATE_COCOA_WINDOW_POINTER, cocoa_window);
    putPtr(SDL_PROP_WINDOW_CREATE_COCOA_VIEW_POINTER, cocoa_view);
    putBool(SDL_PROP_WINDOW_CREATE_WAYLAND_SURFACE_ROLE_CUSTOM_BOOLEAN, wayland_surface_role_custom);
    putBool(SDL_PROP_WINDOW_CREATE_WAYLAND_CREATE_EGL_WINDOW_BOOLEAN, wayland_create_egl_window);
    putPtr(SDL_PROP_WINDOW_CREATE_WAYLAND_WL_SURFACE_POINTER, wayland_wl_surface);
    putPtr(SDL_PROP_WINDOW_CREATE_WIN32_HWND_POINTER, win32_hwnd);
    putPtr(SDL_PROP_WINDOW_CREATE_WIN32_PIXEL_FORMAT_HWND_POINTER, win32_pixel_format_hwnd);
    if(x11_window) putNumber(SDL_PROP_WINDOW_CREATE_X11_WINDOW_NUMBER, *x11_window);

    if(!status) return std::unexpected(status.error());
    return group;
}

Result<Window> Window::create(const char *title, int w, int h, WindowFlags flags) noexcept {
    return adopt(SDL_CreateWindow(title, w, h, flags.toNative()));
}

Result<Window> Window::createWithProperties(const CreateProperties &props) noexcept {
    auto group = props.toProperties();
    if(!group) return std::unexpected(group.error());
    return adopt(SDL_CreateWindowWithProperties(group->id()));
}

Window::Window(Window &&other) noexcept : WindowRef(std::exchange(other.m_window, nullptr)) {}

Window &Window::operator=(Window &&other) noexcept {
    if(this != &other) {
        if(m_window) SDL_DestroyWindow(m_window);
        m_window = std::exchange(other.m_window, nullptr);
    }
    return *this;
}

Window::~Window() {
    if(m_window) SDL_DestroyWindow(m_window);
}

SDL_Window *Window::release() noexcept { return std::exchange(m_window, nullptr); }

}  // namespace sdl3bind::video
