// Copyright (c) 2026, WH, All rights reserved.
#include "Surface.h"

#include <SDL3/SDL_iostream.h>

#include <utility>

namespace sdl3bind {
namespace {  // static

Result<Surface> adopt(SDL_Surface *surface) noexcept {
    auto ret = errors::wrapCallPtr(surface);
    if(!ret) return std::unexpected(ret.error());
    return Surface{*ret};
}

// optional rect -> pointer to a native copy (or nullptr)
struct OptRect {
    explicit OptRect(const std::optional<Rect> &rect) noexcept : m_has(rect.has_value()) {
        if(m_has) m_native = toNative(*rect);
    }
    [[nodiscard]] const SDL_Rect *ptr() const noexcept { return m_has ? &m_native : nullptr; }

   private:
    SDL_Rect m_native{};
    bool m_has;
};

}  // namespace

Result<void> SurfaceRef::lock() const noexcept { return errors::wrapCallBool(SDL_LockSurface(m_surface)); }

void SurfaceRef::unlock() const noexcept { SDL_UnlockSurface(m_surface); }

Result<void> SurfaceRef::fillRect(std::optional<Rect> area, Uint32 color) const noexcept {
    const OptRect rect{area};
    return errors::wrapCallBool(SDL_FillSurfaceRect(m_surface, rect.ptr(), color));
}

Result<void> SurfaceRef::clear(FColor color) const noexcept {
    return errors::wrapCallBool(SDL_ClearSurface(m_surface, color.r, color.g, color.b, color.a));
}

Uint32 SurfaceRef::mapRgb(Uint8 r, Uint8 g, Uint8 b) const noexcept { return SDL_MapSurfaceRGB(m_surface, r, g, b); }

Uint32 SurfaceRef::mapRgba(Uint8 r, Uint8 g, Uint8 b, Uint8 a) const noexcept {
    return SDL_MapSurfaceRGBA(m_surface, r, g, b, a);
}

Result<Surface> SurfaceRef::convertFormat(PixelFormat format) const noexcept {
    return adopt(SDL_ConvertSurface(m_surface, toNative(format)));
}

Result<Surface> SurfaceRef::duplicate() const noexcept { return adopt(SDL_DuplicateSurface(m_surface)); }

Result<void> SurfaceRef::saveBmp(const char *path) const noexcept {
    return errors::wrapCallBool(SDL_SaveBMP(m_surface, path));
}

Result<Surface> Surface::create(int width, int height, PixelFormat format) noexcept {
    return adopt(SDL_CreateSurface(width, height, toNative(format)));
}

Result<Surface> Surface::loadBmp(const char *path) noexcept { return adopt(SDL_LoadBMP(path)); }

Result<Surface> Surface::loadBmpFromMemory(std::span<const std::byte> data) noexcept {
    auto stream = errors::wrapCallPtr(SDL_IOFromConstMem(data.data(), data.size()));
    if(!stream) return std::unexpected(stream.error());
    // closeio = true, the stream is gone after this either way
    return adopt(SDL_LoadBMP_IO(*stream, true));
}

Surface::Surface(Surface &&other) noexcept : SurfaceRef(std::exchange(other.m_surface, nullptr)) {}

Surface &Surface::operator=(Surface &&other) noexcept {
    if(this != &other) {
        if(m_surface) SDL_DestroySurface(m_surface);
        m_surface = std::exchange(other.m_surface, nullptr);
    }
    return *this;
}

Surface::~Surface() {
    if(m_surface) SDL_DestroySurface(m_surface);
}

SDL_Surface *Surface::release() noexcept { return std::exchange(m_surface, nullptr); }

Result<void> blit(SurfaceRef src, std::optional<Rect> srcRect, SurfaceRef dst, std::optional<Rect> dstRect) noexcept {
    const OptRect s{srcRect};
    const OptRect d{dstRect};
    return errors::wrapCallBool(SDL_BlitSurface(src.get(), s.ptr(), dst.get(), d.ptr()));
}

Result<void> blitScaled(SurfaceRef src, std::optional<Rect> srcRect, SurfaceRef dst, std::optional<Rect> dstRect,
                        SDL_ScaleMode scaleMode) noexcept {
    const OptRect s{srcRect};
    const OptRect d{dstRect};
    return errors::wrapCallBool(SDL_BlitSurfaceScaled(src.get(), s.ptr(), dst.get(), d.ptr(), scaleMode));
}

}  // namespace sdl3bind
