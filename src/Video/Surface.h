// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_SURFACE_H
#define SDL3BIND_SURFACE_H

#include "Errors.h"
#include "Pixels.h"
#include "Rect.h"

#include <SDL3/SDL_surface.h>

#include <cstddef>
#include <optional>
#include <span>

namespace sdl3bind {

class Surface;

// a surface someone else owns (e.g. a window's surface)
class SurfaceRef {
   public:
    constexpr explicit SurfaceRef(SDL_Surface *surface) noexcept : m_surface(surface) {}

    [[nodiscard]] constexpr SDL_Surface *get() const noexcept { return m_surface; }
    [[nodiscard]] constexpr explicit operator bool() const noexcept { return m_surface != nullptr; }

    [[nodiscard]] int getWidth() const noexcept { return m_surface->w; }
    [[nodiscard]] int getHeight() const noexcept { return m_surface->h; }
    [[nodiscard]] int getPitch() const noexcept { return m_surface->pitch; }
    [[nodiscard]] std::optional<PixelFormat> getFormat() const noexcept {
        return fromNative<PixelFormat>(m_surface->format);
    }
    // only valid while locked, if mustLock()
    [[nodiscard]] void *getPixels() const noexcept { return m_surface->pixels; }

    [[nodiscard]] bool mustLock() const noexcept { return SDL_MUSTLOCK(m_surface); }
    Result<void> lock() const noexcept;
    void unlock() const noexcept;

    // nothing = the whole surface
    Result<void> fillRect(std::optional<Rect> area, Uint32 color) const noexcept;
    Result<void> clear(FColor color) const noexcept;

    [[nodiscard]] Uint32 mapRgb(Uint8 r, Uint8 g, Uint8 b) const noexcept;
    [[nodiscard]] Uint32 mapRgba(Uint8 r, Uint8 g, Uint8 b, Uint8 a) const noexcept;

    [[nodiscard]] Result<Surface> convertFormat(PixelFormat format) const noexcept;
    [[nodiscard]] Result<Surface> duplicate() const noexcept;

    Result<void> saveBmp(const char *path) const noexcept;

   protected:
    SDL_Surface *m_surface;
};

class Surface : public SurfaceRef {
    NOCOPY(Surface)
   public:
    [[nodiscard]] static Result<Surface> create(int width, int height, PixelFormat format) noexcept;
    [[nodiscard]] static Result<Surface> loadBmp(const char *path) noexcept;
    [[nodiscard]] static Result<Surface> loadBmpFromMemory(std::span<const std::byte> data) noexcept;

    // takes ownership
    explicit Surface(SDL_Surface *surface) noexcept : SurfaceRef(surface) {}

    Surface(Surface &&other) noexcept;
    Surface &operator=(Surface &&other) noexcept;
    ~Surface();

    [[nodiscard]] SDL_Surface *release() noexcept;
};

// copy (and convert) srcRect of src onto dst at dstRect's position, nothing = the whole surface
Result<void> blit(SurfaceRef src, std::optional<Rect> srcRect, SurfaceRef dst, std::optional<Rect> dstRect) noexcept;

// same, but scaled to fill dstRect
Result<void> blitScaled(SurfaceRef src, std::optional<Rect> srcRect, SurfaceRef dst, std::optional<Rect> dstRect,
                        SDL_ScaleMode scaleMode = SDL_SCALEMODE_LINEAR) noexcept;

}  // namespace sdl3bind

#endif
