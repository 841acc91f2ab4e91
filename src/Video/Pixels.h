// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_PIXELS_H
#define SDL3BIND_PIXELS_H

#include "Errors.h"
#include "PixelsApi.h"

#include <string_view>

namespace sdl3bind {

// "SDL_PIXELFORMAT_UNKNOWN" for anything SDL doesn't know
[[nodiscard]] std::string_view getPixelFormatName(std::optional<PixelFormat> format) noexcept;

[[nodiscard]] inline int bitsPerPixel(PixelFormat format) noexcept { return SDL_BITSPERPIXEL(toNative(format)); }
[[nodiscard]] inline int bytesPerPixel(PixelFormat format) noexcept { return SDL_BYTESPERPIXEL(toNative(format)); }
[[nodiscard]] inline bool hasAlpha(PixelFormat format) noexcept { return SDL_ISPIXELFORMAT_ALPHA(toNative(format)); }

// std::nullopt if no format matches
[[nodiscard]] std::optional<PixelFormat> getPixelFormatForMasks(int bpp, Uint32 rmask, Uint32 gmask, Uint32 bmask,
                                                                Uint32 amask) noexcept;

}  // namespace sdl3bind

#endif
