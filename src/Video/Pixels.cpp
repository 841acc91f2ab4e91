// Copyright (c) 2026, WH, All rights reserved.
#include "Pixels.h"

namespace sdl3bind {

std::string_view getPixelFormatName(std::optional<PixelFormat> format) noexcept {
    return SDL_GetPixelFormatName(toNative(format));
}

std::optional<PixelFormat> getPixelFormatForMasks(int bpp, Uint32 rmask, Uint32 gmask, Uint32 bmask,
                                                  Uint32 amask) noexcept {
    return fromNative<PixelFormat>(SDL_GetPixelFormatForMasks(bpp, rmask, gmask, bmask, amask));
}

}  // namespace sdl3bind
