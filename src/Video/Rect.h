// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_RECT_H
#define SDL3BIND_RECT_H

#include "Errors.h"
#include "RectApi.h"

#include <optional>

namespace sdl3bind {

[[nodiscard]] inline bool isEmpty(const Rect &rect) noexcept { return rect.w <= 0 || rect.h <= 0; }
[[nodiscard]] inline bool isEmpty(const FRect &rect) noexcept { return rect.w <= 0.f || rect.h <= 0.f; }

[[nodiscard]] inline bool hasIntersection(const Rect &a, const Rect &b) noexcept {
    const SDL_Rect na = toNative(a), nb = toNative(b);
    return SDL_HasRectIntersection(&na, &nb);
}

[[nodiscard]] inline bool hasIntersection(const FRect &a, const FRect &b) noexcept {
    const SDL_FRect na = toNative(a), nb = toNative(b);
    return SDL_HasRectIntersectionFloat(&na, &nb);
}

// std::nullopt if they don't overlap
[[nodiscard]] inline std::optional<Rect> getIntersection(const Rect &a, const Rect &b) noexcept {
    const SDL_Rect na = toNative(a), nb = toNative(b);
    SDL_Rect out;
    if(!SDL_GetRectIntersection(&na, &nb, &out)) return std::nullopt;
    return fromNative(out);
}

[[nodiscard]] inline std::optional<FRect> getIntersection(const FRect &a, const FRect &b) noexcept {
    const SDL_FRect na = toNative(a), nb = toNative(b);
    SDL_FRect out;
    if(!SDL_GetRectIntersectionFloat(&na, &nb, &out)) return std::nullopt;
    return fromNative(out);
}

[[nodiscard]] inline Result<Rect> getUnion(const Rect &a, const Rect &b) noexcept {
    const SDL_Rect na = toNative(a), nb = toNative(b);
    SDL_Rect out{};
    if(auto ok = errors::wrapCallBool(SDL_GetRectUnion(&na, &nb, &out)); !ok) return std::unexpected(ok.error());
    return fromNative(out);
}

[[nodiscard]] inline bool contains(const Rect &rect, const Point &point) noexcept {
    const SDL_Rect nr = toNative(rect);
    const SDL_Point np = toNative(point);
    return SDL_PointInRect(&np, &nr);
}

}  // namespace sdl3bind

#endif
