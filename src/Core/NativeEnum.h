// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_NATIVEENUM_H
#define SDL3BIND_NATIVEENUM_H

#include <optional>

// enum <-> native enum conversions
// NativeEnum<E> is specialized for every bound enum by the generated *Api.h headers, it provides:
//   native_type, has_invalid, values (every host enumerator), name,
//   fromNative(native_type) -> E, or std::optional<E> when the native enum has an INVALID sentinel
//   toNative(E) / toNative(std::optional<E>) -> native_type (absent maps back to the sentinel)

namespace sdl3bind {

template <typename E>
struct NativeEnum;

template <typename E>
concept BoundEnum = requires { typename NativeEnum<E>::native_type; };

// e.g. fromNative<gpu::BlendFactor>(SDL_GPU_BLENDFACTOR_ONE)
template <BoundEnum E>
[[nodiscard]] constexpr auto fromNative(typename NativeEnum<E>::native_type value) noexcept {
    return NativeEnum<E>::fromNative(value);
}

template <BoundEnum E>
[[nodiscard]] constexpr auto toNative(E value) noexcept {
    return NativeEnum<E>::toNative(value);
}

template <BoundEnum E>
    requires(NativeEnum<E>::has_invalid)
[[nodiscard]] constexpr auto toNative(std::optional<E> value) noexcept {
    return NativeEnum<E>::toNative(value);
}

}  // namespace sdl3bind

#endif
