// Copyright (c) 2015, PG & 2025, WH, All rights reserved.
// tick counter and sleeping, both on top of SDL's timer
#pragma once
#ifndef SDL3BIND_TIMING_H
#define SDL3BIND_TIMING_H

#include "BaseEnvironment.h"

#include <SDL3/SDL_timer.h>

#include <concepts>
#include <cstdint>
#include <thread>

namespace Timing {
constexpr uint64_t NS_PER_SECOND = 1'000'000'000;

[[nodiscard]] inline uint64_t getTicksNS() noexcept { return SDL_GetTicksNS(); }

// busy-waits the last stretch, a 0 just gives up the rest of the time slice
inline void sleepNSPrecise(uint64_t ns) noexcept {
    if(ns > 0)
        SDL_DelayPrecise(ns);
    else
        std::this_thread::yield();
}

template <std::floating_point T = double>
[[nodiscard]] constexpr T nsToSeconds(uint64_t ns) noexcept {
    return static_cast<T>(ns) / static_cast<T>(NS_PER_SECOND);
}

}  // namespace Timing

#endif
