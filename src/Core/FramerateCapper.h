// Copyright (c) 2025, WH, All rights reserved.
#pragma once
#ifndef SDL3BIND_FRAMERATECAPPER_H
#define SDL3BIND_FRAMERATECAPPER_H

#include "Timing.h"

#include <algorithm>
#include <concepts>
#include <cstdint>

namespace sdl3bind {

// call delay() once per frame, at the end of it
// limited: sleeps until the next frame is due, unlimited: only measures
template <typename T = float>
    requires(std::floating_point<T>)
class FramerateCapper {
   public:
    struct Limited {
        uint32_t fps;
    };
    struct Unlimited {};

    constexpr explicit FramerateCapper(Limited limited) noexcept : m_targetFps(limited.fps) {}
    constexpr explicit FramerateCapper(Unlimited /**/) noexcept : m_targetFps(0) {}

    // 0 = unlimited
    constexpr void setLimit(uint32_t fps) noexcept {
        m_targetFps = fps;
        m_nextFrameNS = 0;
    }
    [[nodiscard]] constexpr bool isLimited() const noexcept { return m_targetFps > 0; }

    // returns the time since the previous delay() call, in seconds (0 on the first call)
    T delay() noexcept {
        uint64_t now = Timing::getTicksNS();

        if(m_targetFps > 0) {
            const uint64_t frameTimeNS = Timing::NS_PER_SECOND / m_targetFps;

            // if we're ahead of schedule, sleep until next frame
            // never sleep more than a single frame time
            if(m_nextFrameNS > now) {
                Timing::sleepNSPrecise(std::min(m_nextFrameNS - now, frameTimeNS));
                now = Timing::getTicksNS();
            } else {
                // behind schedule or exactly on time, reset to now
                m_nextFrameNS = now;
            }
            m_nextFrameNS += frameTimeNS;
        }

        const T dt = m_lastFrameNS == 0 ? T{0} : Timing::nsToSeconds<T>(now - m_lastFrameNS);
        m_lastFrameNS = now;

        m_frameNum++;
        if(dt > T{0}) {
            m_fps = T{1} / dt;
        }
        return dt;
    }

    [[nodiscard]] constexpr uint64_t frameNum() const noexcept { return m_frameNum; }

    // instantaneous rate from the last measured frame
    [[nodiscard]] constexpr T fps() const noexcept { return m_fps; }

   private:
    uint32_t m_targetFps;
    uint64_t m_nextFrameNS{0};
    uint64_t m_lastFrameNS{0};
    uint64_t m_frameNum{0};
    T m_fps{0};
};

}  // namespace sdl3bind

#endif
