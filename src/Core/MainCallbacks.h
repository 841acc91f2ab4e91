// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_MAINCALLBACKS_H
#define SDL3BIND_MAINCALLBACKS_H

#include "Errors.h"
#include "Events.h"
#include "InitApi.h"

// only the declarations, the entry point stays the app's own main()
#ifndef SDL_MAIN_NOIMPL
#define SDL_MAIN_NOIMPL
#endif
#include <SDL3/SDL_main.h>

#include <span>
#include <type_traits>

// typed adapter over SDL_EnterAppMainCallbacks
//
//   Result<AppResult> init(State *&state, std::span<char *> args);
//   Result<AppResult> iterate(State *state);
//   Result<AppResult> event(State *state, const events::Event &event);
//   void quit(State *state, AppResult result);
//
// the first three may also return a plain AppResult, a failed Result turns into AppResult::failure
// state is whatever init() left in it (nullptr if it never set it), quit() is always called with it

namespace sdl3bind {

namespace detail {
template <typename R>
constexpr SDL_AppResult toAppResult(R &&result) noexcept {
    if constexpr(std::is_same_v<std::decay_t<R>, AppResult>) {
        return toNative(result);
    } else {
        return result ? toNative(*result) : toNative(AppResult::failure);
    }
}
}  // namespace detail

inline void setMainReady() noexcept { SDL_SetMainReady(); }

template <typename State, auto Init, auto Iterate, auto OnEvent, auto Quit>
int enterAppMainCallbacks(int argc, char *argv[]) {
    struct Trampolines {
        static SDL_AppResult SDLCALL init(void **appstate, int count, char *args[]) {
            State *state = nullptr;
            const SDL_AppResult ret =
                detail::toAppResult(Init(state, std::span<char *>(args, static_cast<size_t>(count))));
            *appstate = state;
            return ret;
        }
        static SDL_AppResult SDLCALL iterate(void *appstate) {
            return detail::toAppResult(Iterate(static_cast<State *>(appstate)));
        }
        static SDL_AppResult SDLCALL event(void *appstate, SDL_Event *native) {
            return detail::toAppResult(OnEvent(static_cast<State *>(appstate), events::fromNative(*native)));
        }
        static void SDLCALL quit(void *appstate, SDL_AppResult result) {
            Quit(static_cast<State *>(appstate), fromNative<AppResult>(result));
        }
    };

    setMainReady();
    return SDL_EnterAppMainCallbacks(argc, argv, &Trampolines::init, &Trampolines::iterate, &Trampolines::event,
                                     &Trampolines::quit);
}

}  // namespace sdl3bind

#endif
