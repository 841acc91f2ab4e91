// Copyright (c) 2026, WH, All rights reserved.
// the smallest possible app on top of the main callbacks: one window, one solid color
#include "Examples.h"

#include "ConVar.h"
#include "FramerateCapper.h"
#include "Init.h"
#include "Logging.h"
#include "MainCallbacks.h"
#include "Window.h"

#include <memory>
#include <variant>

namespace Examples {
namespace {  // static

using namespace sdl3bind;

constexpr InitFlags INIT_FLAGS{.video = true};

struct State {
    FramerateCapper<float> capper;
    video::Window window;
};

Result<AppResult> init(State *&state, std::span<char *> args) {
    if(auto ok = sdl3bind::init(INIT_FLAGS); !ok) return std::unexpected(ok.error());
    logIf(args.size() > 1, "ignoring {} extra argument(s)", args.size() - 1);

    auto window = video::Window::create("Hello SDL3", cv::window_width.getInt(), cv::window_height.getInt(), {});
    if(!window) return std::unexpected(window.error());

    const auto fps = static_cast<uint32_t>(cv::fps_max.getInt());
    auto capper = fps > 0 ? FramerateCapper<float>{FramerateCapper<float>::Limited{fps}}
                          : FramerateCapper<float>{FramerateCapper<float>::Unlimited{}};

    state = new State{.capper = capper, .window = std::move(*window)};
    return AppResult::run;
}

Result<AppResult> iterate(State *state) {
    auto surface = state->window.getSurface();
    if(!surface) return std::unexpected(surface.error());

    if(auto ok = surface->fillRect(std::nullopt, surface->mapRgb(128, 30, 255)); !ok)
        return std::unexpected(ok.error());
    if(auto ok = state->window.updateSurface(); !ok) return std::unexpected(ok.error());

    state->capper.delay();
    return AppResult::run;
}

AppResult event(State * /*state*/, const events::Event &event) {
    if(std::holds_alternative<events::Quit>(event) || std::holds_alternative<events::Terminating>(event))
        return AppResult::success;
    if(const auto *key = std::get_if<events::KeyDown>(&event); key && key->key == SDLK_ESCAPE)
        return AppResult::success;
    return AppResult::run;
}

void quit(State *state, AppResult result) {
    logIf(result == AppResult::failure, "exiting after a failure");

    // init() might have failed before there was anything to clean up
    if(state) {
        logIf(state->capper.frameNum() > 0, "rendered {} frames", state->capper.frameNum());
        delete state;
    }
    sdl3bind::quit(INIT_FLAGS);
}

}  // namespace

int runCallbacks(int argc, char *argv[]) {
    return sdl3bind::enterAppMainCallbacks<State, init, iterate, event, quit>(argc, argv);
}

}  // namespace Examples
