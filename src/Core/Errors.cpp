// Copyright (c) 2026, WH, All rights reserved.
#include "Errors.h"

#include "Logging.h"

#include <SDL3/SDL_error.h>

namespace sdl3bind::errors {
namespace {  // static
thread_local Callback tl_callback{nullptr};
}  // namespace

void setCallback(Callback cb) noexcept { tl_callback = cb; }

Callback getCallback() noexcept { return tl_callback; }

ScopedCallback::ScopedCallback(Callback cb) noexcept : m_previous(tl_callback) { tl_callback = cb; }

ScopedCallback::~ScopedCallback() { tl_callback = m_previous; }

void logCallback(std::optional<std::string_view> err) {
    warnLog("SDL error: {}", err.value_or("(no diagnostic)"));
}

namespace detail {
void notifyFailure() noexcept {
    if(tl_callback) tl_callback(get());
}
}  // namespace detail

Result<std::string_view> wrapCallCString(const char *result) noexcept {
    if(likely(result != nullptr)) return std::string_view{result};
    detail::notifyFailure();
    return std::unexpected(Error{});
}

void clear() noexcept { SDL_ClearError(); }

std::optional<std::string_view> get() noexcept {
    const char *err = SDL_GetError();
    if(err == nullptr || *err == '\0') return std::nullopt;
    return std::string_view{err};
}

// the views aren't guaranteed to be terminated, so they're passed with an explicit length
Result<void> set(std::string_view err) noexcept {
    return wrapCallBool(SDL_SetError("%.*s", static_cast<int>(err.size()), err.data()));
}

Result<void> invalidParamError(std::string_view paramName) noexcept {
    // same text as SDL_InvalidParamError()
    return wrapCallBool(
        SDL_SetError("Parameter '%.*s' is invalid", static_cast<int>(paramName.size()), paramName.data()));
}

Result<void> signalOutOfMemory() noexcept { return wrapCallBool(SDL_OutOfMemory()); }

Result<void> unsupported() noexcept { return wrapCallBool(SDL_Unsupported()); }

}  // namespace sdl3bind::errors
