// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_ERRORS_H
#define SDL3BIND_ERRORS_H

#include "BaseEnvironment.h"

#include <expected>
#include <optional>
#include <string_view>

namespace sdl3bind {

// the one failure kind the bindings surface: "the native call failed"
// the reason only lives in SDL's (thread-local, volatile) diagnostic string, see errors::get()
struct Error {
    bool operator==(const Error &) const = default;
};

template <typename T>
using Result = std::expected<T, Error>;

namespace errors {

// observer invoked on every failed wrapped call, with the diagnostic string at the time of failure
// (std::nullopt if SDL had nothing to say)
using Callback = void (*)(std::optional<std::string_view> err);

// per-thread, not shared: a thread only ever sees its own failures
void setCallback(Callback cb) noexcept;
[[nodiscard]] Callback getCallback() noexcept;

// installs an observer for the current thread for the lifetime of this object,
// restoring whatever was there before on destruction
class ScopedCallback {
    NOCOPY_NOMOVE(ScopedCallback)
   public:
    explicit ScopedCallback(Callback cb) noexcept;
    ~ScopedCallback();

   private:
    Callback m_previous;
};

// logs the diagnostic as a warning
void logCallback(std::optional<std::string_view> err);

namespace detail {
void notifyFailure() noexcept;
}

// the trampoline: sentinel result -> observer + uniform failure, anything else passes through untouched
template <typename T>
[[nodiscard]] inline Result<T> wrapCall(T result, T errorCondition) noexcept {
    if(likely(result != errorCondition)) return result;
    detail::notifyFailure();
    return std::unexpected(Error{});
}

[[nodiscard]] inline Result<void> wrapCallBool(bool result) noexcept {
    if(likely(result)) return {};
    detail::notifyFailure();
    return std::unexpected(Error{});
}

template <typename T>
[[nodiscard]] inline Result<T *> wrapCallPtr(T *result) noexcept {
    if(likely(result != nullptr)) return result;
    detail::notifyFailure();
    return std::unexpected(Error{});
}

template <typename T>
[[nodiscard]] inline Result<T *> wrapNull(T *value) noexcept {
    return wrapCallPtr(value);
}

[[nodiscard]] Result<std::string_view> wrapCallCString(const char *result) noexcept;

// diagnostic string access
void clear() noexcept;
[[nodiscard]] std::optional<std::string_view> get() noexcept;

// these always fail, after leaving the matching diagnostic behind
Result<void> set(std::string_view err) noexcept;
Result<void> invalidParamError(std::string_view paramName) noexcept;
Result<void> signalOutOfMemory() noexcept;
Result<void> unsupported() noexcept;

}  // namespace errors
}  // namespace sdl3bind

#endif
