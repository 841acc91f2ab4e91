#pragma once
// Copyright (c) 2025, WH, All rights reserved.

#include "BaseEnvironment.h"

#include "fmt/format.h"

#include <cstdio>
#include <string_view>

#if defined(_MSC_VER) && !defined(_DEBUG)
// msvc always adds the full scope to __FUNCTION__
#define SDL3BIND_LOG_FUNC Logger::lastScope(__FUNCTION__)
#else
#define SDL3BIND_LOG_FUNC __FUNCTION__
#endif

#define SDL3BIND_LOG_AT(level__, str__, ...)                                                       \
    Logger::log(Logger::Source{__FILE__, __LINE__, SDL3BIND_LOG_FUNC}, Logger::Level::level__, \
                str__ __VA_OPT__(, ) __VA_ARGS__)

// main logging macros
#define debugLog(str__, ...) SDL3BIND_LOG_AT(info, str__ __VA_OPT__(, ) __VA_ARGS__)
#define warnLog(str__, ...) SDL3BIND_LOG_AT(warn, str__ __VA_OPT__(, ) __VA_ARGS__)
#define errorLog(str__, ...) SDL3BIND_LOG_AT(err, str__ __VA_OPT__(, ) __VA_ARGS__)

// log only if condition is true
#define logIf(cond__, str__, ...) (static_cast<bool>(cond__) ? debugLog(str__ __VA_OPT__(, ) __VA_ARGS__) : void(0))

// log only if cvar__.getBool() == true
#define logIfCV(cvar__, str__, ...) logIf(cv::cvar__.getBool(), str__ __VA_OPT__(, ) __VA_ARGS__)

namespace Logger {

// same values as spdlog::level::level_enum, spdlog itself is only included by Logging.cpp
enum class Level : int { trace = 0, debug = 1, info = 2, warn = 3, err = 4, critical = 5 };

struct Source {
    const char *file;
    int line;
    const char *func;
};

namespace _detail {
void log_int(const Source &src, Level lvl, std::string_view str) noexcept;
void logRaw_int(Level lvl, std::string_view str) noexcept;

extern bool g_initialized;

inline void fallback(std::string_view str) noexcept { printf("%.*s\n", static_cast<int>(str.length()), str.data()); }
}  // namespace _detail

// logFile: also write everything to this file (truncated on startup), nullptr/empty for stdout only
// until init() (and after shutdown()) everything goes straight to stdout
void init(const char *logFile = nullptr) noexcept;
void shutdown() noexcept;

void flush() noexcept;

// is stdout a terminal (util func.)
[[nodiscard]] bool isaTTY() noexcept;

// route SDL_Log* output through the raw logger instead of SDL's default stderr output
void installSdlLogOutput() noexcept;

template <typename... Args>
inline void log(const Source &src, Level lvl, fmt::format_string<Args...> fmt, Args &&...args) noexcept
    requires(sizeof...(Args) > 0)
{
    const std::string str = fmt::format(fmt, std::forward<Args>(args)...);
    if(likely(_detail::g_initialized))
        _detail::log_int(src, lvl, str);
    else
        _detail::fallback(str);
}

inline void log(const Source &src, Level lvl, std::string_view str) noexcept {
    if(likely(_detail::g_initialized))
        _detail::log_int(src, lvl, str);
    else
        _detail::fallback(str);
}

// raw logging without any context
template <typename... Args>
inline void logRaw(fmt::format_string<Args...> fmt, Args &&...args) noexcept
    requires(sizeof...(Args) > 0)
{
    const std::string str = fmt::format(fmt, std::forward<Args>(args)...);
    if(likely(_detail::g_initialized))
        _detail::logRaw_int(Level::info, str);
    else
        _detail::fallback(str);
}

inline void logRaw(std::string_view str) noexcept {
    if(likely(_detail::g_initialized))
        _detail::logRaw_int(Level::info, str);
    else
        _detail::fallback(str);
}

#if defined(_MSC_VER) && !defined(_DEBUG)
forceinline const char *lastScope(std::string_view str) {
    const auto pos = str.rfind("::");
    return pos != std::string_view::npos ? str.data() + pos + 2 : str.data();
}
#endif

}  // namespace Logger
