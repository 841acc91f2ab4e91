// Copyright (c) 2025, WH, All rights reserved.
// platform detection and the handful of macros every translation unit wants
#pragma once

#include "config.h"
#include "noinclude.h"

#if defined(_WIN32) || defined(_WIN64)
#define SDL3BIND_PLATFORM_WINDOWS
#elif defined(__APPLE__)
#define SDL3BIND_PLATFORM_MACOS
#elif defined(__linux__)
#define SDL3BIND_PLATFORM_LINUX
#elif defined(__EMSCRIPTEN__)
#define SDL3BIND_PLATFORM_WASM
#endif

#if defined(_DEBUG) || !defined(NDEBUG)
#define SDL3BIND_DEBUG_BUILD
#endif
