#ifndef CONVARDEFS_H
#define CONVARDEFS_H

// ########################################################################################################################
// # this first part is just to allow for proper code completion when editing this file
// ########################################################################################################################

// NOLINTBEGIN(misc-definitions-in-headers)

#if !defined(CONVAR_H) && \
    (defined(_CLANGD) || defined(Q_CREATOR_RUN) || defined(__INTELLISENSE__) || defined(__CDT_PARSER__))
#define DEFINE_CONVARS
#include "ConVar.h"
#endif

// ########################################################################################################################
// # actual declarations/definitions below
// ########################################################################################################################

#include "config.h"

#define _CV(name) name

// defined and included at the end of ConVar.cpp
#if defined(DEFINE_CONVARS)
#undef CONVAR
#define CONVAR(name, ...) ConVar _CV(name)(__VA_ARGS__)
#else
#define CONVAR(name, ...) extern ConVar _CV(name)
#endif

class ConVar;
namespace cv {

// logging
CONVAR(log_file, "log_file", ""sv, CLIENT, "also write the log to this file (truncated on startup)");

// GPU
CONVAR(gpu_debug, "gpu_debug", static_cast<bool>(SDL3BIND_GPU_DEBUG), CLIENT,
       "create GPU devices with the backend's validation layers enabled");
CONVAR(shader_debug, "shader_debug", static_cast<bool>(SDL3BIND_SHADER_DEBUG), CLIENT,
       "shaders were built with debug information (informational, set by the build)");
CONVAR(shader_format, "shader_format", std::string_view{SDL3BIND_SHADER_FORMAT}, CLIENT,
       "bytecode format the embedded shaders were compiled to (spirv, dxbc, dxil, msl, hlsl)");

// examples
CONVAR(example, "example", "callbacks"sv, CLIENT, "which example app to run");
CONVAR(fps_max, "fps_max", 60, CLIENT, "framerate cap for the examples (0 = unlimited)");
CONVAR(window_width, "window_width", 640, CLIENT);
CONVAR(window_height, "window_height", 480, CLIENT);
CONVAR(font_path, "font_path", ""sv, CLIENT, "TTF/OTF font file for the ttf example");

// NOLINTEND(misc-definitions-in-headers)

}  // namespace cv

#endif
