// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef BINDINGGENERATOR_H
#define BINDINGGENERATOR_H

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace YAML {
class Node;
}

// turns a YAML description of a slice of the SDL API (enums, flag sets, plain structs)
// into a C++ header with the host-side types and their native conversions
namespace BindGen {

struct EnumValue {
    std::string name;    // host enumerator, e.g. "one_minus_src_alpha"
    std::string native;  // native constant, e.g. "SDL_GPU_BLENDFACTOR_ONE_MINUS_SRC_ALPHA"
};

struct EnumDesc {
    std::string name;
    std::string native;
    std::optional<std::string> underlying;  // only needed when the native type is a typedef, not a C enum
    std::optional<std::string> invalid;     // sentinel constant, maps to std::nullopt on the host side
    std::string doc;
    std::vector<EnumValue> values;
};

struct FlagsDesc {
    std::string name;
    std::string native;
    std::string doc;
    std::vector<EnumValue> bits;
};

struct FieldDesc {
    std::string name;
    std::string type;
    std::string native;
};

struct StructDesc {
    std::string name;
    std::string native;
    std::string doc;
    std::vector<FieldDesc> fields;
};

struct ApiDesc {
    std::string module;  // output guard/identity, e.g. "GPUApi"
    std::string ns;      // e.g. "sdl3bind::gpu"
    std::vector<std::string> systemIncludes;
    std::vector<std::string> includes;
    std::vector<EnumDesc> enums;
    std::vector<FlagsDesc> flags;
    std::vector<StructDesc> structs;
};

// yaml-cpp exceptions are caught and turned into the error string too
[[nodiscard]] std::expected<ApiDesc, std::string> parseApi(const YAML::Node &root);
[[nodiscard]] std::expected<ApiDesc, std::string> parseApiString(std::string_view yaml);
[[nodiscard]] std::expected<ApiDesc, std::string> parseApiFile(const std::string &path);

[[nodiscard]] std::string generateHeader(const ApiDesc &api);

// checks what the C++ compiler would otherwise complain about much later (duplicate names, empty enums...)
[[nodiscard]] std::optional<std::string> validate(const ApiDesc &api);

}  // namespace BindGen

#endif
