// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SHADERPIPELINE_H
#define SHADERPIPELINE_H

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// build-time shader processing: optional spirv-opt pass, shadercross cross-compilation and reflection,
// and embedding of the result into a C++ header as an sdl3bind::gpu::EmbeddedShader
namespace ShaderPipe {

enum class Stage : uint8_t { vertex, fragment, compute };
enum class SourceFormat : uint8_t { spirv, hlsl };
enum class TargetFormat : uint8_t { spirv, dxbc, dxil, msl, hlsl };

// "foo.vert.hlsl" -> vertex, "foo.frag.spv" -> fragment, everything else is a compute shader
[[nodiscard]] Stage inferStage(std::string_view path);
// ".spv" -> SPIR-V, anything else is treated as HLSL source
[[nodiscard]] SourceFormat inferSourceFormat(std::string_view path);

// case-insensitive
[[nodiscard]] std::optional<TargetFormat> parseTargetFormat(std::string_view str);
[[nodiscard]] std::optional<SourceFormat> parseSourceFormat(std::string_view str);

// the names shadercross expects on its command line
[[nodiscard]] std::string_view stageName(Stage stage);
[[nodiscard]] std::string_view sourceName(SourceFormat format);
[[nodiscard]] std::string_view destName(TargetFormat format);
// file extension of the compiled output, e.g. "dxil"
[[nodiscard]] std::string_view extensionOf(TargetFormat format);

// SPIR-V to SPIR-V needs no cross-compilation
[[nodiscard]] bool needsCrossCompile(SourceFormat source, TargetFormat target);

// resource counts the device needs at shader creation
// for compute shaders storage_textures/storage_buffers are the read-only ones
struct Reflection {
    uint32_t samplers{0};
    uint32_t storage_textures{0};
    uint32_t storage_buffers{0};
    uint32_t uniform_buffers{0};

    // compute only
    uint32_t readwrite_storage_textures{0};
    uint32_t readwrite_storage_buffers{0};
    uint32_t threadcount_x{1};
    uint32_t threadcount_y{1};
    uint32_t threadcount_z{1};

    bool operator==(const Reflection &) const = default;
};

// shadercross --dest JSON output, missing counts are 0 and missing thread counts 1
[[nodiscard]] std::expected<Reflection, std::string> parseReflection(std::string_view json);

struct Options {
    std::string input;
    // C++ identifier of the embedded shader, also the base name of every file written
    std::string name;
    std::string outputDir{"."};
    TargetFormat format{TargetFormat::spirv};
    // std::nullopt = infer from the input's extension
    std::optional<SourceFormat> source;
    bool debug{false};
    std::string shadercross{"shadercross"};
    std::string spirvOpt{"spirv-opt"};
    bool reflect{true};
};

// the individual commands, argv style
[[nodiscard]] std::vector<std::string> spirvFixCommand(const Options &opts, const std::string &in,
                                                      const std::string &out);
[[nodiscard]] std::vector<std::string> spirvOptimizeCommand(const Options &opts, const std::string &in,
                                                           const std::string &out);
[[nodiscard]] std::vector<std::string> crossCompileCommand(const Options &opts, const std::string &in,
                                                          SourceFormat source, Stage stage, const std::string &out);
[[nodiscard]] std::vector<std::string> reflectCommand(const Options &opts, const std::string &in, SourceFormat source,
                                                     Stage stage, const std::string &out);

[[nodiscard]] bool isValidIdentifier(std::string_view name);

// the embeddable header, text formats (msl, hlsl) get a terminating zero that isn't part of the code span
[[nodiscard]] std::string generateEmbedHeader(std::string_view name, std::string_view sourcePath,
                                              std::span<const unsigned char> code, TargetFormat format, Stage stage,
                                              const Reflection &reflection);

// runs every step, returns the path of the written header
[[nodiscard]] std::expected<std::string, std::string> run(const Options &opts);

}  // namespace ShaderPipe

#endif
