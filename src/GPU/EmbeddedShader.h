// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_EMBEDDEDSHADER_H
#define SDL3BIND_EMBEDDEDSHADER_H

#include "GPU.h"

#include <optional>
#include <span>

namespace sdl3bind::gpu {

// compiled shader bytecode + what the device needs to know about it,
// what sdl3bind-shaderpipe writes into its generated headers
struct EmbeddedShader {
    std::span<const unsigned char> code;
    // std::nullopt for HLSL source text, which no device loads directly
    std::optional<ShaderFormat> format;
    // std::nullopt for compute shaders
    std::optional<ShaderStage> stage;
    Uint32 num_samplers{0};
    Uint32 num_storage_textures{0};
    Uint32 num_storage_buffers{0};
    Uint32 num_uniform_buffers{0};
    // compute only, num_storage_textures/num_storage_buffers are the read-only ones there
    Uint32 num_readwrite_storage_textures{0};
    Uint32 num_readwrite_storage_buffers{0};
    Uint32 threadcount_x{1};
    Uint32 threadcount_y{1};
    Uint32 threadcount_z{1};

    [[nodiscard]] constexpr bool isCompute() const noexcept { return !stage.has_value(); }
};

// invalid parameter error for compute shaders and HLSL text
[[nodiscard]] inline Result<ShaderCreateInfo> toShaderCreateInfo(const EmbeddedShader &shader) noexcept {
    if(!shader.stage) return std::unexpected(errors::invalidParamError("shader.stage").error());
    if(!shader.format) return std::unexpected(errors::invalidParamError("shader.format").error());

    return ShaderCreateInfo{
        .code = shader.code,
        .entrypoint = "main",
        .format = shader.format,
        .stage = *shader.stage,
        .num_samplers = shader.num_samplers,
        .num_storage_textures = shader.num_storage_textures,
        .num_storage_buffers = shader.num_storage_buffers,
        .num_uniform_buffers = shader.num_uniform_buffers,
    };
}

// invalid parameter error for graphics shaders and HLSL text
[[nodiscard]] inline Result<ComputePipelineCreateInfo> toComputePipelineCreateInfo(
    const EmbeddedShader &shader) noexcept {
    if(!shader.isCompute()) return std::unexpected(errors::invalidParamError("shader.stage").error());
    if(!shader.format) return std::unexpected(errors::invalidParamError("shader.format").error());

    return ComputePipelineCreateInfo{
        .code = shader.code,
        .entrypoint = "main",
        .format = shader.format,
        .num_samplers = shader.num_samplers,
        .num_readonly_storage_textures = shader.num_storage_textures,
        .num_readonly_storage_buffers = shader.num_storage_buffers,
        .num_readwrite_storage_textures = shader.num_readwrite_storage_textures,
        .num_readwrite_storage_buffers = shader.num_readwrite_storage_buffers,
        .num_uniform_buffers = shader.num_uniform_buffers,
        .threadcount_x = shader.threadcount_x,
        .threadcount_y = shader.threadcount_y,
        .threadcount_z = shader.threadcount_z,
    };
}

}  // namespace sdl3bind::gpu

#endif
