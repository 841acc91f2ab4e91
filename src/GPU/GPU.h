// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_GPU_H
#define SDL3BIND_GPU_H

#include "Errors.h"
#include "GPUApi.h"
#include "Handle.h"
#include "RectApi.h"

#include <SDL3/SDL_gpu.h>
#include <SDL3/SDL_surface.h>

#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace sdl3bind::gpu {

// released through the device that created them, which has to outlive them
template <typename T, auto Fn>
using DeviceOwned = ParentOwned<SDL_GPUDevice, T, Fn>;

using Buffer = DeviceOwned<SDL_GPUBuffer, SDL_ReleaseGPUBuffer>;
using Texture = DeviceOwned<SDL_GPUTexture, SDL_ReleaseGPUTexture>;
using Sampler = DeviceOwned<SDL_GPUSampler, SDL_ReleaseGPUSampler>;
using Shader = DeviceOwned<SDL_GPUShader, SDL_ReleaseGPUShader>;
using GraphicsPipeline = DeviceOwned<SDL_GPUGraphicsPipeline, SDL_ReleaseGPUGraphicsPipeline>;
using ComputePipeline = DeviceOwned<SDL_GPUComputePipeline, SDL_ReleaseGPUComputePipeline>;
using TransferBuffer = DeviceOwned<SDL_GPUTransferBuffer, SDL_ReleaseGPUTransferBuffer>;
using Fence = DeviceOwned<SDL_GPUFence, SDL_ReleaseGPUFence>;

//
// create infos
// these get converted (not reinterpreted), so they're free to use std containers and optionals
//

struct BufferCreateInfo {
    BufferUsageFlags usage;
    Uint32 size{0};
    // debug name, shows up in graphics debuggers
    const char *name{nullptr};
};

struct TextureCreateInfo {
    TextureType type{TextureType::two_dimensional};
    std::optional<TextureFormat> format;
    TextureUsageFlags usage;
    Uint32 width{0};
    Uint32 height{0};
    Uint32 layer_count_or_depth{1};
    Uint32 num_levels{1};
    SampleCount sample_count{SampleCount::no_multisampling};
    const char *name{nullptr};
};

struct SamplerCreateInfo {
    Filter min_filter{Filter::nearest};
    Filter mag_filter{Filter::nearest};
    SamplerMipmapMode mipmap_mode{SamplerMipmapMode::nearest};
    SamplerAddressMode address_mode_u{SamplerAddressMode::repeat};
    SamplerAddressMode address_mode_v{SamplerAddressMode::repeat};
    SamplerAddressMode address_mode_w{SamplerAddressMode::repeat};
    float mip_lod_bias{0.f};
    // only used if set
    std::optional<float> max_anisotropy;
    // only used if set
    std::optional<CompareOp> compare_op;
    float min_lod{0.f};
    float max_lod{1000.f};
};

struct ShaderCreateInfo {
    std::span<const unsigned char> code;
    const char *entrypoint{"main"};
    std::optional<ShaderFormat> format;
    ShaderStage stage{ShaderStage::vertex};
    Uint32 num_samplers{0};
    Uint32 num_storage_textures{0};
    Uint32 num_storage_buffers{0};
    Uint32 num_uniform_buffers{0};
};

struct TransferBufferCreateInfo {
    TransferBufferUsage usage{TransferBufferUsage::upload};
    Uint32 size{0};
};

struct VertexInputState {
    std::vector<VertexBufferDescription> vertex_buffer_descriptions;
    std::vector<VertexAttribute> vertex_attributes;
};

struct RasterizerState {
    FillMode fill_mode{FillMode::fill};
    CullMode cull_mode{CullMode::none};
    FrontFace front_face{FrontFace::counter_clockwise};
    float depth_bias_constant_factor{0.f};
    float depth_bias_clamp{0.f};
    float depth_bias_slope_factor{0.f};
    bool enable_depth_bias{false};
    bool enable_depth_clip{false};
};

struct MultisampleState {
    SampleCount sample_count{SampleCount::no_multisampling};
};

struct DepthStencilState {
    std::optional<CompareOp> compare_op;
    StencilOpState back_stencil_state;
    StencilOpState front_stencil_state;
    Uint8 compare_mask{0};
    Uint8 write_mask{0};
    bool enable_depth_test{false};
    bool enable_depth_write{false};
    bool enable_stencil_test{false};
};

struct GraphicsPipelineTargetInfo {
    std::vector<ColorTargetDescription> color_target_descriptions;
    // no depth-stencil target if unset
    std::optional<TextureFormat> depth_stencil_format;
};

// the shaders only need to live until the pipeline is created
struct GraphicsPipelineCreateInfo {
    SDL_GPUShader *vertex_shader{nullptr};
    SDL_GPUShader *fragment_shader{nullptr};
    VertexInputState vertex_input_state;
    PrimitiveType primitive_type{PrimitiveType::triangle_list};
    RasterizerState rasterizer_state;
    MultisampleState multisample_state;
    DepthStencilState depth_stencil_state;
    GraphicsPipelineTargetInfo target_info;
};

struct ComputePipelineCreateInfo {
    std::span<const unsigned char> code;
    const char *entrypoint{"main"};
    std::optional<ShaderFormat> format;
    Uint32 num_samplers{0};
    Uint32 num_readonly_storage_textures{0};
    Uint32 num_readonly_storage_buffers{0};
    Uint32 num_readwrite_storage_textures{0};
    Uint32 num_readwrite_storage_buffers{0};
    Uint32 num_uniform_buffers{0};
    Uint32 threadcount_x{1};
    Uint32 threadcount_y{1};
    Uint32 threadcount_z{1};
};

struct BlitInfo {
    BlitRegion source;
    BlitRegion destination;
    LoadOp load_op{LoadOp::dont_care};
    // only used with LoadOp::clear
    FColor clear_color;
    SDL_FlipMode flip_mode{SDL_FLIP_NONE};
    Filter filter{Filter::nearest};
    // cycle the destination if it's already bound
    bool cycle{false};
};

// plain conversions, the vectors/spans of the source have to outlive the results that point into them
[[nodiscard]] SDL_GPUBufferCreateInfo toNative(const BufferCreateInfo &info) noexcept;
[[nodiscard]] SDL_GPUTextureCreateInfo toNative(const TextureCreateInfo &info) noexcept;
[[nodiscard]] SDL_GPUSamplerCreateInfo toNative(const SamplerCreateInfo &info) noexcept;
[[nodiscard]] SDL_GPUShaderCreateInfo toNative(const ShaderCreateInfo &info) noexcept;
[[nodiscard]] SDL_GPUTransferBufferCreateInfo toNative(const TransferBufferCreateInfo &info) noexcept;
[[nodiscard]] SDL_GPURasterizerState toNative(const RasterizerState &state) noexcept;
[[nodiscard]] SDL_GPUMultisampleState toNative(const MultisampleState &state) noexcept;
[[nodiscard]] SDL_GPUDepthStencilState toNative(const DepthStencilState &state) noexcept;
[[nodiscard]] SDL_GPUComputePipelineCreateInfo toNative(const ComputePipelineCreateInfo &info) noexcept;
[[nodiscard]] SDL_GPUBlitInfo toNative(const BlitInfo &info) noexcept;

namespace detail {

// mirrored structs -> native array, for the calls that take a pointer + count
template <typename Host>
[[nodiscard]] auto toNativeArray(std::span<const Host> items) {
    using Native = decltype(toNative(std::declval<const Host &>()));
    std::vector<Native> ret;
    ret.reserve(items.size());
    for(const auto &item : items) {
        ret.push_back(toNative(item));
    }
    return ret;
}

// pointers into the vectors of a GraphicsPipelineCreateInfo, valid while both are alive
struct GraphicsPipelineNative {
    std::vector<SDL_GPUVertexBufferDescription> vertex_buffer_descriptions;
    std::vector<SDL_GPUVertexAttribute> vertex_attributes;
    std::vector<SDL_GPUColorTargetDescription> color_target_descriptions;
    SDL_GPUGraphicsPipelineCreateInfo info{};
};

void toNative(const GraphicsPipelineCreateInfo &info, GraphicsPipelineNative &out);

}  // namespace detail

// true if any backend supporting one of these formats is available
[[nodiscard]] bool supportsShaderFormats(ShaderFormatFlags formats, const char *name = nullptr) noexcept;
[[nodiscard]] int getNumDrivers() noexcept;
[[nodiscard]] std::optional<std::string_view> getDriver(int index) noexcept;

// bytes per texel block (per texel for uncompressed formats)
[[nodiscard]] Uint32 textureFormatTexelBlockSize(TextureFormat format) noexcept;
[[nodiscard]] Uint32 calculateTextureFormatSize(TextureFormat format, Uint32 width, Uint32 height,
                                                Uint32 depthOrLayerCount) noexcept;

}  // namespace sdl3bind::gpu

#endif
