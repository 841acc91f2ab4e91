// Copyright (c) 2026, WH, All rights reserved.
#include "GPU.h"

namespace sdl3bind::gpu {

SDL_GPUBufferCreateInfo toNative(const BufferCreateInfo &info) noexcept {
    SDL_GPUBufferCreateInfo ret{};
    ret.usage = info.usage.toNative();
    ret.size = info.size;
    return ret;
}

SDL_GPUTextureCreateInfo toNative(const TextureCreateInfo &info) noexcept {
    SDL_GPUTextureCreateInfo ret{};
    ret.type = toNative(info.type);
    ret.format = toNative(info.format);
    ret.usage = info.usage.toNative();
    ret.width = info.width;
    ret.height = info.height;
    ret.layer_count_or_depth = info.layer_count_or_depth;
    ret.num_levels = info.num_levels;
    ret.sample_count = toNative(info.sample_count);
    return ret;
}

SDL_GPUSamplerCreateInfo toNative(const SamplerCreateInfo &info) noexcept {
    SDL_GPUSamplerCreateInfo ret{};
    ret.min_filter = toNative(info.min_filter);
    ret.mag_filter = toNative(info.mag_filter);
    ret.mipmap_mode = toNative(info.mipmap_mode);
    ret.address_mode_u = toNative(info.address_mode_u);
    ret.address_mode_v = toNative(info.address_mode_v);
    ret.address_mode_w = toNative(info.address_mode_w);
    ret.mip_lod_bias = info.mip_lod_bias;
    ret.max_anisotropy = info.max_anisotropy.value_or(0.f);
    ret.compare_op = toNative(info.compare_op);
    ret.min_lod = info.min_lod;
    ret.max_lod = info.max_lod;
    ret.enable_anisotropy = info.max_anisotropy.has_value();
    ret.enable_compare = info.compare_op.has_value();
    return ret;
}

SDL_GPUShaderCreateInfo toNative(const ShaderCreateInfo &info) noexcept {
    SDL_GPUShaderCreateInfo ret{};
    ret.code_size = info.code.size();
    ret.code = info.code.data();
    ret.entrypoint = info.entrypoint;
    ret.format = toNative(info.format);
    ret.stage = toNative(info.stage);
    ret.num_samplers = info.num_samplers;
    ret.num_storage_textures = info.num_storage_textures;
    ret.num_storage_buffers = info.num_storage_buffers;
    ret.num_uniform_buffers = info.num_uniform_buffers;
    return ret;
}

SDL_GPUTransferBufferCreateInfo toNative(const TransferBufferCreateInfo &info) noexcept {
    SDL_GPUTransferBufferCreateInfo ret{};
    ret.usage = toNative(info.usage);
    ret.size = info.size;
    return ret;
}

SDL_GPURasterizerState toNative(const RasterizerState &state) noexcept {
    SDL_GPURasterizerState ret{};
    ret.fill_mode = toNative(state.fill_mode);
    ret.cull_mode = toNative(state.cull_mode);
    ret.front_face = toNative(state.front_face);
    ret.depth_bias_constant_factor = state.depth_bias_constant_factor;
    ret.depth_bias_clamp = state.depth_bias_clamp;
    ret.depth_bias_slope_factor = state.depth_bias_slope_factor;
    ret.enable_depth_bias = state.enable_depth_bias;
    ret.enable_depth_clip = state.enable_depth_clip;
    return ret;
}

SDL_GPUMultisampleState toNative(const MultisampleState &state) noexcept {
    SDL_GPUMultisampleState ret{};
    ret.sample_count = toNative(state.sample_count);
    return ret;
}

SDL_GPUDepthStencilState toNative(const DepthStencilState &state) noexcept {
    SDL_GPUDepthStencilState ret{};
    ret.compare_op = toNative(state.compare_op);
    ret.back_stencil_state = toNative(state.back_stencil_state);
    ret.front_stencil_state = toNative(state.front_stencil_state);
    ret.compare_mask = state.compare_mask;
    ret.write_mask = state.write_mask;
    ret.enable_depth_test = state.enable_depth_test;
    ret.enable_depth_write = state.enable_depth_write;
    ret.enable_stencil_test = state.enable_stencil_test;
    return ret;
}

SDL_GPUComputePipelineCreateInfo toNative(const ComputePipelineCreateInfo &info) noexcept {
    SDL_GPUComputePipelineCreateInfo ret{};
    ret.code_size = info.code.size();
    ret.code = info.code.data();
    ret.entrypoint = info.entrypoint;
    ret.format = toNative(info.format);
    ret.num_samplers = info.num_samplers;
    ret.num_readonly_storage_textures = info.num_readonly_storage_textures;
    ret.num_readonly_storage_buffers = info.num_readonly_storage_buffers;
    ret.num_readwrite_storage_textures = info.num_readwrite_storage_textures;
    ret.num_readwrite_storage_buffers = info.num_readwrite_storage_buffers;
    ret.num_uniform_buffers = info.num_uniform_buffers;
    ret.threadcount_x = info.threadcount_x;
    ret.threadcount_y = info.threadcount_y;
    ret.threadcount_z = info.threadcount_z;
    return ret;
}

SDL_GPUBlitInfo toNative(const BlitInfo &info) noexcept {
    SDL_GPUBlitInfo ret{};
    ret.source = toNative(info.source);
    ret.destination = toNative(info.destination);
    ret.load_op = toNative(info.load_op);
    ret.clear_color = toNative(info.clear_color);
    ret.flip_mode = info.flip_mode;
    ret.filter = toNative(info.filter);
    ret.cycle = info.cycle;
    return ret;
}

namespace detail {

void toNative(const GraphicsPipelineCreateInfo &info, GraphicsPipelineNative &out) {
    using gpu::toNative;

    out.vertex_buffer_descriptions =
        toNativeArray(std::span{info.vertex_input_state.vertex_buffer_descriptions});
    out.vertex_attributes = toNativeArray(std::span{info.vertex_input_state.vertex_attributes});
    out.color_target_descriptions = toNativeArray(std::span{info.target_info.color_target_descriptions});

    SDL_GPUGraphicsPipelineCreateInfo &ret = out.info;
    ret = {};
    ret.vertex_shader = info.vertex_shader;
    ret.fragment_shader = info.fragment_shader;

    ret.vertex_input_state.vertex_buffer_descriptions = out.vertex_buffer_descriptions.data();
    ret.vertex_input_state.num_vertex_buffers = static_cast<Uint32>(out.vertex_buffer_descriptions.size());
    ret.vertex_input_state.vertex_attributes = out.vertex_attributes.data();
    ret.vertex_input_state.num_vertex_attributes = static_cast<Uint32>(out.vertex_attributes.size());

    ret.primitive_type = toNative(info.primitive_type);
    ret.rasterizer_state = toNative(info.rasterizer_state);
    ret.multisample_state = toNative(info.multisample_state);
    ret.depth_stencil_state = toNative(info.depth_stencil_state);

    ret.target_info.color_target_descriptions = out.color_target_descriptions.data();
    ret.target_info.num_color_targets = static_cast<Uint32>(out.color_target_descriptions.size());
    ret.target_info.has_depth_stencil_target = info.target_info.depth_stencil_format.has_value();
    ret.target_info.depth_stencil_format = toNative(info.target_info.depth_stencil_format);
}

}  // namespace detail

bool supportsShaderFormats(ShaderFormatFlags formats, const char *name) noexcept {
    return SDL_GPUSupportsShaderFormats(formats.toNative(), name);
}

int getNumDrivers() noexcept { return SDL_GetNumGPUDrivers(); }

std::optional<std::string_view> getDriver(int index) noexcept {
    const char *name = SDL_GetGPUDriver(index);
    if(name == nullptr) return std::nullopt;
    return std::string_view{name};
}

Uint32 textureFormatTexelBlockSize(TextureFormat format) noexcept {
    return SDL_GPUTextureFormatTexelBlockSize(toNative(format));
}

Uint32 calculateTextureFormatSize(TextureFormat format, Uint32 width, Uint32 height,
                                  Uint32 depthOrLayerCount) noexcept {
    return SDL_CalculateGPUTextureFormatSize(toNative(format), width, height, depthOrLayerCount);
}

}  // namespace sdl3bind::gpu
