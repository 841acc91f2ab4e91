// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_GPUDEVICE_H
#define SDL3BIND_GPUDEVICE_H

#include "EmbeddedShader.h"
#include "GPU.h"
#include "GPUCommandBuffer.h"
#include "Window.h"

#include <span>
#include <string_view>

namespace sdl3bind::gpu {

// owns the SDL_GPUDevice, every resource created through it must be gone before it is
class Device {
    NOCOPY(Device)
   public:
    [[nodiscard]] static Result<Device> create(ShaderFormatFlags formats, bool debug,
                                               const char *name = nullptr) noexcept;

    Device(Device &&) noexcept = default;
    Device &operator=(Device &&) noexcept = default;
    ~Device() = default;

    [[nodiscard]] SDL_GPUDevice *get() const noexcept { return m_device.get(); }

    [[nodiscard]] Result<std::string_view> getDriver() const noexcept;
    [[nodiscard]] ShaderFormatFlags getShaderFormats() const noexcept;

    // swapchain
    Result<void> claimWindow(video::WindowRef window) const noexcept;
    void releaseWindow(video::WindowRef window) const noexcept;
    Result<void> setSwapchainParameters(video::WindowRef window, SwapchainComposition composition,
                                        PresentMode presentMode) const noexcept;
    [[nodiscard]] bool windowSupportsPresentMode(video::WindowRef window, PresentMode presentMode) const noexcept;
    [[nodiscard]] bool windowSupportsSwapchainComposition(video::WindowRef window,
                                                          SwapchainComposition composition) const noexcept;
    [[nodiscard]] Result<TextureFormat> getSwapchainTextureFormat(video::WindowRef window) const noexcept;
    // 1-3, default 2
    Result<void> setAllowedFramesInFlight(Uint32 allowedFramesInFlight) const noexcept;
    Result<void> waitForSwapchain(video::WindowRef window) const noexcept;

    // resources
    [[nodiscard]] Result<Buffer> createBuffer(const BufferCreateInfo &info) const noexcept;
    [[nodiscard]] Result<Texture> createTexture(const TextureCreateInfo &info) const noexcept;
    [[nodiscard]] Result<Sampler> createSampler(const SamplerCreateInfo &info) const noexcept;
    [[nodiscard]] Result<Shader> createShader(const ShaderCreateInfo &info) const noexcept;
    // fails for compute and HLSL-text shaders
    [[nodiscard]] Result<Shader> createShader(const EmbeddedShader &shader) const noexcept;
    [[nodiscard]] Result<GraphicsPipeline> createGraphicsPipeline(const GraphicsPipelineCreateInfo &info) const;
    [[nodiscard]] Result<ComputePipeline> createComputePipeline(const ComputePipelineCreateInfo &info) const noexcept;
    // fails for graphics and HLSL-text shaders
    [[nodiscard]] Result<ComputePipeline> createComputePipeline(const EmbeddedShader &shader) const noexcept;
    [[nodiscard]] Result<TransferBuffer> createTransferBuffer(const TransferBufferCreateInfo &info) const noexcept;

    void setBufferName(const Buffer &buffer, const char *name) const noexcept;
    void setTextureName(const Texture &texture, const char *name) const noexcept;

    // cycle: discard what was in the buffer if it's still in use
    [[nodiscard]] Result<void *> mapTransferBuffer(const TransferBuffer &buffer, bool cycle) const noexcept;
    void unmapTransferBuffer(const TransferBuffer &buffer) const noexcept;

    // must be submitted (or cancelled) on the thread that acquired it
    [[nodiscard]] Result<CommandBuffer> acquireCommandBuffer() const noexcept;

    Result<void> waitForIdle() const noexcept;
    Result<void> waitForFences(bool waitAll, std::span<const Fence> fences) const;
    [[nodiscard]] bool queryFence(const Fence &fence) const noexcept;

    [[nodiscard]] bool textureSupportsFormat(TextureFormat format, TextureType type,
                                             TextureUsageFlags usage) const noexcept;
    [[nodiscard]] bool textureSupportsSampleCount(TextureFormat format, SampleCount sampleCount) const noexcept;

   private:
    explicit Device(SDL_GPUDevice *device) noexcept : m_device(device) {}

    UniquePtr<SDL_GPUDevice, SDL_DestroyGPUDevice> m_device;
};

}  // namespace sdl3bind::gpu

#endif
