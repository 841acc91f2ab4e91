// Copyright (c) 2026, WH, All rights reserved.
#include "GPUDevice.h"

#include "Logging.h"

#include <vector>

namespace sdl3bind::gpu {
namespace {  // static

template <typename Owned, typename T>
Result<Owned> own(SDL_GPUDevice *device, T *handle) noexcept {
    auto ret = errors::wrapCallPtr(handle);
    if(!ret) return std::unexpected(ret.error());
    return Owned{device, *ret};
}

}  // namespace

Result<Device> Device::create(ShaderFormatFlags formats, bool debug, const char *name) noexcept {
    auto device = errors::wrapCallPtr(SDL_CreateGPUDevice(formats.toNative(), debug, name));
    if(!device) return std::unexpected(device.error());

    Device ret{*device};
    debugLog("created GPU device (driver: {}, debug: {})", SDL_GetGPUDeviceDriver(*device), debug);
    return ret;
}

Result<std::string_view> Device::getDriver() const noexcept {
    return errors::wrapCallCString(SDL_GetGPUDeviceDriver(get()));
}

ShaderFormatFlags Device::getShaderFormats() const noexcept {
    return ShaderFormatFlags::fromNative(SDL_GetGPUShaderFormats(get()));
}

Result<void> Device::claimWindow(video::WindowRef window) const noexcept {
    return errors::wrapCallBool(SDL_ClaimWindowForGPUDevice(get(), window.get()));
}

void Device::releaseWindow(video::WindowRef window) const noexcept {
    SDL_ReleaseWindowFromGPUDevice(get(), window.get());
}

Result<void> Device::setSwapchainParameters(video::WindowRef window, SwapchainComposition composition,
                                            PresentMode presentMode) const noexcept {
    return errors::wrapCallBool(
        SDL_SetGPUSwapchainParameters(get(), window.get(), toNative(composition), toNative(presentMode)));
}

bool Device::windowSupportsPresentMode(video::WindowRef window, PresentMode presentMode) const noexcept {
    return SDL_WindowSupportsGPUPresentMode(get(), window.get(), toNative(presentMode));
}

bool Device::windowSupportsSwapchainComposition(video::WindowRef window,
                                                SwapchainComposition composition) const noexcept {
    return SDL_WindowSupportsGPUSwapchainComposition(get(), window.get(), toNative(composition));
}

Result<TextureFormat> Device::getSwapchainTextureFormat(video::WindowRef window) const noexcept {
    auto native = errors::wrapCall(SDL_GetGPUSwapchainTextureFormat(get(), window.get()),
                                   SDL_GPU_TEXTUREFORMAT_INVALID);
    if(!native) return std::unexpected(native.error());
    auto format = fromNative<TextureFormat>(*native);
    if(!format) return std::unexpected(errors::unsupported().error());
    return *format;
}

Result<void> Device::setAllowedFramesInFlight(Uint32 allowedFramesInFlight) const noexcept {
    return errors::wrapCallBool(SDL_SetGPUAllowedFramesInFlight(get(), allowedFramesInFlight));
}

Result<void> Device::waitForSwapchain(video::WindowRef window) const noexcept {
    return errors::wrapCallBool(SDL_WaitForGPUSwapchain(get(), window.get()));
}

Result<Buffer> Device::createBuffer(const BufferCreateInfo &info) const noexcept {
    const SDL_GPUBufferCreateInfo native = toNative(info);
    auto ret = own<Buffer>(get(), SDL_CreateGPUBuffer(get(), &native));
    if(ret && info.name) setBufferName(*ret, info.name);
    return ret;
}

Result<Texture> Device::createTexture(const TextureCreateInfo &info) const noexcept {
    const SDL_GPUTextureCreateInfo native = toNative(info);
    auto ret = own<Texture>(get(), SDL_CreateGPUTexture(get(), &native));
    if(ret && info.name) setTextureName(*ret, info.name);
    return ret;
}

Result<Sampler> Device::createSampler(const SamplerCreateInfo &info) const noexcept {
    const SDL_GPUSamplerCreateInfo native = toNative(info);
    return own<Sampler>(get(), SDL_CreateGPUSampler(get(), &native));
}

Result<Shader> Device::createShader(const ShaderCreateInfo &info) const noexcept {
    const SDL_GPUShaderCreateInfo native = toNative(info);
    return own<Shader>(get(), SDL_CreateGPUShader(get(), &native));
}

Result<Shader> Device::createShader(const EmbeddedShader &shader) const noexcept {
    auto info = toShaderCreateInfo(shader);
    if(!info) return std::unexpected(info.error());
    return createShader(*info);
}

Result<GraphicsPipeline> Device::createGraphicsPipeline(const GraphicsPipelineCreateInfo &info) const {
    detail::GraphicsPipelineNative native;
    detail::toNative(info, native);
    return own<GraphicsPipeline>(get(), SDL_CreateGPUGraphicsPipeline(get(), &native.info));
}

Result<ComputePipeline> Device::createComputePipeline(const ComputePipelineCreateInfo &info) const noexcept {
    const SDL_GPUComputePipelineCreateInfo native = toNative(info);
    return own<ComputePipeline>(get(), SDL_CreateGPUComputePipeline(get(), &native));
}

Result<ComputePipeline> Device::createComputePipeline(const EmbeddedShader &shader) const noexcept {
    auto info = toComputePipelineCreateInfo(shader);
    if(!info) return std::unexpected(info.error());
    return createComputePipeline(*info);
}

Result<TransferBuffer> Device::createTransferBuffer(const TransferBufferCreateInfo &info) const noexcept {
    const SDL_GPUTransferBufferCreateInfo native = toNative(info);
    return own<TransferBuffer>(get(), SDL_CreateGPUTransferBuffer(get(), &native));
}

void Device::setBufferName(const Buffer &buffer, const char *name) const noexcept {
    SDL_SetGPUBufferName(get(), buffer.get(), name);
}

void Device::setTextureName(const Texture &texture, const char *name) const noexcept {
    SDL_SetGPUTextureName(get(), texture.get(), name);
}

Result<void *> Device::mapTransferBuffer(const TransferBuffer &buffer, bool cycle) const noexcept {
    return errors::wrapCallPtr(SDL_MapGPUTransferBuffer(get(), buffer.get(), cycle));
}

void Device::unmapTransferBuffer(const TransferBuffer &buffer) const noexcept {
    SDL_UnmapGPUTransferBuffer(get(), buffer.get());
}

Result<CommandBuffer> Device::acquireCommandBuffer() const noexcept {
    auto ret = errors::wrapCallPtr(SDL_AcquireGPUCommandBuffer(get()));
    if(!ret) return std::unexpected(ret.error());
    return CommandBuffer{get(), *ret};
}

Result<void> Device::waitForIdle() const noexcept { return errors::wrapCallBool(SDL_WaitForGPUIdle(get())); }

Result<void> Device::waitForFences(bool waitAll, std::span<const Fence> fences) const {
    std::vector<SDL_GPUFence *> native;
    native.reserve(fences.size());
    for(const auto &fence : fences) {
        native.push_back(fence.get());
    }
    return errors::wrapCallBool(
        SDL_WaitForGPUFences(get(), waitAll, native.data(), static_cast<Uint32>(native.size())));
}

bool Device::queryFence(const Fence &fence) const noexcept { return SDL_QueryGPUFence(get(), fence.get()); }

bool Device::textureSupportsFormat(TextureFormat format, TextureType type, TextureUsageFlags usage) const noexcept {
    return SDL_GPUTextureSupportsFormat(get(), toNative(format), toNative(type), usage.toNative());
}

bool Device::textureSupportsSampleCount(TextureFormat format, SampleCount sampleCount) const noexcept {
    return SDL_GPUTextureSupportsSampleCount(get(), toNative(format), toNative(sampleCount));
}

}  // namespace sdl3bind::gpu
