// Copyright (c) 2026, WH, All rights reserved.
#include "GPUCommandBuffer.h"

#include "Logging.h"

#include <utility>

namespace sdl3bind::gpu {

//
// RenderPass
//

RenderPass::RenderPass(RenderPass &&other) noexcept : m_pass(std::exchange(other.m_pass, nullptr)) {}

RenderPass &RenderPass::operator=(RenderPass &&other) noexcept {
    if(this != &other) {
        end();
        m_pass = std::exchange(other.m_pass, nullptr);
    }
    return *this;
}

void RenderPass::bindGraphicsPipeline(const GraphicsPipeline &pipeline) const noexcept {
    SDL_BindGPUGraphicsPipeline(m_pass, pipeline.get());
}

void RenderPass::setViewport(const Viewport &viewport) const noexcept {
    const SDL_GPUViewport native = toNative(viewport);
    SDL_SetGPUViewport(m_pass, &native);
}

void RenderPass::setScissor(const Rect &scissor) const noexcept {
    const SDL_Rect native = sdl3bind::toNative(scissor);
    SDL_SetGPUScissor(m_pass, &native);
}

void RenderPass::setBlendConstants(FColor constants) const noexcept {
    SDL_SetGPUBlendConstants(m_pass, sdl3bind::toNative(constants));
}

void RenderPass::setStencilReference(Uint8 reference) const noexcept { SDL_SetGPUStencilReference(m_pass, reference); }

void RenderPass::bindVertexBuffers(Uint32 firstSlot, std::span<const BufferBinding> bindings) const {
    const auto native = detail::toNativeArray(bindings);
    SDL_BindGPUVertexBuffers(m_pass, firstSlot, native.data(), static_cast<Uint32>(native.size()));
}

void RenderPass::bindIndexBuffer(const BufferBinding &binding, IndexElementSize size) const noexcept {
    const SDL_GPUBufferBinding native = toNative(binding);
    SDL_BindGPUIndexBuffer(m_pass, &native, toNative(size));
}

void RenderPass::bindVertexSamplers(Uint32 firstSlot, std::span<const TextureSamplerBinding> bindings) const {
    const auto native = detail::toNativeArray(bindings);
    SDL_BindGPUVertexSamplers(m_pass, firstSlot, native.data(), static_cast<Uint32>(native.size()));
}

void RenderPass::bindFragmentSamplers(Uint32 firstSlot, std::span<const TextureSamplerBinding> bindings) const {
    const auto native = detail::toNativeArray(bindings);
    SDL_BindGPUFragmentSamplers(m_pass, firstSlot, native.data(), static_cast<Uint32>(native.size()));
}

void RenderPass::drawPrimitives(Uint32 numVertices, Uint32 numInstances, Uint32 firstVertex,
                                Uint32 firstInstance) const noexcept {
    SDL_DrawGPUPrimitives(m_pass, numVertices, numInstances, firstVertex, firstInstance);
}

void RenderPass::drawIndexedPrimitives(Uint32 numIndices, Uint32 numInstances, Uint32 firstIndex,
                                       Sint32 vertexOffset, Uint32 firstInstance) const noexcept {
    SDL_DrawGPUIndexedPrimitives(m_pass, numIndices, numInstances, firstIndex, vertexOffset, firstInstance);
}

void RenderPass::end() noexcept {
    if(m_pass) SDL_EndGPURenderPass(std::exchange(m_pass, nullptr));
}

//
// CopyPass
//

CopyPass::CopyPass(CopyPass &&other) noexcept : m_pass(std::exchange(other.m_pass, nullptr)) {}

CopyPass &CopyPass::operator=(CopyPass &&other) noexcept {
    if(this != &other) {
        end();
        m_pass = std::exchange(other.m_pass, nullptr);
    }
    return *this;
}

void CopyPass::uploadToBuffer(const TransferBufferLocation &source, const BufferRegion &destination,
                              bool cycle) const noexcept {
    const SDL_GPUTransferBufferLocation src = toNative(source);
    const SDL_GPUBufferRegion dst = toNative(destination);
    SDL_UploadToGPUBuffer(m_pass, &src, &dst, cycle);
}

void CopyPass::uploadToTexture(const TextureTransferInfo &source, const TextureRegion &destination,
                               bool cycle) const noexcept {
    const SDL_GPUTextureTransferInfo src = toNative(source);
    const SDL_GPUTextureRegion dst = toNative(destination);
    SDL_UploadToGPUTexture(m_pass, &src, &dst, cycle);
}

void CopyPass::downloadFromBuffer(const BufferRegion &source,
                                  const TransferBufferLocation &destination) const noexcept {
    const SDL_GPUBufferRegion src = toNative(source);
    const SDL_GPUTransferBufferLocation dst = toNative(destination);
    SDL_DownloadFromGPUBuffer(m_pass, &src, &dst);
}

void CopyPass::downloadFromTexture(const TextureRegion &source,
                                   const TextureTransferInfo &destination) const noexcept {
    const SDL_GPUTextureRegion src = toNative(source);
    const SDL_GPUTextureTransferInfo dst = toNative(destination);
    SDL_DownloadFromGPUTexture(m_pass, &src, &dst);
}

void CopyPass::bufferToBuffer(const BufferLocation &source, const BufferLocation &destination, Uint32 size,
                              bool cycle) const noexcept {
    const SDL_GPUBufferLocation src = toNative(source);
    const SDL_GPUBufferLocation dst = toNative(destination);
    SDL_CopyGPUBufferToBuffer(m_pass, &src, &dst, size, cycle);
}

void CopyPass::textureToTexture(const TextureLocation &source, const TextureLocation &destination, Uint32 w,
                                Uint32 h, Uint32 d, bool cycle) const noexcept {
    const SDL_GPUTextureLocation src = toNative(source);
    const SDL_GPUTextureLocation dst = toNative(destination);
    SDL_CopyGPUTextureToTexture(m_pass, &src, &dst, w, h, d, cycle);
}

void CopyPass::end() noexcept {
    if(m_pass) SDL_EndGPUCopyPass(std::exchange(m_pass, nullptr));
}

//
// ComputePass
//

ComputePass::ComputePass(ComputePass &&other) noexcept : m_pass(std::exchange(other.m_pass, nullptr)) {}

ComputePass &ComputePass::operator=(ComputePass &&other) noexcept {
    if(this != &other) {
        end();
        m_pass = std::exchange(other.m_pass, nullptr);
    }
    return *this;
}

void ComputePass::bindComputePipeline(const ComputePipeline &pipeline) const noexcept {
    SDL_BindGPUComputePipeline(m_pass, pipeline.get());
}

void ComputePass::bindStorageBuffers(Uint32 firstSlot, std::span<SDL_GPUBuffer *const> buffers) const noexcept {
    SDL_BindGPUComputeStorageBuffers(m_pass, firstSlot, buffers.data(), static_cast<Uint32>(buffers.size()));
}

void ComputePass::bindStorageTextures(Uint32 firstSlot, std::span<SDL_GPUTexture *const> textures) const noexcept {
    SDL_BindGPUComputeStorageTextures(m_pass, firstSlot, textures.data(), static_cast<Uint32>(textures.size()));
}

void ComputePass::bindSamplers(Uint32 firstSlot, std::span<const TextureSamplerBinding> bindings) const {
    const auto native = detail::toNativeArray(bindings);
    SDL_BindGPUComputeSamplers(m_pass, firstSlot, native.data(), static_cast<Uint32>(native.size()));
}

void ComputePass::dispatch(Uint32 groupCountX, Uint32 groupCountY, Uint32 groupCountZ) const noexcept {
    SDL_DispatchGPUCompute(m_pass, groupCountX, groupCountY, groupCountZ);
}

void ComputePass::end() noexcept {
    if(m_pass) SDL_EndGPUComputePass(std::exchange(m_pass, nullptr));
}

//
// CommandBuffer
//

CommandBuffer::CommandBuffer(CommandBuffer &&other) noexcept
    : m_device(other.m_device),
      m_commandBuffer(std::exchange(other.m_commandBuffer, nullptr)),
      m_swapchainAcquired(std::exchange(other.m_swapchainAcquired, false)) {}

CommandBuffer &CommandBuffer::operator=(CommandBuffer &&other) noexcept {
    if(this != &other) {
        finish();
        m_device = other.m_device;
        m_commandBuffer = std::exchange(other.m_commandBuffer, nullptr);
        m_swapchainAcquired = std::exchange(other.m_swapchainAcquired, false);
    }
    return *this;
}

void CommandBuffer::finish() noexcept {
    if(!m_commandBuffer) return;
    // cancelling is not allowed once a swapchain texture was acquired
    const bool submitting = m_swapchainAcquired;
    if(auto ok = submitting ? submit() : cancel(); !ok) {
        errorLog("couldn't {} abandoned command buffer: {}", submitting ? "submit" : "cancel",
                 errors::get().value_or("?"));
    }
}

void CommandBuffer::pushVertexUniformData(Uint32 slot, std::span<const std::byte> data) const noexcept {
    SDL_PushGPUVertexUniformData(m_commandBuffer, slot, data.data(), static_cast<Uint32>(data.size()));
}

void CommandBuffer::pushFragmentUniformData(Uint32 slot, std::span<const std::byte> data) const noexcept {
    SDL_PushGPUFragmentUniformData(m_commandBuffer, slot, data.data(), static_cast<Uint32>(data.size()));
}

void CommandBuffer::pushComputeUniformData(Uint32 slot, std::span<const std::byte> data) const noexcept {
    SDL_PushGPUComputeUniformData(m_commandBuffer, slot, data.data(), static_cast<Uint32>(data.size()));
}

Result<RenderPass> CommandBuffer::beginRenderPass(
    std::span<const ColorTargetInfo> colorTargets,
    const std::optional<DepthStencilTargetInfo> &depthStencilTarget) const {
    const auto colors = detail::toNativeArray(colorTargets);
    SDL_GPUDepthStencilTargetInfo depthStencil{};
    if(depthStencilTarget) depthStencil = toNative(*depthStencilTarget);

    auto pass = errors::wrapCallPtr(SDL_BeginGPURenderPass(m_commandBuffer, colors.data(),
                                                           static_cast<Uint32>(colors.size()),
                                                           depthStencilTarget ? &depthStencil : nullptr));
    if(!pass) return std::unexpected(pass.error());
    return RenderPass{*pass};
}

Result<CopyPass> CommandBuffer::beginCopyPass() const noexcept {
    auto pass = errors::wrapCallPtr(SDL_BeginGPUCopyPass(m_commandBuffer));
    if(!pass) return std::unexpected(pass.error());
    return CopyPass{*pass};
}

Result<ComputePass> CommandBuffer::beginComputePass(
    std::span<const StorageTextureReadWriteBinding> storageTextures,
    std::span<const StorageBufferReadWriteBinding> storageBuffers) const {
    const auto textures = detail::toNativeArray(storageTextures);
    const auto buffers = detail::toNativeArray(storageBuffers);

    auto pass = errors::wrapCallPtr(SDL_BeginGPUComputePass(m_commandBuffer, textures.data(),
                                                            static_cast<Uint32>(textures.size()), buffers.data(),
                                                            static_cast<Uint32>(buffers.size())));
    if(!pass) return std::unexpected(pass.error());
    return ComputePass{*pass};
}

Result<SwapchainTexture> CommandBuffer::acquireSwapchainTexture(video::WindowRef window) noexcept {
    SwapchainTexture ret;
    if(auto ok = errors::wrapCallBool(SDL_AcquireGPUSwapchainTexture(m_commandBuffer, window.get(), &ret.texture,
                                                                     &ret.width, &ret.height));
       !ok)
        return std::unexpected(ok.error());
    if(ret.texture) m_swapchainAcquired = true;
    return ret;
}

Result<SwapchainTexture> CommandBuffer::waitAndAcquireSwapchainTexture(video::WindowRef window) noexcept {
    SwapchainTexture ret;
    if(auto ok = errors::wrapCallBool(SDL_WaitAndAcquireGPUSwapchainTexture(m_commandBuffer, window.get(),
                                                                            &ret.texture, &ret.width, &ret.height));
       !ok)
        return std::unexpected(ok.error());
    if(ret.texture) m_swapchainAcquired = true;
    return ret;
}

void CommandBuffer::blitTexture(const BlitInfo &info) const noexcept {
    const SDL_GPUBlitInfo native = toNative(info);
    SDL_BlitGPUTexture(m_commandBuffer, &native);
}

void CommandBuffer::generateMipmaps(const Texture &texture) const noexcept {
    SDL_GenerateMipmapsForGPUTexture(m_commandBuffer, texture.get());
}

void CommandBuffer::insertDebugLabel(const char *text) const noexcept { SDL_InsertGPUDebugLabel(m_commandBuffer, text); }

void CommandBuffer::pushDebugGroup(const char *name) const noexcept { SDL_PushGPUDebugGroup(m_commandBuffer, name); }

void CommandBuffer::popDebugGroup() const noexcept { SDL_PopGPUDebugGroup(m_commandBuffer); }

Result<void> CommandBuffer::submit() noexcept {
    m_swapchainAcquired = false;
    return errors::wrapCallBool(SDL_SubmitGPUCommandBuffer(std::exchange(m_commandBuffer, nullptr)));
}

Result<Fence> CommandBuffer::submitAndAcquireFence() noexcept {
    m_swapchainAcquired = false;
    auto fence = errors::wrapCallPtr(SDL_SubmitGPUCommandBufferAndAcquireFence(std::exchange(m_commandBuffer, nullptr)));
    if(!fence) return std::unexpected(fence.error());
    return Fence{m_device, *fence};
}

Result<void> CommandBuffer::cancel() noexcept {
    return errors::wrapCallBool(SDL_CancelGPUCommandBuffer(std::exchange(m_commandBuffer, nullptr)));
}

}  // namespace sdl3bind::gpu
