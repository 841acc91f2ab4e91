// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_GPUCOMMANDBUFFER_H
#define SDL3BIND_GPUCOMMANDBUFFER_H

#include "GPU.h"
#include "Window.h"

#include <cstddef>
#include <optional>
#include <span>
#include <type_traits>

namespace sdl3bind::gpu {

// passes are borrowed from their command buffer, and end themselves if end() wasn't called
// only one pass can be open on a command buffer at a time

class RenderPass {
    NOCOPY(RenderPass)
   public:
    explicit RenderPass(SDL_GPURenderPass *pass) noexcept : m_pass(pass) {}
    RenderPass(RenderPass &&other) noexcept;
    RenderPass &operator=(RenderPass &&other) noexcept;
    ~RenderPass() { end(); }

    [[nodiscard]] SDL_GPURenderPass *get() const noexcept { return m_pass; }

    void bindGraphicsPipeline(const GraphicsPipeline &pipeline) const noexcept;
    void setViewport(const Viewport &viewport) const noexcept;
    void setScissor(const Rect &scissor) const noexcept;
    void setBlendConstants(FColor constants) const noexcept;
    void setStencilReference(Uint8 reference) const noexcept;

    void bindVertexBuffers(Uint32 firstSlot, std::span<const BufferBinding> bindings) const;
    void bindIndexBuffer(const BufferBinding &binding, IndexElementSize size) const noexcept;
    void bindVertexSamplers(Uint32 firstSlot, std::span<const TextureSamplerBinding> bindings) const;
    void bindFragmentSamplers(Uint32 firstSlot, std::span<const TextureSamplerBinding> bindings) const;

    void drawPrimitives(Uint32 numVertices, Uint32 numInstances = 1, Uint32 firstVertex = 0,
                        Uint32 firstInstance = 0) const noexcept;
    void drawIndexedPrimitives(Uint32 numIndices, Uint32 numInstances = 1, Uint32 firstIndex = 0,
                               Sint32 vertexOffset = 0, Uint32 firstInstance = 0) const noexcept;

    void end() noexcept;

   private:
    SDL_GPURenderPass *m_pass;
};

class CopyPass {
    NOCOPY(CopyPass)
   public:
    explicit CopyPass(SDL_GPUCopyPass *pass) noexcept : m_pass(pass) {}
    CopyPass(CopyPass &&other) noexcept;
    CopyPass &operator=(CopyPass &&other) noexcept;
    ~CopyPass() { end(); }

    [[nodiscard]] SDL_GPUCopyPass *get() const noexcept { return m_pass; }

    void uploadToBuffer(const TransferBufferLocation &source, const BufferRegion &destination,
                        bool cycle) const noexcept;
    void uploadToTexture(const TextureTransferInfo &source, const TextureRegion &destination,
                         bool cycle) const noexcept;
    void downloadFromBuffer(const BufferRegion &source, const TransferBufferLocation &destination) const noexcept;
    void downloadFromTexture(const TextureRegion &source, const TextureTransferInfo &destination) const noexcept;
    void bufferToBuffer(const BufferLocation &source, const BufferLocation &destination, Uint32 size,
                        bool cycle) const noexcept;
    void textureToTexture(const TextureLocation &source, const TextureLocation &destination, Uint32 w, Uint32 h,
                          Uint32 d, bool cycle) const noexcept;

    void end() noexcept;

   private:
    SDL_GPUCopyPass *m_pass;
};

class ComputePass {
    NOCOPY(ComputePass)
   public:
    explicit ComputePass(SDL_GPUComputePass *pass) noexcept : m_pass(pass) {}
    ComputePass(ComputePass &&other) noexcept;
    ComputePass &operator=(ComputePass &&other) noexcept;
    ~ComputePass() { end(); }

    [[nodiscard]] SDL_GPUComputePass *get() const noexcept { return m_pass; }

    void bindComputePipeline(const ComputePipeline &pipeline) const noexcept;
    // read-only storage
    void bindStorageBuffers(Uint32 firstSlot, std::span<SDL_GPUBuffer *const> buffers) const noexcept;
    void bindStorageTextures(Uint32 firstSlot, std::span<SDL_GPUTexture *const> textures) const noexcept;
    void bindSamplers(Uint32 firstSlot, std::span<const TextureSamplerBinding> bindings) const;

    void dispatch(Uint32 groupCountX, Uint32 groupCountY, Uint32 groupCountZ) const noexcept;

    void end() noexcept;

   private:
    SDL_GPUComputePass *m_pass;
};

struct SwapchainTexture {
    // nullptr if there's nothing to render to right now (minimized window, too many frames in flight),
    // that's not an error, the frame just gets skipped
    SDL_GPUTexture *texture{nullptr};
    Uint32 width{0};
    Uint32 height{0};
};

// borrowed from the device until submitted or cancelled
// not thread safe: record and submit on the thread that acquired it.
// command buffers execute in submission order.
// one that is dropped without either gets cancelled, or submitted if it holds a swapchain texture
class CommandBuffer {
    NOCOPY(CommandBuffer)
   public:
    CommandBuffer(SDL_GPUDevice *device, SDL_GPUCommandBuffer *commandBuffer) noexcept
        : m_device(device), m_commandBuffer(commandBuffer) {}
    CommandBuffer(CommandBuffer &&other) noexcept;
    CommandBuffer &operator=(CommandBuffer &&other) noexcept;
    ~CommandBuffer() { finish(); }

    [[nodiscard]] SDL_GPUCommandBuffer *get() const noexcept { return m_commandBuffer; }

    // uniforms stay bound for all following draws/dispatches in this command buffer
    void pushVertexUniformData(Uint32 slot, std::span<const std::byte> data) const noexcept;
    void pushFragmentUniformData(Uint32 slot, std::span<const std::byte> data) const noexcept;
    void pushComputeUniformData(Uint32 slot, std::span<const std::byte> data) const noexcept;

    template <typename T>
        requires std::is_trivially_copyable_v<T>
    void pushVertexUniform(Uint32 slot, const T &value) const noexcept {
        pushVertexUniformData(slot, std::as_bytes(std::span{&value, 1}));
    }

    template <typename T>
        requires std::is_trivially_copyable_v<T>
    void pushFragmentUniform(Uint32 slot, const T &value) const noexcept {
        pushFragmentUniformData(slot, std::as_bytes(std::span{&value, 1}));
    }

    [[nodiscard]] Result<RenderPass> beginRenderPass(
        std::span<const ColorTargetInfo> colorTargets,
        const std::optional<DepthStencilTargetInfo> &depthStencilTarget = std::nullopt) const;
    [[nodiscard]] Result<CopyPass> beginCopyPass() const noexcept;
    [[nodiscard]] Result<ComputePass> beginComputePass(
        std::span<const StorageTextureReadWriteBinding> storageTextures,
        std::span<const StorageBufferReadWriteBinding> storageBuffers) const;

    [[nodiscard]] Result<SwapchainTexture> acquireSwapchainTexture(video::WindowRef window) noexcept;
    [[nodiscard]] Result<SwapchainTexture> waitAndAcquireSwapchainTexture(video::WindowRef window) noexcept;
    [[nodiscard]] bool hasSwapchainTexture() const noexcept { return m_swapchainAcquired; }

    void blitTexture(const BlitInfo &info) const noexcept;
    void generateMipmaps(const Texture &texture) const noexcept;

    void insertDebugLabel(const char *text) const noexcept;
    void pushDebugGroup(const char *name) const noexcept;
    void popDebugGroup() const noexcept;

    // the command buffer is gone after these, whether they succeed or not
    Result<void> submit() noexcept;
    [[nodiscard]] Result<Fence> submitAndAcquireFence() noexcept;
    // not allowed after a swapchain texture was acquired
    Result<void> cancel() noexcept;

   private:
    void finish() noexcept;

    SDL_GPUDevice *m_device;
    SDL_GPUCommandBuffer *m_commandBuffer;
    bool m_swapchainAcquired{false};
};

}  // namespace sdl3bind::gpu

#endif
