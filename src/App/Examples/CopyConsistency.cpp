// Copyright (c) 2026, WH, All rights reserved.
// copy passes recorded between two render passes of the same command buffer must be visible to the second one:
// the left half is drawn from one set of buffer/texture contents, which then get overwritten for the right half
#include "Examples.h"

#include "ConVar.h"
#include "GPUDevice.h"
#include "Init.h"
#include "Logging.h"
#include "MainCallbacks.h"
#include "Surface.h"
#include "Window.h"

#include "texturedQuad_frag.h"
#include "texturedQuad_vert.h"

#include <array>
#include <cstddef>
#include <cstring>
#include <memory>
#include <variant>
#include <vector>

namespace Examples {
namespace {  // static

using namespace sdl3bind;

constexpr InitFlags INIT_FLAGS{.video = true};
constexpr int IMAGE_SIZE = 64;
constexpr int CHECKER_SIZE = 8;

struct PositionTextureVertex {
    float x, y, z;
    float u, v;
};

constexpr std::array<PositionTextureVertex, 8> VERTICES{{
    // left quad
    {-1.f, 1.f, 0.f, 0.f, 0.f},
    {0.f, 1.f, 0.f, 1.f, 0.f},
    {0.f, -1.f, 0.f, 1.f, 1.f},
    {-1.f, -1.f, 0.f, 0.f, 1.f},
    // right quad
    {0.f, 1.f, 0.f, 0.f, 0.f},
    {1.f, 1.f, 0.f, 1.f, 0.f},
    {1.f, -1.f, 0.f, 1.f, 1.f},
    {0.f, -1.f, 0.f, 0.f, 1.f},
}};
constexpr std::array<Uint16, 6> INDICES{0, 1, 2, 0, 2, 3};

constexpr Uint32 QUAD_BYTES = sizeof(PositionTextureVertex) * 4;

struct State {
    video::Window window;
    gpu::Device device;
    bool claimed{false};

    gpu::GraphicsPipeline pipeline;
    gpu::Buffer vertexBuffer;
    gpu::Buffer leftVertexBuffer;
    gpu::Buffer rightVertexBuffer;
    gpu::Buffer indexBuffer;
    gpu::Texture texture;
    gpu::Texture leftTexture;
    gpu::Texture rightTexture;
    gpu::Sampler sampler;

    ~State() {
        if(claimed) device.releaseWindow(window);
    }
};

// RGBA bytes of a checkerboard, inverted swaps the two colors
Result<std::vector<std::byte>> makeCheckerboard(bool inverted) {
    auto surface = Surface::create(IMAGE_SIZE, IMAGE_SIZE, PixelFormat::abgr8888);
    if(!surface) return std::unexpected(surface.error());

    const Uint32 light = surface->mapRgba(230, 180, 90, 255);
    const Uint32 dark = surface->mapRgba(60, 30, 20, 255);
    if(auto ok = surface->fillRect(std::nullopt, inverted ? dark : light); !ok) return std::unexpected(ok.error());

    for(int y = 0; y < IMAGE_SIZE; y += CHECKER_SIZE) {
        for(int x = (y / CHECKER_SIZE) % 2 == 0 ? 0 : CHECKER_SIZE; x < IMAGE_SIZE; x += CHECKER_SIZE * 2) {
            if(auto ok = surface->fillRect(Rect{x, y, CHECKER_SIZE, CHECKER_SIZE}, inverted ? light : dark); !ok)
                return std::unexpected(ok.error());
        }
    }

    // abgr8888 is r, g, b, a in memory order (on little endian), rows may be padded
    const size_t rowBytes = static_cast<size_t>(IMAGE_SIZE) * 4;
    std::vector<std::byte> ret(rowBytes * IMAGE_SIZE);
    const auto *pixels = static_cast<const std::byte *>(surface->getPixels());
    for(int y = 0; y < IMAGE_SIZE; y++) {
        std::memcpy(ret.data() + rowBytes * y, pixels + static_cast<size_t>(surface->getPitch()) * y, rowBytes);
    }
    return ret;
}

Result<gpu::GraphicsPipeline> createPipeline(const gpu::Device &device, video::WindowRef window) {
    auto vertexShader = device.createShader(shaders::texturedQuad_vert);
    if(!vertexShader) return std::unexpected(vertexShader.error());
    auto fragmentShader = device.createShader(shaders::texturedQuad_frag);
    if(!fragmentShader) return std::unexpected(fragmentShader.error());

    auto swapchainFormat = device.getSwapchainTextureFormat(window);
    if(!swapchainFormat) return std::unexpected(swapchainFormat.error());

    const gpu::GraphicsPipelineCreateInfo info{
        .vertex_shader = vertexShader->get(),
        .fragment_shader = fragmentShader->get(),
        .vertex_input_state =
            {
                .vertex_buffer_descriptions = {{
                    .slot = 0,
                    .pitch = sizeof(PositionTextureVertex),
                    .input_rate = gpu::VertexInputRate::vertex,
                }},
                .vertex_attributes =
                    {
                        {.location = 0,
                         .buffer_slot = 0,
                         .format = gpu::VertexElementFormat::f32x3,
                         .offset = offsetof(PositionTextureVertex, x)},
                        {.location = 1,
                         .buffer_slot = 0,
                         .format = gpu::VertexElementFormat::f32x2,
                         .offset = offsetof(PositionTextureVertex, u)},
                    },
            },
        .target_info =
            {
                .color_target_descriptions = {{
                    .format = *swapchainFormat,
                    .blend_state =
                        {
                            .src_color_blendfactor = gpu::BlendFactor::src_alpha,
                            .dst_color_blendfactor = gpu::BlendFactor::one_minus_src_alpha,
                            .color_blend_op = gpu::BlendOp::add,
                            .src_alpha_blendfactor = gpu::BlendFactor::src_alpha,
                            .dst_alpha_blendfactor = gpu::BlendFactor::one_minus_src_alpha,
                            .alpha_blend_op = gpu::BlendOp::add,
                            .enable_blend = true,
                        },
                }},
            },
    };

    // the shaders are released on return, the pipeline doesn't need them anymore
    return device.createGraphicsPipeline(info);
}

Result<gpu::Texture> createImageTexture(const gpu::Device &device, const char *name) {
    return device.createTexture({
        .format = gpu::TextureFormat::r8g8b8a8_unorm,
        .usage = {.sampler = true},
        .width = IMAGE_SIZE,
        .height = IMAGE_SIZE,
        .name = name,
    });
}

Result<gpu::Buffer> createBuffer(const gpu::Device &device, gpu::BufferUsageFlags usage, Uint32 size,
                                 const char *name) {
    return device.createBuffer({.usage = usage, .size = size, .name = name});
}

// fills the left/right buffers and textures, and the index buffer
Result<void> uploadInitialData(const State &state) {
    auto left = makeCheckerboard(false);
    if(!left) return std::unexpected(left.error());
    auto right = makeCheckerboard(true);
    if(!right) return std::unexpected(right.error());

    const Uint32 vertexOffset = 0;
    const Uint32 indexOffset = vertexOffset + sizeof(VERTICES);
    const Uint32 leftImageOffset = indexOffset + sizeof(INDICES);
    const auto rightImageOffset = static_cast<Uint32>(leftImageOffset + left->size());
    const auto totalSize = static_cast<Uint32>(rightImageOffset + right->size());

    auto transfer = state.device.createTransferBuffer({.usage = gpu::TransferBufferUsage::upload, .size = totalSize});
    if(!transfer) return std::unexpected(transfer.error());

    {
        auto mapped = state.device.mapTransferBuffer(*transfer, false);
        if(!mapped) return std::unexpected(mapped.error());
        auto *bytes = static_cast<std::byte *>(*mapped);
        std::memcpy(bytes + vertexOffset, VERTICES.data(), sizeof(VERTICES));
        std::memcpy(bytes + indexOffset, INDICES.data(), sizeof(INDICES));
        std::memcpy(bytes + leftImageOffset, left->data(), left->size());
        std::memcpy(bytes + rightImageOffset, right->data(), right->size());
        state.device.unmapTransferBuffer(*transfer);
    }

    auto cmd = state.device.acquireCommandBuffer();
    if(!cmd) return std::unexpected(cmd.error());
    {
        auto copy = cmd->beginCopyPass();
        if(!copy) return std::unexpected(copy.error());

        copy->uploadToBuffer({.transfer_buffer = transfer->get(), .offset = vertexOffset},
                             {.buffer = state.leftVertexBuffer.get(), .offset = 0, .size = QUAD_BYTES}, false);
        copy->uploadToBuffer({.transfer_buffer = transfer->get(), .offset = vertexOffset + QUAD_BYTES},
                             {.buffer = state.rightVertexBuffer.get(), .offset = 0, .size = QUAD_BYTES}, false);
        copy->uploadToBuffer({.transfer_buffer = transfer->get(), .offset = indexOffset},
                             {.buffer = state.indexBuffer.get(), .offset = 0, .size = sizeof(INDICES)}, false);
        copy->uploadToTexture({.transfer_buffer = transfer->get(), .offset = leftImageOffset},
                              {.texture = state.leftTexture.get(), .w = IMAGE_SIZE, .h = IMAGE_SIZE, .d = 1}, false);
        copy->uploadToTexture({.transfer_buffer = transfer->get(), .offset = rightImageOffset},
                              {.texture = state.rightTexture.get(), .w = IMAGE_SIZE, .h = IMAGE_SIZE, .d = 1}, false);
    }
    return cmd->submit();
}

Result<AppResult> init(State *&state, std::span<char *> /*args*/) {
    if(auto ok = sdl3bind::init(INIT_FLAGS); !ok) return std::unexpected(ok.error());

    // whatever format the shaders were built for
    const auto formats = gpu::ShaderFormatFlags::fromNative(sdl3bind::toNative(shaders::texturedQuad_vert.format));
    auto device = gpu::Device::create(formats, cv::gpu_debug.getBool());
    if(!device) return std::unexpected(device.error());

    auto window = video::Window::create("Copy Consistency", cv::window_width.getInt(), cv::window_height.getInt(), {});
    if(!window) return std::unexpected(window.error());

    std::unique_ptr<State> owned{new State{.window = std::move(*window), .device = std::move(*device)}};
    if(auto ok = owned->device.claimWindow(owned->window); !ok) return std::unexpected(ok.error());
    owned->claimed = true;

    auto pipeline = createPipeline(owned->device, owned->window);
    if(!pipeline) return std::unexpected(pipeline.error());
    owned->pipeline = std::move(*pipeline);

    auto sampler = owned->device.createSampler({
        .address_mode_u = gpu::SamplerAddressMode::clamp_to_edge,
        .address_mode_v = gpu::SamplerAddressMode::clamp_to_edge,
        .address_mode_w = gpu::SamplerAddressMode::clamp_to_edge,
    });
    if(!sampler) return std::unexpected(sampler.error());
    owned->sampler = std::move(*sampler);

    const gpu::BufferUsageFlags vertexUsage{.vertex = true};
    auto vertexBuffer = createBuffer(owned->device, vertexUsage, QUAD_BYTES, "Vertex Buffer");
    auto leftVertexBuffer = createBuffer(owned->device, vertexUsage, QUAD_BYTES, "Left Vertex Buffer");
    auto rightVertexBuffer = createBuffer(owned->device, vertexUsage, QUAD_BYTES, "Right Vertex Buffer");
    auto indexBuffer = createBuffer(owned->device, {.index = true}, sizeof(INDICES), "Index Buffer");
    for(const auto *created : {&vertexBuffer, &leftVertexBuffer, &rightVertexBuffer, &indexBuffer}) {
        if(!*created) return std::unexpected(created->error());
    }
    owned->vertexBuffer = std::move(*vertexBuffer);
    owned->leftVertexBuffer = std::move(*leftVertexBuffer);
    owned->rightVertexBuffer = std::move(*rightVertexBuffer);
    owned->indexBuffer = std::move(*indexBuffer);

    auto texture = createImageTexture(owned->device, "Texture");
    auto leftTexture = createImageTexture(owned->device, "Left Texture");
    auto rightTexture = createImageTexture(owned->device, "Right Texture");
    for(const auto *created : {&texture, &leftTexture, &rightTexture}) {
        if(!*created) return std::unexpected(created->error());
    }
    owned->texture = std::move(*texture);
    owned->leftTexture = std::move(*leftTexture);
    owned->rightTexture = std::move(*rightTexture);

    if(auto ok = uploadInitialData(*owned); !ok) return std::unexpected(ok.error());

    state = owned.release();
    return AppResult::run;
}

// copies one side's contents into the shared buffer/texture, then draws the shared ones
Result<void> drawSide(const State &state, const gpu::CommandBuffer &cmd, const gpu::Buffer &vertices,
                      const gpu::Texture &image, const gpu::ColorTargetInfo &target) {
    {
        auto copy = cmd.beginCopyPass();
        if(!copy) return std::unexpected(copy.error());
        copy->bufferToBuffer({.buffer = vertices.get(), .offset = 0}, {.buffer = state.vertexBuffer.get(), .offset = 0},
                             QUAD_BYTES, false);
        copy->textureToTexture({.texture = image.get()}, {.texture = state.texture.get()}, IMAGE_SIZE, IMAGE_SIZE, 1,
                               false);
    }

    auto pass = cmd.beginRenderPass(std::span{&target, 1});
    if(!pass) return std::unexpected(pass.error());

    const std::array vertexBindings{gpu::BufferBinding{.buffer = state.vertexBuffer.get(), .offset = 0}};
    const std::array samplerBindings{
        gpu::TextureSamplerBinding{.texture = state.texture.get(), .sampler = state.sampler.get()}};

    pass->bindGraphicsPipeline(state.pipeline);
    pass->bindVertexBuffers(0, vertexBindings);
    pass->bindIndexBuffer({.buffer = state.indexBuffer.get(), .offset = 0}, gpu::IndexElementSize::indices_16bit);
    pass->bindFragmentSamplers(0, samplerBindings);
    pass->drawIndexedPrimitives(static_cast<Uint32>(INDICES.size()));
    return {};
}

Result<AppResult> iterate(State *state) {
    auto cmd = state->device.acquireCommandBuffer();
    if(!cmd) return std::unexpected(cmd.error());

    auto swapchain = cmd->waitAndAcquireSwapchainTexture(state->window);
    if(!swapchain) return std::unexpected(swapchain.error());

    if(swapchain->texture != nullptr) {
        gpu::ColorTargetInfo target{
            .texture = swapchain->texture,
            .clear_color = {0.f, 0.f, 0.f, 1.f},
            .load_op = gpu::LoadOp::clear,
            .store_op = gpu::StoreOp::store,
        };
        if(auto ok = drawSide(*state, *cmd, state->leftVertexBuffer, state->leftTexture, target); !ok)
            return std::unexpected(ok.error());

        // keep what the left side drew
        target.load_op = gpu::LoadOp::load;
        if(auto ok = drawSide(*state, *cmd, state->rightVertexBuffer, state->rightTexture, target); !ok)
            return std::unexpected(ok.error());
    }

    if(auto ok = cmd->submit(); !ok) return std::unexpected(ok.error());
    return AppResult::run;
}

AppResult event(State * /*state*/, const events::Event &event) {
    if(std::holds_alternative<events::Quit>(event) || std::holds_alternative<events::Terminating>(event))
        return AppResult::success;
    return AppResult::run;
}

void quit(State *state, AppResult /*result*/) {
    delete state;
    sdl3bind::quit(INIT_FLAGS);
}

}  // namespace

int runCopyConsistency(int argc, char *argv[]) {
    if(!shaders::texturedQuad_vert.format) {
        errorLog("the shaders were built as HLSL source, rebuild with a bytecode SDL3BIND_SHADER_FORMAT");
        return 1;
    }
    return sdl3bind::enterAppMainCallbacks<State, init, iterate, event, quit>(argc, argv);
}

}  // namespace Examples
