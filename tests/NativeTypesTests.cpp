// Copyright (c) 2026, WH, All rights reserved.
// generated enums, flag sets and mirrored structs against their native counterparts
#include "config.h"

#include "AudioApi.h"
#include "GPUApi.h"
#include "InitApi.h"
#include "MessageBoxApi.h"
#include "PixelsApi.h"
#include "RectApi.h"
#include "TrayApi.h"
#include "VideoApi.h"

#ifdef SDL3BIND_FEATURE_TTF
#include "TTFApi.h"
#endif

#include <gtest/gtest.h>

#include <optional>

using namespace sdl3bind;

namespace {

template <typename E>
class EnumRoundTripTest : public ::testing::Test {};

using BoundEnums = ::testing::Types<
    AppResult, PixelFormat, audio::AudioFormat, video::SystemTheme, video::DisplayOrientation,
    video::FlashOperation, message_box::ColorType, gpu::PrimitiveType, gpu::LoadOp, gpu::StoreOp,
    gpu::IndexElementSize, gpu::TextureFormat, gpu::TextureType, gpu::SampleCount, gpu::CubeMapFace,
    gpu::TransferBufferUsage, gpu::ShaderStage, gpu::ShaderFormat, gpu::VertexElementFormat, gpu::VertexInputRate,
    gpu::FillMode, gpu::CullMode, gpu::FrontFace, gpu::CompareOp, gpu::StencilOp, gpu::BlendOp, gpu::BlendFactor,
    gpu::Filter, gpu::SamplerMipmapMode, gpu::SamplerAddressMode, gpu::PresentMode, gpu::SwapchainComposition
#ifdef SDL3BIND_FEATURE_TTF
    ,
    ttf::Hinting, ttf::HorizontalAlignment, ttf::Direction
#endif
    >;

TYPED_TEST_SUITE(EnumRoundTripTest, BoundEnums);

template <typename F>
class FlagsRoundTripTest : public ::testing::Test {};

using BoundFlags = ::testing::Types<InitFlags, video::WindowFlags, message_box::Flags, message_box::ButtonFlags,
                                    tray::EntryFlags, gpu::TextureUsageFlags, gpu::BufferUsageFlags,
                                    gpu::ColorComponentFlags, gpu::ShaderFormatFlags
#ifdef SDL3BIND_FEATURE_TTF
                                    ,
                                    ttf::FontStyleFlags
#endif
                                    >;

TYPED_TEST_SUITE(FlagsRoundTripTest, BoundFlags);

}  // namespace

TYPED_TEST(EnumRoundTripTest, EveryValueRoundTrips) {
    ASSERT_FALSE(NativeEnum<TypeParam>::values.empty());
    for(const TypeParam value : NativeEnum<TypeParam>::values) {
        EXPECT_EQ(fromNative<TypeParam>(toNative(value)), value) << NativeEnum<TypeParam>::name;
    }
}

TYPED_TEST(FlagsRoundTripTest, FullMaskRoundTrips) {
    const auto all = TypeParam::fromNative(TypeParam::mask);
    EXPECT_EQ(all.toNative(), TypeParam::mask);
    EXPECT_EQ(TypeParam::fromNative(all.toNative()), all);

    using Native = typename TypeParam::native_type;
    EXPECT_EQ(TypeParam::fromNative(Native{0}), TypeParam{});
    EXPECT_EQ(TypeParam{}.toNative(), Native{0});
}

TEST(NativeEnumTest, SentinelMapsToAbsent) {
    EXPECT_EQ(fromNative<gpu::BlendFactor>(SDL_GPU_BLENDFACTOR_INVALID), std::nullopt);
    EXPECT_EQ(toNative(std::optional<gpu::BlendFactor>{}), SDL_GPU_BLENDFACTOR_INVALID);

    EXPECT_EQ(fromNative<PixelFormat>(SDL_PIXELFORMAT_UNKNOWN), std::nullopt);
    EXPECT_EQ(fromNative<audio::AudioFormat>(SDL_AUDIO_UNKNOWN), std::nullopt);
}

TEST(NativeEnumTest, KnownValuesMapToTheirConstants) {
    EXPECT_EQ(fromNative<gpu::BlendFactor>(SDL_GPU_BLENDFACTOR_ONE_MINUS_SRC_ALPHA),
              gpu::BlendFactor::one_minus_src_alpha);
    EXPECT_EQ(toNative(gpu::BlendFactor::one_minus_src_alpha), SDL_GPU_BLENDFACTOR_ONE_MINUS_SRC_ALPHA);
    EXPECT_EQ(toNative(AppResult::failure), SDL_APP_FAILURE);
}

TEST(NativeEnumTest, UnlistedNativeValueIsAbsent) {
    // not a pixel format SDL knows either
    EXPECT_EQ(fromNative<PixelFormat>(static_cast<SDL_PixelFormat>(0x7fffffff)), std::nullopt);
}

TEST(NativeEnumTest, TraitsDescribeTheEnum) {
    static_assert(NativeEnum<gpu::BlendFactor>::has_invalid);
    static_assert(!NativeEnum<gpu::CullMode>::has_invalid);
    EXPECT_EQ(NativeEnum<gpu::BlendFactor>::name, "BlendFactor");
    EXPECT_FALSE(NativeEnum<gpu::CompareOp>::values.empty());
}

TEST(NativeFlagsTest, FromNativeSetsMatchingBits) {
    const auto flags = video::WindowFlags::fromNative(SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIDDEN);
    EXPECT_TRUE(flags.resizable);
    EXPECT_TRUE(flags.hidden);
    EXPECT_FALSE(flags.fullscreen);
    EXPECT_FALSE(flags.borderless);
    EXPECT_EQ(flags.toNative(), SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIDDEN);
}

TEST(NativeFlagsTest, DesignatedBitsMatchTheConstants) {
    const InitFlags init{.video = true, .events = true};
    EXPECT_EQ(init.toNative(), SDL_INIT_VIDEO | SDL_INIT_EVENTS);
    EXPECT_EQ(InitFlags::fromNative(init.toNative()), init);
}

TEST(NativeFlagsTest, UnknownBitsAreDropped) {
    const SDL_GPUShaderFormat native = SDL_GPU_SHADERFORMAT_SPIRV | (1u << 30);
    const auto formats = gpu::ShaderFormatFlags::fromNative(native);
    EXPECT_TRUE(formats.spirv);
    EXPECT_EQ(formats.toNative(), SDL_GPU_SHADERFORMAT_SPIRV);
}

TEST(NativeStructTest, RectConvertsBitForBit) {
    const Rect rect{.x = 1, .y = 2, .w = 30, .h = 40};
    const SDL_Rect native = toNative(rect);
    EXPECT_EQ(native.x, 1);
    EXPECT_EQ(native.y, 2);
    EXPECT_EQ(native.w, 30);
    EXPECT_EQ(native.h, 40);
    EXPECT_EQ(fromNative(native), rect);
}

TEST(NativeStructTest, EnumFieldsDefaultToTheSentinel) {
    const gpu::ColorTargetBlendState state{};
    const SDL_GPUColorTargetBlendState native = toNative(state);
    EXPECT_EQ(native.src_color_blendfactor, SDL_GPU_BLENDFACTOR_INVALID);
    EXPECT_EQ(native.color_blend_op, SDL_GPU_BLENDOP_INVALID);
    EXPECT_FALSE(native.enable_blend);
}

TEST(NativeStructTest, NestedStructsKeepTheirFields) {
    const gpu::ColorTargetDescription desc{
        .format = gpu::TextureFormat::r8g8b8a8_unorm,
        .blend_state = {.src_color_blendfactor = gpu::BlendFactor::src_alpha, .enable_blend = true},
    };
    const SDL_GPUColorTargetDescription native = toNative(desc);
    EXPECT_EQ(native.format, SDL_GPU_TEXTUREFORMAT_R8G8B8A8_UNORM);
    EXPECT_EQ(native.blend_state.src_color_blendfactor, SDL_GPU_BLENDFACTOR_SRC_ALPHA);
    EXPECT_TRUE(native.blend_state.enable_blend);
}

TEST(NativeStructTest, AudioSpecLayout) {
    const audio::AudioSpec spec{.format = audio::AudioFormat::s16le, .channels = 2, .freq = 48000};
    const SDL_AudioSpec native = toNative(spec);
    EXPECT_EQ(native.format, SDL_AUDIO_S16LE);
    EXPECT_EQ(native.channels, 2);
    EXPECT_EQ(native.freq, 48000);
}
