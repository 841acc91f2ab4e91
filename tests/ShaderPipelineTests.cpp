// Copyright (c) 2026, WH, All rights reserved.
#include "ShaderPipeline.h"

#include "EmbeddedShader.h"

#include <gtest/gtest.h>

#include <array>
#include <string>

using namespace ShaderPipe;

namespace {

bool contains(const std::string &haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(ShaderPipelineTest, InfersStageFromTheInnerExtension) {
    EXPECT_EQ(inferStage("shaders/quad.vert.hlsl"), Stage::vertex);
    EXPECT_EQ(inferStage("quad.frag.spv"), Stage::fragment);
    EXPECT_EQ(inferStage("blur.comp.hlsl"), Stage::compute);
    EXPECT_EQ(inferStage("plain.hlsl"), Stage::compute);
}

TEST(ShaderPipelineTest, InfersSourceFormat) {
    EXPECT_EQ(inferSourceFormat("quad.vert.spv"), SourceFormat::spirv);
    EXPECT_EQ(inferSourceFormat("quad.vert.hlsl"), SourceFormat::hlsl);
    EXPECT_EQ(inferSourceFormat("quad.vert"), SourceFormat::hlsl);
}

TEST(ShaderPipelineTest, ParsesFormatsIgnoringCase) {
    EXPECT_EQ(parseTargetFormat("DXIL"), TargetFormat::dxil);
    EXPECT_EQ(parseTargetFormat("msl"), TargetFormat::msl);
    EXPECT_EQ(parseTargetFormat("SpirV"), TargetFormat::spirv);
    EXPECT_EQ(parseTargetFormat("glsl"), std::nullopt);

    EXPECT_EQ(parseSourceFormat("HLSL"), SourceFormat::hlsl);
    EXPECT_EQ(parseSourceFormat("dxbc"), std::nullopt);
}

TEST(ShaderPipelineTest, CommandLineNames) {
    EXPECT_EQ(stageName(Stage::fragment), "fragment");
    EXPECT_EQ(sourceName(SourceFormat::spirv), "SPIRV");
    EXPECT_EQ(destName(TargetFormat::dxbc), "DXBC");
    EXPECT_EQ(extensionOf(TargetFormat::msl), "msl");
}

TEST(ShaderPipelineTest, SpirvToSpirvIsPassthrough) {
    EXPECT_FALSE(needsCrossCompile(SourceFormat::spirv, TargetFormat::spirv));
    EXPECT_TRUE(needsCrossCompile(SourceFormat::hlsl, TargetFormat::spirv));
    EXPECT_TRUE(needsCrossCompile(SourceFormat::spirv, TargetFormat::msl));
}

TEST(ShaderPipelineTest, CrossCompileCommand) {
    Options opts;
    opts.format = TargetFormat::msl;
    opts.shadercross = "/opt/bin/shadercross";

    const std::vector<std::string> expected{"/opt/bin/shadercross", "in.hlsl", "--source", "HLSL", "--entrypoint",
                                            "main", "--stage", "vertex", "--dest", "MSL", "--output", "out.msl"};
    EXPECT_EQ(crossCompileCommand(opts, "in.hlsl", SourceFormat::hlsl, Stage::vertex, "out.msl"), expected);

    opts.debug = true;
    const auto withDebug = crossCompileCommand(opts, "in.hlsl", SourceFormat::hlsl, Stage::vertex, "out.msl");
    ASSERT_EQ(withDebug.size(), expected.size() + 1);
    EXPECT_EQ(withDebug[10], "--debug");
    EXPECT_EQ(withDebug.back(), "out.msl");
}

TEST(ShaderPipelineTest, ReflectAndSpirvCommands) {
    const Options opts;
    const std::vector<std::string> reflect{"shadercross", "in.spv", "--source", "SPIRV", "--entrypoint", "main",
                                           "--stage",     "fragment", "--dest", "JSON", "--output", "in.json"};
    EXPECT_EQ(reflectCommand(opts, "in.spv", SourceFormat::spirv, Stage::fragment, "in.json"), reflect);

    EXPECT_EQ(spirvFixCommand(opts, "a.spv", "b.spv"),
              (std::vector<std::string>{"spirv-opt", "--remove-duplicates", "--skip-validation", "a.spv", "-o", "b.spv"}));
    EXPECT_EQ(spirvOptimizeCommand(opts, "b.spv", "c.spv"),
              (std::vector<std::string>{"spirv-opt", "-O", "b.spv", "-o", "c.spv"}));
}

TEST(ShaderPipelineTest, ParsesReflection) {
    const auto full = parseReflection(
        R"({"samplers": 1, "storage_textures": 2, "storage_buffers": 3, "uniform_buffers": 4, "inputs": []})");
    ASSERT_TRUE(full.has_value()) << full.error();
    EXPECT_EQ(*full, (Reflection{.samplers = 1, .storage_textures = 2, .storage_buffers = 3, .uniform_buffers = 4}));

    const auto partial = parseReflection(R"({"uniform_buffers": 1})");
    ASSERT_TRUE(partial.has_value()) << partial.error();
    EXPECT_EQ(*partial, (Reflection{.uniform_buffers = 1}));
}

TEST(ShaderPipelineTest, ParsesComputeReflection) {
    const auto compute = parseReflection(R"({
        "samplers": 0,
        "readonly_storage_textures": 1,
        "readonly_storage_buffers": 1,
        "readwrite_storage_textures": 3,
        "readwrite_storage_buffers": 2,
        "uniform_buffers": 1,
        "threadcount_x": 64,
        "threadcount_y": 4
    })");
    ASSERT_TRUE(compute.has_value()) << compute.error();
    EXPECT_EQ(compute->storage_textures, 1u);
    EXPECT_EQ(compute->storage_buffers, 1u);
    EXPECT_EQ(compute->readwrite_storage_textures, 3u);
    EXPECT_EQ(compute->readwrite_storage_buffers, 2u);
    EXPECT_EQ(compute->uniform_buffers, 1u);
    EXPECT_EQ(compute->threadcount_x, 64u);
    EXPECT_EQ(compute->threadcount_y, 4u);
    // not reported: a single thread along that axis
    EXPECT_EQ(compute->threadcount_z, 1u);
}

TEST(ShaderPipelineTest, GraphicsReflectionHasNoComputeCounts) {
    const auto graphics = parseReflection(R"({"samplers": 2, "storage_buffers": 1})");
    ASSERT_TRUE(graphics.has_value()) << graphics.error();
    EXPECT_EQ(graphics->readwrite_storage_buffers, 0u);
    EXPECT_EQ(graphics->threadcount_x, 1u);
    EXPECT_EQ(graphics->threadcount_z, 1u);
}

TEST(ShaderPipelineTest, RejectsBadReflection) {
    EXPECT_FALSE(parseReflection("{not json").has_value());
    EXPECT_FALSE(parseReflection("[1, 2]").has_value());
    EXPECT_FALSE(parseReflection(R"({"samplers": "lots"})").has_value());
}

TEST(ShaderPipelineTest, Identifiers) {
    EXPECT_TRUE(isValidIdentifier("texturedQuad_vert"));
    EXPECT_TRUE(isValidIdentifier("_x1"));
    EXPECT_FALSE(isValidIdentifier(""));
    EXPECT_FALSE(isValidIdentifier("1quad"));
    EXPECT_FALSE(isValidIdentifier("quad.vert"));
}

TEST(ShaderPipelineTest, EmbedHeaderForBinaryFormats) {
    const std::array<unsigned char, 3> code{0x03, 0x02, 0x23};
    const std::string header =
        generateEmbedHeader("quad_vert", "quad.vert.hlsl", code, TargetFormat::spirv, Stage::vertex,
                            Reflection{.samplers = 1, .uniform_buffers = 2});

    EXPECT_TRUE(contains(header, "#pragma once"));
    EXPECT_TRUE(contains(header, "namespace shaders {"));
    EXPECT_TRUE(contains(header, "inline constexpr unsigned char quad_vert_code[] = {\n    0x03,0x02,0x23,\n};"));
    EXPECT_TRUE(contains(header, ".code = std::span<const unsigned char>{quad_vert_code, 3},"));
    EXPECT_TRUE(contains(header, ".format = sdl3bind::gpu::ShaderFormat::spirv,"));
    EXPECT_TRUE(contains(header, ".stage = sdl3bind::gpu::ShaderStage::vertex,"));
    EXPECT_TRUE(contains(header, ".num_samplers = 1,"));
    EXPECT_TRUE(contains(header, ".num_uniform_buffers = 2,"));
}

TEST(ShaderPipelineTest, EmbedHeaderCarriesComputeCounts) {
    const std::array<unsigned char, 1> code{0x07};
    const std::string header = generateEmbedHeader(
        "blur", "blur.comp.hlsl", code, TargetFormat::dxil, Stage::compute,
        Reflection{.storage_buffers = 1, .readwrite_storage_textures = 1, .readwrite_storage_buffers = 2,
                   .threadcount_x = 64, .threadcount_y = 2});

    EXPECT_TRUE(contains(header, ".stage = std::nullopt,"));
    EXPECT_TRUE(contains(header, ".num_storage_buffers = 1,"));
    EXPECT_TRUE(contains(header, ".num_readwrite_storage_textures = 1,"));
    EXPECT_TRUE(contains(header, ".num_readwrite_storage_buffers = 2,"));
    EXPECT_TRUE(contains(header, ".threadcount_x = 64,"));
    EXPECT_TRUE(contains(header, ".threadcount_y = 2,"));
    EXPECT_TRUE(contains(header, ".threadcount_z = 1,"));

    // graphics stages leave the compute fields at their defaults
    const std::string vertex =
        generateEmbedHeader("quad", "quad.vert.hlsl", code, TargetFormat::dxil, Stage::vertex, Reflection{});
    EXPECT_FALSE(contains(vertex, "threadcount"));
}

TEST(ShaderPipelineTest, EmbedHeaderTerminatesTextFormats) {
    const std::array<unsigned char, 2> code{'h', 'i'};
    const std::string msl =
        generateEmbedHeader("blur", "blur.comp.hlsl", code, TargetFormat::msl, Stage::compute, Reflection{});

    // the zero is in the array but not in the span
    EXPECT_TRUE(contains(msl, "0x68,0x69,0x00,"));
    EXPECT_TRUE(contains(msl, "{blur_code, 2}"));
    EXPECT_TRUE(contains(msl, ".stage = std::nullopt,"));

    const std::string hlsl =
        generateEmbedHeader("blur", "blur.comp.hlsl", code, TargetFormat::hlsl, Stage::compute, Reflection{});
    EXPECT_TRUE(contains(hlsl, ".format = std::nullopt,"));
}

TEST(ShaderPipelineTest, RunRejectsBadInput) {
    Options opts;
    opts.input = "quad.vert.hlsl";
    opts.name = "not an identifier";
    auto result = run(opts);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(contains(result.error(), "is not a valid identifier"));

    opts.name = "quad_vert";
    opts.input = "/nonexistent/quad.vert.hlsl";
    result = run(opts);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(contains(result.error(), "doesn't exist"));
}

namespace {

constexpr unsigned char COMPUTE_CODE[] = {0x03, 0x02, 0x23, 0x07};

constexpr sdl3bind::gpu::EmbeddedShader COMPUTE_SHADER{
    .code = std::span<const unsigned char>{COMPUTE_CODE, 4},
    .format = sdl3bind::gpu::ShaderFormat::spirv,
    .stage = std::nullopt,
    .num_samplers = 1,
    .num_storage_textures = 2,
    .num_storage_buffers = 3,
    .num_uniform_buffers = 1,
    .num_readwrite_storage_textures = 4,
    .num_readwrite_storage_buffers = 5,
    .threadcount_x = 8,
    .threadcount_y = 8,
    .threadcount_z = 1,
};

}  // namespace

TEST(EmbeddedShaderTest, ComputeShaderBecomesPipelineInfo) {
    const auto info = sdl3bind::gpu::toComputePipelineCreateInfo(COMPUTE_SHADER);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->code.data(), COMPUTE_CODE);
    EXPECT_EQ(info->code.size(), 4u);
    EXPECT_STREQ(info->entrypoint, "main");
    EXPECT_EQ(info->format, sdl3bind::gpu::ShaderFormat::spirv);
    EXPECT_EQ(info->num_samplers, 1u);
    EXPECT_EQ(info->num_readonly_storage_textures, 2u);
    EXPECT_EQ(info->num_readonly_storage_buffers, 3u);
    EXPECT_EQ(info->num_readwrite_storage_textures, 4u);
    EXPECT_EQ(info->num_readwrite_storage_buffers, 5u);
    EXPECT_EQ(info->num_uniform_buffers, 1u);
    EXPECT_EQ(info->threadcount_x, 8u);
    EXPECT_EQ(info->threadcount_y, 8u);
    EXPECT_EQ(info->threadcount_z, 1u);

    // not a graphics stage
    EXPECT_FALSE(sdl3bind::gpu::toShaderCreateInfo(COMPUTE_SHADER).has_value());
}

TEST(EmbeddedShaderTest, GraphicsShaderIsNoComputePipeline) {
    sdl3bind::gpu::EmbeddedShader fragment = COMPUTE_SHADER;
    fragment.stage = sdl3bind::gpu::ShaderStage::fragment;
    EXPECT_FALSE(sdl3bind::gpu::toComputePipelineCreateInfo(fragment).has_value());

    const auto info = sdl3bind::gpu::toShaderCreateInfo(fragment);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->stage, sdl3bind::gpu::ShaderStage::fragment);
    EXPECT_EQ(info->num_storage_buffers, 3u);

    // HLSL source text can't be loaded either way
    sdl3bind::gpu::EmbeddedShader text = COMPUTE_SHADER;
    text.format = std::nullopt;
    EXPECT_FALSE(sdl3bind::gpu::toComputePipelineCreateInfo(text).has_value());
}
