// Copyright (c) 2026, WH, All rights reserved.
#include "BindingGenerator.h"

#include <gtest/gtest.h>

#include <string>

using namespace BindGen;

namespace {

constexpr std::string_view SAMPLE_API = R"yaml(
module: Sample
namespace: sdl3bind::sample
system_includes:
  - SDL3/SDL_gpu.h
includes:
  - PixelsApi.h

enums:
  - name: CompareOp
    native: SDL_GPUCompareOp
    invalid: SDL_GPU_COMPAREOP_INVALID
    doc: depth/stencil comparison
    values:
      - [never, SDL_GPU_COMPAREOP_NEVER]
      - [less, SDL_GPU_COMPAREOP_LESS]
  - name: CullMode
    native: SDL_GPUCullMode
    values:
      - [none, SDL_GPU_CULLMODE_NONE]
      - [front, SDL_GPU_CULLMODE_FRONT]

flags:
  - name: BufferUsageFlags
    native: SDL_GPUBufferUsageFlags
    bits:
      - [vertex, SDL_GPU_BUFFERUSAGE_VERTEX]
      - [index, SDL_GPU_BUFFERUSAGE_INDEX]

structs:
  - name: BufferBinding
    native: SDL_GPUBufferBinding
    fields:
      - [buffer, "SDL_GPUBuffer *"]
      - [offset, Uint32]
      - [renamed, Uint32, padding]
)yaml";

bool contains(const std::string &haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(BindingGeneratorTest, ParsesEverySection) {
    const auto api = parseApiString(SAMPLE_API);
    ASSERT_TRUE(api.has_value()) << api.error();

    EXPECT_EQ(api->module, "Sample");
    EXPECT_EQ(api->ns, "sdl3bind::sample");
    EXPECT_EQ(api->systemIncludes, (std::vector<std::string>{"SDL3/SDL_gpu.h"}));
    EXPECT_EQ(api->includes, (std::vector<std::string>{"PixelsApi.h"}));

    ASSERT_EQ(api->enums.size(), 2u);
    EXPECT_EQ(api->enums[0].name, "CompareOp");
    EXPECT_EQ(api->enums[0].invalid, "SDL_GPU_COMPAREOP_INVALID");
    EXPECT_EQ(api->enums[0].doc, "depth/stencil comparison");
    ASSERT_EQ(api->enums[0].values.size(), 2u);
    EXPECT_EQ(api->enums[0].values[1].name, "less");
    EXPECT_EQ(api->enums[0].values[1].native, "SDL_GPU_COMPAREOP_LESS");
    EXPECT_FALSE(api->enums[1].invalid.has_value());

    ASSERT_EQ(api->flags.size(), 1u);
    EXPECT_EQ(api->flags[0].bits.size(), 2u);

    ASSERT_EQ(api->structs.size(), 1u);
    ASSERT_EQ(api->structs[0].fields.size(), 3u);
    EXPECT_EQ(api->structs[0].fields[0].type, "SDL_GPUBuffer *");
    // the native field name defaults to the host one
    EXPECT_EQ(api->structs[0].fields[1].native, "offset");
    EXPECT_EQ(api->structs[0].fields[2].native, "padding");
}

TEST(BindingGeneratorTest, GeneratesEnumsWithTraits) {
    const auto api = parseApiString(SAMPLE_API);
    ASSERT_TRUE(api.has_value()) << api.error();
    const std::string header = generateHeader(*api);

    EXPECT_TRUE(contains(header, "#include <SDL3/SDL_gpu.h>"));
    EXPECT_TRUE(contains(header, "#include \"PixelsApi.h\""));
    EXPECT_TRUE(contains(header, "namespace sdl3bind::sample {"));

    EXPECT_TRUE(contains(header, "enum class CompareOp : std::underlying_type_t<SDL_GPUCompareOp> {"));
    EXPECT_TRUE(contains(header, "    less = SDL_GPU_COMPAREOP_LESS,"));
    EXPECT_TRUE(contains(header, "struct NativeEnum<sdl3bind::sample::CompareOp> {"));
    EXPECT_TRUE(contains(header, "static constexpr native_type invalid = SDL_GPU_COMPAREOP_INVALID;"));
    EXPECT_TRUE(contains(header, "std::optional<sdl3bind::sample::CompareOp> fromNative(native_type value)"));

    // no sentinel: plain casts, no optional
    EXPECT_TRUE(contains(header, "static constexpr sdl3bind::sample::CullMode fromNative(native_type value)"));
    EXPECT_TRUE(contains(header, "static constexpr bool has_invalid = false;"));
}

TEST(BindingGeneratorTest, GeneratesFlagsAndStructs) {
    const auto api = parseApiString(SAMPLE_API);
    ASSERT_TRUE(api.has_value()) << api.error();
    const std::string header = generateHeader(*api);

    EXPECT_TRUE(contains(header, "struct BufferUsageFlags {"));
    EXPECT_TRUE(contains(header, "    bool vertex{false};"));
    EXPECT_TRUE(contains(header, "ret.index = (value & SDL_GPU_BUFFERUSAGE_INDEX) != 0;"));
    EXPECT_TRUE(contains(header, "if(this->vertex) ret |= SDL_GPU_BUFFERUSAGE_VERTEX;"));

    EXPECT_TRUE(contains(header, "struct BufferBinding {"));
    EXPECT_TRUE(contains(header, "    SDL_GPUBuffer * buffer{};"));
    EXPECT_TRUE(contains(header, "static_assert(sizeof(BufferBinding) == sizeof(SDL_GPUBufferBinding));"));
    EXPECT_TRUE(
        contains(header, "static_assert(offsetof(BufferBinding, renamed) == offsetof(SDL_GPUBufferBinding, padding));"));
    EXPECT_TRUE(contains(header, "return std::bit_cast<SDL_GPUBufferBinding>(value);"));
}

TEST(BindingGeneratorTest, RejectsMissingIdentity) {
    const auto api = parseApiString("enums: []\n");
    ASSERT_FALSE(api.has_value());
    EXPECT_NE(api.error().find("'module' and 'namespace' are required"), std::string::npos);
}

TEST(BindingGeneratorTest, RejectsMalformedYaml) {
    const auto api = parseApiString("module: [unterminated\n");
    ASSERT_FALSE(api.has_value());
    EXPECT_NE(api.error().find("YAML error"), std::string::npos);
}

TEST(BindingGeneratorTest, RejectsBadPairs) {
    const auto api = parseApiString(R"yaml(
module: Bad
namespace: sdl3bind
enums:
  - name: Broken
    native: SDL_Broken
    values:
      - just_a_name
)yaml");
    ASSERT_FALSE(api.has_value());
    EXPECT_NE(api.error().find("Broken"), std::string::npos);
}

TEST(BindingGeneratorTest, ValidateCatchesDuplicates) {
    ApiDesc api;
    api.module = "Dup";
    api.ns = "sdl3bind";
    api.enums.push_back({.name = "Thing", .native = "SDL_Thing", .values = {{"a", "SDL_A"}}});
    api.flags.push_back({.name = "Thing", .native = "SDL_ThingFlags", .bits = {{"b", "SDL_B"}}});
    EXPECT_EQ(validate(api), "duplicate type name 'Thing'");

    api.flags.clear();
    api.enums[0].values.push_back({"a", "SDL_OTHER"});
    EXPECT_EQ(validate(api), "enum Thing: duplicate value 'a'");

    api.enums[0].values.back().name = "c";
    api.enums[0].values.back().native = "SDL_A";
    EXPECT_EQ(validate(api), "enum Thing: native constant SDL_A is used twice");
}

TEST(BindingGeneratorTest, ValidateCatchesEmptyTypes) {
    ApiDesc api;
    api.module = "Empty";
    api.ns = "sdl3bind";
    api.enums.push_back({.name = "Nothing", .native = "SDL_Nothing"});
    EXPECT_EQ(validate(api), "enum Nothing has no values");

    api.enums.clear();
    api.structs.push_back({.name = "Hollow", .native = "SDL_Hollow"});
    EXPECT_EQ(validate(api), "struct Hollow has no fields");

    api.structs.clear();
    EXPECT_EQ(validate(api), std::nullopt);
}
