// Copyright (c) 2026, WH, All rights reserved.
#include "GPUCommandBuffer.h"

#include <gtest/gtest.h>

#include <type_traits>
#include <utility>

using namespace sdl3bind::gpu;

// a second copy could submit the same native command buffer twice
static_assert(!std::is_copy_constructible_v<CommandBuffer>);
static_assert(!std::is_copy_assignable_v<CommandBuffer>);
static_assert(std::is_nothrow_move_constructible_v<CommandBuffer>);
static_assert(std::is_nothrow_move_assignable_v<CommandBuffer>);

static_assert(!std::is_copy_constructible_v<RenderPass>);
static_assert(!std::is_copy_constructible_v<CopyPass>);
static_assert(!std::is_copy_constructible_v<ComputePass>);

TEST(CommandBufferTest, EmptyBufferHasNothingToFinish) {
    CommandBuffer empty{nullptr, nullptr};
    EXPECT_EQ(empty.get(), nullptr);
    EXPECT_FALSE(empty.hasSwapchainTexture());

    CommandBuffer moved{std::move(empty)};
    EXPECT_EQ(moved.get(), nullptr);
    EXPECT_FALSE(moved.hasSwapchainTexture());

    CommandBuffer assigned{nullptr, nullptr};
    assigned = std::move(moved);
    EXPECT_EQ(assigned.get(), nullptr);
}
