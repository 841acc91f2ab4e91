// Copyright (c) 2026, WH, All rights reserved.
#include "Handle.h"

#include <gtest/gtest.h>

#include <utility>
#include <vector>

using namespace sdl3bind;

namespace {

std::vector<int> g_releasedIds;
void releaseId(int id) { g_releasedIds.push_back(id); }

struct FakeParent {
    std::vector<int *> released;
};
void releaseChild(FakeParent *parent, int *child) { parent->released.push_back(child); }

int g_deleted{0};
void deleteInt(int *p) {
    g_deleted++;
    delete p;
}

using TestId = UniqueId<int, releaseId>;
using TestChild = ParentOwned<FakeParent, int, releaseChild>;

}  // namespace

TEST(HandleTest, UniqueIdReleasesOnce) {
    g_releasedIds.clear();
    {
        TestId a{7};
        EXPECT_TRUE(a);
        TestId b{std::move(a)};
        EXPECT_FALSE(a);  // NOLINT(bugprone-use-after-move)
        EXPECT_EQ(b.get(), 7);
    }
    ASSERT_EQ(g_releasedIds.size(), 1u);
    EXPECT_EQ(g_releasedIds[0], 7);
}

TEST(HandleTest, UniqueIdReleaseGivesUpOwnership) {
    g_releasedIds.clear();
    {
        TestId a{3};
        EXPECT_EQ(a.release(), 3);
        EXPECT_FALSE(a);
    }
    EXPECT_TRUE(g_releasedIds.empty());
}

TEST(HandleTest, UniqueIdMoveAssignReleasesOld) {
    g_releasedIds.clear();
    TestId a{1};
    TestId b{2};
    a = std::move(b);
    ASSERT_EQ(g_releasedIds.size(), 1u);
    EXPECT_EQ(g_releasedIds[0], 1);
    EXPECT_EQ(a.get(), 2);

    a.reset();
    EXPECT_EQ(g_releasedIds.size(), 2u);
    EXPECT_FALSE(a);
}

TEST(HandleTest, UniquePtrUsesFunctionDeleter) {
    g_deleted = 0;
    {
        UniquePtr<int, deleteInt> p{new int{5}};
        EXPECT_EQ(*p, 5);
    }
    EXPECT_EQ(g_deleted, 1);
}

TEST(HandleTest, ParentOwnedReleasesThroughParent) {
    FakeParent parent;
    int child = 0;
    {
        TestChild owned{&parent, &child};
        EXPECT_EQ(owned.parent(), &parent);
        TestChild moved = std::move(owned);
        EXPECT_FALSE(owned);  // NOLINT(bugprone-use-after-move)
        EXPECT_EQ(moved.get(), &child);
    }
    ASSERT_EQ(parent.released.size(), 1u);
    EXPECT_EQ(parent.released[0], &child);
}

TEST(HandleTest, ParentOwnedDefaultIsEmpty) {
    const TestChild empty;
    EXPECT_FALSE(empty);
    EXPECT_EQ(empty.get(), nullptr);
    EXPECT_EQ(empty.parent(), nullptr);
}
