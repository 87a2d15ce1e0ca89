#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include "wbind_arena.hpp"

static const size_t A = alignof(std::max_align_t);

TEST(ArenaTest, RoundsToMaxAlign) {
    EXPECT_EQ(WbindArenaHost::round_up(0), A);
    EXPECT_EQ(WbindArenaHost::round_up(1), A);
    EXPECT_EQ(WbindArenaHost::round_up(A), A);
    EXPECT_EQ(WbindArenaHost::round_up(A + 1), 2 * A);
}

TEST(ArenaTest, BlocksAreAlignedAndOwned) {
    WbindArenaHost arena(64 * A);
    void* p = arena.allocate(3);
    void* q = arena.allocate(5);
    ASSERT_NE(p, nullptr);
    ASSERT_NE(q, nullptr);
    EXPECT_EQ(reinterpret_cast<uintptr_t>(p) % A, 0u);
    EXPECT_EQ(reinterpret_cast<uintptr_t>(q) % A, 0u);
    EXPECT_TRUE(arena.owns(p));
    EXPECT_TRUE(arena.owns(q));

    int outside = 0;
    EXPECT_FALSE(arena.owns(&outside));
    EXPECT_EQ(arena.get_total_free(), arena.get_capacity() - 2 * A);
}

TEST(ArenaTest, BestFitPicksSmallestHole) {
    WbindArenaHost arena(64 * A);
    void* big = arena.allocate(4 * A);
    void* sep1 = arena.allocate(A);
    void* small = arena.allocate(2 * A);
    void* sep2 = arena.allocate(A);
    ASSERT_NE(sep2, nullptr);

    arena.release(big, 4 * A);
    arena.release(small, 2 * A);

    // exact fit for the small hole, then the 4*A hole beats the large tail
    EXPECT_EQ(arena.allocate(2 * A), small);
    EXPECT_EQ(arena.allocate(3 * A), big);

    arena.release(sep1, A);
    arena.release(sep2, A);
}

TEST(ArenaTest, ReleaseCoalescesNeighbours) {
    WbindArenaHost arena(64 * A);
    void* x = arena.allocate(4 * A);
    void* y = arena.allocate(4 * A);
    void* z = arena.allocate(4 * A);

    arena.release(y, 4 * A);
    arena.release(x, 4 * A);
    arena.release(z, 4 * A);

    EXPECT_EQ(arena.get_free_block_count(), 1u);
    EXPECT_EQ(arena.get_total_free(), arena.get_capacity());

    // the whole region is one block again
    void* all = arena.allocate(arena.get_capacity());
    EXPECT_EQ(all, x);
    arena.release(all, arena.get_capacity());
}

TEST(ArenaTest, ExhaustionReturnsNull) {
    WbindArenaHost arena(8 * A);
    void* all = arena.allocate(8 * A);
    ASSERT_NE(all, nullptr);
    EXPECT_EQ(arena.allocate(1), nullptr);
    EXPECT_EQ(arena.get_total_free(), 0u);

    arena.release(all, 8 * A);
    EXPECT_NE(arena.allocate(1), nullptr);
}

TEST(ArenaTest, ResizeGrowsInPlaceWhenNeighbourIsFree) {
    WbindArenaHost arena(64 * A);
    char* p = static_cast<char*>(arena.allocate(A));
    std::memcpy(p, "abc", 4);

    EXPECT_EQ(arena.resize(p, A, 8 * A), p);
    EXPECT_STREQ(p, "abc");
    EXPECT_EQ(arena.get_total_free(), arena.get_capacity() - 8 * A);
}

TEST(ArenaTest, ResizeMovesWhenBlocked) {
    WbindArenaHost arena(64 * A);
    char* p = static_cast<char*>(arena.allocate(2 * A));
    void* wall = arena.allocate(A);
    std::memcpy(p, "payload", 8);

    char* moved = static_cast<char*>(arena.resize(p, 2 * A, 6 * A));
    ASSERT_NE(moved, nullptr);
    EXPECT_NE(moved, p);
    EXPECT_STREQ(moved, "payload");
    EXPECT_EQ(arena.get_total_free(), arena.get_capacity() - 7 * A);

    arena.release(moved, 6 * A);
    arena.release(wall, A);
    EXPECT_EQ(arena.get_free_block_count(), 1u);
}

TEST(ArenaTest, ResizeShrinksInPlace) {
    WbindArenaHost arena(64 * A);
    void* p = arena.allocate(8 * A);
    void* wall = arena.allocate(A);

    EXPECT_EQ(arena.resize(p, 8 * A, A), p);
    EXPECT_EQ(arena.get_total_free(), arena.get_capacity() - 2 * A);

    // the tail is reusable
    void* q = arena.allocate(7 * A);
    EXPECT_EQ(q, static_cast<char*>(p) + A);

    arena.release(q, 7 * A);
    arena.release(p, A);
    arena.release(wall, A);
    EXPECT_EQ(arena.get_total_free(), arena.get_capacity());
}

TEST(ArenaTest, FailedGrowLeavesBlockIntact) {
    WbindArenaHost arena(4 * A);
    char* p = static_cast<char*>(arena.allocate(A));
    void* wall = arena.allocate(A);
    std::memcpy(p, "keep", 5);

    EXPECT_EQ(arena.resize(p, A, 3 * A), nullptr);
    EXPECT_STREQ(p, "keep");
    EXPECT_EQ(arena.get_total_free(), 2 * A);

    arena.release(wall, A);
    arena.release(p, A);
}

TEST(ArenaTest, ZeroCapacityThrows) {
    EXPECT_THROW(WbindArenaHost arena(0), std::bad_alloc);
}

TEST(ArenaTest, SizesNearSizeMaxAreRefused) {
    const size_t huge = SIZE_MAX - 4;
    EXPECT_EQ(WbindArenaHost::round_up(huge), 0u);
    EXPECT_EQ(WbindArenaHost::round_up(SIZE_MAX), 0u);

    WbindArenaHost arena(8 * A);
    EXPECT_EQ(arena.allocate(huge), nullptr);
    EXPECT_EQ(arena.get_total_free(), arena.get_capacity());

    char* p = static_cast<char*>(arena.allocate(A));
    ASSERT_NE(p, nullptr);
    std::memcpy(p, "keep", 5);
    EXPECT_EQ(arena.resize(p, A, huge), nullptr);
    EXPECT_STREQ(p, "keep");
    EXPECT_EQ(arena.get_total_free(), arena.get_capacity() - A);

    // The block is still allocated: a fresh request lands elsewhere.
    void* q = arena.allocate(A);
    EXPECT_NE(q, p);
    arena.release(q, A);
    arena.release(p, A);
    EXPECT_EQ(arena.get_total_free(), arena.get_capacity());
}
