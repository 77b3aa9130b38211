//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/runtime/OffHeapArenaTests.cpp
// Purpose: First-fit reuse, capacity exhaustion, defragmentation and the
//          byte-accounting invariant of the off-heap arena.
// Key invariants: usage().allocated + usage().free == usage().total.
// Ownership/Lifetime: Tests own their arenas.
//
//===----------------------------------------------------------------------===//

#include "runtime/OffHeapArena.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <string>

using namespace pulse::runtime;

namespace
{
void expectBalanced(const OffHeapArena &arena)
{
    const OffHeapUsage u = arena.usage();
    EXPECT_EQ(u.allocated + u.free, u.total);
}
} // namespace

TEST(PulseOffHeapArena, FreedBlockIsReusedWithSameId)
{
    OffHeapArena arena(1000);
    auto a = arena.allocate(100);
    auto b = arena.allocate(100);
    auto c = arena.allocate(100);
    ASSERT_TRUE(a && b && c);
    expectBalanced(arena);

    EXPECT_TRUE(arena.deallocate(*b));
    expectBalanced(arena);

    auto reused = arena.allocate(100);
    ASSERT_TRUE(reused.has_value());
    EXPECT_EQ(*reused, *b);
    EXPECT_EQ(arena.blockCount(), 3u);
    EXPECT_EQ(arena.usage().allocated, 300u);
    expectBalanced(arena);
}

TEST(PulseOffHeapArena, LargerFreeBlockIsReusedWhole)
{
    OffHeapArena arena(1000);
    auto big = arena.allocate(300);
    ASSERT_TRUE(big.has_value());
    EXPECT_TRUE(arena.deallocate(*big));

    auto small = arena.allocate(100);
    ASSERT_TRUE(small.has_value());
    EXPECT_EQ(*small, *big);
    EXPECT_EQ(arena.blockCount(), 1u);
    EXPECT_EQ(arena.freeBlockCount(), 0u);
    EXPECT_EQ(arena.usage().allocated, 300u);
    expectBalanced(arena);
}

TEST(PulseOffHeapArena, ExhaustionReturnsNoSpace)
{
    OffHeapArena arena(256);
    EXPECT_FALSE(arena.allocate(0).has_value());
    EXPECT_FALSE(arena.allocate(257).has_value());
    ASSERT_TRUE(arena.allocate(200).has_value());
    EXPECT_FALSE(arena.allocate(100).has_value());
    ASSERT_TRUE(arena.allocate(56).has_value());
    EXPECT_EQ(arena.usage().free, 0u);
    expectBalanced(arena);
}

TEST(PulseOffHeapArena, DoubleFreeIsRejected)
{
    OffHeapArena arena(128);
    auto id = arena.allocate(64);
    ASSERT_TRUE(id.has_value());
    EXPECT_TRUE(arena.deallocate(*id));
    EXPECT_FALSE(arena.deallocate(*id));
    EXPECT_FALSE(arena.deallocate(999));
}

TEST(PulseOffHeapArena, ReadWriteAreBoundsChecked)
{
    OffHeapArena arena(128);
    auto id = arena.allocate(8);
    ASSERT_TRUE(id.has_value());

    EXPECT_TRUE(arena.write(*id, 2, "hey"));
    auto bytes = arena.read(*id, 2, 3);
    ASSERT_TRUE(bytes.has_value());
    std::string text;
    for (std::byte b : *bytes)
        text.push_back(static_cast<char>(b));
    EXPECT_EQ(text, "hey");

    EXPECT_FALSE(arena.write(*id, 6, "abc"));
    EXPECT_FALSE(arena.read(*id, 4, 5).has_value());

    arena.deallocate(*id);
    EXPECT_FALSE(arena.read(*id, 0, 1).has_value());
    EXPECT_FALSE(arena.write(*id, 0, "x"));
}

TEST(PulseOffHeapArena, ReusedBlockIsZeroed)
{
    OffHeapArena arena(64);
    auto id = arena.allocate(4);
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(arena.write(*id, 0, "abcd"));
    arena.deallocate(*id);
    auto again = arena.allocate(4);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, *id);
    auto bytes = arena.read(*again, 0, 4);
    ASSERT_TRUE(bytes.has_value());
    for (std::byte b : *bytes)
        EXPECT_EQ(std::to_integer<int>(b), 0);
}

TEST(PulseOffHeapArena, DefragmentMergesSmallestFirst)
{
    OffHeapArena arena(1000);
    auto a = arena.allocate(100);
    auto b = arena.allocate(200);
    auto c = arena.allocate(300);
    ASSERT_TRUE(a && b && c);
    arena.deallocate(*c);
    arena.deallocate(*a);
    arena.deallocate(*b);
    EXPECT_EQ(arena.freeBlockCount(), 3u);
    EXPECT_GT(arena.usage().fragmentation, 0.0);

    EXPECT_EQ(arena.defragment(), 2u);
    EXPECT_EQ(arena.freeBlockCount(), 1u);
    EXPECT_EQ(arena.blockCount(), 1u);
    EXPECT_DOUBLE_EQ(arena.usage().fragmentation, 0.0);
    expectBalanced(arena);

    // The merged block carries the id of the smallest block.
    const OffHeapBlock *merged = arena.find(*a);
    ASSERT_NE(merged, nullptr);
    EXPECT_EQ(merged->size, 600u);
    auto big = arena.allocate(550);
    ASSERT_TRUE(big.has_value());
    EXPECT_EQ(*big, *a);
    expectBalanced(arena);
}

TEST(PulseOffHeapArena, UsagePercent)
{
    OffHeapArena arena(400);
    arena.allocate(100);
    EXPECT_DOUBLE_EQ(arena.usagePercent(), 25.0);
    arena.reset();
    EXPECT_DOUBLE_EQ(arena.usagePercent(), 0.0);
    EXPECT_EQ(arena.blockCount(), 0u);
    expectBalanced(arena);
}
