//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/runtime/HeapTests.cpp
// Purpose: Accounting, sweep, promotion and metrics retention of the heap.
// Key invariants: used() equals the summed size of on-heap objects.
// Ownership/Lifetime: Tests own their heaps.
//
//===----------------------------------------------------------------------===//

#include "runtime/Heap.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <string>

using namespace pulse::runtime;

namespace
{
size_t onHeapBytes(const Heap &heap)
{
    size_t sum = 0;
    for (const auto &[id, object] : heap.objects())
    {
        if (!object.promoted)
            sum += object.size;
    }
    return sum;
}
} // namespace

TEST(PulseHeap, AllocationAccounting)
{
    Heap heap;
    heap.allocate(Value::makeInt(1));
    heap.allocate(Value::makeDouble(2.0));
    heap.allocate(Value::makeString("abcd"));
    EXPECT_EQ(heap.used(), 4u + 8u + 8u);
    EXPECT_EQ(heap.used(), onHeapBytes(heap));
    EXPECT_EQ(heap.allocatedCount(), 3u);
}

TEST(PulseHeap, SweepFreesUnreachable)
{
    Heap heap;
    const ObjectId keep = heap.allocate(Value::makeInt(1));
    heap.allocate(Value::makeInt(2));
    heap.allocate(Value::makeDouble(3.0));

    GcReport report = heap.collect({keep});
    EXPECT_EQ(report.freed, 2u);
    EXPECT_EQ(heap.objects().size(), 1u);
    EXPECT_NE(heap.find(keep), nullptr);
    EXPECT_EQ(heap.used(), 4u);
    EXPECT_EQ(heap.used(), onHeapBytes(heap));
    EXPECT_EQ(heap.freedCount(), 2u);
}

TEST(PulseHeap, LargeReachableObjectsArePromoted)
{
    Heap heap;
    const ObjectId big = heap.allocate(Value::makeString(std::string(600, 'x')));
    const ObjectId small = heap.allocate(Value::makeInt(7));
    ASSERT_EQ(heap.used(), 1204u);

    GcReport report = heap.collect({big, small});
    EXPECT_EQ(report.promoted, 1u);
    EXPECT_EQ(report.freed, 0u);

    const HeapObject *object = heap.find(big);
    ASSERT_NE(object, nullptr);
    EXPECT_TRUE(object->promoted);
    ASSERT_TRUE(object->offHeapBlock.has_value());
    EXPECT_EQ(heap.arena().usage().allocated, 1200u);
    EXPECT_EQ(heap.used(), 4u);
    EXPECT_EQ(heap.used(), onHeapBytes(heap));

    // Once unreachable the promoted object releases its block.
    heap.collect({small});
    EXPECT_EQ(heap.find(big), nullptr);
    EXPECT_EQ(heap.arena().usage().allocated, 0u);
    EXPECT_EQ(heap.used(), 4u);
}

TEST(PulseHeap, PromotionFailureLeavesObjectOnHeap)
{
    HeapLimits limits;
    limits.arenaCapacity = 100;
    Heap heap(limits);
    const ObjectId big = heap.allocate(Value::makeString(std::string(600, 'y')));
    GcReport report = heap.collect({big});
    EXPECT_EQ(report.promoted, 0u);
    EXPECT_FALSE(heap.find(big)->promoted);
    EXPECT_EQ(heap.used(), 1200u);
}

namespace
{
ArrayRef stringArray(uint64_t identity, std::string first)
{
    auto array = std::make_shared<ArrayObject>();
    array->elementType = "String";
    array->identity = identity;
    array->elements.push_back(Value::makeString(std::move(first)));
    return array;
}
} // namespace

TEST(PulseHeap, ContainerGrowthIsChargedToEveryHolder)
{
    Heap heap;
    auto array = stringArray(7, "");
    const ObjectId first = heap.allocate(Value::makeArray(array));
    heap.allocate(Value::makeArray(array));
    ASSERT_EQ(heap.used(), 16u);

    EXPECT_EQ(heap.growthCharge(7, 32), 64u);
    EXPECT_EQ(heap.growthCharge(99, 32), 0u);

    heap.resize(7, 32);
    EXPECT_EQ(heap.used(), 80u);
    EXPECT_EQ(heap.find(first)->size, 40u);
    EXPECT_EQ(heap.used(), onHeapBytes(heap));

    heap.resize(7, -32);
    EXPECT_EQ(heap.used(), 16u);
}

TEST(PulseHeap, GrowthBringsPromotedHolderBackOnHeap)
{
    Heap heap;
    const ObjectId id = heap.allocate(Value::makeArray(stringArray(3, std::string(600, 'z'))));
    ASSERT_EQ(heap.used(), 1208u);
    heap.collect({id});
    ASSERT_TRUE(heap.find(id)->promoted);
    ASSERT_EQ(heap.used(), 0u);

    EXPECT_EQ(heap.growthCharge(3, 10), 1218u);
    heap.resize(3, 10);
    const HeapObject *object = heap.find(id);
    EXPECT_FALSE(object->promoted);
    EXPECT_FALSE(object->offHeapBlock.has_value());
    EXPECT_EQ(heap.used(), 1218u);
    EXPECT_EQ(heap.arena().usage().allocated, 0u);
}

TEST(PulseHeap, SweptHoldersAreNotCharged)
{
    Heap heap;
    heap.allocate(Value::makeArray(stringArray(5, "ab")));
    heap.collect({});
    EXPECT_EQ(heap.growthCharge(5, 100), 0u);
    heap.resize(5, 100);
    EXPECT_EQ(heap.used(), 0u);
}

TEST(PulseHeap, ThresholdAndOverflow)
{
    HeapLimits limits;
    limits.budget = 100;
    limits.gcThreshold = 0.5;
    Heap heap(limits);
    for (int i = 0; i < 12; ++i)
        heap.allocate(Value::makeInt(i));
    EXPECT_FALSE(heap.aboveThreshold());
    heap.allocate(Value::makeInt(12));
    EXPECT_TRUE(heap.aboveThreshold());
    EXPECT_FALSE(heap.wouldOverflow(48));
    EXPECT_TRUE(heap.wouldOverflow(49));
    EXPECT_TRUE(heap.wouldOverflow(1000));
}

TEST(PulseHeap, MetricsWindowKeepsNewestFifty)
{
    Heap heap;
    for (int i = 0; i < 60; ++i)
        heap.collect({});
    ASSERT_EQ(heap.metrics().size(), 50u);
    EXPECT_EQ(heap.metrics().front().collections, 11u);
    EXPECT_EQ(heap.metrics().back().collections, 60u);
    for (const auto &sample : heap.metrics())
    {
        EXPECT_FALSE(sample.simulated);
        EXPECT_GE(sample.pauseTimeMs, 0.0);
    }
}

TEST(PulseHeap, ResetClearsEverything)
{
    Heap heap;
    heap.allocate(Value::makeInt(1));
    heap.collect({});
    heap.reset();
    EXPECT_EQ(heap.used(), 0u);
    EXPECT_TRUE(heap.objects().empty());
    EXPECT_TRUE(heap.metrics().empty());
    EXPECT_EQ(heap.collectionCount(), 0u);
}
