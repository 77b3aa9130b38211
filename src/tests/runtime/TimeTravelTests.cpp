//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/runtime/TimeTravelTests.cpp
// Purpose: Ring-buffer capacity, cursor navigation, id lookup and the deep
//          copy taken at capture time.
// Key invariants: size() never exceeds capacity(); ids increase by one.
// Ownership/Lifetime: Tests own recorder, environment and output buffer.
//
//===----------------------------------------------------------------------===//

#include "runtime/TimeTravel.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace pulse::runtime;

namespace
{

struct Fixture
{
    Environment env;
    std::shared_ptr<std::string> output = std::make_shared<std::string>();
    TimeTravelRecorder recorder;

    explicit Fixture(size_t capacity, size_t byteBudget = TimeTravelRecorder::kDefaultByteBudget)
        : recorder(capacity, byteBudget)
    {
    }

    void bind(const std::string &name, Value value)
    {
        Binding b;
        b.value = std::move(value);
        env.declare(name, b);
    }

    uint64_t capture(uint32_t line)
    {
        GcState gc;
        gc.heapUsagePct = line;
        return recorder.captureSnapshot(line, env, {"main"}, HeapState{}, output, output->size(), gc);
    }
};

ArrayRef intArray(uint64_t identity, size_t length)
{
    auto array = std::make_shared<ArrayObject>();
    array->elementType = "int";
    array->identity = identity;
    array->elements.assign(length, Value::makeInt(0));
    return array;
}

ObjectRef object(uint64_t identity)
{
    auto obj = std::make_shared<ObjectInstance>();
    obj->className = "Node";
    obj->identity = identity;
    return obj;
}

const ArrayObject *arrayIn(const Snapshot &snap, const std::string &name)
{
    return snap.variables.at(name).asArray().get();
}

} // namespace

TEST(PulseTimeTravel, EmptyRecorderNavigatesToNull)
{
    TimeTravelRecorder recorder(4);
    EXPECT_TRUE(recorder.empty());
    EXPECT_EQ(recorder.current(), nullptr);
    EXPECT_EQ(recorder.stepBack(), nullptr);
    EXPECT_EQ(recorder.stepForward(), nullptr);
    EXPECT_EQ(recorder.jumpTo(0), nullptr);
}

TEST(PulseTimeTravel, OverwritesOldestOnceFull)
{
    const size_t capacity = 10;
    Fixture f(capacity);
    for (uint32_t i = 0; i <= capacity; ++i)
        EXPECT_EQ(f.capture(i + 1), i);

    EXPECT_EQ(f.recorder.size(), capacity);
    auto all = f.recorder.all();
    ASSERT_EQ(all.size(), capacity);
    EXPECT_EQ(all.front()->id, 1u);
    EXPECT_EQ(all.back()->id, capacity);
    EXPECT_EQ(f.recorder.find(0), nullptr);
}

TEST(PulseTimeTravel, SteppingBackReachesCapacityMinusOneStates)
{
    const size_t capacity = 1000;
    Fixture f(capacity);
    for (uint32_t i = 0; i <= capacity; ++i)
        f.capture(i);

    const Snapshot *newest = f.recorder.current();
    ASSERT_NE(newest, nullptr);
    EXPECT_EQ(newest->id, capacity);

    size_t steps = 0;
    const Snapshot *prev = newest;
    while (true)
    {
        const Snapshot *s = f.recorder.stepBack();
        if (s == prev)
            break;
        prev = s;
        ++steps;
    }
    EXPECT_EQ(steps, capacity - 1);
    EXPECT_EQ(prev->id, 1u);

    // Already at the oldest: the boundary snapshot is returned again.
    EXPECT_EQ(f.recorder.stepBack()->id, 1u);
    EXPECT_EQ(f.recorder.stepForward()->id, 2u);
}

TEST(PulseTimeTravel, StepForwardStopsAtNewest)
{
    Fixture f(5);
    f.capture(1);
    f.capture(2);
    EXPECT_EQ(f.recorder.stepForward()->id, 1u);
    EXPECT_EQ(f.recorder.stepBack()->id, 0u);
    EXPECT_EQ(f.recorder.stepForward()->id, 1u);
}

TEST(PulseTimeTravel, JumpToIsIndexed)
{
    Fixture f(8);
    for (uint32_t i = 0; i < 12; ++i)
        f.capture(100 + i);

    const Snapshot *s = f.recorder.jumpTo(6);
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->id, 6u);
    EXPECT_EQ(s->line, 106u);
    EXPECT_EQ(f.recorder.current(), s);

    EXPECT_EQ(f.recorder.jumpTo(2), nullptr);
    EXPECT_EQ(f.recorder.current()->id, 6u);
    EXPECT_EQ(f.recorder.stepForward()->id, 7u);
}

TEST(PulseTimeTravel, CaptureDeepCopiesVariablesAndOutput)
{
    Fixture f(4);
    Binding b;
    b.value = Value::makeInt(1);
    f.env.declare("x", b);
    *f.output += "first\n";
    f.capture(1);

    b.value = Value::makeInt(2);
    f.env.declare("x", b);
    *f.output += "second\n";
    f.capture(2);

    const Snapshot *first = f.recorder.find(0);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->variables.at("x").asInt(), 1);
    EXPECT_EQ(first->outputSoFar(), "first\n");
    EXPECT_EQ(first->callStack, std::vector<std::string>{"main"});
    EXPECT_EQ(f.recorder.find(1)->outputSoFar(), "first\nsecond\n");
}

TEST(PulseTimeTravel, UnchangedContainersAreShared)
{
    Fixture f(8);
    auto array = intArray(1, 4);
    f.bind("a", Value::makeArray(array));
    f.bind("b", Value::makeArray(array));
    f.capture(1);
    f.capture(2);

    const Snapshot *first = f.recorder.find(0);
    const Snapshot *second = f.recorder.find(1);
    EXPECT_NE(arrayIn(*first, "a"), array.get());
    EXPECT_EQ(arrayIn(*first, "a"), arrayIn(*second, "a"));
    // Aliases stay aliases inside a snapshot.
    EXPECT_EQ(arrayIn(*second, "a"), arrayIn(*second, "b"));
    EXPECT_GT(first->footprint, 0u);
    EXPECT_EQ(second->footprint, 0u);

    array->elements[0] = Value::makeInt(99);
    ++array->version;
    f.capture(3);

    const Snapshot *third = f.recorder.find(2);
    EXPECT_NE(arrayIn(*third, "a"), arrayIn(*second, "a"));
    EXPECT_EQ(arrayIn(*third, "a")->elements[0].asInt(), 99);
    EXPECT_EQ(arrayIn(*second, "a")->elements[0].asInt(), 0);
}

TEST(PulseTimeTravel, ChangeInsideRecopiesHolders)
{
    Fixture f(8);
    auto inner = intArray(2, 2);
    auto holder = object(3);
    holder->fields["items"] = Value::makeArray(inner);
    f.bind("h", Value::makeObject(holder));
    f.capture(1);

    inner->elements[1] = Value::makeInt(5);
    ++inner->version;
    f.capture(2);

    const auto &before = f.recorder.find(0)->variables.at("h").asObject();
    const auto &after = f.recorder.find(1)->variables.at("h").asObject();
    EXPECT_NE(before.get(), after.get());
    EXPECT_EQ(before->fields.at("items").asArray()->elements[1].asInt(), 0);
    EXPECT_EQ(after->fields.at("items").asArray()->elements[1].asInt(), 5);
}

TEST(PulseTimeTravel, CyclesStayConsistentAcrossCopies)
{
    Fixture f(8);
    auto a = object(10);
    auto b = object(11);
    a->fields["next"] = Value::makeObject(b);
    b->fields["next"] = Value::makeObject(a);
    b->fields["count"] = Value::makeInt(0);
    f.bind("a", Value::makeObject(a));
    f.capture(1);

    b->fields["count"] = Value::makeInt(1);
    ++b->version;
    f.capture(2);

    const auto &copyA = f.recorder.find(1)->variables.at("a").asObject();
    const auto &copyB = copyA->fields.at("next").asObject();
    EXPECT_NE(copyA.get(), a.get());
    EXPECT_EQ(copyB->fields.at("count").asInt(), 1);
    EXPECT_EQ(copyB->fields.at("next").asObject().get(), copyA.get());

    const auto &oldA = f.recorder.find(0)->variables.at("a").asObject();
    EXPECT_EQ(oldA->fields.at("next").asObject()->fields.at("count").asInt(), 0);
}

TEST(PulseTimeTravel, ByteBudgetDropsOldestSnapshots)
{
    const size_t budget = 1024 * 1024;
    Fixture f(1000, budget);
    auto array = intArray(4, 5000);
    f.bind("a", Value::makeArray(array));
    for (uint32_t i = 0; i < 50; ++i)
    {
        array->elements[i] = Value::makeInt(static_cast<int32_t>(i));
        ++array->version;
        f.capture(i);
    }

    EXPECT_LT(f.recorder.size(), 50u);
    EXPECT_GE(f.recorder.size(), 1u);
    EXPECT_LE(f.recorder.retainedBytes(), budget);
    EXPECT_EQ(f.recorder.current()->id, 49u);
    EXPECT_EQ(f.recorder.all().front()->id, 50u - f.recorder.size());
    EXPECT_EQ(arrayIn(*f.recorder.current(), "a")->elements[49].asInt(), 49);
    EXPECT_EQ(f.recorder.stepBack()->id, 48u);
}

TEST(PulseTimeTravel, HistoryQueriesAndClear)
{
    Fixture f(3);
    f.capture(10);
    f.capture(20);
    auto usage = f.recorder.heapUsageHistory();
    ASSERT_EQ(usage.size(), 2u);
    EXPECT_DOUBLE_EQ(usage[1].second, 20.0);

    auto all = f.recorder.all();
    EXPECT_EQ(f.recorder.range(all.front()->timestamp, all.back()->timestamp).size(), 2u);
    EXPECT_TRUE(f.recorder.range(0, 1).empty());

    f.recorder.clear();
    EXPECT_TRUE(f.recorder.empty());
    EXPECT_EQ(f.recorder.retainedBytes(), 0u);
    EXPECT_EQ(f.capture(1), 0u);
}

TEST(PulseTimeTravel, CapturesBoundHeapState)
{
    Heap heap;
    const ObjectId bound = heap.allocate(Value::makeInt(5));
    heap.allocate(Value::makeInt(6));
    HeapState state = captureHeapState(heap, {bound});
    EXPECT_EQ(state.used, 8u);
    EXPECT_EQ(state.registeredObjects, 2u);
    ASSERT_EQ(state.boundObjects.size(), 1u);
    EXPECT_EQ(state.boundObjects.at(bound).size, 4u);
}
