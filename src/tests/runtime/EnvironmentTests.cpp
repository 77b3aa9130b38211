//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/runtime/EnvironmentTests.cpp
// Purpose: Frame push/pop restoration, root collection and value semantics.
// Key invariants: Popping a frame restores exactly the bindings it shadowed.
// Ownership/Lifetime: Tests own their environments.
//
//===----------------------------------------------------------------------===//

#include "runtime/Environment.hpp"

#include <gtest/gtest.h>

#include <memory>

using namespace pulse::runtime;

namespace
{
Binding intBinding(int32_t v, ObjectId object = kNoObject)
{
    Binding b;
    b.value = Value::makeInt(v);
    b.object = object;
    b.typeName = "int";
    return b;
}
} // namespace

TEST(PulseEnvironment, FramesShadowAndRestore)
{
    Environment env;
    env.declare("x", intBinding(1, 10));
    env.declare("g", intBinding(7, 11));

    env.pushFrame();
    env.declare("x", intBinding(2, 20));
    env.declare("local", intBinding(3, 21));
    EXPECT_EQ(env.lookup("x")->value.asInt(), 2);
    EXPECT_EQ(env.lookup("g")->value.asInt(), 7);
    EXPECT_TRUE(env.isLocal("x"));
    EXPECT_FALSE(env.isLocal("g"));
    EXPECT_EQ(env.frameDepth(), 1u);

    env.popFrame();
    EXPECT_EQ(env.lookup("x")->value.asInt(), 1);
    EXPECT_EQ(env.lookup("local"), nullptr);
    EXPECT_EQ(env.frameDepth(), 0u);
    EXPECT_TRUE(env.isLocal("g"));
}

TEST(PulseEnvironment, RedeclarationInSameFrameKeepsOriginalSave)
{
    Environment env;
    env.declare("n", intBinding(1));
    {
        FrameGuard guard(env);
        env.declare("n", intBinding(2));
        env.declare("n", intBinding(3));
        EXPECT_EQ(env.lookup("n")->value.asInt(), 3);
    }
    EXPECT_EQ(env.lookup("n")->value.asInt(), 1);
}

TEST(PulseEnvironment, RecursionRestoresEachLevel)
{
    Environment env;
    for (int depth = 0; depth < 5; ++depth)
    {
        env.pushFrame();
        env.declare("n", intBinding(depth));
    }
    for (int depth = 4; depth >= 0; --depth)
    {
        EXPECT_EQ(env.lookup("n")->value.asInt(), depth);
        env.popFrame();
    }
    EXPECT_EQ(env.lookup("n"), nullptr);
}

TEST(PulseEnvironment, RootsIncludeShadowedBindings)
{
    Environment env;
    env.declare("a", intBinding(1, 5));
    env.declare("b", intBinding(2));
    env.pushFrame();
    env.declare("a", intBinding(3, 6));

    const auto roots = env.roots();
    EXPECT_EQ(roots.size(), 2u);
    EXPECT_EQ(roots.count(5), 1u);
    EXPECT_EQ(roots.count(6), 1u);

    env.popFrame();
    EXPECT_EQ(env.roots(), (std::set<ObjectId>{5}));
}

TEST(PulseValue, SizesAndDisplay)
{
    EXPECT_EQ(Value::makeInt(5).sizeBytes(), 4u);
    EXPECT_EQ(Value::makeDouble(1.5).sizeBytes(), 8u);
    EXPECT_EQ(Value::makeString("abc").sizeBytes(), 6u);
    EXPECT_EQ(Value::makeBool(true).sizeBytes(), 1u);
    EXPECT_EQ(Value::makeNull().sizeBytes(), 0u);

    EXPECT_EQ(Value::makeDouble(3.0).toString(), "3.0");
    EXPECT_EQ(Value::makeBool(false).toString(), "false");
    EXPECT_EQ(Value::makeNull().toString(), "null");
}

TEST(PulseValue, ContainersCountStringPayload)
{
    auto array = std::make_shared<ArrayObject>();
    array->elementType = "String";
    array->elements = {Value::makeString("abcd"), Value::makeNull()};
    EXPECT_EQ(Value::makeArray(array).sizeBytes(), 2 * 8u + 8u);
    EXPECT_EQ(elementStoreDelta(array->elements[1], Value::makeString("xyz")), 6);
    EXPECT_EQ(elementStoreDelta(array->elements[0], Value::makeNull()), -8);

    auto object = std::make_shared<ObjectInstance>();
    object->fields["name"] = Value::makeString("ab");
    object->fields["count"] = Value::makeInt(1);
    EXPECT_EQ(Value::makeObject(object).sizeBytes(), 8u);
    EXPECT_EQ(fieldStoreDelta(*object, "name", Value::makeString("abcdef")), 8);
    EXPECT_EQ(fieldStoreDelta(*object, "name", Value::makeNull()), 0);
    EXPECT_EQ(nestedSize(Value::makeArray(array)), 8u);
}

TEST(PulseValue, EqualityByValueAndIdentity)
{
    EXPECT_TRUE(Value::makeInt(2).equals(Value::makeDouble(2.0)));
    EXPECT_TRUE(Value::makeString("on").equals(Value::makeString("on")));

    auto a = std::make_shared<ArrayObject>();
    auto b = std::make_shared<ArrayObject>();
    EXPECT_TRUE(Value::makeArray(a).equals(Value::makeArray(a)));
    EXPECT_FALSE(Value::makeArray(a).equals(Value::makeArray(b)));
    EXPECT_TRUE(Value::makeNull().equals(Value::makeNull()));
}

TEST(PulseValue, TypeNames)
{
    auto arr = std::make_shared<ArrayObject>();
    arr->elementType = "double";
    auto obj = std::make_shared<ObjectInstance>();
    obj->className = "Motor";
    EXPECT_EQ(typeNameOf(Value::makeArray(arr)), "double[]");
    EXPECT_EQ(typeNameOf(Value::makeObject(obj)), "Motor");
    EXPECT_EQ(typeNameOf(Value::makeString("x")), "String");
}
