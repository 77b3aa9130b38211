//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/vm/DeadlineEnforcerTests.cpp
// Purpose: Deadline severity thresholds, nesting and remaining-time queries
//          driven by a manual clock.
// Key invariants: actual > 2x budget is Critical, budget < actual <= 2x is Warning.
// Ownership/Lifetime: The manual clock outlives each enforcer.
//
//===----------------------------------------------------------------------===//

#include "vm/DeadlineEnforcer.hpp"

#include <gtest/gtest.h>

using namespace pulse::vm;

namespace
{
struct ManualClock
{
    double now = 0;

    DeadlineEnforcer::Clock fn()
    {
        return [this] { return now; };
    }
};
} // namespace

TEST(PulseDeadlineEnforcer, SeverityThresholds)
{
    ManualClock clock;
    DeadlineEnforcer enforcer(clock.fn());
    enforcer.registerDeadline("tick", 5, 2);

    enforcer.startMethod("tick");
    clock.now += 11;
    auto critical = enforcer.endMethod("tick");
    ASSERT_TRUE(critical.has_value());
    EXPECT_EQ(critical->severity, DeadlineSeverity::Critical);
    EXPECT_DOUBLE_EQ(critical->actualMs, 11);
    EXPECT_DOUBLE_EQ(critical->expectedMs, 5);
    EXPECT_EQ(critical->line, 2u);

    enforcer.startMethod("tick");
    clock.now += 7;
    auto warning = enforcer.endMethod("tick");
    ASSERT_TRUE(warning.has_value());
    EXPECT_EQ(warning->severity, DeadlineSeverity::Warning);

    enforcer.startMethod("tick");
    clock.now += 5;
    EXPECT_FALSE(enforcer.endMethod("tick").has_value());

    EXPECT_EQ(enforcer.violations().size(), 2u);
    enforcer.clearViolations();
    EXPECT_TRUE(enforcer.violations().empty());
}

TEST(PulseDeadlineEnforcer, UnregisteredMethodsAreIgnored)
{
    ManualClock clock;
    DeadlineEnforcer enforcer(clock.fn());
    EXPECT_FALSE(enforcer.hasDeadline("idle"));
    enforcer.startMethod("idle");
    clock.now += 100;
    EXPECT_FALSE(enforcer.endMethod("idle").has_value());
    EXPECT_TRUE(enforcer.activeDeadlines().empty());
}

TEST(PulseDeadlineEnforcer, NestedEntriesStack)
{
    ManualClock clock;
    DeadlineEnforcer enforcer(clock.fn());
    enforcer.registerDeadline("fib", 10, 1);

    enforcer.startMethod("fib");
    clock.now += 4;
    enforcer.startMethod("fib");
    clock.now += 3;

    auto active = enforcer.activeDeadlines();
    ASSERT_EQ(active.size(), 2u);
    EXPECT_DOUBLE_EQ(active[0].remainingMs, 3);
    EXPECT_DOUBLE_EQ(active[1].remainingMs, 7);

    EXPECT_FALSE(enforcer.endMethod("fib").has_value());
    clock.now += 20;
    auto outer = enforcer.endMethod("fib");
    ASSERT_TRUE(outer.has_value());
    EXPECT_DOUBLE_EQ(outer->actualMs, 27);
    EXPECT_EQ(outer->severity, DeadlineSeverity::Critical);
}

TEST(PulseDeadlineEnforcer, RemainingTimeNeverNegative)
{
    ManualClock clock;
    DeadlineEnforcer enforcer(clock.fn());
    enforcer.registerDeadline("slow", 1, 1);
    enforcer.startMethod("slow");
    clock.now += 50;
    ASSERT_EQ(enforcer.activeDeadlines().size(), 1u);
    EXPECT_DOUBLE_EQ(enforcer.activeDeadlines()[0].remainingMs, 0);
    enforcer.reset();
    EXPECT_FALSE(enforcer.hasDeadline("slow"));
    EXPECT_TRUE(enforcer.activeDeadlines().empty());
}
