//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/vm/RuntimeConfigTests.cpp
// Purpose: Defaults, PULSE_* environment overrides and derived heap limits.
// Key invariants: Malformed or out-of-range variables leave values unchanged.
// Ownership/Lifetime: Each test clears the variables it sets.
//
//===----------------------------------------------------------------------===//

#include "vm/RuntimeConfig.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace pulse::vm;

namespace
{

const char *const kVariables[] = {"PULSE_HEAP_BYTES",
                                  "PULSE_GC_THRESHOLD",
                                  "PULSE_MAX_LOOP",
                                  "PULSE_SNAPSHOTS",
                                  "PULSE_HISTORY_BYTES",
                                  "PULSE_SEED",
                                  "PULSE_TRACE"};

class PulseRuntimeConfig : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        clearAll();
    }

    void TearDown() override
    {
        clearAll();
    }

    static void clearAll()
    {
        for (const char *name : kVariables)
            unsetenv(name);
    }
};

} // namespace

TEST_F(PulseRuntimeConfig, Defaults)
{
    RuntimeConfig config;
    EXPECT_EQ(config.heapBytes, 1024u * 1024u);
    EXPECT_DOUBLE_EQ(config.gcThreshold, 0.7);
    EXPECT_EQ(config.maxLoopIterations, 10000u);
    EXPECT_EQ(config.realTimeLoopIterations, 1000u);
    EXPECT_EQ(config.maxCallDepth, 100u);
    EXPECT_EQ(config.snapshotCapacity, 1000u);
    EXPECT_EQ(config.historyBytes, 64u * 1024u * 1024u);
    EXPECT_TRUE(config.recordSnapshots);
    EXPECT_FALSE(config.seed.has_value());
    EXPECT_FALSE(config.trace.enabled());
}

TEST_F(PulseRuntimeConfig, NoVariablesChangesNothing)
{
    RuntimeConfig config;
    config.applyEnvironmentOverrides();
    EXPECT_EQ(config.heapBytes, 1024u * 1024u);
    EXPECT_EQ(config.maxLoopIterations, 10000u);
    EXPECT_TRUE(config.recordSnapshots);
}

TEST_F(PulseRuntimeConfig, AppliesWellFormedVariables)
{
    setenv("PULSE_HEAP_BYTES", "65536", 1);
    setenv("PULSE_GC_THRESHOLD", "0.5", 1);
    setenv("PULSE_MAX_LOOP", "250", 1);
    setenv("PULSE_SNAPSHOTS", "64", 1);
    setenv("PULSE_HISTORY_BYTES", "1048576", 1);
    setenv("PULSE_SEED", "7", 1);
    setenv("PULSE_TRACE", "gc", 1);

    RuntimeConfig config;
    config.applyEnvironmentOverrides();
    EXPECT_EQ(config.heapBytes, 65536u);
    EXPECT_DOUBLE_EQ(config.gcThreshold, 0.5);
    EXPECT_EQ(config.maxLoopIterations, 250u);
    EXPECT_EQ(config.snapshotCapacity, 64u);
    EXPECT_EQ(config.historyBytes, 1048576u);
    EXPECT_TRUE(config.recordSnapshots);
    EXPECT_EQ(config.seed.value_or(0), 7u);
    EXPECT_EQ(config.trace.mode, TraceConfig::Gc);
}

TEST_F(PulseRuntimeConfig, ZeroSnapshotsDisablesRecording)
{
    setenv("PULSE_SNAPSHOTS", "0", 1);
    RuntimeConfig config;
    config.applyEnvironmentOverrides();
    EXPECT_FALSE(config.recordSnapshots);
    EXPECT_EQ(config.snapshotCapacity, 1000u);
}

TEST_F(PulseRuntimeConfig, IgnoresMalformedValues)
{
    setenv("PULSE_HEAP_BYTES", "12kb", 1);
    setenv("PULSE_GC_THRESHOLD", "1.5", 1);
    setenv("PULSE_MAX_LOOP", "0", 1);
    setenv("PULSE_SNAPSHOTS", "-3", 1);
    setenv("PULSE_HISTORY_BYTES", "0", 1);
    setenv("PULSE_SEED", "", 1);
    setenv("PULSE_TRACE", "loud", 1);

    RuntimeConfig config;
    config.applyEnvironmentOverrides();
    EXPECT_EQ(config.heapBytes, 1024u * 1024u);
    EXPECT_DOUBLE_EQ(config.gcThreshold, 0.7);
    EXPECT_EQ(config.maxLoopIterations, 10000u);
    EXPECT_TRUE(config.recordSnapshots);
    EXPECT_EQ(config.historyBytes, 64u * 1024u * 1024u);
    EXPECT_FALSE(config.seed.has_value());
    EXPECT_EQ(config.trace.mode, TraceConfig::Off);
}

TEST_F(PulseRuntimeConfig, ZeroThresholdAndHeapAreRejected)
{
    setenv("PULSE_HEAP_BYTES", "0", 1);
    setenv("PULSE_GC_THRESHOLD", "0", 1);
    RuntimeConfig config;
    config.applyEnvironmentOverrides();
    EXPECT_EQ(config.heapBytes, 1024u * 1024u);
    EXPECT_DOUBLE_EQ(config.gcThreshold, 0.7);
}

TEST_F(PulseRuntimeConfig, HeapLimitsMirrorConfiguration)
{
    RuntimeConfig config;
    config.heapBytes = 2048;
    config.gcThreshold = 0.6;
    config.promotionThreshold = 256;
    config.arenaBytes = 4096;
    config.metricsWindow = 10;

    const pulse::runtime::HeapLimits limits = config.heapLimits();
    EXPECT_EQ(limits.budget, 2048u);
    EXPECT_DOUBLE_EQ(limits.gcThreshold, 0.6);
    EXPECT_EQ(limits.promotionThreshold, 256u);
    EXPECT_EQ(limits.arenaCapacity, 4096u);
    EXPECT_EQ(limits.metricsWindow, 10u);
}
