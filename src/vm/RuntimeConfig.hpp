//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/RuntimeConfig.hpp
// Purpose: Tunable limits for one interpreter run.
// Key invariants: Defaults reproduce the documented runtime behaviour;
//                 environment overrides never make a field invalid.
// Ownership/Lifetime: Plain value type, copied into each run.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "runtime/Heap.hpp"
#include "vm/Trace.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace pulse::vm
{

/// @brief Limits and switches for the runtime subsystems.
struct RuntimeConfig
{
    /// @name Heap and collector
    /// @{
    size_t heapBytes = 1024 * 1024;           ///< Managed heap budget
    double gcThreshold = 0.7;                 ///< Collect when usage exceeds this fraction
    size_t promotionThreshold = 1024;         ///< Reachable objects above this move off-heap
    size_t arenaBytes = 512 * 1024;           ///< Off-heap arena capacity
    size_t metricsWindow = 50;                ///< Retained GC samples
    bool finalCollection = true;              ///< Collect once more when the run ends
    /// @}

    /// @name Execution limits
    /// @{
    uint32_t maxLoopIterations = 10000;       ///< Per-loop bound
    uint32_t realTimeLoopIterations = 1000;   ///< Per-loop bound inside @RealTime methods
    uint32_t maxCallDepth = 100;              ///< Recursion ceiling
    /// @}

    /// @name History
    /// @{
    size_t snapshotCapacity = 1000;           ///< Ring size of the time-travel buffer
    size_t historyBytes = 64 * 1024 * 1024;   ///< Cap on memory held by snapshot copies
    bool recordSnapshots = true;              ///< Capture a snapshot after each statement
    /// @}

    std::optional<uint64_t> seed;             ///< Fixed seed for the random source
    TraceConfig trace;                        ///< Diagnostic tracing

    /// @brief Apply PULSE_* environment variables on top of the current values.
    /// @details Honours PULSE_HEAP_BYTES, PULSE_GC_THRESHOLD, PULSE_MAX_LOOP,
    ///          PULSE_SNAPSHOTS (0 disables recording), PULSE_HISTORY_BYTES,
    ///          PULSE_SEED and PULSE_TRACE. Malformed values are ignored.
    void applyEnvironmentOverrides();

    /// @brief Heap sizing derived from this configuration.
    runtime::HeapLimits heapLimits() const;
};

} // namespace pulse::vm
