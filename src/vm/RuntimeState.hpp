//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/RuntimeState.hpp
// Purpose: Every piece of mutable state belonging to one interpreter run.
// Key invariants: Nothing here is global; two states never share data.
//                 The output buffer is append-only during a run.
// Ownership/Lifetime: Owned by the engine and replaced by each interpret().
//
//===----------------------------------------------------------------------===//

#pragma once

#include "runtime/Environment.hpp"
#include "runtime/Heap.hpp"
#include "runtime/TimeTravel.hpp"
#include "support/diagnostics.hpp"
#include "vm/DeadlineEnforcer.hpp"
#include "vm/RuntimeConfig.hpp"
#include "vm/SafetyVerifier.hpp"
#include "vm/Trace.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pulse::vm
{

/// @brief Host-supplied sources of time and randomness.
struct RuntimeHooks
{
    /// Uniform value in [0, 1); empty selects a Mersenne Twister seeded from
    /// RuntimeConfig::seed or std::random_device.
    std::function<double()> random;
    /// Monotonic milliseconds for deadline timing; empty selects steady_clock.
    std::function<double()> clock;
    /// Blocks for the given milliseconds; empty selects std::this_thread.
    std::function<void(double)> sleep;
};

/// @brief State of one run.
struct RuntimeState
{
    RuntimeState(RuntimeConfig config, RuntimeHooks hooks = {});

    RuntimeConfig config;
    runtime::Environment env;
    runtime::Heap heap;
    runtime::TimeTravelRecorder history;
    SafetyVerifier safety;
    DeadlineEnforcer deadlines;
    TraceSink trace;
    support::DiagnosticEngine diagnostics;

    std::shared_ptr<std::string> output; ///< Program output, append-only
    std::vector<std::string> callStack;  ///< Active method names, outermost first
    std::vector<SafetyViolation> safetyViolations;

    std::function<double()> random;
    std::function<void(double)> sleep;

    uint64_t nextIdentity = 1; ///< Display identity for arrays and objects

    /// @brief Append @p text to the program output.
    void append(std::string_view text)
    {
        output->append(text);
    }

    /// @brief Record the current state in the history buffer when enabled.
    void recordSnapshot(uint32_t line);

    /// @brief Collect against the environment's roots and trace the result.
    runtime::GcReport collectGarbage();
};

} // namespace pulse::vm
