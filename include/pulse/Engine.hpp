//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/pulse/Engine.hpp
// Purpose: Public facade that lexes, validates, parses and runs Pulse source
//          and exposes the telemetry and history of the last run.
// Invariants: interpret() resets all state first; user-code errors never
//             escape as exceptions. Snapshot pointers stay valid until the
//             next interpret() or destruction of the engine.
// Ownership: The engine owns the run state through a pimpl; results are
//            returned by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "runtime/Heap.hpp"
#include "runtime/TimeTravel.hpp"
#include "support/diagnostics.hpp"
#include "vm/DeadlineEnforcer.hpp"
#include "vm/RuntimeConfig.hpp"
#include "vm/RuntimeState.hpp"
#include "vm/SafetyVerifier.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pulse
{

/// @brief Everything produced by one interpret() call.
struct InterpretResult
{
    std::string output;                                 ///< Program and runtime output
    std::vector<std::shared_ptr<const runtime::Snapshot>> snapshots; ///< Retained history, oldest first
    std::vector<runtime::GcMetricsSample> gcMetrics;    ///< Collector samples, oldest first
    std::vector<vm::DeadlineViolation> deadlineViolations;
    std::vector<vm::SafetyViolation> safetyViolations;
    std::vector<support::Diagnostic> diagnostics;       ///< Lex, validator, parse and runtime
    bool executed = false; ///< False when lexing, validation or parsing stopped the run
    bool halted = false;   ///< True when a critical safety violation stopped execution
};

/// @brief Off-heap part of HeapStatus.
struct OffHeapStatus
{
    size_t allocated = 0;
    size_t total = 0;
};

/// @brief Heap occupancy of the current run.
struct HeapStatus
{
    size_t used = 0;
    size_t max = 0;
    double percentage = 0;
    OffHeapStatus offHeap;
};

/// @brief Interpreter facade.
class Engine
{
  public:
    /// @brief Create an engine with @p config and host @p hooks.
    explicit Engine(vm::RuntimeConfig config = {}, vm::RuntimeHooks hooks = {});
    ~Engine();

    Engine(const Engine &) = delete;
    Engine &operator=(const Engine &) = delete;
    Engine(Engine &&) noexcept;
    Engine &operator=(Engine &&) noexcept;

    /// @brief Reset state, then lex, validate, parse and execute @p source.
    InterpretResult interpret(std::string_view source);

    /// @brief Run one collection out of band.
    void triggerGC();

    /// @brief Heap and arena occupancy.
    [[nodiscard]] HeapStatus getHeapStatus() const;

    /// @name History navigation
    /// Each returns the snapshot under the cursor afterwards, or null when
    /// nothing has been recorded (or @p id is not retained).
    /// @{
    const runtime::Snapshot *stepBackInTime();
    const runtime::Snapshot *stepForwardInTime();
    const runtime::Snapshot *jumpToSnapshot(uint64_t id);
    const runtime::Snapshot *currentSnapshot() const;
    /// @}

    /// @name Read-only views of the last run
    /// @{
    const std::vector<vm::DeadlineViolation> &getDeadlineViolations() const;
    const std::vector<vm::SafetyViolation> &getSafetyViolations() const;
    const std::deque<runtime::GcMetricsSample> &getGCMetrics() const;
    const std::vector<support::Diagnostic> &getDiagnostics() const;
    const runtime::TimeTravelRecorder &history() const;
    /// @}

    /// @brief Configuration used by subsequent runs.
    const vm::RuntimeConfig &config() const;
    void setConfig(vm::RuntimeConfig config);

    /// @brief Fix the seed of the default random source for subsequent runs.
    void setSeed(uint64_t seed);

    /// @brief Replace the random source for subsequent runs.
    void setRandomSource(std::function<double()> random);

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pulse
