//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/TimeTravel.hpp
// Purpose: Bounded execution history with a movable cursor.
// Key invariants: At most capacity() snapshots are retained and, beyond the
//                 newest one, only while their copies fit the byte budget;
//                 retained ids are contiguous, oldest first; the cursor always
//                 designates a retained snapshot when any exist.
// Ownership/Lifetime: Snapshots are immutable and shared. An array or object
//                     copy is shared by every snapshot captured while neither
//                     it nor anything it reaches was stored to; output text is
//                     shared immutably with the evaluator.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "runtime/Environment.hpp"
#include "runtime/Heap.hpp"
#include "runtime/Value.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pulse::runtime
{

/// @brief Collector counters at capture time.
struct GcState
{
    double heapUsagePct = 0;
    uint64_t allocatedObjects = 0;
    uint64_t freedObjects = 0;
    uint64_t collections = 0;
};

/// @brief Per-object summary kept for bound heap objects.
struct HeapObjectSummary
{
    size_t size = 0;
    bool promoted = false;
};

/// @brief Heap accounting plus the objects bound at capture time.
struct HeapState
{
    size_t used = 0;
    size_t budget = 0;
    size_t registeredObjects = 0;
    size_t offHeapAllocated = 0;
    size_t offHeapTotal = 0;
    std::map<ObjectId, HeapObjectSummary> boundObjects;
};

/// @brief Build a HeapState for @p heap restricted to @p roots.
HeapState captureHeapState(const Heap &heap, const std::set<ObjectId> &roots);

/// @brief One captured execution state.
struct Snapshot
{
    uint64_t id = 0;
    double timestamp = 0; ///< Wall clock, ms since the epoch
    uint32_t line = 0;
    std::map<std::string, Value> variables;
    std::vector<std::string> callStack;
    HeapState heapState;
    GcState gcState;

    /// @brief Program output produced up to the capture.
    [[nodiscard]] std::string outputSoFar() const;

    /// Shared output buffer and the prefix of it visible at capture time.
    std::shared_ptr<const std::string> output;
    size_t outputLength = 0;

    /// Estimated bytes of the array and object copies first made for this
    /// snapshot; copies reused from earlier snapshots are not counted again.
    size_t footprint = 0;
};

/// @brief Circular buffer of snapshots with step/jump navigation.
class TimeTravelRecorder
{
  public:
    static constexpr size_t kDefaultCapacity = 1000;
    static constexpr size_t kDefaultByteBudget = 64 * 1024 * 1024;

    /// @brief Create a recorder holding at most @p capacity snapshots (min 1)
    ///        whose copies total about @p byteBudget bytes.
    explicit TimeTravelRecorder(size_t capacity = kDefaultCapacity,
                                size_t byteBudget = kDefaultByteBudget);

    /// @brief Record the given state in the next slot.
    /// @details Arrays and objects are copied only when they, or something
    ///          they reach, changed version since the previous capture;
    ///          otherwise the previous copy is shared. Overwrites the oldest
    ///          snapshot once full, drops the oldest ones while the retained
    ///          copies exceed the byte budget, and moves the cursor to the new
    ///          snapshot.
    /// @return The new snapshot's id; ids increase by one per capture.
    uint64_t captureSnapshot(uint32_t line,
                             const Environment &env,
                             const std::vector<std::string> &callStack,
                             HeapState heapState,
                             std::shared_ptr<const std::string> output,
                             size_t outputLength,
                             const GcState &gcState);

    /// @brief Move the cursor one snapshot older; stays put at the oldest.
    /// @return The snapshot under the cursor, or null when empty.
    const Snapshot *stepBack();

    /// @brief Move the cursor one snapshot newer; stays put at the newest.
    const Snapshot *stepForward();

    /// @brief Move the cursor to snapshot @p id.
    /// @return Null when @p id is not retained (cursor unchanged).
    const Snapshot *jumpTo(uint64_t id);

    /// @brief Snapshot under the cursor, or null when empty.
    const Snapshot *current() const;

    /// @brief Retained snapshot with @p id, or null.
    const Snapshot *find(uint64_t id) const;

    /// @brief Retained snapshots, oldest first.
    std::vector<const Snapshot *> all() const;

    /// @brief Shared handles to the retained snapshots, oldest first.
    std::vector<std::shared_ptr<const Snapshot>> retained() const;

    /// @brief Retained snapshots whose timestamp lies in [@p startMs, @p endMs].
    std::vector<const Snapshot *> range(double startMs, double endMs) const;

    /// @brief (timestamp, heap usage %) per retained snapshot, oldest first.
    std::vector<std::pair<double, double>> heapUsageHistory() const;

    [[nodiscard]] size_t size() const
    {
        return count_;
    }

    [[nodiscard]] size_t capacity() const
    {
        return slots_.size();
    }

    [[nodiscard]] bool empty() const
    {
        return count_ == 0;
    }

    /// @brief Summed footprint of the retained snapshots.
    [[nodiscard]] size_t retainedBytes() const
    {
        return retainedBytes_;
    }

    [[nodiscard]] size_t byteBudget() const
    {
        return byteBudget_;
    }

    /// @brief Drop every snapshot and restart ids at 0.
    void clear();

  private:
    /// Copy of one array or object as of @c version.
    struct SharedCopy
    {
        const void *source = nullptr;
        uint64_t version = 0;
        Value copy;
    };

    /// Slot index of the snapshot @p age positions after the oldest.
    size_t slotAt(size_t age) const
    {
        return (head_ + age) % slots_.size();
    }

    /// Visible variables with containers replaced by shared copies; adds the
    /// footprint of freshly made copies to @p freshBytes.
    std::map<std::string, Value> shareVariables(const Environment &env, size_t &freshBytes);

    void dropOldest();

    std::vector<std::shared_ptr<const Snapshot>> slots_;
    /// Latest copy per container identity reachable at the last capture.
    std::unordered_map<uint64_t, SharedCopy> copies_;
    size_t byteBudget_;
    size_t retainedBytes_ = 0;
    size_t head_ = 0;   ///< Slot of the oldest snapshot
    size_t count_ = 0;  ///< Retained snapshots
    size_t cursor_ = 0; ///< Age of the cursor snapshot (0 = oldest)
    uint64_t nextId_ = 0;
};

} // namespace pulse::runtime
