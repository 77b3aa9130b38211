//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/Heap.hpp
// Purpose: Simulated managed heap: allocation accounting, mark-and-sweep
//          collection and promotion of large reachable objects off-heap.
// Key invariants: used() equals the summed size of registered objects that
//                 are not promoted; after collect() every registered object is
//                 in the root set it was given.
// Ownership/Lifetime: Owns the object registry, the off-heap arena and the
//                     bounded metrics window.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "runtime/Environment.hpp"
#include "runtime/OffHeapArena.hpp"
#include "runtime/Value.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <set>

namespace pulse::runtime
{

/// @brief One registered allocation.
struct HeapObject
{
    ObjectId id = kNoObject;
    Value value;
    size_t size = 0;
    bool promoted = false;
    std::optional<BlockId> offHeapBlock;
};

/// @brief Measurement recorded after each collection.
struct GcMetricsSample
{
    double pauseTimeMs = 0;      ///< Mark, promote and sweep
    double heapUsagePct = 0;     ///< On-heap usage after the collection
    double offHeapUsagePct = 0;  ///< Arena usage after the collection
    uint64_t collections = 0;    ///< Collections performed so far, this one included
    uint64_t allocatedCount = 0; ///< Objects allocated so far
    uint64_t freedCount = 0;     ///< Objects freed so far
    double compactionTimeMs = 0; ///< Arena defragmentation
    double timestamp = 0;        ///< Wall clock, ms since the epoch
    bool simulated = false;      ///< Always false for measured samples
};

/// @brief Outcome of a single collection.
struct GcReport
{
    size_t freed = 0;
    size_t promoted = 0;
    size_t merges = 0;
    double pauseTimeMs = 0;
    double compactionTimeMs = 0;
};

/// @brief Heap sizing knobs.
struct HeapLimits
{
    size_t budget = 1024 * 1024;
    double gcThreshold = 0.7;
    size_t promotionThreshold = 1024;
    size_t arenaCapacity = OffHeapArena::kDefaultCapacity;
    size_t metricsWindow = 50;
};

/// @brief Object registry with a mark-and-sweep collector.
///
/// @details Reachability is by binding: an object survives a collection when
/// its id is in the root set, which the evaluator derives from the
/// environment. Reachable objects larger than the promotion threshold are
/// copied into the off-heap arena and stop counting against the heap budget.
class Heap
{
  public:
    explicit Heap(HeapLimits limits = {});

    /// @brief Register @p value and account its size.
    /// @return The new object's id (never kNoObject).
    ObjectId allocate(Value value);

    /// @brief Run one collection against @p roots and append a metrics sample.
    GcReport collect(const std::set<ObjectId> &roots);

    /// @brief True when usage exceeds threshold times budget.
    [[nodiscard]] bool aboveThreshold() const;

    /// @brief True when allocating @p bytes more would exceed the budget.
    [[nodiscard]] bool wouldOverflow(size_t bytes) const;

    /// @brief Bytes used() grows by if the array or object @p identity grows
    ///        by @p bytes.
    /// @details Every registered object holding the container is charged; a
    ///          promoted holder is charged its whole size because growth
    ///          brings it back on-heap.
    [[nodiscard]] size_t growthCharge(uint64_t identity, size_t bytes) const;

    /// @brief Apply a size change of @p delta bytes to every registered
    ///        object holding the array or object @p identity.
    void resize(uint64_t identity, std::ptrdiff_t delta);

    /// @name Accounting
    /// @{
    [[nodiscard]] size_t used() const
    {
        return used_;
    }

    [[nodiscard]] size_t budget() const
    {
        return limits_.budget;
    }

    [[nodiscard]] double usagePercent() const;

    [[nodiscard]] uint64_t allocatedCount() const
    {
        return allocatedCount_;
    }

    [[nodiscard]] uint64_t freedCount() const
    {
        return freedCount_;
    }

    [[nodiscard]] uint64_t collectionCount() const
    {
        return collections_;
    }

    /// @}

    /// @brief Registered object @p id, or null.
    const HeapObject *find(ObjectId id) const;

    /// @brief Every registered object in id order.
    const std::map<ObjectId, HeapObject> &objects() const
    {
        return objects_;
    }

    /// @brief Most recent metrics samples, oldest first.
    const std::deque<GcMetricsSample> &metrics() const
    {
        return metrics_;
    }

    OffHeapArena &arena()
    {
        return arena_;
    }

    const OffHeapArena &arena() const
    {
        return arena_;
    }

    const HeapLimits &limits() const
    {
        return limits_;
    }

    /// @brief Drop every object, sample and counter and empty the arena.
    void reset();

  private:
    bool promote(HeapObject &object);
    void demote(HeapObject &object);
    void forget(const HeapObject &object);

    HeapLimits limits_;
    OffHeapArena arena_;
    std::map<ObjectId, HeapObject> objects_;
    /// Container identity to the registered objects holding it.
    std::map<uint64_t, std::set<ObjectId>> holders_;
    std::deque<GcMetricsSample> metrics_;
    size_t used_ = 0;
    ObjectId nextId_ = 1;
    uint64_t allocatedCount_ = 0;
    uint64_t freedCount_ = 0;
    uint64_t collections_ = 0;
};

/// @brief Milliseconds since the epoch as a double.
double wallClockMs();

} // namespace pulse::runtime
