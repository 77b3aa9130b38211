//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/Heap.cpp
// Purpose: Allocation accounting and the mark/promote/sweep/compact cycle.
//
//===----------------------------------------------------------------------===//

#include "runtime/Heap.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace pulse::runtime
{

namespace
{

double elapsedMs(std::chrono::steady_clock::time_point since)
{
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since)
        .count();
}

std::optional<uint64_t> containerIdentity(const Value &value)
{
    if (value.isArray())
        return value.asArray()->identity;
    if (value.isObject())
        return value.asObject()->identity;
    return std::nullopt;
}

size_t applyDelta(size_t size, std::ptrdiff_t delta)
{
    if (delta < 0 && static_cast<size_t>(-delta) > size)
        return 0;
    return static_cast<size_t>(static_cast<std::ptrdiff_t>(size) + delta);
}

} // namespace

double wallClockMs()
{
    using namespace std::chrono;
    return duration<double, std::milli>(system_clock::now().time_since_epoch()).count();
}

Heap::Heap(HeapLimits limits) : limits_(limits), arena_(limits.arenaCapacity) {}

ObjectId Heap::allocate(Value value)
{
    HeapObject object;
    object.id = nextId_++;
    object.size = value.sizeBytes();
    object.value = std::move(value);
    used_ += object.size;
    ++allocatedCount_;
    const ObjectId id = object.id;
    if (auto identity = containerIdentity(object.value))
        holders_[*identity].insert(id);
    objects_.emplace(id, std::move(object));
    return id;
}

bool Heap::aboveThreshold() const
{
    return static_cast<double>(used_) >
           limits_.gcThreshold * static_cast<double>(limits_.budget);
}

bool Heap::wouldOverflow(size_t bytes) const
{
    return bytes > limits_.budget || used_ > limits_.budget - bytes;
}

size_t Heap::growthCharge(uint64_t identity, size_t bytes) const
{
    auto it = holders_.find(identity);
    if (it == holders_.end())
        return 0;
    size_t charge = 0;
    for (ObjectId id : it->second)
    {
        const HeapObject &object = objects_.at(id);
        charge += object.promoted ? object.size + bytes : bytes;
    }
    return charge;
}

void Heap::resize(uint64_t identity, std::ptrdiff_t delta)
{
    auto it = holders_.find(identity);
    if (it == holders_.end() || delta == 0)
        return;
    for (ObjectId id : it->second)
    {
        HeapObject &object = objects_.at(id);
        if (object.promoted)
        {
            object.size = applyDelta(object.size, delta);
            if (delta > 0)
                demote(object);
            continue;
        }
        const size_t resized = applyDelta(object.size, delta);
        used_ = used_ - object.size + resized;
        object.size = resized;
    }
}

double Heap::usagePercent() const
{
    if (limits_.budget == 0)
        return 0.0;
    return 100.0 * static_cast<double>(used_) / static_cast<double>(limits_.budget);
}

const HeapObject *Heap::find(ObjectId id) const
{
    auto it = objects_.find(id);
    return it == objects_.end() ? nullptr : &it->second;
}

bool Heap::promote(HeapObject &object)
{
    auto block = arena_.allocate(object.size);
    if (!block)
        return false;
    std::string bytes = object.value.toString();
    if (bytes.size() > object.size)
        bytes.resize(object.size);
    if (!arena_.write(*block, 0, bytes))
    {
        arena_.deallocate(*block);
        return false;
    }
    object.promoted = true;
    object.offHeapBlock = block;
    used_ -= object.size;
    return true;
}

void Heap::demote(HeapObject &object)
{
    if (object.offHeapBlock)
        arena_.deallocate(*object.offHeapBlock);
    object.offHeapBlock.reset();
    object.promoted = false;
    used_ += object.size;
}

void Heap::forget(const HeapObject &object)
{
    auto identity = containerIdentity(object.value);
    if (!identity)
        return;
    auto it = holders_.find(*identity);
    if (it == holders_.end())
        return;
    it->second.erase(object.id);
    if (it->second.empty())
        holders_.erase(it);
}

GcReport Heap::collect(const std::set<ObjectId> &roots)
{
    GcReport report;
    const auto start = std::chrono::steady_clock::now();

    // Mark and promote.
    for (auto &[id, object] : objects_)
    {
        if (roots.count(id) == 0 || object.promoted)
            continue;
        if (object.size > limits_.promotionThreshold && promote(object))
            ++report.promoted;
    }

    // Sweep.
    for (auto it = objects_.begin(); it != objects_.end();)
    {
        if (roots.count(it->first) != 0)
        {
            ++it;
            continue;
        }
        HeapObject &object = it->second;
        if (object.promoted)
        {
            if (object.offHeapBlock)
                arena_.deallocate(*object.offHeapBlock);
        }
        else
        {
            used_ -= object.size;
        }
        forget(object);
        it = objects_.erase(it);
        ++report.freed;
        ++freedCount_;
    }
    report.pauseTimeMs = elapsedMs(start);

    const auto compactStart = std::chrono::steady_clock::now();
    report.merges = arena_.defragment();
    report.compactionTimeMs = elapsedMs(compactStart);

    ++collections_;

    GcMetricsSample sample;
    sample.pauseTimeMs = report.pauseTimeMs;
    sample.heapUsagePct = usagePercent();
    sample.offHeapUsagePct = arena_.usagePercent();
    sample.collections = collections_;
    sample.allocatedCount = allocatedCount_;
    sample.freedCount = freedCount_;
    sample.compactionTimeMs = report.compactionTimeMs;
    sample.timestamp = wallClockMs();
    metrics_.push_back(sample);
    while (metrics_.size() > limits_.metricsWindow)
        metrics_.pop_front();

    return report;
}

void Heap::reset()
{
    objects_.clear();
    holders_.clear();
    metrics_.clear();
    arena_.reset();
    used_ = 0;
    nextId_ = 1;
    allocatedCount_ = 0;
    freedCount_ = 0;
    collections_ = 0;
}

} // namespace pulse::runtime
