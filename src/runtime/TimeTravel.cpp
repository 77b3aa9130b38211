//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/TimeTravel.cpp
// Purpose: Ring-buffer bookkeeping for the execution history and the
//          versioned sharing of array and object copies between snapshots.
//
//===----------------------------------------------------------------------===//

#include "runtime/TimeTravel.hpp"

#include <algorithm>

namespace pulse::runtime
{

namespace
{

const void *containerKey(const Value &value)
{
    if (value.isArray())
        return value.asArray().get();
    if (value.isObject())
        return value.asObject().get();
    return nullptr;
}

uint64_t identityOf(const Value &container)
{
    return container.isArray() ? container.asArray()->identity : container.asObject()->identity;
}

uint64_t versionOf(const Value &container)
{
    return container.isArray() ? container.asArray()->version : container.asObject()->version;
}

bool holdsReferences(const ArrayObject &array)
{
    const std::string &type = array.elementType;
    return type != "int" && type != "double" && type != "boolean" && type != "String";
}

/// @brief Calls @p fn with every array or object held directly by @p container.
template <typename Fn> void forEachChild(const Value &container, Fn &&fn)
{
    if (container.isArray())
    {
        const ArrayObject &array = *container.asArray();
        if (!holdsReferences(array))
            return;
        for (const Value &element : array.elements)
        {
            if (containerKey(element))
                fn(element);
        }
        return;
    }
    for (const auto &[name, field] : container.asObject()->fields)
    {
        if (containerKey(field))
            fn(field);
    }
}

/// @brief Empty copy of @p container carrying its type, identity and version.
Value shellOf(const Value &container)
{
    if (container.isArray())
    {
        const ArrayObject &src = *container.asArray();
        auto copy = std::make_shared<ArrayObject>();
        copy->elementType = src.elementType;
        copy->identity = src.identity;
        copy->version = src.version;
        return Value::makeArray(std::move(copy));
    }
    const ObjectInstance &src = *container.asObject();
    auto copy = std::make_shared<ObjectInstance>();
    copy->className = src.className;
    copy->identity = src.identity;
    copy->version = src.version;
    return Value::makeObject(std::move(copy));
}

size_t footprintOf(const Value &copy)
{
    auto payload = [](const Value &v) { return v.isString() ? v.asString().size() : 0; };
    size_t bytes = 0;
    if (copy.isArray())
    {
        const ArrayObject &array = *copy.asArray();
        bytes = sizeof(ArrayObject) + array.elements.capacity() * sizeof(Value);
        for (const Value &element : array.elements)
            bytes += payload(element);
        return bytes;
    }
    const ObjectInstance &object = *copy.asObject();
    bytes = sizeof(ObjectInstance);
    for (const auto &[name, field] : object.fields)
        bytes += sizeof(std::pair<const std::string, Value>) + name.size() + payload(field);
    return bytes;
}

/// One array or object reachable from the variables being captured.
struct CaptureNode
{
    Value live;
    std::vector<const void *> holders; ///< Containers that hold this one
    bool dirty = false;
    Value copy;
};

} // namespace

HeapState captureHeapState(const Heap &heap, const std::set<ObjectId> &roots)
{
    HeapState state;
    state.used = heap.used();
    state.budget = heap.budget();
    state.registeredObjects = heap.objects().size();
    const OffHeapUsage offHeap = heap.arena().usage();
    state.offHeapAllocated = offHeap.allocated;
    state.offHeapTotal = offHeap.total;
    for (ObjectId id : roots)
    {
        if (const HeapObject *object = heap.find(id))
            state.boundObjects.emplace(id, HeapObjectSummary{object->size, object->promoted});
    }
    return state;
}

std::string Snapshot::outputSoFar() const
{
    if (!output)
        return {};
    return output->substr(0, std::min(outputLength, output->size()));
}

TimeTravelRecorder::TimeTravelRecorder(size_t capacity, size_t byteBudget)
    : slots_(std::max<size_t>(capacity, 1)), byteBudget_(byteBudget)
{
}

std::map<std::string, Value> TimeTravelRecorder::shareVariables(const Environment &env,
                                                                size_t &freshBytes)
{
    // Collect every reachable container and who holds it.
    std::unordered_map<const void *, CaptureNode> nodes;
    std::vector<const void *> order;
    std::vector<std::pair<Value, const void *>> pending;
    for (const auto &[name, binding] : env.bindings())
    {
        if (containerKey(binding.value))
            pending.emplace_back(binding.value, nullptr);
    }
    while (!pending.empty())
    {
        auto [value, holder] = std::move(pending.back());
        pending.pop_back();
        const void *key = containerKey(value);
        auto [it, inserted] = nodes.try_emplace(key);
        if (holder)
            it->second.holders.push_back(holder);
        if (!inserted)
            continue;
        order.push_back(key);
        forEachChild(value, [&](const Value &child) { pending.emplace_back(child, key); });
        it->second.live = std::move(value);
    }

    // A container needs a fresh copy when it changed or reaches one that did.
    std::vector<const void *> changed;
    for (const void *key : order)
    {
        CaptureNode &node = nodes.at(key);
        auto cached = copies_.find(identityOf(node.live));
        if (cached != copies_.end() && cached->second.source == key &&
            cached->second.version == versionOf(node.live))
        {
            node.copy = cached->second.copy;
            continue;
        }
        node.dirty = true;
        changed.push_back(key);
    }
    while (!changed.empty())
    {
        const void *key = changed.back();
        changed.pop_back();
        for (const void *holder : nodes.at(key).holders)
        {
            CaptureNode &outer = nodes.at(holder);
            if (!outer.dirty)
            {
                outer.dirty = true;
                changed.push_back(holder);
            }
        }
    }

    // Shells first so that cycles resolve, then contents.
    for (const void *key : order)
    {
        CaptureNode &node = nodes.at(key);
        if (node.dirty)
            node.copy = shellOf(node.live);
    }
    auto resolve = [&](const Value &v) -> Value
    {
        const void *key = containerKey(v);
        return key ? nodes.at(key).copy : v;
    };
    std::unordered_map<uint64_t, SharedCopy> next;
    next.reserve(order.size());
    for (const void *key : order)
    {
        CaptureNode &node = nodes.at(key);
        if (node.dirty)
        {
            if (node.live.isArray())
            {
                const ArrayObject &src = *node.live.asArray();
                ArrayObject &dst = *node.copy.asArray();
                if (holdsReferences(src))
                {
                    dst.elements.reserve(src.elements.size());
                    for (const Value &element : src.elements)
                        dst.elements.push_back(resolve(element));
                }
                else
                {
                    dst.elements = src.elements;
                }
            }
            else
            {
                ObjectInstance &dst = *node.copy.asObject();
                for (const auto &[name, field] : node.live.asObject()->fields)
                    dst.fields.emplace(name, resolve(field));
            }
            freshBytes += footprintOf(node.copy);
        }
        next[identityOf(node.live)] = SharedCopy{key, versionOf(node.live), node.copy};
    }
    copies_ = std::move(next);

    std::map<std::string, Value> variables;
    for (const auto &[name, binding] : env.bindings())
        variables.emplace(name, resolve(binding.value));
    return variables;
}

uint64_t TimeTravelRecorder::captureSnapshot(uint32_t line,
                                             const Environment &env,
                                             const std::vector<std::string> &callStack,
                                             HeapState heapState,
                                             std::shared_ptr<const std::string> output,
                                             size_t outputLength,
                                             const GcState &gcState)
{
    auto snap = std::make_shared<Snapshot>();
    snap->id = nextId_++;
    snap->timestamp = wallClockMs();
    snap->line = line;
    snap->variables = shareVariables(env, snap->footprint);
    snap->callStack = callStack;
    snap->heapState = std::move(heapState);
    snap->output = std::move(output);
    snap->outputLength = outputLength;
    snap->gcState = gcState;

    if (count_ == slots_.size())
        dropOldest();
    retainedBytes_ += snap->footprint;
    const uint64_t id = snap->id;
    slots_[slotAt(count_)] = std::move(snap);
    ++count_;

    while (count_ > 1 && retainedBytes_ > byteBudget_)
        dropOldest();

    cursor_ = count_ - 1;
    return id;
}

void TimeTravelRecorder::dropOldest()
{
    std::shared_ptr<const Snapshot> &oldest = slots_[head_];
    retainedBytes_ -= std::min(retainedBytes_, oldest->footprint);
    oldest.reset();
    head_ = (head_ + 1) % slots_.size();
    --count_;
}

const Snapshot *TimeTravelRecorder::stepBack()
{
    if (count_ == 0)
        return nullptr;
    if (cursor_ > 0)
        --cursor_;
    return slots_[slotAt(cursor_)].get();
}

const Snapshot *TimeTravelRecorder::stepForward()
{
    if (count_ == 0)
        return nullptr;
    if (cursor_ + 1 < count_)
        ++cursor_;
    return slots_[slotAt(cursor_)].get();
}

const Snapshot *TimeTravelRecorder::jumpTo(uint64_t id)
{
    if (find(id) == nullptr)
        return nullptr;
    cursor_ = static_cast<size_t>(id - slots_[head_]->id);
    return slots_[slotAt(cursor_)].get();
}

const Snapshot *TimeTravelRecorder::current() const
{
    return count_ == 0 ? nullptr : slots_[slotAt(cursor_)].get();
}

const Snapshot *TimeTravelRecorder::find(uint64_t id) const
{
    if (count_ == 0)
        return nullptr;
    const uint64_t oldest = slots_[head_]->id;
    if (id < oldest || id - oldest >= count_)
        return nullptr;
    return slots_[slotAt(static_cast<size_t>(id - oldest))].get();
}

std::vector<const Snapshot *> TimeTravelRecorder::all() const
{
    std::vector<const Snapshot *> out;
    out.reserve(count_);
    for (size_t age = 0; age < count_; ++age)
        out.push_back(slots_[slotAt(age)].get());
    return out;
}

std::vector<std::shared_ptr<const Snapshot>> TimeTravelRecorder::retained() const
{
    std::vector<std::shared_ptr<const Snapshot>> out;
    out.reserve(count_);
    for (size_t age = 0; age < count_; ++age)
        out.push_back(slots_[slotAt(age)]);
    return out;
}

std::vector<const Snapshot *> TimeTravelRecorder::range(double startMs, double endMs) const
{
    std::vector<const Snapshot *> out;
    for (size_t age = 0; age < count_; ++age)
    {
        const Snapshot &snap = *slots_[slotAt(age)];
        if (snap.timestamp >= startMs && snap.timestamp <= endMs)
            out.push_back(&snap);
    }
    return out;
}

std::vector<std::pair<double, double>> TimeTravelRecorder::heapUsageHistory() const
{
    std::vector<std::pair<double, double>> out;
    out.reserve(count_);
    for (size_t age = 0; age < count_; ++age)
    {
        const Snapshot &snap = *slots_[slotAt(age)];
        out.emplace_back(snap.timestamp, snap.gcState.heapUsagePct);
    }
    return out;
}

void TimeTravelRecorder::clear()
{
    for (auto &snap : slots_)
        snap.reset();
    copies_.clear();
    retainedBytes_ = 0;
    head_ = 0;
    count_ = 0;
    cursor_ = 0;
    nextId_ = 0;
}

} // namespace pulse::runtime
