//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/RuntimeState.cpp
// Purpose: Construction of per-run state and the snapshot/collection hooks
//          shared by the evaluator and the engine.
//
//===----------------------------------------------------------------------===//

#include "vm/RuntimeState.hpp"

#include <chrono>
#include <random>
#include <thread>

namespace pulse::vm
{

namespace
{

std::function<double()> makeDefaultRandom(const std::optional<uint64_t> &seed)
{
    auto engine = std::make_shared<std::mt19937_64>(seed ? *seed : std::random_device{}());
    return [engine]()
    {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(*engine);
    };
}

void defaultSleep(double ms)
{
    if (ms > 0)
        std::this_thread::sleep_for(std::chrono::duration<double, std::milli>(ms));
}

} // namespace

RuntimeState::RuntimeState(RuntimeConfig cfg, RuntimeHooks hooks)
    : config(std::move(cfg)), heap(config.heapLimits()), history(config.snapshotCapacity, config.historyBytes),
      safety(config.maxCallDepth), deadlines(std::move(hooks.clock)), trace(config.trace),
      output(std::make_shared<std::string>()),
      random(hooks.random ? std::move(hooks.random) : makeDefaultRandom(config.seed)),
      sleep(hooks.sleep ? std::move(hooks.sleep) : std::function<void(double)>(&defaultSleep))
{
}

void RuntimeState::recordSnapshot(uint32_t line)
{
    if (!config.recordSnapshots)
        return;
    const auto roots = env.roots();
    runtime::GcState gc;
    gc.heapUsagePct = heap.usagePercent();
    gc.allocatedObjects = heap.allocatedCount();
    gc.freedObjects = heap.freedCount();
    gc.collections = heap.collectionCount();
    history.captureSnapshot(line,
                            env,
                            callStack,
                            runtime::captureHeapState(heap, roots),
                            output,
                            output->size(),
                            gc);
}

runtime::GcReport RuntimeState::collectGarbage()
{
    const runtime::GcReport report = heap.collect(env.roots());
    trace.onCollect(heap.collectionCount(), report, heap.usagePercent());
    return report;
}

} // namespace pulse::vm
