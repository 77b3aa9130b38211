//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/RuntimeConfig.cpp
// Purpose: Environment overrides for the runtime configuration.
//
//===----------------------------------------------------------------------===//

#include "vm/RuntimeConfig.hpp"

#include <cstdlib>
#include <limits>

namespace pulse::vm
{

namespace
{

/// @brief Parse a whole decimal unsigned value from @p text.
std::optional<uint64_t> parseUnsigned(const char *text)
{
    if (text == nullptr || *text == '\0' || *text == '-')
        return std::nullopt;
    char *end = nullptr;
    const unsigned long long n = std::strtoull(text, &end, 10);
    if (end == nullptr || *end != '\0')
        return std::nullopt;
    return static_cast<uint64_t>(n);
}

} // namespace

void RuntimeConfig::applyEnvironmentOverrides()
{
    if (auto n = parseUnsigned(std::getenv("PULSE_HEAP_BYTES")); n && *n > 0)
        heapBytes = static_cast<size_t>(*n);

    if (const char *env = std::getenv("PULSE_GC_THRESHOLD"))
    {
        char *end = nullptr;
        const double v = std::strtod(env, &end);
        if (end && end != env && *end == '\0' && v > 0.0 && v <= 1.0)
            gcThreshold = v;
    }

    if (auto n = parseUnsigned(std::getenv("PULSE_MAX_LOOP"));
        n && *n > 0 && *n <= std::numeric_limits<uint32_t>::max())
        maxLoopIterations = static_cast<uint32_t>(*n);

    if (auto n = parseUnsigned(std::getenv("PULSE_SNAPSHOTS")))
    {
        if (*n == 0)
            recordSnapshots = false;
        else
        {
            recordSnapshots = true;
            snapshotCapacity = static_cast<size_t>(*n);
        }
    }

    if (auto n = parseUnsigned(std::getenv("PULSE_HISTORY_BYTES")); n && *n > 0)
        historyBytes = static_cast<size_t>(*n);

    if (auto n = parseUnsigned(std::getenv("PULSE_SEED")))
        seed = *n;

    if (const char *env = std::getenv("PULSE_TRACE"))
    {
        if (auto mode = TraceConfig::parseMode(env))
            trace.mode = *mode;
    }
}

runtime::HeapLimits RuntimeConfig::heapLimits() const
{
    runtime::HeapLimits limits;
    limits.budget = heapBytes;
    limits.gcThreshold = gcThreshold;
    limits.promotionThreshold = promotionThreshold;
    limits.arenaCapacity = arenaBytes;
    limits.metricsWindow = metricsWindow;
    return limits;
}

} // namespace pulse::vm
