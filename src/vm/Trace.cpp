//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Trace.cpp
// Purpose: Implement deterministic tracing for interpreter statements, calls
//          and collections.
// Key invariants: Each event produces at most one flushed line; emission
//                 honours TraceConfig::mode.
// Ownership/Lifetime: Trace sinks emit to externally owned streams.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the interpreter tracing facilities.
/// @details Numbers are rendered through a stream imbued with the classic
///          locale so host locales that use a decimal comma do not leak into
///          the trace.

#include "vm/Trace.hpp"

#include "runtime/Heap.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <locale>
#include <sstream>
#include <string>

namespace pulse::vm
{

bool TraceConfig::enabled() const
{
    return mode != Off;
}

bool TraceConfig::has(Mode flag) const
{
    return (static_cast<uint8_t>(mode) & static_cast<uint8_t>(flag)) != 0;
}

std::optional<TraceConfig::Mode> TraceConfig::parseMode(std::string_view text)
{
    std::string lowered(text);
    std::transform(lowered.begin(),
                   lowered.end(),
                   lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "off" || lowered == "0")
        return Off;
    if (lowered == "stmt")
        return Stmt;
    if (lowered == "gc")
        return Gc;
    if (lowered == "calls")
        return Calls;
    if (lowered == "all" || lowered == "1")
        return All;
    return std::nullopt;
}

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

std::ostream &TraceSink::stream()
{
    return cfg.out ? *cfg.out : std::cerr;
}

void TraceSink::onStatement(uint32_t line, std::string_view kind)
{
    if (!cfg.has(TraceConfig::Stmt))
        return;
    stream() << "[stmt] line " << line << ": " << kind << std::endl;
}

void TraceSink::onCallEnter(std::string_view name, size_t depth)
{
    if (!cfg.has(TraceConfig::Calls))
        return;
    stream() << "[call] enter " << name << " depth=" << depth << std::endl;
}

void TraceSink::onCallExit(std::string_view name)
{
    if (!cfg.has(TraceConfig::Calls))
        return;
    stream() << "[call] exit " << name << std::endl;
}

void TraceSink::onSensorMethod(std::string_view name, std::string_view type)
{
    if (!cfg.has(TraceConfig::Calls))
        return;
    stream() << "[call] sensor " << name << " type=" << type << std::endl;
}

void TraceSink::onCollect(uint64_t collection, const runtime::GcReport &report, double heapPct)
{
    if (!cfg.has(TraceConfig::Gc))
        return;
    std::ostringstream os;
    os.imbue(std::locale::classic());
    os << "[gc] #" << collection << " freed=" << report.freed << " promoted=" << report.promoted
       << std::fixed << std::setprecision(3) << " pause=" << report.pauseTimeMs << "ms"
       << std::setprecision(1) << " heap=" << heapPct << "%";
    stream() << os.str() << std::endl;
}

} // namespace pulse::vm
