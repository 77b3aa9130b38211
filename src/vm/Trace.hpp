//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Trace.hpp
// Purpose: Declare tracing configuration and sink for interpreter events.
// Key invariants: Trace output is deterministic, line-oriented and never
//                 mixed into program output.
// Ownership/Lifetime: Sink holds configuration by value and borrows the
//                     output stream.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace pulse::runtime
{
struct GcReport;
} // namespace pulse::runtime

namespace pulse::vm
{

/// @brief Configuration for interpreter tracing.
struct TraceConfig
{
    /// @brief Tracing modes; values combine as flags.
    enum Mode : uint8_t
    {
        Off = 0,   ///< Tracing disabled
        Stmt = 1,  ///< One line per executed statement
        Gc = 2,    ///< One line per collection
        Calls = 4, ///< Method entry and exit
        All = Stmt | Gc | Calls
    } mode{Off};

    /// @brief Destination; null means std::cerr.
    std::ostream *out = nullptr;

    /// @brief Check whether tracing is enabled.
    /// @return True if mode is not Off.
    bool enabled() const;

    /// @brief True when @p flag is part of the mode.
    bool has(Mode flag) const;

    /// @brief Parse "off", "stmt", "gc", "calls" or "all" (case-insensitive).
    static std::optional<Mode> parseMode(std::string_view text);
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief `[stmt] line N: <kind>`
    void onStatement(uint32_t line, std::string_view kind);

    /// @brief `[call] enter <name> depth=D`
    void onCallEnter(std::string_view name, size_t depth);

    /// @brief `[call] exit <name>`
    void onCallExit(std::string_view name);

    /// @brief `[call] sensor <name> type=<t>`
    void onSensorMethod(std::string_view name, std::string_view type);

    /// @brief `[gc] #k freed=F promoted=P pause=X.XXXms heap=Y.Y%`
    void onCollect(uint64_t collection, const runtime::GcReport &report, double heapPct);

    const TraceConfig &config() const
    {
        return cfg;
    }

  private:
    std::ostream &stream();

    TraceConfig cfg; ///< Active configuration
};

} // namespace pulse::vm
