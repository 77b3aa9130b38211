//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/pulse/cli.hpp
// Purpose: Declarations for the pulse driver's option parsing and commands.
// Key invariants: Options given on the command line override PULSE_*
//                 environment variables.
// Ownership/Lifetime: N/A.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tools/common/ArgvView.hpp"
#include "vm/RuntimeConfig.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace pulse::tools
{

/// @brief Process exit codes of the pulse driver.
enum ExitCode : int
{
    kExitOk = 0,          ///< Program ran to completion without errors.
    kExitDiagnostics = 1, ///< Errors were reported or execution was halted.
    kExitUsage = 2,       ///< Bad command line or unreadable input.
};

/// @brief What the driver does with the source file.
enum class CliMode
{
    Run,        ///< Validate, parse and execute (default).
    Check,      ///< Lex, validate and parse; print diagnostics only.
    DumpTokens, ///< Print the token stream.
    DumpAst,    ///< Print the canonical re-serialisation of the AST.
};

/// @brief Options collected from the command line.
struct CliOptions
{
    std::string sourcePath;
    CliMode mode = CliMode::Run;

    /// @brief Print GC, deadline and safety summaries after the run.
    bool report = false;

    /// @brief Number of trailing snapshots to print after the run (0: none).
    size_t historyCount = 0;

    std::optional<uint64_t> seed;
    std::optional<uint32_t> maxLoop;
    std::optional<vm::TraceConfig::Mode> trace;
};

/// @brief Outcome of command-line parsing.
enum class CliParseResult
{
    Ok,      ///< Options parsed; proceed with @ref CliOptions::mode.
    Help,    ///< -h/--help was given.
    Version, ///< --version was given.
    Error,   ///< Malformed command line; a message was written to stderr.
};

/// @brief Parse the arguments following the program name.
/// @param args Arguments with argv[0] already dropped.
/// @param opts Accumulator receiving parsed option values.
CliParseResult parseArgs(ArgvView args, CliOptions &opts);

/// @brief Build the runtime configuration: defaults, then environment, then
///        command-line overrides.
vm::RuntimeConfig makeRuntimeConfig(const CliOptions &opts);

/// @brief Execute the command selected by @p opts.
/// @return One of the ExitCode values.
int runCommand(const CliOptions &opts);

/// @brief Print the usage text to stderr.
void printUsage();

/// @brief Print version information to stdout.
void printVersion();

} // namespace pulse::tools
