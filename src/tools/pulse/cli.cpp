//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/pulse/cli.cpp
// Purpose: Parse pulse driver options and map them onto RuntimeConfig.
// Key invariants: Numeric options must parse completely; anything else is a
//                 usage error.
// Ownership/Lifetime: Parsed strings are copied into CliOptions.
//
//===----------------------------------------------------------------------===//

#include "tools/pulse/cli.hpp"

#include <charconv>
#include <iostream>
#include <limits>
#include <string_view>

namespace pulse::tools
{

namespace
{

/// @brief Parse an unsigned decimal that must consume all of @p text.
template <typename T> std::optional<T> parseUnsigned(std::string_view text)
{
    T value{};
    const char *first = text.data();
    const char *last = first + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last)
        return std::nullopt;
    return value;
}

/// @brief Fetch the parameter of option @p name, advancing @p index.
std::optional<std::string_view> takeValue(ArgvView args, int &index, std::string_view name)
{
    if (index + 1 >= args.argc)
    {
        std::cerr << "error: " << name << " requires an argument\n";
        return std::nullopt;
    }
    return args.at(++index);
}

} // namespace

CliParseResult parseArgs(ArgvView args, CliOptions &opts)
{
    for (int i = 0; i < args.argc; ++i)
    {
        std::string_view arg = args.at(i);

        if (arg == "-h" || arg == "--help")
            return CliParseResult::Help;
        if (arg == "--version")
            return CliParseResult::Version;

        if (arg == "--check")
        {
            opts.mode = CliMode::Check;
        }
        else if (arg == "--dump-tokens")
        {
            opts.mode = CliMode::DumpTokens;
        }
        else if (arg == "--dump-ast")
        {
            opts.mode = CliMode::DumpAst;
        }
        else if (arg == "--report")
        {
            opts.report = true;
        }
        else if (arg == "--trace")
        {
            opts.trace = vm::TraceConfig::All;
        }
        else if (arg.starts_with("--trace="))
        {
            auto mode = vm::TraceConfig::parseMode(arg.substr(8));
            if (!mode)
            {
                std::cerr << "error: unknown trace mode '" << arg.substr(8)
                          << "' (expected off, stmt, gc, calls or all)\n";
                return CliParseResult::Error;
            }
            opts.trace = *mode;
        }
        else if (arg == "--history" || arg == "--seed" || arg == "--max-loop")
        {
            auto text = takeValue(args, i, arg);
            if (!text)
                return CliParseResult::Error;
            bool ok = false;
            if (arg == "--history")
            {
                if (auto n = parseUnsigned<size_t>(*text))
                {
                    opts.historyCount = *n;
                    ok = true;
                }
            }
            else if (arg == "--seed")
            {
                if (auto n = parseUnsigned<uint64_t>(*text))
                {
                    opts.seed = *n;
                    ok = true;
                }
            }
            else if (auto n = parseUnsigned<uint32_t>(*text); n && *n > 0)
            {
                opts.maxLoop = *n;
                ok = true;
            }
            if (!ok)
            {
                std::cerr << "error: invalid value '" << *text << "' for " << arg << "\n";
                return CliParseResult::Error;
            }
        }
        else if (arg.starts_with("-") && arg.size() > 1)
        {
            std::cerr << "error: unknown option: " << arg << "\n";
            return CliParseResult::Error;
        }
        else
        {
            if (!opts.sourcePath.empty())
            {
                std::cerr << "error: multiple source files not supported\n";
                return CliParseResult::Error;
            }
            opts.sourcePath = std::string(arg);
        }
    }

    if (opts.sourcePath.empty())
    {
        std::cerr << "error: no input file specified\n";
        return CliParseResult::Error;
    }
    return CliParseResult::Ok;
}

vm::RuntimeConfig makeRuntimeConfig(const CliOptions &opts)
{
    vm::RuntimeConfig config;
    config.applyEnvironmentOverrides();
    if (opts.seed)
        config.seed = opts.seed;
    if (opts.maxLoop)
        config.maxLoopIterations = *opts.maxLoop;
    if (opts.trace)
        config.trace.mode = *opts.trace;
    if (opts.historyCount > 0)
        config.recordSnapshots = true;
    return config;
}

} // namespace pulse::tools
