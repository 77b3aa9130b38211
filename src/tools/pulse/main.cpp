//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the pulse command-line interpreter.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `pulse` CLI tool.
/// @details Parses the command line, then hands off to the selected command.

#include "tools/pulse/cli.hpp"

/// @brief Main entry point for the pulse interpreter.
/// @param argc Number of command-line arguments in @p argv.
/// @param argv Argument vector passed to the process.
/// @return 0 on success, 1 on diagnostics or halt, 2 on usage or I/O errors.
int main(int argc, char **argv)
{
    using namespace pulse::tools;

    CliOptions opts;
    switch (parseArgs(ArgvView{argc, argv}.drop_front(), opts))
    {
        case CliParseResult::Help:
            printUsage();
            return kExitOk;
        case CliParseResult::Version:
            printVersion();
            return kExitOk;
        case CliParseResult::Error:
            printUsage();
            return kExitUsage;
        case CliParseResult::Ok:
            break;
    }
    return runCommand(opts);
}
