//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "pulse/version.hpp"
#include "tools/pulse/cli.hpp"

#include <iostream>

namespace pulse::tools
{

void printVersion()
{
    std::cout << "pulse v" << PULSE_VERSION_STR << "\n";
    std::cout << "Pulse IoT Interpreter\n";
}

void printUsage()
{
    std::cerr << "pulse v" << PULSE_VERSION_STR << " - Pulse IoT Interpreter\n"
              << "\n"
              << "Usage: pulse [options] <file.pulse>\n"
              << "\n"
              << "Usage Modes:\n"
              << "  pulse app.pulse                 Run program (default)\n"
              << "  pulse app.pulse --check         Validate and parse only\n"
              << "  pulse app.pulse --dump-ast      Print canonical source\n"
              << "\n"
              << "Options:\n"
              << "  --check                        Report diagnostics without running\n"
              << "  --dump-tokens                  Print the token stream\n"
              << "  --dump-ast                     Print the parsed program\n"
              << "  --report                       Print GC, deadline and safety summary\n"
              << "  --history N                    Print the last N snapshots\n"
              << "  --trace[=stmt|gc|calls|all]    Enable execution tracing on stderr\n"
              << "  --seed N                       Seed the sensor/random source\n"
              << "  --max-loop N                   Per-loop iteration bound\n"
              << "  -h, --help                     Show this help message\n"
              << "  --version                      Show version information\n"
              << "\n"
              << "Environment:\n"
              << "  PULSE_HEAP_BYTES, PULSE_GC_THRESHOLD, PULSE_MAX_LOOP,\n"
              << "  PULSE_SNAPSHOTS, PULSE_HISTORY_BYTES, PULSE_SEED, PULSE_TRACE\n"
              << "\n"
              << "Exit status: 0 success, 1 errors or halt, 2 usage or I/O error\n";
}

} // namespace pulse::tools
