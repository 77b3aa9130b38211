//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/tools/CliTests.cpp
// Purpose: Command-line parsing, configuration layering and exit codes of the
//          pulse driver.
// Key invariants: Exit codes are 0 (ok), 1 (diagnostics or halt), 2 (usage).
// Ownership/Lifetime: Temporary source files are removed by each test.
//
//===----------------------------------------------------------------------===//

#include "tools/pulse/cli.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <vector>

using namespace pulse::tools;

namespace
{

/// @brief Owns argv storage for one parseArgs call.
struct Args
{
    explicit Args(std::initializer_list<const char *> list)
    {
        for (const char *s : list)
            storage.emplace_back(s);
        for (auto &s : storage)
            pointers.push_back(s.data());
    }

    ArgvView view()
    {
        return ArgvView{static_cast<int>(pointers.size()), pointers.data()};
    }

    std::vector<std::string> storage;
    std::vector<char *> pointers;
};

CliParseResult parse(std::initializer_list<const char *> list, CliOptions &opts)
{
    Args args(list);
    return parseArgs(args.view(), opts);
}

/// @brief Source file in the temp directory, removed on destruction.
struct TempSource
{
    TempSource(const std::string &name, const std::string &text)
        : path(std::filesystem::temp_directory_path() / name)
    {
        std::ofstream out(path);
        out << text;
    }

    ~TempSource()
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    std::filesystem::path path;
};

} // namespace

TEST(PulseCli, SourceFileOnlySelectsRun)
{
    CliOptions opts;
    ASSERT_EQ(parse({"blink.pulse"}, opts), CliParseResult::Ok);
    EXPECT_EQ(opts.sourcePath, "blink.pulse");
    EXPECT_EQ(opts.mode, CliMode::Run);
    EXPECT_FALSE(opts.report);
    EXPECT_EQ(opts.historyCount, 0u);
}

TEST(PulseCli, ModesAndFlags)
{
    CliOptions opts;
    ASSERT_EQ(parse({"--check", "--report", "a.pulse"}, opts), CliParseResult::Ok);
    EXPECT_EQ(opts.mode, CliMode::Check);
    EXPECT_TRUE(opts.report);

    CliOptions tokens;
    ASSERT_EQ(parse({"a.pulse", "--dump-tokens"}, tokens), CliParseResult::Ok);
    EXPECT_EQ(tokens.mode, CliMode::DumpTokens);

    CliOptions ast;
    ASSERT_EQ(parse({"--dump-ast", "a.pulse"}, ast), CliParseResult::Ok);
    EXPECT_EQ(ast.mode, CliMode::DumpAst);
}

TEST(PulseCli, NumericOptions)
{
    CliOptions opts;
    ASSERT_EQ(parse({"--history", "5", "--seed", "99", "--max-loop", "200", "a.pulse"}, opts),
              CliParseResult::Ok);
    EXPECT_EQ(opts.historyCount, 5u);
    EXPECT_EQ(opts.seed.value_or(0), 99u);
    EXPECT_EQ(opts.maxLoop.value_or(0), 200u);
}

TEST(PulseCli, TraceOptions)
{
    CliOptions all;
    ASSERT_EQ(parse({"--trace", "a.pulse"}, all), CliParseResult::Ok);
    ASSERT_TRUE(all.trace.has_value());
    EXPECT_EQ(*all.trace, pulse::vm::TraceConfig::All);

    CliOptions gc;
    ASSERT_EQ(parse({"--trace=gc", "a.pulse"}, gc), CliParseResult::Ok);
    ASSERT_TRUE(gc.trace.has_value());
    EXPECT_EQ(*gc.trace, pulse::vm::TraceConfig::Gc);

    CliOptions bad;
    EXPECT_EQ(parse({"--trace=loud", "a.pulse"}, bad), CliParseResult::Error);
}

TEST(PulseCli, HelpAndVersionWinOverErrors)
{
    CliOptions help;
    EXPECT_EQ(parse({"-h"}, help), CliParseResult::Help);
    CliOptions longHelp;
    EXPECT_EQ(parse({"--help", "--bogus"}, longHelp), CliParseResult::Help);
    CliOptions version;
    EXPECT_EQ(parse({"--version"}, version), CliParseResult::Version);
}

TEST(PulseCli, MalformedCommandLines)
{
    CliOptions none;
    EXPECT_EQ(parse({}, none), CliParseResult::Error);

    CliOptions unknown;
    EXPECT_EQ(parse({"--bogus", "a.pulse"}, unknown), CliParseResult::Error);

    CliOptions twoFiles;
    EXPECT_EQ(parse({"a.pulse", "b.pulse"}, twoFiles), CliParseResult::Error);

    CliOptions missingValue;
    EXPECT_EQ(parse({"a.pulse", "--seed"}, missingValue), CliParseResult::Error);

    CliOptions zeroLoop;
    EXPECT_EQ(parse({"--max-loop", "0", "a.pulse"}, zeroLoop), CliParseResult::Error);

    CliOptions notNumber;
    EXPECT_EQ(parse({"--history", "many", "a.pulse"}, notNumber), CliParseResult::Error);
}

TEST(PulseCli, CommandLineOverridesEnvironment)
{
    setenv("PULSE_MAX_LOOP", "300", 1);
    setenv("PULSE_SEED", "1", 1);

    CliOptions envOnly;
    envOnly.sourcePath = "a.pulse";
    pulse::vm::RuntimeConfig fromEnv = makeRuntimeConfig(envOnly);
    EXPECT_EQ(fromEnv.maxLoopIterations, 300u);
    EXPECT_EQ(fromEnv.seed.value_or(0), 1u);

    CliOptions opts;
    opts.sourcePath = "a.pulse";
    opts.maxLoop = 50;
    opts.seed = 8;
    opts.trace = pulse::vm::TraceConfig::Stmt;
    pulse::vm::RuntimeConfig config = makeRuntimeConfig(opts);
    EXPECT_EQ(config.maxLoopIterations, 50u);
    EXPECT_EQ(config.seed.value_or(0), 8u);
    EXPECT_EQ(config.trace.mode, pulse::vm::TraceConfig::Stmt);

    unsetenv("PULSE_MAX_LOOP");
    unsetenv("PULSE_SEED");
}

TEST(PulseCli, HistoryRequestReenablesRecording)
{
    setenv("PULSE_SNAPSHOTS", "0", 1);
    CliOptions opts;
    opts.sourcePath = "a.pulse";
    opts.historyCount = 3;
    EXPECT_TRUE(makeRuntimeConfig(opts).recordSnapshots);
    unsetenv("PULSE_SNAPSHOTS");
}

TEST(PulseCli, MissingFileIsUsageError)
{
    CliOptions opts;
    opts.sourcePath = "/nonexistent/dir/missing.pulse";
    EXPECT_EQ(runCommand(opts), kExitUsage);
}

TEST(PulseCli, CleanRunExitsZero)
{
    TempSource src("pulse_cli_ok.pulse", "System.out.println(\"hi\");\n");
    CliOptions opts;
    opts.sourcePath = src.path.string();
    testing::internal::CaptureStdout();
    const int code = runCommand(opts);
    const std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(code, kExitOk);
    EXPECT_EQ(out, "hi\n");
}

TEST(PulseCli, ValidatorErrorExitsOne)
{
    TempSource src("pulse_cli_div.pulse", "int x = 10 / 0;\n");
    CliOptions opts;
    opts.sourcePath = src.path.string();
    testing::internal::CaptureStdout();
    const int code = runCommand(opts);
    const std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(code, kExitDiagnostics);
    EXPECT_NE(out.find("CRITICAL ERRORS DETECTED"), std::string::npos);
}

TEST(PulseCli, CheckModeReportsWithoutRunning)
{
    TempSource src("pulse_cli_check.pulse", "System.out.println(\"hi\");\n");
    CliOptions opts;
    opts.sourcePath = src.path.string();
    opts.mode = CliMode::Check;
    testing::internal::CaptureStdout();
    const int code = runCommand(opts);
    const std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(code, kExitOk);
    EXPECT_EQ(out.find("hi"), std::string::npos);
}

TEST(PulseCli, ReportAndHistorySections)
{
    TempSource src("pulse_cli_report.pulse", "int a = 1;\na = 2;\n");
    CliOptions opts;
    opts.sourcePath = src.path.string();
    opts.report = true;
    opts.historyCount = 1;
    testing::internal::CaptureStdout();
    const int code = runCommand(opts);
    const std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(code, kExitOk);
    EXPECT_NE(out.find("=== GC ==="), std::string::npos);
    EXPECT_NE(out.find("=== Deadlines ===\nno violations\n"), std::string::npos);
    EXPECT_NE(out.find("=== Safety ===\nno violations\n"), std::string::npos);
    EXPECT_NE(out.find("=== History (1 of 2) ===\n#1 line 2"), std::string::npos);
    EXPECT_NE(out.find(" a=2\n"), std::string::npos);
}
