//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/pulse/cmd_run.cpp
// Purpose: Implement the pulse driver commands: run, check, token and AST
//          dumps, and the post-run report and history listings.
// Key invariants: Program output goes to stdout; diagnostics, reports' error
//                 lines and traces go to stderr.
// Ownership/Lifetime: Each command owns its Engine or frontend objects for the
//                     duration of the call.
//
//===----------------------------------------------------------------------===//

#include "frontends/pulse/AstPrinter.hpp"
#include "frontends/pulse/Lexer.hpp"
#include "frontends/pulse/Parser.hpp"
#include "frontends/pulse/SyntaxValidator.hpp"
#include "pulse/Engine.hpp"
#include "tools/common/source_loader.hpp"
#include "tools/pulse/cli.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>
#include <vector>

namespace pulse::tools
{

namespace
{

bool hasErrors(const std::vector<support::Diagnostic> &diags)
{
    return std::any_of(diags.begin(),
                       diags.end(),
                       [](const support::Diagnostic &d)
                       { return d.severity == support::Severity::Error; });
}

/// @brief Lex and validate @p source, then parse unless validation failed.
/// @return Exit code for --check and --dump-ast.
int checkSource(const std::string &path, const std::string &source, bool dumpAst)
{
    frontend::Lexer lexer{source};
    auto tokens = lexer.tokenize();
    if (!tokens)
    {
        support::printDiag(tokens.error(), std::cerr, path);
        return kExitDiagnostics;
    }

    support::DiagnosticEngine diags;
    frontend::SyntaxValidator validator(diags);
    validator.validate(tokens.value());

    std::unique_ptr<frontend::Program> program;
    bool parseFailed = false;
    if (diags.errorCount() == 0)
    {
        frontend::Parser parser(tokens.value(), diags);
        program = parser.parseProgram();
        parseFailed = parser.hasError() || !program;
    }

    diags.printAll(std::cerr);
    if (diags.errorCount() > 0 || parseFailed)
        return kExitDiagnostics;

    if (dumpAst)
    {
        frontend::AstPrinter printer;
        std::cout << printer.print(*program);
    }
    return kExitOk;
}

int dumpTokens(const std::string &path, const std::string &source)
{
    frontend::Lexer lexer{source};
    auto tokens = lexer.tokenize();
    if (!tokens)
    {
        support::printDiag(tokens.error(), std::cerr, path);
        return kExitDiagnostics;
    }
    for (const frontend::Token &tok : tokens.value())
    {
        std::cout << tok.loc.line << ':' << tok.loc.column << ' '
                  << frontend::tokenKindToString(tok.kind);
        if (!tok.text.empty())
            std::cout << " '" << tok.text << '\'';
        std::cout << '\n';
    }
    return kExitOk;
}

void printReport(const Engine &engine)
{
    std::ostream &os = std::cout;
    os << std::fixed << std::setprecision(2);

    const HeapStatus heap = engine.getHeapStatus();
    const auto &metrics = engine.getGCMetrics();
    os << "=== GC ===\n";
    os << "heap: " << heap.used << '/' << heap.max << " bytes (" << heap.percentage << "%)\n";
    os << "off-heap: " << heap.offHeap.allocated << '/' << heap.offHeap.total << " bytes\n";
    os << "collections: " << (metrics.empty() ? 0 : metrics.back().collections) << '\n';
    if (!metrics.empty())
    {
        double maxPause = 0;
        for (const auto &sample : metrics)
            maxPause = std::max(maxPause, sample.pauseTimeMs);
        os << "max pause: " << maxPause << "ms\n";
    }

    const auto &deadlines = engine.getDeadlineViolations();
    os << "=== Deadlines ===\n";
    if (deadlines.empty())
        os << "no violations\n";
    for (const auto &v : deadlines)
    {
        os << '[' << vm::toString(v.severity) << "] " << v.methodName << ": " << v.actualMs
           << "ms (expected " << v.expectedMs << "ms, line " << v.line << ")\n";
    }

    const auto &safety = engine.getSafetyViolations();
    os << "=== Safety ===\n";
    if (safety.empty())
        os << "no violations\n";
    for (const auto &v : safety)
    {
        os << '[' << vm::toString(v.severity) << "] " << vm::toString(v.kind) << " line "
           << v.line << ": " << v.message << '\n';
    }
    os.unsetf(std::ios::floatfield);
}

void printHistory(const Engine &engine, size_t count)
{
    const std::vector<const runtime::Snapshot *> all = engine.history().all();
    const size_t first = all.size() > count ? all.size() - count : 0;
    std::cout << "=== History (" << (all.size() - first) << " of " << all.size() << ") ===\n";
    for (size_t i = first; i < all.size(); ++i)
    {
        const runtime::Snapshot &snap = *all[i];
        std::cout << '#' << snap.id << " line " << snap.line;
        if (!snap.callStack.empty())
            std::cout << " in " << snap.callStack.back();
        std::cout << " heap=" << snap.heapState.used << 'B';
        for (const auto &[name, value] : snap.variables)
            std::cout << ' ' << name << '=' << value.toString();
        std::cout << '\n';
    }
}

int runSource(const CliOptions &opts, const std::string &source)
{
    Engine engine(makeRuntimeConfig(opts));
    InterpretResult result = engine.interpret(source);

    std::cout << result.output;
    std::cout.flush();

    if (opts.report)
        printReport(engine);
    if (opts.historyCount > 0)
        printHistory(engine, opts.historyCount);

    if (!result.executed || result.halted || hasErrors(result.diagnostics))
        return kExitDiagnostics;
    return kExitOk;
}

} // namespace

int runCommand(const CliOptions &opts)
{
    auto source = loadSourceFile(opts.sourcePath);
    if (!source)
    {
        support::printDiag(source.error(), std::cerr);
        return kExitUsage;
    }

    switch (opts.mode)
    {
        case CliMode::Check:
            return checkSource(opts.sourcePath, source.value(), false);
        case CliMode::DumpAst:
            return checkSource(opts.sourcePath, source.value(), true);
        case CliMode::DumpTokens:
            return dumpTokens(opts.sourcePath, source.value());
        case CliMode::Run:
            return runSource(opts, source.value());
    }
    return kExitUsage;
}

} // namespace pulse::tools
