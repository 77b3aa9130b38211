//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Engine.cpp
// Purpose: Implement the public Engine facade: the lex/validate/parse/run
//          pipeline and read-only access to the state of the last run.
// Key invariants: Each interpret() starts from a fresh RuntimeState; the
//                 previous state (and its snapshots) is released only then.
// Ownership/Lifetime: Impl owns the configuration, hooks and run state.
//
//===----------------------------------------------------------------------===//

#include "pulse/Engine.hpp"

#include "frontends/pulse/Lexer.hpp"
#include "frontends/pulse/Parser.hpp"
#include "frontends/pulse/SyntaxValidator.hpp"
#include "vm/Evaluator.hpp"

#include <string>
#include <utility>

namespace pulse
{

struct Engine::Impl
{
    Impl(vm::RuntimeConfig cfg, vm::RuntimeHooks h)
        : config(std::move(cfg)), hooks(std::move(h)),
          state(std::make_unique<vm::RuntimeState>(config, hooks))
    {
    }

    /// @brief Copy the observable state into @p result.
    void finish(InterpretResult &result) const
    {
        result.output = *state->output;
        result.snapshots = state->history.retained();
        result.gcMetrics.assign(state->heap.metrics().begin(), state->heap.metrics().end());
        result.deadlineViolations = state->deadlines.violations();
        result.safetyViolations = state->safetyViolations;
        result.diagnostics = state->diagnostics.diagnostics();
    }

    vm::RuntimeConfig config;
    vm::RuntimeHooks hooks;
    std::unique_ptr<vm::RuntimeState> state;
};

Engine::Engine(vm::RuntimeConfig config, vm::RuntimeHooks hooks)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(hooks)))
{
}

Engine::~Engine() = default;
Engine::Engine(Engine &&) noexcept = default;
Engine &Engine::operator=(Engine &&) noexcept = default;

InterpretResult Engine::interpret(std::string_view source)
{
    impl_->state = std::make_unique<vm::RuntimeState>(impl_->config, impl_->hooks);
    vm::RuntimeState &st = *impl_->state;
    InterpretResult result;

    frontend::Lexer lexer{std::string(source)};
    auto tokens = lexer.tokenize();
    if (!tokens)
    {
        const support::Diagnostic &error = tokens.error();
        st.diagnostics.report(error);
        st.append("Lex error (line " + std::to_string(error.loc.line) + "): " + error.message +
                  "\n");
        impl_->finish(result);
        return result;
    }

    frontend::SyntaxValidator validator(st.diagnostics);
    validator.validate(tokens.value());
    if (st.diagnostics.errorCount() > 0)
    {
        st.append("CRITICAL ERRORS DETECTED - EXECUTION HALTED:\n");
        for (const auto &d : st.diagnostics.diagnostics())
        {
            if (d.severity == support::Severity::Error)
                st.append("Line " + std::to_string(d.loc.line) + ": " + d.message + "\n");
        }
        impl_->finish(result);
        return result;
    }

    support::DiagnosticEngine parseDiags;
    frontend::Parser parser(tokens.value(), parseDiags);
    std::unique_ptr<frontend::Program> program = parser.parseProgram();
    for (const auto &d : parseDiags.diagnostics())
        st.diagnostics.report(d);
    if (parser.hasError() || !program)
    {
        for (const auto &d : parseDiags.diagnostics())
        {
            if (d.severity == support::Severity::Error)
                st.append("Parse error (line " + std::to_string(d.loc.line) + "): " + d.message +
                          "\n");
        }
        impl_->finish(result);
        return result;
    }

    vm::Evaluator evaluator(st, *program);
    evaluator.run();
    result.executed = true;
    result.halted = evaluator.halted();
    impl_->finish(result);
    return result;
}

void Engine::triggerGC()
{
    impl_->state->collectGarbage();
}

HeapStatus Engine::getHeapStatus() const
{
    const runtime::Heap &heap = impl_->state->heap;
    HeapStatus status;
    status.used = heap.used();
    status.max = heap.budget();
    status.percentage = heap.usagePercent();
    const runtime::OffHeapUsage offHeap = heap.arena().usage();
    status.offHeap.allocated = offHeap.allocated;
    status.offHeap.total = offHeap.total;
    return status;
}

const runtime::Snapshot *Engine::stepBackInTime()
{
    return impl_->state->history.stepBack();
}

const runtime::Snapshot *Engine::stepForwardInTime()
{
    return impl_->state->history.stepForward();
}

const runtime::Snapshot *Engine::jumpToSnapshot(uint64_t id)
{
    return impl_->state->history.jumpTo(id);
}

const runtime::Snapshot *Engine::currentSnapshot() const
{
    return impl_->state->history.current();
}

const std::vector<vm::DeadlineViolation> &Engine::getDeadlineViolations() const
{
    return impl_->state->deadlines.violations();
}

const std::vector<vm::SafetyViolation> &Engine::getSafetyViolations() const
{
    return impl_->state->safetyViolations;
}

const std::deque<runtime::GcMetricsSample> &Engine::getGCMetrics() const
{
    return impl_->state->heap.metrics();
}

const std::vector<support::Diagnostic> &Engine::getDiagnostics() const
{
    return impl_->state->diagnostics.diagnostics();
}

const runtime::TimeTravelRecorder &Engine::history() const
{
    return impl_->state->history;
}

const vm::RuntimeConfig &Engine::config() const
{
    return impl_->config;
}

void Engine::setConfig(vm::RuntimeConfig config)
{
    impl_->config = std::move(config);
}

void Engine::setSeed(uint64_t seed)
{
    impl_->config.seed = seed;
}

void Engine::setRandomSource(std::function<double()> random)
{
    impl_->hooks.random = std::move(random);
}

} // namespace pulse
