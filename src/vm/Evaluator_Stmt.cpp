//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Evaluator_Stmt.cpp
// Purpose: Statement execution, bounded loops and the per-statement
//          snapshot/collection hook.
// Key invariants: A runtime error aborts only the statement that raised it;
//                 loops never run more iterations than the active bound.
//
//===----------------------------------------------------------------------===//

#include "vm/Evaluator.hpp"

using namespace pulse::frontend;
using pulse::runtime::Value;

namespace pulse::vm
{

//===----------------------------------------------------------------------===//
// Sequencing
//===----------------------------------------------------------------------===//

Evaluator::ExecSignal Evaluator::executeSequence(const std::vector<StmtPtr> &stmts)
{
    for (const auto &stmt : stmts)
    {
        const ExecSignal signal = executeGuarded(*stmt);
        if (signal != ExecSignal::Normal)
            return signal;
    }
    return ExecSignal::Normal;
}

Evaluator::ExecSignal Evaluator::executeGuarded(const Stmt &stmt)
{
    ExecSignal signal = ExecSignal::Normal;
    try
    {
        signal = execute(stmt);
    }
    catch (const RuntimeError &e)
    {
        reportRuntimeError(e);
    }
    afterStatement(stmt);
    return signal;
}

void Evaluator::afterStatement(const Stmt &stmt)
{
    if (stmt.kind == StmtKind::Block)
        return;
    state_.recordSnapshot(stmt.loc.line);
    if (state_.heap.aboveThreshold())
        state_.collectGarbage();
}

Evaluator::ExecSignal Evaluator::execute(const Stmt &stmt)
{
    if (stmt.kind != StmtKind::Block)
    {
        currentLine_ = stmt.loc.line;
        state_.trace.onStatement(stmt.loc.line, stmtKindToString(stmt.kind));
    }

    switch (stmt.kind)
    {
        case StmtKind::Block:
            return executeSequence(static_cast<const BlockStmt &>(stmt).statements);
        case StmtKind::Expr:
            eval(*static_cast<const ExprStmt &>(stmt).expr);
            return ExecSignal::Normal;
        case StmtKind::VarDecl:
            return executeVarDecl(static_cast<const VarDeclStmt &>(stmt));
        case StmtKind::If:
            return executeIf(static_cast<const IfStmt &>(stmt));
        case StmtKind::While:
            return executeWhile(static_cast<const WhileStmt &>(stmt));
        case StmtKind::For:
            return executeFor(static_cast<const ForStmt &>(stmt));
        case StmtKind::Return:
            return executeReturn(static_cast<const ReturnStmt &>(stmt));
        case StmtKind::Break:
            return ExecSignal::Break;
        case StmtKind::Continue:
            return ExecSignal::Continue;
    }
    return ExecSignal::Normal;
}

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

Evaluator::ExecSignal Evaluator::executeVarDecl(const VarDeclStmt &stmt)
{
    Value value = stmt.init ? eval(*stmt.init)
                            : runtime::defaultValueFor(stmt.type.name, stmt.type.isArray);
    declareVariable(stmt.name, stmt.type, value, stmt.loc.line);
    return ExecSignal::Normal;
}

bool Evaluator::evalCondition(const Expr &expr)
{
    const Value value = eval(expr);
    if (!value.isBool())
        throw RuntimeError(expr.loc.line,
                           std::string("Condition must be boolean, got ") +
                               runtime::valueKindToString(value.kind()));
    return value.asBool();
}

Evaluator::ExecSignal Evaluator::executeIf(const IfStmt &stmt)
{
    if (evalCondition(*stmt.condition))
        return executeGuarded(*stmt.thenBranch);
    if (stmt.elseBranch)
        return executeGuarded(*stmt.elseBranch);
    return ExecSignal::Normal;
}

bool Evaluator::loopBoundReached(uint32_t iterations, uint32_t line)
{
    const MethodContext *ctx = context();
    const uint32_t bound = ctx && ctx->realTime ? state_.config.realTimeLoopIterations
                                                : state_.config.maxLoopIterations;
    if (iterations < bound)
        return false;
    state_.append("WARNING: Loop terminated after " + std::to_string(bound) +
                  " iterations for safety\n");
    state_.diagnostics.report({support::Severity::Warning,
                               "Loop terminated after " + std::to_string(bound) + " iterations",
                               {line, 0},
                               runtime_codes::kLoopBound});
    return true;
}

Evaluator::ExecSignal Evaluator::executeWhile(const WhileStmt &stmt)
{
    uint32_t iterations = 0;
    while (evalCondition(*stmt.condition))
    {
        if (loopBoundReached(iterations, stmt.loc.line))
            break;
        const ExecSignal signal = executeGuarded(*stmt.body);
        ++iterations;
        if (signal == ExecSignal::Break)
            break;
        if (signal == ExecSignal::Return)
            return signal;
    }
    return ExecSignal::Normal;
}

Evaluator::ExecSignal Evaluator::executeFor(const ForStmt &stmt)
{
    if (stmt.init)
        execute(*stmt.init);

    uint32_t iterations = 0;
    while (!stmt.condition || evalCondition(*stmt.condition))
    {
        if (loopBoundReached(iterations, stmt.loc.line))
            break;
        const ExecSignal signal = executeGuarded(*stmt.body);
        ++iterations;
        if (signal == ExecSignal::Break)
            break;
        if (signal == ExecSignal::Return)
            return signal;
        for (const auto &update : stmt.updates)
            eval(*update);
    }
    return ExecSignal::Normal;
}

Evaluator::ExecSignal Evaluator::executeReturn(const ReturnStmt &stmt)
{
    returnValue_ = stmt.value ? eval(*stmt.value) : Value::makeVoid();
    return ExecSignal::Return;
}

} // namespace pulse::vm
