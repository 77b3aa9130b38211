//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Stmt.hpp
/// @brief Statement nodes for the Pulse AST.
///
/// @details Statements execute for effect. Blocks do not introduce scopes at
/// run time: the evaluator keeps one flat environment per call frame.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/pulse/AST_Expr.hpp"

namespace pulse::frontend
{

struct Stmt;
using StmtPtr = std::unique_ptr<Stmt>;

/// @brief Enumerates all statement node kinds.
enum class StmtKind
{
    Block,
    Expr,
    VarDecl,
    If,
    While,
    For,
    Return,
    Break,
    Continue,
};

/// @brief Human-readable statement kind, used by tracing.
const char *stmtKindToString(StmtKind kind);

/// @brief Base class for all statement nodes.
struct Stmt
{
    StmtKind kind;
    SourceLoc loc;

    Stmt(StmtKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Stmt() = default;
};

/// @brief `{ statements }`.
struct BlockStmt : Stmt
{
    std::vector<StmtPtr> statements;

    explicit BlockStmt(SourceLoc l) : Stmt(StmtKind::Block, l) {}
};

/// @brief Expression evaluated for its side effects.
struct ExprStmt : Stmt
{
    ExprPtr expr;

    ExprStmt(SourceLoc l, ExprPtr e) : Stmt(StmtKind::Expr, l), expr(std::move(e)) {}
};

/// @brief Local declaration `T name [= init];`.
struct VarDeclStmt : Stmt
{
    TypeRef type;
    std::string name;
    ExprPtr init; ///< May be null; the default value of @ref type applies.

    VarDeclStmt(SourceLoc l, TypeRef t, std::string n, ExprPtr i)
        : Stmt(StmtKind::VarDecl, l), type(std::move(t)), name(std::move(n)), init(std::move(i))
    {
    }
};

/// @brief `if (condition) thenBranch [else elseBranch]`.
struct IfStmt : Stmt
{
    ExprPtr condition;
    StmtPtr thenBranch;
    StmtPtr elseBranch; ///< May be null.

    IfStmt(SourceLoc l, ExprPtr c, StmtPtr t, StmtPtr e)
        : Stmt(StmtKind::If, l), condition(std::move(c)), thenBranch(std::move(t)),
          elseBranch(std::move(e))
    {
    }
};

/// @brief `while (condition) body`.
struct WhileStmt : Stmt
{
    ExprPtr condition;
    StmtPtr body;

    WhileStmt(SourceLoc l, ExprPtr c, StmtPtr b)
        : Stmt(StmtKind::While, l), condition(std::move(c)), body(std::move(b))
    {
    }
};

/// @brief `for (init; condition; updates) body`.
/// @details @ref init is a VarDeclStmt, an ExprStmt or null; a null
///          @ref condition loops until the iteration bound or a break.
struct ForStmt : Stmt
{
    StmtPtr init;
    ExprPtr condition;
    std::vector<ExprPtr> updates;
    StmtPtr body;

    explicit ForStmt(SourceLoc l) : Stmt(StmtKind::For, l) {}
};

/// @brief `return [value];`.
struct ReturnStmt : Stmt
{
    ExprPtr value; ///< Null for a bare return.

    ReturnStmt(SourceLoc l, ExprPtr v) : Stmt(StmtKind::Return, l), value(std::move(v)) {}
};

/// @brief `break;`.
struct BreakStmt : Stmt
{
    explicit BreakStmt(SourceLoc l) : Stmt(StmtKind::Break, l) {}
};

/// @brief `continue;`.
struct ContinueStmt : Stmt
{
    explicit ContinueStmt(SourceLoc l) : Stmt(StmtKind::Continue, l) {}
};

} // namespace pulse::frontend
