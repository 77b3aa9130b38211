//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pulse/AstPrinter.hpp
// Purpose: Re-serialize a Pulse AST to canonical source text.
// Key invariants: Printing, re-parsing and printing again yields identical
//                 text; nested composite expressions are fully parenthesized.
// Ownership/Lifetime: Stateless apart from the output buffer it fills.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/pulse/AST.hpp"
#include <string>

namespace pulse::frontend
{

/// @brief Pretty-printer producing canonical Pulse source from an AST.
/// @details Classes are printed first, then top-level methods, then top-level
///          statements. Indentation is four spaces per level.
class AstPrinter
{
  public:
    /// @brief Render a whole program.
    std::string print(const Program &program);

    /// @brief Render one statement at indentation level zero.
    std::string print(const Stmt &stmt);

    /// @brief Render one expression.
    std::string print(const Expr &expr);

  private:
    void printClass(const ClassDecl &cls);
    void printMethod(const MethodDecl &method, const std::string &ownerName);
    void printField(const FieldDecl &field);
    void printAnnotations(const std::vector<Annotation> &annotations);
    void printModifiers(const Modifiers &mods);
    void printStmt(const Stmt &stmt);
    void printBlockBody(const BlockStmt &block);
    void printBranch(const Stmt &stmt, bool guardDanglingElse);
    void printVarDeclCore(const VarDeclStmt &decl);
    void printExpr(const Expr &expr, bool nested);
    void printArgs(const std::vector<ExprPtr> &args);
    void indent();
    void line(const std::string &text);

    std::string out_;
    int depth_ = 0;
};

/// @brief Format a double so that it lexes back as the same NumberLiteral.
std::string formatNumberLiteral(double value);

/// @brief Quote and escape @p value as a string literal.
std::string quoteString(const std::string &value);

} // namespace pulse::frontend
