//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.hpp
/// @brief Recursive descent parser for Pulse programs.
///
/// @details The parser consumes the token list produced by Lexer::tokenize()
/// (comment tokens are dropped on construction) and builds the AST. Each
/// grammar rule is a parsing method; binary operators are handled by one
/// method per precedence level.
///
/// ## Operator Precedence
///
/// | Level | Operators                 | Description       |
/// |-------|---------------------------|-------------------|
/// |   1   | `()` `[]` `.` `++` `--`   | Postfix           |
/// |   2   | `!` `-` `++` `--`         | Prefix unary      |
/// |   3   | `*` `/` `%`               | Multiplicative    |
/// |   4   | `+` `-`                   | Additive          |
/// |   5   | `<` `<=` `>` `>=`         | Relational        |
/// |   6   | `==` `!=`                 | Equality          |
/// |   7   | `&&`                      | Logical AND       |
/// |   8   | `\|\|`                    | Logical OR        |
/// |   9   | `?:`                      | Conditional       |
/// |  10   | `=`                       | Assignment (right)|
///
/// ## Error Recovery
///
/// Errors are reported to the DiagnosticEngine with the offending token's
/// location and code P2001. The parser then skips to the next `;` or `}` and
/// continues, so callers receive a partial tree plus every error; hasError()
/// tells them whether to trust it.
///
/// Expression and statement nesting are each capped at 256 levels so that
/// the parser, printer and evaluator never recurse without bound. Hitting a
/// cap reports one error and abandons the rest of the input.
///
/// ## Declarations
///
/// Declarations need more than one token of lookahead (`int[] a`, `Foo f`,
/// `public static void main(...)`); the parser works over a fully
/// materialised token vector and peeks freely.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/pulse/AST.hpp"
#include "frontends/pulse/Token.hpp"
#include "support/diagnostics.hpp"
#include <memory>
#include <vector>

namespace pulse::frontend
{

/// @brief Recursive descent parser for Pulse source.
class Parser
{
  public:
    /// @brief Create a parser over @p tokens, reporting errors to @p diag.
    /// @param tokens EOF-terminated token list; Comment tokens are ignored.
    /// @param diag Diagnostic sink; must outlive the parser.
    Parser(const std::vector<Token> &tokens, support::DiagnosticEngine &diag);

    /// @brief Parse a whole program.
    /// @return The (possibly partial) program; never null.
    std::unique_ptr<Program> parseProgram();

    /// @brief Parse a single expression.
    ExprPtr parseExpression();

    /// @brief Parse a single statement.
    StmtPtr parseStatement();

    /// @brief True once any parse error has been reported.
    [[nodiscard]] bool hasError() const
    {
        return hasError_;
    }

  private:
    //=========================================================================
    /// @name Token Handling
    /// @{
    //=========================================================================

    const Token &peek(size_t offset = 0) const;
    Token advance();
    bool check(TokenKind kind, size_t offset = 0) const;
    bool match(TokenKind kind, Token *out = nullptr);
    bool expect(TokenKind kind, const char *what, Token *out = nullptr);
    void resyncAfterError();
    bool atEnd() const;

    /// @}
    //=========================================================================
    /// @name Error Handling
    /// @{
    //=========================================================================

    void error(const std::string &message);
    void errorAt(SourceLoc loc, const std::string &message);

    /// @brief Report a nesting overflow and skip to end of input.
    void nestingTooDeep(const char *what, unsigned limit);

    /// @brief Enter one more expression level; false once past the cap.
    bool enterExprLevel();

    /// @brief Gives back @c levels of @c depth on scope exit.
    struct DepthGuard
    {
        unsigned &depth;
        unsigned levels = 1;

        ~DepthGuard()
        {
            depth -= levels;
        }
    };

    /// @}
    //=========================================================================
    /// @name Expressions (Parser_Expr.cpp)
    /// @{
    //=========================================================================

    ExprPtr parseAssignment();
    ExprPtr parseConditional();
    ExprPtr parseLogicalOr();
    ExprPtr parseLogicalAnd();
    ExprPtr parseEquality();
    ExprPtr parseRelational();
    ExprPtr parseAdditive();
    ExprPtr parseMultiplicative();
    ExprPtr parseUnary();
    ExprPtr parsePostfix();
    ExprPtr parsePrimary();
    ExprPtr parseNew();
    bool parseCallArgs(std::vector<ExprPtr> &args);

    /// @}
    //=========================================================================
    /// @name Statements (Parser_Stmt.cpp)
    /// @{
    //=========================================================================

    std::unique_ptr<BlockStmt> parseBlock();
    StmtPtr parseVarDecl(bool requireSemicolon);
    StmtPtr parseIfStmt();
    StmtPtr parseWhileStmt();
    StmtPtr parseForStmt();
    StmtPtr parseReturnStmt();
    StmtPtr parseExprStmt(bool requireSemicolon);

    /// @brief True when the tokens at the cursor start a local declaration.
    bool isVarDeclStart() const;

    /// @}
    //=========================================================================
    /// @name Declarations (Parser_Decl.cpp)
    /// @{
    //=========================================================================

    /// @brief Parse a type, returning false on error.
    bool parseType(TypeRef &out);

    /// @brief Number of tokens a type occupies at @p offset, or 0 if none.
    size_t typeLengthAt(size_t offset) const;

    /// @brief True when a method header starts at the cursor (after any
    ///        annotations and modifiers).
    bool isMethodStart() const;

    std::vector<Annotation> parseAnnotations();
    bool parseAnnotation(Annotation &out);
    Modifiers parseModifiers();
    std::unique_ptr<ClassDecl> parseClass(std::vector<Annotation> annotations,
                                          Modifiers modifiers);
    std::unique_ptr<MethodDecl> parseMethodRest(std::vector<Annotation> annotations,
                                                Modifiers modifiers,
                                                TypeRef returnType,
                                                Token nameTok,
                                                bool isConstructor);
    std::unique_ptr<FieldDecl> parseFieldRest(std::vector<Annotation> annotations,
                                              Modifiers modifiers,
                                              TypeRef type,
                                              Token nameTok);
    bool parseParameters(std::vector<Param> &params);

    /// @}

    std::vector<Token> tokens_;
    size_t pos_ = 0;
    support::DiagnosticEngine &diag_;
    bool hasError_ = false;

    static constexpr unsigned kMaxExprDepth = 256;
    static constexpr unsigned kMaxStmtDepth = 256;
    unsigned exprDepth_ = 0;
    unsigned stmtDepth_ = 0;
    /// Set after a nesting overflow; later errors are not reported.
    bool abandoned_ = false;
};

} // namespace pulse::frontend
