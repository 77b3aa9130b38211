//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pulse/SyntaxValidator.hpp
// Purpose: Static checks over the token stream that run before parsing and
//          never execute code.
// Key invariants: Each (line, message) pair is reported at most once; at most
//                 maxSemicolonWarnings missing-semicolon warnings are issued.
// Ownership/Lifetime: Borrows the DiagnosticEngine; holds no tokens.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/pulse/Token.hpp"
#include "support/diagnostics.hpp"
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pulse::frontend
{

/// @brief Diagnostic codes emitted by the validator.
namespace validator_codes
{
inline constexpr const char *kDeadlineSyntax = "P3001";
inline constexpr const char *kDeadlineNotPositive = "P3002";
inline constexpr const char *kDeadlineNotRealTime = "P3003";
inline constexpr const char *kDivisionByZero = "P3010";
inline constexpr const char *kUnsafeOperation = "P3020";
inline constexpr const char *kBracketMismatch = "P3030";
inline constexpr const char *kMissingSemicolon = "P3040";
inline constexpr const char *kUnexpectedCharacter = "P3050";
} // namespace validator_codes

/// @brief Token-level static analysis.
///
/// @details Checks performed, in order:
///   - `@Deadline` syntax and value range
///   - division or modulo by a literal zero
///   - calls into process-control APIs (`System.exit`, `Runtime.getRuntime`,
///     `ProcessBuilder`, `Class.forName`)
///   - balanced `()`, `[]` and `{}`
///   - missing `;` on declaration/assignment lines (warning)
///   - stray characters (warning)
///
/// Any Error-severity result must keep the program from executing.
class SyntaxValidator
{
  public:
    /// @brief Create a validator reporting into @p diag.
    explicit SyntaxValidator(support::DiagnosticEngine &diag, size_t maxSemicolonWarnings = 3);

    /// @brief Run every check over @p tokens (Comment tokens are ignored).
    void validate(const std::vector<Token> &tokens);

  private:
    void checkDeadlines();
    void checkDivisionByZero();
    void checkUnsafeOperations();
    void checkBrackets();
    void checkMissingSemicolons();
    void checkUnknownCharacters();

    void report(support::Severity severity,
                SourceLoc loc,
                const std::string &message,
                const char *code);

    const Token &at(size_t i) const;

    support::DiagnosticEngine &diag_;
    size_t maxSemicolonWarnings_;
    std::vector<Token> tokens_;
    std::set<std::pair<uint32_t, std::string>> seen_;
};

} // namespace pulse::frontend
