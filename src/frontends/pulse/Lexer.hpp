//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.hpp
/// @brief Lexical analyzer for Pulse source code.
///
/// @details The lexer performs a single left-to-right scan over the source and
/// produces the complete token list in one call. Unlike compiler lexers it
/// keeps comments (as Comment tokens) and stray characters (as Unknown tokens)
/// so that the token stream covers every non-whitespace byte of the input; the
/// syntax validator and editors rely on that.
///
/// ## Token Categories
///
/// - Literals: integers (`42`), numbers (`3.14`), strings (`"text"`)
/// - Identifiers and keywords (binary-searched keyword table)
/// - Annotations: `@Deadline`, `@Sensor`, `@SafetyCheck`, `@RealTime`, and a
///   generic Annotation kind for any other `@name`
/// - Operators and punctuation, maximal munch for two-character forms
///
/// ## Errors
///
/// An unterminated string literal and an integer literal that does not fit in
/// 64 bits are fatal: tokenize() returns the diagnostic instead of a token
/// list. Everything else lexes.
///
/// @invariant pos_ <= source_.size()
/// @invariant For every produced token, text == source.substr(span).
///
/// @see Token.hpp - Token types and TokenKind enum
/// @see Parser.hpp - Consumes tokens to build the AST
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/pulse/Token.hpp"
#include "support/diag_expected.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pulse::frontend
{

/// @brief Lexical analyzer for Pulse source code.
class Lexer
{
  public:
    /// @brief Create a lexer over a copy of @p source.
    explicit Lexer(std::string source);

    /// @brief Scan the whole source.
    /// @return EOF-terminated token list, or the fatal lexical diagnostic.
    support::Expected<std::vector<Token>> tokenize();

    /// @brief Look up a keyword by name.
    /// @return TokenKind if the name is a keyword, nullopt for identifiers.
    static std::optional<TokenKind> lookupKeyword(const std::string &name);

  private:
    //=========================================================================
    /// @name Character Access
    /// @{
    //=========================================================================

    /// @brief Character at the current position, or '\0' at EOF.
    char peekChar() const;

    /// @brief Character @p offset bytes ahead, or '\0' past EOF.
    char peekChar(size_t offset) const;

    /// @brief Consume one byte, maintaining line/column.
    char getChar();

    /// @brief True once every byte has been consumed.
    bool eof() const;

    /// @brief Location of the next unconsumed byte.
    SourceLoc currentLoc() const;

    /// @}
    //=========================================================================
    /// @name Token Lexing
    /// @{
    //=========================================================================

    /// @brief Lex one token starting at the current position.
    /// @return The token, or a diagnostic when the input cannot be lexed.
    support::Expected<Token> lexToken();

    void skipWhitespace();
    Token lexLineComment();
    Token lexBlockComment();
    Token lexIdentifierOrKeyword();
    Token lexAnnotation();
    support::Expected<Token> lexNumber();
    support::Expected<Token> lexString();

    /// @brief Process an escape sequence after the backslash was consumed.
    /// @return The escaped character, or nullopt for an unknown escape (the
    ///         caller then keeps the escaped character itself).
    std::optional<char> processEscape(char c);

    /// @brief Build a single- or two-character operator token.
    Token makeOperator(TokenKind kind, size_t width);

    /// @brief Seal @p tok: fill its span end and lexeme from the consumed bytes.
    void finish(Token &tok, size_t begin);

    /// @}

    std::string source_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;
};

} // namespace pulse::frontend
