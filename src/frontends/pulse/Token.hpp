//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pulse/Token.hpp
// Purpose: Token kinds and token structure for the Pulse lexer.
// Key invariants: Each token has a kind, location and byte span; its text is
//                 exactly the source bytes covered by the span.
// Ownership/Lifetime: Tokens own their string data (text field).
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"
#include <cstdint>
#include <string>

namespace pulse::frontend
{

using support::SourceLoc;
using support::SourceSpan;

/// @brief Token kinds for Pulse sources.
/// @details Organized into sections: special, literals, keywords, annotations,
///          operators, punctuation.
enum class TokenKind
{
    // Special tokens
    Eof,
    Unknown, // stray character that starts no token
    Comment, // `// ...` or `/* ... */`

    // Literals
    IntegerLiteral, // 42
    NumberLiteral,  // 3.14
    StringLiteral,  // "hello"
    Identifier,     // user-defined names

    // Keywords (sorted alphabetically, matching the lookup table)
    KwBoolean,
    KwBreak,
    KwClass,
    KwContinue,
    KwDouble,
    KwElse,
    KwFalse,
    KwFor,
    KwIf,
    KwInt,
    KwNew,
    KwNull,
    KwPrivate,
    KwPublic,
    KwReturn,
    KwStatic,
    KwString,
    KwThis,
    KwTrue,
    KwVoid,
    KwWhile,

    // Annotations
    AtDeadline,    // @Deadline
    AtSensor,      // @Sensor
    AtSafetyCheck, // @SafetyCheck
    AtRealTime,    // @RealTime
    Annotation,    // any other @name

    // Operators
    Plus,         // +
    Minus,        // -
    Star,         // *
    Slash,        // /
    Percent,      // %
    PlusPlus,     // ++
    MinusMinus,   // --
    Bang,         // !
    Equal,        // =
    EqualEqual,   // ==
    NotEqual,     // !=
    Less,         // <
    LessEqual,    // <=
    Greater,      // >
    GreaterEqual, // >=
    AmpAmp,       // &&
    PipePipe,     // ||
    Question,     // ?
    Colon,        // :

    // Punctuation
    Dot,       // .
    Comma,     // ,
    Semicolon, // ;
    LParen,    // (
    RParen,    // )
    LBracket,  // [
    RBracket,  // ]
    LBrace,    // {
    RBrace,    // }
};

/// @brief Convert TokenKind to string for debugging and diagnostics.
const char *tokenKindToString(TokenKind kind);

/// @brief Token structure holding kind, location, span and literal payload.
struct Token
{
    TokenKind kind = TokenKind::Eof;
    SourceLoc loc{};
    SourceSpan span{};
    std::string text; // Original source text (the lexeme)

    // Literal values
    int64_t intValue = 0;
    double doubleValue = 0.0;
    std::string stringValue; // Unescaped string content

    /// @brief Check if this token is of the given kind.
    bool is(TokenKind k) const
    {
        return kind == k;
    }

    /// @brief Check if this token is one of the given kinds.
    template <typename... Kinds> bool isOneOf(Kinds... kinds) const
    {
        return (is(kinds) || ...);
    }

    /// @brief Check if this token is a keyword.
    bool isKeyword() const;

    /// @brief Check if this token is one of the annotation kinds.
    bool isAnnotation() const;

    /// @brief Check if this token names a primitive type or `void`.
    bool isTypeKeyword() const;
};

} // namespace pulse::frontend
