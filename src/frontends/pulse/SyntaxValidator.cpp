//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Token-stream validation. Every check walks the comment-free token vector and
// reports through a de-duplicating helper, so overlapping checks never emit the
// same message twice for one line.
//
//===----------------------------------------------------------------------===//

#include "frontends/pulse/SyntaxValidator.hpp"
#include <iterator>
#include <map>

namespace pulse::frontend
{

using support::Severity;
namespace codes = validator_codes;

namespace
{
const char *bracketName(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::LBrace:
        case TokenKind::RBrace:
            return "brace";
        case TokenKind::LBracket:
        case TokenKind::RBracket:
            return "bracket";
        default:
            return "parenthesis";
    }
}

TokenKind closerFor(TokenKind open)
{
    switch (open)
    {
        case TokenKind::LBrace:
            return TokenKind::RBrace;
        case TokenKind::LBracket:
            return TokenKind::RBracket;
        default:
            return TokenKind::RParen;
    }
}

bool isIdent(const Token &tok, const char *name)
{
    return tok.is(TokenKind::Identifier) && tok.text == name;
}

/// @brief Tokens that, at the end of a line, mean the statement continues.
bool continuesStatement(const Token &tok)
{
    return tok.isOneOf(TokenKind::Semicolon,
                       TokenKind::LBrace,
                       TokenKind::RBrace,
                       TokenKind::Comma,
                       TokenKind::LParen,
                       TokenKind::LBracket,
                       TokenKind::Equal,
                       TokenKind::Plus,
                       TokenKind::Minus,
                       TokenKind::Star,
                       TokenKind::Slash,
                       TokenKind::Percent,
                       TokenKind::AmpAmp,
                       TokenKind::PipePipe,
                       TokenKind::Question,
                       TokenKind::Colon,
                       TokenKind::Dot,
                       TokenKind::Less,
                       TokenKind::LessEqual,
                       TokenKind::Greater,
                       TokenKind::GreaterEqual,
                       TokenKind::EqualEqual,
                       TokenKind::NotEqual,
                       TokenKind::Bang);
}

/// @brief Tokens that, at the start of a line, continue the previous one.
bool continuesFromPrevious(const Token &tok)
{
    return tok.isOneOf(TokenKind::RParen,
                       TokenKind::Dot,
                       TokenKind::Plus,
                       TokenKind::Minus,
                       TokenKind::Star,
                       TokenKind::Slash,
                       TokenKind::Percent,
                       TokenKind::AmpAmp,
                       TokenKind::PipePipe,
                       TokenKind::Question,
                       TokenKind::Colon,
                       TokenKind::Semicolon,
                       TokenKind::Equal);
}
} // namespace

SyntaxValidator::SyntaxValidator(support::DiagnosticEngine &diag, size_t maxSemicolonWarnings)
    : diag_(diag), maxSemicolonWarnings_(maxSemicolonWarnings)
{
}

const Token &SyntaxValidator::at(size_t i) const
{
    if (i >= tokens_.size())
        return tokens_.back();
    return tokens_[i];
}

void SyntaxValidator::report(Severity severity,
                             SourceLoc loc,
                             const std::string &message,
                             const char *code)
{
    if (!seen_.emplace(loc.line, message).second)
        return;
    diag_.report(support::Diagnostic{severity, message, loc, code});
}

void SyntaxValidator::validate(const std::vector<Token> &tokens)
{
    tokens_.clear();
    seen_.clear();
    for (const auto &tok : tokens)
    {
        if (!tok.is(TokenKind::Comment))
            tokens_.push_back(tok);
    }
    if (tokens_.empty() || !tokens_.back().is(TokenKind::Eof))
        tokens_.push_back(Token{});

    checkDeadlines();
    checkDivisionByZero();
    checkUnsafeOperations();
    checkBrackets();
    checkMissingSemicolons();
    checkUnknownCharacters();
}

//===----------------------------------------------------------------------===//
// @Deadline
//===----------------------------------------------------------------------===//

void SyntaxValidator::checkDeadlines()
{
    const std::string invalidSyntax = "Invalid @Deadline syntax. Use @Deadline(ms=value)";

    for (size_t i = 0; i < tokens_.size(); ++i)
    {
        if (!tokens_[i].is(TokenKind::AtDeadline))
            continue;
        const SourceLoc loc = tokens_[i].loc;

        if (!at(i + 1).is(TokenKind::LParen))
        {
            report(Severity::Error, loc, invalidSyntax, codes::kDeadlineSyntax);
            continue;
        }

        // Find `ms = <value>` before the closing parenthesis.
        size_t j = i + 2;
        bool found = false;
        while (j < tokens_.size() && !at(j).isOneOf(TokenKind::RParen, TokenKind::Eof))
        {
            if (isIdent(at(j), "ms") && at(j + 1).is(TokenKind::Equal))
            {
                found = true;
                j += 2;
                break;
            }
            ++j;
        }
        if (!found)
        {
            report(Severity::Error, loc, invalidSyntax, codes::kDeadlineSyntax);
            continue;
        }

        bool negative = false;
        if (at(j).is(TokenKind::Minus))
        {
            negative = true;
            ++j;
        }

        const Token &value = at(j);
        bool numeric = true;
        int64_t ms = 0;
        if (value.is(TokenKind::IntegerLiteral))
            ms = value.intValue;
        else if (value.is(TokenKind::NumberLiteral))
            ms = static_cast<int64_t>(value.doubleValue);
        else
            numeric = false;
        if (negative)
            ms = -ms;

        if (!numeric || ms <= 0)
        {
            report(Severity::Error, value.loc, "Deadline must be positive", codes::kDeadlineNotPositive);
        }
        else if (ms > 1000)
        {
            report(Severity::Warning,
                   value.loc,
                   "Deadline > 1000ms may not be real-time",
                   codes::kDeadlineNotRealTime);
        }
    }
}

//===----------------------------------------------------------------------===//
// Division by literal zero
//===----------------------------------------------------------------------===//

void SyntaxValidator::checkDivisionByZero()
{
    for (size_t i = 0; i + 1 < tokens_.size(); ++i)
    {
        const Token &op = tokens_[i];
        if (!op.isOneOf(TokenKind::Slash, TokenKind::Percent))
            continue;
        const Token &rhs = tokens_[i + 1];
        const bool zero = (rhs.is(TokenKind::IntegerLiteral) && rhs.intValue == 0) ||
                          (rhs.is(TokenKind::NumberLiteral) && rhs.doubleValue == 0.0);
        if (zero)
            report(Severity::Error, op.loc, "Division by zero detected", codes::kDivisionByZero);
    }
}

//===----------------------------------------------------------------------===//
// Unsafe operations
//===----------------------------------------------------------------------===//

void SyntaxValidator::checkUnsafeOperations()
{
    const std::string message = "Unsafe operation not allowed in IoT environment";
    for (size_t i = 0; i < tokens_.size(); ++i)
    {
        const Token &tok = tokens_[i];
        if (!tok.is(TokenKind::Identifier))
            continue;

        const bool dotted = at(i + 1).is(TokenKind::Dot);
        const bool unsafe = (tok.text == "System" && dotted && isIdent(at(i + 2), "exit")) ||
                            (tok.text == "Runtime" && dotted && isIdent(at(i + 2), "getRuntime")) ||
                            (tok.text == "Class" && dotted && isIdent(at(i + 2), "forName")) ||
                            tok.text == "ProcessBuilder";
        if (unsafe)
            report(Severity::Error, tok.loc, message, codes::kUnsafeOperation);
    }
}

//===----------------------------------------------------------------------===//
// Bracket balance
//===----------------------------------------------------------------------===//

void SyntaxValidator::checkBrackets()
{
    std::vector<const Token *> stack;
    for (const auto &tok : tokens_)
    {
        if (tok.isOneOf(TokenKind::LBrace, TokenKind::LBracket, TokenKind::LParen))
        {
            stack.push_back(&tok);
            continue;
        }
        if (!tok.isOneOf(TokenKind::RBrace, TokenKind::RBracket, TokenKind::RParen))
            continue;

        if (stack.empty())
        {
            report(Severity::Error,
                   tok.loc,
                   std::string("Unmatched closing ") + bracketName(tok.kind),
                   codes::kBracketMismatch);
            continue;
        }
        const Token *open = stack.back();
        stack.pop_back();
        if (closerFor(open->kind) != tok.kind)
        {
            report(Severity::Error,
                   tok.loc,
                   std::string("Mismatched ") + bracketName(tok.kind),
                   codes::kBracketMismatch);
        }
    }

    for (const Token *open : stack)
    {
        report(Severity::Error,
               open->loc,
               std::string("Unclosed ") + bracketName(open->kind),
               codes::kBracketMismatch);
    }
}

//===----------------------------------------------------------------------===//
// Missing semicolons
//===----------------------------------------------------------------------===//

void SyntaxValidator::checkMissingSemicolons()
{
    // Group token indices by source line.
    std::map<uint32_t, std::vector<size_t>> lines;
    for (size_t i = 0; i < tokens_.size(); ++i)
    {
        if (!tokens_[i].is(TokenKind::Eof))
            lines[tokens_[i].loc.line].push_back(i);
    }

    size_t warnings = 0;
    for (auto it = lines.begin(); it != lines.end() && warnings < maxSemicolonWarnings_; ++it)
    {
        const std::vector<size_t> &idx = it->second;
        const Token &first = tokens_[idx.front()];
        const Token &last = tokens_[idx.back()];

        bool declaration = false;
        if (first.isTypeKeyword() && !first.is(TokenKind::KwVoid))
        {
            const size_t nameAt = at(idx.front() + 1).is(TokenKind::LBracket) ? 3 : 1;
            declaration = at(idx.front() + nameAt).is(TokenKind::Identifier) &&
                          !at(idx.front() + nameAt + 1).is(TokenKind::LParen);
        }

        bool assignment = false;
        if (first.isOneOf(TokenKind::Identifier, TokenKind::KwThis))
        {
            for (size_t i : idx)
            {
                if (tokens_[i].isOneOf(TokenKind::Equal, TokenKind::PlusPlus, TokenKind::MinusMinus))
                {
                    assignment = true;
                    break;
                }
                if (tokens_[i].isOneOf(TokenKind::LParen, TokenKind::LBrace))
                    break;
            }
        }

        if (!declaration && !assignment)
            continue;
        if (continuesStatement(last))
            continue;

        auto next = std::next(it);
        if (next != lines.end() && continuesFromPrevious(tokens_[next->second.front()]))
            continue;

        const size_t before = diag_.warningCount();
        report(Severity::Warning, last.loc, "Missing semicolon", codes::kMissingSemicolon);
        if (diag_.warningCount() != before)
            ++warnings;
    }
}

//===----------------------------------------------------------------------===//
// Stray characters
//===----------------------------------------------------------------------===//

void SyntaxValidator::checkUnknownCharacters()
{
    for (const auto &tok : tokens_)
    {
        if (tok.is(TokenKind::Unknown))
        {
            report(Severity::Warning,
                   tok.loc,
                   "Unexpected character '" + tok.text + "'",
                   codes::kUnexpectedCharacter);
        }
    }
}

} // namespace pulse::frontend
