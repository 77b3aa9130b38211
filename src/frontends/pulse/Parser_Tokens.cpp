//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Tokens.cpp
/// @brief Token cursor and error handling for the Pulse parser.
///
//===----------------------------------------------------------------------===//

#include "frontends/pulse/Parser.hpp"
#include <string>

namespace pulse::frontend
{

namespace
{
constexpr const char *kParseErrorCode = "P2001";
} // namespace

Parser::Parser(const std::vector<Token> &tokens, support::DiagnosticEngine &diag) : diag_(diag)
{
    tokens_.reserve(tokens.size() + 1);
    for (const auto &tok : tokens)
    {
        if (!tok.is(TokenKind::Comment))
            tokens_.push_back(tok);
    }
    if (tokens_.empty() || !tokens_.back().is(TokenKind::Eof))
    {
        Token eof;
        if (!tokens_.empty())
        {
            eof.loc = tokens_.back().loc;
            eof.span = SourceSpan{tokens_.back().span.end, tokens_.back().span.end};
        }
        tokens_.push_back(std::move(eof));
    }
}

//===----------------------------------------------------------------------===//
// Token Handling
//===----------------------------------------------------------------------===//

const Token &Parser::peek(size_t offset) const
{
    const size_t idx = pos_ + offset;
    if (idx >= tokens_.size())
        return tokens_.back();
    return tokens_[idx];
}

Token Parser::advance()
{
    Token cur = peek();
    if (pos_ + 1 < tokens_.size())
        ++pos_;
    return cur;
}

bool Parser::check(TokenKind kind, size_t offset) const
{
    return peek(offset).kind == kind;
}

bool Parser::atEnd() const
{
    return check(TokenKind::Eof);
}

bool Parser::match(TokenKind kind, Token *out)
{
    if (check(kind))
    {
        Token tok = advance();
        if (out)
            *out = tok;
        return true;
    }
    return false;
}

bool Parser::expect(TokenKind kind, const char *what, Token *out)
{
    if (check(kind))
    {
        Token tok = advance();
        if (out)
            *out = tok;
        return true;
    }
    const Token &got = peek();
    std::string gotText = got.is(TokenKind::Eof) ? std::string("end of input") : "'" + got.text + "'";
    error(std::string("Expected ") + what + ", got " + gotText);
    return false;
}

void Parser::resyncAfterError()
{
    while (!atEnd())
    {
        if (check(TokenKind::Semicolon))
        {
            advance();
            return;
        }
        if (check(TokenKind::RBrace) || check(TokenKind::LBrace))
            return;
        advance();
    }
}

//===----------------------------------------------------------------------===//
// Error Handling
//===----------------------------------------------------------------------===//

void Parser::error(const std::string &message)
{
    errorAt(peek().loc, message);
}

void Parser::errorAt(SourceLoc loc, const std::string &message)
{
    hasError_ = true;
    if (abandoned_)
        return;
    diag_.report(support::Diagnostic{support::Severity::Error, message, loc, kParseErrorCode});
}

void Parser::nestingTooDeep(const char *what, unsigned limit)
{
    error(std::string(what) + " nesting too deep (limit: " + std::to_string(limit) + ")");
    abandoned_ = true;
    pos_ = tokens_.size() - 1;
}

bool Parser::enterExprLevel()
{
    if (++exprDepth_ > kMaxExprDepth)
    {
        --exprDepth_;
        nestingTooDeep("expression", kMaxExprDepth);
        return false;
    }
    return true;
}

} // namespace pulse::frontend
