//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.cpp
/// @brief Implementation of the Pulse lexical analyzer.
///
/// @details Keywords are stored in a sorted array (kKeywordTable) for binary
/// search lookup; the table is ordered by byte value so `String` sorts ahead
/// of the lowercase keywords. Every token records the byte span it covers and
/// its lexeme is copied from exactly that span.
///
/// @see Lexer.hpp for the class interface
///
//===----------------------------------------------------------------------===//

#include "frontends/pulse/Lexer.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <string_view>

namespace pulse::frontend
{

//===----------------------------------------------------------------------===//
// TokenKind to string conversion
//===----------------------------------------------------------------------===//

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "eof";
        case TokenKind::Unknown:
            return "unknown";
        case TokenKind::Comment:
            return "comment";
        case TokenKind::IntegerLiteral:
            return "integer";
        case TokenKind::NumberLiteral:
            return "number";
        case TokenKind::StringLiteral:
            return "string";
        case TokenKind::Identifier:
            return "identifier";
        case TokenKind::KwBoolean:
            return "boolean";
        case TokenKind::KwBreak:
            return "break";
        case TokenKind::KwClass:
            return "class";
        case TokenKind::KwContinue:
            return "continue";
        case TokenKind::KwDouble:
            return "double";
        case TokenKind::KwElse:
            return "else";
        case TokenKind::KwFalse:
            return "false";
        case TokenKind::KwFor:
            return "for";
        case TokenKind::KwIf:
            return "if";
        case TokenKind::KwInt:
            return "int";
        case TokenKind::KwNew:
            return "new";
        case TokenKind::KwNull:
            return "null";
        case TokenKind::KwPrivate:
            return "private";
        case TokenKind::KwPublic:
            return "public";
        case TokenKind::KwReturn:
            return "return";
        case TokenKind::KwStatic:
            return "static";
        case TokenKind::KwString:
            return "String";
        case TokenKind::KwThis:
            return "this";
        case TokenKind::KwTrue:
            return "true";
        case TokenKind::KwVoid:
            return "void";
        case TokenKind::KwWhile:
            return "while";
        case TokenKind::AtDeadline:
            return "@Deadline";
        case TokenKind::AtSensor:
            return "@Sensor";
        case TokenKind::AtSafetyCheck:
            return "@SafetyCheck";
        case TokenKind::AtRealTime:
            return "@RealTime";
        case TokenKind::Annotation:
            return "annotation";
        case TokenKind::Plus:
            return "+";
        case TokenKind::Minus:
            return "-";
        case TokenKind::Star:
            return "*";
        case TokenKind::Slash:
            return "/";
        case TokenKind::Percent:
            return "%";
        case TokenKind::PlusPlus:
            return "++";
        case TokenKind::MinusMinus:
            return "--";
        case TokenKind::Bang:
            return "!";
        case TokenKind::Equal:
            return "=";
        case TokenKind::EqualEqual:
            return "==";
        case TokenKind::NotEqual:
            return "!=";
        case TokenKind::Less:
            return "<";
        case TokenKind::LessEqual:
            return "<=";
        case TokenKind::Greater:
            return ">";
        case TokenKind::GreaterEqual:
            return ">=";
        case TokenKind::AmpAmp:
            return "&&";
        case TokenKind::PipePipe:
            return "||";
        case TokenKind::Question:
            return "?";
        case TokenKind::Colon:
            return ":";
        case TokenKind::Dot:
            return ".";
        case TokenKind::Comma:
            return ",";
        case TokenKind::Semicolon:
            return ";";
        case TokenKind::LParen:
            return "(";
        case TokenKind::RParen:
            return ")";
        case TokenKind::LBracket:
            return "[";
        case TokenKind::RBracket:
            return "]";
        case TokenKind::LBrace:
            return "{";
        case TokenKind::RBrace:
            return "}";
    }
    return "<invalid>";
}

bool Token::isKeyword() const
{
    return kind >= TokenKind::KwBoolean && kind <= TokenKind::KwWhile;
}

bool Token::isAnnotation() const
{
    return kind >= TokenKind::AtDeadline && kind <= TokenKind::Annotation;
}

bool Token::isTypeKeyword() const
{
    return isOneOf(TokenKind::KwInt,
                   TokenKind::KwDouble,
                   TokenKind::KwBoolean,
                   TokenKind::KwString,
                   TokenKind::KwVoid);
}

//===----------------------------------------------------------------------===//
// Keyword lookup table
//===----------------------------------------------------------------------===//

namespace
{

struct KeywordEntry
{
    std::string_view key;
    TokenKind kind;
};

// Sorted by byte value for binary search (21 keywords)
constexpr std::array<KeywordEntry, 21> kKeywordTable = {{
    {"String", TokenKind::KwString},
    {"boolean", TokenKind::KwBoolean},
    {"break", TokenKind::KwBreak},
    {"class", TokenKind::KwClass},
    {"continue", TokenKind::KwContinue},
    {"double", TokenKind::KwDouble},
    {"else", TokenKind::KwElse},
    {"false", TokenKind::KwFalse},
    {"for", TokenKind::KwFor},
    {"if", TokenKind::KwIf},
    {"int", TokenKind::KwInt},
    {"new", TokenKind::KwNew},
    {"null", TokenKind::KwNull},
    {"private", TokenKind::KwPrivate},
    {"public", TokenKind::KwPublic},
    {"return", TokenKind::KwReturn},
    {"static", TokenKind::KwStatic},
    {"this", TokenKind::KwThis},
    {"true", TokenKind::KwTrue},
    {"void", TokenKind::KwVoid},
    {"while", TokenKind::KwWhile},
}};

inline bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

inline bool isLetter(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline bool isWhitespace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/// @brief Check if character can start an identifier.
inline bool isIdentifierStart(char c)
{
    return isLetter(c) || c == '_' || c == '$';
}

/// @brief Check if character can continue an identifier.
inline bool isIdentifierContinue(char c)
{
    return isIdentifierStart(c) || isDigit(c);
}

constexpr const char *kLexErrorCode = "P1001";

} // anonymous namespace

std::optional<TokenKind> Lexer::lookupKeyword(const std::string &name)
{
    auto it = std::lower_bound(kKeywordTable.begin(),
                               kKeywordTable.end(),
                               name,
                               [](const KeywordEntry &entry, const std::string &key)
                               { return entry.key < key; });
    if (it != kKeywordTable.end() && it->key == name)
        return it->kind;
    return std::nullopt;
}

//===----------------------------------------------------------------------===//
// Lexer implementation
//===----------------------------------------------------------------------===//

Lexer::Lexer(std::string source) : source_(std::move(source)) {}

char Lexer::peekChar() const
{
    if (pos_ >= source_.size())
        return '\0';
    return source_[pos_];
}

char Lexer::peekChar(size_t offset) const
{
    if (pos_ + offset >= source_.size())
        return '\0';
    return source_[pos_ + offset];
}

char Lexer::getChar()
{
    if (pos_ >= source_.size())
        return '\0';
    char c = source_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

bool Lexer::eof() const
{
    return pos_ >= source_.size();
}

SourceLoc Lexer::currentLoc() const
{
    return SourceLoc{line_, column_};
}

void Lexer::finish(Token &tok, size_t begin)
{
    tok.span = SourceSpan{begin, pos_};
    tok.text = source_.substr(begin, pos_ - begin);
}

support::Expected<std::vector<Token>> Lexer::tokenize()
{
    std::vector<Token> tokens;
    while (true)
    {
        skipWhitespace();
        if (eof())
            break;
        auto tok = lexToken();
        if (!tok)
            return tok.error();
        tokens.push_back(std::move(tok.value()));
    }

    Token end;
    end.kind = TokenKind::Eof;
    end.loc = currentLoc();
    end.span = SourceSpan{pos_, pos_};
    tokens.push_back(std::move(end));
    return tokens;
}

void Lexer::skipWhitespace()
{
    while (!eof() && isWhitespace(peekChar()))
        getChar();
}

Token Lexer::lexLineComment()
{
    Token tok;
    tok.kind = TokenKind::Comment;
    tok.loc = currentLoc();
    const size_t begin = pos_;
    while (!eof() && peekChar() != '\n')
        getChar();
    finish(tok, begin);
    return tok;
}

Token Lexer::lexBlockComment()
{
    Token tok;
    tok.kind = TokenKind::Comment;
    tok.loc = currentLoc();
    const size_t begin = pos_;

    // Skip /*
    getChar();
    getChar();

    // An unterminated comment runs to the end of input.
    while (!eof())
    {
        if (peekChar() == '*' && peekChar(1) == '/')
        {
            getChar();
            getChar();
            break;
        }
        getChar();
    }
    finish(tok, begin);
    return tok;
}

Token Lexer::lexIdentifierOrKeyword()
{
    Token tok;
    tok.loc = currentLoc();
    const size_t begin = pos_;

    while (!eof() && isIdentifierContinue(peekChar()))
        getChar();
    finish(tok, begin);

    if (auto kw = lookupKeyword(tok.text))
    {
        tok.kind = *kw;
        return tok;
    }

    tok.kind = TokenKind::Identifier;
    return tok;
}

Token Lexer::lexAnnotation()
{
    Token tok;
    tok.loc = currentLoc();
    const size_t begin = pos_;

    getChar(); // '@'
    while (!eof() && isIdentifierContinue(peekChar()))
        getChar();
    finish(tok, begin);

    const std::string_view name = std::string_view(tok.text).substr(1);
    if (name == "Deadline")
        tok.kind = TokenKind::AtDeadline;
    else if (name == "Sensor")
        tok.kind = TokenKind::AtSensor;
    else if (name == "SafetyCheck")
        tok.kind = TokenKind::AtSafetyCheck;
    else if (name == "RealTime")
        tok.kind = TokenKind::AtRealTime;
    else
        tok.kind = TokenKind::Annotation;
    tok.stringValue = std::string(name);
    return tok;
}

support::Expected<Token> Lexer::lexNumber()
{
    Token tok;
    tok.loc = currentLoc();
    const size_t begin = pos_;

    while (isDigit(peekChar()))
        getChar();

    // A fraction needs at least one digit after the dot; `1.` lexes as 1 and '.'.
    const bool isFraction = peekChar() == '.' && isDigit(peekChar(1));
    if (isFraction)
    {
        getChar();
        while (isDigit(peekChar()))
            getChar();
    }
    finish(tok, begin);

    const char *first = tok.text.data();
    const char *last = first + tok.text.size();
    if (isFraction)
    {
        tok.kind = TokenKind::NumberLiteral;
        auto [ptr, ec] = std::from_chars(first, last, tok.doubleValue);
        if (ec != std::errc())
        {
            return support::makeError(
                tok.loc, "number literal out of range: " + tok.text, kLexErrorCode);
        }
        return tok;
    }

    tok.kind = TokenKind::IntegerLiteral;
    auto [ptr, ec] = std::from_chars(first, last, tok.intValue);
    if (ec != std::errc())
    {
        return support::makeError(
            tok.loc, "integer number too large: " + tok.text, kLexErrorCode);
    }
    return tok;
}

std::optional<char> Lexer::processEscape(char c)
{
    switch (c)
    {
        case 'n':
            return '\n';
        case 't':
            return '\t';
        case 'r':
            return '\r';
        case '\\':
            return '\\';
        case '"':
            return '"';
        case '\'':
            return '\'';
        case '0':
            return '\0';
        default:
            return std::nullopt;
    }
}

support::Expected<Token> Lexer::lexString()
{
    Token tok;
    tok.kind = TokenKind::StringLiteral;
    tok.loc = currentLoc();
    const size_t begin = pos_;

    getChar(); // opening quote
    while (true)
    {
        if (eof())
        {
            return support::makeError(
                tok.loc, "Unterminated string at line " + std::to_string(tok.loc.line),
                kLexErrorCode);
        }
        char c = getChar();
        if (c == '"')
            break;
        if (c == '\\')
        {
            if (eof())
                continue;
            char escaped = getChar();
            auto decoded = processEscape(escaped);
            tok.stringValue.push_back(decoded ? *decoded : escaped);
            continue;
        }
        tok.stringValue.push_back(c);
    }
    finish(tok, begin);
    return tok;
}

Token Lexer::makeOperator(TokenKind kind, size_t width)
{
    Token tok;
    tok.kind = kind;
    tok.loc = currentLoc();
    const size_t begin = pos_;
    for (size_t i = 0; i < width; ++i)
        getChar();
    finish(tok, begin);
    return tok;
}

support::Expected<Token> Lexer::lexToken()
{
    const char c = peekChar();
    const char n = peekChar(1);

    if (c == '/' && n == '/')
        return lexLineComment();
    if (c == '/' && n == '*')
        return lexBlockComment();
    if (isIdentifierStart(c))
        return lexIdentifierOrKeyword();
    if (isDigit(c))
        return lexNumber();
    if (c == '"')
        return lexString();
    if (c == '@' && isIdentifierStart(n))
        return lexAnnotation();

    switch (c)
    {
        case '+':
            return n == '+' ? makeOperator(TokenKind::PlusPlus, 2)
                            : makeOperator(TokenKind::Plus, 1);
        case '-':
            return n == '-' ? makeOperator(TokenKind::MinusMinus, 2)
                            : makeOperator(TokenKind::Minus, 1);
        case '*':
            return makeOperator(TokenKind::Star, 1);
        case '/':
            return makeOperator(TokenKind::Slash, 1);
        case '%':
            return makeOperator(TokenKind::Percent, 1);
        case '=':
            return n == '=' ? makeOperator(TokenKind::EqualEqual, 2)
                            : makeOperator(TokenKind::Equal, 1);
        case '!':
            return n == '=' ? makeOperator(TokenKind::NotEqual, 2)
                            : makeOperator(TokenKind::Bang, 1);
        case '<':
            return n == '=' ? makeOperator(TokenKind::LessEqual, 2)
                            : makeOperator(TokenKind::Less, 1);
        case '>':
            return n == '=' ? makeOperator(TokenKind::GreaterEqual, 2)
                            : makeOperator(TokenKind::Greater, 1);
        case '&':
            if (n == '&')
                return makeOperator(TokenKind::AmpAmp, 2);
            break;
        case '|':
            if (n == '|')
                return makeOperator(TokenKind::PipePipe, 2);
            break;
        case '?':
            return makeOperator(TokenKind::Question, 1);
        case ':':
            return makeOperator(TokenKind::Colon, 1);
        case '.':
            return makeOperator(TokenKind::Dot, 1);
        case ',':
            return makeOperator(TokenKind::Comma, 1);
        case ';':
            return makeOperator(TokenKind::Semicolon, 1);
        case '(':
            return makeOperator(TokenKind::LParen, 1);
        case ')':
            return makeOperator(TokenKind::RParen, 1);
        case '[':
            return makeOperator(TokenKind::LBracket, 1);
        case ']':
            return makeOperator(TokenKind::RBracket, 1);
        case '{':
            return makeOperator(TokenKind::LBrace, 1);
        case '}':
            return makeOperator(TokenKind::RBrace, 1);
        default:
            break;
    }

    return makeOperator(TokenKind::Unknown, 1);
}

} // namespace pulse::frontend
