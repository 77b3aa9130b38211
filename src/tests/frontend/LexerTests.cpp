//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/frontend/LexerTests.cpp
// Purpose: Verify token kinds, literal decoding, positions and that the token
//          stream plus whitespace reconstructs the source byte for byte.
// Key invariants: Every token's text equals source.substr(span).
// Ownership/Lifetime: Tests own their source strings.
//
//===----------------------------------------------------------------------===//

#include "frontends/pulse/Lexer.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <string>
#include <vector>

using namespace pulse::frontend;

namespace
{

std::vector<Token> lex(const std::string &source)
{
    Lexer lexer(source);
    auto tokens = lexer.tokenize();
    EXPECT_TRUE(tokens.hasValue()) << source;
    return tokens ? tokens.value() : std::vector<Token>{};
}

std::vector<TokenKind> kindsOf(const std::vector<Token> &tokens)
{
    std::vector<TokenKind> kinds;
    for (const auto &tok : tokens)
        kinds.push_back(tok.kind);
    return kinds;
}

/// @brief Rebuild the source from token text and the whitespace between spans.
std::string reconstruct(const std::string &source, const std::vector<Token> &tokens)
{
    std::string out;
    size_t pos = 0;
    for (const auto &tok : tokens)
    {
        for (; pos < tok.span.begin; ++pos)
        {
            EXPECT_TRUE(std::isspace(static_cast<unsigned char>(source[pos])))
                << "byte " << pos << " not covered by a token";
            out += source[pos];
        }
        EXPECT_EQ(tok.text, source.substr(tok.span.begin, tok.span.size()));
        out += tok.text;
        pos = tok.span.end;
    }
    out += source.substr(pos);
    return out;
}

} // namespace

TEST(PulseLexer, KeywordsAnnotationsAndOperators)
{
    auto tokens = lex("@Deadline(ms=5) public static void f() { x += 1; }");
    std::vector<TokenKind> expected = {
        TokenKind::AtDeadline, TokenKind::LParen,   TokenKind::Identifier,
        TokenKind::Equal,      TokenKind::IntegerLiteral, TokenKind::RParen,
        TokenKind::KwPublic,   TokenKind::KwStatic, TokenKind::KwVoid,
        TokenKind::Identifier, TokenKind::LParen,   TokenKind::RParen,
        TokenKind::LBrace,     TokenKind::Identifier, TokenKind::Plus,
        TokenKind::Equal,      TokenKind::IntegerLiteral, TokenKind::Semicolon,
        TokenKind::RBrace,     TokenKind::Eof};
    EXPECT_EQ(kindsOf(tokens), expected);
}

TEST(PulseLexer, AnnotationKinds)
{
    auto tokens = lex("@Sensor @SafetyCheck @RealTime @Override");
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].kind, TokenKind::AtSensor);
    EXPECT_EQ(tokens[1].kind, TokenKind::AtSafetyCheck);
    EXPECT_EQ(tokens[2].kind, TokenKind::AtRealTime);
    EXPECT_EQ(tokens[3].kind, TokenKind::Annotation);
    EXPECT_EQ(tokens[3].text, "@Override");
}

TEST(PulseLexer, TwoCharacterOperatorsUseMaximalMunch)
{
    auto tokens = lex("a++ <= b-- && c != d || !e == f >= g");
    std::vector<TokenKind> expected = {
        TokenKind::Identifier, TokenKind::PlusPlus,   TokenKind::LessEqual,
        TokenKind::Identifier, TokenKind::MinusMinus, TokenKind::AmpAmp,
        TokenKind::Identifier, TokenKind::NotEqual,   TokenKind::Identifier,
        TokenKind::PipePipe,   TokenKind::Bang,       TokenKind::Identifier,
        TokenKind::EqualEqual, TokenKind::Identifier, TokenKind::GreaterEqual,
        TokenKind::Identifier, TokenKind::Eof};
    EXPECT_EQ(kindsOf(tokens), expected);
}

TEST(PulseLexer, NumbersAndStrings)
{
    auto tokens = lex("42 3.14 \"a\\tb\\\"c\\q\"");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].kind, TokenKind::IntegerLiteral);
    EXPECT_EQ(tokens[0].intValue, 42);
    EXPECT_EQ(tokens[1].kind, TokenKind::NumberLiteral);
    EXPECT_DOUBLE_EQ(tokens[1].doubleValue, 3.14);
    EXPECT_EQ(tokens[2].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens[2].stringValue, "a\tb\"cq");
}

TEST(PulseLexer, CommentsAreRetained)
{
    auto tokens = lex("int x; // trailing\n/* block\n comment */ x = 1;");
    ASSERT_GE(tokens.size(), 5u);
    EXPECT_EQ(tokens[3].kind, TokenKind::Comment);
    EXPECT_EQ(tokens[3].text, "// trailing");
    EXPECT_EQ(tokens[4].kind, TokenKind::Comment);
    EXPECT_EQ(tokens[5].loc.line, 3u);
}

TEST(PulseLexer, UnterminatedBlockCommentRunsToEnd)
{
    auto tokens = lex("x /* never closed");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].kind, TokenKind::Comment);
    EXPECT_EQ(tokens[1].text, "/* never closed");
}

TEST(PulseLexer, StrayCharactersBecomeUnknownTokens)
{
    auto tokens = lex("int a = 1 # 2;");
    bool sawUnknown = false;
    for (const auto &tok : tokens)
    {
        if (tok.kind == TokenKind::Unknown)
        {
            sawUnknown = true;
            EXPECT_EQ(tok.text, "#");
        }
    }
    EXPECT_TRUE(sawUnknown);
}

TEST(PulseLexer, LineAndColumnAreOneBased)
{
    auto tokens = lex("int a;\n  a = 2;");
    ASSERT_GE(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].loc.line, 1u);
    EXPECT_EQ(tokens[0].loc.column, 1u);
    EXPECT_EQ(tokens[3].loc.line, 2u);
    EXPECT_EQ(tokens[3].loc.column, 3u);
}

TEST(PulseLexer, UnterminatedStringIsFatal)
{
    Lexer lexer("int a = 1;\nString s = \"open");
    auto tokens = lexer.tokenize();
    ASSERT_FALSE(tokens.hasValue());
    EXPECT_EQ(tokens.error().loc.line, 2u);
    EXPECT_NE(tokens.error().message.find("Unterminated string"), std::string::npos);
    EXPECT_EQ(tokens.error().code, "P1001");
}

TEST(PulseLexer, TokensReconstructSource)
{
    const std::vector<std::string> sources = {
        "",
        "   \n\t ",
        "class Sensor {\n  @Sensor(type=\"temperature\") double t;\n}\n",
        "int x = 10 / 0; // boom\n/* c */ $ ` ~",
        "@Deadline(ms=5)\nvoid tick() { for (int i = 0; i < 3; i++) { x = x * 2 % 7; } }",
        "String s = \"esc\\\"aped\\n\"; boolean b = !true ? a : b;",
    };
    for (const auto &source : sources)
    {
        auto tokens = lex(source);
        ASSERT_FALSE(tokens.empty());
        EXPECT_EQ(tokens.back().kind, TokenKind::Eof);
        EXPECT_EQ(reconstruct(source, tokens), source);
    }
}

TEST(PulseLexer, LexingIsDeterministic)
{
    const std::string source = "int[] a = new int[4]; a[0] = 3; System.out.println(a.length);";
    auto first = lex(source);
    auto second = lex(source);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i)
    {
        EXPECT_EQ(first[i].kind, second[i].kind);
        EXPECT_EQ(first[i].text, second[i].text);
        EXPECT_EQ(first[i].span.begin, second[i].span.begin);
    }
}
