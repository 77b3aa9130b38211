//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/frontend/SyntaxValidatorTests.cpp
// Purpose: Cover each static token check and the de-duplication of reports.
// Key invariants: Error-severity results carry the line of the offending token.
// Ownership/Lifetime: Each test owns its DiagnosticEngine.
//
//===----------------------------------------------------------------------===//

#include "frontends/pulse/Lexer.hpp"
#include "frontends/pulse/SyntaxValidator.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace pulse;
using namespace pulse::frontend;

namespace
{

std::vector<support::Diagnostic> validate(const std::string &source)
{
    Lexer lexer(source);
    auto tokens = lexer.tokenize();
    EXPECT_TRUE(tokens.hasValue());
    support::DiagnosticEngine diags;
    if (tokens)
    {
        SyntaxValidator validator(diags);
        validator.validate(tokens.value());
    }
    return diags.diagnostics();
}

size_t countMessage(const std::vector<support::Diagnostic> &diags, const std::string &message)
{
    size_t n = 0;
    for (const auto &d : diags)
    {
        if (d.message == message)
            ++n;
    }
    return n;
}

} // namespace

TEST(PulseSyntaxValidator, DivisionByLiteralZero)
{
    auto diags = validate("int x = 10 / 0;");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].severity, support::Severity::Error);
    EXPECT_EQ(diags[0].message, "Division by zero detected");
    EXPECT_EQ(diags[0].loc.line, 1u);
    EXPECT_EQ(diags[0].code, validator_codes::kDivisionByZero);
}

TEST(PulseSyntaxValidator, ModuloByFractionalZero)
{
    auto diags = validate("double r = 4.0 % 0.0;");
    EXPECT_EQ(countMessage(diags, "Division by zero detected"), 1u);
}

TEST(PulseSyntaxValidator, DivisionByNonZeroIsClean)
{
    EXPECT_TRUE(validate("int x = 10 / 2; int y = x % 3;").empty());
}

TEST(PulseSyntaxValidator, DeadlineMustBePositive)
{
    auto zero = validate("@Deadline(ms=0)\nvoid f() { }");
    ASSERT_EQ(countMessage(zero, "Deadline must be positive"), 1u);
    EXPECT_EQ(zero[0].severity, support::Severity::Error);

    auto negative = validate("@Deadline(ms=-5)\nvoid f() { }");
    EXPECT_EQ(countMessage(negative, "Deadline must be positive"), 1u);

    auto text = validate("@Deadline(ms=\"fast\")\nvoid f() { }");
    EXPECT_EQ(countMessage(text, "Deadline must be positive"), 1u);

    auto fraction = validate("@Deadline(ms=0.5)\nvoid f() { }");
    EXPECT_EQ(countMessage(fraction, "Deadline must be positive"), 1u);
}

TEST(PulseSyntaxValidator, DeadlineSyntax)
{
    const std::string message = "Invalid @Deadline syntax. Use @Deadline(ms=value)";
    EXPECT_EQ(countMessage(validate("@Deadline\nvoid f() { }"), message), 1u);
    EXPECT_EQ(countMessage(validate("@Deadline(5)\nvoid f() { }"), message), 1u);
    EXPECT_TRUE(validate("@Deadline(ms=5)\nvoid f() { }").empty());
}

TEST(PulseSyntaxValidator, LongDeadlineWarns)
{
    auto diags = validate("@Deadline(ms=1500)\nvoid f() { }");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].severity, support::Severity::Warning);
    EXPECT_EQ(diags[0].message, "Deadline > 1000ms may not be real-time");
}

TEST(PulseSyntaxValidator, UnsafeOperations)
{
    const std::string message = "Unsafe operation not allowed in IoT environment";
    EXPECT_EQ(countMessage(validate("System.exit(0);"), message), 1u);
    EXPECT_EQ(countMessage(validate("Runtime.getRuntime();"), message), 1u);
    EXPECT_EQ(countMessage(validate("Class.forName(\"x\");"), message), 1u);
    EXPECT_EQ(countMessage(validate("System.out.println(1);"), message), 0u);
}

TEST(PulseSyntaxValidator, Brackets)
{
    auto unmatched = validate("int x = 1; }");
    EXPECT_EQ(countMessage(unmatched, "Unmatched closing brace"), 1u);

    auto mismatched = validate("int x = (1];");
    EXPECT_EQ(countMessage(mismatched, "Mismatched bracket"), 1u);

    auto unclosed = validate("void f() {\n int x = 1;\n");
    ASSERT_EQ(countMessage(unclosed, "Unclosed brace"), 1u);
    for (const auto &d : unclosed)
    {
        if (d.message == "Unclosed brace")
        {
            EXPECT_EQ(d.loc.line, 1u);
        }
    }
}

TEST(PulseSyntaxValidator, MissingSemicolonsAreCappedAtThree)
{
    auto diags = validate("int a = 1\nint b = 2\nint c = 3\nint d = 4\n");
    EXPECT_EQ(countMessage(diags, "Missing semicolon"), 3u);
    for (const auto &d : diags)
        EXPECT_EQ(d.severity, support::Severity::Warning);
}

TEST(PulseSyntaxValidator, ContinuedLinesNeedNoSemicolon)
{
    auto diags = validate("int total = 1 +\n    2;\nx = foo(1,\n    2);");
    EXPECT_EQ(countMessage(diags, "Missing semicolon"), 0u);
}

TEST(PulseSyntaxValidator, UnknownCharacterWarns)
{
    auto diags = validate("int a = 1;\n#");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].severity, support::Severity::Warning);
    EXPECT_EQ(diags[0].message, "Unexpected character '#'");
}

TEST(PulseSyntaxValidator, DuplicatesOnALineAreReportedOnce)
{
    auto diags = validate("int x = 1 / 0 + 2 / 0;");
    EXPECT_EQ(countMessage(diags, "Division by zero detected"), 1u);
}

TEST(PulseSyntaxValidator, CommentsAreIgnored)
{
    EXPECT_TRUE(validate("// int x = 10 / 0\n/* System.exit(0); */ int y = 1;").empty());
}
