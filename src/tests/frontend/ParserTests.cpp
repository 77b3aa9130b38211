//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/frontend/ParserTests.cpp
// Purpose: Check the program shape, precedence and annotation handling of the
//          parser, and that printing the AST is a fixpoint under re-parsing.
// Key invariants: print(parse(print(parse(s)))) == print(parse(s)).
// Ownership/Lifetime: Each helper owns its diagnostic engine and AST.
//
//===----------------------------------------------------------------------===//

#include "frontends/pulse/AST.hpp"
#include "frontends/pulse/AstPrinter.hpp"
#include "frontends/pulse/Lexer.hpp"
#include "frontends/pulse/Parser.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace pulse;
using namespace pulse::frontend;

namespace
{

struct Parsed
{
    support::DiagnosticEngine diags;
    std::unique_ptr<Program> program;
    bool failed = false;
};

std::unique_ptr<Parsed> parse(const std::string &source)
{
    auto result = std::make_unique<Parsed>();
    Lexer lexer(source);
    auto tokens = lexer.tokenize();
    if (!tokens)
    {
        result->failed = true;
        return result;
    }
    Parser parser(tokens.value(), result->diags);
    result->program = parser.parseProgram();
    result->failed = parser.hasError() || !result->program;
    return result;
}

std::string printSource(const std::string &source)
{
    auto parsed = parse(source);
    EXPECT_FALSE(parsed->failed) << source;
    if (parsed->failed)
        return {};
    AstPrinter printer;
    return printer.print(*parsed->program);
}

} // namespace

TEST(PulseParser, ProgramShape)
{
    auto parsed = parse(R"(
class Counter {
    private int count = 0;
    public Counter(int start) { count = start; }
    public void inc() { count++; }
}
@Deadline(ms=5)
void tick() { }
int x = 1;
tick();
)");
    ASSERT_FALSE(parsed->failed);
    const Program &program = *parsed->program;
    ASSERT_EQ(program.classes.size(), 1u);
    EXPECT_EQ(program.classes[0]->name, "Counter");
    ASSERT_EQ(program.classes[0]->fields.size(), 1u);
    ASSERT_EQ(program.classes[0]->methods.size(), 2u);
    EXPECT_TRUE(program.classes[0]->methods[0]->isConstructor);
    EXPECT_FALSE(program.classes[0]->methods[1]->isConstructor);

    ASSERT_EQ(program.methods.size(), 1u);
    const MethodDecl &tick = *program.methods[0];
    EXPECT_EQ(tick.name, "tick");
    ASSERT_EQ(tick.annotations.size(), 1u);
    EXPECT_EQ(tick.annotations[0].name, "Deadline");
    EXPECT_EQ(tick.annotations[0].intArg("ms").value_or(-1), 5);

    ASSERT_EQ(program.statements.size(), 2u);
    EXPECT_EQ(program.statements[0]->kind, StmtKind::VarDecl);
    EXPECT_EQ(program.statements[1]->kind, StmtKind::Expr);
}

TEST(PulseParser, MultiplicationBindsTighterThanAddition)
{
    auto parsed = parse("int x = 1 + 2 * 3;");
    ASSERT_FALSE(parsed->failed);
    ASSERT_EQ(parsed->program->statements.size(), 1u);
    const auto &decl = static_cast<const VarDeclStmt &>(*parsed->program->statements[0]);
    ASSERT_NE(decl.init, nullptr);
    ASSERT_EQ(decl.init->kind, ExprKind::Binary);
    const auto &add = static_cast<const BinaryExpr &>(*decl.init);
    EXPECT_EQ(add.op, BinaryOp::Add);
    ASSERT_EQ(add.right->kind, ExprKind::Binary);
    EXPECT_EQ(static_cast<const BinaryExpr &>(*add.right).op, BinaryOp::Mul);
}

TEST(PulseParser, ArrayTypesAndSensorAnnotation)
{
    auto parsed = parse(R"(
class Station {
    @Sensor(type="humidity") double level;
    int[] history = new int[8];
}
)");
    ASSERT_FALSE(parsed->failed);
    const ClassDecl &station = *parsed->program->classes[0];
    ASSERT_EQ(station.fields.size(), 2u);
    ASSERT_EQ(station.fields[0]->annotations.size(), 1u);
    EXPECT_EQ(station.fields[0]->annotations[0].stringArg("type").value_or(""), "humidity");
    EXPECT_TRUE(station.fields[1]->type.isArray);
    EXPECT_EQ(station.fields[1]->type.name, "int");
}

TEST(PulseParser, BareAnnotationHasNoArguments)
{
    auto parsed = parse("@SafetyCheck\nvoid guard() { }");
    ASSERT_FALSE(parsed->failed);
    const MethodDecl &guard = *parsed->program->methods[0];
    ASSERT_EQ(guard.annotations.size(), 1u);
    EXPECT_FALSE(guard.annotations[0].hasParens);
    EXPECT_TRUE(guard.annotations[0].args.empty());
}

TEST(PulseParser, ErrorsCarryLineAndParserRecovers)
{
    auto parsed = parse("int a = 1;\nint b = ;\nint c = 3;");
    EXPECT_TRUE(parsed->failed);
    ASSERT_GT(parsed->diags.errorCount(), 0u);
    EXPECT_EQ(parsed->diags.diagnostics().front().loc.line, 2u);
    ASSERT_NE(parsed->program, nullptr);
    // Recovery resumes at the next statement.
    bool sawC = false;
    for (const auto &stmt : parsed->program->statements)
    {
        if (stmt->kind == StmtKind::VarDecl &&
            static_cast<const VarDeclStmt &>(*stmt).name == "c")
            sawC = true;
    }
    EXPECT_TRUE(sawC);
}

TEST(PulseParser, DeepParenthesesStopAtNestingLimit)
{
    const std::string source =
        "int x = " + std::string(200000, '(') + "1" + std::string(200000, ')') + ";";
    auto parsed = parse(source);
    EXPECT_TRUE(parsed->failed);
    ASSERT_EQ(parsed->diags.errorCount(), 1u);
    const auto &d = parsed->diags.diagnostics().front();
    EXPECT_EQ(d.code, "P2001");
    EXPECT_EQ(d.message, "expression nesting too deep (limit: 256)");
}

TEST(PulseParser, LongOperatorChainStopsAtNestingLimit)
{
    std::string source = "int x = 1";
    for (int i = 0; i < 100000; ++i)
        source += " + 1";
    source += ";";
    auto parsed = parse(source);
    EXPECT_TRUE(parsed->failed);
    ASSERT_EQ(parsed->diags.errorCount(), 1u);
    EXPECT_EQ(parsed->diags.diagnostics().front().message,
              "expression nesting too deep (limit: 256)");
}

TEST(PulseParser, DeepBlocksStopAtNestingLimit)
{
    const std::string source = std::string(200000, '{') + std::string(200000, '}');
    auto parsed = parse(source);
    EXPECT_TRUE(parsed->failed);
    ASSERT_EQ(parsed->diags.errorCount(), 1u);
    const auto &d = parsed->diags.diagnostics().front();
    EXPECT_EQ(d.code, "P2001");
    EXPECT_EQ(d.message, "statement nesting too deep (limit: 256)");
}

TEST(PulseParser, NestingBelowLimitParses)
{
    std::string nestedIf;
    for (int i = 0; i < 100; ++i)
        nestedIf += "if (true) ";
    nestedIf += "x = 1;";
    const std::string sources[] = {
        "int x = " + std::string(100, '(') + "1" + std::string(100, ')') + ";",
        std::string(100, '{') + std::string(100, '}'),
        "int x = 0; " + nestedIf,
    };
    for (const auto &source : sources)
    {
        auto parsed = parse(source);
        EXPECT_FALSE(parsed->failed);
        EXPECT_EQ(parsed->diags.errorCount(), 0u);
    }
}

TEST(PulseParser, PrintingIsAFixpointUnderReparsing)
{
    const std::string sources[] = {
        "int x = 1 + 2 * 3 - (4 - 5);",
        "boolean b = !(1 < 2) && 3 >= 4 || x != y;",
        "String s = \"quote\\\" and\\nnewline\"; System.out.println(s + 1);",
        "int[] a = new int[3]; a[0] = a.length; a[1]++; --a[2];",
        "for (int i = 0; i < 10; i++) { if (i % 2 == 0) continue; else break; }",
        "while (true) { x = x > 3 ? x - 1 : x + 1; }",
        R"(
class Motor {
    private static int count = 0;
    @Sensor(type="temperature") double temp;
    public Motor() { this.temp = 0.5; count++; }
    @Deadline(ms=10) @RealTime
    public double step(double dt, int[] steps) { return temp * dt; }
}
public static void main(String[] args) {
    Motor m = new Motor();
    System.out.println(m.step(2.0, null));
}
)",
    };
    for (const auto &source : sources)
    {
        const std::string once = printSource(source);
        ASSERT_FALSE(once.empty()) << source;
        EXPECT_EQ(printSource(once), once) << source;
    }
}
