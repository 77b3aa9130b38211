//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Canonical source printer for the Pulse AST. Used by `pulse --dump-ast` and
// by the parser round-trip tests.
//
//===----------------------------------------------------------------------===//

#include "frontends/pulse/AstPrinter.hpp"
#include <charconv>
#include <type_traits>
#include <variant>

namespace pulse::frontend
{

std::string formatNumberLiteral(double value)
{
    char buf[512];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    std::string text = ec == std::errc() ? std::string(buf, ptr) : std::string("0");
    if (text.find('.') == std::string::npos)
        text += ".0";
    return text;
}

std::string quoteString(const std::string &value)
{
    std::string s = "\"";
    for (char c : value)
    {
        switch (c)
        {
            case '\n':
                s += "\\n";
                break;
            case '\t':
                s += "\\t";
                break;
            case '\r':
                s += "\\r";
                break;
            case '\0':
                s += "\\0";
                break;
            case '\\':
                s += "\\\\";
                break;
            case '"':
                s += "\\\"";
                break;
            default:
                s.push_back(c);
                break;
        }
    }
    s.push_back('"');
    return s;
}

std::string AstPrinter::print(const Program &program)
{
    out_.clear();
    depth_ = 0;
    for (const auto &cls : program.classes)
        printClass(*cls);
    for (const auto &method : program.methods)
        printMethod(*method, {});
    for (const auto &stmt : program.statements)
        printStmt(*stmt);
    return out_;
}

std::string AstPrinter::print(const Stmt &stmt)
{
    out_.clear();
    depth_ = 0;
    printStmt(stmt);
    return out_;
}

std::string AstPrinter::print(const Expr &expr)
{
    out_.clear();
    printExpr(expr, false);
    return out_;
}

void AstPrinter::indent()
{
    out_.append(static_cast<size_t>(depth_) * 4, ' ');
}

void AstPrinter::line(const std::string &text)
{
    indent();
    out_ += text;
    out_ += '\n';
}

//===----------------------------------------------------------------------===//
// Declarations
//===----------------------------------------------------------------------===//

void AstPrinter::printAnnotations(const std::vector<Annotation> &annotations)
{
    for (const auto &a : annotations)
    {
        indent();
        out_ += '@';
        out_ += a.name;
        if (a.hasParens)
        {
            out_ += '(';
            for (size_t i = 0; i < a.args.size(); ++i)
            {
                if (i)
                    out_ += ", ";
                out_ += a.args[i].name;
                out_ += '=';
                std::visit(
                    [this](const auto &v)
                    {
                        using V = std::decay_t<decltype(v)>;
                        if constexpr (std::is_same_v<V, int64_t>)
                            out_ += std::to_string(v);
                        else if constexpr (std::is_same_v<V, double>)
                            out_ += v < 0 ? "-" + formatNumberLiteral(-v) : formatNumberLiteral(v);
                        else if constexpr (std::is_same_v<V, std::string>)
                            out_ += quoteString(v);
                        else
                            out_ += v ? "true" : "false";
                    },
                    a.args[i].value);
            }
            out_ += ')';
        }
        out_ += '\n';
    }
}

void AstPrinter::printModifiers(const Modifiers &mods)
{
    if (mods.isPublic)
        out_ += "public ";
    if (mods.isPrivate)
        out_ += "private ";
    if (mods.isStatic)
        out_ += "static ";
}

void AstPrinter::printClass(const ClassDecl &cls)
{
    printAnnotations(cls.annotations);
    indent();
    printModifiers(cls.modifiers);
    out_ += "class " + cls.name + " {\n";
    ++depth_;
    for (const auto &field : cls.fields)
        printField(*field);
    for (const auto &method : cls.methods)
        printMethod(*method, cls.name);
    --depth_;
    line("}");
}

void AstPrinter::printField(const FieldDecl &field)
{
    printAnnotations(field.annotations);
    indent();
    printModifiers(field.modifiers);
    out_ += field.type.str() + " " + field.name;
    if (field.init)
    {
        out_ += " = ";
        printExpr(*field.init, false);
    }
    out_ += ";\n";
}

void AstPrinter::printMethod(const MethodDecl &method, const std::string &ownerName)
{
    printAnnotations(method.annotations);
    indent();
    printModifiers(method.modifiers);
    if (method.isConstructor)
        out_ += ownerName;
    else
        out_ += method.returnType.str() + " " + method.name;
    out_ += '(';
    for (size_t i = 0; i < method.params.size(); ++i)
    {
        if (i)
            out_ += ", ";
        out_ += method.params[i].type.str() + " " + method.params[i].name;
    }
    out_ += ") ";
    if (method.body)
        printBlockBody(*method.body);
    else
        out_ += "{\n}";
    out_ += '\n';
}

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

void AstPrinter::printBlockBody(const BlockStmt &block)
{
    out_ += "{\n";
    ++depth_;
    for (const auto &stmt : block.statements)
        printStmt(*stmt);
    --depth_;
    indent();
    out_ += '}';
}

void AstPrinter::printVarDeclCore(const VarDeclStmt &decl)
{
    out_ += decl.type.str() + " " + decl.name;
    if (decl.init)
    {
        out_ += " = ";
        printExpr(*decl.init, false);
    }
}

void AstPrinter::printBranch(const Stmt &stmt, bool guardDanglingElse)
{
    if (stmt.kind == StmtKind::Block)
    {
        out_ += ' ';
        printBlockBody(static_cast<const BlockStmt &>(stmt));
        out_ += '\n';
        return;
    }

    if (guardDanglingElse && stmt.kind == StmtKind::If &&
        !static_cast<const IfStmt &>(stmt).elseBranch)
    {
        // Keep a trailing else bound to the outer if.
        out_ += " {\n";
        ++depth_;
        printStmt(stmt);
        --depth_;
        indent();
        out_ += "}\n";
        return;
    }

    out_ += '\n';
    ++depth_;
    printStmt(stmt);
    --depth_;
}

void AstPrinter::printStmt(const Stmt &stmt)
{
    switch (stmt.kind)
    {
        case StmtKind::Block:
            indent();
            printBlockBody(static_cast<const BlockStmt &>(stmt));
            out_ += '\n';
            break;
        case StmtKind::Expr:
            indent();
            printExpr(*static_cast<const ExprStmt &>(stmt).expr, false);
            out_ += ";\n";
            break;
        case StmtKind::VarDecl:
            indent();
            printVarDeclCore(static_cast<const VarDeclStmt &>(stmt));
            out_ += ";\n";
            break;
        case StmtKind::If:
        {
            const auto &s = static_cast<const IfStmt &>(stmt);
            indent();
            out_ += "if (";
            printExpr(*s.condition, false);
            out_ += ')';
            printBranch(*s.thenBranch, s.elseBranch != nullptr);
            if (s.elseBranch)
            {
                indent();
                out_ += "else";
                printBranch(*s.elseBranch, false);
            }
            break;
        }
        case StmtKind::While:
        {
            const auto &s = static_cast<const WhileStmt &>(stmt);
            indent();
            out_ += "while (";
            printExpr(*s.condition, false);
            out_ += ')';
            printBranch(*s.body, false);
            break;
        }
        case StmtKind::For:
        {
            const auto &s = static_cast<const ForStmt &>(stmt);
            indent();
            out_ += "for (";
            if (s.init)
            {
                if (s.init->kind == StmtKind::VarDecl)
                    printVarDeclCore(static_cast<const VarDeclStmt &>(*s.init));
                else if (s.init->kind == StmtKind::Expr)
                    printExpr(*static_cast<const ExprStmt &>(*s.init).expr, false);
            }
            out_ += "; ";
            if (s.condition)
                printExpr(*s.condition, false);
            out_ += "; ";
            for (size_t i = 0; i < s.updates.size(); ++i)
            {
                if (i)
                    out_ += ", ";
                printExpr(*s.updates[i], false);
            }
            out_ += ')';
            printBranch(*s.body, false);
            break;
        }
        case StmtKind::Return:
        {
            const auto &s = static_cast<const ReturnStmt &>(stmt);
            indent();
            out_ += "return";
            if (s.value)
            {
                out_ += ' ';
                printExpr(*s.value, false);
            }
            out_ += ";\n";
            break;
        }
        case StmtKind::Break:
            line("break;");
            break;
        case StmtKind::Continue:
            line("continue;");
            break;
    }
}

//===----------------------------------------------------------------------===//
// Expressions
//===----------------------------------------------------------------------===//

void AstPrinter::printArgs(const std::vector<ExprPtr> &args)
{
    out_ += '(';
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (i)
            out_ += ", ";
        printExpr(*args[i], false);
    }
    out_ += ')';
}

void AstPrinter::printExpr(const Expr &expr, bool nested)
{
    switch (expr.kind)
    {
        case ExprKind::IntLiteral:
            out_ += std::to_string(static_cast<const IntLiteralExpr &>(expr).value);
            break;
        case ExprKind::NumberLiteral:
            out_ += formatNumberLiteral(static_cast<const NumberLiteralExpr &>(expr).value);
            break;
        case ExprKind::StringLiteral:
            out_ += quoteString(static_cast<const StringLiteralExpr &>(expr).value);
            break;
        case ExprKind::BoolLiteral:
            out_ += static_cast<const BoolLiteralExpr &>(expr).value ? "true" : "false";
            break;
        case ExprKind::NullLiteral:
            out_ += "null";
            break;
        case ExprKind::Ident:
            out_ += static_cast<const IdentExpr &>(expr).name;
            break;
        case ExprKind::This:
            out_ += "this";
            break;
        case ExprKind::Binary:
        {
            const auto &e = static_cast<const BinaryExpr &>(expr);
            if (nested)
                out_ += '(';
            printExpr(*e.left, true);
            out_ += ' ';
            out_ += binaryOpToString(e.op);
            out_ += ' ';
            printExpr(*e.right, true);
            if (nested)
                out_ += ')';
            break;
        }
        case ExprKind::Unary:
        {
            const auto &e = static_cast<const UnaryExpr &>(expr);
            if (nested)
                out_ += '(';
            switch (e.op)
            {
                case UnaryOp::Neg:
                    out_ += '-';
                    printExpr(*e.operand, true);
                    break;
                case UnaryOp::Not:
                    out_ += '!';
                    printExpr(*e.operand, true);
                    break;
                case UnaryOp::PreInc:
                    out_ += "++";
                    printExpr(*e.operand, true);
                    break;
                case UnaryOp::PreDec:
                    out_ += "--";
                    printExpr(*e.operand, true);
                    break;
                case UnaryOp::PostInc:
                    printExpr(*e.operand, true);
                    out_ += "++";
                    break;
                case UnaryOp::PostDec:
                    printExpr(*e.operand, true);
                    out_ += "--";
                    break;
            }
            if (nested)
                out_ += ')';
            break;
        }
        case ExprKind::Assign:
        {
            const auto &e = static_cast<const AssignExpr &>(expr);
            if (nested)
                out_ += '(';
            printExpr(*e.target, true);
            out_ += " = ";
            printExpr(*e.value, false);
            if (nested)
                out_ += ')';
            break;
        }
        case ExprKind::Conditional:
        {
            const auto &e = static_cast<const ConditionalExpr &>(expr);
            if (nested)
                out_ += '(';
            printExpr(*e.condition, true);
            out_ += " ? ";
            printExpr(*e.thenExpr, true);
            out_ += " : ";
            printExpr(*e.elseExpr, true);
            if (nested)
                out_ += ')';
            break;
        }
        case ExprKind::Call:
        {
            const auto &e = static_cast<const CallExpr &>(expr);
            printExpr(*e.callee, true);
            printArgs(e.args);
            break;
        }
        case ExprKind::Member:
        {
            const auto &e = static_cast<const MemberExpr &>(expr);
            printExpr(*e.object, true);
            out_ += '.';
            out_ += e.member;
            break;
        }
        case ExprKind::Index:
        {
            const auto &e = static_cast<const IndexExpr &>(expr);
            printExpr(*e.base, true);
            out_ += '[';
            printExpr(*e.index, false);
            out_ += ']';
            break;
        }
        case ExprKind::New:
        {
            const auto &e = static_cast<const NewExpr &>(expr);
            out_ += "new " + e.className;
            printArgs(e.args);
            break;
        }
        case ExprKind::NewArray:
        {
            const auto &e = static_cast<const NewArrayExpr &>(expr);
            out_ += "new " + e.elementType.name + "[";
            printExpr(*e.length, false);
            out_ += ']';
            break;
        }
    }
}

} // namespace pulse::frontend
