//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line helpers for AST nodes: operator spellings, statement kind names
// and annotation lookups.
//
//===----------------------------------------------------------------------===//

#include "frontends/pulse/AST.hpp"

namespace pulse::frontend
{

const char *binaryOpToString(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Mod:
            return "%";
        case BinaryOp::Eq:
            return "==";
        case BinaryOp::Ne:
            return "!=";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::Ge:
            return ">=";
        case BinaryOp::And:
            return "&&";
        case BinaryOp::Or:
            return "||";
    }
    return "?";
}

const char *stmtKindToString(StmtKind kind)
{
    switch (kind)
    {
        case StmtKind::Block:
            return "Block";
        case StmtKind::Expr:
            return "ExpressionStatement";
        case StmtKind::VarDecl:
            return "VariableDeclaration";
        case StmtKind::If:
            return "IfStatement";
        case StmtKind::While:
            return "WhileStatement";
        case StmtKind::For:
            return "ForStatement";
        case StmtKind::Return:
            return "ReturnStatement";
        case StmtKind::Break:
            return "BreakStatement";
        case StmtKind::Continue:
            return "ContinueStatement";
    }
    return "Statement";
}

const AnnotationArg *Annotation::find(const std::string &argName) const
{
    for (const auto &arg : args)
    {
        if (arg.name == argName)
            return &arg;
    }
    return nullptr;
}

std::optional<int64_t> Annotation::intArg(const std::string &argName) const
{
    const AnnotationArg *arg = find(argName);
    if (!arg)
        return std::nullopt;
    if (const auto *v = std::get_if<int64_t>(&arg->value))
        return *v;
    return std::nullopt;
}

std::optional<std::string> Annotation::stringArg(const std::string &argName) const
{
    const AnnotationArg *arg = find(argName);
    if (!arg)
        return std::nullopt;
    if (const auto *v = std::get_if<std::string>(&arg->value))
        return *v;
    return std::nullopt;
}

namespace
{
const Annotation *findIn(const std::vector<Annotation> &annotations, AnnotationKind kind)
{
    for (const auto &a : annotations)
    {
        if (a.kind == kind)
            return &a;
    }
    return nullptr;
}
} // namespace

const Annotation *FieldDecl::findAnnotation(AnnotationKind kind) const
{
    return findIn(annotations, kind);
}

const Annotation *MethodDecl::findAnnotation(AnnotationKind kind) const
{
    return findIn(annotations, kind);
}

} // namespace pulse::frontend
