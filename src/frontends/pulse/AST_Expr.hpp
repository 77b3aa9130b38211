//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Expr.hpp
/// @brief Expression nodes for the Pulse AST.
///
/// @details Defines all expression AST nodes produced by the Pulse parser:
/// literals, names, operators, assignment, calls, member access, array
/// indexing, object and array construction, and the conditional operator.
/// The set of kinds is closed; consumers dispatch with a switch over ExprKind
/// and static_cast to the concrete node.
///
/// @invariant Every Expr has a valid `kind` field matching its concrete type.
/// @invariant Source locations are valid for all user-written expressions.
///
/// Ownership/Lifetime: Owned by their parent expression or statement via
/// ExprPtr (std::unique_ptr<Expr>). Forms a tree, not a DAG.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pulse::frontend
{

using support::SourceLoc;

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

/// @brief Reference to a declared type: a primitive, `void`, `String` or a
///        class name, optionally as a one-dimensional array.
struct TypeRef
{
    std::string name;     ///< "int", "double", "boolean", "String", "void" or a class
    bool isArray = false; ///< True for `T[]`

    /// @brief Render the type as written in source.
    std::string str() const
    {
        return isArray ? name + "[]" : name;
    }

    bool operator==(const TypeRef &other) const
    {
        return name == other.name && isArray == other.isArray;
    }
};

/// @brief Enumerates all expression node kinds.
enum class ExprKind
{
    /// @name Literals
    /// @{
    IntLiteral,
    NumberLiteral,
    StringLiteral,
    BoolLiteral,
    NullLiteral,
    /// @}

    /// @name Names
    /// @{
    Ident,
    This,
    /// @}

    /// @name Operators
    /// @{
    Binary,
    Unary,
    Assign,
    Conditional,
    /// @}

    /// @name Access and calls
    /// @{
    Call,
    Member,
    Index,
    /// @}

    /// @name Construction
    /// @{
    New,
    NewArray,
    /// @}
};

/// @brief Binary operators.
enum class BinaryOp
{
    Add, ///< `+` (numeric addition or string concatenation)
    Sub, ///< `-`
    Mul, ///< `*`
    Div, ///< `/`
    Mod, ///< `%`
    Eq,  ///< `==`
    Ne,  ///< `!=`
    Lt,  ///< `<`
    Le,  ///< `<=`
    Gt,  ///< `>`
    Ge,  ///< `>=`
    And, ///< `&&` (short-circuit)
    Or,  ///< `||` (short-circuit)
};

/// @brief Unary operators, including the increment/decrement forms.
enum class UnaryOp
{
    Neg,     ///< `-x`
    Not,     ///< `!x`
    PreInc,  ///< `++x`
    PreDec,  ///< `--x`
    PostInc, ///< `x++`
    PostDec, ///< `x--`
};

/// @brief Source spelling of a binary operator.
const char *binaryOpToString(BinaryOp op);

/// @brief Base class for all expression nodes.
struct Expr
{
    ExprKind kind;
    SourceLoc loc;

    /// @brief Construct an expression with kind and location.
    Expr(ExprKind k, SourceLoc l) : kind(k), loc(l) {}

    /// @brief Virtual destructor for proper polymorphic cleanup.
    virtual ~Expr() = default;
};

/// @brief Integer literal such as `42`.
struct IntLiteralExpr : Expr
{
    int64_t value;

    IntLiteralExpr(SourceLoc l, int64_t v) : Expr(ExprKind::IntLiteral, l), value(v) {}
};

/// @brief Fractional literal such as `3.14`.
struct NumberLiteralExpr : Expr
{
    double value;

    NumberLiteralExpr(SourceLoc l, double v) : Expr(ExprKind::NumberLiteral, l), value(v) {}
};

/// @brief String literal; @ref value holds the unescaped text.
struct StringLiteralExpr : Expr
{
    std::string value;

    StringLiteralExpr(SourceLoc l, std::string v)
        : Expr(ExprKind::StringLiteral, l), value(std::move(v))
    {
    }
};

/// @brief `true` or `false`.
struct BoolLiteralExpr : Expr
{
    bool value;

    BoolLiteralExpr(SourceLoc l, bool v) : Expr(ExprKind::BoolLiteral, l), value(v) {}
};

/// @brief `null`.
struct NullLiteralExpr : Expr
{
    explicit NullLiteralExpr(SourceLoc l) : Expr(ExprKind::NullLiteral, l) {}
};

/// @brief A bare name: local, field, class or builtin namespace.
struct IdentExpr : Expr
{
    std::string name;

    IdentExpr(SourceLoc l, std::string n) : Expr(ExprKind::Ident, l), name(std::move(n)) {}
};

/// @brief `this` inside an instance method or constructor.
struct ThisExpr : Expr
{
    explicit ThisExpr(SourceLoc l) : Expr(ExprKind::This, l) {}
};

/// @brief Binary operation.
struct BinaryExpr : Expr
{
    /// @brief The binary operator.
    BinaryOp op;

    /// @brief The left operand.
    ExprPtr left;

    /// @brief The right operand.
    ExprPtr right;

    /// @brief Construct a binary expression.
    /// @param l Source location (the operator token).
    /// @param o The operator.
    /// @param lhs Left operand.
    /// @param rhs Right operand.
    BinaryExpr(SourceLoc l, BinaryOp o, ExprPtr lhs, ExprPtr rhs)
        : Expr(ExprKind::Binary, l), op(o), left(std::move(lhs)), right(std::move(rhs))
    {
    }
};

/// @brief Unary operation; increment/decrement forms require an lvalue operand.
struct UnaryExpr : Expr
{
    UnaryOp op;
    ExprPtr operand;

    UnaryExpr(SourceLoc l, UnaryOp o, ExprPtr e)
        : Expr(ExprKind::Unary, l), op(o), operand(std::move(e))
    {
    }
};

/// @brief Assignment `target = value`.
/// @invariant target is an Ident, Member or Index expression.
struct AssignExpr : Expr
{
    ExprPtr target;
    ExprPtr value;

    AssignExpr(SourceLoc l, ExprPtr t, ExprPtr v)
        : Expr(ExprKind::Assign, l), target(std::move(t)), value(std::move(v))
    {
    }
};

/// @brief Conditional `cond ? thenExpr : elseExpr`.
struct ConditionalExpr : Expr
{
    ExprPtr condition;
    ExprPtr thenExpr;
    ExprPtr elseExpr;

    ConditionalExpr(SourceLoc l, ExprPtr c, ExprPtr t, ExprPtr e)
        : Expr(ExprKind::Conditional, l), condition(std::move(c)), thenExpr(std::move(t)),
          elseExpr(std::move(e))
    {
    }
};

/// @brief Call expression.
/// @details The callee is an IdentExpr for unqualified calls (`foo(1)`) or a
///          MemberExpr for qualified ones (`obj.foo(1)`, `Math.max(a, b)`,
///          `System.out.println(x)`).
struct CallExpr : Expr
{
    ExprPtr callee;
    std::vector<ExprPtr> args;

    CallExpr(SourceLoc l, ExprPtr c, std::vector<ExprPtr> a)
        : Expr(ExprKind::Call, l), callee(std::move(c)), args(std::move(a))
    {
    }
};

/// @brief Member access `object.member`.
struct MemberExpr : Expr
{
    ExprPtr object;
    std::string member;

    MemberExpr(SourceLoc l, ExprPtr o, std::string m)
        : Expr(ExprKind::Member, l), object(std::move(o)), member(std::move(m))
    {
    }
};

/// @brief Array element access `base[index]`.
struct IndexExpr : Expr
{
    ExprPtr base;
    ExprPtr index;

    IndexExpr(SourceLoc l, ExprPtr b, ExprPtr i)
        : Expr(ExprKind::Index, l), base(std::move(b)), index(std::move(i))
    {
    }
};

/// @brief Object construction `new ClassName(args)`.
struct NewExpr : Expr
{
    std::string className;
    std::vector<ExprPtr> args;

    NewExpr(SourceLoc l, std::string c, std::vector<ExprPtr> a)
        : Expr(ExprKind::New, l), className(std::move(c)), args(std::move(a))
    {
    }
};

/// @brief Array construction `new T[length]`.
struct NewArrayExpr : Expr
{
    TypeRef elementType;
    ExprPtr length;

    NewArrayExpr(SourceLoc l, TypeRef t, ExprPtr n)
        : Expr(ExprKind::NewArray, l), elementType(std::move(t)), length(std::move(n))
    {
    }
};

} // namespace pulse::frontend
