//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Decl.hpp
/// @brief Declaration nodes for the Pulse AST: annotations, fields, methods,
///        classes and the Program root.
///
/// @details A program is a mix of class declarations, top-level methods and
/// top-level statements. Methods and fields are held by unique_ptr so the
/// evaluator can keep stable pointers into the tree for the whole run.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/pulse/AST_Stmt.hpp"
#include <optional>
#include <variant>

namespace pulse::frontend
{

/// @brief Annotations with runtime meaning; anything else is Other.
enum class AnnotationKind
{
    Deadline,    ///< `@Deadline(ms=N)`
    Sensor,      ///< `@Sensor(type="...")`
    SafetyCheck, ///< `@SafetyCheck`
    RealTime,    ///< `@RealTime`
    Other,       ///< Parsed and attached, otherwise ignored
};

/// @brief Literal value of an annotation parameter.
using AnnotationValue = std::variant<int64_t, double, std::string, bool>;

/// @brief One `name=value` annotation parameter.
struct AnnotationArg
{
    std::string name;
    AnnotationValue value;
};

/// @brief Annotation attached to a class, field or method.
struct Annotation
{
    AnnotationKind kind = AnnotationKind::Other;
    std::string name; ///< Name without the leading '@'
    std::vector<AnnotationArg> args;
    bool hasParens = false; ///< True when written with an argument list
    SourceLoc loc;

    /// @brief Find the argument called @p argName.
    const AnnotationArg *find(const std::string &argName) const;

    /// @brief Integer value of @p argName when present and integral.
    std::optional<int64_t> intArg(const std::string &argName) const;

    /// @brief String value of @p argName when present and a string.
    std::optional<std::string> stringArg(const std::string &argName) const;
};

/// @brief Access and storage modifiers.
struct Modifiers
{
    bool isPublic = false;
    bool isPrivate = false;
    bool isStatic = false;

    bool operator==(const Modifiers &other) const
    {
        return isPublic == other.isPublic && isPrivate == other.isPrivate &&
               isStatic == other.isStatic;
    }
};

/// @brief Method parameter.
struct Param
{
    TypeRef type;
    std::string name;
    SourceLoc loc;
};

/// @brief Field declared in a class body.
struct FieldDecl
{
    SourceLoc loc;
    Modifiers modifiers;
    std::vector<Annotation> annotations;
    TypeRef type;
    std::string name;
    ExprPtr init; ///< May be null.

    /// @brief First annotation of @p kind, or null.
    const Annotation *findAnnotation(AnnotationKind kind) const;
};

/// @brief Method, constructor or top-level function.
struct MethodDecl
{
    SourceLoc loc;
    Modifiers modifiers;
    std::vector<Annotation> annotations;
    TypeRef returnType; ///< Class name for constructors
    std::string name;
    std::vector<Param> params;
    std::unique_ptr<BlockStmt> body;
    bool isConstructor = false;

    /// @brief First annotation of @p kind, or null.
    const Annotation *findAnnotation(AnnotationKind kind) const;
};

/// @brief `class Name { fields and methods }`.
struct ClassDecl
{
    SourceLoc loc;
    Modifiers modifiers;
    std::vector<Annotation> annotations;
    std::string name;
    std::vector<std::unique_ptr<FieldDecl>> fields;
    std::vector<std::unique_ptr<MethodDecl>> methods;
};

/// @brief Root of a parsed source file.
struct Program
{
    std::vector<std::unique_ptr<ClassDecl>> classes;
    std::vector<std::unique_ptr<MethodDecl>> methods; ///< Declared outside any class
    std::vector<StmtPtr> statements;                  ///< Top-level statements in order
};

} // namespace pulse::frontend
