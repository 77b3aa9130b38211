//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Evaluator.hpp
// Purpose: Tree-walking interpreter for parsed Pulse programs.
// Key invariants: The evaluator is the only execution path; every statement
//                 it completes is followed by a snapshot and a threshold check
//                 of the heap. Call frames, call-depth guards and the call
//                 stack are balanced on every exit path.
// Ownership/Lifetime: Borrows the program and the run state; neither may be
//                     destroyed while run() is executing.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/pulse/AST.hpp"
#include "runtime/Value.hpp"
#include "vm/RuntimeState.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pulse::vm
{

/// @brief Diagnostic codes for runtime events.
namespace runtime_codes
{
inline constexpr const char *kRuntimeError = "P4001";
inline constexpr const char *kSafetyViolation = "P4010";
inline constexpr const char *kDeadlineViolation = "P4020";
inline constexpr const char *kLoopBound = "P4030";
} // namespace runtime_codes

/// @brief Non-safety runtime failure (type mismatch, undefined name, ...).
/// @details Aborts the current statement only.
class RuntimeError : public std::runtime_error
{
  public:
    RuntimeError(uint32_t line, const std::string &message)
        : std::runtime_error(message), line_(line)
    {
    }

    [[nodiscard]] uint32_t line() const
    {
        return line_;
    }

  private:
    uint32_t line_;
};

/// @brief Raised after a critical safety violation; unwinds the whole run.
class ExecutionHalted : public std::runtime_error
{
  public:
    explicit ExecutionHalted(const std::string &message) : std::runtime_error(message) {}
};

/// @brief Inclusive range of simulated readings for an @Sensor type.
/// @details temperature 20-35, humidity 40-70, pressure 90-110, light 0-1000,
///          anything else 0-100.
std::pair<double, double> sensorRange(std::string_view type);

/// @brief Tree-walking evaluator.
class Evaluator
{
  public:
    Evaluator(RuntimeState &state, const frontend::Program &program);

    /// @brief Execute the program's entry point.
    /// @details Top-level statements when present; otherwise `main`, given an
    ///          empty String[] when it declares a parameter; otherwise every
    ///          parameterless top-level method in declaration order.
    void run();

    /// @brief True when a critical violation stopped the run.
    [[nodiscard]] bool halted() const
    {
        return halted_;
    }

  private:
    /// Outcome of executing a statement.
    enum class ExecSignal
    {
        Normal,
        Return,
        Break,
        Continue,
    };

    struct ClassInfo
    {
        const frontend::ClassDecl *decl = nullptr;
        std::vector<const frontend::FieldDecl *> instanceFields;
        std::map<std::string, const frontend::FieldDecl *> fieldDecls; ///< Instance and static
        std::map<std::string, runtime::Value> statics;
        std::multimap<std::string, const frontend::MethodDecl *> methods;
        std::vector<const frontend::MethodDecl *> constructors;
    };

    /// Innermost-method information used for name resolution and annotations.
    struct MethodContext
    {
        const frontend::MethodDecl *method = nullptr;
        ClassInfo *cls = nullptr;
        runtime::ObjectRef self;
        bool realTime = false;
        bool safetyCheck = false;
    };

    /// An assignment target evaluated once, then read and written through.
    struct Place
    {
        enum class Kind
        {
            Name,    ///< Local, field or static named by an identifier
            Field,   ///< Instance field of @c object
            Static,  ///< Static field of @c cls
            Element, ///< Element @c index of @c array
            Refused, ///< A safety check refused the access; reads give @c fallback
        };

        Kind kind = Kind::Refused;
        const frontend::IdentExpr *ident = nullptr;
        std::string field;
        runtime::ObjectRef object;
        ClassInfo *cls = nullptr;
        runtime::ArrayRef array;
        size_t index = 0;
        runtime::Value fallback;
    };

    class CallScope;

    /// @name Setup (Evaluator.cpp)
    /// @{
    void loadDeclarations();
    void initialiseStatics();
    void registerDeadline(const frontend::MethodDecl &method, const std::string &qualifiedName);
    const frontend::MethodDecl *findMain(ClassInfo *&owner);
    /// @}

    /// @name Statements (Evaluator_Stmt.cpp)
    /// @{
    ExecSignal executeSequence(const std::vector<frontend::StmtPtr> &stmts);
    ExecSignal executeGuarded(const frontend::Stmt &stmt);
    ExecSignal execute(const frontend::Stmt &stmt);
    ExecSignal executeVarDecl(const frontend::VarDeclStmt &stmt);
    ExecSignal executeIf(const frontend::IfStmt &stmt);
    ExecSignal executeWhile(const frontend::WhileStmt &stmt);
    ExecSignal executeFor(const frontend::ForStmt &stmt);
    ExecSignal executeReturn(const frontend::ReturnStmt &stmt);
    void afterStatement(const frontend::Stmt &stmt);
    bool loopBoundReached(uint32_t iterations, uint32_t line);
    bool evalCondition(const frontend::Expr &expr);
    /// @}

    /// @name Expressions (Evaluator_Expr.cpp)
    /// @{
    runtime::Value eval(const frontend::Expr &expr);
    runtime::Value evalBinary(const frontend::BinaryExpr &expr);
    runtime::Value evalArithmetic(frontend::BinaryOp op,
                                  const runtime::Value &lhs,
                                  const runtime::Value &rhs,
                                  uint32_t line);
    runtime::Value evalComparison(frontend::BinaryOp op,
                                  const runtime::Value &lhs,
                                  const runtime::Value &rhs,
                                  uint32_t line);
    runtime::Value evalUnary(const frontend::UnaryExpr &expr);
    runtime::Value evalAssign(const frontend::AssignExpr &expr);
    runtime::Value evalIdent(const frontend::IdentExpr &expr);
    runtime::Value evalMember(const frontend::MemberExpr &expr);
    runtime::Value evalIndex(const frontend::IndexExpr &expr);
    runtime::Value evalNewArray(const frontend::NewArrayExpr &expr);
    void store(const frontend::Expr &target, const runtime::Value &value, uint32_t line);
    Place resolvePlace(const frontend::Expr &target, uint32_t line);
    runtime::Value load(const Place &place, uint32_t line);
    void storeTo(const Place &place, const runtime::Value &value, uint32_t line);
    void assignName(const std::string &name, const runtime::Value &value, uint32_t line);
    runtime::Value readField(const runtime::ObjectRef &object,
                             ClassInfo *cls,
                             const std::string &name,
                             uint32_t line);
    runtime::Value readStatic(ClassInfo &cls, const std::string &name);
    bool isValueName(const std::string &name) const;
    ClassInfo *classReference(const frontend::Expr &expr);
    /// @}

    /// @name Calls and objects (Evaluator_Call.cpp)
    /// @{
    runtime::Value evalCall(const frontend::CallExpr &expr);
    runtime::Value evalNew(const frontend::NewExpr &expr);
    runtime::Value invoke(const frontend::MethodDecl &method,
                          ClassInfo *cls,
                          runtime::ObjectRef self,
                          std::vector<runtime::Value> args,
                          uint32_t line);
    const frontend::MethodDecl *findMethod(ClassInfo *cls,
                                           const std::string &name,
                                           size_t arity) const;
    runtime::ObjectRef instantiate(ClassInfo &cls, uint32_t line);
    std::string qualifiedName(const frontend::MethodDecl &method, const ClassInfo *cls) const;
    std::vector<runtime::Value> evalArgs(const std::vector<frontend::ExprPtr> &args);
    /// @}

    /// @name Builtins (Evaluator_Builtins.cpp)
    /// @{
    bool isBuiltinReceiver(const frontend::Expr &object, std::string &name);
    runtime::Value callBuiltin(const std::string &receiver,
                               const std::string &method,
                               std::vector<runtime::Value> args,
                               uint32_t line);
    runtime::Value callPrint(const std::string &method,
                             const std::vector<runtime::Value> &args,
                             uint32_t line);
    runtime::Value callMath(const std::string &method,
                            const std::vector<runtime::Value> &args,
                            uint32_t line);
    runtime::Value callStringMethod(const std::string &text,
                                    const std::string &method,
                                    const std::vector<runtime::Value> &args,
                                    uint32_t line);
    runtime::Value sensorReading(const frontend::FieldDecl &field);
    /// @}

    /// @name Runtime services (Evaluator.cpp)
    /// @{
    /// @brief Report @p violations; returns true when any was reported.
    /// @throws ExecutionHalted for a critical (or escalated) violation.
    bool handleViolations(std::vector<SafetyViolation> violations);
    void reportRuntimeError(const RuntimeError &error);
    void reportDeadline(const DeadlineViolation &violation);
    runtime::ObjectId allocate(const runtime::Value &value, uint32_t line);
    /// @brief Charge a store that changes container @p identity by @p delta
    ///        bytes to every heap object holding it.
    /// @throws ExecutionHalted when the growth does not fit the heap.
    void chargeContainerStore(uint64_t identity, std::ptrdiff_t delta, uint32_t line);
    runtime::Value coerce(const runtime::Value &value,
                          const frontend::TypeRef &type,
                          uint32_t line) const;
    void declareVariable(const std::string &name,
                         const frontend::TypeRef &type,
                         const runtime::Value &value,
                         uint32_t line);
    ClassInfo *findClass(const std::string &name);
    const MethodContext *context() const;
    bool safetyCheckActive() const;
    runtime::ArrayRef makeArray(const std::string &elementType, size_t length);
    /// @}

    RuntimeState &state_;
    const frontend::Program &program_;
    std::map<std::string, ClassInfo> classes_;
    std::vector<MethodContext> contexts_;
    runtime::Value returnValue_;
    uint32_t currentLine_ = 0;
    bool halted_ = false;
};

} // namespace pulse::vm
