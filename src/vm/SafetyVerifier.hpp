//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/SafetyVerifier.hpp
// Purpose: Per-operation runtime safety checks and the call-depth guard.
// Key invariants: Check functions never mutate state; the call depth changes
//                 only through CallDepthGuard and is balanced on every exit
//                 path, including exceptions.
// Ownership/Lifetime: Violations are returned by value; the verifier owns
//                     only its depth counter.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "runtime/Value.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pulse::vm
{

/// @brief Operations the evaluator submits for verification.
enum class OperationKind
{
    Division,
    ArrayAccess,
    MethodCall,
    MemoryAllocation,
    NullAccess,
};

/// @brief Categories of safety violation.
enum class ViolationKind
{
    DivisionByZero,
    ArrayBounds,
    NullAccess,
    StackOverflow,
    HeapOverflow,
};

/// @brief Violation severity; Critical halts the run.
enum class ViolationSeverity
{
    Warning,
    Error,
    Critical,
};

/// @brief Canonical diagnostic name of @p kind.
constexpr std::string_view toString(ViolationKind kind) noexcept
{
    switch (kind)
    {
        case ViolationKind::DivisionByZero:
            return "division-by-zero";
        case ViolationKind::ArrayBounds:
            return "array-bounds";
        case ViolationKind::NullAccess:
            return "null-access";
        case ViolationKind::StackOverflow:
            return "stack-overflow";
        case ViolationKind::HeapOverflow:
            return "heap-overflow";
    }
    return "null-access";
}

/// @brief Upper-case label used in `SAFETY VIOLATION [X]` lines.
constexpr std::string_view toString(ViolationSeverity severity) noexcept
{
    switch (severity)
    {
        case ViolationSeverity::Warning:
            return "WARNING";
        case ViolationSeverity::Error:
            return "ERROR";
        case ViolationSeverity::Critical:
            return "CRITICAL";
    }
    return "ERROR";
}

/// @brief One detected violation.
struct SafetyViolation
{
    ViolationKind kind = ViolationKind::NullAccess;
    uint32_t line = 0;
    std::string message;
    ViolationSeverity severity = ViolationSeverity::Error;
    double timestamp = 0; ///< Wall clock, ms since the epoch
};

/// @brief Inputs for verify(); each operation reads only its own fields.
struct OperationOperands
{
    runtime::Value lhs;    ///< Division dividend, null-access receiver
    runtime::Value rhs;    ///< Division divisor
    int64_t index = 0;     ///< Array access index
    size_t length = 0;     ///< Array access length
    size_t requested = 0;  ///< Allocation size
    size_t heapUsed = 0;   ///< Allocation: bytes already in use
    size_t heapBudget = 0; ///< Allocation: heap budget
};

class CallDepthGuard;

/// @brief Stateless safety checks plus the scoped recursion counter.
class SafetyVerifier
{
  public:
    static constexpr uint32_t kDefaultMaxDepth = 100;

    explicit SafetyVerifier(uint32_t maxDepth = kDefaultMaxDepth);

    /// @brief Dispatch to the check for @p op.
    std::vector<SafetyViolation> verify(OperationKind op,
                                        const OperationOperands &operands,
                                        uint32_t line) const;

    /// @brief Divisor equal to zero: Critical.
    std::vector<SafetyViolation> checkDivision(const runtime::Value &lhs,
                                               const runtime::Value &rhs,
                                               uint32_t line) const;

    /// @brief Index outside [0, length): Error.
    std::vector<SafetyViolation> checkArrayAccess(size_t length,
                                                  int64_t index,
                                                  uint32_t line) const;

    /// @brief Entering one more call would exceed the ceiling: Critical.
    std::vector<SafetyViolation> checkMethodCall(uint32_t line) const;

    /// @brief Allocation would exceed the heap budget: Critical.
    std::vector<SafetyViolation> checkAllocation(size_t requested,
                                                 size_t heapUsed,
                                                 size_t heapBudget,
                                                 uint32_t line) const;

    /// @brief Null receiver: Error.
    std::vector<SafetyViolation> checkNullAccess(const runtime::Value &receiver,
                                                 uint32_t line) const;

    [[nodiscard]] uint32_t depth() const
    {
        return depth_;
    }

    [[nodiscard]] uint32_t maxDepth() const
    {
        return maxDepth_;
    }

  private:
    friend class CallDepthGuard;

    uint32_t maxDepth_;
    uint32_t depth_ = 0;
};

/// @brief RAII call-depth increment for the duration of a method call.
class CallDepthGuard
{
  public:
    explicit CallDepthGuard(SafetyVerifier &verifier) : verifier_(verifier)
    {
        ++verifier_.depth_;
    }

    ~CallDepthGuard()
    {
        --verifier_.depth_;
    }

    CallDepthGuard(const CallDepthGuard &) = delete;
    CallDepthGuard &operator=(const CallDepthGuard &) = delete;

  private:
    SafetyVerifier &verifier_;
};

} // namespace pulse::vm
