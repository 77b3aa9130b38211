//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/SafetyVerifier.cpp
// Purpose: Safety check implementations and their violation messages.
//
//===----------------------------------------------------------------------===//

#include "vm/SafetyVerifier.hpp"

#include "runtime/Heap.hpp"

#include <string>

namespace pulse::vm
{

namespace
{

SafetyViolation makeViolation(ViolationKind kind,
                              ViolationSeverity severity,
                              uint32_t line,
                              std::string message)
{
    SafetyViolation v;
    v.kind = kind;
    v.severity = severity;
    v.line = line;
    v.message = std::move(message);
    v.timestamp = runtime::wallClockMs();
    return v;
}

} // namespace

SafetyVerifier::SafetyVerifier(uint32_t maxDepth) : maxDepth_(maxDepth) {}

std::vector<SafetyViolation> SafetyVerifier::verify(OperationKind op,
                                                    const OperationOperands &operands,
                                                    uint32_t line) const
{
    switch (op)
    {
        case OperationKind::Division:
            return checkDivision(operands.lhs, operands.rhs, line);
        case OperationKind::ArrayAccess:
            return checkArrayAccess(operands.length, operands.index, line);
        case OperationKind::MethodCall:
            return checkMethodCall(line);
        case OperationKind::MemoryAllocation:
            return checkAllocation(operands.requested, operands.heapUsed, operands.heapBudget, line);
        case OperationKind::NullAccess:
            return checkNullAccess(operands.lhs, line);
    }
    return {};
}

std::vector<SafetyViolation> SafetyVerifier::checkDivision(const runtime::Value &lhs,
                                                           const runtime::Value &rhs,
                                                           uint32_t line) const
{
    if (!rhs.isNumeric() || rhs.asDouble() != 0.0)
        return {};
    return {makeViolation(ViolationKind::DivisionByZero,
                          ViolationSeverity::Critical,
                          line,
                          "Division by zero detected: " + lhs.toString() + " / " +
                              rhs.toString())};
}

std::vector<SafetyViolation> SafetyVerifier::checkArrayAccess(size_t length,
                                                              int64_t index,
                                                              uint32_t line) const
{
    if (index >= 0 && static_cast<uint64_t>(index) < length)
        return {};
    return {makeViolation(ViolationKind::ArrayBounds,
                          ViolationSeverity::Error,
                          line,
                          "Array index out of bounds: index " + std::to_string(index) +
                              ", array length " + std::to_string(length))};
}

std::vector<SafetyViolation> SafetyVerifier::checkMethodCall(uint32_t line) const
{
    const uint32_t next = depth_ + 1;
    if (next <= maxDepth_)
        return {};
    return {makeViolation(ViolationKind::StackOverflow,
                          ViolationSeverity::Critical,
                          line,
                          "Stack overflow: depth " + std::to_string(next) +
                              " exceeds maximum " + std::to_string(maxDepth_))};
}

std::vector<SafetyViolation> SafetyVerifier::checkAllocation(size_t requested,
                                                             size_t heapUsed,
                                                             size_t heapBudget,
                                                             uint32_t line) const
{
    if (heapUsed <= heapBudget && requested <= heapBudget - heapUsed)
        return {};
    const size_t available = heapUsed < heapBudget ? heapBudget - heapUsed : 0;
    return {makeViolation(ViolationKind::HeapOverflow,
                          ViolationSeverity::Critical,
                          line,
                          "Heap overflow: requested " + std::to_string(requested) +
                              " bytes, available " + std::to_string(available))};
}

std::vector<SafetyViolation> SafetyVerifier::checkNullAccess(const runtime::Value &receiver,
                                                             uint32_t line) const
{
    if (!receiver.isNull())
        return {};
    return {makeViolation(
        ViolationKind::NullAccess, ViolationSeverity::Error, line, "Null pointer access detected")};
}

} // namespace pulse::vm
