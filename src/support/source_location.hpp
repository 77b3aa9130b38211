//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares lightweight source position and byte-span PODs used by
//          tokens, AST nodes, diagnostics and runtime violations.
// Key invariants: line == 0 denotes an invalid location; line/column are
//                 1-based when valid. Spans are half-open byte ranges.
// Ownership/Lifetime: Value types with no dynamic ownership.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>

namespace pulse::support
{

/// @brief Represents a position within the single source buffer of a run.
/// @invariant line == 0 indicates an unknown location.
/// @ownership Value type with no owned resources.
struct SourceLoc
{
    /// @brief One-based line number; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number within the line; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location refers to user-written source.
    [[nodiscard]] bool isValid() const;

    /// @brief Determine whether a 1-based column number is available.
    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

/// @brief Half-open byte range [begin, end) into the source buffer.
/// @invariant begin <= end.
struct SourceSpan
{
    size_t begin = 0; ///< Offset of the first byte.
    size_t end = 0;   ///< Offset one past the last byte.

    /// @brief Number of bytes covered by the span.
    [[nodiscard]] size_t size() const
    {
        return end - begin;
    }

    /// @brief True when the span covers no bytes.
    [[nodiscard]] bool empty() const
    {
        return begin == end;
    }
};

} // namespace pulse::support
