//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line validity query for SourceLoc. A location is valid when it names
// a concrete line; the column is optional and surfaced through hasColumn().
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements validity queries for `SourceLoc`.

#include "support/source_location.hpp"

namespace pulse::support
{
/// @brief Determine whether the location carries a real source attachment.
///
/// @details Synthesised nodes (implicit entry calls, builtin frames) carry a
///          default-constructed location with line 0 so diagnostics can elide
///          the position.
///
/// @return True when the location has a 1-based line number.
bool SourceLoc::isValid() const
{
    return line != 0;
}
} // namespace pulse::support
