//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Read a Pulse source file into memory for the command-line driver.
// Key invariants: A successful result holds the complete file contents.
// Ownership/Lifetime: The caller owns the returned buffer.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstddef>
#include <string>

namespace pulse::tools
{

/// @brief Largest source file the driver accepts.
inline constexpr std::size_t kMaxSourceBytes = 16ULL * 1024 * 1024;

/// @brief Load @p path into a string.
///
/// Files that cannot be opened, exceed kMaxSourceBytes, or cannot be buffered
/// produce an error diagnostic with code "P0001" instead of a value.
///
/// @param path Filesystem path to the source file.
/// @return File contents on success; otherwise the I/O diagnostic.
support::Expected<std::string> loadSourceFile(const std::string &path);

} // namespace pulse::tools
