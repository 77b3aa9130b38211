//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the support
// library: severity-to-string mapping, error construction and a printer shared
// by the CLI and the DiagnosticEngine.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Diagnostic formatting helpers backing `Expected`.

#include "support/diag_expected.hpp"

namespace pulse::support
{
namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
/// @param severity Severity enumeration value to translate.
/// @return Null-terminated string naming the severity level.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

/// @brief Build an error diagnostic with the provided location and message.
/// @param loc Source location that triggered the diagnostic, or unknown.
/// @param msg Human-readable description of the problem.
/// @param code Stable diagnostic code, possibly empty.
/// @return Diagnostic populated with error severity and provided context.
Diag makeError(SourceLoc loc, std::string msg, std::string code)
{
    return Diag{Severity::Error, std::move(msg), loc, std::move(code)};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a valid location is available the message is prefixed with
///          "<path>:<line>:<column>:" following the common compiler diagnostic
///          style. A non-empty code is appended in brackets. The function always
///          emits a trailing newline so multiple diagnostics appear as a
///          contiguous block.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
/// @param path Optional file path printed ahead of the line number.
void printDiag(const Diag &diag, std::ostream &os, std::string_view path)
{
    if (!path.empty())
        os << path << ':';
    if (diag.loc.isValid())
    {
        os << diag.loc.line;
        if (diag.loc.hasColumn())
            os << ':' << diag.loc.column;
        os << ": ";
    }
    else if (!path.empty())
    {
        os << ' ';
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message;
    if (!diag.code.empty())
        os << " [" << diag.code << ']';
    os << '\n';
}
} // namespace pulse::support
