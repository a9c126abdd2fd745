//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.cpp
// Purpose: Diagnostic construction and printing helpers shared by the CLI and
//          the toolchain adapter.
// Key invariants: Printed columns are 1-based even though SourceLoc stores
//                 0-based columns.
// Ownership/Lifetime: Stateless helpers.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace stagelens::support
{
namespace detail
{
/// @brief Map a severity enumerator to the lowercase label used in output.
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

Diag makeError(SourceLoc loc, std::string msg)
{
    return Diagnostic{Severity::Error, std::move(msg), loc};
}

Diag makeWarning(SourceLoc loc, std::string msg)
{
    return Diagnostic{Severity::Warning, std::move(msg), loc};
}

/// @brief Format a diagnostic as `name:line:col: severity: message`.
/// @details Diagnostics without a valid line print only the severity and the
///          message so synthetic failures do not show a bogus location.
void printDiag(const Diag &diag, std::ostream &os, const std::string &inputName)
{
    if (diag.loc.isValid())
    {
        os << inputName << ':' << diag.loc.line << ':' << (diag.loc.column + 1) << ": ";
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace stagelens::support
