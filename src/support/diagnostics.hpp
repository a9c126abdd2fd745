//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares diagnostic records and the engine that collects them.
// Key invariants: Diagnostics are kept in report order.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_loc.hpp"

#include <string>
#include <vector>

namespace stagelens::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
    SourceLoc loc;       ///< Optional source location
};

/// @brief Collects the warnings a stage reports alongside its output.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Recorded diagnostics in report order.
    const std::vector<Diagnostic> &diagnostics() const;

    /// @brief Move the recorded diagnostics out of the engine.
    std::vector<Diagnostic> take();

  private:
    std::vector<Diagnostic> diags_;
};
} // namespace stagelens::support
