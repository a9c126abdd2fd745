//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Compiler.hpp
// Purpose: One-call entry points producing each Pylite stage listing from
//          source text.
// Key invariants: Every entry point recomputes from the source; no state is
//                 shared between calls.
// Ownership/Lifetime: Returned listings and code objects are owned by the
//                     caller.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "lang/Bytecode.hpp"
#include "lang/Listing.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <string_view>

namespace stagelens::lang
{

/// @brief One listing line per source line.
Listing listSource(std::string_view src);

/// @brief Token stream rendered one token per line; layout tokens are
///        unattributed.
support::Expected<Listing> listTokens(std::string_view src);

/// @brief AST dump, optionally after constant folding.
/// @param diags Receives folding warnings when @p fold is set.
support::Expected<Listing> listAst(std::string_view src,
                                   bool fold,
                                   support::DiagnosticEngine &diags);

/// @brief Parse, fold and generate pseudo code, optionally peephole optimized.
support::Expected<PseudoCode> compileToPseudo(std::string_view src,
                                              bool optimize,
                                              support::DiagnosticEngine &diags);

/// @brief Full pipeline down to the assembled code object.
support::Expected<CodeObject> compile(std::string_view src, support::DiagnosticEngine &diags);

} // namespace stagelens::lang
