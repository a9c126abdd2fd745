//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/ConstFolder.hpp
// Purpose: AST-level optimizer folding constant expressions.
// Key invariants: A folded Constant keeps the location of the expression it
//                 replaces. Operations that would raise at runtime (division
//                 by zero, overflow) are left untouched.
// Ownership/Lifetime: Mutates the caller's AST in place.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "lang/Ast.hpp"
#include "support/diagnostics.hpp"

#include <cstddef>

namespace stagelens::lang
{

/// @brief Fold constant sub-expressions of @p mod in place.
/// @param mod Module to rewrite.
/// @param diags Receives warnings for operations left unfolded on purpose.
/// @return Number of expressions replaced by constants.
size_t foldConstants(Module &mod, support::DiagnosticEngine &diags);

} // namespace stagelens::lang
