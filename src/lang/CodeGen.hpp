//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/CodeGen.hpp
// Purpose: Lower a Pylite AST into pseudo bytecode with symbolic labels.
// Key invariants: Every emitted instruction carries the line of the statement
//                 or expression that produced it; the module epilogue is
//                 synthetic (line 0).
// Ownership/Lifetime: Reads the AST; the returned PseudoCode is independent.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "lang/Ast.hpp"
#include "lang/Bytecode.hpp"
#include "support/diag_expected.hpp"

namespace stagelens::lang
{

/// @brief Generate pseudo bytecode for @p mod.
/// @return Pseudo code, or an error for `break`/`continue` outside a loop.
support::Expected<PseudoCode> generatePseudo(const Module &mod);

} // namespace stagelens::lang
