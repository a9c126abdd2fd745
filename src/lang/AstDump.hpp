//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/AstDump.hpp
// Purpose: Render an AST as one listing line per node.
// Key invariants: Pre-order; children indented two spaces under their parent.
//                 The Module root is the only unattributed line.
// Ownership/Lifetime: Reads the AST; returns an owned listing.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "lang/Ast.hpp"
#include "lang/Listing.hpp"

namespace stagelens::lang
{

/// @brief Dump @p mod as `field: Node(attrs)` lines.
Listing dumpAst(const Module &mod);

} // namespace stagelens::lang
