//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Peephole.hpp
// Purpose: Pattern-based optimizer over pseudo bytecode.
// Key invariants: Rewrites preserve observable behaviour; conditional jumps
//                 are only threaded forward; every surviving source line keeps
//                 at least one instruction.
// Ownership/Lifetime: Mutates the caller's PseudoCode in place.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "lang/Bytecode.hpp"

#include <cstddef>

namespace stagelens::lang
{

/// @brief Run the peephole rules over @p pc until nothing changes.
/// @return Number of individual rewrites applied.
/// @note Set STAGELENS_TRACE=1 to log each rewrite on the "peephole" channel.
size_t optimizePseudo(PseudoCode &pc);

} // namespace stagelens::lang
