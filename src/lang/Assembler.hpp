//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Assembler.hpp
// Purpose: Resolve labels and encode pseudo bytecode into a code object.
// Key invariants: Output contains no LABEL or pseudo JUMP instructions; every
//                 argument above 255 is preceded by EXTENDED_ARG units that
//                 carry the same line as the instruction they extend.
// Ownership/Lifetime: Reads the PseudoCode; the CodeObject is independent.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "lang/Bytecode.hpp"
#include "support/diag_expected.hpp"

namespace stagelens::lang
{

/// @brief Assemble @p pc into final bytecode.
/// @return Code object, or an error when a conditional jump would need to go
///         backwards or a label is never placed.
support::Expected<CodeObject> assemble(const PseudoCode &pc);

} // namespace stagelens::lang
