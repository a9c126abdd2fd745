//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Bytecode.hpp
// Purpose: Opcode definitions and instruction containers for the pseudo and
//          assembled bytecode stages.
// Key invariants: Pseudo code may contain LABEL markers and the pseudo JUMP;
//                 assembled code never does. Jump targets in pseudo code are
//                 label ids stored in Instr::target.
// Ownership: Containers own their constant and name tables.
// Lifetime: Value types; opcodeName() is defined in Bytecode.cpp.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//
//
// Instruction Encoding (assembled):
// - 2-byte code units: [opcode:8][arg:8]
// - Arguments above 255 are prefixed by EXTENDED_ARG units, high byte first
// - Jump arguments are relative distances in code units
//
// Stack Model:
// - Module-level code only; names resolve through LOAD_NAME/STORE_NAME
// - Operand stack holds values; calls expect callable, NULL, then arguments

#pragma once

#include "lang/Listing.hpp"
#include "lang/Value.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace stagelens::lang
{

/// @brief Bytecode opcodes, grouped by category.
///          - 0x00-0x0F  Stack operations
///          - 0x10-0x1F  Constants and names
///          - 0x20-0x2F  Operators
///          - 0x30-0x3F  Containers and calls
///          - 0x40-0x4F  Control flow
///          - 0xF0-0xFF  Encoding prefixes and pseudo opcodes
enum class Opcode : uint8_t
{
    // Stack operations (0x00-0x0F)
    NOP = 0x00,     ///< No operation.
    POP_TOP = 0x01, ///< Discard TOS.
    COPY = 0x02,    ///< Push a copy of the arg-th stack entry (1 = TOS).
    SWAP = 0x03,    ///< Swap TOS with the arg-th stack entry.

    // Constants and names (0x10-0x1F)
    LOAD_CONST = 0x10,  ///< Push consts[arg].
    LOAD_NAME = 0x11,   ///< Push the value bound to names[arg].
    STORE_NAME = 0x12,  ///< Pop TOS into names[arg].
    DELETE_NAME = 0x13, ///< Unbind names[arg].
    PUSH_NULL = 0x14,   ///< Push the NULL marker used by CALL.

    // Operators (0x20-0x2F)
    BINARY_OP = 0x20,      ///< Apply BinOp(arg) to the top two entries.
    UNARY_NEGATIVE = 0x21, ///< TOS = -TOS.
    UNARY_NOT = 0x22,      ///< TOS = not TOS.
    COMPARE_OP = 0x23,     ///< Apply CmpOp(arg) to the top two entries.

    // Containers and calls (0x30-0x3F)
    BUILD_TUPLE = 0x30,     ///< Pop arg entries and push a tuple.
    UNPACK_SEQUENCE = 0x31, ///< Pop a sequence and push its arg items reversed.
    CALL = 0x32,            ///< Call with arg positional arguments.

    // Control flow (0x40-0x4F)
    GET_ITER = 0x40,          ///< TOS = iter(TOS).
    FOR_ITER = 0x41,          ///< Push next item or jump forward when exhausted.
    END_FOR = 0x42,           ///< Pop the exhausted iterator.
    POP_JUMP_IF_FALSE = 0x43, ///< Pop TOS; jump forward when falsy.
    POP_JUMP_IF_TRUE = 0x44,  ///< Pop TOS; jump forward when truthy.
    JUMP_FORWARD = 0x45,      ///< Unconditional forward jump.
    JUMP_BACKWARD = 0x46,     ///< Unconditional backward jump.
    RETURN_VALUE = 0x47,      ///< Return TOS from the module.
    RETURN_CONST = 0x48,      ///< Return consts[arg].

    // Encoding prefix and pseudo opcodes (0xF0-0xFF)
    EXTENDED_ARG = 0xF0, ///< Prefix supplying the next higher argument byte.
    JUMP = 0xFE,         ///< Pseudo: unconditional jump to a label.
    LABEL = 0xFF,        ///< Pseudo: marks the position of label Instr::target.
};

/// @brief Upper-case opcode mnemonic.
const char *opcodeName(Opcode op);

/// @brief Whether @p op carries a meaningful argument.
bool hasArg(Opcode op);

/// @brief Whether @p op transfers control to a label (pseudo form).
bool isJump(Opcode op);

/// @brief Whether @p op pops a condition and jumps.
bool isConditionalJump(Opcode op);

/// @brief Whether control never falls through @p op.
bool isTerminator(Opcode op);

/// @brief One pseudo instruction or label marker.
struct Instr
{
    Opcode op = Opcode::NOP;
    int32_t arg = 0;
    int32_t target = -1; ///< Label id for jumps and LABEL markers.
    uint32_t line = 0;   ///< 0 = synthetic, unattributed.
};

/// @brief Output of code generation: a linear instruction sequence with
///        symbolic labels plus its constant and name tables.
struct PseudoCode
{
    std::vector<Instr> code;
    std::vector<Value> consts;
    std::vector<std::string> names;
    int32_t labelCount = 0;

    /// @brief Index of @p v in the constant table, appending when absent.
    int32_t addConst(const Value &v);

    /// @brief Index of @p name in the name table, appending when absent.
    int32_t addName(const std::string &name);
};

/// @brief Assembled instruction with resolved offset and argument.
struct CodeInstr
{
    uint32_t offset = 0; ///< Byte offset of this unit.
    Opcode op = Opcode::NOP;
    uint32_t arg = 0;    ///< Full argument value (EXTENDED_ARG prefixes folded in).
    uint32_t line = 0;
    std::string argrepr; ///< Human-readable argument ("to 24", "'a'", "+").
};

/// @brief Final code object produced by the assembler.
struct CodeObject
{
    std::vector<CodeInstr> instrs;
    std::vector<Value> consts;
    std::vector<std::string> names;
    std::vector<uint8_t> bytes;
};

/// @brief Human-readable argument of pseudo instruction @p in.
std::string pseudoArgRepr(const PseudoCode &pc, const Instr &in);

/// @brief Render pseudo code; labels become unattributed `L<n>:` lines.
Listing formatPseudo(const PseudoCode &pc);

/// @brief Render assembled code as `offset OPNAME arg (argrepr)` lines
///        followed by unattributed consts/names summary lines.
Listing formatCode(const CodeObject &co);

} // namespace stagelens::lang
