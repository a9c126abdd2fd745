//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Bytecode.cpp
// Purpose: Opcode metadata, constant/name interning and listing formatters.
// Key invariants: Listing text is stable; panels and tests compare it.
// Ownership/Lifetime: Stateless helpers.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#include "lang/Bytecode.hpp"

#include "lang/Ast.hpp"

#include <cstdio>

namespace stagelens::lang
{

const char *opcodeName(Opcode op)
{
    switch (op)
    {
        // Stack operations
        case Opcode::NOP:
            return "NOP";
        case Opcode::POP_TOP:
            return "POP_TOP";
        case Opcode::COPY:
            return "COPY";
        case Opcode::SWAP:
            return "SWAP";

        // Constants and names
        case Opcode::LOAD_CONST:
            return "LOAD_CONST";
        case Opcode::LOAD_NAME:
            return "LOAD_NAME";
        case Opcode::STORE_NAME:
            return "STORE_NAME";
        case Opcode::DELETE_NAME:
            return "DELETE_NAME";
        case Opcode::PUSH_NULL:
            return "PUSH_NULL";

        // Operators
        case Opcode::BINARY_OP:
            return "BINARY_OP";
        case Opcode::UNARY_NEGATIVE:
            return "UNARY_NEGATIVE";
        case Opcode::UNARY_NOT:
            return "UNARY_NOT";
        case Opcode::COMPARE_OP:
            return "COMPARE_OP";

        // Containers and calls
        case Opcode::BUILD_TUPLE:
            return "BUILD_TUPLE";
        case Opcode::UNPACK_SEQUENCE:
            return "UNPACK_SEQUENCE";
        case Opcode::CALL:
            return "CALL";

        // Control flow
        case Opcode::GET_ITER:
            return "GET_ITER";
        case Opcode::FOR_ITER:
            return "FOR_ITER";
        case Opcode::END_FOR:
            return "END_FOR";
        case Opcode::POP_JUMP_IF_FALSE:
            return "POP_JUMP_IF_FALSE";
        case Opcode::POP_JUMP_IF_TRUE:
            return "POP_JUMP_IF_TRUE";
        case Opcode::JUMP_FORWARD:
            return "JUMP_FORWARD";
        case Opcode::JUMP_BACKWARD:
            return "JUMP_BACKWARD";
        case Opcode::RETURN_VALUE:
            return "RETURN_VALUE";
        case Opcode::RETURN_CONST:
            return "RETURN_CONST";

        // Prefix and pseudo opcodes
        case Opcode::EXTENDED_ARG:
            return "EXTENDED_ARG";
        case Opcode::JUMP:
            return "JUMP";
        case Opcode::LABEL:
            return "LABEL";
    }
    return "UNKNOWN";
}

bool hasArg(Opcode op)
{
    switch (op)
    {
        case Opcode::NOP:
        case Opcode::POP_TOP:
        case Opcode::PUSH_NULL:
        case Opcode::UNARY_NEGATIVE:
        case Opcode::UNARY_NOT:
        case Opcode::GET_ITER:
        case Opcode::END_FOR:
        case Opcode::RETURN_VALUE:
        case Opcode::LABEL:
            return false;
        default:
            return true;
    }
}

bool isJump(Opcode op)
{
    return op == Opcode::JUMP || op == Opcode::JUMP_FORWARD || op == Opcode::JUMP_BACKWARD ||
           op == Opcode::FOR_ITER || isConditionalJump(op);
}

bool isConditionalJump(Opcode op)
{
    return op == Opcode::POP_JUMP_IF_FALSE || op == Opcode::POP_JUMP_IF_TRUE;
}

bool isTerminator(Opcode op)
{
    return op == Opcode::JUMP || op == Opcode::JUMP_FORWARD || op == Opcode::JUMP_BACKWARD ||
           op == Opcode::RETURN_VALUE || op == Opcode::RETURN_CONST;
}

int32_t PseudoCode::addConst(const Value &v)
{
    for (size_t i = 0; i < consts.size(); ++i)
    {
        if (consts[i] == v)
            return static_cast<int32_t>(i);
    }
    consts.push_back(v);
    return static_cast<int32_t>(consts.size() - 1);
}

int32_t PseudoCode::addName(const std::string &name)
{
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (names[i] == name)
            return static_cast<int32_t>(i);
    }
    names.push_back(name);
    return static_cast<int32_t>(names.size() - 1);
}

namespace
{
std::string operandRepr(Opcode op,
                        int64_t arg,
                        const std::vector<Value> &consts,
                        const std::vector<std::string> &names)
{
    switch (op)
    {
        case Opcode::LOAD_CONST:
        case Opcode::RETURN_CONST:
            if (arg >= 0 && static_cast<size_t>(arg) < consts.size())
                return consts[static_cast<size_t>(arg)].repr();
            return "?";
        case Opcode::LOAD_NAME:
        case Opcode::STORE_NAME:
        case Opcode::DELETE_NAME:
            if (arg >= 0 && static_cast<size_t>(arg) < names.size())
                return names[static_cast<size_t>(arg)];
            return "?";
        case Opcode::BINARY_OP:
            return binOpSymbol(static_cast<BinOp>(arg));
        case Opcode::COMPARE_OP:
            return cmpOpSymbol(static_cast<CmpOp>(arg));
        default:
            return "";
    }
}

std::string padRight(std::string s, size_t width)
{
    if (s.size() < width)
        s.append(width - s.size(), ' ');
    return s;
}
} // namespace

std::string pseudoArgRepr(const PseudoCode &pc, const Instr &in)
{
    if (isJump(in.op))
        return "to L" + std::to_string(in.target);
    return operandRepr(in.op, in.arg, pc.consts, pc.names);
}

Listing formatPseudo(const PseudoCode &pc)
{
    Listing out;
    for (const auto &in : pc.code)
    {
        if (in.op == Opcode::LABEL)
        {
            out.push_back(ListingLine{"L" + std::to_string(in.target) + ":", 0});
            continue;
        }
        std::string text = "  " + padRight(opcodeName(in.op), 18);
        if (isJump(in.op))
        {
            text += pseudoArgRepr(pc, in);
        }
        else if (hasArg(in.op))
        {
            text += std::to_string(in.arg);
            const std::string repr = pseudoArgRepr(pc, in);
            if (!repr.empty())
                text += " (" + repr + ")";
        }
        while (!text.empty() && text.back() == ' ')
            text.pop_back();
        out.push_back(ListingLine{std::move(text), in.line});
    }
    return out;
}

Listing formatCode(const CodeObject &co)
{
    Listing out;
    for (const auto &in : co.instrs)
    {
        char offset[16];
        std::snprintf(offset, sizeof(offset), "%4u ", in.offset);
        std::string text = offset + padRight(opcodeName(in.op), 18);
        if (hasArg(in.op))
        {
            text += std::to_string(in.arg);
            if (!in.argrepr.empty())
                text += " (" + in.argrepr + ")";
        }
        while (!text.empty() && text.back() == ' ')
            text.pop_back();
        out.push_back(ListingLine{std::move(text), in.line});
    }

    std::string consts = "consts: (";
    for (size_t i = 0; i < co.consts.size(); ++i)
        consts += (i ? ", " : "") + co.consts[i].repr();
    out.push_back(ListingLine{consts + ")", 0});
    std::string names = "names: (";
    for (size_t i = 0; i < co.names.size(); ++i)
        names += (i ? ", '" : "'") + co.names[i] + "'";
    out.push_back(ListingLine{names + ")", 0});
    return out;
}

} // namespace stagelens::lang
