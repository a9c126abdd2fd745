//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Assembler.cpp
// Purpose: Label resolution, jump lowering and byte encoding.
// Key invariants: Offsets are recomputed until the number of EXTENDED_ARG
//                 prefixes per instruction stops changing.
// Ownership/Lifetime: Stateless beyond one assemble() call.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#include "lang/Assembler.hpp"

#include <unordered_map>
#include <vector>

namespace stagelens::lang
{
namespace
{
constexpr int kMaxSizingRounds = 8;

/// Number of EXTENDED_ARG prefixes needed to encode @p arg.
int prefixCount(uint32_t arg)
{
    int n = 0;
    while (arg > 0xFF)
    {
        arg >>= 8;
        ++n;
    }
    return n;
}

bool isForwardOnly(Opcode op)
{
    return op == Opcode::FOR_ITER || isConditionalJump(op);
}
} // namespace

support::Expected<CodeObject> assemble(const PseudoCode &pc)
{
    // Strip labels, remembering which instruction each one precedes.
    std::vector<Instr> instrs;
    std::unordered_map<int32_t, size_t> labelAt;
    for (const auto &in : pc.code)
    {
        if (in.op == Opcode::LABEL)
            labelAt[in.target] = instrs.size();
        else
            instrs.push_back(in);
    }

    for (const auto &in : instrs)
    {
        if (isJump(in.op) && !labelAt.count(in.target))
            return support::makeError({in.line, 0},
                                      "jump to undefined label L" + std::to_string(in.target));
        if (!isJump(in.op) && in.arg < 0)
            return support::makeError({in.line, 0},
                                      std::string("negative argument for ") + opcodeName(in.op));
    }

    const size_t n = instrs.size();
    std::vector<Opcode> ops(n);
    std::vector<uint32_t> args(n, 0);
    std::vector<int> prefixes(n, 0);
    std::vector<uint32_t> start(n + 1, 0); // code-unit offset of first prefix

    bool stable = false;
    for (int round = 0; round < kMaxSizingRounds && !stable; ++round)
    {
        for (size_t i = 0; i < n; ++i)
            start[i + 1] = start[i] + static_cast<uint32_t>(prefixes[i]) + 1;

        stable = true;
        for (size_t i = 0; i < n; ++i)
        {
            const Instr &in = instrs[i];
            ops[i] = in.op;
            args[i] = static_cast<uint32_t>(in.arg);
            if (isJump(in.op))
            {
                const uint32_t dest = start[labelAt.at(in.target)];
                const uint32_t next = start[i + 1];
                if (dest >= next)
                {
                    args[i] = dest - next;
                    if (in.op == Opcode::JUMP)
                        ops[i] = Opcode::JUMP_FORWARD;
                }
                else if (isForwardOnly(in.op))
                {
                    return support::makeError({in.line, 0},
                                              std::string("backward target for ") +
                                                  opcodeName(in.op));
                }
                else
                {
                    ops[i] = Opcode::JUMP_BACKWARD;
                    args[i] = next - dest;
                }
            }
            const int need = prefixCount(args[i]);
            if (need != prefixes[i])
            {
                prefixes[i] = need;
                stable = false;
            }
        }
    }
    if (!stable)
        return support::makeError({}, "jump offsets did not converge");

    CodeObject co;
    co.consts = pc.consts;
    co.names = pc.names;
    for (size_t i = 0; i < n; ++i)
    {
        const Instr &in = instrs[i];
        uint32_t unit = start[i];
        for (int p = prefixes[i]; p > 0; --p)
        {
            const uint32_t byte = (args[i] >> (8 * p)) & 0xFF;
            co.instrs.push_back(CodeInstr{unit * 2, Opcode::EXTENDED_ARG, byte, in.line, ""});
            co.bytes.push_back(static_cast<uint8_t>(Opcode::EXTENDED_ARG));
            co.bytes.push_back(static_cast<uint8_t>(byte));
            ++unit;
        }

        CodeInstr out{unit * 2, ops[i], hasArg(ops[i]) ? args[i] : 0, in.line, ""};
        if (isJump(in.op))
            out.argrepr = "to " + std::to_string(start[labelAt.at(in.target)] * 2);
        else
            out.argrepr = pseudoArgRepr(pc, in);
        co.bytes.push_back(static_cast<uint8_t>(out.op));
        co.bytes.push_back(static_cast<uint8_t>(out.arg & 0xFF));
        co.instrs.push_back(std::move(out));
    }
    return co;
}

} // namespace stagelens::lang
