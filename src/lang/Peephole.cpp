//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// Implements the peephole optimisations over pseudo bytecode.  Each rule
// rewrites matched instructions into NOPs plus at most one replacement so
// positions stay stable while the rule set runs; a cleanup step then drops
// NOPs and labels nothing refers to.  The driver repeats the whole rule set
// until a round makes no change.
//
//===----------------------------------------------------------------------===//
//
// Rules:
// - LOAD_CONST x n; BUILD_TUPLE n          -> LOAD_CONST (tuple)
// - BUILD_TUPLE n; UNPACK_SEQUENCE n       -> SWAP n (n <= 3)
// - LOAD_CONST; POP_TOP                    -> (nothing)
// - LOAD_CONST c; POP_JUMP_IF_x L          -> JUMP L or (nothing)
// - LOAD_CONST None; RETURN_VALUE          -> RETURN_CONST None
// - JUMP to JUMP                           -> JUMP to final target
// - code after an unconditional transfer   -> removed until a live label
// - jump to the next instruction           -> removed (POP_TOP if conditional)
//
//===----------------------------------------------------------------------===//

#include "lang/Peephole.hpp"

#include "support/trace.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace stagelens::lang
{
namespace
{
constexpr int kMaxRounds = 16;

void traceRewrite(const char *rule, size_t at, uint32_t line)
{
    if (!support::traceEnabled())
        return;
    support::trace("peephole",
                   std::string(rule) + " at " + std::to_string(at) + " (line " +
                       std::to_string(line) + ")");
}

void makeNop(Instr &in)
{
    in.op = Opcode::NOP;
    in.arg = 0;
    in.target = -1;
}

bool isLoadConst(const Instr &in)
{
    return in.op == Opcode::LOAD_CONST;
}

/// Position of each label marker in the current code.
std::unordered_map<int32_t, size_t> labelPositions(const std::vector<Instr> &code)
{
    std::unordered_map<int32_t, size_t> pos;
    for (size_t i = 0; i < code.size(); ++i)
    {
        if (code[i].op == Opcode::LABEL)
            pos[code[i].target] = i;
    }
    return pos;
}

std::unordered_set<int32_t> referencedLabels(const std::vector<Instr> &code)
{
    std::unordered_set<int32_t> refs;
    for (const auto &in : code)
    {
        if (isJump(in.op))
            refs.insert(in.target);
    }
    return refs;
}

/// Index of the first instruction at or after @p i that is neither a label
/// nor a NOP, or code.size().
size_t nextReal(const std::vector<Instr> &code, size_t i)
{
    while (i < code.size() && (code[i].op == Opcode::LABEL || code[i].op == Opcode::NOP))
        ++i;
    return i;
}

class PeepholeOptimizer
{
  public:
    explicit PeepholeOptimizer(PseudoCode &pc) : pc_(pc) {}

    size_t run()
    {
        for (int round = 0; round < kMaxRounds; ++round)
        {
            const size_t before = rewrites_;
            foldConstantTuples();
            swapTupleUnpack();
            dropDeadConstants();
            foldConstantConditions();
            useReturnConst();
            threadJumps();
            removeUnreachable();
            removeJumpsToNext();
            cleanup();
            if (rewrites_ == before)
                break;
        }
        compactConstants();
        return rewrites_;
    }

  private:
    void note(const char *rule, size_t at)
    {
        ++rewrites_;
        traceRewrite(rule, at, pc_.code[at].line);
    }

    void foldConstantTuples()
    {
        auto &code = pc_.code;
        for (size_t i = 0; i < code.size(); ++i)
        {
            if (code[i].op != Opcode::BUILD_TUPLE)
                continue;
            const size_t n = static_cast<size_t>(code[i].arg);
            if (n > i)
                continue;
            bool allConst = true;
            for (size_t k = i - n; k < i && allConst; ++k)
                allConst = isLoadConst(code[k]);
            if (!allConst)
                continue;
            std::vector<Value> elems;
            for (size_t k = i - n; k < i; ++k)
            {
                elems.push_back(pc_.consts[static_cast<size_t>(code[k].arg)]);
                makeNop(code[k]);
            }
            code[i].op = Opcode::LOAD_CONST;
            code[i].arg = pc_.addConst(Value::tuple(std::move(elems)));
            note("fold-const-tuple", i);
        }
    }

    void swapTupleUnpack()
    {
        auto &code = pc_.code;
        for (size_t i = 0; i + 1 < code.size(); ++i)
        {
            Instr &build = code[i];
            Instr &unpack = code[i + 1];
            if (build.op != Opcode::BUILD_TUPLE || unpack.op != Opcode::UNPACK_SEQUENCE ||
                build.arg != unpack.arg || build.arg < 1 || build.arg > 3)
                continue;
            const int32_t n = build.arg;
            makeNop(build);
            if (n == 1)
                makeNop(unpack);
            else
            {
                unpack.op = Opcode::SWAP;
                unpack.arg = n;
            }
            note("tuple-unpack-swap", i);
        }
    }

    void dropDeadConstants()
    {
        auto &code = pc_.code;
        for (size_t i = 0; i + 1 < code.size(); ++i)
        {
            if (isLoadConst(code[i]) && code[i + 1].op == Opcode::POP_TOP)
            {
                makeNop(code[i]);
                makeNop(code[i + 1]);
                note("dead-constant", i);
            }
        }
    }

    void foldConstantConditions()
    {
        auto &code = pc_.code;
        for (size_t i = 0; i + 1 < code.size(); ++i)
        {
            Instr &load = code[i];
            Instr &jump = code[i + 1];
            if (!isLoadConst(load) || !isConditionalJump(jump.op))
                continue;
            const bool truthy = pc_.consts[static_cast<size_t>(load.arg)].truthy();
            const bool jumps = jump.op == Opcode::POP_JUMP_IF_TRUE ? truthy : !truthy;
            makeNop(load);
            if (jumps)
            {
                jump.op = Opcode::JUMP;
                jump.arg = 0;
            }
            else
                makeNop(jump);
            note("constant-condition", i);
        }
    }

    void useReturnConst()
    {
        auto &code = pc_.code;
        for (size_t i = 0; i + 1 < code.size(); ++i)
        {
            if (isLoadConst(code[i]) && code[i + 1].op == Opcode::RETURN_VALUE)
            {
                const int32_t idx = code[i].arg;
                makeNop(code[i]);
                code[i + 1].op = Opcode::RETURN_CONST;
                code[i + 1].arg = idx;
                note("return-const", i + 1);
            }
        }
    }

    void threadJumps()
    {
        auto &code = pc_.code;
        const auto labels = labelPositions(code);
        for (size_t i = 0; i < code.size(); ++i)
        {
            Instr &in = code[i];
            if (in.op != Opcode::JUMP && !isConditionalJump(in.op))
                continue;
            auto it = labels.find(in.target);
            if (it == labels.end())
                continue;
            const size_t dest = nextReal(code, it->second);
            if (dest >= code.size() || code[dest].op != Opcode::JUMP || code[dest].target == in.target)
                continue;
            auto final = labels.find(code[dest].target);
            if (final == labels.end())
                continue;
            if (isConditionalJump(in.op) && final->second < i)
                continue;
            in.target = code[dest].target;
            note("thread-jump", i);
        }
    }

    void removeUnreachable()
    {
        auto &code = pc_.code;
        const auto refs = referencedLabels(code);
        bool dead = false;
        for (size_t i = 0; i < code.size(); ++i)
        {
            Instr &in = code[i];
            if (in.op == Opcode::LABEL)
            {
                if (refs.count(in.target))
                    dead = false;
                continue;
            }
            if (dead)
            {
                if (in.op != Opcode::NOP)
                {
                    makeNop(in);
                    note("unreachable", i);
                }
                // Unreachable code contributes no line events either.
                in.line = 0;
                continue;
            }
            if (isTerminator(in.op))
                dead = true;
        }
    }

    void removeJumpsToNext()
    {
        auto &code = pc_.code;
        for (size_t i = 0; i < code.size(); ++i)
        {
            Instr &in = code[i];
            if (in.op != Opcode::JUMP && !isConditionalJump(in.op))
                continue;
            bool reachesTarget = false;
            for (size_t k = i + 1; k < code.size(); ++k)
            {
                if (code[k].op == Opcode::LABEL)
                {
                    if (code[k].target == in.target)
                    {
                        reachesTarget = true;
                        break;
                    }
                    continue;
                }
                if (code[k].op != Opcode::NOP)
                    break;
            }
            if (!reachesTarget)
                continue;
            if (in.op == Opcode::JUMP)
                makeNop(in);
            else
            {
                in.op = Opcode::POP_TOP;
                in.target = -1;
            }
            note("jump-to-next", i);
        }
    }

    /// Drop NOPs and dead labels.  A NOP survives only when it is the sole
    /// instruction left for its source line.
    void cleanup()
    {
        auto &code = pc_.code;
        const auto refs = referencedLabels(code);
        std::vector<Instr> out;
        out.reserve(code.size());
        uint32_t prevLine = 0;
        for (size_t i = 0; i < code.size(); ++i)
        {
            const Instr &in = code[i];
            if (in.op == Opcode::LABEL)
            {
                if (refs.count(in.target))
                    out.push_back(in);
                continue;
            }
            if (in.op == Opcode::NOP)
            {
                const size_t next = nextReal(code, i + 1);
                const uint32_t nextLine = next < code.size() ? code[next].line : 0;
                if (in.line == 0 || in.line == prevLine || in.line == nextLine)
                    continue;
            }
            prevLine = in.line;
            out.push_back(in);
        }
        code = std::move(out);
    }

    /// Remove constants no instruction loads and renumber the rest.
    void compactConstants()
    {
        std::vector<int32_t> remap(pc_.consts.size(), -1);
        std::vector<Value> kept;
        for (auto &in : pc_.code)
        {
            if (in.op != Opcode::LOAD_CONST && in.op != Opcode::RETURN_CONST)
                continue;
            const size_t old = static_cast<size_t>(in.arg);
            if (remap[old] < 0)
            {
                remap[old] = static_cast<int32_t>(kept.size());
                kept.push_back(pc_.consts[old]);
            }
            in.arg = remap[old];
        }
        pc_.consts = std::move(kept);
    }

    PseudoCode &pc_;
    size_t rewrites_ = 0;
};
} // namespace

size_t optimizePseudo(PseudoCode &pc)
{
    PeepholeOptimizer opt(pc);
    return opt.run();
}

} // namespace stagelens::lang
