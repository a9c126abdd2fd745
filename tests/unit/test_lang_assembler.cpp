// File: tests/unit/test_lang_assembler.cpp
// Purpose: Verify label resolution and argument encoding in the assembler.
// Key invariants: Offsets advance two bytes per code unit; arguments above
//                 255 are preceded by EXTENDED_ARG units.
// Ownership/Lifetime: Test owns CodeObjects returned by value.
// Links: docs/pylite.md

#include "lang/Assembler.hpp"
#include "lang/Compiler.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace stagelens::lang;
using stagelens::support::DiagnosticEngine;

namespace
{
CodeObject build(const std::string &src)
{
    DiagnosticEngine de;
    auto co = compile(src, de);
    EXPECT_TRUE(co) << src;
    if (!co)
        return {};
    return std::move(co.value());
}
} // namespace

TEST(Assembler, StraightLineOffsets)
{
    const CodeObject co = build("a = 1\n");
    ASSERT_EQ(co.instrs.size(), 3U);
    EXPECT_EQ(co.instrs[0].offset, 0U);
    EXPECT_EQ(co.instrs[1].offset, 2U);
    EXPECT_EQ(co.instrs[2].offset, 4U);
    EXPECT_EQ(co.instrs[2].op, Opcode::RETURN_CONST);
    EXPECT_EQ(co.bytes.size(), 6U);

    const Listing l = formatCode(co);
    ASSERT_EQ(l.size(), 5U);
    EXPECT_EQ(l[0].text, "   0 LOAD_CONST        0 (1)");
    EXPECT_EQ(l[0].line, 1U);
    EXPECT_EQ(l[2].line, 0U);
    EXPECT_EQ(l[3].text, "consts: (1, None)");
    EXPECT_EQ(l[4].text, "names: ('a')");
    EXPECT_EQ(l[4].line, 0U);
}

TEST(Assembler, LoopJumpsResolveToByteOffsets)
{
    const CodeObject co = build("while x:\n    x = x - 1\n");
    ASSERT_EQ(co.instrs.size(), 8U);
    EXPECT_EQ(co.instrs[1].op, Opcode::POP_JUMP_IF_FALSE);
    EXPECT_EQ(co.instrs[1].argrepr, "to 14");
    EXPECT_EQ(co.instrs[1].arg, 5U);
    EXPECT_EQ(co.instrs[6].op, Opcode::JUMP_BACKWARD);
    EXPECT_EQ(co.instrs[6].argrepr, "to 0");
    EXPECT_EQ(co.instrs[6].arg, 7U);
    EXPECT_EQ(co.instrs[6].line, 1U);
}

TEST(Assembler, ExtendedArgForLargeConstantTables)
{
    std::string src;
    for (int i = 0; i < 300; ++i)
        src += "v = " + std::to_string(i + 1000) + "\n";
    const CodeObject co = build(src);
    ASSERT_GT(co.consts.size(), 256U);

    bool sawExtended = false;
    for (size_t i = 0; i + 1 < co.instrs.size(); ++i)
    {
        EXPECT_EQ(co.instrs[i + 1].offset, co.instrs[i].offset + 2);
        if (co.instrs[i].op == Opcode::EXTENDED_ARG)
        {
            sawExtended = true;
            const Opcode next = co.instrs[i + 1].op;
            EXPECT_TRUE(next == Opcode::LOAD_CONST || next == Opcode::RETURN_CONST);
            EXPECT_GE(co.instrs[i + 1].arg, 256U);
            EXPECT_EQ(co.instrs[i].arg, co.instrs[i + 1].arg >> 8);
        }
    }
    EXPECT_TRUE(sawExtended);
    EXPECT_EQ(co.bytes.size(), co.instrs.size() * 2);
}

TEST(Assembler, UndefinedLabelIsAnError)
{
    PseudoCode pc;
    pc.code = {Instr{Opcode::JUMP, 0, 7, 3}};
    auto co = assemble(pc);
    ASSERT_FALSE(co);
    EXPECT_EQ(co.error().message, "jump to undefined label L7");
    EXPECT_EQ(co.error().loc.line, 3U);
}
