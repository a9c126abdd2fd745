// File: tests/unit/test_lang_parser.cpp
// Purpose: Unit tests for the Pylite parser and AST dump.
// Key invariants: Every AST node carries the line of its first token.
// Ownership/Lifetime: Test owns parsed modules.
// Links: docs/pylite.md

#include "lang/AstDump.hpp"
#include "lang/Parser.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace stagelens::lang;

TEST(Parser, TupleAssignmentMarksStoreContext)
{
    auto mod = parse("a, b = 1, 2\n");
    ASSERT_TRUE(mod);
    ASSERT_EQ(mod.value().body.size(), 1U);
    const auto &assign = static_cast<const AssignStmt &>(*mod.value().body[0]);
    ASSERT_EQ(assign.kind, Stmt::Kind::Assign);
    ASSERT_EQ(assign.targets.size(), 1U);
    const auto &target = static_cast<const TupleExpr &>(*assign.targets[0]);
    ASSERT_EQ(target.kind, Expr::Kind::Tuple);
    EXPECT_EQ(target.ctx, Ctx::Store);
    EXPECT_EQ(static_cast<const NameExpr &>(*target.elts[1]).ctx, Ctx::Store);
    EXPECT_EQ(assign.value->kind, Expr::Kind::Tuple);
}

TEST(Parser, ChainedAssignmentKeepsAllTargets)
{
    auto mod = parse("x = y = 3\n");
    ASSERT_TRUE(mod);
    const auto &assign = static_cast<const AssignStmt &>(*mod.value().body[0]);
    EXPECT_EQ(assign.targets.size(), 2U);
}

TEST(Parser, PrecedenceOfArithmeticAndComparison)
{
    auto mod = parse("r = 1 + 2 * 3 < 10\n");
    ASSERT_TRUE(mod);
    const auto &assign = static_cast<const AssignStmt &>(*mod.value().body[0]);
    ASSERT_EQ(assign.value->kind, Expr::Kind::Compare);
    const auto &cmp = static_cast<const CompareExpr &>(*assign.value);
    ASSERT_EQ(cmp.left->kind, Expr::Kind::BinOp);
    const auto &add = static_cast<const BinOpExpr &>(*cmp.left);
    EXPECT_EQ(add.op, BinOp::Add);
    EXPECT_EQ(static_cast<const BinOpExpr &>(*add.right).op, BinOp::Mult);
}

TEST(Parser, CompoundStatements)
{
    auto mod = parse("for i in range(3):\n"
                     "    if i:\n"
                     "        continue\n"
                     "    elif i == 2:\n"
                     "        break\n"
                     "    else:\n"
                     "        pass\n"
                     "while n: n = n - 1\n"
                     "del a, b\n");
    ASSERT_TRUE(mod);
    const auto &body = mod.value().body;
    ASSERT_EQ(body.size(), 3U);
    EXPECT_EQ(body[0]->kind, Stmt::Kind::For);
    const auto &f = static_cast<const ForStmt &>(*body[0]);
    ASSERT_EQ(f.body.size(), 1U);
    const auto &ifs = static_cast<const IfStmt &>(*f.body[0]);
    ASSERT_EQ(ifs.orelse.size(), 1U);
    EXPECT_EQ(ifs.orelse[0]->kind, Stmt::Kind::If);
    EXPECT_EQ(ifs.orelse[0]->loc.line, 4U);
    EXPECT_EQ(body[1]->kind, Stmt::Kind::While);
    EXPECT_EQ(body[2]->kind, Stmt::Kind::Del);
    EXPECT_EQ(static_cast<const DelStmt &>(*body[2]).targets.size(), 2U);
}

TEST(Parser, SyntaxErrors)
{
    auto lit = parse("1 = x\n");
    ASSERT_FALSE(lit);
    EXPECT_EQ(lit.error().message, "cannot assign to literal");

    auto block = parse("if x:\ny\n");
    ASSERT_FALSE(block);
    EXPECT_EQ(block.error().message, "expected an indented block");
    EXPECT_EQ(block.error().loc.line, 2U);

    auto paren = parse("x = (1 + )\n");
    ASSERT_FALSE(paren);
    EXPECT_EQ(paren.error().loc.line, 1U);

    auto div = parse("x = 1 / 2\n");
    ASSERT_FALSE(div);
    EXPECT_EQ(div.error().message, "true division is not supported; use '//'");
}

TEST(Parser, DeepParenthesesAreRejected)
{
    const std::string deep = "x = " + std::string(100000, '(') + "1" + std::string(100000, ')') + "\n";
    auto mod = parse(deep);
    ASSERT_FALSE(mod);
    EXPECT_EQ(mod.error().message, "too many nested parentheses");
    EXPECT_EQ(mod.error().loc.line, 1U);
    EXPECT_EQ(mod.error().loc.column, 204U);
}

TEST(Parser, DeepUnaryChainIsRejected)
{
    auto minus = parse("x = " + std::string(50000, '-') + "1\n");
    ASSERT_FALSE(minus);
    EXPECT_EQ(minus.error().message, "expression nesting too deep (limit: 256)");

    std::string nots = "x = ";
    for (int i = 0; i < 50000; ++i)
        nots += "not ";
    nots += "y\n";
    auto negated = parse(nots);
    ASSERT_FALSE(negated);
    EXPECT_EQ(negated.error().message, "expression nesting too deep (limit: 256)");
}

TEST(Parser, LongElifChainIsRejected)
{
    std::string src = "if a:\n    pass\n";
    for (int i = 0; i < 5000; ++i)
        src += "elif a:\n    pass\n";
    auto mod = parse(src);
    ASSERT_FALSE(mod);
    EXPECT_EQ(mod.error().message, "statement nesting too deep (limit: 1000)");
}

TEST(Parser, NestingBelowTheLimitsStillParses)
{
    const std::string parens = "x = " + std::string(150, '(') + "1" + std::string(150, ')') + "\n";
    auto mod = parse(parens);
    ASSERT_TRUE(mod);
    EXPECT_EQ(static_cast<const AssignStmt &>(*mod.value().body[0]).value->kind,
              Expr::Kind::Constant);

    auto minus = parse("x = " + std::string(200, '-') + "1\n");
    ASSERT_TRUE(minus);
    const Listing l = dumpAst(minus.value());
    EXPECT_EQ(l.size(), 4U + 200U);

    std::string src = "if a:\n    pass\n";
    for (int i = 0; i < 100; ++i)
        src += "elif a:\n    pass\n";
    EXPECT_TRUE(parse(src));
}

TEST(AstDump, PreorderWithIndentationAndLines)
{
    auto mod = parse("a = 1\nb = 2\n");
    ASSERT_TRUE(mod);
    const Listing l = dumpAst(mod.value());
    ASSERT_EQ(l.size(), 7U);
    EXPECT_EQ(l[0].text, "Module");
    EXPECT_EQ(l[0].line, 0U);
    EXPECT_EQ(l[1].text, "  body[0]: Assign");
    EXPECT_EQ(l[1].line, 1U);
    EXPECT_EQ(l[2].text, "    targets[0]: Name(id='a', ctx=Store)");
    EXPECT_EQ(l[3].text, "    value: Constant(value=1)");
    EXPECT_EQ(l[3].line, 1U);
    EXPECT_EQ(l[4].text, "  body[1]: Assign");
    EXPECT_EQ(l[4].line, 2U);
}
