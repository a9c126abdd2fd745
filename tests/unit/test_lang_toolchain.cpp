// File: tests/unit/test_lang_toolchain.cpp
// Purpose: Verify the Pylite adapter produces every stage with correct
//          line attribution and honours toolchain capabilities.
// Key invariants: Layout and summary items are unattributed; unavailable
//                 stages fail instead of producing output.
// Ownership/Lifetime: Test owns the adapter instances.
// Links: docs/explorer.md, docs/pylite.md

#include "pipeline/LangToolchain.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using namespace stagelens::pipeline;

namespace
{
bool anyTextContains(const std::vector<StageItem> &items, const std::string &needle)
{
    return std::any_of(items.begin(), items.end(), [&](const StageItem &it) {
        return it.text.find(needle) != std::string::npos;
    });
}
} // namespace

TEST(LangToolchain, SourceAndTokens)
{
    LangToolchain tc;
    auto src = tc.run("a = 1\nb = 2\n", StageKind::Source);
    ASSERT_TRUE(src);
    ASSERT_EQ(src.value().items.size(), 2U);
    EXPECT_EQ(src.value().items[1], (StageItem{"b = 2", 2}));

    auto toks = tc.run("a = 1\n", StageKind::Tokens);
    ASSERT_TRUE(toks);
    const auto &items = toks.value().items;
    ASSERT_EQ(items.size(), 5U);
    EXPECT_EQ(items[0], (StageItem{"1,0-1,1: NAME 'a'", 1}));
    EXPECT_FALSE(items[3].line.has_value());
    EXPECT_FALSE(items[4].line.has_value());
}

TEST(LangToolchain, OptimizedAstFoldsConstants)
{
    LangToolchain tc;
    auto ast = tc.run("x = 1 + 2\n", StageKind::AST);
    auto opt = tc.run("x = 1 + 2\n", StageKind::OptimizedAST);
    ASSERT_TRUE(ast);
    ASSERT_TRUE(opt);
    EXPECT_TRUE(anyTextContains(ast.value().items, "BinOp(op=Add)"));
    EXPECT_FALSE(anyTextContains(opt.value().items, "BinOp"));
    EXPECT_TRUE(anyTextContains(opt.value().items, "Constant(value=3)"));
    EXPECT_FALSE(ast.value().items[0].line.has_value());
}

TEST(LangToolchain, FoldingWarningsTravelWithTheStage)
{
    LangToolchain tc;
    auto ast = tc.run("x = 1 // 0\n", StageKind::AST);
    auto opt = tc.run("x = 1 // 0\n", StageKind::OptimizedAST);
    ASSERT_TRUE(ast);
    ASSERT_TRUE(opt);
    EXPECT_TRUE(ast.value().diagnostics.empty());
    ASSERT_EQ(opt.value().diagnostics.size(), 1U);
    EXPECT_EQ(opt.value().diagnostics[0].severity, stagelens::support::Severity::Warning);
}

TEST(LangToolchain, BytecodeStages)
{
    LangToolchain tc;
    auto pseudo = tc.run("a = 1\n", StageKind::PseudoBytecode);
    auto opt = tc.run("a = 1\n", StageKind::OptimizedPseudoBytecode);
    auto code = tc.run("a = 1\n", StageKind::FinalBytecode);
    ASSERT_TRUE(pseudo);
    ASSERT_TRUE(opt);
    ASSERT_TRUE(code);
    EXPECT_EQ(pseudo.value().items.back().text, "  RETURN_VALUE");
    EXPECT_FALSE(pseudo.value().items.back().line.has_value());
    EXPECT_TRUE(anyTextContains(opt.value().items, "RETURN_CONST"));

    const auto &items = code.value().items;
    ASSERT_EQ(items.size(), 5U);
    EXPECT_EQ(items[0].line, 1U);
    EXPECT_EQ(items[3].text, "consts: (1, None)");
    EXPECT_FALSE(items[3].line.has_value());
}

TEST(LangToolchain, SyntaxErrorsCarryLocation)
{
    LangToolchain tc;
    EXPECT_TRUE(tc.run("x = )\n", StageKind::Tokens));
    auto ast = tc.run("a = 1\nx = )\n", StageKind::AST);
    ASSERT_FALSE(ast);
    EXPECT_EQ(ast.error().loc.line, 2U);
    EXPECT_EQ(ast.error().message, "invalid syntax near ')'");

    auto toks = tc.run("s = 'open\n", StageKind::Tokens);
    ASSERT_FALSE(toks);
    EXPECT_EQ(toks.error().message, "unterminated string literal");
}

TEST(LangToolchain, ReducedVersionRejectsMissingStages)
{
    LangToolchain tc(ToolchainVersion::Reduced);
    EXPECT_EQ(tc.version(), ToolchainVersion::Reduced);
    EXPECT_FALSE(tc.availableStages().contains(StageKind::PseudoBytecode));

    auto opt = tc.run("a = 1\n", StageKind::OptimizedAST);
    ASSERT_FALSE(opt);
    EXPECT_EQ(opt.error().message, "Optimized AST is not available in the reduced toolchain");

    auto code = tc.run("a = 1\n", StageKind::FinalBytecode);
    ASSERT_TRUE(code);
    EXPECT_TRUE(anyTextContains(code.value().items, "RETURN_CONST"));
}
