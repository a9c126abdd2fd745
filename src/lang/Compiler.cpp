//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Compiler.cpp
// Purpose: Chains lexer, parser, folder, code generator, peephole optimizer
//          and assembler.
// Key invariants: The pseudo stages always start from the folded AST, so the
//                 optimized pseudo stage differs from the plain one only by
//                 the peephole pass.
// Ownership/Lifetime: Stateless.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#include "lang/Compiler.hpp"

#include "lang/Assembler.hpp"
#include "lang/AstDump.hpp"
#include "lang/CodeGen.hpp"
#include "lang/ConstFolder.hpp"
#include "lang/Lexer.hpp"
#include "lang/Parser.hpp"
#include "lang/Peephole.hpp"

#include <string>
#include <utility>

namespace stagelens::lang
{

Listing listSource(std::string_view src)
{
    Listing out;
    uint32_t line = 1;
    size_t begin = 0;
    while (begin < src.size())
    {
        size_t end = src.find('\n', begin);
        if (end == std::string_view::npos)
            end = src.size();
        std::string text(src.substr(begin, end - begin));
        if (!text.empty() && text.back() == '\r')
            text.pop_back();
        out.push_back(ListingLine{std::move(text), line++});
        begin = end + 1;
    }
    return out;
}

support::Expected<Listing> listTokens(std::string_view src)
{
    auto toks = tokenize(src);
    if (!toks)
        return toks.error();
    Listing out;
    for (const auto &t : toks.value())
        out.push_back(ListingLine{t.describe(), t.isLayout() ? 0u : t.start.line});
    return out;
}

support::Expected<Listing> listAst(std::string_view src,
                                   bool fold,
                                   support::DiagnosticEngine &diags)
{
    auto mod = parse(src);
    if (!mod)
        return mod.error();
    if (fold)
        foldConstants(mod.value(), diags);
    return dumpAst(mod.value());
}

support::Expected<PseudoCode> compileToPseudo(std::string_view src,
                                              bool optimize,
                                              support::DiagnosticEngine &diags)
{
    auto mod = parse(src);
    if (!mod)
        return mod.error();
    foldConstants(mod.value(), diags);
    auto pc = generatePseudo(mod.value());
    if (!pc)
        return pc.error();
    if (optimize)
        optimizePseudo(pc.value());
    return pc;
}

support::Expected<CodeObject> compile(std::string_view src, support::DiagnosticEngine &diags)
{
    auto pc = compileToPseudo(src, true, diags);
    if (!pc)
        return pc.error();
    return assemble(pc.value());
}

} // namespace stagelens::lang
