//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/pipeline/LangToolchain.cpp
// Purpose: Converts Pylite listings into stage items.
// Key invariants: Listing line 0 maps to an unattributed item.
// Ownership/Lifetime: See LangToolchain.hpp.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#include "pipeline/LangToolchain.hpp"

#include "lang/Compiler.hpp"

#include <string>
#include <utility>

namespace stagelens::pipeline
{
namespace
{
std::vector<StageItem> toItems(const lang::Listing &listing)
{
    std::vector<StageItem> items;
    items.reserve(listing.size());
    for (const auto &l : listing)
    {
        StageItem item{l.text, std::nullopt};
        if (l.line != 0)
            item.line = l.line;
        items.push_back(std::move(item));
    }
    return items;
}

support::Expected<StageOutput> finish(support::Expected<lang::Listing> listing,
                                      support::DiagnosticEngine &diags)
{
    if (!listing)
        return listing.error();
    return StageOutput{toItems(listing.value()), diags.take()};
}
} // namespace

LangToolchain::LangToolchain(ToolchainVersion version)
    : version_(version), stages_(stagesFor(version))
{
}

StageSet LangToolchain::availableStages() const
{
    return stages_;
}

support::Expected<StageOutput> LangToolchain::run(std::string_view source, StageKind kind)
{
    if (!stages_.contains(kind))
    {
        return support::makeError({},
                                  std::string(stageTitle(kind)) + " is not available in the " +
                                      toolchainVersionName(version_) + " toolchain");
    }

    support::DiagnosticEngine diags;
    switch (kind)
    {
        case StageKind::Source:
            return StageOutput{toItems(lang::listSource(source)), {}};
        case StageKind::Tokens:
            return finish(lang::listTokens(source), diags);
        case StageKind::AST:
            return finish(lang::listAst(source, false, diags), diags);
        case StageKind::OptimizedAST:
            return finish(lang::listAst(source, true, diags), diags);
        case StageKind::PseudoBytecode:
        case StageKind::OptimizedPseudoBytecode:
        {
            auto pc = lang::compileToPseudo(
                source, kind == StageKind::OptimizedPseudoBytecode, diags);
            if (!pc)
                return pc.error();
            return StageOutput{toItems(lang::formatPseudo(pc.value())), diags.take()};
        }
        case StageKind::FinalBytecode:
        {
            auto co = lang::compile(source, diags);
            if (!co)
                return co.error();
            return StageOutput{toItems(lang::formatCode(co.value())), diags.take()};
        }
    }
    return support::makeError({}, "unknown stage");
}

} // namespace stagelens::pipeline
