//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/pipeline/StageKind.cpp
// Purpose: Names, titles and capability sets for pipeline stages.
// Key invariants: stageName() and parseStageName() are inverse.
// Ownership/Lifetime: Stateless.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#include "pipeline/StageKind.hpp"

namespace stagelens::pipeline
{

const char *stageName(StageKind kind)
{
    switch (kind)
    {
        case StageKind::Source:
            return "source";
        case StageKind::Tokens:
            return "tokens";
        case StageKind::AST:
            return "ast";
        case StageKind::OptimizedAST:
            return "opt-ast";
        case StageKind::PseudoBytecode:
            return "pseudo";
        case StageKind::OptimizedPseudoBytecode:
            return "opt-pseudo";
        case StageKind::FinalBytecode:
            return "code";
    }
    return "?";
}

const char *stageTitle(StageKind kind)
{
    switch (kind)
    {
        case StageKind::Source:
            return "Source";
        case StageKind::Tokens:
            return "Tokens";
        case StageKind::AST:
            return "AST";
        case StageKind::OptimizedAST:
            return "Optimized AST";
        case StageKind::PseudoBytecode:
            return "Pseudo Bytecode";
        case StageKind::OptimizedPseudoBytecode:
            return "Optimized Pseudo Bytecode";
        case StageKind::FinalBytecode:
            return "Assembled Bytecode";
    }
    return "?";
}

char stageKey(StageKind kind)
{
    return static_cast<char>('1' + stageIndex(kind));
}

std::optional<StageKind> parseStageName(std::string_view name)
{
    for (StageKind kind : kAllStages)
    {
        if (name == stageName(kind))
            return kind;
    }
    return std::nullopt;
}

StageSet StageSet::all()
{
    StageSet s;
    for (StageKind kind : kAllStages)
        s.insert(kind);
    return s;
}

size_t StageSet::size() const
{
    size_t n = 0;
    for (StageKind kind : kAllStages)
        n += contains(kind) ? 1 : 0;
    return n;
}

std::vector<StageKind> StageSet::members() const
{
    std::vector<StageKind> out;
    for (StageKind kind : kAllStages)
    {
        if (contains(kind))
            out.push_back(kind);
    }
    return out;
}

StageSet stagesFor(ToolchainVersion version)
{
    StageSet s = StageSet::all();
    if (version == ToolchainVersion::Reduced)
    {
        s.erase(StageKind::OptimizedAST);
        s.erase(StageKind::PseudoBytecode);
        s.erase(StageKind::OptimizedPseudoBytecode);
    }
    return s;
}

const char *toolchainVersionName(ToolchainVersion version)
{
    return version == ToolchainVersion::Full ? "full" : "reduced";
}

std::optional<ToolchainVersion> parseToolchainVersion(std::string_view name)
{
    if (name == "full")
        return ToolchainVersion::Full;
    if (name == "reduced")
        return ToolchainVersion::Reduced;
    return std::nullopt;
}

} // namespace stagelens::pipeline
