//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/pipeline/StageKind.hpp
// Purpose: Pipeline stage enumeration, capability sets and toolchain versions.
// Key invariants: Enumerator order is the topological order in which stages
//                 run; stageIndex() is dense in [0, kStageCount).
// Ownership/Lifetime: Value types and string literals with static storage.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace stagelens::pipeline
{

/// @brief Pipeline stages in the order they run.
enum class StageKind : uint8_t
{
    Source,
    Tokens,
    AST,
    OptimizedAST,
    PseudoBytecode,
    OptimizedPseudoBytecode,
    FinalBytecode,
};

inline constexpr size_t kStageCount = 7;

inline constexpr std::array<StageKind, kStageCount> kAllStages = {
    StageKind::Source,
    StageKind::Tokens,
    StageKind::AST,
    StageKind::OptimizedAST,
    StageKind::PseudoBytecode,
    StageKind::OptimizedPseudoBytecode,
    StageKind::FinalBytecode,
};

inline constexpr size_t stageIndex(StageKind kind)
{
    return static_cast<size_t>(kind);
}

/// @brief Short command-line name ("source", "opt-ast", "code", ...).
const char *stageName(StageKind kind);

/// @brief Human-readable panel title ("Optimized AST").
const char *stageTitle(StageKind kind);

/// @brief Toggle key, '1' for Source through '7' for FinalBytecode.
char stageKey(StageKind kind);

/// @brief Parse a short command-line name.
std::optional<StageKind> parseStageName(std::string_view name);

/// @brief Set of stages a toolchain can produce.
class StageSet
{
  public:
    StageSet() = default;

    /// @brief Set containing every stage.
    static StageSet all();

    bool contains(StageKind kind) const
    {
        return (bits_ & bit(kind)) != 0;
    }

    void insert(StageKind kind)
    {
        bits_ |= bit(kind);
    }

    void erase(StageKind kind)
    {
        bits_ &= static_cast<uint8_t>(~bit(kind));
    }

    /// @brief Number of stages in the set.
    size_t size() const;

    bool empty() const
    {
        return bits_ == 0;
    }

    /// @brief Members in topological order.
    std::vector<StageKind> members() const;

    bool operator==(const StageSet &other) const = default;

  private:
    static constexpr uint8_t bit(StageKind kind)
    {
        return static_cast<uint8_t>(1u << stageIndex(kind));
    }

    uint8_t bits_ = 0;
};

/// @brief Toolchain generations with different stage capabilities.
enum class ToolchainVersion : uint8_t
{
    Full,    ///< Every stage.
    Reduced, ///< No OptimizedAST, PseudoBytecode or OptimizedPseudoBytecode.
};

/// @brief Capability set of @p version; resolved once at startup.
StageSet stagesFor(ToolchainVersion version);

const char *toolchainVersionName(ToolchainVersion version);

/// @brief Parse "full" or "reduced".
std::optional<ToolchainVersion> parseToolchainVersion(std::string_view name);

} // namespace stagelens::pipeline
