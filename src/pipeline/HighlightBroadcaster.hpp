//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/pipeline/HighlightBroadcaster.hpp
// Purpose: Applies the highlight for one source line to every visible panel.
// Key invariants: Hidden panels and panels over stale or missing artifacts
//                 are not touched. Broadcasting the same line twice leaves
//                 the same visible state as broadcasting it once.
// Ownership/Lifetime: Borrows the controller and view state.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "pipeline/PipelineController.hpp"
#include "pipeline/ViewState.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace stagelens::pipeline
{

/// @brief Derived per-panel highlight state.
enum class PanelState : uint8_t
{
    Hidden,
    VisibleUnhighlighted,
    VisibleHighlighted,
};

const char *panelStateName(PanelState state);

class HighlightBroadcaster
{
  public:
    HighlightBroadcaster(PipelineController &controller, const ViewState &view);

    /// @brief Make @p line the current line and highlight it everywhere.
    void onLineSelected(uint32_t line);

    /// @brief Re-broadcast the controller's current line, or clear every
    ///        eligible panel when there is none.
    void reapply();

    /// @brief State of the panel for @p kind as last applied.
    PanelState panelState(StageKind kind) const;

    /// @brief Indices last applied to @p kind's panel (empty when cleared).
    const std::vector<size_t> &appliedIndices(StageKind kind) const
    {
        return applied_[stageIndex(kind)].indices;
    }

  private:
    struct Applied
    {
        std::vector<size_t> indices;
        uint64_t revision = 0; ///< Artifact revision the indices refer to.
    };

    void apply(std::optional<uint32_t> line);

    PipelineController &controller_;
    const ViewState &view_;
    std::array<Applied, kStageCount> applied_{};
};

} // namespace stagelens::pipeline
