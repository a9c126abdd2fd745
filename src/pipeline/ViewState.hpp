//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/pipeline/ViewState.hpp
// Purpose: Which stage panels are visible and how many columns they use.
// Key invariants: Only stages in the capability set can become visible;
//                 panelColumns() == min(visibleCount(), 3) after recompute().
// Ownership/Lifetime: One instance per session, owned by the application.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "pipeline/StageKind.hpp"

#include <array>
#include <cstddef>
#include <vector>

namespace stagelens::pipeline
{

class ViewState
{
  public:
    static constexpr size_t kMaxColumns = 3;

    /// @brief Start with Source and FinalBytecode visible where available.
    explicit ViewState(StageSet available);

    /// @brief Flip visibility of @p kind; no-op for unavailable stages.
    void toggle(StageKind kind);

    /// @brief Set visibility of @p kind; no-op for unavailable stages.
    void setVisible(StageKind kind, bool visible);

    bool isVisible(StageKind kind) const
    {
        return visible_[stageIndex(kind)];
    }

    bool isAvailable(StageKind kind) const
    {
        return available_.contains(kind);
    }

    StageSet available() const
    {
        return available_;
    }

    size_t visibleCount() const;

    /// @brief Visible stages in topological order.
    std::vector<StageKind> visibleStages() const;

    /// @brief Column count derived by the last recompute().
    size_t panelColumns() const
    {
        return columns_;
    }

    /// @brief Refresh derived layout values from the visibility flags.
    void recompute();

  private:
    StageSet available_;
    std::array<bool, kStageCount> visible_{};
    size_t columns_ = 0;
};

} // namespace stagelens::pipeline
