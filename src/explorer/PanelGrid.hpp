//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/explorer/PanelGrid.hpp
// Purpose: Lays the visible stage panels out in a column grid.
// Key invariants: Holds one StagePanel per StageKind for its whole lifetime;
//                 only panels visible in the ViewState are laid out or painted.
// Ownership/Lifetime: Owns the panels; borrows the ViewState.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "explorer/StagePanel.hpp"
#include "pipeline/ViewState.hpp"

#include <array>
#include <memory>

namespace stagelens::explorer
{

class PanelGrid : public tui::ui::Widget
{
  public:
    PanelGrid(const pipeline::ViewState &view, const tui::style::Theme &theme);

    void layout(const tui::ui::Rect &r) override;
    void paint(tui::render::ScreenBuffer &sb) override;
    bool onEvent(const tui::ui::Event &ev) override;

    StagePanel &panel(pipeline::StageKind kind)
    {
        return *panels_[pipeline::stageIndex(kind)];
    }

    const StagePanel &panel(pipeline::StageKind kind) const
    {
        return *panels_[pipeline::stageIndex(kind)];
    }

  private:
    const pipeline::ViewState &view_;
    const tui::style::Theme &theme_;
    std::array<std::unique_ptr<StagePanel>, pipeline::kStageCount> panels_;
};

} // namespace stagelens::explorer
