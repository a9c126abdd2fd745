//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/explorer/PanelGrid.cpp
// Purpose: Grid layout for stage panels.
// Key invariants: Visible panels fill rows left to right in pipeline order;
//                 the last column absorbs the remainder of the width.
// Ownership/Lifetime: See PanelGrid.hpp.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#include "explorer/PanelGrid.hpp"

namespace stagelens::explorer
{

using pipeline::kAllStages;
using tui::ui::Rect;

PanelGrid::PanelGrid(const pipeline::ViewState &view, const tui::style::Theme &theme)
    : view_(view), theme_(theme)
{
    for (auto kind : kAllStages)
        panels_[pipeline::stageIndex(kind)] = std::make_unique<StagePanel>(kind, theme);
}

void PanelGrid::layout(const Rect &r)
{
    rect_ = r;
    const auto visible = view_.visibleStages();
    const int cols = static_cast<int>(view_.panelColumns());
    if (visible.empty() || cols == 0)
    {
        for (auto &p : panels_)
            p->layout(Rect{});
        return;
    }
    const int n = static_cast<int>(visible.size());
    const int rows = (n + cols - 1) / cols;
    const int cellW = r.w / cols;
    const int cellH = r.h / rows;

    for (auto &p : panels_)
        p->layout(Rect{});
    for (int i = 0; i < n; ++i)
    {
        const int row = i / cols;
        const int col = i % cols;
        Rect cell{r.x + col * cellW, r.y + row * cellH, cellW, cellH};
        if (col == cols - 1 || i == n - 1)
            cell.w = r.x + r.w - cell.x;
        if (row == rows - 1)
            cell.h = r.y + r.h - cell.y;
        panel(visible[static_cast<size_t>(i)]).layout(cell);
    }
}

void PanelGrid::paint(tui::render::ScreenBuffer &sb)
{
    const auto visible = view_.visibleStages();
    if (visible.empty())
    {
        sb.fill(rect_.y, rect_.x, rect_.h, rect_.w, theme_.style(tui::style::Role::Normal));
        if (rect_.h > 0)
            sb.putText(rect_.y + rect_.h / 2,
                       rect_.x + 2,
                       "No stages visible. Press 1-7 to show a stage.",
                       theme_.style(tui::style::Role::Disabled),
                       rect_.w - 4);
        return;
    }
    for (auto kind : visible)
        panel(kind).paint(sb);
}

bool PanelGrid::onEvent(const tui::ui::Event &ev)
{
    if (ev.kind != tui::ui::Event::Kind::Mouse)
        return false;
    for (auto kind : view_.visibleStages())
    {
        StagePanel &p = panel(kind);
        if (p.rect().contains(ev.mouse.x, ev.mouse.y))
            return p.onEvent(ev);
    }
    return false;
}

} // namespace stagelens::explorer
