//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/pipeline/ViewState.cpp
// Purpose: Visibility flags and derived panel layout.
// Key invariants: See ViewState.hpp.
// Ownership/Lifetime: See ViewState.hpp.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#include "pipeline/ViewState.hpp"

#include <algorithm>

namespace stagelens::pipeline
{

ViewState::ViewState(StageSet available) : available_(available)
{
    visible_[stageIndex(StageKind::Source)] = available_.contains(StageKind::Source);
    visible_[stageIndex(StageKind::FinalBytecode)] = available_.contains(StageKind::FinalBytecode);
    recompute();
}

void ViewState::toggle(StageKind kind)
{
    if (!available_.contains(kind))
        return;
    visible_[stageIndex(kind)] = !visible_[stageIndex(kind)];
    recompute();
}

void ViewState::setVisible(StageKind kind, bool visible)
{
    if (!available_.contains(kind))
        return;
    visible_[stageIndex(kind)] = visible;
    recompute();
}

size_t ViewState::visibleCount() const
{
    return static_cast<size_t>(std::count(visible_.begin(), visible_.end(), true));
}

std::vector<StageKind> ViewState::visibleStages() const
{
    std::vector<StageKind> out;
    for (StageKind kind : kAllStages)
    {
        if (isVisible(kind))
            out.push_back(kind);
    }
    return out;
}

void ViewState::recompute()
{
    columns_ = std::min(visibleCount(), kMaxColumns);
}

} // namespace stagelens::pipeline
