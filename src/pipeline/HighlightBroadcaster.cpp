//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/pipeline/HighlightBroadcaster.cpp
// Purpose: Cross-panel highlight propagation.
// Key invariants: See HighlightBroadcaster.hpp.
// Ownership/Lifetime: See HighlightBroadcaster.hpp.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#include "pipeline/HighlightBroadcaster.hpp"

#include "support/trace.hpp"

#include <string>

namespace stagelens::pipeline
{

const char *panelStateName(PanelState state)
{
    switch (state)
    {
        case PanelState::Hidden:
            return "hidden";
        case PanelState::VisibleUnhighlighted:
            return "visible";
        case PanelState::VisibleHighlighted:
            return "highlighted";
    }
    return "?";
}

HighlightBroadcaster::HighlightBroadcaster(PipelineController &controller, const ViewState &view)
    : controller_(controller), view_(view)
{
}

void HighlightBroadcaster::onLineSelected(uint32_t line)
{
    controller_.setCurrentLine(line);
    apply(line);
}

void HighlightBroadcaster::reapply()
{
    apply(controller_.currentLine());
}

void HighlightBroadcaster::apply(std::optional<uint32_t> line)
{
    const auto snap = controller_.snapshot();
    for (StageKind kind : view_.visibleStages())
    {
        const StageSlot &slot = snap->slot(kind);
        PanelView *panel = controller_.panel(kind);
        if (!slot.artifact || slot.stale || !panel)
            continue;

        Applied &applied = applied_[stageIndex(kind)];
        applied.revision = slot.artifact->revision();
        if (line)
            applied.indices = slot.artifact->index().lookup(*line);
        else
            applied.indices.clear();

        if (applied.indices.empty())
            panel->clearHighlight();
        else
            panel->highlight(applied.indices);

        if (support::traceEnabled())
        {
            support::trace("highlight",
                           std::string(stageName(kind)) + " line " +
                               (line ? std::to_string(*line) : std::string("-")) + ": " +
                               std::to_string(applied.indices.size()) + " items");
        }
    }
}

PanelState HighlightBroadcaster::panelState(StageKind kind) const
{
    if (!view_.isVisible(kind))
        return PanelState::Hidden;
    const Applied &applied = applied_[stageIndex(kind)];
    const auto artifact = controller_.artifact(kind);
    if (!artifact || applied.indices.empty() || applied.revision != artifact->revision())
        return PanelState::VisibleUnhighlighted;
    return PanelState::VisibleHighlighted;
}

} // namespace stagelens::pipeline
