// File: tests/unit/test_highlight_broadcaster.cpp
// Purpose: Verify line selection fans out to visible, fresh panels only.
// Key invariants: Broadcasting is idempotent; a line with no items clears the
//                 panel; hidden and stale panels keep their last highlight.
// Ownership/Lifetime: Test owns controller, view state and panels.
// Links: docs/explorer.md

#include "pipeline/HighlightBroadcaster.hpp"

#include "tests/common/PipelineFakes.hpp"

#include <gtest/gtest.h>

#include <array>

using namespace stagelens::pipeline;
using stagelens::tests::RecordingPanel;
using stagelens::tests::ScriptedAdapter;

namespace
{
struct Rig
{
    Rig() : ctl(adapter), view(StageSet::all()), hb(ctl, view)
    {
        for (StageKind kind : kAllStages)
            ctl.attachPanel(kind, &panels[stageIndex(kind)]);
    }

    RecordingPanel &panel(StageKind kind)
    {
        return panels[stageIndex(kind)];
    }

    ScriptedAdapter adapter;
    PipelineController ctl;
    ViewState view;
    HighlightBroadcaster hb;
    std::array<RecordingPanel, kStageCount> panels;
};
} // namespace

TEST(HighlightBroadcaster, SelectsMatchingItemsInVisiblePanels)
{
    Rig r;
    ASSERT_TRUE(r.ctl.setSource("a\nb\nc\n"));
    r.hb.onLineSelected(2);

    EXPECT_EQ(r.ctl.currentLine(), 2U);
    EXPECT_EQ(r.panel(StageKind::Source).highlighted(), (std::vector<size_t>{1}));
    EXPECT_EQ(r.panel(StageKind::FinalBytecode).highlighted(), (std::vector<size_t>{1}));
    EXPECT_EQ(r.hb.appliedIndices(StageKind::Source), (std::vector<size_t>{1}));
    EXPECT_EQ(r.hb.panelState(StageKind::Source), PanelState::VisibleHighlighted);

    EXPECT_EQ(r.panel(StageKind::Tokens).highlightCalls(), 0);
    EXPECT_EQ(r.hb.panelState(StageKind::Tokens), PanelState::Hidden);
    EXPECT_STREQ(panelStateName(PanelState::Hidden), "hidden");
}

TEST(HighlightBroadcaster, RepeatedSelectionIsIdempotent)
{
    Rig r;
    ASSERT_TRUE(r.ctl.setSource("a\nb\n"));
    r.hb.onLineSelected(1);
    const auto first = r.panel(StageKind::Source).highlighted();
    r.hb.onLineSelected(1);
    EXPECT_EQ(r.panel(StageKind::Source).highlighted(), first);
    EXPECT_EQ(r.hb.panelState(StageKind::Source), PanelState::VisibleHighlighted);
}

TEST(HighlightBroadcaster, EmptyMatchClearsHighlight)
{
    Rig r;
    ASSERT_TRUE(r.ctl.setSource("a\nb\n"));
    r.hb.onLineSelected(1);
    r.hb.onLineSelected(9);
    EXPECT_TRUE(r.panel(StageKind::Source).highlighted().empty());
    EXPECT_GE(r.panel(StageKind::Source).clearCalls(), 1);
    EXPECT_EQ(r.hb.panelState(StageKind::Source), PanelState::VisibleUnhighlighted);
}

TEST(HighlightBroadcaster, HiddenPanelKeepsStateUntilShown)
{
    Rig r;
    ASSERT_TRUE(r.ctl.setSource("a\nb\n"));
    r.view.toggle(StageKind::Tokens);
    r.hb.onLineSelected(1);
    EXPECT_EQ(r.panel(StageKind::Tokens).highlighted(), (std::vector<size_t>{0}));

    r.view.toggle(StageKind::Tokens);
    r.hb.onLineSelected(2);
    EXPECT_EQ(r.panel(StageKind::Tokens).highlighted(), (std::vector<size_t>{0}));
    EXPECT_EQ(r.hb.panelState(StageKind::Tokens), PanelState::Hidden);

    r.view.toggle(StageKind::Tokens);
    r.hb.reapply();
    EXPECT_EQ(r.panel(StageKind::Tokens).highlighted(), (std::vector<size_t>{1}));
}

TEST(HighlightBroadcaster, StalePanelsAreSkipped)
{
    Rig r;
    ASSERT_TRUE(r.ctl.setSource("a\nb\n"));
    r.hb.onLineSelected(1);

    r.adapter.failOn = StageKind::AST;
    ASSERT_FALSE(r.ctl.setSource("a\nb\nc\n"));
    r.hb.onLineSelected(3);
    EXPECT_EQ(r.panel(StageKind::Source).highlighted(), (std::vector<size_t>{2}));
    EXPECT_EQ(r.panel(StageKind::FinalBytecode).highlighted(), (std::vector<size_t>{0}))
        << "stale panel keeps its previous highlight";
}

TEST(HighlightBroadcaster, NewRevisionClearsCurrentLine)
{
    Rig r;
    ASSERT_TRUE(r.ctl.setSource("a\nb\n"));
    r.hb.onLineSelected(2);
    ASSERT_TRUE(r.ctl.setSource("x\ny\n"));
    r.hb.reapply();
    EXPECT_FALSE(r.ctl.currentLine().has_value());
    EXPECT_TRUE(r.panel(StageKind::Source).highlighted().empty());
    EXPECT_EQ(r.hb.panelState(StageKind::Source), PanelState::VisibleUnhighlighted);
}
