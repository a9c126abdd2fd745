//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/pipeline/PipelineController.cpp
// Purpose: Stage recomputation, failure containment and snapshot publishing.
// Key invariants: A new snapshot is built completely before it replaces the
//                 current one; exceptions from the adapter never escape.
// Ownership/Lifetime: See PipelineController.hpp.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#include "pipeline/PipelineController.hpp"

#include "support/trace.hpp"

#include <exception>
#include <utility>

namespace stagelens::pipeline
{

std::string PipelineError::describe() const
{
    std::string out = stageTitle(stage);
    out += ": ";
    if (kind == PipelineErrorKind::AdapterCrash)
        out += "internal error: ";
    else if (loc.isValid())
        out += "line " + std::to_string(loc.line) + ": ";
    out += message;
    return out;
}

PipelineController::PipelineController(ToolchainAdapter &adapter)
    : adapter_(adapter), available_(adapter.availableStages()),
      snapshot_(std::make_shared<PipelineSnapshot>())
{
}

support::Expected<void, PipelineError> PipelineController::setSource(std::string text)
{
    const uint64_t revision = snapshot_->revision + 1;
    auto next = std::make_shared<PipelineSnapshot>(*snapshot_);
    next->revision = revision;

    StageSet refreshed;
    std::optional<PipelineError> failure;
    for (StageKind kind : available_.members())
    {
        StageSlot &slot = next->slots[stageIndex(kind)];
        if (failure)
        {
            slot.stale = true;
            continue;
        }

        try
        {
            auto out = adapter_.run(text, kind);
            if (!out)
            {
                const auto &diag = out.error();
                failure = PipelineError{
                    PipelineErrorKind::CompilationFailed, kind, diag.message, diag.loc};
                slot.stale = true;
                continue;
            }
            slot.artifact = std::make_shared<const StageArtifact>(
                kind, std::move(out.value().items), revision, std::move(out.value().diagnostics));
            slot.stale = false;
            refreshed.insert(kind);
        }
        catch (const std::exception &ex)
        {
            PipelineError err{PipelineErrorKind::AdapterCrash, kind, ex.what(), {}};
            support::trace("pipeline", "adapter crash, keeping revision " +
                                           std::to_string(snapshot_->revision) + ": " +
                                           err.describe());
            lastError_ = err;
            return err;
        }
    }

    snapshot_ = std::move(next);
    source_ = std::move(text);
    pushToPanels(*snapshot_, refreshed);

    if (failure)
    {
        support::trace("pipeline",
                       "revision " + std::to_string(revision) + " partial: " + failure->describe());
        lastError_ = failure;
        return *failure;
    }

    support::trace("pipeline", "revision " + std::to_string(revision) + " published, " +
                                   std::to_string(refreshed.size()) + " stages");
    currentLine_.reset();
    lastError_.reset();
    return {};
}

void PipelineController::attachPanel(StageKind kind, PanelView *panel)
{
    panels_[stageIndex(kind)] = panel;
    if (!panel)
        return;
    const StageSlot &slot = snapshot_->slot(kind);
    if (slot.artifact)
        panel->setContent(slot.artifact->items());
    panel->markStale(slot.stale);
}

void PipelineController::pushToPanels(const PipelineSnapshot &snap, const StageSet &refreshed)
{
    for (StageKind kind : available_.members())
    {
        PanelView *view = panels_[stageIndex(kind)];
        if (!view)
            continue;
        const StageSlot &slot = snap.slot(kind);
        if (refreshed.contains(kind))
            view->setContent(slot.artifact->items());
        view->markStale(slot.stale);
    }
}

} // namespace stagelens::pipeline
