//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/pipeline/PipelineController.hpp
// Purpose: Recomputes every stage when the source changes and publishes the
//          results as one snapshot.
// Key invariants: Readers only ever see a whole snapshot; a snapshot is
//                 replaced by swapping a single pointer. Stages absent from
//                 the toolchain's capability set are never run and their
//                 slots stay empty and not stale.
// Ownership/Lifetime: Borrows the adapter and attached panels, which must
//                     outlive the controller. Owns the snapshots.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "pipeline/PanelView.hpp"
#include "pipeline/StageArtifact.hpp"
#include "pipeline/StageKind.hpp"
#include "pipeline/ToolchainAdapter.hpp"
#include "support/diag_expected.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace stagelens::pipeline
{

enum class PipelineErrorKind : uint8_t
{
    CompilationFailed, ///< The toolchain rejected the source at some stage.
    AdapterCrash,      ///< The adapter threw; nothing was published.
};

struct PipelineError
{
    PipelineErrorKind kind = PipelineErrorKind::CompilationFailed;
    StageKind stage = StageKind::Source;
    std::string message;
    support::SourceLoc loc;

    /// @brief One-line summary, `AST: line 2: invalid syntax near ')'`.
    std::string describe() const;
};

/// @brief Artifact slot for one stage inside a snapshot.
struct StageSlot
{
    std::shared_ptr<const StageArtifact> artifact; ///< May be null.
    bool stale = false;
};

/// @brief Immutable set of stage slots published together.
struct PipelineSnapshot
{
    uint64_t revision = 0;
    std::array<StageSlot, kStageCount> slots;

    const StageSlot &slot(StageKind kind) const
    {
        return slots[stageIndex(kind)];
    }
};

class PipelineController
{
  public:
    explicit PipelineController(ToolchainAdapter &adapter);

    /// @brief Recompute every available stage over @p text.
    /// @details On success every available stage is replaced, stale flags are
    ///          cleared and the current line is reset. On CompilationFailed the
    ///          stages before the failing one are refreshed while it and every
    ///          later stage keep their previous artifact and become stale. On
    ///          AdapterCrash the previous snapshot and source stay in place.
    support::Expected<void, PipelineError> setSource(std::string text);

    /// @brief Attach @p panel to stage @p kind; nullptr detaches.
    /// @details A panel attached after content exists receives it immediately.
    void attachPanel(StageKind kind, PanelView *panel);

    PanelView *panel(StageKind kind) const
    {
        return panels_[stageIndex(kind)];
    }

    /// @brief Currently published snapshot; never null.
    std::shared_ptr<const PipelineSnapshot> snapshot() const
    {
        return snapshot_;
    }

    /// @brief Artifact of @p kind in the current snapshot, or null.
    std::shared_ptr<const StageArtifact> artifact(StageKind kind) const
    {
        return snapshot_->slot(kind).artifact;
    }

    bool isStale(StageKind kind) const
    {
        return snapshot_->slot(kind).stale;
    }

    /// @brief Revision of the current snapshot; 0 before the first publish.
    uint64_t revision() const
    {
        return snapshot_->revision;
    }

    StageSet availableStages() const
    {
        return available_;
    }

    /// @brief Source text the most recent refresh was computed from.
    const std::string &source() const
    {
        return source_;
    }

    std::optional<uint32_t> currentLine() const
    {
        return currentLine_;
    }

    void setCurrentLine(std::optional<uint32_t> line)
    {
        currentLine_ = line;
    }

    /// @brief Error from the latest setSource call, if it failed.
    const std::optional<PipelineError> &lastError() const
    {
        return lastError_;
    }

  private:
    void pushToPanels(const PipelineSnapshot &snap, const StageSet &refreshed);

    ToolchainAdapter &adapter_;
    StageSet available_;
    std::shared_ptr<const PipelineSnapshot> snapshot_;
    std::array<PanelView *, kStageCount> panels_{};
    std::string source_;
    std::optional<uint32_t> currentLine_;
    std::optional<PipelineError> lastError_;
};

} // namespace stagelens::pipeline
