//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/pipeline/StageArtifact.hpp
// Purpose: Immutable output of one stage for one source revision.
// Key invariants: index() is built from items() at construction and both are
//                 never modified afterwards.
// Ownership/Lifetime: Shared read-only between the controller's snapshots
//                     through std::shared_ptr<const StageArtifact>.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "pipeline/PositionIndex.hpp"
#include "pipeline/StageItem.hpp"
#include "pipeline/StageKind.hpp"
#include "support/diagnostics.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace stagelens::pipeline
{

class StageArtifact
{
  public:
    StageArtifact(StageKind kind,
                  std::vector<StageItem> items,
                  uint64_t revision,
                  std::vector<support::Diagnostic> diagnostics = {})
        : kind_(kind), items_(std::move(items)), index_(PositionIndex::build(items_)),
          revision_(revision), diagnostics_(std::move(diagnostics))
    {
    }

    StageKind kind() const
    {
        return kind_;
    }

    const std::vector<StageItem> &items() const
    {
        return items_;
    }

    const PositionIndex &index() const
    {
        return index_;
    }

    /// @brief Source revision this artifact was computed from.
    uint64_t revision() const
    {
        return revision_;
    }

    /// @brief Non-fatal notes and warnings the stage produced.
    const std::vector<support::Diagnostic> &diagnostics() const
    {
        return diagnostics_;
    }

  private:
    StageKind kind_;
    std::vector<StageItem> items_;
    PositionIndex index_;
    uint64_t revision_;
    std::vector<support::Diagnostic> diagnostics_;
};

} // namespace stagelens::pipeline
