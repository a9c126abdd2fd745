//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/pipeline/PanelView.hpp
// Purpose: Rendering surface for one stage, as seen by the pipeline core.
// Key invariants: setContent() drops any existing highlight.
// Ownership/Lifetime: Panels are owned by the UI; the controller and
//                     broadcaster only borrow them.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "pipeline/StageItem.hpp"

#include <cstddef>
#include <vector>

namespace stagelens::pipeline
{

class PanelView
{
  public:
    virtual ~PanelView() = default;

    /// @brief Replace the displayed items.
    virtual void setContent(const std::vector<StageItem> &items) = 0;

    /// @brief Highlight exactly @p indices (ascending item indices).
    virtual void highlight(const std::vector<size_t> &indices) = 0;

    /// @brief Remove any highlight.
    virtual void clearHighlight() = 0;

    /// @brief Flag the content as reflecting an older source revision.
    virtual void markStale(bool stale)
    {
        (void)stale;
    }
};

} // namespace stagelens::pipeline
