//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/pipeline/PositionIndex.hpp
// Purpose: Maps a source line to the indices of the items it produced.
// Key invariants: Each item index is listed under at most one line, in
//                 ascending order; unattributed items are listed nowhere.
// Ownership/Lifetime: Immutable after build(); owned by its StageArtifact.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "pipeline/StageItem.hpp"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace stagelens::pipeline
{

class PositionIndex
{
  public:
    PositionIndex() = default;

    /// @brief Index @p items by their source line. O(n).
    static PositionIndex build(const std::vector<StageItem> &items);

    /// @brief Indices of items attributed to @p line.
    /// @return Reference to an empty vector when @p line produced nothing.
    const std::vector<size_t> &lookup(uint32_t line) const;

    /// @brief Number of distinct lines with at least one item.
    size_t lineCount() const
    {
        return byLine_.size();
    }

  private:
    std::unordered_map<uint32_t, std::vector<size_t>> byLine_;
};

} // namespace stagelens::pipeline
