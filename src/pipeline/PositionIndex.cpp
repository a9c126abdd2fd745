//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/pipeline/PositionIndex.cpp
// Purpose: Line to item-index lookup table.
// Key invariants: See PositionIndex.hpp.
// Ownership/Lifetime: See PositionIndex.hpp.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#include "pipeline/PositionIndex.hpp"

namespace stagelens::pipeline
{

PositionIndex PositionIndex::build(const std::vector<StageItem> &items)
{
    PositionIndex index;
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (items[i].line)
            index.byLine_[*items[i].line].push_back(i);
    }
    return index;
}

const std::vector<size_t> &PositionIndex::lookup(uint32_t line) const
{
    static const std::vector<size_t> kEmpty;
    auto it = byLine_.find(line);
    return it == byLine_.end() ? kEmpty : it->second;
}

} // namespace stagelens::pipeline
