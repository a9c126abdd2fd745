// File: tests/unit/test_position_index.cpp
// Purpose: Verify line-to-item indexing of stage artifacts.
// Key invariants: Lookup returns ascending indices; unattributed items are
//                 never returned.
// Ownership/Lifetime: Test owns item vectors and artifacts.
// Links: docs/explorer.md

#include "pipeline/PositionIndex.hpp"
#include "pipeline/StageArtifact.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace stagelens::pipeline;

TEST(PositionIndex, GroupsItemsByLine)
{
    const std::vector<StageItem> items = {
        {"Module", std::nullopt},
        {"a", 1},
        {"=", 1},
        {"b", 2},
        {"1", 1},
        {"<newline>", std::nullopt},
    };
    const PositionIndex idx = PositionIndex::build(items);
    EXPECT_EQ(idx.lookup(1), (std::vector<size_t>{1, 2, 4}));
    EXPECT_EQ(idx.lookup(2), (std::vector<size_t>{3}));
    EXPECT_TRUE(idx.lookup(3).empty());
    EXPECT_TRUE(idx.lookup(0).empty());
    EXPECT_EQ(idx.lineCount(), 2U);
}

TEST(PositionIndex, EmptyArtifact)
{
    const StageArtifact art(StageKind::Tokens, {}, 4);
    EXPECT_TRUE(art.items().empty());
    EXPECT_TRUE(art.index().lookup(1).empty());
    EXPECT_EQ(art.index().lineCount(), 0U);
    EXPECT_EQ(art.revision(), 4U);
    EXPECT_EQ(art.kind(), StageKind::Tokens);
}

TEST(PositionIndex, ArtifactIndexesItsOwnCopy)
{
    std::vector<StageItem> items = {{"x", 7}, {"y", 7}};
    const StageArtifact art(StageKind::Source, items, 1);
    items.clear();
    EXPECT_EQ(art.index().lookup(7), (std::vector<size_t>{0, 1}));
    EXPECT_EQ(art.items()[1].text, "y");
}
