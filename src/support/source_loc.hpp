//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/source_loc.hpp
// Purpose: Declares lightweight source location POD used across the pipeline.
// Key invariants: Line zero denotes an unknown location.
// Ownership/Lifetime: Simple value type stored by clients; no ownership semantics.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace stagelens::support
{
/// @brief Position within the single in-memory source snippet.
struct SourceLoc
{
    /// 1-based line number; 0 if unknown.
    uint32_t line = 0;

    /// 0-based column offset within the line.
    uint32_t column = 0;

    /// @brief Whether this location refers to a real line.
    [[nodiscard]] bool isValid() const
    {
        return line != 0;
    }
};

} // namespace stagelens::support
