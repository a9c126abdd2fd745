//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/pipeline/StageItem.hpp
// Purpose: One renderable unit of a stage's output.
// Key invariants: line, when present, is 1-based.
// Ownership/Lifetime: Value type.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace stagelens::pipeline
{

/// @brief A token, AST node line or instruction as shown in a panel.
struct StageItem
{
    std::string text;                 ///< Display text.
    std::optional<uint32_t> line;     ///< Source line; empty when unattributed.

    bool operator==(const StageItem &other) const = default;
};

} // namespace stagelens::pipeline
