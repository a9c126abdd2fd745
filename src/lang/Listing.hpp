//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Listing.hpp
// Purpose: Textual listing line emitted by every Pylite stage printer.
// Key invariants: line == 0 means the entry has no single source line.
// Ownership/Lifetime: Value type.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace stagelens::lang
{

struct ListingLine
{
    std::string text;
    uint32_t line = 0;
};

using Listing = std::vector<ListingLine>;

} // namespace stagelens::lang
