//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: tui/src/version.cpp
// Purpose: Provide the version string reported by `stagelens --version`.
// Key invariants: Returned string remains valid for the process lifetime and
//                 matches the project version recorded in CMake metadata.
// Ownership/Lifetime: Returns a pointer to a string with static storage
//                     duration; callers must not attempt to free it.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#include "tui/version.hpp"

namespace stagelens::tui
{
/// @brief Report the semantic version string.
/// @return Pointer to a string containing the "major.minor.patch" version.
const char *stagelens_version() noexcept
{
#ifdef STAGELENS_VERSION
    return STAGELENS_VERSION;
#else
    return "0.1.0";
#endif
}
} // namespace stagelens::tui
