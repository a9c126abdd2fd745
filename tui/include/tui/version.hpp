// tui/include/tui/version.hpp
#pragma once

/// @brief Returns the Stagelens version string.
/// @invariant The returned pointer is non-null and points to a null-terminated string.
/// @ownership The returned string has static storage duration and must not be freed.
namespace stagelens::tui
{
const char *stagelens_version() noexcept;
} // namespace stagelens::tui
