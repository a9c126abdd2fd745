//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/trace.hpp
// Purpose: Environment-gated diagnostic tracing for the explorer.
// Key invariants: Tracing is off unless STAGELENS_TRACE is set or a stream is
//                 installed explicitly.
// Ownership/Lifetime: The installed stream is borrowed; callers keep it alive.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>
#include <string_view>

namespace stagelens::support
{

/// @brief Whether trace lines are currently emitted.
/// @details The first call consults @c STAGELENS_TRACE; any non-empty value
///          other than "0" enables tracing to stderr.
bool traceEnabled();

/// @brief Redirect trace output; @c nullptr restores the environment default.
/// @details Installing a stream also enables tracing, which lets tests capture
///          trace lines without touching the environment.
void setTraceStream(std::ostream *os);

/// @brief Emit one `[channel] message` line when tracing is enabled.
void trace(std::string_view channel, std::string_view message);

} // namespace stagelens::support
