//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: support/trace.cpp
// Purpose: Implement `[channel] message` tracing gated by STAGELENS_TRACE.
// Key invariants: Environment is read once; stream override wins over it.
// Ownership/Lifetime: Borrowed stream pointer stored in a function-local static.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "support/trace.hpp"

#include <cstdlib>
#include <iostream>

namespace stagelens::support
{
namespace
{
std::ostream *&overrideStream()
{
    static std::ostream *os = nullptr;
    return os;
}

bool envEnabled()
{
    static const bool enabled = []
    {
        const char *v = std::getenv("STAGELENS_TRACE");
        return v != nullptr && v[0] != '\0' && !(v[0] == '0' && v[1] == '\0');
    }();
    return enabled;
}
} // namespace

bool traceEnabled()
{
    return overrideStream() != nullptr || envEnabled();
}

void setTraceStream(std::ostream *os)
{
    overrideStream() = os;
}

void trace(std::string_view channel, std::string_view message)
{
    if (!traceEnabled())
        return;
    std::ostream &os = overrideStream() ? *overrideStream() : std::cerr;
    os << '[' << channel << "] " << message << '\n';
}

} // namespace stagelens::support
