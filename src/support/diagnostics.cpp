/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     GNU GPL v3.
 * @details
 *     The diagnostic engine aggregates messages emitted by the toolchain stages.
 *     Diagnostics are stored until callers inspect or take them.
 */

#include "support/diagnostics.hpp"

#include <utility>

namespace stagelens::support
{
/**
 * @brief Adds a diagnostic to the engine.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    diags_.push_back(std::move(d));
}

const std::vector<Diagnostic> &DiagnosticEngine::diagnostics() const
{
    return diags_;
}

/**
 * @brief Transfers the stored diagnostics to the caller, leaving it empty.
 */
std::vector<Diagnostic> DiagnosticEngine::take()
{
    return std::exchange(diags_, {});
}
} // namespace stagelens::support
