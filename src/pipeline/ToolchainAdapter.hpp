//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/pipeline/ToolchainAdapter.hpp
// Purpose: Boundary between the pipeline core and a concrete compiler.
// Key invariants: run() either returns every item of the stage or an error
//                 diagnostic; it never returns partial output.
// Ownership/Lifetime: Owned by the application; the controller borrows it.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "pipeline/StageItem.hpp"
#include "pipeline/StageKind.hpp"
#include "support/diag_expected.hpp"

#include <string_view>
#include <vector>

namespace stagelens::pipeline
{

/// @brief Items of one stage plus the non-fatal diagnostics it produced.
struct StageOutput
{
    std::vector<StageItem> items;
    std::vector<support::Diagnostic> diagnostics;
};

class ToolchainAdapter
{
  public:
    virtual ~ToolchainAdapter() = default;

    /// @brief Stages the active toolchain version can produce.
    virtual StageSet availableStages() const = 0;

    /// @brief Run stage @p kind over @p source.
    /// @return Stage output, or the error diagnostic when the toolchain
    ///         rejects the source.
    /// @note May throw std::exception on internal failure; the controller
    ///       treats that as a crash and rolls back.
    virtual support::Expected<StageOutput> run(std::string_view source, StageKind kind) = 0;
};

} // namespace stagelens::pipeline
