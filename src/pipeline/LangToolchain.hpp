//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/pipeline/LangToolchain.hpp
// Purpose: ToolchainAdapter over the bundled Pylite compiler.
// Key invariants: Each run() call compiles from scratch; the adapter holds no
//                 state besides its version.
// Ownership/Lifetime: Plain value; safe to share by reference.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "pipeline/ToolchainAdapter.hpp"

namespace stagelens::pipeline
{

class LangToolchain final : public ToolchainAdapter
{
  public:
    explicit LangToolchain(ToolchainVersion version = ToolchainVersion::Full);

    ToolchainVersion version() const
    {
        return version_;
    }

    StageSet availableStages() const override;

    support::Expected<StageOutput> run(std::string_view source, StageKind kind) override;

  private:
    ToolchainVersion version_;
    StageSet stages_;
};

} // namespace stagelens::pipeline
