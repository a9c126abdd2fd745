// File: src/explorer/cli.hpp
// Purpose: Command-line options and the non-interactive dump mode of stagelens.
// Key invariants: Parsing never exits the process; callers act on the result.
// Ownership/Lifetime: N/A.
// Links: docs/explorer.md

#pragma once

#include "pipeline/StageKind.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace stagelens::explorer
{

/// @brief Options accepted by the stagelens driver.
struct CliOptions
{
    /// @brief Source file to load; empty selects the built-in demo.
    std::string file{};

    /// @brief Configuration file given with --config.
    std::optional<std::string> configPath{};

    /// @brief Toolchain version forced with --toolchain; overrides the config.
    std::optional<pipeline::ToolchainVersion> toolchain{};

    /// @brief Stage to print with --dump instead of starting the UI.
    std::optional<pipeline::StageKind> dump{};

    /// @brief Restrict --dump output to items attributed to this line.
    std::optional<uint32_t> line{};

    bool showVersion = false;
    bool showHelp = false;
};

/// @brief Result of attempting to parse one command-line argument.
enum class OptionParseResult
{
    NotMatched, ///< Argument is not an option this driver knows.
    Parsed,     ///< Argument consumed and reflected in the options.
    Error       ///< Argument named an option but its value was malformed.
};

/// @brief Parse the option at @p index, advancing it past consumed values.
OptionParseResult parseOption(int &index, int argc, char **argv, CliOptions &opts);

/// @brief Parse the whole command line into @p opts.
/// @return False after printing a message to @p err when an argument is
///         malformed or unknown.
bool parseCommandLine(int argc, char **argv, CliOptions &opts, std::ostream &err);

/// @brief Print the usage synopsis.
void usage(std::ostream &os);

/// @brief Source shown when no file is given.
std::string_view defaultSnippet();

/// @brief Read @p path into a string.
support::Expected<std::string> readSourceFile(const std::string &path);

/// @brief Run the --dump mode over @p source.
/// @details Prints one `line | text` row per item of the requested stage to
///          @p out, or the failing diagnostic to @p err.
/// @return Process exit code: 0 on success, 1 when the stage failed or is not
///         available in @p version.
int runDump(const CliOptions &opts,
            pipeline::ToolchainVersion version,
            std::string_view source,
            const std::string &inputName,
            std::ostream &out,
            std::ostream &err);

} // namespace stagelens::explorer
