//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// Implements command-line parsing for the stagelens driver together with the
// non-interactive dump mode used by scripts and tests.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Parses stagelens options and prints single stages on request.
/// @details The dump mode talks to the toolchain adapter directly so that its
///          output matches what the matching panel would show.

#include "explorer/cli.hpp"

#include "pipeline/LangToolchain.hpp"

#include <charconv>
#include <fstream>
#include <ostream>
#include <sstream>
#include <system_error>

namespace stagelens::explorer
{

namespace
{

/// @brief Split `--name=value`; returns the value when @p arg has that form.
std::optional<std::string_view> inlineValue(std::string_view arg, std::string_view name)
{
    if (arg.size() > name.size() && arg.substr(0, name.size()) == name && arg[name.size()] == '=')
        return arg.substr(name.size() + 1);
    return std::nullopt;
}

/// @brief Fetch the value of option @p name from `--name=v` or `--name v`.
std::optional<std::string_view> optionValue(int &index, int argc, char **argv, std::string_view name)
{
    const std::string_view arg = argv[index];
    if (auto v = inlineValue(arg, name))
        return v;
    if (arg != name || index + 1 >= argc)
        return std::nullopt;
    return std::string_view(argv[++index]);
}

bool matchesOption(std::string_view arg, std::string_view name)
{
    return arg == name || inlineValue(arg, name).has_value();
}

} // namespace

OptionParseResult parseOption(int &index, int argc, char **argv, CliOptions &opts)
{
    const std::string_view arg = argv[index];
    if (arg == "--help" || arg == "-h")
    {
        opts.showHelp = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--version")
    {
        opts.showVersion = true;
        return OptionParseResult::Parsed;
    }
    if (matchesOption(arg, "--toolchain"))
    {
        auto value = optionValue(index, argc, argv, "--toolchain");
        if (!value)
            return OptionParseResult::Error;
        opts.toolchain = pipeline::parseToolchainVersion(*value);
        return opts.toolchain ? OptionParseResult::Parsed : OptionParseResult::Error;
    }
    if (matchesOption(arg, "--config"))
    {
        auto value = optionValue(index, argc, argv, "--config");
        if (!value || value->empty())
            return OptionParseResult::Error;
        opts.configPath = std::string(*value);
        return OptionParseResult::Parsed;
    }
    if (matchesOption(arg, "--dump"))
    {
        auto value = optionValue(index, argc, argv, "--dump");
        if (!value)
            return OptionParseResult::Error;
        opts.dump = pipeline::parseStageName(*value);
        return opts.dump ? OptionParseResult::Parsed : OptionParseResult::Error;
    }
    if (matchesOption(arg, "--line"))
    {
        auto value = optionValue(index, argc, argv, "--line");
        if (!value)
            return OptionParseResult::Error;
        uint32_t parsed = 0;
        const char *const begin = value->data();
        const char *const end = begin + value->size();
        const auto fc = std::from_chars(begin, end, parsed);
        if (fc.ec != std::errc() || fc.ptr != end || parsed == 0)
            return OptionParseResult::Error;
        opts.line = parsed;
        return OptionParseResult::Parsed;
    }
    return OptionParseResult::NotMatched;
}

bool parseCommandLine(int argc, char **argv, CliOptions &opts, std::ostream &err)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        switch (parseOption(i, argc, argv, opts))
        {
            case OptionParseResult::Parsed:
                continue;
            case OptionParseResult::Error:
                err << "stagelens: invalid value for '" << arg << "'\n";
                return false;
            case OptionParseResult::NotMatched:
                break;
        }
        if (arg.size() > 1 && arg[0] == '-')
        {
            err << "stagelens: unknown option '" << arg << "'\n";
            return false;
        }
        if (!opts.file.empty())
        {
            err << "stagelens: more than one input file\n";
            return false;
        }
        opts.file = std::string(arg);
    }
    if (opts.line && !opts.dump)
    {
        err << "stagelens: --line requires --dump\n";
        return false;
    }
    return true;
}

void usage(std::ostream &os)
{
    os << "usage: stagelens [options] [file]\n"
          "\n"
          "Shows a Pylite program next to every stage of its compilation.\n"
          "\n"
          "options:\n"
          "  --toolchain=full|reduced  toolchain version (overrides the config)\n"
          "  --config <path>           read settings from an INI file\n"
          "  --dump <stage>            print one stage and exit\n"
          "                            (source, tokens, ast, opt-ast, pseudo,\n"
          "                             opt-pseudo, code)\n"
          "  --line <N>                with --dump, only items of source line N\n"
          "  --version                 print the version and exit\n"
          "  --help                    print this message and exit\n"
          "\n"
          "Set STAGELENS_TRACE=1 to trace on stderr and STAGELENS_NO_TTY=1 to\n"
          "render a single frame without a terminal.\n";
}

std::string_view defaultSnippet()
{
    return "# Fibonacci numbers below 100\n"
           "a, b = 0, 1\n"
           "while a < 100:\n"
           "    print(a)\n"
           "    a, b = b, a + b\n"
           "\n"
           "for i in range(3):\n"
           "    if i % 2 == 0:\n"
           "        print(\"even\", i)\n"
           "    else:\n"
           "        print(\"odd\", i)\n";
}

support::Expected<std::string> readSourceFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return support::makeError({}, "cannot open '" + path + "'");
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        return support::makeError({}, "error reading '" + path + "'");
    return ss.str();
}

int runDump(const CliOptions &opts,
            pipeline::ToolchainVersion version,
            std::string_view source,
            const std::string &inputName,
            std::ostream &out,
            std::ostream &err)
{
    if (!opts.dump)
        return 1;
    pipeline::LangToolchain toolchain(version);
    auto result = toolchain.run(source, *opts.dump);
    if (!result)
    {
        support::printDiag(result.error(), err, inputName);
        return 1;
    }
    for (const auto &d : result.value().diagnostics)
        support::printDiag(d, err, inputName);
    for (const auto &item : result.value().items)
    {
        if (opts.line && item.line != opts.line)
            continue;
        if (item.line)
            out << *item.line;
        out << " | " << item.text << '\n';
    }
    return 0;
}

} // namespace stagelens::explorer
