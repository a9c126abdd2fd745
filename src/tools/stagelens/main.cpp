//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/stagelens/main.cpp
// Purpose: Entry point of the stagelens pipeline explorer.
// Key invariants: Returns 0 on a clean exit and 1 on usage or input errors.
// Ownership/Lifetime: The terminal session outlives the explorer so raw mode
//                     is restored after the last frame.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#include "explorer/ExplorerApp.hpp"
#include "explorer/cli.hpp"
#include "support/trace.hpp"
#include "tui/config/config.hpp"
#include "tui/term/input.hpp"
#include "tui/term/session.hpp"
#include "tui/term/term_io.hpp"
#include "tui/version.hpp"

#include <cerrno>
#include <iostream>
#include <string>

#include <poll.h>
#include <unistd.h>

using namespace stagelens;

namespace
{

/// @brief Resolve the toolchain version: command line, then config, then full.
pipeline::ToolchainVersion resolveToolchain(const explorer::CliOptions &opts,
                                            const tui::config::Config &config)
{
    if (opts.toolchain)
        return *opts.toolchain;
    if (config.explorer.toolchain)
    {
        if (auto v = pipeline::parseToolchainVersion(*config.explorer.toolchain))
            return *v;
        support::trace("app", "ignoring unknown toolchain '" + *config.explorer.toolchain + "'");
    }
    return pipeline::ToolchainVersion::Full;
}

void pumpInput(tui::term::InputDecoder &decoder, tui::App &app)
{
    for (auto &key : decoder.drain())
    {
        tui::ui::Event e{};
        e.kind = tui::ui::Event::Kind::Key;
        e.key = key;
        app.pushEvent(e);
    }
    for (auto &mouse : decoder.drain_mouse())
    {
        tui::ui::Event e{};
        e.kind = tui::ui::Event::Kind::Mouse;
        e.mouse = mouse;
        app.pushEvent(e);
    }
    for (auto &paste : decoder.drain_paste())
    {
        tui::ui::Event e{};
        e.kind = tui::ui::Event::Kind::Paste;
        e.paste = std::move(paste.text);
        app.pushEvent(e);
    }
}

} // namespace

int main(int argc, char **argv)
{
    explorer::CliOptions opts;
    if (!explorer::parseCommandLine(argc, argv, opts, std::cerr))
    {
        explorer::usage(std::cerr);
        return 1;
    }
    if (opts.showHelp)
    {
        explorer::usage(std::cout);
        return 0;
    }
    if (opts.showVersion)
    {
        std::cout << "stagelens " << tui::stagelens_version() << '\n';
        return 0;
    }

    tui::config::Config config;
    if (opts.configPath && !tui::config::loadFromFile(*opts.configPath, config))
    {
        std::cerr << "stagelens: cannot read config '" << *opts.configPath << "'\n";
        return 1;
    }

    std::string source;
    std::string inputName = "<demo>";
    if (opts.file.empty())
    {
        source = std::string(explorer::defaultSnippet());
    }
    else
    {
        auto text = explorer::readSourceFile(opts.file);
        if (!text)
        {
            support::printDiag(text.error(), std::cerr, opts.file);
            return 1;
        }
        source = std::move(text.value());
        inputName = opts.file;
    }

    const pipeline::ToolchainVersion version = resolveToolchain(opts, config);
    if (opts.dump)
        return explorer::runDump(opts, version, source, inputName, std::cout, std::cerr);

    if (tui::TerminalSession::headlessRequested())
    {
        tui::term::StringTermIO tio;
        explorer::ExplorerApp explorerApp(tio, 24, 80, config, version);
        auto loaded = explorerApp.loadSource(std::move(source));
        if (!loaded)
            support::trace("app", loaded.error().describe());
        explorerApp.app().tick();
        const auto &screen = explorerApp.app().screen();
        for (int y = 0; y < screen.rows(); ++y)
            std::cout << screen.rowText(y) << '\n';
        return 0;
    }

    tui::TerminalSession session;
    tui::term::RealTermIO tio;
    int rows = 24;
    int cols = 80;
    if (!tui::TerminalSession::querySize(rows, cols))
        support::trace("app", "terminal size unavailable, assuming 24x80");

    explorer::ExplorerApp explorerApp(tio, rows, cols, config, version);
    auto loaded = explorerApp.loadSource(std::move(source));
    if (!loaded)
        support::trace("app", loaded.error().describe());
    explorerApp.app().tick();

    tui::term::InputDecoder decoder;
    char in[256];
    while (!explorerApp.quitRequested())
    {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, 200);
        if (ready < 0 && errno != EINTR)
            break;
        if (ready > 0)
        {
            const ssize_t n = ::read(STDIN_FILENO, in, sizeof(in));
            if (n <= 0)
                break;
            decoder.feed(std::string_view(in, static_cast<size_t>(n)));
            pumpInput(decoder, explorerApp.app());
        }
        int newRows = rows;
        int newCols = cols;
        if (tui::TerminalSession::querySize(newRows, newCols) && (newRows != rows || newCols != cols))
        {
            rows = newRows;
            cols = newCols;
            explorerApp.app().resize(rows, cols);
        }
        explorerApp.app().tick();
    }
    return 0;
}
