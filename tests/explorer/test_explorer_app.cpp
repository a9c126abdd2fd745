// File: tests/explorer/test_explorer_app.cpp
// Purpose: Drive the headless explorer through keys, mouse and the editor and
//          check what ends up on screen and in the pipeline.
// Key invariants: Header, key hints and status rows always reflect the
//                 controller and view state after a tick.
// Ownership/Lifetime: Each test owns a StringTermIO and one ExplorerApp.
// Links: docs/explorer.md

#include "explorer/ExplorerApp.hpp"
#include "tui/term/term_io.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace stagelens;
using explorer::ExplorerApp;
using pipeline::StageKind;
using pipeline::ToolchainVersion;
using tui::term::KeyEvent;
using tui::term::MouseEvent;
using tui::term::StringTermIO;
using tui::ui::Event;

namespace
{
constexpr int kRows = 24;
constexpr int kCols = 80;

Event charKey(char c, unsigned mods = 0)
{
    Event ev{};
    ev.key.codepoint = static_cast<uint32_t>(c);
    ev.key.mods = mods;
    return ev;
}

Event codeKey(KeyEvent::Code code)
{
    Event ev{};
    ev.key.code = code;
    return ev;
}

Event moveTo(int x, int y)
{
    Event ev{};
    ev.kind = Event::Kind::Mouse;
    ev.mouse.type = MouseEvent::Type::Move;
    ev.mouse.x = x;
    ev.mouse.y = y;
    return ev;
}

Event paste(std::string text)
{
    Event ev{};
    ev.kind = Event::Kind::Paste;
    ev.paste = std::move(text);
    return ev;
}

bool contains(const std::string &haystack, const std::string &needle)
{
    return haystack.find(needle) != std::string::npos;
}
} // namespace

TEST(ExplorerApp, FirstFrameShowsHeaderPanelsAndHints)
{
    StringTermIO tio;
    tui::config::Config cfg;
    ExplorerApp app(tio, kRows, kCols, cfg, ToolchainVersion::Full);
    ASSERT_TRUE(app.loadSource("a = 1\nb = 2\n"));
    app.app().tick();

    auto &screen = app.app().screen();
    EXPECT_TRUE(contains(screen.rowText(0), "stagelens (full toolchain)  revision 1"));
    EXPECT_TRUE(contains(screen.rowText(1), "Source (1)"));
    EXPECT_TRUE(contains(screen.rowText(1), "Assembled Bytecode (7)"));
    EXPECT_EQ(screen.rowText(2).substr(0, 8), "\xE2\x94\x82" "a = 1");
    EXPECT_TRUE(contains(screen.rowText(kRows - 2), "1 [source] 2 tokens"));
    EXPECT_TRUE(contains(app.hintText(), " 7 [code]  tab focus"));
    EXPECT_TRUE(contains(screen.rowText(kRows - 1), "hover over an item"));
    EXPECT_FALSE(tio.buffer().empty());
}

TEST(ExplorerApp, HoveringSourceSelectsLine)
{
    StringTermIO tio;
    tui::config::Config cfg;
    ExplorerApp app(tio, kRows, kCols, cfg, ToolchainVersion::Full);
    ASSERT_TRUE(app.loadSource("a = 1\nb = 2\n"));
    app.app().tick();

    app.app().pushEvent(moveTo(5, 3));
    app.app().tick();
    ASSERT_TRUE(app.controller().currentLine().has_value());
    EXPECT_EQ(*app.controller().currentLine(), 2U);
    EXPECT_EQ(app.statusText(), "line 2");
    EXPECT_EQ(app.grid().panel(StageKind::Source).highlighted(), (std::vector<size_t>{1}));

    const auto &code = app.grid().panel(StageKind::FinalBytecode);
    ASSERT_FALSE(code.highlighted().empty());
    for (size_t i : code.highlighted())
        EXPECT_EQ(code.items()[i].line, 2U);
}

TEST(ExplorerApp, DigitKeysToggleStages)
{
    StringTermIO tio;
    tui::config::Config cfg;
    ExplorerApp app(tio, kRows, kCols, cfg, ToolchainVersion::Full);
    ASSERT_TRUE(app.loadSource("a = 1\n"));
    app.app().tick();

    app.app().pushEvent(charKey('2'));
    app.app().tick();
    EXPECT_TRUE(app.view().isVisible(StageKind::Tokens));
    EXPECT_EQ(app.view().panelColumns(), 3U);
    EXPECT_TRUE(contains(app.hintText(), "2 [tokens]"));
    EXPECT_TRUE(contains(app.app().screen().rowText(1), "Tokens (2)"));

    app.app().pushEvent(charKey('1'));
    app.app().pushEvent(charKey('2'));
    app.app().pushEvent(charKey('7'));
    app.app().tick();
    EXPECT_EQ(app.view().visibleCount(), 0U);
    EXPECT_TRUE(contains(app.app().screen().rowText(1 + (kRows - 3) / 2), "No stages visible"));
}

TEST(ExplorerApp, EditorCommitReloadsSource)
{
    StringTermIO tio;
    tui::config::Config cfg;
    ExplorerApp app(tio, kRows, kCols, cfg, ToolchainVersion::Full);
    ASSERT_TRUE(app.loadSource("a = 1\n"));
    app.app().tick();

    app.app().pushEvent(charKey('e'));
    app.app().tick();
    ASSERT_TRUE(app.modalHost().hasModal());
    EXPECT_FALSE(app.quitRequested());

    app.app().pushEvent(paste("c = 3\n"));
    app.app().pushEvent(codeKey(KeyEvent::Code::Esc));
    app.app().tick();
    EXPECT_FALSE(app.modalHost().hasModal());
    EXPECT_EQ(app.controller().source(), "c = 3\na = 1\n");
    EXPECT_EQ(app.controller().revision(), 2U);
    EXPECT_FALSE(app.quitRequested());
}

TEST(ExplorerApp, EditorDiscardKeepsSource)
{
    StringTermIO tio;
    tui::config::Config cfg;
    ExplorerApp app(tio, kRows, kCols, cfg, ToolchainVersion::Full);
    ASSERT_TRUE(app.loadSource("a = 1\n"));
    app.app().tick();

    app.openEditor();
    app.app().pushEvent(charKey('z'));
    app.app().pushEvent(codeKey(KeyEvent::Code::F10));
    app.app().tick();
    EXPECT_FALSE(app.modalHost().hasModal());
    EXPECT_EQ(app.controller().source(), "a = 1\n");
    EXPECT_EQ(app.controller().revision(), 1U);
}

TEST(ExplorerApp, BrokenEditShowsErrorInStatus)
{
    StringTermIO tio;
    tui::config::Config cfg;
    ExplorerApp app(tio, kRows, kCols, cfg, ToolchainVersion::Full);
    ASSERT_TRUE(app.loadSource("a = 1\n"));
    app.app().tick();

    app.openEditor();
    app.app().pushEvent(paste("b = (\n"));
    app.app().pushEvent(codeKey(KeyEvent::Code::Esc));
    app.app().tick();
    ASSERT_TRUE(app.controller().lastError().has_value());
    EXPECT_TRUE(contains(app.statusText(), "Tokens: "));
    EXPECT_TRUE(contains(app.app().screen().rowText(kRows - 1), "Tokens: "));
    EXPECT_TRUE(app.grid().panel(StageKind::FinalBytecode).isStale());
    EXPECT_TRUE(contains(app.app().screen().rowText(1), "[stale]"));
}

TEST(ExplorerApp, QuitKeys)
{
    StringTermIO tio;
    tui::config::Config cfg;
    ExplorerApp app(tio, kRows, kCols, cfg, ToolchainVersion::Full);
    app.app().pushEvent(charKey('q'));
    app.app().tick();
    EXPECT_TRUE(app.quitRequested());

    ExplorerApp other(tio, kRows, kCols, cfg, ToolchainVersion::Full);
    other.app().pushEvent(codeKey(KeyEvent::Code::Esc));
    other.app().tick();
    EXPECT_TRUE(other.quitRequested());
}

TEST(ExplorerApp, ConfigSetsVisibilityAndBindings)
{
    tui::config::Config cfg;
    ASSERT_TRUE(tui::config::loadFromFile(CONFIG_INI, cfg));
    StringTermIO tio;
    ExplorerApp app(tio, kRows, kCols, cfg, ToolchainVersion::Full);
    EXPECT_TRUE(app.view().isVisible(StageKind::Source));
    EXPECT_TRUE(app.view().isVisible(StageKind::Tokens));
    EXPECT_TRUE(app.view().isVisible(StageKind::FinalBytecode));
    EXPECT_EQ(app.view().visibleCount(), 3U);

    app.app().pushEvent(codeKey(KeyEvent::Code::F2));
    app.app().tick();
    EXPECT_FALSE(app.view().isVisible(StageKind::Tokens));

    app.app().pushEvent(charKey('E', KeyEvent::Ctrl));
    app.app().tick();
    EXPECT_TRUE(app.modalHost().hasModal());
}

TEST(ExplorerApp, HintsFollowReboundKeys)
{
    tui::config::Config cfg;
    cfg.keymap_global.push_back(
        tui::config::Binding{tui::input::KeyChord{KeyEvent::Code::Unknown, 0, '3'}, "quit"});
    cfg.keymap_global.push_back(
        tui::config::Binding{tui::input::KeyChord{KeyEvent::Code::F5, 0, 0}, "toggle.tokens"});
    StringTermIO tio;
    ExplorerApp app(tio, kRows, kCols, cfg, ToolchainVersion::Full);
    const bool astVisible = app.view().isVisible(StageKind::AST);

    const std::string hints = app.hintText();
    EXPECT_EQ(hints.rfind("3 quit  e edit  1 [source] 2 tokens ", 0), 0U) << hints;
    EXPECT_FALSE(contains(hints, " ast"));
    EXPECT_FALSE(contains(hints, "[ast]"));

    app.app().pushEvent(codeKey(KeyEvent::Code::F5));
    app.app().tick();
    EXPECT_TRUE(app.view().isVisible(StageKind::Tokens));

    app.app().pushEvent(charKey('3'));
    app.app().tick();
    EXPECT_TRUE(app.quitRequested());
    EXPECT_EQ(app.view().isVisible(StageKind::AST), astVisible);
}

TEST(ExplorerApp, ReducedToolchainIgnoresUnavailableStages)
{
    tui::config::Config cfg;
    ASSERT_TRUE(tui::config::loadFromFile(CONFIG_REDUCED_INI, cfg));
    StringTermIO tio;
    ExplorerApp app(tio, kRows, kCols, cfg, ToolchainVersion::Reduced);
    EXPECT_FALSE(app.view().isVisible(StageKind::OptimizedAST));
    EXPECT_EQ(app.view().visibleCount(), 2U);
    EXPECT_EQ(app.keymap().find("toggle.pseudo"), nullptr);
    EXPECT_FALSE(contains(app.hintText(), "opt-ast"));
    EXPECT_TRUE(contains(app.hintText(), "3 ast"));

    app.toggleStage(StageKind::PseudoBytecode);
    EXPECT_FALSE(app.view().isVisible(StageKind::PseudoBytecode));

    app.app().tick();
    EXPECT_TRUE(contains(app.app().screen().rowText(0), "stagelens (reduced toolchain)"));

    app.app().pushEvent(charKey('x'));
    app.app().tick();
    EXPECT_TRUE(app.quitRequested());
}
