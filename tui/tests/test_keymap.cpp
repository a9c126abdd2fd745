// tui/tests/test_keymap.cpp
// @brief Verify command registration, chord dispatch and hint ordering.
// @invariant Rebinding a chord moves it to the new command.
// @ownership Keymap owns commands.

#include "tui/input/keymap.hpp"

#include <gtest/gtest.h>

#include <string>

using stagelens::tui::input::chordName;
using stagelens::tui::input::KeyChord;
using stagelens::tui::input::Keymap;
using stagelens::tui::term::KeyEvent;

namespace
{
KeyEvent charKey(char c, unsigned mods = 0)
{
    KeyEvent ev{};
    ev.codepoint = static_cast<uint32_t>(c);
    ev.mods = mods;
    return ev;
}
} // namespace

TEST(Keymap, BoundChordRunsCommand)
{
    Keymap km;
    int runs = 0;
    km.registerCommand("count", "Count", [&] { ++runs; });
    km.bindGlobal(KeyChord{KeyEvent::Code::Unknown, 0, 'c'}, "count");

    EXPECT_TRUE(km.handle(charKey('c')));
    EXPECT_FALSE(km.handle(charKey('d')));
    EXPECT_FALSE(km.handle(charKey('c', KeyEvent::Ctrl)));
    EXPECT_EQ(runs, 1);
}

TEST(Keymap, RebindingAChordMovesItToTheNewCommand)
{
    Keymap km;
    std::string last;
    km.registerCommand("quit", "Quit", [&] { last = "quit"; });
    km.registerCommand("toggle.ast", "AST", [&] { last = "ast"; });
    const KeyChord three{KeyEvent::Code::Unknown, 0, '3'};
    km.bindGlobal(three, "toggle.ast");
    km.bindGlobal(three, "quit");

    EXPECT_TRUE(km.handle(charKey('3')));
    EXPECT_EQ(last, "quit");
    EXPECT_TRUE(km.chordsFor("toggle.ast").empty());
    ASSERT_EQ(km.chordsFor("quit").size(), 1U);
}

TEST(Keymap, ReRegisteringReplacesAction)
{
    Keymap km;
    int which = 0;
    km.registerCommand("cmd", "First", [&] { which = 1; });
    km.registerCommand("cmd", "Second", [&] { which = 2; });
    EXPECT_EQ(km.find("cmd")->name, "Second");
    EXPECT_TRUE(km.execute("cmd"));
    EXPECT_EQ(which, 2);
    EXPECT_FALSE(km.execute("missing"));
    EXPECT_EQ(km.find("missing"), nullptr);
}

TEST(Keymap, ChordsForListsPlainCharactersFirst)
{
    Keymap km;
    km.registerCommand("quit", "Quit", [] {});
    km.bindGlobal(KeyChord{KeyEvent::Code::Esc, 0, 0}, "quit");
    km.bindGlobal(KeyChord{KeyEvent::Code::Unknown, 0, 'x'}, "quit");
    km.bindGlobal(KeyChord{KeyEvent::Code::Unknown, KeyEvent::Ctrl, 'a'}, "quit");
    km.bindGlobal(KeyChord{KeyEvent::Code::Unknown, 0, 'q'}, "quit");
    km.bindGlobal(KeyChord{KeyEvent::Code::F10, KeyEvent::Ctrl, 0}, "other");

    const auto chords = km.chordsFor("quit");
    ASSERT_EQ(chords.size(), 4U);
    EXPECT_EQ(chordName(chords[0]), "q");
    EXPECT_EQ(chordName(chords[1]), "x");
    EXPECT_EQ(chordName(chords[2]), "ctrl+a");
    EXPECT_EQ(chordName(chords[3]), "esc");
    EXPECT_EQ(chordName(km.chordsFor("other").at(0)), "ctrl+f10");
}
