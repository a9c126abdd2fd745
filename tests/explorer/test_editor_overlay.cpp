// File: tests/explorer/test_editor_overlay.cpp
// Purpose: Verify source editing keys and the commit/discard contract.
// Key invariants: The dismiss callback fires exactly once; unchanged text is
//                 reported as no change.
// Ownership/Lifetime: Test owns the overlay and captures its result.
// Links: docs/explorer.md

#include "explorer/EditorOverlay.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>

using namespace stagelens;
using explorer::EditorOverlay;
using tui::render::ScreenBuffer;
using tui::style::Theme;
using tui::term::KeyEvent;
using tui::ui::Event;
using tui::ui::Rect;

namespace
{
Event key(KeyEvent::Code code, unsigned mods = 0, uint32_t cp = 0)
{
    Event ev{};
    ev.key.code = code;
    ev.key.mods = mods;
    ev.key.codepoint = cp;
    return ev;
}

Event ch(char32_t c)
{
    return key(KeyEvent::Code::Unknown, 0, static_cast<uint32_t>(c));
}

struct Capture
{
    int calls{0};
    std::optional<std::string> result;

    EditorOverlay::DismissFn fn()
    {
        return [this](std::optional<std::string> r) {
            ++calls;
            result = std::move(r);
        };
    }
};
} // namespace

TEST(EditorOverlay, TypingAndCommit)
{
    Theme theme;
    Capture cap;
    EditorOverlay ed("a = 1\n", theme, 4, cap.fn());
    ed.onEvent(key(KeyEvent::Code::End));
    ed.onEvent(ch('0'));
    EXPECT_EQ(ed.text(), "a = 10\n");
    ed.onEvent(key(KeyEvent::Code::Down));
    ed.onEvent(ch('b'));
    ed.onEvent(key(KeyEvent::Code::Enter));
    EXPECT_EQ(ed.text(), "a = 10\nb\n");

    ed.onEvent(key(KeyEvent::Code::Esc));
    EXPECT_EQ(cap.calls, 1);
    ASSERT_TRUE(cap.result.has_value());
    EXPECT_EQ(*cap.result, "a = 10\nb\n");
    EXPECT_TRUE(ed.closeRequested());

    ed.onEvent(key(KeyEvent::Code::Esc));
    EXPECT_EQ(cap.calls, 1);
}

TEST(EditorOverlay, UnchangedTextReportsNoChange)
{
    Theme theme;
    Capture cap;
    EditorOverlay ed("x = 1\n", theme, 4, cap.fn());
    ed.onEvent(ch('y'));
    ed.onEvent(key(KeyEvent::Code::Backspace));
    ed.onEvent(key(KeyEvent::Code::Esc));
    EXPECT_EQ(cap.calls, 1);
    EXPECT_FALSE(cap.result.has_value());
}

TEST(EditorOverlay, DiscardKeys)
{
    Theme theme;
    Capture ctrlX;
    EditorOverlay a("a\n", theme, 4, ctrlX.fn());
    a.onEvent(ch('z'));
    a.onEvent(key(KeyEvent::Code::Unknown, KeyEvent::Ctrl, 'x'));
    EXPECT_EQ(ctrlX.calls, 1);
    EXPECT_FALSE(ctrlX.result.has_value());

    Capture f10;
    EditorOverlay b("a\n", theme, 4, f10.fn());
    b.onEvent(ch('z'));
    b.onEvent(key(KeyEvent::Code::F10));
    EXPECT_EQ(f10.calls, 1);
    EXPECT_FALSE(f10.result.has_value());
    EXPECT_TRUE(b.closeRequested());
}

TEST(EditorOverlay, TabInsertsSpacesToNextStop)
{
    Theme theme;
    Capture cap;
    EditorOverlay ed("", theme, 4, cap.fn());
    ed.onEvent(ch('a'));
    ed.onEvent(key(KeyEvent::Code::Tab));
    EXPECT_EQ(ed.text(), "a   ");
    ed.onEvent(key(KeyEvent::Code::Tab));
    EXPECT_EQ(ed.text(), "a       ");
    EXPECT_EQ(ed.cursor(), 8U);
}

TEST(EditorOverlay, Utf8AwareEditingAndPaste)
{
    Theme theme;
    Capture cap;
    EditorOverlay ed("", theme, 4, cap.fn());
    ed.onEvent(ch(U'é'));
    ed.onEvent(ch('x'));
    EXPECT_EQ(ed.text(), "\xC3\xA9x");
    ed.onEvent(key(KeyEvent::Code::Left));
    ed.onEvent(key(KeyEvent::Code::Left));
    EXPECT_EQ(ed.cursor(), 0U);
    ed.onEvent(key(KeyEvent::Code::Delete));
    EXPECT_EQ(ed.text(), "x");

    Event paste{};
    paste.kind = Event::Kind::Paste;
    paste.paste = "y = 2\n";
    ed.onEvent(paste);
    EXPECT_EQ(ed.text(), "y = 2\nx");

    ed.onEvent(key(KeyEvent::Code::Unknown, KeyEvent::Alt, 'q'));
    EXPECT_EQ(ed.text(), "y = 2\nx");
}

TEST(EditorOverlay, PaintsFrameGutterAndCursor)
{
    Theme theme;
    Capture cap;
    EditorOverlay ed("a = 1\nb = 2\n", theme, 4, cap.fn());
    const Rect r = ed.preferredRect(Rect{0, 0, 40, 12});
    EXPECT_EQ(r.x, 4);
    EXPECT_EQ(r.y, 1);
    EXPECT_EQ(r.w, 32);
    EXPECT_EQ(r.h, 10);

    ed.layout(Rect{0, 0, 40, 8});
    ScreenBuffer sb;
    sb.resize(8, 40);
    sb.clear(theme.normal);
    ed.paint(sb);
    EXPECT_NE(sb.rowText(0).find("Edit source"), std::string::npos);
    EXPECT_EQ(sb.rowText(1).substr(0, 10), "   1 a = 1");
    EXPECT_EQ(sb.rowText(2).substr(0, 10), "   2 b = 2");
    EXPECT_NE(sb.rowText(7).find("Ctrl+X/F10: discard"), std::string::npos);
    EXPECT_NE(sb.at(1, 5).style.attrs & tui::render::Reverse, 0);
}
