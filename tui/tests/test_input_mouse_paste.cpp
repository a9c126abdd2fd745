// tui/tests/test_input_mouse_paste.cpp
// @brief Tests key, SGR mouse and bracketed paste decoding.
// @invariant Decoder handles sequences split across feeds.
// @ownership InputDecoder owns its event queues only.

#include "tui/term/input.hpp"

#include <gtest/gtest.h>

using stagelens::tui::term::InputDecoder;
using stagelens::tui::term::KeyEvent;
using stagelens::tui::term::MouseEvent;

TEST(InputDecoder, SgrMouseEvents)
{
    InputDecoder d;

    d.feed("\x1b[<0;10;20M");
    auto me = d.drain_mouse();
    ASSERT_EQ(me.size(), 1U);
    EXPECT_EQ(me[0].type, MouseEvent::Type::Down);
    EXPECT_EQ(me[0].x, 9);
    EXPECT_EQ(me[0].y, 19);
    EXPECT_EQ(me[0].buttons, 1U);

    d.feed("\x1b[<0;10;20m");
    me = d.drain_mouse();
    ASSERT_EQ(me.size(), 1U);
    EXPECT_EQ(me[0].type, MouseEvent::Type::Up);

    d.feed("\x1b[<35;11;21M");
    me = d.drain_mouse();
    ASSERT_EQ(me.size(), 1U);
    EXPECT_EQ(me[0].type, MouseEvent::Type::Move);
    EXPECT_EQ(me[0].buttons, 0U);
    EXPECT_EQ(me[0].x, 10);
    EXPECT_EQ(me[0].y, 20);

    d.feed("\x1b[<64;12;22M\x1b[<65;12;22M");
    me = d.drain_mouse();
    ASSERT_EQ(me.size(), 2U);
    EXPECT_EQ(me[0].type, MouseEvent::Type::Wheel);
    EXPECT_EQ(me[0].buttons, 1U);
    EXPECT_EQ(me[1].buttons, 2U);
    EXPECT_TRUE(d.drain().empty());
}

TEST(InputDecoder, BracketedPasteAcrossFeeds)
{
    InputDecoder d;
    d.feed("\x1b[200~hello\n");
    EXPECT_TRUE(d.drain_paste().empty());
    d.feed("world\x1b[20");
    EXPECT_TRUE(d.drain_paste().empty());
    d.feed("1~q");
    auto pe = d.drain_paste();
    ASSERT_EQ(pe.size(), 1U);
    EXPECT_EQ(pe[0].text, "hello\nworld");
    auto keys = d.drain();
    ASSERT_EQ(keys.size(), 1U);
    EXPECT_EQ(keys[0].codepoint, static_cast<uint32_t>('q'));
}

TEST(InputDecoder, NavigationAndFunctionKeys)
{
    InputDecoder d;
    d.feed("\x1b[A\x1b[1;5C\x1b[3~\x1b[21~\x1bOP\x1b[Z");
    auto keys = d.drain();
    ASSERT_EQ(keys.size(), 6U);
    EXPECT_EQ(keys[0].code, KeyEvent::Code::Up);
    EXPECT_EQ(keys[1].code, KeyEvent::Code::Right);
    EXPECT_EQ(keys[1].mods, static_cast<unsigned>(KeyEvent::Ctrl));
    EXPECT_EQ(keys[2].code, KeyEvent::Code::Delete);
    EXPECT_EQ(keys[3].code, KeyEvent::Code::F10);
    EXPECT_EQ(keys[4].code, KeyEvent::Code::F1);
    EXPECT_EQ(keys[5].code, KeyEvent::Code::Tab);
    EXPECT_EQ(keys[5].mods, static_cast<unsigned>(KeyEvent::Shift));
}

TEST(InputDecoder, ControlBytesAndLoneEscape)
{
    InputDecoder d;
    d.feed("\x18\r\t\x7f");
    auto keys = d.drain();
    ASSERT_EQ(keys.size(), 4U);
    EXPECT_EQ(keys[0].code, KeyEvent::Code::Unknown);
    EXPECT_EQ(keys[0].mods, static_cast<unsigned>(KeyEvent::Ctrl));
    EXPECT_EQ(keys[0].codepoint, static_cast<uint32_t>('x'));
    EXPECT_EQ(keys[1].code, KeyEvent::Code::Enter);
    EXPECT_EQ(keys[2].code, KeyEvent::Code::Tab);
    EXPECT_EQ(keys[3].code, KeyEvent::Code::Backspace);

    d.feed("\x1b");
    keys = d.drain();
    ASSERT_EQ(keys.size(), 1U);
    EXPECT_EQ(keys[0].code, KeyEvent::Code::Esc);
}

TEST(InputDecoder, Utf8CodepointsSplitAcrossFeeds)
{
    InputDecoder d;
    d.feed("\xc3");
    EXPECT_TRUE(d.drain().empty());
    d.feed("\xbc");
    auto keys = d.drain();
    ASSERT_EQ(keys.size(), 1U);
    EXPECT_EQ(keys[0].codepoint, 0xFCU);
}
