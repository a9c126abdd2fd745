// tui/tests/test_session.cpp
// @brief Lifecycle test for TerminalSession with CI-safe no-op path.
// @invariant TerminalSession performs no terminal I/O when STAGELENS_NO_TTY=1.
// @ownership Test owns the StringTermIO.

#include "tui/term/session.hpp"
#include "tui/term/term_io.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using stagelens::tui::TerminalSession;
using stagelens::tui::term::StringTermIO;

TEST(TerminalSession, HeadlessRequestIsANoOp)
{
    ::setenv("STAGELENS_NO_TTY", "1", 1);
    EXPECT_TRUE(TerminalSession::headlessRequested());
    {
        TerminalSession session;
        EXPECT_FALSE(session.active());
    }
    ::setenv("STAGELENS_NO_TTY", "0", 1);
    EXPECT_FALSE(TerminalSession::headlessRequested());
}

TEST(StringTermIO, BuffersWritesAndCountsFlushes)
{
    StringTermIO tio;
    tio.write("ab");
    tio.write("c");
    tio.flush();
    EXPECT_EQ(tio.buffer(), "abc");
    EXPECT_EQ(tio.flushCount(), 1);
    tio.clear();
    EXPECT_TRUE(tio.buffer().empty());
}
