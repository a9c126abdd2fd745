//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: tui/src/term/session.cpp
// Purpose: Raw-mode terminal session with mouse tracking and bracketed paste.
// Key invariants: Every mode enabled in the constructor is disabled in the
//                 destructor, in reverse order.
// Ownership/Lifetime: Owns the saved termios state for its lifetime.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#include "tui/term/session.hpp"

#include "support/trace.hpp"

#include <cstdlib>
#include <cstring>

#if !defined(_WIN32)
#include <sys/ioctl.h>
#include <unistd.h>
#endif

namespace stagelens::tui
{
namespace
{
// Alternate screen, hidden cursor, any-motion mouse tracking with SGR
// coordinates, bracketed paste.
constexpr const char kEnter[] = "\x1b[?1049h\x1b[?25l\x1b[?1003h\x1b[?1006h\x1b[?2004h";
constexpr const char kLeave[] = "\x1b[?2004l\x1b[?1006l\x1b[?1003l\x1b[?25h\x1b[?1049l";

#if !defined(_WIN32)
void writeAll(const char *s)
{
    size_t left = std::strlen(s);
    while (left > 0)
    {
        ssize_t n = ::write(STDOUT_FILENO, s, left);
        if (n <= 0)
            return;
        s += n;
        left -= static_cast<size_t>(n);
    }
}
#endif
} // namespace

bool TerminalSession::headlessRequested()
{
    const char *v = std::getenv("STAGELENS_NO_TTY");
    return v && v[0] == '1';
}

TerminalSession::TerminalSession()
{
#if !defined(_WIN32)
    if (headlessRequested() || !::isatty(STDIN_FILENO) || !::isatty(STDOUT_FILENO))
        return;
    if (::tcgetattr(STDIN_FILENO, &saved_) != 0)
        return;

    struct termios raw = saved_;
    raw.c_iflag &= static_cast<tcflag_t>(~(BRKINT | ICRNL | INPCK | ISTRIP | IXON));
    raw.c_oflag &= static_cast<tcflag_t>(~OPOST);
    raw.c_cflag |= CS8;
    raw.c_lflag &= static_cast<tcflag_t>(~(ECHO | ICANON | IEXTEN | ISIG));
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0)
        return;

    writeAll(kEnter);
    active_ = true;
    support::trace("app", "terminal session active");
#endif
}

TerminalSession::~TerminalSession()
{
#if !defined(_WIN32)
    if (!active_)
        return;
    writeAll(kLeave);
    (void)::tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
#endif
}

bool TerminalSession::querySize(int &rows, int &cols)
{
#if !defined(_WIN32)
    struct winsize ws
    {
    };
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) != 0 || ws.ws_row == 0 || ws.ws_col == 0)
        return false;
    rows = ws.ws_row;
    cols = ws.ws_col;
    return true;
#else
    (void)rows;
    (void)cols;
    return false;
#endif
}

} // namespace stagelens::tui
