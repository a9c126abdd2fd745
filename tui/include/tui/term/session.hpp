// tui/include/tui/term/session.hpp
// @brief RAII guard putting the terminal into raw, alternate-screen mode.
// @invariant When active(), the destructor restores the original terminal
//            attributes and leaves the alternate screen.
// @ownership Owns the saved termios state only.
#pragma once

#if !defined(_WIN32)
#include <termios.h>
#endif

namespace stagelens::tui
{

class TerminalSession
{
  public:
    /// @brief Enter raw mode unless STAGELENS_NO_TTY=1 or stdio is not a tty.
    TerminalSession();
    ~TerminalSession();

    TerminalSession(const TerminalSession &) = delete;
    TerminalSession &operator=(const TerminalSession &) = delete;

    [[nodiscard]] bool active() const
    {
        return active_;
    }

    /// @brief Whether STAGELENS_NO_TTY requests headless operation.
    static bool headlessRequested();

    /// @brief Query the terminal size; false when unavailable.
    static bool querySize(int &rows, int &cols);

  private:
    bool active_{false};
#if !defined(_WIN32)
    struct termios saved_
    {
    };
#endif
};

} // namespace stagelens::tui
