// tui/include/tui/render/renderer.hpp
// @brief ANSI renderer flushing ScreenBuffer diffs to a TermIO.
// @invariant Style and cursor sequences are only emitted when they change.
// @ownership Renderer borrows the TermIO; it must outlive the renderer.
#pragma once

#include "tui/render/screen.hpp"
#include "tui/term/term_io.hpp"

namespace stagelens::tui::render
{

class Renderer
{
  public:
    Renderer(term::TermIO &tio, bool truecolor);

    /// @brief Emit the cells that changed since the buffer's last snapshot.
    void draw(const ScreenBuffer &sb);

    /// @brief Forget cached cursor and style, forcing the next draw to
    ///        re-emit both.
    void invalidate();

    [[nodiscard]] bool truecolor() const
    {
        return truecolor_;
    }

  private:
    void setStyle(const Style &style);
    void moveCursor(int y, int x);

    term::TermIO &tio_;
    bool truecolor_;
    bool styleKnown_{false};
    Style currentStyle_{};
    int cursorY_{-1};
    int cursorX_{-1};
};

} // namespace stagelens::tui::render
